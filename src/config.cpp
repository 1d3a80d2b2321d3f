#include <cctype>
#include <limits>
#include <sstream>

#include <sharemirror/arguments.h>
#include <sharemirror/config.h>

namespace sharemirror
{

const char* const DEFAULT_ONEZONE = "https://datahub.egi.eu";

static bool parseDigits(const std::string& text, std::size_t& end, uint64_t& value)
{
    value = 0;
    end = 0;

    while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end])))
    {
        auto digit = static_cast<uint64_t>(text[end] - '0');

        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10)
            return false;

        value = value * 10 + digit;
        ++end;
    }

    return end > 0;
}

ErrorOr<m_off_t> parseSize(const std::string& text)
{
    std::size_t end;
    uint64_t value;

    if (!parseDigits(text, end, value))
        return unexpected(Error(API_EARGS, "Invalid size: \"" + text + "\""));

    std::string suffix = text.substr(end);

    for (auto& c : suffix)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    // Accept "M", "MB" and "MIB" alike.
    if (suffix.size() == 3 && suffix.compare(1, 2, "IB") == 0)
        suffix.resize(1);
    else if (suffix.size() == 2 && suffix[1] == 'B')
        suffix.resize(1);

    unsigned shift = 0;

    if (suffix.empty() || suffix == "B")
        shift = 0;
    else if (suffix == "K")
        shift = 10;
    else if (suffix == "M")
        shift = 20;
    else if (suffix == "G")
        shift = 30;
    else if (suffix == "T")
        shift = 40;
    else
        return unexpected(Error(API_EARGS, "Unknown size suffix: \"" + text + "\""));

    const auto limit = static_cast<uint64_t>(std::numeric_limits<m_off_t>::max());

    if (value > (limit >> shift))
        return unexpected(Error(API_EARGS, "Size too large: \"" + text + "\""));

    value <<= shift;

    if (!value)
        return unexpected(Error(API_EARGS, "Size must be positive: \"" + text + "\""));

    return static_cast<m_off_t>(value);
}

ErrorOr<unsigned> parsePositive(const std::string& text, bool allowZero)
{
    std::size_t end;
    uint64_t value;

    if (!parseDigits(text, end, value)
        || end != text.size()
        || value > std::numeric_limits<unsigned>::max())
        return unexpected(Error(API_EARGS, "Invalid number: \"" + text + "\""));

    if (!value && !allowZero)
        return unexpected(Error(API_EARGS, "Value must be positive: \"" + text + "\""));

    return static_cast<unsigned>(value);
}

ErrorOr<MirrorConfig> MirrorConfig::fromArguments(const Arguments& arguments)
{
    MirrorConfig config;

    if (arguments.contains("--help") || arguments.contains("-h"))
    {
        config.mHelp = true;
        return config;
    }

    auto& positionals = arguments.positionals();

    if (positionals.empty())
        return unexpected(Error(API_EARGS, "Missing file ID"));

    if (positionals.size() > 1)
        return unexpected(Error(API_EARGS, "Unexpected argument: \"" + positionals[1] + "\""));

    config.mFileId = positionals.front();

    if (arguments.contains("--onezone"))
    {
        config.mOnezone = arguments.getValue("--onezone");

        // Avoid "//api" when the caller added a trailing slash.
        while (!config.mOnezone.empty() && config.mOnezone.back() == '/')
            config.mOnezone.pop_back();

        if (config.mOnezone.empty())
            return unexpected(Error(API_EARGS, "Empty --onezone"));
    }

    if (arguments.contains("--output"))
    {
        config.mOutputDir = arguments.getValue("--output");

        if (config.mOutputDir.empty())
            return unexpected(Error(API_EARGS, "Empty --output"));
    }

    if (arguments.contains("--chunk-size"))
    {
        auto size = parseSize(arguments.getValue("--chunk-size"));

        if (!size)
            return unexpected(std::move(size).error().annotate("--chunk-size"));

        config.mChunkSize = *size;
    }

    // Parses an unsigned option in place.
    auto unsignedOption = [&](const char* name, unsigned& target, bool allowZero) {
        if (!arguments.contains(name))
            return Error(API_OK);

        auto value = parsePositive(arguments.getValue(name), allowZero);

        if (!value)
            return std::move(value).error().annotate(name);

        target = *value;

        return Error(API_OK);
    }; // unsignedOption

    unsigned retryDelay = static_cast<unsigned>(config.mRetryDelay.count());
    unsigned timeout = static_cast<unsigned>(config.mTimeout.count());

    for (auto result : {unsignedOption("--workers", config.mWorkers, false),
                        unsignedOption("--file-workers", config.mFileWorkers, false),
                        unsignedOption("--retries", config.mRetryLimit, true),
                        unsignedOption("--retry-delay", retryDelay, true),
                        unsignedOption("--page-size", config.mPageSize, false),
                        unsignedOption("--timeout", timeout, true)})
    {
        if (result != API_OK)
            return unexpected(result);
    }

    config.mRetryDelay = std::chrono::milliseconds(retryDelay);
    config.mTimeout = std::chrono::seconds(timeout);

    config.mFailFast = arguments.contains("--fail-fast");
    config.mSkipExisting = arguments.contains("--skip-existing");

    if (arguments.contains("--log-level"))
    {
        auto level = arguments.getValue("--log-level");

        if (!toLogLevel(level, config.mLogLevel))
            return unexpected(Error(API_EARGS, "Unknown log level: \"" + level + "\""));
    }
    else if (arguments.contains("-vv"))
    {
        config.mLogLevel = logVerbose;
    }
    else if (arguments.contains("-v"))
    {
        config.mLogLevel = arguments.count("-v") > 1 ? logVerbose : logDebug;
    }

    config.mLogFile = arguments.getValue("--log-file");

    return config;
}

std::string usage(const char* program)
{
    std::ostringstream ostream;

    ostream << "Usage: " << program << " [options] FILE_ID\n"
            << "\n"
            << "Download a shared space, directory or file recursively.\n"
            << "\n"
            << "Options:\n"
            << "  --onezone=URL        Onezone hostname with protocol (default "
            << DEFAULT_ONEZONE << ")\n"
            << "  --output=DIR         Directory to download into (default .)\n"
            << "  --chunk-size=SIZE    Byte range size, e.g. 512K, 32M (default 4M)\n"
            << "  --workers=N          Parallel range requests per file (default 1)\n"
            << "  --file-workers=N     Files downloaded at the same time (default 1)\n"
            << "  --retries=N          Retries for transient failures (default 3)\n"
            << "  --retry-delay=MS     Base delay between retries (default 250)\n"
            << "  --page-size=N        Directory listing page size (default 1000)\n"
            << "  --timeout=S          Per request timeout, 0 for none (default 60)\n"
            << "  --fail-fast          Stop at the first failure\n"
            << "  --skip-existing      Skip files that already exist with the same size\n"
            << "  --log-level=LEVEL    fatal, error, warning, info, debug or verbose\n"
            << "  --log-file=PATH      Also append log output to PATH\n"
            << "  -v, -vv              Debug or verbose logging\n"
            << "  -h, --help           Show this message\n";

    return ostream.str();
}

} // sharemirror
