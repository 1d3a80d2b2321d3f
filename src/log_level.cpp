#include <algorithm>
#include <cctype>
#include <map>

#include <sharemirror/log_level.h>

namespace sharemirror
{

static std::string toUpper(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    return value;
}

bool toLogLevel(const std::string& level, LogLevel& result)
{
    static const std::map<std::string, LogLevel> levels = {
#define DEFINE_LOG_LEVEL_ENTRY(name) \
    {toUpper(#name), log ## name},
        DEFINE_LOG_LEVELS(DEFINE_LOG_LEVEL_ENTRY)
#undef DEFINE_LOG_LEVEL_ENTRY
        // Short forms.
        {"ERR", logError},
        {"WARN", logWarning},
    }; // levels

    auto i = levels.find(toUpper(level));

    if (i == levels.end())
        return false;

    result = i->second;

    return true;
}

const char* toString(LogLevel level)
{
    static const std::map<LogLevel, std::string> strings = {
#define DEFINE_LOG_LEVEL_ENTRY(name) \
    {log ## name, toUpper(#name)},
        DEFINE_LOG_LEVELS(DEFINE_LOG_LEVEL_ENTRY)
#undef DEFINE_LOG_LEVEL_ENTRY
    }; // strings

    if (auto i = strings.find(level); i != strings.end())
        return i->second.c_str();

    return "N/A";
}

} // sharemirror
