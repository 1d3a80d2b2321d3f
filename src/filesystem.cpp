#include <cstdio>

#include <sharemirror/filesystem.h>

namespace sharemirror
{

static const char* const PARTIAL_SUFFIX = ".part";

static void escapeChar(std::string& result, unsigned char c)
{
    char buf[4];

    snprintf(buf, sizeof(buf), "%%%02x", c);
    result.append(buf);
}

std::string sanitizeName(const std::string& name)
{
    if (name.empty())
        return "%00";

    if (name == "." || name == "..")
    {
        std::string result;

        for (auto c : name)
            escapeChar(result, static_cast<unsigned char>(c));

        return result;
    }

    std::string result;

    result.reserve(name.size());

    for (unsigned char c : name)
    {
        if (c < 0x20 || c == 0x7f || c == '/' || c == '\\')
            escapeChar(result, c);
        else
            result.push_back(static_cast<char>(c));
    }

    return result;
}

std::string joinPath(const std::string& parent, const std::string& name)
{
    if (parent.empty())
        return name;

    if (name.empty())
        return parent;

    if (parent.back() == '/')
        return parent + name;

    return parent + "/" + name;
}

std::string partialPath(const std::string& path)
{
    return path + PARTIAL_SUFFIX;
}

} // sharemirror
