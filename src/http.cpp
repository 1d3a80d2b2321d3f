#include <cctype>
#include <cstdio>
#include <cstdlib>

#include <sharemirror/http.h>

namespace sharemirror
{

bool HttpResponse::append(const char* data, std::size_t len)
{
    if (mBodyLimit >= 0 && static_cast<m_off_t>(mBody.size() + len) > mBodyLimit)
    {
        mOversized = true;
        return false;
    }

    mBody.append(data, len);

    return true;
}

std::string rangeHeaderValue(m_off_t offset, m_off_t length)
{
    return "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1);
}

bool parseContentRange(const std::string& value, m_off_t& first, m_off_t& last, m_off_t& total)
{
    static const std::string prefix = "bytes ";

    if (value.compare(0, prefix.size(), prefix))
        return false;

    const char* ptr = value.c_str() + prefix.size();
    char* end = nullptr;

    first = strtoll(ptr, &end, 10);
    if (end == ptr || *end != '-')
        return false;

    ptr = end + 1;
    last = strtoll(ptr, &end, 10);
    if (end == ptr || *end != '/' || last < first)
        return false;

    ptr = end + 1;
    if (*ptr == '*')
    {
        total = -1;
        return true;
    }

    total = strtoll(ptr, &end, 10);

    return end != ptr && total > last;
}

bool isRetryableStatus(int status)
{
    switch (status)
    {
        case 408:
        case 429:
        case 500:
        case 502:
        case 503:
        case 504:
            return true;
        default:
            return false;
    }
}

std::string urlEncode(const std::string& value)
{
    std::string result;

    result.reserve(value.size());

    for (unsigned char c : value)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            result.push_back(static_cast<char>(c));
        }
        else
        {
            char buf[4];
            snprintf(buf, sizeof(buf), "%%%02X", c);
            result.append(buf);
        }
    }

    return result;
}

} // sharemirror
