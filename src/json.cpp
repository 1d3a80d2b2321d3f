#include <cctype>
#include <cstdlib>
#include <cstring>

#include <sharemirror/json.h>
#include <sharemirror/logging.h>

namespace sharemirror
{

static int hexval(const int c)
{
    if (c >= '0' && c <= '9')
        return c - '0';

    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;

    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;

    return -1;
}

// literal length if ptr is at true, false or null, else 0
static std::size_t literal(const char* ptr)
{
    if (!strncmp(ptr, "true", 4) || !strncmp(ptr, "null", 4))
        return 4;

    if (!strncmp(ptr, "false", 5))
        return 5;

    return 0;
}

static void appendUtf8(std::string& s, unsigned long cp)
{
    if (cp < 0x80)
    {
        s.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        s.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        s.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        s.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        s.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// four hex digits at p, or -1
static long hex4(const std::string& s, std::size_t p)
{
    if (p + 4 > s.size())
        return -1;

    long value = 0;

    for (std::size_t i = p; i < p + 4; ++i)
    {
        auto digit = hexval(s[i]);

        if (digit < 0)
            return -1;

        value = (value << 4) | digit;
    }

    return value;
}

// store array or object in string s
// reposition after object
bool JSON::storeobject(std::string* s)
{
    int openobject[2] = { 0 };
    const char* ptr;
    bool escaped = false;

    while (*(const signed char*)pos > 0 && *pos <= ' ')
    {
        pos++;
    }

    if (!*pos || *pos == ']' || *pos == '}')
    {
        return false;
    }

    if (*pos == ',')
    {
        pos++;
    }

    ptr = pos;

    for (;;)
    {
        if ((*ptr == '[') || (*ptr == '{'))
        {
            openobject[*ptr == '[']++;
        }
        else if ((*ptr == ']') || (*ptr == '}'))
        {
            if (--openobject[*ptr == ']'] < 0)
            {
                LOG_err << "Parse error (])";
                return false;
            }
        }
        else if (*ptr == '"')
        {
            ptr++;

            while (*ptr && (escaped || *ptr != '"'))
            {
                escaped = *ptr == '\\' && !escaped;
                ptr++;
            }

            if (!*ptr)
            {
                LOG_err << "Parse error (\")";
                return false;
            }
        }
        else if ((*ptr >= '0' && *ptr <= '9') || *ptr == '-' || *ptr == '.')
        {
            ptr++;

            while ((*ptr >= '0' && *ptr <= '9')
                   || *ptr == '.'
                   || *ptr == 'e'
                   || *ptr == 'E'
                   || ((*ptr == '+' || *ptr == '-') && (ptr[-1] == 'e' || ptr[-1] == 'E')))
            {
                ptr++;
            }

            ptr--;
        }
        else if (auto length = literal(ptr))
        {
            ptr += length - 1;
        }
        else if (*ptr != ':' && *ptr != ',')
        {
            LOG_err << "Parse error (unexpected " << (*ptr ? *ptr : '0') << ")";
            return false;
        }

        ptr++;

        if (!openobject[0] && !openobject[1])
        {
            if (s)
            {
                if (*pos == '"')
                {
                    s->assign(pos + 1, static_cast<size_t>(ptr - pos - 2));
                }
                else
                {
                    s->assign(pos, static_cast<size_t>(ptr - pos));
                }
            }

            pos = ptr;
            return true;
        }
    }
}

bool JSON::isnumeric()
{
    if (*pos == ',' || *pos == ':')
    {
        pos++;
    }

    const char* ptr = pos;

    if (*ptr == '-')
    {
        ptr++;
    }

    return *ptr >= '0' && *ptr <= '9';
}

bool JSON::isnull()
{
    const char* ptr = pos;

    if (*ptr == ',' || *ptr == ':')
    {
        ptr++;
    }

    return !strncmp(ptr, "null", 4);
}

// decode integer
m_off_t JSON::getint()
{
    const char* ptr;

    if (*pos == ':' || *pos == ',')
    {
        pos++;
    }

    ptr = pos;

    if (*ptr == '"')
    {
        ptr++;
    }

    if ((*ptr < '0' || *ptr > '9') && *ptr != '-')
    {
        LOG_err << "Parse error (getint)";

        // Don't get stuck on the value.
        storeobject();

        return -1;
    }

    auto r = static_cast<m_off_t>(strtoll(ptr, nullptr, 10));
    storeobject();

    return r;
}

bool JSON::getbool()
{
    if (*pos == ':' || *pos == ',')
    {
        pos++;
    }

    if (isnumeric())
    {
        return getint() != 0;
    }

    bool r = !strncmp(pos, "true", 4);
    storeobject();

    return r;
}

std::string JSON::getname()
{
    const char* ptr = pos;
    std::string name;

    if (*ptr == ',' || *ptr == ':')
    {
        ptr++;
    }

    if (*ptr++ == '"')
    {
        while (*ptr && *ptr != '"')
        {
            name += *ptr;
            ptr++;
        }

        if (*ptr == '"' && ptr[1] == ':')
        {
            pos = ptr + 2;
        }
        else
        {
            LOG_err << "Parse error (getname)";
            name.clear();
        }
    }

    return name;
}

bool JSON::getstring(std::string& value)
{
    if (*pos == ':' || *pos == ',')
    {
        pos++;
    }

    if (*pos != '"')
    {
        return false;
    }

    std::string raw;

    if (!storeobject(&raw))
    {
        return false;
    }

    unescape(&raw);
    value = std::move(raw);

    return true;
}

// try to to enter array
bool JSON::enterarray()
{
    if (*pos == ',' || *pos == ':')
    {
        pos++;
    }

    if (*pos == '[')
    {
        pos++;
        return true;
    }

    return false;
}

// leave array (must be at end of array)
bool JSON::leavearray()
{
    if (*pos == ']')
    {
        pos++;
        return true;
    }

    LOG_err << "Parse error (leavearray)";
    return false;
}

// try to enter object
bool JSON::enterobject()
{
    if (*pos == ',' || *pos == ':')
    {
        pos++;
    }

    if (*pos == '{')
    {
        pos++;
        return true;
    }

    return false;
}

// leave object (skip remainder)
bool JSON::leaveobject()
{
    for (; ;)
    {
        if (*pos == ':' || *pos == ',' || *pos == ' ')
        {
            pos++;
        }
        else if (*pos == '"'
                || (*pos >= '0' && *pos <= '9')
                || *pos == '-'
                || *pos == '['
                || *pos == '{'
                || literal(pos))
        {
            if (!storeobject())
                break;
        }
        else if (*pos == ']')
        {
            LOG_err << "Parse error (unexpected ']' character)";
            pos++;
        }
        else
        {
            break;
        }
    }

    if (*pos == '}')
    {
        pos++;
        return true;
    }

    LOG_err << "Parse error (leaveobject)";
    return false;
}

// unescape JSON string (non-strict)
void JSON::unescape(std::string* s)
{
    std::string result;

    result.reserve(s->size());

    for (std::size_t i = 0; i < s->size(); i++)
    {
        char c = (*s)[i];

        if (c != '\\' || i + 1 == s->size())
        {
            result.push_back(c);
            continue;
        }

        switch ((*s)[++i])
        {
            case 'n':
                result.push_back('\n');
                break;

            case 'r':
                result.push_back('\r');
                break;

            case 'b':
                result.push_back('\b');
                break;

            case 'f':
                result.push_back('\f');
                break;

            case 't':
                result.push_back('\t');
                break;

            case 'u':
            {
                auto cp = hex4(*s, i + 1);

                if (cp < 0)
                {
                    result.push_back('u');
                    break;
                }

                i += 4;

                // surrogate pair
                if (cp >= 0xD800 && cp < 0xDC00
                    && i + 2 < s->size()
                    && (*s)[i + 1] == '\\'
                    && (*s)[i + 2] == 'u')
                {
                    auto low = hex4(*s, i + 3);

                    if (low >= 0xDC00 && low < 0xE000)
                    {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        i += 6;
                    }
                }

                appendUtf8(result, static_cast<unsigned long>(cp));
                break;
            }

            default:
                result.push_back((*s)[i]);
        }
    }

    s->swap(result);
}

std::string JSON::stripWhitespace(const std::string& text)
{
    return stripWhitespace(text.c_str());
}

std::string JSON::stripWhitespace(const char* text)
{
    JSON reader(text);
    std::string result;

    while (*reader.pos)
    {
        if (*reader.pos == '"')
        {
            std::string temp;

            result.push_back('"');

            if (!reader.storeobject(&temp))
                return result;

            result.append(temp);
            result.push_back('"');
        }
        else if (std::isspace(static_cast<unsigned char>(*reader.pos)))
            ++reader.pos;
        else
            result.push_back(*reader.pos++);
    }

    return result;
}

} // sharemirror
