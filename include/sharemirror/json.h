#ifndef SHAREMIRROR_JSON_H
#define SHAREMIRROR_JSON_H 1

#include <string>

#include <sharemirror/types.h>

namespace sharemirror
{

// linear non-strict JSON scanner
//
// Expects input without insignificant whitespace, see stripWhitespace().
struct JSON
{
    JSON()
      : pos(nullptr)
    {
    }

    explicit JSON(const std::string& data)
      : pos(data.c_str())
    {
    }

    explicit JSON(const char* data)
      : pos(data)
    {
    }

    const char* pos;

    bool isnumeric();

    // true when the next value is the literal null
    bool isnull();

    m_off_t getint();

    // true/false literals, or numbers (non-zero is true)
    bool getbool();

    // Returns the attribute name and positions at its value,
    // or an empty string at the end of an object.
    std::string getname();

    // Unescaped string value. Returns false if the value isn't a string.
    bool getstring(std::string& value);

    bool enterarray();
    bool leavearray();

    bool enterobject();
    bool leaveobject();

    // Store (or skip) the next value, repositioning after it.
    bool storeobject(std::string* = nullptr);

    static void unescape(std::string*);

    // Strip whitespace from a string in a JSON-safe manner.
    static std::string stripWhitespace(const std::string& text);
    static std::string stripWhitespace(const char* text);
}; // JSON

} // sharemirror

#endif
