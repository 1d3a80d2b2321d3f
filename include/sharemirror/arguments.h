#ifndef SHAREMIRROR_ARGUMENTS_H
#define SHAREMIRROR_ARGUMENTS_H 1

#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace sharemirror
{

// A simple arguments parser that supports --name=value, --name and positionals.
// See unit test for the usage
class Arguments
{
public:
    using size_type = std::unordered_map<std::string, std::string>::size_type;

    bool contains(const std::string& name) const;

    std::string getValue(const std::string& name, const std::string& defaultValue = "") const;

    // Words that don't start with '-', in command line order.
    const std::vector<std::string>& positionals() const;

    // Number of times a bare option was repeated, e.g. -v -v.
    unsigned count(const std::string& name) const;

    bool empty() const;

    size_type size() const;

private:
    friend class ArgumentsParser;

    friend std::ostream& operator<<(std::ostream& os, const Arguments& arguments);

    std::unordered_map<std::string, std::string> mValues;

    std::unordered_map<std::string, unsigned> mCounts;

    std::vector<std::string> mPositionals;
};

std::ostream& operator<<(std::ostream& os, const Arguments& arguments);


class ArgumentsParser
{
public:
    static Arguments parse(int argc, char* argv[]);

private:
    static std::pair<std::string, std::string> parseOneArgument(const std::string& argument);
};

} // sharemirror

#endif
