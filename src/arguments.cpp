#include <sharemirror/arguments.h>

namespace sharemirror
{

std::string Arguments::getValue(const std::string& name, const std::string& defaultValue) const
{
    auto it = mValues.find(name);
    return it == mValues.end() ? defaultValue : it->second;
}

const std::vector<std::string>& Arguments::positionals() const
{
    return mPositionals;
}

unsigned Arguments::count(const std::string& name) const
{
    auto it = mCounts.find(name);
    return it == mCounts.end() ? 0u : it->second;
}

bool Arguments::empty() const
{
    return mValues.empty() && mPositionals.empty();
}

Arguments::size_type Arguments::size() const
{
    return mValues.size();
}

bool Arguments::contains(const std::string& name) const
{
    return mValues.count(name) > 0;
}

std::ostream& operator<<(std::ostream& os, const Arguments& arguments)
{
    for (auto& argument : arguments.mValues)
    {
        os << "  " << argument.first << "=" << argument.second << std::endl;
    }
    for (auto& positional : arguments.mPositionals)
    {
        os << "  " << positional << std::endl;
    }
    return os;
}

Arguments ArgumentsParser::parse(int argc, char* argv[])
{
    Arguments arguments;

    // Everything after "--" is positional.
    bool optionsEnded = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (!optionsEnded && arg == "--")
        {
            optionsEnded = true;
            continue;
        }

        if (optionsEnded || arg.size() < 2 || arg[0] != '-')
        {
            arguments.mPositionals.emplace_back(std::move(arg));
            continue;
        }

        auto argument = parseOneArgument(arg);

        ++arguments.mCounts[argument.first];

        // A argument wouldn't be emplaced (thus dropped) if it is duplicated with a previous one
        arguments.mValues.emplace(std::move(argument));
    }

    return arguments;
}

std::pair<std::string, std::string> ArgumentsParser::parseOneArgument(const std::string& argument)
{
    const auto pos = argument.find('=');
    return pos == argument.npos ?
                  std::make_pair(argument, std::string()) :
                  std::make_pair(argument.substr(0, pos), argument.substr(pos + 1));
}

} // sharemirror
