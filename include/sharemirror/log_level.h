#ifndef SHAREMIRROR_LOG_LEVEL_H
#define SHAREMIRROR_LOG_LEVEL_H 1

#include <string>

namespace sharemirror
{

#define DEFINE_LOG_LEVELS(expander) \
    expander(Fatal) \
    expander(Error) \
    expander(Warning) \
    expander(Info) \
    expander(Debug) \
    expander(Verbose)

enum LogLevel : int
{
#define DEFINE_LOG_LEVEL_ENUMERANT(name) log ## name,
    DEFINE_LOG_LEVELS(DEFINE_LOG_LEVEL_ENUMERANT)
#undef DEFINE_LOG_LEVEL_ENUMERANT
    logMax = logVerbose
}; // LogLevel

// Case insensitive. Returns false if level names no known level.
bool toLogLevel(const std::string& level, LogLevel& result);

const char* toString(LogLevel level);

} // sharemirror

#endif
