/* Usage example:

    // log debug messages and above
    SimpleLogger::setLogLevel(logDebug);

    // send messages to the console, and append them to a file
    ConsoleLogger output;
    output.setLogFile("mirror.log");
    SimpleLogger::setOutputClass(&output);

    LOG_debug << "Listing " << identifier;
    LOG_info << "File " << path << " downloaded";

   Each statement produces exactly one call to the output class, stamped with
   the UTC time and the emitting file:line.
*/
#ifndef SHAREMIRROR_LOGGING_H
#define SHAREMIRROR_LOGGING_H 1

#include <atomic>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>

#include <sharemirror/log_level.h>
#include <sharemirror/types.h>

namespace sharemirror
{

// Output Log Interface
class Logger
{
public:
    virtual ~Logger() = default;

    virtual void log(const char* time, int loglevel, const char* source, const char* message) = 0;
}; // Logger

class SimpleLogger
{
    LogLevel level;

    std::ostringstream ostr;
    std::string t;
    std::string fname;

    static std::string getTime();

    static std::atomic<Logger*> logger;

    static std::atomic<LogLevel> logCurrentLevel;

public:
    SimpleLogger(const LogLevel ll, const char* filename, const int line);

    ~SimpleLogger();

    static const char* toStr(LogLevel ll);

    template<typename T>
    SimpleLogger& operator<<(const T& value)
    {
        ostr << value;
        return *this;
    }

    SimpleLogger& operator<<(const std::error_code& value)
    {
        ostr << value.category().name() << ": " << value.message();
        return *this;
    }

    // set the output class for all log levels
    static void setOutputClass(Logger* logger_class)
    {
        logger = logger_class;
    }

    static Logger* getOutputClass()
    {
        return logger;
    }

    static void setLogLevel(LogLevel ll)
    {
        logCurrentLevel = ll;
    }

    static LogLevel getLogLevel()
    {
        return logCurrentLevel;
    }

    // LOG_info << "foo", SimpleLogger::postLog(logInfo, "bar", filename, line);
    static void postLog(LogLevel logLevel, const char* message, const char* filename, int line);
}; // SimpleLogger

// source file leaf name - maybe compile time
template<std::size_t N> inline const char* log_file_leafname(const char (&fullpath)[N])
{
    for (std::size_t i = N; i--; )
    {
        if (fullpath[i] == '/' || fullpath[i] == '\\')
        {
            return &fullpath[i + 1];
        }
    }
    return fullpath;
}

// An intermediate class used to suppress the "statement has no effect" warning
class LoggerVoidify
{
public:
    void operator&(const SimpleLogger&) { }
};

#define LOG_verbose \
    ::sharemirror::SimpleLogger::getLogLevel() < ::sharemirror::logMax ? (void)0 : \
        ::sharemirror::LoggerVoidify() & ::sharemirror::SimpleLogger(::sharemirror::logMax, ::sharemirror::log_file_leafname(__FILE__), __LINE__)

#define LOG_debug \
    ::sharemirror::SimpleLogger::getLogLevel() < ::sharemirror::logDebug ? (void)0 : \
        ::sharemirror::LoggerVoidify() & ::sharemirror::SimpleLogger(::sharemirror::logDebug, ::sharemirror::log_file_leafname(__FILE__), __LINE__)

#define LOG_info \
    ::sharemirror::SimpleLogger::getLogLevel() < ::sharemirror::logInfo ? (void)0 : \
        ::sharemirror::LoggerVoidify() & ::sharemirror::SimpleLogger(::sharemirror::logInfo, ::sharemirror::log_file_leafname(__FILE__), __LINE__)

#define LOG_warn \
    ::sharemirror::SimpleLogger::getLogLevel() < ::sharemirror::logWarning ? (void)0 : \
        ::sharemirror::LoggerVoidify() & ::sharemirror::SimpleLogger(::sharemirror::logWarning, ::sharemirror::log_file_leafname(__FILE__), __LINE__)

#define LOG_err \
    ::sharemirror::SimpleLogger::getLogLevel() < ::sharemirror::logError ? (void)0 : \
        ::sharemirror::LoggerVoidify() & ::sharemirror::SimpleLogger(::sharemirror::logError, ::sharemirror::log_file_leafname(__FILE__), __LINE__)

#define LOG_fatal \
    ::sharemirror::SimpleLogger(::sharemirror::logFatal, ::sharemirror::log_file_leafname(__FILE__), __LINE__)

// Writes "[time][level] message" lines to std::cerr and, optionally, a file.
class ConsoleLogger : public Logger
{
    std::mutex mLock;

    std::ofstream mFile;

    bool mConsole = true;

public:
    // Append to path as well as the console. Returns false if it can't be opened.
    bool setLogFile(const std::string& path);

    void setLogToConsole(bool enable);

    void log(const char* time, int loglevel, const char* source, const char* message) override;
}; // ConsoleLogger

} // sharemirror

#endif
