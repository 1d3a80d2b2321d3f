#include <cassert>
#include <ctime>
#include <iostream>

#include <sharemirror/logging.h>

namespace sharemirror
{

ConsoleLogger g_consoleLogger;

std::atomic<Logger*> SimpleLogger::logger{&g_consoleLogger};

// by the default, display logs with level equal or less than logInfo
std::atomic<LogLevel> SimpleLogger::logCurrentLevel{logInfo};

SimpleLogger::SimpleLogger(const LogLevel ll, const char* filename, const int line)
  : level(ll)
{
    if (!logger)
        return;

    t = getTime();

    std::ostringstream oss;
    oss << filename;
    if (line >= 0)
    {
        oss << ":" << line;
    }
    fname = oss.str();
}

SimpleLogger::~SimpleLogger()
{
    if (auto* output = logger.load())
        output->log(t.c_str(), level, fname.c_str(), ostr.str().c_str());
}

std::string SimpleLogger::getTime()
{
    char ts[50];
    time_t t = std::time(NULL);
    std::tm tm{};

    gmtime_r(&t, &tm);

    if (std::strftime(ts, sizeof(ts), "%H:%M:%S", &tm)) return ts;

    return {};
}

const char* SimpleLogger::toStr(LogLevel ll)
{
    switch (ll)
    {
        case logVerbose: return "verbose";
        case logDebug: return "debug";
        case logInfo: return "info";
        case logWarning: return "warn";
        case logError: return "err";
        case logFatal: return "FATAL";
    }
    assert(false);
    return "";
}

void SimpleLogger::postLog(LogLevel logLevel, const char* message, const char* filename, int line)
{
    if (getLogLevel() < logLevel)
        return;

    SimpleLogger entry(logLevel, filename ? filename : "", filename ? line : -1);
    if (message)
    {
        entry << message;
    }
}

bool ConsoleLogger::setLogFile(const std::string& path)
{
    std::lock_guard<std::mutex> guard(mLock);

    if (mFile.is_open())
        mFile.close();

    mFile.open(path, std::ios::out | std::ios::app);

    return mFile.is_open();
}

void ConsoleLogger::setLogToConsole(bool enable)
{
    std::lock_guard<std::mutex> guard(mLock);

    mConsole = enable;
}

void ConsoleLogger::log(const char* time, int loglevel, const char* source, const char* message)
{
    if (!time)
    {
        time = "";
    }

    if (!source)
    {
        source = "";
    }

    if (!message)
    {
        message = "";
    }

    auto levelName = SimpleLogger::toStr(static_cast<LogLevel>(loglevel));

    std::lock_guard<std::mutex> guard(mLock);

    if (mConsole)
    {
        std::cerr << "[" << time << "][" << levelName << "] " << message;

        // file:line only adds noise at the default level
        if (SimpleLogger::getLogLevel() >= logDebug && *source)
            std::cerr << " [" << source << "]";

        std::cerr << std::endl;
    }

    if (mFile.is_open())
    {
        mFile << "[" << time << "][" << levelName << "] " << message
              << " [" << source << "]" << std::endl;
    }
}

} // sharemirror
