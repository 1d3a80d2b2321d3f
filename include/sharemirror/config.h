#ifndef SHAREMIRROR_CONFIG_H
#define SHAREMIRROR_CONFIG_H 1

#include <chrono>
#include <string>

#include <sharemirror/expected.h>
#include <sharemirror/log_level.h>
#include <sharemirror/types.h>

namespace sharemirror
{

class Arguments;

// Default Onezone when none is given.
extern const char* const DEFAULT_ONEZONE;

struct MirrorConfig
{
    // Base URL of the sharing service.
    std::string mOnezone = DEFAULT_ONEZONE;

    // Identifier of the shared file, directory or space.
    std::string mFileId;

    // Where the mirrored tree is created.
    std::string mOutputDir = ".";

    // Size of each byte range request.
    m_off_t mChunkSize = 4 * 1024 * 1024;

    // Chunk workers per active file.
    unsigned mWorkers = 1;

    // Files transferred at the same time.
    unsigned mFileWorkers = 1;

    // How many times a transient chunk failure is retried.
    unsigned mRetryLimit = 3;

    // Base delay between retries, grows linearly with each attempt.
    std::chrono::milliseconds mRetryDelay{250};

    // Children requested per listing page.
    unsigned mPageSize = 1000;

    // Per request timeout, zero for none.
    std::chrono::seconds mTimeout{60};

    // Stop at the first failure.
    bool mFailFast = false;

    // Don't download files that already exist with the right size.
    bool mSkipExisting = false;

    LogLevel mLogLevel = logInfo;

    // Optional file that receives a copy of all log output.
    std::string mLogFile;

    // Set when --help was requested.
    bool mHelp = false;

    // Build a configuration from parsed command line arguments.
    static ErrorOr<MirrorConfig> fromArguments(const Arguments& arguments);
}; // MirrorConfig

// Parse "32M", "512k", "1GiB", "4096" into a byte count.
ErrorOr<m_off_t> parseSize(const std::string& text);

// Parse a strictly positive integer.
ErrorOr<unsigned> parsePositive(const std::string& text, bool allowZero = false);

std::string usage(const char* program);

} // sharemirror

#endif
