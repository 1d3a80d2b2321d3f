/**
 * sharemirror: mirror a public Onedata share to a local directory.
 *
 * Usage: sharemirror [options] <file-id>
 */
#include <iostream>

#include <sharemirror/arguments.h>
#include <sharemirror/config.h>
#include <sharemirror/logging.h>
#include <sharemirror/mirror.h>
#include <sharemirror/posix/net.h>
#include <sharemirror/posix/signals.h>
#include <sharemirror/shareclient.h>

using namespace sharemirror;

static void printSummary(const Summary& summary)
{
    std::cout << "Files downloaded: " << summary.mFilesSucceeded << std::endl
              << "Files skipped:    " << summary.mFilesSkipped << std::endl
              << "Files failed:     " << summary.mFilesFailed << std::endl
              << "Directories:      " << summary.mDirectoriesCreated << std::endl
              << "Bytes written:    " << summary.mBytesWritten << std::endl;

    for (auto& failure : summary.mFailures)
        std::cout << "Failed: " << failure.mPath << ": " << failure.mError << std::endl;
}

int main(int argc, char* argv[])
{
    auto arguments = ArgumentsParser::parse(argc, argv);
    auto config = MirrorConfig::fromArguments(arguments);

    if (!config)
    {
        std::cerr << config.error().message() << std::endl << std::endl
                  << usage(argv[0]);
        return 1;
    }

    if (config->mHelp)
    {
        std::cout << usage(argv[0]);
        return 0;
    }

    ConsoleLogger output;

    if (!config->mLogFile.empty() && !output.setLogFile(config->mLogFile))
    {
        std::cerr << "Unable to open log file: " << config->mLogFile << std::endl;
        return 1;
    }

    SimpleLogger::setOutputClass(&output);
    SimpleLogger::setLogLevel(config->mLogLevel);

    CurlHttpIO httpio;

    httpio.setTimeout(config->mTimeout);

    RestShareClient client(httpio, config->mOnezone, config->mPageSize);

    MirrorOptions options;

    options.mChunkSize = config->mChunkSize;
    options.mWorkers = config->mWorkers;
    options.mFileWorkers = config->mFileWorkers;
    options.mFailFast = config->mFailFast;
    options.mSkipExisting = config->mSkipExisting;
    options.mRetry.mRetryLimit = config->mRetryLimit;
    options.mRetry.mRetryDelay = config->mRetryDelay;

    Mirror mirror(client, options);
    SignalWatcher watcher(mirror);

    auto summary = mirror.run(config->mFileId, config->mOutputDir);

    // No cancellation once the run's over.
    watcher.stop();

    if (!summary)
    {
        LOG_err << "Mirroring " << config->mFileId << " failed: " << summary.error();

        SimpleLogger::setOutputClass(nullptr);
        return 1;
    }

    printSummary(*summary);

    // The logger's going out of scope.
    SimpleLogger::setOutputClass(nullptr);

    return summary->status();
}
