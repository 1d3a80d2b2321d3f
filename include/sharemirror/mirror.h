#ifndef SHAREMIRROR_MIRROR_H
#define SHAREMIRROR_MIRROR_H 1

#include <atomic>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <sharemirror/chunkscheduler.h>
#include <sharemirror/expected.h>
#include <sharemirror/node.h>

namespace sharemirror
{

class ShareClient;

struct MirrorOptions
{
    // Size of each byte range request.
    m_off_t mChunkSize = 4 * 1024 * 1024;

    // Chunk workers per active file.
    unsigned mWorkers = 1;

    // Files transferred at the same time.
    unsigned mFileWorkers = 1;

    // Stop at the first failure.
    bool mFailFast = false;

    // Leave files that already exist with the right size alone.
    bool mSkipExisting = false;

    RetryPolicy mRetry;
}; // MirrorOptions

// What a run achieved.
struct Summary
{
    std::size_t mFilesSucceeded = 0;
    std::size_t mFilesFailed = 0;
    std::size_t mFilesSkipped = 0;
    std::size_t mDirectoriesCreated = 0;

    m_off_t mBytesWritten = 0;

    // Every subtree, directory and file that failed.
    std::vector<PathError> mFailures;

    // 0 when everything succeeded, 2 for a partial success and 3 when
    // nothing could be mirrored.
    int status() const;

    bool succeeded() const
    {
        return mFailures.empty();
    }
}; // Summary

// Receives progress notifications.
//
// Called from transfer threads, possibly concurrently when more than one
// file is transferred at a time.
class MirrorListener
{
public:
    virtual ~MirrorListener() = default;

    virtual void onDirectoryCreated(const std::string&, bool /* existed */)
    {
    }

    virtual void onFileStarted(const std::string&, m_off_t /* size */)
    {
    }

    virtual void onChunkWritten(const std::string&, const ChunkResult&)
    {
    }

    virtual void onFileFinished(const std::string&, const Error&)
    {
    }
}; // MirrorListener

// Mirrors a share to a local directory.
class Mirror
{
    struct FileOutcome;

    // Where the content comes from.
    ShareClient& mClient;

    // How we mirror by default.
    MirrorOptions mOptions;

    // Who we tell about progress, may be null.
    MirrorListener* mListener;

    // Set by cancel().
    std::atomic<bool> mCancelled;

    // Set when the current run should wind down.
    std::atomic<bool> mStopping;

    // Why the current run stopped.
    Error mFailure;

    // Streams that are currently transferring.
    std::set<ChunkStream*> mStreams;

    // Serializes access to mFailure and mStreams.
    std::mutex mLock;

    ErrorOr<Summary> execute(const std::string& id,
                             const std::string& destination,
                             const MirrorOptions& options);

    // Transfer a single file.
    FileOutcome transfer(const Node& node,
                         const std::string& path,
                         const MirrorOptions& options,
                         ChunkScheduler& scheduler);

    // Track a stream so that it can be cancelled. False if we're stopping.
    bool track(ChunkStream& stream);

    void untrack(ChunkStream& stream);

    // Wind down the current run, remembering the first reason.
    void stop(const Error& reason);

public:
    Mirror(ShareClient& client,
           MirrorOptions options = MirrorOptions(),
           MirrorListener* listener = nullptr);

    Mirror(const Mirror& other) = delete;

    Mirror& operator=(const Mirror& rhs) = delete;

    // Mirror id below destination.
    //
    // Only failures that prevent the run altogether are returned as errors.
    // Individual file and subtree failures are reported in the summary,
    // unless fail-fast is enabled.
    ErrorOr<Summary> run(const std::string& id, const std::string& destination);

    ErrorOr<Summary> run(const std::string& id,
                         const std::string& destination,
                         m_off_t chunkSize,
                         unsigned workerCount);

    // Stop the current run, if any, and any future ones.
    //
    // Safe to call from any thread.
    void cancel();

    bool cancelled() const
    {
        return mCancelled;
    }

    const MirrorOptions& options() const
    {
        return mOptions;
    }
}; // Mirror

} // sharemirror

#endif
