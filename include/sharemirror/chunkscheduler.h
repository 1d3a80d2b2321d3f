#ifndef SHAREMIRROR_CHUNKSCHEDULER_H
#define SHAREMIRROR_CHUNKSCHEDULER_H 1

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <sharemirror/node.h>
#include <sharemirror/types.h>

namespace sharemirror
{

class ShareClient;

// A byte range of a file that needs to be fetched.
struct ChunkTask
{
    std::string mFileId;
    m_off_t mOffset = 0;
    m_off_t mLength = 0;
}; // ChunkTask

struct ChunkResult
{
    m_off_t mOffset = 0;
    m_off_t mLength = 0;

    // Content, empty unless the chunk succeeded.
    std::string mData;

    Error mOutcome = API_OK;

    // How many requests were made for this chunk.
    unsigned mAttempts = 0;

    bool succeeded() const
    {
        return mOutcome == API_OK;
    }
}; // ChunkResult

struct RetryPolicy
{
    // How many times a transient failure is retried.
    unsigned mRetryLimit = 3;

    // Base backoff, multiplied by the attempt number.
    std::chrono::milliseconds mRetryDelay{250};

    std::chrono::milliseconds delay(unsigned attempt) const
    {
        return mRetryDelay * attempt;
    }
}; // RetryPolicy

// The results of a file's chunk transfers, in completion order.
//
// Owns the workers performing the transfers. Destroying a stream that
// hasn't been drained cancels it and waits for its workers to finish.
class ChunkStream
{
    class Context;

    friend class ChunkScheduler;

    std::unique_ptr<Context> mContext;

    explicit ChunkStream(std::unique_ptr<Context> context);

public:
    // A stream that has nothing to deliver.
    ChunkStream();

    ChunkStream(ChunkStream&& other);

    ~ChunkStream();

    ChunkStream& operator=(ChunkStream&& rhs);

    // Wait for the next result. Returns false once every task has reported.
    bool next(ChunkResult& result);

    // Stop fetching. Tasks not yet fetched report LOCAL_ECANCELLED.
    //
    // Safe to call from any thread.
    void cancel();

    bool cancelled() const;

    // How many results this stream will deliver.
    std::size_t total() const;

    // How many results have been delivered so far.
    std::size_t received() const;

    std::size_t workerCount() const;
}; // ChunkStream

class ChunkScheduler
{
    // Where chunks are fetched from.
    ShareClient& mClient;

    // How transient failures are handled.
    RetryPolicy mPolicy;

public:
    explicit ChunkScheduler(ShareClient& client, RetryPolicy policy = RetryPolicy());

    // Split [0, size) into consecutive chunks of chunkSize bytes.
    //
    // The last chunk holds whatever remains. Zero sized files have no chunks.
    static std::vector<ChunkTask> partition(const std::string& id,
                                            m_off_t size,
                                            m_off_t chunkSize);

    static std::size_t chunkCount(m_off_t size, m_off_t chunkSize);

    // Start fetching a file's content with at most workerCount workers.
    ChunkStream scheduleFile(const Node& node, m_off_t chunkSize, unsigned workerCount);
}; // ChunkScheduler

} // sharemirror

#endif
