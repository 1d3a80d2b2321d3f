#include <algorithm>
#include <atomic>
#include <cassert>
#include <condition_variable>
#include <mutex>
#include <thread>

#include <sharemirror/channel.h>
#include <sharemirror/chunkscheduler.h>
#include <sharemirror/logging.h>
#include <sharemirror/shareclient.h>

namespace sharemirror
{

class ChunkStream::Context
{
    // Fetch a single chunk, retrying transient failures.
    ChunkResult fetch(const ChunkTask& task);

    // Wait before a retry. Returns false if we were cancelled meanwhile.
    bool backoff(std::chrono::milliseconds delay);

    // Executed by each worker.
    void loop();

    // Where chunks come from.
    ShareClient& mClient;

    // How failures are retried.
    const RetryPolicy mPolicy;

    // What needs fetching.
    const std::vector<ChunkTask> mTasks;

    // Index of the next task to be taken.
    std::atomic<std::size_t> mNext;

    // Completed chunks waiting to be consumed.
    Channel<ChunkResult> mResults;

    // Set when the transfer should stop.
    std::atomic<bool> mCancelled;

    // Lets cancel() interrupt a backoff.
    std::condition_variable mCV;
    std::mutex mLock;

    // How many workers are still running.
    std::atomic<std::size_t> mActive;

    // How many results the consumer has taken.
    std::size_t mReceived;

    // Who's doing the fetching.
    std::vector<std::thread> mWorkers;

public:
    Context(ShareClient& client,
            const RetryPolicy& policy,
            std::vector<ChunkTask> tasks,
            std::size_t workerCount);

    ~Context();

    void cancel();

    bool cancelled() const
    {
        return mCancelled;
    }

    bool next(ChunkResult& result);

    // Spawn the workers.
    void start(std::size_t workerCount);

    std::size_t received() const
    {
        return mReceived;
    }

    std::size_t total() const
    {
        return mTasks.size();
    }

    std::size_t workerCount() const
    {
        return mWorkers.size();
    }
}; // Context

ChunkStream::Context::Context(ShareClient& client,
                              const RetryPolicy& policy,
                              std::vector<ChunkTask> tasks,
                              std::size_t workerCount)
  : mClient(client)
  , mPolicy(policy)
  , mTasks(std::move(tasks))
  , mNext(0u)
  , mResults(workerCount)
  , mCancelled(false)
  , mCV()
  , mLock()
  , mActive(0u)
  , mReceived(0u)
  , mWorkers()
{
}

ChunkStream::Context::~Context()
{
    cancel();

    // Release any worker blocked on a full channel.
    mResults.close();

    for (auto& worker : mWorkers)
        worker.join();
}

bool ChunkStream::Context::backoff(std::chrono::milliseconds delay)
{
    std::unique_lock<std::mutex> lock(mLock);

    return !mCV.wait_for(lock, delay, [&]() { return mCancelled.load(); });
}

void ChunkStream::Context::cancel()
{
    {
        std::lock_guard<std::mutex> guard(mLock);

        mCancelled = true;
    }

    mCV.notify_all();
}

ChunkResult ChunkStream::Context::fetch(const ChunkTask& task)
{
    ChunkResult result;

    result.mOffset = task.mOffset;
    result.mLength = task.mLength;

    for (unsigned attempt = 1; ; ++attempt)
    {
        if (mCancelled)
        {
            result.mOutcome = Error(LOCAL_ECANCELLED, "Transfer cancelled");
            return result;
        }

        result.mAttempts = attempt;

        auto data = mClient.fetchRange(task.mFileId, task.mOffset, task.mLength);

        if (data)
        {
            result.mData = std::move(*data);
            result.mOutcome = API_OK;
            return result;
        }

        result.mOutcome = std::move(data).error();

        if (!result.mOutcome.retryable())
        {
            LOG_debug << "Chunk at " << task.mOffset << " of " << task.mFileId
                      << " failed: " << result.mOutcome;
            return result;
        }

        if (attempt > mPolicy.mRetryLimit)
        {
            LOG_warn << "Chunk at " << task.mOffset << " of " << task.mFileId
                     << " failed after " << attempt << " attempts: " << result.mOutcome;
            return result;
        }

        auto delay = mPolicy.delay(attempt);

        LOG_debug << "Chunk at " << task.mOffset << " of " << task.mFileId
                  << " failed: " << result.mOutcome
                  << ", retrying in " << delay.count() << "ms";

        if (!backoff(delay))
        {
            result.mOutcome = Error(LOCAL_ECANCELLED, "Transfer cancelled");
            return result;
        }
    }
}

void ChunkStream::Context::loop()
{
    for (;;)
    {
        auto index = mNext++;

        if (index >= mTasks.size())
            break;

        auto& task = mTasks[index];
        ChunkResult result;

        // Every task reports, even when we've been cancelled.
        if (mCancelled)
        {
            result.mOffset = task.mOffset;
            result.mLength = task.mLength;
            result.mOutcome = Error(LOCAL_ECANCELLED, "Transfer cancelled");
        }
        else
        {
            result = fetch(task);
        }

        // The stream's being torn down.
        if (!mResults.push(std::move(result)))
            break;
    }

    // Last one out closes the channel.
    if (--mActive == 0)
        mResults.close();
}

bool ChunkStream::Context::next(ChunkResult& result)
{
    if (mReceived == mTasks.size())
        return false;

    if (!mResults.pop(result))
        return false;

    ++mReceived;

    return true;
}

void ChunkStream::Context::start(std::size_t workerCount)
{
    workerCount = std::min(workerCount, mTasks.size());

    if (!workerCount)
    {
        mResults.close();
        return;
    }

    mActive = workerCount;
    mWorkers.reserve(workerCount);

    while (workerCount--)
        mWorkers.emplace_back(&Context::loop, this);
}

ChunkStream::ChunkStream(std::unique_ptr<Context> context)
  : mContext(std::move(context))
{
}

ChunkStream::ChunkStream()
  : mContext()
{
}

ChunkStream::ChunkStream(ChunkStream&& other) = default;

ChunkStream::~ChunkStream() = default;

ChunkStream& ChunkStream::operator=(ChunkStream&& rhs) = default;

bool ChunkStream::next(ChunkResult& result)
{
    return mContext && mContext->next(result);
}

void ChunkStream::cancel()
{
    if (mContext)
        mContext->cancel();
}

bool ChunkStream::cancelled() const
{
    return mContext && mContext->cancelled();
}

std::size_t ChunkStream::total() const
{
    return mContext ? mContext->total() : 0u;
}

std::size_t ChunkStream::received() const
{
    return mContext ? mContext->received() : 0u;
}

std::size_t ChunkStream::workerCount() const
{
    return mContext ? mContext->workerCount() : 0u;
}

ChunkScheduler::ChunkScheduler(ShareClient& client, RetryPolicy policy)
  : mClient(client)
  , mPolicy(policy)
{
}

std::size_t ChunkScheduler::chunkCount(m_off_t size, m_off_t chunkSize)
{
    assert(chunkSize > 0);

    if (size <= 0)
        return 0u;

    return static_cast<std::size_t>((size + chunkSize - 1) / chunkSize);
}

std::vector<ChunkTask> ChunkScheduler::partition(const std::string& id,
                                                 m_off_t size,
                                                 m_off_t chunkSize)
{
    std::vector<ChunkTask> tasks;

    tasks.reserve(chunkCount(size, chunkSize));

    for (m_off_t offset = 0; offset < size; offset += chunkSize)
    {
        ChunkTask task;

        task.mFileId = id;
        task.mOffset = offset;
        task.mLength = std::min(chunkSize, size - offset);

        tasks.emplace_back(std::move(task));
    }

    return tasks;
}

ChunkStream ChunkScheduler::scheduleFile(const Node& node, m_off_t chunkSize, unsigned workerCount)
{
    assert(node.isFile());

    auto tasks = partition(node.mId, node.mSize, chunkSize);
    auto workers = std::max<std::size_t>(1u, std::min<std::size_t>(workerCount, tasks.size()));

    LOG_debug << "Scheduling " << tasks.size() << " chunks of " << node.mId
              << " on " << (tasks.empty() ? 0u : workers) << " workers";

    auto context = std::make_unique<ChunkStream::Context>(mClient,
                                                          mPolicy,
                                                          std::move(tasks),
                                                          workers);

    context->start(workers);

    return ChunkStream(std::move(context));
}

} // sharemirror
