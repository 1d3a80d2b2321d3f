#include <algorithm>
#include <thread>

#include <sharemirror/fileassembler.h>
#include <sharemirror/filesystem.h>
#include <sharemirror/logging.h>
#include <sharemirror/mirror.h>
#include <sharemirror/shareclient.h>
#include <sharemirror/treeresolver.h>

namespace sharemirror
{

struct Mirror::FileOutcome
{
    Error mResult = API_OK;

    m_off_t mBytesWritten = 0;

    // Left alone as it was already present.
    bool mSkipped = false;

    // Whether the transfer ran at all.
    bool mStarted = false;
}; // FileOutcome

int Summary::status() const
{
    if (mFailures.empty())
        return 0;

    if (mFilesSucceeded || mFilesSkipped)
        return 2;

    return 3;
}

Mirror::Mirror(ShareClient& client, MirrorOptions options, MirrorListener* listener)
  : mClient(client)
  , mOptions(options)
  , mListener(listener)
  , mCancelled(false)
  , mStopping(false)
  , mFailure(API_OK)
  , mStreams()
  , mLock()
{
}

void Mirror::cancel()
{
    LOG_info << "Cancelling";

    mCancelled = true;

    stop(Error(LOCAL_ECANCELLED, "Mirror cancelled"));
}

void Mirror::stop(const Error& reason)
{
    std::lock_guard<std::mutex> guard(mLock);

    if (mFailure == API_OK)
        mFailure = reason;

    mStopping = true;

    for (auto* stream : mStreams)
        stream->cancel();
}

bool Mirror::track(ChunkStream& stream)
{
    std::lock_guard<std::mutex> guard(mLock);

    if (mStopping)
        return false;

    mStreams.insert(&stream);

    return true;
}

void Mirror::untrack(ChunkStream& stream)
{
    std::lock_guard<std::mutex> guard(mLock);

    mStreams.erase(&stream);
}

ErrorOr<Summary> Mirror::run(const std::string& id, const std::string& destination)
{
    return execute(id, destination, mOptions);
}

ErrorOr<Summary> Mirror::run(const std::string& id,
                             const std::string& destination,
                             m_off_t chunkSize,
                             unsigned workerCount)
{
    auto options = mOptions;

    options.mChunkSize = chunkSize;
    options.mWorkers = workerCount;

    return execute(id, destination, options);
}

Mirror::FileOutcome Mirror::transfer(const Node& node,
                                     const std::string& path,
                                     const MirrorOptions& options,
                                     ChunkScheduler& scheduler)
{
    FileOutcome outcome;

    if (options.mSkipExisting)
    {
        auto size = fileSize(path);

        if (size && *size == node.mSize)
        {
            LOG_info << "File " << path << " exists, not downloaded";

            outcome.mSkipped = true;
            return outcome;
        }
    }

    outcome.mStarted = true;

    LOG_info << "Downloading file " << path;

    if (mListener)
        mListener->onFileStarted(path, node.mSize);

    FileAssembler assembler;

    outcome.mResult = assembler.open(path,
                                     node.mSize,
                                     ChunkScheduler::chunkCount(node.mSize, options.mChunkSize));

    if (outcome.mResult == API_OK)
    {
        auto stream = scheduler.scheduleFile(node, options.mChunkSize, options.mWorkers);

        // We've been asked to stop before we got going.
        if (!track(stream))
            stream.cancel();

        ChunkResult chunk;

        while (stream.next(chunk))
        {
            auto result = assembler.accept(chunk);

            if (result == API_OK)
            {
                if (mListener)
                    mListener->onChunkWritten(path, chunk);

                continue;
            }

            // No point fetching the rest.
            if (options.mFailFast)
                stream.cancel();
        }

        untrack(stream);

        outcome.mResult = assembler.finish();
    }

    outcome.mBytesWritten = assembler.state().mBytesWritten;

    if (outcome.mResult == API_OK)
    {
        LOG_info << "File " << path << " downloaded";
    }
    else
    {
        LOG_err << "Error when downloading file " << path << ": " << outcome.mResult;
    }

    if (mListener)
        mListener->onFileFinished(path, outcome.mResult);

    return outcome;
}

ErrorOr<Summary> Mirror::execute(const std::string& id,
                                 const std::string& destination,
                                 const MirrorOptions& options)
{
    if (options.mChunkSize <= 0 || !options.mWorkers || !options.mFileWorkers)
        return unexpected(Error(API_EARGS, "Chunk size and worker counts must be positive"));

    {
        std::lock_guard<std::mutex> guard(mLock);

        if (mCancelled)
            return unexpected(Error(LOCAL_ECANCELLED, "Mirror cancelled"));

        mFailure = API_OK;
        mStopping = false;
    }

    LOG_info << "Mirroring " << id << " to " << destination;

    TreeResolver resolver(mClient, options.mFailFast, &mStopping);

    auto resolution = resolver.resolve(id);

    if (mCancelled)
        return unexpected(Error(LOCAL_ECANCELLED, "Mirror cancelled"));

    if (!resolution)
    {
        LOG_err << "Unable to resolve " << id << ": " << resolution.error();
        return unexpected(std::move(resolution).error());
    }

    Summary summary;
    auto& tree = resolution->mTree;

    summary.mFailures = resolution->mFailures;

    auto result = makeDirectories(destination);

    if (result != API_OK)
    {
        result.annotate("Destination");

        LOG_err << "Unable to create " << destination << ": " << result;

        return unexpected(std::move(result));
    }

    // Whether a directory exists locally.
    std::vector<bool> usable(tree.size(), true);
    std::vector<NodeIndex> files;

    for (auto index : tree.preorder())
    {
        auto& node = tree.node(index);
        auto relative = tree.path(index);

        if (node.mParent != UNDEF_INDEX && !usable[node.mParent])
        {
            usable[index] = false;

            if (node.isFile())
            {
                ++summary.mFilesFailed;
                summary.mFailures.push_back(
                  PathError{relative, Error(API_EWRITE, relative + ": parent directory missing")});
            }

            continue;
        }

        if (node.isFile())
        {
            files.push_back(index);
            continue;
        }

        auto path = joinPath(destination, relative);
        bool existed = false;

        result = makeDirectory(path, &existed);

        if (result != API_OK)
        {
            usable[index] = false;

            LOG_err << "Unable to create directory " << path << ": " << result;

            if (options.mFailFast)
                return unexpected(std::move(result));

            summary.mFailures.push_back(PathError{relative, result});
            continue;
        }

        if (existed)
        {
            LOG_info << "Directory " << path << " exists, not created";
        }
        else
        {
            LOG_info << "Creating directory " << path;
            ++summary.mDirectoriesCreated;
        }

        if (mListener)
            mListener->onDirectoryCreated(path, existed);
    }

    ChunkScheduler scheduler(mClient, options.mRetry);
    std::vector<FileOutcome> outcomes(files.size());
    std::atomic<std::size_t> next(0u);

    auto worker = [&]() {
        while (!mStopping)
        {
            auto i = next++;

            if (i >= files.size())
                break;

            auto& node = tree.node(files[i]);

            outcomes[i] = transfer(node,
                                   joinPath(destination, tree.path(files[i])),
                                   options,
                                   scheduler);

            auto& outcome = outcomes[i];

            if (options.mFailFast
                && outcome.mResult != API_OK
                && outcome.mResult != LOCAL_ECANCELLED)
            {
                stop(outcome.mResult);
            }
        }
    }; // worker

    std::vector<std::thread> threads;
    auto threadCount = std::min<std::size_t>(options.mFileWorkers, files.size());

    // The calling thread is one of the workers.
    for (std::size_t i = 1; i < threadCount; ++i)
        threads.emplace_back(worker);

    worker();

    for (auto& thread : threads)
        thread.join();

    if (mCancelled)
    {
        LOG_warn << "Mirroring of " << id << " cancelled";
        return unexpected(Error(LOCAL_ECANCELLED, "Mirror cancelled"));
    }

    if (mStopping)
    {
        std::lock_guard<std::mutex> guard(mLock);

        return unexpected(mFailure);
    }

    for (std::size_t i = 0; i < files.size(); ++i)
    {
        auto& outcome = outcomes[i];

        summary.mBytesWritten += outcome.mBytesWritten;

        if (outcome.mSkipped)
        {
            ++summary.mFilesSkipped;
        }
        else if (outcome.mResult == API_OK)
        {
            ++summary.mFilesSucceeded;
        }
        else
        {
            ++summary.mFilesFailed;
            summary.mFailures.push_back(PathError{tree.path(files[i]), outcome.mResult});
        }
    }

    LOG_info << "Mirrored " << id << ": "
             << summary.mFilesSucceeded << " files downloaded, "
             << summary.mFilesSkipped << " skipped, "
             << summary.mFilesFailed << " failed, "
             << summary.mBytesWritten << " bytes written";

    return summary;
}

} // sharemirror
