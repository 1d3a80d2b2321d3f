#include <cstring>

#include <sharemirror/chunkscheduler.h>
#include <sharemirror/fileassembler.h>
#include <sharemirror/logging.h>

namespace sharemirror
{

FileAssembler::FileAssembler(std::unique_ptr<FileAccess> file)
  : mFile(std::move(file))
  , mState()
  , mOpen(false)
{
    if (!mFile)
        mFile = newFileAccess();
}

FileAssembler::~FileAssembler()
{
    if (mOpen && !mFile->closef())
    {
        LOG_warn << "Unable to close " << mState.mPartialPath << ": " << strerror(mFile->errorcode);
    }
}

void FileAssembler::fail(const ChunkResult& result, Error error)
{
    ++mState.mChunksFailed;

    if (mState.failed())
        return;

    error.annotate(mState.mPath + " at offset " + std::to_string(result.mOffset));

    mState.mFailure = std::move(error);
}

Error FileAssembler::open(const std::string& path, m_off_t size, std::size_t chunkCount)
{
    mState = TransferState();
    mState.mPath = path;
    mState.mPartialPath = partialPath(path);
    mState.mSize = size;
    mState.mChunkCount = chunkCount;

    if (!mFile->fopen(mState.mPartialPath))
    {
        mState.mFailure = Error(API_EWRITE,
                                mState.mPartialPath + ": " + strerror(mFile->errorcode));
        return mState.mFailure;
    }

    mOpen = true;

    if (!mFile->ftruncate(size))
    {
        mState.mFailure = Error(API_EWRITE,
                                path + ": unable to allocate " + std::to_string(size)
                                + " bytes: " + strerror(mFile->errorcode));
        return mState.mFailure;
    }

    return API_OK;
}

Error FileAssembler::accept(const ChunkResult& result)
{
    if (!result.succeeded())
    {
        fail(result, result.mOutcome);
        return result.mOutcome;
    }

    auto length = static_cast<m_off_t>(result.mData.size());

    if (result.mOffset < 0
        || length != result.mLength
        || result.mOffset + length > mState.mSize)
    {
        Error error(API_ERANGE,
                    "chunk of " + std::to_string(length) + " bytes doesn't fit");

        fail(result, error);
        return error;
    }

    if (!mOpen)
    {
        Error error(API_EWRITE, "file isn't open");

        fail(result, error);
        return error;
    }

    if (!mFile->fwrite(reinterpret_cast<const byte*>(result.mData.data()),
                       result.mData.size(),
                       result.mOffset))
    {
        Error error(API_EWRITE, strerror(mFile->errorcode));

        LOG_err << "Unable to write " << length << " bytes at " << result.mOffset
                << " of " << mState.mPath << ": " << error.message();

        fail(result, error);
        return error;
    }

    ++mState.mChunksWritten;
    mState.mBytesWritten += length;

    return API_OK;
}

Error FileAssembler::finish()
{
    m_off_t size = -1;

    if (mOpen)
    {
        if (!mState.failed() && !mFile->fstat(size))
        {
            mState.mFailure = Error(API_EREAD,
                                    mState.mPath + ": " + strerror(mFile->errorcode));
        }

        mOpen = false;

        if (!mFile->closef() && !mState.failed())
        {
            mState.mFailure = Error(API_EWRITE,
                                    mState.mPath + ": " + strerror(mFile->errorcode));
        }
    }

    if (mState.failed())
        return mState.mFailure;

    if (!mState.complete())
    {
        mState.mFailure = Error(API_EINCOMPLETE,
                                mState.mPath + ": " + std::to_string(mState.mChunksWritten)
                                + " of " + std::to_string(mState.mChunkCount)
                                + " chunks received");
        return mState.mFailure;
    }

    if (mState.mBytesWritten != mState.mSize || size != mState.mSize)
    {
        mState.mFailure = Error(API_EINCOMPLETE,
                                mState.mPath + ": expected " + std::to_string(mState.mSize)
                                + " bytes, wrote " + std::to_string(mState.mBytesWritten));
        return mState.mFailure;
    }

    auto result = renameFile(mState.mPartialPath, mState.mPath);

    if (result != API_OK)
        mState.mFailure = result;

    return result;
}

} // sharemirror
