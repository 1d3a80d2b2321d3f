#ifndef SHAREMIRROR_FILEASSEMBLER_H
#define SHAREMIRROR_FILEASSEMBLER_H 1

#include <cstddef>
#include <memory>
#include <string>

#include <sharemirror/filesystem.h>
#include <sharemirror/types.h>

namespace sharemirror
{

struct ChunkResult;

// Progress of a single file's transfer.
struct TransferState
{
    // Where the content ends up.
    std::string mPath;

    // Where the content's written until every chunk is in place.
    std::string mPartialPath;

    // Expected size of the file.
    m_off_t mSize = 0;

    std::size_t mChunkCount = 0;
    std::size_t mChunksWritten = 0;
    std::size_t mChunksFailed = 0;

    m_off_t mBytesWritten = 0;

    // First thing that went wrong, API_OK if nothing has.
    Error mFailure = API_OK;

    // Every chunk has reported, successfully or not.
    bool complete() const
    {
        return mChunksWritten + mChunksFailed == mChunkCount;
    }

    bool failed() const
    {
        return mFailure != API_OK;
    }
}; // TransferState

// Writes a file's chunks, in whatever order they arrive, to their place.
//
// Only one thread may use an assembler at a time.
class FileAssembler
{
    std::unique_ptr<FileAccess> mFile;

    TransferState mState;

    // Whether the file is open.
    bool mOpen;

    // Record a failure, keeping the first.
    void fail(const ChunkResult& result, Error error);

public:
    // file defaults to the host's FileAccess.
    explicit FileAssembler(std::unique_ptr<FileAccess> file = nullptr);

    FileAssembler(const FileAssembler& other) = delete;

    ~FileAssembler();

    FileAssembler& operator=(const FileAssembler& rhs) = delete;

    // Create or truncate path's partial file and size it to size bytes.
    Error open(const std::string& path, m_off_t size, std::size_t chunkCount);

    // Write a successful chunk at its offset, or record a failed one.
    //
    // Returns the chunk's own outcome.
    Error accept(const ChunkResult& result);

    // Close the file and move it to its path. Succeeds only when every
    // chunk was written.
    //
    // A failed transfer's content is left in the partial file and anything
    // already at path is left alone.
    Error finish();

    const TransferState& state() const
    {
        return mState;
    }

    bool failed() const
    {
        return mState.failed();
    }
}; // FileAssembler

} // sharemirror

#endif
