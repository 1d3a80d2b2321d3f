#include <gtest/gtest.h>

#include <cerrno>

#include <sharemirror/chunkscheduler.h>
#include <sharemirror/fileassembler.h>

#include "TemporaryDirectory.h"

using namespace sharemirror;

namespace
{

ChunkResult chunk(const std::string& content, m_off_t offset, m_off_t length)
{
    ChunkResult result;

    result.mOffset = offset;
    result.mLength = length;
    result.mData = content.substr(static_cast<std::size_t>(offset),
                                  static_cast<std::size_t>(length));
    result.mAttempts = 1;

    return result;
}

ChunkResult failure(m_off_t offset, m_off_t length, Error error)
{
    ChunkResult result;

    result.mOffset = offset;
    result.mLength = length;
    result.mOutcome = std::move(error);
    result.mAttempts = 1;

    return result;
}

// Accepts everything but refuses to write.
class UnwritableFileAccess : public FileAccess
{
public:
    bool fopen(const std::string&) override
    {
        return true;
    }

    bool fwrite(const byte*, std::size_t, m_off_t) override
    {
        errorcode = ENOSPC;
        return false;
    }

    bool ftruncate(m_off_t) override
    {
        return true;
    }

    bool fstat(m_off_t& size) override
    {
        size = 0;
        return true;
    }

    bool closef() override
    {
        return true;
    }
}; // UnwritableFileAccess

} // anonymous

TEST(FileAssembler, chunksInAnyOrder)
{
    TemporaryDirectory root;
    auto path = (root.path() / "f").string();
    auto content = pattern(10, 1);

    FileAssembler assembler;

    ASSERT_EQ(API_OK, assembler.open(path, 10, 4));

    EXPECT_EQ(API_OK, assembler.accept(chunk(content, 9, 1)));
    EXPECT_EQ(API_OK, assembler.accept(chunk(content, 3, 3)));
    EXPECT_EQ(API_OK, assembler.accept(chunk(content, 0, 3)));
    EXPECT_FALSE(assembler.state().complete());
    EXPECT_EQ(API_OK, assembler.accept(chunk(content, 6, 3)));

    EXPECT_TRUE(assembler.state().complete());
    EXPECT_EQ(10, assembler.state().mBytesWritten);
    EXPECT_EQ(API_OK, assembler.finish());

    EXPECT_EQ(content, readFile(path));
    EXPECT_FALSE(fs::exists(partialPath(path)));
}

TEST(FileAssembler, contentMovesInPlaceOnlyWhenComplete)
{
    TemporaryDirectory root;
    auto path = (root.path() / "f").string();
    auto content = pattern(6, 5);

    FileAssembler assembler;

    ASSERT_EQ(API_OK, assembler.open(path, 6, 2));
    ASSERT_EQ(API_OK, assembler.accept(chunk(content, 0, 3)));

    EXPECT_FALSE(fs::exists(path));
    EXPECT_TRUE(fs::exists(partialPath(path)));

    ASSERT_EQ(API_OK, assembler.accept(chunk(content, 3, 3)));
    ASSERT_EQ(API_OK, assembler.finish());

    EXPECT_EQ(content, readFile(path));
    EXPECT_FALSE(fs::exists(partialPath(path)));
}

TEST(FileAssembler, failureLeavesPreviousFileAlone)
{
    TemporaryDirectory root;
    auto path = root.path() / "f";

    writeFile(path, "previous");

    FileAssembler assembler;

    ASSERT_EQ(API_OK, assembler.open(path.string(), 8, 2));
    EXPECT_EQ(API_OK, assembler.accept(chunk("complete", 0, 4)));
    EXPECT_EQ(API_EFAILED, assembler.accept(failure(4, 4, Error(API_EFAILED, "HTTP 403"))));
    EXPECT_EQ(API_EFAILED, assembler.finish());

    EXPECT_EQ("previous", readFile(path));
    EXPECT_EQ(8u, fs::file_size(partialPath(path.string())));
}

TEST(FileAssembler, replacesExistingFile)
{
    TemporaryDirectory root;
    auto path = root.path() / "f";

    writeFile(path, "a much longer previous version");

    FileAssembler assembler;

    ASSERT_EQ(API_OK, assembler.open(path.string(), 3, 1));
    EXPECT_EQ(API_OK, assembler.accept(chunk("new", 0, 3)));
    EXPECT_EQ(API_OK, assembler.finish());

    EXPECT_EQ("new", readFile(path));
}

TEST(FileAssembler, emptyFile)
{
    TemporaryDirectory root;
    auto path = root.path() / "empty";

    FileAssembler assembler;

    ASSERT_EQ(API_OK, assembler.open(path.string(), 0, 0));
    EXPECT_TRUE(assembler.state().complete());
    EXPECT_EQ(API_OK, assembler.finish());

    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(0u, fs::file_size(path));
}

TEST(FileAssembler, firstFailureIsKept)
{
    TemporaryDirectory root;
    auto path = (root.path() / "f").string();
    auto content = pattern(9, 2);

    FileAssembler assembler;

    ASSERT_EQ(API_OK, assembler.open(path, 9, 3));

    EXPECT_EQ(API_OK, assembler.accept(chunk(content, 0, 3)));
    EXPECT_EQ(API_EFAILED, assembler.accept(failure(3, 3, Error(API_EFAILED, "HTTP 403"))));
    EXPECT_EQ(API_EAGAIN, assembler.accept(failure(6, 3, Error(API_EAGAIN, "HTTP 503"))));

    auto& state = assembler.state();

    EXPECT_TRUE(state.complete());
    EXPECT_TRUE(state.failed());
    EXPECT_EQ(1u, state.mChunksWritten);
    EXPECT_EQ(2u, state.mChunksFailed);

    auto result = assembler.finish();

    EXPECT_EQ(API_EFAILED, result);
    EXPECT_NE(std::string::npos, result.message().find("at offset 3"));
    EXPECT_NE(std::string::npos, result.message().find("HTTP 403"));

    // The partial file stays behind.
    EXPECT_FALSE(fs::exists(path));

    auto written = readFile(partialPath(path));

    ASSERT_EQ(9u, written.size());
    EXPECT_EQ(content.substr(0, 3), written.substr(0, 3));
}

TEST(FileAssembler, chunksKeepBeingWrittenAfterFailure)
{
    TemporaryDirectory root;
    auto path = (root.path() / "f").string();
    auto content = pattern(6, 4);

    FileAssembler assembler;

    ASSERT_EQ(API_OK, assembler.open(path, 6, 2));

    EXPECT_NE(API_OK, assembler.accept(failure(0, 3, Error(API_ERANGE, "short"))));
    EXPECT_EQ(API_OK, assembler.accept(chunk(content, 3, 3)));
    EXPECT_EQ(API_ERANGE, assembler.finish());

    EXPECT_EQ(content.substr(3), readFile(partialPath(path)).substr(3));
}

TEST(FileAssembler, missingChunksAreIncomplete)
{
    TemporaryDirectory root;
    auto path = (root.path() / "f").string();
    auto content = pattern(6);

    FileAssembler assembler;

    ASSERT_EQ(API_OK, assembler.open(path, 6, 2));
    EXPECT_EQ(API_OK, assembler.accept(chunk(content, 0, 3)));

    auto result = assembler.finish();

    EXPECT_EQ(API_EINCOMPLETE, result);
    EXPECT_NE(std::string::npos, result.message().find("1 of 2"));
}

TEST(FileAssembler, misplacedChunksAreRejected)
{
    TemporaryDirectory root;
    auto path = (root.path() / "f").string();

    FileAssembler assembler;

    ASSERT_EQ(API_OK, assembler.open(path, 4, 2));

    // Past the end.
    EXPECT_EQ(API_ERANGE, assembler.accept(chunk("abcdef", 2, 4)));

    // Data doesn't match the requested length.
    auto wrong = chunk("abcd", 0, 2);

    wrong.mLength = 3;

    EXPECT_EQ(API_ERANGE, assembler.accept(wrong));
    EXPECT_EQ(API_ERANGE, assembler.finish());
}

TEST(FileAssembler, writeFailure)
{
    FileAssembler assembler(std::make_unique<UnwritableFileAccess>());

    ASSERT_EQ(API_OK, assembler.open("unwritable", 3, 1));

    auto result = assembler.accept(chunk("abc", 0, 3));

    EXPECT_EQ(API_EWRITE, result);
    EXPECT_EQ(ErrorKind::LOCAL, result.kind());
    EXPECT_EQ(API_EWRITE, assembler.finish());
    EXPECT_EQ(0, assembler.state().mBytesWritten);
}

TEST(FileAssembler, openFailure)
{
    TemporaryDirectory root;

    FileAssembler assembler;

    EXPECT_EQ(API_EWRITE, assembler.open((root.path() / "missing" / "f").string(), 3, 1));
    EXPECT_EQ(API_EWRITE, assembler.accept(chunk("abc", 0, 3)));
    EXPECT_EQ(API_EWRITE, assembler.finish());
}
