#include <gtest/gtest.h>

#include <cerrno>

#include <sys/stat.h>

#include <sharemirror/filesystem.h>

#include "TemporaryDirectory.h"

using namespace sharemirror;

TEST(Filesystem, sanitizeNameKeepsOrdinaryNames)
{
    EXPECT_EQ("report.pdf", sanitizeName("report.pdf"));
    EXPECT_EQ("two words", sanitizeName("two words"));
    EXPECT_EQ("100%.txt", sanitizeName("100%.txt"));
    EXPECT_EQ("\xc3\xa9t\xc3\xa9", sanitizeName("\xc3\xa9t\xc3\xa9"));
    EXPECT_EQ("...", sanitizeName("..."));
}

TEST(Filesystem, sanitizeNameEscapesSeparatorsAndControls)
{
    EXPECT_EQ("a%2fb", sanitizeName("a/b"));
    EXPECT_EQ("a%5cb", sanitizeName("a\\b"));
    EXPECT_EQ("a%0ab", sanitizeName("a\nb"));
    EXPECT_EQ("%7f", sanitizeName("\x7f"));
    EXPECT_EQ("%2f..%2f..%2fetc", sanitizeName("/../../etc"));
}

TEST(Filesystem, sanitizeNameEscapesSpecialNames)
{
    EXPECT_EQ("%00", sanitizeName(""));
    EXPECT_EQ("%2e", sanitizeName("."));
    EXPECT_EQ("%2e%2e", sanitizeName(".."));
}

TEST(Filesystem, joinPath)
{
    EXPECT_EQ("a/b", joinPath("a", "b"));
    EXPECT_EQ("a/b", joinPath("a/", "b"));
    EXPECT_EQ("/b", joinPath("/", "b"));
    EXPECT_EQ("b", joinPath("", "b"));
    EXPECT_EQ("a", joinPath("a", ""));
}

TEST(Filesystem, makeDirectoryIsIdempotent)
{
    TemporaryDirectory root;
    auto path = (root.path() / "d").string();
    bool existed = true;

    ASSERT_EQ(API_OK, makeDirectory(path, &existed));
    EXPECT_FALSE(existed);
    EXPECT_TRUE(fs::is_directory(path));

    ASSERT_EQ(API_OK, makeDirectory(path, &existed));
    EXPECT_TRUE(existed);
}

TEST(Filesystem, makeDirectoryIsPrivate)
{
    TemporaryDirectory root;
    auto path = (root.path() / "d").string();

    auto previous = umask(022);
    auto result = makeDirectory(path);

    umask(previous);

    ASSERT_EQ(API_OK, result);

    struct stat attributes;

    ASSERT_EQ(0, stat(path.c_str(), &attributes));
    EXPECT_EQ(0700u, attributes.st_mode & 0777u);
}

TEST(Filesystem, makeDirectoryOverFileFails)
{
    TemporaryDirectory root;
    auto path = root.path() / "f";

    writeFile(path, "x");

    EXPECT_EQ(API_EWRITE, makeDirectory(path.string()));
}

TEST(Filesystem, makeDirectoryWithoutParentFails)
{
    TemporaryDirectory root;

    EXPECT_EQ(API_EWRITE, makeDirectory((root.path() / "a" / "b").string()));
}

TEST(Filesystem, makeDirectoriesCreatesParents)
{
    TemporaryDirectory root;
    auto path = root.path() / "a" / "b" / "c";

    ASSERT_EQ(API_OK, makeDirectories(path.string()));
    EXPECT_TRUE(fs::is_directory(path));

    ASSERT_EQ(API_OK, makeDirectories(path.string() + "/"));
}

TEST(Filesystem, fileSize)
{
    TemporaryDirectory root;
    auto path = root.path() / "f";

    auto size = fileSize(path.string());

    ASSERT_FALSE(size);
    EXPECT_EQ(API_ENOENT, size.error());

    writeFile(path, "12345");

    size = fileSize(path.string());

    ASSERT_TRUE(size);
    EXPECT_EQ(5, *size);

    EXPECT_EQ(API_EREAD, fileSize(root.string()).error());
}

TEST(Filesystem, fileAccessWritesAtOffsets)
{
    TemporaryDirectory root;
    auto path = root.path() / "f";
    auto file = newFileAccess();

    ASSERT_TRUE(file->fopen(path.string()));
    ASSERT_TRUE(file->ftruncate(6));
    ASSERT_TRUE(file->fwrite(reinterpret_cast<const byte*>("def"), 3, 3));
    ASSERT_TRUE(file->fwrite(reinterpret_cast<const byte*>("abc"), 3, 0));

    m_off_t size = 0;

    ASSERT_TRUE(file->fstat(size));
    EXPECT_EQ(6, size);
    ASSERT_TRUE(file->closef());

    EXPECT_EQ("abcdef", readFile(path));
}

TEST(Filesystem, fileAccessTruncatesExistingFile)
{
    TemporaryDirectory root;
    auto path = root.path() / "f";

    writeFile(path, "previous content");

    auto file = newFileAccess();

    ASSERT_TRUE(file->fopen(path.string()));
    ASSERT_TRUE(file->closef());

    EXPECT_EQ("", readFile(path));
}

TEST(Filesystem, fileAccessIsPrivate)
{
    TemporaryDirectory root;
    auto path = (root.path() / "f").string();
    auto file = newFileAccess();

    ASSERT_TRUE(file->fopen(path));
    ASSERT_TRUE(file->closef());

    struct stat attributes;

    ASSERT_EQ(0, stat(path.c_str(), &attributes));
    EXPECT_EQ(0u, attributes.st_mode & 0077u);
}

TEST(Filesystem, fileAccessDoesntFollowLinks)
{
    TemporaryDirectory root;
    auto target = root.path() / "target";
    auto link = root.path() / "link";

    writeFile(target, "precious");
    fs::create_symlink(target, link);

    auto file = newFileAccess();

    EXPECT_FALSE(file->fopen(link.string()));
    EXPECT_EQ(ELOOP, file->errorcode);
    EXPECT_EQ("precious", readFile(target));
}

TEST(Filesystem, renameFileReplacesTarget)
{
    TemporaryDirectory root;
    auto from = root.path() / "f.part";
    auto to = root.path() / "f";

    EXPECT_EQ("f.part", fs::path(partialPath(to.string())).filename().string());

    writeFile(from, "new");
    writeFile(to, "old");

    ASSERT_EQ(API_OK, renameFile(from.string(), to.string()));
    EXPECT_EQ("new", readFile(to));
    EXPECT_FALSE(fs::exists(from));

    EXPECT_EQ(API_EWRITE, renameFile(from.string(), to.string()));
}

TEST(Filesystem, fileAccessOpenFailure)
{
    TemporaryDirectory root;
    auto file = newFileAccess();

    EXPECT_FALSE(file->fopen((root.path() / "missing" / "f").string()));
    EXPECT_EQ(ENOENT, file->errorcode);
}
