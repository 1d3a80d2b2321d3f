#ifndef SHAREMIRROR_FILESYSTEM_H
#define SHAREMIRROR_FILESYSTEM_H 1

#include <cstddef>
#include <memory>
#include <string>

#include <sharemirror/expected.h>
#include <sharemirror/types.h>

namespace sharemirror
{

// generic host file access interface
struct FileAccess
{
    // errno of the last failed operation
    int errorcode = 0;

    virtual ~FileAccess() = default;

    // Create or truncate path for writing. Symbolic links aren't followed.
    virtual bool fopen(const std::string& path) = 0;

    // Write len bytes at pos. Fails unless everything was written.
    virtual bool fwrite(const byte* data, std::size_t len, m_off_t pos) = 0;

    virtual bool ftruncate(m_off_t size) = 0;

    virtual bool fstat(m_off_t& size) = 0;

    virtual bool closef() = 0;
}; // FileAccess

// Host's FileAccess implementation.
std::unique_ptr<FileAccess> newFileAccess();

// Make a remote name safe to use as a single local path component.
//
// Separators and control characters become "%xx". Empty, "." and ".." names
// are escaped so they can't refer to the parent or current directory.
std::string sanitizeName(const std::string& name);

// Join two path components with a single separator.
std::string joinPath(const std::string& parent, const std::string& name);

// Create a single directory. Succeeds if it already exists.
Error makeDirectory(const std::string& path, bool* existed = nullptr);

// Create a directory and any missing parents.
Error makeDirectories(const std::string& path);

// Move from over to, replacing any file already there.
Error renameFile(const std::string& from, const std::string& to);

// Where a file's content is written until it's complete.
std::string partialPath(const std::string& path);

// Size of a regular file, API_ENOENT if there's no such file.
ErrorOr<m_off_t> fileSize(const std::string& path);

} // sharemirror

#endif
