#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <sharemirror/logging.h>
#include <sharemirror/posix/fs.h>

namespace sharemirror
{

static const int defaultfilepermissions = 0600;

static const int defaultfolderpermissions = 0700;

PosixFileAccess::PosixFileAccess()
  : fd(-1)
{
}

PosixFileAccess::~PosixFileAccess()
{
    if (fd >= 0)
        close(fd);
}

bool PosixFileAccess::fopen(const std::string& path)
{
    if (fd >= 0)
        close(fd);

    fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, defaultfilepermissions);

    if (fd < 0)
    {
        errorcode = errno;

        LOG_err << "Unable to open file: " << path << ". Error was: " << strerror(errorcode);

        return false;
    }

    return true;
}

bool PosixFileAccess::fwrite(const byte* data, std::size_t len, m_off_t pos)
{
    while (len)
    {
        auto written = pwrite(fd, data, len, pos);

        if (written < 0)
        {
            if (errno == EINTR)
                continue;

            errorcode = errno;
            return false;
        }

        // Shouldn't happen for regular files but isn't an error either.
        if (!written)
        {
            errorcode = EIO;
            return false;
        }

        data += written;
        len -= static_cast<std::size_t>(written);
        pos += written;
    }

    return true;
}

bool PosixFileAccess::ftruncate(m_off_t size)
{
    // Truncate the file.
    if (::ftruncate(fd, size) == 0)
        return true;

    errorcode = errno;

    // Couldn't truncate the file.
    return false;
}

bool PosixFileAccess::fstat(m_off_t& size)
{
    struct stat attributes;

    if (::fstat(fd, &attributes))
    {
        errorcode = errno;

        LOG_err << "Unable to stat descriptor: "
                << fd
                << ". Error was: "
                << errorcode;

        return false;
    }

    size = static_cast<m_off_t>(attributes.st_size);

    return true;
}

bool PosixFileAccess::closef()
{
    if (fd < 0)
        return true;

    auto result = close(fd);

    fd = -1;

    if (!result)
        return true;

    // Delayed write errors surface here.
    errorcode = errno;

    return false;
}

std::unique_ptr<FileAccess> newFileAccess()
{
    return std::make_unique<PosixFileAccess>();
}

Error makeDirectory(const std::string& path, bool* existed)
{
    if (existed)
        *existed = false;

    mode_t mode = umask(0);
    bool r = !mkdir(path.c_str(), static_cast<mode_t>(defaultfolderpermissions));
    int errorcode = errno;
    umask(mode);

    if (r)
        return API_OK;

    if (errorcode == EEXIST)
    {
        struct stat statbuf;

        if (!stat(path.c_str(), &statbuf) && S_ISDIR(statbuf.st_mode))
        {
            LOG_debug << "Failed to create local directory: " << path << " (already exists)";

            if (existed)
                *existed = true;

            return API_OK;
        }

        return Error(API_EWRITE, path + ": exists and is not a directory");
    }

    LOG_err << "Error creating local directory: " << path << " errno: " << errorcode;

    return Error(API_EWRITE, path + ": " + strerror(errorcode));
}

Error makeDirectories(const std::string& path)
{
    if (path.empty())
        return Error(API_EARGS, "Empty directory path");

    // Create each ancestor in turn.
    for (auto i = path.find('/', 1); i != std::string::npos; i = path.find('/', i + 1))
    {
        if (path[i - 1] == '/')
            continue;

        auto result = makeDirectory(path.substr(0, i));

        if (result != API_OK)
            return result;
    }

    if (path.size() > 1 && path.back() == '/')
        return API_OK;

    return makeDirectory(path);
}

Error renameFile(const std::string& from, const std::string& to)
{
    if (!rename(from.c_str(), to.c_str()))
    {
        LOG_verbose << "Successfully moved file: " << from << " to " << to;
        return API_OK;
    }

    int errorcode = errno;

    LOG_warn << "Unable to move file: " << from << " to " << to << ". Error code: " << errorcode;

    return Error(API_EWRITE, to + ": " + strerror(errorcode));
}

ErrorOr<m_off_t> fileSize(const std::string& path)
{
    struct stat statbuf;

    if (stat(path.c_str(), &statbuf))
    {
        if (errno == ENOENT || errno == ENOTDIR)
            return unexpected(Error(API_ENOENT, path));

        return unexpected(Error(API_EREAD, path + ": " + strerror(errno)));
    }

    if (!S_ISREG(statbuf.st_mode))
        return unexpected(Error(API_EREAD, path + ": not a regular file"));

    return static_cast<m_off_t>(statbuf.st_size);
}

} // sharemirror
