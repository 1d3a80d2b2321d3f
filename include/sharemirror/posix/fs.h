#ifndef SHAREMIRROR_POSIX_FS_H
#define SHAREMIRROR_POSIX_FS_H 1

#include <sharemirror/filesystem.h>

namespace sharemirror
{

class PosixFileAccess : public FileAccess
{
    int fd;

public:
    PosixFileAccess();

    PosixFileAccess(const PosixFileAccess& other) = delete;

    ~PosixFileAccess();

    PosixFileAccess& operator=(const PosixFileAccess& rhs) = delete;

    bool fopen(const std::string& path) override;

    bool fwrite(const byte* data, std::size_t len, m_off_t pos) override;

    bool ftruncate(m_off_t size) override;

    bool fstat(m_off_t& size) override;

    bool closef() override;
}; // PosixFileAccess

} // sharemirror

#endif
