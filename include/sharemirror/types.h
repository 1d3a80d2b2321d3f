#ifndef SHAREMIRROR_TYPES_H
#define SHAREMIRROR_TYPES_H 1

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>

namespace sharemirror
{

// file offsets and sizes
typedef int64_t m_off_t;

typedef unsigned char byte;

typedef enum ErrorCodes : int
{
    API_OK = 0,                     ///< Everything OK.
    API_EINTERNAL = -1,             ///< Internal error.
    API_EARGS = -2,                 ///< Bad arguments.
    API_EAGAIN = -3,                ///< Transient failure, retry with backoff.
    API_EFAILED = -5,               ///< Request failed permanently.
    API_ERANGE = -7,                ///< Short, long or malformed range data.
    API_ENOENT = -9,                ///< Resource does not exist.
    API_ECIRCULAR = -10,            ///< Circular linkage.
    API_EINCOMPLETE = -13,          ///< Transfer finished with data missing.
    API_EWRITE = -20,               ///< File could not be written to.
    API_EREAD = -21,                ///< File could not be read from.
    LOCAL_ETIMEOUT = -1001,         ///< A request timed out.
    LOCAL_ECANCELLED = -1002,       ///< Request abandoned due to cancellation.
} error;

// How an error propagates through a run.
enum class ErrorKind
{
    NONE,
    NOT_FOUND,
    SERVICE,
    TRANSIENT,
    RANGE,
    LOCAL
}; // ErrorKind

const char* errorstring(error e);

const char* toString(ErrorKind kind);

class Error
{
public:
    Error(error err = API_EINTERNAL)
      : mError(err)
      , mMessage()
    {
    }

    Error(error err, std::string message)
      : mError(err)
      , mMessage(std::move(message))
    {
    }

    // Prefix the diagnostic with where the error happened.
    Error& annotate(const std::string& where);

    // Which of the propagation kinds does this error belong to?
    ErrorKind kind() const;

    // Human readable description: code string plus diagnostic.
    std::string describe() const;

    const std::string& message() const
    {
        return mMessage;
    }

    bool retryable() const
    {
        return kind() == ErrorKind::TRANSIENT;
    }

    operator error() const
    {
        return mError;
    }

private:
    error mError;
    std::string mMessage;
}; // Error

std::ostream& operator<<(std::ostream& ostream, const Error& value);

} // sharemirror

#endif
