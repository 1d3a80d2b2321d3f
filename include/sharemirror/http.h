#ifndef SHAREMIRROR_HTTP_H
#define SHAREMIRROR_HTTP_H 1

#include <cstddef>
#include <string>

#include <sharemirror/types.h>

namespace sharemirror
{

// outgoing HTTP GET request
struct HttpRequest
{
    std::string mURL;

    // Requested byte range, none when mRangeLength is zero.
    m_off_t mRangeOffset = 0;
    m_off_t mRangeLength = 0;

    bool ranged() const
    {
        return mRangeLength > 0;
    }
}; // HttpRequest

struct HttpResponse
{
    // HTTP status, zero if no response was received.
    int mStatus = 0;

    std::string mBody;

    // Value of the Content-Range header, if any.
    std::string mContentRange;

    // Set when the request failed below HTTP (DNS, connect, TLS, reset).
    std::string mTransportError;

    // Set when the request timed out.
    bool mTimedOut = false;

    // Largest body accepted, -1 for any size.
    m_off_t mBodyLimit = -1;

    // Set when the body outgrew mBodyLimit and the transfer was stopped.
    bool mOversized = false;

    // Append to the body. Fails, and sets mOversized, if that would
    // exceed mBodyLimit.
    bool append(const char* data, std::size_t len);

    bool transportFailed() const
    {
        return !mTransportError.empty() || mTimedOut;
    }

    bool successful() const
    {
        return !transportFailed() && mStatus >= 200 && mStatus < 300;
    }
}; // HttpResponse

// generic host HTTP I/O interface
//
// Implementations must tolerate concurrent calls from multiple threads.
class HttpIO
{
public:
    virtual ~HttpIO() = default;

    // Perform a request, blocking until it completes.
    virtual HttpResponse get(const HttpRequest& request) = 0;
}; // HttpIO

// "bytes=first-last" for a Range header.
std::string rangeHeaderValue(m_off_t offset, m_off_t length);

// Parse "bytes first-last/total". Total is -1 when given as "*".
bool parseContentRange(const std::string& value, m_off_t& first, m_off_t& last, m_off_t& total);

// Statuses worth retrying: timeouts, throttling and gateway trouble.
bool isRetryableStatus(int status);

// Percent-encode everything but unreserved characters.
std::string urlEncode(const std::string& value);

} // sharemirror

#endif
