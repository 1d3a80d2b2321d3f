#ifndef SHAREMIRROR_POSIX_NET_H
#define SHAREMIRROR_POSIX_NET_H 1

#include <array>
#include <chrono>
#include <mutex>
#include <string>

#include <curl/curl.h>

#include <sharemirror/http.h>

namespace sharemirror
{

// libcurl based HttpIO.
//
// Each request runs on its own easy handle. DNS results, TLS sessions and
// live connections are pooled through a share handle so that concurrent
// workers reuse connections to the same host.
class CurlHttpIO : public HttpIO
{
    // Serializes process wide initialization.
    static std::mutex curlMutex;

    // How many instances are alive.
    static int instanceCount;

    // Connection, DNS and TLS session pool.
    CURLSH* mShare;

    // One lock per kind of shared data.
    std::array<std::mutex, CURL_LOCK_DATA_LAST> mShareLocks;

    std::string mUserAgent;

    std::chrono::seconds mConnectTimeout;

    // Whole request timeout, zero for none.
    std::chrono::seconds mTimeout;

    static void lock_function(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);

    static void unlock_function(CURL* handle, curl_lock_data data, void* userptr);

    static size_t write_data(void* ptr, size_t size, size_t nmemb, void* target);

    static size_t check_header(char* ptr, size_t size, size_t nmemb, void* target);

public:
    CurlHttpIO();

    CurlHttpIO(const CurlHttpIO& other) = delete;

    ~CurlHttpIO();

    CurlHttpIO& operator=(const CurlHttpIO& rhs) = delete;

    HttpResponse get(const HttpRequest& request) override;

    void setuseragent(const std::string& userAgent);

    void setConnectTimeout(std::chrono::seconds timeout);

    void setTimeout(std::chrono::seconds timeout);
}; // CurlHttpIO

} // sharemirror

#endif
