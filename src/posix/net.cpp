#include <cstring>
#include <memory>
#include <strings.h>

#include <sharemirror/logging.h>
#include <sharemirror/posix/net.h>

namespace sharemirror
{

std::mutex CurlHttpIO::curlMutex;

int CurlHttpIO::instanceCount = 0;

CurlHttpIO::CurlHttpIO()
  : mShare(nullptr)
  , mShareLocks()
  , mUserAgent("sharemirror/1.0")
  , mConnectTimeout(30)
  , mTimeout(0)
{
    {
        std::lock_guard<std::mutex> guard(curlMutex);

        if (++instanceCount == 1)
        {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }
    }

    const curl_version_info_data* data = curl_version_info(CURLVERSION_NOW);
    if (data->version)
    {
        LOG_debug << "cURL version: " << data->version;
    }

    if (data->ssl_version)
    {
        LOG_debug << "SSL version: " << data->ssl_version;
    }

    mShare = curl_share_init();

    if (!mShare)
    {
        // Requests still work, they just don't share a pool.
        LOG_warn << "Unable to create cURL share handle";
        return;
    }

    curl_share_setopt(mShare, CURLSHOPT_LOCKFUNC, lock_function);
    curl_share_setopt(mShare, CURLSHOPT_UNLOCKFUNC, unlock_function);
    curl_share_setopt(mShare, CURLSHOPT_USERDATA, this);
    curl_share_setopt(mShare, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(mShare, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);

#if LIBCURL_VERSION_NUM >= 0x073900 // At least cURL 7.57.0
    curl_share_setopt(mShare, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
#endif
}

CurlHttpIO::~CurlHttpIO()
{
    if (mShare)
    {
        curl_share_cleanup(mShare);
    }

    std::lock_guard<std::mutex> guard(curlMutex);

    if (--instanceCount == 0)
    {
        curl_global_cleanup();
    }
}

void CurlHttpIO::lock_function(CURL*, curl_lock_data data, curl_lock_access, void* userptr)
{
    auto* httpio = static_cast<CurlHttpIO*>(userptr);

    httpio->mShareLocks[static_cast<size_t>(data)].lock();
}

void CurlHttpIO::unlock_function(CURL*, curl_lock_data data, void* userptr)
{
    auto* httpio = static_cast<CurlHttpIO*>(userptr);

    httpio->mShareLocks[static_cast<size_t>(data)].unlock();
}

size_t CurlHttpIO::write_data(void* ptr, size_t size, size_t nmemb, void* target)
{
    size_t len = size * nmemb;
    auto* response = static_cast<HttpResponse*>(target);

    // Anything short of len aborts the transfer.
    if (len && !response->append(static_cast<const char*>(ptr), len))
    {
        LOG_debug << "Response body exceeds " << response->mBodyLimit << " bytes";
        return 0;
    }

    return len;
}

// remember the Content-Range of the final response
size_t CurlHttpIO::check_header(char* ptr, size_t size, size_t nmemb, void* target)
{
    static const char contentRange[] = "Content-Range:";

    size_t len = size * nmemb;
    auto* response = static_cast<HttpResponse*>(target);

    if (len > 2)
    {
        LOG_verbose << "Header: " << std::string(ptr, len - 2);
    }

    if (len >= 5 && !strncmp(ptr, "HTTP/", 5))
    {
        // Redirects produce more than one set of headers.
        response->mContentRange.clear();
    }
    else if (len > sizeof(contentRange) - 1
             && !strncasecmp(ptr, contentRange, sizeof(contentRange) - 1))
    {
        std::string value(ptr + sizeof(contentRange) - 1, len - (sizeof(contentRange) - 1));

        // trim surrounding whitespace and CRLF
        auto first = value.find_first_not_of(" \t");
        auto last = value.find_last_not_of(" \t\r\n");

        if (first != std::string::npos && last != std::string::npos)
            response->mContentRange = value.substr(first, last - first + 1);
    }

    return len;
}

HttpResponse CurlHttpIO::get(const HttpRequest& request)
{
    HttpResponse response;

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);

    if (!curl)
    {
        LOG_err << "Unable to create cURL handle";
        response.mTransportError = "Unable to create cURL handle";
        return response;
    }

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);

    if (request.ranged())
    {
        // A server ignoring the range shouldn't make us buffer everything.
        response.mBodyLimit = request.mRangeLength;

        auto range = "Range: " + rangeHeaderValue(request.mRangeOffset, request.mRangeLength);
        headers.reset(curl_slist_append(nullptr, range.c_str()));
    }
    else
    {
        // Compressed transfer is fine when we don't count bytes.
        curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");

        headers.reset(curl_slist_append(nullptr, "Accept: application/json"));
    }

    char errorBuffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.mURL.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, mUserAgent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_data);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, static_cast<void*>(&response));
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, check_header);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, static_cast<void*>(&response));
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 8L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(mConnectTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(mTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TCP_KEEPIDLE, 90L);
    curl_easy_setopt(curl.get(), CURLOPT_TCP_KEEPINTVL, 60L);

    if (mShare)
    {
        curl_easy_setopt(curl.get(), CURLOPT_SHARE, mShare);
    }

    LOG_verbose << "GET " << request.mURL
                << (request.ranged() ? " " + rangeHeaderValue(request.mRangeOffset,
                                                              request.mRangeLength)
                                     : std::string());

    CURLcode errorCode = curl_easy_perform(curl.get());

    if (errorCode == CURLE_WRITE_ERROR && response.mOversized)
    {
        long httpstatus = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpstatus);
        response.mStatus = static_cast<int>(httpstatus);

        LOG_debug << "Request to " << request.mURL << " stopped, HTTP " << response.mStatus
                  << " with more than " << response.mBodyLimit << " bytes";

        return response;
    }

    if (errorCode != CURLE_OK)
    {
        response.mTimedOut = errorCode == CURLE_OPERATION_TIMEDOUT;
        response.mTransportError = *errorBuffer ? errorBuffer : curl_easy_strerror(errorCode);

        LOG_debug << "Request to " << request.mURL << " failed with error " << errorCode
                  << ": " << response.mTransportError;

        return response;
    }

    long httpstatus = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpstatus);
    response.mStatus = static_cast<int>(httpstatus);

    LOG_verbose << "Request to " << request.mURL << " finished with status " << response.mStatus
                << " (" << response.mBody.size() << " bytes)";

    return response;
}

void CurlHttpIO::setuseragent(const std::string& userAgent)
{
    mUserAgent = userAgent;
}

void CurlHttpIO::setConnectTimeout(std::chrono::seconds timeout)
{
    mConnectTimeout = timeout;
}

void CurlHttpIO::setTimeout(std::chrono::seconds timeout)
{
    mTimeout = timeout;
}

} // sharemirror
