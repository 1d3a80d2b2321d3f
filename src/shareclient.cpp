#include <algorithm>
#include <cctype>

#include <sharemirror/http.h>
#include <sharemirror/json.h>
#include <sharemirror/logging.h>
#include <sharemirror/shareclient.h>

namespace sharemirror
{

static const char* const SHARES_DATA_PATH = "/api/v3/onezone/shares/data/";

static std::string lowercase(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    return value;
}

// Extract id and description from {"error": {"id": ..., "description": ...}}.
static bool parseServiceError(const std::string& body, std::string& id, std::string& description)
{
    auto text = JSON::stripWhitespace(body);
    JSON json(text);

    if (!json.enterobject())
        return false;

    for (auto name = json.getname(); !name.empty(); name = json.getname())
    {
        if (name != "error" || !json.enterobject())
        {
            if (!json.storeobject())
                return false;

            continue;
        }

        for (auto field = json.getname(); !field.empty(); field = json.getname())
        {
            if (field == "id")
            {
                if (!json.getstring(id))
                    json.storeobject();
            }
            else if (field == "description")
            {
                if (!json.getstring(description))
                    json.storeobject();
            }
            else if (!json.storeobject())
            {
                return false;
            }
        }

        return !id.empty();
    }

    return false;
}

// Parse a single node object, the scanner positioned at its opening brace.
static bool parseNode(JSON& json, NodeInfo& info)
{
    if (!json.enterobject())
        return false;

    for (auto name = json.getname(); !name.empty(); name = json.getname())
    {
        if (name == "id" || name == "file_id" || name == "fileId")
        {
            if (!json.getstring(info.mId))
                return false;
        }
        else if (name == "name")
        {
            if (!json.getstring(info.mName))
                return false;
        }
        else if (name == "type")
        {
            std::string type;

            if (!json.getstring(type))
                return false;

            info.mKind = RestShareClient::parseKind(type);

            // Remember what we didn't understand for diagnostics.
            if (info.mKind == NodeKind::UNKNOWN)
            {
                LOG_warn << "Unsupported node type: " << type;
            }
        }
        else if (name == "size")
        {
            if (json.isnumeric())
                info.mSize = json.getint();
            else if (!json.storeobject())
                return false;
        }
        else if (!json.storeobject())
        {
            return false;
        }
    }

    return json.leaveobject();
}

RestShareClient::RestShareClient(HttpIO& httpio, std::string baseURL, unsigned pageSize)
  : mHttpIO(httpio)
  , mBaseURL(std::move(baseURL))
  , mPageSize(pageSize)
{
    while (!mBaseURL.empty() && mBaseURL.back() == '/')
        mBaseURL.pop_back();
}

std::string RestShareClient::dataURL(const std::string& id) const
{
    return mBaseURL + SHARES_DATA_PATH + urlEncode(id);
}

Error RestShareClient::toError(const HttpResponse& response, const std::string& what)
{
    if (response.transportFailed())
    {
        return Error(response.mTimedOut ? LOCAL_ETIMEOUT : API_EAGAIN,
                     what + ": " + response.mTransportError);
    }

    std::string id;
    std::string description;
    std::string message = what + ": HTTP " + std::to_string(response.mStatus);

    if (parseServiceError(response.mBody, id, description))
    {
        message += " (" + id;

        if (!description.empty())
            message += ": " + description;

        message += ")";
    }

    if (response.mStatus == 404 || id == "notFound")
        return Error(API_ENOENT, message);

    if (isRetryableStatus(response.mStatus))
        return Error(API_EAGAIN, message);

    if (response.mStatus == 416)
        return Error(API_ERANGE, message);

    return Error(API_EFAILED, message);
}

NodeKind RestShareClient::parseKind(const std::string& type)
{
    auto kind = lowercase(type);

    if (kind == "reg" || kind == "file")
        return NodeKind::FILE;

    if (kind == "dir" || kind == "directory")
        return NodeKind::DIRECTORY;

    return NodeKind::UNKNOWN;
}

ErrorOr<NodeInfo> RestShareClient::parseMetadata(const std::string& id, const std::string& body)
{
    auto text = JSON::stripWhitespace(body);
    JSON json(text);
    NodeInfo info;
    std::string type;

    if (!json.enterobject())
        return unexpected(Error(API_EFAILED, "Malformed metadata for " + id));

    for (auto name = json.getname(); !name.empty(); name = json.getname())
    {
        bool parsed = true;

        if (name == "type")
            parsed = json.getstring(type);
        else if (name == "name")
            parsed = json.getstring(info.mName);
        else if (name == "size" && json.isnumeric())
            info.mSize = json.getint();
        else
            parsed = json.storeobject();

        if (!parsed)
            return unexpected(Error(API_EFAILED, "Malformed metadata for " + id));
    }

    if (!json.leaveobject())
        return unexpected(Error(API_EFAILED, "Malformed metadata for " + id));

    if (type.empty())
        return unexpected(Error(API_EFAILED, "Metadata for " + id + " has no type"));

    info.mId = id;
    info.mKind = parseKind(type);

    if (info.mKind == NodeKind::UNKNOWN)
        return unexpected(Error(API_EFAILED, "Unsupported node type: " + type));

    if (info.mName.empty())
        return unexpected(Error(API_EFAILED, "Metadata for " + id + " has no name"));

    return info;
}

ErrorOr<ChildPage> RestShareClient::parseChildren(const std::string& body)
{
    auto text = JSON::stripWhitespace(body);
    JSON json(text);
    ChildPage page;
    bool isLast = false;
    bool sawChildren = false;

    if (!json.enterobject())
        return unexpected(Error(API_EFAILED, "Malformed listing"));

    for (auto name = json.getname(); !name.empty(); name = json.getname())
    {
        if (name == "children")
        {
            if (!json.enterarray())
                return unexpected(Error(API_EFAILED, "Malformed listing: children isn't an array"));

            while (*json.pos == '{' || *json.pos == ',')
            {
                NodeInfo info;

                if (!parseNode(json, info))
                    return unexpected(Error(API_EFAILED, "Malformed listing entry"));

                if (info.mId.empty())
                    return unexpected(Error(API_EFAILED, "Listing entry without an identifier"));

                page.mChildren.emplace_back(std::move(info));
            }

            if (!json.leavearray())
                return unexpected(Error(API_EFAILED, "Malformed listing"));

            sawChildren = true;
        }
        else if (name == "nextPageToken")
        {
            std::string token;

            if (json.isnull())
                json.storeobject();
            else if (json.getstring(token) && !token.empty())
                page.mNextPageToken = std::move(token);
            else
                return unexpected(Error(API_EFAILED, "Malformed listing: bad page token"));
        }
        else if (name == "isLast")
        {
            isLast = json.getbool();
        }
        else if (!json.storeobject())
        {
            return unexpected(Error(API_EFAILED, "Malformed listing"));
        }
    }

    if (!json.leaveobject() || !sawChildren)
        return unexpected(Error(API_EFAILED, "Malformed listing"));

    if (isLast)
        page.mNextPageToken.reset();

    return page;
}

ErrorOr<NodeInfo> RestShareClient::getMetadata(const std::string& id)
{
    HttpRequest request;

    request.mURL = dataURL(id);

    LOG_debug << "Fetching metadata of " << id;

    auto response = mHttpIO.get(request);

    if (!response.successful())
        return unexpected(toError(response, "Metadata of " + id));

    return parseMetadata(id, response.mBody);
}

ErrorOr<ChildPage> RestShareClient::listChildren(const std::string& id,
                                                 const std::optional<std::string>& pageToken)
{
    HttpRequest request;

    request.mURL = dataURL(id) + "/children?limit=" + std::to_string(mPageSize);

    if (pageToken)
        request.mURL += "&token=" + urlEncode(*pageToken);

    LOG_debug << "Listing " << id << (pageToken ? " (continued)" : "");

    auto response = mHttpIO.get(request);

    if (!response.successful())
        return unexpected(toError(response, "Listing of " + id));

    auto page = parseChildren(response.mBody);

    if (!page)
        return unexpected(std::move(page).error().annotate("Listing of " + id));

    return page;
}

ErrorOr<std::string> RestShareClient::fetchRange(const std::string& id,
                                                 m_off_t offset,
                                                 m_off_t length)
{
    if (offset < 0 || length <= 0)
        return unexpected(Error(API_EARGS, "Invalid range for " + id));

    HttpRequest request;

    request.mURL = dataURL(id) + "/content";
    request.mRangeOffset = offset;
    request.mRangeLength = length;

    auto what = "Content of " + id + " [" + rangeHeaderValue(offset, length) + "]";
    auto response = mHttpIO.get(request);

    if (!response.successful())
        return unexpected(toError(response, what));

    if (response.mOversized)
    {
        return unexpected(Error(API_ERANGE,
                                what + ": HTTP " + std::to_string(response.mStatus)
                                + " with more than " + std::to_string(length) + " bytes"));
    }

    auto received = static_cast<m_off_t>(response.mBody.size());

    if (response.mStatus == 206)
    {
        m_off_t first;
        m_off_t last;
        m_off_t total;

        if (!response.mContentRange.empty()
            && (!parseContentRange(response.mContentRange, first, last, total)
                || first != offset
                || last != offset + length - 1))
        {
            return unexpected(Error(API_ERANGE,
                                    what + ": unexpected Content-Range " + response.mContentRange));
        }

        if (received != length)
        {
            return unexpected(Error(API_ERANGE,
                                    what + ": received " + std::to_string(received) + " bytes"));
        }

        return std::move(response.mBody);
    }

    // The server ignored our range and sent everything.
    if (response.mStatus == 200 && !offset && received == length)
        return std::move(response.mBody);

    LOG_debug << what << ": unusable reply, HTTP " << response.mStatus
              << " with " << received << " bytes";

    return unexpected(Error(API_ERANGE,
                            what + ": HTTP " + std::to_string(response.mStatus)
                            + " with " + std::to_string(received) + " bytes"));
}

} // sharemirror
