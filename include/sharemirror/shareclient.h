#ifndef SHAREMIRROR_SHARECLIENT_H
#define SHAREMIRROR_SHARECLIENT_H 1

#include <optional>
#include <string>
#include <vector>

#include <sharemirror/expected.h>
#include <sharemirror/node.h>
#include <sharemirror/types.h>

namespace sharemirror
{

class HttpIO;
struct HttpResponse;

// One page of a directory listing.
struct ChildPage
{
    std::vector<NodeInfo> mChildren;

    // Absent when this was the last page.
    std::optional<std::string> mNextPageToken;
}; // ChildPage

// Access to the content of a public share.
//
// Implementations must be safe to call from several threads at once.
class ShareClient
{
public:
    virtual ~ShareClient() = default;

    // Kind, name and size of a node.
    virtual ErrorOr<NodeInfo> getMetadata(const std::string& id) = 0;

    // One page of a directory's immediate children.
    virtual ErrorOr<ChildPage> listChildren(const std::string& id,
                                            const std::optional<std::string>& pageToken) = 0;

    // Exactly length bytes of a file's content, starting at offset.
    virtual ErrorOr<std::string> fetchRange(const std::string& id,
                                            m_off_t offset,
                                            m_off_t length) = 0;
}; // ShareClient

// ShareClient speaking the Onezone shares data REST API.
class RestShareClient : public ShareClient
{
    HttpIO& mHttpIO;

    // e.g. https://datahub.egi.eu
    std::string mBaseURL;

    // How many children we ask for per listing request.
    unsigned mPageSize;

    std::string dataURL(const std::string& id) const;

    // Map a failed response to an error.
    static Error toError(const HttpResponse& response, const std::string& what);

public:
    RestShareClient(HttpIO& httpio, std::string baseURL, unsigned pageSize = 1000);

    ErrorOr<NodeInfo> getMetadata(const std::string& id) override;

    ErrorOr<ChildPage> listChildren(const std::string& id,
                                    const std::optional<std::string>& pageToken) override;

    ErrorOr<std::string> fetchRange(const std::string& id,
                                    m_off_t offset,
                                    m_off_t length) override;

    // Parse a metadata reply for id.
    static ErrorOr<NodeInfo> parseMetadata(const std::string& id, const std::string& body);

    // Parse a listing reply.
    static ErrorOr<ChildPage> parseChildren(const std::string& body);

    // "REG", "dir" and friends.
    static NodeKind parseKind(const std::string& type);
}; // RestShareClient

} // sharemirror

#endif
