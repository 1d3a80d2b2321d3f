#ifndef SHAREMIRROR_TREERESOLVER_H
#define SHAREMIRROR_TREERESOLVER_H 1

#include <atomic>
#include <set>
#include <string>
#include <vector>

#include <sharemirror/expected.h>
#include <sharemirror/node.h>

namespace sharemirror
{

class ShareClient;

struct Resolution
{
    Tree mTree;

    // Subtrees that couldn't be resolved and were left out of mTree.
    std::vector<PathError> mFailures;
}; // Resolution

// Expands a share identifier into a complete tree.
class TreeResolver
{
    ShareClient& mClient;

    // Give up on the first subtree failure.
    bool mFailFast;

    // Checked between requests, may be null.
    const std::atomic<bool>* mCancelled;

    // Every page of a directory's listing.
    ErrorOr<std::vector<NodeInfo>> listAll(const std::string& id);

    // Add a directory's children, recursing into subdirectories.
    Error expand(Resolution& resolution, NodeIndex directory, std::set<std::string>& visited);

    bool cancelled() const;

public:
    explicit TreeResolver(ShareClient& client,
                          bool failFast = false,
                          const std::atomic<bool>* cancelled = nullptr);

    // Resolve id and, if it's a directory, everything below it.
    //
    // Fails only when the root can't be resolved, or on the first subtree
    // failure when fail-fast.
    ErrorOr<Resolution> resolve(const std::string& id);
}; // TreeResolver

} // sharemirror

#endif
