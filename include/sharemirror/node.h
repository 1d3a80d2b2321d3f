#ifndef SHAREMIRROR_NODE_H
#define SHAREMIRROR_NODE_H 1

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

#include <sharemirror/types.h>

namespace sharemirror
{

enum class NodeKind
{
    UNKNOWN,
    FILE,
    DIRECTORY
}; // NodeKind

const char* toString(NodeKind kind);

// What the service tells us about a single node.
struct NodeInfo
{
    // Opaque identifier used in requests.
    std::string mId;

    // Name as reported by the service.
    std::string mName;

    NodeKind mKind = NodeKind::UNKNOWN;

    // Content size in bytes, -1 when unknown.
    m_off_t mSize = -1;
}; // NodeInfo

using NodeIndex = std::size_t;

constexpr NodeIndex UNDEF_INDEX = std::numeric_limits<NodeIndex>::max();

struct Node
{
    std::string mId;

    // Sanitized local name.
    std::string mName;

    NodeKind mKind = NodeKind::UNKNOWN;

    m_off_t mSize = -1;

    // UNDEF_INDEX for the root.
    NodeIndex mParent = UNDEF_INDEX;

    // In listing order. Always empty for files.
    std::vector<NodeIndex> mChildren;

    bool isFile() const
    {
        return mKind == NodeKind::FILE;
    }

    bool isDirectory() const
    {
        return mKind == NodeKind::DIRECTORY;
    }
}; // Node

// Arena holding a resolved tree.
//
// Nodes are addressed by index and never move once added, the root is always
// index 0. Parents refer to their children by index only.
class Tree
{
    std::vector<Node> mNodes;

public:
    // Add the root. The tree must be empty.
    NodeIndex addRoot(const NodeInfo& info, const std::string& name);

    // Add a child below a directory.
    NodeIndex addChild(NodeIndex parent, const NodeInfo& info, const std::string& name);

    // Drop every node at or beyond size, detaching them from their parents.
    //
    // Used to roll back a subtree that couldn't be resolved completely.
    void truncate(std::size_t size);

    const Node& node(NodeIndex index) const;

    const Node& root() const;

    bool empty() const;

    std::size_t size() const;

    // Path of a node relative to the destination, including the root's name.
    std::string path(NodeIndex index) const;

    // Parents before children, children in listing order.
    std::vector<NodeIndex> preorder() const;

    std::size_t fileCount() const;

    std::size_t directoryCount() const;

    // Sum of all known file sizes.
    m_off_t totalSize() const;
}; // Tree

// A failure tied to a location in the mirrored tree.
struct PathError
{
    std::string mPath;
    Error mError;
}; // PathError

} // sharemirror

#endif
