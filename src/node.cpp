#include <algorithm>
#include <cassert>

#include <sharemirror/node.h>

namespace sharemirror
{

const char* toString(NodeKind kind)
{
    switch (kind)
    {
        case NodeKind::UNKNOWN:
            return "unknown";
        case NodeKind::FILE:
            return "file";
        case NodeKind::DIRECTORY:
            return "directory";
    }

    return "invalid";
}

NodeIndex Tree::addRoot(const NodeInfo& info, const std::string& name)
{
    assert(mNodes.empty());

    Node node;

    node.mId = info.mId;
    node.mName = name;
    node.mKind = info.mKind;
    node.mSize = info.mKind == NodeKind::FILE ? info.mSize : -1;

    mNodes.emplace_back(std::move(node));

    return 0;
}

NodeIndex Tree::addChild(NodeIndex parent, const NodeInfo& info, const std::string& name)
{
    assert(parent < mNodes.size());
    assert(mNodes[parent].isDirectory());

    Node node;

    node.mId = info.mId;
    node.mName = name;
    node.mKind = info.mKind;
    node.mSize = info.mKind == NodeKind::FILE ? info.mSize : -1;
    node.mParent = parent;

    auto index = mNodes.size();

    mNodes.emplace_back(std::move(node));
    mNodes[parent].mChildren.push_back(index);

    return index;
}

void Tree::truncate(std::size_t size)
{
    if (size >= mNodes.size())
        return;

    // Children always live after their parents so any reference to a
    // dropped node comes from a parent that's either dropped too or kept.
    for (auto i = mNodes.size(); i-- > size; )
    {
        auto parent = mNodes[i].mParent;

        if (parent == UNDEF_INDEX || parent >= size)
            continue;

        auto& siblings = mNodes[parent].mChildren;

        siblings.erase(std::remove(siblings.begin(), siblings.end(), i), siblings.end());
    }

    mNodes.resize(size);
}

const Node& Tree::node(NodeIndex index) const
{
    assert(index < mNodes.size());

    return mNodes[index];
}

const Node& Tree::root() const
{
    return node(0);
}

bool Tree::empty() const
{
    return mNodes.empty();
}

std::size_t Tree::size() const
{
    return mNodes.size();
}

std::string Tree::path(NodeIndex index) const
{
    std::vector<const std::string*> names;

    for (; index != UNDEF_INDEX; index = mNodes[index].mParent)
        names.push_back(&mNodes[index].mName);

    std::string result;

    for (auto i = names.rbegin(); i != names.rend(); ++i)
    {
        if (!result.empty())
            result.push_back('/');

        result.append(**i);
    }

    return result;
}

std::vector<NodeIndex> Tree::preorder() const
{
    std::vector<NodeIndex> order;
    std::vector<NodeIndex> pending;

    if (mNodes.empty())
        return order;

    order.reserve(mNodes.size());
    pending.push_back(0);

    while (!pending.empty())
    {
        auto index = pending.back();

        pending.pop_back();
        order.push_back(index);

        auto& children = mNodes[index].mChildren;

        // Reversed so the first child is visited first.
        pending.insert(pending.end(), children.rbegin(), children.rend());
    }

    return order;
}

std::size_t Tree::fileCount() const
{
    return static_cast<std::size_t>(
      std::count_if(mNodes.begin(), mNodes.end(), [](const Node& node) {
          return node.isFile();
      }));
}

std::size_t Tree::directoryCount() const
{
    return static_cast<std::size_t>(
      std::count_if(mNodes.begin(), mNodes.end(), [](const Node& node) {
          return node.isDirectory();
      }));
}

m_off_t Tree::totalSize() const
{
    m_off_t total = 0;

    for (auto& node : mNodes)
    {
        if (node.isFile() && node.mSize > 0)
            total += node.mSize;
    }

    return total;
}

} // sharemirror
