#include <sharemirror/filesystem.h>
#include <sharemirror/logging.h>
#include <sharemirror/shareclient.h>
#include <sharemirror/treeresolver.h>

namespace sharemirror
{

// Pick a name not yet used in a directory.
//
// A file also claims the name of its partial file.
static std::string uniqueName(const std::string& name, bool file, std::set<std::string>& used)
{
    auto taken = [&](const std::string& candidate) {
        return used.count(candidate) || (file && used.count(partialPath(candidate)));
    }; // taken

    auto candidate = name;

    for (unsigned i = 1; taken(candidate); ++i)
        candidate = name + " (" + std::to_string(i) + ")";

    used.insert(candidate);

    if (file)
        used.insert(partialPath(candidate));

    return candidate;
}

TreeResolver::TreeResolver(ShareClient& client,
                           bool failFast,
                           const std::atomic<bool>* cancelled)
  : mClient(client)
  , mFailFast(failFast)
  , mCancelled(cancelled)
{
}

bool TreeResolver::cancelled() const
{
    return mCancelled && *mCancelled;
}

ErrorOr<std::vector<NodeInfo>> TreeResolver::listAll(const std::string& id)
{
    std::vector<NodeInfo> children;
    std::set<std::string> tokens;
    std::optional<std::string> token;

    do
    {
        if (cancelled())
            return unexpected(Error(LOCAL_ECANCELLED, "Resolution cancelled"));

        auto page = mClient.listChildren(id, token);

        if (!page)
            return unexpected(std::move(page).error());

        auto& entries = page->mChildren;

        children.insert(children.end(),
                        std::make_move_iterator(entries.begin()),
                        std::make_move_iterator(entries.end()));

        token = std::move(page->mNextPageToken);

        // Don't loop forever if the service hands out the same token again.
        if (token && !tokens.insert(*token).second)
            return unexpected(Error(API_EFAILED, "Listing of " + id + " repeats page token " + *token));
    }
    while (token);

    return children;
}

Error TreeResolver::expand(Resolution& resolution, NodeIndex directory, std::set<std::string>& visited)
{
    auto& tree = resolution.mTree;
    auto id = tree.node(directory).mId;
    auto children = listAll(id);

    if (!children)
        return std::move(children).error();

    LOG_debug << "Listed " << children->size() << " children of " << tree.path(directory);

    std::set<std::string> names;

    for (auto& child : *children)
    {
        if (cancelled())
            return Error(LOCAL_ECANCELLED, "Resolution cancelled");

        if (visited.count(child.mId))
        {
            return Error(API_ECIRCULAR,
                         "Listing of " + id + " includes " + child.mId + " more than once");
        }

        auto info = child;

        // The listing didn't tell us enough, ask for the node itself.
        if (info.mKind == NodeKind::UNKNOWN || (info.mKind == NodeKind::FILE && info.mSize < 0))
        {
            auto metadata = mClient.getMetadata(child.mId);

            if (metadata && metadata->mKind == NodeKind::FILE && metadata->mSize < 0)
            {
                metadata = unexpected(Error(API_EFAILED, "Size of " + child.mId + " is unknown"));
            }

            if (!metadata)
            {
                if (metadata.error() == LOCAL_ECANCELLED)
                    return metadata.error();

                auto path = joinPath(tree.path(directory),
                                     sanitizeName(info.mName.empty() ? child.mId : info.mName));
                auto error = std::move(metadata).error();

                error.annotate(path);

                LOG_warn << "Unable to resolve " << path << ": " << error;

                resolution.mFailures.push_back(PathError{path, error});

                if (mFailFast)
                    return error;

                continue;
            }

            if (info.mName.empty())
                info.mName = metadata->mName;

            info.mKind = metadata->mKind;
            info.mSize = metadata->mSize;
        }

        auto name = uniqueName(sanitizeName(info.mName.empty() ? info.mId : info.mName),
                               info.mKind == NodeKind::FILE,
                               names);
        auto failureMark = resolution.mFailures.size();

        visited.insert(info.mId);

        auto index = tree.addChild(directory, info, name);

        if (!tree.node(index).isDirectory())
            continue;

        auto result = expand(resolution, index, visited);

        if (result == API_OK)
            continue;

        if (result == LOCAL_ECANCELLED)
            return result;

        // Recorded further down, already carries its path.
        if (mFailFast && resolution.mFailures.size() > failureMark)
            return result;

        auto path = tree.path(index);

        // All or nothing, forget everything we learned below this directory.
        for (auto i = index; i < tree.size(); ++i)
            visited.erase(tree.node(i).mId);

        tree.truncate(index);
        resolution.mFailures.resize(failureMark);

        result.annotate(path);

        LOG_warn << "Unable to resolve directory " << path << ": " << result;

        resolution.mFailures.push_back(PathError{path, result});

        if (mFailFast)
            return result;
    }

    return API_OK;
}

ErrorOr<Resolution> TreeResolver::resolve(const std::string& id)
{
    auto metadata = mClient.getMetadata(id);

    if (!metadata)
        return unexpected(std::move(metadata).error().annotate(id));

    Resolution resolution;

    if (metadata->mKind == NodeKind::FILE && metadata->mSize < 0)
        return unexpected(Error(API_EFAILED, "Size of " + id + " is unknown"));

    resolution.mTree.addRoot(*metadata, sanitizeName(metadata->mName));

    if (metadata->mKind == NodeKind::FILE)
    {
        LOG_debug << id << " is a file of " << metadata->mSize << " bytes";
        return resolution;
    }

    std::set<std::string> visited = {id};

    auto result = expand(resolution, 0, visited);

    if (result != API_OK)
    {
        // Subtree failures already carry their path.
        if (resolution.mFailures.empty())
            result.annotate(id);

        return unexpected(std::move(result));
    }

    auto& tree = resolution.mTree;

    LOG_info << "Resolved " << tree.root().mName << ": "
             << tree.fileCount() << " files in "
             << tree.directoryCount() << " directories, "
             << tree.totalSize() << " bytes";

    return resolution;
}

} // sharemirror
