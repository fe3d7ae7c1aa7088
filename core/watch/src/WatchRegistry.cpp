#include "WatchRegistry.h"
#include "ErrorCodes.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "PathUtils.h"
#include <algorithm>
#include <cerrno>
#include <iterator>
#include <unistd.h>

namespace fs = std::filesystem;

namespace WatchBridge {

namespace {
    ErrorCode pathErrorCode(const std::error_code& ec) {
        switch (ec.value()) {
            case EACCES:
            case EPERM: return ErrorCode::PERMISSION_DENIED;
            case ENOTDIR: return ErrorCode::NOT_A_DIRECTORY;
            default: return ErrorCode::NOT_FOUND;
        }
    }

    // "a/./b/" -> "a/b", "." -> ""; absolute paths and ".." are refused
    std::optional<std::string> normalizeRelative(const std::string& path) {
        fs::path p(path);
        if (p.is_absolute()) {
            return std::nullopt;
        }
        std::string result;
        for (const auto& element : p) {
            const std::string part = element.string();
            if (part.empty() || part == ".") {
                continue;
            }
            if (part == "..") {
                return std::nullopt;
            }
            result = PathUtils::joinRelative(result, part);
        }
        return result;
    }

    VoidResult checkDirectory(const fs::path& dir) {
        std::error_code ec;
        auto status = fs::status(dir, ec);
        if (ec || !fs::exists(status)) {
            return ErrorRegistry::createError(ec ? pathErrorCode(ec) : ErrorCode::NOT_FOUND,
                                              dir.string(), "WatchRegistry");
        }
        if (!fs::is_directory(status)) {
            return ErrorRegistry::createError(ErrorCode::NOT_A_DIRECTORY, dir.string(), "WatchRegistry");
        }
        if (::access(dir.c_str(), R_OK | X_OK) != 0) {
            return ErrorRegistry::createError(ErrorCode::PERMISSION_DENIED, dir.string(), "WatchRegistry");
        }
        return Ok();
    }
}

WatchRegistry::WatchRegistry(IEventSource& source)
    : source_(source) {
}

WatchRegistry::~WatchRegistry() {
    clear();
}

Result<RootInfo> WatchRegistry::addRoot(const std::string& id, const std::string& fspath,
                                        const std::string& subpath, bool recursive) {
    auto relative = normalizeRelative(subpath);
    if (!relative) {
        return ErrorRegistry::createError(ErrorCode::NOT_FOUND, "path escapes the replica: " + subpath,
                                          "WatchRegistry");
    }

    std::error_code ec;
    fs::path canonical = fs::canonical(fspath, ec);
    if (ec) {
        return ErrorRegistry::createError(pathErrorCode(ec), fspath + " (" + ec.message() + ")", "WatchRegistry");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    bool created = false;
    auto it = roots_.find(id);
    if (it == roots_.end()) {
        WatchRoot root;
        root.id = id;
        root.fspath = canonical;
        root.generation = nextGeneration_++;
        root.recursive = recursive;
        it = roots_.emplace(id, std::move(root)).first;
        created = true;
    } else if (it->second.fspath != canonical) {
        LOG_WARN_COMP("Replica " + id + " is already registered at " + it->second.fspath.string() +
                      ", ignoring " + canonical.string(), "WatchRegistry");
    }

    WatchRoot& root = it->second;
    if (!created && root.topDirs.count(*relative) && root.dirs.count(*relative)) {
        LOG_DEBUG_COMP_IF("Replica " + id + " already watches '" + *relative + "'", "WatchRegistry");
        return describe(root, false);
    }

    const fs::path top = relative->empty() ? root.fspath : root.fspath / *relative;
    auto fail = [&](const Error& error) -> Result<RootInfo> {
        if (created) {
            releaseRoot(root);
            roots_.erase(id);
        }
        return error;
    };

    auto valid = checkDirectory(top);
    if (!valid) {
        return fail(valid.error());
    }

    auto handle = subscribeDirectory(root, *relative, top, false);
    if (!handle) {
        return fail(handle.error());
    }
    root.topDirs.insert(*relative);

    if (root.recursive) {
        SCOPED_TIMER_COMP("Initial scan of " + top.string(), "WatchRegistry");
        walkTree(root, *relative, top, nullptr);
    }

    Logger::instance().info("Watching replica " + id + " at " + top.string() + " (" +
                            std::to_string(root.dirs.size()) + " directories)", "WatchRegistry");
    return describe(root, created);
}

VoidResult WatchRegistry::ensureDirectory(const std::string& id, const std::string& relativeDir) {
    auto relative = normalizeRelative(relativeDir);
    if (!relative) {
        return ErrorRegistry::createError(ErrorCode::NOT_FOUND, "path escapes the replica: " + relativeDir,
                                          "WatchRegistry");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roots_.find(id);
    if (it == roots_.end()) {
        return ErrorRegistry::createError(ErrorCode::UNKNOWN_ROOT, id, "WatchRegistry");
    }

    WatchRoot& root = it->second;
    if (root.dirs.count(*relative)) {
        return Ok();
    }

    const fs::path dir = root.fspath / *relative;
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(dir, ec))) {
        LOG_DEBUG_COMP_IF("Skipping '" + *relative + "': not a directory anymore", "WatchRegistry");
        return Ok();
    }

    auto handle = subscribeDirectory(root, *relative, dir, false);
    if (!handle) {
        if (codeOf(handle.error()) == ErrorCode::NOT_FOUND) {
            return Ok();
        }
        return handle.error();
    }
    if (root.recursive) {
        walkTree(root, *relative, dir, nullptr);
    }
    return Ok();
}

VoidResult WatchRegistry::followLink(const std::string& id, const std::string& relativeLink) {
    auto relative = normalizeRelative(relativeLink);
    if (!relative || relative->empty()) {
        return ErrorRegistry::createError(ErrorCode::NOT_FOUND, "invalid link path: " + relativeLink,
                                          "WatchRegistry");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roots_.find(id);
    if (it == roots_.end()) {
        return ErrorRegistry::createError(ErrorCode::UNKNOWN_ROOT, id, "WatchRegistry");
    }

    WatchRoot& root = it->second;
    const fs::path link = root.fspath / *relative;

    std::error_code ec;
    fs::path target = fs::canonical(link, ec);
    if (ec) {
        // Dangling link: nothing to watch behind it
        LOG_DEBUG_COMP_IF("Link '" + *relative + "' does not resolve: " + ec.message(), "WatchRegistry");
        return Ok();
    }
    if (!fs::is_directory(target, ec)) {
        // Only directory targets carry subscriptions
        return Ok();
    }

    auto handle = subscribeDirectory(root, *relative, target, true);
    if (!handle) {
        return handle.error();
    }
    root.links[*relative] = target;
    if (root.recursive) {
        walkTree(root, *relative, target, nullptr);
    }

    LOG_DEBUG_COMP_IF("Following link '" + *relative + "' -> " + target.string(), "WatchRegistry");
    return Ok();
}

std::vector<std::string> WatchRegistry::onDirectoryAppeared(const std::string& rootId,
                                                            const std::string& relativeDir,
                                                            const std::string& absolutePath) {
    std::vector<std::string> discovered;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roots_.find(rootId);
    if (it == roots_.end() || !it->second.recursive) {
        return discovered;
    }

    WatchRoot& root = it->second;
    auto handle = subscribeDirectory(root, relativeDir, absolutePath, true);
    if (!handle) {
        // Gone again before we got to it; its removal event is on the way
        LOG_DEBUG_COMP_IF("Could not watch new directory '" + relativeDir + "': " +
                          handle.error().message, "WatchRegistry");
        return discovered;
    }

    walkTree(root, relativeDir, absolutePath, &discovered);
    return discovered;
}

bool WatchRegistry::onDirectoryRemoved(const std::string& rootId, const std::string& relativeDir) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roots_.find(rootId);
    if (it == roots_.end()) {
        return false;
    }

    WatchRoot& root = it->second;
    std::vector<std::string> doomed;
    for (const auto& entry : root.dirs) {
        if (PathUtils::isSameOrBelow(entry.first, relativeDir)) {
            doomed.push_back(entry.first);
        }
    }
    for (const auto& dir : doomed) {
        releaseDirectory(root, dir);
    }
    for (auto link = root.links.begin(); link != root.links.end();) {
        link = PathUtils::isSameOrBelow(link->first, relativeDir) ? root.links.erase(link) : std::next(link);
    }

    if (!doomed.empty()) {
        LOG_DEBUG_COMP_IF("Released " + std::to_string(doomed.size()) + " watches below '" +
                          relativeDir + "' of " + rootId, "WatchRegistry");
    }

    bool topLost = false;
    for (auto top = root.topDirs.begin(); top != root.topDirs.end();) {
        if (PathUtils::isSameOrBelow(*top, relativeDir)) {
            top = root.topDirs.erase(top);
            topLost = true;
        } else {
            ++top;
        }
    }
    if (!topLost) {
        return false;
    }

    // A surviving top directory above it still sees the name come back
    for (const auto& top : root.topDirs) {
        if (PathUtils::isSameOrBelow(relativeDir, top)) {
            return false;
        }
    }
    return true;
}

void WatchRegistry::onSubscriptionLost(SubscriptionHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(handle);
    if (it == owners_.end()) {
        return;
    }

    for (const auto& owner : it->second) {
        auto root = roots_.find(owner.rootId);
        if (root == roots_.end()) {
            continue;
        }
        auto dir = root->second.dirs.find(owner.relativeDir);
        if (dir != root->second.dirs.end() && dir->second == handle) {
            root->second.dirs.erase(dir);
        }
    }
    owners_.erase(it);
}

bool WatchRegistry::removeRoot(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roots_.find(id);
    if (it == roots_.end()) {
        return false;
    }

    size_t count = it->second.dirs.size();
    releaseRoot(it->second);
    roots_.erase(it);

    Logger::instance().info("Stopped watching replica " + id + " (" + std::to_string(count) +
                            " watches released)", "WatchRegistry");
    return true;
}

void WatchRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : roots_) {
        releaseRoot(entry.second);
    }
    roots_.clear();
    owners_.clear();
}

std::vector<EventTarget> WatchRegistry::resolve(const RawEvent& event) const {
    std::vector<EventTarget> targets;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(event.handle);
    if (it == owners_.end()) {
        return targets;
    }

    for (const auto& owner : it->second) {
        auto root = roots_.find(owner.rootId);
        if (root == roots_.end()) {
            continue;
        }
        EventTarget target;
        target.rootId = owner.rootId;
        if (event.isSelf) {
            target.relativePath = owner.relativeDir;
            target.isTopDirectory = root->second.topDirs.count(owner.relativeDir) > 0;
        } else {
            target.relativePath = PathUtils::joinRelative(owner.relativeDir, event.name);
        }
        targets.push_back(std::move(target));
    }
    return targets;
}

bool WatchRegistry::hasRoot(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return roots_.count(id) > 0;
}

std::optional<RootInfo> WatchRegistry::rootInfo(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roots_.find(id);
    if (it == roots_.end()) {
        return std::nullopt;
    }
    return describe(it->second, false);
}

size_t WatchRegistry::subscriptionCount(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roots_.find(id);
    return it != roots_.end() ? it->second.dirs.size() : 0;
}

std::vector<std::string> WatchRegistry::rootIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(roots_.size());
    for (const auto& entry : roots_) {
        ids.push_back(entry.first);
    }
    return ids;
}

// Caller holds mutex_. With refresh set, an existing mapping is re-checked
// against the source: a directory replaced under the same name gets the new
// handle, and a repeat subscription of the same inode is handed back.
Result<SubscriptionHandle> WatchRegistry::subscribeDirectory(WatchRoot& root, const std::string& relativeDir,
                                                             const fs::path& absolutePath, bool refresh) {
    auto existing = root.dirs.find(relativeDir);
    if (existing != root.dirs.end() && !refresh) {
        return existing->second;
    }

    auto result = source_.subscribe(absolutePath.string());
    if (!result) {
        return result.error();
    }
    SubscriptionHandle handle = result.value();

    if (existing != root.dirs.end()) {
        if (existing->second == handle) {
            source_.unsubscribe(handle).onError([&](const Error& error) {
                LOG_WARN_COMP("Failed to drop repeat watch on " + absolutePath.string() + ": " +
                              error.message, "WatchRegistry");
            });
            return handle;
        }
        releaseDirectory(root, relativeDir);
    }

    root.dirs[relativeDir] = handle;
    owners_[handle].push_back({root.id, relativeDir});
    return handle;
}

void WatchRegistry::releaseDirectory(WatchRoot& root, const std::string& relativeDir) {
    auto dir = root.dirs.find(relativeDir);
    if (dir == root.dirs.end()) {
        return;
    }
    SubscriptionHandle handle = dir->second;
    root.dirs.erase(dir);

    auto owners = owners_.find(handle);
    if (owners != owners_.end()) {
        auto& list = owners->second;
        list.erase(std::remove_if(list.begin(), list.end(), [&](const Owner& owner) {
            return owner.rootId == root.id && owner.relativeDir == relativeDir;
        }), list.end());
        if (list.empty()) {
            owners_.erase(owners);
        }
    }

    source_.unsubscribe(handle).onError([&](const Error& error) {
        LOG_WARN_COMP("Failed to release watch on '" + relativeDir + "' of " + root.id + ": " +
                      error.message, "WatchRegistry");
    });
}

void WatchRegistry::releaseRoot(WatchRoot& root) {
    std::vector<std::string> dirs;
    dirs.reserve(root.dirs.size());
    for (const auto& entry : root.dirs) {
        dirs.push_back(entry.first);
    }
    for (const auto& dir : dirs) {
        releaseDirectory(root, dir);
    }
    root.links.clear();
}

// Subscribes each directory before the iterator descends into it.
void WatchRegistry::walkTree(WatchRoot& root, const std::string& relativeBase, const fs::path& absoluteBase,
                             std::vector<std::string>* discovered) {
    std::error_code ec;
    fs::recursive_directory_iterator it(absoluteBase, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_DEBUG_COMP_IF("Cannot scan " + absoluteBase.string() + ": " + ec.message(), "WatchRegistry");
        return;
    }

    size_t skipped = 0;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            LOG_WARN_COMP("Scan of " + absoluteBase.string() + " stopped early: " + ec.message(), "WatchRegistry");
            break;
        }

        auto relative = PathUtils::relativeTo(absoluteBase, it->path());
        if (!relative) {
            continue;
        }
        std::string relativePath = PathUtils::joinRelative(relativeBase, *relative);
        if (discovered) {
            discovered->push_back(relativePath);
        }

        std::error_code statEc;
        if (it->is_symlink(statEc) || !it->is_directory(statEc)) {
            continue;
        }

        auto handle = subscribeDirectory(root, relativePath, it->path(), discovered != nullptr);
        if (!handle) {
            ++skipped;
            LOG_WARN_COMP("Not watching '" + relativePath + "': " + handle.error().message, "WatchRegistry");
            it.disable_recursion_pending();
        }
    }

    if (skipped > 0) {
        LOG_WARN_COMP(std::to_string(skipped) + " directories of " + root.id + " are not watched", "WatchRegistry");
    }
}

RootInfo WatchRegistry::describe(const WatchRoot& root, bool created) const {
    RootInfo info;
    info.id = root.id;
    info.fspath = root.fspath.string();
    info.generation = root.generation;
    info.subscriptions = root.dirs.size();
    info.created = created;
    return info;
}

} // namespace WatchBridge
