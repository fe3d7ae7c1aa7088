#pragma once

/**
 * @file WatchRegistry.h
 * @brief Replica roots and the directory subscriptions that cover them
 *
 * Every directory below a watched subpath holds one subscription on the event
 * source. Handles may be shared (inotify returns one wd per inode), so each
 * handle maps to every (root, relative directory) that subscribed it.
 */

#include "IEventSource.h"
#include "Result.h"
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace WatchBridge {

struct RootInfo {
    std::string id;
    std::string fspath;       // canonical absolute replica root
    uint64_t generation{0};
    size_t subscriptions{0};
    bool created{false};      // false when START named an already registered root
};

/**
 * @brief Where a raw event lands: one root and a path relative to it
 */
struct EventTarget {
    std::string rootId;
    std::string relativePath;
    bool isTopDirectory{false};  // the event concerns a watched subpath itself
};

class WatchRegistry {
public:
    explicit WatchRegistry(IEventSource& source);
    ~WatchRegistry();

    WatchRegistry(const WatchRegistry&) = delete;
    WatchRegistry& operator=(const WatchRegistry&) = delete;

    /**
     * @brief Register (or extend) a replica and subscribe @p subpath below it
     *
     * The top directory must exist, be a readable directory and accept a
     * subscription; nested directories that cannot be subscribed are logged
     * and skipped. A root created by a failed call is rolled back.
     */
    Result<RootInfo> addRoot(const std::string& id, const std::string& fspath,
                             const std::string& subpath, bool recursive);

    /// Make sure @p relativeDir is subscribed; a directory that vanished meanwhile is not an error
    VoidResult ensureDirectory(const std::string& id, const std::string& relativeDir);

    /// Subscribe the target tree of a symlink so its changes report under the link's path
    VoidResult followLink(const std::string& id, const std::string& relativeLink);

    /**
     * @brief Subscribe a directory that just appeared, and everything below it
     * @return relative paths of the entries found inside during the walk
     *
     * The subscription is made before the walk, so an entry created inside the
     * directory is either seen by the walk or reported by the event source.
     */
    std::vector<std::string> onDirectoryAppeared(const std::string& rootId, const std::string& relativeDir,
                                                 const std::string& absolutePath);

    /**
     * @brief Release the subscriptions of @p relativeDir and of everything nested below it
     * @return true when a subpath named by START went with it and no other
     *         watched subpath covers the place it was, so the root is blind there
     */
    bool onDirectoryRemoved(const std::string& rootId, const std::string& relativeDir);

    /// The source dropped @p handle by itself; forget it without releasing
    void onSubscriptionLost(SubscriptionHandle handle);

    /// Release every subscription of the root; false when the id was unknown
    bool removeRoot(const std::string& id);

    /// Release everything for every root
    void clear();

    std::vector<EventTarget> resolve(const RawEvent& event) const;

    bool hasRoot(const std::string& id) const;
    std::optional<RootInfo> rootInfo(const std::string& id) const;
    size_t subscriptionCount(const std::string& id) const;
    std::vector<std::string> rootIds() const;

private:
    struct WatchRoot {
        std::string id;
        std::filesystem::path fspath;
        uint64_t generation{0};
        bool recursive{true};
        std::set<std::string> topDirs;                        // subpaths named by START
        std::map<std::string, SubscriptionHandle> dirs;       // relative dir -> handle
        std::map<std::string, std::filesystem::path> links;   // relative link -> target
    };

    struct Owner {
        std::string rootId;
        std::string relativeDir;
    };

    Result<SubscriptionHandle> subscribeDirectory(WatchRoot& root, const std::string& relativeDir,
                                                  const std::filesystem::path& absolutePath, bool refresh);
    void releaseDirectory(WatchRoot& root, const std::string& relativeDir);
    void releaseRoot(WatchRoot& root);
    void walkTree(WatchRoot& root, const std::string& relativeBase, const std::filesystem::path& absoluteBase,
                  std::vector<std::string>* discovered);
    RootInfo describe(const WatchRoot& root, bool created) const;

    IEventSource& source_;

    mutable std::mutex mutex_;
    std::map<std::string, WatchRoot> roots_;
    std::map<SubscriptionHandle, std::vector<Owner>> owners_;
    uint64_t nextGeneration_{1};
};

} // namespace WatchBridge
