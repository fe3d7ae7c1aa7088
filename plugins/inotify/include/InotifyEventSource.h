#pragma once

/**
 * @file InotifyEventSource.h
 * @brief inotify-backed IEventSource
 */

#include "IEventSource.h"
#include "FdGuard.h"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>

struct inotify_event;

namespace WatchBridge {

struct InotifyOptions {
    int readRetryAttempts{3};
    std::chrono::milliseconds readRetryBackoff{50};
    std::chrono::milliseconds pollInterval{100};
};

class InotifyEventSource : public IEventSource {
public:
    explicit InotifyEventSource(InotifyOptions options = {});
    ~InotifyEventSource() override;

    bool initialize(EventCallback onEvent, FailureCallback onFailure) override;
    void shutdown() override;
    Result<SubscriptionHandle> subscribe(const std::string& directory) override;
    VoidResult unsubscribe(SubscriptionHandle handle) override;
    size_t getSubscriptionCount() const override;
    std::string getName() const override { return "inotify"; }

    /// Delay before retry number @p failures (1-based); doubles up to a cap
    static std::chrono::milliseconds retryBackoff(std::chrono::milliseconds base, int failures);

private:
    struct WatchEntry {
        std::string path;
        int refs{0};  // inotify hands out one wd per inode, so repeat subscribers share it
    };

    void monitorLoop();
    bool readBatch(char* buffer, size_t size, int& failures);
    void dispatch(const struct inotify_event* event);
    bool lookupPath(int wd, std::string& path) const;
    void forget(int wd);

    InotifyOptions options_;
    wb::FdGuard inotifyFd_;
    std::atomic<bool> running_{false};
    std::thread monitorThread_;
    EventCallback onEvent_;
    FailureCallback onFailure_;

    mutable std::mutex watchMutex_;
    std::map<int, WatchEntry> watches_;  // wd -> entry
};

} // namespace WatchBridge
