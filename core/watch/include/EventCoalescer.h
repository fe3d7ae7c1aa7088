#pragma once

/**
 * @file EventCoalescer.h
 * @brief Per-root change accumulation, debouncing and blocking waits
 *
 * Ingestion runs on the event source thread while drains and waits run on
 * the protocol side. Each root's pending set has its own mutex; the root map
 * is only write-locked when roots come and go.
 */

#include "PendingChangeSet.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace WatchBridge {

/**
 * @brief Debounce configuration
 */
struct CoalescerConfig {
    std::chrono::milliseconds debounce{50};
    std::chrono::milliseconds maxDelay{500};
};

/**
 * @brief Cancellation flag for one in-flight wait
 *
 * Cancel through EventCoalescer::cancel() so the waiter is woken.
 */
class WaitToken {
public:
    bool cancelled() const { return cancelled_.load(); }

private:
    friend class EventCoalescer;
    std::atomic<bool> cancelled_{false};
};

struct WaitResult {
    enum class Status {
        Changed,
        TimedOut,
        Cancelled
    };

    Status status{Status::TimedOut};
    std::string rootId;  // set when status == Changed
};

class EventCoalescer {
public:
    using Clock = std::chrono::steady_clock;

    explicit EventCoalescer(CoalescerConfig config = {});

    /// Create an empty pending set; no-op for a known root
    void addRoot(const std::string& rootId);

    /// Discard the root and whatever it had pending
    void removeRoot(const std::string& rootId);

    bool hasRoot(const std::string& rootId) const;

    /**
     * @brief Fold one change into the root's pending set
     * @return false when the root is not registered (event dropped)
     */
    bool ingest(const std::string& rootId, const std::string& relativePath, ChangeKind kind,
                bool isDirectory, Clock::time_point timestamp = Clock::now());

    /// Mark every root as changed at its top ("" covers the whole replica)
    void markAllChanged(Clock::time_point timestamp = Clock::now());

    /**
     * @brief Atomically take and clear the root's pending paths
     *
     * Every event ingested before the swap is returned here; every event
     * ingested after it stays for the next drain.
     */
    std::vector<std::string> drain(const std::string& rootId);

    bool hasPending(const std::string& rootId) const;

    /// Pending and either quiet for the debounce window or held past maxDelay
    bool isReady(const std::string& rootId, Clock::time_point now = Clock::now()) const;

    /**
     * @brief Block until one of @p rootIds is ready, the timeout passes or
     *        the token is cancelled
     *
     * Never consumes pending changes. An empty timeout waits indefinitely.
     */
    WaitResult waitForChanges(const std::vector<std::string>& rootIds,
                              std::optional<std::chrono::milliseconds> timeout,
                              const WaitToken& token);

    void cancel(WaitToken& token);

    const CoalescerConfig& config() const { return config_; }

private:
    struct RootSlot {
        mutable std::mutex mutex;
        PendingChangeSet pending;
        Clock::time_point firstPending{};
        Clock::time_point lastEvent{};
    };

    std::shared_ptr<RootSlot> findSlot(const std::string& rootId) const;
    std::optional<Clock::time_point> readyTime(const RootSlot& slot) const;
    void notifyWaiters();

    CoalescerConfig config_;

    mutable std::shared_mutex slotsMutex_;
    std::unordered_map<std::string, std::shared_ptr<RootSlot>> slots_;

    std::mutex waitMutex_;
    std::condition_variable waitCv_;
};

} // namespace WatchBridge
