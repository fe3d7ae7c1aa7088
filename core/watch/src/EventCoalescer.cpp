#include "EventCoalescer.h"
#include "LoggerMacros.h"
#include <algorithm>

namespace WatchBridge {

EventCoalescer::EventCoalescer(CoalescerConfig config)
    : config_(config) {
}

void EventCoalescer::addRoot(const std::string& rootId) {
    std::unique_lock<std::shared_mutex> lock(slotsMutex_);
    if (slots_.find(rootId) == slots_.end()) {
        slots_.emplace(rootId, std::make_shared<RootSlot>());
    }
}

void EventCoalescer::removeRoot(const std::string& rootId) {
    std::shared_ptr<RootSlot> slot;
    {
        std::unique_lock<std::shared_mutex> lock(slotsMutex_);
        auto it = slots_.find(rootId);
        if (it == slots_.end()) {
            return;
        }
        slot = std::move(it->second);
        slots_.erase(it);
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (!slot->pending.empty()) {
        LOG_DEBUG_COMP_IF("Discarding " + std::to_string(slot->pending.size()) +
                          " pending changes of " + rootId, "Coalescer");
    }
    slot->pending.clear();
}

bool EventCoalescer::hasRoot(const std::string& rootId) const {
    return findSlot(rootId) != nullptr;
}

std::shared_ptr<EventCoalescer::RootSlot> EventCoalescer::findSlot(const std::string& rootId) const {
    std::shared_lock<std::shared_mutex> lock(slotsMutex_);
    auto it = slots_.find(rootId);
    return it != slots_.end() ? it->second : nullptr;
}

bool EventCoalescer::ingest(const std::string& rootId, const std::string& relativePath, ChangeKind kind,
                            bool isDirectory, Clock::time_point timestamp) {
    auto slot = findSlot(rootId);
    if (!slot) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->pending.empty()) {
            slot->firstPending = timestamp;
        }
        slot->lastEvent = std::max(slot->lastEvent, timestamp);
        slot->pending.add(relativePath, kind, isDirectory);
    }

    LOG_DEBUG_COMP_IF(rootId + ": " + changeKindName(kind) + " '" + relativePath + "'", "Coalescer");
    notifyWaiters();
    return true;
}

void EventCoalescer::markAllChanged(Clock::time_point timestamp) {
    std::vector<std::shared_ptr<RootSlot>> all;
    {
        std::shared_lock<std::shared_mutex> lock(slotsMutex_);
        for (const auto& entry : slots_) {
            all.push_back(entry.second);
        }
    }

    for (const auto& slot : all) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->pending.empty()) {
            slot->firstPending = timestamp;
        }
        slot->lastEvent = std::max(slot->lastEvent, timestamp);
        slot->pending.add("", ChangeKind::Unknown, true);
    }
    notifyWaiters();
}

std::vector<std::string> EventCoalescer::drain(const std::string& rootId) {
    auto slot = findSlot(rootId);
    if (!slot) {
        return {};
    }

    PendingChangeSet taken;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        taken.swap(slot->pending);
    }
    return taken.paths();
}

bool EventCoalescer::hasPending(const std::string& rootId) const {
    auto slot = findSlot(rootId);
    if (!slot) {
        return false;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return !slot->pending.empty();
}

bool EventCoalescer::isReady(const std::string& rootId, Clock::time_point now) const {
    auto slot = findSlot(rootId);
    if (!slot) {
        return false;
    }
    auto ready = readyTime(*slot);
    return ready && *ready <= now;
}

std::optional<EventCoalescer::Clock::time_point> EventCoalescer::readyTime(const RootSlot& slot) const {
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.pending.empty()) {
        return std::nullopt;
    }
    return std::min(slot.lastEvent + config_.debounce, slot.firstPending + config_.maxDelay);
}

WaitResult EventCoalescer::waitForChanges(const std::vector<std::string>& rootIds,
                                          std::optional<std::chrono::milliseconds> timeout,
                                          const WaitToken& token) {
    const auto start = Clock::now();
    const auto deadline = timeout ? start + *timeout : Clock::time_point::max();

    std::unique_lock<std::mutex> lock(waitMutex_);
    for (;;) {
        if (token.cancelled()) {
            return {WaitResult::Status::Cancelled, ""};
        }

        const auto now = Clock::now();
        auto wakeAt = deadline;
        for (const auto& rootId : rootIds) {
            auto slot = findSlot(rootId);
            if (!slot) {
                continue;
            }
            auto ready = readyTime(*slot);
            if (!ready) {
                continue;
            }
            if (*ready <= now) {
                return {WaitResult::Status::Changed, rootId};
            }
            wakeAt = std::min(wakeAt, *ready);
        }

        if (now >= deadline) {
            return {WaitResult::Status::TimedOut, ""};
        }

        // Ingest bumps the condition under waitMutex_, so no wakeup is lost
        // between the readiness scan above and this wait.
        if (wakeAt == Clock::time_point::max()) {
            waitCv_.wait(lock);
        } else {
            waitCv_.wait_until(lock, wakeAt);
        }
    }
}

void EventCoalescer::cancel(WaitToken& token) {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        token.cancelled_ = true;
    }
    waitCv_.notify_all();
}

void EventCoalescer::notifyWaiters() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
    }
    waitCv_.notify_all();
}

} // namespace WatchBridge
