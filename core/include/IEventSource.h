#pragma once

/**
 * @file IEventSource.h
 * @brief Boundary between the bridge and the OS directory-change facility
 *
 * A subscription covers exactly one directory; recursion is the caller's job.
 * Events are delivered on the source's own thread.
 */

#include "Result.h"
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace WatchBridge {

using SubscriptionHandle = int;
constexpr SubscriptionHandle INVALID_SUBSCRIPTION = -1;

enum class RawEventKind {
    Created,
    Modified,
    Removed,
    RenamedFrom,
    RenamedTo,
    Unknown,
    Overflow,          // events were dropped, handle is INVALID_SUBSCRIPTION
    SubscriptionLost   // the OS released the subscription on its own
};

/**
 * @brief One raw notification, consumed immediately by the bridge
 */
struct RawEvent {
    RawEventKind kind{RawEventKind::Unknown};
    SubscriptionHandle handle{INVALID_SUBSCRIPTION};
    std::string path;       // absolute path of the affected entry
    std::string name;       // entry name inside the subscribed directory, "" for self events
    bool isDirectory{false};
    bool isSelf{false};     // the subscribed directory itself was removed or moved
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
};

using EventCallback = std::function<void(const RawEvent&)>;

/// Invoked once when the source can no longer deliver events
using FailureCallback = std::function<void(const Error&)>;

class IEventSource {
public:
    virtual ~IEventSource() = default;

    virtual bool initialize(EventCallback onEvent, FailureCallback onFailure) = 0;

    /**
     * @brief Stop delivery and release every remaining subscription
     */
    virtual void shutdown() = 0;

    /**
     * @brief Subscribe to changes of the entries directly inside @p directory
     *
     * Subscribing the same directory twice is allowed; each successful call
     * must be matched by one unsubscribe().
     */
    virtual Result<SubscriptionHandle> subscribe(const std::string& directory) = 0;

    virtual VoidResult unsubscribe(SubscriptionHandle handle) = 0;

    virtual size_t getSubscriptionCount() const = 0;

    virtual std::string getName() const = 0;
};

const char* rawEventKindName(RawEventKind kind);

} // namespace WatchBridge
