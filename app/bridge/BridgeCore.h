#pragma once

#include "EventCoalescer.h"
#include "ExitCodes.h"
#include "IEventSource.h"
#include "ProtocolStateMachine.h"
#include "ProtocolWriter.h"
#include "Result.h"
#include "WatchRegistry.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace WatchBridge {

/**
 * @brief Configuration for bridge startup
 */
struct BridgeConfig {
    std::chrono::milliseconds debounce{50};
    std::chrono::milliseconds maxDelay{500};
    std::chrono::milliseconds waitTimeout{0};   // 0 = unbounded
    bool recursive = true;
};

/**
 * @brief Process lifecycle of the fsmonitor bridge
 *
 * Wires the event source into the registry and the coalescer, runs the
 * command loop on the calling thread and maps the way the session ended to
 * an exit code. Every path out of run() releases all subscriptions.
 */
class BridgeCore {
public:
    BridgeCore(const BridgeConfig& config, std::unique_ptr<IEventSource> source,
               int inputFd, std::ostream& output);
    ~BridgeCore();

    BridgeCore(const BridgeCore&) = delete;
    BridgeCore& operator=(const BridgeCore&) = delete;

    /**
     * @brief Start the event source
     * @return false if the source could not be initialized
     */
    bool initialize();

    /**
     * @brief Run the protocol session until it ends (blocking)
     */
    ExitCode run();

    /**
     * @brief Release every subscription and stop the event source
     *
     * Safe to call more than once.
     */
    void shutdown();

    const BridgeConfig& getConfig() const { return config_; }
    bool isRunning() const { return running_; }

private:
    // Event source thread
    void onRawEvent(const RawEvent& event);
    void onSourceFailure(const Error& error);

    bool shouldStop() const;
    ExitCode interruptedExitCode();
    void printConfiguration() const;

    BridgeConfig config_;
    std::unique_ptr<IEventSource> source_;
    EventCoalescer coalescer_;
    ProtocolWriter writer_;
    WatchRegistry registry_;
    ProtocolStateMachine session_;
    int inputFd_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> sourceFailed_{false};

    mutable std::mutex failureMutex_;
    Error sourceError_;
};

} // namespace WatchBridge
