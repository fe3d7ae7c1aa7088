#pragma once

/**
 * @file ProtocolStateMachine.h
 * @brief Session logic of the Unison fsmonitor protocol, version 1
 *
 * Commands arrive on one thread through handle(). A WAIT starts a notifier
 * thread that blocks on the coalescer and writes "CHANGES <id>" once one of
 * the waited roots has settled changes. Every command other than WAIT
 * cancels that wait first; the notifier only writes while its token is still
 * the active one, so no CHANGES line can follow a cancelling command.
 */

#include "EventCoalescer.h"
#include "ExitCodes.h"
#include "ProtocolCodec.h"
#include "ProtocolWriter.h"
#include "Result.h"
#include "WatchRegistry.h"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace WatchBridge {

enum class RootState {
    Idle,
    Waiting,
    Failed
};

const char* rootStateName(RootState state);

struct SessionOptions {
    bool recursive{true};
    std::optional<std::chrono::milliseconds> waitTimeout;  // empty = wait until changes arrive
};

class ProtocolStateMachine {
public:
    static constexpr int PROTOCOL_VERSION = 1;

    ProtocolStateMachine(WatchRegistry& registry, EventCoalescer& coalescer, ProtocolWriter& writer,
                         SessionOptions options = {});
    ~ProtocolStateMachine();

    ProtocolStateMachine(const ProtocolStateMachine&) = delete;
    ProtocolStateMachine& operator=(const ProtocolStateMachine&) = delete;

    /// Announce our protocol version; the host answers with its own
    VoidResult begin();

    /**
     * @brief Process one input line
     * @return an exit code when the session must end, nothing to keep going
     */
    std::optional<ExitCode> handleLine(const std::string& line);
    std::optional<ExitCode> handle(const Command& command);

    /// Report @p error once and mark every live root Failed
    void failAllRoots(const Error& error);

    /// Report @p error and mark one root Failed; nothing happens once it has failed
    void failRoot(const std::string& id, const Error& error);

    /// Cancel any wait and join the notifier
    void shutdown();

    bool handshakeComplete() const;
    bool scanning() const;
    std::optional<RootState> rootState(const std::string& id) const;

private:
    enum class Phase {
        AwaitingHandshake,
        Active,
        Scanning
    };

    std::optional<ExitCode> handleHandshake(const Command& command);
    std::optional<ExitCode> handleScan(const Command& command);
    std::optional<ExitCode> handleStart(const Command& command);
    std::optional<ExitCode> handleWait(const Command& command);
    std::optional<ExitCode> handleChanges(const Command& command);
    std::optional<ExitCode> handleReset(const Command& command);

    std::optional<ExitCode> protocolViolation(const Command& command);
    std::optional<ExitCode> reply(const VoidResult& result);
    std::optional<ExitCode> sendError(const Error& error);

    // Caller holds sessionMutex_
    void failRootLocked(const std::string& id, const Error& error);
    void startNotifierLocked();
    void takeWaitLocked(std::shared_ptr<WaitToken>& token, std::thread& notifier);
    void releaseWait(std::shared_ptr<WaitToken> token, std::thread notifier);

    void cancelWaits();
    void notifierLoop(std::shared_ptr<WaitToken> token, std::vector<std::string> roots);

    WatchRegistry& registry_;
    EventCoalescer& coalescer_;
    ProtocolWriter& writer_;
    SessionOptions options_;

    Phase phase_{Phase::AwaitingHandshake};
    std::string scanRoot_;
    bool scanAccepted_{false};

    mutable std::mutex sessionMutex_;
    std::map<std::string, RootState> states_;
    std::shared_ptr<WaitToken> activeToken_;
    std::thread notifier_;
};

} // namespace WatchBridge
