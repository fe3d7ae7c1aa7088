#pragma once

namespace WatchBridge {

/**
 * @brief Process exit status, one value per way a session can end
 */
enum class ExitCode : int {
    Clean = 0,              // command stream closed normally
    StartupFailure = 1,     // bad arguments or configuration
    HandshakeFailure = 2,
    ProtocolViolation = 3,
    EventSourceFailure = 4,
    IOFailure = 5,
    Terminated = 6          // SIGINT / SIGTERM
};

inline int toInt(ExitCode code) {
    return static_cast<int>(code);
}

const char* exitCodeName(ExitCode code);

} // namespace WatchBridge
