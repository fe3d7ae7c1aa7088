#include "ErrorCodes.h"
#include "ExitCodes.h"

namespace WatchBridge {

const std::unordered_map<ErrorCode, std::string>& ErrorRegistry::messages() {
    static const std::unordered_map<ErrorCode, std::string> table = {
        {ErrorCode::MALFORMED_COMMAND, "Malformed command"},
        {ErrorCode::UNSUPPORTED_VERSION, "Unsupported protocol version"},
        {ErrorCode::UNKNOWN_ROOT, "unknown replica"},
        {ErrorCode::DUPLICATE_WAIT, "Replica is already being waited on"},
        {ErrorCode::UNEXPECTED_COMMAND, "unexpected command"},
        {ErrorCode::ROOT_FAILED, "Replica monitoring has failed"},

        {ErrorCode::NOT_FOUND, "No such directory"},
        {ErrorCode::PERMISSION_DENIED, "Permission denied"},
        {ErrorCode::NOT_A_DIRECTORY, "Not a directory"},
        {ErrorCode::SUBSCRIPTION_LIMIT, "Watch limit reached (see fs.inotify.max_user_watches)"},
        {ErrorCode::SUBSCRIBE_FAILED, "Failed to watch directory"},
        {ErrorCode::UNSUBSCRIBE_FAILED, "Failed to release watch"},
        {ErrorCode::WATCHED_DIRECTORY_REMOVED, "Watched directory was removed"},

        {ErrorCode::EVENT_READ_FAILED, "Failed to read filesystem events"},
        {ErrorCode::EVENT_QUEUE_OVERFLOW, "Filesystem event queue overflowed"},

        {ErrorCode::INPUT_CLOSED, "Command stream closed"},
        {ErrorCode::INPUT_READ_FAILED, "Failed to read command stream"},
        {ErrorCode::OUTPUT_WRITE_FAILED, "Failed to write response stream"},
        {ErrorCode::EVENT_SOURCE_FAILED, "Filesystem event source failed"},
        {ErrorCode::INVALID_CONFIGURATION, "Invalid configuration"},

        {ErrorCode::SUCCESS, "Operation successful"}
    };
    return table;
}

std::string ErrorRegistry::getMessage(ErrorCode code) {
    const auto& table = messages();
    auto it = table.find(code);
    if (it != table.end()) {
        return it->second;
    }
    return "Unknown error";
}

std::string ErrorRegistry::getCodeString(ErrorCode code) {
    switch (code) {
        case ErrorCode::MALFORMED_COMMAND: return "MALFORMED_COMMAND";
        case ErrorCode::UNSUPPORTED_VERSION: return "UNSUPPORTED_VERSION";
        case ErrorCode::UNKNOWN_ROOT: return "UNKNOWN_ROOT";
        case ErrorCode::DUPLICATE_WAIT: return "DUPLICATE_WAIT";
        case ErrorCode::UNEXPECTED_COMMAND: return "UNEXPECTED_COMMAND";
        case ErrorCode::ROOT_FAILED: return "ROOT_FAILED";

        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case ErrorCode::NOT_A_DIRECTORY: return "NOT_A_DIRECTORY";
        case ErrorCode::SUBSCRIPTION_LIMIT: return "SUBSCRIPTION_LIMIT";
        case ErrorCode::SUBSCRIBE_FAILED: return "SUBSCRIBE_FAILED";
        case ErrorCode::UNSUBSCRIBE_FAILED: return "UNSUBSCRIBE_FAILED";
        case ErrorCode::WATCHED_DIRECTORY_REMOVED: return "WATCHED_DIRECTORY_REMOVED";

        case ErrorCode::EVENT_READ_FAILED: return "EVENT_READ_FAILED";
        case ErrorCode::EVENT_QUEUE_OVERFLOW: return "EVENT_QUEUE_OVERFLOW";

        case ErrorCode::INPUT_CLOSED: return "INPUT_CLOSED";
        case ErrorCode::INPUT_READ_FAILED: return "INPUT_READ_FAILED";
        case ErrorCode::OUTPUT_WRITE_FAILED: return "OUTPUT_WRITE_FAILED";
        case ErrorCode::EVENT_SOURCE_FAILED: return "EVENT_SOURCE_FAILED";
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";

        case ErrorCode::SUCCESS: return "SUCCESS";
        default: return "UNKNOWN";
    }
}

Error ErrorRegistry::createError(ErrorCode code, const std::string& details,
                                 const std::string& component) {
    std::string message = getMessage(code);
    if (!details.empty()) {
        message += ": " + details;
    }
    return Error(std::move(message), static_cast<int>(code), component);
}

const char* exitCodeName(ExitCode code) {
    switch (code) {
        case ExitCode::Clean: return "clean";
        case ExitCode::StartupFailure: return "startup failure";
        case ExitCode::HandshakeFailure: return "handshake failure";
        case ExitCode::ProtocolViolation: return "protocol violation";
        case ExitCode::EventSourceFailure: return "event source failure";
        case ExitCode::IOFailure: return "I/O failure";
        case ExitCode::Terminated: return "terminated by signal";
        default: return "unknown";
    }
}

} // namespace WatchBridge
