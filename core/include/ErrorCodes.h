#pragma once

#include "Result.h"
#include <string>
#include <unordered_map>

namespace WatchBridge {

enum class ErrorCode : int {
    // Protocol Errors (1000-1999)
    MALFORMED_COMMAND = 1000,
    UNSUPPORTED_VERSION = 1001,
    UNKNOWN_ROOT = 1002,
    DUPLICATE_WAIT = 1003,
    UNEXPECTED_COMMAND = 1004,
    ROOT_FAILED = 1005,

    // Watch Errors (2000-2999)
    NOT_FOUND = 2000,
    PERMISSION_DENIED = 2001,
    NOT_A_DIRECTORY = 2002,
    SUBSCRIPTION_LIMIT = 2003,
    SUBSCRIBE_FAILED = 2004,
    UNSUBSCRIBE_FAILED = 2005,
    WATCHED_DIRECTORY_REMOVED = 2006,

    // Transient Event Errors (3000-3999)
    EVENT_READ_FAILED = 3000,
    EVENT_QUEUE_OVERFLOW = 3001,

    // Fatal Errors (4000-4999)
    INPUT_CLOSED = 4000,
    INPUT_READ_FAILED = 4001,
    OUTPUT_WRITE_FAILED = 4002,
    EVENT_SOURCE_FAILED = 4003,
    INVALID_CONFIGURATION = 4004,

    // Success
    SUCCESS = 0
};

class ErrorRegistry {
private:
    static const std::unordered_map<ErrorCode, std::string>& messages();

public:
    static std::string getMessage(ErrorCode code);
    static std::string getCodeString(ErrorCode code);

    /**
     * @brief Build an Error carrying the code and its registered message
     * @param details Appended after the message ("<message>: <details>")
     */
    static Error createError(ErrorCode code, const std::string& details = "",
                             const std::string& component = "");
};

inline ErrorCode codeOf(const Error& error) {
    return static_cast<ErrorCode>(error.code);
}

} // namespace WatchBridge
