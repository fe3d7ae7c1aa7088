#pragma once

/**
 * @file ProtocolCodec.h
 * @brief Line format of the Unison fsmonitor protocol
 *
 * A line is a command name followed by space separated, percent-encoded
 * arguments:
 *   START 1a2b%20c /home/user/replica sub/dir
 */

#include "Result.h"
#include <string>
#include <vector>

namespace WatchBridge {

struct Command {
    std::string name;
    std::vector<std::string> args;  // already unquoted
};

class ProtocolCodec {
public:
    /// Percent-encode everything except letters, digits and "_.-~/"
    static std::string quote(const std::string& value);

    /// Decode %XX in either case; malformed escapes are kept literally
    static std::string unquote(const std::string& value);

    /**
     * @brief Split one line (without its newline) into a command
     *
     * Fails with MALFORMED_COMMAND for a blank line.
     */
    static Result<Command> parse(const std::string& line);

    /// Encode a response line without the trailing newline
    static std::string format(const std::string& name, const std::vector<std::string>& args = {});
};

} // namespace WatchBridge
