#include "ProtocolReader.h"
#include "Constants.h"
#include "LoggerMacros.h"
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace WatchBridge {

ProtocolReader::ProtocolReader(int fd, StopPredicate shouldStop, std::chrono::milliseconds pollInterval)
    : fd_(fd), shouldStop_(std::move(shouldStop)), pollInterval_(pollInterval) {
}

bool ProtocolReader::takeLine(std::string& line) {
    size_t pos = buffer_.find('\n');
    if (pos == std::string::npos) {
        return false;
    }
    line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

ProtocolReader::Status ProtocolReader::readLine(std::string& line) {
    char chunk[wb::config::INPUT_BUFFER_SIZE];

    for (;;) {
        if (takeLine(line)) {
            LOG_DEBUG_COMP_IF("<< " + line, "Protocol");
            return Status::Line;
        }

        if (buffer_.size() > wb::config::MAX_COMMAND_LINE) {
            lastError_ = "command line exceeds " + std::to_string(wb::config::MAX_COMMAND_LINE) + " bytes";
            return Status::Error;
        }

        if (shouldStop_ && shouldStop_()) {
            return Status::Interrupted;
        }

        struct pollfd pfd = { fd_, POLLIN, 0 };
        int ret = poll(&pfd, 1, static_cast<int>(pollInterval_.count()));
        if (ret == 0) continue;  // Timeout, re-check the stop predicate
        if (ret < 0) {
            if (errno == EINTR) continue;
            lastError_ = strerror(errno);
            return Status::Error;
        }
        if (pfd.revents & POLLNVAL) {
            lastError_ = "invalid input descriptor";
            return Status::Error;
        }

        // POLLHUP still leaves buffered data to read; read() reports the end
        ssize_t n = read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            if (!buffer_.empty()) {
                LOG_WARN_COMP("Discarding unterminated final line (" + std::to_string(buffer_.size()) +
                              " bytes)", "Protocol");
                buffer_.clear();
            }
            return Status::EndOfStream;
        }
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            continue;
        }
        lastError_ = strerror(errno);
        return Status::Error;
    }
}

} // namespace WatchBridge
