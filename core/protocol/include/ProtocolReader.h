#pragma once

/**
 * @file ProtocolReader.h
 * @brief Line reader for the command stream
 *
 * Reads with poll() so that a stop request interrupts a blocked read within
 * one poll tick.
 */

#include <chrono>
#include <functional>
#include <string>

namespace WatchBridge {

class ProtocolReader {
public:
    enum class Status {
        Line,
        EndOfStream,
        Interrupted,
        Error
    };

    using StopPredicate = std::function<bool()>;

    /// Does not take ownership of @p fd
    explicit ProtocolReader(int fd, StopPredicate shouldStop = nullptr,
                            std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100));

    /**
     * @brief Read the next line, without its terminating newline
     *
     * A final line without a newline is discarded and reported as
     * EndOfStream, since the host never sends one.
     */
    Status readLine(std::string& line);

    /// errno text of the last Error status
    const std::string& lastError() const { return lastError_; }

private:
    bool takeLine(std::string& line);

    int fd_;
    StopPredicate shouldStop_;
    std::chrono::milliseconds pollInterval_;
    std::string buffer_;
    std::string lastError_;
};

} // namespace WatchBridge
