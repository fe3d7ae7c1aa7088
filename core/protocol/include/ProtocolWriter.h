#pragma once

/**
 * @file ProtocolWriter.h
 * @brief Serialized, flushed writer for the response stream
 *
 * The protocol thread and the notifier thread both write; a batch (a change
 * report and its DONE) is written under one lock so lines never interleave.
 */

#include "ProtocolCodec.h"
#include "Result.h"
#include <atomic>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace WatchBridge {

class ProtocolWriter {
public:
    explicit ProtocolWriter(std::ostream& out);

    VoidResult send(const std::string& name, const std::vector<std::string>& args = {});
    VoidResult sendBatch(const std::vector<Command>& commands);

    /// A write failed earlier; the stream is unusable
    bool failed() const { return failed_.load(); }

private:
    VoidResult flushLocked();

    std::ostream& out_;
    std::mutex mutex_;
    std::atomic<bool> failed_{false};
};

} // namespace WatchBridge
