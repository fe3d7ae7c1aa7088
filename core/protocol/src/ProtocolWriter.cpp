#include "ProtocolWriter.h"
#include "ErrorCodes.h"
#include "LoggerMacros.h"

namespace WatchBridge {

ProtocolWriter::ProtocolWriter(std::ostream& out)
    : out_(out) {
}

VoidResult ProtocolWriter::send(const std::string& name, const std::vector<std::string>& args) {
    return sendBatch({Command{name, args}});
}

VoidResult ProtocolWriter::sendBatch(const std::vector<Command>& commands) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failed_) {
        return ErrorRegistry::createError(ErrorCode::OUTPUT_WRITE_FAILED, "stream already failed", "Protocol");
    }

    for (const auto& command : commands) {
        std::string line = ProtocolCodec::format(command.name, command.args);
        LOG_DEBUG_COMP_IF(">> " + line, "Protocol");
        out_ << line << '\n';
    }
    return flushLocked();
}

VoidResult ProtocolWriter::flushLocked() {
    out_.flush();
    if (!out_) {
        failed_ = true;
        LOG_ERROR_COMP("Response stream write failed", "Protocol");
        return ErrorRegistry::createError(ErrorCode::OUTPUT_WRITE_FAILED, "", "Protocol");
    }
    return Ok();
}

} // namespace WatchBridge
