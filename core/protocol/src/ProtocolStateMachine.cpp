#include "ProtocolStateMachine.h"
#include "ErrorCodes.h"
#include "Logger.h"
#include "LoggerMacros.h"

namespace WatchBridge {

const char* rootStateName(RootState state) {
    switch (state) {
        case RootState::Idle: return "Idle";
        case RootState::Waiting: return "Waiting";
        case RootState::Failed: return "Failed";
        default: return "Unknown";
    }
}

ProtocolStateMachine::ProtocolStateMachine(WatchRegistry& registry, EventCoalescer& coalescer,
                                           ProtocolWriter& writer, SessionOptions options)
    : registry_(registry), coalescer_(coalescer), writer_(writer), options_(options) {
}

ProtocolStateMachine::~ProtocolStateMachine() {
    shutdown();
}

VoidResult ProtocolStateMachine::begin() {
    return writer_.send("VERSION", {std::to_string(PROTOCOL_VERSION)});
}

std::optional<ExitCode> ProtocolStateMachine::handleLine(const std::string& line) {
    auto command = ProtocolCodec::parse(line);
    if (!command) {
        LOG_WARN_COMP("Ignoring input line: " + command.error().message, "Protocol");
        return std::nullopt;
    }
    return handle(command.value());
}

std::optional<ExitCode> ProtocolStateMachine::handle(const Command& command) {
    switch (phase_) {
        case Phase::AwaitingHandshake:
            return handleHandshake(command);
        case Phase::Scanning:
            return handleScan(command);
        case Phase::Active:
            break;
    }

    if (command.name != "WAIT") {
        cancelWaits();
    }

    if (command.name == "DEBUG") {
        Logger::instance().setLevel(LogLevel::DEBUG);
        Logger::instance().info("Debug logging enabled by host", "Protocol");
        return std::nullopt;
    } else if (command.name == "START") {
        return handleStart(command);
    } else if (command.name == "WAIT") {
        return handleWait(command);
    } else if (command.name == "CHANGES") {
        return handleChanges(command);
    } else if (command.name == "RESET") {
        return handleReset(command);
    }

    return protocolViolation(command);
}

std::optional<ExitCode> ProtocolStateMachine::handleHandshake(const Command& command) {
    if (command.name != "VERSION") {
        sendError(ErrorRegistry::createError(ErrorCode::UNEXPECTED_COMMAND,
                                             command.name + " (expected VERSION)", "Protocol"));
        return ExitCode::HandshakeFailure;
    }
    if (command.args.empty()) {
        sendError(ErrorRegistry::createError(ErrorCode::MALFORMED_COMMAND, "VERSION without a number", "Protocol"));
        return ExitCode::HandshakeFailure;
    }
    if (command.args[0] != std::to_string(PROTOCOL_VERSION)) {
        sendError(ErrorRegistry::createError(ErrorCode::UNSUPPORTED_VERSION, command.args[0], "Protocol"));
        return ExitCode::HandshakeFailure;
    }

    phase_ = Phase::Active;
    Logger::instance().info("Handshake complete, protocol version " + command.args[0], "Protocol");
    return std::nullopt;
}

std::optional<ExitCode> ProtocolStateMachine::handleStart(const Command& command) {
    if (command.args.size() < 2) {
        sendError(ErrorRegistry::createError(ErrorCode::MALFORMED_COMMAND,
                                             "START needs a replica id and a path", "Protocol"));
        return ExitCode::ProtocolViolation;
    }

    const std::string& id = command.args[0];
    const std::string& fspath = command.args[1];
    const std::string subpath = command.args.size() > 2 ? command.args[2] : "";

    phase_ = Phase::Scanning;
    scanRoot_ = id;
    scanAccepted_ = false;

    std::lock_guard<std::mutex> lock(sessionMutex_);
    auto state = states_.find(id);
    if (state != states_.end() && state->second == RootState::Failed) {
        states_.erase(state);
    }

    const bool existed = registry_.hasRoot(id);
    coalescer_.addRoot(id);

    auto root = registry_.addRoot(id, fspath, subpath, options_.recursive);
    if (!root) {
        if (!existed) {
            coalescer_.removeRoot(id);
        }
        LOG_WARN_COMP("START " + id + " failed: " + root.error().message, "Protocol");
        return sendError(root.error());
    }

    states_.emplace(id, RootState::Idle);
    scanAccepted_ = true;

    const auto& info = root.value();
    LOG_DEBUG_COMP_IF("Replica " + id + (info.created ? " registered" : " extended") +
                      ", generation " + std::to_string(info.generation) + ", " +
                      std::to_string(info.subscriptions) + " watches", "Protocol");
    return reply(writer_.send("OK"));
}

std::optional<ExitCode> ProtocolStateMachine::handleScan(const Command& command) {
    if (command.name == "DONE") {
        phase_ = Phase::Active;
        scanRoot_.clear();
        return std::nullopt;
    }

    if (command.name != "DIR" && command.name != "LINK") {
        return protocolViolation(command);
    }

    if (!scanAccepted_) {
        return std::nullopt;  // START failed, the rest of its dialogue is moot
    }

    const std::string path = command.args.empty() ? "" : command.args[0];
    VoidResult result = command.name == "DIR" ? registry_.ensureDirectory(scanRoot_, path)
                                              : registry_.followLink(scanRoot_, path);
    if (!result) {
        scanAccepted_ = false;
        std::lock_guard<std::mutex> lock(sessionMutex_);
        failRootLocked(scanRoot_, result.error());
        return reply(writer_.send("ERROR", {result.error().message}));
    }
    return reply(writer_.send("OK"));
}

std::optional<ExitCode> ProtocolStateMachine::handleWait(const Command& command) {
    if (command.args.empty()) {
        sendError(ErrorRegistry::createError(ErrorCode::MALFORMED_COMMAND, "WAIT needs a replica id", "Protocol"));
        return ExitCode::ProtocolViolation;
    }
    const std::string& id = command.args[0];

    std::shared_ptr<WaitToken> oldToken;
    std::thread oldNotifier;
    std::optional<ExitCode> outcome;
    bool restart = false;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        auto it = states_.find(id);
        if (it == states_.end()) {
            return sendError(ErrorRegistry::createError(ErrorCode::UNKNOWN_ROOT, id, "Protocol"));
        }
        if (it->second == RootState::Failed) {
            return sendError(ErrorRegistry::createError(ErrorCode::ROOT_FAILED, id, "Protocol"));
        }
        if (it->second == RootState::Waiting) {
            auto error = ErrorRegistry::createError(ErrorCode::DUPLICATE_WAIT, id, "Protocol");
            failRootLocked(id, error);
            return sendError(error);
        }

        if (coalescer_.isReady(id)) {
            for (auto& entry : states_) {
                if (entry.second == RootState::Waiting) {
                    entry.second = RootState::Idle;
                }
            }
            outcome = reply(writer_.send("CHANGES", {id}));
        } else {
            it->second = RootState::Waiting;
            restart = true;
        }
        takeWaitLocked(oldToken, oldNotifier);
    }

    // The old notifier may be blocked on sessionMutex_, so join it unlocked
    releaseWait(std::move(oldToken), std::move(oldNotifier));

    if (restart) {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        startNotifierLocked();
    }
    return outcome;
}

std::optional<ExitCode> ProtocolStateMachine::handleChanges(const Command& command) {
    if (command.args.empty()) {
        sendError(ErrorRegistry::createError(ErrorCode::MALFORMED_COMMAND, "CHANGES needs a replica id", "Protocol"));
        return ExitCode::ProtocolViolation;
    }
    const std::string& id = command.args[0];

    std::lock_guard<std::mutex> lock(sessionMutex_);
    auto it = states_.find(id);
    if (it == states_.end()) {
        return sendError(ErrorRegistry::createError(ErrorCode::UNKNOWN_ROOT, id, "Protocol"));
    }
    if (it->second == RootState::Failed) {
        return sendError(ErrorRegistry::createError(ErrorCode::ROOT_FAILED, id, "Protocol"));
    }

    std::vector<Command> report;
    for (const auto& path : coalescer_.drain(id)) {
        report.push_back(Command{"RECURSIVE", {path}});
    }
    LOG_DEBUG_COMP_IF("Reporting " + std::to_string(report.size()) + " changed paths for " + id, "Protocol");
    report.push_back(Command{"DONE", {}});
    return reply(writer_.sendBatch(report));
}

std::optional<ExitCode> ProtocolStateMachine::handleReset(const Command& command) {
    if (command.args.empty()) {
        sendError(ErrorRegistry::createError(ErrorCode::MALFORMED_COMMAND, "RESET needs a replica id", "Protocol"));
        return ExitCode::ProtocolViolation;
    }
    const std::string& id = command.args[0];

    std::lock_guard<std::mutex> lock(sessionMutex_);
    auto it = states_.find(id);
    if (it == states_.end()) {
        LOG_WARN_COMP("RESET for unknown replica " + id, "Protocol");
        return std::nullopt;
    }

    registry_.removeRoot(id);
    coalescer_.removeRoot(id);
    states_.erase(it);
    return std::nullopt;
}

std::optional<ExitCode> ProtocolStateMachine::protocolViolation(const Command& command) {
    LOG_ERROR_COMP("Unexpected command " + command.name + (phase_ == Phase::Scanning ? " during START" : ""),
                   "Protocol");
    sendError(ErrorRegistry::createError(ErrorCode::UNEXPECTED_COMMAND, command.name, "Protocol"));
    return ExitCode::ProtocolViolation;
}

std::optional<ExitCode> ProtocolStateMachine::reply(const VoidResult& result) {
    if (!result) {
        return ExitCode::IOFailure;
    }
    return std::nullopt;
}

std::optional<ExitCode> ProtocolStateMachine::sendError(const Error& error) {
    return reply(writer_.send("ERROR", {error.message}));
}

void ProtocolStateMachine::failRootLocked(const std::string& id, const Error& error) {
    registry_.removeRoot(id);
    coalescer_.removeRoot(id);
    states_[id] = RootState::Failed;
    LOG_ERROR_COMP("Replica " + id + " failed: " + error.message, "Protocol");
}

void ProtocolStateMachine::failAllRoots(const Error& error) {
    cancelWaits();

    std::lock_guard<std::mutex> lock(sessionMutex_);
    for (auto& entry : states_) {
        if (entry.second != RootState::Failed) {
            registry_.removeRoot(entry.first);
            coalescer_.removeRoot(entry.first);
            entry.second = RootState::Failed;
        }
    }
    writer_.send("ERROR", {error.message}).onError([](const Error& writeError) {
        LOG_ERROR_COMP("Could not report failure to host: " + writeError.message, "Protocol");
    });
}

void ProtocolStateMachine::failRoot(const std::string& id, const Error& error) {
    // A wait on other roots goes on; this root's slot is gone from under it
    std::lock_guard<std::mutex> lock(sessionMutex_);
    auto it = states_.find(id);
    if (it == states_.end() || it->second == RootState::Failed) {
        return;
    }
    failRootLocked(id, error);
    writer_.send("ERROR", {error.message}).onError([](const Error& writeError) {
        LOG_ERROR_COMP("Could not report failure to host: " + writeError.message, "Protocol");
    });
}

void ProtocolStateMachine::shutdown() {
    cancelWaits();
}

bool ProtocolStateMachine::handshakeComplete() const {
    return phase_ != Phase::AwaitingHandshake;
}

bool ProtocolStateMachine::scanning() const {
    return phase_ == Phase::Scanning;
}

std::optional<RootState> ProtocolStateMachine::rootState(const std::string& id) const {
    std::lock_guard<std::mutex> lock(sessionMutex_);
    auto it = states_.find(id);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ProtocolStateMachine::startNotifierLocked() {
    std::vector<std::string> roots;
    for (const auto& entry : states_) {
        if (entry.second == RootState::Waiting) {
            roots.push_back(entry.first);
        }
    }
    if (roots.empty()) {
        return;
    }

    activeToken_ = std::make_shared<WaitToken>();
    notifier_ = std::thread(&ProtocolStateMachine::notifierLoop, this, activeToken_, std::move(roots));
}

void ProtocolStateMachine::takeWaitLocked(std::shared_ptr<WaitToken>& token, std::thread& notifier) {
    token = std::move(activeToken_);
    activeToken_.reset();
    notifier = std::move(notifier_);
}

void ProtocolStateMachine::releaseWait(std::shared_ptr<WaitToken> token, std::thread notifier) {
    if (token) {
        coalescer_.cancel(*token);
    }
    if (notifier.joinable()) {
        notifier.join();
    }
}

void ProtocolStateMachine::cancelWaits() {
    std::shared_ptr<WaitToken> token;
    std::thread notifier;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        for (auto& entry : states_) {
            if (entry.second == RootState::Waiting) {
                entry.second = RootState::Idle;
            }
        }
        takeWaitLocked(token, notifier);
    }
    releaseWait(std::move(token), std::move(notifier));
}

void ProtocolStateMachine::notifierLoop(std::shared_ptr<WaitToken> token, std::vector<std::string> roots) {
    WaitResult result = coalescer_.waitForChanges(roots, options_.waitTimeout, *token);
    if (result.status == WaitResult::Status::Cancelled) {
        return;
    }

    std::lock_guard<std::mutex> lock(sessionMutex_);
    if (activeToken_ != token) {
        return;  // Superseded while we were waking up
    }
    activeToken_.reset();

    for (auto& entry : states_) {
        if (entry.second == RootState::Waiting) {
            entry.second = RootState::Idle;
        }
    }

    if (result.status == WaitResult::Status::TimedOut) {
        LOG_DEBUG_COMP_IF("Wait timed out without changes", "Protocol");
        return;
    }

    writer_.send("CHANGES", {result.rootId}).onError([](const Error& error) {
        LOG_ERROR_COMP("Could not announce changes: " + error.message, "Protocol");
    });
}

} // namespace WatchBridge
