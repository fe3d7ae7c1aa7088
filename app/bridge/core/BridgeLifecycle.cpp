/**
 * @file BridgeLifecycle.cpp
 * @brief BridgeCore constructor, destructor, lifecycle methods (initialize, run, shutdown)
 */

#include "BridgeCore.h"
#include "Constants.h"
#include "ErrorCodes.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "ProtocolReader.h"
#include <csignal>

namespace WatchBridge {

namespace {
    // Signal-safe: use volatile sig_atomic_t for guaranteed async-signal-safety
    volatile sig_atomic_t signalReceived = 0;
    volatile sig_atomic_t receivedSignalNum = 0;

    void signalHandler(int signal) {
        receivedSignalNum = signal;
        signalReceived = 1;
    }

    CoalescerConfig coalescerConfig(const BridgeConfig& config) {
        CoalescerConfig result;
        result.debounce = config.debounce;
        result.maxDelay = config.maxDelay;
        return result;
    }

    SessionOptions sessionOptions(const BridgeConfig& config) {
        SessionOptions result;
        result.recursive = config.recursive;
        if (config.waitTimeout.count() > 0) {
            result.waitTimeout = config.waitTimeout;
        }
        return result;
    }
}

BridgeCore::BridgeCore(const BridgeConfig& config, std::unique_ptr<IEventSource> source,
                       int inputFd, std::ostream& output)
    : config_(config),
      source_(std::move(source)),
      coalescer_(coalescerConfig(config)),
      writer_(output),
      registry_(*source_),
      session_(registry_, coalescer_, writer_, sessionOptions(config)),
      inputFd_(inputFd)
{
}

BridgeCore::~BridgeCore() {
    shutdown();
}

bool BridgeCore::initialize() {
    auto& logger = Logger::instance();
    logger.info("WatchBridge initializing...", "BridgeCore");

    printConfiguration();

    bool ok = source_->initialize(
        [this](const RawEvent& event) { onRawEvent(event); },
        [this](const Error& error) { onSourceFailure(error); });
    if (!ok) {
        logger.error("Failed to initialize " + source_->getName() + " event source", "BridgeCore");
        return false;
    }

    logger.info("Bridge initialization complete", "BridgeCore");
    return true;
}

ExitCode BridgeCore::run() {
    auto& logger = Logger::instance();

    // Setup signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    // A vanished host must surface as a write error, not kill us
    std::signal(SIGPIPE, SIG_IGN);

    running_ = true;

    ExitCode code = ExitCode::Clean;
    if (!session_.begin()) {
        logger.error("Could not send protocol version", "BridgeCore");
        shutdown();
        return ExitCode::IOFailure;
    }

    ProtocolReader reader(inputFd_, [this]() { return shouldStop(); },
                          std::chrono::milliseconds(wb::config::INPUT_POLL_INTERVAL_MS));

    std::string line;
    for (;;) {
        auto status = reader.readLine(line);

        if (status == ProtocolReader::Status::Line) {
            auto exit = session_.handleLine(line);
            if (exit) {
                code = *exit;
                break;
            }
            continue;
        }

        if (status == ProtocolReader::Status::EndOfStream) {
            logger.info("Command stream closed", "BridgeCore");
            code = ExitCode::Clean;
        } else if (status == ProtocolReader::Status::Error) {
            logger.error("Failed to read command stream: " + reader.lastError(), "BridgeCore");
            code = ExitCode::IOFailure;
        } else {
            code = interruptedExitCode();
        }
        break;
    }

    shutdown();

    logger.info(std::string("Bridge exiting: ") + exitCodeName(code), "BridgeCore");
    return code;
}

void BridgeCore::shutdown() {
    if (stopped_.exchange(true)) return;

    auto& logger = Logger::instance();
    logger.info("Shutting down bridge...", "BridgeCore");

    running_ = false;

    // Shutdown in reverse order of initialization
    session_.shutdown();
    registry_.clear();
    source_->shutdown();

    LOG_DEBUG_COMP_IF("Event source holds " + std::to_string(source_->getSubscriptionCount()) +
                      " subscriptions after shutdown", "BridgeCore");
    logger.info("Bridge stopped", "BridgeCore");
}

bool BridgeCore::shouldStop() const {
    return signalReceived || sourceFailed_ || writer_.failed();
}

ExitCode BridgeCore::interruptedExitCode() {
    auto& logger = Logger::instance();

    if (sourceFailed_) {
        Error error;
        {
            std::lock_guard<std::mutex> lock(failureMutex_);
            error = sourceError_;
        }
        logger.critical("Event source failed: " + error.message, "BridgeCore");
        session_.failAllRoots(error);
        return ExitCode::EventSourceFailure;
    }

    if (writer_.failed()) {
        logger.error("Response stream is gone", "BridgeCore");
        return ExitCode::IOFailure;
    }

    // Log which signal was received (safe now, outside signal handler)
    int sigNum = receivedSignalNum;
    logger.info("Received signal " + std::to_string(sigNum) + ", initiating shutdown", "BridgeCore");
    return ExitCode::Terminated;
}

void BridgeCore::printConfiguration() const {
    auto& logger = Logger::instance();
    logger.info("Configuration:", "BridgeCore");
    logger.info("  Event source: " + source_->getName(), "BridgeCore");
    logger.info("  Debounce: " + std::to_string(config_.debounce.count()) + " ms", "BridgeCore");
    logger.info("  Max delay: " + std::to_string(config_.maxDelay.count()) + " ms", "BridgeCore");
    logger.info("  Wait timeout: " +
                (config_.waitTimeout.count() > 0 ? std::to_string(config_.waitTimeout.count()) + " ms"
                                                  : std::string("unbounded")), "BridgeCore");
    logger.info(std::string("  Recursive: ") + (config_.recursive ? "yes" : "no"), "BridgeCore");
}

} // namespace WatchBridge
