#include "InotifyEventSource.h"
#include "Constants.h"
#include "ErrorCodes.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include <sys/inotify.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>

namespace WatchBridge {

namespace {
    constexpr uint32_t WATCH_MASK = IN_CREATE | IN_DELETE | IN_MODIFY | IN_MOVED_FROM | IN_MOVED_TO |
                                    IN_CLOSE_WRITE | IN_ATTRIB | IN_DELETE_SELF | IN_MOVE_SELF |
                                    IN_ONLYDIR | IN_DONT_FOLLOW | IN_EXCL_UNLINK;

    constexpr size_t EVENT_BUFFER_SIZE = 64 * (sizeof(struct inotify_event) + NAME_MAX + 1);

    ErrorCode subscribeErrorCode(int err) {
        switch (err) {
            case ENOENT: return ErrorCode::NOT_FOUND;
            case EACCES: return ErrorCode::PERMISSION_DENIED;
            case ENOTDIR: return ErrorCode::NOT_A_DIRECTORY;
            case ENOSPC:
            case EMFILE: return ErrorCode::SUBSCRIPTION_LIMIT;
            default: return ErrorCode::SUBSCRIBE_FAILED;
        }
    }
}

InotifyEventSource::InotifyEventSource(InotifyOptions options)
    : options_(options) {
}

InotifyEventSource::~InotifyEventSource() {
    shutdown();
}

std::chrono::milliseconds InotifyEventSource::retryBackoff(std::chrono::milliseconds base, int failures) {
    const int doublings = std::min(std::max(failures - 1, 0), wb::config::MAX_READ_RETRY_DOUBLINGS);
    return base * (int64_t{1} << doublings);
}

bool InotifyEventSource::initialize(EventCallback onEvent, FailureCallback onFailure) {
    auto& logger = Logger::instance();

    onEvent_ = std::move(onEvent);
    onFailure_ = std::move(onFailure);

    inotifyFd_.reset(inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
    if (!inotifyFd_) {
        logger.log(LogLevel::ERROR, "Failed to initialize inotify: " + std::string(strerror(errno)), "Inotify");
        return false;
    }

    running_ = true;
    monitorThread_ = std::thread(&InotifyEventSource::monitorLoop, this);

    logger.log(LogLevel::DEBUG, "inotify event source initialized", "Inotify");
    return true;
}

void InotifyEventSource::shutdown() {
    running_ = false;

    if (monitorThread_.joinable()) {
        monitorThread_.join();
    }

    size_t released = 0;
    {
        std::lock_guard<std::mutex> lock(watchMutex_);
        for (const auto& [wd, entry] : watches_) {
            if (inotifyFd_ && inotify_rm_watch(inotifyFd_.get(), wd) == 0) {
                ++released;
            }
        }
        watches_.clear();
    }

    if (inotifyFd_) {
        inotifyFd_.reset();
        LOG_DEBUG_COMP_IF("inotify event source shut down, released " +
                          std::to_string(released) + " leftover watches", "Inotify");
    }
}

Result<SubscriptionHandle> InotifyEventSource::subscribe(const std::string& directory) {
    if (!inotifyFd_) {
        return ErrorRegistry::createError(ErrorCode::EVENT_SOURCE_FAILED, "inotify is not initialized", "Inotify");
    }

    std::lock_guard<std::mutex> lock(watchMutex_);

    int wd = inotify_add_watch(inotifyFd_.get(), directory.c_str(), WATCH_MASK);
    if (wd < 0) {
        int err = errno;
        return ErrorRegistry::createError(subscribeErrorCode(err), directory + " (" + strerror(err) + ")", "Inotify");
    }

    auto& entry = watches_[wd];
    if (entry.refs == 0) {
        entry.path = directory;
    }
    ++entry.refs;
    return wd;
}

VoidResult InotifyEventSource::unsubscribe(SubscriptionHandle handle) {
    std::lock_guard<std::mutex> lock(watchMutex_);

    auto it = watches_.find(handle);
    if (it == watches_.end()) {
        return ErrorRegistry::createError(ErrorCode::UNSUBSCRIBE_FAILED,
                                          "watch " + std::to_string(handle) + " already released", "Inotify");
    }

    if (--it->second.refs > 0) {
        return Ok();
    }

    std::string path = it->second.path;
    watches_.erase(it);

    if (inotify_rm_watch(inotifyFd_.get(), handle) < 0) {
        int err = errno;
        // EINVAL: the kernel dropped the watch already (directory gone)
        if (err == EINVAL) {
            return Ok();
        }
        return ErrorRegistry::createError(ErrorCode::UNSUBSCRIBE_FAILED, path + " (" + strerror(err) + ")", "Inotify");
    }
    return Ok();
}

size_t InotifyEventSource::getSubscriptionCount() const {
    std::lock_guard<std::mutex> lock(watchMutex_);
    return watches_.size();
}

bool InotifyEventSource::lookupPath(int wd, std::string& path) const {
    std::lock_guard<std::mutex> lock(watchMutex_);
    auto it = watches_.find(wd);
    if (it == watches_.end()) {
        return false;
    }
    path = it->second.path;
    return true;
}

void InotifyEventSource::forget(int wd) {
    std::lock_guard<std::mutex> lock(watchMutex_);
    watches_.erase(wd);
}

void InotifyEventSource::monitorLoop() {
    alignas(struct inotify_event) char buffer[EVENT_BUFFER_SIZE];
    int failures = 0;

    while (running_) {
        struct pollfd pfd = { inotifyFd_.get(), POLLIN, 0 };
        int ret = poll(&pfd, 1, static_cast<int>(options_.pollInterval.count()));

        if (ret == 0) continue;  // Timeout

        if (ret < 0 && errno == EINTR) continue;

        if (ret < 0 || (pfd.revents & (POLLERR | POLLNVAL))) {
            if (!readBatch(nullptr, 0, failures)) break;
            continue;
        }

        if (!readBatch(buffer, sizeof(buffer), failures)) break;
    }
}

// Returns false once retries are exhausted and the failure was reported.
bool InotifyEventSource::readBatch(char* buffer, size_t size, int& failures) {
    auto& logger = Logger::instance();

    ssize_t len = -1;
    int err = EIO;
    if (buffer) {
        len = read(inotifyFd_.get(), buffer, size);
        err = errno;
        if (len < 0 && (err == EAGAIN || err == EWOULDBLOCK || err == EINTR)) {
            return true;
        }
    }

    if (len <= 0) {
        ++failures;
        std::string reason = len == 0 ? "short read" : strerror(err);
        if (failures >= options_.readRetryAttempts) {
            logger.log(LogLevel::ERROR, "inotify read failed " + std::to_string(failures) +
                       " times, giving up: " + reason, "Inotify");
            running_ = false;
            if (onFailure_) {
                onFailure_(ErrorRegistry::createError(ErrorCode::EVENT_SOURCE_FAILED, reason, "Inotify"));
            }
            return false;
        }

        auto backoff = retryBackoff(options_.readRetryBackoff, failures);
        logger.log(LogLevel::WARN, "inotify read failed (" + reason + "), retrying in " +
                   std::to_string(backoff.count()) + "ms", "Inotify");
        std::this_thread::sleep_for(backoff);
        return true;
    }

    failures = 0;

    size_t i = 0;
    while (i < static_cast<size_t>(len)) {
        const auto* event = reinterpret_cast<const struct inotify_event*>(&buffer[i]);
        dispatch(event);
        i += sizeof(struct inotify_event) + event->len;
    }
    return true;
}

void InotifyEventSource::dispatch(const struct inotify_event* event) {
    if (event->mask & IN_Q_OVERFLOW) {
        LOG_WARN_COMP("inotify queue overflow, events were lost", "Inotify");
        RawEvent overflow;
        overflow.kind = RawEventKind::Overflow;
        if (onEvent_) onEvent_(overflow);
        return;
    }

    std::string dirPath;
    if (!lookupPath(event->wd, dirPath)) {
        return;  // Released by us; late events are irrelevant
    }

    RawEvent ev;
    ev.handle = event->wd;

    if (event->mask & IN_IGNORED) {
        forget(event->wd);
        ev.kind = RawEventKind::SubscriptionLost;
        ev.path = dirPath;
        ev.isDirectory = true;
        ev.isSelf = true;
        if (onEvent_) onEvent_(ev);
        return;
    }

    // event->name is NUL padded; len counts the padding
    std::string name = event->len > 0 ? std::string(event->name) : std::string();
    if (name.empty()) {
        ev.isSelf = true;
        ev.isDirectory = true;
        ev.path = dirPath;
    } else {
        ev.name = name;
        ev.path = dirPath + "/" + name;
        ev.isDirectory = (event->mask & IN_ISDIR) != 0;
    }

    if (event->mask & IN_CREATE) {
        ev.kind = RawEventKind::Created;
    } else if (event->mask & IN_DELETE) {
        ev.kind = RawEventKind::Removed;
    } else if (event->mask & IN_MOVED_FROM) {
        ev.kind = RawEventKind::RenamedFrom;
    } else if (event->mask & IN_MOVED_TO) {
        ev.kind = RawEventKind::RenamedTo;
    } else if (event->mask & (IN_MODIFY | IN_CLOSE_WRITE | IN_ATTRIB)) {
        ev.kind = RawEventKind::Modified;
    } else if (event->mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_UNMOUNT)) {
        ev.kind = RawEventKind::Removed;
    } else {
        ev.kind = RawEventKind::Unknown;
    }

    LOG_DEBUG_COMP_IF(std::string(rawEventKindName(ev.kind)) + " " + ev.path +
                      (ev.isDirectory ? " (dir)" : ""), "Inotify");

    if (onEvent_) {
        onEvent_(ev);
    }
}

} // namespace WatchBridge
