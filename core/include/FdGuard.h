#pragma once

/**
 * @file FdGuard.h
 * @brief RAII owner for a POSIX file descriptor
 *
 * Holds the inotify descriptor of the event source and the pipe ends used by
 * tests. Closing happens exactly once, on reset() or destruction.
 */

#include <unistd.h>
#include <utility>

namespace wb {

class FdGuard {
public:
    FdGuard() noexcept : fd_(-1) {}

    explicit FdGuard(int fd) noexcept : fd_(fd) {}

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    FdGuard(FdGuard&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    FdGuard& operator=(FdGuard&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    ~FdGuard() {
        reset();
    }

    int get() const noexcept { return fd_; }

    explicit operator bool() const noexcept { return fd_ >= 0; }

    bool valid() const noexcept { return fd_ >= 0; }

    /// Give up ownership without closing
    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    /// Close the owned descriptor (if any) and adopt a new one
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    void swap(FdGuard& other) noexcept {
        std::swap(fd_, other.fd_);
    }

private:
    int fd_;
};

inline void swap(FdGuard& a, FdGuard& b) noexcept {
    a.swap(b);
}

} // namespace wb
