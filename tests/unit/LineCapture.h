#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <ostream>
#include <streambuf>
#include <string>
#include <vector>

namespace WatchBridge {

/**
 * @brief Thread-safe ostream sink that splits output into lines
 *
 * The response stream is written from the protocol thread and the notifier
 * thread; tests pop complete lines from here with a timeout.
 */
class LineCapture : private std::streambuf, public std::ostream {
public:
    LineCapture() : std::ostream(static_cast<std::streambuf*>(this)) {}

    std::optional<std::string> next(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !lines_.empty(); })) {
            return std::nullopt;
        }
        std::string line = lines_.front();
        lines_.pop_front();
        return line;
    }

    /// Lines written so far and not yet taken with next()
    std::vector<std::string> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result(lines_.begin(), lines_.end());
        lines_.clear();
        return result;
    }

    bool quietFor(std::chrono::milliseconds period) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, period, [this]() { return !lines_.empty(); });
    }

private:
    // Declared by both bases
    using int_type = std::streambuf::int_type;
    using traits_type = std::streambuf::traits_type;

    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (traits_type::to_char_type(ch) == '\n') {
            lines_.push_back(partial_);
            partial_.clear();
            cv_.notify_all();
        } else {
            partial_ += traits_type::to_char_type(ch);
        }
        return ch;
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::string partial_;
    std::deque<std::string> lines_;
};

} // namespace WatchBridge
