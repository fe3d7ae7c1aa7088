#pragma once

/**
 * @file Result.h
 * @brief Value-or-error return type used across WatchBridge module boundaries
 *
 * Watch and protocol failures are expected outcomes (a replica path vanished,
 * the watch limit was hit), so they travel as values instead of exceptions.
 *
 * Usage:
 *   Result<SubscriptionHandle> r = source.subscribe(dir);
 *   if (!r) {
 *       LOG_WARN_COMP(r.error().toString(), "WatchRegistry");
 *       return r.error();
 *   }
 *   use(r.value());
 */

#include <variant>
#include <string>
#include <stdexcept>
#include <functional>
#include <utility>

namespace WatchBridge {

/**
 * @brief Error payload: human readable message plus an ErrorCode value
 */
struct Error {
    std::string message;
    int code{0};
    std::string component;

    Error() = default;
    Error(std::string msg, int c = 0, std::string comp = "")
        : message(std::move(msg)), code(c), component(std::move(comp)) {}

    std::string toString() const {
        std::string result = message;
        if (!component.empty()) {
            result = "[" + component + "] " + result;
        }
        if (code != 0) {
            result += " (code: " + std::to_string(code) + ")";
        }
        return result;
    }
};

template<typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<T>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    explicit operator bool() const { return isOk(); }

    T& value() {
        if (isError()) {
            throw std::logic_error("Called value() on Error result: " +
                std::get<E>(data_).toString());
        }
        return std::get<T>(data_);
    }

    const T& value() const {
        if (isError()) {
            throw std::logic_error("Called value() on Error result: " +
                std::get<E>(data_).toString());
        }
        return std::get<T>(data_);
    }

    E& error() {
        if (isOk()) {
            throw std::logic_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    const E& error() const {
        if (isOk()) {
            throw std::logic_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    T valueOr(const T& defaultValue) const {
        return isOk() ? std::get<T>(data_) : defaultValue;
    }

    Result& onError(const std::function<void(const E&)>& callback) {
        if (isError()) {
            callback(error());
        }
        return *this;
    }

private:
    std::variant<T, E> data_;
};

// Specialization for operations with no value, only success/error
template<typename E>
class Result<void, E> {
public:
    Result() : data_(OkType{}) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<OkType>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    explicit operator bool() const { return isOk(); }

    E& error() {
        if (isOk()) {
            throw std::logic_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    const E& error() const {
        if (isOk()) {
            throw std::logic_error("Called error() on Ok result");
        }
        return std::get<E>(data_);
    }

    Result& onError(const std::function<void(const E&)>& callback) {
        if (isError()) {
            callback(error());
        }
        return *this;
    }

private:
    struct OkType {};
    std::variant<OkType, E> data_;
};

using VoidResult = Result<void, Error>;

inline VoidResult Ok() {
    return VoidResult();
}

} // namespace WatchBridge
