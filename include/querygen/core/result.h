#ifndef QUERYGEN_CORE_RESULT_H_
#define QUERYGEN_CORE_RESULT_H_

#include <string>
#include <optional>
#include <stdexcept>

namespace querygen {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * Usage:
 * ```
 * Result<Duration> ParseDuration(const std::string& text) {
 *     if (text.empty()) {
 *         return Result<Duration>::error("empty duration");
 *     }
 *     return Result<Duration>(Duration(0));
 * }
 *
 * auto result = ParseDuration("90s");
 * if (result.ok()) {
 *     Duration value = result.value();
 * } else {
 *     std::string error = result.error();
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_msg_(std::nullopt) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, ErrorTag) : value_(), error_msg_(std::move(error_msg)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_msg_(std::move(other.error_msg_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_msg_ = std::move(other.error_msg_);
        }
        return *this;
    }

    // Move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    const T& value() const { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(const std::string& message) {
        return Result<T>(message, ErrorTag{});
    }

private:
    T value_;
    std::optional<std::string> error_msg_;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() : error_msg_(std::nullopt) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, ErrorTag) : error_msg_(std::move(error_msg)) {}

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }

    static Result<void> error(const std::string& message) {
        return Result<void>(message, ErrorTag{});
    }

private:
    std::optional<std::string> error_msg_;
};

} // namespace core
} // namespace querygen

#endif // QUERYGEN_CORE_RESULT_H_
