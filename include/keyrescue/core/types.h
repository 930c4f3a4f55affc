#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace keyrescue {

using CommitHash = std::string;
using TimePoint = std::chrono::system_clock::time_point;

enum class ErrorCode {
    Success = 0,
    NotFound,
    NotInitialized,
    Timeout,
    OperationCancelled,
    OperationInProgress,
    ResourceExhausted,
    ProcessFailed,
    WriteError,
};

constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::OperationInProgress: return "Operation in progress";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::ProcessFailed: return "Process failed";
        case ErrorCode::WriteError: return "Write error";
    }
    return "Unknown error";
}

/// Failure code plus a human-readable message naming the cause.
struct Error {
    ErrorCode code{ErrorCode::Success};
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}
};

/**
 * @brief Value or Error.
 *
 * Accessing the wrong alternative throws std::runtime_error; callers check
 * has_value() (or the bool conversion) first.
 */
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        requireValue();
        return std::get<T>(data_);
    }

    T&& value() && {
        requireValue();
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result holds a value, not an error");
        }
        return std::get<Error>(data_);
    }

private:
    void requireValue() const {
        if (!has_value()) {
            throw std::runtime_error("Result holds an error: " + std::get<Error>(data_).message);
        }
    }

    std::variant<T, Error> data_;
};

template <> class Result<void> {
public:
    Result() = default;
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result holds an error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result holds a value, not an error");
        }
        return error_;
    }

private:
    Error error_;
};

} // namespace keyrescue

template <> struct fmt::formatter<keyrescue::ErrorCode> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(keyrescue::ErrorCode error, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(keyrescue::errorToString(error), ctx);
    }
};
