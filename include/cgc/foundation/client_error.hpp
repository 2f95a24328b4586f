#pragma once

/// @file client_error.hpp
/// @brief Client-specific error type used with Result<T, ClientError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "cgc/foundation/error_code.hpp"

namespace cgc::foundation {

/// Rich error type carrying an error code, human-readable message,
/// and optional type-erased context data for debugging.
class ClientError {
public:
    ClientError() = default;

    explicit ClientError(ErrorCode code)
        : code_(code) {}

    ClientError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ClientError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Failure kind driving retry / teardown decisions.
    [[nodiscard]] ErrorKind kind() const noexcept { return classifyError(code_); }

    /// True when the error only reports a cooperative cancellation.
    [[nodiscard]] bool isCancellation() const noexcept {
        return kind() == ErrorKind::Cancellation;
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    /// Check whether this error carries context data.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// "Subsystem: message" form used for OnError notifications.
    [[nodiscard]] std::string describe() const {
        std::string out(subsystem());
        out += ": ";
        out += message_;
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace cgc::foundation
