#pragma once

/// @file duel_error.hpp
/// @brief Engine error type used with Result<T, DuelError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "duel/foundation/error_code.hpp"

namespace duel::foundation {

/// Error code, human-readable message and optional typed context.
///
/// Configuration errors carry the offending dotted key as context
/// (a std::string), so callers can point at the bad line of a config file.
class DuelError {
public:
    DuelError() = default;

    explicit DuelError(ErrorCode code)
        : code_(code) {}

    DuelError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    DuelError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr if empty or of another type).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// True for the two persistence codes.
    [[nodiscard]] bool isPersistenceFailure() const noexcept {
        return errorSubsystem(code_) == "Persistence";
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace duel::foundation
