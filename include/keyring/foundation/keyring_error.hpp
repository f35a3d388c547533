#pragma once

/// @file keyring_error.hpp
/// @brief Error type used with Result<T, KeyringError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "keyring/foundation/error_code.hpp"

namespace keyring::foundation {

/// Rich error type carrying an error code, human-readable message,
/// and optional type-erased context data for diagnostics.
///
/// Token validation attaches a token::ValidationFailure as context so
/// callers can tell "no key matched" apart from "signature valid but
/// token expired" without parsing the message.
class KeyringError {
public:
    KeyringError() = default;

    explicit KeyringError(ErrorCode code)
        : code_(code) {}

    KeyringError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    KeyringError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description. Never contains key material.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    /// Check whether this error carries context data.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace keyring::foundation
