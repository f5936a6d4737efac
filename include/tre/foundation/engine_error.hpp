#pragma once

/// @file engine_error.hpp
/// @brief Engine error type used with Result<T, EngineError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "tre/foundation/error_code.hpp"

namespace tre::foundation {

/// Error carrying a categorized code, a human-readable message and
/// optional type-erased context (e.g. the offending SplitConfig).
class EngineError {
public:
    EngineError() = default;

    explicit EngineError(ErrorCode code)
        : code_(code) {}

    EngineError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    EngineError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr on type mismatch or when empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// True for errors that abort a run before any match is processed.
    [[nodiscard]] bool isConfigurationError() const noexcept {
        return foundation::isConfigurationError(code_);
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace tre::foundation
