#pragma once

/// @file game_error.hpp
/// @brief Error type used with Result<T, GameError> throughout the core.

#include <any>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "dai/foundation/error_code.hpp"
#include "dai/foundation/types.hpp"

namespace dai::foundation {

/// Error raised by graph validation, controller registration and config
/// lookups.
///
/// The context slot identifies the offending input: the table index of a
/// rejected cell or link, or the EntityId a controller call named.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }

    /// Typed context data, or nullptr on type mismatch or when empty.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// Index of the rejected navigation record, when the context holds one.
    [[nodiscard]] std::optional<std::size_t> recordIndex() const noexcept {
        if (const auto* index = context<std::size_t>()) {
            return *index;
        }
        return std::nullopt;
    }

    /// Entity the failed call named, when the context holds one.
    [[nodiscard]] std::optional<EntityId> entity() const noexcept {
        if (const auto* id = context<EntityId>()) {
            return *id;
        }
        return std::nullopt;
    }

    /// "<subsystem>: <message>"
    [[nodiscard]] std::string describe() const {
        return std::string(subsystem()) + ": " + message_;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

}  // namespace dai::foundation
