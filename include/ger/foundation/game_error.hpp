#pragma once

/// @file game_error.hpp
/// @brief Error value returned by registry, entity, config and decode calls.
///
/// Registry operations attach the EntityId they were acting on (the entity
/// that was not found, the id that was already issued, the record that broke
/// a manager invariant on decode) so callers can react without parsing the
/// message.  The message is for logs and humans only.

#include <any>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "ger/foundation/error_code.hpp"
#include "ger/foundation/types.hpp"

namespace ger::foundation {

class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @p context is usually the EntityId the failing call was given.
    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// "Registry", "Serialization", "Config", ... from the code's range.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// True when a blob was rejected: malformed bytes, a newer schema, or a
    /// decoded registry that breaks an invariant.
    [[nodiscard]] bool isDecodeFailure() const noexcept {
        return isDecodeError(code_);
    }

    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    /// The entity the error refers to, if one was attached.
    [[nodiscard]] std::optional<EntityId> entityId() const noexcept {
        if (const auto* id = context<EntityId>()) {
            return *id;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace ger::foundation
