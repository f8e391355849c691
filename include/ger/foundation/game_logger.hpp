#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon common_system logger interface.
///
/// Category-based filtering, structured context, and per-category runtime
/// log levels for the registry.

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "ger/foundation/game_result.hpp"
#include "ger/foundation/types.hpp"

namespace ger::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core          = 0, ///< Library-wide messages
    Registry      = 1, ///< EntityManager lifecycle and routing
    Entity        = 2, ///< Per-entity behaviour (events, defeat)
    Serialization = 3, ///< Encoding / decoding of blobs
    Config        = 4  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 5;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Registry", "Entity", "Serialization", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a case-insensitive level name ("debug", "WARN", "warning", ...).
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Parse a case-insensitive category name ("registry", "Entity", ...).
std::optional<LogCategory> parseLogCategory(std::string_view name);

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.managerId = ManagerId(7);
///   ctx.entityId = EntityId(3);
///   ctx.extra["type"] = "player";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Registry,
///                         "Entity added", ctx);
/// @endcode
struct LogContext {
    std::optional<EntityId> entityId;
    std::optional<ManagerId> managerId;
    std::map<std::string, std::string> extra;
};

/// Registry logger on top of kcenon's GlobalLoggerRegistry.
///
/// Each category logs through a named logger ("ger.<Category>") when one
/// is registered, otherwise through the registry's default logger.
///
/// Default levels:
/// | Category      | Default Level |
/// |---------------|---------------|
/// | Core          | Info          |
/// | Registry      | Info          |
/// | Entity        | Debug         |
/// | Serialization | Info          |
/// | Config        | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message followed by its context as "{key=val, ...}".
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    GameResult<void> flush();

    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ger::foundation

/// @name GER_LOG Macros
/// GER_MIN_LOG_LEVEL can be defined before including this header to
/// compile out calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef GER_MIN_LOG_LEVEL
    #define GER_MIN_LOG_LEVEL 0
#endif

#define GER_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= GER_MIN_LOG_LEVEL &&                      \
            ::ger::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::ger::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define GER_LOG_CTX(level, cat, msg, ctx)                                        \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= GER_MIN_LOG_LEVEL &&                      \
            ::ger::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::ger::foundation::GameLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                   \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define GER_LOG_DEBUG(cat, msg) \
    GER_LOG(::ger::foundation::LogLevel::Debug, (cat), (msg))

#define GER_LOG_INFO(cat, msg) \
    GER_LOG(::ger::foundation::LogLevel::Info, (cat), (msg))

#define GER_LOG_WARN(cat, msg) \
    GER_LOG(::ger::foundation::LogLevel::Warning, (cat), (msg))

#define GER_LOG_ERROR(cat, msg) \
    GER_LOG(::ger::foundation::LogLevel::Error, (cat), (msg))

/// @}
