#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon logger interfaces for categorized,
///        structured logging from the AI core.
///
/// Provides category-based filtering, structured context and per-category
/// runtime log levels.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "dai/foundation/game_result.hpp"
#include "dai/foundation/types.hpp"

namespace dai::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per subsystem of the core.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Library lifecycle
    Config      = 1, ///< Tuning and YAML loading
    AI          = 2, ///< Controllers and the AI system driver
    Alertness   = 3, ///< Alert level transitions
    Navigation  = 4, ///< Navigation mesh ingest
    Pathfinding = 5, ///< A* / Dijkstra queries
    Harness     = 6  ///< Interactive path test harness
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Config", "AI", "Alertness", "Navigation", "Pathfinding", "Harness"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
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

/// Parse a level name as written in tuning files ("debug", "warn", ...).
/// Matching is case-insensitive; "warn" is accepted for Warning.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

class ConfigManager;

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = EntityId(42);
///   ctx.extra["level"] = "High";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Alertness,
///                         "Alert level raised", ctx);
/// @endcode
struct LogContext {
    std::optional<EntityId> entityId;
    std::optional<uint32_t> cellId;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logging interfaces.
///
/// Uses PIMPL to keep kcenon headers out of the public API. Each category
/// resolves a named logger ("dai.<Category>") from the global registry and
/// falls back to the registry's default logger.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Config      | Info          |
/// | AI          | Info          |
/// | Alertness   | Debug         |
/// | Navigation  | Info          |
/// | Pathfinding | Info          |
/// | Harness     | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    // Non-copyable, movable.
    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key-value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Apply "logging.<category>" levels from @p config, e.g.
    /// @code
    ///   logging:
    ///     alertness: info
    ///     pathfinding: debug
    /// @endcode
    /// Categories without a key keep their level.
    /// @return ConfigTypeMismatch naming the first unparseable level; the
    ///         remaining categories are still applied.
    GameResult<void> applyConfig(const ConfigManager& config);

    /// Flush the default logger.
    GameResult<void> flush();

    /// Process-wide instance used by the DAI_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dai::foundation

// ---------------------------------------------------------------------------
// Convenience macros (outside the namespace; macros are global)
// ---------------------------------------------------------------------------

/// @name DAI_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// DAI_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef DAI_MIN_LOG_LEVEL
    #define DAI_MIN_LOG_LEVEL 0
#endif

#define DAI_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= DAI_MIN_LOG_LEVEL &&                      \
            ::dai::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::dai::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define DAI_LOG_DEBUG(cat, msg) \
    DAI_LOG(::dai::foundation::LogLevel::Debug, (cat), (msg))

#define DAI_LOG_INFO(cat, msg) \
    DAI_LOG(::dai::foundation::LogLevel::Info, (cat), (msg))

#define DAI_LOG_WARN(cat, msg) \
    DAI_LOG(::dai::foundation::LogLevel::Warning, (cat), (msg))

#define DAI_LOG_ERROR(cat, msg) \
    DAI_LOG(::dai::foundation::LogLevel::Error, (cat), (msg))

/// @}
