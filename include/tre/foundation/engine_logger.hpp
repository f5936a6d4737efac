#pragma once

/// @file engine_logger.hpp
/// @brief EngineLogger wrapping kcenon common_system logging for the rating engine.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tre/foundation/engine_result.hpp"
#include "tre/foundation/types.hpp"

namespace tre::foundation {

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

/// Log categories, one per pipeline stage.
enum class LogCategory : uint8_t {
    Core       = 0, ///< Run lifecycle
    Feed       = 1, ///< Match ingestion and data quality
    Rating     = 2, ///< Per-match rating updates
    Evaluation = 3, ///< Held-out prediction scoring
    Export     = 4, ///< Output artifacts
    Config     = 5  ///< Configuration loading and validation
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Feed", "Rating", "Evaluation", "Export", "Config"
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

/// Parse a level name as written in config ("debug", "WARNING", ...).
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.playerId = PlayerId(42);
///   ctx.matchDate = "2019-03-11";
///   ctx.extra["reason"] = "missing score";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Feed,
///                         "Neutral margin applied", ctx);
/// @endcode
struct LogContext {
    std::optional<PlayerId> playerId;
    std::optional<std::string> matchDate;
    std::optional<std::string> runId;
    std::unordered_map<std::string, std::string> extra;
};

/// Rating engine logger wrapping kcenon's logger registry.
///
/// Uses PIMPL to keep kcenon headers out of the public API.
///
/// Default log levels per category:
/// | Category   | Default Level |
/// |------------|---------------|
/// | Core       | Info          |
/// | Feed       | Info          |
/// | Rating     | Info          |
/// | Evaluation | Info          |
/// | Export     | Info          |
/// | Config     | Info          |
///
/// Per-match rating traces are emitted at Debug under Rating, so they stay
/// silent until that category is lowered.
class EngineLogger {
public:
    EngineLogger();
    ~EngineLogger();

    EngineLogger(const EngineLogger&) = delete;
    EngineLogger& operator=(const EngineLogger&) = delete;
    EngineLogger(EngineLogger&&) noexcept;
    EngineLogger& operator=(EngineLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with context fields appended as "{key=val, ...}".
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply the same minimum level to every category.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the registry's default logger.
    EngineResult<void> flush();

    /// Process-wide logger used by the TRE_LOG macros.
    static EngineLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tre::foundation

/// @name TRE_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// TRE_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef TRE_MIN_LOG_LEVEL
    #define TRE_MIN_LOG_LEVEL 0
#endif

#define TRE_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= TRE_MIN_LOG_LEVEL &&                      \
            ::tre::foundation::EngineLogger::instance().isEnabled((level), (cat))) \
        {                                                                        \
            ::tre::foundation::EngineLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define TRE_LOG_DEBUG(cat, msg) \
    TRE_LOG(::tre::foundation::LogLevel::Debug, (cat), (msg))

#define TRE_LOG_INFO(cat, msg) \
    TRE_LOG(::tre::foundation::LogLevel::Info, (cat), (msg))

#define TRE_LOG_WARN(cat, msg) \
    TRE_LOG(::tre::foundation::LogLevel::Warning, (cat), (msg))

#define TRE_LOG_ERROR(cat, msg) \
    TRE_LOG(::tre::foundation::LogLevel::Error, (cat), (msg))

/// @}
