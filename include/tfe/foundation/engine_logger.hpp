#pragma once

/// @file engine_logger.hpp
/// @brief EngineLogger wrapping the kcenon logger registry for category logging.
///
/// Provides category-based filtering, structured logging with match and
/// player context, and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tfe/foundation/engine_result.hpp"
#include "tfe/foundation/types.hpp"

namespace tfe::foundation {

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

/// Engine subsystems used as log categories.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Startup, configuration, tool wiring
    Ingest      = 1, ///< Record parsing and dropped rows
    Ranking     = 2, ///< Ranking history loading and lookup
    Rating      = 3, ///< Elo updates
    Features    = 4, ///< Feature assembly
    Replay      = 5, ///< Chronological pass
    Live        = 6, ///< Live queries and snapshot publication
    Persistence = 7  ///< Feature table output
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Ingest", "Ranking", "Rating", "Features", "Replay", "Live", "Persistence"
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

/// Structured context appended to a log line as key=value pairs.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.matchId = "2019-560-127";
///   ctx.extra["reason"] = "unparseable date";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Ingest,
///                         "Dropped match record", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> matchId;
    std::optional<PlayerId> playerId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category logger on top of kcenon's GlobalLoggerRegistry.
///
/// Each category resolves a named logger "tfe.<Category>" and falls back
/// to the registry's default logger. PIMPL keeps kcenon headers out of the
/// public API.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Ingest      | Info          |
/// | Ranking     | Info          |
/// | Rating      | Info          |
/// | Features    | Info          |
/// | Replay      | Info          |
/// | Live        | Info          |
/// | Persistence | Info          |
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

    /// Log a message with structured context data.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    EngineResult<void> flush();

    /// Process-wide logger instance.
    static EngineLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse a level name ("debug", "INFO", ...) as used in configuration.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace tfe::foundation

/// @name TFE_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// TFE_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef TFE_MIN_LOG_LEVEL
    #define TFE_MIN_LOG_LEVEL 0
#endif

#define TFE_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= TFE_MIN_LOG_LEVEL &&                      \
            ::tfe::foundation::EngineLogger::instance().isEnabled((level), (cat))) \
        {                                                                        \
            ::tfe::foundation::EngineLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define TFE_LOG_DEBUG(cat, msg) \
    TFE_LOG(::tfe::foundation::LogLevel::Debug, (cat), (msg))

#define TFE_LOG_INFO(cat, msg) \
    TFE_LOG(::tfe::foundation::LogLevel::Info, (cat), (msg))

#define TFE_LOG_WARN(cat, msg) \
    TFE_LOG(::tfe::foundation::LogLevel::Warning, (cat), (msg))

#define TFE_LOG_ERROR(cat, msg) \
    TFE_LOG(::tfe::foundation::LogLevel::Error, (cat), (msg))

/// @}
