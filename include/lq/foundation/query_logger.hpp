#pragma once

/// @file query_logger.hpp
/// @brief QueryLogger wrapping kcenon common_system logging interfaces.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control for the library's
/// subsystems.

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "lq/foundation/query_result.hpp"

namespace lq::foundation {

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

/// Library log categories, one per subsystem.
enum class LogCategory : uint8_t {
    Core   = 0, ///< Values, config, library setup
    Object = 1, ///< Class creation and instantiation
    Source = 2, ///< Source adapters
    Query  = 3  ///< Lazy and terminal query operators
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 4;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Object", "Source", "Query"
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

/// Parse a case-insensitive level name ("trace", "Warning", "OFF", ...).
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.operation = "toMapping";
///   ctx.itemIndex = 3;
///   ctx.extra["kind"] = "integer";
///   logger.logWithContext(LogLevel::Trace, LogCategory::Query,
///                         "Skipped non-pair item", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> operation;
    std::optional<std::size_t> itemIndex;
    std::unordered_map<std::string, std::string> extra;
};

/// Library logger wrapping kcenon's logging interfaces.
///
/// Messages are routed to the logger registered as "lq.<Category>" in
/// kcenon's GlobalLoggerRegistry, falling back to the registry's default
/// logger.  With nothing registered every call is a no-op.  Uses PIMPL
/// to hide kcenon types from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Object   | Info          |
/// | Source   | Warning       |
/// | Query    | Warning       |
class QueryLogger {
public:
    QueryLogger();
    ~QueryLogger();

    // Non-copyable, movable.
    QueryLogger(const QueryLogger&) = delete;
    QueryLogger& operator=(const QueryLogger&) = delete;
    QueryLogger(QueryLogger&&) noexcept;
    QueryLogger& operator=(QueryLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    QueryResult<void> flush();

    /// Get the global QueryLogger singleton instance.
    static QueryLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lq::foundation

// ---------------------------------------------------------------------------
// Convenience macros (outside the namespace: macros are global)
// ---------------------------------------------------------------------------

/// @name LQ_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// LQ_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
///
/// The message expression is only evaluated when the level is enabled,
/// so it may build strings freely.
/// @{

#ifndef LQ_MIN_LOG_LEVEL
    #define LQ_MIN_LOG_LEVEL 0
#endif

#define LQ_LOG(level, cat, msg)                                                  \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= LQ_MIN_LOG_LEVEL &&                       \
            ::lq::foundation::QueryLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::lq::foundation::QueryLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define LQ_LOG_TRACE(cat, msg) \
    LQ_LOG(::lq::foundation::LogLevel::Trace, (cat), (msg))

#define LQ_LOG_DEBUG(cat, msg) \
    LQ_LOG(::lq::foundation::LogLevel::Debug, (cat), (msg))

#define LQ_LOG_INFO(cat, msg) \
    LQ_LOG(::lq::foundation::LogLevel::Info, (cat), (msg))

#define LQ_LOG_WARN(cat, msg) \
    LQ_LOG(::lq::foundation::LogLevel::Warning, (cat), (msg))

#define LQ_LOG_ERROR(cat, msg) \
    LQ_LOG(::lq::foundation::LogLevel::Error, (cat), (msg))

/// @}
