#pragma once

/// @file client_logger.hpp
/// @brief ClientLogger wrapping kcenon logger_system for structured,
///        category-filtered logging of the network client core.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "cgc/foundation/client_result.hpp"

namespace cgc::foundation {

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

/// Client subsystems used as log categories.
enum class LogCategory : uint8_t {
    Core       = 0, ///< Process-level setup and teardown
    Connection = 1, ///< ConnectionClient state machine
    Transport  = 2, ///< Socket / channel level I/O
    Codec      = 3, ///< Framing and compression
    Health     = 4, ///< Keepalive and probes
    Reconnect  = 5, ///< Reconnect supervision
    Scope      = 6, ///< Cancellation scopes and tracked operations
    Events     = 7  ///< Event delivery to application handlers
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 8;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Connection", "Transport", "Codec",
        "Health", "Reconnect", "Scope", "Events"
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

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.endpoint = "10.0.0.4:4000";
///   ctx.attempt = 2;
///   logger.logWithContext(LogLevel::Warning, LogCategory::Connection,
///                         "connect attempt failed", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> endpoint;
    std::optional<uint32_t> attempt;
    std::optional<uint32_t> sequence;
    std::optional<std::string> operation;
    std::unordered_map<std::string, std::string> extra;
};

/// Client logger wrapping kcenon's logging system.
///
/// Category-based filtering, structured context and per-category runtime
/// levels. Uses PIMPL to keep kcenon headers out of the public API.
///
/// Default log levels per category:
/// | Category   | Default Level |
/// |------------|---------------|
/// | Core       | Info          |
/// | Connection | Info          |
/// | Transport  | Info          |
/// | Codec      | Warning       |
/// | Health     | Info          |
/// | Reconnect  | Info          |
/// | Scope      | Debug         |
/// | Events     | Warning       |
class ClientLogger {
public:
    ClientLogger();
    ~ClientLogger();

    // Non-copyable, movable.
    ClientLogger(const ClientLogger&) = delete;
    ClientLogger& operator=(const ClientLogger&) = delete;
    ClientLogger(ClientLogger&&) noexcept;
    ClientLogger& operator=(ClientLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    ClientResult<void> flush();

    /// Process-wide logger used by the CGC_LOG macros.
    static ClientLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cgc::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// @name CGC_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// CGC_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef CGC_MIN_LOG_LEVEL
    #define CGC_MIN_LOG_LEVEL 0
#endif

#define CGC_LOG(level, cat, msg)                                                  \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= CGC_MIN_LOG_LEVEL &&                       \
            ::cgc::foundation::ClientLogger::instance().isEnabled((level), (cat))) \
        {                                                                         \
            ::cgc::foundation::ClientLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define CGC_LOG_DEBUG(cat, msg) \
    CGC_LOG(::cgc::foundation::LogLevel::Debug, (cat), (msg))

#define CGC_LOG_INFO(cat, msg) \
    CGC_LOG(::cgc::foundation::LogLevel::Info, (cat), (msg))

#define CGC_LOG_WARN(cat, msg) \
    CGC_LOG(::cgc::foundation::LogLevel::Warning, (cat), (msg))

#define CGC_LOG_ERROR(cat, msg) \
    CGC_LOG(::cgc::foundation::LogLevel::Error, (cat), (msg))

/// @}
