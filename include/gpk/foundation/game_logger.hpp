#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon common_system logging for gameplay code.
///
/// Provides per-category filtering, structured context, and runtime
/// level control.  The concrete sink is whatever ILogger is registered
/// in kcenon's GlobalLoggerRegistry (the scene runner installs a
/// console logger; tests install a capturing mock).

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gpk/foundation/game_result.hpp"

namespace gpk::foundation {

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

/// Gameplay log categories, each with its own minimum level.
enum class LogCategory : uint8_t {
    Core     = 0, ///< World lifecycle and runner
    ECS      = 1, ///< Entity-Component-System
    Config   = 2, ///< Configuration loading
    Scene    = 3, ///< Scene documents and references
    Teleport = 4, ///< Teleporter triggers
    Lighting = 5, ///< Light effects
    AI       = 6  ///< Enemy behavior
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "ECS", "Config", "Scene", "Teleport", "Lighting", "AI"
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

/// Parse a level name ("debug", "WARNING", ...) case-insensitively.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Parse a category name ("ai", "Teleport", ...) case-insensitively.
[[nodiscard]] std::optional<LogCategory> parseLogCategory(std::string_view name);

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityName = "Guard_02";
///   ctx.extra["range"] = "3.0";
///   logger.logWithContext(LogLevel::Debug, LogCategory::AI,
///                         "Player detected", ctx);
/// @endcode
struct LogContext {
    std::optional<uint32_t> entityId;
    std::optional<std::string> entityName;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger over kcenon's GlobalLoggerRegistry.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | ECS      | Info          |
/// | Config   | Info          |
/// | Scene    | Info          |
/// | Teleport | Info          |
/// | Lighting | Info          |
/// | AI       | Debug         |
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

    /// Log a message with context fields appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger's buffered output.
    GameResult<void> flush();

    /// Process-wide logger used by the GPK_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gpk::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// @name GPK_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define GPK_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef GPK_MIN_LOG_LEVEL
    #define GPK_MIN_LOG_LEVEL 0
#endif

#define GPK_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= GPK_MIN_LOG_LEVEL &&                      \
            ::gpk::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::gpk::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define GPK_LOG_DEBUG(cat, msg) \
    GPK_LOG(::gpk::foundation::LogLevel::Debug, (cat), (msg))

#define GPK_LOG_INFO(cat, msg) \
    GPK_LOG(::gpk::foundation::LogLevel::Info, (cat), (msg))

#define GPK_LOG_WARN(cat, msg) \
    GPK_LOG(::gpk::foundation::LogLevel::Warning, (cat), (msg))

#define GPK_LOG_ERROR(cat, msg) \
    GPK_LOG(::gpk::foundation::LogLevel::Error, (cat), (msg))

/// @}
