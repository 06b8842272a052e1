/// @file game_logger.cpp
/// @brief GameLogger implementation over kcenon common_system.

#include "gpk/foundation/game_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace gpk::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: GPK -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // ECS
    LogLevel::Info,   // Config
    LogLevel::Info,   // Scene
    LogLevel::Info,   // Teleport
    LogLevel::Info,   // Lighting
    LogLevel::Debug   // AI
};

static bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    for (uint8_t i = 0; i <= static_cast<uint8_t>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (equalsIgnoreCase(name, logLevelName(level))) {
            return level;
        }
    }
    if (equalsIgnoreCase(name, "warn")) {
        return LogLevel::Warning;
    }
    return std::nullopt;
}

std::optional<LogCategory> parseLogCategory(std::string_view name) {
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        if (equalsIgnoreCase(name, logCategoryName(cat))) {
            return cat;
        }
    }
    return std::nullopt;
}

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.entityId) {
        append("entity_id", std::to_string(*ctx.entityId));
    }
    if (ctx.entityName && !ctx.entityName->empty()) {
        append("entity", *ctx.entityName);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct GameLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Per-category logger names ("gpk.AI", ...) looked up in the registry.
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = std::string("gpk.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    // A category-specific logger wins; otherwise the registry default.
    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto idx = static_cast<std::size_t>(cat);
        if (idx < kLogCategoryCount) {
            auto named = registry.get_logger(loggerNames[idx]);
            if (named && named != kci::GlobalLoggerRegistry::null_logger()) {
                return named;
            }
        }
        return registry.get_default_logger();
    }

    void write(LogLevel level, LogCategory cat, const std::string& line) const {
        auto logger = getLogger(cat);
        if (!logger) {
            return;
        }
        auto result = logger->log(mapLevel(level), line);
        (void)result;  // A failing sink has nowhere else to report to.
    }
};

GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

GameLogger::GameLogger(GameLogger&&) noexcept = default;
GameLogger& GameLogger::operator=(GameLogger&&) noexcept = default;

void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }

    // Format: [Category] message
    std::string formatted;
    formatted.reserve(msg.size() + 16);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;

    impl_->write(level, cat, formatted);
}

void GameLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }

    std::string ctxStr = formatContext(ctx);

    // Format: [Category] message {key=val, ...}
    std::string formatted;
    formatted.reserve(msg.size() + ctxStr.size() + 20);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;
    if (!ctxStr.empty()) {
        formatted += " {";
        formatted += ctxStr;
        formatted += '}';
    }

    impl_->write(level, cat, formatted);
}

void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

GameResult<void> GameLogger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    if (!logger) {
        return GameResult<void>::ok();
    }
    auto result = logger->flush();
    if (result.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger inst;
    return inst;
}

} // namespace gpk::foundation
