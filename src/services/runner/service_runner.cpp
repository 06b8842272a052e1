/// @file service_runner.cpp
/// @brief Implementation of shared entry-point utilities.

#include "gpk/service/service_runner.hpp"

#include <charconv>
#include <csignal>
#include <cstdlib>

#include "gpk/foundation/game_logger.hpp"

namespace gpk::service {

using gpk::foundation::ErrorCode;
using gpk::foundation::GameError;
using gpk::foundation::GameLogger;
using gpk::foundation::GameResult;
using gpk::foundation::LogCategory;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- Config loading ----------------------------------------------------------

GameResult<void> loadConfig(gpk::foundation::ConfigManager& config,
                            const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("GPK_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    auto result = config.load(configPath);
    if (result) {
        GPK_LOG_INFO(LogCategory::Config, "Loaded config from " + configPath.string());
    }
    return result;
}

std::size_t applyLoggingConfig(const gpk::foundation::ConfigManager& config) {
    std::size_t applied = 0;
    for (const auto& key : config.keysUnder("logging")) {
        auto categoryName = std::string_view(key).substr(sizeof("logging.") - 1);
        auto category = gpk::foundation::parseLogCategory(categoryName);
        if (!category) {
            GPK_LOG_WARN(LogCategory::Config, "Unknown log category: " + key);
            continue;
        }
        auto levelName = config.get<std::string>(key);
        auto level = levelName ? gpk::foundation::parseLogLevel(levelName.value())
                               : std::nullopt;
        if (!level) {
            GPK_LOG_WARN(LogCategory::Config, "Invalid log level for " + key);
            continue;
        }
        GameLogger::instance().setCategoryLevel(*category, *level);
        ++applied;
    }
    return applied;
}

// -- CLI argument parsing ----------------------------------------------------

std::optional<std::string> parseArg(int argc, char* argv[], std::string_view flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == flag) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return std::string(argv[i + 1]);     // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return std::nullopt;
}

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    auto value = parseArg(argc, argv, "--config");
    return value ? std::filesystem::path(*value) : std::filesystem::path{};
}

GameResult<std::optional<uint64_t>> parseTicksArg(int argc, char* argv[]) {
    auto value = parseArg(argc, argv, "--ticks");
    if (!value) {
        return GameResult<std::optional<uint64_t>>::ok(std::nullopt);
    }
    uint64_t ticks = 0;
    const char* first = value->data();
    const char* last = first + value->size();
    auto [ptr, ec] = std::from_chars(first, last, ticks);
    if (ec != std::errc{} || ptr != last) {
        return GameResult<std::optional<uint64_t>>::err(
            GameError(ErrorCode::InvalidArgument, "invalid --ticks value: " + *value));
    }
    return GameResult<std::optional<uint64_t>>::ok(ticks);
}

} // namespace gpk::service
