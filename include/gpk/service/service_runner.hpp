#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for the scene runner entry point.
///
/// Signal handling, configuration loading, logging setup and CLI
/// argument parsing.

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "gpk/foundation/config_manager.hpp"
#include "gpk/foundation/game_result.hpp"

namespace gpk::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.  Default
/// handlers are restored on destruction so that a late signal terminates
/// the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Set the flag as if a signal had arrived.
    void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Load a YAML configuration file into @p config.
///
/// The path is resolved in order:
///   1. GPK_CONFIG_PATH environment variable (if set and non-empty)
///   2. @p defaultPath
///
/// @return Success or ConfigLoadFailed.
[[nodiscard]] gpk::foundation::GameResult<void>
loadConfig(gpk::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Apply `logging.<category>: <level>` entries to the global GameLogger.
///
/// Unknown categories or levels are reported with a warning and skipped.
/// @return Number of categories whose level was changed.
std::size_t applyLoggingConfig(const gpk::foundation::ConfigManager& config);

/// Find `<flag> <value>` in the command line.
///
/// @return The value, or std::nullopt when the flag is absent or last.
[[nodiscard]] std::optional<std::string>
parseArg(int argc, char* argv[], std::string_view flag);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

/// Parse `--ticks <N>`.
/// @return N, std::nullopt when absent, or InvalidArgument when not a
///         non-negative integer.
[[nodiscard]] gpk::foundation::GameResult<std::optional<uint64_t>>
parseTicksArg(int argc, char* argv[]);

} // namespace gpk::service
