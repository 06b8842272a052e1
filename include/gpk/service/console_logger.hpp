#pragma once

/// @file console_logger.hpp
/// @brief kcenon ILogger that writes timestamped lines to std::clog.

#include <atomic>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace gpk::service {

/// Minimal console sink for the scene runner.
///
/// Lines look like `12:04:31.207 [INFO] [Teleport] Player teleported to: B`.
/// Writes are serialized so lines from the loop thread and the main thread
/// never interleave.
class ConsoleLogger : public kcenon::common::interfaces::ILogger {
public:
    using log_level = kcenon::common::interfaces::log_level;

    /// @param out  Destination stream; defaults to std::clog.
    explicit ConsoleLogger(std::ostream* out = nullptr);

    kcenon::common::VoidResult log(log_level level, const std::string& message) override;

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(log_level level) const override;

    kcenon::common::VoidResult set_level(log_level level) override;

    log_level get_level() const override;

    kcenon::common::VoidResult flush() override;

private:
    std::ostream* out_;
    std::mutex mutex_;
    std::atomic<log_level> minLevel_{log_level::trace};
};

} // namespace gpk::service
