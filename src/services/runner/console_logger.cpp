/// @file console_logger.cpp
/// @brief ConsoleLogger implementation.

#include "gpk/service/console_logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace gpk::service {

namespace {

using kcenon::common::interfaces::log_level;

std::string_view levelTag(log_level level) {
    switch (level) {
        case log_level::trace:    return "TRACE";
        case log_level::debug:    return "DEBUG";
        case log_level::info:     return "INFO";
        case log_level::warning:  return "WARN";
        case log_level::error:    return "ERROR";
        case log_level::critical: return "CRITICAL";
        default:                  return "OFF";
    }
}

void writeTimestamp(std::ostream& os) {
    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);
    os << std::put_time(&local, "%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis.count() << std::setfill(' ');
}

} // namespace

ConsoleLogger::ConsoleLogger(std::ostream* out)
    : out_(out != nullptr ? out : &std::clog) {}

kcenon::common::VoidResult ConsoleLogger::log(log_level level, const std::string& message) {
    if (!is_enabled(level)) {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }
    std::lock_guard lock(mutex_);
    writeTimestamp(*out_);
    *out_ << " [" << levelTag(level) << "] " << message << '\n';
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kcenon::common::VoidResult ConsoleLogger::log(
    log_level level, std::string_view message,
    const kcenon::common::interfaces::source_location& /*loc*/) {
    return log(level, std::string(message));
}

kcenon::common::VoidResult ConsoleLogger::log(
    const kcenon::common::interfaces::log_entry& entry) {
    return log(entry.level, entry.message);
}

bool ConsoleLogger::is_enabled(log_level level) const {
    return level >= minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::set_level(log_level level) {
    minLevel_.store(level, std::memory_order_release);
    return kcenon::common::VoidResult::ok(std::monostate{});
}

log_level ConsoleLogger::get_level() const {
    return minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::flush() {
    std::lock_guard lock(mutex_);
    out_->flush();
    return kcenon::common::VoidResult::ok(std::monostate{});
}

} // namespace gpk::service
