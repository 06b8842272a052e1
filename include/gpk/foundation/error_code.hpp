#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the gameplay kit.

#include <cstdint>
#include <string_view>

namespace gpk::foundation {

/// Error codes grouped by subsystem in 0x100-wide hex ranges, so the
/// source of an error can be read off the value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,

    // ECS (0x0300 - 0x03FF)
    ComponentNotFound = 0x0301,
    CircularDependency = 0x0303,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Thread / deferred actions (0x0700 - 0x07FF)
    JobNotFound = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerFlushFailed = 0x0802,

    // Scene (0x0900 - 0x09FF)
    SceneLoadFailed = 0x0900,

    // Gameplay (0x0A00 - 0x0AFF)
    MissingLight = 0x0A01,
    NotATeleporter = 0x0A04,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0300: return "ECS";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        case 0x0900: return "Scene";
        case 0x0A00: return "Gameplay";
        default: return "Unknown";
    }
}

} // namespace gpk::foundation
