#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define GPK_VERSION_MAJOR 0
#define GPK_VERSION_MINOR 3
#define GPK_VERSION_PATCH 0
#define GPK_VERSION_STRING "0.3.0"

namespace gpk {

/// Library version information at compile time.
struct Version {
    static constexpr int major = GPK_VERSION_MAJOR;
    static constexpr int minor = GPK_VERSION_MINOR;
    static constexpr int patch = GPK_VERSION_PATCH;
    static constexpr const char* string = GPK_VERSION_STRING;
};

} // namespace gpk
