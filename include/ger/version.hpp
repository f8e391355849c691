#pragma once

/// @file version.hpp
/// @brief Project version information.

#define GER_VERSION_MAJOR 0
#define GER_VERSION_MINOR 3
#define GER_VERSION_PATCH 1
#define GER_VERSION_STRING "0.3.1"

namespace ger {

/// Compile-time library version.
struct Version {
    static constexpr int major = GER_VERSION_MAJOR;
    static constexpr int minor = GER_VERSION_MINOR;
    static constexpr int patch = GER_VERSION_PATCH;
    static constexpr const char* string = GER_VERSION_STRING;
};

} // namespace ger
