#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define AGW_VERSION_MAJOR 0
#define AGW_VERSION_MINOR 1
#define AGW_VERSION_PATCH 0
#define AGW_VERSION_STRING "0.1.0"

namespace agw {

/// Project version information at compile time.
struct Version {
    static constexpr int major = AGW_VERSION_MAJOR;
    static constexpr int minor = AGW_VERSION_MINOR;
    static constexpr int patch = AGW_VERSION_PATCH;
    static constexpr const char* string = AGW_VERSION_STRING;
};

} // namespace agw
