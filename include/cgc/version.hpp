#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define CGC_VERSION_MAJOR 0
#define CGC_VERSION_MINOR 3
#define CGC_VERSION_PATCH 0
#define CGC_VERSION_STRING "0.3.0"

namespace cgc {

/// Project version information at compile time.
struct Version {
    static constexpr int major = CGC_VERSION_MAJOR;
    static constexpr int minor = CGC_VERSION_MINOR;
    static constexpr int patch = CGC_VERSION_PATCH;
    static constexpr const char* string = CGC_VERSION_STRING;
};

} // namespace cgc
