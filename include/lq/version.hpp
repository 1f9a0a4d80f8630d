#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define LQ_VERSION_MAJOR 0
#define LQ_VERSION_MINOR 1
#define LQ_VERSION_PATCH 0
#define LQ_VERSION_STRING "0.1.0"

namespace lq {

/// Project version information at compile time.
struct Version {
    static constexpr int major = LQ_VERSION_MAJOR;
    static constexpr int minor = LQ_VERSION_MINOR;
    static constexpr int patch = LQ_VERSION_PATCH;
    static constexpr const char* string = LQ_VERSION_STRING;
};

} // namespace lq
