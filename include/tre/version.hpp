#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define TRE_VERSION_MAJOR 0
#define TRE_VERSION_MINOR 3
#define TRE_VERSION_PATCH 0
#define TRE_VERSION_STRING "0.3.0"

namespace tre {

/// Rating engine version information at compile time.
struct Version {
    static constexpr int major = TRE_VERSION_MAJOR;
    static constexpr int minor = TRE_VERSION_MINOR;
    static constexpr int patch = TRE_VERSION_PATCH;
    static constexpr const char* string = TRE_VERSION_STRING;
};

} // namespace tre
