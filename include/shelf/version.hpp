#pragma once

/// @file version.hpp
/// @brief Project version information.

#define SHELF_VERSION_MAJOR 0
#define SHELF_VERSION_MINOR 3
#define SHELF_VERSION_PATCH 0
#define SHELF_VERSION_STRING "0.3.0"

namespace shelf {

/// Project version information at compile time.
struct Version {
    static constexpr int major = SHELF_VERSION_MAJOR;
    static constexpr int minor = SHELF_VERSION_MINOR;
    static constexpr int patch = SHELF_VERSION_PATCH;
    static constexpr const char* string = SHELF_VERSION_STRING;
};

} // namespace shelf
