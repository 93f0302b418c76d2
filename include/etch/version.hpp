#pragma once

/// @file version.hpp
/// @brief Library version information.

#define ETCH_VERSION_MAJOR 0
#define ETCH_VERSION_MINOR 3
#define ETCH_VERSION_PATCH 0

namespace etch {

/// @brief Return the library version string (e.g. "0.3.0").
/// @return Null-terminated version string in "major.minor.patch" format.
inline const char* version() {
    return "0.3.0";
}

/// @brief Return the major version number.
inline int versionMajor() { return ETCH_VERSION_MAJOR; }
/// @brief Return the minor version number.
inline int versionMinor() { return ETCH_VERSION_MINOR; }
/// @brief Return the patch version number.
inline int versionPatch() { return ETCH_VERSION_PATCH; }

}
