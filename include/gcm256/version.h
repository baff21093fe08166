/**
 * @file version.h
 * @brief Unified Version Information for gcm256 Library
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * All other files should include this header and use these macros.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef GCM256_VERSION_H
#define GCM256_VERSION_H

/** Major version number (API breaking changes) */
#define GCM256_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define GCM256_VERSION_MINOR 0

/** Patch version number (bug fixes) */
#define GCM256_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define GCM256_VERSION_STRING "1.0.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define GCM256_VERSION_NUMBER ((GCM256_VERSION_MAJOR * 10000) + \
                               (GCM256_VERSION_MINOR * 100) + \
                               GCM256_VERSION_PATCH)

/** Library name */
#define GCM256_LIBRARY_NAME "gcm256"

/** Full library description */
#define GCM256_DESCRIPTION "AES-256-GCM authenticated encryption"

/** Build type identifier */
#ifdef NDEBUG
#define GCM256_BUILD_TYPE "Release"
#else
#define GCM256_BUILD_TYPE "Debug"
#endif

/**
 * @brief Check if library version is at least the specified version
 */
#define GCM256_VERSION_AT_LEAST(major, minor, patch) \
    (GCM256_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

#endif /* GCM256_VERSION_H */
