/**
 * @file common.h
 * @brief Common definitions and utility macros for gcm256 library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef GCM256_CORE_COMMON_H
#define GCM256_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define GCM256_PLATFORM_WINDOWS 1
    #define GCM256_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define GCM256_PLATFORM_LINUX 1
    #define GCM256_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define GCM256_PLATFORM_MACOS 1
    #define GCM256_PLATFORM_NAME "macOS"
#else
    #define GCM256_PLATFORM_UNKNOWN 1
    #define GCM256_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef GCM256_PLATFORM_WINDOWS
    #ifdef GCM256_SHARED_LIBRARY
        #ifdef GCM256_BUILDING
            #define GCM256_API __declspec(dllexport)
        #else
            #define GCM256_API __declspec(dllimport)
        #endif
    #else
        #define GCM256_API
    #endif
#else
    #ifdef GCM256_SHARED_LIBRARY
        #define GCM256_API __attribute__((visibility("default")))
    #else
        #define GCM256_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    GCM256_SUCCESS = 0,
    GCM256_ERROR_INVALID_PARAM = -1,
    GCM256_ERROR_INVALID_KEY = -2,          // Key is not 32 bytes
    GCM256_ERROR_INVALID_IV = -3,           // Nonce is not 12 bytes
    GCM256_ERROR_INVALID_TAG = -4,          // Tag is not 16 bytes
    GCM256_ERROR_INVALID_BLOCK_SIZE = -5,   // Block is not 16 bytes
    GCM256_ERROR_LENGTH_LIMIT = -6,         // Input exceeds SP 800-38D limits
    GCM256_ERROR_INVALID_STATE = -7,        // Call order violated
    GCM256_ERROR_AUTH_FAILED = -8,          // AEAD authentication failed
    GCM256_ERROR_RANDOM_FAILED = -9,        // CSPRNG failure
    GCM256_ERROR_NONCE_EXHAUSTED = -10      // Nonce sequence has no values left
} gcm256_error_t;

// Key, block and GCM parameter sizes
#define GCM256_AES256_KEY_SIZE   32
#define GCM256_AES256_ROUNDS     14
#define GCM256_BLOCK_SIZE        16
#define GCM256_GCM_NONCE_SIZE    12
#define GCM256_GCM_TAG_SIZE      16

// SP 800-38D: len(P) <= 2^39 - 256 bits, len(A) <= 2^64 - 1 bits
#define GCM256_GCM_MAX_PLAINTEXT ((UINT64_C(1) << 36) - 32)
#define GCM256_GCM_MAX_AAD       ((UINT64_C(1) << 61) - 1)

// Utility macros
#define GCM256_ARRAY_SIZE(arr) (sizeof(arr) / sizeof((arr)[0]))
#define GCM256_MIN(a, b) ((a) < (b) ? (a) : (b))

#define GCM256_ROTL32(x, n) ((uint32_t)(((x) << (n)) | ((x) >> (32 - (n)))))

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
GCM256_API const char* gcm256_error_string(gcm256_error_t error);

/**
 * @brief Library version string ("major.minor.patch")
 */
GCM256_API const char* gcm256_version(void);

/**
 * @brief Name of the platform the library was built for
 */
GCM256_API const char* gcm256_platform(void);

#ifdef __cplusplus
}
#endif

#endif // GCM256_CORE_COMMON_H
