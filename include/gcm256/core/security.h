/**
 * @file security.h
 * @brief Security primitives for gcm256
 *
 * This header provides security-critical functions including:
 * - Constant-time comparison for tag verification
 * - Secure memory zeroing
 * - Cryptographically secure random number generation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GCM256_CORE_SECURITY_H
#define GCM256_CORE_SECURITY_H

#include "gcm256/core/common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Constant-time memory comparison
 *
 * Compares two memory regions in constant time. The execution time does not
 * depend on the content of the memory regions.
 *
 * @param a First memory region
 * @param b Second memory region
 * @param len Number of bytes to compare
 * @return 1 if equal, 0 if different or if either pointer is null
 */
GCM256_API int gcm256_secure_compare(const void* a, const void* b, size_t len);

/**
 * @brief Secure memory zeroing
 *
 * Securely zeros memory, guaranteed not to be optimized away by compiler.
 *
 * @param ptr Pointer to memory to zero (null is ignored)
 * @param len Number of bytes to zero
 */
GCM256_API void gcm256_secure_zero(void* ptr, size_t len);

/**
 * @brief Cryptographically secure random bytes
 *
 * Generates random bytes using the platform CSPRNG:
 * - Windows: BCryptGenRandom
 * - Linux: getrandom() syscall or /dev/urandom
 * - macOS: SecRandomCopyBytes
 *
 * @param buf Buffer to fill with random bytes
 * @param len Number of random bytes to generate
 * @return GCM256_SUCCESS, GCM256_ERROR_INVALID_PARAM or GCM256_ERROR_RANDOM_FAILED
 */
GCM256_API gcm256_error_t gcm256_random_bytes(void* buf, size_t len);

#ifdef __cplusplus
} // extern "C"

namespace gcm256 {

/**
 * @brief Constant-time comparison for C++ containers
 */
template<typename Container>
bool secure_compare(const Container& a, const Container& b) {
    if (a.size() != b.size()) return false;
    return gcm256_secure_compare(a.data(), b.data(),
                                 a.size() * sizeof(typename Container::value_type)) == 1;
}

} // namespace gcm256

#endif // __cplusplus

#endif // GCM256_CORE_SECURITY_H
