/**
 * @file security.cpp
 * @brief Security Primitives Implementation
 *
 * Secure zeroing of key material, constant-time tag comparison and the
 * platform CSPRNG behind key and nonce generation.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "gcm256/core/security.h"
#include "gcm256/core/common.h"
#include <cstring>
#include <cstdint>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <bcrypt.h>
#ifndef STATUS_SUCCESS
constexpr NTSTATUS GCM256_STATUS_SUCCESS = 0x00000000L;
#define STATUS_SUCCESS GCM256_STATUS_SUCCESS
#endif
#else
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#if defined(__linux__)
// sys/random.h requires glibc 2.25+, call the syscall directly
#include <sys/syscall.h>
#ifdef SYS_getrandom
#define GCM256_HAS_GETRANDOM_SYSCALL 1
static inline ssize_t gcm256_getrandom(void* buf, size_t len, unsigned int flags) {
    return syscall(SYS_getrandom, buf, len, flags);
}
#endif
#elif defined(__APPLE__)
#include <Security/SecRandom.h>
#endif
#endif

namespace gcm256 {
namespace internal {

// ============================================================================
// Compiler Memory Barrier
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define COMPILER_BARRIER() __asm__ __volatile__("" ::: "memory")
#elif defined(_MSC_VER)
#include <intrin.h>
#define COMPILER_BARRIER() _ReadWriteBarrier()
#else
#define COMPILER_BARRIER()
#endif

// ============================================================================
// Secure Memory Operations
// ============================================================================

// Volatile function pointer to prevent optimization
using SecureZeroFn = void (*volatile)(void*, size_t);

static void secure_zero_impl(void* ptr, size_t len) {
    volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
    while (len--) {
        *p++ = 0;
    }
}

static SecureZeroFn secure_zero_ptr = secure_zero_impl;

void secure_zero(void* ptr, size_t len) {
    if (!ptr || len == 0) return;

#ifdef _WIN32
    SecureZeroMemory(ptr, len);
#else
    secure_zero_ptr(ptr, len);
#endif

    COMPILER_BARRIER();
}

bool secure_compare(const void* a, const void* b, size_t len) {
    if (!a || !b) return false;

    const volatile unsigned char* pa = static_cast<const volatile unsigned char*>(a);
    const volatile unsigned char* pb = static_cast<const volatile unsigned char*>(b);

    volatile unsigned char diff = 0;

    // Always iterate through all bytes
    for (size_t i = 0; i < len; i++) {
        diff |= static_cast<unsigned char>(pa[i] ^ pb[i]);
    }

    COMPILER_BARRIER();

    return diff == 0;
}

// ============================================================================
// CSPRNG Implementation
// ============================================================================

#ifdef _WIN32

gcm256_error_t random_bytes(void* buf, size_t len) {
    if (!buf) return GCM256_ERROR_INVALID_PARAM;
    if (len == 0) return GCM256_SUCCESS;

    NTSTATUS status = BCryptGenRandom(
        nullptr,
        static_cast<PUCHAR>(buf),
        static_cast<ULONG>(len),
        BCRYPT_USE_SYSTEM_PREFERRED_RNG
    );

    return (status == STATUS_SUCCESS) ? GCM256_SUCCESS : GCM256_ERROR_RANDOM_FAILED;
}

#elif defined(__APPLE__)

gcm256_error_t random_bytes(void* buf, size_t len) {
    if (!buf) return GCM256_ERROR_INVALID_PARAM;
    if (len == 0) return GCM256_SUCCESS;

    if (SecRandomCopyBytes(kSecRandomDefault, len, buf) == errSecSuccess) {
        return GCM256_SUCCESS;
    }

    arc4random_buf(buf, len);
    return GCM256_SUCCESS;
}

#else

gcm256_error_t random_bytes(void* buf, size_t len) {
    if (!buf) return GCM256_ERROR_INVALID_PARAM;
    if (len == 0) return GCM256_SUCCESS;

    unsigned char* p = static_cast<unsigned char*>(buf);
    size_t remaining = len;

#ifdef GCM256_HAS_GETRANDOM_SYSCALL
    // getrandom syscall first (kernel 3.17+)
    while (remaining > 0) {
        ssize_t ret = gcm256_getrandom(p, remaining, 0);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;  // ENOSYS or other: fall back to /dev/urandom
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }

    if (remaining == 0) return GCM256_SUCCESS;

    p = static_cast<unsigned char*>(buf);
    remaining = len;
#endif

    int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
    if (fd < 0) return GCM256_ERROR_RANDOM_FAILED;

    while (remaining > 0) {
        ssize_t ret = read(fd, p, remaining);
        if (ret < 0) {
            if (errno == EINTR) continue;
            close(fd);
            return GCM256_ERROR_RANDOM_FAILED;
        }
        if (ret == 0) {
            close(fd);
            return GCM256_ERROR_RANDOM_FAILED;
        }
        p += ret;
        remaining -= static_cast<size_t>(ret);
    }

    close(fd);
    return GCM256_SUCCESS;
}

#endif

}  // namespace internal
}  // namespace gcm256

// ============================================================================
// C ABI Exports
// ============================================================================

extern "C" {

void gcm256_secure_zero(void* ptr, size_t len) {
    gcm256::internal::secure_zero(ptr, len);
}

int gcm256_secure_compare(const void* a, const void* b, size_t len) {
    return gcm256::internal::secure_compare(a, b, len) ? 1 : 0;
}

gcm256_error_t gcm256_random_bytes(void* buf, size_t len) {
    return gcm256::internal::random_bytes(buf, len);
}

}  // extern "C"
