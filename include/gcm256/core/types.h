/**
 * @file types.h
 * @brief Type definitions for gcm256 library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef GCM256_CORE_TYPES_H
#define GCM256_CORE_TYPES_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus

#include <vector>
#include <array>

namespace gcm256 {

// Byte vector
using ByteVec = std::vector<uint8_t>;

// Byte array templates
template<size_t N>
using ByteArray = std::array<uint8_t, N>;

// Key material
using AES256Key = ByteArray<32>;

// Cipher block, also the GF(2^128) element representation
using AESBlock = ByteArray<16>;

// GCM parameters
using GcmNonce = ByteArray<12>;
using GcmTag = ByteArray<16>;

} // namespace gcm256

#endif // __cplusplus

#endif // GCM256_CORE_TYPES_H
