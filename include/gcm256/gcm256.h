/**
 * @file gcm256.h
 * @brief gcm256 - AES-256-GCM Authenticated Encryption Library
 *
 * Unified header for the library.
 *
 * Modules:
 * - AES256: AES-256 block cipher (FIPS 197)
 * - gf128 / GHash: GF(2^128) arithmetic and GHASH
 * - CounterMode: 32-bit counter mode keystream
 * - AES256GCM: AEAD seal/open (NIST SP 800-38D)
 * - NonceSequence: deterministic 96-bit nonces
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GCM256_H
#define GCM256_H

// ============================================================================
// Core
// ============================================================================

#include "gcm256/version.h"
#include "gcm256/core/common.h"
#include "gcm256/core/types.h"
#include "gcm256/core/security.h"

// ============================================================================
// Cryptographic Modules
// ============================================================================

#include "gcm256/crypto/aes.h"      // AES256
#include "gcm256/crypto/ghash.h"    // gf128::multiply, GHash
#include "gcm256/crypto/ctr.h"      // CounterMode
#include "gcm256/crypto/gcm.h"      // AES256GCM, NonceSequence

#endif // GCM256_H
