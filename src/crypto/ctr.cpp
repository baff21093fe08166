/**
 * @file ctr.cpp
 * @brief AES-256 counter mode implementation
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "gcm256/crypto/ctr.h"
#include "gcm256/core/security.h"
#include <cstring>
#include <stdexcept>

// ============================================================================
// Public C API
// ============================================================================

extern "C" {

gcm256_error_t gcm256_ctr32_crypt(const gcm256_aes_ctx_t* ctx, const uint8_t counter_block[16],
                                  const uint8_t* input, size_t len, uint8_t* output) {
    if (!ctx || !counter_block) return GCM256_ERROR_INVALID_PARAM;
    if (len > 0 && (!input || !output)) return GCM256_ERROR_INVALID_PARAM;
    if (!ctx->initialized) return GCM256_ERROR_INVALID_STATE;

    uint8_t counter[16];
    uint8_t keystream[16];
    memcpy(counter, counter_block, 16);

    size_t offset = 0;
    while (offset < len) {
        gcm256_error_t err = gcm256_aes_encrypt_block(ctx, counter, keystream);
        if (err != GCM256_SUCCESS) {
            gcm256_secure_zero(counter, 16);
            return err;
        }

        size_t n = GCM256_MIN(len - offset, static_cast<size_t>(16));
        for (size_t i = 0; i < n; i++) {
            output[offset + i] = input[offset + i] ^ keystream[i];
        }

        gcm256::ctr::inc32(counter);
        offset += n;
    }

    gcm256_secure_zero(counter, 16);
    gcm256_secure_zero(keystream, 16);
    return GCM256_SUCCESS;
}

gcm256_error_t gcm256_ctr_crypt(const gcm256_aes_ctx_t* ctx, const uint8_t nonce[12],
                                const uint8_t* input, size_t len, uint8_t* output) {
    if (!nonce) return GCM256_ERROR_INVALID_PARAM;

    uint8_t counter[16];
    memcpy(counter, nonce, 12);
    counter[12] = 0;
    counter[13] = 0;
    counter[14] = 0;
    counter[15] = 1;

    gcm256_error_t err = gcm256_ctr32_crypt(ctx, counter, input, len, output);
    gcm256_secure_zero(counter, 16);
    return err;
}

} // extern "C"

// ============================================================================
// C++ Implementation
// ============================================================================

namespace gcm256 {

namespace ctr {

void inc32(uint8_t block[16]) noexcept {
    for (int i = 15; i >= 12; i--) {
        if (++block[i] != 0) break;
    }
}

void inc32(AESBlock& block) noexcept {
    inc32(block.data());
}

AESBlock counterBlock(const GcmNonce& nonce, uint32_t counter) noexcept {
    AESBlock block;
    memcpy(block.data(), nonce.data(), nonce.size());
    block[12] = static_cast<uint8_t>(counter >> 24);
    block[13] = static_cast<uint8_t>(counter >> 16);
    block[14] = static_cast<uint8_t>(counter >> 8);
    block[15] = static_cast<uint8_t>(counter);
    return block;
}

} // namespace ctr

ByteVec CounterMode::encrypt(const ByteVec& data, const GcmNonce& nonce,
                             uint32_t initial_counter) const {
    return crypt(data, nonce, initial_counter);
}

ByteVec CounterMode::decrypt(const ByteVec& data, const GcmNonce& nonce,
                             uint32_t initial_counter) const {
    return crypt(data, nonce, initial_counter);
}

ByteVec CounterMode::crypt(const ByteVec& data, const GcmNonce& nonce,
                           uint32_t initial_counter) const {
    AESBlock counter = ctr::counterBlock(nonce, initial_counter);
    ByteVec output(data.size());

    gcm256_error_t err = gcm256_ctr32_crypt(cipher_.context(), counter.data(),
                                            data.data(), data.size(), output.data());
    gcm256_secure_zero(counter.data(), counter.size());
    if (err != GCM256_SUCCESS) {
        throw std::logic_error("CTR: AES-256 context is not initialized");
    }
    return output;
}

} // namespace gcm256
