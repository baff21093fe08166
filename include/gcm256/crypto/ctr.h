/**
 * @file ctr.h
 * @brief AES-256 counter mode (CTR)
 *
 * Keystream block i is E_K(CB_i), where CB_1 is the initial counter block and
 * CB_{i+1} = inc32(CB_i) increments the low 32 bits big-endian modulo 2^32.
 * Encryption and decryption are the same operation.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GCM256_CRYPTO_CTR_H
#define GCM256_CRYPTO_CTR_H

#include "gcm256/core/common.h"
#include "gcm256/core/types.h"
#include "gcm256/crypto/aes.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief CTR transform from an explicit 16-byte counter block
 *
 * @param ctx Initialized AES context
 * @param counter_block Initial counter block (not modified)
 * @param input Input data (may be null when len is 0)
 * @param len Data length in bytes
 * @param output Output buffer of len bytes (may equal input)
 * @return GCM256_SUCCESS or error code
 */
GCM256_API gcm256_error_t gcm256_ctr32_crypt(
    const gcm256_aes_ctx_t* ctx,
    const uint8_t counter_block[16],
    const uint8_t* input,
    size_t len,
    uint8_t* output
);

/**
 * @brief CTR transform with initial counter block Nonce || 0x00000001
 *
 * @param ctx Initialized AES context
 * @param nonce 12-byte nonce
 * @param input Input data
 * @param len Data length in bytes
 * @param output Output buffer of len bytes (may equal input)
 * @return GCM256_SUCCESS or error code
 */
GCM256_API gcm256_error_t gcm256_ctr_crypt(
    const gcm256_aes_ctx_t* ctx,
    const uint8_t nonce[12],
    const uint8_t* input,
    size_t len,
    uint8_t* output
);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

namespace gcm256 {

namespace ctr {

/**
 * @brief Increment the low 32 bits of a counter block (big-endian, wrapping)
 */
void inc32(uint8_t block[16]) noexcept;
void inc32(AESBlock& block) noexcept;

/**
 * @brief Build Nonce || [counter]_32
 */
AESBlock counterBlock(const GcmNonce& nonce, uint32_t counter) noexcept;

} // namespace ctr

/**
 * @brief Counter mode over a borrowed AES-256 key schedule
 *
 * The cipher must outlive this object.
 */
class CounterMode {
public:
    explicit CounterMode(const AES256& cipher) : cipher_(cipher) {}

    /**
     * @brief Encrypt data
     * @param data Plaintext
     * @param nonce 12-byte nonce
     * @param initial_counter Counter of the first keystream block
     * @return Ciphertext of the same length
     */
    ByteVec encrypt(const ByteVec& data, const GcmNonce& nonce,
                    uint32_t initial_counter = 1) const;

    /**
     * @brief Decrypt data (identical to encrypt)
     */
    ByteVec decrypt(const ByteVec& data, const GcmNonce& nonce,
                    uint32_t initial_counter = 1) const;

private:
    ByteVec crypt(const ByteVec& data, const GcmNonce& nonce, uint32_t initial_counter) const;

    const AES256& cipher_;
};

} // namespace gcm256

#endif // __cplusplus

#endif // GCM256_CRYPTO_CTR_H
