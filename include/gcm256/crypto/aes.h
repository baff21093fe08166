/**
 * @file aes.h
 * @brief AES-256 block cipher core
 *
 * Key schedule and single-block forward/inverse transforms (FIPS 197,
 * Nk = 8, Nr = 14). This is the only primitive the counter mode engine and
 * the GCM construction build on; no bulk modes are exposed here.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#ifndef GCM256_CRYPTO_AES_H
#define GCM256_CRYPTO_AES_H

#include "gcm256/core/common.h"
#include "gcm256/core/types.h"

#ifdef __cplusplus
extern "C" {
#endif

// AES-256 context structure
typedef struct {
    uint32_t round_keys[4 * (GCM256_AES256_ROUNDS + 1)];  // 15 round keys, big-endian words
    int initialized;
} gcm256_aes_ctx_t;

/**
 * @brief Initialize AES context with a 256-bit key
 * @param ctx AES context to initialize
 * @param key Encryption key
 * @param key_len Key length in bytes (must be 32)
 * @return GCM256_SUCCESS, GCM256_ERROR_INVALID_PARAM or GCM256_ERROR_INVALID_KEY
 */
GCM256_API gcm256_error_t gcm256_aes_init(
    gcm256_aes_ctx_t* ctx,
    const uint8_t* key,
    size_t key_len
);

/**
 * @brief Encrypt single AES block (16 bytes)
 * @param ctx Initialized AES context
 * @param input 16-byte input block
 * @param output 16-byte output block (may alias input)
 * @return GCM256_SUCCESS or error code
 */
GCM256_API gcm256_error_t gcm256_aes_encrypt_block(
    const gcm256_aes_ctx_t* ctx,
    const uint8_t input[16],
    uint8_t output[16]
);

/**
 * @brief Decrypt single AES block (16 bytes)
 * @param ctx Initialized AES context
 * @param input 16-byte input block
 * @param output 16-byte output block (may alias input)
 * @return GCM256_SUCCESS or error code
 */
GCM256_API gcm256_error_t gcm256_aes_decrypt_block(
    const gcm256_aes_ctx_t* ctx,
    const uint8_t input[16],
    uint8_t output[16]
);

/**
 * @brief Encrypt a length-checked block
 *
 * Same transform as gcm256_aes_encrypt_block for callers holding a
 * pointer/length pair.
 *
 * @return GCM256_ERROR_INVALID_BLOCK_SIZE unless input_len is 16
 */
GCM256_API gcm256_error_t gcm256_aes_encrypt(
    const gcm256_aes_ctx_t* ctx,
    const uint8_t* input,
    size_t input_len,
    uint8_t output[16]
);

/**
 * @brief Decrypt a length-checked block
 * @return GCM256_ERROR_INVALID_BLOCK_SIZE unless input_len is 16
 */
GCM256_API gcm256_error_t gcm256_aes_decrypt(
    const gcm256_aes_ctx_t* ctx,
    const uint8_t* input,
    size_t input_len,
    uint8_t output[16]
);

/**
 * @brief Clear AES context (secure zeroing)
 * @param ctx AES context to clear
 */
GCM256_API void gcm256_aes_clear(gcm256_aes_ctx_t* ctx);

#ifdef __cplusplus
}
#endif

// C++ interface
#ifdef __cplusplus

namespace gcm256 {

/**
 * @brief AES-256 block cipher
 *
 * Holds the expanded key schedule; read-only after construction and safe to
 * share between threads.
 */
class AES256 {
public:
    static constexpr size_t KEY_SIZE = GCM256_AES256_KEY_SIZE;
    static constexpr size_t BLOCK_SIZE = GCM256_BLOCK_SIZE;

    /**
     * @brief Construct AES-256 instance with key
     * @throws std::invalid_argument if key is not 32 bytes
     */
    explicit AES256(const ByteVec& key);
    explicit AES256(const uint8_t* key, size_t key_len);
    explicit AES256(const AES256Key& key);

    ~AES256();

    // Disable copy
    AES256(const AES256&) = delete;
    AES256& operator=(const AES256&) = delete;

    // Enable move
    AES256(AES256&& other) noexcept;
    AES256& operator=(AES256&& other) noexcept;

    /**
     * @brief Encrypt single block
     */
    AESBlock encryptBlock(const AESBlock& input) const;

    /**
     * @brief Encrypt single block given as a byte vector
     * @throws std::invalid_argument if input is not 16 bytes
     */
    AESBlock encryptBlock(const ByteVec& input) const;

    /**
     * @brief Decrypt single block
     */
    AESBlock decryptBlock(const AESBlock& input) const;

    /**
     * @throws std::invalid_argument if input is not 16 bytes
     */
    AESBlock decryptBlock(const ByteVec& input) const;

private:
    friend class CounterMode;
    friend class AES256GCM;

    const gcm256_aes_ctx_t* context() const noexcept { return &ctx_; }

    gcm256_aes_ctx_t ctx_;
};

} // namespace gcm256

#endif // __cplusplus

#endif // GCM256_CRYPTO_AES_H
