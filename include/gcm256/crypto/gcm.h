/**
 * @file gcm.h
 * @brief AES-256-GCM authenticated encryption (NIST SP 800-38D)
 *
 * Only 96-bit nonces are accepted: J0 = Nonce || 0x00000001, the payload is
 * encrypted in counter mode from inc32(J0), and the tag is
 * GHASH_H(A, C) XOR E_K(J0) with H = E_K(0^128).
 *
 * A (key, nonce) pair must never encrypt two different messages. Reuse
 * reveals the XOR of the plaintexts and lets an attacker recover H and forge
 * tags. Use generateNonce() for random nonces (safe up to about 2^32
 * messages per key) or NonceSequence for deterministic ones.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GCM256_CRYPTO_GCM_H
#define GCM256_CRYPTO_GCM_H

#include "gcm256/core/common.h"
#include "gcm256/core/types.h"
#include "gcm256/crypto/aes.h"
#include "gcm256/crypto/ghash.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * One-shot AEAD
 * ============================================================================ */

/**
 * @brief AES-256-GCM encryption with authentication
 * @param ctx Initialized AES context
 * @param iv Nonce
 * @param iv_len Nonce length (must be 12)
 * @param aad Additional authenticated data
 * @param aad_len AAD length
 * @param input Plaintext input
 * @param input_len Input length
 * @param output Ciphertext output (input_len bytes, may equal input)
 * @param tag 16-byte authentication tag output
 * @return GCM256_SUCCESS or error code
 */
GCM256_API gcm256_error_t gcm256_gcm_encrypt(
    const gcm256_aes_ctx_t* ctx,
    const uint8_t* iv,
    size_t iv_len,
    const uint8_t* aad,
    size_t aad_len,
    const uint8_t* input,
    size_t input_len,
    uint8_t* output,
    uint8_t tag[16]
);

/**
 * @brief AES-256-GCM decryption with authentication
 *
 * The tag is verified before any plaintext is produced. On failure the
 * output buffer is zeroed.
 *
 * @param ctx Initialized AES context
 * @param iv Nonce
 * @param iv_len Nonce length (must be 12)
 * @param aad Additional authenticated data
 * @param aad_len AAD length
 * @param input Ciphertext input
 * @param input_len Input length
 * @param tag Authentication tag
 * @param tag_len Tag length (must be 16)
 * @param output Plaintext output (input_len bytes, may equal input)
 * @return GCM256_SUCCESS, GCM256_ERROR_AUTH_FAILED or error code
 */
GCM256_API gcm256_error_t gcm256_gcm_decrypt(
    const gcm256_aes_ctx_t* ctx,
    const uint8_t* iv,
    size_t iv_len,
    const uint8_t* aad,
    size_t aad_len,
    const uint8_t* input,
    size_t input_len,
    const uint8_t* tag,
    size_t tag_len,
    uint8_t* output
);

/* ============================================================================
 * Streaming Encryption
 * ============================================================================ */

/**
 * @brief AES-256-GCM context for streaming encryption
 */
typedef struct {
    gcm256_aes_ctx_t aes_ctx;
    gcm256_ghash_ctx_t ghash;
    uint8_t j0[16];           /**< Pre-counter block */
    uint8_t counter[16];      /**< Next counter block */
    uint8_t keystream[16];    /**< Current keystream block */
    size_t keystream_pos;     /**< Consumed bytes of keystream (16 = none left) */
    int finalized;
} gcm256_gcm_ctx_t;

/**
 * @brief Initialize streaming GCM encryption context
 * @param ctx GCM context to initialize
 * @param key Encryption key
 * @param key_len Key length (must be 32)
 * @param iv Nonce
 * @param iv_len Nonce length (must be 12)
 * @return GCM256_SUCCESS or error code
 */
GCM256_API gcm256_error_t gcm256_gcm_init(
    gcm256_gcm_ctx_t* ctx,
    const uint8_t* key, size_t key_len,
    const uint8_t* iv, size_t iv_len);

/**
 * @brief Process additional authenticated data (AAD)
 * @note Must be called before any update_encrypt call
 * @return GCM256_SUCCESS, GCM256_ERROR_INVALID_STATE or error code
 */
GCM256_API gcm256_error_t gcm256_gcm_update_aad(
    gcm256_gcm_ctx_t* ctx,
    const uint8_t* aad, size_t aad_len);

/**
 * @brief Encrypt data in streaming mode
 *
 * Chunks may have any length; the concatenated output equals one-shot
 * encryption of the concatenated input.
 */
GCM256_API gcm256_error_t gcm256_gcm_update_encrypt(
    gcm256_gcm_ctx_t* ctx,
    const uint8_t* input, size_t input_len,
    uint8_t* output);

/**
 * @brief Finalize GCM encryption and get authentication tag
 *
 * On failure the tag buffer is zeroed and the context is not finalized.
 */
GCM256_API gcm256_error_t gcm256_gcm_final_encrypt(
    gcm256_gcm_ctx_t* ctx,
    uint8_t tag[16]);

/**
 * @brief Clear GCM context (secure zeroing)
 */
GCM256_API void gcm256_gcm_clear(gcm256_gcm_ctx_t* ctx);

/* ============================================================================
 * Deterministic Nonces
 * ============================================================================ */

/**
 * @brief Nonce sequence state: fixed field || 64-bit invocation counter
 *
 * Not thread-safe; use gcm256::NonceSequence for concurrent callers.
 */
typedef struct {
    uint8_t fixed[4];
    uint64_t counter;
} gcm256_nonce_seq_t;

/**
 * @brief Initialize a nonce sequence
 * @param seq Sequence state
 * @param fixed 4-byte fixed field, unique per key holder
 * @return GCM256_SUCCESS or GCM256_ERROR_INVALID_PARAM
 */
GCM256_API gcm256_error_t gcm256_nonce_seq_init(gcm256_nonce_seq_t* seq, const uint8_t fixed[4]);

/**
 * @brief Emit the next nonce
 * @param seq Sequence state
 * @param nonce 12-byte output
 * @return GCM256_SUCCESS or GCM256_ERROR_NONCE_EXHAUSTED
 */
GCM256_API gcm256_error_t gcm256_nonce_seq_next(gcm256_nonce_seq_t* seq, uint8_t nonce[12]);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

#include <atomic>
#include <utility>

namespace gcm256 {

/**
 * @brief AES-256-GCM AEAD class
 *
 * Immutable after construction; concurrent seal/open calls on one instance
 * are safe as long as every call uses its own nonce.
 */
class AES256GCM {
public:
    static constexpr size_t KEY_SIZE = GCM256_AES256_KEY_SIZE;
    static constexpr size_t NONCE_SIZE = GCM256_GCM_NONCE_SIZE;
    static constexpr size_t TAG_SIZE = GCM256_GCM_TAG_SIZE;

    /**
     * @brief Construct with 256-bit key
     * @throws std::invalid_argument if key is not 32 bytes
     */
    explicit AES256GCM(const ByteVec& key);
    explicit AES256GCM(const uint8_t* key, size_t key_len);
    explicit AES256GCM(const AES256Key& key);

    ~AES256GCM() = default;

    // Disable copy
    AES256GCM(const AES256GCM&) = delete;
    AES256GCM& operator=(const AES256GCM&) = delete;

    // Enable move
    AES256GCM(AES256GCM&&) noexcept = default;
    AES256GCM& operator=(AES256GCM&&) noexcept = default;

    /**
     * @brief Authenticated encryption
     * @param nonce 12-byte nonce (MUST be unique per message)
     * @param plaintext Input data
     * @param aad Additional authenticated data
     * @return Pair of (ciphertext, 16-byte tag)
     * @throws std::length_error if plaintext or aad exceed the GCM limits
     */
    std::pair<ByteVec, GcmTag> seal(
        const GcmNonce& nonce,
        const ByteVec& plaintext,
        const ByteVec& aad = {}
    ) const;

    /**
     * @throws std::invalid_argument if nonce is not 12 bytes
     */
    std::pair<ByteVec, GcmTag> seal(
        const ByteVec& nonce,
        const ByteVec& plaintext,
        const ByteVec& aad = {}
    ) const;

    /**
     * @brief Authenticated decryption
     * @param nonce 12-byte nonce
     * @param ciphertext Input data
     * @param tag Authentication tag
     * @param aad Additional authenticated data
     * @param plaintext Output, set only when authentication succeeds
     * @return true if the tag verified, false otherwise (plaintext cleared)
     */
    bool open(
        const GcmNonce& nonce,
        const ByteVec& ciphertext,
        const GcmTag& tag,
        const ByteVec& aad,
        ByteVec& plaintext
    ) const;

    /**
     * @throws std::invalid_argument if nonce is not 12 bytes or tag not 16
     */
    bool open(
        const ByteVec& nonce,
        const ByteVec& ciphertext,
        const ByteVec& tag,
        const ByteVec& aad,
        ByteVec& plaintext
    ) const;

    /**
     * @brief Generate random nonce
     * @throws std::runtime_error if the OS random source fails
     */
    static GcmNonce generateNonce();

    /**
     * @brief Generate random key
     * @throws std::runtime_error if the OS random source fails
     */
    static AES256Key generateKey();

private:
    AES256 cipher_;
};

/**
 * @brief Deterministic 96-bit nonce construction (SP 800-38D 8.2.1)
 *
 * Nonce = fixed field (4 bytes) || invocation counter (8 bytes, big-endian).
 * next() is lock-free and never returns the same value twice; after 2^64 - 1
 * nonces the sequence is exhausted and the key must be replaced.
 *
 * @code
 * NonceSequence nonces;
 * auto sealed = gcm.seal(nonces.next(), plaintext, aad);
 * @endcode
 */
class NonceSequence {
public:
    static constexpr size_t FIXED_SIZE = 4;

    /**
     * @brief Random fixed field
     * @throws std::runtime_error if the OS random source fails
     */
    NonceSequence();

    /**
     * @brief Caller-chosen fixed field, e.g. a device identifier
     * @param fixed Fixed field
     * @param start First counter value
     */
    explicit NonceSequence(const ByteArray<FIXED_SIZE>& fixed, uint64_t start = 0);

    NonceSequence(const NonceSequence&) = delete;
    NonceSequence& operator=(const NonceSequence&) = delete;

    /**
     * @brief Next unused nonce
     * @throws std::overflow_error when the counter space is exhausted
     */
    GcmNonce next();

    /**
     * @brief Number of nonces still available
     */
    uint64_t remaining() const noexcept;

    const ByteArray<FIXED_SIZE>& fixed() const noexcept { return fixed_; }

private:
    ByteArray<FIXED_SIZE> fixed_;
    std::atomic<uint64_t> counter_;
};

} // namespace gcm256

#endif // __cplusplus

#endif // GCM256_CRYPTO_GCM_H
