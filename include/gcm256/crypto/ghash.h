/**
 * @file ghash.h
 * @brief GF(2^128) arithmetic and the GHASH universal hash (NIST SP 800-38D)
 *
 * Field elements are 16-byte blocks in GCM bit order: bit 0 is the most
 * significant bit of byte 0. The reduction polynomial is
 * x^128 + x^7 + x^2 + x + 1, i.e. R = 0xE1 || 0^120.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#ifndef GCM256_CRYPTO_GHASH_H
#define GCM256_CRYPTO_GHASH_H

#include "gcm256/core/common.h"
#include "gcm256/core/types.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * GF(2^128) Multiplication
 * ============================================================================ */

/**
 * @brief Z = X * Y in GF(2^128), bit-serial (SP 800-38D Algorithm 1)
 *
 * @param x First operand (16 bytes)
 * @param y Second operand (16 bytes)
 * @param z Product (16 bytes, may alias x or y)
 */
GCM256_API void gcm256_gf128_mul(const uint8_t x[16], const uint8_t y[16], uint8_t z[16]);

/* ============================================================================
 * GHASH
 * ============================================================================ */

/**
 * @brief GHASH context
 *
 * Holds the 4-bit multiplication table for H, the running accumulator and a
 * partial-block buffer. AAD must be fed before any ciphertext.
 */
typedef struct {
    uint64_t table[16][2];  // table[i] = i * H (Shoup 4-bit method)
    uint8_t state[16];      // Running accumulator Y
    uint8_t buffer[16];     // Pending partial block
    size_t buffer_len;
    uint64_t aad_len;       // AAD bytes absorbed
    uint64_t ct_len;        // Ciphertext bytes absorbed
    int finalized;
} gcm256_ghash_ctx_t;

/**
 * @brief Initialize GHASH with hash subkey H
 * @param ctx GHASH context
 * @param h Hash subkey, normally E_K(0^128)
 * @return GCM256_SUCCESS or GCM256_ERROR_INVALID_PARAM
 */
GCM256_API gcm256_error_t gcm256_ghash_init(gcm256_ghash_ctx_t* ctx, const uint8_t h[16]);

/**
 * @brief Absorb associated data
 *
 * May be called repeatedly; the final partial block is zero-padded when the
 * first ciphertext byte arrives or at finalization.
 *
 * @return GCM256_ERROR_INVALID_STATE if ciphertext was already absorbed or
 *         the context is finalized
 */
GCM256_API gcm256_error_t gcm256_ghash_update_aad(gcm256_ghash_ctx_t* ctx,
                                                  const uint8_t* aad, size_t aad_len);

/**
 * @brief Absorb ciphertext
 * @return GCM256_ERROR_INVALID_STATE if the context is finalized
 */
GCM256_API gcm256_error_t gcm256_ghash_update(gcm256_ghash_ctx_t* ctx,
                                              const uint8_t* data, size_t len);

/**
 * @brief Fold the length block and output the digest S
 *
 * The length block is [len(A)]_64 || [len(C)]_64 in bits, big-endian.
 *
 * @param ctx GHASH context
 * @param out 16-byte digest
 */
GCM256_API gcm256_error_t gcm256_ghash_final(gcm256_ghash_ctx_t* ctx, uint8_t out[16]);

/**
 * @brief Clear GHASH context (secure zeroing)
 */
GCM256_API void gcm256_ghash_clear(gcm256_ghash_ctx_t* ctx);

#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

namespace gcm256 {

namespace gf128 {

/**
 * @brief Product in GF(2^128)
 */
AESBlock multiply(const AESBlock& x, const AESBlock& y);

/**
 * @brief Multiplicative identity (0x80 || 0^120 in GCM bit order)
 */
AESBlock one();

} // namespace gf128

/**
 * @brief Incremental GHASH
 *
 * @code
 * GHash ghash(h);
 * ghash.updateAAD(aad);
 * ghash.update(ciphertext);
 * AESBlock s = ghash.finalize();
 * @endcode
 */
class GHash {
public:
    explicit GHash(const AESBlock& h);
    ~GHash();

    GHash(const GHash&) = delete;
    GHash& operator=(const GHash&) = delete;

    /**
     * @throws std::logic_error after update() or finalize()
     */
    void updateAAD(const uint8_t* data, size_t len);
    void updateAAD(const ByteVec& data) { updateAAD(data.data(), data.size()); }

    /**
     * @throws std::logic_error after finalize()
     */
    void update(const uint8_t* data, size_t len);
    void update(const ByteVec& data) { update(data.data(), data.size()); }

    /**
     * @brief Append the length block and return the digest
     * @throws std::logic_error if called twice
     */
    AESBlock finalize();

    /**
     * @brief One-shot GHASH_H(A, C)
     */
    static AESBlock digest(const AESBlock& h, const ByteVec& aad, const ByteVec& ciphertext);

private:
    gcm256_ghash_ctx_t ctx_;
};

} // namespace gcm256

#endif // __cplusplus

#endif // GCM256_CRYPTO_GHASH_H
