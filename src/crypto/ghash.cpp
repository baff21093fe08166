/**
 * @file ghash.cpp
 * @brief GHASH Implementation - GF(2^128) Multiplication
 *
 * GHASH for GCM mode using a 4-bit table (Shoup's method): the sixteen
 * multiples i * H are precomputed once per hash subkey, then each block costs
 * 32 table lookups and shifts instead of 128 conditional XORs.
 *
 * Reference: NIST SP 800-38D
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "gcm256/crypto/ghash.h"
#include "gcm256/core/security.h"
#include <cstring>
#include <cstdint>
#include <stdexcept>

namespace gcm256 {
namespace internal {

namespace {

// Reduction of the four bits shifted out by Z * x^4, pre-shifted into the
// top 16 bits: R_TABLE[i] = (i * R) >> 4 for R = 0xE1 || 0^120
const uint64_t R_TABLE[16] = {
    0x0000000000000000ULL, 0x1C20000000000000ULL,
    0x3840000000000000ULL, 0x2460000000000000ULL,
    0x7080000000000000ULL, 0x6CA0000000000000ULL,
    0x48C0000000000000ULL, 0x54E0000000000000ULL,
    0xE100000000000000ULL, 0xFD20000000000000ULL,
    0xD940000000000000ULL, 0xC560000000000000ULL,
    0x9180000000000000ULL, 0x8DA0000000000000ULL,
    0xA9C0000000000000ULL, 0xB5E0000000000000ULL
};

uint64_t load_be64(const uint8_t* p) {
    return (static_cast<uint64_t>(p[0]) << 56) |
           (static_cast<uint64_t>(p[1]) << 48) |
           (static_cast<uint64_t>(p[2]) << 40) |
           (static_cast<uint64_t>(p[3]) << 32) |
           (static_cast<uint64_t>(p[4]) << 24) |
           (static_cast<uint64_t>(p[5]) << 16) |
           (static_cast<uint64_t>(p[6]) << 8) |
           static_cast<uint64_t>(p[7]);
}

void store_be64(uint8_t* p, uint64_t v) {
    for (int i = 7; i >= 0; i--) {
        p[7 - i] = static_cast<uint8_t>(v >> (i * 8));
    }
}

// Multiply by x in GCM bit order (right shift) with reduction
void mul_by_x(const uint64_t in[2], uint64_t out[2]) {
    uint64_t carry = in[1] & 1;
    out[1] = (in[1] >> 1) | ((in[0] & 1) << 63);
    out[0] = in[0] >> 1;
    out[0] ^= 0xE100000000000000ULL & (0 - carry);
}

}  // namespace

/**
 * @brief Precompute table[i] = i * H
 *
 * A nibble's most significant bit is the lowest power of x, so table[8] is
 * H itself, table[4] = H * x, table[2] = H * x^2, table[1] = H * x^3.
 */
void ghash_table_init(uint64_t table[16][2], const uint8_t h[16]) {
    table[0][0] = 0;
    table[0][1] = 0;
    table[8][0] = load_be64(h);
    table[8][1] = load_be64(h + 8);

    for (int i = 4; i > 0; i >>= 1) {
        mul_by_x(table[2 * i], table[i]);
    }
    for (int i = 2; i < 16; i <<= 1) {
        for (int j = 1; j < i; j++) {
            table[i + j][0] = table[i][0] ^ table[j][0];
            table[i + j][1] = table[i][1] ^ table[j][1];
        }
    }
}

/**
 * @brief Y = X * H using the precomputed table
 *
 * Horner evaluation from the highest-degree nibble (low nibble of byte 15)
 * down to the lowest (high nibble of byte 0).
 */
void ghash_table_mul(const uint64_t table[16][2], const uint8_t x[16], uint8_t y[16]) {
    uint64_t z_hi = 0, z_lo = 0;

    for (int i = 15; i >= 0; i--) {
        const int nibbles[2] = { x[i] & 0x0F, x[i] >> 4 };
        for (int idx : nibbles) {
            uint64_t reduce = R_TABLE[z_lo & 0xF];
            z_lo = (z_lo >> 4) | (z_hi << 60);
            z_hi = (z_hi >> 4) ^ reduce;

            z_hi ^= table[idx][0];
            z_lo ^= table[idx][1];
        }
    }

    store_be64(y, z_hi);
    store_be64(y + 8, z_lo);
}

namespace {

void process_block(gcm256_ghash_ctx_t* ctx, const uint8_t block[16]) {
    uint8_t temp[16];
    for (int i = 0; i < 16; i++) {
        temp[i] = ctx->state[i] ^ block[i];
    }
    ghash_table_mul(ctx->table, temp, ctx->state);
    gcm256_secure_zero(temp, 16);
}

void absorb(gcm256_ghash_ctx_t* ctx, const uint8_t* data, size_t len) {
    size_t offset = 0;

    if (ctx->buffer_len > 0) {
        size_t needed = 16 - ctx->buffer_len;
        if (len < needed) {
            memcpy(ctx->buffer + ctx->buffer_len, data, len);
            ctx->buffer_len += len;
            return;
        }
        memcpy(ctx->buffer + ctx->buffer_len, data, needed);
        process_block(ctx, ctx->buffer);
        offset = needed;
        ctx->buffer_len = 0;
    }

    while (offset + 16 <= len) {
        process_block(ctx, data + offset);
        offset += 16;
    }

    if (offset < len) {
        memcpy(ctx->buffer, data + offset, len - offset);
        ctx->buffer_len = len - offset;
    }
}

// Zero-pad and fold a pending partial block
void flush(gcm256_ghash_ctx_t* ctx) {
    if (ctx->buffer_len > 0) {
        memset(ctx->buffer + ctx->buffer_len, 0, 16 - ctx->buffer_len);
        process_block(ctx, ctx->buffer);
        ctx->buffer_len = 0;
    }
}

}  // namespace

}  // namespace internal
}  // namespace gcm256

// ============================================================================
// C ABI Exports
// ============================================================================

extern "C" {

gcm256_error_t gcm256_ghash_init(gcm256_ghash_ctx_t* ctx, const uint8_t h[16]) {
    if (!ctx || !h) return GCM256_ERROR_INVALID_PARAM;

    memset(ctx, 0, sizeof(gcm256_ghash_ctx_t));
    gcm256::internal::ghash_table_init(ctx->table, h);
    return GCM256_SUCCESS;
}

gcm256_error_t gcm256_ghash_update_aad(gcm256_ghash_ctx_t* ctx, const uint8_t* aad, size_t aad_len) {
    if (!ctx) return GCM256_ERROR_INVALID_PARAM;
    if (aad_len > 0 && !aad) return GCM256_ERROR_INVALID_PARAM;
    if (ctx->finalized || ctx->ct_len > 0) return GCM256_ERROR_INVALID_STATE;
    if (aad_len > GCM256_GCM_MAX_AAD - ctx->aad_len) return GCM256_ERROR_LENGTH_LIMIT;

    if (aad_len > 0) {
        gcm256::internal::absorb(ctx, aad, aad_len);
        ctx->aad_len += aad_len;
    }
    return GCM256_SUCCESS;
}

gcm256_error_t gcm256_ghash_update(gcm256_ghash_ctx_t* ctx, const uint8_t* data, size_t len) {
    if (!ctx) return GCM256_ERROR_INVALID_PARAM;
    if (len > 0 && !data) return GCM256_ERROR_INVALID_PARAM;
    if (ctx->finalized) return GCM256_ERROR_INVALID_STATE;
    if (len > GCM256_GCM_MAX_PLAINTEXT - ctx->ct_len) return GCM256_ERROR_LENGTH_LIMIT;

    if (len > 0) {
        // AAD and ciphertext are padded independently
        if (ctx->ct_len == 0) gcm256::internal::flush(ctx);
        gcm256::internal::absorb(ctx, data, len);
        ctx->ct_len += len;
    }
    return GCM256_SUCCESS;
}

gcm256_error_t gcm256_ghash_final(gcm256_ghash_ctx_t* ctx, uint8_t out[16]) {
    if (!ctx || !out) return GCM256_ERROR_INVALID_PARAM;
    if (ctx->finalized) return GCM256_ERROR_INVALID_STATE;

    gcm256::internal::flush(ctx);

    uint8_t len_block[16];
    gcm256::internal::store_be64(len_block, ctx->aad_len * 8);
    gcm256::internal::store_be64(len_block + 8, ctx->ct_len * 8);
    gcm256::internal::process_block(ctx, len_block);

    memcpy(out, ctx->state, 16);
    ctx->finalized = 1;
    return GCM256_SUCCESS;
}

void gcm256_ghash_clear(gcm256_ghash_ctx_t* ctx) {
    if (ctx) gcm256_secure_zero(ctx, sizeof(gcm256_ghash_ctx_t));
}

}  // extern "C"

// ============================================================================
// C++ Class Implementation
// ============================================================================

namespace gcm256 {

GHash::GHash(const AESBlock& h) {
    if (gcm256_ghash_init(&ctx_, h.data()) != GCM256_SUCCESS)
        throw std::invalid_argument("GHASH: invalid hash subkey");
}

GHash::~GHash() { gcm256_ghash_clear(&ctx_); }

void GHash::updateAAD(const uint8_t* data, size_t len) {
    gcm256_error_t err = gcm256_ghash_update_aad(&ctx_, data, len);
    if (err == GCM256_ERROR_INVALID_STATE) throw std::logic_error("GHASH: AAD must precede ciphertext");
    if (err == GCM256_ERROR_LENGTH_LIMIT) throw std::length_error("GHASH: AAD too long");
    if (err != GCM256_SUCCESS) throw std::invalid_argument("GHASH: invalid AAD buffer");
}

void GHash::update(const uint8_t* data, size_t len) {
    gcm256_error_t err = gcm256_ghash_update(&ctx_, data, len);
    if (err == GCM256_ERROR_INVALID_STATE) throw std::logic_error("GHASH: already finalized");
    if (err == GCM256_ERROR_LENGTH_LIMIT) throw std::length_error("GHASH: ciphertext too long");
    if (err != GCM256_SUCCESS) throw std::invalid_argument("GHASH: invalid data buffer");
}

AESBlock GHash::finalize() {
    AESBlock out;
    if (gcm256_ghash_final(&ctx_, out.data()) != GCM256_SUCCESS)
        throw std::logic_error("GHASH: already finalized");
    return out;
}

AESBlock GHash::digest(const AESBlock& h, const ByteVec& aad, const ByteVec& ciphertext) {
    GHash ghash(h);
    ghash.updateAAD(aad);
    ghash.update(ciphertext);
    return ghash.finalize();
}

}  // namespace gcm256
