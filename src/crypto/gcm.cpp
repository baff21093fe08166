/**
 * @file gcm.cpp
 * @brief AES-256-GCM implementation
 *
 * One-shot seal/open, streaming encryption and the C++ AEAD class. The
 * counter-mode pass and GHASH come from ctr.cpp and ghash.cpp; this file only
 * derives H and J0 and assembles the tag.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "gcm256/crypto/gcm.h"
#include "gcm256/crypto/ctr.h"
#include "gcm256/core/security.h"
#include <cstring>
#include <stdexcept>

namespace {

// J0 = IV || 0^31 || 1 for 96-bit IVs
inline void make_j0(const uint8_t iv[12], uint8_t j0[16]) {
    memcpy(j0, iv, 12);
    j0[12] = 0;
    j0[13] = 0;
    j0[14] = 0;
    j0[15] = 1;
}

gcm256_error_t check_lengths(size_t aad_len, size_t input_len) {
    if (static_cast<uint64_t>(input_len) > GCM256_GCM_MAX_PLAINTEXT) return GCM256_ERROR_LENGTH_LIMIT;
    if (static_cast<uint64_t>(aad_len) > GCM256_GCM_MAX_AAD) return GCM256_ERROR_LENGTH_LIMIT;
    return GCM256_SUCCESS;
}

/**
 * Tag = GHASH_H(A, C) XOR E_K(J0)
 */
gcm256_error_t compute_tag(const gcm256_aes_ctx_t* ctx, const uint8_t j0[16],
                           const uint8_t* aad, size_t aad_len,
                           const uint8_t* ct, size_t ct_len, uint8_t tag[16]) {
    uint8_t h[16] = {0};
    uint8_t ek_j0[16];
    gcm256_ghash_ctx_t ghash;

    gcm256_error_t err = gcm256_aes_encrypt_block(ctx, h, h);
    if (err == GCM256_SUCCESS) err = gcm256_ghash_init(&ghash, h);
    if (err == GCM256_SUCCESS) err = gcm256_ghash_update_aad(&ghash, aad, aad_len);
    if (err == GCM256_SUCCESS) err = gcm256_ghash_update(&ghash, ct, ct_len);
    if (err == GCM256_SUCCESS) err = gcm256_ghash_final(&ghash, tag);
    if (err == GCM256_SUCCESS) err = gcm256_aes_encrypt_block(ctx, j0, ek_j0);
    if (err == GCM256_SUCCESS) {
        for (int i = 0; i < 16; i++) tag[i] ^= ek_j0[i];
    }

    gcm256_secure_zero(h, 16);
    gcm256_secure_zero(ek_j0, 16);
    gcm256_ghash_clear(&ghash);
    return err;
}

} // anonymous namespace

// ============================================================================
// One-shot AEAD
// ============================================================================

extern "C" {

gcm256_error_t gcm256_gcm_encrypt(const gcm256_aes_ctx_t* ctx,
                                  const uint8_t* iv, size_t iv_len,
                                  const uint8_t* aad, size_t aad_len,
                                  const uint8_t* input, size_t input_len,
                                  uint8_t* output, uint8_t tag[16]) {
    if (!ctx || !iv || !tag) return GCM256_ERROR_INVALID_PARAM;
    if (iv_len != GCM256_GCM_NONCE_SIZE) return GCM256_ERROR_INVALID_IV;
    if (!ctx->initialized) return GCM256_ERROR_INVALID_STATE;

    gcm256_error_t err = check_lengths(aad_len, input_len);
    if (err != GCM256_SUCCESS) return err;
    if (aad_len > 0 && !aad) return GCM256_ERROR_INVALID_PARAM;
    if (input_len > 0 && (!input || !output)) return GCM256_ERROR_INVALID_PARAM;

    uint8_t j0[16];
    uint8_t counter[16];
    make_j0(iv, j0);
    memcpy(counter, j0, 16);
    gcm256::ctr::inc32(counter);

    err = gcm256_ctr32_crypt(ctx, counter, input, input_len, output);
    if (err == GCM256_SUCCESS) {
        err = compute_tag(ctx, j0, aad, aad_len, output, input_len, tag);
    }

    gcm256_secure_zero(j0, 16);
    gcm256_secure_zero(counter, 16);
    return err;
}

gcm256_error_t gcm256_gcm_decrypt(const gcm256_aes_ctx_t* ctx,
                                  const uint8_t* iv, size_t iv_len,
                                  const uint8_t* aad, size_t aad_len,
                                  const uint8_t* input, size_t input_len,
                                  const uint8_t* tag, size_t tag_len,
                                  uint8_t* output) {
    if (!ctx || !iv || !tag) return GCM256_ERROR_INVALID_PARAM;
    if (iv_len != GCM256_GCM_NONCE_SIZE) return GCM256_ERROR_INVALID_IV;
    if (tag_len != GCM256_GCM_TAG_SIZE) return GCM256_ERROR_INVALID_TAG;
    if (!ctx->initialized) return GCM256_ERROR_INVALID_STATE;

    gcm256_error_t err = check_lengths(aad_len, input_len);
    if (err != GCM256_SUCCESS) return err;
    if (aad_len > 0 && !aad) return GCM256_ERROR_INVALID_PARAM;
    if (input_len > 0 && (!input || !output)) return GCM256_ERROR_INVALID_PARAM;

    uint8_t j0[16];
    uint8_t counter[16];
    uint8_t computed_tag[16];
    make_j0(iv, j0);

    // Verify before decrypting
    err = compute_tag(ctx, j0, aad, aad_len, input, input_len, computed_tag);
    if (err == GCM256_SUCCESS && !gcm256_secure_compare(tag, computed_tag, 16)) {
        err = GCM256_ERROR_AUTH_FAILED;
    }

    if (err == GCM256_SUCCESS) {
        memcpy(counter, j0, 16);
        gcm256::ctr::inc32(counter);
        err = gcm256_ctr32_crypt(ctx, counter, input, input_len, output);
        gcm256_secure_zero(counter, 16);
    }

    if (err != GCM256_SUCCESS && input_len > 0) {
        gcm256_secure_zero(output, input_len);
    }

    gcm256_secure_zero(j0, 16);
    gcm256_secure_zero(computed_tag, 16);
    return err;
}

// ============================================================================
// Streaming Encryption
// ============================================================================

gcm256_error_t gcm256_gcm_init(gcm256_gcm_ctx_t* ctx,
                               const uint8_t* key, size_t key_len,
                               const uint8_t* iv, size_t iv_len) {
    if (!ctx || !key || !iv) return GCM256_ERROR_INVALID_PARAM;
    if (iv_len != GCM256_GCM_NONCE_SIZE) return GCM256_ERROR_INVALID_IV;

    memset(ctx, 0, sizeof(gcm256_gcm_ctx_t));

    gcm256_error_t err = gcm256_aes_init(&ctx->aes_ctx, key, key_len);
    if (err != GCM256_SUCCESS) return err;

    uint8_t h[16] = {0};
    err = gcm256_aes_encrypt_block(&ctx->aes_ctx, h, h);
    if (err == GCM256_SUCCESS) err = gcm256_ghash_init(&ctx->ghash, h);
    gcm256_secure_zero(h, 16);
    if (err != GCM256_SUCCESS) {
        gcm256_gcm_clear(ctx);
        return err;
    }

    make_j0(iv, ctx->j0);
    memcpy(ctx->counter, ctx->j0, 16);
    gcm256::ctr::inc32(ctx->counter);
    ctx->keystream_pos = 16;

    return GCM256_SUCCESS;
}

gcm256_error_t gcm256_gcm_update_aad(gcm256_gcm_ctx_t* ctx,
                                     const uint8_t* aad, size_t aad_len) {
    if (!ctx) return GCM256_ERROR_INVALID_PARAM;
    if (ctx->finalized || !ctx->aes_ctx.initialized) return GCM256_ERROR_INVALID_STATE;

    return gcm256_ghash_update_aad(&ctx->ghash, aad, aad_len);
}

gcm256_error_t gcm256_gcm_update_encrypt(gcm256_gcm_ctx_t* ctx,
                                         const uint8_t* input, size_t input_len,
                                         uint8_t* output) {
    if (!ctx) return GCM256_ERROR_INVALID_PARAM;
    if (ctx->finalized || !ctx->aes_ctx.initialized) return GCM256_ERROR_INVALID_STATE;
    if (input_len == 0) return GCM256_SUCCESS;
    if (!input || !output) return GCM256_ERROR_INVALID_PARAM;
    if (static_cast<uint64_t>(input_len) > GCM256_GCM_MAX_PLAINTEXT - ctx->ghash.ct_len) {
        return GCM256_ERROR_LENGTH_LIMIT;
    }

    for (size_t i = 0; i < input_len; i++) {
        if (ctx->keystream_pos == 16) {
            gcm256_error_t err = gcm256_aes_encrypt_block(&ctx->aes_ctx, ctx->counter, ctx->keystream);
            if (err != GCM256_SUCCESS) return err;
            gcm256::ctr::inc32(ctx->counter);
            ctx->keystream_pos = 0;
        }
        output[i] = input[i] ^ ctx->keystream[ctx->keystream_pos++];
    }

    return gcm256_ghash_update(&ctx->ghash, output, input_len);
}

gcm256_error_t gcm256_gcm_final_encrypt(gcm256_gcm_ctx_t* ctx, uint8_t tag[16]) {
    if (!ctx || !tag) return GCM256_ERROR_INVALID_PARAM;
    if (ctx->finalized || !ctx->aes_ctx.initialized) return GCM256_ERROR_INVALID_STATE;

    uint8_t ek_j0[16] = {0};
    gcm256_error_t err = gcm256_ghash_final(&ctx->ghash, tag);
    if (err == GCM256_SUCCESS) err = gcm256_aes_encrypt_block(&ctx->aes_ctx, ctx->j0, ek_j0);

    if (err == GCM256_SUCCESS) {
        for (int i = 0; i < 16; i++) tag[i] ^= ek_j0[i];
        ctx->finalized = 1;
    } else {
        gcm256_secure_zero(tag, 16);
    }

    gcm256_secure_zero(ek_j0, 16);
    gcm256_secure_zero(ctx->keystream, 16);
    return err;
}

void gcm256_gcm_clear(gcm256_gcm_ctx_t* ctx) {
    if (ctx) gcm256_secure_zero(ctx, sizeof(gcm256_gcm_ctx_t));
}

} // extern "C"

// ============================================================================
// C++ Class Implementation
// ============================================================================

namespace gcm256 {

namespace {

void throw_on_error(gcm256_error_t err) {
    switch (err) {
        case GCM256_SUCCESS:
            return;
        case GCM256_ERROR_INVALID_IV:
            throw std::invalid_argument("GCM nonce must be 12 bytes");
        case GCM256_ERROR_INVALID_TAG:
            throw std::invalid_argument("GCM tag must be 16 bytes");
        case GCM256_ERROR_LENGTH_LIMIT:
            throw std::length_error("GCM input exceeds the maximum length");
        case GCM256_ERROR_INVALID_STATE:
            throw std::logic_error("AES-256-GCM instance has been moved from");
        default:
            throw std::invalid_argument(gcm256_error_string(err));
    }
}

} // anonymous namespace

AES256GCM::AES256GCM(const ByteVec& key) : cipher_(key) {}

AES256GCM::AES256GCM(const uint8_t* key, size_t key_len) : cipher_(key, key_len) {}

AES256GCM::AES256GCM(const AES256Key& key) : cipher_(key) {}

std::pair<ByteVec, GcmTag> AES256GCM::seal(const GcmNonce& nonce,
                                            const ByteVec& plaintext,
                                            const ByteVec& aad) const {
    ByteVec ciphertext(plaintext.size());
    GcmTag tag;

    throw_on_error(gcm256_gcm_encrypt(cipher_.context(),
                                      nonce.data(), nonce.size(),
                                      aad.data(), aad.size(),
                                      plaintext.data(), plaintext.size(),
                                      ciphertext.data(), tag.data()));
    return {std::move(ciphertext), tag};
}

std::pair<ByteVec, GcmTag> AES256GCM::seal(const ByteVec& nonce,
                                            const ByteVec& plaintext,
                                            const ByteVec& aad) const {
    if (nonce.size() != NONCE_SIZE) {
        throw std::invalid_argument("GCM nonce must be 12 bytes");
    }
    GcmNonce n;
    memcpy(n.data(), nonce.data(), NONCE_SIZE);
    return seal(n, plaintext, aad);
}

bool AES256GCM::open(const GcmNonce& nonce,
                     const ByteVec& ciphertext,
                     const GcmTag& tag,
                     const ByteVec& aad,
                     ByteVec& plaintext) const {
    ByteVec output(ciphertext.size());

    gcm256_error_t err = gcm256_gcm_decrypt(cipher_.context(),
                                            nonce.data(), nonce.size(),
                                            aad.data(), aad.size(),
                                            ciphertext.data(), ciphertext.size(),
                                            tag.data(), tag.size(),
                                            output.data());
    if (err == GCM256_ERROR_AUTH_FAILED) {
        gcm256_secure_zero(plaintext.data(), plaintext.size());
        plaintext.clear();
        return false;
    }
    throw_on_error(err);

    plaintext = std::move(output);
    return true;
}

bool AES256GCM::open(const ByteVec& nonce,
                     const ByteVec& ciphertext,
                     const ByteVec& tag,
                     const ByteVec& aad,
                     ByteVec& plaintext) const {
    if (nonce.size() != NONCE_SIZE) {
        throw std::invalid_argument("GCM nonce must be 12 bytes");
    }
    if (tag.size() != TAG_SIZE) {
        throw std::invalid_argument("GCM tag must be 16 bytes");
    }

    GcmNonce n;
    GcmTag t;
    memcpy(n.data(), nonce.data(), NONCE_SIZE);
    memcpy(t.data(), tag.data(), TAG_SIZE);
    return open(n, ciphertext, t, aad, plaintext);
}

GcmNonce AES256GCM::generateNonce() {
    GcmNonce nonce;
    if (gcm256_random_bytes(nonce.data(), nonce.size()) != GCM256_SUCCESS) {
        throw std::runtime_error("Failed to generate random nonce");
    }
    return nonce;
}

AES256Key AES256GCM::generateKey() {
    AES256Key key;
    if (gcm256_random_bytes(key.data(), key.size()) != GCM256_SUCCESS) {
        throw std::runtime_error("Failed to generate random key");
    }
    return key;
}

} // namespace gcm256
