/**
 * @file aes.cpp
 * @brief AES-256 block cipher core (FIPS 197)
 *
 * Portable software implementation:
 * - Constexpr S-Box generation (compile-time, no runtime table setup)
 * - NO T-tables
 * - Round keys and temporaries securely zeroed
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "gcm256/crypto/aes.h"
#include "gcm256/core/security.h"
#include <array>
#include <cstring>
#include <stdexcept>
#include <utility>

// ============================================================================
// Constexpr S-Box Generation (Compile-time)
// ============================================================================

namespace {

// GF(2^8) multiplication helper for S-Box generation
constexpr uint8_t gf_mul_constexpr(uint8_t a, uint8_t b) {
    uint8_t result = 0;
    uint8_t temp = a;
    for (int i = 0; i < 8; ++i) {
        if ((b >> i) & 1) {
            result ^= temp;
        }
        uint8_t hi_bit = (temp >> 7) & 1;
        temp = static_cast<uint8_t>((temp << 1) ^ (hi_bit ? 0x1b : 0));
    }
    return result;
}

// a^(-1) = a^254 in GF(2^8); 0 maps to 0
constexpr uint8_t gf_inverse_constexpr(uint8_t a) {
    if (a == 0) return 0;
    uint8_t result = a;
    for (int i = 0; i < 6; ++i) {
        result = gf_mul_constexpr(result, result);
        result = gf_mul_constexpr(result, a);
    }
    result = gf_mul_constexpr(result, result);
    return result;
}

constexpr uint8_t affine_transform(uint8_t x) {
    uint8_t s = x;
    s ^= static_cast<uint8_t>((x << 1) | (x >> 7));
    s ^= static_cast<uint8_t>((x << 2) | (x >> 6));
    s ^= static_cast<uint8_t>((x << 3) | (x >> 5));
    s ^= static_cast<uint8_t>((x << 4) | (x >> 4));
    s ^= 0x63;
    return s;
}

constexpr uint8_t generate_sbox_entry(uint8_t i) {
    return affine_transform(gf_inverse_constexpr(i));
}

constexpr uint8_t inv_affine_transform(uint8_t x) {
    uint8_t s = static_cast<uint8_t>((x << 1) | (x >> 7));
    s ^= static_cast<uint8_t>((x << 3) | (x >> 5));
    s ^= static_cast<uint8_t>((x << 6) | (x >> 2));
    s ^= 0x05;
    return s;
}

constexpr uint8_t generate_inv_sbox_entry(uint8_t i) {
    return gf_inverse_constexpr(inv_affine_transform(i));
}

template<typename F, size_t... Is>
constexpr auto make_table_impl(F f, std::index_sequence<Is...>) {
    return std::array<uint8_t, sizeof...(Is)>{{f(static_cast<uint8_t>(Is))...}};
}

template<size_t N, typename F>
constexpr auto make_table(F f) {
    return make_table_impl(f, std::make_index_sequence<N>{});
}

constexpr auto SBOX = make_table<256>(generate_sbox_entry);
constexpr auto INV_SBOX = make_table<256>(generate_inv_sbox_entry);

static_assert(SBOX[0x00] == 0x63 && SBOX[0x53] == 0xed, "S-Box generation");
static_assert(INV_SBOX[0x63] == 0x00 && INV_SBOX[0xed] == 0x53, "Inverse S-Box generation");

// Round constants; AES-256 consumes RCON[1..7]
constexpr uint8_t RCON[8] = {
    0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40
};

constexpr int NK = GCM256_AES256_KEY_SIZE / 4;
constexpr int NR = GCM256_AES256_ROUNDS;
constexpr int SCHEDULE_WORDS = 4 * (NR + 1);

// ============================================================================
// Internal Helper Functions
// ============================================================================

inline uint8_t gf_mul(uint8_t a, uint8_t b) {
    uint8_t result = 0;
    uint8_t temp = a;
    for (size_t i = 0; i < 8; i++) {
        uint8_t mask = static_cast<uint8_t>(-static_cast<int8_t>((b >> i) & 1));
        result ^= (temp & mask);
        uint8_t hi_bit = static_cast<uint8_t>((temp >> 7) & 1);
        temp = static_cast<uint8_t>((temp << 1) ^ (0x1b & static_cast<uint8_t>(-static_cast<int8_t>(hi_bit))));
    }
    return result;
}

inline uint32_t sub_word(uint32_t w) {
    return (static_cast<uint32_t>(SBOX[(w >> 24) & 0xff]) << 24) |
           (static_cast<uint32_t>(SBOX[(w >> 16) & 0xff]) << 16) |
           (static_cast<uint32_t>(SBOX[(w >> 8) & 0xff]) << 8) |
           (static_cast<uint32_t>(SBOX[w & 0xff]));
}

// ============================================================================
// Key Expansion (big-endian words)
// ============================================================================

void key_expansion(const uint8_t* key, uint32_t* round_keys) {
    for (int i = 0; i < NK; i++) {
        round_keys[i] = (static_cast<uint32_t>(key[4*i]) << 24) |
                        (static_cast<uint32_t>(key[4*i+1]) << 16) |
                        (static_cast<uint32_t>(key[4*i+2]) << 8) |
                        (static_cast<uint32_t>(key[4*i+3]));
    }

    for (int i = NK; i < SCHEDULE_WORDS; i++) {
        uint32_t temp = round_keys[i - 1];
        if (i % NK == 0) {
            temp = sub_word(GCM256_ROTL32(temp, 8));
            temp ^= (static_cast<uint32_t>(RCON[i / NK]) << 24);
        } else if (i % NK == 4) {
            // 256-bit keys only: extra SubWord in the middle of each group
            temp = sub_word(temp);
        }
        round_keys[i] = round_keys[i - NK] ^ temp;
    }
}

// ============================================================================
// Round Operations
// ============================================================================

void sub_bytes(uint8_t state[16]) {
    for (int i = 0; i < 16; i++) state[i] = SBOX[state[i]];
}

void inv_sub_bytes(uint8_t state[16]) {
    for (int i = 0; i < 16; i++) state[i] = INV_SBOX[state[i]];
}

// State is column-major: state[4*c + r]. Row r rotates left by r.
void shift_rows(uint8_t state[16]) {
    uint8_t temp;
    temp = state[1]; state[1] = state[5]; state[5] = state[9]; state[9] = state[13]; state[13] = temp;
    temp = state[2]; state[2] = state[10]; state[10] = temp;
    temp = state[6]; state[6] = state[14]; state[14] = temp;
    temp = state[15]; state[15] = state[11]; state[11] = state[7]; state[7] = state[3]; state[3] = temp;
}

void inv_shift_rows(uint8_t state[16]) {
    uint8_t temp;
    temp = state[13]; state[13] = state[9]; state[9] = state[5]; state[5] = state[1]; state[1] = temp;
    temp = state[2]; state[2] = state[10]; state[10] = temp;
    temp = state[6]; state[6] = state[14]; state[14] = temp;
    temp = state[3]; state[3] = state[7]; state[7] = state[11]; state[11] = state[15]; state[15] = temp;
}

void mix_columns(uint8_t state[16]) {
    for (int i = 0; i < 4; i++) {
        int c = i * 4;
        uint8_t a0 = state[c], a1 = state[c+1], a2 = state[c+2], a3 = state[c+3];
        state[c]   = gf_mul(a0, 2) ^ gf_mul(a1, 3) ^ a2 ^ a3;
        state[c+1] = a0 ^ gf_mul(a1, 2) ^ gf_mul(a2, 3) ^ a3;
        state[c+2] = a0 ^ a1 ^ gf_mul(a2, 2) ^ gf_mul(a3, 3);
        state[c+3] = gf_mul(a0, 3) ^ a1 ^ a2 ^ gf_mul(a3, 2);
    }
}

void inv_mix_columns(uint8_t state[16]) {
    for (int i = 0; i < 4; i++) {
        int c = i * 4;
        uint8_t a0 = state[c], a1 = state[c+1], a2 = state[c+2], a3 = state[c+3];
        state[c]   = gf_mul(a0, 14) ^ gf_mul(a1, 11) ^ gf_mul(a2, 13) ^ gf_mul(a3, 9);
        state[c+1] = gf_mul(a0, 9) ^ gf_mul(a1, 14) ^ gf_mul(a2, 11) ^ gf_mul(a3, 13);
        state[c+2] = gf_mul(a0, 13) ^ gf_mul(a1, 9) ^ gf_mul(a2, 14) ^ gf_mul(a3, 11);
        state[c+3] = gf_mul(a0, 11) ^ gf_mul(a1, 13) ^ gf_mul(a2, 9) ^ gf_mul(a3, 14);
    }
}

void add_round_key(uint8_t state[16], const uint32_t* round_key) {
    for (int i = 0; i < 4; i++) {
        state[i*4]   ^= static_cast<uint8_t>((round_key[i] >> 24) & 0xff);
        state[i*4+1] ^= static_cast<uint8_t>((round_key[i] >> 16) & 0xff);
        state[i*4+2] ^= static_cast<uint8_t>((round_key[i] >> 8) & 0xff);
        state[i*4+3] ^= static_cast<uint8_t>(round_key[i] & 0xff);
    }
}

} // anonymous namespace

// ============================================================================
// Public C API
// ============================================================================

extern "C" {

gcm256_error_t gcm256_aes_init(gcm256_aes_ctx_t* ctx, const uint8_t* key, size_t key_len) {
    if (!ctx || !key) return GCM256_ERROR_INVALID_PARAM;
    if (key_len != GCM256_AES256_KEY_SIZE) return GCM256_ERROR_INVALID_KEY;

    key_expansion(key, ctx->round_keys);
    ctx->initialized = 1;
    return GCM256_SUCCESS;
}

gcm256_error_t gcm256_aes_encrypt_block(const gcm256_aes_ctx_t* ctx,
                                        const uint8_t input[16], uint8_t output[16]) {
    if (!ctx || !input || !output) return GCM256_ERROR_INVALID_PARAM;
    if (!ctx->initialized) return GCM256_ERROR_INVALID_STATE;

    uint8_t state[16];
    memcpy(state, input, 16);

    add_round_key(state, &ctx->round_keys[0]);
    for (int round = 1; round < NR; round++) {
        sub_bytes(state);
        shift_rows(state);
        mix_columns(state);
        add_round_key(state, &ctx->round_keys[round * 4]);
    }
    sub_bytes(state);
    shift_rows(state);
    add_round_key(state, &ctx->round_keys[NR * 4]);

    memcpy(output, state, 16);
    gcm256_secure_zero(state, 16);
    return GCM256_SUCCESS;
}

gcm256_error_t gcm256_aes_decrypt_block(const gcm256_aes_ctx_t* ctx,
                                        const uint8_t input[16], uint8_t output[16]) {
    if (!ctx || !input || !output) return GCM256_ERROR_INVALID_PARAM;
    if (!ctx->initialized) return GCM256_ERROR_INVALID_STATE;

    uint8_t state[16];
    memcpy(state, input, 16);

    const uint32_t* rk = ctx->round_keys;

    add_round_key(state, &rk[NR * 4]);
    for (int round = NR - 1; round > 0; round--) {
        inv_shift_rows(state);
        inv_sub_bytes(state);
        add_round_key(state, &rk[round * 4]);
        inv_mix_columns(state);
    }
    inv_shift_rows(state);
    inv_sub_bytes(state);
    add_round_key(state, &rk[0]);

    memcpy(output, state, 16);
    gcm256_secure_zero(state, 16);
    return GCM256_SUCCESS;
}

gcm256_error_t gcm256_aes_encrypt(const gcm256_aes_ctx_t* ctx, const uint8_t* input,
                                  size_t input_len, uint8_t output[16]) {
    if (input_len != GCM256_BLOCK_SIZE) return GCM256_ERROR_INVALID_BLOCK_SIZE;
    return gcm256_aes_encrypt_block(ctx, input, output);
}

gcm256_error_t gcm256_aes_decrypt(const gcm256_aes_ctx_t* ctx, const uint8_t* input,
                                  size_t input_len, uint8_t output[16]) {
    if (input_len != GCM256_BLOCK_SIZE) return GCM256_ERROR_INVALID_BLOCK_SIZE;
    return gcm256_aes_decrypt_block(ctx, input, output);
}

void gcm256_aes_clear(gcm256_aes_ctx_t* ctx) {
    if (ctx) gcm256_secure_zero(ctx, sizeof(gcm256_aes_ctx_t));
}

} // extern "C"

// ============================================================================
// C++ Class Implementation
// ============================================================================

namespace gcm256 {

AES256::AES256(const ByteVec& key) : AES256(key.data(), key.size()) {}

AES256::AES256(const uint8_t* key, size_t key_len) {
    gcm256_error_t err = gcm256_aes_init(&ctx_, key, key_len);
    if (err != GCM256_SUCCESS) throw std::invalid_argument("AES-256 key must be 32 bytes");
}

AES256::AES256(const AES256Key& key) : AES256(key.data(), key.size()) {}

AES256::~AES256() { gcm256_aes_clear(&ctx_); }

AES256::AES256(AES256&& other) noexcept {
    memcpy(&ctx_, &other.ctx_, sizeof(ctx_));
    gcm256_secure_zero(&other.ctx_, sizeof(other.ctx_));
}

AES256& AES256::operator=(AES256&& other) noexcept {
    if (this != &other) {
        gcm256_aes_clear(&ctx_);
        memcpy(&ctx_, &other.ctx_, sizeof(ctx_));
        gcm256_secure_zero(&other.ctx_, sizeof(other.ctx_));
    }
    return *this;
}

AESBlock AES256::encryptBlock(const AESBlock& input) const {
    AESBlock output;
    if (gcm256_aes_encrypt_block(&ctx_, input.data(), output.data()) != GCM256_SUCCESS)
        throw std::logic_error("AES-256 context is not initialized");
    return output;
}

AESBlock AES256::encryptBlock(const ByteVec& input) const {
    AESBlock output;
    gcm256_error_t err = gcm256_aes_encrypt(&ctx_, input.data(), input.size(), output.data());
    if (err == GCM256_ERROR_INVALID_BLOCK_SIZE) throw std::invalid_argument("invalid block size");
    if (err != GCM256_SUCCESS) throw std::logic_error("AES-256 context is not initialized");
    return output;
}

AESBlock AES256::decryptBlock(const AESBlock& input) const {
    AESBlock output;
    if (gcm256_aes_decrypt_block(&ctx_, input.data(), output.data()) != GCM256_SUCCESS)
        throw std::logic_error("AES-256 context is not initialized");
    return output;
}

AESBlock AES256::decryptBlock(const ByteVec& input) const {
    AESBlock output;
    gcm256_error_t err = gcm256_aes_decrypt(&ctx_, input.data(), input.size(), output.data());
    if (err == GCM256_ERROR_INVALID_BLOCK_SIZE) throw std::invalid_argument("invalid block size");
    if (err != GCM256_SUCCESS) throw std::logic_error("AES-256 context is not initialized");
    return output;
}

} // namespace gcm256
