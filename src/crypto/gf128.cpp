/**
 * @file gf128.cpp
 * @brief GF(2^128) multiplication, bit-serial reference
 *
 * Implements SP 800-38D Algorithm 1: for each bit of X from the most
 * significant, Z ^= V when the bit is set, then V = V * x with reduction by
 * R = 0xE1 || 0^120 when the bit shifted out of V is set.
 *
 * Branch-free masks keep the running time independent of operand values.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "gcm256/crypto/ghash.h"
#include "gcm256/core/security.h"
#include <cstring>
#include <cstdint>

namespace gcm256 {
namespace internal {

void gf128_mul(const uint8_t x[16], const uint8_t y[16], uint8_t z[16]) {
    uint8_t v[16], acc[16];
    memcpy(v, y, 16);
    memset(acc, 0, 16);

    for (int i = 0; i < 16; i++) {
        for (int j = 7; j >= 0; j--) {
            uint8_t mask = static_cast<uint8_t>(-static_cast<int8_t>((x[i] >> j) & 1));
            for (int k = 0; k < 16; k++) acc[k] ^= (v[k] & mask);

            uint8_t lsb = v[15] & 1;
            for (int k = 15; k > 0; k--) v[k] = static_cast<uint8_t>((v[k] >> 1) | ((v[k-1] & 1) << 7));
            v[0] >>= 1;
            uint8_t lsb_mask = static_cast<uint8_t>(-static_cast<int8_t>(lsb));
            v[0] ^= (0xe1 & lsb_mask);
        }
    }

    // x and y are fully consumed before z is written, so aliasing is fine
    memcpy(z, acc, 16);
    gcm256_secure_zero(v, 16);
    gcm256_secure_zero(acc, 16);
}

}  // namespace internal

namespace gf128 {

AESBlock multiply(const AESBlock& x, const AESBlock& y) {
    AESBlock z;
    internal::gf128_mul(x.data(), y.data(), z.data());
    return z;
}

AESBlock one() {
    AESBlock e{};
    e[0] = 0x80;
    return e;
}

}  // namespace gf128
}  // namespace gcm256

extern "C" void gcm256_gf128_mul(const uint8_t x[16], const uint8_t y[16], uint8_t z[16]) {
    if (!x || !y || !z) return;
    gcm256::internal::gf128_mul(x, y, z);
}
