/**
 * @file nonce.cpp
 * @brief Deterministic GCM nonce construction
 *
 * Nonce = fixed field (32 bits) || invocation counter (64 bits, big-endian),
 * NIST SP 800-38D section 8.2.1. The counter value UINT64_MAX is never
 * issued and marks exhaustion.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include "gcm256/crypto/gcm.h"
#include "gcm256/core/security.h"
#include <cstring>
#include <stdexcept>

namespace {

constexpr uint64_t COUNTER_EXHAUSTED = UINT64_MAX;

inline void build_nonce(const uint8_t fixed[4], uint64_t counter, uint8_t nonce[12]) {
    memcpy(nonce, fixed, 4);
    for (int i = 0; i < 8; i++) {
        nonce[4 + i] = static_cast<uint8_t>(counter >> (56 - 8 * i));
    }
}

} // anonymous namespace

extern "C" {

gcm256_error_t gcm256_nonce_seq_init(gcm256_nonce_seq_t* seq, const uint8_t fixed[4]) {
    if (!seq || !fixed) return GCM256_ERROR_INVALID_PARAM;

    memcpy(seq->fixed, fixed, 4);
    seq->counter = 0;
    return GCM256_SUCCESS;
}

gcm256_error_t gcm256_nonce_seq_next(gcm256_nonce_seq_t* seq, uint8_t nonce[12]) {
    if (!seq || !nonce) return GCM256_ERROR_INVALID_PARAM;
    if (seq->counter == COUNTER_EXHAUSTED) return GCM256_ERROR_NONCE_EXHAUSTED;

    build_nonce(seq->fixed, seq->counter, nonce);
    seq->counter++;
    return GCM256_SUCCESS;
}

} // extern "C"

namespace gcm256 {

NonceSequence::NonceSequence() : counter_(0) {
    if (gcm256_random_bytes(fixed_.data(), fixed_.size()) != GCM256_SUCCESS) {
        throw std::runtime_error("Failed to generate nonce fixed field");
    }
}

NonceSequence::NonceSequence(const ByteArray<FIXED_SIZE>& fixed, uint64_t start)
    : fixed_(fixed), counter_(start) {}

GcmNonce NonceSequence::next() {
    uint64_t current = counter_.load(std::memory_order_relaxed);
    do {
        if (current == COUNTER_EXHAUSTED) {
            throw std::overflow_error("GCM nonce sequence exhausted, re-key required");
        }
    } while (!counter_.compare_exchange_weak(current, current + 1,
                                             std::memory_order_relaxed));

    GcmNonce nonce;
    build_nonce(fixed_.data(), current, nonce.data());
    return nonce;
}

uint64_t NonceSequence::remaining() const noexcept {
    return COUNTER_EXHAUSTED - counter_.load(std::memory_order_relaxed);
}

} // namespace gcm256
