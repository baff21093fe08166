/**
 * @file test_gcm.cpp
 * @brief AES-256-GCM unit tests
 *
 * Tests for the AEAD layer:
 * - Known answers: McGrew & Viega GCM test cases 13 to 16 (AES-256)
 * - Tamper detection on ciphertext, tag, AAD and nonce
 * - Parameter validation and length limits
 * - Streaming encryption against one-shot
 * - Deterministic nonce sequence
 *
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include <gtest/gtest.h>
#include <cstdio>
#include <cstring>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gcm256/gcm256.h"

using gcm256::AES256GCM;
using gcm256::ByteVec;
using gcm256::GcmNonce;
using gcm256::GcmTag;

/**
 * @brief Convert hex string to bytes
 */
static std::vector<uint8_t> hex_to_bytes(const std::string& hex) {
    std::vector<uint8_t> bytes;
    for (size_t i = 0; i < hex.length(); i += 2) {
        auto byte = static_cast<uint8_t>(
            std::stoi(hex.substr(i, 2), nullptr, 16));
        bytes.push_back(byte);
    }
    return bytes;
}

/**
 * @brief Convert bytes to hex string
 */
static std::string bytes_to_hex(const uint8_t* data, size_t len) {
    std::string hex;
    char buf[3];
    for (size_t i = 0; i < len; ++i) {
        snprintf(buf, sizeof(buf), "%02x", data[i]);
        hex += buf;
    }
    return hex;
}

template<size_t N>
static std::array<uint8_t, N> to_array(const std::vector<uint8_t>& v) {
    std::array<uint8_t, N> out{};
    memcpy(out.data(), v.data(), N);
    return out;
}

class GCMTest : public ::testing::Test {
protected:
    const std::string key_hex_ =
        "feffe9928665731c6d6a8f9467308308feffe9928665731c6d6a8f9467308308";
    const std::string nonce_hex_ = "cafebabefacedbaddecaf888";
    const std::string pt_hex_ =
        "d9313225f88406e5a55909c5aff5269a86a7a9531534f7da2e4c303d8a318a72"
        "1c3c0c95956809532fcf0e2449a6b525b16aedf5aa0de657ba637b391aafd255";
    const std::string ct_hex_ =
        "522dc1f099567d07f47f37a32a84427d643a8cdcbfe5c0c97598a2bd2555d1aa"
        "8cb08e48590dbb3da7b08b1056828838c5f61e6393ba7a0abcc9f662898015ad";
    const std::string aad_hex_ = "feedfacedeadbeeffeedfacedeadbeefabaddad2";

    ByteVec key() const { return hex_to_bytes(key_hex_); }
    GcmNonce nonce() const { return to_array<12>(hex_to_bytes(nonce_hex_)); }
    ByteVec plaintext() const { return hex_to_bytes(pt_hex_); }
    ByteVec plaintext60() const {
        ByteVec pt = plaintext();
        pt.resize(60);
        return pt;
    }
    ByteVec aad() const { return hex_to_bytes(aad_hex_); }
};

// ============================================================================
// Known Answer Tests
// ============================================================================

// Test case 13: zero key, empty plaintext, no AAD
TEST_F(GCMTest, KAT_Case13_EmptyPlaintext) {
    AES256GCM gcm(ByteVec(32, 0));
    GcmNonce nonce{};

    auto sealed = gcm.seal(nonce, ByteVec{});
    EXPECT_TRUE(sealed.first.empty());
    EXPECT_EQ(bytes_to_hex(sealed.second.data(), 16), "530f8afbc74536b9a963b4f1c4cb738b");

    ByteVec out;
    EXPECT_TRUE(gcm.open(nonce, sealed.first, sealed.second, {}, out));
    EXPECT_TRUE(out.empty());
}

// Test case 14: zero key, one zero block
TEST_F(GCMTest, KAT_Case14_ZeroBlock) {
    AES256GCM gcm(ByteVec(32, 0));
    GcmNonce nonce{};

    auto sealed = gcm.seal(nonce, ByteVec(16, 0));
    EXPECT_EQ(bytes_to_hex(sealed.first.data(), sealed.first.size()),
              "cea7403d4d606b6e074ec5d3baf39d18");
    EXPECT_EQ(bytes_to_hex(sealed.second.data(), 16), "d0d1c8a799996bf0265b98b5d48ab919");
}

// Test case 15: four full blocks, no AAD
TEST_F(GCMTest, KAT_Case15_FullBlocks) {
    AES256GCM gcm(key());

    auto sealed = gcm.seal(nonce(), plaintext());
    EXPECT_EQ(bytes_to_hex(sealed.first.data(), sealed.first.size()), ct_hex_);
    EXPECT_EQ(bytes_to_hex(sealed.second.data(), 16), "b094dac5d93471bdec1a502270e3cc6c");

    ByteVec out;
    ASSERT_TRUE(gcm.open(nonce(), sealed.first, sealed.second, {}, out));
    EXPECT_EQ(out, plaintext());
}

// Test case 16: partial last block with AAD
TEST_F(GCMTest, KAT_Case16_PartialBlockWithAAD) {
    AES256GCM gcm(key());
    ByteVec pt = plaintext60();

    auto sealed = gcm.seal(nonce(), pt, aad());
    EXPECT_EQ(bytes_to_hex(sealed.first.data(), sealed.first.size()), ct_hex_.substr(0, 120));
    EXPECT_EQ(bytes_to_hex(sealed.second.data(), 16), "76fc6ece0f4e1768cddf8853bb2d551b");

    ByteVec out;
    ASSERT_TRUE(gcm.open(nonce(), sealed.first, sealed.second, aad(), out));
    EXPECT_EQ(out, pt);
}

TEST_F(GCMTest, KAT_Case16_CApi) {
    ByteVec k = key();
    ByteVec iv = hex_to_bytes(nonce_hex_);
    ByteVec a = aad();
    ByteVec pt = plaintext60();

    gcm256_aes_ctx_t ctx;
    ASSERT_EQ(gcm256_aes_init(&ctx, k.data(), k.size()), GCM256_SUCCESS);

    ByteVec ct(pt.size());
    uint8_t tag[16];
    ASSERT_EQ(gcm256_gcm_encrypt(&ctx, iv.data(), iv.size(), a.data(), a.size(),
                                 pt.data(), pt.size(), ct.data(), tag), GCM256_SUCCESS);
    EXPECT_EQ(bytes_to_hex(tag, 16), "76fc6ece0f4e1768cddf8853bb2d551b");

    ByteVec dec(ct.size());
    ASSERT_EQ(gcm256_gcm_decrypt(&ctx, iv.data(), iv.size(), a.data(), a.size(),
                                 ct.data(), ct.size(), tag, 16, dec.data()), GCM256_SUCCESS);
    EXPECT_EQ(dec, pt);

    gcm256_aes_clear(&ctx);
}

// ============================================================================
// Tamper Detection
// ============================================================================

TEST_F(GCMTest, CiphertextBitFlipsRejected) {
    AES256GCM gcm(key());
    auto sealed = gcm.seal(nonce(), plaintext(), aad());

    for (size_t i = 0; i < sealed.first.size(); i += 7) {
        ByteVec tampered = sealed.first;
        tampered[i] ^= static_cast<uint8_t>(1u << (i % 8));

        ByteVec out{0xaa, 0xbb};
        EXPECT_FALSE(gcm.open(nonce(), tampered, sealed.second, aad(), out)) << "byte " << i;
        EXPECT_TRUE(out.empty());
    }
}

TEST_F(GCMTest, TagBitFlipsRejected) {
    AES256GCM gcm(key());
    auto sealed = gcm.seal(nonce(), plaintext(), aad());

    for (size_t bit = 0; bit < 128; bit++) {
        GcmTag tag = sealed.second;
        tag[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));

        ByteVec out;
        EXPECT_FALSE(gcm.open(nonce(), sealed.first, tag, aad(), out)) << "bit " << bit;
    }
}

TEST_F(GCMTest, WrongAADRejected) {
    AES256GCM gcm(key());
    auto sealed = gcm.seal(nonce(), plaintext(), aad());

    ByteVec out;
    ByteVec other_aad = aad();
    other_aad.back() ^= 0x01;
    EXPECT_FALSE(gcm.open(nonce(), sealed.first, sealed.second, other_aad, out));
    EXPECT_FALSE(gcm.open(nonce(), sealed.first, sealed.second, {}, out));
}

TEST_F(GCMTest, WrongNonceOrKeyRejected) {
    AES256GCM gcm(key());
    auto sealed = gcm.seal(nonce(), plaintext(), aad());

    GcmNonce other_nonce = nonce();
    other_nonce[11] ^= 0x01;
    ByteVec out;
    EXPECT_FALSE(gcm.open(other_nonce, sealed.first, sealed.second, aad(), out));

    ByteVec other_key = key();
    other_key[0] ^= 0x80;
    AES256GCM other(other_key);
    EXPECT_FALSE(other.open(nonce(), sealed.first, sealed.second, aad(), out));
}

TEST_F(GCMTest, FailedDecryptZeroesOutput) {
    ByteVec k = key();
    ByteVec iv = hex_to_bytes(nonce_hex_);
    ByteVec ct = hex_to_bytes(ct_hex_);

    gcm256_aes_ctx_t ctx;
    ASSERT_EQ(gcm256_aes_init(&ctx, k.data(), k.size()), GCM256_SUCCESS);

    uint8_t bad_tag[16] = {0};
    ByteVec out(ct.size(), 0x5a);
    EXPECT_EQ(gcm256_gcm_decrypt(&ctx, iv.data(), iv.size(), nullptr, 0,
                                 ct.data(), ct.size(), bad_tag, 16, out.data()),
              GCM256_ERROR_AUTH_FAILED);
    EXPECT_EQ(out, ByteVec(ct.size(), 0));

    gcm256_aes_clear(&ctx);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(GCMTest, InvalidKeyRejected) {
    EXPECT_THROW(AES256GCM(ByteVec(16)), std::invalid_argument);
    EXPECT_THROW(AES256GCM(ByteVec(0)), std::invalid_argument);
    EXPECT_NO_THROW(AES256GCM(ByteVec(32)));
}

TEST_F(GCMTest, InvalidNonceLengthRejected) {
    AES256GCM gcm(key());

    EXPECT_THROW(gcm.seal(ByteVec(11), plaintext()), std::invalid_argument);
    EXPECT_THROW(gcm.seal(ByteVec(16), plaintext()), std::invalid_argument);

    ByteVec out;
    EXPECT_THROW(gcm.open(ByteVec(8), plaintext(), ByteVec(16), {}, out), std::invalid_argument);

    gcm256_aes_ctx_t ctx;
    ByteVec k = key();
    ASSERT_EQ(gcm256_aes_init(&ctx, k.data(), k.size()), GCM256_SUCCESS);
    uint8_t iv[16] = {0};
    uint8_t tag[16];
    EXPECT_EQ(gcm256_gcm_encrypt(&ctx, iv, 16, nullptr, 0, nullptr, 0, nullptr, tag),
              GCM256_ERROR_INVALID_IV);
    EXPECT_EQ(gcm256_gcm_encrypt(&ctx, iv, 0, nullptr, 0, nullptr, 0, nullptr, tag),
              GCM256_ERROR_INVALID_IV);
    gcm256_aes_clear(&ctx);
}

TEST_F(GCMTest, InvalidTagLengthRejected) {
    AES256GCM gcm(key());
    auto sealed = gcm.seal(nonce(), plaintext());

    ByteVec n = hex_to_bytes(nonce_hex_);
    ByteVec short_tag(sealed.second.begin(), sealed.second.begin() + 12);
    ByteVec out;
    EXPECT_THROW(gcm.open(n, sealed.first, short_tag, {}, out), std::invalid_argument);

    ByteVec full_tag(sealed.second.begin(), sealed.second.end());
    EXPECT_TRUE(gcm.open(n, sealed.first, full_tag, {}, out));

    gcm256_aes_ctx_t ctx;
    ByteVec k = key();
    ASSERT_EQ(gcm256_aes_init(&ctx, k.data(), k.size()), GCM256_SUCCESS);
    EXPECT_EQ(gcm256_gcm_decrypt(&ctx, n.data(), n.size(), nullptr, 0, sealed.first.data(),
                                 sealed.first.size(), short_tag.data(), short_tag.size(),
                                 out.data()),
              GCM256_ERROR_INVALID_TAG);
    gcm256_aes_clear(&ctx);
}

TEST_F(GCMTest, LengthLimitsEnforced) {
    gcm256_aes_ctx_t ctx;
    ByteVec k = key();
    ASSERT_EQ(gcm256_aes_init(&ctx, k.data(), k.size()), GCM256_SUCCESS);

    uint8_t iv[12] = {0};
    uint8_t buf[16] = {0};
    uint8_t tag[16] = {0};

    // Rejected before any buffer is touched
    EXPECT_EQ(gcm256_gcm_encrypt(&ctx, iv, 12, nullptr, 0, buf,
                                 static_cast<size_t>(GCM256_GCM_MAX_PLAINTEXT + 1), buf, tag),
              GCM256_ERROR_LENGTH_LIMIT);
    EXPECT_EQ(gcm256_gcm_decrypt(&ctx, iv, 12, nullptr, 0, buf,
                                 static_cast<size_t>(GCM256_GCM_MAX_PLAINTEXT + 1), tag, 16, buf),
              GCM256_ERROR_LENGTH_LIMIT);
    EXPECT_EQ(gcm256_gcm_encrypt(&ctx, iv, 12, buf,
                                 static_cast<size_t>(GCM256_GCM_MAX_AAD + 1), buf, 0, buf, tag),
              GCM256_ERROR_LENGTH_LIMIT);

    gcm256_aes_clear(&ctx);
}

TEST_F(GCMTest, NullParametersRejected) {
    gcm256_aes_ctx_t ctx;
    ByteVec k = key();
    ASSERT_EQ(gcm256_aes_init(&ctx, k.data(), k.size()), GCM256_SUCCESS);

    uint8_t iv[12] = {0};
    uint8_t buf[16] = {0};
    uint8_t tag[16];
    EXPECT_EQ(gcm256_gcm_encrypt(nullptr, iv, 12, nullptr, 0, buf, 16, buf, tag),
              GCM256_ERROR_INVALID_PARAM);
    EXPECT_EQ(gcm256_gcm_encrypt(&ctx, nullptr, 12, nullptr, 0, buf, 16, buf, tag),
              GCM256_ERROR_INVALID_PARAM);
    EXPECT_EQ(gcm256_gcm_encrypt(&ctx, iv, 12, nullptr, 4, buf, 16, buf, tag),
              GCM256_ERROR_INVALID_PARAM);
    EXPECT_EQ(gcm256_gcm_encrypt(&ctx, iv, 12, nullptr, 0, nullptr, 16, buf, tag),
              GCM256_ERROR_INVALID_PARAM);
    EXPECT_EQ(gcm256_gcm_encrypt(&ctx, iv, 12, nullptr, 0, buf, 16, buf, nullptr),
              GCM256_ERROR_INVALID_PARAM);

    gcm256_aes_clear(&ctx);
}

// ============================================================================
// Round Trips Across Lengths
// ============================================================================

TEST_F(GCMTest, SealOpenAcrossLengths) {
    AES256GCM gcm(key());
    GcmNonce n = nonce();

    for (size_t len : {0u, 1u, 15u, 16u, 17u, 31u, 32u, 33u, 255u, 1024u}) {
        ByteVec pt(len);
        for (size_t i = 0; i < len; i++) pt[i] = static_cast<uint8_t>(i * 13 + 5);

        auto sealed = gcm.seal(n, pt, aad());
        EXPECT_EQ(sealed.first.size(), len);

        ByteVec out;
        ASSERT_TRUE(gcm.open(n, sealed.first, sealed.second, aad(), out)) << "length " << len;
        EXPECT_EQ(out, pt);
        n[11]++;
    }
}

TEST_F(GCMTest, SealIsDeterministicPerNonce) {
    AES256GCM gcm(key());
    GcmNonce n1 = nonce();
    GcmNonce n2 = n1;
    n2[0] ^= 0x01;

    auto a = gcm.seal(n1, plaintext60(), aad());
    auto b = gcm.seal(n1, plaintext60(), aad());
    EXPECT_EQ(a, b);

    AES256GCM other(key());
    EXPECT_EQ(other.seal(n1, plaintext60(), aad()), a);

    auto c = gcm.seal(n2, plaintext60(), aad());
    EXPECT_EQ(c.first.size(), a.first.size());
    EXPECT_NE(a.first, c.first);
    EXPECT_NE(a.second, c.second);
}

TEST_F(GCMTest, InPlaceCApi) {
    ByteVec k = key();
    ByteVec iv = hex_to_bytes(nonce_hex_);
    ByteVec buf = plaintext();

    gcm256_aes_ctx_t ctx;
    ASSERT_EQ(gcm256_aes_init(&ctx, k.data(), k.size()), GCM256_SUCCESS);

    uint8_t tag[16];
    ASSERT_EQ(gcm256_gcm_encrypt(&ctx, iv.data(), 12, nullptr, 0, buf.data(), buf.size(),
                                 buf.data(), tag), GCM256_SUCCESS);
    EXPECT_EQ(bytes_to_hex(buf.data(), buf.size()), ct_hex_);

    ASSERT_EQ(gcm256_gcm_decrypt(&ctx, iv.data(), 12, nullptr, 0, buf.data(), buf.size(),
                                 tag, 16, buf.data()), GCM256_SUCCESS);
    EXPECT_EQ(buf, plaintext());

    gcm256_aes_clear(&ctx);
}

TEST_F(GCMTest, MovedFromInstanceThrows) {
    AES256GCM gcm(key());
    AES256GCM moved(std::move(gcm));

    auto sealed = moved.seal(nonce(), plaintext());
    EXPECT_EQ(bytes_to_hex(sealed.second.data(), 16), "b094dac5d93471bdec1a502270e3cc6c");
    EXPECT_THROW(gcm.seal(nonce(), plaintext()), std::logic_error);
}

// ============================================================================
// Streaming Encryption
// ============================================================================

TEST_F(GCMTest, StreamingMatchesOneShot) {
    ByteVec k = key();
    ByteVec iv = hex_to_bytes(nonce_hex_);
    ByteVec a = aad();
    ByteVec pt = plaintext60();

    const size_t chunk_sizes[] = {1, 5, 16, 17, 60};
    for (size_t chunk : chunk_sizes) {
        gcm256_gcm_ctx_t ctx;
        ASSERT_EQ(gcm256_gcm_init(&ctx, k.data(), k.size(), iv.data(), iv.size()), GCM256_SUCCESS);

        ASSERT_EQ(gcm256_gcm_update_aad(&ctx, a.data(), 7), GCM256_SUCCESS);
        ASSERT_EQ(gcm256_gcm_update_aad(&ctx, a.data() + 7, a.size() - 7), GCM256_SUCCESS);

        ByteVec ct(pt.size());
        for (size_t off = 0; off < pt.size(); off += chunk) {
            size_t n = GCM256_MIN(chunk, pt.size() - off);
            ASSERT_EQ(gcm256_gcm_update_encrypt(&ctx, pt.data() + off, n, ct.data() + off),
                      GCM256_SUCCESS);
        }

        uint8_t tag[16];
        ASSERT_EQ(gcm256_gcm_final_encrypt(&ctx, tag), GCM256_SUCCESS);

        EXPECT_EQ(bytes_to_hex(ct.data(), ct.size()), ct_hex_.substr(0, 120)) << "chunk " << chunk;
        EXPECT_EQ(bytes_to_hex(tag, 16), "76fc6ece0f4e1768cddf8853bb2d551b") << "chunk " << chunk;

        gcm256_gcm_clear(&ctx);
    }
}

TEST_F(GCMTest, StreamingCallOrderEnforced) {
    ByteVec k = key();
    ByteVec iv = hex_to_bytes(nonce_hex_);
    ByteVec a = aad();
    ByteVec pt = plaintext();
    ByteVec ct(pt.size());
    uint8_t tag[16];

    gcm256_gcm_ctx_t ctx;
    ASSERT_EQ(gcm256_gcm_init(&ctx, k.data(), k.size(), iv.data(), iv.size()), GCM256_SUCCESS);
    ASSERT_EQ(gcm256_gcm_update_encrypt(&ctx, pt.data(), pt.size(), ct.data()), GCM256_SUCCESS);
    EXPECT_EQ(gcm256_gcm_update_aad(&ctx, a.data(), a.size()), GCM256_ERROR_INVALID_STATE);

    ASSERT_EQ(gcm256_gcm_final_encrypt(&ctx, tag), GCM256_SUCCESS);
    EXPECT_EQ(gcm256_gcm_update_encrypt(&ctx, pt.data(), pt.size(), ct.data()),
              GCM256_ERROR_INVALID_STATE);
    EXPECT_EQ(gcm256_gcm_final_encrypt(&ctx, tag), GCM256_ERROR_INVALID_STATE);

    gcm256_gcm_clear(&ctx);

    EXPECT_EQ(gcm256_gcm_init(&ctx, k.data(), 16, iv.data(), iv.size()), GCM256_ERROR_INVALID_KEY);
    EXPECT_EQ(gcm256_gcm_init(&ctx, k.data(), k.size(), iv.data(), 8), GCM256_ERROR_INVALID_IV);
}

TEST_F(GCMTest, StreamingFinalFailureClearsTag) {
    ByteVec k = key();
    ByteVec iv = hex_to_bytes(nonce_hex_);
    ByteVec pt = plaintext();
    ByteVec ct(pt.size());

    gcm256_gcm_ctx_t ctx;
    ASSERT_EQ(gcm256_gcm_init(&ctx, k.data(), k.size(), iv.data(), iv.size()), GCM256_SUCCESS);
    ASSERT_EQ(gcm256_gcm_update_encrypt(&ctx, pt.data(), pt.size(), ct.data()), GCM256_SUCCESS);

    // Authenticator already closed underneath the stream
    ctx.ghash.finalized = 1;

    uint8_t tag[16];
    memset(tag, 0xAA, sizeof(tag));
    EXPECT_EQ(gcm256_gcm_final_encrypt(&ctx, tag), GCM256_ERROR_INVALID_STATE);
    for (size_t i = 0; i < sizeof(tag); i++) {
        EXPECT_EQ(tag[i], 0) << "byte " << i;
    }
    EXPECT_EQ(ctx.finalized, 0);
    for (size_t i = 0; i < sizeof(ctx.keystream); i++) {
        EXPECT_EQ(ctx.keystream[i], 0) << "keystream byte " << i;
    }

    gcm256_gcm_clear(&ctx);
}

// ============================================================================
// Random Generation
// ============================================================================

TEST_F(GCMTest, GenerateKeyAndNonce) {
    auto k1 = AES256GCM::generateKey();
    auto k2 = AES256GCM::generateKey();
    EXPECT_NE(k1, k2);

    auto n1 = AES256GCM::generateNonce();
    auto n2 = AES256GCM::generateNonce();
    EXPECT_NE(n1, n2);

    AES256GCM gcm(k1);
    auto sealed = gcm.seal(n1, plaintext());
    ByteVec out;
    EXPECT_TRUE(gcm.open(n1, sealed.first, sealed.second, {}, out));
    EXPECT_EQ(out, plaintext());
}

// ============================================================================
// Nonce Sequence
// ============================================================================

TEST_F(GCMTest, NonceSequenceLayout) {
    gcm256::ByteArray<4> fixed = {0xde, 0xad, 0xbe, 0xef};
    gcm256::NonceSequence seq(fixed);

    GcmNonce n0 = seq.next();
    GcmNonce n1 = seq.next();

    EXPECT_EQ(bytes_to_hex(n0.data(), 12), "deadbeef0000000000000000");
    EXPECT_EQ(bytes_to_hex(n1.data(), 12), "deadbeef0000000000000001");
    EXPECT_EQ(seq.fixed(), fixed);
}

TEST_F(GCMTest, NonceSequenceExhaustion) {
    gcm256::ByteArray<4> fixed = {0, 0, 0, 1};
    gcm256::NonceSequence seq(fixed, UINT64_MAX - 2);

    EXPECT_EQ(seq.remaining(), 2u);
    GcmNonce a = seq.next();
    GcmNonce b = seq.next();
    EXPECT_NE(a, b);
    EXPECT_EQ(bytes_to_hex(b.data(), 12), "00000001fffffffffffffffe");
    EXPECT_EQ(seq.remaining(), 0u);

    EXPECT_THROW(seq.next(), std::overflow_error);
    EXPECT_THROW(seq.next(), std::overflow_error);
}

TEST_F(GCMTest, NonceSequenceCApi) {
    uint8_t fixed[4] = {1, 2, 3, 4};
    gcm256_nonce_seq_t seq;
    ASSERT_EQ(gcm256_nonce_seq_init(&seq, fixed), GCM256_SUCCESS);

    uint8_t nonce[12];
    ASSERT_EQ(gcm256_nonce_seq_next(&seq, nonce), GCM256_SUCCESS);
    EXPECT_EQ(bytes_to_hex(nonce, 12), "010203040000000000000000");

    seq.counter = UINT64_MAX;
    EXPECT_EQ(gcm256_nonce_seq_next(&seq, nonce), GCM256_ERROR_NONCE_EXHAUSTED);
}

TEST_F(GCMTest, NonceSequenceUniqueAcrossThreads) {
    gcm256::NonceSequence seq;
    const int threads = 4;
    const int per_thread = 1000;

    std::vector<std::vector<GcmNonce>> results(threads);
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; t++) {
        workers.emplace_back([&seq, &results, t, per_thread]() {
            for (int i = 0; i < per_thread; i++) results[t].push_back(seq.next());
        });
    }
    for (auto& w : workers) w.join();

    std::set<GcmNonce> unique;
    for (const auto& r : results) unique.insert(r.begin(), r.end());
    EXPECT_EQ(unique.size(), static_cast<size_t>(threads * per_thread));
}
