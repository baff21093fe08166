/**
 * @file test_ghash.cpp
 * @brief GHASH unit tests
 *
 * Reference digests from the McGrew & Viega GCM test cases,
 * AES-256 cases 14 to 16.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <gtest/gtest.h>
#include "gcm256/gcm256.h"
#include <cstring>
#include <stdexcept>
#include <string>

using gcm256::AESBlock;
using gcm256::ByteVec;

static ByteVec hex_to_bytes(const std::string& hex) {
    ByteVec bytes;
    for (size_t i = 0; i < hex.length(); i += 2) {
        bytes.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return bytes;
}

static AESBlock to_block(const ByteVec& v) {
    AESBlock block{};
    memcpy(block.data(), v.data(), block.size());
    return block;
}

class GHashTest : public ::testing::Test {
protected:
    // H for key feffe992...8308 (repeated)
    AESBlock h_ = to_block(hex_to_bytes("acbef20579b4b8ebce889bac8732dad7"));

    ByteVec aad_ = hex_to_bytes("feedfacedeadbeeffeedfacedeadbeefabaddad2");
    ByteVec ct_ = hex_to_bytes(
        "522dc1f099567d07f47f37a32a84427d643a8cdcbfe5c0c97598a2bd2555d1aa"
        "8cb08e48590dbb3da7b08b1056828838c5f61e6393ba7a0abcc9f662");
    AESBlock expected_ = to_block(hex_to_bytes("8bd0c4d8aacd391e67cca447e8c38f65"));
};

TEST_F(GHashTest, EmptyInputIsZero) {
    AESBlock zero{};
    EXPECT_EQ(gcm256::GHash::digest(h_, {}, {}), zero);
}

TEST_F(GHashTest, ZeroKeyCase14) {
    AESBlock h = to_block(hex_to_bytes("dc95c078a2408989ad48a21492842087"));
    ByteVec ct = hex_to_bytes("cea7403d4d606b6e074ec5d3baf39d18");
    AESBlock expected = to_block(hex_to_bytes("83de425c5edc5d498f382c441041ca92"));

    EXPECT_EQ(gcm256::GHash::digest(h, {}, ct), expected);
}

TEST_F(GHashTest, FullBlocksCase15) {
    ByteVec ct = hex_to_bytes(
        "522dc1f099567d07f47f37a32a84427d643a8cdcbfe5c0c97598a2bd2555d1aa"
        "8cb08e48590dbb3da7b08b1056828838c5f61e6393ba7a0abcc9f662898015ad");
    AESBlock expected = to_block(hex_to_bytes("4db870d37cb75fcb46097c36230d1612"));

    EXPECT_EQ(gcm256::GHash::digest(h_, {}, ct), expected);
}

TEST_F(GHashTest, PartialBlocksWithAADCase16) {
    EXPECT_EQ(gcm256::GHash::digest(h_, aad_, ct_), expected_);
}

TEST_F(GHashTest, ChunkingDoesNotChangeDigest) {
    const size_t chunk_sizes[] = {1, 3, 7, 15, 16, 17, 33};

    for (size_t chunk : chunk_sizes) {
        gcm256::GHash ghash(h_);
        for (size_t off = 0; off < aad_.size(); off += chunk) {
            ghash.updateAAD(aad_.data() + off, GCM256_MIN(chunk, aad_.size() - off));
        }
        for (size_t off = 0; off < ct_.size(); off += chunk) {
            ghash.update(ct_.data() + off, GCM256_MIN(chunk, ct_.size() - off));
        }
        EXPECT_EQ(ghash.finalize(), expected_) << "chunk size " << chunk;
    }
}

// AAD and ciphertext are padded separately, so moving bytes across the
// boundary must change the digest
TEST_F(GHashTest, DomainSeparation) {
    ByteVec aad_plus(aad_);
    aad_plus.push_back(ct_[0]);
    ByteVec ct_minus(ct_.begin() + 1, ct_.end());

    EXPECT_NE(gcm256::GHash::digest(h_, aad_plus, ct_minus), expected_);
}

TEST_F(GHashTest, AADAfterCiphertextRejected) {
    gcm256::GHash ghash(h_);
    ghash.updateAAD(aad_);
    ghash.update(ct_);
    EXPECT_THROW(ghash.updateAAD(aad_), std::logic_error);

    gcm256_ghash_ctx_t ctx;
    ASSERT_EQ(gcm256_ghash_init(&ctx, h_.data()), GCM256_SUCCESS);
    ASSERT_EQ(gcm256_ghash_update(&ctx, ct_.data(), ct_.size()), GCM256_SUCCESS);
    EXPECT_EQ(gcm256_ghash_update_aad(&ctx, aad_.data(), aad_.size()), GCM256_ERROR_INVALID_STATE);
    gcm256_ghash_clear(&ctx);
}

TEST_F(GHashTest, UpdateAfterFinalizeRejected) {
    gcm256::GHash ghash(h_);
    ghash.update(ct_);
    ghash.finalize();

    EXPECT_THROW(ghash.update(ct_), std::logic_error);
    EXPECT_THROW(ghash.updateAAD(aad_), std::logic_error);
    EXPECT_THROW(ghash.finalize(), std::logic_error);
}

TEST_F(GHashTest, EmptyUpdatesAreNoOps) {
    gcm256::GHash ghash(h_);
    ghash.updateAAD(nullptr, 0);
    ghash.updateAAD(aad_);
    ghash.update(nullptr, 0);
    ghash.updateAAD(nullptr, 0);
    ghash.update(ct_);
    EXPECT_EQ(ghash.finalize(), expected_);
}

TEST_F(GHashTest, NullBuffersRejected) {
    gcm256_ghash_ctx_t ctx;
    EXPECT_EQ(gcm256_ghash_init(nullptr, h_.data()), GCM256_ERROR_INVALID_PARAM);
    EXPECT_EQ(gcm256_ghash_init(&ctx, nullptr), GCM256_ERROR_INVALID_PARAM);

    ASSERT_EQ(gcm256_ghash_init(&ctx, h_.data()), GCM256_SUCCESS);
    EXPECT_EQ(gcm256_ghash_update_aad(&ctx, nullptr, 4), GCM256_ERROR_INVALID_PARAM);
    EXPECT_EQ(gcm256_ghash_update(&ctx, nullptr, 4), GCM256_ERROR_INVALID_PARAM);
    EXPECT_EQ(gcm256_ghash_final(&ctx, nullptr), GCM256_ERROR_INVALID_PARAM);
    gcm256_ghash_clear(&ctx);
}
