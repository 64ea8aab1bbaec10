/**
 * @file test_hashing.cpp
 * @brief Unit tests for the BLAKE3 digest
 */

#include <gtest/gtest.h>
#include <hashing/blake3_digest.hpp>
#include <string>

using namespace Lexicode;

TEST(HashingTest, Determinism) {
    std::string data = "layoff 0233-00001-1-2-2";
    auto hash1 = Blake3Digest::hash(data);
    auto hash2 = Blake3Digest::hash(data);

    EXPECT_EQ(hash1, hash2);
}

TEST(HashingTest, CollisionResistance) {
    auto hash1 = Blake3Digest::hash("test1");
    auto hash2 = Blake3Digest::hash("test2");

    EXPECT_NE(hash1, hash2);
}

TEST(HashingTest, KnownVector) {
    // BLAKE3 of the empty input, first 16 bytes
    EXPECT_EQ(Blake3Digest::to_hex(Blake3Digest::hash("")), "af1349b9f5f9a1a6a0404dea36dcc949");
}

TEST(HashingTest, HexLength) {
    std::string hex = Blake3Digest().finalize_hex();
    EXPECT_EQ(hex.length(), 32u); // 16 bytes * 2
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(HashingTest, StreamingMatchesOneShot) {
    Blake3Digest digest;
    digest.update("lexi");
    digest.update("code");
    EXPECT_EQ(digest.finalize(), Blake3Digest::hash("lexicode"));
}

TEST(HashingTest, FieldsAreSeparated) {
    Blake3Digest a;
    a.add_field("ab");
    a.add_field("c");
    a.end_record();

    Blake3Digest b;
    b.add_field("a");
    b.add_field("bc");
    b.end_record();

    EXPECT_NE(a.finalize(), b.finalize());
}

TEST(HashingTest, FinalizeDoesNotConsume) {
    Blake3Digest digest;
    digest.add_field("happy");
    auto first = digest.finalize();
    EXPECT_EQ(digest.finalize(), first);

    digest.end_record();
    EXPECT_NE(digest.finalize(), first);
}
