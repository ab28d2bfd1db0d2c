// CASHSEED - Core Types Tests
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include <gtest/gtest.h>
#include "cashseed/core/types.h"
#include "cashseed/core/hex.h"
#include "cashseed/core/error.h"

namespace cashseed {
namespace test {

// ============================================================================
// Hash Type Tests
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesZeroHash) {
    Hash256 hash;
    EXPECT_TRUE(hash.IsNull());
    for (size_t i = 0; i < hash.size(); ++i) {
        EXPECT_EQ(hash[i], 0);
    }
}

TEST(Hash256Test, SizeIs32Bytes) {
    EXPECT_EQ(Hash256::SIZE, 32u);
    EXPECT_EQ(Hash512::SIZE, 64u);
    EXPECT_EQ(Hash160::SIZE, 20u);
}

TEST(Hash256Test, ConstructFromShortBufferZeroPads) {
    Byte data[3] = {0xaa, 0xbb, 0xcc};
    Hash256 hash(data, sizeof(data));
    
    EXPECT_FALSE(hash.IsNull());
    EXPECT_EQ(hash[0], 0xaa);
    EXPECT_EQ(hash[2], 0xcc);
    EXPECT_EQ(hash[3], 0x00);
}

TEST(Hash256Test, EqualityOperator) {
    std::array<Byte, 32> bytes{};
    bytes[31] = 1;
    Hash256 a(bytes);
    Hash256 b(bytes);
    Hash256 c;
    
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(Hash160Test, ToHexKeepsByteOrder) {
    auto bytes = HexToBytes("751e76e8199196d454941c45d1b3a323f1433bd6");
    Hash160 hash(bytes.data(), bytes.size());
    EXPECT_EQ(hash.ToHex(), "751e76e8199196d454941c45d1b3a323f1433bd6");
}

// ============================================================================
// Big-endian Helper Tests
// ============================================================================

TEST(BigEndianTest, WriteBE32) {
    Bytes out;
    WriteBE32(out, 0x8000002c);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0], 0x80);
    EXPECT_EQ(out[1], 0x00);
    EXPECT_EQ(out[2], 0x00);
    EXPECT_EQ(out[3], 0x2c);
}

TEST(BigEndianTest, ReadBE32) {
    Byte data[4] = {0x34, 0x42, 0x19, 0x3e};
    EXPECT_EQ(ReadBE32(data), 0x3442193eu);
}

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, RoundTrip) {
    std::vector<Byte> data = {0x00, 0x01, 0x7f, 0x80, 0xff};
    EXPECT_EQ(BytesToHex(data), "00017f80ff");
    EXPECT_EQ(HexToBytes("00017f80ff"), data);
}

TEST(HexTest, UppercaseAccepted) {
    EXPECT_EQ(HexToBytes("ABcd"), (std::vector<Byte>{0xab, 0xcd}));
}

TEST(HexTest, EmptyString) {
    EXPECT_TRUE(HexToBytes("").empty());
    EXPECT_FALSE(IsValidHex(""));
}

TEST(HexTest, OddLengthThrows) {
    try {
        HexToBytes("abc");
        FAIL() << "expected KeyError";
    } catch (const KeyError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::InvalidEncodingInput);
    }
}

TEST(HexTest, InvalidCharacterThrows) {
    EXPECT_THROW(HexToBytes("zz"), KeyError);
    EXPECT_FALSE(IsValidHex("0g"));
    EXPECT_TRUE(IsValidHex("0a"));
}

} // namespace test
} // namespace cashseed
