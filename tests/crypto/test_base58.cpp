// CASHSEED - Base58 and Base58Check Tests
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include <gtest/gtest.h>
#include "cashseed/crypto/base58.h"
#include "cashseed/core/hex.h"

#include <string>
#include <vector>

namespace cashseed {
namespace test {

// ============================================================================
// Base58
// ============================================================================

struct Base58Vector {
    const char* hex;
    const char* encoded;
};

class Base58VectorTest : public ::testing::TestWithParam<Base58Vector> {};

TEST_P(Base58VectorTest, EncodeAndDecode) {
    const auto& v = GetParam();
    auto bytes = HexToBytes(v.hex);
    
    EXPECT_EQ(EncodeBase58(bytes), v.encoded);
    
    auto decoded = DecodeBase58(v.encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes);
}

INSTANTIATE_TEST_SUITE_P(KnownVectors, Base58VectorTest, ::testing::Values(
    Base58Vector{"", ""},
    Base58Vector{"61", "2g"},
    Base58Vector{"626262", "a3gV"},
    Base58Vector{"636363", "aPEr"},
    Base58Vector{"00000000000000000000", "1111111111"},
    Base58Vector{"516b6fcd0f", "ABnLTmg"},
    Base58Vector{"572e4794", "3EFU7m"}
));

TEST(Base58Test, RejectsInvalidCharacters) {
    EXPECT_FALSE(DecodeBase58("0").has_value());
    EXPECT_FALSE(DecodeBase58("O").has_value());
    EXPECT_FALSE(DecodeBase58("I").has_value());
    EXPECT_FALSE(DecodeBase58("l").has_value());
    EXPECT_FALSE(DecodeBase58("abc!").has_value());
}

// ============================================================================
// Base58Check
// ============================================================================

TEST(Base58CheckTest, LegacyAddressOfGeneratorKey) {
    std::vector<uint8_t> payload = {0x00};
    auto hash = HexToBytes("751e76e8199196d454941c45d1b3a323f1433bd6");
    payload.insert(payload.end(), hash.begin(), hash.end());
    
    EXPECT_EQ(EncodeBase58Check(payload), "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH");
}

TEST(Base58CheckTest, DecodeStripsChecksum) {
    auto decoded = DecodeBase58Check("1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH");
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->size(), 21u);
    EXPECT_EQ((*decoded)[0], 0x00);
    EXPECT_EQ(BytesToHex(decoded->data() + 1, 20), "751e76e8199196d454941c45d1b3a323f1433bd6");
}

TEST(Base58CheckTest, RejectsBadChecksum) {
    // Last character changed
    EXPECT_FALSE(DecodeBase58Check("1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMJ").has_value());
}

TEST(Base58CheckTest, RejectsTooShort) {
    EXPECT_FALSE(DecodeBase58Check("").has_value());
    EXPECT_FALSE(DecodeBase58Check("2g").has_value());
}

} // namespace test
} // namespace cashseed
