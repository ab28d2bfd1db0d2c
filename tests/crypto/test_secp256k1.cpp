// CASHSEED - secp256k1 Arithmetic Tests
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include <gtest/gtest.h>
#include "cashseed/crypto/secp256k1.h"
#include "cashseed/core/hex.h"

#include <array>
#include <string>

namespace cashseed {
namespace test {

using namespace secp256k1;

namespace {

const char* const G_COMPRESSED =
    "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
const char* const TWO_G_COMPRESSED =
    "02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5";
const char* const THREE_G_COMPRESSED =
    "02f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9";

std::array<uint8_t, 32> ScalarBytes(uint8_t lastByte) {
    std::array<uint8_t, 32> bytes{};
    bytes[31] = lastByte;
    return bytes;
}

std::array<uint8_t, 32> OrderMinus(uint8_t delta) {
    std::array<uint8_t, 32> bytes = CURVE_ORDER;
    bytes[31] = static_cast<uint8_t>(bytes[31] - delta);
    return bytes;
}

} // namespace

// ============================================================================
// Scalar Tests
// ============================================================================

TEST(ScalarTest, CurveOrderConstant) {
    EXPECT_EQ(BytesToHex(CURVE_ORDER),
              "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141");
}

TEST(ScalarTest, RangeChecks) {
    EXPECT_TRUE(Scalar().IsZero());
    EXPECT_FALSE(Scalar().IsValid());
    EXPECT_TRUE(Scalar(ScalarBytes(1)).IsValid());
    EXPECT_TRUE(Scalar(OrderMinus(1)).IsValid());
    EXPECT_FALSE(Scalar(CURVE_ORDER).IsBelowOrder());
    EXPECT_FALSE(Scalar(CURVE_ORDER).IsValid());
}

TEST(ScalarTest, AdditionWrapsModOrder) {
    Scalar sum = Scalar(OrderMinus(1)) + Scalar(ScalarBytes(1));
    EXPECT_TRUE(sum.IsZero());
    
    Scalar wrapped = Scalar(OrderMinus(1)) + Scalar(ScalarBytes(3));
    EXPECT_EQ(wrapped, Scalar(ScalarBytes(2)));
}

TEST(ScalarTest, SimpleAddition) {
    EXPECT_EQ(Scalar(ScalarBytes(1)) + Scalar(ScalarBytes(2)), Scalar(ScalarBytes(3)));
}

TEST(IsValidPrivateKeyTest, Boundaries) {
    EXPECT_FALSE(IsValidPrivateKey(ScalarBytes(0)));
    EXPECT_TRUE(IsValidPrivateKey(ScalarBytes(1)));
    EXPECT_TRUE(IsValidPrivateKey(OrderMinus(1)));
    EXPECT_FALSE(IsValidPrivateKey(CURVE_ORDER));
}

// ============================================================================
// Point Tests
// ============================================================================

TEST(PointTest, GeneratorFromPrivateKeyOne) {
    auto pub = ComputePublicKey(ScalarBytes(1).data());
    ASSERT_TRUE(pub.has_value());
    EXPECT_EQ(BytesToHex(*pub), G_COMPRESSED);
}

TEST(PointTest, InvalidPrivateKeyHasNoPublicKey) {
    EXPECT_FALSE(ComputePublicKey(ScalarBytes(0).data()).has_value());
    EXPECT_FALSE(ComputePublicKey(CURVE_ORDER.data()).has_value());
}

TEST(PointTest, CompressedRoundTrip) {
    auto bytes = HexToBytes(TWO_G_COMPRESSED);
    auto point = Point::FromCompressed(bytes.data(), bytes.size());
    ASSERT_TRUE(point.has_value());
    EXPECT_EQ(BytesToHex(point->ToCompressed()), TWO_G_COMPRESSED);
}

TEST(PointTest, Addition) {
    auto g = ScalarBaseMultiply(Scalar(ScalarBytes(1)));
    auto twoG = ScalarBaseMultiply(Scalar(ScalarBytes(2)));
    ASSERT_TRUE(g && twoG);
    
    EXPECT_EQ(BytesToHex(twoG->ToCompressed()), TWO_G_COMPRESSED);
    EXPECT_EQ(*g + *g, *twoG);
    EXPECT_EQ(BytesToHex((*g + *twoG).ToCompressed()), THREE_G_COMPRESSED);
}

TEST(PointTest, RejectsMalformedEncodings) {
    auto bytes = HexToBytes(G_COMPRESSED);
    
    // Wrong length
    EXPECT_FALSE(Point::FromCompressed(bytes.data(), 32).has_value());
    
    // Uncompressed prefix
    bytes[0] = 0x04;
    EXPECT_FALSE(Point::FromCompressed(bytes.data(), bytes.size()).has_value());
    
    // x not below the field prime
    std::array<uint8_t, COMPRESSED_SIZE> big{};
    big.fill(0xff);
    big[0] = 0x02;
    EXPECT_FALSE(Point::FromCompressed(big).has_value());
}

TEST(PointTest, NegatedPointSumsToInfinity) {
    auto g = HexToBytes(G_COMPRESSED);
    auto negG = g;
    negG[0] = 0x03;
    
    auto p = Point::FromCompressed(g.data(), g.size());
    auto q = Point::FromCompressed(negG.data(), negG.size());
    ASSERT_TRUE(p && q);
    
    Point sum = *p + *q;
    EXPECT_TRUE(sum.IsInfinity());
    EXPECT_THROW(sum.ToCompressed(), std::logic_error);
}

// ============================================================================
// Tweak Tests
// ============================================================================

TEST(PublicKeyTweakAddTest, AddsTweakTimesGenerator) {
    auto g = HexToBytes(G_COMPRESSED);
    auto result = PublicKeyTweakAdd(g.data(), g.size(), ScalarBytes(1).data());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(BytesToHex(*result), TWO_G_COMPRESSED);
}

TEST(PublicKeyTweakAddTest, ZeroTweakReturnsParent) {
    auto g = HexToBytes(G_COMPRESSED);
    auto result = PublicKeyTweakAdd(g.data(), g.size(), ScalarBytes(0).data());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(BytesToHex(*result), G_COMPRESSED);
}

TEST(PublicKeyTweakAddTest, RejectsTweakAtOrder) {
    auto g = HexToBytes(G_COMPRESSED);
    EXPECT_FALSE(PublicKeyTweakAdd(g.data(), g.size(), CURVE_ORDER.data()).has_value());
}

TEST(PublicKeyTweakAddTest, InfinityResultRejected) {
    // G + (n-1)G = nG = infinity
    auto g = HexToBytes(G_COMPRESSED);
    EXPECT_FALSE(PublicKeyTweakAdd(g.data(), g.size(), OrderMinus(1).data()).has_value());
}

} // namespace test
} // namespace cashseed
