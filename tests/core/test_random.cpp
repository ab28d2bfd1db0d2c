// CASHSEED - Random Number Generation Tests
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include <gtest/gtest.h>
#include "cashseed/core/random.h"

#include <algorithm>
#include <vector>

namespace cashseed {
namespace test {

TEST(RandomTest, GetStrongRandBytesNonZero) {
    // Random bytes should not all be zero (extremely unlikely)
    std::vector<uint8_t> bytes(32);
    GetStrongRandBytes(bytes.data(), bytes.size());
    
    bool allZero = std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
    EXPECT_FALSE(allZero);
}

TEST(RandomTest, GetStrongRandBytesDifferent) {
    // Bytes are never cached between calls
    std::vector<uint8_t> bytes1 = GetStrongRandBytes(32);
    std::vector<uint8_t> bytes2 = GetStrongRandBytes(32);
    
    EXPECT_EQ(bytes1.size(), 32u);
    EXPECT_NE(bytes1, bytes2);
}

TEST(RandomTest, GetStrongRandBytesZeroLength) {
    uint8_t dummy = 0;
    EXPECT_NO_THROW(GetStrongRandBytes(&dummy, 0));
    EXPECT_TRUE(GetStrongRandBytes(0).empty());
}

TEST(RandomTest, GetStrongRandBytesLargeBuffer) {
    // Larger than a single getrandom() call may return
    std::vector<uint8_t> bytes(1 << 20);
    EXPECT_NO_THROW(GetStrongRandBytes(bytes.data(), bytes.size()));
    
    bool allZero = std::all_of(bytes.end() - 64, bytes.end(), [](uint8_t b) { return b == 0; });
    EXPECT_FALSE(allZero);
}

TEST(RandomTest, ByteDistribution) {
    // Every byte value should appear in a large sample
    std::vector<uint8_t> bytes = GetStrongRandBytes(65536);
    std::vector<int> counts(256, 0);
    for (uint8_t b : bytes) {
        counts[b]++;
    }
    
    for (int count : counts) {
        EXPECT_GT(count, 0);
    }
}

} // namespace test
} // namespace cashseed
