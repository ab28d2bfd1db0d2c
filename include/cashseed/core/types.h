// CASHSEED - Core Types Header
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// Fundamental byte and fixed-width hash types used throughout CASHSEED.

#ifndef CASHSEED_CORE_TYPES_H
#define CASHSEED_CORE_TYPES_H

#include "cashseed/core/hex.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace cashseed {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Growable byte buffer
using Bytes = std::vector<Byte>;

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size digest value. Bytes are kept and printed in digest order.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;
    
    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }
    
    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept 
        : data_(data) {}
    
    /// Construct from raw bytes; short input is zero padded
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }
    
    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }
    
    constexpr size_t size() const noexcept { return SIZE; }
    
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }
    
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }
    
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }
    
    /// Lowercase hex of the digest bytes
    std::string ToHex() const {
        return BytesToHex(data_.data(), SIZE);
    }
    
    /// Copy of the underlying array
    const std::array<Byte, SIZE>& ToArray() const noexcept { return data_; }

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
};

/// 512-bit hash (64 bytes)
class Hash512 : public BaseHash<512> {
public:
    using BaseHash<512>::BaseHash;
};

/// 160-bit hash (20 bytes) - public key hashes inside addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
};

// ============================================================================
// Big-endian helpers
// ============================================================================

/// Append a 32-bit value in big-endian order
inline void WriteBE32(Bytes& out, uint32_t value) {
    out.push_back(static_cast<Byte>((value >> 24) & 0xFF));
    out.push_back(static_cast<Byte>((value >> 16) & 0xFF));
    out.push_back(static_cast<Byte>((value >> 8) & 0xFF));
    out.push_back(static_cast<Byte>(value & 0xFF));
}

/// Read a 32-bit big-endian value
inline uint32_t ReadBE32(const Byte* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

} // namespace cashseed

#endif // CASHSEED_CORE_TYPES_H
