// CASHSEED - secp256k1 Elliptic Curve Operations
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// The secp256k1 arithmetic needed by BIP32 key derivation: scalar range
// checks, scalar addition mod n, generator multiplication, point addition
// and compressed point encoding. Backed by OpenSSL EC_GROUP/EC_POINT/BIGNUM.

#ifndef CASHSEED_CRYPTO_SECP256K1_H
#define CASHSEED_CRYPTO_SECP256K1_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include "cashseed/core/types.h"

namespace cashseed {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

/// Curve order n
extern const std::array<uint8_t, 32> CURVE_ORDER;

/// Size of a compressed point
constexpr size_t COMPRESSED_SIZE = 33;

// ============================================================================
// Scalar (256-bit integer mod n)
// ============================================================================

/**
 * A 256-bit big-endian scalar. Used for private keys and derivation tweaks.
 * The bytes are wiped on destruction.
 */
class Scalar {
public:
    static constexpr size_t SIZE = 32;
    
    /// Default constructor (zero)
    Scalar();
    
    /// Construct from 32 big-endian bytes
    explicit Scalar(const uint8_t* data);
    explicit Scalar(const std::array<uint8_t, SIZE>& data);
    
    ~Scalar();
    
    Scalar(const Scalar&) = default;
    Scalar& operator=(const Scalar&) = default;
    
    /// Check if scalar is zero
    bool IsZero() const;
    
    /// Check if scalar is strictly below n (zero allowed)
    bool IsBelowOrder() const;
    
    /// Check if scalar is a valid private key (non-zero and < n)
    bool IsValid() const { return !IsZero() && IsBelowOrder(); }
    
    const uint8_t* data() const { return data_.data(); }
    const std::array<uint8_t, SIZE>& ToBytes() const { return data_; }
    
    /// Addition mod n
    Scalar operator+(const Scalar& other) const;
    
    bool operator==(const Scalar& other) const { return data_ == other.data_; }
    bool operator!=(const Scalar& other) const { return !(*this == other); }

private:
    std::array<uint8_t, SIZE> data_;
};

// ============================================================================
// Point (secp256k1 curve point)
// ============================================================================

/**
 * A point on the secp256k1 curve, held as an OpenSSL EC_POINT.
 */
class Point {
public:
    /// Default constructor - point at infinity
    Point();
    
    /// Parse compressed bytes (33 bytes: 02/03 || x). Fails for points off
    /// the curve or a bad prefix.
    static std::optional<Point> FromCompressed(const uint8_t* data, size_t len);
    static std::optional<Point> FromCompressed(const std::array<uint8_t, COMPRESSED_SIZE>& data) {
        return FromCompressed(data.data(), data.size());
    }
    
    /// Check if point at infinity
    bool IsInfinity() const;
    
    /// Serialize to compressed form. Must not be called on infinity.
    /// @throws std::logic_error for the point at infinity
    std::array<uint8_t, COMPRESSED_SIZE> ToCompressed() const;
    
    /// Point addition
    Point operator+(const Point& other) const;
    
    bool operator==(const Point& other) const;
    bool operator!=(const Point& other) const { return !(*this == other); }
    
    Point(const Point& other);
    Point& operator=(const Point& other);
    Point(Point&& other) noexcept;
    Point& operator=(Point&& other) noexcept;
    ~Point();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    
    explicit Point(std::unique_ptr<Impl> impl);
    
    friend std::optional<Point> ScalarBaseMultiply(const Scalar& scalar);
};

// ============================================================================
// High-Level Operations
// ============================================================================

/**
 * Scalar multiplication by the generator: scalar * G.
 * 
 * @return Public point, or nullopt if scalar is not a valid private key
 */
std::optional<Point> ScalarBaseMultiply(const Scalar& scalar);

/// Check that 32 bytes form a valid private key in [1, n-1]
bool IsValidPrivateKey(const uint8_t* key);
bool IsValidPrivateKey(const std::array<uint8_t, 32>& key);

/**
 * Compressed public key of a private scalar.
 * 
 * @return 33-byte point, or nullopt if the scalar is out of range
 */
std::optional<std::array<uint8_t, COMPRESSED_SIZE>> ComputePublicKey(const uint8_t* privKey);

/**
 * Public key tweak: result = P + tweak*G.
 * 
 * @param pubkey Compressed public key (33 bytes)
 * @param tweak 32-byte tweak, must be below n
 * @return Compressed result, or nullopt if the input is invalid or the sum
 *         is the point at infinity
 */
std::optional<std::array<uint8_t, COMPRESSED_SIZE>> PublicKeyTweakAdd(
    const uint8_t* pubkey, size_t pubkeyLen, const uint8_t* tweak);

} // namespace secp256k1
} // namespace cashseed

#endif // CASHSEED_CRYPTO_SECP256K1_H
