// CASHSEED - SHA256 Hash Function
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// SHA-256 (FIPS 180-4) backed by the OpenSSL EVP digest interface.

#ifndef CASHSEED_CRYPTO_SHA256_H
#define CASHSEED_CRYPTO_SHA256_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "cashseed/core/types.h"

namespace cashseed {

/// SHA-256 hasher class
/// Provides incremental hashing capability
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;
    
    SHA256();
    ~SHA256();
    
    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;
    SHA256(SHA256&&) noexcept;
    SHA256& operator=(SHA256&&) noexcept;
    
    /// Write data to the hasher
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);
    
    /// Finalize the hash and write OUTPUT_SIZE bytes to hash.
    /// The hasher must be Reset() before reuse.
    void Finalize(Byte hash[OUTPUT_SIZE]);
    
    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute double SHA256 (SHA256(SHA256(data))), the Base58Check checksum hash
Hash256 DoubleSHA256(const Byte* data, size_t len);

inline Hash256 DoubleSHA256(const std::vector<Byte>& data) {
    return DoubleSHA256(data.data(), data.size());
}

} // namespace cashseed

#endif // CASHSEED_CRYPTO_SHA256_H
