// CASHSEED - RIPEMD160 Hash Function
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#ifndef CASHSEED_CRYPTO_RIPEMD160_H
#define CASHSEED_CRYPTO_RIPEMD160_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include "cashseed/core/types.h"

namespace cashseed {

/// RIPEMD-160 hasher class
class RIPEMD160 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 20;
    
    RIPEMD160();
    ~RIPEMD160();
    
    RIPEMD160(const RIPEMD160&) = delete;
    RIPEMD160& operator=(const RIPEMD160&) = delete;
    RIPEMD160(RIPEMD160&&) noexcept;
    RIPEMD160& operator=(RIPEMD160&&) noexcept;
    
    RIPEMD160& Write(const Byte* data, size_t len);
    
    /// Write OUTPUT_SIZE bytes to hash
    void Finalize(Byte hash[OUTPUT_SIZE]);
    
    RIPEMD160& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute RIPEMD160 hash of data in a single call
Hash160 RIPEMD160Hash(const Byte* data, size_t len);

inline Hash160 RIPEMD160Hash(const std::vector<Byte>& data) {
    return RIPEMD160Hash(data.data(), data.size());
}

/// Compute Hash160 (RIPEMD160(SHA256(data))), the key hash used by
/// fingerprints and addresses
Hash160 Hash160FromData(const Byte* data, size_t len);

inline Hash160 Hash160FromData(const std::vector<Byte>& data) {
    return Hash160FromData(data.data(), data.size());
}

} // namespace cashseed

#endif // CASHSEED_CRYPTO_RIPEMD160_H
