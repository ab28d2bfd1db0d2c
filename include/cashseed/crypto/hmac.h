// CASHSEED - HMAC and PBKDF2
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// HMAC-SHA512 (RFC 2104) and PBKDF2-HMAC-SHA512 (RFC 8018) over OpenSSL,
// plus the helpers used to compare and wipe secret buffers.

#ifndef CASHSEED_CRYPTO_HMAC_H
#define CASHSEED_CRYPTO_HMAC_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "cashseed/core/types.h"

namespace cashseed {

namespace hmac {
    /// HMAC-SHA512 output size
    constexpr size_t SHA512_SIZE = 64;
}

// ============================================================================
// HMAC-SHA512
// ============================================================================

/**
 * Compute HMAC-SHA512 in one call.
 * 
 * @param key Secret key
 * @param keyLen Key length
 * @param data Data to authenticate
 * @param dataLen Data length
 * @return 64-byte MAC
 */
Hash512 ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen);

/// Compute HMAC-SHA512 with vectors
inline Hash512 ComputeHMAC_SHA512(const std::vector<Byte>& key,
                                   const std::vector<Byte>& data) {
    return ComputeHMAC_SHA512(key.data(), key.size(), data.data(), data.size());
}

/// Compute HMAC-SHA512 with array key
template<size_t N>
inline Hash512 ComputeHMAC_SHA512(const std::array<Byte, N>& key,
                                   const std::vector<Byte>& data) {
    return ComputeHMAC_SHA512(key.data(), N, data.data(), data.size());
}

// ============================================================================
// PBKDF2
// ============================================================================

/**
 * PBKDF2 with HMAC-SHA512.
 * 
 * @param password Password bytes (used as the HMAC key)
 * @param salt Salt bytes
 * @param iterations Iteration count, must be non-zero
 * @param keyLen Desired key length
 * @return Derived key
 * @throws std::invalid_argument if iterations or keyLen is zero
 */
std::vector<Byte> PBKDF2_SHA512(const std::string& password,
                                 const std::string& salt,
                                 uint32_t iterations,
                                 size_t keyLen);

// ============================================================================
// Secret Handling Helpers
// ============================================================================

/// Constant-time comparison of two buffers of length len
bool ConstantTimeCompare(const Byte* a, const Byte* b, size_t len);

/// Overwrite a buffer with zeros in a way the optimizer cannot drop
void SecureClear(void* data, size_t len);

template<typename Container>
void SecureClear(Container& buf) {
    if (!buf.empty()) {
        SecureClear(&buf[0], buf.size() * sizeof(buf[0]));
    }
}

} // namespace cashseed

#endif // CASHSEED_CRYPTO_HMAC_H
