// CASHSEED - HMAC and PBKDF2 Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/crypto/hmac.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <limits>
#include <stdexcept>

namespace cashseed {

// ============================================================================
// HMAC-SHA512
// ============================================================================

Hash512 ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen) {
    if (keyLen > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("HMAC-SHA512: key too long");
    }
    
    // OpenSSL rejects a null key pointer even for an empty key
    static const Byte EMPTY = 0;
    const Byte* keyPtr = keyLen > 0 ? key : &EMPTY;
    const Byte* dataPtr = dataLen > 0 ? data : &EMPTY;
    
    Hash512 result;
    unsigned int resultLen = 0;
    if (HMAC(EVP_sha512(), keyPtr, static_cast<int>(keyLen),
             dataPtr, dataLen, result.data(), &resultLen) == nullptr ||
        resultLen != hmac::SHA512_SIZE) {
        throw std::runtime_error("HMAC-SHA512: OpenSSL computation failed");
    }
    return result;
}

// ============================================================================
// PBKDF2
// ============================================================================

std::vector<Byte> PBKDF2_SHA512(const std::string& password,
                                 const std::string& salt,
                                 uint32_t iterations,
                                 size_t keyLen) {
    if (iterations == 0) {
        throw std::invalid_argument("PBKDF2: iteration count must be non-zero");
    }
    if (keyLen == 0) {
        throw std::invalid_argument("PBKDF2: key length must be non-zero");
    }
    
    std::vector<Byte> result(keyLen);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()),
                          static_cast<int>(salt.size()),
                          static_cast<int>(iterations),
                          EVP_sha512(),
                          static_cast<int>(keyLen), result.data()) != 1) {
        SecureClear(result);
        throw std::runtime_error("PBKDF2: OpenSSL derivation failed");
    }
    return result;
}

// ============================================================================
// Secret Handling Helpers
// ============================================================================

bool ConstantTimeCompare(const Byte* a, const Byte* b, size_t len) {
    return CRYPTO_memcmp(a, b, len) == 0;
}

void SecureClear(void* data, size_t len) {
    if (data && len > 0) {
        OPENSSL_cleanse(data, len);
    }
}

} // namespace cashseed
