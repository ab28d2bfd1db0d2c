// CASHSEED - SHA256 Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace cashseed {

struct SHA256::Impl {
    EVP_MD_CTX* ctx{nullptr};
    
    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("SHA256: EVP_MD_CTX_new failed");
        }
    }
    
    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {
    Reset();
}

SHA256::~SHA256() = default;

SHA256::SHA256(SHA256&&) noexcept = default;

SHA256& SHA256::operator=(SHA256&&) noexcept = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("SHA256: digest update failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: digest finalization failed");
    }
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA256: digest init failed");
    }
    return *this;
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 result;
    SHA256().Write(data, len).Finalize(result.data());
    return result;
}

Hash256 DoubleSHA256(const Byte* data, size_t len) {
    Hash256 first = SHA256Hash(data, len);
    return SHA256Hash(first.data(), first.size());
}

} // namespace cashseed
