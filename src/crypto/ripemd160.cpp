// CASHSEED - RIPEMD160 Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/crypto/ripemd160.h"
#include "cashseed/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace cashseed {

struct RIPEMD160::Impl {
    EVP_MD_CTX* ctx{nullptr};
    
    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("RIPEMD160: EVP_MD_CTX_new failed");
        }
    }
    
    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }
};

RIPEMD160::RIPEMD160() : impl_(std::make_unique<Impl>()) {
    Reset();
}

RIPEMD160::~RIPEMD160() = default;

RIPEMD160::RIPEMD160(RIPEMD160&&) noexcept = default;

RIPEMD160& RIPEMD160::operator=(RIPEMD160&&) noexcept = default;

RIPEMD160& RIPEMD160::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("RIPEMD160: digest update failed");
    }
    return *this;
}

void RIPEMD160::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("RIPEMD160: digest finalization failed");
    }
}

RIPEMD160& RIPEMD160::Reset() {
    // Served by the default provider on OpenSSL 3.0.7 and later
    if (EVP_DigestInit_ex(impl_->ctx, EVP_ripemd160(), nullptr) != 1) {
        throw std::runtime_error("RIPEMD160: digest unavailable in this OpenSSL build");
    }
    return *this;
}

Hash160 RIPEMD160Hash(const Byte* data, size_t len) {
    Hash160 result;
    RIPEMD160().Write(data, len).Finalize(result.data());
    return result;
}

Hash160 Hash160FromData(const Byte* data, size_t len) {
    Hash256 sha = SHA256Hash(data, len);
    return RIPEMD160Hash(sha.data(), sha.size());
}

} // namespace cashseed
