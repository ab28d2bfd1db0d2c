// CASHSEED - secp256k1 Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/crypto/secp256k1.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace cashseed {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

const std::array<uint8_t, 32> CURVE_ORDER = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
};

// ============================================================================
// Scalar Implementation
// ============================================================================

Scalar::Scalar() {
    data_.fill(0);
}

Scalar::Scalar(const uint8_t* data) {
    std::memcpy(data_.data(), data, SIZE);
}

Scalar::Scalar(const std::array<uint8_t, SIZE>& data) : data_(data) {}

Scalar::~Scalar() {
    OPENSSL_cleanse(data_.data(), SIZE);
}

bool Scalar::IsZero() const {
    return std::all_of(data_.begin(), data_.end(), [](uint8_t b) { return b == 0; });
}

bool Scalar::IsBelowOrder() const {
    // Big-endian byte arrays compare lexicographically
    return data_ < CURVE_ORDER;
}

Scalar Scalar::operator+(const Scalar& other) const {
    Scalar result;
    
    BIGNUM* a = BN_bin2bn(data_.data(), SIZE, nullptr);
    BIGNUM* b = BN_bin2bn(other.data_.data(), SIZE, nullptr);
    BIGNUM* n = BN_bin2bn(CURVE_ORDER.data(), 32, nullptr);
    BIGNUM* r = BN_new();
    BN_CTX* ctx = BN_CTX_new();
    
    bool ok = a && b && n && r && ctx &&
              BN_mod_add(r, a, b, n, ctx) == 1 &&
              BN_bn2binpad(r, result.data_.data(), SIZE) == static_cast<int>(SIZE);
    
    BN_clear_free(a);
    BN_clear_free(b);
    BN_free(n);
    BN_clear_free(r);
    BN_CTX_free(ctx);
    
    if (!ok) {
        throw std::runtime_error("secp256k1: scalar addition failed");
    }
    return result;
}

// ============================================================================
// Point Implementation
// ============================================================================

struct Point::Impl {
    EC_GROUP* group{nullptr};
    EC_POINT* point{nullptr};
    BN_CTX* ctx{nullptr};
    
    Impl() {
        group = EC_GROUP_new_by_curve_name(NID_secp256k1);
        ctx = BN_CTX_new();
        if (group) {
            point = EC_POINT_new(group);
            if (point) {
                EC_POINT_set_to_infinity(group, point);
            }
        }
        if (!group || !ctx || !point) {
            Release();
            throw std::runtime_error("secp256k1: failed to allocate curve point");
        }
    }
    
    Impl(const Impl& other) : Impl() {
        if (EC_POINT_copy(point, other.point) != 1) {
            Release();
            throw std::runtime_error("secp256k1: failed to copy curve point");
        }
    }
    
    ~Impl() {
        Release();
    }
    
    void Release() {
        if (point) EC_POINT_free(point);
        if (group) EC_GROUP_free(group);
        if (ctx) BN_CTX_free(ctx);
        point = nullptr;
        group = nullptr;
        ctx = nullptr;
    }
};

Point::Point() : impl_(std::make_unique<Impl>()) {}

Point::Point(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

Point::Point(const Point& other) : impl_(std::make_unique<Impl>(*other.impl_)) {}

Point& Point::operator=(const Point& other) {
    if (this != &other) {
        impl_ = std::make_unique<Impl>(*other.impl_);
    }
    return *this;
}

Point::Point(Point&& other) noexcept = default;

Point& Point::operator=(Point&& other) noexcept = default;

Point::~Point() = default;

std::optional<Point> Point::FromCompressed(const uint8_t* data, size_t len) {
    if (!data || len != COMPRESSED_SIZE || (data[0] != 0x02 && data[0] != 0x03)) {
        return std::nullopt;
    }
    
    auto impl = std::make_unique<Impl>();
    // oct2point rejects x coordinates with no matching curve point
    if (EC_POINT_oct2point(impl->group, impl->point, data, len, impl->ctx) != 1) {
        return std::nullopt;
    }
    return Point(std::move(impl));
}

bool Point::IsInfinity() const {
    return EC_POINT_is_at_infinity(impl_->group, impl_->point) == 1;
}

std::array<uint8_t, COMPRESSED_SIZE> Point::ToCompressed() const {
    if (IsInfinity()) {
        throw std::logic_error("secp256k1: cannot serialize the point at infinity");
    }
    
    std::array<uint8_t, COMPRESSED_SIZE> result{};
    size_t written = EC_POINT_point2oct(impl_->group, impl_->point,
                                        POINT_CONVERSION_COMPRESSED,
                                        result.data(), result.size(), impl_->ctx);
    if (written != COMPRESSED_SIZE) {
        throw std::runtime_error("secp256k1: point serialization failed");
    }
    return result;
}

Point Point::operator+(const Point& other) const {
    auto impl = std::make_unique<Impl>();
    if (EC_POINT_add(impl->group, impl->point, impl_->point, other.impl_->point,
                     impl->ctx) != 1) {
        throw std::runtime_error("secp256k1: point addition failed");
    }
    return Point(std::move(impl));
}

bool Point::operator==(const Point& other) const {
    return EC_POINT_cmp(impl_->group, impl_->point, other.impl_->point, impl_->ctx) == 0;
}

// ============================================================================
// High-Level Operations
// ============================================================================

std::optional<Point> ScalarBaseMultiply(const Scalar& scalar) {
    if (!scalar.IsValid()) {
        return std::nullopt;
    }
    
    auto impl = std::make_unique<Point::Impl>();
    BIGNUM* k = BN_secure_new();
    if (!k) {
        throw std::runtime_error("secp256k1: BIGNUM allocation failed");
    }
    
    bool ok = BN_bin2bn(scalar.data(), Scalar::SIZE, k) != nullptr &&
              EC_POINT_mul(impl->group, impl->point, k, nullptr, nullptr, impl->ctx) == 1;
    BN_clear_free(k);
    
    if (!ok) {
        throw std::runtime_error("secp256k1: generator multiplication failed");
    }
    return Point(std::move(impl));
}

bool IsValidPrivateKey(const uint8_t* key) {
    return Scalar(key).IsValid();
}

bool IsValidPrivateKey(const std::array<uint8_t, 32>& key) {
    return Scalar(key).IsValid();
}

std::optional<std::array<uint8_t, COMPRESSED_SIZE>> ComputePublicKey(const uint8_t* privKey) {
    auto point = ScalarBaseMultiply(Scalar(privKey));
    if (!point) {
        return std::nullopt;
    }
    return point->ToCompressed();
}

std::optional<std::array<uint8_t, COMPRESSED_SIZE>> PublicKeyTweakAdd(
    const uint8_t* pubkey, size_t pubkeyLen, const uint8_t* tweak) {
    auto parent = Point::FromCompressed(pubkey, pubkeyLen);
    if (!parent) {
        return std::nullopt;
    }
    
    Scalar t(tweak);
    if (!t.IsBelowOrder()) {
        return std::nullopt;
    }
    
    // A zero tweak leaves the parent unchanged
    if (t.IsZero()) {
        return parent->ToCompressed();
    }
    
    auto tG = ScalarBaseMultiply(t);
    if (!tG) {
        return std::nullopt;
    }
    
    Point sum = *tG + *parent;
    if (sum.IsInfinity()) {
        return std::nullopt;
    }
    return sum.ToCompressed();
}

} // namespace secp256k1
} // namespace cashseed
