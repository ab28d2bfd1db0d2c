// CASHSEED - HD Key Derivation Implementation (BIP32/BIP44)
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/wallet/hdkey.h"
#include "cashseed/core/error.h"
#include "cashseed/core/hex.h"
#include "cashseed/crypto/hmac.h"
#include "cashseed/crypto/ripemd160.h"
#include "cashseed/crypto/secp256k1.h"
#include "cashseed/util/logging.h"

#include <algorithm>
#include <cstring>
#include <sstream>

namespace cashseed {
namespace wallet {

namespace {

/// HMAC key for master key generation
constexpr const char* BIP32_SEED_KEY = "Bitcoin seed";

/// Split I = HMAC-SHA512 output into the tweak (IL) and chain code (IR)
void SplitHMAC(const Hash512& hash, ExtendedKey::PrivateKeyBytes& left,
               ExtendedKey::ChainCode& right) {
    std::memcpy(left.data(), hash.data(), 32);
    std::memcpy(right.data(), hash.data() + 32, 32);
}

} // namespace

// ============================================================================
// PathComponent Implementation
// ============================================================================

std::optional<PathComponent> PathComponent::FromString(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }
    
    bool hardened = false;
    std::string numStr = str;
    
    if (str.back() == '\'' || str.back() == 'h' || str.back() == 'H') {
        hardened = true;
        numStr = str.substr(0, str.size() - 1);
    }
    
    if (numStr.empty() || numStr.size() > 10 ||
        !std::all_of(numStr.begin(), numStr.end(),
                     [](unsigned char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    
    uint64_t index = std::stoull(numStr);
    if (index >= HARDENED_FLAG) {
        return std::nullopt;
    }
    return PathComponent(static_cast<uint32_t>(index), hardened);
}

std::string PathComponent::ToString() const {
    return std::to_string(index) + (hardened ? "'" : "");
}

// ============================================================================
// DerivationPath Implementation
// ============================================================================

std::optional<DerivationPath> DerivationPath::FromString(const std::string& path) {
    if (path.empty() || (path[0] != 'm' && path[0] != 'M')) {
        return std::nullopt;
    }
    if (path.size() == 1) {
        return DerivationPath();
    }
    if (path[1] != '/') {
        return std::nullopt;
    }
    
    std::vector<PathComponent> components;
    std::istringstream stream(path.substr(2));
    std::string token;
    
    while (std::getline(stream, token, '/')) {
        auto comp = PathComponent::FromString(token);
        if (!comp) {
            return std::nullopt;
        }
        components.push_back(*comp);
    }
    
    // "m/" or a trailing slash
    if (components.empty() || path.back() == '/') {
        return std::nullopt;
    }
    
    return DerivationPath(std::move(components));
}

DerivationPath DerivationPath::BIP44Account(uint32_t account) {
    std::vector<PathComponent> components;
    components.emplace_back(BIP44_PURPOSE, true);       // 44'
    components.emplace_back(BCH_COIN_TYPE, true);       // 145'
    components.emplace_back(account, true);             // account'
    return DerivationPath(std::move(components));
}

DerivationPath DerivationPath::Child(uint32_t index, bool hardened) const {
    std::vector<PathComponent> newComponents = components_;
    newComponents.emplace_back(index, hardened);
    return DerivationPath(std::move(newComponents));
}

std::string DerivationPath::ToString() const {
    std::string result = "m";
    for (const auto& comp : components_) {
        result += "/" + comp.ToString();
    }
    return result;
}

bool DerivationPath::operator==(const DerivationPath& other) const {
    return components_ == other.components_;
}

// ============================================================================
// ExtendedKey Implementation
// ============================================================================

ExtendedKey::~ExtendedKey() {
    SecureClear(privateKey_);
}

ExtendedKey ExtendedKey::FromPrivateKey(const PrivateKeyBytes& key, const ChainCode& chainCode,
                                        uint8_t depth, uint32_t parentFingerprint,
                                        uint32_t childIndex) {
    auto pubKey = secp256k1::ComputePublicKey(key.data());
    if (!pubKey) {
        throw KeyError(ErrorCode::ScalarOutOfRange, "private key is zero or not below the curve order");
    }
    
    ExtendedKey result;
    result.privateKey_ = key;
    result.publicKey_ = *pubKey;
    result.chainCode_ = chainCode;
    result.depth_ = depth;
    result.parentFingerprint_ = parentFingerprint;
    result.childIndex_ = childIndex;
    result.isPrivate_ = true;
    return result;
}

ExtendedKey ExtendedKey::FromPublicKey(const PublicKeyBytes& key, const ChainCode& chainCode,
                                       uint8_t depth, uint32_t parentFingerprint,
                                       uint32_t childIndex) {
    if (!secp256k1::Point::FromCompressed(key)) {
        throw KeyError(ErrorCode::InvalidEncodingInput, "public key is not a compressed curve point");
    }
    
    ExtendedKey result;
    result.publicKey_ = key;
    result.chainCode_ = chainCode;
    result.depth_ = depth;
    result.parentFingerprint_ = parentFingerprint;
    result.childIndex_ = childIndex;
    result.isPrivate_ = false;
    return result;
}

ExtendedKey ExtendedKey::FromSeed(const Byte* seed, size_t seedLen) {
    if (seed == nullptr || seedLen < 16 || seedLen > 64) {
        throw KeyError(ErrorCode::InvalidEncodingInput,
                       "seed must be 16 to 64 bytes, got " + std::to_string(seedLen));
    }
    
    Hash512 hash = ComputeHMAC_SHA512(reinterpret_cast<const Byte*>(BIP32_SEED_KEY),
                                      std::strlen(BIP32_SEED_KEY), seed, seedLen);
    
    PrivateKeyBytes key{};
    ChainCode chainCode{};
    SplitHMAC(hash, key, chainCode);
    
    ExtendedKey master = FromPrivateKey(key, chainCode);
    SecureClear(key);
    
    LOG_DEBUG(util::LogCategory::DERIVE) << "Master key fingerprint "
                                         << FingerprintToHex(master.GetFingerprint());
    return master;
}

ExtendedKey ExtendedKey::DeriveChild(uint32_t index) const {
    if (depth_ == 0xFF) {
        throw KeyError(ErrorCode::InvalidEncodingInput, "maximum derivation depth reached");
    }
    return isPrivate_ ? DerivePrivateChild(index) : DerivePublicChild(index);
}

ExtendedKey ExtendedKey::DerivePath(const DerivationPath& path) const {
    ExtendedKey current = *this;
    for (const auto& comp : path.GetComponents()) {
        current = current.DeriveChild(comp.GetFullIndex());
    }
    return current;
}

ExtendedKey ExtendedKey::DerivePrivateChild(uint32_t index) const {
    bool hardened = (index & HARDENED_FLAG) != 0;
    
    // Data for HMAC
    std::vector<Byte> data;
    data.reserve(37);
    
    if (hardened) {
        // Hardened: 0x00 || private key || index
        data.push_back(0x00);
        data.insert(data.end(), privateKey_.begin(), privateKey_.end());
    } else {
        // Normal: public key || index
        data.insert(data.end(), publicKey_.begin(), publicKey_.end());
    }
    WriteBE32(data, index);
    
    Hash512 hash = ComputeHMAC_SHA512(chainCode_, data);
    SecureClear(data);
    
    PrivateKeyBytes tweakBytes{};
    ChainCode newChainCode{};
    SplitHMAC(hash, tweakBytes, newChainCode);
    
    secp256k1::Scalar tweak(tweakBytes);
    SecureClear(tweakBytes);
    if (!tweak.IsBelowOrder()) {
        throw KeyError(ErrorCode::ScalarOutOfRange,
                       "derivation tweak exceeds curve order at index " + std::to_string(index));
    }
    
    // Child key = IL + parent key (mod n)
    secp256k1::Scalar child = tweak + secp256k1::Scalar(privateKey_);
    if (child.IsZero()) {
        throw KeyError(ErrorCode::ScalarOutOfRange,
                       "derived key is zero at index " + std::to_string(index));
    }
    
    return FromPrivateKey(child.ToBytes(), newChainCode, depth_ + 1, GetFingerprint(), index);
}

ExtendedKey ExtendedKey::DerivePublicChild(uint32_t index) const {
    // Cannot derive hardened child from public key
    if ((index & HARDENED_FLAG) != 0) {
        throw KeyError(ErrorCode::UnsupportedHardenedPublicDerivation,
                       "hardened index " + std::to_string(index & ~HARDENED_FLAG) +
                       "' requires a private key");
    }
    
    // Data: compressed public key (33 bytes) || index (4 bytes big-endian)
    std::vector<Byte> data(publicKey_.begin(), publicKey_.end());
    WriteBE32(data, index);
    
    Hash512 hash = ComputeHMAC_SHA512(chainCode_, data);
    
    PrivateKeyBytes tweak{};
    ChainCode newChainCode{};
    SplitHMAC(hash, tweak, newChainCode);
    
    if (!secp256k1::Scalar(tweak).IsBelowOrder()) {
        throw KeyError(ErrorCode::ScalarOutOfRange,
                       "derivation tweak exceeds curve order at index " + std::to_string(index));
    }
    
    // childPubKey = IL * G + parentPubKey
    auto childPubKey = secp256k1::PublicKeyTweakAdd(publicKey_.data(), publicKey_.size(),
                                                     tweak.data());
    if (!childPubKey) {
        throw KeyError(ErrorCode::ScalarOutOfRange,
                       "derived point is at infinity at index " + std::to_string(index));
    }
    
    return FromPublicKey(*childPubKey, newChainCode, depth_ + 1, GetFingerprint(), index);
}

ExtendedKey ExtendedKey::Neuter() const {
    return FromPublicKey(publicKey_, chainCode_, depth_, parentFingerprint_, childIndex_);
}

std::optional<ExtendedKey::PrivateKeyBytes> ExtendedKey::GetPrivateKey() const {
    if (!isPrivate_) {
        return std::nullopt;
    }
    return privateKey_;
}

Hash160 ExtendedKey::GetIdentifier() const {
    return Hash160FromData(publicKey_.data(), publicKey_.size());
}

uint32_t ExtendedKey::GetFingerprint() const {
    return ReadBE32(GetIdentifier().data());
}

bool ExtendedKey::operator==(const ExtendedKey& other) const {
    return isPrivate_ == other.isPrivate_ &&
           depth_ == other.depth_ &&
           parentFingerprint_ == other.parentFingerprint_ &&
           childIndex_ == other.childIndex_ &&
           chainCode_ == other.chainCode_ &&
           publicKey_ == other.publicKey_ &&
           ConstantTimeCompare(privateKey_.data(), other.privateKey_.data(), PRIVATE_KEY_SIZE);
}

// ============================================================================
// Account Helpers
// ============================================================================

ExtendedKey DeriveAccountKey(const std::array<Byte, 64>& seed) {
    ExtendedKey account = ExtendedKey::FromSeed(seed).DerivePath(DerivationPath::BIP44Account(0));
    LogDebugF(util::LogCategory::DERIVE, "Derived account key m/44'/145'/0' fingerprint %s",
              FingerprintToHex(account.GetFingerprint()).c_str());
    return account;
}

std::string FingerprintToHex(uint32_t fingerprint) {
    Bytes bytes;
    WriteBE32(bytes, fingerprint);
    return BytesToHex(bytes);
}

} // namespace wallet
} // namespace cashseed
