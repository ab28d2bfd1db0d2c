// CASHSEED - Extended Key Serialization (BIP32 xprv/xpub)
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/wallet/hdkey.h"
#include "cashseed/core/error.h"
#include "cashseed/crypto/base58.h"
#include "cashseed/crypto/hmac.h"
#include "cashseed/crypto/secp256k1.h"

#include <cstring>

namespace cashseed {
namespace wallet {

// Serialized layout (78 bytes):
//   [0..4)   version
//   [4]      depth
//   [5..9)   parent fingerprint
//   [9..13)  child index
//   [13..45) chain code
//   [45..78) 0x00 || private key, or compressed public key

std::array<Byte, ExtendedKey::SERIALIZED_SIZE> ExtendedKey::ToBytes() const {
    Bytes out;
    out.reserve(SERIALIZED_SIZE);
    
    WriteBE32(out, isPrivate_ ? VERSION_PRIVATE : VERSION_PUBLIC);
    out.push_back(depth_);
    WriteBE32(out, parentFingerprint_);
    WriteBE32(out, childIndex_);
    out.insert(out.end(), chainCode_.begin(), chainCode_.end());
    
    if (isPrivate_) {
        out.push_back(0x00);
        out.insert(out.end(), privateKey_.begin(), privateKey_.end());
    } else {
        out.insert(out.end(), publicKey_.begin(), publicKey_.end());
    }
    
    std::array<Byte, SERIALIZED_SIZE> result{};
    std::memcpy(result.data(), out.data(), SERIALIZED_SIZE);
    SecureClear(out);
    return result;
}

std::string ExtendedKey::ToBase58() const {
    std::array<Byte, SERIALIZED_SIZE> raw = ToBytes();
    std::vector<Byte> payload(raw.begin(), raw.end());
    std::string encoded = EncodeBase58Check(payload);
    SecureClear(raw);
    SecureClear(payload);
    return encoded;
}

ExtendedKey ExtendedKey::FromBase58(const std::string& str) {
    auto data = DecodeBase58Check(str);
    if (!data) {
        throw KeyError(ErrorCode::MalformedExtendedKey, "invalid Base58Check encoding or checksum");
    }
    if (data->size() != SERIALIZED_SIZE) {
        size_t got = data->size();
        SecureClear(*data);
        throw KeyError(ErrorCode::MalformedExtendedKey,
                       "extended key payload is " + std::to_string(got) + " bytes, expected 78");
    }
    
    try {
        ExtendedKey key = FromBytes(data->data(), data->size());
        SecureClear(*data);
        return key;
    } catch (const KeyError&) {
        SecureClear(*data);
        throw;
    }
}

ExtendedKey ExtendedKey::FromBytes(const Byte* data, size_t len) {
    if (data == nullptr || len != SERIALIZED_SIZE) {
        throw KeyError(ErrorCode::MalformedExtendedKey,
                       "extended key must be 78 bytes, got " + std::to_string(len));
    }
    
    uint32_t version = ReadBE32(data);
    
    bool isPrivate;
    if (version == VERSION_PRIVATE) {
        isPrivate = true;
    } else if (version == VERSION_PUBLIC) {
        isPrivate = false;
    } else {
        throw KeyError(ErrorCode::MalformedExtendedKey, "unknown extended key version");
    }
    
    uint8_t depth = data[4];
    uint32_t parentFingerprint = ReadBE32(data + 5);
    uint32_t childIndex = ReadBE32(data + 9);
    
    // A master key has no parent
    if (depth == 0 && (parentFingerprint != 0 || childIndex != 0)) {
        throw KeyError(ErrorCode::MalformedExtendedKey,
                       "depth 0 key with non-zero parent fingerprint or index");
    }
    
    ChainCode chainCode{};
    std::memcpy(chainCode.data(), data + 13, CHAIN_CODE_SIZE);
    
    if (isPrivate) {
        if (data[45] != 0x00) {
            throw KeyError(ErrorCode::MalformedExtendedKey, "private key field lacks 0x00 prefix");
        }
        PrivateKeyBytes key{};
        std::memcpy(key.data(), data + 46, PRIVATE_KEY_SIZE);
        if (!secp256k1::IsValidPrivateKey(key)) {
            SecureClear(key);
            throw KeyError(ErrorCode::MalformedExtendedKey, "private key out of range");
        }
        ExtendedKey result = FromPrivateKey(key, chainCode, depth, parentFingerprint, childIndex);
        SecureClear(key);
        return result;
    }
    
    PublicKeyBytes key{};
    std::memcpy(key.data(), data + 45, PUBLIC_KEY_SIZE);
    if (!secp256k1::Point::FromCompressed(key)) {
        throw KeyError(ErrorCode::MalformedExtendedKey, "public key is not a compressed curve point");
    }
    return FromPublicKey(key, chainCode, depth, parentFingerprint, childIndex);
}

} // namespace wallet
} // namespace cashseed
