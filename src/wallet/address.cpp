// CASHSEED - Receive Address Encoding Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/wallet/address.h"
#include "cashseed/core/error.h"
#include "cashseed/crypto/base58.h"
#include "cashseed/crypto/cashaddr.h"
#include "cashseed/crypto/ripemd160.h"
#include "cashseed/util/logging.h"

#include <algorithm>
#include <cctype>

namespace cashseed {
namespace wallet {

// ============================================================================
// Address Format
// ============================================================================

std::optional<AddressFormat> ParseAddressFormat(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    if (lower == "legacy") return AddressFormat::Legacy;
    if (lower == "cashaddr") return AddressFormat::CashAddr;
    return std::nullopt;
}

const char* AddressFormatToString(AddressFormat format) {
    switch (format) {
        case AddressFormat::Legacy: return "legacy";
        case AddressFormat::CashAddr: return "cashaddr";
    }
    return "unknown";
}

// ============================================================================
// Encoding
// ============================================================================

std::string EncodeLegacyAddress(const Hash160& keyHash) {
    std::vector<uint8_t> payload;
    payload.reserve(1 + Hash160::SIZE);
    payload.push_back(LEGACY_P2PKH_VERSION);
    payload.insert(payload.end(), keyHash.begin(), keyHash.end());
    return EncodeBase58Check(payload);
}

std::string EncodeCashAddress(const Hash160& keyHash) {
    std::vector<uint8_t> payload;
    payload.reserve(1 + Hash160::SIZE);
    payload.push_back(CASHADDR_P2PKH_VERSION);
    payload.insert(payload.end(), keyHash.begin(), keyHash.end());
    return cashaddr::Encode(CASHADDR_PREFIX, payload);
}

std::string EncodeAddress(const Byte* pubKey, size_t len, AddressFormat format) {
    if (pubKey == nullptr || len != ExtendedKey::PUBLIC_KEY_SIZE ||
        (pubKey[0] != 0x02 && pubKey[0] != 0x03)) {
        throw KeyError(ErrorCode::InvalidEncodingInput,
                       "expected a 33-byte compressed public key, got " +
                       std::to_string(len) + " bytes");
    }
    
    Hash160 keyHash = Hash160FromData(pubKey, len);
    switch (format) {
        case AddressFormat::Legacy:
            return EncodeLegacyAddress(keyHash);
        case AddressFormat::CashAddr:
            return EncodeCashAddress(keyHash);
    }
    throw KeyError(ErrorCode::InvalidEncodingInput, "unknown address format");
}

// ============================================================================
// Decoding
// ============================================================================

Hash160 DecodeLegacyAddress(const std::string& address) {
    auto data = DecodeBase58Check(address);
    if (!data) {
        throw KeyError(ErrorCode::InvalidEncodingInput, "invalid Base58Check address");
    }
    if (data->size() != 1 + Hash160::SIZE) {
        throw KeyError(ErrorCode::InvalidEncodingInput,
                       "legacy address payload is " + std::to_string(data->size()) +
                       " bytes, expected 21");
    }
    if ((*data)[0] != LEGACY_P2PKH_VERSION) {
        throw KeyError(ErrorCode::InvalidEncodingInput, "not a P2PKH legacy address");
    }
    return Hash160(data->data() + 1, Hash160::SIZE);
}

Hash160 DecodeCashAddress(const std::string& address) {
    auto content = cashaddr::Decode(address, CASHADDR_PREFIX);
    if (!content) {
        throw KeyError(ErrorCode::InvalidEncodingInput, "invalid CashAddr encoding or checksum");
    }
    if (content->prefix != CASHADDR_PREFIX) {
        throw KeyError(ErrorCode::InvalidEncodingInput,
                       "unexpected CashAddr prefix: " + content->prefix);
    }
    if (content->payload.size() != 1 + Hash160::SIZE) {
        throw KeyError(ErrorCode::InvalidEncodingInput,
                       "CashAddr payload is " + std::to_string(content->payload.size()) +
                       " bytes, expected 21");
    }
    if (content->payload[0] != CASHADDR_P2PKH_VERSION) {
        throw KeyError(ErrorCode::InvalidEncodingInput, "not a P2PKH CashAddr address");
    }
    return Hash160(content->payload.data() + 1, Hash160::SIZE);
}

// ============================================================================
// Receive Addresses
// ============================================================================

std::string DeriveReceiveAddress(const ExtendedKey& accountKey, AddressFormat format,
                                 uint32_t index) {
    ExtendedKey child = accountKey.Neuter().DeriveChild(RECEIVE_BRANCH).DeriveChild(index);
    std::string address = EncodeAddress(child.GetPublicKey(), format);
    
    LOG_DEBUG(util::LogCategory::ADDRESS) << "Derived " << AddressFormatToString(format)
                                          << " address at index " << index;
    return address;
}

std::string DeriveReceiveAddress(const std::string& accountXpub, AddressFormat format,
                                 uint32_t index) {
    return DeriveReceiveAddress(ExtendedKey::FromBase58(accountXpub), format, index);
}

} // namespace wallet
} // namespace cashseed
