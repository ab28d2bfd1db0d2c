// CASHSEED - Receive Address Encoding
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// Pay-to-public-key-hash addresses in two text formats:
// - Legacy: Base58Check(0x00 || hash160), e.g. 1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH
// - CashAddr: bitcoincash:q... over the same version byte and hash160

#ifndef CASHSEED_WALLET_ADDRESS_H
#define CASHSEED_WALLET_ADDRESS_H

#include "cashseed/core/types.h"
#include "cashseed/wallet/hdkey.h"

#include <cstdint>
#include <optional>
#include <string>

namespace cashseed {
namespace wallet {

// ============================================================================
// Constants
// ============================================================================

/// CashAddr human-readable prefix
constexpr const char* CASHADDR_PREFIX = "bitcoincash";

/// Legacy P2PKH version byte
constexpr uint8_t LEGACY_P2PKH_VERSION = 0x00;

/// CashAddr version byte for P2PKH with a 160-bit hash
constexpr uint8_t CASHADDR_P2PKH_VERSION = 0x00;

// ============================================================================
// Address Format
// ============================================================================

enum class AddressFormat {
    Legacy,
    CashAddr,
};

/// "legacy" or "cashaddr" (case-insensitive)
std::optional<AddressFormat> ParseAddressFormat(const std::string& name);

const char* AddressFormatToString(AddressFormat format);

// ============================================================================
// Encoding
// ============================================================================

/// Legacy address for a public key hash
std::string EncodeLegacyAddress(const Hash160& keyHash);

/// CashAddr address for a public key hash
std::string EncodeCashAddress(const Hash160& keyHash);

/**
 * Address for a compressed public key.
 * 
 * @throws KeyError(InvalidEncodingInput) unless pubKey is 33 bytes
 *         starting with 0x02 or 0x03
 */
std::string EncodeAddress(const Byte* pubKey, size_t len, AddressFormat format);

inline std::string EncodeAddress(const ExtendedKey::PublicKeyBytes& pubKey,
                                 AddressFormat format) {
    return EncodeAddress(pubKey.data(), pubKey.size(), format);
}

// ============================================================================
// Decoding
// ============================================================================

/// @throws KeyError(InvalidEncodingInput) on bad checksum, length or version
Hash160 DecodeLegacyAddress(const std::string& address);

/// Prefix may be omitted; mixed case is rejected
/// @throws KeyError(InvalidEncodingInput) on bad checksum, prefix, length or version
Hash160 DecodeCashAddress(const std::string& address);

// ============================================================================
// Receive Addresses
// ============================================================================

/**
 * Receive address at accountKey / 0 / index.
 * 
 * Both hops are non-hardened, so an account xpub is enough.
 */
std::string DeriveReceiveAddress(const ExtendedKey& accountKey, AddressFormat format,
                                 uint32_t index);

/// Same, from a Base58Check account xpub (or xprv)
std::string DeriveReceiveAddress(const std::string& accountXpub, AddressFormat format,
                                 uint32_t index);

} // namespace wallet
} // namespace cashseed

#endif // CASHSEED_WALLET_ADDRESS_H
