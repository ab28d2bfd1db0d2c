// CASHSEED - Hierarchical Deterministic Key Derivation (BIP32/BIP44)
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// Implements BIP32 master key generation, private and public child
// derivation, and the BIP44 account path used by the wallet.
//
// Account path: m/44'/145'/0'
// Receive addresses: account xpub -> 0 -> index (non-hardened)

#ifndef CASHSEED_WALLET_HDKEY_H
#define CASHSEED_WALLET_HDKEY_H

#include "cashseed/core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cashseed {
namespace wallet {

// ============================================================================
// Constants
// ============================================================================

/// BIP44 purpose constant
constexpr uint32_t BIP44_PURPOSE = 44;

/// SLIP-0044 coin type for Bitcoin Cash
constexpr uint32_t BCH_COIN_TYPE = 145;

/// Hardened key derivation threshold
constexpr uint32_t HARDENED_FLAG = 0x80000000;

/// External (receive) branch below an account key
constexpr uint32_t RECEIVE_BRANCH = 0;

// ============================================================================
// Key Derivation Path
// ============================================================================

/**
 * Represents a BIP32 derivation path component.
 */
struct PathComponent {
    uint32_t index;
    bool hardened;
    
    PathComponent(uint32_t idx = 0, bool hard = false) 
        : index(idx), hardened(hard) {}
    
    /// Full index value (with hardened flag if applicable)
    uint32_t GetFullIndex() const {
        return hardened ? (index | HARDENED_FLAG) : index;
    }
    
    /// Parse "44'", "44h", "44H" or "0"; index must be below 2^31
    static std::optional<PathComponent> FromString(const std::string& str);
    
    std::string ToString() const;
    
    bool operator==(const PathComponent& other) const {
        return index == other.index && hardened == other.hardened;
    }
};

/**
 * A complete BIP32 derivation path.
 * 
 * Example paths:
 * - m/44'/145'/0'      (account key)
 * - m/44'/145'/0'/0/5  (sixth receiving key)
 */
class DerivationPath {
public:
    /// Empty path (master key)
    DerivationPath() = default;
    
    explicit DerivationPath(std::vector<PathComponent> components)
        : components_(std::move(components)) {}
    
    /// Parse from string, e.g. "m/44'/145'/0'". Must start with "m".
    static std::optional<DerivationPath> FromString(const std::string& path);
    
    /// Account-level path m/44'/145'/account'
    static DerivationPath BIP44Account(uint32_t account = 0);
    
    const std::vector<PathComponent>& GetComponents() const { return components_; }
    
    size_t Depth() const { return components_.size(); }
    
    bool IsEmpty() const { return components_.empty(); }
    
    /// Append a component
    DerivationPath Child(uint32_t index, bool hardened = false) const;
    
    std::string ToString() const;
    
    bool operator==(const DerivationPath& other) const;
    bool operator!=(const DerivationPath& other) const { return !(*this == other); }
    
private:
    std::vector<PathComponent> components_;
};

// ============================================================================
// Extended Key (BIP32)
// ============================================================================

/**
 * An immutable extended key: key material plus chain code and the
 * metadata needed for serialization.
 * 
 * Private keys keep their 32-byte scalar and the matching compressed
 * public key. Public keys keep only the 33-byte compressed point.
 * Every derivation failure throws KeyError; there is no invalid state.
 */
class ExtendedKey {
public:
    static constexpr size_t CHAIN_CODE_SIZE = 32;
    static constexpr size_t PRIVATE_KEY_SIZE = 32;
    static constexpr size_t PUBLIC_KEY_SIZE = 33;
    
    /// Size of serialized extended key (78 bytes)
    static constexpr size_t SERIALIZED_SIZE = 78;
    
    /// Version bytes, used for every coin type
    static constexpr uint32_t VERSION_PRIVATE = 0x0488ADE4;  // xprv
    static constexpr uint32_t VERSION_PUBLIC = 0x0488B21E;   // xpub
    
    using ChainCode = std::array<Byte, CHAIN_CODE_SIZE>;
    using PrivateKeyBytes = std::array<Byte, PRIVATE_KEY_SIZE>;
    using PublicKeyBytes = std::array<Byte, PUBLIC_KEY_SIZE>;
    
    /// Build from a private scalar
    /// @throws KeyError(ScalarOutOfRange) if the scalar is 0 or >= n
    static ExtendedKey FromPrivateKey(const PrivateKeyBytes& key, const ChainCode& chainCode,
                                      uint8_t depth = 0, uint32_t parentFingerprint = 0,
                                      uint32_t childIndex = 0);
    
    /// Build from a compressed public key
    /// @throws KeyError(InvalidEncodingInput) if the point is not on the curve
    static ExtendedKey FromPublicKey(const PublicKeyBytes& key, const ChainCode& chainCode,
                                     uint8_t depth = 0, uint32_t parentFingerprint = 0,
                                     uint32_t childIndex = 0);
    
    /**
     * Generate the master key from a seed.
     * 
     * I = HMAC-SHA512("Bitcoin seed", seed); key = I[0:32], chain = I[32:64].
     * @param seedLen 16 to 64 bytes
     */
    static ExtendedKey FromSeed(const Byte* seed, size_t seedLen);
    
    template<size_t N>
    static ExtendedKey FromSeed(const std::array<Byte, N>& seed) {
        return FromSeed(seed.data(), seed.size());
    }
    
    /**
     * Derive a child key.
     * 
     * Private keys derive private children (hardened or not). Public keys
     * derive public children and reject hardened indices with
     * UnsupportedHardenedPublicDerivation.
     * 
     * @param index Child index (use | HARDENED_FLAG for hardened)
     * @throws KeyError(ScalarOutOfRange) if the child is invalid; the next
     *         index is not tried
     */
    ExtendedKey DeriveChild(uint32_t index) const;
    
    /// Derive along every component of a path
    ExtendedKey DerivePath(const DerivationPath& path) const;
    
    /// Public extended key with the same metadata
    ExtendedKey Neuter() const;
    
    bool IsPrivate() const { return isPrivate_; }
    
    /// Private scalar (only if IsPrivate())
    std::optional<PrivateKeyBytes> GetPrivateKey() const;
    
    /// Compressed public key
    const PublicKeyBytes& GetPublicKey() const { return publicKey_; }
    
    const ChainCode& GetChainCode() const { return chainCode_; }
    
    uint8_t GetDepth() const { return depth_; }
    
    uint32_t GetParentFingerprint() const { return parentFingerprint_; }
    
    uint32_t GetChildIndex() const { return childIndex_; }
    
    /// Hash160 of the compressed public key
    Hash160 GetIdentifier() const;
    
    /// First 4 bytes of the identifier, big-endian
    uint32_t GetFingerprint() const;
    
    // ========================================================================
    // Serialization (extkey.cpp)
    // ========================================================================
    
    /// version | depth | parent fingerprint | index | chain code | key field
    std::array<Byte, SERIALIZED_SIZE> ToBytes() const;
    
    /// Base58Check string (xprv... or xpub...)
    std::string ToBase58() const;
    
    /// @throws KeyError(MalformedExtendedKey) on bad length, version or key field
    static ExtendedKey FromBytes(const Byte* data, size_t len);
    
    /// @throws KeyError(MalformedExtendedKey) on bad encoding or checksum
    static ExtendedKey FromBase58(const std::string& str);
    
    bool operator==(const ExtendedKey& other) const;
    bool operator!=(const ExtendedKey& other) const { return !(*this == other); }
    
    ExtendedKey(const ExtendedKey&) = default;
    ExtendedKey& operator=(const ExtendedKey&) = default;
    ExtendedKey(ExtendedKey&&) = default;
    ExtendedKey& operator=(ExtendedKey&&) = default;
    ~ExtendedKey();

private:
    ExtendedKey() = default;
    
    ExtendedKey DerivePrivateChild(uint32_t index) const;
    ExtendedKey DerivePublicChild(uint32_t index) const;
    
    /// Private scalar, zero for public keys
    PrivateKeyBytes privateKey_{};
    
    PublicKeyBytes publicKey_{};
    
    ChainCode chainCode_{};
    
    /// Depth in hierarchy (0 = master)
    uint8_t depth_{0};
    
    uint32_t parentFingerprint_{0};
    
    uint32_t childIndex_{0};
    
    bool isPrivate_{false};
};

// ============================================================================
// Account Helpers
// ============================================================================

/// Account key m/44'/145'/0' from a BIP39 seed
ExtendedKey DeriveAccountKey(const std::array<Byte, 64>& seed);

/// Fingerprint as 8 lowercase hex characters
std::string FingerprintToHex(uint32_t fingerprint);

} // namespace wallet
} // namespace cashseed

#endif // CASHSEED_WALLET_HDKEY_H
