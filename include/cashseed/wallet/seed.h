// CASHSEED - Wallet Seed
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// A validated mnemonic with its optional passphrase, and the account keys
// derived from them. This is the value the surrounding application keeps
// for a loaded wallet.

#ifndef CASHSEED_WALLET_SEED_H
#define CASHSEED_WALLET_SEED_H

#include "cashseed/wallet/address.h"
#include "cashseed/wallet/hdkey.h"
#include "cashseed/wallet/mnemonic.h"
#include "cashseed/wallet/wordlist.h"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace cashseed {
namespace wallet {

/**
 * Mnemonic, passphrase and the keys derived from them.
 * 
 * Generate() runs PBKDF2 and derives the account key m/44'/145'/0' once.
 * Changing the passphrase discards the derived material until Generate()
 * is called again. Secret buffers are wiped on destruction.
 */
class Seed {
public:
    /**
     * @param words Complete mnemonic
     * @param wordList List the mnemonic is checked against
     * @throws KeyError(InvalidMnemonicWord, InvalidMnemonicLength or
     *         ChecksumMismatch) if the mnemonic is not valid
     */
    Seed(std::vector<std::string> words, const WordList& wordList);
    
    Seed(const Seed&) = default;
    Seed& operator=(const Seed& other);
    
    /// Moving copies the secrets, then wipes the source and leaves it empty
    Seed(Seed&& other);
    Seed& operator=(Seed&& other);
    ~Seed();
    
    const std::vector<std::string>& GetWords() const { return words_; }
    
    /// Space-joined mnemonic sentence
    std::string GetMnemonic() const { return JoinMnemonic(words_); }
    
    size_t WordCount() const { return words_.size(); }
    
    // ========================================================================
    // Passphrase
    // ========================================================================
    
    /// Replace the passphrase; discards generated keys if it changes
    void SetPassphrase(const std::string& passphrase);
    
    bool HasPassphrase() const { return !passphrase_.empty(); }
    
    const std::string& GetPassphrase() const { return passphrase_; }
    
    // ========================================================================
    // Derived Material
    // ========================================================================
    
    /// Compute seed bytes, account keys and fingerprint (no-op if done)
    void Generate();
    
    bool IsGenerated() const { return seedBytes_.has_value(); }
    
    /// @throws KeyError(SeedNotReady) before Generate()
    const std::array<Byte, BIP39_SEED_SIZE>& GetSeedBytes() const;
    const ExtendedKey& GetAccountKey() const;
    std::string GetXprv() const;
    std::string GetXpub() const;
    
    /// Account key fingerprint, 8 hex characters
    std::string GetFingerprint() const;
    
    /// Receive address at m/44'/145'/0'/0/index
    std::string GenerateAddress(AddressFormat format, uint32_t index) const;
    
    /// Equal when both are generated with identical seed bytes
    bool operator==(const Seed& other) const;
    bool operator!=(const Seed& other) const { return !(*this == other); }

private:
    void Discard();
    void WipeSecrets();
    void RequireGenerated() const;
    
    std::vector<std::string> words_;
    std::string passphrase_;
    
    std::optional<std::array<Byte, BIP39_SEED_SIZE>> seedBytes_;
    std::optional<ExtendedKey> accountKey_;
};

} // namespace wallet
} // namespace cashseed

#endif // CASHSEED_WALLET_SEED_H
