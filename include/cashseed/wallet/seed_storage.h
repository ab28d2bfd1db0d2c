// CASHSEED - In-Memory Seed Storage
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// Holds the mnemonic being entered word by word and the finished Seed.
// Nothing here is ever written to disk.

#ifndef CASHSEED_WALLET_SEED_STORAGE_H
#define CASHSEED_WALLET_SEED_STORAGE_H

#include "cashseed/wallet/seed.h"
#include "cashseed/wallet/wordlist.h"

#include <optional>
#include <string>
#include <vector>

namespace cashseed {
namespace wallet {

class SeedStorage {
public:
    static constexpr size_t DEFAULT_MNEMONIC_LENGTH = 12;
    
    /// The word list must outlive the storage
    explicit SeedStorage(const WordList& wordList);
    ~SeedStorage();
    
    SeedStorage(const SeedStorage&) = delete;
    SeedStorage& operator=(const SeedStorage&) = delete;
    
    // ========================================================================
    // Pending Mnemonic
    // ========================================================================
    
    /// Resize to 12, 15, 18, 21 or 24 empty slots
    /// @throws KeyError(InvalidMnemonicLength) for other lengths
    void SetMnemonicLength(size_t wordCount);
    
    size_t GetMnemonicLength() const { return pending_.size(); }
    
    /**
     * Set the word in a slot.
     * 
     * @param index Slot index; negative values count from the end (-1 = last)
     * @throws KeyError(InvalidMnemonicWord) if the word is not in the list
     * @throws std::out_of_range if the slot does not exist
     */
    void UpdateWord(const std::string& word, int index);
    
    /// Word in a slot (empty if unset); negative indices count from the end
    const std::string& GetWord(int index) const;
    
    /// Copy of all slots
    std::vector<std::string> GetMnemonic() const { return pending_; }
    
    /// True when every slot holds a word
    bool IsMnemonicComplete() const;
    
    /// Wipe all slots and return to 12 empty slots
    void DiscardMnemonic();
    
    /**
     * Fill the last slot from the other slots and user-chosen bits.
     * 
     * @param finalBits FinalWordFreeBits(length) characters of '0'/'1'
     */
    void ApplyFinalWord(const std::string& finalBits);
    
    // ========================================================================
    // Seed
    // ========================================================================
    
    /**
     * Validate the pending mnemonic, build and generate a Seed, then wipe
     * the pending words.
     */
    Seed& ConvertMnemonicToSeed(const std::string& passphrase = "");
    
    bool HasSeed() const { return seed_.has_value(); }
    
    /// @throws KeyError(SeedNotReady) if no seed is held
    Seed& GetSeed();
    
    void DiscardSeed();

private:
    size_t SlotIndex(int index) const;
    
    const WordList& wordList_;
    std::vector<std::string> pending_;
    std::optional<Seed> seed_;
};

} // namespace wallet
} // namespace cashseed

#endif // CASHSEED_WALLET_SEED_STORAGE_H
