// CASHSEED - BIP39 Mnemonic Codec
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// Converts between entropy and mnemonic sentences, validates the embedded
// checksum and derives the 64-byte BIP39 seed.
//
// Word count | Entropy | Checksum | Total bits
//     12     | 128 bit |   4 bit  |   132
//     15     | 160 bit |   5 bit  |   165
//     18     | 192 bit |   6 bit  |   198
//     21     | 224 bit |   7 bit  |   231
//     24     | 256 bit |   8 bit  |   264

#ifndef CASHSEED_WALLET_MNEMONIC_H
#define CASHSEED_WALLET_MNEMONIC_H

#include "cashseed/core/types.h"
#include "cashseed/wallet/wordlist.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cashseed {
namespace wallet {

// ============================================================================
// Constants
// ============================================================================

/// Size of a BIP39 seed
constexpr size_t BIP39_SEED_SIZE = 64;

/// PBKDF2 iteration count for seed derivation
constexpr uint32_t BIP39_PBKDF2_ROUNDS = 2048;

/// Bits encoded by one word
constexpr size_t BITS_PER_WORD = 11;

/// Supported mnemonic lengths
constexpr size_t MIN_MNEMONIC_WORDS = 12;
constexpr size_t MAX_MNEMONIC_WORDS = 24;

// ============================================================================
// Helpers
// ============================================================================

/// True for 12, 15, 18, 21 and 24
bool IsValidWordCount(size_t wordCount);

/// Entropy bytes encoded by a mnemonic of this length
/// @throws KeyError(InvalidMnemonicLength) for unsupported counts
size_t EntropySizeForWordCount(size_t wordCount);

/// Checksum bits carried by a mnemonic of this length (wordCount / 3)
size_t ChecksumBitsForWordCount(size_t wordCount);

/// Entropy bits the user chooses for the final word (11 - wordCount / 3)
size_t FinalWordFreeBits(size_t wordCount);

/// Words joined by single spaces
std::string JoinMnemonic(const std::vector<std::string>& words);

/// Split on any run of whitespace
std::vector<std::string> SplitMnemonic(const std::string& text);

// ============================================================================
// Mnemonic Codec
// ============================================================================

/**
 * Entropy to mnemonic conversion against a fixed word list.
 * 
 * The codec holds a reference to the word list, which must outlive it.
 * All operations are const and may run concurrently.
 */
class MnemonicCodec {
public:
    explicit MnemonicCodec(const WordList& wordList) : wordList_(wordList) {}
    
    /**
     * Encode entropy as a mnemonic.
     * 
     * @param entropy 16, 20, 24, 28 or 32 bytes
     * @throws KeyError(InvalidEncodingInput) on any other length
     */
    std::vector<std::string> EntropyToMnemonic(const std::vector<Byte>& entropy) const;
    
    /**
     * Decode a mnemonic back to its entropy.
     * 
     * @throws KeyError(InvalidMnemonicWord) if a word is not in the list
     * @throws KeyError(InvalidMnemonicLength) if the bit length is unsupported
     * @throws KeyError(ChecksumMismatch) if the checksum does not match
     */
    std::vector<Byte> MnemonicToEntropy(const std::vector<std::string>& words) const;
    
    /// Validate a mnemonic, throwing the same errors as MnemonicToEntropy
    void Verify(const std::vector<std::string>& words) const;
    
    /// Non-throwing form of Verify
    bool IsValid(const std::vector<std::string>& words) const;
    
    /**
     * Generate a mnemonic from fresh OS entropy.
     * 
     * @param numWords 12, 15, 18, 21 or 24
     * @throws KeyError(InvalidMnemonicLength) for other counts
     */
    std::vector<std::string> GenerateRandom(size_t numWords) const;
    
    /**
     * Complete a mnemonic whose last word is chosen by hand.
     * 
     * The preceding words fix most of the entropy; the caller supplies the
     * remaining entropy bits as a string of '0' and '1' characters
     * (FinalWordFreeBits long). The final word's checksum bits are
     * recomputed from the assembled entropy.
     * 
     * @param precedingWords 11, 14, 17, 20 or 23 words
     * @param finalBits remaining entropy bits, most significant first
     * @return The complete mnemonic
     */
    std::vector<std::string> ComputeFinalWord(const std::vector<std::string>& precedingWords,
                                              const std::string& finalBits) const;
    
    const WordList& GetWordList() const { return wordList_; }

private:
    std::vector<uint16_t> LookupIndices(const std::vector<std::string>& words) const;
    
    const WordList& wordList_;
};

// ============================================================================
// Seed Derivation
// ============================================================================

/**
 * Derive the BIP39 seed.
 * 
 * PBKDF2-HMAC-SHA512 over the space-joined sentence with salt
 * "mnemonic" + passphrase, 2048 rounds. No Unicode normalization is
 * applied. The mnemonic is not validated here.
 */
std::array<Byte, BIP39_SEED_SIZE> MnemonicToSeed(const std::vector<std::string>& words,
                                                 const std::string& passphrase = "");

} // namespace wallet
} // namespace cashseed

#endif // CASHSEED_WALLET_MNEMONIC_H
