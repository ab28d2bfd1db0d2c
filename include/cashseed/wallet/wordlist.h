// CASHSEED - BIP39 Word List
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// Immutable 2048-word list with reverse lookup. Loaded once at startup and
// passed by reference to everything that converts between words and
// 11-bit indices.

#ifndef CASHSEED_WALLET_WORDLIST_H
#define CASHSEED_WALLET_WORDLIST_H

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cashseed {
namespace wallet {

/// Number of words in a BIP39 word list
constexpr size_t WORDLIST_SIZE = 2048;

/**
 * An ordered BIP39 word list.
 * 
 * The index of a word is its 0-based line number in the source file.
 * Instances are read-only after construction and safe to share between
 * threads.
 */
class WordList {
public:
    /// Load from a text file, one word per line
    /// @throws KeyError(InvalidWordList) if unreadable or malformed
    static WordList FromFile(const std::string& path);
    
    /// Load from a stream, one word per line; a blank line before the last word is an error
    static WordList FromStream(std::istream& in);
    
    /// Build from an in-memory list
    static WordList FromWords(std::vector<std::string> words);
    
    /// Word at index (index must be < 2048)
    const std::string& Word(uint16_t index) const;
    
    /// Index of a word, or nullopt if absent
    std::optional<uint16_t> IndexOf(const std::string& word) const;
    
    bool Contains(const std::string& word) const { return IndexOf(word).has_value(); }
    
    size_t Size() const { return words_.size(); }

private:
    explicit WordList(std::vector<std::string> words);
    
    std::vector<std::string> words_;
    std::unordered_map<std::string, uint16_t> index_;
};

} // namespace wallet
} // namespace cashseed

#endif // CASHSEED_WALLET_WORDLIST_H
