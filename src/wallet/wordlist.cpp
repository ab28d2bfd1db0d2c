// CASHSEED - BIP39 Word List Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/wallet/wordlist.h"
#include "cashseed/core/error.h"
#include "cashseed/util/logging.h"

#include <fstream>
#include <stdexcept>

namespace cashseed {
namespace wallet {

WordList::WordList(std::vector<std::string> words) : words_(std::move(words)) {
    if (words_.size() != WORDLIST_SIZE) {
        throw KeyError(ErrorCode::InvalidWordList,
                       "expected " + std::to_string(WORDLIST_SIZE) + " words, got " +
                       std::to_string(words_.size()));
    }
    
    index_.reserve(words_.size());
    for (size_t i = 0; i < words_.size(); ++i) {
        if (words_[i].empty()) {
            throw KeyError(ErrorCode::InvalidWordList,
                           "empty word at line " + std::to_string(i + 1));
        }
        if (!index_.emplace(words_[i], static_cast<uint16_t>(i)).second) {
            throw KeyError(ErrorCode::InvalidWordList,
                           "duplicate word at line " + std::to_string(i + 1));
        }
    }
}

WordList WordList::FromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw KeyError(ErrorCode::InvalidWordList, "cannot open word list: " + path);
    }
    WordList list = FromStream(file);
    LOG_DEBUG(util::LogCategory::MNEMONIC) << "Loaded word list from " << path;
    return list;
}

WordList WordList::FromStream(std::istream& in) {
    std::vector<std::string> words;
    words.reserve(WORDLIST_SIZE);
    
    // Index equals line number, so only blank lines after the last word are allowed
    std::string line;
    int lineNum = 0;
    int firstBlank = 0;
    while (std::getline(in, line)) {
        ++lineNum;
        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos) {
            if (firstBlank == 0) {
                firstBlank = lineNum;
            }
            continue;
        }
        if (firstBlank != 0) {
            throw KeyError(ErrorCode::InvalidWordList,
                           "blank line at line " + std::to_string(firstBlank));
        }
        size_t end = line.find_last_not_of(" \t\r");
        words.push_back(line.substr(start, end - start + 1));
    }
    
    return WordList(std::move(words));
}

WordList WordList::FromWords(std::vector<std::string> words) {
    return WordList(std::move(words));
}

const std::string& WordList::Word(uint16_t index) const {
    if (index >= words_.size()) {
        throw std::out_of_range("word index out of range");
    }
    return words_[index];
}

std::optional<uint16_t> WordList::IndexOf(const std::string& word) const {
    auto it = index_.find(word);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace wallet
} // namespace cashseed
