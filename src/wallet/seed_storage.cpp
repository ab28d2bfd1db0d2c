// CASHSEED - In-Memory Seed Storage Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/wallet/seed_storage.h"
#include "cashseed/core/error.h"
#include "cashseed/crypto/hmac.h"
#include "cashseed/util/logging.h"

#include <algorithm>
#include <stdexcept>

namespace cashseed {
namespace wallet {

SeedStorage::SeedStorage(const WordList& wordList)
    : wordList_(wordList), pending_(DEFAULT_MNEMONIC_LENGTH) {}

SeedStorage::~SeedStorage() {
    DiscardMnemonic();
}

size_t SeedStorage::SlotIndex(int index) const {
    int size = static_cast<int>(pending_.size());
    int slot = index < 0 ? size + index : index;
    if (slot < 0 || slot >= size) {
        throw std::out_of_range("mnemonic slot " + std::to_string(index) +
                                " out of range for " + std::to_string(size) + " words");
    }
    return static_cast<size_t>(slot);
}

void SeedStorage::SetMnemonicLength(size_t wordCount) {
    if (!IsValidWordCount(wordCount)) {
        throw KeyError(ErrorCode::InvalidMnemonicLength,
                       "unsupported word count " + std::to_string(wordCount));
    }
    DiscardMnemonic();
    pending_.assign(wordCount, std::string());
}

void SeedStorage::UpdateWord(const std::string& word, int index) {
    size_t slot = SlotIndex(index);
    if (!wordList_.Contains(word)) {
        throw KeyError(ErrorCode::InvalidMnemonicWord,
                       "word for slot " + std::to_string(slot + 1) + " is not in the word list");
    }
    SecureClear(pending_[slot]);
    pending_[slot] = word;
}

const std::string& SeedStorage::GetWord(int index) const {
    return pending_[SlotIndex(index)];
}

bool SeedStorage::IsMnemonicComplete() const {
    return std::none_of(pending_.begin(), pending_.end(),
                        [](const std::string& w) { return w.empty(); });
}

void SeedStorage::DiscardMnemonic() {
    for (auto& word : pending_) {
        SecureClear(word);
    }
    pending_.assign(DEFAULT_MNEMONIC_LENGTH, std::string());
}

void SeedStorage::ApplyFinalWord(const std::string& finalBits) {
    std::vector<std::string> preceding(pending_.begin(), pending_.end() - 1);
    std::vector<std::string> complete =
        MnemonicCodec(wordList_).ComputeFinalWord(preceding, finalBits);
    
    SecureClear(pending_.back());
    pending_.back() = complete.back();
    
    for (auto& word : preceding) SecureClear(word);
    for (auto& word : complete) SecureClear(word);
}

Seed& SeedStorage::ConvertMnemonicToSeed(const std::string& passphrase) {
    Seed seed(pending_, wordList_);
    seed.SetPassphrase(passphrase);
    seed.Generate();
    
    seed_ = std::move(seed);
    DiscardMnemonic();
    
    LOG_DEBUG(util::LogCategory::SEED) << "Converted pending mnemonic to seed";
    return *seed_;
}

Seed& SeedStorage::GetSeed() {
    if (!seed_) {
        throw KeyError(ErrorCode::SeedNotReady, "no seed loaded");
    }
    return *seed_;
}

void SeedStorage::DiscardSeed() {
    seed_.reset();
}

} // namespace wallet
} // namespace cashseed
