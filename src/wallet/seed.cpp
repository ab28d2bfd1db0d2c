// CASHSEED - Wallet Seed Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/wallet/seed.h"
#include "cashseed/core/error.h"
#include "cashseed/crypto/hmac.h"
#include "cashseed/util/logging.h"

namespace cashseed {
namespace wallet {

Seed::Seed(std::vector<std::string> words, const WordList& wordList)
    : words_(std::move(words)) {
    try {
        MnemonicCodec(wordList).Verify(words_);
    } catch (const KeyError&) {
        for (auto& word : words_) {
            SecureClear(word);
        }
        throw;
    }
}

Seed::Seed(Seed&& other) : Seed(static_cast<const Seed&>(other)) {
    other.WipeSecrets();
}

Seed& Seed::operator=(const Seed& other) {
    if (this != &other) {
        WipeSecrets();
        words_ = other.words_;
        passphrase_ = other.passphrase_;
        seedBytes_ = other.seedBytes_;
        accountKey_ = other.accountKey_;
    }
    return *this;
}

Seed& Seed::operator=(Seed&& other) {
    if (this != &other) {
        *this = static_cast<const Seed&>(other);
        other.WipeSecrets();
    }
    return *this;
}

Seed::~Seed() {
    WipeSecrets();
}

void Seed::WipeSecrets() {
    Discard();
    for (auto& word : words_) {
        SecureClear(word);
    }
    words_.clear();
    SecureClear(passphrase_);
    passphrase_.clear();
}

void Seed::Discard() {
    if (seedBytes_) {
        SecureClear(*seedBytes_);
        seedBytes_.reset();
    }
    accountKey_.reset();
}

void Seed::SetPassphrase(const std::string& passphrase) {
    if (passphrase == passphrase_) {
        return;
    }
    SecureClear(passphrase_);
    passphrase_ = passphrase;
    Discard();
    LOG_DEBUG(util::LogCategory::SEED) << "Passphrase "
                                       << (passphrase_.empty() ? "cleared" : "set");
}

void Seed::Generate() {
    if (IsGenerated()) {
        return;
    }
    
    // Fully computed before being stored
    std::array<Byte, BIP39_SEED_SIZE> seed = MnemonicToSeed(words_, passphrase_);
    ExtendedKey account = DeriveAccountKey(seed);
    
    seedBytes_ = seed;
    accountKey_ = std::move(account);
    SecureClear(seed);
    
    LOG_INFO(util::LogCategory::SEED) << "Generated seed for " << words_.size()
                                      << "-word mnemonic, fingerprint " << GetFingerprint();
}

void Seed::RequireGenerated() const {
    if (!IsGenerated()) {
        throw KeyError(ErrorCode::SeedNotReady, "seed has not been generated");
    }
}

const std::array<Byte, BIP39_SEED_SIZE>& Seed::GetSeedBytes() const {
    RequireGenerated();
    return *seedBytes_;
}

const ExtendedKey& Seed::GetAccountKey() const {
    RequireGenerated();
    return *accountKey_;
}

std::string Seed::GetXprv() const {
    return GetAccountKey().ToBase58();
}

std::string Seed::GetXpub() const {
    return GetAccountKey().Neuter().ToBase58();
}

std::string Seed::GetFingerprint() const {
    return FingerprintToHex(GetAccountKey().GetFingerprint());
}

std::string Seed::GenerateAddress(AddressFormat format, uint32_t index) const {
    return DeriveReceiveAddress(GetAccountKey(), format, index);
}

bool Seed::operator==(const Seed& other) const {
    if (!IsGenerated() || !other.IsGenerated()) {
        return false;
    }
    return ConstantTimeCompare(seedBytes_->data(), other.seedBytes_->data(), BIP39_SEED_SIZE);
}

} // namespace wallet
} // namespace cashseed
