// CASHSEED - Address Encoding Tests
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include <gtest/gtest.h>
#include "cashseed/wallet/address.h"
#include "cashseed/wallet/mnemonic.h"
#include "cashseed/core/error.h"
#include "cashseed/core/hex.h"

#include <cctype>
#include <functional>
#include <string>
#include <vector>

namespace cashseed {
namespace wallet {
namespace test {

namespace {

ErrorCode CodeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const KeyError& e) {
        return e.Code();
    }
    ADD_FAILURE() << "expected KeyError";
    return ErrorCode::SeedNotReady;
}

Hash160 HashFromHex(const std::string& hex) {
    std::vector<Byte> bytes = HexToBytes(hex);
    return Hash160(bytes.data(), bytes.size());
}

/// m/44'/0'/0' of "abandon x11 about"
const char* BITCOIN_ACCOUNT_XPUB =
    "xpub6BosfCnifzxcFwrSzQiqu2DBVTshkCXacvNsWGYJVVhhawA7d4R5WSWGFNbi8Aw6ZRc1brxMyWMzG3DSSSSoekkudhUd9yLb6qx39T9nMdj";

const char* CASHADDR_CHARSET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

struct AddressPair {
    const char* legacy;
    const char* cashaddr;
};

const AddressPair PAIRS[] = {
    {"1BpEi6DfDAUFd7GtittLSdBeYJvcoaVggu",
     "bitcoincash:qpm2qsznhks23z7629mms6s4cwef74vcwvy22gdx6a"},
    {"1KXrWXciRDZUpQwQmuM1DbwsKDLYAYsVLR",
     "bitcoincash:qr95sy3j9xwd2ap32xkykttr4cvcu7as4y0qverfuy"},
    {"16w1D5WRVKJuZUsSRzdLp9w3YGcgoxDXb",
     "bitcoincash:qqq3728yw0y47sqn6l2na30mcw6zm78dzqre909m2r"},
};

} // namespace

// ============================================================================
// Format Names
// ============================================================================

TEST(AddressFormatTest, Parse) {
    EXPECT_EQ(ParseAddressFormat("legacy"), AddressFormat::Legacy);
    EXPECT_EQ(ParseAddressFormat("CashAddr"), AddressFormat::CashAddr);
    EXPECT_EQ(ParseAddressFormat("CASHADDR"), AddressFormat::CashAddr);
    EXPECT_FALSE(ParseAddressFormat("base58").has_value());
    EXPECT_FALSE(ParseAddressFormat("").has_value());
}

TEST(AddressFormatTest, ToStringRoundTrip) {
    for (AddressFormat f : {AddressFormat::Legacy, AddressFormat::CashAddr}) {
        EXPECT_EQ(ParseAddressFormat(AddressFormatToString(f)), f);
    }
}

// ============================================================================
// Encoding
// ============================================================================

TEST(AddressEncodeTest, KnownCashAddr) {
    Hash160 hash = HashFromHex("f5bf48b397dae70be82b3cca4793f8eb2b6cdac9");
    EXPECT_EQ(EncodeCashAddress(hash),
              "bitcoincash:qr6m7j9njldwwzlg9v7v53unlr4jkmx6eylep8ekg2");
}

TEST(AddressEncodeTest, KnownPairs) {
    for (const auto& pair : PAIRS) {
        Hash160 fromLegacy = DecodeLegacyAddress(pair.legacy);
        Hash160 fromCash = DecodeCashAddress(pair.cashaddr);
        EXPECT_EQ(fromLegacy, fromCash) << pair.legacy;
        EXPECT_EQ(EncodeLegacyAddress(fromCash), pair.legacy);
        EXPECT_EQ(EncodeCashAddress(fromLegacy), pair.cashaddr);
    }
}

TEST(AddressEncodeTest, GeneratorPoint) {
    std::vector<Byte> pubkey =
        HexToBytes("0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
    
    std::string legacy = EncodeAddress(pubkey.data(), pubkey.size(), AddressFormat::Legacy);
    EXPECT_EQ(legacy, "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH");
    EXPECT_EQ(DecodeLegacyAddress(legacy).ToHex(), "751e76e8199196d454941c45d1b3a323f1433bd6");
    
    std::string cash = EncodeAddress(pubkey.data(), pubkey.size(), AddressFormat::CashAddr);
    EXPECT_EQ(cash.rfind("bitcoincash:q", 0), 0u);
    EXPECT_EQ(DecodeCashAddress(cash), DecodeLegacyAddress(legacy));
}

TEST(AddressEncodeTest, RejectsUncompressedOrShortKeys) {
    std::vector<Byte> key(65, 0x01);
    key[0] = 0x04;
    EXPECT_EQ(CodeOf([&] { EncodeAddress(key.data(), key.size(), AddressFormat::Legacy); }),
              ErrorCode::InvalidEncodingInput);
    
    key.resize(33);
    EXPECT_EQ(CodeOf([&] { EncodeAddress(key.data(), key.size(), AddressFormat::CashAddr); }),
              ErrorCode::InvalidEncodingInput);
    
    key[0] = 0x02;
    key.resize(32);
    EXPECT_EQ(CodeOf([&] { EncodeAddress(key.data(), key.size(), AddressFormat::Legacy); }),
              ErrorCode::InvalidEncodingInput);
}

// ============================================================================
// Decoding
// ============================================================================

TEST(AddressDecodeTest, CashAddrPrefixOptional) {
    const std::string full = PAIRS[0].cashaddr;
    const std::string bare = full.substr(full.find(':') + 1);
    EXPECT_EQ(DecodeCashAddress(bare), DecodeCashAddress(full));
}

TEST(AddressDecodeTest, CashAddrUppercaseAccepted) {
    std::string upper = PAIRS[1].cashaddr;
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    EXPECT_EQ(DecodeCashAddress(upper), DecodeCashAddress(PAIRS[1].cashaddr));
}

TEST(AddressDecodeTest, CashAddrMixedCaseRejected) {
    std::string mixed = PAIRS[1].cashaddr;
    mixed[mixed.size() - 1] = 'Y';
    EXPECT_EQ(CodeOf([&] { DecodeCashAddress(mixed); }), ErrorCode::InvalidEncodingInput);
}

TEST(AddressDecodeTest, CashAddrWrongPrefixRejected) {
    EXPECT_EQ(CodeOf([&] { DecodeCashAddress("bchtest:qpm2qsznhks23z7629mms6s4cwef74vcwvy22gdx6a"); }),
              ErrorCode::InvalidEncodingInput);
}

TEST(AddressDecodeTest, EverySingleCharMutationRejected) {
    const std::string charset = CASHADDR_CHARSET;
    const std::string original = PAIRS[0].cashaddr;
    
    for (size_t i = 0; i < original.size(); ++i) {
        std::string mutated = original;
        size_t pos = charset.find(original[i]);
        mutated[i] = (pos == std::string::npos) ? 'q' : charset[(pos + 1) % charset.size()];
        if (mutated[i] == original[i]) {
            mutated[i] = 'p';
        }
        EXPECT_EQ(CodeOf([&] { DecodeCashAddress(mutated); }), ErrorCode::InvalidEncodingInput)
            << "position " << i;
    }
}

TEST(AddressDecodeTest, LegacyChecksumRejected) {
    std::string mutated = PAIRS[0].legacy;
    mutated[5] = (mutated[5] == 'z') ? 'y' : 'z';
    EXPECT_EQ(CodeOf([&] { DecodeLegacyAddress(mutated); }), ErrorCode::InvalidEncodingInput);
    EXPECT_EQ(CodeOf([&] { DecodeLegacyAddress(""); }), ErrorCode::InvalidEncodingInput);
    EXPECT_EQ(CodeOf([&] { DecodeLegacyAddress("0OIl"); }), ErrorCode::InvalidEncodingInput);
}

TEST(AddressDecodeTest, LegacyScriptHashRejected) {
    // Pay-to-script-hash version byte 0x05
    EXPECT_EQ(CodeOf([&] { DecodeLegacyAddress("3J98t1WpEZ73CNmQviecrnyiWrnqRhWNLy"); }),
              ErrorCode::InvalidEncodingInput);
}

// ============================================================================
// Receive Addresses
// ============================================================================

TEST(ReceiveAddressTest, BitcoinAccountVector) {
    EXPECT_EQ(DeriveReceiveAddress(std::string(BITCOIN_ACCOUNT_XPUB), AddressFormat::Legacy, 0),
              "1LqBGSKuX5yYUonjxT5qGfpUsXKYYWeabA");
}

TEST(ReceiveAddressTest, FormatsAgree) {
    ExtendedKey account = ExtendedKey::FromBase58(BITCOIN_ACCOUNT_XPUB);
    for (uint32_t i = 0; i < 5; ++i) {
        std::string legacy = DeriveReceiveAddress(account, AddressFormat::Legacy, i);
        std::string cash = DeriveReceiveAddress(account, AddressFormat::CashAddr, i);
        EXPECT_EQ(DecodeLegacyAddress(legacy), DecodeCashAddress(cash)) << i;
    }
}

TEST(ReceiveAddressTest, PrivateAndPublicAccountAgree) {
    std::vector<std::string> words(11, "abandon");
    words.push_back("about");
    ExtendedKey account = DeriveAccountKey(MnemonicToSeed(words));
    
    std::string xpub = account.Neuter().ToBase58();
    for (uint32_t i : {0u, 1u, 19u}) {
        EXPECT_EQ(DeriveReceiveAddress(account, AddressFormat::CashAddr, i),
                  DeriveReceiveAddress(xpub, AddressFormat::CashAddr, i));
    }
}

TEST(ReceiveAddressTest, IndicesDiffer) {
    ExtendedKey account = ExtendedKey::FromBase58(BITCOIN_ACCOUNT_XPUB);
    EXPECT_NE(DeriveReceiveAddress(account, AddressFormat::CashAddr, 0),
              DeriveReceiveAddress(account, AddressFormat::CashAddr, 1));
}

TEST(ReceiveAddressTest, HardenedIndexRejected) {
    ExtendedKey account = ExtendedKey::FromBase58(BITCOIN_ACCOUNT_XPUB);
    EXPECT_EQ(CodeOf([&] { DeriveReceiveAddress(account, AddressFormat::Legacy, HARDENED_FLAG); }),
              ErrorCode::UnsupportedHardenedPublicDerivation);
}

TEST(ReceiveAddressTest, MalformedXpub) {
    EXPECT_EQ(CodeOf([] { DeriveReceiveAddress(std::string("xpubnotreal"),
                                               AddressFormat::Legacy, 0); }),
              ErrorCode::MalformedExtendedKey);
}

} // namespace test
} // namespace wallet
} // namespace cashseed
