// CASHSEED - Concurrent Use Tests
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// Only the WordList and the logger are shared between threads; every other
// object is owned by the thread that creates it.

#include <gtest/gtest.h>
#include "cashseed/wallet/address.h"
#include "cashseed/wallet/mnemonic.h"
#include "cashseed/wallet/seed.h"
#include "cashseed/util/logging.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace cashseed {
namespace wallet {
namespace test {

namespace {

/// m/44'/145'/0' of "abandon x11 about"
const char* CASH_ACCOUNT_XPUB =
    "xpub6ByHsPNSQXTWZ7PLESMY2FufyYWtLXagSUpMQq7Un96SiThZH2iJB1X7pwviH1WtKVeDP6K8d6xxFzzoaFzF3s8BKCZx8oEDdDkNnp4owAZ";

constexpr int NUM_THREADS = 8;
constexpr int ITERATIONS = 20;
constexpr uint32_t NUM_INDICES = 10;

class CountingSink : public util::ILogSink {
public:
    void Write(const util::LogEntry&) override { ++count; }
    std::atomic<int> count{0};
};

std::vector<std::string> AbandonAbout() {
    std::vector<std::string> words(11, "abandon");
    words.push_back("about");
    return words;
}

} // namespace

class ConcurrencyTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        list_ = std::make_unique<WordList>(WordList::FromFile(CASHSEED_TEST_WORDLIST_PATH));
    }

    static void TearDownTestSuite() {
        list_.reset();
    }

    void SetUp() override {
        auto& logger = util::Logger::Instance();
        logger.ClearSinks();
        logger.SetCategoryFilter("");
        logger.SetLevel(util::LogLevel::Debug);
        sink_ = std::make_shared<CountingSink>();
        logger.AddSink(sink_);
    }

    void TearDown() override {
        auto& logger = util::Logger::Instance();
        logger.ClearSinks();
        logger.SetLevel(util::LogLevel::Warn);
    }

    static std::unique_ptr<WordList> list_;
    std::shared_ptr<CountingSink> sink_;
};

std::unique_ptr<WordList> ConcurrencyTest::list_;

TEST_F(ConcurrencyTest, AddressesAndMnemonicsAcrossThreads) {
    const std::string xpub = CASH_ACCOUNT_XPUB;

    std::vector<std::string> legacy;
    std::vector<std::string> cash;
    for (uint32_t i = 0; i < NUM_INDICES; ++i) {
        legacy.push_back(DeriveReceiveAddress(xpub, AddressFormat::Legacy, i));
        cash.push_back(DeriveReceiveAddress(xpub, AddressFormat::CashAddr, i));
    }
    ASSERT_EQ(legacy[0], "1mW6fDEMjKrDHvLvoEsaeLxSCzZBf3Bfg");
    ASSERT_EQ(cash[0], "bitcoincash:qqyx49mu0kkn9ftfj6hje6g2wfer34yfnq5tahq3q6");

    std::atomic<int> mismatches{0};
    std::atomic<int> badMnemonics{0};
    std::atomic<int> failures{0};

    auto worker = [&](int id) {
        try {
            MnemonicCodec codec(*list_);
            for (int n = 0; n < ITERATIONS; ++n) {
                uint32_t index = static_cast<uint32_t>(id + n) % NUM_INDICES;
                if (DeriveReceiveAddress(xpub, AddressFormat::Legacy, index) != legacy[index] ||
                    DeriveReceiveAddress(xpub, AddressFormat::CashAddr, index) != cash[index]) {
                    ++mismatches;
                }

                std::vector<std::string> words = codec.GenerateRandom(24);
                if (words.size() != 24 || !codec.IsValid(words)) {
                    ++badMnemonics;
                }
            }
        } catch (const std::exception&) {
            ++failures;
        }
    };

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back(worker, t);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(badMnemonics.load(), 0);
    EXPECT_GT(sink_->count.load(), 0);
}

TEST_F(ConcurrencyTest, SeedsOnSharedWordList) {
    std::atomic<int> mismatches{0};
    std::atomic<int> failures{0};

    auto worker = [&]() {
        try {
            Seed seed(AbandonAbout(), *list_);
            seed.Generate();
            if (seed.GetXpub() != CASH_ACCOUNT_XPUB || seed.GetFingerprint() != "cba3794d" ||
                seed.GenerateAddress(AddressFormat::Legacy, 2) != "15Ax9BJRJ4TABF85UsPpz9QvuBpiJhCfsw") {
                ++mismatches;
            }
        } catch (const std::exception&) {
            ++failures;
        }
    };

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(mismatches.load(), 0);
}

} // namespace test
} // namespace wallet
} // namespace cashseed
