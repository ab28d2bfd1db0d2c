// CASHSEED Tool
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// Command-line front end for the key-derivation engine.
// Supports:
// - Generating a new BIP39 recovery phrase
// - Restoring a phrase and showing its account keys
// - Completing a phrase whose last word comes from coin flips
// - Listing receive addresses from an account xpub

#include "cashseed/core/error.h"
#include "cashseed/util/config.h"
#include "cashseed/util/logging.h"
#include "cashseed/wallet/address.h"
#include "cashseed/wallet/mnemonic.h"
#include "cashseed/wallet/seed.h"
#include "cashseed/wallet/wordlist.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <termios.h>
#include <unistd.h>
#include <vector>

using namespace cashseed;
using namespace cashseed::wallet;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";

#ifndef CASHSEED_WORDLIST_PATH
#define CASHSEED_WORDLIST_PATH "data/bip39_english.txt"
#endif

/// Upper bound for --count
constexpr int64_t MAX_ADDRESS_COUNT = 1000;

// ============================================================================
// Terminal Utilities
// ============================================================================

/// Read secret text from terminal without echo
std::string ReadPassword(const std::string& prompt) {
    std::cerr << prompt << std::flush;
    
    bool isTerminal = isatty(STDIN_FILENO) == 1;
    termios oldt{}, newt{};
    if (isTerminal) {
        tcgetattr(STDIN_FILENO, &oldt);
        newt = oldt;
        newt.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &newt);
    }
    
    std::string password;
    std::getline(std::cin, password);
    
    if (isTerminal) {
        tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
    }
    std::cerr << std::endl;
    
    return password;
}

void PrintLine(char c = '-', int width = 60) {
    std::cout << std::string(width, c) << "\n";
}

void PrintWords(const std::vector<std::string>& words) {
    for (size_t i = 0; i < words.size(); ++i) {
        std::cout << std::setw(2) << (i + 1) << ". " << words[i] << "\n";
    }
}

/// All positional arguments after the command, split into words
std::vector<std::string> CollectWords(const std::vector<std::string>& args, size_t first,
                                      size_t last) {
    std::vector<std::string> words;
    for (size_t i = first; i < last && i < args.size(); ++i) {
        for (auto& w : SplitMnemonic(args[i])) {
            words.push_back(std::move(w));
        }
    }
    return words;
}

// ============================================================================
// Setup
// ============================================================================

void SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    
    util::LogLevel level = util::LogLevelFromString(config.GetString(util::ConfigKeys::LOGLEVEL, "warn"));
    
    auto debug = config.TryGetString(util::ConfigKeys::DEBUG);
    if (debug && *debug != "false" && *debug != "0") {
        level = util::LogLevel::Debug;
        if (*debug != "true" && *debug != "1") {
            logger.SetCategoryFilter(*debug);
        }
    }
    logger.SetLevel(level);
    
    logger.AddSink(std::make_shared<util::ConsoleSink>(level));
}

/// Command line first, then the config file without overwriting
bool LoadConfig(int argc, const char* const argv[], util::ConfigManager& config) {
    auto result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage << "\n";
        return false;
    }
    
    auto confPath = config.TryGetString(util::ConfigKeys::CONF);
    std::string path = confPath ? *confPath : util::DEFAULT_CONFIG_FILENAME;
    
    // The default file is optional, an explicit one is not
    if (confPath || std::ifstream(path).good()) {
        result = config.ParseFile(path);
        if (!result.success) {
            std::cerr << "Error: " << result.errorMessage;
            if (result.errorLine > 0) {
                std::cerr << " (" << result.errorFile << ":" << result.errorLine << ")";
            }
            std::cerr << "\n";
            return false;
        }
    }
    
    config.SetDefault(util::ConfigKeys::WORDLIST, CASHSEED_WORDLIST_PATH);
    config.SetDefault(util::ConfigKeys::ADDRESSFORMAT, "cashaddr");
    config.SetDefault(util::ConfigKeys::WORDS, "12");
    config.SetDefault(util::ConfigKeys::INDEX, "0");
    config.SetDefault(util::ConfigKeys::COUNT, "1");
    return true;
}

WordList LoadWordList(const util::ConfigManager& config) {
    return WordList::FromFile(config.GetPath(util::ConfigKeys::WORDLIST));
}

void PrintAccount(const Seed& seed, bool showPrivate) {
    std::cout << "Fingerprint: " << seed.GetFingerprint() << "\n";
    std::cout << "Path:        " << DerivationPath::BIP44Account(0).ToString() << "\n";
    std::cout << "xpub:        " << seed.GetXpub() << "\n";
    if (showPrivate) {
        std::cout << "xprv:        " << seed.GetXprv() << "\n";
    }
}

// ============================================================================
// Command Handlers
// ============================================================================

int CommandGenerate(const util::ConfigManager& config) {
    auto wordCount = config.TryGetInt(util::ConfigKeys::WORDS);
    if (!wordCount || !IsValidWordCount(static_cast<size_t>(*wordCount))) {
        std::cerr << "Error: Invalid word count. Must be 12, 15, 18, 21, or 24.\n";
        return 1;
    }
    
    WordList wordList = LoadWordList(config);
    MnemonicCodec codec(wordList);
    Seed seed(codec.GenerateRandom(static_cast<size_t>(*wordCount)), wordList);
    
    if (config.GetBool(util::ConfigKeys::PASSPHRASE_PROMPT, false)) {
        seed.SetPassphrase(ReadPassword("Passphrase: "));
    }
    seed.Generate();
    
    std::cout << "Recovery phrase (" << seed.WordCount() << " words):\n\n";
    PrintLine();
    PrintWords(seed.GetWords());
    PrintLine();
    std::cout << "\n";
    PrintAccount(seed, config.GetBool(util::ConfigKeys::SHOW_PRIVATE, false));
    return 0;
}

int CommandRestore(const util::ConfigManager& config) {
    const auto& args = config.GetPositionalArgs();
    std::vector<std::string> words = CollectWords(args, 1, args.size());
    if (words.empty()) {
        words = SplitMnemonic(ReadPassword("Recovery phrase: "));
    }
    
    WordList wordList = LoadWordList(config);
    Seed seed(std::move(words), wordList);
    
    if (config.GetBool(util::ConfigKeys::PASSPHRASE_PROMPT, false)) {
        seed.SetPassphrase(ReadPassword("Passphrase: "));
    }
    seed.Generate();
    
    std::cout << "Recovery phrase is valid (" << seed.WordCount() << " words"
              << (seed.HasPassphrase() ? ", with passphrase" : "") << ")\n";
    PrintAccount(seed, config.GetBool(util::ConfigKeys::SHOW_PRIVATE, false));
    return 0;
}

int CommandFinalWord(const util::ConfigManager& config) {
    const auto& args = config.GetPositionalArgs();
    if (args.size() < 3) {
        std::cerr << "Error: Usage: cashseed-tool finalword \"<words...>\" <bits>\n";
        return 1;
    }
    
    std::vector<std::string> preceding = CollectWords(args, 1, args.size() - 1);
    const std::string& bits = args.back();
    
    WordList wordList = LoadWordList(config);
    MnemonicCodec codec(wordList);
    std::vector<std::string> words = codec.ComputeFinalWord(preceding, bits);
    
    std::cout << "Final word:  " << words.back() << "\n\n";
    PrintLine();
    PrintWords(words);
    PrintLine();
    return 0;
}

int CommandAddress(const util::ConfigManager& config) {
    const auto& args = config.GetPositionalArgs();
    if (args.size() < 2) {
        std::cerr << "Error: Usage: cashseed-tool address <xpub> [--index=N] [--count=K]\n";
        return 1;
    }
    
    auto format = ParseAddressFormat(config.GetString(util::ConfigKeys::ADDRESSFORMAT, "cashaddr"));
    if (!format) {
        std::cerr << "Error: Invalid address format. Must be legacy or cashaddr.\n";
        return 1;
    }
    
    auto index = config.TryGetInt(util::ConfigKeys::INDEX);
    if (!index || *index < 0 || *index >= static_cast<int64_t>(HARDENED_FLAG)) {
        std::cerr << "Error: Invalid index. Must be between 0 and 2147483647.\n";
        return 1;
    }
    
    auto count = config.TryGetInt(util::ConfigKeys::COUNT);
    if (!count || *count < 1 || *count > MAX_ADDRESS_COUNT ||
        *index + *count > static_cast<int64_t>(HARDENED_FLAG)) {
        std::cerr << "Error: Invalid count. Must be between 1 and " << MAX_ADDRESS_COUNT << ".\n";
        return 1;
    }
    
    ExtendedKey account = ExtendedKey::FromBase58(args[1]).Neuter();
    for (int64_t i = 0; i < *count; ++i) {
        uint32_t idx = static_cast<uint32_t>(*index + i);
        std::cout << idx << "  " << DeriveReceiveAddress(account, *format, idx) << "\n";
    }
    return 0;
}

// ============================================================================
// Help and Usage
// ============================================================================

void PrintUsage() {
    std::cout << "CASHSEED Tool v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: cashseed-tool <command> [arguments] [options]\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  generate                  Create a new recovery phrase\n";
    std::cout << "  restore \"<words>\"         Validate a phrase and show its account keys\n";
    std::cout << "  finalword \"<words>\" <bits>  Complete a phrase from coin-flip bits\n";
    std::cout << "  address <xpub>            List receive addresses of an account xpub\n";
    std::cout << "  help                      Show this help message\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --conf=<path>             Config file (default: ./cashseed.conf)\n";
    std::cout << "  --wordlist=<path>         BIP39 word list file\n";
    std::cout << "  --words=<n>               Word count for generate (12,15,18,21,24)\n";
    std::cout << "  --passphrase-prompt       Ask for a BIP39 passphrase\n";
    std::cout << "  --show-private            Also print the account xprv (DANGEROUS)\n";
    std::cout << "  --index=<n>               First address index (default: 0)\n";
    std::cout << "  --count=<n>               Number of addresses (default: 1)\n";
    std::cout << "  --addressformat=<fmt>     legacy or cashaddr (default: cashaddr)\n";
    std::cout << "  --loglevel=<level>        debug, info, warn, error, off\n";
    std::cout << "  --debug[=<category>]      Debug logging (mnemonic, seed, derive, address)\n";
    std::cout << "  --version                 Show version\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  cashseed-tool generate --words=24\n";
    std::cout << "  cashseed-tool restore --passphrase-prompt\n";
    std::cout << "  cashseed-tool finalword \"<23 words>\" 101\n";
    std::cout << "  cashseed-tool address xpub6... --count=5 --addressformat=legacy\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << "CASHSEED Tool v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 CASHSEED Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    util::ConfigManager config;
    if (!LoadConfig(argc, argv, config)) {
        return 1;
    }
    
    if (config.GetBool("version", false) || config.GetBool("v", false)) {
        PrintVersion();
        return 0;
    }
    
    const auto& args = config.GetPositionalArgs();
    bool help = config.GetBool("help", false) || config.GetBool("h", false);
    if (help || args.empty()) {
        PrintUsage();
        return help ? 0 : 1;
    }
    
    SetupLogging(config);
    
    const std::string& command = args[0];
    int rc = 1;
    try {
        // Route to command
        if (command == "generate") {
            rc = CommandGenerate(config);
        } else if (command == "restore") {
            rc = CommandRestore(config);
        } else if (command == "finalword") {
            rc = CommandFinalWord(config);
        } else if (command == "address") {
            rc = CommandAddress(config);
        } else if (command == "help") {
            PrintUsage();
            rc = 0;
        } else {
            std::cerr << "Unknown command: " << command << "\n";
            std::cerr << "Run 'cashseed-tool help' for usage.\n";
        }
    } catch (const KeyError& e) {
        LOG_ERROR(util::LogCategory::TOOL) << "Command " << command << " failed: "
                                           << ErrorCodeToString(e.Code());
        std::cerr << "Error (" << ErrorCodeToString(e.Code()) << "): " << e.what() << "\n";
        rc = 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }
    
    util::Logger::Instance().ClearSinks();
    return rc;
}
