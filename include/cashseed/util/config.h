// CASHSEED - Configuration
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// Settings for the cashseed tool, merged from three sources. A value from a
// higher-priority source is never replaced by a lower one:
//
//   command line  >  config file  >  built-in defaults
//
// Config file format, one setting per line:
//
//   # comment           ; comment
//   key=value           key="quoted \"value\""   key='literal'
//   flag                (same as flag=true)
//   noflag              (same as flag=false)
//   key=first \         (a trailing backslash joins the next line)
//       second
//
// ${VAR} in values is replaced by the environment variable. Section headers
// are rejected. Configuration never holds secrets.

#ifndef CASHSEED_UTIL_CONFIG_H
#define CASHSEED_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cashseed {
namespace util {

/// Config file read when --conf is not given; a missing default file is not an error
constexpr const char* DEFAULT_CONFIG_FILENAME = "cashseed.conf";

constexpr size_t MAX_CONFIG_SIZE = 64 * 1024;
constexpr size_t MAX_LINE_LENGTH = 4096;

struct ConfigParseResult {
    bool success{true};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Error(const std::string& msg, const std::string& file, int line = 0) {
        return {false, msg, file, line};
    }
};

class ConfigManager {
public:
    /// --key=value, --key and --nokey; other arguments are positional. "--" ends options.
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /// Reads a config file; ~ and ${VAR} in the path are expanded
    ConfigParseResult ParseFile(const std::string& path);

    /// Reads config text; sourceName is reported in errors
    ConfigParseResult Parse(std::istream& in, const std::string& sourceName);

    void SetDefault(const std::string& key, const std::string& value);

    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;

    /// Whole decimal numbers only; nullopt when missing or malformed
    std::optional<int64_t> TryGetInt(const std::string& key) const;

    /// true/yes/on/1 or false/no/off/0; defaultValue when missing or malformed
    bool GetBool(const std::string& key, bool defaultValue) const;

    /// Value with ~ and ${VAR} expanded
    std::string GetPath(const std::string& key, const std::string& defaultValue = "") const;

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

private:
    enum class Source { Default, File, CommandLine };

    struct Setting {
        std::string value;
        Source source;
    };

    void Put(const std::string& key, const std::string& value, Source source);

    std::map<std::string, Setting> settings_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* CONF = "conf";
    constexpr const char* WORDLIST = "wordlist";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* DEBUG = "debug";
    constexpr const char* ADDRESSFORMAT = "addressformat";
    constexpr const char* WORDS = "words";
    constexpr const char* INDEX = "index";
    constexpr const char* COUNT = "count";
    constexpr const char* PASSPHRASE_PROMPT = "passphrase-prompt";
    constexpr const char* SHOW_PRIVATE = "show-private";
}

} // namespace util
} // namespace cashseed

#endif // CASHSEED_UTIL_CONFIG_H
