// CASHSEED - Configuration Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <pwd.h>
#include <unistd.h>

namespace cashseed {
namespace util {

namespace {

const char* const kCommandLineSource = "<command-line>";

std::string Trim(const std::string& str) {
    size_t begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    return str.substr(begin, str.find_last_not_of(" \t\r\n") - begin + 1);
}

bool IsValidKey(const std::string& key) {
    return !key.empty() && std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

/// "name" -> (name, "true"); "noname" -> (name, "false")
std::pair<std::string, std::string> SplitFlag(const std::string& flag) {
    if (flag.size() > 2 && flag.compare(0, 2, "no") == 0 &&
        std::islower(static_cast<unsigned char>(flag[2]))) {
        return {flag.substr(2), "false"};
    }
    return {flag, "true"};
}

/// Strips matching quotes. Single quotes are literal; double quotes
/// understand \n, \t, \\ and \".
std::string Unquote(const std::string& str) {
    if (str.size() < 2 || str.front() != str.back() ||
        (str.front() != '"' && str.front() != '\'')) {
        return str;
    }
    std::string inner = str.substr(1, str.size() - 2);
    if (str.front() == '\'') {
        return inner;
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        char c = inner[i];
        if (c == '\\' && i + 1 < inner.size()) {
            char next = inner[i + 1];
            if (next == 'n' || next == 't' || next == '\\' || next == '"') {
                out += next == 'n' ? '\n' : next == 't' ? '\t' : next;
                ++i;
                continue;
            }
        }
        out += c;
    }
    return out;
}

std::optional<bool> ParseBool(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* yes : {"true", "yes", "on", "1"}) {
        if (str == yes) return true;
    }
    for (const char* no : {"false", "no", "off", "0"}) {
        if (str == no) return false;
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// Expansion
// ============================================================================

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string out;
    size_t pos = 0;
    while (pos < value.size()) {
        size_t open = value.find("${", pos);
        size_t close = open == std::string::npos ? open : value.find('}', open + 2);
        if (close == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        out.append(value, pos, open - pos);
        const char* env = std::getenv(value.substr(open + 2, close - open - 2).c_str());
        if (env) {
            out += env;
        }
        pos = close + 1;
    }
    return out;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        const struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : nullptr;
    }
    if (!home || !*home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

// ============================================================================
// Sources
// ============================================================================

void ConfigManager::Put(const std::string& key, const std::string& value, Source source) {
    auto it = settings_.find(key);
    if (it != settings_.end() && it->second.source > source) {
        return;
    }
    settings_[key] = Setting{value, source};
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value) {
    Put(key, value, Source::Default);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    positional_.clear();
    bool optionsDone = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!optionsDone && arg == "--") {
            optionsDone = true;
            continue;
        }
        if (optionsDone || arg.size() < 2 || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }

        size_t nameStart = arg.find_first_not_of('-');
        if (nameStart == std::string::npos) {
            return ConfigParseResult::Error("Invalid option: " + arg, kCommandLineSource, i);
        }
        std::string option = arg.substr(nameStart);
        std::pair<std::string, std::string> kv;
        size_t eq = option.find('=');
        if (eq != std::string::npos) {
            kv = {option.substr(0, eq), option.substr(eq + 1)};
        } else {
            kv = SplitFlag(option);
        }

        if (!IsValidKey(kv.first)) {
            return ConfigParseResult::Error("Invalid option: " + arg, kCommandLineSource, i);
        }
        Put(kv.first, kv.second, Source::CommandLine);
    }
    return {};
}

ConfigParseResult ConfigManager::ParseFile(const std::string& path) {
    std::string expanded = ExpandEnvVars(ExpandTilde(path));

    std::ifstream file(expanded, std::ios::ate);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + expanded, expanded);
    }
    if (static_cast<std::streamoff>(file.tellg()) > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)", expanded);
    }
    file.seekg(0);
    return Parse(file, expanded);
}

ConfigParseResult ConfigManager::Parse(std::istream& in, const std::string& sourceName) {
    std::string raw;
    std::string pending;
    int lineNum = 0;
    int startLine = 0;

    // Returns false and fills result on a malformed line
    auto apply = [&](const std::string& text, int line, ConfigParseResult& result) {
        std::string trimmed = Trim(text);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
            return true;
        }
        if (trimmed[0] == '[') {
            result = ConfigParseResult::Error("Section headers are not supported", sourceName, line);
            return false;
        }

        std::pair<std::string, std::string> kv;
        size_t eq = trimmed.find('=');
        if (eq == std::string::npos) {
            kv = SplitFlag(trimmed);
        } else {
            kv = {Trim(trimmed.substr(0, eq)),
                  ExpandEnvVars(Unquote(Trim(trimmed.substr(eq + 1))))};
        }
        if (!IsValidKey(kv.first)) {
            result = ConfigParseResult::Error(
                kv.first.empty() ? "Empty key" : "Invalid key: " + kv.first, sourceName, line);
            return false;
        }
        Put(kv.first, kv.second, Source::File);
        return true;
    };

    ConfigParseResult result;
    while (std::getline(in, raw)) {
        ++lineNum;
        if (raw.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }
        if (pending.empty()) {
            startLine = lineNum;
        }
        if (!raw.empty() && raw.back() == '\\') {
            pending.append(raw, 0, raw.size() - 1);
            continue;
        }
        pending += raw;
        if (!apply(pending, startLine, result)) {
            return result;
        }
        pending.clear();
    }
    if (!pending.empty() && !apply(pending, startLine, result)) {
        return result;
    }
    return result;
}

// ============================================================================
// Lookup
// ============================================================================

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    auto it = settings_.find(key);
    if (it == settings_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& defaultValue) const {
    return TryGetString(key).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str) {
        return std::nullopt;
    }
    std::string text = Trim(*str);
    size_t digits = (!text.empty() && (text[0] == '-' || text[0] == '+')) ? 1 : 0;
    if (text.size() == digits ||
        !std::all_of(text.begin() + digits, text.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return static_cast<int64_t>(std::stoll(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    auto str = TryGetString(key);
    if (!str) {
        return defaultValue;
    }
    return ParseBool(Trim(*str)).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key, const std::string& defaultValue) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue)));
}

} // namespace util
} // namespace cashseed
