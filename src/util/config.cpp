// STAKEGUARD - Configuration File Parser Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/util/config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace stakeguard {
namespace util {

namespace {

constexpr const char* COMMAND_LINE_SOURCE = "<command-line>";

std::string Strip(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string Lower(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool IsKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

/// "nofoo" -> ("foo", "false"), anything else -> (word, "true")
std::pair<std::string, std::string> FlagValue(const std::string& word) {
    if (word.size() > 2 && word.compare(0, 2, "no") == 0 &&
        std::islower(static_cast<unsigned char>(word[2]))) {
        return {word.substr(2), "false"};
    }
    return {word, "true"};
}

/// Strips matching quotes; backslash escapes apply inside double quotes only
std::string Unquote(const std::string& raw) {
    if (raw.size() < 2 || raw.front() != raw.back() ||
        (raw.front() != '"' && raw.front() != '\'')) {
        return raw;
    }
    std::string inner = raw.substr(1, raw.size() - 2);
    if (raw.front() == '\'') {
        return inner;
    }

    std::string out;
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] != '\\' || i + 1 == inner.size()) {
            out += inner[i];
            continue;
        }
        switch (inner[i + 1]) {
            case 'n':  out += '\n'; ++i; break;
            case 't':  out += '\t'; ++i; break;
            case '\\': out += '\\'; ++i; break;
            case '"':  out += '"';  ++i; break;
            default:   out += '\\'; break;
        }
    }
    return out;
}

} // namespace

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "OK";
    }
    std::string out;
    if (!errorFile.empty()) {
        out = errorFile;
        if (errorLine > 0) {
            out += ":" + std::to_string(errorLine);
        }
        out += ": ";
    }
    return out + errorMessage;
}

// ============================================================================
// Parsing
// ============================================================================

std::optional<std::string> ConfigManager::Assign(const std::string& section, std::string key,
                                                 std::string value) {
    if (key.empty()) {
        return std::string("Empty key");
    }
    auto bad = std::find_if_not(key.begin(), key.end(), IsKeyChar);
    if (bad != key.end()) {
        return "Invalid character in key: " + std::string(1, *bad);
    }
    sections_[section][std::move(key)] = std::move(value);
    return std::nullopt;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    std::string section;
    std::string raw;
    int lineNum = 0;

    while (std::getline(in, raw)) {
        ++lineNum;
        if (raw.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }

        std::string line = Strip(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            size_t close = line.find(']');
            if (close == std::string::npos) {
                return ConfigParseResult::Error(
                    "Missing closing bracket in section header", source, lineNum);
            }
            section = Lower(Strip(line.substr(1, close - 1)));
            continue;
        }

        std::pair<std::string, std::string> kv;
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            kv = FlagValue(line);
        } else {
            kv.first = Strip(line.substr(0, eq));
            kv.second = ExpandEnvVars(Unquote(Strip(line.substr(eq + 1))));
        }

        if (auto error = Assign(section, std::move(kv.first), std::move(kv.second))) {
            return ConfigParseResult::Error(*error, source, lineNum);
        }
    }
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }
    std::streamoff size = file.tellg();
    if (size > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)", path);
    }
    file.seekg(0);
    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream in(content);
    return ParseStream(in, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.empty()) {
            continue;
        }
        if (arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }

        size_t start = arg.find_first_not_of('-');
        if (start == std::string::npos) {
            continue;
        }
        std::string word = arg.substr(start);

        std::pair<std::string, std::string> kv;
        size_t eq = word.find('=');
        if (eq != std::string::npos) {
            kv = {word.substr(0, eq), word.substr(eq + 1)};
        } else {
            kv = FlagValue(word);
            // "--key value": a bare (non-negated) flag takes the next word
            if (kv.second == "true" && i + 1 < argc && argv[i + 1][0] != '-') {
                kv.second = argv[++i];
            }
        }

        if (Assign("", std::move(kv.first), std::move(kv.second))) {
            return ConfigParseResult::Error("Invalid command-line option: " + arg,
                                            COMMAND_LINE_SOURCE);
        }
    }
    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

const std::string* ConfigManager::Find(const std::string& key,
                                       const std::string& section) const {
    auto sec = sections_.find(section);
    if (sec == sections_.end()) {
        return nullptr;
    }
    auto it = sec->second.find(key);
    return it == sec->second.end() ? nullptr : &it->second;
}

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return Find(key, section) != nullptr;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    if (const std::string* value = Find(key, section)) {
        return *value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    const std::string* value = Find(key, section);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(value->c_str(), &end, 10);
    if (errno == ERANGE || end == value->c_str() || !Strip(end).empty()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(parsed);
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    const std::string* value = Find(key, section);
    return value ? ParseBool(*value) : std::nullopt;
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::optional<double> ConfigManager::TryGetDouble(const std::string& key,
                                                  const std::string& section) const {
    const std::string* value = Find(key, section);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    double parsed = std::strtod(value->c_str(), &end);
    if (errno == ERANGE || end == value->c_str() || !Strip(end).empty()) {
        return std::nullopt;
    }
    return parsed;
}

double ConfigManager::GetDouble(const std::string& key, double defaultValue,
                                const std::string& section) const {
    return TryGetDouble(key, section).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key, const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

void ConfigManager::Clear() {
    sections_.clear();
    positional_.clear();
}

size_t ConfigManager::Size() const {
    size_t n = 0;
    for (const auto& sec : sections_) {
        n += sec.second.size();
    }
    return n;
}

// ============================================================================
// Helpers
// ============================================================================

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string v = Lower(str);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    return std::nullopt;
}

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
        std::string name = value.substr(open + 2, close - open - 2);
        if (const char* env = std::getenv(name.c_str())) {
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

    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (const struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    return home.empty() ? path : home + path.substr(1);
}

} // namespace util
} // namespace stakeguard
