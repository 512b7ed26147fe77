// STAKEGUARD - Configuration File Parser
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// INI-style settings for the daemon, plus the command-line overrides.
//
//   # comment            ; comment
//   [general]            section names are case-insensitive
//   min_rewards = 2.5
//   webhook_url = "https://..."   quotes stripped, ${VAR} expanded
//   use_sudo             bare key is a true flag
//   noenable_tmux        "no" prefix is a false flag

#ifndef STAKEGUARD_UTIL_CONFIG_H
#define STAKEGUARD_UTIL_CONFIG_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stakeguard {
namespace util {

/// Looked up in the working directory unless -conf is given
constexpr const char* DEFAULT_CONFIG_FILENAME = "stakeguard.conf";

/// Secrets file (KEY=VALUE lines) next to the config
constexpr const char* DEFAULT_ENV_FILENAME = ".env";

constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;
constexpr size_t MAX_LINE_LENGTH = 4096;

/**
 * Outcome of parsing one source. On failure `errorFile`/`errorLine`
 * locate the offending line when known.
 */
struct ConfigParseResult {
    bool success{true};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() { return {}; }
    static ConfigParseResult Error(std::string msg, std::string file = "", int line = 0) {
        return {false, std::move(msg), std::move(file), line};
    }

    /// "file:line: message"
    std::string ToString() const;
};

/**
 * Settings store. Later sources overwrite earlier ones key by key, so the
 * daemon parses the file first and the command line second. Command-line
 * options always land in the global ("") section.
 */
class ConfigManager {
public:
    ConfigParseResult ParseFile(const std::string& filePath);
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Accepts -key=value, --key value, -flag and -noflag. Words that do not
     * follow a bare flag and do not start with '-' become positionals.
     */
    ConfigParseResult ParseCommandLine(int argc, char* argv[]);

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key, const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Rejects values with trailing text ("60 blocks")
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    std::optional<double> TryGetDouble(const std::string& key,
                                       const std::string& section = "") const;
    double GetDouble(const std::string& key, double defaultValue,
                     const std::string& section = "") const;

    /// String value with ~ and ${VAR} expanded
    std::string GetPath(const std::string& key, const std::string& defaultValue = "",
                        const std::string& section = "") const;

    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }

    void Clear();
    size_t Size() const;

    static std::string ExpandEnvVars(const std::string& value);
    static std::string ExpandTilde(const std::string& path);

    /// true/yes/on/1 and false/no/off/0, case-insensitive
    static std::optional<bool> ParseBool(const std::string& str);

private:
    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    /// Validates `key` and stores it; on failure returns the error text
    std::optional<std::string> Assign(const std::string& section, std::string key,
                                      std::string value);

    const std::string* Find(const std::string& key, const std::string& section) const;

    // section -> key -> value
    std::map<std::string, std::map<std::string, std::string>> sections_;
    std::vector<std::string> positional_;
};

} // namespace util
} // namespace stakeguard

#endif // STAKEGUARD_UTIL_CONFIG_H
