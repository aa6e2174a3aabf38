#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bulkget::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() > 1 ? std::filesystem::path(home) / path.substr(2)
                                   : std::filesystem::path(home);
        }
    }
    return path;
}

// Strict integer parsing; the whole string must be a number.
std::optional<std::int64_t> parse_int(std::string_view s);

// Parse a value from a TOML-style config file. Accepts both "[section] key" and
// "section.key" forms. Returns an empty string when absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Resolve the config file: explicit override, then $BULKGET_CONFIG, then
/// $XDG_CONFIG_HOME/bulkget/config.toml or ~/.config/bulkget/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/**
 * Values read from the [transfer] section. Unset keys stay empty so callers can layer
 * command-line flags and built-in defaults around them.
 */
struct TransferConfig {
    std::optional<std::filesystem::path> outputDir;
    std::optional<int> parallelFiles;
    std::optional<int> threads;
    std::optional<std::int64_t> chunkSizeMb;
    std::optional<int> flushEvery;
    std::optional<int> maxAttempts;
    std::optional<std::string> apiKey;
    std::optional<std::filesystem::path> logFile;

    // Keys present with unusable values, as "key: reason".
    std::vector<std::string> problems;
};

// A missing file yields an empty TransferConfig.
TransferConfig load_transfer_config(const std::filesystem::path& config_path);

// Credential from the environment (NCBI_API_KEY), if set and non-empty.
std::optional<std::string> api_key_from_env();

} // namespace bulkget::config
