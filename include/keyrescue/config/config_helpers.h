#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyrescue::config {

/// Trims, then strips one pair of matching single or double quotes.
std::string unquote(std::string_view val);

/// "~/x" -> "$HOME/x"; anything else is returned as is.
std::filesystem::path expand_tilde(const std::string& path);

// Integer parsing; nullopt for empty or malformed input
std::optional<long long> parse_integer(std::string_view s);

// Milliseconds; @p fallback for negative or malformed input
inline std::chrono::milliseconds parse_ms(std::string_view s,
                                          std::chrono::milliseconds fallback = {}) {
    if (auto v = parse_integer(s); v && *v >= 0) {
        return std::chrono::milliseconds(*v);
    }
    return fallback;
}

/**
 * @brief Read one value from a TOML-style config file.
 *
 * Matches `key` inside `[section]` or a dotted `section.key` anywhere.
 * Inline `#` comments outside quotes are dropped and the value is unquoted.
 * Returns "" when the file or the key is missing.
 */
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Accepts "a,b" or ["a", "b"]; empty entries are skipped.
std::vector<std::string> parse_string_list(std::string_view raw);

// $KEYRESCUE_CONFIG, then $XDG_CONFIG_HOME/keyrescue/config.toml, then ~/.config
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_DATA_HOME/keyrescue or ~/.local/share/keyrescue
std::filesystem::path get_data_dir();

// Map a textual level (trace/debug/info/warn/error/off) onto spdlog
void apply_log_level(const std::string& level);

} // namespace keyrescue::config
