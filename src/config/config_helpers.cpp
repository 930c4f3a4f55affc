#include <keyrescue/common/pattern_utils.h>
#include <keyrescue/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

namespace keyrescue::config {

namespace {

std::string_view dropInlineComment(std::string_view value) {
    char quote = 0;
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (quote == 0 && (c == '"' || c == '\'')) {
            quote = c;
        } else if (c == quote) {
            quote = 0;
        } else if (c == '#' && quote == 0) {
            return common::trim(value.substr(0, i));
        }
    }
    return value;
}

// "[name]" -> "name"
std::optional<std::string> sectionHeader(std::string_view line) {
    if (line.empty() || line.front() != '[') {
        return std::nullopt;
    }
    const auto close = line.find(']');
    if (close == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(common::trim(line.substr(1, close - 1)));
}

} // namespace

std::string unquote(std::string_view val) {
    val = common::trim(val);
    if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') &&
        val.back() == val.front()) {
        val = val.substr(1, val.size() - 2);
    }
    return std::string(val);
}

std::filesystem::path expand_tilde(const std::string& path) {
    if (path.empty() || path.front() != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
}

std::optional<long long> parse_integer(std::string_view s) {
    s = common::trim(s);
    if (s.empty()) {
        return std::nullopt;
    }
    long long out = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return out;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    const std::string dotted = section.empty() ? std::string{} : section + "." + key;
    bool inSection = section.empty();

    for (std::string raw; std::getline(file, raw);) {
        const auto line = common::trim(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (auto header = sectionHeader(line)) {
            inSection = section.empty() || *header == section;
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        const auto k = common::trim(line.substr(0, eq));
        if ((inSection && k == key) || (!dotted.empty() && k == dotted)) {
            return unquote(dropInlineComment(common::trim(line.substr(eq + 1))));
        }
    }
    return "";
}

std::vector<std::string> parse_string_list(std::string_view raw) {
    auto s = common::trim(raw);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    std::vector<std::string> out;
    while (true) {
        const auto comma = s.find(',');
        auto token = unquote(s.substr(0, comma));
        if (!token.empty()) {
            out.push_back(std::move(token));
        }
        if (comma == std::string_view::npos) {
            break;
        }
        s.remove_prefix(comma + 1);
    }
    return out;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }
    if (const char* env = std::getenv("KEYRESCUE_CONFIG"); env && *env) {
        return env;
    }

    std::filesystem::path configHome;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        configHome = xdg;
    } else if (const char* home = std::getenv("HOME")) {
        configHome = std::filesystem::path(home) / ".config";
    } else {
        configHome = "~/.config";
    }
    return configHome / "keyrescue" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "keyrescue";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "keyrescue";
    }
    return std::filesystem::current_path() / "keyrescue_data";
}

void apply_log_level(const std::string& level) {
    std::string lvl = level;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lvl.empty()) {
        return;
    }
    if (lvl == "warning") {
        lvl = "warn";
    }
    const auto parsed = spdlog::level::from_str(lvl);
    // from_str() maps unknown names to off; only "off" itself may mean off.
    if (parsed == spdlog::level::off && lvl != "off") {
        spdlog::warn("[Config] Unknown log level '{}', keeping current level", level);
        return;
    }
    spdlog::set_level(parsed);
}

} // namespace keyrescue::config
