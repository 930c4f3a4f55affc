#include <keyrescue/extraction/text_rules.h>
#include <keyrescue/recovery/value_checks.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace keyrescue::recovery {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isLabelishKey(std::string_view key) {
    for (std::string_view marker : {".label.", ".button.", ".title.", ".heading.", ".placeholder."}) {
        if (key.find(marker) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

const char* suspicionToString(SuspicionReason reason) noexcept {
    switch (reason) {
        case SuspicionReason::None: return "none";
        case SuspicionReason::Empty: return "empty";
        case SuspicionReason::EqualsKey: return "equals key";
        case SuspicionReason::DottedIdentifier: return "dotted identifier";
        case SuspicionReason::UnresolvedPlaceholder: return "unresolved placeholder";
        case SuspicionReason::LabelTooLong: return "label too long";
    }
    return "unknown";
}

std::vector<std::string> placeholderNames(std::string_view value) {
    static const std::regex kPlaceholder(R"(\{([a-zA-Z_][a-zA-Z0-9_]*)\})");
    std::vector<std::string> names;
    const std::string text(value);
    for (std::sregex_iterator it(text.begin(), text.end(), kPlaceholder), end; it != end; ++it) {
        auto name = (*it)[1].str();
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(std::move(name));
        }
    }
    return names;
}

SuspicionReason checkValue(std::string_view key, std::string_view value,
                           const std::optional<std::set<std::string>>& knownOptionNames) {
    static const std::regex kDottedIdentifier(R"(^[A-Za-z0-9_]+(\.[A-Za-z0-9_\-]+)+$)");

    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return SuspicionReason::Empty;
    }
    auto last = value.find_last_not_of(" \t\r\n");
    const auto trimmed = value.substr(first, last - first + 1);

    if (trimmed == key) {
        return SuspicionReason::EqualsKey;
    }
    if (trimmed.size() <= extraction::kMaxRegexInput &&
        std::regex_match(trimmed.begin(), trimmed.end(), kDottedIdentifier)) {
        return SuspicionReason::DottedIdentifier;
    }
    if (isLabelishKey(key) && extraction::countWords(trimmed) >= 10) {
        return SuspicionReason::LabelTooLong;
    }
    if (knownOptionNames) {
        std::set<std::string> known;
        for (const auto& n : *knownOptionNames) {
            known.insert(toLower(n));
        }
        for (const auto& name : placeholderNames(trimmed)) {
            if (known.count(toLower(name)) == 0) {
                return SuspicionReason::UnresolvedPlaceholder;
            }
        }
    }
    return SuspicionReason::None;
}

bool hasExtractionArtifact(std::string_view value) {
    static const std::regex kValidPlaceholder(R"(\{[a-zA-Z_][a-zA-Z0-9_]*\})");
    static const std::regex kBareValueToken(R"(\b[Vv]alue\d+\b)");
    static const std::regex kFieldNoun(
        R"(\b(Count|Total|Name|Value|Item|User|Email|Date|Time|Status|Type|Id)\b)");
    static const std::regex kAdjacentCapitalized(R"([A-Z][a-z]+\s+[A-Z][a-z]+)");

    if (value.size() > extraction::kMaxRegexInput) {
        return false;
    }
    const std::string text(value);
    const auto withoutPlaceholders = std::regex_replace(text, kValidPlaceholder, "");
    if (std::regex_search(withoutPlaceholders, kBareValueToken)) {
        return true;
    }
    return std::regex_search(text, kFieldNoun) && std::regex_search(text, kAdjacentCapitalized);
}

} // namespace keyrescue::recovery
