#include <keyrescue/extraction/text_analysis.h>
#include <keyrescue/extraction/text_rules.h>
#include <keyrescue/locale/translation_key.h>

#include <algorithm>
#include <cctype>

namespace keyrescue::extraction {

namespace {

std::string lastSegment(std::string_view key) {
    auto parts = locale::splitKeySegments(key);
    return parts.empty() ? std::string{} : parts.back();
}

// "invalidCredentials_hint-x" -> "invalid Credentials hint x"
std::string separateWords(std::string_view segment) {
    std::string out;
    out.reserve(segment.size() + 8);
    for (size_t i = 0; i < segment.size(); ++i) {
        char c = segment[i];
        if (c == '_' || c == '-') {
            out.push_back(' ');
            continue;
        }
        if (i > 0 && std::isupper(static_cast<unsigned char>(c)) &&
            std::islower(static_cast<unsigned char>(segment[i - 1]))) {
            out.push_back(' ');
        }
        out.push_back(c);
    }
    return out;
}

std::vector<std::string> splitSpaces(const std::string& s) {
    std::vector<std::string> out;
    std::string current;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                out.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        out.push_back(std::move(current));
    }
    return out;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::size_t computeEditDistance(std::string_view a, std::string_view b) {
    const size_t m = a.size();
    const size_t n = b.size();
    if (m == 0)
        return n;
    if (n == 0)
        return m;

    std::vector<size_t> dp(n + 1);
    for (size_t j = 0; j <= n; ++j)
        dp[j] = j;
    for (size_t i = 1; i <= m; ++i) {
        size_t prev = dp[0];
        dp[0] = i;
        for (size_t j = 1; j <= n; ++j) {
            size_t temp = dp[j];
            if (a[i - 1] == b[j - 1]) {
                dp[j] = prev;
            } else {
                dp[j] = 1 + std::min({dp[j - 1], dp[j], prev});
            }
            prev = temp;
        }
    }
    return dp[n];
}

std::vector<std::string> extractHintWords(std::string_view key) {
    std::vector<std::string> hints;
    for (auto& word : splitSpaces(toLower(separateWords(lastSegment(key))))) {
        if (word.size() > 2 && std::find(hints.begin(), hints.end(), word) == hints.end()) {
            hints.push_back(std::move(word));
        }
    }
    return hints;
}

std::vector<std::string> extractPlaceholderHints(std::string_view source, std::string_view key) {
    static const std::regex kIdentifier(R"(^[a-zA-Z_][a-zA-Z0-9_]*$)");
    // Only the call prefix goes through std::regex; the options body is found by hand.
    const std::regex prefix(R"(\bt\(\s*['"])" + escapeRegex(key) + R"(['"]\s*,\s*\{)");

    std::vector<std::string> hints;
    for (std::cregex_iterator it(source.data(), source.data() + source.size(), prefix), end;
         it != end; ++it) {
        const auto open = static_cast<size_t>(it->position(0) + it->length(0));
        const auto close = source.find('}', open);
        if (close == std::string_view::npos || close == open) {
            continue;
        }
        const std::string_view body = source.substr(open, close - open);
        size_t start = 0;
        while (start <= body.size()) {
            size_t pos = body.find_first_of(":,", start);
            std::string token(
                body.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
            auto first = token.find_first_not_of(" \t\r\n");
            auto last = token.find_last_not_of(" \t\r\n");
            token = first == std::string::npos ? std::string{}
                                               : token.substr(first, last - first + 1);
            if (token.size() <= kMaxRegexInput && std::regex_match(token, kIdentifier)) {
                auto lower = toLower(token);
                if (std::find(hints.begin(), hints.end(), lower) == hints.end()) {
                    hints.push_back(std::move(lower));
                }
            }
            if (pos == std::string_view::npos)
                break;
            start = pos + 1;
        }
    }
    return hints;
}

std::string buildLabelFromKeySegment(std::string_view keyOrSegment) {
    auto parts = splitSpaces(separateWords(lastSegment(keyOrSegment)));
    std::string label;
    for (size_t i = 0; i < parts.size(); ++i) {
        auto lower = toLower(parts[i]);
        if (i == 0) {
            lower[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(lower[0])));
        } else {
            label.push_back(' ');
        }
        label += lower;
    }
    return label;
}

std::string escapeRegex(std::string_view text) {
    static constexpr std::string_view kSpecial = R"(.*+?^${}()|[]\/)";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (kSpecial.find(c) != std::string_view::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::regex translationCallPattern(std::string_view key) {
    return std::regex(R"(\b\$?t\(\s*['"])" + escapeRegex(key) + R"(['"])");
}

} // namespace keyrescue::extraction
