#include <keyrescue/common/pattern_utils.h>
#include <keyrescue/extraction/candidate_extractor.h>
#include <keyrescue/extraction/text_rules.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_set>

namespace keyrescue::extraction {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string collapseWhitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pendingSpace = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

std::string unescapeLiteral(std::string_view body, char quote) {
    std::string out;
    out.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] == '\\' && i + 1 < body.size()) {
            char next = body[i + 1];
            if (next == quote) {
                out.push_back(quote);
                ++i;
                continue;
            }
            if (next == 'n') {
                out.push_back(' ');
                ++i;
                continue;
            }
        }
        out.push_back(body[i]);
    }
    return out;
}

std::size_t countMatches(std::string_view lower, const std::vector<std::string>& needles) {
    std::size_t n = 0;
    for (const auto& needle : needles) {
        if (!needle.empty() && lower.find(needle) != std::string_view::npos) {
            ++n;
        }
    }
    return n;
}

class CandidateCollector {
public:
    explicit CandidateCollector(const ScoringContext& ctx) : ctx_(ctx) {}

    void add(std::string_view raw, CandidateSource source) {
        auto text = std::string(common::trim(raw));
        if (text.empty() || text.size() > kMaxRegexInput || seen_.count(text) > 0) {
            return;
        }
        if (!looksLikeUserText(text)) {
            return;
        }
        seen_.insert(text);
        int score = scoreCandidate(text, ctx_, sourceBonus(source));
        out_.push_back(Candidate{std::move(text), score});
    }

    std::vector<Candidate> take() {
        std::stable_sort(out_.begin(), out_.end(), [](const Candidate& a, const Candidate& b) {
            if (a.score != b.score) {
                return a.score > b.score;
            }
            return a.text.size() > b.text.size();
        });
        return std::move(out_);
    }

private:
    const ScoringContext& ctx_;
    std::unordered_set<std::string> seen_;
    std::vector<Candidate> out_;
};

template <typename Fn> void forEachLine(std::string_view content, Fn&& fn) {
    size_t start = 0;
    while (start <= content.size()) {
        size_t end = content.find('\n', start);
        fn(content.substr(start, end == std::string_view::npos ? std::string_view::npos
                                                               : end - start));
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
}

// Labeled patterns run line by line; lines over kMaxRegexInput are skipped.
void collectRegex(std::string_view content, const std::regex& re, int group,
                  CandidateSource source, CandidateCollector& collector) {
    forEachLine(content, [&](std::string_view line) {
        if (line.size() > kMaxRegexInput) {
            return;
        }
        for (std::cregex_iterator it(line.data(), line.data() + line.size(), re), end; it != end;
             ++it) {
            collector.add((*it)[group].str(), source);
        }
    });
}

void collectTagText(std::string_view content, CandidateCollector& collector) {
    size_t i = 0;
    while ((i = content.find('>', i)) != std::string_view::npos) {
        size_t j = i + 1;
        while (j < content.size() && content[j] != '<' && content[j] != '>' && content[j] != '{') {
            ++j;
        }
        if (j < content.size() && content[j] == '<' && j > i + 1) {
            collector.add(collapseWhitespace(content.substr(i + 1, j - i - 1)),
                          CandidateSource::TagText);
        }
        i = j;
    }
}

void collectTemplateLiterals(std::string_view content, CandidateCollector& collector) {
    size_t i = 0;
    while ((i = content.find('`', i)) != std::string_view::npos) {
        size_t close = content.find('`', i + 1);
        if (close == std::string_view::npos) {
            break;
        }
        if (auto normalized = normalizeTemplateLiteral(content.substr(i + 1, close - i - 1))) {
            collector.add(*normalized, CandidateSource::TemplateLiteral);
        }
        i = close + 1;
    }
}

void collectQuotedOnLine(std::string_view line, char quote, CandidateCollector& collector) {
    size_t i = 0;
    while ((i = line.find(quote, i)) != std::string_view::npos) {
        size_t j = i + 1;
        std::size_t units = 0;
        bool closed = false;
        while (j < line.size()) {
            if (line[j] == '\\' && j + 1 < line.size()) {
                j += 2;
                ++units;
                continue;
            }
            if (line[j] == quote) {
                closed = true;
                break;
            }
            ++j;
            ++units;
        }
        if (!closed) {
            ++i;
            continue;
        }
        if (units >= 3) {
            collector.add(unescapeLiteral(line.substr(i + 1, j - i - 1), quote),
                          CandidateSource::QuotedLiteral);
            i = j + 1;
        } else {
            ++i;
        }
    }
}

void collectQuotedLiterals(std::string_view content, CandidateCollector& collector) {
    static const std::regex kStyleLine(R"(className\s*=|class\s*=|style\s*=|styles\.|classes\.)");
    forEachLine(content, [&](std::string_view line) {
        if (line.size() > kMaxRegexInput) {
            spdlog::debug("[CandidateExtractor] Skipping {}-byte line", line.size());
            return;
        }
        if (!std::regex_search(line.begin(), line.end(), kStyleLine)) {
            collectQuotedOnLine(line, '"', collector);
            collectQuotedOnLine(line, '\'', collector);
        }
    });
}

} // namespace

int sourceBonus(CandidateSource source) noexcept {
    switch (source) {
        case CandidateSource::UiProp: return 5;
        case CandidateSource::CallArgument: return 6;
        case CandidateSource::ObjectProperty: return 4;
        case CandidateSource::Interpolation: return 4;
        case CandidateSource::TagText: return 2;
        case CandidateSource::TemplateLiteral: return 4;
        case CandidateSource::QuotedLiteral: return 0;
    }
    return 0;
}

int scoreCandidate(std::string_view text, const ScoringContext& ctx, int bonus) {
    static const std::regex kTerminal(R"([.!?]$)");
    static const std::regex kUiVocabulary(
        R"(\b(please|click|tap|select|enter|submit|cancel|save|delete|edit|view|loading|error|success|warning)\b)",
        std::regex::icase);
    static const std::regex kCallShape(R"(^\w+\()");
    static const std::regex kIdentifierShape(R"(^[a-z][a-zA-Z0-9]*$)");

    int score = bonus;
    const auto lower = toLower(text);
    score += 10 * static_cast<int>(countMatches(lower, ctx.hintWords));
    score += 3 * static_cast<int>(countMatches(lower, ctx.placeholderHints));

    if (!text.empty() && std::isupper(static_cast<unsigned char>(text.front()))) {
        score += 2;
    }
    const bool regexSafe = text.size() <= kMaxRegexInput;
    if (regexSafe && std::regex_search(text.begin(), text.end(), kTerminal)) {
        score += 2;
    }
    if (text.find(' ') != std::string_view::npos) {
        score += 1;
    }
    if (countWords(text) >= 3) {
        score += 2;
    }
    if (text.size() >= 5 && text.size() <= 150) {
        score += 2;
    }
    if (regexSafe && std::regex_search(text.begin(), text.end(), kUiVocabulary)) {
        score += 3;
    }
    if (regexSafe && (std::regex_search(text.begin(), text.end(), kCallShape) ||
                      std::regex_match(text.begin(), text.end(), kIdentifierShape))) {
        score -= 5;
    }
    return score;
}

std::vector<Candidate> extractCandidates(std::string_view content, const ScoringContext& ctx) {
    static const std::regex kUiProps(
        R"(\b(title|placeholder|alt|label|message|description|header|tooltip|aria-label|aria-description|buttonText|submitText|cancelText|confirmText|errorText|helperText)\s*=\s*["']([^"']+)["'])",
        std::regex::icase);
    static const std::regex kCallArguments(
        R"((?:showMessage|showError|showSuccess|toast|alert|confirm|notify|setError|setMessage|setTitle)(?:\.\w+)?\s*\(\s*["']([^"']+)["'])",
        std::regex::icase);
    static const std::regex kObjectProperties(
        R"(\b(?:text|label|title|message|description|placeholder|content|header|tooltip|buttonText|errorMessage|successMessage)\s*:\s*["']([^"']+)["'])",
        std::regex::icase);
    static const std::regex kInterpolation(R"(\{\{\s*['"]([^'"{}]+)['"]\s*\}\})");

    CandidateCollector collector(ctx);

    collectRegex(content, kUiProps, 2, CandidateSource::UiProp, collector);
    collectRegex(content, kCallArguments, 1, CandidateSource::CallArgument, collector);
    collectRegex(content, kObjectProperties, 1, CandidateSource::ObjectProperty, collector);
    collectRegex(content, kInterpolation, 1, CandidateSource::Interpolation, collector);
    collectTagText(content, collector);
    collectTemplateLiterals(content, collector);
    collectQuotedLiterals(content, collector);

    return collector.take();
}

std::optional<std::string> normalizeTemplateLiteral(std::string_view body) {
    std::string out;
    std::string staticText;
    int counter = 0;
    size_t i = 0;
    while (i < body.size()) {
        if (body[i] == '$' && i + 1 < body.size() && body[i + 1] == '{') {
            // Skip to the matching brace, allowing nested braces in the expression.
            int depth = 0;
            size_t j = i + 1;
            for (; j < body.size(); ++j) {
                if (body[j] == '{') {
                    ++depth;
                } else if (body[j] == '}' && --depth == 0) {
                    break;
                }
            }
            out += "{value" + std::to_string(++counter) + "}";
            i = (j < body.size()) ? j + 1 : body.size();
            continue;
        }
        out.push_back(body[i]);
        staticText.push_back(body[i]);
        ++i;
    }

    bool hasLetter = std::any_of(staticText.begin(), staticText.end(),
                                 [](unsigned char c) { return std::isalpha(c) != 0; });
    if (!hasLetter) {
        return std::nullopt;
    }
    return collapseWhitespace(out);
}

bool hasSignal(std::string_view text, const ScoringContext& ctx) {
    const auto lower = toLower(text);
    return countMatches(lower, ctx.hintWords) > 0 || countMatches(lower, ctx.placeholderHints) > 0;
}

bool isKeyLike(std::string_view text) {
    if (text.find('.') == std::string_view::npos) {
        return false;
    }
    return std::none_of(text.begin(), text.end(),
                        [](unsigned char c) { return std::isspace(c) != 0; });
}

bool meetsHintQuota(std::string_view text, const ScoringContext& ctx) {
    static const std::regex kPlaceholder(R"(\{[a-zA-Z_][a-zA-Z0-9_]*\})");

    const auto lower = toLower(text);
    const auto hintMatches = countMatches(lower, ctx.hintWords);
    const auto placeholderMatches = countMatches(lower, ctx.placeholderHints);
    const bool anyPlaceholder =
        text.size() <= kMaxRegexInput && std::regex_search(text.begin(), text.end(), kPlaceholder);

    const std::size_t hints = ctx.hintWords.size();
    const std::size_t target = hints >= 3 ? (hints * 6 + 9) / 10 : 1;
    if (hintMatches >= target) {
        return true;
    }
    return hints >= 2 && hintMatches + 1 >= target && (placeholderMatches > 0 || anyPlaceholder);
}

bool isAcceptable(std::string_view raw, const ScoringContext& ctx) {
    static const std::regex kPlaceholderStart(R"(\{[a-zA-Z_])");

    const auto text = common::trim(raw);
    if (text.empty() || text.size() > 160) {
        return false;
    }
    if (text.find('\n') != std::string_view::npos) {
        return false;
    }
    if (isKeyLike(text)) {
        return false;
    }
    const bool hasWhitespace = std::any_of(text.begin(), text.end(),
                                           [](unsigned char c) { return std::isspace(c) != 0; });
    if (!hasWhitespace && !std::regex_search(text.begin(), text.end(), kPlaceholderStart)) {
        return false;
    }
    if (!hasSignal(text, ctx)) {
        return false;
    }
    return meetsHintQuota(text, ctx);
}

} // namespace keyrescue::extraction
