#pragma once

#include <cstddef>
#include <span>
#include <string_view>

namespace keyrescue::extraction {

// Safety limit: std::regex recurses per matched character, so longer lines and
// texts are never handed to it. Over-long text is treated as not user-facing.
inline constexpr std::size_t kMaxRegexInput = 4096;

enum class Verdict { Accept, Reject, Abstain };

/// Outcome of the rule that decided (or "default" when every rule abstained).
struct RuleVerdict {
    Verdict verdict;
    std::string_view rule;
};

/**
 * @brief A named predicate over trimmed text.
 *
 * Rules are evaluated in priority order; the first one that does not abstain
 * decides whether the text is human-readable.
 */
struct TextRule {
    std::string_view name;
    Verdict (*evaluate)(std::string_view text);
};

/// Tailwind-style utility classes, hyphenated tokens, breakpoint prefixes.
/// False for text longer than kMaxRegexInput.
bool isCssClassLike(std::string_view text);

/// Identifiers, URLs, paths, bare placeholders, colors, numbers, event handler names, ...
/// Text longer than kMaxRegexInput counts as code.
bool isCodePatternLike(std::string_view text);

/// Signals that make a single token read as UI text (capital start, punctuation, vocabulary, ...).
/// False for text longer than kMaxRegexInput.
bool isUserTextLike(std::string_view text);

/// Word count over whitespace-separated tokens.
std::size_t countWords(std::string_view text);

/// The ordered rule list used by classifyText().
std::span<const TextRule> userTextRules();

/// Fold over userTextRules(); text is trimmed first. Text longer than
/// kMaxRegexInput is rejected as "tooLong" before any rule runs.
RuleVerdict classifyText(std::string_view text);

inline bool looksLikeUserText(std::string_view text) {
    return classifyText(text).verdict == Verdict::Accept;
}

} // namespace keyrescue::extraction
