#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyrescue::extraction {

/// A span of text judged to be human-readable, with its relevance score.
struct Candidate {
    std::string text;
    int score = 0;
};

/// Where a candidate was found; decides its source bonus.
enum class CandidateSource {
    UiProp,          ///< title="...", aria-label="...", placeholder="..."
    CallArgument,    ///< toast("..."), setError('...')
    ObjectProperty,  ///< { message: "..." }
    Interpolation,   ///< {{ '...' }}
    TagText,         ///< >...<
    TemplateLiteral, ///< `Hello ${name}`
    QuotedLiteral,   ///< any "..." or '...'
};

int sourceBonus(CandidateSource source) noexcept;

/**
 * @brief Hints scoring is computed against.
 *
 * hintWords come from the key (see extractHintWords); placeholderHints are the
 * option names seen at the key's call sites (see extractPlaceholderHints).
 */
struct ScoringContext {
    std::vector<std::string> hintWords;
    std::vector<std::string> placeholderHints;
};

/**
 * @brief Additive relevance score.
 *
 *  +10 per hint word contained, +3 per placeholder hint contained,
 *  +2 capital start, +2 terminal punctuation, +1 space, +2 more for 3+ words,
 *  +2 length in [5,150], +3 UI vocabulary, -5 call/identifier shape, + bonus.
 */
int scoreCandidate(std::string_view text, const ScoringContext& ctx, int bonus = 0);

/**
 * @brief Every human-readable string in @p content, best first.
 *
 * Labeled sources (UI props, call arguments, object properties) are scanned
 * before generic literals; the first occurrence of a text wins. Ties on score
 * are broken by longer text first.
 */
std::vector<Candidate> extractCandidates(std::string_view content, const ScoringContext& ctx);

/**
 * @brief Static text of a template literal body.
 *
 * `${expr}` becomes {value1}, {value2}, ... and whitespace is collapsed.
 * Returns nullopt if nothing alphabetic remains outside placeholders.
 */
std::optional<std::string> normalizeTemplateLiteral(std::string_view body);

/// Contains a hint word or a placeholder hint.
bool hasSignal(std::string_view text, const ScoringContext& ctx);

/// Dotted and without whitespace ("auth.errors.x").
bool isKeyLike(std::string_view text);

/// Hint-word quota: ceil(0.6 * hints) for 3+ hints, else 1; one less with placeholders present.
bool meetsHintQuota(std::string_view text, const ScoringContext& ctx);

/**
 * @brief Final gate for diff-derived candidates.
 *
 * Length <= 160, single line, not key-like, contains whitespace or a
 * placeholder, has signal and meets the hint quota.
 */
bool isAcceptable(std::string_view text, const ScoringContext& ctx);

} // namespace keyrescue::extraction
