#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace keyrescue::extraction {

/// Levenshtein distance (single-row DP).
std::size_t computeEditDistance(std::string_view a, std::string_view b);

/**
 * @brief Lowercase relevance hints from the key's last segment.
 *
 * camelCase is split, '_' and '-' become separators, tokens of length <= 2 are
 * dropped: "auth.errors.invalidCredentials" -> {"invalid", "credentials"}.
 */
std::vector<std::string> extractHintWords(std::string_view key);

/**
 * @brief Option names passed alongside @p key at translation call sites in @p source.
 *
 * For `t('cart.total', { count: n, currency })` returns {"count", "n", "currency"}
 * (identifier tokens only, lowercased, de-duplicated).
 */
std::vector<std::string> extractPlaceholderHints(std::string_view source, std::string_view key);

/// "user_profile" or "a.b.userProfile" -> "User profile".
std::string buildLabelFromKeySegment(std::string_view keyOrSegment);

std::string escapeRegex(std::string_view text);

/// Matches `t('key'`, `t("key"`, `$t('key'` and `$t("key"` with optional whitespace.
std::regex translationCallPattern(std::string_view key);

} // namespace keyrescue::extraction
