#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace keyrescue::recovery {

/// Why a resolved value is not trusted; None means it looks usable.
enum class SuspicionReason {
    None,
    Empty,
    EqualsKey,
    DottedIdentifier,
    UnresolvedPlaceholder,
    LabelTooLong,
};

const char* suspicionToString(SuspicionReason reason) noexcept;

/// Placeholder names ({name}) appearing in @p value, in order of first appearance.
std::vector<std::string> placeholderNames(std::string_view value);

/**
 * @brief Sanity check for a resolved translation value.
 *
 * @param knownOptionNames option names passed at the call site. When provided,
 *        every {placeholder} in the value must be among them (case-insensitive);
 *        when nullopt, placeholders are not checked.
 */
SuspicionReason checkValue(std::string_view key, std::string_view value,
                           const std::optional<std::set<std::string>>& knownOptionNames);

/**
 * @brief Caller-facing variant: without known option names, any placeholder is suspicious.
 */
inline bool isSuspiciousValue(std::string_view key, std::string_view value,
                              const std::optional<std::set<std::string>>& knownOptionNames) {
    return checkValue(key, value, knownOptionNames.value_or(std::set<std::string>{})) !=
           SuspicionReason::None;
}

/**
 * @brief Signs that the value came from a bad automated extraction:
 * "value1"-style tokens outside braces, or field nouns (Count, Name, ...)
 * alongside adjacent Capitalized words ("Total Count items").
 * Values longer than extraction::kMaxRegexInput are not inspected.
 */
bool hasExtractionArtifact(std::string_view value);

} // namespace keyrescue::recovery
