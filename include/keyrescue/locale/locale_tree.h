#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace keyrescue::locale {

/// Locale file content; key order is preserved across read and write.
using LocaleTree = nlohmann::ordered_json;

/// Parse locale JSON. Returns nullopt on syntax errors or when the root is not an object.
std::optional<LocaleTree> parseLocaleTree(std::string_view text);

/**
 * @brief String leaf at dotted @p key.
 *
 * Nested objects are walked first; a flat entry stored under the literal
 * dotted key is used as a fallback. Non-string leaves yield nullopt.
 */
std::optional<std::string> getNestedValue(const LocaleTree& tree, std::string_view key);

/// Set the string leaf at @p key, creating intermediate objects. False if a non-object blocks the path.
bool setNestedValue(LocaleTree& tree, std::string_view key, std::string value);

/// Two-space indented JSON with a trailing newline.
std::string serializeLocaleTree(const LocaleTree& tree);

} // namespace keyrescue::locale
