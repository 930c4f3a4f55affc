#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyrescue::locale {

/// Dot-separated segments with empty segments dropped ("a..b." -> {a, b}).
std::vector<std::string> splitKeySegments(std::string_view key);

/// Canonical dotted form, or nullopt when no segment remains.
std::optional<std::string> normalizeKey(std::string_view key);

/**
 * @brief Alternate paths under which the same string may be stored.
 *
 * Order: full path, minus first segment, minus first two segments, last
 * segment, last two segments. Duplicates are dropped keeping the first
 * occurrence; "a.b.c" yields {"a.b.c", "b.c", "c"}.
 */
std::vector<std::string> getKeyPathVariations(std::string_view key);

} // namespace keyrescue::locale
