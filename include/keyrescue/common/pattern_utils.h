#pragma once

#include <ranges>
#include <string>
#include <string_view>
#include <utility>

namespace keyrescue::common {

template <class T>
concept StringLike = requires(T&& t) { std::string_view{std::forward<T>(t)}; };

/**
 * @brief Shell-style wildcard match ('?' one character, '*' any run).
 *
 * Case-sensitive. Backtracks to the last '*' on mismatch instead of recursing.
 */
[[nodiscard]] inline constexpr bool wildcard_match(std::string_view text,
                                                   std::string_view pattern) noexcept {
    std::size_t ti = 0;
    std::size_t pi = 0;
    std::size_t lastStar = std::string_view::npos;
    std::size_t resumeAt = 0;

    while (ti < text.size()) {
        const bool inPattern = pi < pattern.size();
        if (inPattern && (pattern[pi] == '?' || pattern[pi] == text[ti])) {
            ++ti;
            ++pi;
        } else if (inPattern && pattern[pi] == '*') {
            lastStar = pi++;
            resumeAt = ti;
        } else if (lastStar != std::string_view::npos) {
            pi = lastStar + 1;
            ti = ++resumeAt;
        } else {
            return false;
        }
    }
    while (pi < pattern.size() && pattern[pi] == '*') {
        ++pi;
    }
    return pi == pattern.size();
}

template <std::ranges::input_range Range>
requires StringLike<std::ranges::range_value_t<Range>>
[[nodiscard]] inline bool matches_any(std::string_view text, const Range& patterns) noexcept {
    for (const auto& pattern : patterns) {
        if (wildcard_match(text, std::string_view{pattern})) {
            return true;
        }
    }
    return false;
}

/// Source-glob check: "*.vue" matches by file name, "src/*.ts" by relative path.
template <std::ranges::input_range Range>
requires StringLike<std::ranges::range_value_t<Range>>
[[nodiscard]] inline bool matches_file(std::string_view relativePath, const Range& globs) noexcept {
    const auto slash = relativePath.rfind('/');
    const auto name =
        slash == std::string_view::npos ? relativePath : relativePath.substr(slash + 1);
    return matches_any(name, globs) || matches_any(relativePath, globs);
}

[[nodiscard]] inline constexpr bool is_blank(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_blank(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_blank(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace keyrescue::common
