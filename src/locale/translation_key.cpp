#include <keyrescue/locale/translation_key.h>

#include <algorithm>

namespace keyrescue::locale {

namespace {

std::string joinSegments(const std::vector<std::string>& parts, size_t first, size_t last) {
    std::string out;
    for (size_t i = first; i < last; ++i) {
        if (!out.empty()) {
            out += '.';
        }
        out += parts[i];
    }
    return out;
}

} // namespace

std::vector<std::string> splitKeySegments(std::string_view key) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= key.size()) {
        size_t pos = key.find('.', start);
        auto seg = key.substr(start, pos == std::string_view::npos ? std::string_view::npos
                                                                   : pos - start);
        while (!seg.empty() && (seg.front() == ' ' || seg.front() == '\t'))
            seg.remove_prefix(1);
        while (!seg.empty() && (seg.back() == ' ' || seg.back() == '\t'))
            seg.remove_suffix(1);
        if (!seg.empty()) {
            parts.emplace_back(seg);
        }
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return parts;
}

std::optional<std::string> normalizeKey(std::string_view key) {
    auto parts = splitKeySegments(key);
    if (parts.empty()) {
        return std::nullopt;
    }
    return joinSegments(parts, 0, parts.size());
}

std::vector<std::string> getKeyPathVariations(std::string_view key) {
    auto parts = splitKeySegments(key);
    if (parts.empty()) {
        return {};
    }

    const size_t n = parts.size();
    std::vector<std::string> raw;
    raw.push_back(joinSegments(parts, 0, n));
    if (n > 1) {
        raw.push_back(joinSegments(parts, 1, n));
    }
    if (n > 2) {
        raw.push_back(joinSegments(parts, 2, n));
    }
    raw.push_back(parts.back());
    if (n > 2) {
        raw.push_back(joinSegments(parts, n - 2, n));
    }

    std::vector<std::string> out;
    for (auto& v : raw) {
        if (std::find(out.begin(), out.end(), v) == out.end()) {
            out.push_back(std::move(v));
        }
    }
    return out;
}

} // namespace keyrescue::locale
