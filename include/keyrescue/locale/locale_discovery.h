#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace keyrescue::locale {

struct LocaleFileInfo {
    std::filesystem::path path; ///< Absolute path on disk
    std::string relativePath;   ///< Workspace-relative, forward slashes
    std::string locale;         ///< "en", "fr", ...
    std::string fileName;       ///< "auth.json"
};

/**
 * @brief Find locale JSON files under the given roots.
 *
 * Recognizes `<root>/<locale>/<name>.json` (grouped by locale) and
 * `<root>/<locale>.json` (single file per locale). Roots that do not exist
 * are skipped. Results are sorted by root order, then locale, then file name.
 */
std::vector<LocaleFileInfo> discoverLocaleFiles(const std::filesystem::path& workspace,
                                                const std::vector<std::string>& roots);

} // namespace keyrescue::locale
