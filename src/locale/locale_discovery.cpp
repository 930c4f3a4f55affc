#include <keyrescue/locale/locale_discovery.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace keyrescue::locale {

namespace {

namespace fs = std::filesystem;

bool isJsonFile(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_regular_file(ec) && entry.path().extension() == ".json";
}

std::vector<fs::directory_entry> sortedEntries(const fs::path& dir) {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        spdlog::debug("[LocaleDiscovery] Cannot list {}: {}", dir.string(), ec.message());
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });
    return entries;
}

} // namespace

std::vector<LocaleFileInfo> discoverLocaleFiles(const std::filesystem::path& workspace,
                                                const std::vector<std::string>& roots) {
    std::vector<LocaleFileInfo> files;
    for (const auto& root : roots) {
        const auto base = workspace / root;
        std::error_code ec;
        if (!fs::is_directory(base, ec)) {
            continue;
        }

        for (const auto& entry : sortedEntries(base)) {
            if (entry.is_directory(ec)) {
                const auto locale = entry.path().filename().string();
                for (const auto& file : sortedEntries(entry.path())) {
                    if (!isJsonFile(file)) {
                        continue;
                    }
                    LocaleFileInfo info;
                    info.path = file.path();
                    info.relativePath = fs::relative(file.path(), workspace, ec).generic_string();
                    info.locale = locale;
                    info.fileName = file.path().filename().string();
                    files.push_back(std::move(info));
                }
            } else if (isJsonFile(entry)) {
                LocaleFileInfo info;
                info.path = entry.path();
                info.relativePath = fs::relative(entry.path(), workspace, ec).generic_string();
                info.locale = entry.path().stem().string();
                info.fileName = entry.path().filename().string();
                files.push_back(std::move(info));
            }
        }
    }
    spdlog::debug("[LocaleDiscovery] {} locale files under {}", files.size(), workspace.string());
    return files;
}

} // namespace keyrescue::locale
