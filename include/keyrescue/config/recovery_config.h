#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace keyrescue::config {

/**
 * @brief Tunables for the recovery engine.
 *
 * Resolution order for every field: environment override, then the TOML file
 * from get_config_path(), then the defaults below.
 */
struct RecoveryConfig {
    struct Recovery {
        int daysBack = 120;
        std::size_t maxCommitsPerFile = 15;
        std::size_t sourceMaxCommits = 30;
        std::size_t historyBatchLimit = 100;
        std::size_t parallelWidth = 5;
    } recovery;

    struct Locales {
        std::vector<std::string> roots = {"resources/js/i18n/auto", "src/i18n", "src/locales",
                                          "locales", "i18n"};
    } locales;

    struct Sources {
        std::vector<std::string> globs = {"*.ts", "*.tsx", "*.js", "*.jsx", "*.vue"};
        std::vector<std::string> excludes = {"node_modules", ".git", "dist", "build"};
        std::size_t maxFiles = 500;
        std::size_t readBatch = 20;
    } sources;

    struct Git {
        std::string executable = "git";
        std::chrono::milliseconds timeout{30'000};
        std::size_t maxOutputBytes = 10 * 1024 * 1024;
    } git;

    struct Locks {
        std::chrono::milliseconds lockTimeout{5 * 60 * 1000};
        std::chrono::milliseconds fileLockTimeout{30'000};
        std::chrono::milliseconds fileWriteDelay{50};
        std::chrono::milliseconds waitTimeout{30'000};
    } locks;

    std::string logLevel = "info";
};

/**
 * @brief Load configuration from @p configPath (or the standard location when empty).
 *
 * A missing file yields the defaults; malformed numeric values are logged and ignored.
 */
RecoveryConfig loadRecoveryConfig(const std::filesystem::path& configPath = {});

} // namespace keyrescue::config
