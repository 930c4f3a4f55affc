#include <keyrescue/config/config_helpers.h>
#include <keyrescue/config/recovery_config.h>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace keyrescue::config {

namespace {

template <typename T>
void applyInteger(const std::filesystem::path& path, const char* section, const char* key,
                  const char* envName, T& target) {
    std::string raw;
    if (envName) {
        if (const char* env = std::getenv(envName); env && *env) {
            raw = env;
        }
    }
    if (raw.empty()) {
        raw = parse_config_value(path, section, key);
    }
    if (raw.empty()) {
        return;
    }
    auto parsed = parse_integer(raw);
    if (!parsed || *parsed < 0) {
        spdlog::warn("[Config] Ignoring invalid value '{}' for {}.{}", raw, section, key);
        return;
    }
    target = static_cast<T>(*parsed);
}

void applyDuration(const std::filesystem::path& path, const char* section, const char* key,
                   std::chrono::milliseconds& target) {
    auto raw = parse_config_value(path, section, key);
    if (raw.empty()) {
        return;
    }
    auto parsed = parse_ms(raw, std::chrono::milliseconds{-1});
    if (parsed.count() < 0) {
        spdlog::warn("[Config] Ignoring invalid duration '{}' for {}.{}", raw, section, key);
        return;
    }
    target = parsed;
}

void applyList(const std::filesystem::path& path, const char* section, const char* key,
               std::vector<std::string>& target) {
    auto raw = parse_config_value(path, section, key);
    if (raw.empty()) {
        return;
    }
    auto values = parse_string_list(raw);
    if (!values.empty()) {
        target = std::move(values);
    }
}

} // namespace

RecoveryConfig loadRecoveryConfig(const std::filesystem::path& configPath) {
    RecoveryConfig cfg;
    const auto path = configPath.empty() ? get_config_path() : configPath;
    if (!std::filesystem::exists(path)) {
        spdlog::debug("[Config] No config file at {}, using defaults", path.string());
    }

    applyInteger(path, "recovery", "days_back", "KEYRESCUE_DAYS_BACK", cfg.recovery.daysBack);
    applyInteger(path, "recovery", "max_commits_per_file", "KEYRESCUE_MAX_COMMITS",
                 cfg.recovery.maxCommitsPerFile);
    applyInteger(path, "recovery", "source_max_commits", nullptr, cfg.recovery.sourceMaxCommits);
    applyInteger(path, "recovery", "history_batch_limit", nullptr,
                 cfg.recovery.historyBatchLimit);
    applyInteger(path, "recovery", "parallel_width", nullptr, cfg.recovery.parallelWidth);
    if (cfg.recovery.parallelWidth == 0) {
        cfg.recovery.parallelWidth = 1;
    }

    applyList(path, "locales", "roots", cfg.locales.roots);

    applyList(path, "sources", "globs", cfg.sources.globs);
    applyList(path, "sources", "excludes", cfg.sources.excludes);
    applyInteger(path, "sources", "max_files", nullptr, cfg.sources.maxFiles);

    if (const char* env = std::getenv("KEYRESCUE_GIT"); env && *env) {
        cfg.git.executable = env;
    } else if (auto exe = parse_config_value(path, "git", "executable"); !exe.empty()) {
        cfg.git.executable = expand_tilde(exe).string();
    }
    applyDuration(path, "git", "timeout_ms", cfg.git.timeout);
    applyInteger(path, "git", "max_output_bytes", nullptr, cfg.git.maxOutputBytes);

    applyDuration(path, "locks", "lock_timeout_ms", cfg.locks.lockTimeout);
    applyDuration(path, "locks", "file_lock_timeout_ms", cfg.locks.fileLockTimeout);
    applyDuration(path, "locks", "file_write_delay_ms", cfg.locks.fileWriteDelay);
    applyDuration(path, "locks", "wait_timeout_ms", cfg.locks.waitTimeout);

    if (auto level = parse_config_value(path, "log", "level"); !level.empty()) {
        cfg.logLevel = level;
        apply_log_level(cfg.logLevel);
    }
    return cfg;
}

} // namespace keyrescue::config
