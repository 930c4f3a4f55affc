#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <keyrescue/concurrency/cancellation.h>
#include <keyrescue/config/recovery_config.h>
#include <keyrescue/core/types.h>
#include <keyrescue/history/version_history_source.h>
#include <keyrescue/recovery/locale_snapshot_cache.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace keyrescue::recovery {

/**
 * @brief A recovered value and where it came from.
 *
 * source is one of: ref:<commit>, head, head:<locale>, history:<commit>,
 * history:<locale>:<commit>, diff:<without>..<with>, source:<commit>:<relpath>.
 */
struct RecoveryResult {
    std::string value;
    std::string source;

    bool operator==(const RecoveryResult& other) const {
        return value == other.value && source == other.source;
    }
};

struct RecoveryOptions {
    std::optional<int> daysBack;               ///< Defaults to recovery.days_back
    std::optional<std::size_t> maxCommits;     ///< Per locale file; recovery.max_commits_per_file
    std::optional<CommitHash> extractRef;      ///< Commit taken just before key extraction
    std::optional<std::set<std::string>> callOptionNames; ///< Options passed at the t() call
    std::shared_ptr<CancellationToken> cancel;
};

/**
 * @brief Phased search for the human-readable value of translation keys.
 *
 * Phases, stopping at the first hit per key:
 *  1. session cache
 *  2. extraction-reference commit (target locale)
 *  3. HEAD, target locale
 *  4. HEAD, other locales
 *  5. history, target locale
 *  6. history, other locales
 *  7. source files: diffs of translation-related commits, the diff that introduced
 *     the t() call, the snapshot before it, then the best match in any commit
 *     without the call
 *
 * Neither entry point throws; keys that cannot be recovered map to std::nullopt.
 * Results are cached per (normalized workspace, locale, key) until clearCache().
 */
class RecoveryPipeline {
public:
    RecoveryPipeline(std::shared_ptr<history::IVersionHistorySource> history,
                     config::RecoveryConfig config,
                     boost::asio::any_io_executor blockingExecutor);

    boost::asio::awaitable<std::optional<RecoveryResult>>
    recover(std::filesystem::path workspace, std::string localeName, std::string key,
            RecoveryOptions options = {});

    /// Every key of @p keys appears in the result map.
    boost::asio::awaitable<std::map<std::string, std::optional<RecoveryResult>>>
    recoverBatch(std::filesystem::path workspace, std::vector<std::string> keys,
                 std::string localeName, RecoveryOptions options = {});

    /// Drops session results and every workspace snapshot.
    void clearCache();

    std::size_t cachedResultCount() const;

    SnapshotCacheRegistry& snapshots() noexcept { return registry_; }

private:
    std::optional<RecoveryResult> cachedResult(const std::string& cacheKey) const;
    void storeResult(const std::string& cacheKey, const RecoveryResult& result);

    config::RecoveryConfig config_;
    SnapshotCacheRegistry registry_;

    mutable std::mutex cacheMutex_;
    std::unordered_map<std::string, RecoveryResult> sessionCache_;
};

} // namespace keyrescue::recovery
