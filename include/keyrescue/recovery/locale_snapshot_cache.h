#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <keyrescue/config/recovery_config.h>
#include <keyrescue/core/async_event.h>
#include <keyrescue/core/types.h>
#include <keyrescue/history/version_history_source.h>
#include <keyrescue/locale/locale_discovery.h>
#include <keyrescue/locale/locale_tree.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace keyrescue::recovery {

/**
 * @brief Memoized view of one workspace's locale files, their history and the
 * source-file key index.
 *
 * Every lookup result is cached, including failures (a null pointer), so each
 * (path, commit) pair is fetched at most once per session. Blocking file I/O
 * runs on the blocking executor; everything else runs on the caller's
 * executor, which must be the same for all callers (or a strand).
 */
class LocaleSnapshotCache {
public:
    LocaleSnapshotCache(std::filesystem::path workspace,
                        std::shared_ptr<history::IVersionHistorySource> history,
                        config::RecoveryConfig config,
                        boost::asio::any_io_executor blockingExecutor);

    /**
     * @brief Discover locale files and parse their HEAD content.
     *
     * Runs once; concurrent callers wait for the first. @p defaultLocale is
     * loaded first. History for all locale files is fetched with one batched
     * query on the first localeHistory() call, bounded by @p daysBack or by
     * that call's window, whichever reaches further back.
     */
    boost::asio::awaitable<void> initialize(std::string defaultLocale, int daysBack);

    bool initialized() const noexcept { return initialized_; }
    const std::filesystem::path& workspace() const noexcept { return workspace_; }

    /// All locale files in discovery order.
    const std::vector<locale::LocaleFileInfo>& files() const noexcept { return files_; }
    std::vector<locale::LocaleFileInfo> filesForLocale(std::string_view localeName) const;

    /// Parsed HEAD content, or nullptr when the file was unreadable or invalid.
    const locale::LocaleTree* headTree(const std::string& relPath) const;

    /**
     * @brief Commits touching a locale file, newest first, no older than @p since.
     *
     * A @p since older than the prefetched window drops the prefetch and
     * repeats the batched query over the wider window.
     */
    boost::asio::awaitable<std::vector<history::CommitRef>>
    localeHistory(std::string relPath, TimePoint since, std::size_t maxCount);

    /// Commits touching a source file, bounded by recovery.source_max_commits.
    /// Refetched when @p since reaches past the window cached for the file.
    boost::asio::awaitable<std::vector<history::CommitRef>> sourceHistory(std::string relPath,
                                                                          TimePoint since);

    boost::asio::awaitable<std::shared_ptr<const locale::LocaleTree>> treeAt(std::string relPath,
                                                                             CommitHash commit);

    boost::asio::awaitable<std::shared_ptr<const std::string>> sourceAt(std::string relPath,
                                                                        CommitHash commit);

    boost::asio::awaitable<std::shared_ptr<const std::string>>
    diffBetween(std::string relPath, CommitHash from, CommitHash to);

    /// Current on-disk content of a workspace file.
    boost::asio::awaitable<std::shared_ptr<const std::string>> workingCopy(std::string relPath);

    /**
     * @brief Record which source files call t()/$t() with each of @p keys.
     *
     * Only keys not indexed before are scanned. The candidate file list is
     * built once from sources.globs minus sources.excludes, capped at
     * sources.max_files.
     */
    boost::asio::awaitable<void> ensureKeyIndex(std::vector<std::string> keys);

    /// Workspace-relative source files calling @p key, sorted.
    std::vector<std::string> filesForKey(const std::string& key) const;

    bool isKeyIndexed(const std::string& key) const { return indexedKeys_.count(key) > 0; }

    void clear();

private:
    boost::asio::awaitable<void> loadHeadContent(std::vector<locale::LocaleFileInfo> files);
    boost::asio::awaitable<void> ensureHistory(TimePoint since);
    boost::asio::awaitable<void> prefetchHistory();
    boost::asio::awaitable<std::shared_ptr<const std::string>> rawAt(std::string relPath,
                                                                     CommitHash commit);
    boost::asio::awaitable<std::vector<std::string>> candidateSourceFiles();

    std::filesystem::path workspace_;
    std::shared_ptr<history::IVersionHistorySource> history_;
    config::RecoveryConfig config_;
    boost::asio::any_io_executor blockingExecutor_;

    bool initialized_{false};
    std::shared_ptr<AsyncEvent> initDone_;

    std::vector<locale::LocaleFileInfo> files_;
    std::unordered_map<std::string, std::shared_ptr<const locale::LocaleTree>> headTrees_;

    // Prefetched window; files absent from a complete batch have no commits in it.
    TimePoint historySince_{};
    bool historyReady_{false};
    std::shared_ptr<AsyncEvent> historyLoading_;
    bool historyBatchComplete_{false};
    std::unordered_map<std::string, std::vector<history::CommitRef>> localeHistory_;
    struct WindowedCommits {
        TimePoint since;
        std::vector<history::CommitRef> commits;
    };
    std::unordered_map<std::string, WindowedCommits> sourceHistory_;

    std::unordered_map<std::string, std::shared_ptr<const std::string>> rawContent_;
    std::unordered_map<std::string, std::shared_ptr<const locale::LocaleTree>> parsedContent_;
    std::unordered_map<std::string, std::shared_ptr<const std::string>> diffs_;
    std::unordered_map<std::string, std::shared_ptr<const std::string>> workingCopies_;

    std::optional<std::vector<std::string>> sourceFiles_;
    std::set<std::string> indexedKeys_;
    std::map<std::string, std::set<std::string>> keyIndex_;
};

/// Lexically normalized, generic-separator form of @p workspace without a trailing '/'.
std::string normalizeWorkspaceKey(const std::filesystem::path& workspace);

/**
 * @brief One LocaleSnapshotCache per workspace, keyed by normalizeWorkspaceKey().
 */
class SnapshotCacheRegistry {
public:
    SnapshotCacheRegistry(std::shared_ptr<history::IVersionHistorySource> history,
                          config::RecoveryConfig config,
                          boost::asio::any_io_executor blockingExecutor);

    std::shared_ptr<LocaleSnapshotCache> get(const std::filesystem::path& workspace);

    /// Clears and forgets every workspace cache.
    void clearAll();

    std::size_t size() const;

private:
    std::shared_ptr<history::IVersionHistorySource> history_;
    config::RecoveryConfig config_;
    boost::asio::any_io_executor blockingExecutor_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<LocaleSnapshotCache>> caches_;
};

} // namespace keyrescue::recovery
