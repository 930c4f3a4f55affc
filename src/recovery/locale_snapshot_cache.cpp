#include <keyrescue/common/pattern_utils.h>
#include <keyrescue/core/parallel.h>
#include <keyrescue/recovery/locale_snapshot_cache.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include <boost/asio/this_coro.hpp>

namespace keyrescue::recovery {

namespace {

namespace fs = std::filesystem;

std::optional<std::string> readWholeFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return ss.str();
}

std::vector<history::CommitRef> windowed(const std::vector<history::CommitRef>& commits,
                                         TimePoint since, std::size_t maxCount) {
    std::vector<history::CommitRef> out;
    for (const auto& c : commits) {
        if (out.size() >= maxCount) {
            break;
        }
        // Commits with an unparsed date are kept.
        if (c.date != TimePoint{} && c.date < since) {
            continue;
        }
        out.push_back(c);
    }
    return out;
}

bool containsTranslationCall(std::string_view content, const std::string& key) {
    const std::string patterns[] = {"t('" + key + "'", "t(\"" + key + "\"", "$t('" + key + "'",
                                    "$t(\"" + key + "\""};
    for (const auto& p : patterns) {
        if (content.find(p) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

LocaleSnapshotCache::LocaleSnapshotCache(fs::path workspace,
                                         std::shared_ptr<history::IVersionHistorySource> history,
                                         config::RecoveryConfig config,
                                         boost::asio::any_io_executor blockingExecutor)
    : workspace_(std::move(workspace)), history_(std::move(history)), config_(std::move(config)),
      blockingExecutor_(std::move(blockingExecutor)) {}

boost::asio::awaitable<void> LocaleSnapshotCache::initialize(std::string defaultLocale,
                                                             int daysBack) {
    if (initialized_) {
        co_return;
    }
    if (initDone_) {
        auto pending = initDone_;
        co_await pending->wait();
        co_return;
    }

    auto executor = co_await boost::asio::this_coro::executor;
    auto done = std::make_shared<AsyncEvent>(executor);
    initDone_ = done;

    const auto start = std::chrono::steady_clock::now();
    spdlog::info("[LocaleSnapshotCache] Initializing cache for {}", workspace_.string());

    try {
        auto discover = [ws = workspace_, roots = config_.locales.roots]() {
            return locale::discoverLocaleFiles(ws, roots);
        };
        files_ = co_await runBlocking(blockingExecutor_, std::move(discover));
        spdlog::info("[LocaleSnapshotCache] Found {} locale files", files_.size());

        // Default locale first, the rest after.
        std::vector<locale::LocaleFileInfo> ordered;
        std::copy_if(files_.begin(), files_.end(), std::back_inserter(ordered),
                     [&](const auto& f) { return f.locale == defaultLocale; });
        std::copy_if(files_.begin(), files_.end(), std::back_inserter(ordered),
                     [&](const auto& f) { return f.locale != defaultLocale; });
        co_await loadHeadContent(std::move(ordered));
        historySince_ = std::chrono::system_clock::now() - std::chrono::hours(24) * daysBack;
    } catch (const std::exception& e) {
        spdlog::warn("[LocaleSnapshotCache] Initialization incomplete for {}: {}",
                     workspace_.string(), e.what());
    }

    initialized_ = true;
    done->set();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::info("[LocaleSnapshotCache] Initialization complete in {}ms", elapsed.count());
}

boost::asio::awaitable<void>
LocaleSnapshotCache::loadHeadContent(std::vector<locale::LocaleFileInfo> files) {
    const std::size_t batch = std::max<std::size_t>(1, config_.sources.readBatch);
    for (std::size_t i = 0; i < files.size(); i += batch) {
        const std::size_t end = std::min(files.size(), i + batch);
        std::vector<boost::asio::awaitable<std::optional<std::string>>> reads;
        for (std::size_t j = i; j < end; ++j) {
            reads.push_back(runBlocking(blockingExecutor_,
                                        [path = files[j].path]() { return readWholeFile(path); }));
        }
        auto contents = co_await gatherAll(std::move(reads));

        for (std::size_t j = i; j < end; ++j) {
            const auto& file = files[j];
            const auto& raw = contents[j - i];
            std::shared_ptr<const locale::LocaleTree> tree;
            if (raw) {
                if (auto parsed = locale::parseLocaleTree(*raw)) {
                    tree = std::make_shared<const locale::LocaleTree>(std::move(*parsed));
                } else {
                    spdlog::debug("[LocaleSnapshotCache] {} is not a JSON object", file.relativePath);
                }
            } else {
                spdlog::debug("[LocaleSnapshotCache] Cannot read {}", file.relativePath);
            }
            headTrees_[file.relativePath] = std::move(tree);
        }
    }
    spdlog::debug("[LocaleSnapshotCache] Loaded {} locale files from HEAD", headTrees_.size());
}

boost::asio::awaitable<void> LocaleSnapshotCache::ensureHistory(TimePoint since) {
    while (!historyReady_ && historyLoading_) {
        auto pending = historyLoading_;
        co_await pending->wait();
    }
    if (historyReady_) {
        if (since >= historySince_) {
            co_return;
        }
        spdlog::debug("[LocaleSnapshotCache] Widening history window for {}", workspace_.string());
        historyReady_ = false;
        historyBatchComplete_ = false;
        localeHistory_.clear();
    }
    historySince_ = std::min(historySince_, since);

    auto executor = co_await boost::asio::this_coro::executor;
    auto done = std::make_shared<AsyncEvent>(executor);
    historyLoading_ = done;
    try {
        co_await prefetchHistory();
    } catch (const std::exception& e) {
        spdlog::debug("[LocaleSnapshotCache] History prefetch failed: {}", e.what());
    }
    historyReady_ = true;
    historyLoading_.reset();
    done->set();
}

boost::asio::awaitable<void> LocaleSnapshotCache::prefetchHistory() {
    if (files_.empty()) {
        historyBatchComplete_ = true;
        co_return;
    }

    std::vector<std::string> rels;
    rels.reserve(files_.size());
    for (const auto& f : files_) {
        rels.push_back(f.relativePath);
    }

    const auto limit = config_.recovery.historyBatchLimit;
    auto batched = co_await history_->listCommitsForFiles(workspace_, rels, historySince_, limit);

    std::set<std::string> distinct;
    for (const auto& [rel, commits] : batched) {
        for (const auto& c : commits) {
            distinct.insert(c.hash);
        }
    }
    historyBatchComplete_ = distinct.size() < limit;

    for (auto& [rel, commits] : batched) {
        localeHistory_[rel] = std::move(commits);
    }
    if (historyBatchComplete_) {
        for (const auto& rel : rels) {
            localeHistory_.try_emplace(rel);
        }
    }
    spdlog::debug("[LocaleSnapshotCache] Prefetched history: {} commits across {} files{}",
                  distinct.size(), batched.size(), historyBatchComplete_ ? "" : " (truncated)");
}

std::vector<locale::LocaleFileInfo>
LocaleSnapshotCache::filesForLocale(std::string_view localeName) const {
    std::vector<locale::LocaleFileInfo> out;
    for (const auto& f : files_) {
        if (f.locale == localeName) {
            out.push_back(f);
        }
    }
    return out;
}

const locale::LocaleTree* LocaleSnapshotCache::headTree(const std::string& relPath) const {
    auto it = headTrees_.find(relPath);
    return it == headTrees_.end() ? nullptr : it->second.get();
}

boost::asio::awaitable<std::vector<history::CommitRef>>
LocaleSnapshotCache::localeHistory(std::string relPath, TimePoint since, std::size_t maxCount) {
    co_await ensureHistory(since);
    auto it = localeHistory_.find(relPath);
    if (it == localeHistory_.end()) {
        auto commits = co_await history_->listCommits(
            workspace_, relPath, historySince_,
            std::max(maxCount, config_.recovery.maxCommitsPerFile));
        it = localeHistory_.emplace(relPath, std::move(commits)).first;
    }
    co_return windowed(it->second, since, maxCount);
}

boost::asio::awaitable<std::vector<history::CommitRef>>
LocaleSnapshotCache::sourceHistory(std::string relPath, TimePoint since) {
    auto it = sourceHistory_.find(relPath);
    if (it == sourceHistory_.end() || since < it->second.since) {
        auto commits = co_await history_->listCommits(workspace_, relPath, since,
                                                      config_.recovery.sourceMaxCommits);
        it = sourceHistory_.insert_or_assign(relPath, WindowedCommits{since, std::move(commits)})
                 .first;
    }
    co_return windowed(it->second.commits, since, config_.recovery.sourceMaxCommits);
}

boost::asio::awaitable<std::shared_ptr<const std::string>>
LocaleSnapshotCache::rawAt(std::string relPath, CommitHash commit) {
    const auto key = relPath + ":" + commit;
    if (auto it = rawContent_.find(key); it != rawContent_.end()) {
        co_return it->second;
    }
    std::shared_ptr<const std::string> content;
    if (auto text = co_await history_->contentAt(workspace_, relPath, commit)) {
        content = std::make_shared<const std::string>(std::move(*text));
    }
    rawContent_[key] = content;
    co_return content;
}

boost::asio::awaitable<std::shared_ptr<const locale::LocaleTree>>
LocaleSnapshotCache::treeAt(std::string relPath, CommitHash commit) {
    const auto key = relPath + ":" + commit;
    if (auto it = parsedContent_.find(key); it != parsedContent_.end()) {
        co_return it->second;
    }
    std::shared_ptr<const locale::LocaleTree> tree;
    if (auto raw = co_await rawAt(relPath, commit)) {
        if (auto parsed = locale::parseLocaleTree(*raw)) {
            tree = std::make_shared<const locale::LocaleTree>(std::move(*parsed));
        } else {
            spdlog::debug("[LocaleSnapshotCache] {} at {} does not parse", relPath,
                          commit.substr(0, 7));
        }
    }
    parsedContent_[key] = tree;
    co_return tree;
}

boost::asio::awaitable<std::shared_ptr<const std::string>>
LocaleSnapshotCache::sourceAt(std::string relPath, CommitHash commit) {
    co_return co_await rawAt(std::move(relPath), std::move(commit));
}

boost::asio::awaitable<std::shared_ptr<const std::string>>
LocaleSnapshotCache::diffBetween(std::string relPath, CommitHash from, CommitHash to) {
    const auto key = relPath + ":" + from + ".." + to;
    if (auto it = diffs_.find(key); it != diffs_.end()) {
        co_return it->second;
    }
    std::shared_ptr<const std::string> patch;
    if (auto text = co_await history_->diff(workspace_, relPath, from, to)) {
        patch = std::make_shared<const std::string>(std::move(*text));
    }
    diffs_[key] = patch;
    co_return patch;
}

boost::asio::awaitable<std::shared_ptr<const std::string>>
LocaleSnapshotCache::workingCopy(std::string relPath) {
    if (auto it = workingCopies_.find(relPath); it != workingCopies_.end()) {
        co_return it->second;
    }
    auto read = [path = workspace_ / relPath]() { return readWholeFile(path); };
    auto text = co_await runBlocking(blockingExecutor_, std::move(read));
    std::shared_ptr<const std::string> content;
    if (text) {
        content = std::make_shared<const std::string>(std::move(*text));
    }
    workingCopies_[relPath] = content;
    co_return content;
}

boost::asio::awaitable<std::vector<std::string>> LocaleSnapshotCache::candidateSourceFiles() {
    if (sourceFiles_) {
        co_return *sourceFiles_;
    }
    auto scan =
        [ws = workspace_, globs = config_.sources.globs, excludes = config_.sources.excludes,
         maxFiles = config_.sources.maxFiles]() {
            std::vector<std::string> out;
            std::error_code ec;
            fs::recursive_directory_iterator it(
                ws, fs::directory_options::skip_permission_denied, ec);
            for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
                const auto name = it->path().filename().string();
                std::error_code typeEc;
                if (it->is_directory(typeEc)) {
                    if (common::matches_any(name, excludes)) {
                        it.disable_recursion_pending();
                    }
                    continue;
                }
                if (!it->is_regular_file(typeEc)) {
                    continue;
                }
                const auto rel = fs::relative(it->path(), ws, typeEc).generic_string();
                if (common::matches_file(rel, globs)) {
                    out.push_back(rel);
                }
            }
            std::sort(out.begin(), out.end());
            if (out.size() > maxFiles) {
                out.resize(maxFiles);
            }
            return out;
        };
    auto found = co_await runBlocking(blockingExecutor_, std::move(scan));
    spdlog::debug("[LocaleSnapshotCache] {} candidate source files", found.size());
    sourceFiles_ = found;
    co_return found;
}

boost::asio::awaitable<void> LocaleSnapshotCache::ensureKeyIndex(std::vector<std::string> keys) {
    auto pending = std::make_shared<std::vector<std::string>>();
    for (auto& key : keys) {
        if (indexedKeys_.count(key) == 0 &&
            std::find(pending->begin(), pending->end(), key) == pending->end()) {
            pending->push_back(std::move(key));
        }
    }
    if (pending->empty()) {
        co_return;
    }

    const auto files = co_await candidateSourceFiles();
    const std::size_t batch = std::max<std::size_t>(1, config_.sources.readBatch);
    std::size_t matches = 0;

    for (std::size_t i = 0; i < files.size(); i += batch) {
        const std::size_t end = std::min(files.size(), i + batch);
        std::vector<boost::asio::awaitable<std::vector<std::size_t>>> scans;
        for (std::size_t j = i; j < end; ++j) {
            scans.push_back(runBlocking(
                blockingExecutor_, [path = workspace_ / files[j], pending]() {
                    std::vector<std::size_t> hits;
                    auto content = readWholeFile(path);
                    if (!content) {
                        return hits;
                    }
                    for (std::size_t k = 0; k < pending->size(); ++k) {
                        if (containsTranslationCall(*content, (*pending)[k])) {
                            hits.push_back(k);
                        }
                    }
                    return hits;
                }));
        }
        auto results = co_await gatherAll(std::move(scans));
        for (std::size_t j = i; j < end; ++j) {
            for (auto k : results[j - i]) {
                keyIndex_[(*pending)[k]].insert(files[j]);
                ++matches;
            }
        }
    }

    indexedKeys_.insert(pending->begin(), pending->end());
    spdlog::debug("[LocaleSnapshotCache] Indexed {} keys over {} source files ({} references)",
                  pending->size(), files.size(), matches);
}

std::vector<std::string> LocaleSnapshotCache::filesForKey(const std::string& key) const {
    auto it = keyIndex_.find(key);
    if (it == keyIndex_.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

void LocaleSnapshotCache::clear() {
    initialized_ = false;
    initDone_.reset();
    files_.clear();
    headTrees_.clear();
    historySince_ = {};
    historyReady_ = false;
    historyLoading_.reset();
    historyBatchComplete_ = false;
    localeHistory_.clear();
    sourceHistory_.clear();
    rawContent_.clear();
    parsedContent_.clear();
    diffs_.clear();
    workingCopies_.clear();
    sourceFiles_.reset();
    indexedKeys_.clear();
    keyIndex_.clear();
}

SnapshotCacheRegistry::SnapshotCacheRegistry(
    std::shared_ptr<history::IVersionHistorySource> history, config::RecoveryConfig config,
    boost::asio::any_io_executor blockingExecutor)
    : history_(std::move(history)), config_(std::move(config)),
      blockingExecutor_(std::move(blockingExecutor)) {}

std::string normalizeWorkspaceKey(const fs::path& workspace) {
    auto key = workspace.lexically_normal().generic_string();
    while (key.size() > 1 && key.back() == '/') {
        key.pop_back();
    }
    return key;
}

std::shared_ptr<LocaleSnapshotCache> SnapshotCacheRegistry::get(const fs::path& workspace) {
    const auto key = normalizeWorkspaceKey(workspace);
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = caches_[key];
    if (!slot) {
        slot = std::make_shared<LocaleSnapshotCache>(workspace, history_, config_,
                                                     blockingExecutor_);
    }
    return slot;
}

void SnapshotCacheRegistry::clearAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, cache] : caches_) {
        cache->clear();
    }
    caches_.clear();
}

std::size_t SnapshotCacheRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return caches_.size();
}

} // namespace keyrescue::recovery
