#include <keyrescue/core/parallel.h>
#include <keyrescue/extraction/candidate_extractor.h>
#include <keyrescue/extraction/text_analysis.h>
#include <keyrescue/extraction/text_rules.h>
#include <keyrescue/locale/translation_key.h>
#include <keyrescue/recovery/recovery_pipeline.h>
#include <keyrescue/recovery/value_checks.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <regex>

namespace keyrescue::recovery {

namespace {

using extraction::Candidate;
using extraction::ScoringContext;

enum class MatchKind { NoMatch, Found, Contaminated };

struct Match {
    MatchKind kind = MatchKind::NoMatch;
    std::string value;
};

struct KeyState {
    std::string key;
    std::vector<std::string> variations;
    std::optional<RecoveryResult> result;
    std::set<std::string> contaminatedLocales;
};

struct KeyHit {
    Match match;
    CommitHash commit;
};

struct SearchContext {
    LocaleSnapshotCache& cache;
    const RecoveryOptions& options;
    TimePoint since;
    std::size_t maxCommits;
    std::size_t width;
};

std::string preview(const std::string& value) {
    return value.size() > 50 ? value.substr(0, 50) + "..." : value;
}

/**
 * First usable value for the key's variations in @p tree.
 *
 * Suspicious values are skipped. An extraction artifact is skipped in HEAD
 * content and reported as Contaminated in history content.
 */
Match matchInTree(const locale::LocaleTree& tree, const KeyState& state,
                  const RecoveryOptions& options, bool historical) {
    for (const auto& variant : state.variations) {
        auto value = locale::getNestedValue(tree, variant);
        if (!value || value->empty()) {
            continue;
        }
        if (hasExtractionArtifact(*value)) {
            if (historical) {
                return Match{MatchKind::Contaminated, std::move(*value)};
            }
            spdlog::debug("[RecoveryPipeline] Skipping extraction artifact for {}: \"{}\"",
                          state.key, preview(*value));
            continue;
        }
        auto reason = checkValue(state.key, *value, options.callOptionNames);
        if (reason != SuspicionReason::None) {
            spdlog::debug("[RecoveryPipeline] Skipping suspicious value for {} ({}): \"{}\"",
                          state.key, suspicionToString(reason), preview(*value));
            continue;
        }
        return Match{MatchKind::Found, std::move(*value)};
    }
    return {};
}

bool anyUnresolved(const std::vector<KeyState>& states) {
    return std::any_of(states.begin(), states.end(), [](const auto& s) { return !s.result; });
}

void searchHeadTrees(const LocaleSnapshotCache& cache, std::vector<KeyState>& states,
                     const std::vector<locale::LocaleFileInfo>& files, const RecoveryOptions& options,
                     bool targetLocale) {
    for (const auto& file : files) {
        if (isCancelled(options.cancel)) {
            return;
        }
        const auto* tree = cache.headTree(file.relativePath);
        if (!tree) {
            continue;
        }
        for (auto& state : states) {
            if (state.result) {
                continue;
            }
            auto match = matchInTree(*tree, state, options, false);
            if (match.kind == MatchKind::Found) {
                state.result = RecoveryResult{std::move(match.value),
                                              targetLocale ? "head" : "head:" + file.locale};
                spdlog::debug("[RecoveryPipeline] {} found in {} ({})", state.key,
                              file.relativePath, state.result->source);
            }
        }
    }
}

boost::asio::awaitable<void> searchExtractRef(SearchContext& ctx, std::vector<KeyState>& states,
                                              const std::vector<locale::LocaleFileInfo>& files,
                                              const CommitHash& ref) {
    for (const auto& file : files) {
        if (isCancelled(ctx.options.cancel) || !anyUnresolved(states)) {
            co_return;
        }
        auto tree = co_await ctx.cache.treeAt(file.relativePath, ref);
        if (!tree) {
            continue;
        }
        for (auto& state : states) {
            if (state.result) {
                continue;
            }
            auto match = matchInTree(*tree, state, ctx.options, false);
            if (match.kind == MatchKind::Found) {
                state.result = RecoveryResult{std::move(match.value), "ref:" + ref};
                spdlog::debug("[RecoveryPipeline] {} found at extraction ref {}", state.key,
                              ref.substr(0, 7));
            }
        }
    }
}

boost::asio::awaitable<std::map<std::size_t, KeyHit>>
scanFileHistory(SearchContext& ctx, const std::vector<KeyState>& states,
                locale::LocaleFileInfo file, std::vector<std::size_t> active) {
    std::map<std::size_t, KeyHit> hits;
    auto commits = co_await ctx.cache.localeHistory(file.relativePath, ctx.since, ctx.maxCommits);
    for (const auto& commit : commits) {
        if (isCancelled(ctx.options.cancel) || hits.size() == active.size()) {
            break;
        }
        auto tree = co_await ctx.cache.treeAt(file.relativePath, commit.hash);
        if (!tree) {
            continue;
        }
        for (auto idx : active) {
            if (hits.count(idx) > 0) {
                continue;
            }
            auto match = matchInTree(*tree, states[idx], ctx.options, true);
            if (match.kind != MatchKind::NoMatch) {
                hits.emplace(idx, KeyHit{std::move(match), commit.hash});
            }
        }
    }
    co_return hits;
}

boost::asio::awaitable<std::map<std::size_t, KeyHit>> noHits() {
    co_return std::map<std::size_t, KeyHit>{};
}

/**
 * History search over @p files. Files are scanned in parallel groups; their
 * outcomes are merged in file order so the first file to find or to
 * contaminate a key decides it, as a sequential scan would.
 */
boost::asio::awaitable<void> searchHistory(SearchContext& ctx, std::vector<KeyState>& states,
                                           const std::vector<locale::LocaleFileInfo>& files,
                                           bool targetLocale) {
    for (std::size_t i = 0; i < files.size(); i += ctx.width) {
        if (isCancelled(ctx.options.cancel) || !anyUnresolved(states)) {
            co_return;
        }
        const std::size_t end = std::min(files.size(), i + ctx.width);

        std::vector<boost::asio::awaitable<std::map<std::size_t, KeyHit>>> scans;
        for (std::size_t j = i; j < end; ++j) {
            std::vector<std::size_t> active;
            for (std::size_t k = 0; k < states.size(); ++k) {
                if (!states[k].result && states[k].contaminatedLocales.count(files[j].locale) == 0) {
                    active.push_back(k);
                }
            }
            if (active.empty()) {
                scans.push_back(noHits());
                continue;
            }
            scans.push_back(scanFileHistory(ctx, states, files[j], std::move(active)));
        }
        auto outcomes = co_await gatherAll(std::move(scans));

        for (std::size_t j = i; j < end; ++j) {
            const auto& file = files[j];
            for (auto& [idx, hit] : outcomes[j - i]) {
                auto& state = states[idx];
                if (state.result || state.contaminatedLocales.count(file.locale) > 0) {
                    continue;
                }
                if (hit.match.kind == MatchKind::Contaminated) {
                    spdlog::info("[RecoveryPipeline] {} history for {} has an extraction artifact "
                                 "at {}: \"{}\"; abandoning {} history",
                                 file.locale, state.key, hit.commit.substr(0, 7),
                                 preview(hit.match.value), file.locale);
                    state.contaminatedLocales.insert(file.locale);
                    continue;
                }
                state.result = RecoveryResult{
                    std::move(hit.match.value),
                    targetLocale ? "history:" + hit.commit
                                 : "history:" + file.locale + ":" + hit.commit};
                spdlog::debug("[RecoveryPipeline] {} found in {} @ {}", state.key,
                              file.relativePath, hit.commit.substr(0, 7));
            }
        }
    }
}

bool isKeywordCommit(const std::string& message) {
    static const std::regex kKeywords(R"(i18n|translat|lang|locale|intl)", std::regex::icase);
    return message.size() <= extraction::kMaxRegexInput && std::regex_search(message, kKeywords);
}

template <typename Fn> void forEachPatchLine(std::string_view patch, Fn&& fn) {
    std::size_t start = 0;
    while (start < patch.size()) {
        std::size_t nl = patch.find('\n', start);
        if (nl == std::string_view::npos) {
            nl = patch.size();
        }
        fn(patch.substr(start, nl - start));
        start = nl + 1;
    }
}

bool isRemovedLine(std::string_view line) {
    return !line.empty() && line.front() == '-' && line.substr(0, 3) != "---";
}

bool isAddedLine(std::string_view line) {
    return !line.empty() && line.front() == '+' && line.substr(0, 3) != "+++";
}

bool matchesLine(std::string_view line, const std::regex& re) {
    return line.size() <= extraction::kMaxRegexInput &&
           std::regex_search(line.begin(), line.end(), re);
}

/// Candidates with signal from each removed line and, for multi-line removals, from the lines joined.
std::vector<Candidate> removedLineCandidates(const std::vector<std::string>& removed,
                                             const ScoringContext& scoring) {
    std::vector<Candidate> out;
    auto keep = [&](std::vector<Candidate> found) {
        for (auto& c : found) {
            if (extraction::hasSignal(c.text, scoring) && !extraction::isKeyLike(c.text)) {
                out.push_back(std::move(c));
            }
        }
    };
    for (const auto& line : removed) {
        keep(extraction::extractCandidates(line, scoring));
    }
    if (removed.size() > 1) {
        std::string joined;
        for (const auto& line : removed) {
            joined += line;
            joined += '\n';
        }
        keep(extraction::extractCandidates(joined, scoring));
    }
    return out;
}

void sortByScore(std::vector<Candidate>& candidates) {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });
}

/// Candidates from the removed lines of hunks whose added lines contain the call.
std::vector<Candidate> diffCandidates(std::string_view patch, const std::regex& callPattern,
                                      const ScoringContext& scoring) {
    std::vector<Candidate> out;
    std::vector<std::string> removed;
    bool addedHasCall = false;

    auto flush = [&]() {
        if (addedHasCall && !removed.empty()) {
            auto found = removedLineCandidates(removed, scoring);
            std::move(found.begin(), found.end(), std::back_inserter(out));
        }
        removed.clear();
        addedHasCall = false;
    };

    forEachPatchLine(patch, [&](std::string_view line) {
        if (line.substr(0, 2) == "@@") {
            flush();
        } else if (isRemovedLine(line)) {
            removed.emplace_back(line.substr(1));
        } else if (isAddedLine(line) && matchesLine(line.substr(1), callPattern)) {
            addedHasCall = true;
        }
    });
    flush();

    sortByScore(out);
    return out;
}

/**
 * Candidates from every removed line of a translation-related commit.
 *
 * +2 when the text carries a {placeholder}, +3 when the commit added any t()
 * call, since such a commit most likely replaced the text with a key.
 */
std::vector<Candidate> keywordDiffCandidates(std::string_view patch,
                                             const ScoringContext& scoring) {
    static const std::regex kAnyCall(R"(\bt\(\s*['"])");

    std::vector<std::string> removed;
    bool addedHasCall = false;
    forEachPatchLine(patch, [&](std::string_view line) {
        if (isRemovedLine(line)) {
            removed.emplace_back(line.substr(1));
        } else if (!addedHasCall && isAddedLine(line) && matchesLine(line.substr(1), kAnyCall)) {
            addedHasCall = true;
        }
    });

    auto out = removedLineCandidates(removed, scoring);
    for (auto& c : out) {
        if (!placeholderNames(c.text).empty()) {
            c.score += 2;
        }
        if (addedHasCall) {
            c.score += 3;
        }
    }
    sortByScore(out);
    return out;
}

/// First candidate passing isAcceptable(), if it reaches @p threshold.
std::optional<Candidate> acceptedCandidate(const std::vector<Candidate>& candidates,
                                           const ScoringContext& scoring, int threshold) {
    for (const auto& c : candidates) {
        if (extraction::isAcceptable(c.text, scoring)) {
            return c.score >= threshold ? std::optional<Candidate>(c) : std::nullopt;
        }
    }
    return std::nullopt;
}

/**
 * Source-file recovery for one file. Strategies, first hit wins:
 *  1. diffs of commits whose message mentions translation work (score >= 5)
 *  2. the diff that introduced the call (score >= 3)
 *  3. the snapshot just before the introduction (score >= 5)
 *  4. the best candidate over every commit without the call, starting at the
 *     newest translation-related commit (score >= 6)
 */
boost::asio::awaitable<std::optional<RecoveryResult>>
recoverFromSourceFile(SearchContext& ctx, const std::string& key, const std::string& relPath) {
    ScoringContext scoring;
    scoring.hintWords = extraction::extractHintWords(key);
    if (auto current = co_await ctx.cache.workingCopy(relPath)) {
        scoring.placeholderHints = extraction::extractPlaceholderHints(*current, key);
    }

    auto commits = co_await ctx.cache.sourceHistory(relPath, ctx.since);
    if (commits.empty()) {
        co_return std::nullopt;
    }

    std::optional<std::size_t> firstKeyword;
    for (std::size_t i = 0; i < commits.size(); ++i) {
        if (!isKeywordCommit(commits[i].message)) {
            continue;
        }
        if (!firstKeyword) {
            firstKeyword = i;
        }
        if (i + 1 >= commits.size()) {
            continue;
        }
        if (isCancelled(ctx.options.cancel)) {
            co_return std::nullopt;
        }
        const auto& previous = commits[i + 1].hash;
        const auto& current = commits[i].hash;
        auto patch = co_await ctx.cache.diffBetween(relPath, previous, current);
        if (!patch) {
            continue;
        }
        if (auto c = acceptedCandidate(keywordDiffCandidates(*patch, scoring), scoring, 5)) {
            spdlog::debug("[RecoveryPipeline] {} recovered from translation commit {} (score={})",
                          key, current.substr(0, 7), c->score);
            co_return RecoveryResult{c->text, "diff:" + previous + ".." + current};
        }
    }

    // Walk back from the newest commit to the first one without the call.
    const auto callPattern = extraction::translationCallPattern(key);
    std::optional<CommitHash> with;
    std::optional<CommitHash> without;
    for (std::size_t i = 0; i < commits.size(); ++i) {
        if (isCancelled(ctx.options.cancel)) {
            co_return std::nullopt;
        }
        auto content = co_await ctx.cache.sourceAt(relPath, commits[i].hash);
        if (!content) {
            continue;
        }
        if (std::regex_search(*content, callPattern)) {
            with = commits[i].hash;
            without = i + 1 < commits.size() ? std::optional<CommitHash>(commits[i + 1].hash)
                                             : std::nullopt;
        } else if (with) {
            without = commits[i].hash;
            break;
        }
    }

    if (with && without) {
        spdlog::debug("[RecoveryPipeline] t('{}') introduced in {} between {} and {}", key,
                      relPath, without->substr(0, 7), with->substr(0, 7));

        if (auto patch = co_await ctx.cache.diffBetween(relPath, *without, *with)) {
            if (auto c = acceptedCandidate(diffCandidates(*patch, callPattern, scoring), scoring, 3)) {
                spdlog::debug("[RecoveryPipeline] {} recovered from diff (score={})", key,
                              c->score);
                co_return RecoveryResult{c->text, "diff:" + *without + ".." + *with};
            }
        }

        if (auto snapshot = co_await ctx.cache.sourceAt(relPath, *without)) {
            for (const auto& c : extraction::extractCandidates(*snapshot, scoring)) {
                if (c.score < 5) {
                    break;
                }
                if (extraction::hasSignal(c.text, scoring) && !extraction::isKeyLike(c.text)) {
                    spdlog::debug("[RecoveryPipeline] {} recovered from {} @ {} (score={})", key,
                                  relPath, without->substr(0, 7), c.score);
                    co_return RecoveryResult{c.text, "source:" + *without + ":" + relPath};
                }
            }
        }
    } else {
        spdlog::debug("[RecoveryPipeline] No introducing commit for {} in {}", key, relPath);
    }

    std::optional<Candidate> best;
    CommitHash bestCommit;
    for (std::size_t i = firstKeyword.value_or(0); i < commits.size(); ++i) {
        if (isCancelled(ctx.options.cancel)) {
            co_return std::nullopt;
        }
        auto content = co_await ctx.cache.sourceAt(relPath, commits[i].hash);
        if (!content || std::regex_search(*content, callPattern)) {
            continue;
        }
        auto c = acceptedCandidate(extraction::extractCandidates(*content, scoring), scoring, 6);
        if (c && (!best || c->score > best->score)) {
            best = std::move(c);
            bestCommit = commits[i].hash;
        }
    }
    if (best) {
        spdlog::debug("[RecoveryPipeline] {} matched in {} @ {} (score={})", key, relPath,
                      bestCommit.substr(0, 7), best->score);
        co_return RecoveryResult{best->text, "source:" + bestCommit + ":" + relPath};
    }
    co_return std::nullopt;
}

boost::asio::awaitable<std::optional<RecoveryResult>> recoverFromSources(SearchContext& ctx,
                                                                         std::string key) {
    const auto files = ctx.cache.filesForKey(key);
    if (files.empty()) {
        spdlog::debug("[RecoveryPipeline] No source file references {}", key);
        co_return std::nullopt;
    }
    for (const auto& rel : files) {
        if (isCancelled(ctx.options.cancel)) {
            break;
        }
        if (auto result = co_await recoverFromSourceFile(ctx, key, rel)) {
            co_return result;
        }
    }
    co_return std::nullopt;
}

boost::asio::awaitable<void> searchSources(SearchContext& ctx, std::vector<KeyState>& states) {
    std::vector<std::size_t> pending;
    std::vector<std::string> keys;
    for (std::size_t k = 0; k < states.size(); ++k) {
        if (!states[k].result) {
            pending.push_back(k);
            keys.push_back(states[k].key);
        }
    }
    if (pending.empty()) {
        co_return;
    }
    co_await ctx.cache.ensureKeyIndex(std::move(keys));

    for (std::size_t i = 0; i < pending.size(); i += ctx.width) {
        if (isCancelled(ctx.options.cancel)) {
            co_return;
        }
        const std::size_t end = std::min(pending.size(), i + ctx.width);
        std::vector<boost::asio::awaitable<std::optional<RecoveryResult>>> tasks;
        for (std::size_t j = i; j < end; ++j) {
            tasks.push_back(recoverFromSources(ctx, states[pending[j]].key));
        }
        auto results = co_await gatherAll(std::move(tasks));
        for (std::size_t j = i; j < end; ++j) {
            if (results[j - i]) {
                states[pending[j]].result = std::move(results[j - i]);
            }
        }
    }
}

std::size_t countResolved(const std::vector<KeyState>& states) {
    return static_cast<std::size_t>(
        std::count_if(states.begin(), states.end(), [](const auto& s) { return s.result.has_value(); }));
}

} // namespace

RecoveryPipeline::RecoveryPipeline(std::shared_ptr<history::IVersionHistorySource> history,
                                   config::RecoveryConfig config,
                                   boost::asio::any_io_executor blockingExecutor)
    : config_(config),
      registry_(std::move(history), std::move(config), std::move(blockingExecutor)) {}

boost::asio::awaitable<std::optional<RecoveryResult>>
RecoveryPipeline::recover(std::filesystem::path workspace, std::string localeName,
                          std::string key, RecoveryOptions options) {
    std::vector<std::string> keys{key};
    auto results = co_await recoverBatch(std::move(workspace), std::move(keys),
                                         std::move(localeName), std::move(options));
    auto it = results.find(key);
    co_return it == results.end() ? std::nullopt : it->second;
}

boost::asio::awaitable<std::map<std::string, std::optional<RecoveryResult>>>
RecoveryPipeline::recoverBatch(std::filesystem::path workspace, std::vector<std::string> keys,
                               std::string localeName, RecoveryOptions options) {
    std::map<std::string, std::optional<RecoveryResult>> results;
    const auto start = std::chrono::steady_clock::now();
    const auto cachePrefix = normalizeWorkspaceKey(workspace) + "::" + localeName + "::";

    // Phase 1: session cache
    std::vector<KeyState> states;
    std::size_t cacheHits = 0;
    for (const auto& key : keys) {
        if (results.count(key) > 0) {
            continue;
        }
        results[key] = std::nullopt;
        if (auto cached = cachedResult(cachePrefix + key)) {
            results[key] = std::move(cached);
            ++cacheHits;
            continue;
        }
        auto variations = locale::getKeyPathVariations(key);
        if (variations.empty()) {
            spdlog::debug("[RecoveryPipeline] Ignoring invalid key '{}'", key);
            continue;
        }
        states.push_back(KeyState{key, std::move(variations), std::nullopt, {}});
    }
    spdlog::info("[RecoveryPipeline] Recovering {} keys for {} ({} cached)", results.size(),
                 localeName, cacheHits);
    if (states.empty()) {
        co_return results;
    }

    const int daysBack = options.daysBack.value_or(config_.recovery.daysBack);
    const auto since = std::chrono::system_clock::now() - std::chrono::hours(24) * daysBack;

    try {
        auto cache = registry_.get(workspace);
        co_await cache->initialize(localeName, daysBack);

        SearchContext ctx{*cache, options, since,
                          options.maxCommits.value_or(config_.recovery.maxCommitsPerFile),
                          std::max<std::size_t>(1, config_.recovery.parallelWidth)};

        const auto targetFiles = cache->filesForLocale(localeName);
        std::vector<locale::LocaleFileInfo> otherFiles;
        for (const auto& f : cache->files()) {
            if (f.locale != localeName) {
                otherFiles.push_back(f);
            }
        }

        auto stillRunning = [&]() { return !isCancelled(options.cancel) && anyUnresolved(states); };

        if (options.extractRef && stillRunning()) {
            co_await searchExtractRef(ctx, states, targetFiles, *options.extractRef);
        }
        if (stillRunning()) {
            searchHeadTrees(*cache, states, targetFiles, options, true);
        }
        if (stillRunning()) {
            searchHeadTrees(*cache, states, otherFiles, options, false);
        }
        if (stillRunning()) {
            co_await searchHistory(ctx, states, targetFiles, true);
        }
        if (stillRunning()) {
            co_await searchHistory(ctx, states, otherFiles, false);
        }
        if (stillRunning()) {
            co_await searchSources(ctx, states);
        }
        if (isCancelled(options.cancel)) {
            spdlog::info("[RecoveryPipeline] Cancelled with {} of {} keys recovered",
                         countResolved(states), states.size());
        }
    } catch (const std::exception& e) {
        spdlog::warn("[RecoveryPipeline] Recovery aborted for {}: {}", workspace.string(),
                     e.what());
    }

    for (auto& state : states) {
        if (state.result) {
            storeResult(cachePrefix + state.key, *state.result);
            results[state.key] = std::move(state.result);
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::info("[RecoveryPipeline] Recovered {}/{} keys in {}ms", countResolved(states),
                 states.size(), elapsed.count());
    co_return results;
}

void RecoveryPipeline::clearCache() {
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        sessionCache_.clear();
    }
    registry_.clearAll();
}

std::size_t RecoveryPipeline::cachedResultCount() const {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    return sessionCache_.size();
}

std::optional<RecoveryResult> RecoveryPipeline::cachedResult(const std::string& cacheKey) const {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    auto it = sessionCache_.find(cacheKey);
    if (it == sessionCache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void RecoveryPipeline::storeResult(const std::string& cacheKey, const RecoveryResult& result) {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    sessionCache_[cacheKey] = result;
}

} // namespace keyrescue::recovery
