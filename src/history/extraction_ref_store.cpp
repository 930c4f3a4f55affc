#include <keyrescue/config/config_helpers.h>
#include <keyrescue/history/extraction_ref_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

namespace keyrescue::history {

using json = nlohmann::json;

namespace {

std::string normalizeWorkspace(const std::filesystem::path& workspace) {
    auto normal = workspace.lexically_normal().generic_string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

int64_t toMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

ExtractionRefStore::ExtractionRefStore(std::filesystem::path storeFile,
                                       std::shared_ptr<IVersionHistorySource> history)
    : storeFile_(std::move(storeFile)), history_(std::move(history)) {}

std::filesystem::path ExtractionRefStore::defaultStorePath() {
    return config::get_data_dir() / "commit_refs.json";
}

std::vector<ScriptCommitRef> ExtractionRefStore::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadUnlocked();
}

std::vector<ScriptCommitRef> ExtractionRefStore::loadUnlocked() const {
    std::vector<ScriptCommitRef> refs;
    std::ifstream in(storeFile_);
    if (!in) {
        return refs;
    }
    try {
        auto doc = json::parse(in);
        if (!doc.is_array()) {
            return refs;
        }
        for (const auto& entry : doc) {
            ScriptCommitRef ref;
            ref.scriptName = entry.value("scriptName", "");
            ref.commitHash = entry.value("commitHash", "");
            ref.workspace = entry.value("folderPath", "");
            ref.timestamp =
                TimePoint(std::chrono::milliseconds(entry.value("timestamp", int64_t{0})));
            if (!ref.commitHash.empty()) {
                refs.push_back(std::move(ref));
            }
        }
    } catch (const json::exception& e) {
        spdlog::warn("[ExtractionRefStore] Ignoring unreadable store {}: {}", storeFile_.string(),
                     e.what());
    }
    return refs;
}

Result<void> ExtractionRefStore::append(ScriptCommitRef ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto refs = loadUnlocked();
    ref.workspace = normalizeWorkspace(ref.workspace);
    refs.push_back(std::move(ref));
    if (refs.size() > kMaxEntries) {
        refs.erase(refs.begin(), refs.end() - static_cast<std::ptrdiff_t>(kMaxEntries));
    }

    json doc = json::array();
    for (const auto& r : refs) {
        doc.push_back({{"scriptName", r.scriptName},
                       {"commitHash", r.commitHash},
                       {"timestamp", toMillis(r.timestamp)},
                       {"folderPath", r.workspace}});
    }

    std::error_code ec;
    std::filesystem::create_directories(storeFile_.parent_path(), ec);
    std::ofstream out(storeFile_, std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::WriteError, "Cannot open " + storeFile_.string()};
    }
    out << doc.dump(2) << '\n';
    if (!out) {
        return Error{ErrorCode::WriteError, "Failed writing " + storeFile_.string()};
    }
    return {};
}

std::optional<ScriptCommitRef> ExtractionRefStore::latestRef(const std::filesystem::path& workspace,
                                                             const std::string& scriptName) const {
    const auto key = normalizeWorkspace(workspace);
    auto refs = load();
    for (auto it = refs.rbegin(); it != refs.rend(); ++it) {
        if (it->workspace == key && it->scriptName == scriptName) {
            return *it;
        }
    }
    return std::nullopt;
}

boost::asio::awaitable<Result<ScriptCommitRef>>
ExtractionRefStore::recordCommitRef(std::filesystem::path workspace, std::string scriptName) {
    if (!history_) {
        co_return Error{ErrorCode::NotInitialized, "No history source configured"};
    }
    auto head = co_await history_->headCommit(workspace);
    if (!head) {
        co_return Error{ErrorCode::NotFound,
                        "No HEAD commit for " + workspace.string() + " (not a repository?)"};
    }

    ScriptCommitRef ref{std::move(scriptName), *head, std::chrono::system_clock::now(),
                        workspace.string()};
    if (auto saved = append(ref); !saved) {
        co_return saved.error();
    }
    spdlog::info("[ExtractionRefStore] Recorded {} before '{}' in {}", ref.commitHash,
                 ref.scriptName, ref.workspace);
    ref.workspace = normalizeWorkspace(ref.workspace);
    co_return ref;
}

} // namespace keyrescue::history
