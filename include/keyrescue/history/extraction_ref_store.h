#pragma once

#include <keyrescue/core/types.h>
#include <keyrescue/history/version_history_source.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace keyrescue::history {

/// Commit recorded just before a bulk script rewrote the workspace.
struct ScriptCommitRef {
    std::string scriptName;
    CommitHash commitHash;
    TimePoint timestamp;
    std::string workspace;
};

/**
 * @brief Persists script commit refs as a JSON array (newest last, bounded).
 *
 * The newest "i18n:extract" ref of a workspace is what the recovery pipeline
 * consults as its extraction-reference commit.
 */
class ExtractionRefStore {
public:
    static constexpr const char* kExtractScript = "i18n:extract";
    static constexpr std::size_t kMaxEntries = 50;

    ExtractionRefStore(std::filesystem::path storeFile,
                       std::shared_ptr<IVersionHistorySource> history);

    /// Default location under config::get_data_dir().
    static std::filesystem::path defaultStorePath();

    /// Resolve HEAD of @p workspace and append it under @p scriptName.
    boost::asio::awaitable<Result<ScriptCommitRef>> recordCommitRef(std::filesystem::path workspace,
                                                                    std::string scriptName);

    Result<void> append(ScriptCommitRef ref);

    std::optional<ScriptCommitRef> latestRef(const std::filesystem::path& workspace,
                                             const std::string& scriptName) const;

    std::optional<CommitHash> latestExtractRef(const std::filesystem::path& workspace) const {
        auto ref = latestRef(workspace, kExtractScript);
        return ref ? std::optional<CommitHash>(ref->commitHash) : std::nullopt;
    }

    std::vector<ScriptCommitRef> load() const;

private:
    std::vector<ScriptCommitRef> loadUnlocked() const;

    std::filesystem::path storeFile_;
    std::shared_ptr<IVersionHistorySource> history_;
    mutable std::mutex mutex_;
};

} // namespace keyrescue::history
