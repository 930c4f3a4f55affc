#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <keyrescue/config/recovery_config.h>
#include <keyrescue/history/version_history_source.h>
#include <keyrescue/process/process_runner.h>

#include <boost/asio/any_io_executor.hpp>

#include <string_view>

namespace keyrescue::history {

/**
 * @brief IVersionHistorySource backed by the git command line.
 *
 * Every git invocation runs on the blocking executor supplied at construction
 * (typically a boost::asio::thread_pool); callers resume on their own executor.
 */
class GitHistorySource final : public IVersionHistorySource {
public:
    GitHistorySource(config::RecoveryConfig::Git config,
                     boost::asio::any_io_executor blockingExecutor);

    boost::asio::awaitable<std::vector<CommitRef>> listCommits(std::filesystem::path workspace,
                                                               std::string relPath,
                                                               TimePoint since,
                                                               std::size_t maxCount) override;

    boost::asio::awaitable<std::optional<std::string>>
    contentAt(std::filesystem::path workspace, std::string relPath, CommitHash commit) override;

    boost::asio::awaitable<std::optional<std::string>> diff(std::filesystem::path workspace,
                                                            std::string relPath, CommitHash from,
                                                            CommitHash to) override;

    boost::asio::awaitable<std::optional<CommitHash>>
    headCommit(std::filesystem::path workspace) override;

    boost::asio::awaitable<std::map<std::string, std::vector<CommitRef>>>
    listCommitsForFiles(std::filesystem::path workspace, std::vector<std::string> relPaths,
                        TimePoint since, std::size_t maxCount) override;

    /// Accepts hashes, branch names and rev expressions such as HEAD~2.
    static bool isValidGitRef(std::string_view ref);

    /// Parses `--format=%H%x1f%aI%x1f%s` output.
    static std::vector<CommitRef> parseLog(std::string_view output);

    /// Parses the batched `--name-only` form where commit lines carry a "commit\x1f" prefix.
    static std::map<std::string, std::vector<CommitRef>> parseNameOnlyLog(std::string_view output);

    static std::string formatSinceDate(TimePoint since);
    static std::optional<TimePoint> parseIsoDate(std::string_view iso);

private:
    boost::asio::awaitable<std::optional<process::ProcessOutput>>
    runGit(std::filesystem::path workspace, std::vector<std::string> args);

    config::RecoveryConfig::Git config_;
    boost::asio::any_io_executor blockingExecutor_;
};

} // namespace keyrescue::history
