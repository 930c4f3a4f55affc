#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <keyrescue/core/types.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

namespace keyrescue::history {

/**
 * @brief One commit touching a file, newest first in every list.
 */
struct CommitRef {
    CommitHash hash;
    TimePoint date;
    std::string message;

    bool operator==(const CommitRef& other) const { return hash == other.hash; }
};

/**
 * @brief Read-only access to a workspace's version history.
 *
 * Paths are relative to @p workspace. Implementations never throw: failures
 * (no repository, unknown revision, timeouts) come back as empty lists or
 * std::nullopt.
 */
class IVersionHistorySource {
public:
    virtual ~IVersionHistorySource() = default;

    virtual boost::asio::awaitable<std::vector<CommitRef>>
    listCommits(std::filesystem::path workspace, std::string relPath, TimePoint since,
                std::size_t maxCount) = 0;

    virtual boost::asio::awaitable<std::optional<std::string>>
    contentAt(std::filesystem::path workspace, std::string relPath, CommitHash commit) = 0;

    /// Unified diff from @p from to @p to, or nullopt when unavailable or empty.
    virtual boost::asio::awaitable<std::optional<std::string>>
    diff(std::filesystem::path workspace, std::string relPath, CommitHash from, CommitHash to) = 0;

    virtual boost::asio::awaitable<std::optional<CommitHash>>
    headCommit(std::filesystem::path workspace) = 0;

    /**
     * @brief History for several files at once.
     *
     * The default issues one listCommits per path; implementations backed by a
     * process override it with a single query. @p maxCount bounds the whole query.
     */
    virtual boost::asio::awaitable<std::map<std::string, std::vector<CommitRef>>>
    listCommitsForFiles(std::filesystem::path workspace, std::vector<std::string> relPaths,
                        TimePoint since, std::size_t maxCount);
};

} // namespace keyrescue::history
