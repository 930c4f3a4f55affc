#include <keyrescue/history/version_history_source.h>

namespace keyrescue::history {

boost::asio::awaitable<std::map<std::string, std::vector<CommitRef>>>
IVersionHistorySource::listCommitsForFiles(std::filesystem::path workspace,
                                           std::vector<std::string> relPaths, TimePoint since,
                                           std::size_t maxCount) {
    std::map<std::string, std::vector<CommitRef>> out;
    for (const auto& rel : relPaths) {
        auto commits = co_await listCommits(workspace, rel, since, maxCount);
        if (!commits.empty()) {
            out.emplace(rel, std::move(commits));
        }
    }
    co_return out;
}

} // namespace keyrescue::history
