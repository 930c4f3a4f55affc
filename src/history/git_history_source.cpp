#include <keyrescue/core/parallel.h>
#include <keyrescue/history/git_history_source.h>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <regex>

namespace keyrescue::history {

namespace {

constexpr char kFieldSep = '\x1f';
constexpr std::string_view kCommitMarker = "commit\x1f";

std::vector<std::string_view> splitFields(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(kFieldSep, start);
        if (pos == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

template <typename Fn> void forEachLine(std::string_view text, Fn&& fn) {
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        fn(line);
        start = end + 1;
    }
}

std::optional<CommitRef> parseCommitFields(const std::vector<std::string_view>& fields) {
    if (fields.empty() || fields[0].empty()) {
        return std::nullopt;
    }
    CommitRef ref;
    ref.hash = std::string(fields[0]);
    if (fields.size() > 1) {
        if (auto date = GitHistorySource::parseIsoDate(fields[1])) {
            ref.date = *date;
        }
    }
    if (fields.size() > 2) {
        ref.message = std::string(fields[2]);
    }
    return ref;
}

int parseInt(std::string_view s) {
    int v = 0;
    std::from_chars(s.data(), s.data() + s.size(), v);
    return v;
}

std::string trimmed(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    return s;
}

} // namespace

GitHistorySource::GitHistorySource(config::RecoveryConfig::Git config,
                                   boost::asio::any_io_executor blockingExecutor)
    : config_(std::move(config)), blockingExecutor_(std::move(blockingExecutor)) {}

bool GitHistorySource::isValidGitRef(std::string_view ref) {
    static const std::regex kRefPattern(R"(^[A-Za-z0-9_./\-^~@]+$)");
    if (ref.empty() || ref.size() >= 256) {
        return false;
    }
    // A leading dash would be read as an option.
    if (ref.front() == '-') {
        return false;
    }
    return std::regex_match(ref.begin(), ref.end(), kRefPattern);
}

std::optional<TimePoint> GitHistorySource::parseIsoDate(std::string_view iso) {
    // 2024-05-01T12:34:56+02:00 (strict ISO from %aI); Z suffix also accepted
    if (iso.size() < 19) {
        return std::nullopt;
    }
    using namespace std::chrono;
    const int y = parseInt(iso.substr(0, 4));
    const int mo = parseInt(iso.substr(5, 2));
    const int d = parseInt(iso.substr(8, 2));
    const int h = parseInt(iso.substr(11, 2));
    const int mi = parseInt(iso.substr(14, 2));
    const int s = parseInt(iso.substr(17, 2));

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    sys_seconds tp = sys_days{ymd} + hours{h} + minutes{mi} + seconds{s};

    auto tz = iso.substr(19);
    if (tz.size() >= 6 && (tz[0] == '+' || tz[0] == '-')) {
        const int offH = parseInt(tz.substr(1, 2));
        const int offM = parseInt(tz.substr(4, 2));
        auto offset = hours{offH} + minutes{offM};
        tp = (tz[0] == '+') ? tp - offset : tp + offset;
    }
    return time_point_cast<system_clock::duration>(tp);
}

std::string GitHistorySource::formatSinceDate(TimePoint since) {
    using namespace std::chrono;
    year_month_day ymd{floor<days>(since)};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

std::vector<CommitRef> GitHistorySource::parseLog(std::string_view output) {
    std::vector<CommitRef> commits;
    forEachLine(output, [&](std::string_view line) {
        if (line.empty()) {
            return;
        }
        if (auto ref = parseCommitFields(splitFields(line))) {
            commits.push_back(std::move(*ref));
        }
    });
    return commits;
}

std::map<std::string, std::vector<CommitRef>>
GitHistorySource::parseNameOnlyLog(std::string_view output) {
    std::map<std::string, std::vector<CommitRef>> byFile;
    std::optional<CommitRef> current;
    forEachLine(output, [&](std::string_view line) {
        if (line.empty()) {
            return;
        }
        if (line.starts_with(kCommitMarker)) {
            current = parseCommitFields(splitFields(line.substr(kCommitMarker.size())));
            return;
        }
        if (!current) {
            return;
        }
        auto& list = byFile[std::string(line)];
        if (list.empty() || list.back().hash != current->hash) {
            list.push_back(*current);
        }
    });
    return byFile;
}

boost::asio::awaitable<std::optional<process::ProcessOutput>>
GitHistorySource::runGit(std::filesystem::path workspace, std::vector<std::string> args) {
    process::ProcessSpec spec{.executable = config_.executable, .args = std::move(args)};
    spec.in_directory(std::move(workspace))
        .with_timeout(config_.timeout)
        .with_max_output(config_.maxOutputBytes);

    auto task = [spec = std::move(spec)]() -> std::optional<process::ProcessOutput> {
            auto result = process::runProcess(spec);
            if (!result) {
                spdlog::debug("[GitHistory] git {} failed: {}",
                              spec.args.empty() ? std::string{} : spec.args.front(),
                              result.error().message);
                return std::nullopt;
            }
            auto output = std::move(result).value();
            if (!output.ok()) {
                spdlog::debug("[GitHistory] git {} exited with {}: {}",
                              spec.args.empty() ? std::string{} : spec.args.front(),
                              output.exitCode, trimmed(output.err));
                return std::nullopt;
            }
            return output;
        };
    co_return co_await runBlocking(blockingExecutor_, std::move(task));
}

boost::asio::awaitable<std::vector<CommitRef>>
GitHistorySource::listCommits(std::filesystem::path workspace, std::string relPath,
                              TimePoint since, std::size_t maxCount) {
    std::vector<std::string> args{"log", "--since=" + formatSinceDate(since), "-n",
                                  std::to_string(maxCount), "--format=%H%x1f%aI%x1f%s", "--",
                                  relPath};
    auto output = co_await runGit(std::move(workspace), std::move(args));
    if (!output) {
        co_return std::vector<CommitRef>{};
    }
    co_return parseLog(output->out);
}

boost::asio::awaitable<std::optional<std::string>>
GitHistorySource::contentAt(std::filesystem::path workspace, std::string relPath,
                            CommitHash commit) {
    if (!isValidGitRef(commit)) {
        spdlog::warn("[GitHistory] Rejecting invalid commit ref '{}'", commit);
        co_return std::nullopt;
    }
    std::vector<std::string> args{"show", commit + ":" + relPath};
    auto output = co_await runGit(std::move(workspace), std::move(args));
    if (!output) {
        co_return std::nullopt;
    }
    co_return std::move(output->out);
}

boost::asio::awaitable<std::optional<std::string>>
GitHistorySource::diff(std::filesystem::path workspace, std::string relPath, CommitHash from,
                       CommitHash to) {
    if (!isValidGitRef(from) || !isValidGitRef(to)) {
        spdlog::warn("[GitHistory] Rejecting invalid diff refs '{}'..'{}'", from, to);
        co_return std::nullopt;
    }
    std::vector<std::string> args{"diff", from, to, "--", relPath};
    auto output = co_await runGit(std::move(workspace), std::move(args));
    if (!output || output->out.empty()) {
        co_return std::nullopt;
    }
    co_return std::move(output->out);
}

boost::asio::awaitable<std::optional<CommitHash>>
GitHistorySource::headCommit(std::filesystem::path workspace) {
    std::vector<std::string> args{"rev-parse", "HEAD"};
    auto output = co_await runGit(std::move(workspace), std::move(args));
    if (!output) {
        co_return std::nullopt;
    }
    auto hash = trimmed(output->out);
    if (hash.empty()) {
        co_return std::nullopt;
    }
    co_return hash;
}

boost::asio::awaitable<std::map<std::string, std::vector<CommitRef>>>
GitHistorySource::listCommitsForFiles(std::filesystem::path workspace,
                                      std::vector<std::string> relPaths, TimePoint since,
                                      std::size_t maxCount) {
    if (relPaths.empty()) {
        co_return std::map<std::string, std::vector<CommitRef>>{};
    }
    std::vector<std::string> args = {"log",
                                     "--since=" + formatSinceDate(since),
                                     "-n",
                                     std::to_string(maxCount),
                                     "--name-only",
                                     "--relative",
                                     "--format=commit%x1f%H%x1f%aI%x1f%s",
                                     "--"};
    args.insert(args.end(), relPaths.begin(), relPaths.end());

    auto output = co_await runGit(std::move(workspace), std::move(args));
    if (!output) {
        co_return std::map<std::string, std::vector<CommitRef>>{};
    }
    auto byFile = parseNameOnlyLog(output->out);
    spdlog::debug("[GitHistory] Batched history: {} files with commits out of {} requested",
                  byFile.size(), relPaths.size());
    co_return byFile;
}

} // namespace keyrescue::history
