#include <keyrescue/core/parallel.h>
#include <keyrescue/locale/locale_file_writer.h>
#include <keyrescue/locale/locale_tree.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <system_error>

namespace keyrescue::locale {

namespace {

namespace fs = std::filesystem;

LocaleTree readTreeOrEmpty(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return LocaleTree::object();
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (auto tree = parseLocaleTree(ss.str())) {
        return std::move(*tree);
    }
    spdlog::warn("[LocaleFileWriter] {} is not a JSON object; starting from {{}}", path.string());
    return LocaleTree::object();
}

Result<void> writeAtomically(const fs::path& path, const std::string& text) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::WriteError,
                         "Cannot create " + path.parent_path().string() + ": " + ec.message()};
        }
    }
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::WriteError, "Cannot open " + tmp.string() + " for writing"};
        }
        out << text;
        out.flush();
        if (!out) {
            fs::remove(tmp, ec);
            return Error{ErrorCode::WriteError, "Failed writing " + tmp.string()};
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Error{ErrorCode::WriteError, "Cannot replace " + path.string() + ": " + ec.message()};
    }
    return Result<void>();
}

} // namespace

LocaleFileWriter::LocaleFileWriter(concurrency::OperationLockManager& locks,
                                   concurrency::FileMutex& mutex,
                                   boost::asio::any_io_executor blockingExecutor)
    : locks_(locks), mutex_(mutex), blockingExecutor_(std::move(blockingExecutor)) {}

boost::asio::awaitable<Result<void>>
LocaleFileWriter::applyUpdates(fs::path path, std::map<std::string, std::string> updates,
                               concurrency::OperationType holder) {
    if (updates.empty()) {
        co_return Result<void>();
    }
    const auto key = path.lexically_normal().string();

    co_return co_await locks_.withFileLock(key, holder, [&]() -> boost::asio::awaitable<Result<void>> {
        co_return co_await mutex_.withFileMutex(key, [&]() -> boost::asio::awaitable<Result<void>> {
            co_return co_await runBlocking(blockingExecutor_, [&]() -> Result<void> {
                auto tree = readTreeOrEmpty(path);
                std::size_t applied = 0;
                for (const auto& [dotted, value] : updates) {
                    if (setNestedValue(tree, dotted, value)) {
                        ++applied;
                    } else {
                        spdlog::warn("[LocaleFileWriter] Cannot set {} in {}: path blocked",
                                     dotted, path.string());
                    }
                }
                auto written = writeAtomically(path, serializeLocaleTree(tree));
                if (written) {
                    spdlog::debug("[LocaleFileWriter] Wrote {} keys to {}", applied, path.string());
                } else {
                    spdlog::warn("[LocaleFileWriter] {}: {}", written.error().code,
                                 written.error().message);
                }
                return written;
            });
        });
    });
}

} // namespace keyrescue::locale
