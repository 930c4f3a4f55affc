#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <keyrescue/concurrency/cancellation.h>
#include <keyrescue/config/recovery_config.h>
#include <keyrescue/core/types.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

namespace keyrescue::concurrency {

enum class OperationType {
    TranslationProject,
    TranslationFile,
    CleanupUnused,
    CleanupInvalid,
    KeyManagement,
    StyleFix,
    Recovery,
};

const char* operationTypeToString(OperationType type) noexcept;

struct OperationLockInfo {
    OperationType type;
    std::string description;
    std::chrono::steady_clock::time_point startTime;
    std::size_t count = 1; ///< Same-type nesting depth
    std::shared_ptr<CancellationToken> cancellation;
    uint64_t generation = 0; ///< Bumped each time the slot changes hands
};

struct LockAcquireOptions {
    bool wait = false;
    std::optional<std::chrono::milliseconds> timeout; ///< Defaults to Config::waitTimeout
    bool cancellable = false;
};

struct FileLockInfo {
    OperationType holder;
    std::chrono::steady_clock::time_point timestamp;
};

/**
 * @brief Serializes conflicting bulk operations and guards single-file writes.
 *
 * Global slot state machine: Idle -> Held{type, count} -> Idle. Acquiring the
 * held type nests; a different type fails fast or queues FIFO with a timeout.
 * Releasing the last nesting level hands the slot directly to the next waiter.
 * A lock older than Config::lockTimeout is reclaimed on the next check.
 *
 * All methods must be called from the executor passed at construction.
 */
class OperationLockManager {
public:
    struct Config {
        std::chrono::milliseconds lockTimeout{5 * 60 * 1000};
        std::chrono::milliseconds fileLockTimeout{30'000};
        std::chrono::milliseconds fileWriteDelay{50};
        std::chrono::milliseconds waitTimeout{30'000};

        static Config fromRecoveryConfig(const config::RecoveryConfig::Locks& locks) {
            return Config{locks.lockTimeout, locks.fileLockTimeout, locks.fileWriteDelay,
                          locks.waitTimeout};
        }
    };

    using AcquireOptions = LockAcquireOptions;

    struct Stats {
        std::optional<OperationType> heldType;
        std::string description;
        std::size_t nesting = 0;
        std::size_t waiters = 0;
        std::size_t fileLocks = 0;
        uint64_t staleReclaimed = 0;
    };

    explicit OperationLockManager(boost::asio::any_io_executor executor);
    OperationLockManager(boost::asio::any_io_executor executor, Config config);
    ~OperationLockManager();

    OperationLockManager(const OperationLockManager&) = delete;
    OperationLockManager& operator=(const OperationLockManager&) = delete;

    /**
     * @brief Take the global slot.
     * @return OperationInProgress when busy and not waiting, Timeout when the
     *         wait expired, OperationCancelled when forceReleaseAll() ran.
     */
    boost::asio::awaitable<Result<void>> acquire(OperationType type, std::string description,
                                                 AcquireOptions options = {});

    /// No-op unless @p type holds the slot.
    void release(OperationType type);

    /// As release(type), but also a no-op once the holder of @p generation was reclaimed.
    void release(OperationType type, uint64_t generation);

    /// True while held; reclaims a stale lock first.
    bool isHeld();

    std::optional<OperationLockInfo> currentLock();

    /// "\"<description>\" is in progress (<N>s elapsed)", empty when idle.
    std::string blockingMessage();

    /// Signal the holder's cancellation token, if it has one.
    bool cancelCurrent();

    /// Drop every lock and fail every waiter with OperationCancelled.
    void forceReleaseAll();

    Stats stats();

    /**
     * @brief Take the per-file write lock for @p holder.
     *
     * Fails when another holder's lock is younger than Config::fileLockTimeout.
     * Successful acquisitions are spaced by Config::fileWriteDelay across all files.
     */
    boost::asio::awaitable<bool> acquireFileLock(std::string path, OperationType holder);

    void releaseFileLock(const std::string& path);

    /// Runs @p fn (returning awaitable<Result<T>>) under the file lock.
    template <typename F>
    auto withFileLock(std::string path, OperationType holder, F fn)
        -> boost::asio::awaitable<typename std::invoke_result_t<F&>::value_type> {
        if (!co_await acquireFileLock(path, holder)) {
            co_return Error{ErrorCode::OperationInProgress,
                            "File is locked by another operation: " + path};
        }
        FileLockGuard guard(*this, path);
        co_return co_await fn();
    }

    /**
     * @brief Run @p fn while holding the global slot.
     *
     * @p fn receives the lock's cancellation token (null unless
     * options.cancellable). Returns nullopt when the slot could not be taken;
     * the reason is logged.
     */
    template <typename F>
    auto withGlobalLock(OperationType type, std::string description, F fn,
                        AcquireOptions options = {})
        -> boost::asio::awaitable<std::optional<
            typename std::invoke_result_t<F&, std::shared_ptr<CancellationToken>>::value_type>> {
        using R =
            typename std::invoke_result_t<F&, std::shared_ptr<CancellationToken>>::value_type;
        static_assert(!std::is_void_v<R>, "withGlobalLock requires a non-void result");

        auto acquired = co_await acquire(type, description, options);
        if (!acquired) {
            spdlog::warn("[OperationLock] Cannot start '{}': {}", description,
                         acquired.error().message);
            co_return std::nullopt;
        }
        std::shared_ptr<CancellationToken> token;
        uint64_t generation = 0;
        if (auto info = currentLock()) {
            token = info->cancellation;
            generation = info->generation;
        }
        GlobalLockGuard guard(*this, type, generation);
        co_return std::optional<R>(co_await fn(std::move(token)));
    }

private:
    struct Waiter;

    class GlobalLockGuard {
    public:
        GlobalLockGuard(OperationLockManager& mgr, OperationType type, uint64_t generation)
            : mgr_(mgr), type_(type), generation_(generation) {}
        ~GlobalLockGuard() { mgr_.release(type_, generation_); }
        GlobalLockGuard(const GlobalLockGuard&) = delete;
        GlobalLockGuard& operator=(const GlobalLockGuard&) = delete;

    private:
        OperationLockManager& mgr_;
        OperationType type_;
        uint64_t generation_;
    };

    class FileLockGuard {
    public:
        FileLockGuard(OperationLockManager& mgr, std::string path)
            : mgr_(mgr), path_(std::move(path)) {}
        ~FileLockGuard() { mgr_.releaseFileLock(path_); }
        FileLockGuard(const FileLockGuard&) = delete;
        FileLockGuard& operator=(const FileLockGuard&) = delete;

    private:
        OperationLockManager& mgr_;
        std::string path_;
    };

    void reclaimIfStaleLocked();
    void promoteNextLocked();
    void releaseLocked(OperationType type);
    std::string blockingMessageLocked() const;

    boost::asio::any_io_executor executor_;
    Config config_;

    std::mutex mutex_;
    std::optional<OperationLockInfo> held_;
    std::deque<std::shared_ptr<Waiter>> waiters_;
    std::unordered_map<std::string, FileLockInfo> fileLocks_;
    std::chrono::steady_clock::time_point nextWriteSlot_{};
    uint64_t staleReclaimed_{0};
    uint64_t generation_{0};
};

} // namespace keyrescue::concurrency
