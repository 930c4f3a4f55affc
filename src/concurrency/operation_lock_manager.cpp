#include <keyrescue/concurrency/operation_lock_manager.h>

#include <fmt/format.h>

#include <algorithm>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace keyrescue::concurrency {

namespace {
using Clock = std::chrono::steady_clock;
}

struct OperationLockManager::Waiter {
    Waiter(boost::asio::any_io_executor ex, OperationType t, std::string d, bool c)
        : timer(std::move(ex)), type(t), description(std::move(d)), cancellable(c) {}

    boost::asio::steady_timer timer;
    OperationType type;
    std::string description;
    bool cancellable;
    bool granted = false;
    bool rejected = false;
};

const char* operationTypeToString(OperationType type) noexcept {
    switch (type) {
        case OperationType::TranslationProject: return "translation-project";
        case OperationType::TranslationFile: return "translation-file";
        case OperationType::CleanupUnused: return "cleanup-unused";
        case OperationType::CleanupInvalid: return "cleanup-invalid";
        case OperationType::KeyManagement: return "key-management";
        case OperationType::StyleFix: return "style-fix";
        case OperationType::Recovery: return "recovery";
    }
    return "unknown";
}

OperationLockManager::OperationLockManager(boost::asio::any_io_executor executor)
    : OperationLockManager(std::move(executor), Config{}) {}

OperationLockManager::OperationLockManager(boost::asio::any_io_executor executor, Config config)
    : executor_(std::move(executor)), config_(config) {}

OperationLockManager::~OperationLockManager() {
    forceReleaseAll();
}

boost::asio::awaitable<Result<void>>
OperationLockManager::acquire(OperationType type, std::string description,
                              AcquireOptions options) {
    std::shared_ptr<Waiter> waiter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reclaimIfStaleLocked();

        if (!held_) {
            held_ = OperationLockInfo{type, description, Clock::now(), 1,
                                      options.cancellable ? std::make_shared<CancellationToken>()
                                                          : nullptr,
                                      ++generation_};
            spdlog::debug("[OperationLock] Acquired {} for '{}'", operationTypeToString(type),
                          description);
            co_return Result<void>();
        }
        if (held_->type == type) {
            ++held_->count;
            spdlog::debug("[OperationLock] Nested {} (depth {})", operationTypeToString(type),
                          held_->count);
            co_return Result<void>();
        }
        if (!options.wait) {
            auto msg = blockingMessageLocked();
            spdlog::info("[OperationLock] '{}' blocked: {}", description, msg);
            co_return Error{ErrorCode::OperationInProgress, msg};
        }

        waiter = std::make_shared<Waiter>(executor_, type, description, options.cancellable);
        waiter->timer.expires_after(options.timeout.value_or(config_.waitTimeout));
        waiters_.push_back(waiter);
        spdlog::debug("[OperationLock] '{}' queued behind {} ({} waiting)", description,
                      operationTypeToString(held_->type), waiters_.size());
    }

    boost::system::error_code ec;
    co_await waiter->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    std::lock_guard<std::mutex> lock(mutex_);
    if (waiter->granted) {
        co_return Result<void>();
    }
    waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), waiter), waiters_.end());
    if (waiter->rejected) {
        co_return Error{ErrorCode::OperationCancelled,
                        "Lock wait cancelled for '" + waiter->description + "'"};
    }
    auto msg = blockingMessageLocked();
    spdlog::warn("[OperationLock] '{}' timed out waiting: {}", waiter->description, msg);
    co_return Error{ErrorCode::Timeout, "Timed out waiting for lock: " + msg};
}

void OperationLockManager::release(OperationType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    releaseLocked(type);
}

void OperationLockManager::release(OperationType type, uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (held_ && held_->generation != generation) {
        spdlog::debug("[OperationLock] Ignoring release of reclaimed {} lock",
                      operationTypeToString(type));
        return;
    }
    releaseLocked(type);
}

void OperationLockManager::releaseLocked(OperationType type) {
    if (!held_ || held_->type != type) {
        return;
    }
    if (--held_->count > 0) {
        return;
    }
    spdlog::debug("[OperationLock] Released {}", operationTypeToString(type));
    promoteNextLocked();
}

bool OperationLockManager::isHeld() {
    std::lock_guard<std::mutex> lock(mutex_);
    reclaimIfStaleLocked();
    return held_.has_value();
}

std::optional<OperationLockInfo> OperationLockManager::currentLock() {
    std::lock_guard<std::mutex> lock(mutex_);
    reclaimIfStaleLocked();
    return held_;
}

std::string OperationLockManager::blockingMessage() {
    std::lock_guard<std::mutex> lock(mutex_);
    reclaimIfStaleLocked();
    return blockingMessageLocked();
}

bool OperationLockManager::cancelCurrent() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_ || !held_->cancellation) {
        return false;
    }
    spdlog::info("[OperationLock] Cancellation requested for '{}'", held_->description);
    held_->cancellation->cancel();
    return true;
}

void OperationLockManager::forceReleaseAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (held_ && held_->cancellation) {
        held_->cancellation->cancel();
    }
    if (held_ || !waiters_.empty() || !fileLocks_.empty()) {
        spdlog::warn("[OperationLock] Force releasing all locks ({} waiters, {} file locks)",
                     waiters_.size(), fileLocks_.size());
    }
    held_.reset();
    for (auto& waiter : waiters_) {
        waiter->rejected = true;
        waiter->timer.cancel();
    }
    waiters_.clear();
    fileLocks_.clear();
}

OperationLockManager::Stats OperationLockManager::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats s;
    if (held_) {
        s.heldType = held_->type;
        s.description = held_->description;
        s.nesting = held_->count;
    }
    s.waiters = waiters_.size();
    s.fileLocks = fileLocks_.size();
    s.staleReclaimed = staleReclaimed_;
    return s;
}

boost::asio::awaitable<bool> OperationLockManager::acquireFileLock(std::string path,
                                                                   OperationType holder) {
    Clock::duration delay{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = Clock::now();
        if (auto it = fileLocks_.find(path); it != fileLocks_.end() && it->second.holder != holder) {
            if (now - it->second.timestamp < config_.fileLockTimeout) {
                spdlog::debug("[OperationLock] {} is locked by {}", path,
                              operationTypeToString(it->second.holder));
                co_return false;
            }
            spdlog::warn("[OperationLock] Reclaiming stale file lock on {} from {}", path,
                         operationTypeToString(it->second.holder));
        }
        fileLocks_[path] = FileLockInfo{holder, now};

        // Reserve the next write slot so back-to-back writes stay spaced.
        const auto slot = std::max(now, nextWriteSlot_);
        delay = slot - now;
        nextWriteSlot_ = slot + config_.fileWriteDelay;
    }

    if (delay > Clock::duration::zero()) {
        boost::asio::steady_timer timer(executor_);
        timer.expires_after(delay);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    co_return true;
}

void OperationLockManager::releaseFileLock(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    fileLocks_.erase(path);
}

void OperationLockManager::reclaimIfStaleLocked() {
    if (!held_) {
        return;
    }
    const auto age = Clock::now() - held_->startTime;
    if (age <= config_.lockTimeout) {
        return;
    }
    spdlog::warn("[OperationLock] Auto-releasing stale {} lock '{}' after {}s",
                 operationTypeToString(held_->type), held_->description,
                 std::chrono::duration_cast<std::chrono::seconds>(age).count());
    if (held_->cancellation) {
        held_->cancellation->cancel();
    }
    ++staleReclaimed_;
    promoteNextLocked();
}

void OperationLockManager::promoteNextLocked() {
    held_.reset();
    if (waiters_.empty()) {
        return;
    }
    auto next = waiters_.front();
    waiters_.pop_front();
    held_ = OperationLockInfo{next->type, next->description, Clock::now(), 1,
                              next->cancellable ? std::make_shared<CancellationToken>() : nullptr,
                              ++generation_};
    next->granted = true;
    next->timer.cancel();
    spdlog::debug("[OperationLock] Handed {} to '{}'", operationTypeToString(next->type),
                  next->description);
}

std::string OperationLockManager::blockingMessageLocked() const {
    if (!held_) {
        return {};
    }
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - held_->startTime);
    return fmt::format("\"{}\" is in progress ({}s elapsed)", held_->description,
                       elapsed.count());
}

} // namespace keyrescue::concurrency
