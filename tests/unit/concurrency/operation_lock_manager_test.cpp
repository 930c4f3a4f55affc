#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

#include <keyrescue/concurrency/operation_lock_manager.h>
#include <keyrescue/core/parallel.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>
#include <thread>

using namespace keyrescue;
using namespace keyrescue::concurrency;
using namespace std::chrono_literals;

namespace {

boost::asio::awaitable<void> sleepFor(std::chrono::milliseconds d) {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    timer.expires_after(d);
    boost::system::error_code ec;
    co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
}

OperationLockManager::AcquireOptions waiting(std::chrono::milliseconds timeout = 5s) {
    OperationLockManager::AcquireOptions options;
    options.wait = true;
    options.timeout = timeout;
    return options;
}

class OperationLockManagerTest : public test::AsyncTest {
protected:
    std::unique_ptr<OperationLockManager> makeManager(OperationLockManager::Config cfg = {}) {
        return std::make_unique<OperationLockManager>(executor(), cfg);
    }

    ErrorCode acquireCode(OperationLockManager& mgr, OperationType type, std::string description,
                          OperationLockManager::AcquireOptions options = {}) {
        return run([&]() -> boost::asio::awaitable<ErrorCode> {
            auto r = co_await mgr.acquire(type, description, options);
            co_return r ? ErrorCode::Success : r.error().code;
        }());
    }
};

TEST_F(OperationLockManagerTest, AcquireAndRelease) {
    auto mgr = makeManager();
    EXPECT_FALSE(mgr->isHeld());
    EXPECT_TRUE(mgr->blockingMessage().empty());

    EXPECT_EQ(acquireCode(*mgr, OperationType::TranslationProject, "Translate project"),
              ErrorCode::Success);
    ASSERT_TRUE(mgr->isHeld());
    auto info = mgr->currentLock();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->type, OperationType::TranslationProject);
    EXPECT_EQ(info->description, "Translate project");
    EXPECT_EQ(info->cancellation, nullptr);

    mgr->release(OperationType::TranslationProject);
    EXPECT_FALSE(mgr->isHeld());
}

TEST_F(OperationLockManagerTest, SameTypeNests) {
    auto mgr = makeManager();
    EXPECT_EQ(acquireCode(*mgr, OperationType::KeyManagement, "Rename keys"), ErrorCode::Success);
    EXPECT_EQ(acquireCode(*mgr, OperationType::KeyManagement, "Move keys"), ErrorCode::Success);
    EXPECT_EQ(mgr->stats().nesting, 2u);

    mgr->release(OperationType::KeyManagement);
    EXPECT_TRUE(mgr->isHeld());
    mgr->release(OperationType::KeyManagement);
    EXPECT_FALSE(mgr->isHeld());
}

TEST_F(OperationLockManagerTest, ReleaseOfOtherTypeIsIgnored) {
    auto mgr = makeManager();
    EXPECT_EQ(acquireCode(*mgr, OperationType::StyleFix, "Fix styles"), ErrorCode::Success);
    mgr->release(OperationType::CleanupUnused);
    EXPECT_TRUE(mgr->isHeld());
}

TEST_F(OperationLockManagerTest, DifferentTypeWithoutWaitReportsHolder) {
    auto mgr = makeManager();
    EXPECT_EQ(acquireCode(*mgr, OperationType::TranslationProject, "Translate project"),
              ErrorCode::Success);

    auto message = run([&]() -> boost::asio::awaitable<std::string> {
        auto r = co_await mgr->acquire(OperationType::CleanupUnused, "Remove unused keys");
        co_return r ? std::string{} : r.error().message;
    }());

    EXPECT_NE(message.find("\"Translate project\" is in progress"), std::string::npos) << message;
    EXPECT_EQ(mgr->currentLock()->type, OperationType::TranslationProject);
}

TEST_F(OperationLockManagerTest, BackToBackBulkOperations) {
    auto mgr = makeManager();

    auto outcome = run([&]() -> boost::asio::awaitable<std::pair<bool, bool>> {
        auto ex = co_await boost::asio::this_coro::executor;
        AsyncEvent finishFirst(ex);
        AsyncEvent firstStarted(ex);

        std::vector<boost::asio::awaitable<std::optional<int>>> tasks;
        tasks.push_back(mgr->withGlobalLock(
            OperationType::TranslationProject, "Translate project",
            [&](std::shared_ptr<CancellationToken>) -> boost::asio::awaitable<int> {
                firstStarted.set();
                co_await finishFirst.wait();
                co_return 1;
            }));
        auto contender = [&]() -> boost::asio::awaitable<std::optional<int>> {
            co_await firstStarted.wait();
            auto blocked = co_await mgr->withGlobalLock(
                OperationType::CleanupInvalid, "Remove invalid keys",
                [](std::shared_ptr<CancellationToken>) -> boost::asio::awaitable<int> {
                    co_return 2;
                });
            finishFirst.set();
            co_return blocked ? std::optional<int>(-1) : std::optional<int>(0);
        };
        tasks.push_back(contender());
        auto results = co_await gatherAll(std::move(tasks));

        auto second = co_await mgr->withGlobalLock(
            OperationType::CleanupInvalid, "Remove invalid keys",
            [](std::shared_ptr<CancellationToken>) -> boost::asio::awaitable<int> { co_return 2; });

        const bool blockedWhileFirstRan = results[0] == 1 && results[1] == 0;
        co_return std::make_pair(blockedWhileFirstRan, second == 2);
    }());

    EXPECT_TRUE(outcome.first);
    EXPECT_TRUE(outcome.second);
    EXPECT_FALSE(mgr->isHeld());
}

TEST_F(OperationLockManagerTest, WaitersAreServedInOrder) {
    auto mgr = makeManager();
    EXPECT_EQ(acquireCode(*mgr, OperationType::TranslationProject, "Translate project"),
              ErrorCode::Success);

    std::vector<std::string> order;
    auto results = run([&]() -> boost::asio::awaitable<std::vector<bool>> {
        auto waiter = [&](OperationType type, std::string name) -> boost::asio::awaitable<bool> {
            auto r = co_await mgr->acquire(type, name, waiting());
            if (!r) {
                co_return false;
            }
            order.push_back(name);
            co_await sleepFor(5ms);
            mgr->release(type);
            co_return true;
        };
        std::vector<boost::asio::awaitable<bool>> tasks;
        tasks.push_back(waiter(OperationType::CleanupUnused, "cleanup"));
        tasks.push_back(waiter(OperationType::StyleFix, "style"));
        auto releaser = [&]() -> boost::asio::awaitable<bool> {
            co_await sleepFor(20ms);
            EXPECT_EQ(mgr->stats().waiters, 2u);
            mgr->release(OperationType::TranslationProject);
            co_return true;
        };
        tasks.push_back(releaser());
        co_return co_await gatherAll(std::move(tasks));
    }());

    EXPECT_EQ(results, (std::vector<bool>{true, true, true}));
    EXPECT_EQ(order, (std::vector<std::string>{"cleanup", "style"}));
    EXPECT_FALSE(mgr->isHeld());
}

TEST_F(OperationLockManagerTest, WaitTimesOut) {
    auto mgr = makeManager();
    EXPECT_EQ(acquireCode(*mgr, OperationType::TranslationFile, "Translate en.json"),
              ErrorCode::Success);

    auto message = run([&]() -> boost::asio::awaitable<std::string> {
        auto r = co_await mgr->acquire(OperationType::StyleFix, "Fix styles", waiting(20ms));
        co_return r ? std::string{} : r.error().message;
    }());

    EXPECT_EQ(message.rfind("Timed out waiting for lock: ", 0), 0u) << message;
    EXPECT_EQ(mgr->stats().waiters, 0u);
    EXPECT_EQ(mgr->currentLock()->type, OperationType::TranslationFile);
}

TEST_F(OperationLockManagerTest, StaleLockIsReclaimedAndCancelled) {
    OperationLockManager::Config cfg;
    cfg.lockTimeout = 20ms;
    auto mgr = makeManager(cfg);

    OperationLockManager::AcquireOptions cancellable;
    cancellable.cancellable = true;
    EXPECT_EQ(acquireCode(*mgr, OperationType::Recovery, "Recover values", cancellable),
              ErrorCode::Success);
    auto token = mgr->currentLock()->cancellation;
    ASSERT_NE(token, nullptr);

    std::this_thread::sleep_for(40ms);

    EXPECT_FALSE(mgr->isHeld());
    EXPECT_TRUE(token->isCancelled());
    EXPECT_EQ(mgr->stats().staleReclaimed, 1u);
    EXPECT_EQ(acquireCode(*mgr, OperationType::CleanupUnused, "Remove unused keys"),
              ErrorCode::Success);
}

TEST_F(OperationLockManagerTest, ReclaimedHolderCannotReleaseSuccessor) {
    OperationLockManager::Config cfg;
    cfg.lockTimeout = 50ms;
    auto mgr = makeManager(cfg);

    auto snapshot = run([&]() -> boost::asio::awaitable<std::optional<OperationLockInfo>> {
        auto first = co_await mgr->withGlobalLock(
            OperationType::Recovery, "Recover en",
            [&](std::shared_ptr<CancellationToken>) -> boost::asio::awaitable<bool> {
                co_await sleepFor(80ms);
                // The first holder is stale by now; a new same-type holder takes over.
                auto second = co_await mgr->acquire(OperationType::Recovery, "Recover fr");
                co_return static_cast<bool>(second);
            });
        EXPECT_TRUE(first.has_value() && *first);
        co_return mgr->currentLock();
    }());

    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->description, "Recover fr");
    EXPECT_EQ(snapshot->count, 1u);
    EXPECT_EQ(mgr->stats().staleReclaimed, 1u);

    mgr->release(OperationType::Recovery, snapshot->generation);
    EXPECT_FALSE(mgr->isHeld());
}

TEST_F(OperationLockManagerTest, GenerationChangesWithEachHolder) {
    auto mgr = makeManager();
    EXPECT_EQ(acquireCode(*mgr, OperationType::StyleFix, "Fix styles"), ErrorCode::Success);
    const auto first = mgr->currentLock()->generation;
    EXPECT_EQ(acquireCode(*mgr, OperationType::StyleFix, "Fix more styles"), ErrorCode::Success);
    EXPECT_EQ(mgr->currentLock()->generation, first);

    mgr->release(OperationType::StyleFix, first + 1);
    EXPECT_EQ(mgr->stats().nesting, 2u);
    mgr->release(OperationType::StyleFix, first);
    mgr->release(OperationType::StyleFix, first);
    EXPECT_FALSE(mgr->isHeld());

    EXPECT_EQ(acquireCode(*mgr, OperationType::StyleFix, "Fix styles again"), ErrorCode::Success);
    EXPECT_NE(mgr->currentLock()->generation, first);
}

TEST_F(OperationLockManagerTest, ForceReleaseRejectsWaiters) {
    auto mgr = makeManager();
    EXPECT_EQ(acquireCode(*mgr, OperationType::TranslationProject, "Translate project"),
              ErrorCode::Success);

    auto codes = run([&]() -> boost::asio::awaitable<std::vector<ErrorCode>> {
        auto waiter = [&]() -> boost::asio::awaitable<ErrorCode> {
            auto r = co_await mgr->acquire(OperationType::StyleFix, "Fix styles", waiting());
            co_return r ? ErrorCode::Success : r.error().code;
        };
        auto forcer = [&]() -> boost::asio::awaitable<ErrorCode> {
            co_await sleepFor(10ms);
            mgr->forceReleaseAll();
            co_return ErrorCode::Success;
        };
        std::vector<boost::asio::awaitable<ErrorCode>> tasks;
        tasks.push_back(waiter());
        tasks.push_back(forcer());
        co_return co_await gatherAll(std::move(tasks));
    }());

    EXPECT_EQ(codes[0], ErrorCode::OperationCancelled);
    EXPECT_FALSE(mgr->isHeld());
}

TEST_F(OperationLockManagerTest, CancelCurrentSignalsToken) {
    auto mgr = makeManager();
    EXPECT_EQ(acquireCode(*mgr, OperationType::KeyManagement, "Rename keys"), ErrorCode::Success);
    EXPECT_FALSE(mgr->cancelCurrent());
    mgr->release(OperationType::KeyManagement);

    OperationLockManager::AcquireOptions cancellable;
    cancellable.cancellable = true;
    auto sawCancel = run(mgr->withGlobalLock(
        OperationType::TranslationProject, "Translate project",
        [&](std::shared_ptr<CancellationToken> token) -> boost::asio::awaitable<bool> {
            EXPECT_NE(token, nullptr);
            EXPECT_TRUE(mgr->cancelCurrent());
            co_return isCancelled(token);
        },
        cancellable));

    ASSERT_TRUE(sawCancel.has_value());
    EXPECT_TRUE(*sawCancel);
    EXPECT_FALSE(mgr->isHeld());
}

TEST_F(OperationLockManagerTest, FileLockExcludesOtherHolders) {
    auto mgr = makeManager();
    const std::string path = "/ws/locales/en.json";

    auto outcome = run([&]() -> boost::asio::awaitable<std::vector<bool>> {
        std::vector<bool> out;
        out.push_back(co_await mgr->acquireFileLock(path, OperationType::TranslationFile));
        out.push_back(co_await mgr->acquireFileLock(path, OperationType::CleanupUnused));
        out.push_back(co_await mgr->acquireFileLock(path, OperationType::TranslationFile));
        mgr->releaseFileLock(path);
        out.push_back(co_await mgr->acquireFileLock(path, OperationType::CleanupUnused));
        co_return out;
    }());

    EXPECT_EQ(outcome, (std::vector<bool>{true, false, true, true}));
    EXPECT_EQ(mgr->stats().fileLocks, 1u);
}

TEST_F(OperationLockManagerTest, WithFileLockReportsContention) {
    auto mgr = makeManager();
    const std::string path = "/ws/locales/fr.json";

    auto message = run([&]() -> boost::asio::awaitable<std::string> {
        co_await mgr->acquireFileLock(path, OperationType::KeyManagement);
        auto r = co_await mgr->withFileLock(path, OperationType::StyleFix,
                                            []() -> boost::asio::awaitable<Result<void>> {
                                                co_return Result<void>();
                                            });
        co_return r ? std::string{} : r.error().message;
    }());

    EXPECT_EQ(message, "File is locked by another operation: " + path);
}

TEST_F(OperationLockManagerTest, StaleFileLockIsReclaimed) {
    OperationLockManager::Config cfg;
    cfg.fileLockTimeout = 20ms;
    cfg.fileWriteDelay = 0ms;
    auto mgr = makeManager(cfg);
    const std::string path = "/ws/locales/de.json";

    EXPECT_TRUE(run(mgr->acquireFileLock(path, OperationType::TranslationFile)));
    std::this_thread::sleep_for(40ms);
    EXPECT_TRUE(run(mgr->acquireFileLock(path, OperationType::CleanupInvalid)));
}

TEST_F(OperationLockManagerTest, WritesAreSpacedByWriteDelay) {
    OperationLockManager::Config cfg;
    cfg.fileWriteDelay = 30ms;
    auto mgr = makeManager(cfg);

    const auto start = std::chrono::steady_clock::now();
    auto ok = run([&]() -> boost::asio::awaitable<bool> {
        bool all = true;
        for (const char* path : {"/ws/a.json", "/ws/b.json", "/ws/c.json"}) {
            all = co_await mgr->acquireFileLock(path, OperationType::TranslationFile) && all;
            mgr->releaseFileLock(path);
        }
        co_return all;
    }());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(ok);
    EXPECT_GE(elapsed, 55ms);
}

TEST(OperationTypeTest, Names) {
    EXPECT_STREQ(operationTypeToString(OperationType::TranslationProject), "translation-project");
    EXPECT_STREQ(operationTypeToString(OperationType::CleanupInvalid), "cleanup-invalid");
    EXPECT_STREQ(operationTypeToString(OperationType::Recovery), "recovery");
}

TEST(OperationLockConfigTest, TakesTimingsFromRecoveryConfig) {
    config::RecoveryConfig cfg;
    cfg.locks.lockTimeout = 1000ms;
    cfg.locks.fileWriteDelay = 0ms;

    auto lockCfg = OperationLockManager::Config::fromRecoveryConfig(cfg.locks);

    EXPECT_EQ(lockCfg.lockTimeout, 1000ms);
    EXPECT_EQ(lockCfg.fileLockTimeout, 30'000ms);
    EXPECT_EQ(lockCfg.fileWriteDelay, 0ms);
    EXPECT_EQ(lockCfg.waitTimeout, 30'000ms);
}

} // namespace
