#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

#include <keyrescue/core/parallel.h>
#include <keyrescue/locale/locale_file_writer.h>
#include <keyrescue/locale/locale_tree.h>

using namespace keyrescue;
using namespace keyrescue::locale;
using concurrency::OperationType;

namespace {

class LocaleFileWriterTest : public test::AsyncTest {
protected:
    void SetUp() override {
        test::AsyncTest::SetUp();
        concurrency::OperationLockManager::Config cfg;
        cfg.fileWriteDelay = std::chrono::milliseconds{0};
        locks = std::make_unique<concurrency::OperationLockManager>(executor(), cfg);
        mutex = std::make_unique<concurrency::FileMutex>(executor());
        writer = std::make_unique<LocaleFileWriter>(*locks, *mutex, blockingExecutor());
    }

    void TearDown() override {
        writer.reset();
        mutex.reset();
        locks.reset();
        test::AsyncTest::TearDown();
    }

    Result<void> apply(const std::filesystem::path& path,
                       std::map<std::string, std::string> updates,
                       OperationType holder = OperationType::Recovery) {
        return run(writer->applyUpdates(path, std::move(updates), holder));
    }

    std::unique_ptr<concurrency::OperationLockManager> locks;
    std::unique_ptr<concurrency::FileMutex> mutex;
    std::unique_ptr<LocaleFileWriter> writer;
};

TEST_F(LocaleFileWriterTest, MergesIntoExistingFile) {
    auto path = writeFile("locales/en/auth.json", R"({"login": "Log in", "errors": {}})");

    auto result = apply(path, {{"errors.invalid_credentials", "Invalid credentials."},
                               {"logout", "Log out"}});

    ASSERT_TRUE(result) << result.error().message;
    auto tree = parseLocaleTree(test::readFile(path));
    ASSERT_TRUE(tree);
    EXPECT_EQ(getNestedValue(*tree, "login"), "Log in");
    EXPECT_EQ(getNestedValue(*tree, "errors.invalid_credentials"), "Invalid credentials.");
    EXPECT_EQ(getNestedValue(*tree, "logout"), "Log out");
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));
}

TEST_F(LocaleFileWriterTest, CreatesMissingFile) {
    auto path = testDir / "locales" / "fr" / "auth.json";

    ASSERT_TRUE(apply(path, {{"login", "Connexion"}}));

    auto tree = parseLocaleTree(test::readFile(path));
    ASSERT_TRUE(tree);
    EXPECT_EQ(getNestedValue(*tree, "login"), "Connexion");
}

TEST_F(LocaleFileWriterTest, BlockedPathIsSkipped) {
    auto path = writeFile("locales/en/auth.json", R"({"errors": "flat"})");

    ASSERT_TRUE(apply(path, {{"errors.invalid", "Invalid"}, {"title", "Sign in"}}));

    auto tree = parseLocaleTree(test::readFile(path));
    ASSERT_TRUE(tree);
    EXPECT_EQ(getNestedValue(*tree, "errors"), "flat");
    EXPECT_EQ(getNestedValue(*tree, "title"), "Sign in");
}

TEST_F(LocaleFileWriterTest, LockedFileIsReported) {
    auto path = writeFile("locales/en/auth.json", "{}");
    ASSERT_TRUE(run(locks->acquireFileLock(path.lexically_normal().string(),
                                           OperationType::TranslationFile)));

    auto result = apply(path, {{"title", "Sign in"}}, OperationType::CleanupUnused);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::OperationInProgress);
    EXPECT_EQ(test::readFile(path), "{}");
}

TEST_F(LocaleFileWriterTest, EmptyUpdateLeavesFileUntouched) {
    auto path = writeFile("locales/en/auth.json", "{ \"a\" : \"b\" }");

    ASSERT_TRUE(apply(path, {}));

    EXPECT_EQ(test::readFile(path), "{ \"a\" : \"b\" }");
}

TEST_F(LocaleFileWriterTest, ConcurrentWritersDoNotLoseUpdates) {
    auto path = writeFile("locales/en/common.json", "{}");

    auto ok = run([&]() -> boost::asio::awaitable<bool> {
        std::vector<boost::asio::awaitable<Result<void>>> writes;
        for (int i = 0; i < 5; ++i) {
            writes.push_back(writer->applyUpdates(
                path, {{"k" + std::to_string(i), "Value " + std::to_string(i)}},
                OperationType::TranslationFile));
        }
        auto results = co_await gatherAll(std::move(writes));
        bool all = true;
        for (const auto& r : results) {
            all = all && static_cast<bool>(r);
        }
        co_return all;
    }());

    EXPECT_TRUE(ok);
    auto tree = parseLocaleTree(test::readFile(path));
    ASSERT_TRUE(tree);
    EXPECT_EQ(tree->size(), 5u);
}

} // namespace
