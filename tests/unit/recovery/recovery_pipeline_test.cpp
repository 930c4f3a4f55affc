#include <gtest/gtest.h>

#include "../../common/fake_history_source.h"
#include "../../common/test_helpers.h"

#include <keyrescue/recovery/recovery_pipeline.h>

using namespace keyrescue;
using namespace keyrescue::recovery;
using namespace std::chrono_literals;

namespace {

constexpr const char* kLocaleRoot = "resources/js/i18n/auto";

class RecoveryPipelineTest : public test::AsyncTest {
protected:
    void SetUp() override {
        test::AsyncTest::SetUp();
        history = std::make_shared<test::FakeHistorySource>();
        pipeline = std::make_unique<RecoveryPipeline>(history, config::RecoveryConfig{},
                                                      blockingExecutor());
    }

    void TearDown() override {
        pipeline.reset();
        test::AsyncTest::TearDown();
    }

    std::string localePath(const std::string& locale, const std::string& file) const {
        return std::string(kLocaleRoot) + "/" + locale + "/" + file;
    }

    std::optional<RecoveryResult> recover(const std::string& locale, const std::string& key,
                                          RecoveryOptions options = {}) {
        return run(pipeline->recover(testDir, locale, key, std::move(options)));
    }

    // Login form whose toast message was replaced by a translation call in C2
    void setUpIntroducedCall() {
        const std::string before = "export function onLogin(res) {\n"
                                   "  if (!res.ok) {\n"
                                   "    toast(\"Invalid credentials, please try again.\");\n"
                                   "  }\n"
                                   "}\n";
        const std::string after = "export function onLogin(res) {\n"
                                  "  if (!res.ok) {\n"
                                  "    toast(t('auth.errors.invalid_credentials'));\n"
                                  "  }\n"
                                  "}\n";
        const std::string locale = "{\n  \"errors\": {\n    \"required\": \"Required\"\n  }\n}\n";

        writeFile(localePath("en", "auth.json"), locale);
        writeFile("src/components/Login.tsx", after);

        history->addCommit("C0", {{localePath("en", "auth.json"), locale}}, "add locales");
        history->addCommit("C1", {{"src/components/Login.tsx", before}}, "login form");
        history->addCommit("C2", {{"src/components/Login.tsx", after}}, "extract strings");
    }

    std::shared_ptr<test::FakeHistorySource> history;
    std::unique_ptr<RecoveryPipeline> pipeline;
};

TEST_F(RecoveryPipelineTest, RecoversValueFromDiffThatIntroducedCall) {
    setUpIntroducedCall();

    auto result = recover("en", "auth.errors.invalid_credentials");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "Invalid credentials, please try again.");
    EXPECT_EQ(result->source, "diff:C1..C2");
}

TEST_F(RecoveryPipelineTest, HeadValueNeedsNoHistory) {
    writeFile(localePath("en", "auth.json"),
              R"({"errors": {"invalid_credentials": "Invalid email or password."}})");
    history->addCommit("C1", {{localePath("en", "auth.json"), "{}"}});

    auto result = recover("en", "auth.errors.invalid_credentials");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "Invalid email or password.");
    EXPECT_EQ(result->source, "head");
    EXPECT_EQ(history->totalCalls(), 0u);
}

TEST_F(RecoveryPipelineTest, HeadOfAnotherLocaleIsTaggedWithThatLocale) {
    writeFile(localePath("en", "common.json"), R"({"save": "Save changes"})");
    writeFile(localePath("fr", "common.json"), R"({"cancel": "Annuler"})");

    auto result = recover("fr", "common.save");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "Save changes");
    EXPECT_EQ(result->source, "head:en");
}

TEST_F(RecoveryPipelineTest, SuspiciousPlaceholderFallsThroughToHistory) {
    const auto rel = localePath("en", "greetings.json");
    writeFile(rel, R"({"welcome": "Hello {name}"})");
    history->addCommit("C1", {{rel, R"({"welcome": "Welcome back"})"}});
    history->addCommit("C2", {{rel, R"({"welcome": "Hello {name}"})"}});

    RecoveryOptions options;
    options.callOptionNames = std::set<std::string>{"count"};
    auto result = recover("en", "greetings.welcome", options);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "Welcome back");
    EXPECT_EQ(result->source, "history:C1");
}

TEST_F(RecoveryPipelineTest, PlaceholdersAreNotCheckedWithoutOptionNames) {
    writeFile(localePath("en", "greetings.json"), R"({"welcome": "Hello {name}"})");

    auto result = recover("en", "greetings.welcome");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "Hello {name}");
    EXPECT_EQ(result->source, "head");
}

TEST_F(RecoveryPipelineTest, KnownPlaceholderIsAccepted) {
    writeFile(localePath("en", "greetings.json"), R"({"welcome": "Hello {Name}"})");

    RecoveryOptions options;
    options.callOptionNames = std::set<std::string>{"name"};
    auto result = recover("en", "greetings.welcome", options);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->source, "head");
}

TEST_F(RecoveryPipelineTest, ExtractionRefWinsOverHead) {
    const auto rel = localePath("en", "nav.json");
    writeFile(rel, R"({"home": "Home"})");
    history->addCommit("R1", {{rel, R"({"home": "Go to dashboard"})"}});

    RecoveryOptions options;
    options.extractRef = "R1";
    auto result = recover("en", "nav.home", options);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "Go to dashboard");
    EXPECT_EQ(result->source, "ref:R1");
}

TEST_F(RecoveryPipelineTest, ContaminatedHistoryIsAbandonedForThatLocale) {
    const auto en = localePath("en", "cart.json");
    const auto fr = localePath("fr", "cart.json");
    writeFile(en, "{}");
    writeFile(fr, "{}");
    history->addCommit("F1", {{fr, R"({"items_label": "Articles du panier"})"}});
    history->addCommit("E1", {{en, R"({"items_label": "Items in cart"})"}});
    history->addCommit("E2", {{en, R"({"items_label": "Total Count items"})"}});
    history->addCommit("X1", {{en, "{}"}, {fr, "{}"}});

    auto result = recover("en", "cart.items_label");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "Articles du panier");
    EXPECT_EQ(result->source, "history:fr:F1");
}

TEST_F(RecoveryPipelineTest, HistoryOfTargetLocaleUsesNewestUsableCommit) {
    const auto rel = localePath("en", "profile.json");
    writeFile(rel, "{}");
    history->addCommit("P1", {{rel, R"({"title": "Profile"})"}});
    history->addCommit("P2", {{rel, R"({"title": "Your profile"})"}});
    history->addCommit("P3", {{rel, "{}"}});

    auto result = recover("en", "profile.title");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "Your profile");
    EXPECT_EQ(result->source, "history:P2");
}

TEST_F(RecoveryPipelineTest, UnrecoverableKeyIsNull) {
    writeFile(localePath("en", "auth.json"), R"({"login": "Log in"})");

    EXPECT_FALSE(recover("en", "auth.missing_entirely").has_value());
}

TEST_F(RecoveryPipelineTest, MissingHistoryDegradesToNull) {
    setUpIntroducedCall();
    history->setAvailable(false);

    EXPECT_FALSE(recover("en", "auth.errors.invalid_credentials").has_value());
}

TEST_F(RecoveryPipelineTest, SecondRecoveryIsServedFromCache) {
    setUpIntroducedCall();

    auto first = recover("en", "auth.errors.invalid_credentials");
    const auto callsAfterFirst = history->totalCalls();
    auto second = recover("en", "auth.errors.invalid_credentials");

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(history->totalCalls(), callsAfterFirst);
    EXPECT_EQ(pipeline->cachedResultCount(), 1u);
}

TEST_F(RecoveryPipelineTest, EquivalentWorkspacePathsShareSessionCache) {
    setUpIntroducedCall();

    auto first = run(pipeline->recover(testDir, "en", "auth.errors.invalid_credentials"));
    const auto callsAfterFirst = history->totalCalls();
    auto dotted = run(pipeline->recover(testDir / ".", "en", "auth.errors.invalid_credentials"));
    auto slashed = run(pipeline->recover(testDir / "", "en", "auth.errors.invalid_credentials"));

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(dotted.has_value());
    ASSERT_TRUE(slashed.has_value());
    EXPECT_EQ(*first, *dotted);
    EXPECT_EQ(*first, *slashed);
    EXPECT_EQ(history->totalCalls(), callsAfterFirst);
    EXPECT_EQ(pipeline->cachedResultCount(), 1u);
    EXPECT_EQ(pipeline->snapshots().size(), 1u);
}

TEST_F(RecoveryPipelineTest, WiderLookbackReachesOlderHistory) {
    const auto rel = localePath("en", "auth.json");
    const auto now = std::chrono::system_clock::now();
    writeFile(rel, "{}");
    history->addCommit("H1", {{rel, R"({"errors": {"invalid_credentials": "Invalid email or password."}})"}},
                       "update", now - 24h * 30);
    history->addCommit("H2", {{rel, "{}"}}, "update", now);

    RecoveryOptions narrow;
    narrow.daysBack = 1;
    EXPECT_FALSE(recover("en", "auth.errors.invalid_credentials", narrow).has_value());

    RecoveryOptions wide;
    wide.daysBack = 365;
    auto result = recover("en", "auth.errors.invalid_credentials", wide);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "Invalid email or password.");
    EXPECT_EQ(result->source, "history:H1");
}

TEST_F(RecoveryPipelineTest, TranslationCommitDiffIsCheckedFirst) {
    // The text became t('auth.invalid') in an i18n commit; the key was renamed later.
    const std::string original = "export function onLogin(res) {\n"
                                 "  if (!res.ok) {\n"
                                 "    toast(\"Invalid credentials, please try again.\");\n"
                                 "  }\n"
                                 "}\n";
    const std::string extracted = "export function onLogin(res) {\n"
                                  "  if (!res.ok) {\n"
                                  "    toast(t('auth.invalid'));\n"
                                  "  }\n"
                                  "}\n";
    const std::string renamed = "export function onLogin(res) {\n"
                                "  if (!res.ok) {\n"
                                "    toast(t('auth.errors.invalid_credentials'));\n"
                                "  }\n"
                                "}\n";
    writeFile("src/components/Login.tsx", renamed);
    history->addCommit("S1", {{"src/components/Login.tsx", original}}, "login form");
    history->addCommit("S2", {{"src/components/Login.tsx", extracted}}, "i18n: extract login strings");
    history->addCommit("S3", {{"src/components/Login.tsx", renamed}}, "rename keys");

    auto result = recover("en", "auth.errors.invalid_credentials");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "Invalid credentials, please try again.");
    EXPECT_EQ(result->source, "diff:S1..S2");
}

TEST_F(RecoveryPipelineTest, BestMatchAcrossCommitsWithoutCall) {
    // The call exists only in the working copy; no commit introduces it.
    const auto file = [](const std::string& line) {
        return "export function onLogin(res) {\n  if (!res.ok) {\n    " + line + "\n  }\n}\n";
    };
    writeFile("src/components/Login.tsx", file("toast(t('auth.errors.invalid_credentials'));"));
    history->addCommit("S1", {{"src/components/Login.tsx",
                               file("toast(\"Invalid credentials, please try again.\");")}},
                       "login form");
    history->addCommit("S2", {{"src/components/Login.tsx", file("toast(\"Invalid credentials\");")}},
                       "shorter message");

    auto result = recover("en", "auth.errors.invalid_credentials");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, "Invalid credentials, please try again.");
    EXPECT_EQ(result->source, "source:S1:src/components/Login.tsx");
}

TEST_F(RecoveryPipelineTest, ClearCacheForgetsResults) {
    writeFile(localePath("en", "auth.json"), R"({"login": "Log in"})");
    ASSERT_TRUE(recover("en", "auth.login").has_value());
    EXPECT_EQ(pipeline->cachedResultCount(), 1u);

    pipeline->clearCache();

    EXPECT_EQ(pipeline->cachedResultCount(), 0u);
    EXPECT_EQ(pipeline->snapshots().size(), 0u);
}

TEST_F(RecoveryPipelineTest, BatchCoversEveryKeyAndMatchesSingleRecovery) {
    setUpIntroducedCall();
    writeFile(localePath("en", "nav.json"), R"({"home": "Home"})");

    auto batch = run(pipeline->recoverBatch(
        testDir, {"nav.home", "auth.errors.invalid_credentials", "nav.nowhere", ""}, "en"));

    ASSERT_EQ(batch.size(), 4u);
    ASSERT_TRUE(batch["nav.home"].has_value());
    EXPECT_EQ(batch["nav.home"]->source, "head");
    ASSERT_TRUE(batch["auth.errors.invalid_credentials"].has_value());
    EXPECT_EQ(batch["auth.errors.invalid_credentials"]->source, "diff:C1..C2");
    EXPECT_FALSE(batch["nav.nowhere"].has_value());
    EXPECT_FALSE(batch[""].has_value());

    pipeline->clearCache();
    auto single = recover("en", "auth.errors.invalid_credentials");
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(*single, *batch["auth.errors.invalid_credentials"]);
}

TEST_F(RecoveryPipelineTest, CancelledRecoveryStopsBeforeHistory) {
    setUpIntroducedCall();

    RecoveryOptions options;
    options.cancel = std::make_shared<CancellationToken>();
    options.cancel->cancel();

    EXPECT_FALSE(recover("en", "auth.errors.invalid_credentials", options).has_value());
    EXPECT_EQ(history->totalCalls(), 0u);
}

} // namespace
