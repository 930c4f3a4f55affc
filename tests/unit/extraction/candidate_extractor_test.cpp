#include <gtest/gtest.h>

#include <keyrescue/extraction/candidate_extractor.h>

#include <algorithm>

using namespace keyrescue::extraction;

namespace {

bool containsText(const std::vector<Candidate>& candidates, const std::string& text) {
    return std::any_of(candidates.begin(), candidates.end(),
                       [&](const Candidate& c) { return c.text == text; });
}

TEST(CandidateExtractorTest, SourceBonuses) {
    EXPECT_EQ(sourceBonus(CandidateSource::CallArgument), 6);
    EXPECT_EQ(sourceBonus(CandidateSource::UiProp), 5);
    EXPECT_EQ(sourceBonus(CandidateSource::ObjectProperty), 4);
    EXPECT_EQ(sourceBonus(CandidateSource::TagText), 2);
    EXPECT_EQ(sourceBonus(CandidateSource::QuotedLiteral), 0);
}

TEST(CandidateExtractorTest, ScoresHintWordsAndShape) {
    ScoringContext ctx{{"invalid", "credentials"}, {}};
    // 2 hints (+20), capital, terminal, space, 3+ words, length, "please", call bonus.
    EXPECT_EQ(scoreCandidate("Invalid credentials, please try again.", ctx,
                             sourceBonus(CandidateSource::CallArgument)),
              38);

    ScoringContext none;
    EXPECT_EQ(scoreCandidate("Invalid input", ctx) - scoreCandidate("Invalid input", none), 10);
    EXPECT_LT(scoreCandidate("handleClick", none), 0);
}

TEST(CandidateExtractorTest, PlaceholderHintsScoreThree) {
    ScoringContext with{{}, {"count"}};
    ScoringContext without;
    EXPECT_EQ(scoreCandidate("You have {count} items", with) -
                  scoreCandidate("You have {count} items", without),
              3);
}

TEST(CandidateExtractorTest, LabeledCallArgumentRanksFirst) {
    const std::string source = R"(const other = "Something else entirely";
toast("Invalid credentials, please try again.");
)";
    ScoringContext ctx{{"invalid", "credentials"}, {}};
    auto candidates = extractCandidates(source, ctx);
    ASSERT_GE(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].text, "Invalid credentials, please try again.");
    EXPECT_EQ(candidates[0].score, 38);
    EXPECT_TRUE(containsText(candidates, "Something else entirely"));
}

TEST(CandidateExtractorTest, EachTextAppearsOnce) {
    const std::string source = R"(<button title="Save changes">Save changes</button>
alert('Save changes');
)";
    auto candidates = extractCandidates(source, ScoringContext{});
    EXPECT_EQ(std::count_if(candidates.begin(), candidates.end(),
                            [](const Candidate& c) { return c.text == "Save changes"; }),
              1);
}

TEST(CandidateExtractorTest, FindsTagTextAndTemplateLiterals) {
    const std::string source = "<p>Welcome back,\n   friend</p>\nconst s = `Hello ${user.name}, welcome`;\n";
    auto candidates = extractCandidates(source, ScoringContext{});
    EXPECT_TRUE(containsText(candidates, "Welcome back, friend"));
    EXPECT_TRUE(containsText(candidates, "Hello {value1}, welcome"));
}

TEST(CandidateExtractorTest, SkipsStyleLinesAndCode) {
    const std::string source = R"(<div className="Primary action button"></div>
import Login from "./components/Login";
const handler = "handleSubmit";
)";
    auto candidates = extractCandidates(source, ScoringContext{});
    EXPECT_TRUE(candidates.empty());
}

TEST(CandidateExtractorTest, SurvivesVeryLongLiterals) {
    const std::string blob(200000, 'a');
    const std::string source = "const icon = \"" + blob + "\";\n"
                               "const hint = { title: '" + blob + "' };\n"
                               "<span>" + blob + "</span>\n"
                               "showError(\"Invalid credentials, please try again.\");\n";
    ScoringContext ctx{{"invalid", "credentials"}, {}};
    auto candidates = extractCandidates(source, ctx);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].text, "Invalid credentials, please try again.");
    EXPECT_EQ(candidates[0].score, 38);
}

TEST(CandidateExtractorTest, ScoringOverlongTextSkipsShapeChecks) {
    const std::string blob(200000, 'a');
    ScoringContext ctx{{"aaa"}, {}};
    // Hint (+10) and nothing else: no capital, no space, too long for the length bonus.
    EXPECT_EQ(scoreCandidate(blob, ctx), 10);
    EXPECT_FALSE(meetsHintQuota(blob, ScoringContext{{"x", "y"}, {"z"}}));
}

TEST(CandidateExtractorTest, NormalizesTemplateLiterals) {
    EXPECT_EQ(normalizeTemplateLiteral("Hello ${user.name}, you have ${items.filter(x => { return x; }).length} items"),
              "Hello {value1}, you have {value2} items");
    EXPECT_EQ(normalizeTemplateLiteral("  spaced\n  out  "), "spaced out");
    EXPECT_FALSE(normalizeTemplateLiteral("${a}${b}").has_value());
    EXPECT_FALSE(normalizeTemplateLiteral("${a} - ${b}").has_value());
}

TEST(CandidateExtractorTest, KeyLikeText) {
    EXPECT_TRUE(isKeyLike("auth.errors.invalid"));
    EXPECT_FALSE(isKeyLike("Done. Next step"));
    EXPECT_FALSE(isKeyLike("Done"));
}

TEST(CandidateExtractorTest, HintQuota) {
    ScoringContext three{{"invalid", "credentials", "login"}, {}};
    EXPECT_TRUE(meetsHintQuota("Invalid credentials", three));
    EXPECT_FALSE(meetsHintQuota("Invalid input", three));
    // One short of the quota is enough when a placeholder is present.
    EXPECT_TRUE(meetsHintQuota("Invalid value for {field}", three));

    ScoringContext one{{"welcome"}, {}};
    EXPECT_TRUE(meetsHintQuota("Welcome aboard", one));
    EXPECT_FALSE(meetsHintQuota("Good morning", one));
}

TEST(CandidateExtractorTest, AcceptanceGate) {
    ScoringContext ctx{{"welcome"}, {"name"}};
    EXPECT_TRUE(isAcceptable("Welcome back, {name}!", ctx));
    EXPECT_TRUE(isAcceptable("  Welcome aboard  ", ctx));
    EXPECT_FALSE(isAcceptable("Welcome", ctx));
    EXPECT_FALSE(isAcceptable("welcome.title", ctx));
    EXPECT_FALSE(isAcceptable("Welcome\naboard", ctx));
    EXPECT_FALSE(isAcceptable("Good morning", ctx));
    EXPECT_FALSE(isAcceptable("Welcome " + std::string(160, 'x'), ctx));
}

} // namespace
