#include <gtest/gtest.h>

#include <keyrescue/extraction/text_rules.h>

using namespace keyrescue::extraction;

namespace {

TEST(TextRulesTest, RulesRunInPriorityOrder) {
    auto rules = userTextRules();
    ASSERT_EQ(rules.size(), 5u);
    EXPECT_EQ(rules[0].name, "hasLetter");
    EXPECT_EQ(rules[1].name, "isCssClassLike");
    EXPECT_EQ(rules[2].name, "isCodePatternLike");
    EXPECT_EQ(rules[3].name, "isMultiWord");
    EXPECT_EQ(rules[4].name, "isUserTextLike");
}

TEST(TextRulesTest, RejectsTextWithoutLetters) {
    for (const char* text : {"a", "123", "12.5", "--", "  "}) {
        auto result = classifyText(text);
        EXPECT_EQ(result.verdict, Verdict::Reject) << text;
        EXPECT_EQ(result.rule, "hasLetter") << text;
    }
}

TEST(TextRulesTest, RejectsUtilityClasses) {
    for (const char* text : {"flex items-center", "btn-primary", "px-4 py-2", "md:hidden"}) {
        auto result = classifyText(text);
        EXPECT_EQ(result.verdict, Verdict::Reject) << text;
        EXPECT_EQ(result.rule, "isCssClassLike") << text;
    }
}

TEST(TextRulesTest, RejectsCodeShapes) {
    for (const char* text : {"handleSubmit", "https://example.com/login", "./components/Login",
                             "Login.vue", "{name}", "#ff00aa", "onClick", "@/stores/auth"}) {
        EXPECT_TRUE(isCodePatternLike(text)) << text;
        EXPECT_FALSE(looksLikeUserText(text)) << text;
    }
}

TEST(TextRulesTest, AcceptsUiText) {
    auto multi = classifyText("Invalid credentials, please try again.");
    EXPECT_EQ(multi.verdict, Verdict::Accept);
    EXPECT_EQ(multi.rule, "isMultiWord");

    auto single = classifyText("Save!");
    EXPECT_EQ(single.verdict, Verdict::Accept);
    EXPECT_EQ(single.rule, "isUserTextLike");

    EXPECT_TRUE(looksLikeUserText("Done!"));
    EXPECT_TRUE(looksLikeUserText("Hello {name}, welcome"));
}

TEST(TextRulesTest, SingleLowercaseIdentifierIsNotUserText) {
    EXPECT_FALSE(looksLikeUserText("submit"));
    EXPECT_FALSE(looksLikeUserText("user_id"));
}

// The identifier shape is case-insensitive, so a bare capitalized word is code.
TEST(TextRulesTest, BareCapitalizedWordIsIdentifier) {
    auto result = classifyText("Save");
    EXPECT_EQ(result.verdict, Verdict::Reject);
    EXPECT_EQ(result.rule, "isCodePatternLike");
}

TEST(TextRulesTest, OverlongTextIsRejectedWithoutMatching) {
    const std::string blob(200000, 'a');
    auto result = classifyText(blob);
    EXPECT_EQ(result.verdict, Verdict::Reject);
    EXPECT_EQ(result.rule, "tooLong");
    EXPECT_FALSE(isCssClassLike(blob));
    EXPECT_TRUE(isCodePatternLike(blob));
    EXPECT_FALSE(isUserTextLike("Hello " + blob));

    const std::string atLimit = "Hello " + std::string(kMaxRegexInput - 6, 'a');
    EXPECT_EQ(classifyText(atLimit).verdict, Verdict::Accept);
}

TEST(TextRulesTest, CountsWords) {
    EXPECT_EQ(countWords("  one\ttwo  three "), 3u);
    EXPECT_EQ(countWords(""), 0u);
}

} // namespace
