#include <gtest/gtest.h>

#include <keyrescue/locale/translation_key.h>

using namespace keyrescue::locale;

namespace {

TEST(TranslationKeyTest, SplitsAndTrimsSegments) {
    EXPECT_EQ(splitKeySegments("auth.errors.invalid"),
              (std::vector<std::string>{"auth", "errors", "invalid"}));
    EXPECT_EQ(splitKeySegments(" a . b ..c."), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(splitKeySegments("...").empty());
}

TEST(TranslationKeyTest, NormalizesKeys) {
    EXPECT_EQ(normalizeKey("auth..login "), "auth.login");
    EXPECT_FALSE(normalizeKey("").has_value());
    EXPECT_FALSE(normalizeKey(" . ").has_value());
}

TEST(TranslationKeyTest, VariationsForDeepKey) {
    EXPECT_EQ(getKeyPathVariations("app.auth.errors.invalid_credentials"),
              (std::vector<std::string>{"app.auth.errors.invalid_credentials",
                                        "auth.errors.invalid_credentials",
                                        "errors.invalid_credentials", "invalid_credentials"}));
}

TEST(TranslationKeyTest, VariationsAreDeduplicated) {
    EXPECT_EQ(getKeyPathVariations("common.save"),
              (std::vector<std::string>{"common.save", "save"}));
    EXPECT_EQ(getKeyPathVariations("title"), (std::vector<std::string>{"title"}));
}

TEST(TranslationKeyTest, InvalidKeyHasNoVariations) {
    EXPECT_TRUE(getKeyPathVariations("").empty());
    EXPECT_TRUE(getKeyPathVariations(". .").empty());
}

} // namespace
