#include <keyrescue/common/pattern_utils.h>
#include <keyrescue/extraction/text_rules.h>

#include <array>
#include <cctype>
#include <regex>
#include <string>
#include <vector>

namespace keyrescue::extraction {

namespace {

bool search(const std::regex& re, std::string_view text) {
    return std::regex_search(text.begin(), text.end(), re);
}

bool matchWhole(const std::regex& re, std::string_view text) {
    return std::regex_match(text.begin(), text.end(), re);
}

bool containsSpace(std::string_view text) {
    return text.find(' ') != std::string_view::npos;
}

std::vector<std::string_view> splitWhitespace(std::string_view text) {
    std::vector<std::string_view> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
            ++i;
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i])))
            ++i;
        if (i > start) {
            tokens.push_back(text.substr(start, i - start));
        }
    }
    return tokens;
}

Verdict hasLetterRule(std::string_view text) {
    if (text.size() < 2) {
        return Verdict::Reject;
    }
    for (char c : text) {
        if (std::isalpha(static_cast<unsigned char>(c))) {
            return Verdict::Abstain;
        }
    }
    return Verdict::Reject;
}

Verdict cssClassRule(std::string_view text) {
    return isCssClassLike(text) ? Verdict::Reject : Verdict::Abstain;
}

Verdict codePatternRule(std::string_view text) {
    return isCodePatternLike(text) ? Verdict::Reject : Verdict::Abstain;
}

Verdict multiWordRule(std::string_view text) {
    return countWords(text) >= 2 ? Verdict::Accept : Verdict::Abstain;
}

Verdict userTextRule(std::string_view text) {
    return isUserTextLike(text) ? Verdict::Accept : Verdict::Reject;
}

constexpr std::array<TextRule, 5> kRules = {{
    {"hasLetter", &hasLetterRule},
    {"isCssClassLike", &cssClassRule},
    {"isCodePatternLike", &codePatternRule},
    {"isMultiWord", &multiWordRule},
    {"isUserTextLike", &userTextRule},
}};

} // namespace

std::size_t countWords(std::string_view text) {
    return splitWhitespace(text).size();
}

bool isCssClassLike(std::string_view raw) {
    const auto text = common::trim(raw);
    if (text.empty() || text.size() > kMaxRegexInput) {
        return false;
    }

    static const std::vector<std::regex> kCssPatterns = {
        std::regex(R"(^[a-z]+-[a-z0-9-]+(\s+[a-z]+-[a-z0-9-]+)*$)", std::regex::icase),
        std::regex(R"(\b(flex|grid|block|inline|hidden|absolute|relative|fixed)\b)"),
        std::regex(R"(\b(w-|h-|p-|m-|px-|py-|mx-|my-|pt-|pb-|pl-|pr-|mt-|mb-|ml-|mr-))"),
        std::regex(R"(\b(text-|bg-|border-|rounded|shadow|overflow|cursor|opacity))"),
        std::regex(R"(\b(sm:|md:|lg:|xl:|2xl:|hover:|focus:|active:|dark:))"),
        std::regex(R"(\b(justify-|items-|self-|gap-|space-))"),
        std::regex(R"(\b(font-|leading-|tracking-))"),
        std::regex(R"(\b(z-\d|top-|bottom-|left-|right-))"),
        std::regex(R"(^[a-z][a-z0-9]*(-[a-z0-9]+)+(\s|$))"),
    };
    for (const auto& re : kCssPatterns) {
        if (search(re, text)) {
            return true;
        }
    }

    static const std::regex kHyphenToken(R"(^[a-z][a-z0-9]*(-[a-z0-9]+)+$)", std::regex::icase);
    static const std::regex kBreakpointToken(R"(^(sm|md|lg|xl|2xl|hover|focus|dark):)");

    auto tokens = splitWhitespace(text);
    if (tokens.size() >= 2) {
        std::size_t cssLike = 0;
        for (auto token : tokens) {
            if (matchWhole(kHyphenToken, token) || search(kBreakpointToken, token)) {
                ++cssLike;
            }
        }
        if (cssLike * 2 >= tokens.size()) {
            return true;
        }
    }
    return false;
}

bool isCodePatternLike(std::string_view raw) {
    const auto text = common::trim(raw);
    if (text.size() > kMaxRegexInput) {
        return true;
    }

    static const std::regex kIdentifier(R"(^[a-z_][a-z0-9_]*$)", std::regex::icase);
    static const std::regex kUrl(R"(^(https?:|mailto:|tel:|//|www\.))");
    static const std::regex kPathStart(R"(^[./\\])");
    static const std::regex kFileExt(R"(\.(ts|tsx|js|jsx|vue|json|css|scss|html|php|blade\.php)$)",
                                     std::regex::icase);
    static const std::regex kTemplateExpr(R"(^\$\{.*\}$)");
    static const std::regex kMustache(R"(^\{\{.*\}\}$)");
    static const std::regex kBarePlaceholder(R"(^\{[a-zA-Z_][a-zA-Z0-9_]*\}$)");
    static const std::regex kIntent(R"(^(intent:|scheme=|#Intent))");
    static const std::regex kEventHandler(R"(^on[A-Z][a-zA-Z]*$)");
    static const std::regex kElementName(R"(^[a-z]+-[a-z-]+$)");
    static const std::regex kHexColor(R"(^#[0-9a-fA-F]{3,8}$)");
    static const std::regex kNumber(R"(^-?\d+(\.\d+)?$)");
    static const std::regex kObjectKey(R"(^[a-zA-Z_$][a-zA-Z0-9_$]*:$)");
    static const std::regex kImportPath(R"(^@/|^\.\.?/|^~/)");

    if (!containsSpace(text) && matchWhole(kIdentifier, text)) {
        return true;
    }
    for (const auto* re : {&kUrl, &kPathStart, &kFileExt, &kTemplateExpr, &kMustache,
                           &kBarePlaceholder, &kIntent, &kEventHandler, &kElementName,
                           &kHexColor, &kNumber, &kObjectKey, &kImportPath}) {
        if (search(*re, text)) {
            return true;
        }
    }
    return false;
}

bool isUserTextLike(std::string_view raw) {
    const auto text = common::trim(raw);
    if (text.empty() || text.size() > kMaxRegexInput) {
        return false;
    }

    static const std::regex kTerminal(R"([.!?:]$)");
    static const std::regex kCommonWords(
        R"(\b(the|and|or|to|is|are|was|has|have|this|that|your|our|please|click|tap|select|add|save|cancel|delete|edit|view|open|close|enter|submit|confirm|error|success|warning|loading|welcome|hello|hi|thanks|sorry|oops|done|next|back|continue|finish|start|stop|pause|play|search|find|filter|sort|show|hide|enable|disable|on|off|yes|no|ok|failed|try|again)\b)",
        std::regex::icase);
    static const std::regex kPlaceholder(R"(\{[a-zA-Z_][a-zA-Z0-9_]*\})");
    static const std::regex kSentenceShape(R"([A-Z][a-z]+(\s+[a-z]+)+)");

    const bool startsWithCapital = std::isupper(static_cast<unsigned char>(text.front())) != 0;
    return startsWithCapital || search(kTerminal, text) || search(kCommonWords, text) ||
           search(kPlaceholder, text) || search(kSentenceShape, text);
}

std::span<const TextRule> userTextRules() {
    return kRules;
}

RuleVerdict classifyText(std::string_view raw) {
    const auto text = common::trim(raw);
    if (text.size() > kMaxRegexInput) {
        return {Verdict::Reject, "tooLong"};
    }
    for (const auto& rule : kRules) {
        auto verdict = rule.evaluate(text);
        if (verdict != Verdict::Abstain) {
            return {verdict, rule.name};
        }
    }
    return {Verdict::Reject, "default"};
}

} // namespace keyrescue::extraction
