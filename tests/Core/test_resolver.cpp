/**
 * @file test_resolver.cpp
 * @brief Unit tests for span selection, rule folding and replacement actions
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Sanitizer.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <re2/re2.h>
#include <string>
#include <vector>

using namespace ClipGuard;
using namespace ClipGuard::Sanitize;
using namespace ClipGuard::Testing;

namespace {

CompiledRule makeRule(const std::string& id, const std::string& pattern,
                      RuleAction action = RuleAction::Mask,
                      std::optional<std::string> replacement = std::nullopt) {
    CompiledRule compiled;
    compiled.rule.id = id;
    compiled.rule.name = id;
    compiled.rule.pattern = pattern;
    compiled.rule.action = action;
    compiled.rule.replacement = std::move(replacement);

    auto regex = compilePattern(pattern);
    if (regex.isSuccess()) {
        compiled.regex = regex.value();
    } else {
        compiled.status = regex.error();
    }
    return compiled;
}

} // anonymous namespace

// ============================================================================
// SanitizationApplier
// ============================================================================

TEST(SanitizationApplier, MaskCountsCodePoints) {
    SanitizationApplier applier;
    EXPECT_EQ(applier.mask("hunter2"), "*******");
    EXPECT_EQ(applier.mask("日本"), "**");
    EXPECT_EQ(applier.mask("Jürgen"), "******");
    EXPECT_EQ(applier.mask(""), "");
}

TEST(SanitizationApplier, CustomMaskCharacter) {
    SanitizationApplier applier('#');
    EXPECT_EQ(applier.apply(RuleAction::Mask, "abcd"), "####");
    EXPECT_EQ(applier.maskChar(), '#');
}

TEST(SanitizationApplier, RenameUsesReplacementOrDefault) {
    SanitizationApplier applier;
    EXPECT_EQ(applier.apply(RuleAction::Rename, "secret"), "[REDACTED]");
    EXPECT_EQ(applier.apply(RuleAction::Rename, "secret", std::string("<key>")), "<key>");
}

TEST(SanitizationApplier, RemoveDropsSpan) {
    SanitizationApplier applier;
    EXPECT_EQ(applier.apply(RuleAction::Remove, "secret"), "");
}

TEST(SanitizationApplier, ObfuscateUsesDigestPrefix) {
    // SHA-256("abc") starts with ba7816bf
    EXPECT_EQ(SanitizationApplier::obfuscate("abc"), "[OBFUSCATED:ba7816bf]");

    SanitizationApplier applier;
    EXPECT_EQ(applier.apply(RuleAction::Obfuscate, "abc"), "[OBFUSCATED:ba7816bf]");
    EXPECT_NE(SanitizationApplier::obfuscate("abd"), SanitizationApplier::obfuscate("abc"));
}

// ============================================================================
// Span selection
// ============================================================================

TEST(SpanSelection, FirstNonEmptyGroupWins) {
    re2::RE2 re(R"((x*)(\d+)-(\d+))");
    auto matches = findAllMatches(re, "id 123-456");
    ASSERT_EQ(matches.size(), 1u);

    SpanSelection selection = MatchResolver::selectSpan(matches[0]);
    ASSERT_TRUE(std::holds_alternative<CapturedSpan>(selection));
    EXPECT_EQ(std::get<CapturedSpan>(selection).groupIndex, 2u);
    EXPECT_EQ(spanOf(selection), (Span{3, 3}));
}

TEST(SpanSelection, NoGroupsSelectsFullMatch) {
    re2::RE2 re(R"(\d{3})");
    auto matches = findAllMatches(re, "ab 987");
    ASSERT_EQ(matches.size(), 1u);

    SpanSelection selection = MatchResolver::selectSpan(matches[0]);
    ASSERT_TRUE(std::holds_alternative<FullMatch>(selection));
    EXPECT_EQ(spanOf(selection), (Span{3, 3}));
}

TEST(SpanSelection, AllGroupsEmptySelectsFullMatch) {
    re2::RE2 re(R"(key=(\d*))");
    auto matches = findAllMatches(re, "key=");
    ASSERT_EQ(matches.size(), 1u);

    SpanSelection selection = MatchResolver::selectSpan(matches[0]);
    EXPECT_TRUE(std::holds_alternative<FullMatch>(selection));
    EXPECT_EQ(spanOf(selection), (Span{0, 4}));
}

TEST(SpanSelection, UnmatchedGroupIsSkipped) {
    re2::RE2 re(R"((foo)|(bar)baz)");
    auto matches = findAllMatches(re, "barbaz");
    ASSERT_EQ(matches.size(), 1u);
    ASSERT_EQ(matches[0].groups.size(), 3u);
    EXPECT_FALSE(matches[0].groups[1].has_value());

    SpanSelection selection = MatchResolver::selectSpan(matches[0]);
    ASSERT_TRUE(std::holds_alternative<CapturedSpan>(selection));
    EXPECT_EQ(std::get<CapturedSpan>(selection).groupIndex, 2u);
    EXPECT_EQ(spanOf(selection), (Span{0, 3}));
}

// ============================================================================
// findAllMatches
// ============================================================================

TEST(FindAllMatches, NonOverlappingLeftToRight) {
    re2::RE2 re("aa");
    auto matches = findAllMatches(re, "aaaaa");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(*matches[0].groups[0], (Span{0, 2}));
    EXPECT_EQ(*matches[1].groups[0], (Span{2, 2}));
}

TEST(FindAllMatches, EmptyMatchesAdvanceByCodePoint) {
    re2::RE2 re("x*");
    auto matches = findAllMatches(re, "\xC3\xBC" "x");
    ASSERT_EQ(matches.size(), 3u);
    EXPECT_EQ(*matches[0].groups[0], (Span{0, 0}));
    EXPECT_EQ(*matches[1].groups[0], (Span{2, 1}));
    EXPECT_EQ(*matches[2].groups[0], (Span{3, 0}));
}

TEST(FindAllMatches, WordBoundarySeesPrecedingText) {
    re2::RE2 re(R"(\b\d{2})");
    auto matches = findAllMatches(re, "1234 56");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(*matches[0].groups[0], (Span{0, 2}));
    EXPECT_EQ(*matches[1].groups[0], (Span{5, 2}));
}

TEST(FindAllMatches, LongSingleTokenIsLinear) {
    re2::RE2 re(R"(password\s*[:=]\s*(\S+))");
    const std::string text = "password: " + std::string(500000, 'a');
    auto matches = findAllMatches(re, text);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(*matches[0].groups[1], (Span{10, 500000}));
}

// ============================================================================
// MatchResolver
// ============================================================================

class MatchResolverTest : public ::testing::Test {
protected:
    Core::Logger logger_;
    MatchResolver resolver_{logger_};
    SanitizationApplier applier_;
};

TEST_F(MatchResolverTest, MasksCapturedValueOnly) {
    std::vector<CompiledRule> rules = {makeRule("pw", R"(password\s*[:=]\s*(\S+))")};

    Resolution resolution = resolver_.resolve(rules, "password: hunter2", applier_);

    EXPECT_EQ(resolution.text, "password: *******");
    ASSERT_EQ(resolution.matches.size(), 1u);
    EXPECT_EQ(resolution.matches[0].ruleId, "pw");
    EXPECT_EQ(resolution.matches[0].matchedText, "hunter2");
    EXPECT_EQ(resolution.matches[0].replacement, "*******");
}

TEST_F(MatchResolverTest, EveryOccurrenceIsReplaced) {
    std::vector<CompiledRule> rules = {
        makeRule("num", R"(=(\d+))", RuleAction::Rename, std::string("N"))
    };

    Resolution resolution = resolver_.resolve(rules, "a=111 b=22222 c=3333", applier_);

    EXPECT_EQ(resolution.text, "a=N b=N c=N");
    EXPECT_EQ(resolution.matches.size(), 3u);
}

TEST_F(MatchResolverTest, HigherPriorityRuleRunsFirst) {
    std::vector<CompiledRule> renameFirst = {
        makeRule("rename", "secret", RuleAction::Rename, std::string("TOKEN")),
        makeRule("mask", "secret")
    };
    EXPECT_EQ(resolver_.resolve(renameFirst, "my secret", applier_).text, "my TOKEN");

    std::vector<CompiledRule> maskFirst = {
        makeRule("mask", "secret"),
        makeRule("rename", "secret", RuleAction::Rename, std::string("TOKEN"))
    };
    EXPECT_EQ(resolver_.resolve(maskFirst, "my secret", applier_).text, "my ******");
}

TEST_F(MatchResolverTest, LaterRuleSeesEarlierOutput) {
    std::vector<CompiledRule> rules = {
        makeRule("rename", "alpha", RuleAction::Rename, std::string("beta")),
        makeRule("remove", "beta ", RuleAction::Remove)
    };

    EXPECT_EQ(resolver_.resolve(rules, "alpha gamma", applier_).text, "gamma");
}

TEST_F(MatchResolverTest, ShortMatchesAreLeftAlone) {
    std::vector<CompiledRule> rules = {makeRule("id", R"(id=(\w+))")};

    Resolution resolution = resolver_.resolve(rules, "id=ab id=abcd", applier_);

    EXPECT_EQ(resolution.text, "id=ab id=****");
    EXPECT_EQ(resolution.matches.size(), 1u);
}

TEST_F(MatchResolverTest, ShortMatchesAllowedForFixedWidthRules) {
    CompiledRule rule = makeRule("id", R"(id=(\w+))");
    rule.rule.allowShortMatches = true;

    Resolution resolution = resolver_.resolve({rule}, "id=ab id=abcd", applier_);

    EXPECT_EQ(resolution.text, "id=** id=****");
}

TEST_F(MatchResolverTest, EmptyGroupFallsBackToFullMatch) {
    std::vector<CompiledRule> rules = {makeRule("key", R"(key=(\d*))")};

    EXPECT_EQ(resolver_.resolve(rules, "key= rest", applier_).text, "**** rest");
}

TEST_F(MatchResolverTest, InertRuleIsSkipped) {
    std::vector<CompiledRule> rules = {
        makeRule("broken", "(unclosed"),
        makeRule("ok", "token")
    };
    ASSERT_FALSE(rules[0].usable());

    Resolution resolution = resolver_.resolve(rules, "token (unclosed", applier_);

    EXPECT_EQ(resolution.text, "***** (unclosed");
    ASSERT_EQ(resolution.skippedRules.size(), 1u);
    EXPECT_EQ(resolution.skippedRules[0], "broken");
}

TEST_F(MatchResolverTest, NoRulesLeavesTextUnchanged) {
    Resolution resolution = resolver_.resolve({}, "nothing to see", applier_);
    EXPECT_EQ(resolution.text, "nothing to see");
    EXPECT_TRUE(resolution.matches.empty());
}

TEST_F(MatchResolverTest, MultiByteCapturesAreMaskedPerCodePoint) {
    std::vector<CompiledRule> rules = {makeRule("name", R"(name=(\S+))")};

    EXPECT_EQ(resolver_.resolve(rules, "name=Jürgen ok", applier_).text, "name=****** ok");
}
