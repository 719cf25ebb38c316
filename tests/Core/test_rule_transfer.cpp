/**
 * @file test_rule_transfer.cpp
 * @brief Unit tests for rule and pattern transfer and the saved library
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/RuleTransfer.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace ClipGuard;
using namespace ClipGuard::Sanitize;
using namespace ClipGuard::Transfer;
using namespace ClipGuard::Testing;

class RuleTransferTest : public ::testing::Test {
protected:
    Core::Logger logger_;
    RuleTransfer transfer_{logger_};
    PatternLibrary library_{logger_};
};

TEST_F(RuleTransferTest, Iso8601) {
    EXPECT_EQ(RuleTransfer::formatIso8601(Timestamp{}), "1970-01-01T00:00:00Z");
    EXPECT_EQ(RuleTransfer::formatIso8601(Timestamp(Seconds(1700000000))), "2023-11-14T22:13:20Z");
}

TEST_F(RuleTransferTest, ExportEnvelope) {
    const std::string document = transfer_.exportRules(library_.rules(), Timestamp(Seconds(86400)));
    json doc = json::parse(document);

    EXPECT_EQ(doc["metadata"]["version"], "1.0");
    EXPECT_EQ(doc["metadata"]["appName"], "ClipGuard");
    EXPECT_EQ(doc["metadata"]["exportDate"], "1970-01-02T00:00:00Z");

    ASSERT_TRUE(doc["rules"].is_array());
    ASSERT_EQ(doc["rules"].size(), 5u);
    const json& first = doc["rules"][0];
    EXPECT_EQ(first["name"], "Password Fields");
    EXPECT_EQ(first["enabled"], true);
    EXPECT_TRUE(first["action"].is_number_integer());
    EXPECT_TRUE(first.contains("replacement"));
    EXPECT_TRUE(first.contains("priority"));
}

TEST_F(RuleTransferTest, ExportedRulesImportUnchanged) {
    const auto rules = library_.rules();
    auto imported = transfer_.importRules(transfer_.exportRules(rules));
    ASSERT_RESULT_SUCCESS(imported);

    EXPECT_FALSE(imported.value().legacyFormat);
    ASSERT_TRUE(imported.value().metadata.has_value());
    EXPECT_EQ(imported.value().metadata->appName, "ClipGuard");
    EXPECT_EQ(imported.value().rules, rules);
}

TEST_F(RuleTransferTest, LegacyListWithOldFieldNames) {
    const std::string legacy = R"([
        {"id": "r1", "name": "Hosts", "pattern": "host-\\d+", "isEnabled": false,
         "ruleType": 1, "replacementValue": "<host>", "priority": 3},
        {"name": "Credit Card Legacy", "pattern": "\\d{16}", "ruleType": 0}
    ])";

    auto imported = transfer_.importRules(legacy);
    ASSERT_RESULT_SUCCESS(imported);
    EXPECT_TRUE(imported.value().legacyFormat);
    EXPECT_FALSE(imported.value().metadata.has_value());

    const auto& rules = imported.value().rules;
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0].id, "r1");
    EXPECT_FALSE(rules[0].enabled);
    EXPECT_EQ(rules[0].action, RuleAction::Rename);
    EXPECT_EQ(rules[0].replacement, "<host>");
    EXPECT_EQ(rules[0].priority, 3);
    EXPECT_FALSE(rules[0].allowShortMatches);

    EXPECT_TRUE(rules[1].id.empty());
    EXPECT_TRUE(rules[1].enabled);
    EXPECT_EQ(rules[1].action, RuleAction::Mask);
    EXPECT_TRUE(rules[1].allowShortMatches);
}

TEST_F(RuleTransferTest, NewerMajorVersionIsRejected) {
    const std::string document = R"({
        "metadata": {"version": "2.0", "exportDate": "2025-01-01T00:00:00Z", "appName": "ClipGuard"},
        "rules": []
    })";
    EXPECT_RESULT_ERROR(transfer_.importRules(document), ErrorCode::IncompatibleVersion);

    const std::string minor = R"({
        "metadata": {"version": "1.7", "exportDate": "2025-01-01T00:00:00Z", "appName": "ClipGuard"},
        "rules": []
    })";
    ASSERT_RESULT_SUCCESS(transfer_.importRules(minor));
}

TEST_F(RuleTransferTest, MalformedDocuments) {
    EXPECT_RESULT_ERROR(transfer_.importRules("not json at all"), ErrorCode::InvalidFormat);
    EXPECT_RESULT_ERROR(transfer_.importRules(R"({"rules": []})"), ErrorCode::InvalidFormat);
    EXPECT_RESULT_ERROR(transfer_.importRules("42"), ErrorCode::InvalidFormat);

    // Missing action
    EXPECT_RESULT_ERROR(transfer_.importRules(R"([{"name": "a", "pattern": "a"}])"),
                        ErrorCode::InvalidFormat);

    // Unknown action code
    EXPECT_RESULT_ERROR(transfer_.importRules(R"([{"name": "a", "pattern": "a", "action": 9}])"),
                        ErrorCode::InvalidFormat);
}

TEST_F(RuleTransferTest, OneBadRuleRejectsTheBatch) {
    const std::string document = R"([
        {"name": "good", "pattern": "g", "action": 0},
        {"name": "bad", "pattern": 17, "action": 0}
    ])";
    EXPECT_RESULT_ERROR(transfer_.importRules(document), ErrorCode::InvalidFormat);
}

TEST_F(RuleTransferTest, FileRoundTrip) {
    TempDirectory dir;
    const std::string path = dir.file("rules.json");

    ASSERT_RESULT_SUCCESS(transfer_.exportToFile(library_.rules(), path));
    auto imported = transfer_.importFromFile(path);
    ASSERT_RESULT_SUCCESS(imported);
    EXPECT_EQ(imported.value().rules.size(), 5u);
}

TEST_F(RuleTransferTest, FileErrors) {
    TempDirectory dir;
    EXPECT_RESULT_ERROR(transfer_.importFromFile(dir.file("missing.json")), ErrorCode::FileNotFound);

    const std::string large = dir.file("large.json");
    writeFile(large, std::string(MAX_IMPORT_FILE_SIZE + 1, ' '));
    EXPECT_RESULT_ERROR(transfer_.importFromFile(large), ErrorCode::FileTooLarge);

    EXPECT_RESULT_ERROR(transfer_.exportToFile(library_.rules(), dir.file("no/such/dir/rules.json")),
                        ErrorCode::FileWriteError);
}

TEST_F(RuleTransferTest, ApplyReplace) {
    auto imported = transfer_.importRules(
        R"([{"id": "x", "name": "X", "pattern": "x+", "action": 2},
            {"id": "x", "name": "Y", "pattern": "y+", "action": 2}])");
    ASSERT_RESULT_SUCCESS(imported);

    auto applied = transfer_.apply(library_, imported.value(), ImportMode::Replace);
    ASSERT_RESULT_SUCCESS(applied);
    EXPECT_EQ(applied.value(), 2u);

    auto rules = library_.rules();
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0].id, "x");
    EXPECT_NE(rules[1].id, "x");
    EXPECT_FALSE(rules[1].id.empty());
}

TEST_F(RuleTransferTest, ApplyMergeRenamesCollidingIds) {
    auto imported = transfer_.importRules(
        R"([{"id": "rule-password-fields", "name": "Copy", "pattern": "copy", "action": 0},
            {"id": "fresh", "name": "Fresh", "pattern": "fresh", "action": 0}])");
    ASSERT_RESULT_SUCCESS(imported);

    auto applied = transfer_.apply(library_, imported.value(), ImportMode::Merge);
    ASSERT_RESULT_SUCCESS(applied);
    EXPECT_EQ(applied.value(), 2u);

    auto rules = library_.rules();
    ASSERT_EQ(rules.size(), 7u);
    EXPECT_EQ(library_.findRule("rule-password-fields")->name, "Password Fields");
    EXPECT_TRUE(library_.findRule("fresh").has_value());
    EXPECT_EQ(rules[5].name, "Copy");
    EXPECT_NE(rules[5].id, "rule-password-fields");
}

// ============================================================================
// Patterns
// ============================================================================

TEST_F(RuleTransferTest, ExportedPatternsImportUnchanged) {
    const auto patterns = library_.patterns();
    const std::string document = transfer_.exportPatterns(patterns, Timestamp(Seconds(86400)));

    json doc = json::parse(document);
    EXPECT_EQ(doc["metadata"]["exportDate"], "1970-01-02T00:00:00Z");
    ASSERT_EQ(doc["patterns"].size(), 17u);
    EXPECT_EQ(doc["patterns"][0]["category"], "Payment Information");

    auto imported = transfer_.importPatterns(document);
    ASSERT_RESULT_SUCCESS(imported);
    EXPECT_FALSE(imported.value().legacyFormat);
    ASSERT_TRUE(imported.value().metadata.has_value());
    EXPECT_EQ(imported.value().patterns, patterns);
}

TEST_F(RuleTransferTest, BarePatternListWithFreeFormCategory) {
    const std::string legacy = R"([
        {"id": "p1", "name": "Badge", "pattern": "BADGE-\\d{4}", "description": "Door badge",
         "category": "Building Access", "created": 700000000},
        {"name": "Routing", "pattern": "\\d{9}", "category": "Financial Information",
         "isEnabled": false}
    ])";

    auto imported = transfer_.importPatterns(legacy);
    ASSERT_RESULT_SUCCESS(imported);
    EXPECT_TRUE(imported.value().legacyFormat);

    const auto& patterns = imported.value().patterns;
    ASSERT_EQ(patterns.size(), 2u);
    EXPECT_EQ(patterns[0].id, "p1");
    EXPECT_EQ(patterns[0].description, "Door badge");
    EXPECT_EQ(patterns[0].category, PatternCategory::Personal);
    EXPECT_TRUE(patterns[0].enabled);
    EXPECT_TRUE(patterns[1].id.empty());
    EXPECT_EQ(patterns[1].category, PatternCategory::Financial);
    EXPECT_FALSE(patterns[1].enabled);
}

TEST_F(RuleTransferTest, PatternDocumentsWithoutPatternsAreRejected) {
    EXPECT_RESULT_ERROR(transfer_.importPatterns("[]"), ErrorCode::InvalidFormat);
    EXPECT_RESULT_ERROR(transfer_.importPatterns(R"({
        "metadata": {"version": "1.0", "exportDate": "2025-01-01T00:00:00Z", "appName": "ClipGuard"},
        "patterns": []
    })"), ErrorCode::InvalidFormat);
    EXPECT_RESULT_ERROR(transfer_.importPatterns(R"({
        "metadata": {"version": "3.0", "exportDate": "2025-01-01T00:00:00Z", "appName": "ClipGuard"},
        "patterns": [{"name": "a", "pattern": "a"}]
    })"), ErrorCode::IncompatibleVersion);
    EXPECT_RESULT_ERROR(transfer_.importPatterns(R"([{"name": "a"}])"), ErrorCode::InvalidFormat);
}

TEST_F(RuleTransferTest, ApplyPatternsMergeThenReplace) {
    auto imported = transfer_.importPatterns(
        R"([{"id": "pattern-visa", "name": "Visa Copy", "pattern": "4\\d{15}",
             "category": "Payment Information"},
            {"id": "badge", "name": "Badge", "pattern": "BADGE-\\d{4}", "category": "Personal Information"}])");
    ASSERT_RESULT_SUCCESS(imported);

    auto merged = transfer_.applyPatterns(library_, imported.value(), ImportMode::Merge);
    ASSERT_RESULT_SUCCESS(merged);
    EXPECT_EQ(merged.value(), 2u);
    EXPECT_EQ(library_.patterns().size(), 19u);
    EXPECT_EQ(library_.findPattern("pattern-visa")->name, "Credit Card - VISA");
    EXPECT_EQ(library_.patterns()[17].name, "Visa Copy");
    EXPECT_NE(library_.patterns()[17].id, "pattern-visa");

    auto replaced = transfer_.applyPatterns(library_, imported.value(), ImportMode::Replace);
    ASSERT_RESULT_SUCCESS(replaced);
    EXPECT_EQ(replaced.value(), 2u);
    ASSERT_EQ(library_.patterns().size(), 2u);
    EXPECT_EQ(library_.findPattern("badge")->name, "Badge");
    EXPECT_EQ(library_.patternStatus("badge"), ErrorCode::Success);
}

TEST_F(RuleTransferTest, PatternFileRoundTrip) {
    TempDirectory dir;
    const std::string path = dir.file("patterns.json");

    ASSERT_RESULT_SUCCESS(transfer_.exportPatternsToFile(library_.patterns(), path));
    auto imported = transfer_.importPatternsFromFile(path);
    ASSERT_RESULT_SUCCESS(imported);
    EXPECT_EQ(imported.value().patterns.size(), 17u);

    EXPECT_RESULT_ERROR(transfer_.importPatternsFromFile(dir.file("missing.json")),
                        ErrorCode::FileNotFound);
}

// ============================================================================
// Saved Library
// ============================================================================

TEST_F(RuleTransferTest, SavedLibrarySurvivesRestart) {
    TempDirectory dir;
    const std::string path = dir.file("library.json");

    SanitizationService service(library_, logger_);
    ASSERT_RESULT_SUCCESS(library_.removeRule("rule-password-fields"));
    ASSERT_RESULT_SUCCESS(library_.addRule({.id = "tickets", .name = "Tickets",
                                            .pattern = "TICKET-\\d+", .action = RuleAction::Remove}));
    ASSERT_RESULT_SUCCESS(library_.setPatternEnabled("pattern-email", false));
    service.setPreferences({false, '#'});

    ASSERT_RESULT_SUCCESS(transfer_.saveLibrary(RuleTransfer::capture(service), path));

    PatternLibrary freshLibrary(logger_);
    SanitizationService freshService(freshLibrary, logger_);
    auto saved = transfer_.loadLibrary(path);
    ASSERT_RESULT_SUCCESS(saved);
    transfer_.restore(freshService, saved.value());

    EXPECT_EQ(freshLibrary.rules(), library_.rules());
    EXPECT_EQ(freshLibrary.patterns(), library_.patterns());
    EXPECT_FALSE(freshLibrary.findRule("rule-password-fields").has_value());
    EXPECT_FALSE(freshLibrary.findPattern("pattern-email")->enabled);
    EXPECT_FALSE(freshService.preferences().detectionEnabled);
    EXPECT_EQ(freshService.preferences().maskChar, '#');
    EXPECT_EQ(freshService.sanitize("see TICKET-42 now"), "see  now");

    // The saved file is also a valid rules envelope
    auto rules = transfer_.importFromFile(path);
    ASSERT_RESULT_SUCCESS(rules);
    EXPECT_EQ(rules.value().rules, library_.rules());
}

TEST_F(RuleTransferTest, UnusableSavedLibrary) {
    TempDirectory dir;
    EXPECT_RESULT_ERROR(transfer_.loadLibrary(dir.file("never-saved.json")), ErrorCode::FileNotFound);

    const std::string broken = dir.file("broken.json");
    writeFile(broken, "{\"metadata\": ");
    EXPECT_RESULT_ERROR(transfer_.loadLibrary(broken), ErrorCode::InvalidFormat);

    const std::string badMask = dir.file("mask.json");
    writeFile(badMask, R"({
        "metadata": {"version": "1.0", "exportDate": "2025-01-01T00:00:00Z", "appName": "ClipGuard"},
        "rules": [], "patterns": [],
        "preferences": {"detectionEnabled": true, "maskChar": "##"}
    })");
    EXPECT_RESULT_ERROR(transfer_.loadLibrary(badMask), ErrorCode::InvalidFormat);

    const std::string rulesOnly = dir.file("rules.json");
    ASSERT_RESULT_SUCCESS(transfer_.exportToFile(library_.rules(), rulesOnly));
    EXPECT_RESULT_ERROR(transfer_.loadLibrary(rulesOnly), ErrorCode::InvalidFormat);
}
