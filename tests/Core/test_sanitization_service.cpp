/**
 * @file test_sanitization_service.cpp
 * @brief End-to-end tests of detection plus rule passes over the stock library
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Sanitizer.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <thread>
#include <vector>

using namespace ClipGuard;
using namespace ClipGuard::Sanitize;
using namespace ClipGuard::Testing;

class SanitizationServiceTest : public ::testing::Test {
protected:
    Core::Logger logger_;
    PatternLibrary library_{logger_};
    SanitizationService service_{library_, logger_};

    const SensitiveDataDetection* findDetection(const std::string& patternId) const {
        detections_ = service_.lastDetections();
        auto it = std::find_if(detections_.begin(), detections_.end(),
                               [&](const SensitiveDataDetection& d) { return d.patternId == patternId; });
        return it == detections_.end() ? nullptr : &*it;
    }

    mutable std::vector<SensitiveDataDetection> detections_;
};

TEST_F(SanitizationServiceTest, PlainTextIsUnchanged) {
    EXPECT_EQ(service_.sanitize("just a grocery list: eggs, milk"), "just a grocery list: eggs, milk");
    EXPECT_TRUE(service_.lastRuleMatches().empty());
}

TEST_F(SanitizationServiceTest, EmptyText) {
    EXPECT_EQ(service_.sanitize(""), "");
    EXPECT_TRUE(service_.lastDetections().empty());
}

TEST_F(SanitizationServiceTest, PasswordValueIsMasked) {
    EXPECT_EQ(service_.sanitize("password: hunter2"), "password: *******");

    auto matches = service_.lastRuleMatches();
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].ruleId, "rule-password-fields");
    EXPECT_EQ(matches[0].matchedText, "hunter2");
}

TEST_F(SanitizationServiceTest, ValidCardIsRedactedByDetection) {
    EXPECT_EQ(service_.sanitize("4111111111111111"), std::string(16, '*'));

    const auto* visa = findDetection("pattern-visa");
    ASSERT_NE(visa, nullptr);
    EXPECT_DOUBLE_EQ(visa->confidence, 0.9);
    EXPECT_TRUE(visa->redacted);
    EXPECT_EQ(visa->span, (Span{0, 16}));
}

TEST_F(SanitizationServiceTest, InvalidCardIsCaughtByRule) {
    EXPECT_EQ(service_.sanitize("card 4111111111111112"), "card " + std::string(16, '*'));

    const auto* visa = findDetection("pattern-visa");
    ASSERT_NE(visa, nullptr);
    EXPECT_DOUBLE_EQ(visa->confidence, 0.3);
    EXPECT_FALSE(visa->redacted);

    auto matches = service_.lastRuleMatches();
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].ruleId, "rule-credit-card-numbers");
}

TEST_F(SanitizationServiceTest, SsnIsRedacted) {
    EXPECT_EQ(service_.sanitize("SSN 123-45-6789 on file"), "SSN *********** on file");

    const auto* ssn = findDetection("pattern-us-ssn");
    ASSERT_NE(ssn, nullptr);
    EXPECT_TRUE(ssn->redacted);
}

TEST_F(SanitizationServiceTest, EmailIsReportedThenObfuscatedByRule) {
    const std::string expected =
        "contact " + SanitizationApplier::obfuscate("bob@example.com") + " today";
    EXPECT_EQ(service_.sanitize("contact bob@example.com today"), expected);

    const auto* email = findDetection("pattern-email");
    ASSERT_NE(email, nullptr);
    EXPECT_DOUBLE_EQ(email->confidence, 0.75);
    EXPECT_FALSE(email->redacted);
}

TEST_F(SanitizationServiceTest, LowConfidenceDetectionIsOnlyReported) {
    EXPECT_EQ(service_.sanitize("gateway 10.0.0.1"), "gateway 10.0.0.1");

    const auto* ip = findDetection("pattern-ipv4");
    ASSERT_NE(ip, nullptr);
    EXPECT_DOUBLE_EQ(ip->confidence, 0.6);
    EXPECT_FALSE(ip->redacted);
}

TEST_F(SanitizationServiceTest, DetectionsAreOrderedByConfidence) {
    service_.sanitize("4111111111111111 from 10.0.0.1");

    auto detections = service_.lastDetections();
    ASSERT_GE(detections.size(), 2u);
    for (size_t i = 1; i < detections.size(); i++) {
        EXPECT_GE(detections[i - 1].confidence, detections[i].confidence);
    }
}

TEST_F(SanitizationServiceTest, DetectionCanBeDisabled) {
    service_.setDetectionEnabled(false);

    EXPECT_EQ(service_.sanitize("SSN 123-45-6789"), "SSN 123-45-6789");
    EXPECT_TRUE(service_.lastDetections().empty());
}

TEST_F(SanitizationServiceTest, MaskCharacterPreference) {
    service_.setMaskChar('#');
    EXPECT_EQ(service_.sanitize("password=abc123"), "password=######");
    EXPECT_EQ(service_.preferences().maskChar, '#');
}

TEST_F(SanitizationServiceTest, DisabledRuleDoesNotRun) {
    ASSERT_RESULT_SUCCESS(library_.setRuleEnabled("rule-password-fields", false));
    EXPECT_EQ(service_.sanitize("password: hunter2"), "password: hunter2");
}

TEST_F(SanitizationServiceTest, CustomRuleOutranksStockRules) {
    ASSERT_RESULT_SUCCESS(library_.addRule({
        .name = "Internal Hosts",
        .pattern = R"(\b[a-z0-9-]+\.corp\.internal\b)",
        .action = RuleAction::Rename,
        .replacement = std::string("<host>"),
        .priority = 5,
    }));

    EXPECT_EQ(service_.sanitize("ssh build-01.corp.internal"), "ssh <host>");
}

TEST_F(SanitizationServiceTest, LongSingleTokenValueIsMasked) {
    const std::string value(500000, 'a');
    EXPECT_EQ(service_.sanitize("password: " + value), "password: " + std::string(value.size(), '*'));

    auto matches = service_.lastRuleMatches();
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].matchedText.size(), value.size());
}

TEST_F(SanitizationServiceTest, LongTokensWithoutSecretsPassThrough) {
    const std::string letters(500000, 'a');
    EXPECT_EQ(service_.sanitize(letters), letters);

    const std::string connection = "connection:" + std::string(300000, 'x');
    EXPECT_EQ(service_.sanitize(connection), connection);
}

TEST_F(SanitizationServiceTest, LargeBase64BlobKeepsItsLength) {
    const std::string alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string blob;
    while (blob.size() < 2000000) {
        blob += alphabet;
    }
    EXPECT_EQ(service_.sanitize(blob).size(), blob.size());
}

TEST_F(SanitizationServiceTest, ConcurrentCallsAreSafe) {
    std::vector<std::thread> threads;
    std::vector<std::string> outputs(8);
    for (size_t i = 0; i < outputs.size(); i++) {
        threads.emplace_back([&, i] {
            outputs[i] = service_.sanitize("password: hunter2");
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& output : outputs) {
        EXPECT_EQ(output, "password: *******");
    }
}
