/**
 * @file DefaultPatterns.cpp
 * @brief Stock sanitization rules and builtin sensitive-data patterns
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Patterns.hpp>

namespace ClipGuard::Sanitize {

std::vector<SanitizationRule> defaultRules() {
    std::vector<SanitizationRule> rules;
    
    rules.push_back({
        .id = "rule-password-fields",
        .name = "Password Fields",
        .pattern = R"((?i)password\s*[:=]\s*['"]?([^'"\s]+)['"]?)",
        .action = RuleAction::Mask,
    });
    
    rules.push_back({
        .id = "rule-api-keys",
        .name = "API Keys",
        .pattern = R"((?i)(api[_-]?key|auth[_-]?token)\s*[:=]\s*['"]?([\w\-]+)['"]?)",
        .action = RuleAction::Mask,
    });
    
    rules.push_back({
        .id = "rule-connection-strings",
        .name = "Connection Strings",
        .pattern = R"((?i)(jdbc|mongodb|mysql|postgresql|connection)[:"].*?((?:password|pwd)\s*=\s*[^;\s"]+))",
        .action = RuleAction::Mask,
    });
    
    rules.push_back({
        .id = "rule-credit-card-numbers",
        .name = "Credit Card Numbers",
        .pattern = R"(\b(?:\d[ -]*?){13,16}\b)",
        .action = RuleAction::Mask,
        .allowShortMatches = true,
    });
    
    rules.push_back({
        .id = "rule-email-addresses",
        .name = "Email Addresses",
        .pattern = R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)",
        .action = RuleAction::Obfuscate,
    });
    
    return rules;
}

std::vector<SensitivePattern> defaultPatterns() {
    return {
        // Payment
        {"pattern-visa", "Credit Card - VISA",
         R"(\b4[0-9]{12}(?:[0-9]{3})?\b)",
         PatternCategory::Payment,
         "VISA card numbers (13 or 16 digits starting with 4)"},
        {"pattern-mastercard", "Credit Card - MasterCard",
         R"(\b(?:5[1-5][0-9]{2}|222[1-9]|22[3-9][0-9]|2[3-6][0-9]{2}|27[01][0-9]|2720)[0-9]{12}\b)",
         PatternCategory::Payment,
         "MasterCard numbers (16 digits, 51-55 or 2221-2720)"},
        {"pattern-amex", "Credit Card - AMEX",
         R"(\b3[47][0-9]{13}\b)",
         PatternCategory::Payment,
         "American Express numbers (15 digits starting with 34 or 37)"},
        {"pattern-discover", "Credit Card - Discover",
         R"(\b6(?:011|5[0-9]{2})[0-9]{12}\b)",
         PatternCategory::Payment,
         "Discover numbers (16 digits starting with 6011 or 65)"},
        
        // Government
        {"pattern-us-ssn", "US Social Security Number",
         R"(\b(?:00[1-9]|0[1-9]\d|[1-578]\d{2}|6[0-57-9]\d|66[0-57-9])-(?:0[1-9]|[1-9]\d)-(?:000[1-9]|00[1-9]\d|0[1-9]\d{2}|[1-9]\d{3})\b)",
         PatternCategory::GovernmentID,
         "US SSN in XXX-XX-XXXX form"},
        
        // Contact
        {"pattern-us-phone", "US Phone Numbers",
         R"(\b(?:\+?1[-.]?)?\(?([0-9]{3})\)?[-.]?([0-9]{3})[-.]?([0-9]{4})\b)",
         PatternCategory::Contact,
         "US phone numbers with optional country code"},
        {"pattern-email", "Email Addresses",
         R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)",
         PatternCategory::Contact,
         "Email addresses"},
        
        // Network
        {"pattern-ipv4", "IPv4 Addresses",
         R"(\b(?:[0-9]{1,3}\.){3}[0-9]{1,3}\b)",
         PatternCategory::Network,
         "Dotted-quad IPv4 addresses"},
        
        // Credentials
        {"pattern-api-keys", "API Keys",
         R"(\b(?:api[-_]?key|auth[-_]?token|secret[-_]?key)\s*[:=]\s*['"]([\w\-\.]{16,64})['"])",
         PatternCategory::Credentials,
         "Quoted values of api_key, auth_token or secret_key"},
        {"pattern-oauth-jwt", "OAuth/JWT Tokens",
         R"(\b(?:bearer|access_token|id_token)\s*[:=]\s*['"]([\w\-\.]{24,})['"])",
         PatternCategory::Credentials,
         "Bearer, access and id tokens"},
        {"pattern-aws-access-key", "AWS Access Keys",
         R"(\b(AKIA[0-9A-Z]{16})\b)",
         PatternCategory::Credentials,
         "AWS access key ids (AKIA + 16 characters)"},
        {"pattern-aws-secret-key", "AWS Secret Keys",
         R"(\b[0-9a-zA-Z/+]{40}\b)",
         PatternCategory::Credentials,
         "AWS secret access keys (40 characters)"},
        {"pattern-password-fields", "Password Fields",
         R"(\b(?:password|pwd|passcode)\s*[:=]\s*['"]([^'"]{8,})['"])",
         PatternCategory::Credentials,
         "Quoted password values of 8 or more characters"},
        
        // Connection
        {"pattern-db-connection", "Database Connection Strings",
         R"(\b(?:mongodb|postgresql|mysql|jdbc)://[^:]+:[^@]+@[^/]+/[^\s]+)",
         PatternCategory::Connection,
         "Database URLs with embedded credentials"},
        
        // Cryptocurrency
        {"pattern-bitcoin", "Bitcoin Addresses",
         R"(\b(bc1|[13])[a-zA-HJ-NP-Z0-9]{25,39}\b)",
         PatternCategory::Cryptocurrency,
         "Bitcoin p2pkh, p2sh and bech32 addresses"},
        
        // Personal
        {"pattern-personal-names", "Personal Names",
         R"(\b(?:name|customer|client|user|patient)\s*[:=]\s*['"]([A-Z][a-z]+(?: [A-Z][a-z]+)+)['"])",
         PatternCategory::Personal,
         "Quoted full names after name/customer/client/user/patient"},
        
        // Financial
        {"pattern-bank-account", "Bank Account Numbers",
         R"(\b(?:account|acct)\s*#?\s*[:=]?\s*['"]?([0-9]{8,17})['"]?)",
         PatternCategory::Financial,
         "Account numbers of 8 to 17 digits with context"},
    };
}

} // namespace ClipGuard::Sanitize
