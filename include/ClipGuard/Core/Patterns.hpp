/**
 * @file Patterns.hpp
 * @brief Sanitization rules, builtin sensitive-data patterns and their library
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 *
 * Two kinds of entries live in the library:
 * - SanitizationRule: user-editable pattern + action, applied unconditionally
 * - SensitivePattern: builtin detection pattern, auto-redacted only when the
 *   confidence scorer is sure enough
 *
 * Patterns use RE2 syntax, so matching time is linear in the input length
 * and never recurses per character. Lookaround and backreferences are not
 * available. A leading "(?i)" is turned into a case-insensitive option. A
 * pattern that fails to compile makes its entry inert; it is never an error
 * for the pass as a whole.
 */

#pragma once

#ifndef CLIPGUARD_CORE_PATTERNS_HPP
#define CLIPGUARD_CORE_PATTERNS_HPP

#include <ClipGuard/Core/Types.hpp>
#include <ClipGuard/Core/ErrorCodes.hpp>
#include <ClipGuard/Core/Logger.hpp>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace re2 {
class RE2;
}

namespace ClipGuard::Sanitize {

// ============================================================================
// Rule and Pattern Types
// ============================================================================

/**
 * @brief What a rule does with the span it selects
 *
 * The numeric values are the wire codes used by rule import/export.
 */
enum class RuleAction : uint8_t {
    Mask = 0,       ///< Replace each character with the mask character
    Rename = 1,     ///< Replace with a fixed value (default "[REDACTED]")
    Obfuscate = 2,  ///< Replace with a short hash tag
    Remove = 3      ///< Delete the span
};

/// Map a wire code to an action
std::optional<RuleAction> ruleActionFromCode(int64_t code) noexcept;

/// Display name ("Mask", "Rename", ...)
const char* ruleActionName(RuleAction action) noexcept;

/**
 * @brief Builtin pattern category, drives confidence scoring
 */
enum class PatternCategory : uint8_t {
    Payment,
    Credentials,
    GovernmentID,
    Network,
    Contact,
    Connection,
    Cryptocurrency,
    Personal,
    Financial
};

/// Display name ("Payment Information", ...)
const char* categoryName(PatternCategory category) noexcept;

/// Inverse of categoryName()
std::optional<PatternCategory> categoryFromName(std::string_view name) noexcept;

/**
 * @brief User-defined sanitization rule
 */
struct SanitizationRule {
    std::string id;
    std::string name;
    std::string pattern;
    bool enabled = true;
    RuleAction action = RuleAction::Mask;
    std::optional<std::string> replacement;  ///< Used by Rename
    int priority = 0;                        ///< Higher runs first
    bool allowShortMatches = false;          ///< Fixed-width exception (card numbers)

    bool operator==(const SanitizationRule&) const = default;
};

/**
 * @brief Builtin detection pattern
 */
struct SensitivePattern {
    std::string id;
    std::string name;
    std::string pattern;
    PatternCategory category = PatternCategory::Personal;
    std::string description;
    bool enabled = true;

    bool operator==(const SensitivePattern&) const = default;
};

/// Shared immutable compiled expression
using RegexPtr = std::shared_ptr<const re2::RE2>;

/**
 * @brief Rule plus its compiled expression
 *
 * `regex` is null when the pattern failed to compile; `status` then holds
 * the reason (InvalidPattern or EmptyPattern).
 */
struct CompiledRule {
    SanitizationRule rule;
    RegexPtr regex;
    ErrorCode status = ErrorCode::Success;

    [[nodiscard]] bool usable() const noexcept { return regex != nullptr; }
};

/**
 * @brief Pattern plus its compiled expression
 */
struct CompiledPattern {
    SensitivePattern pattern;
    RegexPtr regex;
    ErrorCode status = ErrorCode::Success;

    [[nodiscard]] bool usable() const noexcept { return regex != nullptr; }
};

/**
 * @brief Compile a pattern source
 *
 * Handles the "(?i)" prefix. Never throws.
 *
 * @return Compiled expression, or InvalidPattern / EmptyPattern
 */
Result<RegexPtr> compilePattern(const std::string& source);

/**
 * @brief Whether a rule name marks it as a card-number rule
 *
 * Imported rules matching this get allowShortMatches.
 */
bool isCardNumberRuleName(std::string_view name) noexcept;

/// The five stock user rules
std::vector<SanitizationRule> defaultRules();

/// The seventeen builtin detection patterns
std::vector<SensitivePattern> defaultPatterns();

// ============================================================================
// Pattern Library
// ============================================================================

/**
 * @brief Thread-safe owner of rules and patterns with their compiled forms
 *
 * Readers take a snapshot (`sortedEnabledRules`, `enabledPatterns`) and run
 * matching without holding the lock.
 *
 * @code
 * Core::Logger logger;
 * Sanitize::PatternLibrary library(logger);
 * auto id = library.addRule({.name = "Tokens", .pattern = "token=(\\w+)"});
 * @endcode
 */
class PatternLibrary {
public:
    /**
     * @param logger Logger for compile failures
     * @param loadDefaults Seed with defaultRules() and defaultPatterns()
     */
    explicit PatternLibrary(Core::Logger& logger, bool loadDefaults = true);
    ~PatternLibrary();

    PatternLibrary(const PatternLibrary&) = delete;
    PatternLibrary& operator=(const PatternLibrary&) = delete;

    // ---- Rules -------------------------------------------------------------

    /**
     * @brief Add a rule
     *
     * An empty id is replaced by a fresh UUID. A rule whose pattern does not
     * compile is still stored (inert); check ruleStatus().
     *
     * @return Assigned id, or DuplicateId
     */
    Result<std::string> addRule(SanitizationRule rule);

    /// Replace the rule with the same id
    Result<void> updateRule(const SanitizationRule& rule);

    Result<void> removeRule(const std::string& id);

    Result<void> setRuleEnabled(const std::string& id, bool enabled);

    [[nodiscard]] std::optional<SanitizationRule> findRule(const std::string& id) const;

    /// Compile status of a rule, RuleNotFound when absent
    [[nodiscard]] ErrorCode ruleStatus(const std::string& id) const;

    /// All rules in insertion order
    [[nodiscard]] std::vector<SanitizationRule> rules() const;

    /**
     * @brief Enabled rules by priority, highest first
     *
     * Stable: equal priorities keep insertion order. Inert rules are
     * included so the resolver can report and skip them.
     */
    [[nodiscard]] std::vector<CompiledRule> sortedEnabledRules() const;

    /// Replace every rule (import)
    void replaceRules(std::vector<SanitizationRule> rules);

    void resetRulesToDefaults();

    // ---- Patterns ----------------------------------------------------------

    Result<std::string> addPattern(SensitivePattern pattern);

    Result<void> updatePattern(const SensitivePattern& pattern);

    Result<void> removePattern(const std::string& id);

    Result<void> setPatternEnabled(const std::string& id, bool enabled);

    [[nodiscard]] std::optional<SensitivePattern> findPattern(const std::string& id) const;

    [[nodiscard]] ErrorCode patternStatus(const std::string& id) const;

    [[nodiscard]] std::vector<SensitivePattern> patterns() const;

    /// Enabled patterns in insertion order
    [[nodiscard]] std::vector<CompiledPattern> enabledPatterns() const;

    /// Replace every pattern (import, saved library)
    void replacePatterns(std::vector<SensitivePattern> patterns);

    void resetPatternsToDefaults();

private:
    CompiledRule compileRule(SanitizationRule rule) const;
    CompiledPattern compileEntry(SensitivePattern pattern) const;
    Result<std::string> newId();

    Core::Logger& m_logger;
    mutable std::shared_mutex m_mutex;
    std::vector<CompiledRule> m_rules;
    std::vector<CompiledPattern> m_patterns;
};

} // namespace ClipGuard::Sanitize

#endif // CLIPGUARD_CORE_PATTERNS_HPP
