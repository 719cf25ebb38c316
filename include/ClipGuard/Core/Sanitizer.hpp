/**
 * @file Sanitizer.hpp
 * @brief Match resolution, confidence scoring and the sanitization pipeline
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 *
 * Pipeline for one sanitize() call:
 * 1. Detection pass: every enabled builtin pattern is matched against the
 *    input. Each hit is scored; hits at or above REDACTION_THRESHOLD are
 *    masked, the rest are only reported.
 * 2. Rule pass: enabled user rules run by priority over the text produced
 *    by step 1. Each rule sees the output of the rule before it.
 *
 * All offsets are byte offsets into UTF-8 text. Lengths used for policy
 * (short-match rejection, mask width) count code points.
 */

#pragma once

#ifndef CLIPGUARD_CORE_SANITIZER_HPP
#define CLIPGUARD_CORE_SANITIZER_HPP

#include <ClipGuard/Core/Types.hpp>
#include <ClipGuard/Core/ErrorCodes.hpp>
#include <ClipGuard/Core/Logger.hpp>
#include <ClipGuard/Core/Patterns.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ClipGuard::Sanitize {

// ============================================================================
// Spans
// ============================================================================

/**
 * @brief Byte range inside a text buffer
 */
struct Span {
    size_t offset = 0;
    size_t length = 0;

    [[nodiscard]] size_t end() const noexcept { return offset + length; }

    [[nodiscard]] bool overlaps(const Span& other) const noexcept {
        return offset < other.end() && other.offset < end();
    }

    bool operator==(const Span&) const = default;
};

/// The whole match was selected
struct FullMatch {
    Span span;
};

/// A capture group was selected
struct CapturedSpan {
    Span span;
    size_t groupIndex = 0;  ///< 1-based group number
};

/// Result of span selection for one regex match
using SpanSelection = std::variant<FullMatch, CapturedSpan>;

/// Span of either selection kind
[[nodiscard]] Span spanOf(const SpanSelection& selection) noexcept;

/**
 * @brief Group offsets of one regex match
 *
 * groups[0] is the whole match. A group that did not participate is
 * std::nullopt.
 */
struct RegexMatch {
    std::vector<std::optional<Span>> groups;
};

/**
 * @brief Every non-overlapping match of @p regex in @p text, left to right
 *
 * An empty match moves the search forward by one code point. Text before
 * the search position still counts as context for \b and ^.
 */
[[nodiscard]] std::vector<RegexMatch> findAllMatches(const re2::RE2& regex, std::string_view text);

// ============================================================================
// Sanitization Applier
// ============================================================================

/**
 * @brief Produces the replacement string for a rule action
 */
class SanitizationApplier {
public:
    static constexpr const char* DEFAULT_RENAME = "[REDACTED]";

    explicit SanitizationApplier(char maskChar = '*') noexcept
        : m_maskChar(maskChar) {}

    /**
     * @brief Replacement for @p matched under @p action
     * @param replacement Rename value; DEFAULT_RENAME when absent
     */
    [[nodiscard]] std::string apply(RuleAction action, std::string_view matched,
                                    const std::optional<std::string>& replacement = std::nullopt) const;

    /// One mask character per code point of @p matched
    [[nodiscard]] std::string mask(std::string_view matched) const;

    /// "[OBFUSCATED:" + first 8 hex digits of SHA-256 + "]"
    [[nodiscard]] static std::string obfuscate(std::string_view matched);

    [[nodiscard]] char maskChar() const noexcept { return m_maskChar; }

private:
    char m_maskChar;
};

// ============================================================================
// Match Resolver
// ============================================================================

/**
 * @brief One replacement performed by a rule
 *
 * `selection` is relative to the buffer the rule ran on, which is the
 * output of the previous rule.
 */
struct ResolvedMatch {
    std::string ruleId;
    std::string ruleName;
    SpanSelection selection;
    std::string matchedText;
    std::string replacement;
};

/**
 * @brief Output of a rule pass
 */
struct Resolution {
    std::string text;                       ///< Rewritten text
    std::vector<ResolvedMatch> matches;     ///< In application order
    std::vector<std::string> skippedRules;  ///< Ids of inert or failing rules
};

/**
 * @brief Runs rules sequentially over a shared buffer
 *
 * Each rule is one step of a fold: its matches are found in the current
 * buffer, applied rightmost-first into a new string, and that string is
 * handed to the next rule.
 */
class MatchResolver {
public:
    /// Spans shorter than this (in code points) are left alone
    static constexpr size_t MIN_MATCH_CHARACTERS = 3;

    explicit MatchResolver(Core::Logger& logger) noexcept
        : m_logger(logger) {}

    /**
     * @brief Apply @p rules (already ordered by priority) to @p text
     */
    [[nodiscard]] Resolution resolve(const std::vector<CompiledRule>& rules,
                                     std::string_view text,
                                     const SanitizationApplier& applier) const;

    /**
     * @brief First non-empty capture group 1..K, else the full match
     */
    [[nodiscard]] static SpanSelection selectSpan(const RegexMatch& match);

private:
    Core::Logger& m_logger;
};

// ============================================================================
// Confidence Scorer
// ============================================================================

/**
 * @brief Scores automatic detections in [0, 1]
 *
 * | Category                 | Score                               |
 * |--------------------------|-------------------------------------|
 * | Payment (Credit Card)    | 0.9 Luhn-valid, 0.3 otherwise       |
 * | Government ID            | 0.85                                |
 * | Credentials              | 0.8, 0.2 with a placeholder token   |
 * | Contact (Email)          | 0.75 with '@' and '.', else 0.3     |
 * | Contact (Phone)          | 0.7 with >= 10 digits, else 0.4     |
 * | Network, Connection, ... | 0.6                                 |
 *
 * Payment and Contact entries not covered above keep the 0.5 baseline.
 * Matches under 6 characters are scaled by 0.8.
 */
class ConfidenceScorer {
public:
    static constexpr double BASELINE = 0.5;
    static constexpr double REDACTION_THRESHOLD = 0.8;

    [[nodiscard]] static double score(std::string_view matchedText,
                                      const SensitivePattern& pattern);

    /// Luhn check over the digits of @p text; needs 13 to 19 digits
    [[nodiscard]] static bool passesLuhn(std::string_view text) noexcept;

    [[nodiscard]] static bool shouldRedact(double confidence) noexcept {
        return confidence >= REDACTION_THRESHOLD;
    }
};

// ============================================================================
// Sanitization Service
// ============================================================================

/**
 * @brief One automatic detection from the last sanitize() call
 */
struct SensitiveDataDetection {
    std::string patternId;
    std::string patternName;
    PatternCategory category = PatternCategory::Personal;
    std::string matchedText;
    Span span;                 ///< In the input text
    double confidence = 0.0;
    bool redacted = false;
};

struct SanitizationPreferences {
    bool detectionEnabled = true;
    char maskChar = '*';
};

/**
 * @brief The full pipeline plus preferences and last detections
 *
 * Safe to call from several threads; the detections reported by
 * lastDetections() belong to whichever call finished last.
 */
class SanitizationService {
public:
    SanitizationService(PatternLibrary& library, Core::Logger& logger,
                        SanitizationPreferences preferences = {});

    SanitizationService(const SanitizationService&) = delete;
    SanitizationService& operator=(const SanitizationService&) = delete;

    /**
     * @brief Sanitize @p text
     * @return The rewritten text (equal to the input when nothing matched)
     */
    std::string sanitize(std::string_view text);

    /// Detections of the last call, highest confidence first
    [[nodiscard]] std::vector<SensitiveDataDetection> lastDetections() const;

    /// Rule replacements of the last call
    [[nodiscard]] std::vector<ResolvedMatch> lastRuleMatches() const;

    [[nodiscard]] SanitizationPreferences preferences() const;
    void setPreferences(const SanitizationPreferences& preferences);
    void setDetectionEnabled(bool enabled);
    void setMaskChar(char maskChar);

    [[nodiscard]] PatternLibrary& library() noexcept { return m_library; }

private:
    std::string runDetection(std::string_view text, const SanitizationApplier& applier,
                             std::vector<SensitiveDataDetection>& detections) const;

    PatternLibrary& m_library;
    Core::Logger& m_logger;
    MatchResolver m_resolver;

    mutable std::mutex m_mutex;
    SanitizationPreferences m_preferences;
    std::vector<SensitiveDataDetection> m_lastDetections;
    std::vector<ResolvedMatch> m_lastRuleMatches;
};

} // namespace ClipGuard::Sanitize

#endif // CLIPGUARD_CORE_SANITIZER_HPP
