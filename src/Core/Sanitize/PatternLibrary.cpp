/**
 * @file PatternLibrary.cpp
 * @brief Rule/pattern storage and regular expression compilation
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Patterns.hpp>
#include <ClipGuard/Core/Crypto.hpp>
#include <re2/re2.h>
#include <algorithm>
#include <mutex>

namespace ClipGuard::Sanitize {

namespace {

constexpr std::string_view CASE_INSENSITIVE_PREFIX = "(?i)";

template<typename Entry>
auto findById(std::vector<Entry>& entries, const std::string& id,
              const std::string& (*key)(const Entry&)) {
    return std::find_if(entries.begin(), entries.end(),
                        [&](const Entry& e) { return key(e) == id; });
}

const std::string& ruleKey(const CompiledRule& entry) { return entry.rule.id; }
const std::string& patternKey(const CompiledPattern& entry) { return entry.pattern.id; }

} // anonymous namespace

// ============================================================================
// Free Functions
// ============================================================================

std::optional<RuleAction> ruleActionFromCode(int64_t code) noexcept {
    switch (code) {
        case 0: return RuleAction::Mask;
        case 1: return RuleAction::Rename;
        case 2: return RuleAction::Obfuscate;
        case 3: return RuleAction::Remove;
        default: return std::nullopt;
    }
}

const char* ruleActionName(RuleAction action) noexcept {
    switch (action) {
        case RuleAction::Mask:      return "Mask";
        case RuleAction::Rename:    return "Rename";
        case RuleAction::Obfuscate: return "Obfuscate";
        case RuleAction::Remove:    return "Remove";
    }
    return "Unknown";
}

const char* categoryName(PatternCategory category) noexcept {
    switch (category) {
        case PatternCategory::Payment:        return "Payment Information";
        case PatternCategory::Credentials:    return "Credentials";
        case PatternCategory::GovernmentID:   return "Government ID";
        case PatternCategory::Network:        return "Network Information";
        case PatternCategory::Contact:        return "Contact Information";
        case PatternCategory::Connection:     return "Connection Information";
        case PatternCategory::Cryptocurrency: return "Cryptocurrency";
        case PatternCategory::Personal:       return "Personal Information";
        case PatternCategory::Financial:      return "Financial Information";
    }
    return "Unknown";
}

std::optional<PatternCategory> categoryFromName(std::string_view name) noexcept {
    constexpr PatternCategory all[] = {
        PatternCategory::Payment, PatternCategory::Credentials, PatternCategory::GovernmentID,
        PatternCategory::Network, PatternCategory::Contact, PatternCategory::Connection,
        PatternCategory::Cryptocurrency, PatternCategory::Personal, PatternCategory::Financial
    };
    for (PatternCategory category : all) {
        if (name == categoryName(category)) {
            return category;
        }
    }
    return std::nullopt;
}

Result<RegexPtr> compilePattern(const std::string& source) {
    std::string_view body = source;
    re2::RE2::Options options;
    options.set_log_errors(false);
    
    if (body.substr(0, CASE_INSENSITIVE_PREFIX.size()) == CASE_INSENSITIVE_PREFIX) {
        body.remove_prefix(CASE_INSENSITIVE_PREFIX.size());
        options.set_case_sensitive(false);
    }
    
    if (body.empty()) {
        return ErrorCode::EmptyPattern;
    }
    
    auto regex = std::make_shared<const re2::RE2>(re2::StringPiece(body.data(), body.size()), options);
    if (!regex->ok()) {
        return ErrorCode::InvalidPattern;
    }
    return RegexPtr(std::move(regex));
}

bool isCardNumberRuleName(std::string_view name) noexcept {
    return name.find("Credit Card") != std::string_view::npos;
}

// ============================================================================
// PatternLibrary
// ============================================================================

PatternLibrary::PatternLibrary(Core::Logger& logger, bool loadDefaults)
    : m_logger(logger) {
    if (loadDefaults) {
        resetRulesToDefaults();
        resetPatternsToDefaults();
    }
}

PatternLibrary::~PatternLibrary() = default;

CompiledRule PatternLibrary::compileRule(SanitizationRule rule) const {
    CompiledRule compiled;
    auto regex = compilePattern(rule.pattern);
    if (regex.isSuccess()) {
        compiled.regex = regex.value();
    } else {
        compiled.status = regex.error();
        CLIPGUARD_LOG_WARNING_F(m_logger, "Rule '%s' is inert: %s",
                                rule.name.c_str(), getErrorMessage(compiled.status).data());
    }
    compiled.rule = std::move(rule);
    return compiled;
}

CompiledPattern PatternLibrary::compileEntry(SensitivePattern pattern) const {
    CompiledPattern compiled;
    auto regex = compilePattern(pattern.pattern);
    if (regex.isSuccess()) {
        compiled.regex = regex.value();
    } else {
        compiled.status = regex.error();
        CLIPGUARD_LOG_WARNING_F(m_logger, "Pattern '%s' is inert: %s",
                                pattern.name.c_str(), getErrorMessage(compiled.status).data());
    }
    compiled.pattern = std::move(pattern);
    return compiled;
}

Result<std::string> PatternLibrary::newId() {
    Crypto::SecureRandom random;
    return random.generateUuid();
}

// ---- Rules -----------------------------------------------------------------

Result<std::string> PatternLibrary::addRule(SanitizationRule rule) {
    if (rule.id.empty()) {
        std::string id;
        CLIPGUARD_TRY_ASSIGN(id, newId());
        rule.id = std::move(id);
    }
    
    CompiledRule compiled = compileRule(std::move(rule));
    
    std::unique_lock lock(m_mutex);
    if (findById(m_rules, compiled.rule.id, &ruleKey) != m_rules.end()) {
        return ErrorCode::DuplicateId;
    }
    std::string id = compiled.rule.id;
    m_rules.push_back(std::move(compiled));
    return id;
}

Result<void> PatternLibrary::updateRule(const SanitizationRule& rule) {
    CompiledRule compiled = compileRule(rule);
    
    std::unique_lock lock(m_mutex);
    auto it = findById(m_rules, rule.id, &ruleKey);
    if (it == m_rules.end()) {
        return ErrorCode::RuleNotFound;
    }
    *it = std::move(compiled);
    return Result<void>::Success();
}

Result<void> PatternLibrary::removeRule(const std::string& id) {
    std::unique_lock lock(m_mutex);
    auto it = findById(m_rules, id, &ruleKey);
    if (it == m_rules.end()) {
        return ErrorCode::RuleNotFound;
    }
    m_rules.erase(it);
    return Result<void>::Success();
}

Result<void> PatternLibrary::setRuleEnabled(const std::string& id, bool enabled) {
    std::unique_lock lock(m_mutex);
    auto it = findById(m_rules, id, &ruleKey);
    if (it == m_rules.end()) {
        return ErrorCode::RuleNotFound;
    }
    it->rule.enabled = enabled;
    return Result<void>::Success();
}

std::optional<SanitizationRule> PatternLibrary::findRule(const std::string& id) const {
    std::shared_lock lock(m_mutex);
    for (const auto& entry : m_rules) {
        if (entry.rule.id == id) {
            return entry.rule;
        }
    }
    return std::nullopt;
}

ErrorCode PatternLibrary::ruleStatus(const std::string& id) const {
    std::shared_lock lock(m_mutex);
    for (const auto& entry : m_rules) {
        if (entry.rule.id == id) {
            return entry.status;
        }
    }
    return ErrorCode::RuleNotFound;
}

std::vector<SanitizationRule> PatternLibrary::rules() const {
    std::shared_lock lock(m_mutex);
    std::vector<SanitizationRule> result;
    result.reserve(m_rules.size());
    for (const auto& entry : m_rules) {
        result.push_back(entry.rule);
    }
    return result;
}

std::vector<CompiledRule> PatternLibrary::sortedEnabledRules() const {
    std::vector<CompiledRule> result;
    {
        std::shared_lock lock(m_mutex);
        for (const auto& entry : m_rules) {
            if (entry.rule.enabled) {
                result.push_back(entry);
            }
        }
    }
    
    std::stable_sort(result.begin(), result.end(),
                     [](const CompiledRule& a, const CompiledRule& b) {
                         return a.rule.priority > b.rule.priority;
                     });
    return result;
}

void PatternLibrary::replaceRules(std::vector<SanitizationRule> rules) {
    std::vector<CompiledRule> compiled;
    compiled.reserve(rules.size());
    for (auto& rule : rules) {
        if (rule.id.empty()) {
            auto id = newId();
            if (id.isFailure()) {
                CLIPGUARD_LOG_ERROR_F(m_logger, "Dropping rule '%s': %s",
                                      rule.name.c_str(), getErrorMessage(id.error()).data());
                continue;
            }
            rule.id = id.value();
        }
        compiled.push_back(compileRule(std::move(rule)));
    }
    
    std::unique_lock lock(m_mutex);
    m_rules = std::move(compiled);
}

void PatternLibrary::resetRulesToDefaults() {
    replaceRules(defaultRules());
}

// ---- Patterns --------------------------------------------------------------

Result<std::string> PatternLibrary::addPattern(SensitivePattern pattern) {
    if (pattern.id.empty()) {
        std::string id;
        CLIPGUARD_TRY_ASSIGN(id, newId());
        pattern.id = std::move(id);
    }
    
    CompiledPattern compiled = compileEntry(std::move(pattern));
    
    std::unique_lock lock(m_mutex);
    if (findById(m_patterns, compiled.pattern.id, &patternKey) != m_patterns.end()) {
        return ErrorCode::DuplicateId;
    }
    std::string id = compiled.pattern.id;
    m_patterns.push_back(std::move(compiled));
    return id;
}

Result<void> PatternLibrary::updatePattern(const SensitivePattern& pattern) {
    CompiledPattern compiled = compileEntry(pattern);
    
    std::unique_lock lock(m_mutex);
    auto it = findById(m_patterns, pattern.id, &patternKey);
    if (it == m_patterns.end()) {
        return ErrorCode::PatternNotFound;
    }
    *it = std::move(compiled);
    return Result<void>::Success();
}

Result<void> PatternLibrary::removePattern(const std::string& id) {
    std::unique_lock lock(m_mutex);
    auto it = findById(m_patterns, id, &patternKey);
    if (it == m_patterns.end()) {
        return ErrorCode::PatternNotFound;
    }
    m_patterns.erase(it);
    return Result<void>::Success();
}

Result<void> PatternLibrary::setPatternEnabled(const std::string& id, bool enabled) {
    std::unique_lock lock(m_mutex);
    auto it = findById(m_patterns, id, &patternKey);
    if (it == m_patterns.end()) {
        return ErrorCode::PatternNotFound;
    }
    it->pattern.enabled = enabled;
    return Result<void>::Success();
}

std::optional<SensitivePattern> PatternLibrary::findPattern(const std::string& id) const {
    std::shared_lock lock(m_mutex);
    for (const auto& entry : m_patterns) {
        if (entry.pattern.id == id) {
            return entry.pattern;
        }
    }
    return std::nullopt;
}

ErrorCode PatternLibrary::patternStatus(const std::string& id) const {
    std::shared_lock lock(m_mutex);
    for (const auto& entry : m_patterns) {
        if (entry.pattern.id == id) {
            return entry.status;
        }
    }
    return ErrorCode::PatternNotFound;
}

std::vector<SensitivePattern> PatternLibrary::patterns() const {
    std::shared_lock lock(m_mutex);
    std::vector<SensitivePattern> result;
    result.reserve(m_patterns.size());
    for (const auto& entry : m_patterns) {
        result.push_back(entry.pattern);
    }
    return result;
}

std::vector<CompiledPattern> PatternLibrary::enabledPatterns() const {
    std::shared_lock lock(m_mutex);
    std::vector<CompiledPattern> result;
    for (const auto& entry : m_patterns) {
        if (entry.pattern.enabled) {
            result.push_back(entry);
        }
    }
    return result;
}

void PatternLibrary::replacePatterns(std::vector<SensitivePattern> patterns) {
    std::vector<CompiledPattern> compiled;
    compiled.reserve(patterns.size());
    for (auto& pattern : patterns) {
        if (pattern.id.empty()) {
            auto id = newId();
            if (id.isFailure()) {
                CLIPGUARD_LOG_ERROR_F(m_logger, "Dropping pattern '%s': %s",
                                      pattern.name.c_str(), getErrorMessage(id.error()).data());
                continue;
            }
            pattern.id = id.value();
        }
        compiled.push_back(compileEntry(std::move(pattern)));
    }
    
    std::unique_lock lock(m_mutex);
    m_patterns = std::move(compiled);
}

void PatternLibrary::resetPatternsToDefaults() {
    replacePatterns(defaultPatterns());
}

} // namespace ClipGuard::Sanitize
