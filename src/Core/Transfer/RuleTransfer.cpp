/**
 * @file RuleTransfer.cpp
 * @brief Rule and pattern envelopes, legacy import and the saved library
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/RuleTransfer.hpp>
#include <nlohmann/json.hpp>
#include <charconv>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unordered_set>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ClipGuard::Transfer {

namespace {

using Sanitize::SanitizationRule;
using Sanitize::SensitivePattern;

/// Value under @p key, falling back to @p legacyKey
const json* field(const json& object, const char* key, const char* legacyKey = nullptr) {
    auto it = object.find(key);
    if (it != object.end()) {
        return &*it;
    }
    if (legacyKey) {
        it = object.find(legacyKey);
        if (it != object.end()) {
            return &*it;
        }
    }
    return nullptr;
}

Result<SanitizationRule> ruleFromJson(const json& j) {
    if (!j.is_object()) {
        return ErrorCode::InvalidFormat;
    }

    SanitizationRule rule;

    const json* name = field(j, "name");
    const json* pattern = field(j, "pattern");
    if (!name || !name->is_string() || !pattern || !pattern->is_string()) {
        return ErrorCode::InvalidFormat;
    }
    rule.name = name->get<std::string>();
    rule.pattern = pattern->get<std::string>();

    if (const json* id = field(j, "id")) {
        if (!id->is_string()) {
            return ErrorCode::InvalidFormat;
        }
        rule.id = id->get<std::string>();
    }

    if (const json* enabled = field(j, "enabled", "isEnabled")) {
        if (!enabled->is_boolean()) {
            return ErrorCode::InvalidFormat;
        }
        rule.enabled = enabled->get<bool>();
    }

    const json* action = field(j, "action", "ruleType");
    if (!action || !action->is_number_integer()) {
        return ErrorCode::InvalidFormat;
    }
    auto parsedAction = Sanitize::ruleActionFromCode(action->get<int64_t>());
    if (!parsedAction) {
        return ErrorCode::InvalidFormat;
    }
    rule.action = *parsedAction;

    if (const json* replacement = field(j, "replacement", "replacementValue")) {
        if (replacement->is_string()) {
            rule.replacement = replacement->get<std::string>();
        } else if (!replacement->is_null()) {
            return ErrorCode::InvalidFormat;
        }
    }

    if (const json* priority = field(j, "priority")) {
        if (!priority->is_number_integer()) {
            return ErrorCode::InvalidFormat;
        }
        rule.priority = priority->get<int>();
    }

    rule.allowShortMatches = Sanitize::isCardNumberRuleName(rule.name);
    return rule;
}

Result<std::vector<SanitizationRule>> rulesFromJson(const json& list) {
    if (!list.is_array()) {
        return ErrorCode::InvalidFormat;
    }

    std::vector<SanitizationRule> rules;
    rules.reserve(list.size());
    for (const auto& entry : list) {
        auto rule = ruleFromJson(entry);
        if (rule.isFailure()) {
            return rule.error();
        }
        rules.push_back(std::move(rule.value()));
    }
    return rules;
}

Result<SensitivePattern> patternFromJson(const json& j) {
    if (!j.is_object()) {
        return ErrorCode::InvalidFormat;
    }

    SensitivePattern pattern;

    const json* name = field(j, "name");
    const json* source = field(j, "pattern");
    if (!name || !name->is_string() || !source || !source->is_string()) {
        return ErrorCode::InvalidFormat;
    }
    pattern.name = name->get<std::string>();
    pattern.pattern = source->get<std::string>();

    if (const json* id = field(j, "id")) {
        if (!id->is_string()) {
            return ErrorCode::InvalidFormat;
        }
        pattern.id = id->get<std::string>();
    }

    if (const json* category = field(j, "category")) {
        if (!category->is_string()) {
            return ErrorCode::InvalidFormat;
        }
        // Free-form categories from older exports score as personal data
        pattern.category = Sanitize::categoryFromName(category->get<std::string>())
                               .value_or(Sanitize::PatternCategory::Personal);
    }

    if (const json* description = field(j, "description")) {
        if (!description->is_string()) {
            return ErrorCode::InvalidFormat;
        }
        pattern.description = description->get<std::string>();
    }

    if (const json* enabled = field(j, "enabled", "isEnabled")) {
        if (!enabled->is_boolean()) {
            return ErrorCode::InvalidFormat;
        }
        pattern.enabled = enabled->get<bool>();
    }

    return pattern;
}

Result<std::vector<SensitivePattern>> patternsFromJson(const json& list) {
    if (!list.is_array()) {
        return ErrorCode::InvalidFormat;
    }

    std::vector<SensitivePattern> patterns;
    patterns.reserve(list.size());
    for (const auto& entry : list) {
        auto pattern = patternFromJson(entry);
        if (pattern.isFailure()) {
            return pattern.error();
        }
        patterns.push_back(std::move(pattern.value()));
    }
    return patterns;
}

Result<Sanitize::SanitizationPreferences> preferencesFromJson(const json* j) {
    Sanitize::SanitizationPreferences preferences;
    if (!j) {
        return preferences;
    }
    if (!j->is_object()) {
        return ErrorCode::InvalidFormat;
    }

    if (const json* detection = field(*j, "detectionEnabled")) {
        if (!detection->is_boolean()) {
            return ErrorCode::InvalidFormat;
        }
        preferences.detectionEnabled = detection->get<bool>();
    }
    if (const json* mask = field(*j, "maskChar")) {
        if (!mask->is_string() || mask->get_ref<const std::string&>().size() != 1) {
            return ErrorCode::InvalidFormat;
        }
        preferences.maskChar = mask->get_ref<const std::string&>()[0];
    }
    return preferences;
}

json rulesToJson(const std::vector<SanitizationRule>& rules) {
    json list = json::array();
    for (const auto& rule : rules) {
        json entry;
        entry["id"] = rule.id;
        entry["name"] = rule.name;
        entry["pattern"] = rule.pattern;
        entry["enabled"] = rule.enabled;
        entry["action"] = static_cast<int>(rule.action);
        entry["replacement"] = rule.replacement ? json(*rule.replacement) : json(nullptr);
        entry["priority"] = rule.priority;
        list.push_back(std::move(entry));
    }
    return list;
}

json patternsToJson(const std::vector<SensitivePattern>& patterns) {
    json list = json::array();
    for (const auto& pattern : patterns) {
        list.push_back({
            {"id", pattern.id},
            {"name", pattern.name},
            {"pattern", pattern.pattern},
            {"category", Sanitize::categoryName(pattern.category)},
            {"description", pattern.description},
            {"enabled", pattern.enabled}
        });
    }
    return list;
}

json metadataJson(Timestamp exportedAt) {
    return {
        {"version", EXPORT_FORMAT_VERSION},
        {"exportDate", RuleTransfer::formatIso8601(exportedAt)},
        {"appName", APP_NAME}
    };
}

/// Ids repeated within one list are cleared so the library assigns fresh ones
template<typename Entry>
void clearRepeatedIds(std::vector<Entry>& entries) {
    std::unordered_set<std::string> seen;
    for (auto& entry : entries) {
        if (!entry.id.empty() && !seen.insert(entry.id).second) {
            entry.id.clear();
        }
    }
}

Result<void> writeDocument(const std::string& document, const std::string& path,
                           Core::Logger& logger) {
    const std::string tmpPath = path + ".tmp";

    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            CLIPGUARD_LOG_ERROR_F(logger, "Cannot create %s", tmpPath.c_str());
            return ErrorCode::FileWriteError;
        }
        out.write(document.data(), static_cast<std::streamsize>(document.size()));
        out.flush();
        if (!out) {
            return ErrorCode::FileWriteError;
        }
    }

    std::error_code ec;
    fs::rename(tmpPath, path, ec);
    if (ec) {
        CLIPGUARD_LOG_ERROR_F(logger, "Cannot move %s into place: %s",
                              path.c_str(), ec.message().c_str());
        fs::remove(tmpPath, ec);
        return ErrorCode::FileWriteError;
    }
    return Result<void>::Success();
}

Result<std::string> readDocument(const std::string& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return ErrorCode::FileNotFound;
    }
    if (size > MAX_IMPORT_FILE_SIZE) {
        return ErrorCode::FileTooLarge;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return ErrorCode::FileReadError;
    }
    std::string document((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return ErrorCode::FileReadError;
    }
    return document;
}

Result<int> majorVersion(const std::string& version) {
    int major = 0;
    const char* begin = version.data();
    const char* end = begin + version.size();
    auto [ptr, ec] = std::from_chars(begin, end, major);
    if (ec != std::errc() || ptr == begin || (ptr != end && *ptr != '.')) {
        return ErrorCode::InvalidFormat;
    }
    return major;
}

/// Metadata of an envelope whose payload lives under @p listKey
Result<ExportMetadata> parseMetadata(const json& doc, const char* listKey) {
    if (!doc.is_object()) {
        return ErrorCode::InvalidFormat;
    }

    const json* metadata = field(doc, "metadata");
    if (!metadata || !metadata->is_object() || !field(doc, listKey)) {
        return ErrorCode::InvalidFormat;
    }

    ExportMetadata meta;
    const json* version = field(*metadata, "version");
    const json* exportDate = field(*metadata, "exportDate");
    const json* appName = field(*metadata, "appName");
    if (!version || !version->is_string() ||
        !exportDate || !exportDate->is_string() ||
        !appName || !appName->is_string()) {
        return ErrorCode::InvalidFormat;
    }
    meta.version = version->get<std::string>();
    meta.exportDate = exportDate->get<std::string>();
    meta.appName = appName->get<std::string>();

    auto major = majorVersion(meta.version);
    if (major.isFailure()) {
        return major.error();
    }
    if (major.value() != SUPPORTED_MAJOR_VERSION) {
        return ErrorCode::IncompatibleVersion;
    }
    return meta;
}

Result<ImportedRules> parseEnvelope(const json& doc) {
    ExportMetadata meta;
    CLIPGUARD_TRY_ASSIGN(meta, parseMetadata(doc, "rules"));

    auto parsed = rulesFromJson(*field(doc, "rules"));
    if (parsed.isFailure()) {
        return parsed.error();
    }

    ImportedRules imported;
    imported.rules = std::move(parsed.value());
    imported.metadata = std::move(meta);
    return imported;
}

} // anonymous namespace

// ============================================================================
// Export
// ============================================================================

std::string RuleTransfer::formatIso8601(Timestamp timestamp) {
    std::time_t seconds = WallClock::to_time_t(timestamp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer, written);
}

std::string RuleTransfer::exportRules(const std::vector<Sanitize::SanitizationRule>& rules,
                                      Timestamp exportedAt) const {
    json doc;
    doc["metadata"] = metadataJson(exportedAt);
    doc["rules"] = rulesToJson(rules);

    CLIPGUARD_LOG_DEBUG_F(m_logger, "Exported %zu rules", rules.size());
    return doc.dump(2);
}

Result<void> RuleTransfer::exportToFile(const std::vector<Sanitize::SanitizationRule>& rules,
                                        const std::string& path) const {
    return writeDocument(exportRules(rules), path, m_logger);
}

// ============================================================================
// Import
// ============================================================================

Result<ImportedRules> RuleTransfer::importRules(std::string_view document) const {
    json doc = json::parse(document.begin(), document.end(), nullptr, false);
    if (doc.is_discarded()) {
        CLIPGUARD_LOG_WARNING(m_logger, "Rule import rejected: not JSON");
        return ErrorCode::InvalidFormat;
    }

    auto envelope = parseEnvelope(doc);
    if (envelope.isSuccess()) {
        CLIPGUARD_LOG_INFO_F(m_logger, "Imported %zu rules (format %s)",
                             envelope.value().rules.size(),
                             envelope.value().metadata->version.c_str());
        return envelope;
    }
    if (envelope.error() == ErrorCode::IncompatibleVersion) {
        CLIPGUARD_LOG_WARNING(m_logger, "Rule import rejected: unsupported version");
        return ErrorCode::IncompatibleVersion;
    }

    // Legacy: a bare list of rules
    auto legacy = rulesFromJson(doc);
    if (legacy.isFailure()) {
        CLIPGUARD_LOG_WARNING(m_logger, "Rule import rejected: invalid format");
        return ErrorCode::InvalidFormat;
    }

    ImportedRules imported;
    imported.rules = std::move(legacy.value());
    imported.legacyFormat = true;
    CLIPGUARD_LOG_INFO_F(m_logger, "Imported %zu rules (legacy list)", imported.rules.size());
    return imported;
}

Result<ImportedRules> RuleTransfer::importFromFile(const std::string& path) const {
    std::string document;
    CLIPGUARD_TRY_ASSIGN(document, readDocument(path));
    return importRules(document);
}

Result<size_t> RuleTransfer::apply(Sanitize::PatternLibrary& library,
                                   const ImportedRules& imported, ImportMode mode) const {
    if (mode == ImportMode::Replace) {
        std::vector<SanitizationRule> rules = imported.rules;
        clearRepeatedIds(rules);
        const size_t count = rules.size();
        library.replaceRules(std::move(rules));
        return count;
    }

    size_t added = 0;
    for (SanitizationRule rule : imported.rules) {
        auto result = library.addRule(rule);
        if (result.isFailure() && result.error() == ErrorCode::DuplicateId) {
            rule.id.clear();
            result = library.addRule(rule);
        }
        if (result.isFailure()) {
            CLIPGUARD_LOG_WARNING_F(m_logger, "Rule '%s' not imported: %s",
                                    rule.name.c_str(), getErrorMessage(result.error()).data());
            continue;
        }
        ++added;
    }
    return added;
}

// ============================================================================
// Patterns
// ============================================================================

std::string RuleTransfer::exportPatterns(const std::vector<Sanitize::SensitivePattern>& patterns,
                                         Timestamp exportedAt) const {
    json doc;
    doc["metadata"] = metadataJson(exportedAt);
    doc["patterns"] = patternsToJson(patterns);

    CLIPGUARD_LOG_DEBUG_F(m_logger, "Exported %zu patterns", patterns.size());
    return doc.dump(2);
}

Result<ImportedPatterns> RuleTransfer::importPatterns(std::string_view document) const {
    json doc = json::parse(document.begin(), document.end(), nullptr, false);
    if (doc.is_discarded()) {
        CLIPGUARD_LOG_WARNING(m_logger, "Pattern import rejected: not JSON");
        return ErrorCode::InvalidFormat;
    }

    ImportedPatterns imported;
    auto meta = parseMetadata(doc, "patterns");
    if (meta.isFailure() && meta.error() == ErrorCode::IncompatibleVersion) {
        CLIPGUARD_LOG_WARNING(m_logger, "Pattern import rejected: unsupported version");
        return ErrorCode::IncompatibleVersion;
    }

    auto parsed = patternsFromJson(meta.isSuccess() ? *field(doc, "patterns") : doc);
    if (parsed.isFailure() || parsed.value().empty()) {
        CLIPGUARD_LOG_WARNING(m_logger, "Pattern import rejected: no valid patterns");
        return ErrorCode::InvalidFormat;
    }

    imported.patterns = std::move(parsed.value());
    if (meta.isSuccess()) {
        imported.metadata = std::move(meta.value());
    } else {
        imported.legacyFormat = true;
    }
    CLIPGUARD_LOG_INFO_F(m_logger, "Imported %zu patterns", imported.patterns.size());
    return imported;
}

Result<void> RuleTransfer::exportPatternsToFile(const std::vector<Sanitize::SensitivePattern>& patterns,
                                                const std::string& path) const {
    return writeDocument(exportPatterns(patterns), path, m_logger);
}

Result<ImportedPatterns> RuleTransfer::importPatternsFromFile(const std::string& path) const {
    std::string document;
    CLIPGUARD_TRY_ASSIGN(document, readDocument(path));
    return importPatterns(document);
}

Result<size_t> RuleTransfer::applyPatterns(Sanitize::PatternLibrary& library,
                                           const ImportedPatterns& imported, ImportMode mode) const {
    if (mode == ImportMode::Replace) {
        std::vector<SensitivePattern> patterns = imported.patterns;
        clearRepeatedIds(patterns);
        const size_t count = patterns.size();
        library.replacePatterns(std::move(patterns));
        return count;
    }

    size_t added = 0;
    for (SensitivePattern pattern : imported.patterns) {
        auto result = library.addPattern(pattern);
        if (result.isFailure() && result.error() == ErrorCode::DuplicateId) {
            pattern.id.clear();
            result = library.addPattern(pattern);
        }
        if (result.isFailure()) {
            CLIPGUARD_LOG_WARNING_F(m_logger, "Pattern '%s' not imported: %s",
                                    pattern.name.c_str(), getErrorMessage(result.error()).data());
            continue;
        }
        ++added;
    }
    return added;
}

// ============================================================================
// Saved Library
// ============================================================================

SavedLibrary RuleTransfer::capture(Sanitize::SanitizationService& service) {
    SavedLibrary saved;
    saved.rules = service.library().rules();
    saved.patterns = service.library().patterns();
    saved.preferences = service.preferences();
    return saved;
}

Result<void> RuleTransfer::saveLibrary(const SavedLibrary& saved, const std::string& path) const {
    json doc;
    doc["metadata"] = metadataJson(WallClock::now());
    doc["rules"] = rulesToJson(saved.rules);
    doc["patterns"] = patternsToJson(saved.patterns);
    doc["preferences"] = {
        {"detectionEnabled", saved.preferences.detectionEnabled},
        {"maskChar", std::string(1, saved.preferences.maskChar)}
    };

    CLIPGUARD_TRY(writeDocument(doc.dump(2), path, m_logger));
    CLIPGUARD_LOG_DEBUG_F(m_logger, "Saved %zu rules and %zu patterns to %s",
                          saved.rules.size(), saved.patterns.size(), path.c_str());
    return Result<void>::Success();
}

Result<SavedLibrary> RuleTransfer::loadLibrary(const std::string& path) const {
    std::string document;
    CLIPGUARD_TRY_ASSIGN(document, readDocument(path));

    json doc = json::parse(document, nullptr, false);
    if (doc.is_discarded()) {
        CLIPGUARD_LOG_WARNING_F(m_logger, "Saved library %s is not JSON", path.c_str());
        return ErrorCode::InvalidFormat;
    }

    ExportMetadata meta;
    CLIPGUARD_TRY_ASSIGN(meta, parseMetadata(doc, "rules"));

    const json* patternList = field(doc, "patterns");
    if (!patternList) {
        return ErrorCode::InvalidFormat;
    }

    std::vector<SanitizationRule> rules;
    CLIPGUARD_TRY_ASSIGN(rules, rulesFromJson(*field(doc, "rules")));
    std::vector<SensitivePattern> patterns;
    CLIPGUARD_TRY_ASSIGN(patterns, patternsFromJson(*patternList));
    Sanitize::SanitizationPreferences preferences;
    CLIPGUARD_TRY_ASSIGN(preferences, preferencesFromJson(field(doc, "preferences")));

    SavedLibrary saved;
    saved.rules = std::move(rules);
    saved.patterns = std::move(patterns);
    saved.preferences = preferences;

    CLIPGUARD_LOG_INFO_F(m_logger, "Loaded %zu rules and %zu patterns (format %s)",
                         saved.rules.size(), saved.patterns.size(), meta.version.c_str());
    return saved;
}

void RuleTransfer::restore(Sanitize::SanitizationService& service, const SavedLibrary& saved) const {
    std::vector<SanitizationRule> rules = saved.rules;
    clearRepeatedIds(rules);
    std::vector<SensitivePattern> patterns = saved.patterns;
    clearRepeatedIds(patterns);

    service.library().replaceRules(std::move(rules));
    service.library().replacePatterns(std::move(patterns));
    service.setPreferences(saved.preferences);
}

} // namespace ClipGuard::Transfer
