/**
 * @file RuleTransfer.hpp
 * @brief JSON import and export of rules, patterns and the saved library
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 *
 * Export document:
 * @code{.json}
 * {
 *   "metadata": {"version": "1.0", "exportDate": "2025-03-01T12:00:00Z", "appName": "ClipGuard"},
 *   "rules": [
 *     {"id": "...", "name": "API Keys", "pattern": "...", "enabled": true,
 *      "action": 0, "replacement": null, "priority": 0}
 *   ]
 * }
 * @endcode
 *
 * Import also accepts a bare array of rules (the legacy format) and the
 * legacy key names `isEnabled`, `ruleType` and `replacementValue`. The bare
 * array is only tried when the document is not an envelope. One malformed
 * rule rejects the whole document.
 *
 * Pattern documents use the same envelope with a "patterns" list; each
 * entry carries id, name, pattern, category (display name), description
 * and enabled. An empty pattern list is rejected.
 *
 * The saved library is one envelope holding "rules", "patterns" and
 * "preferences" ({"detectionEnabled": true, "maskChar": "*"}). Since it
 * has a "rules" list, importRules() reads it as well.
 */

#pragma once

#ifndef CLIPGUARD_CORE_RULE_TRANSFER_HPP
#define CLIPGUARD_CORE_RULE_TRANSFER_HPP

#include <ClipGuard/Core/Types.hpp>
#include <ClipGuard/Core/ErrorCodes.hpp>
#include <ClipGuard/Core/Logger.hpp>
#include <ClipGuard/Core/Patterns.hpp>
#include <ClipGuard/Core/Sanitizer.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ClipGuard::Transfer {

/// Version written into exported envelopes
constexpr const char* EXPORT_FORMAT_VERSION = "1.0";

/// Major version accepted on import
constexpr int SUPPORTED_MAJOR_VERSION = 1;

/// Largest rules file importFromFile() will read
constexpr size_t MAX_IMPORT_FILE_SIZE = 4 * 1024 * 1024;

struct ExportMetadata {
    std::string version;
    std::string exportDate;
    std::string appName;
};

struct ImportedRules {
    std::vector<Sanitize::SanitizationRule> rules;
    std::optional<ExportMetadata> metadata;  ///< Absent for the legacy format
    bool legacyFormat = false;
};

struct ImportedPatterns {
    std::vector<Sanitize::SensitivePattern> patterns;
    std::optional<ExportMetadata> metadata;  ///< Absent for a bare list
    bool legacyFormat = false;
};

/**
 * @brief Everything the user can edit, kept between runs
 */
struct SavedLibrary {
    std::vector<Sanitize::SanitizationRule> rules;
    std::vector<Sanitize::SensitivePattern> patterns;
    Sanitize::SanitizationPreferences preferences;
};

/// How imported rules meet the rules already in the library
enum class ImportMode : uint8_t {
    Replace,  ///< Drop existing rules first
    Merge     ///< Append; colliding ids get a fresh id
};

class RuleTransfer {
public:
    explicit RuleTransfer(Core::Logger& logger) noexcept
        : m_logger(logger) {}

    /**
     * @brief Serialize @p rules into an export envelope
     */
    [[nodiscard]] std::string exportRules(const std::vector<Sanitize::SanitizationRule>& rules,
                                          Timestamp exportedAt = WallClock::now()) const;

    /**
     * @brief Parse an envelope or a legacy rule list
     * @return InvalidFormat or IncompatibleVersion on rejection
     */
    [[nodiscard]] Result<ImportedRules> importRules(std::string_view document) const;

    Result<void> exportToFile(const std::vector<Sanitize::SanitizationRule>& rules,
                              const std::string& path) const;

    [[nodiscard]] Result<ImportedRules> importFromFile(const std::string& path) const;

    /**
     * @brief Install imported rules into @p library
     * @return Number of rules installed
     */
    Result<size_t> apply(Sanitize::PatternLibrary& library, const ImportedRules& imported,
                         ImportMode mode) const;

    // ---- Patterns ----------------------------------------------------------

    [[nodiscard]] std::string exportPatterns(const std::vector<Sanitize::SensitivePattern>& patterns,
                                             Timestamp exportedAt = WallClock::now()) const;

    /**
     * @brief Parse a pattern envelope or a bare pattern list
     * @return InvalidFormat (also for an empty list) or IncompatibleVersion
     */
    [[nodiscard]] Result<ImportedPatterns> importPatterns(std::string_view document) const;

    Result<void> exportPatternsToFile(const std::vector<Sanitize::SensitivePattern>& patterns,
                                      const std::string& path) const;

    [[nodiscard]] Result<ImportedPatterns> importPatternsFromFile(const std::string& path) const;

    /// Install imported patterns, same id handling as apply()
    Result<size_t> applyPatterns(Sanitize::PatternLibrary& library,
                                 const ImportedPatterns& imported, ImportMode mode) const;

    // ---- Saved library -----------------------------------------------------

    /// Collect rules, patterns and preferences from a running service
    [[nodiscard]] static SavedLibrary capture(Sanitize::SanitizationService& service);

    /**
     * @brief Write @p saved atomically to @p path (tmp file + rename)
     */
    Result<void> saveLibrary(const SavedLibrary& saved, const std::string& path) const;

    /**
     * @brief Read a file written by saveLibrary()
     * @return FileNotFound when nothing was saved yet, InvalidFormat or
     *         IncompatibleVersion when the file is unusable
     */
    [[nodiscard]] Result<SavedLibrary> loadLibrary(const std::string& path) const;

    /// Replace the service's rules, patterns and preferences with @p saved
    void restore(Sanitize::SanitizationService& service, const SavedLibrary& saved) const;

    /// "YYYY-MM-DDTHH:MM:SSZ" in UTC
    [[nodiscard]] static std::string formatIso8601(Timestamp timestamp);

private:
    Core::Logger& m_logger;
};

} // namespace ClipGuard::Transfer

#endif // CLIPGUARD_CORE_RULE_TRANSFER_HPP
