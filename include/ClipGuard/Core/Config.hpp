/**
 * @file Config.hpp
 * @brief Secure configuration loading and typed engine settings
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 * 
 * The loader protects against:
 * - TOCTOU races between path check and open
 * - Path traversal outside an allowed directory
 * - Symlink substitution
 * - Oversized files
 */

#pragma once

#ifndef CLIPGUARD_CORE_CONFIG_HPP
#define CLIPGUARD_CORE_CONFIG_HPP

#include <ClipGuard/Core/Types.hpp>
#include <ClipGuard/Core/ErrorCodes.hpp>
#include <ClipGuard/Core/Logger.hpp>
#include <string>
#include <map>
#include <variant>

namespace ClipGuard::Config {

using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string
>;

using ConfigMap = std::map<std::string, ConfigValue>;

/**
 * @brief Secure key=value configuration loader
 * 
 * Lines starting with '#' or ';' are comments. Values are type-inferred:
 * `true`/`false` become bool, integers become int64_t, decimals become
 * double, anything else (or a double-quoted value) stays a string.
 */
class SecureConfigLoader {
public:
    struct Options {
        size_t max_file_size = 1024 * 1024;  // 1MB default
        std::string allowed_directory;       // Restrict to directory
    };
    
    explicit SecureConfigLoader() : SecureConfigLoader(Options{}) {}
    explicit SecureConfigLoader(const Options& options);
    ~SecureConfigLoader();
    
    /**
     * @brief Load configuration from file
     * @param path Path to configuration file
     * @return Parsed configuration or error
     */
    Result<ConfigMap> load(const std::string& path);
    
    /**
     * @brief Load configuration from memory
     * @param data Configuration text
     * @return Parsed configuration or error
     */
    Result<ConfigMap> loadFromMemory(ByteSpan data);
    
private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Engine Settings
// ============================================================================

/// Upper bound for the text compression threshold
constexpr int64_t MAX_COMPRESS_THRESHOLD = 2000000;

/**
 * @brief Typed engine settings built from a ConfigMap
 * 
 * Recognized keys:
 * | Key                              | Type   | Default  |
 * |----------------------------------|--------|----------|
 * | history.max_items                | int    | 100      |
 * | text.compress_threshold          | int    | 1000     |
 * | pressure.warning.image_keep      | int    | 15       |
 * | pressure.warning.text_threshold  | int    | 10000    |
 * | pressure.critical.image_keep     | int    | 5        |
 * | pressure.critical.history_limit  | int    | 50       |
 * | storage.blob_dir                 | string | ""       |
 * | storage.blob_key_path            | string | ""       |
 * | storage.item_journal             | string | ""       |
 * | storage.encrypt_blobs            | bool   | false    |
 * | storage.secure_delete            | bool   | false    |
 * | sanitize.detection_enabled       | bool   | true     |
 * | sanitize.mask_char               | string | "*"      |
 * | sanitize.library_file            | string | ""       |
 * | log.level                        | string | "info"   |
 * | log.file                         | string | ""       |
 * | monitor.warning_mb               | int    | 512      |
 * | monitor.critical_mb              | int    | 1024     |
 * | monitor.interval_ms              | int    | 2000     |
 * 
 * Unknown keys are ignored.
 */
struct EngineConfig {
    size_t historyMaxItems = 100;
    size_t compressThreshold = 1000;
    
    size_t warningImageKeep = 15;
    size_t warningTextThreshold = 10000;
    size_t criticalImageKeep = 5;
    size_t criticalHistoryLimit = 50;
    
    std::string blobDirectory;
    std::string blobKeyPath;        ///< Empty: `<blob_dir>/blob.key`
    std::string itemJournalPath;
    bool encryptBlobs = false;
    bool secureDelete = false;
    
    bool detectionEnabled = true;
    char maskChar = '*';
    std::string libraryFile;        ///< Saved rules, patterns, preferences
    
    Core::LogLevel logLevel = Core::LogLevel::Info;
    std::string logFile;
    
    uint64_t monitorWarningMb = 512;
    uint64_t monitorCriticalMb = 1024;
    Milliseconds monitorInterval{2000};
    
    /**
     * @brief Build settings from a parsed map
     * @return ConfigInvalid when a value has the wrong type or range
     */
    static Result<EngineConfig> fromMap(const ConfigMap& config);
};

} // namespace ClipGuard::Config

#endif // CLIPGUARD_CORE_CONFIG_HPP
