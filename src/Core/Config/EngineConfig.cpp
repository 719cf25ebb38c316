/**
 * @file EngineConfig.cpp
 * @brief Conversion of a parsed ConfigMap into typed engine settings
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Config.hpp>

namespace ClipGuard::Config {

namespace {

class Reader {
public:
    explicit Reader(const ConfigMap& config) : m_config(config) {}
    
    Result<void> readCount(const char* key, size_t& out, int64_t minValue, int64_t maxValue) {
        auto it = m_config.find(key);
        if (it == m_config.end()) {
            return Result<void>::Success();
        }
        const auto* value = std::get_if<int64_t>(&it->second);
        if (value == nullptr || *value < minValue || *value > maxValue) {
            return ErrorCode::ConfigInvalid;
        }
        out = static_cast<size_t>(*value);
        return Result<void>::Success();
    }
    
    Result<void> readBool(const char* key, bool& out) {
        auto it = m_config.find(key);
        if (it == m_config.end()) {
            return Result<void>::Success();
        }
        const auto* value = std::get_if<bool>(&it->second);
        if (value == nullptr) {
            return ErrorCode::ConfigInvalid;
        }
        out = *value;
        return Result<void>::Success();
    }
    
    Result<void> readString(const char* key, std::string& out) {
        auto it = m_config.find(key);
        if (it == m_config.end()) {
            return Result<void>::Success();
        }
        const auto* value = std::get_if<std::string>(&it->second);
        if (value == nullptr) {
            return ErrorCode::ConfigInvalid;
        }
        out = *value;
        return Result<void>::Success();
    }

private:
    const ConfigMap& m_config;
};

constexpr int64_t MAX_COUNT = 1000000;

} // anonymous namespace

Result<EngineConfig> EngineConfig::fromMap(const ConfigMap& config) {
    EngineConfig result;
    Reader reader(config);
    
    CLIPGUARD_TRY(reader.readCount("history.max_items", result.historyMaxItems, 1, MAX_COUNT));
    CLIPGUARD_TRY(reader.readCount("text.compress_threshold", result.compressThreshold,
                                   1, MAX_COMPRESS_THRESHOLD));
    CLIPGUARD_TRY(reader.readCount("pressure.warning.image_keep", result.warningImageKeep,
                                   0, MAX_COUNT));
    CLIPGUARD_TRY(reader.readCount("pressure.warning.text_threshold", result.warningTextThreshold,
                                   0, MAX_COMPRESS_THRESHOLD));
    CLIPGUARD_TRY(reader.readCount("pressure.critical.image_keep", result.criticalImageKeep,
                                   0, MAX_COUNT));
    CLIPGUARD_TRY(reader.readCount("pressure.critical.history_limit", result.criticalHistoryLimit,
                                   1, MAX_COUNT));
    
    CLIPGUARD_TRY(reader.readString("storage.blob_dir", result.blobDirectory));
    CLIPGUARD_TRY(reader.readString("storage.blob_key_path", result.blobKeyPath));
    CLIPGUARD_TRY(reader.readString("storage.item_journal", result.itemJournalPath));
    CLIPGUARD_TRY(reader.readBool("storage.encrypt_blobs", result.encryptBlobs));
    CLIPGUARD_TRY(reader.readBool("storage.secure_delete", result.secureDelete));
    
    CLIPGUARD_TRY(reader.readBool("sanitize.detection_enabled", result.detectionEnabled));
    std::string mask(1, result.maskChar);
    CLIPGUARD_TRY(reader.readString("sanitize.mask_char", mask));
    if (mask.size() != 1) {
        return ErrorCode::ConfigInvalid;
    }
    result.maskChar = mask[0];
    CLIPGUARD_TRY(reader.readString("sanitize.library_file", result.libraryFile));
    
    std::string level;
    CLIPGUARD_TRY(reader.readString("log.level", level));
    if (!level.empty()) {
        result.logLevel = Core::parseLogLevel(level);
    }
    CLIPGUARD_TRY(reader.readString("log.file", result.logFile));
    
    size_t warningMb = static_cast<size_t>(result.monitorWarningMb);
    size_t criticalMb = static_cast<size_t>(result.monitorCriticalMb);
    size_t intervalMs = static_cast<size_t>(result.monitorInterval.count());
    CLIPGUARD_TRY(reader.readCount("monitor.warning_mb", warningMb, 1, MAX_COUNT));
    CLIPGUARD_TRY(reader.readCount("monitor.critical_mb", criticalMb, 1, MAX_COUNT));
    CLIPGUARD_TRY(reader.readCount("monitor.interval_ms", intervalMs, 10, 3600000));
    if (criticalMb < warningMb) {
        return ErrorCode::ConfigInvalid;
    }
    result.monitorWarningMb = warningMb;
    result.monitorCriticalMb = criticalMb;
    result.monitorInterval = Milliseconds(static_cast<int64_t>(intervalMs));
    
    return result;
}

} // namespace ClipGuard::Config
