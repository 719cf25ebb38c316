/**
 * @file main.cpp
 * @brief Line-oriented ClipGuard demo
 *
 * Every line read from stdin is captured as clipboard text and the
 * sanitized form is printed. Lines starting with ':' are commands:
 *
 *   :stats              storage and resource statistics
 *   :warning/:critical  simulate memory pressure
 *   :maintain           retention-free maintenance pass
 *   :export <path>      write the rule set to a file
 *   :import <path>      merge rules from a file
 *   :export-patterns <path>
 *   :import-patterns <path>
 *   :quit
 *
 * Usage: clipguard_demo [config-file]
 *
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/ClipboardHistory.hpp>
#include <ClipGuard/Core/Config.hpp>
#include <ClipGuard/Core/Pressure.hpp>
#include <ClipGuard/Core/ResourceManager.hpp>
#include <ClipGuard/Core/RuleTransfer.hpp>
#include <iostream>
#include <memory>
#include <string>

using namespace ClipGuard;

namespace {

Result<Config::EngineConfig> loadEngineConfig(int argc, char* argv[]) {
    if (argc < 2) {
        return Config::EngineConfig{};
    }
    Config::SecureConfigLoader loader;
    auto map = loader.load(argv[1]);
    if (map.isFailure()) {
        return map.error();
    }
    return Config::EngineConfig::fromMap(map.value());
}

void printStatistics(Clipboard::ClipboardHistory& history, const Resource::TieredResourceManager& manager) {
    auto stats = history.statistics();
    if (stats.isFailure()) {
        std::cout << "statistics unavailable: " << getErrorMessage(stats.error()) << "\n";
        return;
    }
    const auto& s = stats.value();
    const auto r = manager.statistics();
    std::cout << "items " << s.totalItems << " (text " << s.textItems << ", image " << s.imageItems
              << ")\n"
              << "sanitized " << s.sanitizedItems << ", compressed " << s.compressedTexts
              << ", evicted images " << s.evictedImages << "\n"
              << "resident text bytes " << s.residentTextBytes << ", compressed bytes "
              << s.compressedTextBytes << "\n"
              << "compressions " << r.compressions << ", evictions " << r.evictions
              << ", reloads " << r.reloads << ", failures " << r.failures
              << ", pressure " << Resource::pressureLevelName(r.lastLevel) << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto configResult = loadEngineConfig(argc, argv);
    if (configResult.isFailure()) {
        std::cerr << "Invalid configuration: " << getErrorMessage(configResult.error()) << std::endl;
        return 1;
    }
    const Config::EngineConfig config = configResult.value();

    Core::Logger logger;
    Core::LogOutput outputs = Core::LogOutput::Console;
    if (!config.logFile.empty()) {
        outputs = outputs | Core::LogOutput::File;
    }
    if (!logger.Initialize(config.logLevel, outputs, config.logFile)) {
        std::cerr << "Logger initialization failed" << std::endl;
        return 1;
    }

    Sanitize::PatternLibrary library(logger);
    Sanitize::SanitizationService sanitizer(library, logger,
                                            {config.detectionEnabled, config.maskChar});

    // Stores: on disk when configured, in memory otherwise
    std::unique_ptr<Storage::IItemStore> itemStore;
    if (config.itemJournalPath.empty()) {
        itemStore = std::make_unique<Storage::InMemoryItemStore>();
    } else {
        auto journal = Storage::JournalItemStore::open(config.itemJournalPath, logger);
        if (journal.isFailure()) {
            CLIPGUARD_LOG_ERROR_F(logger, "Cannot open item journal: %s",
                                  getErrorMessage(journal.error()).data());
            return 1;
        }
        itemStore = std::move(journal.value());
    }

    std::unique_ptr<Storage::IBlobStore> blobStore;
    if (config.blobDirectory.empty()) {
        blobStore = std::make_unique<Storage::InMemoryBlobStore>();
    } else {
        Storage::FileBlobStore::Options blobOptions;
        blobOptions.directory = config.blobDirectory;
        blobOptions.encrypt = config.encryptBlobs;
        blobOptions.keyFile = config.blobKeyPath;
        blobOptions.secureDelete = config.secureDelete;
        auto files = Storage::FileBlobStore::open(blobOptions, logger);
        if (files.isFailure()) {
            CLIPGUARD_LOG_ERROR_F(logger, "Cannot open blob directory: %s",
                                  getErrorMessage(files.error()).data());
            return 1;
        }
        blobStore = std::move(files.value());
    }

    Dispatch::SerialQueue queue("clipguard.history");
    Dispatch::WorkerPool pool;
    Dispatch::KeyedExecutor storeExecutor(pool);

    Clipboard::ClipboardHistory history(queue, storeExecutor, sanitizer, *itemStore, *blobStore,
                                        logger, {config.historyMaxItems});
    history.setStatusCallback([](const Clipboard::StatusEvent& event) {
        std::cerr << "[status] " << getErrorMessage(event.code) << ": " << event.message << "\n";
    });

    Resource::ResourcePolicy policy;
    policy.compressThreshold = config.compressThreshold;
    policy.warningImageKeep = config.warningImageKeep;
    policy.warningTextThreshold = config.warningTextThreshold;
    policy.criticalImageKeep = config.criticalImageKeep;
    policy.criticalHistoryLimit = config.criticalHistoryLimit;
    Resource::TieredResourceManager manager(history, pool, storeExecutor, *blobStore, logger, policy);

    Resource::ResidentMemoryMonitor::Options monitorOptions;
    monitorOptions.warningBytes = config.monitorWarningMb * 1024 * 1024;
    monitorOptions.criticalBytes = config.monitorCriticalMb * 1024 * 1024;
    monitorOptions.interval = config.monitorInterval;
    Resource::ResidentMemoryMonitor monitor(monitorOptions, logger);

    auto attached = manager.attach(monitor);
    auto started = attached.isSuccess() ? monitor.start() : attached;
    if (started.isFailure()) {
        CLIPGUARD_LOG_WARNING_F(logger, "Memory monitor not running: %s",
                                getErrorMessage(started.error()).data());
    }

    auto restored = history.restore();
    if (restored.isFailure()) {
        CLIPGUARD_LOG_ERROR_F(logger, "History restore failed: %s",
                              getErrorMessage(restored.error()).data());
    }

    Transfer::RuleTransfer transfer(logger);
    if (!config.libraryFile.empty()) {
        auto saved = transfer.loadLibrary(config.libraryFile);
        if (saved.isSuccess()) {
            transfer.restore(sanitizer, saved.value());
        } else if (saved.error() != ErrorCode::FileNotFound) {
            CLIPGUARD_LOG_WARNING_F(logger, "Saved library ignored: %s",
                                    getErrorMessage(saved.error()).data());
        }
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line == ":quit") {
            break;
        }
        if (line == ":stats") {
            printStatistics(history, manager);
            continue;
        }
        if (line == ":warning" || line == ":critical") {
            manager.handlePressure(line == ":warning" ? Resource::PressureLevel::Warning
                                                      : Resource::PressureLevel::Critical);
            auto idle = manager.waitForIdle();
            if (idle.isFailure()) {
                std::cout << "pressure handling incomplete: " << getErrorMessage(idle.error()) << "\n";
            }
            continue;
        }
        if (line == ":maintain") {
            auto report = history.performMaintenance(Clipboard::MaintenanceOptions{});
            if (report.isFailure()) {
                std::cout << "maintenance failed: " << getErrorMessage(report.error()) << "\n";
            } else {
                std::cout << "orphan blobs removed: " << report.value().orphanBlobs << "\n";
            }
            continue;
        }
        if (line.rfind(":export-patterns ", 0) == 0) {
            auto exported = transfer.exportPatternsToFile(library.patterns(), line.substr(17));
            std::cout << (exported.isSuccess() ? "exported" : getErrorMessage(exported.error()).data())
                      << "\n";
            continue;
        }
        if (line.rfind(":import-patterns ", 0) == 0) {
            auto imported = transfer.importPatternsFromFile(line.substr(17));
            if (imported.isFailure()) {
                std::cout << "import failed: " << getErrorMessage(imported.error()) << "\n";
                continue;
            }
            auto applied = transfer.applyPatterns(library, imported.value(), Transfer::ImportMode::Merge);
            std::cout << "imported " << applied.valueOr(0) << " patterns\n";
            continue;
        }
        if (line.rfind(":export ", 0) == 0) {
            auto exported = transfer.exportToFile(library.rules(), line.substr(8));
            std::cout << (exported.isSuccess() ? "exported" : getErrorMessage(exported.error()).data())
                      << "\n";
            continue;
        }
        if (line.rfind(":import ", 0) == 0) {
            auto imported = transfer.importFromFile(line.substr(8));
            if (imported.isFailure()) {
                std::cout << "import failed: " << getErrorMessage(imported.error()) << "\n";
                continue;
            }
            auto applied = transfer.apply(library, imported.value(), Transfer::ImportMode::Merge);
            std::cout << "imported " << applied.valueOr(0) << " rules\n";
            continue;
        }

        auto id = history.addText(line);
        if (id.isFailure()) {
            std::cout << "capture failed: " << getErrorMessage(id.error()) << "\n";
            continue;
        }
        auto text = history.copyText(id.value());
        std::cout << (text.isSuccess() ? text.value() : std::string("<unavailable>")) << "\n";
    }

    monitor.stop();
    auto idle = manager.waitForIdle();
    if (idle.isFailure()) {
        CLIPGUARD_LOG_WARNING(logger, "Shutdown with resource work pending");
    }
    history.flush();
    if (!config.libraryFile.empty()) {
        auto saved = transfer.saveLibrary(Transfer::RuleTransfer::capture(sanitizer), config.libraryFile);
        if (saved.isFailure()) {
            CLIPGUARD_LOG_ERROR_F(logger, "Cannot save library: %s",
                                  getErrorMessage(saved.error()).data());
        }
    }
    logger.Shutdown();
    return 0;
}
