/**
 * @file TieredResourceManager.cpp
 * @brief Pressure policy, compression, eviction and reload
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/ResourceManager.hpp>
#include <ClipGuard/Core/Config.hpp>
#include <future>

namespace ClipGuard::Resource {

using Clipboard::ClipboardItem;
using Clipboard::ImageState;
using Clipboard::TextState;

Result<void> validatePolicy(const ResourcePolicy& policy) {
    if (policy.compressThreshold == 0 ||
        policy.compressThreshold > static_cast<size_t>(Config::MAX_COMPRESS_THRESHOLD)) {
        return ErrorCode::ConfigInvalid;
    }
    if (policy.criticalHistoryLimit == 0) {
        return ErrorCode::ConfigInvalid;
    }
    return Result<void>::Success();
}

struct TieredResourceManager::Subscription {
    std::mutex mutex;
    TieredResourceManager* target = nullptr;
};

// ============================================================================
// Lifetime
// ============================================================================

TieredResourceManager::TieredResourceManager(Clipboard::ClipboardHistory& history,
                                             Dispatch::WorkerPool& pool,
                                             Dispatch::KeyedExecutor& blobExecutor,
                                             Storage::IBlobStore& blobStore,
                                             Core::Logger& logger,
                                             ResourcePolicy policy)
    : m_history(history)
    , m_queue(history.queue())
    , m_pool(pool)
    , m_blobExecutor(blobExecutor)
    , m_blobStore(blobStore)
    , m_logger(logger)
    , m_policy(policy)
    , m_subscription(std::make_shared<Subscription>())
{
    if (validatePolicy(policy).isFailure()) {
        CLIPGUARD_LOG_WARNING(m_logger, "Resource policy out of range, using defaults");
        m_policy = ResourcePolicy{};
    }

    m_subscription->target = this;
    m_history.setItemAddedHook([this](const ClipboardItem& item) { onItemAdded(item); });
}

TieredResourceManager::~TieredResourceManager() {
    {
        std::lock_guard<std::mutex> lock(m_subscription->mutex);
        m_subscription->target = nullptr;
    }
    m_history.setItemAddedHook(nullptr);

    auto idle = waitForIdle();
    if (idle.isFailure()) {
        CLIPGUARD_LOG_ERROR_F(m_logger, "Resource manager destroyed with work in flight: %s",
                              getErrorMessage(idle.error()).data());
    }
}

Result<void> TieredResourceManager::attach(IPressureSource& source) {
    std::weak_ptr<Subscription> weak = m_subscription;
    return source.subscribe([weak](PressureLevel level) {
        auto subscription = weak.lock();
        if (!subscription) {
            return;
        }
        std::lock_guard<std::mutex> lock(subscription->mutex);
        if (subscription->target) {
            subscription->target->handlePressure(level);
        }
    });
}

ResourcePolicy TieredResourceManager::policy() const {
    std::lock_guard<std::mutex> lock(m_policyMutex);
    return m_policy;
}

Result<void> TieredResourceManager::setPolicy(const ResourcePolicy& policy) {
    CLIPGUARD_TRY(validatePolicy(policy));
    std::lock_guard<std::mutex> lock(m_policyMutex);
    m_policy = policy;
    return Result<void>::Success();
}

ResourceStatistics TieredResourceManager::statistics() const {
    ResourceStatistics stats;
    stats.compressions = m_compressions.load();
    stats.evictions = m_evictions.load();
    stats.fallbackEvictions = m_fallbackEvictions.load();
    stats.reloads = m_reloads.load();
    stats.failures = m_failures.load();
    stats.compactions = m_compactions.load();
    stats.lastLevel = m_lastLevel.load();
    return stats;
}

// ============================================================================
// Pressure Policy
// ============================================================================

void TieredResourceManager::handlePressure(PressureLevel level) {
    m_lastLevel.store(level);
    const ResourcePolicy current = policy();

    bool posted = m_queue.post([this, level, current] {
        switch (level) {
            case PressureLevel::Normal:
                CLIPGUARD_LOG_DEBUG(m_logger, "Memory pressure back to normal");
                break;
            case PressureLevel::Warning:
                applyWarningOnQueue(current);
                break;
            case PressureLevel::Critical:
                applyCriticalOnQueue(current);
                break;
        }
    });
    if (!posted) {
        CLIPGUARD_LOG_WARNING_F(m_logger, "Dropped %s pressure signal, history queue stopped",
                                pressureLevelName(level));
    }
}

void TieredResourceManager::applyWarningOnQueue(const ResourcePolicy& policy) {
    CLIPGUARD_LOG_INFO(m_logger, "Applying warning pressure policy");

    evictBeyondOnQueue(policy.warningImageKeep);

    auto* items = m_history.itemsOnQueue();
    if (!items) {
        return;
    }
    for (const auto& item : *items) {
        if (item.isText() && item.textLength() > policy.warningTextThreshold) {
            scheduleCompression(item);
        }
    }
}

void TieredResourceManager::applyCriticalOnQueue(const ResourcePolicy& policy) {
    CLIPGUARD_LOG_INFO(m_logger, "Applying critical pressure policy");

    auto trimmed = m_history.trimOnQueue(policy.criticalHistoryLimit);
    if (trimmed.isFailure()) {
        CLIPGUARD_LOG_ERROR_F(m_logger, "Critical trim failed: %s",
                              getErrorMessage(trimmed.error()).data());
    }

    evictBeyondOnQueue(policy.criticalImageKeep);

    auto* items = m_history.itemsOnQueue();
    if (items) {
        for (const auto& item : *items) {
            if (item.isText()) {
                scheduleCompression(item);
            }
        }
    }

    m_compactionRequested = true;
    if (jobsInFlight() == 0) {
        runRequestedCompaction();
    }
}

void TieredResourceManager::evictBeyondOnQueue(size_t keep) {
    auto* items = m_history.itemsOnQueue();
    if (!items) {
        return;
    }

    size_t images = 0;
    for (auto& item : *items) {
        if (!item.isImage()) {
            continue;
        }
        if (++images > keep) {
            scheduleEviction(item);
        }
    }
}

void TieredResourceManager::onItemAdded(const ClipboardItem& item) {
    if (item.isText() && item.textLength() > policy().compressThreshold) {
        scheduleCompression(item);
    }
}

void TieredResourceManager::requestCompression(const ItemId& id) {
    bool posted = m_queue.post([this, id] {
        if (const ClipboardItem* item = m_history.findOnQueue(id)) {
            scheduleCompression(*item);
        }
    });
    if (!posted) {
        CLIPGUARD_LOG_WARNING(m_logger, "Compression request dropped, history queue stopped");
    }
}

void TieredResourceManager::requestEviction(const ItemId& id) {
    bool posted = m_queue.post([this, id] {
        if (ClipboardItem* item = m_history.findOnQueue(id)) {
            scheduleEviction(*item);
        }
    });
    if (!posted) {
        CLIPGUARD_LOG_WARNING(m_logger, "Eviction request dropped, history queue stopped");
    }
}

// ============================================================================
// Text Compression
// ============================================================================

void TieredResourceManager::scheduleCompression(const ClipboardItem& item) {
    if (!item.isText() || item.textState() != TextState::Resident ||
        item.textUnavailable() || !item.originalText()) {
        return;
    }
    const ItemId id = item.id();
    if (!m_compressing.insert(id).second) {
        return;
    }

    auto original = std::make_shared<const std::string>(*item.originalText());
    std::shared_ptr<const std::string> sanitized;
    if (item.isSanitized() && item.sanitizedText()) {
        sanitized = std::make_shared<const std::string>(*item.sanitizedText());
    }

    beginJob();
    bool submitted = m_pool.submit([this, id, original, sanitized] {
        auto compressedOriginal = m_compressor.compressText(*original);
        Result<ByteBuffer> compressedSanitized(ByteBuffer{});
        if (sanitized) {
            compressedSanitized = m_compressor.compressText(*sanitized);
        }

        if (compressedOriginal.isFailure() || compressedSanitized.isFailure()) {
            ++m_failures;
            CLIPGUARD_LOG_ERROR_F(m_logger, "Compression of item %s failed", id.c_str());
            finishJob([this, id] { m_compressing.erase(id); });
            return;
        }

        SharedBytes originalFrame =
            std::make_shared<const ByteBuffer>(std::move(compressedOriginal.value()));
        SharedBytes sanitizedFrame;
        if (sanitized) {
            sanitizedFrame = std::make_shared<const ByteBuffer>(std::move(compressedSanitized.value()));
        }

        finishJob([this, id, originalFrame, sanitizedFrame] {
            commitCompression(id, originalFrame, sanitizedFrame);
        });
    });

    if (!submitted) {
        m_compressing.erase(id);
        endJob();
        CLIPGUARD_LOG_WARNING(m_logger, "Worker pool rejected compression job");
    }
}

void TieredResourceManager::commitCompression(const ItemId& id, SharedBytes original,
                                              SharedBytes sanitized) {
    m_compressing.erase(id);

    ClipboardItem* item = m_history.findOnQueue(id);
    if (!item || item->textState() == TextState::Compressed) {
        return;
    }

    auto committed = item->commitCompressedText(std::move(original), std::move(sanitized));
    if (committed.isFailure()) {
        CLIPGUARD_LOG_ERROR_F(m_logger, "Cannot commit compressed text for %s: %s",
                              id.c_str(), getErrorMessage(committed.error()).data());
        return;
    }

    auto persisted = m_history.persistOnQueue(*item);
    if (persisted.isFailure()) {
        CLIPGUARD_LOG_WARNING_F(m_logger, "Compressed text of %s not persisted", id.c_str());
    }

    ++m_compressions;
    CLIPGUARD_LOG_DEBUG_F(m_logger, "Compressed text item %s (%zu characters)",
                          id.c_str(), item->textLength());
}

// ============================================================================
// Image Eviction
// ============================================================================

void TieredResourceManager::scheduleEviction(ClipboardItem& item) {
    if (!item.isImage() || item.imageState() != ImageState::Resident) {
        return;
    }
    const ItemId id = item.id();
    if (m_evicting.count(id) != 0) {
        return;
    }

    // Blob written on insert or kept from an earlier eviction
    if (item.hasDurableImage()) {
        auto committed = item.commitEviction(item.imageRef(),
                                             item.imageRef() ? nullptr : item.imageFallback());
        if (committed.isSuccess()) {
            ++m_evictions;
            auto persisted = m_history.persistOnQueue(item);
            if (persisted.isFailure()) {
                CLIPGUARD_LOG_WARNING_F(m_logger, "Eviction of %s not persisted", id.c_str());
            }
        }
        return;
    }

    SharedBytes pixels = item.imagePixels();
    if (!pixels) {
        return;
    }
    m_evicting.insert(id);

    beginJob();
    bool submitted = m_blobExecutor.submit(id, [this, id, pixels] {
        auto saved = m_blobStore.save(id, *pixels);
        if (saved.isSuccess()) {
            BlobRef ref = saved.value();
            finishJob([this, id, ref] { commitEviction(id, ref, nullptr); });
            return;
        }

        CLIPGUARD_LOG_WARNING_F(m_logger, "Blob save failed for %s (%s), keeping compressed copy",
                                id.c_str(), getErrorMessage(saved.error()).data());
        m_history.reportStatus({ErrorCode::StoreWriteFailed, id,
                                "Image could not be saved, kept in memory"});

        auto fallback = m_compressor.compress(*pixels);
        if (fallback.isFailure()) {
            ++m_failures;
            CLIPGUARD_LOG_ERROR_F(m_logger, "Image %s stays resident, no durable copy", id.c_str());
            finishJob([this, id] { m_evicting.erase(id); });
            return;
        }

        SharedBytes copy = std::make_shared<const ByteBuffer>(std::move(fallback.value()));
        finishJob([this, id, copy] { commitEviction(id, std::nullopt, copy); });
    });

    if (!submitted) {
        m_evicting.erase(id);
        endJob();
        CLIPGUARD_LOG_WARNING(m_logger, "Store executor rejected eviction job");
    }
}

void TieredResourceManager::commitEviction(const ItemId& id, std::optional<BlobRef> ref,
                                           SharedBytes fallback) {
    m_evicting.erase(id);

    ClipboardItem* item = m_history.findOnQueue(id);
    if (!item) {
        // Removed while the save ran
        if (ref) {
            m_history.deleteBlob(ref->key);
        }
        return;
    }
    if (item->imageState() != ImageState::Resident) {
        return;
    }

    const bool durable = ref.has_value();
    auto committed = item->commitEviction(std::move(ref), std::move(fallback));
    if (committed.isFailure()) {
        CLIPGUARD_LOG_ERROR_F(m_logger, "Cannot commit eviction of %s: %s",
                              id.c_str(), getErrorMessage(committed.error()).data());
        return;
    }

    auto persisted = m_history.persistOnQueue(*item);
    if (persisted.isFailure()) {
        CLIPGUARD_LOG_WARNING_F(m_logger, "Eviction of %s not persisted", id.c_str());
    }

    ++m_evictions;
    if (!durable) {
        ++m_fallbackEvictions;
    }
}

// ============================================================================
// Image Reload
// ============================================================================

void TieredResourceManager::reloadImageAsync(const ItemId& id, ReloadCallback callback) {
    bool posted = m_queue.post([this, id, callback] {
        ClipboardItem* item = m_history.findOnQueue(id);
        if (!item) {
            callback(ErrorCode::ItemNotFound);
            return;
        }
        if (!item->isImage()) {
            callback(ErrorCode::NoImage);
            return;
        }
        if (item->imageState() == ImageState::Resident) {
            callback(item->imagePixels());
            return;
        }

        const std::optional<BlobRef> ref = item->imageRef();
        const SharedBytes fallback = item->imageFallback();
        if (!ref && !fallback) {
            finishReload(id, ErrorCode::ImageLoadFailed, callback);
            return;
        }

        beginJob();
        bool submitted = false;
        if (ref) {
            submitted = m_blobExecutor.submit(id, [this, id, ref, callback] {
                auto loaded = m_blobStore.load(*ref);
                Result<SharedBytes> pixels(ErrorCode::ImageLoadFailed);
                if (loaded.isSuccess() && loaded.value().size() == ref->size) {
                    pixels = std::make_shared<const ByteBuffer>(std::move(loaded.value()));
                } else if (loaded.isFailure()) {
                    CLIPGUARD_LOG_ERROR_F(m_logger, "Blob load failed for %s: %s",
                                          id.c_str(), getErrorMessage(loaded.error()).data());
                } else {
                    CLIPGUARD_LOG_ERROR_F(m_logger, "Blob for %s has the wrong size", id.c_str());
                }
                finishJob([this, id, pixels, callback] { finishReload(id, pixels, callback); });
            });
        } else {
            submitted = m_pool.submit([this, id, fallback, callback] {
                auto decoded = m_compressor.decompress(*fallback);
                Result<SharedBytes> pixels(ErrorCode::ImageLoadFailed);
                if (decoded.isSuccess()) {
                    pixels = std::make_shared<const ByteBuffer>(std::move(decoded.value()));
                } else {
                    CLIPGUARD_LOG_ERROR_F(m_logger, "Fallback copy of %s is unreadable", id.c_str());
                }
                finishJob([this, id, pixels, callback] { finishReload(id, pixels, callback); });
            });
        }

        if (!submitted) {
            endJob();
            finishReload(id, ErrorCode::ImageLoadFailed, callback);
        }
    });

    if (!posted) {
        callback(ErrorCode::ContextStopped);
    }
}

void TieredResourceManager::finishReload(const ItemId& id, Result<SharedBytes> pixels,
                                         const ReloadCallback& callback) {
    if (pixels.isFailure()) {
        ++m_failures;
        CLIPGUARD_LOG_ERROR_F(m_logger, "Image %s could not be reloaded", id.c_str());
        m_history.reportStatus({ErrorCode::ImageLoadFailed, id, "Image unavailable"});
        callback(ErrorCode::ImageLoadFailed);
        return;
    }

    // Last reload to finish owns the resident buffer
    if (ClipboardItem* item = m_history.findOnQueue(id)) {
        auto committed = item->commitReload(pixels.value());
        if (committed.isFailure()) {
            CLIPGUARD_LOG_WARNING_F(m_logger, "Cannot commit reload of %s", id.c_str());
        }
    }

    ++m_reloads;
    callback(std::move(pixels));
}

Result<SharedBytes> TieredResourceManager::reloadImageSync(const ItemId& id) {
    if (m_queue.isCurrent()) {
        return ErrorCode::WrongContext;
    }

    auto promise = std::make_shared<std::promise<Result<SharedBytes>>>();
    auto future = promise->get_future();
    reloadImageAsync(id, [promise](Result<SharedBytes> pixels) {
        promise->set_value(std::move(pixels));
    });
    return future.get();
}

// ============================================================================
// Job Tracking
// ============================================================================

void TieredResourceManager::finishJob(Dispatch::Task commit) {
    bool posted = m_queue.post([this, commit] {
        commit();
        // Only the queue starts jobs, so one in flight means this is the last
        if (m_compactionRequested && jobsInFlight() == 1) {
            runRequestedCompaction();
        }
        endJob();
    });
    if (!posted) {
        CLIPGUARD_LOG_WARNING(m_logger, "Result dropped, history queue stopped");
        endJob();
    }
}

void TieredResourceManager::beginJob() {
    std::lock_guard<std::mutex> lock(m_jobMutex);
    ++m_inFlight;
}

void TieredResourceManager::endJob() {
    std::lock_guard<std::mutex> lock(m_jobMutex);
    if (m_inFlight > 0) {
        --m_inFlight;
    }
    if (m_inFlight == 0) {
        m_jobCv.notify_all();
    }
}

size_t TieredResourceManager::jobsInFlight() {
    std::lock_guard<std::mutex> lock(m_jobMutex);
    return m_inFlight;
}

void TieredResourceManager::runRequestedCompaction() {
    m_compactionRequested = false;
    m_history.compactStoreAsync();
    ++m_compactions;
}

Result<void> TieredResourceManager::waitForIdle() {
    if (m_queue.isCurrent()) {
        return ErrorCode::WrongContext;
    }

    while (true) {
        CLIPGUARD_TRY(m_queue.drain());
        {
            std::unique_lock<std::mutex> lock(m_jobMutex);
            m_jobCv.wait(lock, [this] { return m_inFlight == 0; });
        }
        m_blobExecutor.waitIdle();
        CLIPGUARD_TRY(m_queue.drain());

        std::lock_guard<std::mutex> lock(m_jobMutex);
        if (m_inFlight == 0 && m_queue.pending() == 0) {
            break;
        }
    }

    m_blobExecutor.waitIdle();
    return Result<void>::Success();
}

} // namespace ClipGuard::Resource
