/**
 * @file ResourceManager.hpp
 * @brief Tiered text compression and image eviction under memory pressure
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 *
 * Every transition follows the same three steps:
 * 1. Plan on the history queue (pick items, mark them pending).
 * 2. Work on the pool or the keyed executor (compress, save, load).
 * 3. Commit on the history queue (re-find the item, apply, persist).
 *
 * Readers therefore never see a half-evicted image or a half-compressed
 * text. Pending sets make every request idempotent: an item already
 * compressed, evicted or in flight is skipped.
 */

#pragma once

#ifndef CLIPGUARD_CORE_RESOURCE_MANAGER_HPP
#define CLIPGUARD_CORE_RESOURCE_MANAGER_HPP

#include <ClipGuard/Core/Types.hpp>
#include <ClipGuard/Core/ErrorCodes.hpp>
#include <ClipGuard/Core/Logger.hpp>
#include <ClipGuard/Core/ClipboardHistory.hpp>
#include <ClipGuard/Core/Compression.hpp>
#include <ClipGuard/Core/Dispatch.hpp>
#include <ClipGuard/Core/Pressure.hpp>
#include <ClipGuard/Core/Storage.hpp>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_set>

namespace ClipGuard::Resource {

/**
 * @brief Thresholds applied by the pressure policy
 */
struct ResourcePolicy {
    size_t compressThreshold = 1000;      ///< Compress new text longer than this (code points)
    size_t warningImageKeep = 15;         ///< Resident images kept under Warning
    size_t warningTextThreshold = 10000;  ///< Text compressed under Warning
    size_t criticalImageKeep = 5;         ///< Resident images kept under Critical
    size_t criticalHistoryLimit = 50;     ///< History size after Critical
};

/// Reject thresholds outside their ranges
Result<void> validatePolicy(const ResourcePolicy& policy);

/// Completion of an image reload, always invoked on the history queue
using ReloadCallback = std::function<void(Result<SharedBytes>)>;

struct ResourceStatistics {
    uint64_t compressions = 0;
    uint64_t evictions = 0;
    uint64_t fallbackEvictions = 0;   ///< Evictions kept in memory after a failed save
    uint64_t reloads = 0;
    uint64_t failures = 0;
    uint64_t compactions = 0;
    PressureLevel lastLevel = PressureLevel::Normal;
};

/**
 * @brief Moves item payloads between resident and durable tiers
 *
 * @code
 * Resource::TieredResourceManager manager(history, pool, executor, blobs, logger);
 * manager.attach(monitor);
 * manager.reloadImageAsync(id, [](Result<SharedBytes> pixels) { ... });
 * @endcode
 */
class TieredResourceManager {
public:
    /**
     * @param history History whose queue owns every commit
     * @param pool Pool for compression and fallback decompression
     * @param blobExecutor Keyed executor shared with the history (ordering per item id)
     * @param blobStore Durable image store
     */
    TieredResourceManager(Clipboard::ClipboardHistory& history,
                          Dispatch::WorkerPool& pool,
                          Dispatch::KeyedExecutor& blobExecutor,
                          Storage::IBlobStore& blobStore,
                          Core::Logger& logger,
                          ResourcePolicy policy = {});
    ~TieredResourceManager();

    TieredResourceManager(const TieredResourceManager&) = delete;
    TieredResourceManager& operator=(const TieredResourceManager&) = delete;

    /// Subscribe to @p source for the manager's lifetime
    Result<void> attach(IPressureSource& source);

    /// Schedule the response to @p level (any thread, returns at once)
    void handlePressure(PressureLevel level);

    /// Schedule compression of one text item
    void requestCompression(const ItemId& id);

    /// Schedule eviction of one image item
    void requestEviction(const ItemId& id);

    /**
     * @brief Bring an image back into memory without blocking
     *
     * Resident images complete immediately (on the queue). Evicted images
     * load from the blob store, or from the fallback copy. On failure the
     * item stays Evicted, ImageLoadFailed is reported through the history
     * status callback and passed to @p callback.
     */
    void reloadImageAsync(const ItemId& id, ReloadCallback callback);

    /**
     * @brief Blocking variant of reloadImageAsync
     * @return WrongContext when called on the history queue
     */
    Result<SharedBytes> reloadImageSync(const ItemId& id);

    /**
     * @brief Block until scheduled plans, jobs and their store writes finish
     * @return WrongContext when called on the history queue
     */
    Result<void> waitForIdle();

    [[nodiscard]] ResourcePolicy policy() const;

    Result<void> setPolicy(const ResourcePolicy& policy);

    [[nodiscard]] ResourceStatistics statistics() const;

private:
    struct Subscription;

    void onItemAdded(const Clipboard::ClipboardItem& item);

    void applyWarningOnQueue(const ResourcePolicy& policy);
    void applyCriticalOnQueue(const ResourcePolicy& policy);
    void evictBeyondOnQueue(size_t keep);

    void scheduleCompression(const Clipboard::ClipboardItem& item);
    void scheduleEviction(Clipboard::ClipboardItem& item);

    void commitCompression(const ItemId& id, SharedBytes original, SharedBytes sanitized);
    void commitEviction(const ItemId& id, std::optional<BlobRef> ref, SharedBytes fallback);
    void finishReload(const ItemId& id, Result<SharedBytes> pixels, const ReloadCallback& callback);

    /// Post @p commit to the queue; the job ends after it runs
    void finishJob(Dispatch::Task commit);
    void beginJob();
    void endJob();
    size_t jobsInFlight();
    void runRequestedCompaction();

    Clipboard::ClipboardHistory& m_history;
    Dispatch::SerialQueue& m_queue;
    Dispatch::WorkerPool& m_pool;
    Dispatch::KeyedExecutor& m_blobExecutor;
    Storage::IBlobStore& m_blobStore;
    Core::Logger& m_logger;
    Compression::TextCompressor m_compressor;

    mutable std::mutex m_policyMutex;
    ResourcePolicy m_policy;

    // Queue-confined
    std::unordered_set<ItemId> m_compressing;
    std::unordered_set<ItemId> m_evicting;
    bool m_compactionRequested = false;

    std::mutex m_jobMutex;
    std::condition_variable m_jobCv;
    size_t m_inFlight = 0;

    std::atomic<uint64_t> m_compressions{0};
    std::atomic<uint64_t> m_evictions{0};
    std::atomic<uint64_t> m_fallbackEvictions{0};
    std::atomic<uint64_t> m_reloads{0};
    std::atomic<uint64_t> m_failures{0};
    std::atomic<uint64_t> m_compactions{0};
    std::atomic<PressureLevel> m_lastLevel{PressureLevel::Normal};

    std::shared_ptr<Subscription> m_subscription;
};

} // namespace ClipGuard::Resource

#endif // CLIPGUARD_CORE_RESOURCE_MANAGER_HPP
