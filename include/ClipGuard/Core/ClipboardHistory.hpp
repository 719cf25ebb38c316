/**
 * @file ClipboardHistory.hpp
 * @brief The ordered clipboard item collection and its persistence
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 *
 * The history is confined to a SerialQueue: every insert, delete, trim and
 * published state change runs on that queue. Public methods may be called
 * from any other thread; they hop onto the queue and wait. Methods with an
 * `OnQueue` suffix are for code already running on the queue (the resource
 * manager's commits) and refuse to run anywhere else.
 *
 * Store writes and blob deletes are handed to a KeyedExecutor keyed by item
 * id, so they run off the queue but in order per item. A failed item-store
 * write is reported through the status callback; the in-memory history is
 * not rolled back.
 */

#pragma once

#ifndef CLIPGUARD_CORE_CLIPBOARD_HISTORY_HPP
#define CLIPGUARD_CORE_CLIPBOARD_HISTORY_HPP

#include <ClipGuard/Core/Types.hpp>
#include <ClipGuard/Core/ErrorCodes.hpp>
#include <ClipGuard/Core/Logger.hpp>
#include <ClipGuard/Core/ClipboardItem.hpp>
#include <ClipGuard/Core/Dispatch.hpp>
#include <ClipGuard/Core/Sanitizer.hpp>
#include <ClipGuard/Core/Storage.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ClipGuard::Clipboard {

/**
 * @brief Non-blocking failure notice for the host UI
 */
struct StatusEvent {
    ErrorCode code = ErrorCode::Success;
    ItemId itemId;
    std::string message;
};

using StatusCallback = std::function<void(const StatusEvent&)>;

/// Runs on the queue right after an item is inserted
using ItemAddedHook = std::function<void(const ClipboardItem&)>;

/// Which text of an item to read
enum class TextVariant : uint8_t {
    Original,
    Sanitized,
    Display  ///< Sanitized, falling back to original
};

struct HistoryOptions {
    size_t maxItems = 100;
};

struct StorageStatistics {
    size_t totalItems = 0;
    size_t textItems = 0;
    size_t imageItems = 0;
    size_t sanitizedItems = 0;
    size_t compressedTexts = 0;
    size_t unavailableTexts = 0;
    size_t residentImages = 0;
    size_t evictedImages = 0;
    size_t residentTextBytes = 0;
    size_t compressedTextBytes = 0;
    size_t residentImageBytes = 0;
    size_t fallbackImageBytes = 0;
};

struct MaintenanceOptions {
    std::optional<Hours> retention;  ///< Delete items older than this
    bool cleanupOrphans = true;      ///< Delete blobs no item refers to
    bool compact = true;             ///< Compact the item store
};

struct MaintenanceReport {
    size_t expiredItems = 0;
    size_t orphanBlobs = 0;
    bool compacted = false;
};

/**
 * @brief Newest-first item collection
 */
class ClipboardHistory {
public:
    ClipboardHistory(Dispatch::SerialQueue& queue,
                     Dispatch::KeyedExecutor& storeExecutor,
                     Sanitize::SanitizationService& sanitizer,
                     Storage::IItemStore& itemStore,
                     Storage::IBlobStore& blobStore,
                     Core::Logger& logger,
                     HistoryOptions options = {});
    ~ClipboardHistory();

    ClipboardHistory(const ClipboardHistory&) = delete;
    ClipboardHistory& operator=(const ClipboardHistory&) = delete;

    // ---- Capture -----------------------------------------------------------

    /**
     * @brief Sanitize and insert captured text
     *
     * Identical text already in the history is not inserted again; the id
     * of the existing item is returned instead.
     */
    Result<ItemId> addText(std::string text);

    /// Insert a captured image
    Result<ItemId> addImage(ByteBuffer pixels);

    /// Load up to maxItems newest records from the item store (startup)
    Result<size_t> restore();

    // ---- Membership --------------------------------------------------------

    Result<void> remove(const ItemId& id);

    Result<void> clear();

    /// Drop oldest items until at most @p limit remain; returns how many went
    Result<size_t> trimTo(size_t limit);

    /// Change the capacity and trim to it
    Result<void> setMaxItems(size_t maxItems);

    [[nodiscard]] size_t maxItems() const;

    // ---- Reads -------------------------------------------------------------

    /// Value copies, newest first
    Result<std::vector<ClipboardItem>> snapshot();

    Result<ClipboardItem> find(const ItemId& id);

    Result<size_t> size();

    /**
     * @brief Read an item's text, decompressing when needed
     *
     * A failed decompression marks the text unavailable for good
     * (DecompressionFailed now, TextUnavailable on later calls).
     */
    Result<std::string> readText(const ItemId& id, TextVariant variant = TextVariant::Display);

    /// Text to put back on the clipboard
    Result<std::string> copyText(const ItemId& id) { return readText(id, TextVariant::Display); }

    /// Query the item store (call flush() first to see the latest writes)
    Result<std::vector<Storage::ItemRecord>> search(const Storage::ItemQuery& query);

    Result<StorageStatistics> statistics();

    // ---- Maintenance -------------------------------------------------------

    Result<MaintenanceReport> performMaintenance(const MaintenanceOptions& options);

    /**
     * @brief Wait for queued store writes and blob deletes
     *
     * Off the queue this also runs the blob references those writes hand
     * back to their items.
     */
    void flush();

    /// Queue an item-store compaction on the store executor
    void compactStoreAsync();

    // ---- Hooks -------------------------------------------------------------

    void setStatusCallback(StatusCallback callback);
    void setItemAddedHook(ItemAddedHook hook);

    /// Deliver a status event to the callback (any thread)
    void reportStatus(const StatusEvent& event);

    // ---- Queue-confined access ---------------------------------------------

    /// Items newest first; nullptr off the queue
    [[nodiscard]] std::vector<ClipboardItem>* itemsOnQueue();

    /// nullptr when absent or off the queue
    [[nodiscard]] ClipboardItem* findOnQueue(const ItemId& id);

    /// Queue a store write of @p item's current state
    Result<void> persistOnQueue(const ClipboardItem& item);

    /// Remove oldest items beyond @p limit with store and blob cleanup
    Result<size_t> trimOnQueue(size_t limit);

    /// Queue a blob delete ordered after earlier blob work for @p key
    void deleteBlob(const std::string& key);

    [[nodiscard]] Dispatch::SerialQueue& queue() noexcept { return m_queue; }

private:
    Result<ItemId> insert(ClipboardItem item);
    Result<void> onQueue(const std::function<void()>& task);
    void insertOnQueue(ClipboardItem& item, Result<ItemId>& outcome);
    void eraseAt(size_t index);
    size_t trimItems(size_t limit);
    void persistRecord(Storage::ItemRecord record);
    void persistNewImage(const ClipboardItem& item);
    void writeRecord(const Storage::ItemRecord& record);

    Dispatch::SerialQueue& m_queue;
    Dispatch::KeyedExecutor& m_storeExecutor;
    Sanitize::SanitizationService& m_sanitizer;
    Storage::IItemStore& m_itemStore;
    Storage::IBlobStore& m_blobStore;
    Core::Logger& m_logger;

    std::vector<ClipboardItem> m_items;  // queue-confined
    std::atomic<size_t> m_maxItems;

    mutable std::mutex m_hookMutex;
    StatusCallback m_statusCallback;
    ItemAddedHook m_itemAddedHook;
};

} // namespace ClipGuard::Clipboard

#endif // CLIPGUARD_CORE_CLIPBOARD_HISTORY_HPP
