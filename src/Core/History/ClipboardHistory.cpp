/**
 * @file ClipboardHistory.cpp
 * @brief Queue-confined clipboard history
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/ClipboardHistory.hpp>
#include <ClipGuard/Core/Compression.hpp>
#include <algorithm>
#include <unordered_set>

namespace ClipGuard::Clipboard {

ClipboardHistory::ClipboardHistory(Dispatch::SerialQueue& queue,
                                   Dispatch::KeyedExecutor& storeExecutor,
                                   Sanitize::SanitizationService& sanitizer,
                                   Storage::IItemStore& itemStore,
                                   Storage::IBlobStore& blobStore,
                                   Core::Logger& logger,
                                   HistoryOptions options)
    : m_queue(queue)
    , m_storeExecutor(storeExecutor)
    , m_sanitizer(sanitizer)
    , m_itemStore(itemStore)
    , m_blobStore(blobStore)
    , m_logger(logger)
    , m_maxItems(options.maxItems) {
}

ClipboardHistory::~ClipboardHistory() {
    // Store tasks capture this, and so do the commits they post to the queue
    flush();
}

// ============================================================================
// Capture
// ============================================================================

Result<ItemId> ClipboardHistory::addText(std::string text) {
    auto item = ClipboardItem::makeText(std::move(text));
    if (item.isFailure()) {
        return item.error();
    }

    // Sanitization runs on the caller's thread, never on the queue
    std::string sanitized = m_sanitizer.sanitize(*item.value().originalText());
    CLIPGUARD_TRY(item.value().setSanitizedText(std::move(sanitized)));

    return insert(std::move(item.value()));
}

Result<ItemId> ClipboardHistory::addImage(ByteBuffer pixels) {
    auto item = ClipboardItem::makeImage(std::move(pixels));
    if (item.isFailure()) {
        return item.error();
    }
    return insert(std::move(item.value()));
}

Result<size_t> ClipboardHistory::restore() {
    Storage::ItemQuery query;
    query.sort = Storage::SortOrder::NewestFirst;
    query.limit = m_maxItems.load();

    auto records = m_itemStore.query(query);
    if (records.isFailure()) {
        CLIPGUARD_LOG_ERROR_F(m_logger, "History restore failed: %s",
                              getErrorMessage(records.error()).data());
        return records.error();
    }

    std::vector<ClipboardItem> restored;
    restored.reserve(records.value().size());
    for (const auto& record : records.value()) {
        if (record.kind == ItemKind::Image && !record.imageRef) {
            CLIPGUARD_LOG_WARNING_F(m_logger, "Skipping stored image %s without a blob",
                                    record.id.c_str());
            continue;
        }
        restored.push_back(record.toItem());
    }

    size_t added = 0;
    CLIPGUARD_TRY(onQueue([&] {
        for (auto& item : restored) {
            bool present = std::any_of(m_items.begin(), m_items.end(),
                [&](const ClipboardItem& existing) { return existing.id() == item.id(); });
            if (!present) {
                m_items.push_back(std::move(item));
                ++added;
            }
        }
        std::stable_sort(m_items.begin(), m_items.end(),
            [](const ClipboardItem& a, const ClipboardItem& b) {
                return a.createdAt() > b.createdAt();
            });
        trimItems(m_maxItems.load());
    }));

    CLIPGUARD_LOG_INFO_F(m_logger, "Restored %zu items from the item store", added);
    return added;
}

Result<ItemId> ClipboardHistory::insert(ClipboardItem item) {
    Result<ItemId> outcome(ErrorCode::InternalError);
    CLIPGUARD_TRY(onQueue([&] { insertOnQueue(item, outcome); }));
    return outcome;
}

void ClipboardHistory::insertOnQueue(ClipboardItem& item, Result<ItemId>& outcome) {
    if (item.isText()) {
        for (const auto& existing : m_items) {
            if (existing.isText() && existing.textDigest() == item.textDigest()) {
                CLIPGUARD_LOG_DEBUG_F(m_logger, "Duplicate text, keeping item %s",
                                      existing.id().c_str());
                outcome = existing.id();
                return;
            }
        }
    }

    m_items.insert(m_items.begin(), item);
    if (item.isImage()) {
        persistNewImage(item);
    } else {
        persistRecord(Storage::ItemRecord::fromItem(item));
    }

    ItemAddedHook hook;
    {
        std::lock_guard<std::mutex> lock(m_hookMutex);
        hook = m_itemAddedHook;
    }
    if (hook) {
        hook(m_items.front());
    }

    trimItems(m_maxItems.load());
    outcome = item.id();
}

// ============================================================================
// Membership
// ============================================================================

Result<void> ClipboardHistory::remove(const ItemId& id) {
    bool found = false;
    CLIPGUARD_TRY(onQueue([&] {
        for (size_t i = 0; i < m_items.size(); ++i) {
            if (m_items[i].id() == id) {
                eraseAt(i);
                found = true;
                break;
            }
        }
    }));
    return found ? Result<void>::Success() : Result<void>(ErrorCode::ItemNotFound);
}

Result<void> ClipboardHistory::clear() {
    return onQueue([&] {
        while (!m_items.empty()) {
            eraseAt(m_items.size() - 1);
        }
    });
}

Result<size_t> ClipboardHistory::trimTo(size_t limit) {
    size_t removed = 0;
    CLIPGUARD_TRY(onQueue([&] { removed = trimItems(limit); }));
    return removed;
}

Result<void> ClipboardHistory::setMaxItems(size_t maxItems) {
    if (maxItems == 0) {
        return ErrorCode::InvalidArgument;
    }
    m_maxItems.store(maxItems);
    auto trimmed = trimTo(maxItems);
    if (trimmed.isFailure()) {
        return trimmed.error();
    }
    return Result<void>::Success();
}

size_t ClipboardHistory::maxItems() const {
    return m_maxItems.load();
}

void ClipboardHistory::eraseAt(size_t index) {
    const ClipboardItem& item = m_items[index];
    const ItemId id = item.id();

    if (item.isImage()) {
        deleteBlob(id);
    }

    bool queued = m_storeExecutor.submit(id, [this, id] {
        auto result = m_itemStore.remove(id);
        // A record whose write failed earlier is simply absent
        if (result.isFailure() && result.error() != ErrorCode::ItemNotFound) {
            CLIPGUARD_LOG_WARNING_F(m_logger, "Item store delete failed for %s: %s",
                                    id.c_str(), getErrorMessage(result.error()).data());
            reportStatus({ErrorCode::StoreDeleteFailed, id, "Could not delete stored item"});
        }
    });
    if (!queued) {
        CLIPGUARD_LOG_WARNING_F(m_logger, "Store executor rejected delete of %s", id.c_str());
    }

    m_items.erase(m_items.begin() + static_cast<std::ptrdiff_t>(index));
}

// ============================================================================
// Reads
// ============================================================================

Result<std::vector<ClipboardItem>> ClipboardHistory::snapshot() {
    std::vector<ClipboardItem> copy;
    CLIPGUARD_TRY(onQueue([&] { copy = m_items; }));
    return copy;
}

Result<ClipboardItem> ClipboardHistory::find(const ItemId& id) {
    std::optional<ClipboardItem> found;
    CLIPGUARD_TRY(onQueue([&] {
        for (const auto& item : m_items) {
            if (item.id() == id) {
                found = item;
                break;
            }
        }
    }));
    if (!found) {
        return ErrorCode::ItemNotFound;
    }
    return std::move(*found);
}

Result<size_t> ClipboardHistory::size() {
    size_t count = 0;
    CLIPGUARD_TRY(onQueue([&] { count = m_items.size(); }));
    return count;
}

Result<std::string> ClipboardHistory::readText(const ItemId& id, TextVariant variant) {
    auto found = find(id);
    if (found.isFailure()) {
        return found.error();
    }
    const ClipboardItem& item = found.value();

    if (!item.isText()) {
        return ErrorCode::InvalidArgument;
    }
    if (item.textUnavailable()) {
        return ErrorCode::TextUnavailable;
    }

    if (item.textState() == TextState::Resident) {
        switch (variant) {
            case TextVariant::Original:
                return item.originalText().value_or(std::string());
            case TextVariant::Sanitized:
                return item.sanitizedText().value_or(std::string());
            case TextVariant::Display:
                return item.displayText().value_or(std::string());
        }
        return ErrorCode::InvalidArgument;
    }

    // Compressed: a missing sanitized frame means it mirrors the original
    SharedBytes frame = item.compressedOriginal();
    if (variant != TextVariant::Original && item.compressedSanitized()) {
        frame = item.compressedSanitized();
    }

    Result<std::string> text(ErrorCode::DecompressionFailed);
    if (frame) {
        text = Compression::TextCompressor().decompressText(*frame);
    }

    if (text.isFailure()) {
        CLIPGUARD_LOG_ERROR_F(m_logger, "Text of item %s could not be decompressed: %s",
                              id.c_str(), getErrorMessage(text.errorOr()).data());
        auto marked = onQueue([&] {
            if (ClipboardItem* live = findOnQueue(id)) {
                live->markTextUnavailable();
            }
        });
        if (marked.isFailure()) {
            CLIPGUARD_LOG_WARNING(m_logger, "Could not mark text unavailable");
        }
        reportStatus({ErrorCode::DecompressionFailed, id, "Stored text is corrupted"});
        return ErrorCode::DecompressionFailed;
    }

    return text;
}

Result<std::vector<Storage::ItemRecord>> ClipboardHistory::search(const Storage::ItemQuery& query) {
    return m_itemStore.query(query);
}

Result<StorageStatistics> ClipboardHistory::statistics() {
    StorageStatistics stats;
    CLIPGUARD_TRY(onQueue([&] {
        for (const auto& item : m_items) {
            ++stats.totalItems;
            if (item.isText()) {
                ++stats.textItems;
                if (item.isSanitized()) ++stats.sanitizedItems;
                if (item.textUnavailable()) ++stats.unavailableTexts;

                if (item.textState() == TextState::Compressed) {
                    ++stats.compressedTexts;
                    if (auto frame = item.compressedOriginal()) stats.compressedTextBytes += frame->size();
                    if (auto frame = item.compressedSanitized()) stats.compressedTextBytes += frame->size();
                } else {
                    if (item.originalText()) stats.residentTextBytes += item.originalText()->size();
                    if (item.isSanitized() && item.sanitizedText()) {
                        stats.residentTextBytes += item.sanitizedText()->size();
                    }
                }
            } else {
                ++stats.imageItems;
                if (item.imageState() == ImageState::Resident) {
                    ++stats.residentImages;
                    stats.residentImageBytes += item.imageSize();
                } else if (item.imageState() == ImageState::Evicted) {
                    ++stats.evictedImages;
                }
                if (auto fallback = item.imageFallback()) {
                    stats.fallbackImageBytes += fallback->size();
                }
            }
        }
    }));
    return stats;
}

// ============================================================================
// Maintenance
// ============================================================================

Result<MaintenanceReport> ClipboardHistory::performMaintenance(const MaintenanceOptions& options) {
    if (m_queue.isCurrent()) {
        return ErrorCode::WrongContext;
    }

    MaintenanceReport report;

    if (options.retention) {
        const Timestamp cutoff = WallClock::now() - *options.retention;

        CLIPGUARD_TRY(onQueue([&] {
            for (size_t i = m_items.size(); i-- > 0;) {
                if (m_items[i].createdAt() < cutoff) {
                    eraseAt(i);
                    ++report.expiredItems;
                }
            }
        }));
        flush();

        // Records older than the cutoff that were never loaded into memory
        Storage::ItemQuery stale;
        stale.createdBefore = cutoff;
        auto records = m_itemStore.query(stale);
        if (records.isFailure()) {
            return records.error();
        }
        for (const auto& record : records.value()) {
            auto removed = m_itemStore.remove(record.id);
            if (removed.isFailure() && removed.error() != ErrorCode::ItemNotFound) {
                return ErrorCode::StoreDeleteFailed;
            }
            if (record.imageRef) {
                deleteBlob(record.imageRef->key);
            }
            ++report.expiredItems;
        }
    }

    if (options.cleanupOrphans) {
        flush();

        std::unordered_set<std::string> referenced;
        CLIPGUARD_TRY(onQueue([&] {
            for (const auto& item : m_items) {
                referenced.insert(item.id());
                if (item.imageRef()) referenced.insert(item.imageRef()->key);
            }
        }));

        auto records = m_itemStore.query(Storage::ItemQuery{});
        if (records.isFailure()) {
            return records.error();
        }
        for (const auto& record : records.value()) {
            referenced.insert(record.id);
            if (record.imageRef) referenced.insert(record.imageRef->key);
        }

        auto keys = m_blobStore.list();
        if (keys.isFailure()) {
            return keys.error();
        }
        for (const auto& key : keys.value()) {
            if (referenced.count(key) == 0) {
                deleteBlob(key);
                ++report.orphanBlobs;
            }
        }
        flush();
    }

    if (options.compact) {
        flush();
        auto compacted = m_itemStore.compact();
        if (compacted.isFailure()) {
            CLIPGUARD_LOG_WARNING_F(m_logger, "Item store compaction failed: %s",
                                    getErrorMessage(compacted.error()).data());
        }
        report.compacted = compacted.isSuccess();
    }

    CLIPGUARD_LOG_INFO_F(m_logger, "Maintenance: %zu expired, %zu orphan blobs, compacted=%d",
                         report.expiredItems, report.orphanBlobs, report.compacted ? 1 : 0);
    return report;
}

void ClipboardHistory::flush() {
    m_storeExecutor.waitIdle();
    if (!m_queue.isCurrent() && m_queue.drain().isFailure()) {
        CLIPGUARD_LOG_WARNING(m_logger, "History queue could not be drained");
    }
}

void ClipboardHistory::compactStoreAsync() {
    bool queued = m_storeExecutor.submit("item-store-compaction", [this] {
        auto result = m_itemStore.compact();
        if (result.isFailure()) {
            CLIPGUARD_LOG_WARNING_F(m_logger, "Item store compaction failed: %s",
                                    getErrorMessage(result.error()).data());
        } else {
            CLIPGUARD_LOG_DEBUG(m_logger, "Item store compacted");
        }
    });
    if (!queued) {
        CLIPGUARD_LOG_WARNING(m_logger, "Store executor rejected compaction");
    }
}

// ============================================================================
// Hooks
// ============================================================================

void ClipboardHistory::setStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(m_hookMutex);
    m_statusCallback = std::move(callback);
}

void ClipboardHistory::setItemAddedHook(ItemAddedHook hook) {
    std::lock_guard<std::mutex> lock(m_hookMutex);
    m_itemAddedHook = std::move(hook);
}

void ClipboardHistory::reportStatus(const StatusEvent& event) {
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_hookMutex);
        callback = m_statusCallback;
    }
    if (callback) {
        callback(event);
    }
}

// ============================================================================
// Queue-confined access
// ============================================================================

std::vector<ClipboardItem>* ClipboardHistory::itemsOnQueue() {
    return m_queue.isCurrent() ? &m_items : nullptr;
}

ClipboardItem* ClipboardHistory::findOnQueue(const ItemId& id) {
    if (!m_queue.isCurrent()) {
        return nullptr;
    }
    for (auto& item : m_items) {
        if (item.id() == id) {
            return &item;
        }
    }
    return nullptr;
}

Result<void> ClipboardHistory::persistOnQueue(const ClipboardItem& item) {
    if (!m_queue.isCurrent()) {
        return ErrorCode::WrongContext;
    }
    persistRecord(Storage::ItemRecord::fromItem(item));
    return Result<void>::Success();
}

Result<size_t> ClipboardHistory::trimOnQueue(size_t limit) {
    if (!m_queue.isCurrent()) {
        return ErrorCode::WrongContext;
    }
    return trimItems(limit);
}

size_t ClipboardHistory::trimItems(size_t limit) {
    size_t removed = 0;
    while (m_items.size() > limit) {
        eraseAt(m_items.size() - 1);
        ++removed;
    }
    if (removed > 0) {
        CLIPGUARD_LOG_DEBUG_F(m_logger, "Trimmed %zu items (limit %zu)", removed, limit);
    }
    return removed;
}

void ClipboardHistory::deleteBlob(const std::string& key) {
    bool queued = m_storeExecutor.submit(key, [this, key] {
        auto result = m_blobStore.remove(key);
        if (result.isFailure()) {
            CLIPGUARD_LOG_WARNING_F(m_logger, "Blob delete failed for %s: %s",
                                    key.c_str(), getErrorMessage(result.error()).data());
        }
    });
    if (!queued) {
        CLIPGUARD_LOG_WARNING_F(m_logger, "Store executor rejected blob delete of %s", key.c_str());
    }
}

// ============================================================================
// Internals
// ============================================================================

Result<void> ClipboardHistory::onQueue(const std::function<void()>& task) {
    if (m_queue.isCurrent()) {
        task();
        return Result<void>::Success();
    }
    return m_queue.sync(task);
}

void ClipboardHistory::persistRecord(Storage::ItemRecord record) {
    // An image record is written only once its pixels have a blob
    if (record.kind == ItemKind::Image && !record.imageRef) {
        CLIPGUARD_LOG_DEBUG_F(m_logger, "Image %s has no blob yet, record not written",
                              record.id.c_str());
        return;
    }

    const ItemId id = record.id;
    bool queued = m_storeExecutor.submit(id, [this, record = std::move(record)] {
        writeRecord(record);
    });
    if (!queued) {
        CLIPGUARD_LOG_WARNING_F(m_logger, "Store executor rejected write of %s", id.c_str());
    }
}

void ClipboardHistory::persistNewImage(const ClipboardItem& item) {
    const ItemId id = item.id();
    SharedBytes pixels = item.imagePixels();
    if (!pixels) {
        return;
    }

    Storage::ItemRecord record = Storage::ItemRecord::fromItem(item);
    bool queued = m_storeExecutor.submit(id, [this, id, pixels, record = std::move(record)]() mutable {
        auto saved = m_blobStore.save(id, *pixels);
        if (saved.isFailure()) {
            CLIPGUARD_LOG_ERROR_F(m_logger, "Image blob write failed for %s: %s",
                                  id.c_str(), getErrorMessage(saved.error()).data());
            reportStatus({ErrorCode::StoreWriteFailed, id, "Could not save image"});
            return;
        }

        const BlobRef ref = saved.value();
        record.imageRef = ref;
        writeRecord(record);

        bool posted = m_queue.post([this, id, ref] {
            ClipboardItem* target = findOnQueue(id);
            if (target && !target->imageRef()) {
                auto attached = target->attachImageRef(ref);
                if (attached.isFailure()) {
                    CLIPGUARD_LOG_WARNING_F(m_logger, "Cannot attach blob to %s: %s",
                                            id.c_str(), getErrorMessage(attached.error()).data());
                }
            }
        });
        if (!posted) {
            CLIPGUARD_LOG_DEBUG_F(m_logger, "Queue stopped before blob of %s was attached", id.c_str());
        }
    });
    if (!queued) {
        CLIPGUARD_LOG_WARNING_F(m_logger, "Store executor rejected image write of %s", id.c_str());
    }
}

void ClipboardHistory::writeRecord(const Storage::ItemRecord& record) {
    auto result = m_itemStore.put(record);
    if (result.isFailure()) {
        CLIPGUARD_LOG_ERROR_F(m_logger, "Item store write failed for %s: %s",
                              record.id.c_str(), getErrorMessage(result.error()).data());
        reportStatus({ErrorCode::StoreWriteFailed, record.id, "Could not save item"});
    }
}

} // namespace ClipGuard::Clipboard
