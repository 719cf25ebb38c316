/**
 * @file Storage.hpp
 * @brief Durable item and blob stores
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 *
 * The item store keeps one ItemRecord per clipboard item (metadata plus
 * resident or compressed text). The blob store keeps evicted image bytes.
 * Both are opaque durable maps; implementations are free to transform the
 * bytes at rest as long as load() returns what save() was given.
 */

#pragma once

#ifndef CLIPGUARD_CORE_STORAGE_HPP
#define CLIPGUARD_CORE_STORAGE_HPP

#include <ClipGuard/Core/Types.hpp>
#include <ClipGuard/Core/ErrorCodes.hpp>
#include <ClipGuard/Core/Logger.hpp>
#include <ClipGuard/Core/ClipboardItem.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ClipGuard::Storage {

// ============================================================================
// Item Records
// ============================================================================

/// Prefix marking a persisted compressed text field
constexpr const char* COMPRESSED_PREFIX = "COMPRESSED:";

/**
 * @brief Persisted form of a ClipboardItem
 *
 * Pixels are never part of a record; an image is durable only through
 * its blob reference.
 */
struct ItemRecord {
    ItemId id;
    Timestamp createdAt{};
    Clipboard::ItemKind kind = Clipboard::ItemKind::Text;

    std::optional<std::string> originalText;
    std::optional<std::string> sanitizedText;
    SharedBytes compressedOriginal;
    SharedBytes compressedSanitized;
    size_t textLength = 0;
    bool sanitized = false;
    SHA256Hash textDigest{};

    std::optional<BlobRef> imageRef;
    size_t imageSize = 0;

    static ItemRecord fromItem(const Clipboard::ClipboardItem& item);

    [[nodiscard]] Clipboard::ClipboardItem toItem() const;
};

/// "COMPRESSED:" + base64 of @p frame
std::string encodeCompressedField(ByteSpan frame);

/// Inverse of encodeCompressedField; StoreCorrupted when the field is malformed
Result<ByteBuffer> decodeCompressedField(const std::string& field);

enum class SortOrder : uint8_t {
    NewestFirst,
    OldestFirst
};

/**
 * @brief Filter, sort and page for IItemStore::query
 */
struct ItemQuery {
    std::optional<Clipboard::ItemKind> kind;
    std::optional<std::string> textContains;   ///< Matches original or sanitized text
    std::optional<Timestamp> createdAfter;     ///< Exclusive
    std::optional<Timestamp> createdBefore;    ///< Exclusive
    SortOrder sort = SortOrder::NewestFirst;
    size_t limit = 0;                          ///< 0 means unlimited
    size_t offset = 0;
};

/// True when @p record passes the filter part of @p query
bool matchesQuery(const ItemRecord& record, const ItemQuery& query);

/// Filter, sort and page @p records
std::vector<ItemRecord> applyQuery(std::vector<ItemRecord> records, const ItemQuery& query);

// ============================================================================
// Item Store
// ============================================================================

class IItemStore {
public:
    virtual ~IItemStore() = default;

    /// Insert or replace the record with the same id
    virtual Result<void> put(const ItemRecord& record) = 0;

    /// ItemNotFound when absent
    virtual Result<ItemRecord> get(const ItemId& id) const = 0;

    /// ItemNotFound when absent
    virtual Result<void> remove(const ItemId& id) = 0;

    virtual Result<std::vector<ItemRecord>> query(const ItemQuery& query) const = 0;

    /// Number of records passing the filter (limit and offset ignored)
    virtual Result<size_t> count(const ItemQuery& query) const = 0;

    /// Reclaim space held by deleted or replaced records
    virtual Result<void> compact() = 0;
};

/**
 * @brief Mutex-guarded map, nothing survives the process
 */
class InMemoryItemStore : public IItemStore {
public:
    InMemoryItemStore() = default;

    Result<void> put(const ItemRecord& record) override;
    Result<ItemRecord> get(const ItemId& id) const override;
    Result<void> remove(const ItemId& id) override;
    Result<std::vector<ItemRecord>> query(const ItemQuery& query) const override;
    Result<size_t> count(const ItemQuery& query) const override;
    Result<void> compact() override;

private:
    mutable std::mutex m_mutex;
    std::map<ItemId, ItemRecord> m_records;
};

/**
 * @brief Append-only JSON-lines journal
 *
 * Every put appends `{"op":"put","record":{...}}`, every remove appends
 * `{"op":"delete","id":"..."}`. Text records carry `"textEncoding"`
 * ("plain" or "zlib"); only "zlib" fields are decoded as compressed frames.
 * Opening replays the file; a torn trailing
 * line is skipped with a warning. compact() rewrites the journal with one
 * put per live record through a temporary file and rename.
 */
class JournalItemStore : public IItemStore {
public:
    static Result<std::unique_ptr<JournalItemStore>> open(const std::string& path,
                                                          Core::Logger& logger);

    ~JournalItemStore() override;

    Result<void> put(const ItemRecord& record) override;
    Result<ItemRecord> get(const ItemId& id) const override;
    Result<void> remove(const ItemId& id) override;
    Result<std::vector<ItemRecord>> query(const ItemQuery& query) const override;
    Result<size_t> count(const ItemQuery& query) const override;
    Result<void> compact() override;

    /// Lines in the journal file (live and superseded)
    [[nodiscard]] size_t journalEntries() const;

private:
    class Impl;
    explicit JournalItemStore(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Blob Store
// ============================================================================

class IBlobStore {
public:
    virtual ~IBlobStore() = default;

    /// Persist @p data under @p key, replacing any previous blob
    virtual Result<BlobRef> save(const std::string& key, ByteSpan data) = 0;

    /// BlobNotFound when absent
    virtual Result<ByteBuffer> load(const BlobRef& ref) = 0;

    /// Succeeds when the key is already absent
    virtual Result<void> remove(const std::string& key) = 0;

    virtual Result<std::vector<std::string>> list() = 0;
};

/**
 * @brief Heap-backed blob store
 */
class InMemoryBlobStore : public IBlobStore {
public:
    Result<BlobRef> save(const std::string& key, ByteSpan data) override;
    Result<ByteBuffer> load(const BlobRef& ref) override;
    Result<void> remove(const std::string& key) override;
    Result<std::vector<std::string>> list() override;

private:
    std::mutex m_mutex;
    std::map<std::string, ByteBuffer> m_blobs;
};

/**
 * @brief One file per blob: `<directory>/<key>.bin`
 *
 * Writes go to `<key>.bin.tmp` and are renamed into place. With
 * `encrypt` set, files hold AES-256-GCM output bound to the key name.
 * Without an explicit key, the 32-byte key is read from `keyFile`, or
 * generated and written there with mode 0600 on first open. A key file
 * readable by group or others, or owned by another user, is refused.
 * With `secureDelete` set, files are overwritten with random bytes
 * before unlinking. Keys may only contain [A-Za-z0-9_-].
 */
class FileBlobStore : public IBlobStore {
public:
    struct Options {
        std::string directory;
        bool encrypt = false;
        bool secureDelete = false;
        std::optional<AESKey> key;  ///< Takes precedence over keyFile
        std::string keyFile;        ///< Defaults to `<directory>/blob.key`
    };

    static Result<std::unique_ptr<FileBlobStore>> open(const Options& options,
                                                       Core::Logger& logger);

    ~FileBlobStore() override;

    Result<BlobRef> save(const std::string& key, ByteSpan data) override;
    Result<ByteBuffer> load(const BlobRef& ref) override;
    Result<void> remove(const std::string& key) override;
    Result<std::vector<std::string>> list() override;

    [[nodiscard]] std::string pathFor(const std::string& key) const;

private:
    class Impl;
    explicit FileBlobStore(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> m_impl;
};

/// True for keys made of [A-Za-z0-9_-]
bool isValidBlobKey(const std::string& key) noexcept;

} // namespace ClipGuard::Storage

#endif // CLIPGUARD_CORE_STORAGE_HPP
