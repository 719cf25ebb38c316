/**
 * @file InMemoryStores.cpp
 * @brief Heap-backed item and blob stores
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Storage.hpp>

namespace ClipGuard::Storage {

// ============================================================================
// InMemoryItemStore
// ============================================================================

Result<void> InMemoryItemStore::put(const ItemRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records[record.id] = record;
    return Result<void>::Success();
}

Result<ItemRecord> InMemoryItemStore::get(const ItemId& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return ErrorCode::ItemNotFound;
    }
    return it->second;
}

Result<void> InMemoryItemStore::remove(const ItemId& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_records.erase(id) == 0) {
        return ErrorCode::ItemNotFound;
    }
    return Result<void>::Success();
}

Result<std::vector<ItemRecord>> InMemoryItemStore::query(const ItemQuery& query) const {
    std::vector<ItemRecord> records;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        records.reserve(m_records.size());
        for (const auto& [id, record] : m_records) {
            records.push_back(record);
        }
    }
    return applyQuery(std::move(records), query);
}

Result<size_t> InMemoryItemStore::count(const ItemQuery& query) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t total = 0;
    for (const auto& [id, record] : m_records) {
        if (matchesQuery(record, query)) {
            ++total;
        }
    }
    return total;
}

Result<void> InMemoryItemStore::compact() {
    return Result<void>::Success();
}

// ============================================================================
// InMemoryBlobStore
// ============================================================================

Result<BlobRef> InMemoryBlobStore::save(const std::string& key, ByteSpan data) {
    if (key.empty()) {
        return ErrorCode::InvalidArgument;
    }
    
    std::lock_guard<std::mutex> lock(m_mutex);
    m_blobs[key] = ByteBuffer(data.begin(), data.end());
    return BlobRef{key, data.size()};
}

Result<ByteBuffer> InMemoryBlobStore::load(const BlobRef& ref) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_blobs.find(ref.key);
    if (it == m_blobs.end()) {
        return ErrorCode::BlobNotFound;
    }
    return it->second;
}

Result<void> InMemoryBlobStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_blobs.erase(key);
    return Result<void>::Success();
}

Result<std::vector<std::string>> InMemoryBlobStore::list() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> keys;
    keys.reserve(m_blobs.size());
    for (const auto& [key, bytes] : m_blobs) {
        keys.push_back(key);
    }
    return keys;
}

} // namespace ClipGuard::Storage
