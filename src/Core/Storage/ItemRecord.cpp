/**
 * @file ItemRecord.cpp
 * @brief Item <-> record conversion and query evaluation
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Storage.hpp>
#include <ClipGuard/Core/Compression.hpp>
#include <ClipGuard/Core/Crypto.hpp>
#include <algorithm>

namespace ClipGuard::Storage {

using Clipboard::ClipboardItem;
using Clipboard::ItemKind;
using Clipboard::TextState;

ItemRecord ItemRecord::fromItem(const ClipboardItem& item) {
    ItemRecord record;
    record.id = item.id();
    record.createdAt = item.createdAt();
    record.kind = item.kind();
    
    if (item.isText()) {
        record.textLength = item.textLength();
        record.sanitized = item.isSanitized();
        record.textDigest = item.textDigest();
        if (item.textState() == TextState::Compressed) {
            record.compressedOriginal = item.compressedOriginal();
            record.compressedSanitized = item.compressedSanitized();
        } else {
            record.originalText = item.originalText();
            record.sanitizedText = item.sanitizedText();
        }
    } else {
        record.imageRef = item.imageRef();
        record.imageSize = item.imageSize();
    }
    
    return record;
}

ClipboardItem ItemRecord::toItem() const {
    ClipboardItem item(id, createdAt, kind);
    if (kind == ItemKind::Text) {
        item.restoreText(originalText, sanitizedText, compressedOriginal, compressedSanitized,
                         textLength, sanitized, textDigest);
    } else {
        item.restoreImage(imageRef, imageSize);
    }
    return item;
}

std::string encodeCompressedField(ByteSpan frame) {
    return std::string(COMPRESSED_PREFIX) + Crypto::toBase64(frame);
}

Result<ByteBuffer> decodeCompressedField(const std::string& field) {
    std::string_view prefix(COMPRESSED_PREFIX);
    if (field.compare(0, prefix.size(), prefix) != 0) {
        return ErrorCode::StoreCorrupted;
    }
    
    auto decoded = Crypto::fromBase64(field.substr(prefix.size()));
    if (decoded.isFailure()) {
        return ErrorCode::StoreCorrupted;
    }
    return decoded;
}

namespace {

bool textFieldContains(const std::optional<std::string>& plain, const SharedBytes& compressed,
                       const std::string& needle) {
    if (plain) {
        return plain->find(needle) != std::string::npos;
    }
    if (compressed) {
        Compression::TextCompressor compressor;
        auto text = compressor.decompressText(*compressed);
        return text.isSuccess() && text.value().find(needle) != std::string::npos;
    }
    return false;
}

} // anonymous namespace

bool matchesQuery(const ItemRecord& record, const ItemQuery& query) {
    if (query.kind && record.kind != *query.kind) {
        return false;
    }
    if (query.createdAfter && !(record.createdAt > *query.createdAfter)) {
        return false;
    }
    if (query.createdBefore && !(record.createdAt < *query.createdBefore)) {
        return false;
    }
    if (query.textContains) {
        if (record.kind != ItemKind::Text) {
            return false;
        }
        const std::string& needle = *query.textContains;
        if (!textFieldContains(record.originalText, record.compressedOriginal, needle) &&
            !textFieldContains(record.sanitizedText, record.compressedSanitized, needle)) {
            return false;
        }
    }
    return true;
}

std::vector<ItemRecord> applyQuery(std::vector<ItemRecord> records, const ItemQuery& query) {
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&](const ItemRecord& r) { return !matchesQuery(r, query); }),
                  records.end());
    
    // Id breaks ties so equal timestamps page deterministically
    std::sort(records.begin(), records.end(), [&](const ItemRecord& a, const ItemRecord& b) {
        if (a.createdAt != b.createdAt) {
            return query.sort == SortOrder::NewestFirst ? a.createdAt > b.createdAt
                                                        : a.createdAt < b.createdAt;
        }
        return a.id < b.id;
    });
    
    if (query.offset >= records.size()) {
        return {};
    }
    records.erase(records.begin(), records.begin() + static_cast<std::ptrdiff_t>(query.offset));
    if (query.limit > 0 && records.size() > query.limit) {
        records.resize(query.limit);
    }
    return records;
}

} // namespace ClipGuard::Storage
