/**
 * @file JournalItemStore.cpp
 * @brief JSON-lines journal item store
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Storage.hpp>
#include <ClipGuard/Core/Crypto.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace ClipGuard::Storage {

namespace {

constexpr const char* TEXT_ENCODING_PLAIN = "plain";
constexpr const char* TEXT_ENCODING_ZLIB = "zlib";

int64_t toMillis(Timestamp ts) {
    return std::chrono::duration_cast<Milliseconds>(ts.time_since_epoch()).count();
}

Timestamp fromMillis(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<WallClock::duration>(Milliseconds(ms)));
}

json recordToJson(const ItemRecord& record) {
    json j;
    j["id"] = record.id;
    j["createdAt"] = toMillis(record.createdAt);
    j["kind"] = Clipboard::itemKindName(record.kind);
    
    if (record.kind == Clipboard::ItemKind::Text) {
        j["textLength"] = record.textLength;
        j["sanitized"] = record.sanitized;
        j["digest"] = Crypto::toHex(ByteSpan(record.textDigest.data(), record.textDigest.size()));
        
        if (record.compressedOriginal) {
            j["textEncoding"] = TEXT_ENCODING_ZLIB;
            j["originalText"] = encodeCompressedField(*record.compressedOriginal);
            if (record.compressedSanitized) {
                j["sanitizedText"] = encodeCompressedField(*record.compressedSanitized);
            }
        } else {
            j["textEncoding"] = TEXT_ENCODING_PLAIN;
            if (record.originalText) j["originalText"] = *record.originalText;
            if (record.sanitizedText) j["sanitizedText"] = *record.sanitizedText;
        }
    } else {
        j["imageSize"] = record.imageSize;
        if (record.imageRef) {
            j["imageRef"] = {{"key", record.imageRef->key}, {"size", record.imageRef->size}};
        }
    }
    
    return j;
}

Result<ItemRecord> recordFromJson(const json& j) {
    try {
        ItemRecord record;
        record.id = j.at("id").get<std::string>();
        record.createdAt = fromMillis(j.at("createdAt").get<int64_t>());
        
        const std::string kind = j.at("kind").get<std::string>();
        if (kind == "text") {
            record.kind = Clipboard::ItemKind::Text;
        } else if (kind == "image") {
            record.kind = Clipboard::ItemKind::Image;
        } else {
            return ErrorCode::InvalidFieldType;
        }
        
        if (record.kind == Clipboard::ItemKind::Text) {
            record.textLength = j.value("textLength", size_t{0});
            record.sanitized = j.value("sanitized", false);
            
            auto digest = Crypto::fromHex(j.value("digest", std::string()));
            if (digest.isSuccess() && digest.value().size() == record.textDigest.size()) {
                std::copy(digest.value().begin(), digest.value().end(), record.textDigest.begin());
            }
            
            // Plain text may itself start with COMPRESSED:
            const std::string encoding = j.value("textEncoding", std::string(TEXT_ENCODING_PLAIN));
            if (encoding != TEXT_ENCODING_PLAIN && encoding != TEXT_ENCODING_ZLIB) {
                return ErrorCode::InvalidFieldType;
            }
            
            const std::string original = j.value("originalText", std::string());
            if (encoding == TEXT_ENCODING_ZLIB) {
                auto frame = decodeCompressedField(original);
                if (frame.isFailure()) {
                    return frame.error();
                }
                record.compressedOriginal = std::make_shared<const ByteBuffer>(std::move(frame.value()));
                
                if (j.contains("sanitizedText")) {
                    auto sanitized = decodeCompressedField(j.at("sanitizedText").get<std::string>());
                    if (sanitized.isFailure()) {
                        return sanitized.error();
                    }
                    record.compressedSanitized =
                        std::make_shared<const ByteBuffer>(std::move(sanitized.value()));
                }
            } else {
                if (j.contains("originalText")) record.originalText = original;
                if (j.contains("sanitizedText")) {
                    record.sanitizedText = j.at("sanitizedText").get<std::string>();
                }
            }
        } else {
            record.imageSize = j.value("imageSize", size_t{0});
            if (j.contains("imageRef")) {
                const auto& ref = j.at("imageRef");
                record.imageRef = BlobRef{ref.at("key").get<std::string>(),
                                          ref.at("size").get<uint64_t>()};
            }
        }
        
        return record;
    } catch (const json::exception&) {
        return ErrorCode::MissingField;
    }
}

} // anonymous namespace

// ============================================================================
// JournalItemStore::Impl
// ============================================================================

class JournalItemStore::Impl {
public:
    Impl(std::string path, Core::Logger& logger)
        : m_path(std::move(path))
        , m_logger(logger) {
    }
    
    Result<void> replay() {
        std::ifstream in(m_path);
        if (!in) {
            // First run: nothing to replay
            return openAppend();
        }
        
        std::string line;
        size_t lineNumber = 0;
        while (std::getline(in, line)) {
            ++lineNumber;
            if (line.empty()) {
                continue;
            }
            
            json entry = json::parse(line, nullptr, false);
            if (entry.is_discarded() || !entry.is_object()) {
                CLIPGUARD_LOG_WARNING_F(m_logger, "Journal %s: skipping unreadable line %zu",
                                        m_path.c_str(), lineNumber);
                continue;
            }
            
            const std::string op = entry.value("op", std::string());
            if (op == "put" && entry.contains("record")) {
                auto record = recordFromJson(entry["record"]);
                if (record.isFailure()) {
                    CLIPGUARD_LOG_WARNING_F(m_logger, "Journal %s: bad record on line %zu: %s",
                                            m_path.c_str(), lineNumber,
                                            getErrorMessage(record.error()).data());
                    continue;
                }
                m_records[record.value().id] = std::move(record.value());
            } else if (op == "delete" && entry.contains("id") && entry["id"].is_string()) {
                m_records.erase(entry["id"].get<std::string>());
            } else {
                CLIPGUARD_LOG_WARNING_F(m_logger, "Journal %s: unknown entry on line %zu",
                                        m_path.c_str(), lineNumber);
                continue;
            }
            ++m_entries;
        }
        
        CLIPGUARD_LOG_INFO_F(m_logger, "Journal %s: %zu live records from %zu entries",
                             m_path.c_str(), m_records.size(), m_entries);
        return openAppend();
    }
    
    Result<void> openAppend() {
        m_out.close();
        m_out.clear();
        m_out.open(m_path, std::ios::out | std::ios::app);
        if (!m_out) {
            return ErrorCode::FileWriteError;
        }
        return Result<void>::Success();
    }
    
    Result<void> append(const json& entry) {
        if (!m_out) {
            return ErrorCode::StoreWriteFailed;
        }
        m_out << entry.dump() << '\n';
        m_out.flush();
        if (!m_out) {
            return ErrorCode::StoreWriteFailed;
        }
        ++m_entries;
        return Result<void>::Success();
    }
    
    Result<void> put(const ItemRecord& record) {
        std::lock_guard<std::mutex> lock(m_mutex);
        json entry = {{"op", "put"}, {"record", recordToJson(record)}};
        CLIPGUARD_TRY(append(entry));
        m_records[record.id] = record;
        return Result<void>::Success();
    }
    
    Result<ItemRecord> get(const ItemId& id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(id);
        if (it == m_records.end()) {
            return ErrorCode::ItemNotFound;
        }
        return it->second;
    }
    
    Result<void> remove(const ItemId& id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_records.find(id) == m_records.end()) {
            return ErrorCode::ItemNotFound;
        }
        json entry = {{"op", "delete"}, {"id", id}};
        auto written = append(entry);
        if (written.isFailure()) {
            return ErrorCode::StoreDeleteFailed;
        }
        m_records.erase(id);
        return Result<void>::Success();
    }
    
    std::vector<ItemRecord> all() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<ItemRecord> records;
        records.reserve(m_records.size());
        for (const auto& [id, record] : m_records) {
            records.push_back(record);
        }
        return records;
    }
    
    Result<void> compact() {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        const std::string tmpPath = m_path + ".tmp";
        {
            std::ofstream tmp(tmpPath, std::ios::out | std::ios::trunc);
            if (!tmp) {
                return ErrorCode::StoreWriteFailed;
            }
            for (const auto& [id, record] : m_records) {
                json entry = {{"op", "put"}, {"record", recordToJson(record)}};
                tmp << entry.dump() << '\n';
            }
            tmp.flush();
            if (!tmp) {
                std::error_code ec;
                fs::remove(tmpPath, ec);
                return ErrorCode::StoreWriteFailed;
            }
        }
        
        m_out.close();
        std::error_code ec;
        fs::rename(tmpPath, m_path, ec);
        if (ec) {
            CLIPGUARD_LOG_ERROR_F(m_logger, "Journal %s: compaction rename failed: %s",
                                  m_path.c_str(), ec.message().c_str());
            fs::remove(tmpPath, ec);
            CLIPGUARD_TRY(openAppend());
            return ErrorCode::StoreWriteFailed;
        }
        
        size_t before = m_entries;
        m_entries = m_records.size();
        CLIPGUARD_LOG_DEBUG_F(m_logger, "Journal %s compacted: %zu -> %zu entries",
                              m_path.c_str(), before, m_entries);
        return openAppend();
    }
    
    size_t entries() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries;
    }

private:
    std::string m_path;
    Core::Logger& m_logger;
    mutable std::mutex m_mutex;
    std::map<ItemId, ItemRecord> m_records;
    std::ofstream m_out;
    size_t m_entries = 0;
};

// ============================================================================
// JournalItemStore - Public API
// ============================================================================

Result<std::unique_ptr<JournalItemStore>> JournalItemStore::open(const std::string& path,
                                                                 Core::Logger& logger) {
    if (path.empty()) {
        return ErrorCode::InvalidPath;
    }
    
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return ErrorCode::DirectoryNotFound;
        }
    }
    
    auto impl = std::make_unique<Impl>(path, logger);
    CLIPGUARD_TRY(impl->replay());
    return std::unique_ptr<JournalItemStore>(new JournalItemStore(std::move(impl)));
}

JournalItemStore::JournalItemStore(std::unique_ptr<Impl> impl)
    : m_impl(std::move(impl)) {
}

JournalItemStore::~JournalItemStore() = default;

Result<void> JournalItemStore::put(const ItemRecord& record) {
    return m_impl->put(record);
}

Result<ItemRecord> JournalItemStore::get(const ItemId& id) const {
    return m_impl->get(id);
}

Result<void> JournalItemStore::remove(const ItemId& id) {
    return m_impl->remove(id);
}

Result<std::vector<ItemRecord>> JournalItemStore::query(const ItemQuery& query) const {
    return applyQuery(m_impl->all(), query);
}

Result<size_t> JournalItemStore::count(const ItemQuery& query) const {
    auto records = m_impl->all();
    return static_cast<size_t>(std::count_if(records.begin(), records.end(),
        [&](const ItemRecord& r) { return matchesQuery(r, query); }));
}

Result<void> JournalItemStore::compact() {
    return m_impl->compact();
}

size_t JournalItemStore::journalEntries() const {
    return m_impl->entries();
}

} // namespace ClipGuard::Storage
