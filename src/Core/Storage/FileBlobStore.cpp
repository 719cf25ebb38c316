/**
 * @file FileBlobStore.cpp
 * @brief File-per-blob store with optional encryption and secure delete
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Storage.hpp>
#include <ClipGuard/Core/Crypto.hpp>
#include <filesystem>
#include <fstream>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ClipGuard::Storage {

namespace {

constexpr const char* BLOB_EXTENSION = ".bin";
constexpr const char* TEMP_SUFFIX = ".tmp";
constexpr const char* KEY_FILE_NAME = "blob.key";

Result<ByteBuffer> readWholeFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return ErrorCode::BlobNotFound;
    }
    
    ByteBuffer data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return ErrorCode::StoreReadFailed;
    }
    return data;
}

Result<void> writeWholeFile(const fs::path& path, ByteSpan data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return ErrorCode::StoreWriteFailed;
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
        return ErrorCode::StoreWriteFailed;
    }
    return Result<void>::Success();
}

enum class KeyFileState {
    Loaded,
    Missing
};

Result<KeyFileState> readKeyFile(const fs::path& path, AESKey& key) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            return KeyFileState::Missing;
        }
        return ErrorCode::FileAccessDenied;
    }
    
    struct stat st;
    if (::fstat(fd, &st) < 0) {
        ::close(fd);
        return ErrorCode::FileReadError;
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        return ErrorCode::InvalidPath;
    }
    // Owner-only, and owned by this user
    if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0 || st.st_uid != ::geteuid()) {
        ::close(fd);
        return ErrorCode::FileAccessDenied;
    }
    if (static_cast<size_t>(st.st_size) != key.size()) {
        ::close(fd);
        return ErrorCode::InvalidKey;
    }
    
    size_t total = 0;
    while (total < key.size()) {
        ssize_t n = ::read(fd, key.data() + total, key.size() - total);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            ::close(fd);
            Crypto::secureZero(key.data(), key.size());
            return ErrorCode::FileReadError;
        }
        total += static_cast<size_t>(n);
    }
    ::close(fd);
    return KeyFileState::Loaded;
}

Result<void> createKeyFile(const fs::path& path, const AESKey& key) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
    if (fd < 0) {
        return errno == EEXIST ? ErrorCode::FileAlreadyExists : ErrorCode::FileAccessDenied;
    }
    
    size_t total = 0;
    while (total < key.size()) {
        ssize_t n = ::write(fd, key.data() + total, key.size() - total);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            ::close(fd);
            ::unlink(path.c_str());
            return ErrorCode::FileWriteError;
        }
        total += static_cast<size_t>(n);
    }
    if (::fsync(fd) < 0) {
        ::close(fd);
        ::unlink(path.c_str());
        return ErrorCode::FileWriteError;
    }
    ::close(fd);
    return Result<void>::Success();
}

} // anonymous namespace

bool isValidBlobKey(const std::string& key) noexcept {
    if (key.empty() || key.size() > 128) {
        return false;
    }
    for (char c : key) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// FileBlobStore::Impl
// ============================================================================

class FileBlobStore::Impl {
public:
    Impl(const Options& options, Core::Logger& logger)
        : m_directory(options.directory)
        , m_secureDelete(options.secureDelete)
        , m_logger(logger) {
    }
    
    Result<void> initialize(const Options& options) {
        std::error_code ec;
        fs::create_directories(m_directory, ec);
        if (ec || !fs::is_directory(m_directory, ec)) {
            CLIPGUARD_LOG_ERROR_F(m_logger, "Blob directory %s unavailable: %s",
                                  m_directory.c_str(), ec.message().c_str());
            return ErrorCode::DirectoryNotFound;
        }
        
        if (options.encrypt) {
            AESKey key{};
            if (options.key) {
                key = *options.key;
            } else {
                fs::path keyPath = options.keyFile.empty()
                    ? m_directory / KEY_FILE_NAME
                    : fs::path(options.keyFile);
                auto loaded = loadOrCreateKey(keyPath, key);
                if (loaded.isFailure()) {
                    CLIPGUARD_LOG_ERROR_F(m_logger, "Blob key %s unusable: %s",
                                          keyPath.c_str(), getErrorMessage(loaded.error()).data());
                    return loaded.error();
                }
            }
            m_cipher = std::make_unique<Crypto::AESCipher>(key);
            Crypto::secureZero(key.data(), key.size());
        }
        
        return Result<void>::Success();
    }
    
    fs::path pathFor(const std::string& key) const {
        return m_directory / (key + BLOB_EXTENSION);
    }
    
    Result<BlobRef> save(const std::string& key, ByteSpan data) {
        if (!isValidBlobKey(key)) {
            return ErrorCode::InvalidArgument;
        }
        
        ByteBuffer sealed;
        ByteSpan payload = data;
        if (m_cipher) {
            auto encrypted = m_cipher->encrypt(data, asBytes(key));
            if (encrypted.isFailure()) {
                return ErrorCode::StoreWriteFailed;
            }
            sealed = std::move(encrypted.value());
            payload = sealed;
        }
        
        fs::path finalPath = pathFor(key);
        fs::path tmpPath = finalPath;
        tmpPath += TEMP_SUFFIX;
        
        auto written = writeWholeFile(tmpPath, payload);
        if (written.isFailure()) {
            std::error_code ec;
            fs::remove(tmpPath, ec);
            CLIPGUARD_LOG_WARNING_F(m_logger, "Blob %s: write failed", key.c_str());
            return written.error();
        }
        
        std::error_code ec;
        fs::rename(tmpPath, finalPath, ec);
        if (ec) {
            fs::remove(tmpPath, ec);
            CLIPGUARD_LOG_WARNING_F(m_logger, "Blob %s: rename failed", key.c_str());
            return ErrorCode::StoreWriteFailed;
        }
        
        return BlobRef{key, data.size()};
    }
    
    Result<ByteBuffer> load(const BlobRef& ref) {
        if (!isValidBlobKey(ref.key)) {
            return ErrorCode::InvalidArgument;
        }
        
        auto raw = readWholeFile(pathFor(ref.key));
        if (raw.isFailure()) {
            return raw.error();
        }
        
        if (!m_cipher) {
            return raw;
        }
        
        auto plain = m_cipher->decrypt(raw.value(), asBytes(ref.key));
        if (plain.isFailure()) {
            CLIPGUARD_LOG_WARNING_F(m_logger, "Blob %s: authentication failed", ref.key.c_str());
            return ErrorCode::StoreCorrupted;
        }
        return plain;
    }
    
    Result<void> remove(const std::string& key) {
        if (!isValidBlobKey(key)) {
            return ErrorCode::InvalidArgument;
        }
        
        fs::path path = pathFor(key);
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Result<void>::Success();
        }
        
        if (m_secureDelete) {
            overwrite(path);
        }
        
        if (!fs::remove(path, ec) && ec) {
            return ErrorCode::StoreDeleteFailed;
        }
        return Result<void>::Success();
    }
    
    Result<std::vector<std::string>> list() {
        std::vector<std::string> keys;
        std::error_code ec;
        fs::directory_iterator it(m_directory, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            const fs::path& path = it->path();
            if (path.extension() == BLOB_EXTENSION && it->is_regular_file(ec)) {
                keys.push_back(path.stem().string());
            }
        }
        if (ec) {
            return ErrorCode::StoreReadFailed;
        }
        return keys;
    }

private:
    Result<void> loadOrCreateKey(const fs::path& path, AESKey& key) {
        // Second pass covers a key file created by a concurrent open
        for (int attempt = 0; attempt < 2; ++attempt) {
            KeyFileState state = KeyFileState::Missing;
            CLIPGUARD_TRY_ASSIGN(state, readKeyFile(path, key));
            if (state == KeyFileState::Loaded) {
                return Result<void>::Success();
            }
            
            Crypto::SecureRandom random;
            CLIPGUARD_TRY_ASSIGN(key, random.generateAESKey());
            auto created = createKeyFile(path, key);
            if (created.isSuccess()) {
                CLIPGUARD_LOG_INFO_F(m_logger, "Created blob key %s", path.c_str());
                return created;
            }
            Crypto::secureZero(key.data(), key.size());
            if (created.error() != ErrorCode::FileAlreadyExists) {
                return created;
            }
        }
        return ErrorCode::FileAccessDenied;
    }
    
    void overwrite(const fs::path& path) {
        std::error_code ec;
        auto size = fs::file_size(path, ec);
        if (ec || size == 0) {
            return;
        }
        
        Crypto::SecureRandom random;
        auto noise = random.generate(static_cast<size_t>(size));
        if (noise.isFailure()) {
            CLIPGUARD_LOG_WARNING_F(m_logger, "Secure delete of %s: no random data, unlinking only",
                                    path.c_str());
            return;
        }
        
        std::fstream out(path, std::ios::binary | std::ios::in | std::ios::out);
        out.write(reinterpret_cast<const char*>(noise.value().data()),
                  static_cast<std::streamsize>(noise.value().size()));
        out.flush();
        if (!out) {
            CLIPGUARD_LOG_WARNING_F(m_logger, "Secure delete of %s: overwrite failed", path.c_str());
        }
    }
    
    fs::path m_directory;
    bool m_secureDelete;
    Core::Logger& m_logger;
    std::unique_ptr<Crypto::AESCipher> m_cipher;
};

// ============================================================================
// FileBlobStore - Public API
// ============================================================================

Result<std::unique_ptr<FileBlobStore>> FileBlobStore::open(const Options& options,
                                                           Core::Logger& logger) {
    if (options.directory.empty()) {
        return ErrorCode::InvalidPath;
    }
    
    auto impl = std::make_unique<Impl>(options, logger);
    CLIPGUARD_TRY(impl->initialize(options));
    return std::unique_ptr<FileBlobStore>(new FileBlobStore(std::move(impl)));
}

FileBlobStore::FileBlobStore(std::unique_ptr<Impl> impl)
    : m_impl(std::move(impl)) {
}

FileBlobStore::~FileBlobStore() = default;

Result<BlobRef> FileBlobStore::save(const std::string& key, ByteSpan data) {
    return m_impl->save(key, data);
}

Result<ByteBuffer> FileBlobStore::load(const BlobRef& ref) {
    return m_impl->load(ref);
}

Result<void> FileBlobStore::remove(const std::string& key) {
    return m_impl->remove(key);
}

Result<std::vector<std::string>> FileBlobStore::list() {
    return m_impl->list();
}

std::string FileBlobStore::pathFor(const std::string& key) const {
    return m_impl->pathFor(key).string();
}

} // namespace ClipGuard::Storage
