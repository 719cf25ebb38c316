// tests/TestHarness.cpp

#include "TestHarness.hpp"
#include <ClipGuard/Core/Crypto.hpp>
#include <filesystem>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;

namespace ClipGuard::Testing {

ByteBuffer randomBytes(size_t size) {
    Crypto::SecureRandom rng;
    auto result = rng.generate(size);
    if (result.isFailure()) {
        // Fall back to insecure random for testing
        ByteBuffer data(size);
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 255);
        for (auto& b : data) {
            b = static_cast<uint8_t>(dis(gen));
        }
        return data;
    }
    return result.value();
}

std::string randomString(size_t length) {
    static const char charset[] =
        "abcdefghijklmnopqrstuvwxyz"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "0123456789";

    std::string result;
    result.reserve(length);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);

    for (size_t i = 0; i < length; i++) {
        result += charset[dis(gen)];
    }

    return result;
}

ByteBuffer makePixels(size_t size, uint8_t seed) {
    ByteBuffer pixels(size);
    for (size_t i = 0; i < size; i++) {
        pixels[i] = static_cast<uint8_t>((i * 31 + seed) & 0xFF);
    }
    return pixels;
}

// TempDirectory
TempDirectory::TempDirectory() {
    fs::path base = fs::temp_directory_path() / ("clipguard_test_" + randomString(12));
    fs::create_directories(base);
    m_path = base.string();
}

TempDirectory::~TempDirectory() {
    std::error_code ec;
    fs::remove_all(m_path, ec);
}

std::string TempDirectory::file(const std::string& name) const {
    return (fs::path(m_path) / name).string();
}

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

bool waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// FailingItemStore
Result<void> FailingItemStore::put(const Storage::ItemRecord&) {
    ++failedPuts;
    return ErrorCode::StoreWriteFailed;
}

// FailingBlobStore
Result<BlobRef> FailingBlobStore::save(const std::string&, ByteSpan) {
    return ErrorCode::StoreWriteFailed;
}

// GatedBlobStore
Result<BlobRef> GatedBlobStore::save(const std::string& key, ByteSpan data) {
    {
        std::unique_lock<std::mutex> lock(m_gateMutex);
        ++m_waiting;
        m_gateCv.wait(lock, [this] { return m_open; });
        --m_waiting;
    }
    return InMemoryBlobStore::save(key, data);
}

void GatedBlobStore::open() {
    {
        std::lock_guard<std::mutex> lock(m_gateMutex);
        m_open = true;
    }
    m_gateCv.notify_all();
}

size_t GatedBlobStore::waiting() const {
    std::lock_guard<std::mutex> lock(m_gateMutex);
    return m_waiting;
}

} // namespace ClipGuard::Testing
