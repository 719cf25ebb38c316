/**
 * @file HashEngine.cpp
 * @brief Hash engine implementation using the OpenSSL EVP API
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Crypto.hpp>
#include <ClipGuard/Core/Crypto/OpenSSLRAII.hpp>
#include <openssl/evp.h>
#include <algorithm>

namespace ClipGuard::Crypto {

// ============================================================================
// HashEngine::Impl - OpenSSL EVP implementation
// ============================================================================

class HashEngine::Impl {
public:
    explicit Impl(HashAlgorithm algorithm)
        : m_algorithm(algorithm)
        , m_ctx(EVP_MD_CTX_new())
        , m_md(algorithm == HashAlgorithm::SHA512 ? EVP_sha512() : EVP_sha256())
        , m_active(false)
    {
    }
    
    Result<void> init() {
        if (!m_ctx || m_md == nullptr) {
            return ErrorCode::HashFailed;
        }
        
        if (EVP_DigestInit_ex(m_ctx, m_md, nullptr) != 1) {
            return ErrorCode::HashFailed;
        }
        
        m_active = true;
        return Result<void>::Success();
    }
    
    Result<void> update(ByteSpan data) {
        if (!m_active) {
            return ErrorCode::InvalidState;
        }
        
        if (data.empty()) {
            return Result<void>::Success();
        }
        
        if (EVP_DigestUpdate(m_ctx, data.data(), data.size()) != 1) {
            return ErrorCode::HashFailed;
        }
        
        return Result<void>::Success();
    }
    
    Result<ByteBuffer> finalize() {
        if (!m_active) {
            return ErrorCode::InvalidState;
        }
        
        ByteBuffer digest(static_cast<size_t>(EVP_MD_size(m_md)));
        unsigned int len = 0;
        
        m_active = false;
        if (EVP_DigestFinal_ex(m_ctx, digest.data(), &len) != 1 || len != digest.size()) {
            return ErrorCode::HashFailed;
        }
        
        return digest;
    }
    
    Result<ByteBuffer> hash(ByteSpan data) {
        CLIPGUARD_TRY(init());
        CLIPGUARD_TRY(update(data));
        return finalize();
    }
    
    HashAlgorithm getAlgorithm() const noexcept {
        return m_algorithm;
    }
    
private:
    HashAlgorithm m_algorithm;
    EVPMDCtxPtr m_ctx;
    const EVP_MD* m_md;
    bool m_active;
};

// ============================================================================
// HashEngine - Public API
// ============================================================================

HashEngine::HashEngine(HashAlgorithm algorithm)
    : m_impl(std::make_unique<Impl>(algorithm)) {
}

HashEngine::~HashEngine() = default;

Result<ByteBuffer> HashEngine::hash(ByteSpan data) {
    return m_impl->hash(data);
}

Result<ByteBuffer> HashEngine::hash(std::string_view text) {
    return m_impl->hash(asBytes(text));
}

Result<SHA256Hash> HashEngine::sha256(ByteSpan data) {
    HashEngine engine(HashAlgorithm::SHA256);
    auto result = engine.hash(data);
    if (result.isFailure()) {
        return result.error();
    }
    
    const auto& digest = result.value();
    if (digest.size() != 32) {
        return ErrorCode::HashFailed;
    }
    
    SHA256Hash hash;
    std::copy(digest.begin(), digest.end(), hash.begin());
    return hash;
}

Result<void> HashEngine::init() {
    return m_impl->init();
}

Result<void> HashEngine::update(ByteSpan data) {
    return m_impl->update(data);
}

Result<ByteBuffer> HashEngine::finalize() {
    return m_impl->finalize();
}

size_t HashEngine::getHashSize(HashAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case HashAlgorithm::SHA256: return 32;
        case HashAlgorithm::SHA512: return 64;
    }
    return 0;
}

HashAlgorithm HashEngine::getAlgorithm() const noexcept {
    return m_impl->getAlgorithm();
}

} // namespace ClipGuard::Crypto
