/**
 * @file OpenSSLRAII.hpp
 * @brief RAII wrappers for OpenSSL contexts
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 * 
 * Owns OpenSSL contexts so they are released on every exit path of the
 * hashing, cipher and encoding code.
 * 
 * @code
 * EVPMDCtxPtr ctx(EVP_MD_CTX_new());
 * if (!ctx) {
 *     return ErrorCode::CryptoError;
 * }
 * EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
 * @endcode
 */

#pragma once

#ifndef CLIPGUARD_CRYPTO_OPENSSL_RAII_HPP
#define CLIPGUARD_CRYPTO_OPENSSL_RAII_HPP

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <utility>

namespace ClipGuard::Crypto {

// ============================================================================
// Generic RAII Wrapper Template
// ============================================================================

/**
 * @brief Unique owner of an OpenSSL object
 * 
 * @tparam T OpenSSL object type (e.g., EVP_CIPHER_CTX)
 * @tparam Deleter OpenSSL free function
 */
template<typename T, void (*Deleter)(T*)>
class OpenSSLRAII {
public:
    explicit OpenSSLRAII(T* ptr = nullptr) noexcept
        : m_ptr(ptr) {
    }
    
    ~OpenSSLRAII() noexcept {
        reset();
    }
    
    OpenSSLRAII(const OpenSSLRAII&) = delete;
    OpenSSLRAII& operator=(const OpenSSLRAII&) = delete;
    
    OpenSSLRAII(OpenSSLRAII&& other) noexcept
        : m_ptr(other.m_ptr) {
        other.m_ptr = nullptr;
    }
    
    OpenSSLRAII& operator=(OpenSSLRAII&& other) noexcept {
        if (this != &other) {
            reset();
            m_ptr = other.m_ptr;
            other.m_ptr = nullptr;
        }
        return *this;
    }
    
    /// Free the held object and take ownership of @p ptr
    void reset(T* ptr = nullptr) noexcept {
        if (m_ptr != nullptr) {
            Deleter(m_ptr);
        }
        m_ptr = ptr;
    }
    
    [[nodiscard]] T* release() noexcept {
        T* ptr = m_ptr;
        m_ptr = nullptr;
        return ptr;
    }
    
    [[nodiscard]] T* get() const noexcept {
        return m_ptr;
    }
    
    [[nodiscard]] explicit operator bool() const noexcept {
        return m_ptr != nullptr;
    }
    
    /// Implicit conversion for OpenSSL API calls
    operator T*() const noexcept {
        return m_ptr;
    }

private:
    T* m_ptr;
};

// ============================================================================
// Specialized Wrappers
// ============================================================================

/// Symmetric cipher context (blob encryption)
using EVPCipherCtxPtr = OpenSSLRAII<EVP_CIPHER_CTX, EVP_CIPHER_CTX_free>;

/// Message digest context (obfuscation digests)
using EVPMDCtxPtr = OpenSSLRAII<EVP_MD_CTX, EVP_MD_CTX_free>;

/// BIO chain (base64 filters); frees the whole chain
using BIOChainPtr = OpenSSLRAII<BIO, BIO_free_all>;

} // namespace ClipGuard::Crypto

#endif // CLIPGUARD_CRYPTO_OPENSSL_RAII_HPP
