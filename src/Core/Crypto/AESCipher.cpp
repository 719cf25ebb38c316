/**
 * @file AESCipher.cpp
 * @brief AES-256-GCM authenticated encryption for blobs at rest
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 * 
 * Output layout: nonce (12 bytes) || ciphertext || tag (16 bytes).
 * A fresh random nonce is drawn for every call to encrypt().
 * Keys are per-process; they are never persisted by the blob store.
 */

#include <ClipGuard/Core/Crypto.hpp>
#include <ClipGuard/Core/Crypto/OpenSSLRAII.hpp>
#include <openssl/evp.h>
#include <algorithm>

namespace ClipGuard::Crypto {

namespace {

constexpr size_t NONCE_SIZE = 12;
constexpr size_t TAG_SIZE = 16;

} // anonymous namespace

// ============================================================================
// AESCipher::Impl
// ============================================================================

class AESCipher::Impl {
public:
    explicit Impl(const AESKey& key)
        : m_key(key) {
    }
    
    ~Impl() {
        secureZero(m_key.data(), m_key.size());
    }
    
    Result<ByteBuffer> encrypt(ByteSpan plaintext, ByteSpan aad) {
        auto nonceResult = m_random.generateNonce();
        if (nonceResult.isFailure()) {
            return nonceResult.error();
        }
        const AESNonce& nonce = nonceResult.value();
        
        EVPCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return ErrorCode::EncryptionFailed;
        }
        
        if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx, nullptr, nullptr, m_key.data(), nonce.data()) != 1) {
            return ErrorCode::EncryptionFailed;
        }
        
        int len = 0;
        if (!aad.empty() &&
            EVP_EncryptUpdate(ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
            return ErrorCode::EncryptionFailed;
        }
        
        ByteBuffer output(NONCE_SIZE + plaintext.size() + TAG_SIZE);
        std::copy(nonce.begin(), nonce.end(), output.begin());
        Byte* cipherOut = output.data() + NONCE_SIZE;
        
        int cipherLen = 0;
        if (!plaintext.empty()) {
            if (EVP_EncryptUpdate(ctx, cipherOut, &len, plaintext.data(),
                                  static_cast<int>(plaintext.size())) != 1) {
                return ErrorCode::EncryptionFailed;
            }
            cipherLen = len;
        }
        
        if (EVP_EncryptFinal_ex(ctx, cipherOut + cipherLen, &len) != 1) {
            return ErrorCode::EncryptionFailed;
        }
        cipherLen += len;
        
        Byte* tagOut = output.data() + NONCE_SIZE + static_cast<size_t>(cipherLen);
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tagOut) != 1) {
            return ErrorCode::EncryptionFailed;
        }
        
        output.resize(NONCE_SIZE + static_cast<size_t>(cipherLen) + TAG_SIZE);
        return output;
    }
    
    Result<ByteBuffer> decrypt(ByteSpan input, ByteSpan aad) {
        if (input.size() < NONCE_SIZE + TAG_SIZE) {
            return ErrorCode::DecryptionFailed;
        }
        
        ByteSpan nonce = input.subspan(0, NONCE_SIZE);
        ByteSpan ciphertext = input.subspan(NONCE_SIZE, input.size() - NONCE_SIZE - TAG_SIZE);
        ByteSpan tag = input.subspan(input.size() - TAG_SIZE);
        
        EVPCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return ErrorCode::DecryptionFailed;
        }
        
        if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx, nullptr, nullptr, m_key.data(), nonce.data()) != 1) {
            return ErrorCode::DecryptionFailed;
        }
        
        int len = 0;
        if (!aad.empty() &&
            EVP_DecryptUpdate(ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
            return ErrorCode::DecryptionFailed;
        }
        
        ByteBuffer plaintext(ciphertext.size());
        int plainLen = 0;
        if (!ciphertext.empty()) {
            if (EVP_DecryptUpdate(ctx, plaintext.data(), &len, ciphertext.data(),
                                  static_cast<int>(ciphertext.size())) != 1) {
                secureZero(plaintext.data(), plaintext.size());
                return ErrorCode::DecryptionFailed;
            }
            plainLen = len;
        }
        
        // Tag must be set before the final call
        ByteBuffer tagCopy(tag.begin(), tag.end());
        if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE),
                                tagCopy.data()) != 1) {
            secureZero(plaintext.data(), plaintext.size());
            return ErrorCode::DecryptionFailed;
        }
        
        if (EVP_DecryptFinal_ex(ctx, plaintext.data() + plainLen, &len) != 1) {
            secureZero(plaintext.data(), plaintext.size());
            return ErrorCode::DecryptionFailed;
        }
        plainLen += len;
        
        plaintext.resize(static_cast<size_t>(plainLen));
        return plaintext;
    }

private:
    AESKey m_key;
    SecureRandom m_random;
};

// ============================================================================
// AESCipher - Public API
// ============================================================================

AESCipher::AESCipher(const AESKey& key)
    : m_impl(std::make_unique<Impl>(key)) {
}

AESCipher::~AESCipher() = default;

Result<ByteBuffer> AESCipher::encrypt(ByteSpan plaintext, ByteSpan associatedData) {
    return m_impl->encrypt(plaintext, associatedData);
}

Result<ByteBuffer> AESCipher::decrypt(ByteSpan ciphertext, ByteSpan associatedData) {
    return m_impl->decrypt(ciphertext, associatedData);
}

} // namespace ClipGuard::Crypto
