/**
 * @file Crypto.hpp
 * @brief Cryptographic utilities for ClipGuard
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 * 
 * This module provides:
 * - SHA-256 digests for obfuscation markers
 * - Secure random bytes, keys and item identifiers
 * - AES-256-GCM at-rest protection for stored image blobs
 * - Hex and base64 encoding
 */

#pragma once

#ifndef CLIPGUARD_CORE_CRYPTO_HPP
#define CLIPGUARD_CORE_CRYPTO_HPP

#include <ClipGuard/Core/Types.hpp>
#include <ClipGuard/Core/ErrorCodes.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace ClipGuard::Crypto {

// ============================================================================
// Secure Random Number Generator
// ============================================================================

/**
 * @brief Cryptographically secure random number generator
 * 
 * Uses OpenSSL RAND_bytes.
 */
class SecureRandom {
public:
    SecureRandom();
    ~SecureRandom();
    
    /**
     * @brief Fill a buffer with random bytes
     * @param buffer Buffer to fill
     * @param size Number of bytes to generate
     * @return Result indicating success or failure
     */
    Result<void> generate(Byte* buffer, size_t size);
    
    /**
     * @brief Generate random byte buffer
     * @param size Number of bytes to generate
     * @return Random bytes or error
     */
    Result<ByteBuffer> generate(size_t size);
    
    /**
     * @brief Generate random AES-256 key
     */
    Result<AESKey> generateAESKey();
    
    /**
     * @brief Generate random 12-byte GCM nonce
     */
    Result<AESNonce> generateNonce();
    
    /**
     * @brief Generate an RFC 4122 version 4 UUID string
     * @return Lower-case "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx" or error
     */
    Result<std::string> generateUuid();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Hash Engine
// ============================================================================

/**
 * @brief Hash algorithm types
 */
enum class HashAlgorithm {
    SHA256,
    SHA512
};

/**
 * @brief Cryptographic hash engine
 * 
 * Provides one-shot and streaming hash computation.
 * 
 * @example
 * ```cpp
 * HashEngine hasher(HashAlgorithm::SHA256);
 * 
 * // One-shot
 * auto digest = hasher.hash(data);
 * 
 * // Streaming
 * hasher.init();
 * hasher.update(chunk1);
 * hasher.update(chunk2);
 * auto digest = hasher.finalize();
 * ```
 */
class HashEngine {
public:
    explicit HashEngine(HashAlgorithm algorithm = HashAlgorithm::SHA256);
    ~HashEngine();
    
    HashEngine(const HashEngine&) = delete;
    HashEngine& operator=(const HashEngine&) = delete;
    
    /**
     * @brief Compute hash of data (one-shot)
     */
    Result<ByteBuffer> hash(ByteSpan data);
    
    /**
     * @brief Compute hash of a string's bytes (one-shot)
     */
    Result<ByteBuffer> hash(std::string_view text);
    
    /**
     * @brief Compute SHA-256 hash (static helper)
     */
    static Result<SHA256Hash> sha256(ByteSpan data);
    
    Result<void> init();
    Result<void> update(ByteSpan data);
    Result<ByteBuffer> finalize();
    
    /**
     * @brief Get hash output size for algorithm
     */
    static size_t getHashSize(HashAlgorithm algorithm) noexcept;
    
    HashAlgorithm getAlgorithm() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// AES Cipher
// ============================================================================

/**
 * @brief AES-256-GCM cipher for at-rest blob protection
 * 
 * Every call to encrypt() draws a fresh random nonce and prepends it to
 * the output: nonce (12) + ciphertext + tag (16). decrypt() verifies the
 * tag and returns DecryptionFailed on any mismatch.
 */
class AESCipher {
public:
    /**
     * @brief Construct cipher with key
     * @param key AES-256 key (32 bytes)
     */
    explicit AESCipher(const AESKey& key);
    
    ~AESCipher();
    
    AESCipher(const AESCipher&) = delete;
    AESCipher& operator=(const AESCipher&) = delete;
    
    /**
     * @brief Encrypt data
     * @param plaintext Data to encrypt
     * @param associatedData Additional authenticated data (optional)
     * @return nonce + ciphertext + tag, or error
     */
    Result<ByteBuffer> encrypt(ByteSpan plaintext, ByteSpan associatedData = {});
    
    /**
     * @brief Decrypt data produced by encrypt()
     * @param ciphertext nonce + ciphertext + tag
     * @param associatedData Additional authenticated data (optional)
     * @return Plaintext or error
     */
    Result<ByteBuffer> decrypt(ByteSpan ciphertext, ByteSpan associatedData = {});

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Convert bytes to lower-case hex string
 */
std::string toHex(ByteSpan data);

/**
 * @brief Convert hex string to bytes
 */
Result<ByteBuffer> fromHex(const std::string& hex);

/**
 * @brief Convert bytes to base64 string (no line breaks)
 */
std::string toBase64(ByteSpan data);

/**
 * @brief Convert base64 string to bytes
 */
Result<ByteBuffer> fromBase64(const std::string& base64);

/**
 * @brief Securely zero memory
 * @param data Memory to zero
 * @param size Size of memory
 */
void secureZero(void* data, size_t size) noexcept;

} // namespace ClipGuard::Crypto

#endif // CLIPGUARD_CORE_CRYPTO_HPP
