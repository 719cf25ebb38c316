/**
 * @file SecureRandom.cpp
 * @brief Secure random generation backed by OpenSSL RAND_bytes
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Crypto.hpp>
#include <openssl/rand.h>
#include <climits>

namespace ClipGuard::Crypto {

class SecureRandom::Impl {
public:
    Result<void> generate(Byte* buffer, size_t size) {
        if (buffer == nullptr && size > 0) {
            return ErrorCode::InvalidArgument;
        }
        
        // RAND_bytes takes an int length
        while (size > 0) {
            int chunk = size > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(size);
            if (RAND_bytes(buffer, chunk) != 1) {
                return ErrorCode::RandomGenerationFailed;
            }
            buffer += chunk;
            size -= static_cast<size_t>(chunk);
        }
        
        return Result<void>::Success();
    }
};

SecureRandom::SecureRandom()
    : m_impl(std::make_unique<Impl>()) {
}

SecureRandom::~SecureRandom() = default;

Result<void> SecureRandom::generate(Byte* buffer, size_t size) {
    return m_impl->generate(buffer, size);
}

Result<ByteBuffer> SecureRandom::generate(size_t size) {
    ByteBuffer buffer(size);
    auto result = m_impl->generate(buffer.data(), size);
    if (result.isFailure()) {
        return result.error();
    }
    return buffer;
}

Result<AESKey> SecureRandom::generateAESKey() {
    AESKey key;
    auto result = m_impl->generate(key.data(), key.size());
    if (result.isFailure()) {
        return result.error();
    }
    return key;
}

Result<AESNonce> SecureRandom::generateNonce() {
    AESNonce nonce;
    auto result = m_impl->generate(nonce.data(), nonce.size());
    if (result.isFailure()) {
        return result.error();
    }
    return nonce;
}

Result<std::string> SecureRandom::generateUuid() {
    std::array<Byte, 16> raw;
    auto result = m_impl->generate(raw.data(), raw.size());
    if (result.isFailure()) {
        return result.error();
    }
    
    raw[6] = static_cast<Byte>((raw[6] & 0x0F) | 0x40);  // version 4
    raw[8] = static_cast<Byte>((raw[8] & 0x3F) | 0x80);  // RFC 4122 variant
    
    std::string hex = toHex(ByteSpan(raw.data(), raw.size()));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace ClipGuard::Crypto
