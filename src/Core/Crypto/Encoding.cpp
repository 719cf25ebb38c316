/**
 * @file Encoding.cpp
 * @brief Hex/Base64 encoding and secure memory wiping
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Crypto.hpp>
#include <ClipGuard/Core/Crypto/OpenSSLRAII.hpp>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace ClipGuard::Crypto {

namespace {

bool isBase64Char(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/' || c == '=';
}

int hexCharToNibble(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string toBase64(ByteSpan data) {
    if (data.empty()) {
        return "";
    }
    
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new(BIO_s_mem());
    if (b64 == nullptr || bmem == nullptr) {
        if (b64 != nullptr) BIO_free(b64);
        if (bmem != nullptr) BIO_free(bmem);
        return "";
    }
    
    BIOChainPtr chain(BIO_push(b64, bmem));
    BIO_set_flags(chain, BIO_FLAGS_BASE64_NO_NL);
    
    if (BIO_write(chain, data.data(), static_cast<int>(data.size())) <= 0 ||
        BIO_flush(chain) != 1) {
        return "";
    }
    
    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(chain, &bptr);
    if (bptr == nullptr) {
        return "";
    }
    
    return std::string(bptr->data, bptr->length);
}

Result<ByteBuffer> fromBase64(const std::string& base64) {
    if (base64.empty()) {
        return ByteBuffer{};
    }
    
    // The BIO decoder silently skips garbage, so validate up front
    if (base64.size() % 4 != 0) {
        return ErrorCode::InvalidBase64;
    }
    for (char c : base64) {
        if (!isBase64Char(c)) {
            return ErrorCode::InvalidBase64;
        }
    }
    
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new_mem_buf(base64.data(), static_cast<int>(base64.length()));
    if (b64 == nullptr || bmem == nullptr) {
        if (b64 != nullptr) BIO_free(b64);
        if (bmem != nullptr) BIO_free(bmem);
        return ErrorCode::InternalError;
    }
    
    BIOChainPtr chain(BIO_push(b64, bmem));
    BIO_set_flags(chain, BIO_FLAGS_BASE64_NO_NL);
    
    ByteBuffer buffer(base64.length());
    int decodedLength = BIO_read(chain, buffer.data(), static_cast<int>(buffer.size()));
    if (decodedLength <= 0) {
        return ErrorCode::InvalidBase64;
    }
    
    buffer.resize(static_cast<size_t>(decodedLength));
    return buffer;
}

std::string toHex(ByteSpan data) {
    static const char hexChars[] = "0123456789abcdef";
    
    std::string result;
    result.reserve(data.size() * 2);
    for (Byte b : data) {
        result.push_back(hexChars[(b >> 4) & 0x0F]);
        result.push_back(hexChars[b & 0x0F]);
    }
    return result;
}

Result<ByteBuffer> fromHex(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        return ErrorCode::InvalidHexString;
    }
    
    ByteBuffer result;
    result.reserve(hex.length() / 2);
    
    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = hexCharToNibble(hex[i]);
        int low = hexCharToNibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            return ErrorCode::InvalidHexString;
        }
        result.push_back(static_cast<Byte>((high << 4) | low));
    }
    
    return result;
}

void secureZero(void* data, size_t size) noexcept {
    if (data != nullptr && size > 0) {
        OPENSSL_cleanse(data, size);
    }
}

} // namespace ClipGuard::Crypto
