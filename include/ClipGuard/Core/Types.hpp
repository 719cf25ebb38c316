/**
 * @file Types.hpp
 * @brief Core type definitions for ClipGuard
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 * 
 * This file contains fundamental type definitions, constants, and aliases
 * used throughout the ClipGuard codebase. All components should include
 * this header for consistent type usage.
 */

#pragma once

#ifndef CLIPGUARD_CORE_TYPES_HPP
#define CLIPGUARD_CORE_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <span>
#include <optional>
#include <memory>
#include <functional>
#include <chrono>

namespace ClipGuard {

// ============================================================================
// Version Information
// ============================================================================

/// Major version number
constexpr uint32_t VERSION_MAJOR = 1;

/// Minor version number
constexpr uint32_t VERSION_MINOR = 0;

/// Patch version number
constexpr uint32_t VERSION_PATCH = 0;

/// Full version string
constexpr const char* VERSION_STRING = "1.0.0";

/// Application name written into exported documents
constexpr const char* APP_NAME = "ClipGuard";

// ============================================================================
// Fundamental Type Aliases
// ============================================================================

/// Byte type for raw buffers
using Byte = uint8_t;

/// Span of bytes (non-owning view)
using ByteSpan = std::span<const Byte>;

/// Mutable span of bytes
using MutableByteSpan = std::span<Byte>;

/// Owning byte buffer
using ByteBuffer = std::vector<Byte>;

/// Immutable byte buffer shared between the history and background workers
using SharedBytes = std::shared_ptr<const ByteBuffer>;

/// Clipboard item identifier (UUID string)
using ItemId = std::string;

// ============================================================================
// Time Types
// ============================================================================

/// High-resolution clock for performance measurements
using Clock = std::chrono::steady_clock;

/// Monotonic time point
using TimePoint = Clock::time_point;

/// Wall clock used for persisted timestamps
using WallClock = std::chrono::system_clock;

/// Persisted timestamp
using Timestamp = WallClock::time_point;

/// Duration in milliseconds
using Milliseconds = std::chrono::milliseconds;

/// Duration in seconds
using Seconds = std::chrono::seconds;

/// Duration in hours
using Hours = std::chrono::hours;

// ============================================================================
// Hash and Cryptographic Types
// ============================================================================

/// SHA-256 hash (32 bytes)
using SHA256Hash = std::array<Byte, 32>;

/// AES-256 key (32 bytes)
using AESKey = std::array<Byte, 32>;

/// AES IV/Nonce (12 bytes for GCM)
using AESNonce = std::array<Byte, 12>;

// ============================================================================
// Storage References
// ============================================================================

/**
 * @brief Durable handle to bytes held by a blob store
 */
struct BlobRef {
    std::string key;    ///< Store-specific key (the item id for file stores)
    uint64_t size = 0;  ///< Plaintext size in bytes

    bool operator==(const BlobRef&) const = default;
};

// ============================================================================
// Byte/String Helpers
// ============================================================================

/// View a string's storage as bytes
inline ByteSpan asBytes(std::string_view text) noexcept {
    return ByteSpan(reinterpret_cast<const Byte*>(text.data()), text.size());
}

/// Copy a byte span into a string
inline std::string toString(ByteSpan data) {
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

/**
 * @brief Count UTF-8 code points in a string
 * 
 * Continuation bytes (10xxxxxx) are not counted, so malformed input
 * still produces a bounded result.
 */
inline size_t utf8Length(std::string_view text) noexcept {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace ClipGuard

#endif // CLIPGUARD_CORE_TYPES_HPP
