/**
 * @file Compression.hpp
 * @brief Lossless zlib compression with a self-describing header
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 * 
 * Frame layout:
 * | Offset | Size | Field                          |
 * |--------|------|--------------------------------|
 * | 0      | 4    | Magic "CGZ1"                   |
 * | 4      | 8    | Original size (little endian)  |
 * | 12     | n    | zlib stream                    |
 * 
 * Decompression checks both the stream end and the recorded size, so a
 * truncated or corrupted frame fails with DecompressionFailed instead of
 * returning a shortened buffer.
 */

#pragma once

#ifndef CLIPGUARD_CORE_COMPRESSION_HPP
#define CLIPGUARD_CORE_COMPRESSION_HPP

#include <ClipGuard/Core/Types.hpp>
#include <ClipGuard/Core/ErrorCodes.hpp>
#include <string>
#include <string_view>

namespace ClipGuard::Compression {

/// Frame header size (magic + original size)
constexpr size_t FRAME_HEADER_SIZE = 12;

/// Largest payload a frame may declare
constexpr uint64_t MAX_FRAME_PAYLOAD = 1ULL << 31;

/**
 * @brief Stateless zlib compressor for text and image fallback copies
 */
class TextCompressor {
public:
    /**
     * @param level zlib level 1..9, or -1 for the library default
     */
    explicit TextCompressor(int level = -1) noexcept;
    
    [[nodiscard]] Result<ByteBuffer> compress(ByteSpan data) const;
    
    [[nodiscard]] Result<ByteBuffer> decompress(ByteSpan frame) const;
    
    [[nodiscard]] Result<ByteBuffer> compressText(std::string_view text) const;
    
    [[nodiscard]] Result<std::string> decompressText(ByteSpan frame) const;
    
    /// True when @p data starts with a frame header
    [[nodiscard]] static bool isFrame(ByteSpan data) noexcept;
    
    /// Original size recorded in a frame header
    [[nodiscard]] static Result<uint64_t> originalSize(ByteSpan frame) noexcept;

private:
    int m_level;
};

} // namespace ClipGuard::Compression

#endif // CLIPGUARD_CORE_COMPRESSION_HPP
