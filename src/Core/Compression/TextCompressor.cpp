/**
 * @file TextCompressor.cpp
 * @brief zlib-backed frame compression
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Compression.hpp>
#include <zlib.h>
#include <algorithm>
#include <climits>
#include <cstring>

namespace ClipGuard::Compression {

namespace {

constexpr Byte FRAME_MAGIC[4] = {'C', 'G', 'Z', '1'};

void writeSize(Byte* out, uint64_t size) noexcept {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<Byte>((size >> (8 * i)) & 0xFF);
    }
}

uint64_t readSize(const Byte* in) noexcept {
    uint64_t size = 0;
    for (int i = 0; i < 8; ++i) {
        size |= static_cast<uint64_t>(in[i]) << (8 * i);
    }
    return size;
}

} // anonymous namespace

TextCompressor::TextCompressor(int level) noexcept
    : m_level((level >= 1 && level <= 9) ? level : Z_DEFAULT_COMPRESSION) {
}

bool TextCompressor::isFrame(ByteSpan data) noexcept {
    return data.size() >= FRAME_HEADER_SIZE &&
           std::memcmp(data.data(), FRAME_MAGIC, sizeof(FRAME_MAGIC)) == 0;
}

Result<uint64_t> TextCompressor::originalSize(ByteSpan frame) noexcept {
    if (!isFrame(frame)) {
        return ErrorCode::DecompressionFailed;
    }
    return readSize(frame.data() + sizeof(FRAME_MAGIC));
}

Result<ByteBuffer> TextCompressor::compress(ByteSpan data) const {
    if (data.size() > MAX_FRAME_PAYLOAD) {
        return ErrorCode::CompressionFailed;
    }
    
    uLong bound = compressBound(static_cast<uLong>(data.size()));
    ByteBuffer frame(FRAME_HEADER_SIZE + bound);
    std::memcpy(frame.data(), FRAME_MAGIC, sizeof(FRAME_MAGIC));
    writeSize(frame.data() + sizeof(FRAME_MAGIC), data.size());
    
    uLongf destLen = bound;
    int rc = compress2(frame.data() + FRAME_HEADER_SIZE, &destLen,
                       data.data(), static_cast<uLong>(data.size()), m_level);
    if (rc != Z_OK) {
        return ErrorCode::CompressionFailed;
    }
    
    frame.resize(FRAME_HEADER_SIZE + destLen);
    frame.shrink_to_fit();
    return frame;
}

Result<ByteBuffer> TextCompressor::decompress(ByteSpan frame) const {
    auto sizeResult = originalSize(frame);
    if (sizeResult.isFailure()) {
        return sizeResult.error();
    }
    
    uint64_t expected = sizeResult.value();
    if (expected > MAX_FRAME_PAYLOAD) {
        return ErrorCode::DecompressionFailed;
    }
    
    ByteSpan stream = frame.subspan(FRAME_HEADER_SIZE);
    ByteBuffer output(static_cast<size_t>(expected));
    
    z_stream zs{};
    if (inflateInit(&zs) != Z_OK) {
        return ErrorCode::DecompressionFailed;
    }
    
    zs.next_in = const_cast<Bytef*>(stream.data());
    zs.avail_in = static_cast<uInt>(std::min<size_t>(stream.size(), UINT_MAX));
    Byte empty = 0;
    zs.next_out = output.empty() ? &empty : output.data();
    zs.avail_out = static_cast<uInt>(output.size());
    
    // The buffer is exact: anything but Z_STREAM_END is a failure
    int rc = inflate(&zs, Z_FINISH);
    uLong produced = zs.total_out;
    inflateEnd(&zs);
    
    if (rc != Z_STREAM_END || produced != expected) {
        return ErrorCode::DecompressionFailed;
    }
    
    return output;
}

Result<ByteBuffer> TextCompressor::compressText(std::string_view text) const {
    return compress(asBytes(text));
}

Result<std::string> TextCompressor::decompressText(ByteSpan frame) const {
    auto result = decompress(frame);
    if (result.isFailure()) {
        return result.error();
    }
    return toString(result.value());
}

} // namespace ClipGuard::Compression
