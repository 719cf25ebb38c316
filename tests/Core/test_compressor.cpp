/**
 * @file test_compressor.cpp
 * @brief Unit tests for the zlib text frame codec
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Compression.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace ClipGuard;
using namespace ClipGuard::Compression;
using namespace ClipGuard::Testing;

TEST(TextCompressor, LargeTextShrinksAndRestores) {
    std::string text;
    for (int i = 0; i < 5000; i++) {
        text += "line " + std::to_string(i % 17) + " of repetitive clipboard text\n";
    }

    TextCompressor compressor;
    auto frame = compressor.compressText(text);
    ASSERT_RESULT_SUCCESS(frame);
    EXPECT_LT(frame.value().size(), text.size() / 4);
    EXPECT_TRUE(TextCompressor::isFrame(frame.value()));

    auto size = TextCompressor::originalSize(frame.value());
    ASSERT_RESULT_SUCCESS(size);
    EXPECT_EQ(size.value(), text.size());

    auto restored = compressor.decompressText(frame.value());
    ASSERT_RESULT_SUCCESS(restored);
    EXPECT_EQ(restored.value(), text);
}

TEST(TextCompressor, MultiByteTextIsPreserved) {
    const std::string text = "Grüße aus Zürich, 東京 から 🚀🚀🚀";

    TextCompressor compressor(9);
    auto frame = compressor.compressText(text);
    ASSERT_RESULT_SUCCESS(frame);

    auto restored = compressor.decompressText(frame.value());
    ASSERT_RESULT_SUCCESS(restored);
    EXPECT_EQ(restored.value(), text);
}

TEST(TextCompressor, EmptyInput) {
    TextCompressor compressor;
    auto frame = compressor.compress(ByteSpan{});
    ASSERT_RESULT_SUCCESS(frame);

    auto restored = compressor.decompress(frame.value());
    ASSERT_RESULT_SUCCESS(restored);
    EXPECT_TRUE(restored.value().empty());
}

TEST(TextCompressor, BinaryPayload) {
    TextCompressor compressor(1);
    ByteBuffer pixels = makePixels(64 * 64 * 4, 42);

    auto frame = compressor.compress(pixels);
    ASSERT_RESULT_SUCCESS(frame);

    auto restored = compressor.decompress(frame.value());
    ASSERT_RESULT_SUCCESS(restored);
    EXPECT_EQ(restored.value(), pixels);
}

TEST(TextCompressor, MissingMagicFails) {
    TextCompressor compressor;
    ByteBuffer garbage(64, 0x5A);
    EXPECT_FALSE(TextCompressor::isFrame(garbage));
    EXPECT_RESULT_ERROR(compressor.decompress(garbage), ErrorCode::DecompressionFailed);
}

TEST(TextCompressor, TruncatedFrameFails) {
    TextCompressor compressor;
    auto frame = compressor.compressText(std::string(4096, 'q') + randomString(512));
    ASSERT_RESULT_SUCCESS(frame);

    ByteBuffer truncated(frame.value().begin(), frame.value().end() - 8);
    EXPECT_RESULT_ERROR(compressor.decompress(truncated), ErrorCode::DecompressionFailed);
}

TEST(TextCompressor, CorruptedStreamFails) {
    TextCompressor compressor;
    auto frame = compressor.compressText(randomString(2048));
    ASSERT_RESULT_SUCCESS(frame);

    ByteBuffer corrupted = frame.value();
    for (size_t i = FRAME_HEADER_SIZE; i < corrupted.size(); i++) {
        corrupted[i] = static_cast<Byte>(~corrupted[i]);
    }
    EXPECT_RESULT_ERROR(compressor.decompress(corrupted), ErrorCode::DecompressionFailed);
}

TEST(TextCompressor, WrongRecordedSizeFails) {
    TextCompressor compressor;
    const std::string text = "exact size is part of the frame";
    auto frame = compressor.compressText(text);
    ASSERT_RESULT_SUCCESS(frame);

    ByteBuffer larger = frame.value();
    larger[4] = static_cast<Byte>(larger[4] + 1);
    EXPECT_RESULT_ERROR(compressor.decompress(larger), ErrorCode::DecompressionFailed);

    ByteBuffer smaller = frame.value();
    smaller[4] = static_cast<Byte>(smaller[4] - 1);
    EXPECT_RESULT_ERROR(compressor.decompress(smaller), ErrorCode::DecompressionFailed);
}
