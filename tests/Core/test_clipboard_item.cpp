/**
 * @file test_clipboard_item.cpp
 * @brief Unit tests for clipboard item state transitions
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/ClipboardItem.hpp>
#include <ClipGuard/Core/Compression.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <memory>

using namespace ClipGuard;
using namespace ClipGuard::Clipboard;
using namespace ClipGuard::Testing;

namespace {

SharedBytes compressed(const std::string& text) {
    Compression::TextCompressor compressor;
    auto frame = compressor.compressText(text);
    return std::make_shared<const ByteBuffer>(frame.value());
}

} // anonymous namespace

// ============================================================================
// Text items
// ============================================================================

TEST(ClipboardItem, NewTextItem) {
    auto result = ClipboardItem::makeText("Grüße");
    ASSERT_RESULT_SUCCESS(result);
    const ClipboardItem& item = result.value();

    EXPECT_TRUE(item.isText());
    EXPECT_EQ(item.id().size(), 36u);
    EXPECT_EQ(item.textState(), TextState::Resident);
    EXPECT_EQ(item.textLength(), 5u);
    EXPECT_EQ(item.originalText(), "Grüße");
    EXPECT_EQ(item.sanitizedText(), "Grüße");
    EXPECT_FALSE(item.isSanitized());
    EXPECT_EQ(item.imageState(), ImageState::Absent);
}

TEST(ClipboardItem, IdsAreUnique) {
    auto a = ClipboardItem::makeText("same");
    auto b = ClipboardItem::makeText("same");
    ASSERT_RESULT_SUCCESS(a);
    ASSERT_RESULT_SUCCESS(b);
    EXPECT_NE(a.value().id(), b.value().id());
    EXPECT_EQ(a.value().textDigest(), b.value().textDigest());
}

TEST(ClipboardItem, SanitizedTextDrivesDisplay) {
    auto result = ClipboardItem::makeText("password: hunter2");
    ASSERT_RESULT_SUCCESS(result);
    ClipboardItem item = std::move(result.value());

    ASSERT_RESULT_SUCCESS(item.setSanitizedText("password: *******"));
    EXPECT_TRUE(item.isSanitized());
    EXPECT_EQ(item.displayText(), "password: *******");
    EXPECT_EQ(item.originalText(), "password: hunter2");

    ASSERT_RESULT_SUCCESS(item.setSanitizedText("password: hunter2"));
    EXPECT_FALSE(item.isSanitized());
}

TEST(ClipboardItem, CompressionReleasesResidentText) {
    const std::string text(3000, 'a');
    auto result = ClipboardItem::makeText(text);
    ASSERT_RESULT_SUCCESS(result);
    ClipboardItem item = std::move(result.value());

    ASSERT_RESULT_SUCCESS(item.commitCompressedText(compressed(text), nullptr));
    EXPECT_EQ(item.textState(), TextState::Compressed);
    EXPECT_FALSE(item.originalText().has_value());
    EXPECT_FALSE(item.displayText().has_value());
    EXPECT_EQ(item.textLength(), 3000u);
    EXPECT_NE(item.compressedOriginal(), nullptr);
    EXPECT_EQ(item.compressedSanitized(), nullptr);

    EXPECT_RESULT_ERROR(item.setSanitizedText("x"), ErrorCode::InvalidState);
}

TEST(ClipboardItem, SecondCompressionIsNoOp) {
    auto result = ClipboardItem::makeText("some text");
    ASSERT_RESULT_SUCCESS(result);
    ClipboardItem item = std::move(result.value());

    SharedBytes first = compressed("some text");
    ASSERT_RESULT_SUCCESS(item.commitCompressedText(first, nullptr));
    ASSERT_RESULT_SUCCESS(item.commitCompressedText(compressed("other"), nullptr));
    EXPECT_EQ(item.compressedOriginal(), first);
}

TEST(ClipboardItem, CompressionNeedsFrame) {
    auto result = ClipboardItem::makeText("text");
    ASSERT_RESULT_SUCCESS(result);
    EXPECT_RESULT_ERROR(result.value().commitCompressedText(nullptr, nullptr), ErrorCode::InvalidState);
}

TEST(ClipboardItem, UnavailableFlag) {
    auto result = ClipboardItem::makeText("text");
    ASSERT_RESULT_SUCCESS(result);
    ClipboardItem item = std::move(result.value());
    EXPECT_FALSE(item.textUnavailable());
    item.markTextUnavailable();
    EXPECT_TRUE(item.textUnavailable());
}

// ============================================================================
// Image items
// ============================================================================

TEST(ClipboardItem, EmptyImageIsRejected) {
    EXPECT_RESULT_ERROR(ClipboardItem::makeImage({}), ErrorCode::NoImage);
}

TEST(ClipboardItem, ImageEvictionAndReload) {
    ByteBuffer pixels = makePixels(1024, 3);
    auto result = ClipboardItem::makeImage(pixels);
    ASSERT_RESULT_SUCCESS(result);
    ClipboardItem item = std::move(result.value());

    EXPECT_EQ(item.imageState(), ImageState::Resident);
    EXPECT_EQ(item.imageSize(), 1024u);
    EXPECT_FALSE(item.hasDurableImage());

    BlobRef ref{item.id(), 1024};
    ASSERT_RESULT_SUCCESS(item.commitEviction(ref, nullptr));
    EXPECT_EQ(item.imageState(), ImageState::Evicted);
    EXPECT_EQ(item.imagePixels(), nullptr);
    EXPECT_EQ(item.imageRef(), ref);
    EXPECT_EQ(item.imageSize(), 1024u);

    ASSERT_RESULT_SUCCESS(item.commitReload(std::make_shared<const ByteBuffer>(pixels)));
    EXPECT_EQ(item.imageState(), ImageState::Resident);
    EXPECT_EQ(*item.imagePixels(), pixels);
    EXPECT_TRUE(item.hasDurableImage());
}

TEST(ClipboardItem, EvictionNeedsDurableCopy) {
    auto result = ClipboardItem::makeImage(makePixels(16, 1));
    ASSERT_RESULT_SUCCESS(result);
    ClipboardItem item = std::move(result.value());

    EXPECT_RESULT_ERROR(item.commitEviction(std::nullopt, nullptr), ErrorCode::NoDurableCopy);
    EXPECT_EQ(item.imageState(), ImageState::Resident);
    EXPECT_NE(item.imagePixels(), nullptr);
}

TEST(ClipboardItem, FallbackEviction) {
    auto result = ClipboardItem::makeImage(makePixels(16, 1));
    ASSERT_RESULT_SUCCESS(result);
    ClipboardItem item = std::move(result.value());

    auto fallback = std::make_shared<const ByteBuffer>(ByteBuffer{1, 2, 3});
    ASSERT_RESULT_SUCCESS(item.commitEviction(std::nullopt, fallback));
    EXPECT_EQ(item.imageState(), ImageState::Evicted);
    EXPECT_FALSE(item.imageRef().has_value());
    EXPECT_EQ(item.imageFallback(), fallback);
}

TEST(ClipboardItem, ImageOperationsRejectTextItems) {
    auto result = ClipboardItem::makeText("text");
    ASSERT_RESULT_SUCCESS(result);
    ClipboardItem item = std::move(result.value());

    EXPECT_RESULT_ERROR(item.commitEviction(BlobRef{"k", 1}, nullptr), ErrorCode::InvalidState);
    EXPECT_RESULT_ERROR(item.commitReload(std::make_shared<const ByteBuffer>(ByteBuffer{1})),
                        ErrorCode::InvalidState);
}

TEST(ClipboardItem, StateNames) {
    EXPECT_STREQ(itemKindName(ItemKind::Image), "image");
    EXPECT_STREQ(textStateName(TextState::Compressed), "compressed");
    EXPECT_STREQ(imageStateName(ImageState::Evicted), "evicted");
}
