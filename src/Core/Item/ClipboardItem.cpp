/**
 * @file ClipboardItem.cpp
 * @brief Clipboard item state transitions
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/ClipboardItem.hpp>
#include <ClipGuard/Core/Crypto.hpp>

namespace ClipGuard::Clipboard {

const char* itemKindName(ItemKind kind) noexcept {
    switch (kind) {
        case ItemKind::Text:  return "text";
        case ItemKind::Image: return "image";
    }
    return "unknown";
}

const char* textStateName(TextState state) noexcept {
    switch (state) {
        case TextState::Resident:   return "resident";
        case TextState::Compressed: return "compressed";
    }
    return "unknown";
}

const char* imageStateName(ImageState state) noexcept {
    switch (state) {
        case ImageState::Absent:   return "absent";
        case ImageState::Resident: return "resident";
        case ImageState::Evicted:  return "evicted";
    }
    return "unknown";
}

ClipboardItem::ClipboardItem(ItemId id, Timestamp createdAt, ItemKind kind)
    : m_id(std::move(id))
    , m_createdAt(createdAt)
    , m_kind(kind) {
}

Result<ClipboardItem> ClipboardItem::makeText(std::string text, Timestamp createdAt) {
    Crypto::SecureRandom random;
    auto id = random.generateUuid();
    if (id.isFailure()) {
        return id.error();
    }
    
    auto digest = Crypto::HashEngine::sha256(asBytes(text));
    if (digest.isFailure()) {
        return digest.error();
    }
    
    ClipboardItem item(std::move(id.value()), createdAt, ItemKind::Text);
    item.m_textDigest = digest.value();
    item.m_textLength = utf8Length(text);
    item.m_sanitizedText = text;
    item.m_originalText = std::move(text);
    return item;
}

Result<ClipboardItem> ClipboardItem::makeImage(ByteBuffer pixels, Timestamp createdAt) {
    if (pixels.empty()) {
        return ErrorCode::NoImage;
    }
    
    Crypto::SecureRandom random;
    auto id = random.generateUuid();
    if (id.isFailure()) {
        return id.error();
    }
    
    ClipboardItem item(std::move(id.value()), createdAt, ItemKind::Image);
    item.m_imageSize = pixels.size();
    item.m_imagePixels = std::make_shared<const ByteBuffer>(std::move(pixels));
    item.m_imageState = ImageState::Resident;
    return item;
}

std::optional<std::string> ClipboardItem::displayText() const {
    if (m_sanitizedText) {
        return m_sanitizedText;
    }
    return m_originalText;
}

Result<void> ClipboardItem::setSanitizedText(std::string sanitized) {
    if (!isText() || m_textState != TextState::Resident || !m_originalText) {
        return ErrorCode::InvalidState;
    }
    
    m_sanitized = (*m_originalText != sanitized);
    m_sanitizedText = std::move(sanitized);
    return Result<void>::Success();
}

Result<void> ClipboardItem::commitCompressedText(SharedBytes original, SharedBytes sanitized) {
    if (!isText() || !original) {
        return ErrorCode::InvalidState;
    }
    if (m_textState == TextState::Compressed) {
        return Result<void>::Success();
    }
    
    m_compressedOriginal = std::move(original);
    m_compressedSanitized = std::move(sanitized);
    m_originalText.reset();
    m_sanitizedText.reset();
    m_textState = TextState::Compressed;
    return Result<void>::Success();
}

void ClipboardItem::restoreText(std::optional<std::string> original,
                                std::optional<std::string> sanitized,
                                SharedBytes compressedOriginal,
                                SharedBytes compressedSanitized,
                                size_t textLength, bool sanitizedFlag,
                                const SHA256Hash& digest) {
    m_originalText = std::move(original);
    m_sanitizedText = std::move(sanitized);
    m_compressedOriginal = std::move(compressedOriginal);
    m_compressedSanitized = std::move(compressedSanitized);
    m_textState = m_compressedOriginal ? TextState::Compressed : TextState::Resident;
    m_textLength = textLength;
    m_sanitized = sanitizedFlag;
    m_textDigest = digest;
    m_imageState = ImageState::Absent;
}

Result<void> ClipboardItem::commitEviction(std::optional<BlobRef> ref, SharedBytes fallback) {
    if (!isImage()) {
        return ErrorCode::InvalidState;
    }
    if (!ref && !fallback) {
        return ErrorCode::NoDurableCopy;
    }
    
    bool durable = ref.has_value();
    m_imageRef = std::move(ref);
    m_imageFallback = durable ? nullptr : std::move(fallback);
    m_imagePixels.reset();
    m_imageState = ImageState::Evicted;
    return Result<void>::Success();
}

Result<void> ClipboardItem::attachImageRef(BlobRef ref) {
    if (!isImage()) {
        return ErrorCode::InvalidState;
    }
    
    m_imageRef = std::move(ref);
    m_imageFallback.reset();
    return Result<void>::Success();
}

Result<void> ClipboardItem::commitReload(SharedBytes pixels) {
    if (!isImage() || !pixels) {
        return ErrorCode::InvalidState;
    }
    
    m_imageSize = pixels->size();
    m_imagePixels = std::move(pixels);
    m_imageState = ImageState::Resident;
    return Result<void>::Success();
}

void ClipboardItem::restoreImage(std::optional<BlobRef> ref, size_t imageSize) {
    m_imageRef = std::move(ref);
    m_imageSize = imageSize;
    m_imagePixels.reset();
    m_imageFallback.reset();
    m_imageState = m_imageRef ? ImageState::Evicted : ImageState::Absent;
}

} // namespace ClipGuard::Clipboard
