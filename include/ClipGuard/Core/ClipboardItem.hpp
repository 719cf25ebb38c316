/**
 * @file ClipboardItem.hpp
 * @brief Clipboard item value object and its resource states
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 *
 * State model:
 * @code
 *   Text  : Resident  --compress-->  Compressed
 *   Image : Resident  --evict----->  Evicted  --reload-->  Resident
 * @endcode
 *
 * Text items always have ImageState::Absent; image items never carry text.
 * Buffers are held through shared immutable pointers so a copy of an item
 * (as handed out by ClipboardHistory::snapshot) is cheap and never aliases
 * mutable state.
 */

#pragma once

#ifndef CLIPGUARD_CORE_CLIPBOARD_ITEM_HPP
#define CLIPGUARD_CORE_CLIPBOARD_ITEM_HPP

#include <ClipGuard/Core/Types.hpp>
#include <ClipGuard/Core/ErrorCodes.hpp>
#include <optional>
#include <string>

namespace ClipGuard::Clipboard {

enum class ItemKind : uint8_t {
    Text = 0,
    Image = 1
};

enum class TextState : uint8_t {
    Resident = 0,
    Compressed = 1
};

enum class ImageState : uint8_t {
    Absent = 0,
    Resident = 1,
    Evicted = 2
};

const char* itemKindName(ItemKind kind) noexcept;
const char* textStateName(TextState state) noexcept;
const char* imageStateName(ImageState state) noexcept;

/**
 * @brief One captured clipboard entry
 */
class ClipboardItem {
public:
    /**
     * @brief New text item with a fresh UUID, sanitized text equal to the original
     */
    static Result<ClipboardItem> makeText(std::string text, Timestamp createdAt = WallClock::now());

    /**
     * @brief New image item with a fresh UUID and resident pixels
     */
    static Result<ClipboardItem> makeImage(ByteBuffer pixels, Timestamp createdAt = WallClock::now());

    /**
     * @brief Empty item with a known identity (used when restoring from a store)
     */
    ClipboardItem(ItemId id, Timestamp createdAt, ItemKind kind);

    ClipboardItem(const ClipboardItem&) = default;
    ClipboardItem(ClipboardItem&&) noexcept = default;
    ClipboardItem& operator=(const ClipboardItem&) = default;
    ClipboardItem& operator=(ClipboardItem&&) noexcept = default;

    // ---- Identity ----------------------------------------------------------

    [[nodiscard]] const ItemId& id() const noexcept { return m_id; }
    [[nodiscard]] Timestamp createdAt() const noexcept { return m_createdAt; }
    [[nodiscard]] ItemKind kind() const noexcept { return m_kind; }
    [[nodiscard]] bool isText() const noexcept { return m_kind == ItemKind::Text; }
    [[nodiscard]] bool isImage() const noexcept { return m_kind == ItemKind::Image; }

    // ---- Text --------------------------------------------------------------

    [[nodiscard]] TextState textState() const noexcept { return m_textState; }

    /// Resident original text; nullopt when compressed or not a text item
    [[nodiscard]] const std::optional<std::string>& originalText() const noexcept { return m_originalText; }

    /// Resident sanitized text; nullopt when compressed or not a text item
    [[nodiscard]] const std::optional<std::string>& sanitizedText() const noexcept { return m_sanitizedText; }

    /// Sanitized text if it differs, else the original (resident only)
    [[nodiscard]] std::optional<std::string> displayText() const;

    /**
     * @brief Record the sanitizer output
     *
     * Only valid on a resident text item.
     */
    Result<void> setSanitizedText(std::string sanitized);

    /// originalText != sanitizedText, kept across compression
    [[nodiscard]] bool isSanitized() const noexcept { return m_sanitized; }

    /// Code points of the original text, kept across compression
    [[nodiscard]] size_t textLength() const noexcept { return m_textLength; }

    /// SHA-256 of the original text (duplicate detection)
    [[nodiscard]] const SHA256Hash& textDigest() const noexcept { return m_textDigest; }

    [[nodiscard]] SharedBytes compressedOriginal() const noexcept { return m_compressedOriginal; }

    /// Null when the sanitized text is identical to the original
    [[nodiscard]] SharedBytes compressedSanitized() const noexcept { return m_compressedSanitized; }

    /**
     * @brief Switch to the compressed representation
     * @param original Compressed original text
     * @param sanitized Compressed sanitized text, or null when it mirrors the original
     */
    Result<void> commitCompressedText(SharedBytes original, SharedBytes sanitized);

    /// Restore text state from persisted fields (no length check possible)
    void restoreText(std::optional<std::string> original, std::optional<std::string> sanitized,
                     SharedBytes compressedOriginal, SharedBytes compressedSanitized,
                     size_t textLength, bool sanitizedFlag, const SHA256Hash& digest);

    /// Decompression failed once; the text is never read again
    void markTextUnavailable() noexcept { m_textUnavailable = true; }
    [[nodiscard]] bool textUnavailable() const noexcept { return m_textUnavailable; }

    // ---- Image -------------------------------------------------------------

    [[nodiscard]] ImageState imageState() const noexcept { return m_imageState; }

    /// Resident pixels; null when evicted or not an image item
    [[nodiscard]] SharedBytes imagePixels() const noexcept { return m_imagePixels; }

    /// Byte size of the image, kept across eviction
    [[nodiscard]] size_t imageSize() const noexcept { return m_imageSize; }

    [[nodiscard]] const std::optional<BlobRef>& imageRef() const noexcept { return m_imageRef; }

    /// In-memory compressed copy kept when the blob save failed
    [[nodiscard]] SharedBytes imageFallback() const noexcept { return m_imageFallback; }

    /// True when an evicted image can be brought back
    [[nodiscard]] bool hasDurableImage() const noexcept {
        return m_imageRef.has_value() || m_imageFallback != nullptr;
    }

    /**
     * @brief Release resident pixels
     *
     * Requires a blob reference or a fallback copy; fails with
     * NoDurableCopy otherwise and leaves the item untouched.
     */
    Result<void> commitEviction(std::optional<BlobRef> ref, SharedBytes fallback);

    /**
     * @brief Record the blob written when the image was first stored
     *
     * Pixels and state are unchanged; an in-memory fallback is dropped.
     */
    Result<void> attachImageRef(BlobRef ref);

    /// Install reloaded pixels; the durable copy is kept for re-eviction
    Result<void> commitReload(SharedBytes pixels);

    /// Restore image state from persisted fields
    void restoreImage(std::optional<BlobRef> ref, size_t imageSize);

private:
    ItemId m_id;
    Timestamp m_createdAt;
    ItemKind m_kind;

    TextState m_textState = TextState::Resident;
    std::optional<std::string> m_originalText;
    std::optional<std::string> m_sanitizedText;
    SharedBytes m_compressedOriginal;
    SharedBytes m_compressedSanitized;
    size_t m_textLength = 0;
    bool m_sanitized = false;
    bool m_textUnavailable = false;
    SHA256Hash m_textDigest{};

    ImageState m_imageState = ImageState::Absent;
    SharedBytes m_imagePixels;
    size_t m_imageSize = 0;
    std::optional<BlobRef> m_imageRef;
    SharedBytes m_imageFallback;
};

} // namespace ClipGuard::Clipboard

#endif // CLIPGUARD_CORE_CLIPBOARD_ITEM_HPP
