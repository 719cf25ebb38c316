/**
 * @file ErrorCodes.hpp
 * @brief Error codes and result types for ClipGuard
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 * 
 * This file defines all error codes used throughout ClipGuard, along with
 * a Result type for error handling without exceptions. None of these errors
 * is fatal to the process: callers log them, surface them as status and
 * keep capturing.
 */

#pragma once

#ifndef CLIPGUARD_CORE_ERROR_CODES_HPP
#define CLIPGUARD_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <optional>
#include <type_traits>

namespace ClipGuard {

// ============================================================================
// Error Category Enumeration
// ============================================================================

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory : uint8_t {
    None        = 0x00,  ///< No error
    System      = 0x01,  ///< Threading and platform errors
    Crypto      = 0x02,  ///< Hashing, random and cipher errors
    Config      = 0x03,  ///< Configuration errors
    IO          = 0x04,  ///< File I/O errors
    Parse       = 0x05,  ///< Parsing errors
    Pattern     = 0x06,  ///< Rule and pattern errors
    Compression = 0x07,  ///< Text compression errors
    Storage     = 0x08,  ///< Item and blob store errors
    Image       = 0x09,  ///< Image residency errors
    Transfer    = 0x0A,  ///< Rule import/export errors
    Internal    = 0xFF   ///< Internal/unknown errors
};

// ============================================================================
// Error Code Enumeration
// ============================================================================

/**
 * @brief Error codes for all ClipGuard operations
 * 
 * Error codes are structured as:
 * - 0x0000: Success
 * - 0x0100-0x01FF: System errors
 * - 0x0200-0x02FF: Crypto errors
 * - 0x0300-0x03FF: Config errors
 * - 0x0400-0x04FF: I/O errors
 * - 0x0500-0x05FF: Parse errors
 * - 0x0600-0x06FF: Pattern errors
 * - 0x0700-0x07FF: Compression errors
 * - 0x0800-0x08FF: Storage errors
 * - 0x0900-0x09FF: Image errors
 * - 0x0A00-0x0AFF: Transfer errors
 * - 0xFF00-0xFFFF: Internal errors
 */
enum class ErrorCode : uint16_t {
    // ========================================================================
    // Success (0x0000)
    // ========================================================================
    
    /// Operation completed successfully
    Success = 0x0000,
    
    // ========================================================================
    // System Errors (0x0100-0x01FF)
    // ========================================================================
    
    /// Generic system error
    SystemError = 0x0100,
    
    /// Thread creation failed
    ThreadCreationFailed = 0x0101,
    
    /// Operation timed out
    Timeout = 0x0102,
    
    /// Operation was cancelled
    Cancelled = 0x0103,
    
    /// Feature not supported on this platform
    NotSupported = 0x0104,
    
    /// Blocking call issued from the context it would wait on
    WrongContext = 0x0105,
    
    /// Execution context has been shut down
    ContextStopped = 0x0106,
    
    // ========================================================================
    // Cryptographic Errors (0x0200-0x02FF)
    // ========================================================================
    
    /// Generic cryptographic error
    CryptoError = 0x0200,
    
    /// Encryption failed
    EncryptionFailed = 0x0201,
    
    /// Decryption or tag verification failed
    DecryptionFailed = 0x0202,
    
    /// Hash computation failed
    HashFailed = 0x0203,
    
    /// Invalid key format or size
    InvalidKey = 0x0204,
    
    /// Random number generation failed
    RandomGenerationFailed = 0x0205,
    
    // ========================================================================
    // Configuration Errors (0x0300-0x03FF)
    // ========================================================================
    
    /// Generic configuration error
    ConfigError = 0x0300,
    
    /// Missing required configuration
    ConfigMissing = 0x0301,
    
    /// Invalid configuration value
    ConfigInvalid = 0x0302,
    
    /// Configuration file not found
    ConfigFileNotFound = 0x0303,
    
    /// Configuration parse error
    ConfigParseFailed = 0x0304,
    
    // ========================================================================
    // I/O Errors (0x0400-0x04FF)
    // ========================================================================
    
    /// Generic I/O error
    IOError = 0x0400,
    
    /// File not found
    FileNotFound = 0x0401,
    
    /// File access denied
    FileAccessDenied = 0x0402,
    
    /// Directory not found or not creatable
    DirectoryNotFound = 0x0403,
    
    /// File read error
    FileReadError = 0x0404,
    
    /// File write error
    FileWriteError = 0x0405,
    
    /// File too large
    FileTooLarge = 0x0406,
    
    /// Invalid file path
    InvalidPath = 0x0407,
    
    /// Path outside the allowed directory
    AccessDenied = 0x0408,
    
    /// Exclusive create hit an existing file
    FileAlreadyExists = 0x0409,
    
    // ========================================================================
    // Parse Errors (0x0500-0x05FF)
    // ========================================================================
    
    /// Generic parse error
    ParseError = 0x0500,
    
    /// JSON parse error
    JsonParseFailed = 0x0501,
    
    /// Invalid JSON structure
    JsonInvalid = 0x0502,
    
    /// Missing required field
    MissingField = 0x0503,
    
    /// Invalid field type
    InvalidFieldType = 0x0504,
    
    /// Invalid hex string
    InvalidHexString = 0x0505,
    
    /// Invalid base64 string
    InvalidBase64 = 0x0506,
    
    // ========================================================================
    // Pattern Errors (0x0600-0x06FF)
    // ========================================================================
    
    /// Generic pattern error
    PatternError = 0x0600,
    
    /// Pattern failed to compile; the rule is inert
    InvalidPattern = 0x0601,
    
    /// Pattern source is empty
    EmptyPattern = 0x0602,
    
    /// Rule id not present in the library
    RuleNotFound = 0x0603,
    
    /// Sensitive pattern id not present in the library
    PatternNotFound = 0x0604,
    
    /// Id already present in the library
    DuplicateId = 0x0605,
    
    // ========================================================================
    // Compression Errors (0x0700-0x07FF)
    // ========================================================================
    
    /// Generic compression error
    CompressionError = 0x0700,
    
    /// Compression failed
    CompressionFailed = 0x0701,
    
    /// Decompression failed or produced a size mismatch
    DecompressionFailed = 0x0702,
    
    /// Text was lost after an earlier decompression failure
    TextUnavailable = 0x0703,
    
    // ========================================================================
    // Storage Errors (0x0800-0x08FF)
    // ========================================================================
    
    /// Generic storage error
    StorageError = 0x0800,
    
    /// Durable write failed; in-memory state is kept
    StoreWriteFailed = 0x0801,
    
    /// Durable read failed
    StoreReadFailed = 0x0802,
    
    /// Durable delete failed
    StoreDeleteFailed = 0x0803,
    
    /// Item not found
    ItemNotFound = 0x0804,
    
    /// Blob not found
    BlobNotFound = 0x0805,
    
    /// Store contents could not be decoded
    StoreCorrupted = 0x0806,
    
    // ========================================================================
    // Image Errors (0x0900-0x09FF)
    // ========================================================================
    
    /// Generic image error
    ImageError = 0x0900,
    
    /// Image could not be reloaded from any durable copy
    ImageLoadFailed = 0x0901,
    
    /// Item holds no image
    NoImage = 0x0902,
    
    /// Eviction refused because no durable copy exists
    NoDurableCopy = 0x0903,
    
    // ========================================================================
    // Transfer Errors (0x0A00-0x0AFF)
    // ========================================================================
    
    /// Generic transfer error
    TransferError = 0x0A00,
    
    /// Document is neither an export envelope nor a legacy rule list
    InvalidFormat = 0x0A01,
    
    /// Export envelope version is not supported
    IncompatibleVersion = 0x0A02,
    
    // ========================================================================
    // Internal Errors (0xFF00-0xFFFF)
    // ========================================================================
    
    /// Unknown internal error
    InternalError = 0xFF00,
    
    /// Invalid state
    InvalidState = 0xFF01,
    
    /// Null pointer
    NullPointer = 0xFF02,
    
    /// Invalid argument
    InvalidArgument = 0xFF03,
    
    /// Out of range
    OutOfRange = 0xFF04
};

// ============================================================================
// Error Code Utilities
// ============================================================================

/**
 * @brief Get the category of an error code
 * @param code The error code
 * @return The error category
 */
[[nodiscard]] constexpr ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint16_t value = static_cast<uint16_t>(code);
    if (value == 0) return ErrorCategory::None;
    uint8_t category = static_cast<uint8_t>((value >> 8) & 0xFF);
    return static_cast<ErrorCategory>(category);
}

/**
 * @brief Check if an error code represents success
 */
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::Success;
}

/**
 * @brief Check if an error code represents failure
 */
[[nodiscard]] constexpr bool isFailure(ErrorCode code) noexcept {
    return code != ErrorCode::Success;
}

/**
 * @brief Get human-readable error message
 * @param code The error code
 * @return Error message string
 */
[[nodiscard]] std::string_view getErrorMessage(ErrorCode code) noexcept;

/**
 * @brief Get error category name
 * @param category The error category
 * @return Category name string
 */
[[nodiscard]] std::string_view getCategoryName(ErrorCategory category) noexcept;

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for operations that can fail
 * 
 * Holds either a value of type T or an ErrorCode.
 * 
 * @tparam T The success value type
 * 
 * @example
 * ```cpp
 * auto text = manager.readText(id);
 * if (text.isFailure()) {
 *     CLIPGUARD_LOG_WARNING(logger, getErrorMessage(text.error()));
 * }
 * ```
 */
template<typename T>
class Result {
public:
    /// Default constructor creates a failed result
    Result() : m_data(ErrorCode::InternalError) {}
    
    /// Construct from success value
    Result(const T& value) : m_data(value) {}
    
    /// Construct from success value (move)
    Result(T&& value) : m_data(std::move(value)) {}
    
    /// Construct from error code
    Result(ErrorCode error) : m_data(error) {}
    
    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    
    /// Check if result is success
    [[nodiscard]] bool isSuccess() const noexcept {
        return std::holds_alternative<T>(m_data);
    }
    
    /// Check if result is failure
    [[nodiscard]] bool isFailure() const noexcept {
        return std::holds_alternative<ErrorCode>(m_data);
    }
    
    /// Explicit conversion to bool (true if success)
    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }
    
    /// Get the success value (throws if failure)
    [[nodiscard]] T& value() & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }
    
    /// Get the success value (const, throws if failure)
    [[nodiscard]] const T& value() const & {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(m_data);
    }
    
    /// Get the success value (rvalue, throws if failure)
    [[nodiscard]] T&& value() && {
        if (isFailure()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(std::move(m_data));
    }
    
    /// Get the error code (throws if success)
    [[nodiscard]] ErrorCode error() const {
        if (isSuccess()) {
            throw std::runtime_error("Attempted to access error of successful Result");
        }
        return std::get<ErrorCode>(m_data);
    }
    
    /// Get value or default if failure
    [[nodiscard]] T valueOr(const T& defaultValue) const & {
        return isSuccess() ? std::get<T>(m_data) : defaultValue;
    }
    
    /// Get value or default if failure (move)
    [[nodiscard]] T valueOr(T&& defaultValue) && {
        return isSuccess() ? std::get<T>(std::move(m_data)) : std::move(defaultValue);
    }
    
    /// Get error or Success if no error
    [[nodiscard]] ErrorCode errorOr(ErrorCode defaultError = ErrorCode::Success) const noexcept {
        return isFailure() ? std::get<ErrorCode>(m_data) : defaultError;
    }
    
    /// Transform success value using a function
    template<typename F>
    [[nodiscard]] auto map(F&& func) const -> Result<decltype(func(std::declval<T>()))> {
        using U = decltype(func(std::declval<T>()));
        if (isSuccess()) {
            return Result<U>(func(std::get<T>(m_data)));
        }
        return Result<U>(std::get<ErrorCode>(m_data));
    }
    
    /// Chain with another Result-returning function
    template<typename F>
    [[nodiscard]] auto flatMap(F&& func) const -> decltype(func(std::declval<T>())) {
        using ResultType = decltype(func(std::declval<T>()));
        if (isSuccess()) {
            return func(std::get<T>(m_data));
        }
        return ResultType(std::get<ErrorCode>(m_data));
    }

private:
    std::variant<T, ErrorCode> m_data;
};

/**
 * @brief Specialization of Result for void (no return value)
 */
template<>
class Result<void> {
public:
    /// Construct success result
    Result() : m_error(ErrorCode::Success) {}
    
    /// Construct from error code
    Result(ErrorCode error) : m_error(error) {}
    
    [[nodiscard]] static Result Success() {
        return Result();
    }
    
    [[nodiscard]] bool isSuccess() const noexcept {
        return m_error == ErrorCode::Success;
    }
    
    [[nodiscard]] bool isFailure() const noexcept {
        return m_error != ErrorCode::Success;
    }
    
    [[nodiscard]] explicit operator bool() const noexcept {
        return isSuccess();
    }
    
    [[nodiscard]] ErrorCode error() const noexcept {
        return m_error;
    }

private:
    ErrorCode m_error;
};

/// Alias for Result<void>
using VoidResult = Result<void>;

// ============================================================================
// Convenience Macros
// ============================================================================

/**
 * @brief Return early if result is failure
 * 
 * Usage:
 * ```cpp
 * CLIPGUARD_TRY(store.remove(id));
 * ```
 */
#define CLIPGUARD_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.isFailure()) return _result.error(); \
    } while (0)

/**
 * @brief Assign value or return early on failure
 * 
 * Usage:
 * ```cpp
 * ByteBuffer data;
 * CLIPGUARD_TRY_ASSIGN(data, store.load(id));
 * ```
 */
#define CLIPGUARD_TRY_ASSIGN(var, expr) \
    auto _result_##var = (expr); \
    if (_result_##var.isFailure()) return _result_##var.error(); \
    var = std::move(_result_##var.value())

} // namespace ClipGuard

#endif // CLIPGUARD_CORE_ERROR_CODES_HPP
