/**
 * @file ErrorCodes.cpp
 * @brief Human-readable descriptions for error codes and categories
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/ErrorCodes.hpp>

namespace ClipGuard {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:                return "Success";
        
        // System
        case ErrorCode::SystemError:            return "System error";
        case ErrorCode::ThreadCreationFailed:   return "Thread creation failed";
        case ErrorCode::Timeout:                return "Operation timed out";
        case ErrorCode::Cancelled:              return "Operation cancelled";
        case ErrorCode::NotSupported:           return "Not supported on this platform";
        case ErrorCode::WrongContext:           return "Blocking call issued from the serial context";
        case ErrorCode::ContextStopped:         return "Execution context stopped";
        
        // Crypto
        case ErrorCode::CryptoError:            return "Cryptographic error";
        case ErrorCode::EncryptionFailed:       return "Encryption failed";
        case ErrorCode::DecryptionFailed:       return "Decryption failed";
        case ErrorCode::HashFailed:             return "Hash computation failed";
        case ErrorCode::InvalidKey:             return "Invalid key";
        case ErrorCode::RandomGenerationFailed: return "Random generation failed";
        
        // Config
        case ErrorCode::ConfigError:            return "Configuration error";
        case ErrorCode::ConfigMissing:          return "Missing configuration";
        case ErrorCode::ConfigInvalid:          return "Invalid configuration value";
        case ErrorCode::ConfigFileNotFound:     return "Configuration file not found";
        case ErrorCode::ConfigParseFailed:      return "Configuration parse failed";
        
        // IO
        case ErrorCode::IOError:                return "I/O error";
        case ErrorCode::FileNotFound:           return "File not found";
        case ErrorCode::FileAccessDenied:       return "File access denied";
        case ErrorCode::DirectoryNotFound:      return "Directory not found";
        case ErrorCode::FileReadError:          return "File read error";
        case ErrorCode::FileWriteError:         return "File write error";
        case ErrorCode::FileTooLarge:           return "File too large";
        case ErrorCode::InvalidPath:            return "Invalid path";
        case ErrorCode::AccessDenied:           return "Access denied";
        case ErrorCode::FileAlreadyExists:      return "File already exists";
        
        // Parse
        case ErrorCode::ParseError:             return "Parse error";
        case ErrorCode::JsonParseFailed:        return "JSON parse failed";
        case ErrorCode::JsonInvalid:            return "Invalid JSON structure";
        case ErrorCode::MissingField:           return "Missing required field";
        case ErrorCode::InvalidFieldType:       return "Invalid field type";
        case ErrorCode::InvalidHexString:       return "Invalid hex string";
        case ErrorCode::InvalidBase64:          return "Invalid base64 string";
        
        // Pattern
        case ErrorCode::PatternError:           return "Pattern error";
        case ErrorCode::InvalidPattern:         return "Invalid pattern";
        case ErrorCode::EmptyPattern:           return "Empty pattern";
        case ErrorCode::RuleNotFound:           return "Rule not found";
        case ErrorCode::PatternNotFound:        return "Pattern not found";
        case ErrorCode::DuplicateId:            return "Duplicate id";
        
        // Compression
        case ErrorCode::CompressionError:       return "Compression error";
        case ErrorCode::CompressionFailed:      return "Compression failed";
        case ErrorCode::DecompressionFailed:    return "Decompression failed";
        case ErrorCode::TextUnavailable:        return "Text unavailable";
        
        // Storage
        case ErrorCode::StorageError:           return "Storage error";
        case ErrorCode::StoreWriteFailed:       return "Store write failed";
        case ErrorCode::StoreReadFailed:        return "Store read failed";
        case ErrorCode::StoreDeleteFailed:      return "Store delete failed";
        case ErrorCode::ItemNotFound:           return "Item not found";
        case ErrorCode::BlobNotFound:           return "Blob not found";
        case ErrorCode::StoreCorrupted:         return "Store corrupted";
        
        // Image
        case ErrorCode::ImageError:             return "Image error";
        case ErrorCode::ImageLoadFailed:        return "Image load failed";
        case ErrorCode::NoImage:                return "Item holds no image";
        case ErrorCode::NoDurableCopy:          return "No durable copy for eviction";
        
        // Transfer
        case ErrorCode::TransferError:          return "Transfer error";
        case ErrorCode::InvalidFormat:          return "Invalid rule document format";
        case ErrorCode::IncompatibleVersion:    return "Incompatible document version";
        
        // Internal
        case ErrorCode::InternalError:          return "Internal error";
        case ErrorCode::InvalidState:           return "Invalid state";
        case ErrorCode::NullPointer:            return "Null pointer";
        case ErrorCode::InvalidArgument:        return "Invalid argument";
        case ErrorCode::OutOfRange:             return "Out of range";
    }
    return "Unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:        return "None";
        case ErrorCategory::System:      return "System";
        case ErrorCategory::Crypto:      return "Crypto";
        case ErrorCategory::Config:      return "Config";
        case ErrorCategory::IO:          return "IO";
        case ErrorCategory::Parse:       return "Parse";
        case ErrorCategory::Pattern:     return "Pattern";
        case ErrorCategory::Compression: return "Compression";
        case ErrorCategory::Storage:     return "Storage";
        case ErrorCategory::Image:       return "Image";
        case ErrorCategory::Transfer:    return "Transfer";
        case ErrorCategory::Internal:    return "Internal";
    }
    return "Unknown";
}

} // namespace ClipGuard
