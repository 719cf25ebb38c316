/**
 * @file SanitizationApplier.cpp
 * @brief Replacement strings for rule actions
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Sanitizer.hpp>
#include <ClipGuard/Core/Crypto.hpp>

namespace ClipGuard::Sanitize {

std::string SanitizationApplier::apply(RuleAction action, std::string_view matched,
                                       const std::optional<std::string>& replacement) const {
    switch (action) {
        case RuleAction::Mask:
            return mask(matched);
        case RuleAction::Rename:
            return replacement.value_or(DEFAULT_RENAME);
        case RuleAction::Obfuscate:
            return obfuscate(matched);
        case RuleAction::Remove:
            return "";
    }
    return mask(matched);
}

std::string SanitizationApplier::mask(std::string_view matched) const {
    return std::string(utf8Length(matched), m_maskChar);
}

std::string SanitizationApplier::obfuscate(std::string_view matched) {
    auto digest = Crypto::HashEngine::sha256(asBytes(matched));
    if (digest.isFailure()) {
        return "[OBFUSCATED]";
    }
    
    const auto& hash = digest.value();
    return "[OBFUSCATED:" + Crypto::toHex(ByteSpan(hash.data(), 4)) + "]";
}

} // namespace ClipGuard::Sanitize
