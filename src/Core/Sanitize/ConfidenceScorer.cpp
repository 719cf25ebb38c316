/**
 * @file ConfidenceScorer.cpp
 * @brief Confidence heuristics for automatic detections
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Sanitizer.hpp>
#include <algorithm>
#include <array>
#include <cctype>

namespace ClipGuard::Sanitize {

namespace {

constexpr std::array<std::string_view, 6> PLACEHOLDER_TOKENS = {
    "example", "test", "sample", "dummy", "placeholder", "yourkey"
};

constexpr size_t SHORT_MATCH_CHARACTERS = 6;
constexpr double SHORT_MATCH_FACTOR = 0.8;

bool containsPlaceholder(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    for (auto token : PLACEHOLDER_TOKENS) {
        if (lowered.find(token) != std::string::npos) {
            return true;
        }
    }
    return false;
}

size_t countDigits(std::string_view text) noexcept {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; }));
}

bool nameContains(const SensitivePattern& pattern, std::string_view word) noexcept {
    return pattern.name.find(word) != std::string::npos;
}

} // anonymous namespace

bool ConfidenceScorer::passesLuhn(std::string_view text) noexcept {
    size_t digits = countDigits(text);
    if (digits < 13 || digits > 19) {
        return false;
    }
    
    int sum = 0;
    bool doubleIt = false;
    for (auto it = text.rbegin(); it != text.rend(); ++it) {
        unsigned char c = static_cast<unsigned char>(*it);
        if (!std::isdigit(c)) {
            continue;
        }
        int d = c - '0';
        if (doubleIt) {
            d *= 2;
            if (d > 9) {
                d -= 9;
            }
        }
        sum += d;
        doubleIt = !doubleIt;
    }
    return sum % 10 == 0;
}

double ConfidenceScorer::score(std::string_view matchedText, const SensitivePattern& pattern) {
    double confidence = BASELINE;
    
    switch (pattern.category) {
        case PatternCategory::Payment:
            if (isCardNumberRuleName(pattern.name)) {
                confidence = passesLuhn(matchedText) ? 0.9 : 0.3;
            }
            break;
            
        case PatternCategory::GovernmentID:
            confidence = 0.85;
            break;
            
        case PatternCategory::Credentials:
            confidence = containsPlaceholder(matchedText) ? 0.2 : 0.8;
            break;
            
        case PatternCategory::Contact:
            if (nameContains(pattern, "Email")) {
                bool plausible = matchedText.find('@') != std::string_view::npos &&
                                 matchedText.find('.') != std::string_view::npos;
                confidence = plausible ? 0.75 : 0.3;
            } else if (nameContains(pattern, "Phone")) {
                confidence = countDigits(matchedText) >= 10 ? 0.7 : 0.4;
            }
            break;
            
        default:
            confidence = 0.6;
            break;
    }
    
    if (utf8Length(matchedText) < SHORT_MATCH_CHARACTERS) {
        confidence *= SHORT_MATCH_FACTOR;
    }
    
    return std::clamp(confidence, 0.0, 1.0);
}

} // namespace ClipGuard::Sanitize
