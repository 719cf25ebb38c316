/**
 * @file SanitizationService.cpp
 * @brief Detection pass followed by the user rule pass
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Sanitizer.hpp>
#include <algorithm>

namespace ClipGuard::Sanitize {

SanitizationService::SanitizationService(PatternLibrary& library, Core::Logger& logger,
                                         SanitizationPreferences preferences)
    : m_library(library)
    , m_logger(logger)
    , m_resolver(logger)
    , m_preferences(preferences) {
}

std::string SanitizationService::runDetection(std::string_view text,
                                              const SanitizationApplier& applier,
                                              std::vector<SensitiveDataDetection>& detections) const {
    const std::string input(text);
    
    for (const auto& entry : m_library.enabledPatterns()) {
        if (!entry.usable()) {
            continue;
        }
        
        for (const auto& match : findAllMatches(*entry.regex, input)) {
            Span span = spanOf(MatchResolver::selectSpan(match));
            std::string_view matched(input.data() + span.offset, span.length);
            if (utf8Length(matched) < MatchResolver::MIN_MATCH_CHARACTERS) {
                continue;
            }
            
            SensitiveDataDetection detection;
            detection.patternId = entry.pattern.id;
            detection.patternName = entry.pattern.name;
            detection.category = entry.pattern.category;
            detection.matchedText = std::string(matched);
            detection.span = span;
            detection.confidence = ConfidenceScorer::score(matched, entry.pattern);
            detections.push_back(std::move(detection));
        }
    }
    
    std::stable_sort(detections.begin(), detections.end(),
                     [](const SensitiveDataDetection& a, const SensitiveDataDetection& b) {
                         return a.confidence > b.confidence;
                     });
    
    // Highest confidence claims a region first; overlapping weaker hits stay unredacted
    std::vector<const SensitiveDataDetection*> accepted;
    for (auto& detection : detections) {
        if (!ConfidenceScorer::shouldRedact(detection.confidence)) {
            continue;
        }
        bool overlaps = std::any_of(accepted.begin(), accepted.end(),
            [&](const SensitiveDataDetection* other) { return other->span.overlaps(detection.span); });
        if (!overlaps) {
            detection.redacted = true;
            accepted.push_back(&detection);
        }
    }
    
    std::sort(accepted.begin(), accepted.end(),
              [](const SensitiveDataDetection* a, const SensitiveDataDetection* b) {
                  return a->span.offset > b->span.offset;
              });
    
    std::string result = input;
    for (const auto* detection : accepted) {
        result.replace(detection->span.offset, detection->span.length,
                       applier.mask(detection->matchedText));
    }
    return result;
}

std::string SanitizationService::sanitize(std::string_view text) {
    SanitizationPreferences prefs = preferences();
    SanitizationApplier applier(prefs.maskChar);
    
    std::vector<SensitiveDataDetection> detections;
    Resolution resolution;
    
    if (text.empty()) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastDetections.clear();
        m_lastRuleMatches.clear();
        return "";
    }
    
    std::string afterDetection = prefs.detectionEnabled
        ? runDetection(text, applier, detections)
        : std::string(text);
    
    resolution = m_resolver.resolve(m_library.sortedEnabledRules(), afterDetection, applier);
    
    size_t redacted = static_cast<size_t>(std::count_if(detections.begin(), detections.end(),
        [](const SensitiveDataDetection& d) { return d.redacted; }));
    if (redacted > 0 || !resolution.matches.empty()) {
        CLIPGUARD_LOG_DEBUG_F(m_logger, "Sanitized text: %zu detections (%zu redacted), %zu rule replacements",
                              detections.size(), redacted, resolution.matches.size());
    }
    
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastDetections = std::move(detections);
        m_lastRuleMatches = std::move(resolution.matches);
    }
    
    return std::move(resolution.text);
}

std::vector<SensitiveDataDetection> SanitizationService::lastDetections() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastDetections;
}

std::vector<ResolvedMatch> SanitizationService::lastRuleMatches() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastRuleMatches;
}

SanitizationPreferences SanitizationService::preferences() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_preferences;
}

void SanitizationService::setPreferences(const SanitizationPreferences& preferences) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_preferences = preferences;
}

void SanitizationService::setDetectionEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_preferences.detectionEnabled = enabled;
}

void SanitizationService::setMaskChar(char maskChar) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_preferences.maskChar = maskChar;
}

} // namespace ClipGuard::Sanitize
