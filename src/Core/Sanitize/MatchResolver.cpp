/**
 * @file MatchResolver.cpp
 * @brief Sequential rule passes over a shared text buffer
 * @author ClipGuard Team
 * @version 1.0.0
 * @date 2025
 * 
 * @copyright Copyright (c) 2025 ClipGuard. All rights reserved.
 */

#include <ClipGuard/Core/Sanitizer.hpp>
#include <re2/re2.h>

namespace ClipGuard::Sanitize {

Span spanOf(const SpanSelection& selection) noexcept {
    return std::visit([](const auto& s) { return s.span; }, selection);
}

std::vector<RegexMatch> findAllMatches(const re2::RE2& regex, std::string_view text) {
    std::vector<RegexMatch> matches;
    const int groupCount = 1 + regex.NumberOfCapturingGroups();
    std::vector<re2::StringPiece> groups(static_cast<size_t>(groupCount));
    const re2::StringPiece input(text.data(), text.size());
    
    size_t position = 0;
    while (position <= text.size() &&
           regex.Match(input, position, text.size(), re2::RE2::UNANCHORED, groups.data(), groupCount)) {
        RegexMatch match;
        match.groups.reserve(groups.size());
        for (const auto& group : groups) {
            if (group.data() == nullptr) {
                match.groups.emplace_back(std::nullopt);
            } else {
                match.groups.emplace_back(Span{static_cast<size_t>(group.data() - text.data()), group.size()});
            }
        }
        
        const Span whole = *match.groups[0];
        matches.push_back(std::move(match));
        
        if (whole.length > 0) {
            position = whole.end();
            continue;
        }
        position = whole.offset + 1;
        while (position < text.size() && (static_cast<unsigned char>(text[position]) & 0xC0) == 0x80) {
            ++position;
        }
    }
    return matches;
}

SpanSelection MatchResolver::selectSpan(const RegexMatch& match) {
    for (size_t group = 1; group < match.groups.size(); ++group) {
        if (match.groups[group] && match.groups[group]->length > 0) {
            return CapturedSpan{*match.groups[group], group};
        }
    }
    
    return FullMatch{match.groups.empty() ? Span{} : match.groups[0].value_or(Span{})};
}

Resolution MatchResolver::resolve(const std::vector<CompiledRule>& rules,
                                  std::string_view text,
                                  const SanitizationApplier& applier) const {
    Resolution resolution;
    std::string current(text);
    
    for (const auto& entry : rules) {
        const SanitizationRule& rule = entry.rule;
        
        if (!entry.usable()) {
            CLIPGUARD_LOG_DEBUG_F(m_logger, "Skipping rule '%s': %s",
                                  rule.name.c_str(), getErrorMessage(entry.status).data());
            resolution.skippedRules.push_back(rule.id);
            continue;
        }
        
        const std::vector<RegexMatch> matches = findAllMatches(*entry.regex, current);
        
        if (matches.empty()) {
            continue;
        }
        
        std::string next = current;
        for (auto it = matches.rbegin(); it != matches.rend(); ++it) {
            SpanSelection selection = selectSpan(*it);
            Span span = spanOf(selection);
            if (span.length == 0) {
                continue;
            }
            
            std::string_view matched(current.data() + span.offset, span.length);
            if (utf8Length(matched) < MIN_MATCH_CHARACTERS && !rule.allowShortMatches) {
                continue;
            }
            
            std::string replacement = applier.apply(rule.action, matched, rule.replacement);
            next.replace(span.offset, span.length, replacement);
            
            resolution.matches.push_back(ResolvedMatch{
                rule.id, rule.name, selection, std::string(matched), std::move(replacement)
            });
        }
        
        current = std::move(next);
    }
    
    resolution.text = std::move(current);
    return resolution;
}

} // namespace ClipGuard::Sanitize
