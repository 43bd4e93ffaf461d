#include "cascade/hallucination.h"
#include "cascade/text_normalizer.h"
#include <set>

namespace cascade {

const char* to_string(HallucinationVerdict verdict) {
    switch (verdict) {
        case HallucinationVerdict::Trusted:         return "trusted";
        case HallucinationVerdict::EmptyNeedle:     return "empty_needle";
        case HallucinationVerdict::RepeatedPattern: return "repeated_pattern";
        case HallucinationVerdict::NoMatch:         return "no_match";
        case HallucinationVerdict::LowSimilarity:   return "low_similarity";
        case HallucinationVerdict::FarFromCursor:   return "far_from_cursor";
    }
    return "unknown";
}

HallucinationVerdict classify_match(const std::string& needle_text,
                                    const MatchResult* match,
                                    size_t remaining_len,
                                    const HallucinationOptions& options) {
    if (needle_text.empty()) {
        return HallucinationVerdict::EmptyNeedle;
    }

    // Degenerate repeats ("阿阿阿阿", "嗯嗯嗯嗯嗯") are typical filler hallucinations
    const std::u32string chars = utf8_decode(needle_text);
    if (chars.size() >= options.min_repeat_length) {
        std::set<char32_t> distinct(chars.begin(), chars.end());
        if (distinct.size() <= options.max_distinct_chars) {
            return HallucinationVerdict::RepeatedPattern;
        }
    }

    if (match == nullptr) {
        return HallucinationVerdict::NoMatch;
    }

    if (match->similarity < options.min_similarity) {
        return HallucinationVerdict::LowSimilarity;
    }

    if (remaining_len > 0) {
        const double limit = static_cast<double>(remaining_len) * options.max_relative_start;
        if (static_cast<double>(match->start_pos) > limit) {
            return HallucinationVerdict::FarFromCursor;
        }
    }

    return HallucinationVerdict::Trusted;
}

bool is_likely_hallucination(const std::string& needle_text,
                             const MatchResult* match,
                             size_t remaining_len,
                             const HallucinationOptions& options) {
    return classify_match(needle_text, match, remaining_len, options) != HallucinationVerdict::Trusted;
}

} // namespace cascade
