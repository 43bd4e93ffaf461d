#include "cascade/types.h"
#include <stdexcept>
#include <string>

namespace cascade {

const char* to_string(TextSource source) {
    switch (source) {
        case TextSource::Direct: return "direct";
        case TextSource::Merged: return "merged";
        case TextSource::FuzzyMatch: return "fuzzy_match";
        case TextSource::HallucinationFallback: return "hallucination_fallback";
        case TextSource::SuspiciousFallback: return "suspicious_fallback";
        case TextSource::Empty: return "empty";
        case TextSource::SourceEmpty: return "source_empty";
        case TextSource::ExtractFailed: return "extract_failed";
    }
    return "unknown";
}

bool is_fallback(TextSource source) {
    return source == TextSource::HallucinationFallback ||
           source == TextSource::SuspiciousFallback ||
           source == TextSource::SourceEmpty ||
           source == TextSource::ExtractFailed;
}

// ═══════════════════════════════════════════════════════════
// Option Validation
// ═══════════════════════════════════════════════════════════

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

} // anonymous namespace

void AnchorOptions::validate() const {
    require(min_silence_gap_ms >= 0, "min_silence_gap_ms must be non-negative");
    require(max_segment_duration_ms > 0, "max_segment_duration_ms must be positive");
}

void MatchOptions::validate() const {
    require(min_similarity >= 0.0f && min_similarity <= 1.0f,
            "min_similarity must be within [0, 1]");
    require(min_window_ratio > 0.0f, "min_window_ratio must be positive");
    require(max_window_ratio >= min_window_ratio,
            "max_window_ratio must not be smaller than min_window_ratio");
    require(distance_multiplier > 0, "distance_multiplier must be positive");
    require(min_search_distance > 0, "min_search_distance must be positive");
}

void HallucinationOptions::validate() const {
    require(min_similarity >= 0.0f && min_similarity <= 1.0f,
            "hallucination min_similarity must be within [0, 1]");
    require(min_repeat_length > max_distinct_chars,
            "min_repeat_length must exceed max_distinct_chars");
    require(max_relative_start > 0.0f && max_relative_start <= 1.0f,
            "max_relative_start must be within (0, 1]");
}

void AlignmentOptions::validate() const {
    match.validate();
    hallucination.validate();
    require(boundary_ratio > 0.0f && boundary_ratio <= 1.0f,
            "boundary_ratio must be within (0, 1]");
    require(fallback_step_cap > 0, "fallback_step_cap must be positive");
}

void PipelineOptions::validate() const {
    anchors.validate();
    alignment.validate();
    require(extract_padding_ms >= 0, "extract_padding_ms must be non-negative");
}

} // namespace cascade
