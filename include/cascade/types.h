#pragma once

#include "export.h"
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cascade {

/**
 * @brief Provenance of the text carried by an output record
 *
 * Every record keeps its source so the merge can be audited afterwards.
 */
enum class TextSource {
    Direct,                 // Single-sentence segment, high-fidelity text verbatim
    Merged,                 // Single-speaker segment, whole high-fidelity text in one record
    FuzzyMatch,             // Accepted fuzzy match against the high-fidelity text
    HallucinationFallback,  // Match rejected as hallucination, diarized text used
    SuspiciousFallback,     // Match too close to the search boundary, diarized text used
    Empty,                  // Group text had nothing left after normalization
    SourceEmpty,            // High-fidelity engine produced no usable text
    ExtractFailed           // Audio slicing failed for the segment
};

/**
 * @brief Stable tag for a TextSource ("fuzzy_match", "source_empty", ...)
 */
CASCADE_API const char* to_string(TextSource source);

/**
 * @brief True for sources that carry the diarized engine's own text
 */
CASCADE_API bool is_fallback(TextSource source);

/**
 * @brief Diarized sentence (lower text fidelity, reliable speaker and timing)
 */
struct Sentence {
    int64_t start;           // Start time in milliseconds
    int64_t end;             // End time in milliseconds
    std::string text;        // UTF-8 text from the diarization engine
    int speaker;             // Speaker ID (-1 if unknown)

    Sentence() : start(0), end(0), speaker(-1) {}
    Sentence(int64_t start_ms, int64_t end_ms, std::string sentence_text, int speaker_id)
        : start(start_ms), end(end_ms), text(std::move(sentence_text)), speaker(speaker_id) {}
};

/**
 * @brief Consecutive same-speaker sentences merged into one matching unit
 */
struct SpeakerGroup {
    int speaker;                     // Shared speaker ID
    int64_t start;                   // Start of the first member (ms)
    int64_t end;                     // End of the last member (ms)
    std::string text;                // Member texts concatenated in order
    std::vector<Sentence> members;   // Original sentences, in order

    SpeakerGroup() : speaker(-1), start(0), end(0) {}
};

/**
 * @brief Fuzzy substring match inside a haystack
 *
 * Positions are character (code point) offsets into the searched haystack.
 */
struct MatchResult {
    std::string text;        // haystack[start_pos, end_pos) in UTF-8
    size_t start_pos;        // Inclusive start offset
    size_t end_pos;          // Exclusive end offset
    float similarity;        // Sequence similarity ratio (0.0-1.0)

    MatchResult() : start_pos(0), end_pos(0), similarity(0.0f) {}
};

/**
 * @brief One output record of the merged transcript
 */
struct AlignmentRecord {
    int speaker;             // Speaker ID from the diarized stream
    int64_t start;           // Start time in milliseconds
    int64_t end;             // End time in milliseconds
    std::string text;        // Chosen text (high-fidelity or diarized fallback)
    TextSource source;       // Where the text came from
    int merged_count;        // Number of diarized sentences behind this record (>= 1)
    float similarity;        // Match similarity (FuzzyMatch only, 0 otherwise)

    AlignmentRecord() : speaker(-1), start(0), end(0), source(TextSource::Empty),
                        merged_count(1), similarity(0.0f) {}
};

/**
 * @brief Per-source record counts, ordered by tag
 */
using SourceStats = std::map<TextSource, int>;

// ═══════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════

/**
 * @brief Alignment segment boundaries (anchor detection)
 */
struct AnchorOptions {
    int64_t min_silence_gap_ms = 2000;            // Silence longer than this starts a segment
    int64_t max_segment_duration_ms = 5 * 60 * 1000;  // Forced anchor after this long
    bool split_on_speaker_change = true;          // Speaker switch starts a segment

    /// @throws std::invalid_argument on out-of-range values
    void validate() const;
};

/**
 * @brief Sliding-window fuzzy search parameters
 */
struct MatchOptions {
    float min_similarity = 0.5f;           // Minimum ratio for a match to be returned
    float min_window_ratio = 0.5f;         // Shortest window = needle_len * ratio
    float max_window_ratio = 2.0f;         // Longest window = needle_len * ratio
    int distance_multiplier = 3;           // Default search distance = needle_len * multiplier
    int min_search_distance = 50;          // ...but never below this many characters
    size_t max_window_evaluations = 2000000;  // Cap on (window, offset) pairs per search (0 = no cap)

    /// @throws std::invalid_argument on out-of-range values
    void validate() const;
};

/**
 * @brief Trust thresholds for matched text
 */
struct HallucinationOptions {
    float min_similarity = 0.4f;           // Matches below this are distrusted
    size_t min_repeat_length = 4;          // Needles this long are checked for degenerate repeats
    size_t max_distinct_chars = 2;         // ...and flagged when they use this few characters
    float max_relative_start = 0.5f;       // Match start beyond remaining_len * ratio is distrusted

    /// @throws std::invalid_argument on out-of-range values
    void validate() const;
};

/**
 * @brief Sequential aligner configuration
 */
struct AlignmentOptions {
    MatchOptions match;
    HallucinationOptions hallucination;
    float boundary_ratio = 0.8f;           // Match start beyond max_search_distance * ratio is suspicious
    size_t fallback_step_cap = 20;         // Cursor step on fallback = min(needle_len, cap)

    /// @throws std::invalid_argument on out-of-range values
    void validate() const;
};

/**
 * @brief End-to-end pipeline configuration
 */
struct PipelineOptions {
    AnchorOptions anchors;
    AlignmentOptions alignment;
    int64_t extract_padding_ms = 100;      // Audio padding around each alignment segment
    bool clean_text = true;                // Strip emoji / engine markup from both streams

    /// @throws std::invalid_argument on out-of-range values
    void validate() const;
};

} // namespace cascade
