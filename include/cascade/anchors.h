#pragma once

#include "export.h"
#include "types.h"
#include <cstddef>
#include <vector>

namespace cascade {

/**
 * @brief Half-open range of sentence indices [begin, end) forming one alignment segment
 */
struct SegmentSpan {
    size_t begin;
    size_t end;

    size_t size() const { return end - begin; }
};

/**
 * @brief Find alignment anchors in a diarized sentence sequence
 *
 * An anchor is a sentence index where a new alignment segment starts:
 * index 0, any sentence preceded by a silence gap longer than
 * min_silence_gap_ms, any speaker change (when split_on_speaker_change),
 * and any sentence starting more than max_segment_duration_ms after the
 * last anchor. The sentence count is appended as terminal
 * sentinel, so the result is strictly increasing and always ends with
 * sentences.size(). Empty input yields {0, 0}.
 *
 * Example:
 * @code
 * // A(0-1000) A(1100-2000) A(5000-6000) B(6100-7000)
 * find_alignment_anchors(sentences);   // {0, 2, 3, 4}
 * @endcode
 */
CASCADE_API std::vector<size_t> find_alignment_anchors(const std::vector<Sentence>& sentences,
                                                       const AnchorOptions& options = AnchorOptions());

/**
 * @brief Turn an anchor list into consecutive segments
 *
 * Adjacent equal anchors (empty input) produce no segment.
 */
CASCADE_API std::vector<SegmentSpan> anchors_to_segments(const std::vector<size_t>& anchors);

/**
 * @brief Copy out the sentences of one segment
 */
CASCADE_API std::vector<Sentence> segment_sentences(const std::vector<Sentence>& sentences,
                                                    const SegmentSpan& span);

} // namespace cascade
