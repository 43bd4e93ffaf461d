#include "cascade/anchors.h"
#include <algorithm>

namespace cascade {

std::vector<size_t> find_alignment_anchors(const std::vector<Sentence>& sentences,
                                           const AnchorOptions& options) {
    if (sentences.empty()) {
        return {0, 0};
    }

    std::vector<size_t> anchors;
    anchors.push_back(0);
    int64_t last_anchor_time = sentences[0].start;

    for (size_t i = 1; i < sentences.size(); ++i) {
        const Sentence& prev = sentences[i - 1];
        const Sentence& curr = sentences[i];

        const int64_t gap = curr.start - prev.end;
        const int64_t elapsed = curr.start - last_anchor_time;

        const bool is_anchor =
            gap > options.min_silence_gap_ms ||
            (options.split_on_speaker_change && prev.speaker != curr.speaker) ||
            elapsed > options.max_segment_duration_ms;

        if (is_anchor) {
            anchors.push_back(i);
            last_anchor_time = curr.start;
        }
    }

    anchors.push_back(sentences.size());
    return anchors;
}

std::vector<SegmentSpan> anchors_to_segments(const std::vector<size_t>& anchors) {
    std::vector<SegmentSpan> segments;
    for (size_t i = 0; i + 1 < anchors.size(); ++i) {
        if (anchors[i + 1] > anchors[i]) {
            segments.push_back({anchors[i], anchors[i + 1]});
        }
    }
    return segments;
}

std::vector<Sentence> segment_sentences(const std::vector<Sentence>& sentences,
                                        const SegmentSpan& span) {
    const size_t end = std::min(span.end, sentences.size());
    const size_t begin = std::min(span.begin, end);
    return std::vector<Sentence>(sentences.begin() + begin, sentences.begin() + end);
}

} // namespace cascade
