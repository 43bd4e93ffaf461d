#pragma once

#include "export.h"
#include "types.h"
#include "hallucination.h"
#include <cstddef>
#include <string>
#include <vector>

namespace cascade {

/**
 * @brief Outcome of aligning one speaker group
 */
struct GroupAlignment {
    SpeakerGroup group;              // The aligned unit
    std::string text;                // Chosen text
    TextSource source;               // FuzzyMatch, HallucinationFallback, SuspiciousFallback or Empty
    HallucinationVerdict verdict;    // Detector verdict (Trusted unless rejected)
    float similarity;                // Match similarity (0 if no match)
    size_t cursor_before;            // Cursor when the group was visited
    size_t cursor_after;             // Cursor after the group (>= cursor_before)

    GroupAlignment() : source(TextSource::Empty), verdict(HallucinationVerdict::Trusted),
                       similarity(0.0f), cursor_before(0), cursor_after(0) {}
};

/**
 * @brief Result of one alignment segment
 */
struct AlignmentPass {
    std::vector<GroupAlignment> groups;   // One entry per input group, in order
    size_t text_length = 0;               // High-fidelity text length (code points)
    size_t final_cursor = 0;              // Cursor after the last group
};

/**
 * @brief Sequential fuzzy aligner for one alignment segment
 *
 * Walks speaker groups left to right with a cursor into the segment's
 * high-fidelity text. Each group is searched only in the text after the
 * cursor and only within a bounded distance, so a bad match can skip at most
 * a few dozen characters. Accepted matches move the cursor to the match end;
 * rejected ones fall back to the group's own text and move the cursor by a
 * small fixed step so later groups stay in sync.
 *
 * The cursor never decreases and never exceeds the text length. The aligner
 * holds no state between calls; one instance can serve any number of
 * segments.
 *
 * Example usage:
 * @code
 * cascade::SequentialAligner aligner;
 * auto pass = aligner.align(hf_text, cascade::group_by_speaker(sentences));
 * for (const auto& g : pass.groups) {
 *     std::cout << g.group.speaker << ": " << g.text << "\n";
 * }
 * @endcode
 */
class CASCADE_API SequentialAligner {
public:
    explicit SequentialAligner(const AlignmentOptions& options = AlignmentOptions());

    /**
     * @brief Align speaker groups against a high-fidelity text
     *
     * @param high_fidelity_text UTF-8 text of the whole segment
     * @param groups Speaker groups of the segment, in time order
     * @return One GroupAlignment per group
     */
    AlignmentPass align(const std::string& high_fidelity_text,
                        const std::vector<SpeakerGroup>& groups) const;

    const AlignmentOptions& get_options() const { return options_; }

private:
    GroupAlignment align_group(const std::u32string& text,
                               const SpeakerGroup& group,
                               size_t cursor) const;

    AlignmentOptions options_;
};

} // namespace cascade
