#pragma once

#include "export.h"
#include "types.h"
#include "sequential_aligner.h"
#include <string>
#include <vector>

namespace cascade {

// ═══════════════════════════════════════════════════════════
// Record Construction
// ═══════════════════════════════════════════════════════════

/**
 * @brief Output record for one aligned speaker group
 *
 * merged_count is the number of member sentences; the group's text is
 * kept whole, never split back across members.
 */
CASCADE_API AlignmentRecord make_record(const GroupAlignment& alignment);

/**
 * @brief Output records of one alignment pass, in group order
 */
CASCADE_API std::vector<AlignmentRecord> assemble_records(const AlignmentPass& pass);

/**
 * @brief Single record spanning a whole segment
 *
 * Used for single-sentence (Direct) and single-speaker (Merged) segments.
 * Speaker comes from the first sentence, merged_count is the sentence count.
 */
CASCADE_API AlignmentRecord make_segment_record(const std::vector<Sentence>& sentences,
                                                const std::string& text,
                                                TextSource source);

/**
 * @brief One fallback record per group carrying the group's own text
 *
 * Used when a segment has no high-fidelity text at all (SourceEmpty,
 * ExtractFailed).
 */
CASCADE_API std::vector<AlignmentRecord> make_fallback_records(const std::vector<SpeakerGroup>& groups,
                                                               TextSource source);

// ═══════════════════════════════════════════════════════════
// Statistics & Post-processing
// ═══════════════════════════════════════════════════════════

/**
 * @brief Count records per source tag
 */
CASCADE_API SourceStats compute_source_stats(const std::vector<AlignmentRecord>& records);

/**
 * @brief Total number of diarized sentences represented by the records
 */
CASCADE_API int total_merged_count(const std::vector<AlignmentRecord>& records);

/**
 * @brief Merge consecutive non-empty records of the same speaker for display
 *
 * Texts are concatenated, spans widened and merged counts summed. The source
 * is kept when all merged records agree, otherwise it becomes Merged. Records
 * with empty text are dropped.
 */
CASCADE_API std::vector<AlignmentRecord> collapse_speaker_runs(const std::vector<AlignmentRecord>& records);

} // namespace cascade
