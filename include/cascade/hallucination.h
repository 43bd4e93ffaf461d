#pragma once

#include "export.h"
#include "types.h"
#include <cstddef>
#include <string>

namespace cascade {

/**
 * @brief Reason a match was (or was not) distrusted
 */
enum class HallucinationVerdict {
    Trusted,            // Match is plausible
    EmptyNeedle,        // Nothing to match
    RepeatedPattern,    // Needle is a degenerate repeat such as "阿阿阿阿"
    NoMatch,            // Search found nothing
    LowSimilarity,      // Match below the trust threshold
    FarFromCursor       // Match starts too far into the remaining text
};

CASCADE_API const char* to_string(HallucinationVerdict verdict);

/**
 * @brief Classify a diarized unit and its match, first failing rule wins
 *
 * Rules, in order:
 *   1. empty needle
 *   2. needle of at least min_repeat_length characters built from at most
 *      max_distinct_chars distinct characters
 *   3. no match
 *   4. similarity below min_similarity
 *   5. match start beyond remaining_len * max_relative_start (remaining_len > 0)
 *
 * @param needle_text Raw diarized text (code points are counted, not bytes)
 * @param match Match found for the needle, or nullptr when none was found
 * @param remaining_len Characters of high-fidelity text left after the cursor
 */
CASCADE_API HallucinationVerdict classify_match(const std::string& needle_text,
                                                const MatchResult* match,
                                                size_t remaining_len,
                                                const HallucinationOptions& options = HallucinationOptions());

/**
 * @brief True when the diarized unit is likely a hallucination or the match is untrustworthy
 */
CASCADE_API bool is_likely_hallucination(const std::string& needle_text,
                                         const MatchResult* match,
                                         size_t remaining_len,
                                         const HallucinationOptions& options = HallucinationOptions());

} // namespace cascade
