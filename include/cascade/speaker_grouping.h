#pragma once

#include "export.h"
#include "types.h"
#include <vector>

namespace cascade {

/**
 * @brief Merge consecutive same-speaker sentences into groups
 *
 * Group text is the member texts concatenated with no separator. Groups
 * preserve order, adjacent groups always differ in speaker, and the members
 * of all groups together reproduce the input exactly.
 */
CASCADE_API std::vector<SpeakerGroup> group_by_speaker(const std::vector<Sentence>& sentences);

/**
 * @brief Number of distinct speakers in a sentence list
 */
CASCADE_API size_t count_speakers(const std::vector<Sentence>& sentences);

} // namespace cascade
