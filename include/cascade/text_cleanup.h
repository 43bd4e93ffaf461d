#pragma once

#include "export.h"
#include <string>

namespace cascade {

/**
 * @brief Remove emoji and pictographic symbols, then trim
 *
 * Drops the emoticon, pictograph, transport, flag, dingbat,
 * supplemental-symbol and miscellaneous-symbol blocks. CJK text and
 * punctuation are untouched.
 */
CASCADE_API std::string remove_emoji(const std::string& text);

/**
 * @brief Remove engine markup such as "<|zh|><|NEUTRAL|><|Speech|>"
 *
 * Tags are "<", optional spaces, "|", anything but "|", "|", optional
 * spaces, ">". Whitespace runs collapse to a single space and the result
 * is trimmed.
 */
CASCADE_API std::string remove_engine_tags(const std::string& text);

/**
 * @brief Engine tags first, then emoji
 */
CASCADE_API std::string clean_transcript(const std::string& text);

} // namespace cascade
