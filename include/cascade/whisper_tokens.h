#pragma once

#include "export.h"
#include <cstdint>
#include <string>
#include <vector>

namespace cascade {

/**
 * @brief Text span produced by a timestamped Whisper decode
 */
struct TimedText {
    int64_t start;           // Start time in milliseconds
    int64_t end;             // End time in milliseconds
    std::string text;        // Trimmed UTF-8 text

    TimedText() : start(0), end(0) {}
};

/**
 * @brief Parse a timestamp token like "<|2.50|>"
 *
 * @return Time in seconds, or -1.0f if the token is not a timestamp
 */
CASCADE_API float parse_timestamp_token(const std::string& token);

/**
 * @brief True for any "<|...|>" control token (language, task, timestamps)
 */
CASCADE_API bool is_special_token(const std::string& token);

/**
 * @brief Decode one byte-level BPE token to raw bytes
 *
 * Whisper's vocabulary stores every byte as a printable code point
 * (space is "Ġ", U+0120). CJK characters span several tokens, so bytes
 * must be concatenated before the result is valid UTF-8.
 */
CASCADE_API std::string token_to_bytes(const std::string& token);

/**
 * @brief Decode a token sequence to trimmed UTF-8 text, skipping control tokens
 */
CASCADE_API std::string decode_tokens(const std::vector<std::string>& tokens);

/**
 * @brief Split a timestamped token sequence into timed spans
 *
 * Expects Whisper's "<|t0|> text <|t1|>" pattern. Text before the first
 * timestamp starts at offset_ms, text after the last timestamp closes at
 * chunk_end_ms. Empty spans are dropped.
 *
 * @param tokens Generated tokens for one 30 second window
 * @param offset_ms Window start in the file
 * @param chunk_end_ms Window end in the file
 */
CASCADE_API std::vector<TimedText> split_timestamped_tokens(const std::vector<std::string>& tokens,
                                                            int64_t offset_ms,
                                                            int64_t chunk_end_ms);

} // namespace cascade
