#pragma once

#include "export.h"
#include <cstddef>
#include <string>
#include <vector>

namespace cascade {

// ═══════════════════════════════════════════════════════════
// UTF-8 Helpers
// ═══════════════════════════════════════════════════════════

/**
 * @brief Decode UTF-8 into code points
 *
 * Malformed sequences decode to U+FFFD, one replacement per offending byte,
 * so every input byte is accounted for.
 */
CASCADE_API std::u32string utf8_decode(const std::string& text);

/**
 * @brief Encode code points as UTF-8
 */
CASCADE_API std::string utf8_encode(const std::u32string& text);

/**
 * @brief Encode text[begin, end) as UTF-8 (bounds are clamped)
 */
CASCADE_API std::string utf8_encode(const std::u32string& text, size_t begin, size_t end);

/**
 * @brief Number of code points in a UTF-8 string
 */
CASCADE_API size_t utf8_length(const std::string& text);

/**
 * @brief Trim Unicode whitespace from both ends
 */
CASCADE_API std::u32string trim(const std::u32string& text);
CASCADE_API std::string trim(const std::string& text);

// ═══════════════════════════════════════════════════════════
// Normalization
// ═══════════════════════════════════════════════════════════

/**
 * @brief Comparison form of a string plus its way back to the original
 *
 * index_map[k] is the original offset of the k-th retained character; the
 * map is strictly increasing.
 */
struct NormalizedText {
    std::u32string text;             // Retained, case-folded characters
    std::vector<size_t> index_map;   // normalized position -> original position
    size_t original_length = 0;      // Length of the source string (code points)

    /**
     * @brief Map a normalized position back into the original string
     *
     * Positions at or past the end map to original_length, which makes
     * an exclusive window end map to just after the last retained character
     * and its trailing punctuation.
     */
    size_t map_to_original(size_t normalized_pos) const {
        return normalized_pos < index_map.size() ? index_map[normalized_pos] : original_length;
    }

    size_t size() const { return text.size(); }
    bool empty() const { return text.empty(); }
};

/**
 * @brief True for characters dropped during normalization
 *
 * Covers CJK and Latin sentence punctuation, brackets and quotes,
 * Unicode whitespace and control/format characters.
 */
CASCADE_API bool is_ignorable(char32_t c);

/**
 * @brief Simple lower-case mapping (ASCII, Latin-1, Latin Extended-A, Greek,
 *        Cyrillic, fullwidth Latin)
 */
CASCADE_API char32_t fold_case(char32_t c);

/**
 * @brief Strip punctuation/whitespace and lower-case, keeping the position map
 *
 * normalize_text("") yields an empty text and an empty map. Normalizing an
 * already normalized text changes nothing.
 */
CASCADE_API NormalizedText normalize_text(const std::u32string& text);
CASCADE_API NormalizedText normalize_text(const std::string& text);

/**
 * @brief Normalized form re-encoded as UTF-8
 */
CASCADE_API std::string normalized_string(const std::string& text);

/**
 * @brief Length (code points) of the normalized form
 */
CASCADE_API size_t normalized_length(const std::string& text);

} // namespace cascade
