#pragma once

#include "export.h"
#include "types.h"
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace cascade {

/**
 * @brief Ratcliff/Obershelp sequence similarity
 *
 * Sums the longest matching blocks of two sequences recursively and reports
 * ratio = 2 * matches / (len(a) + len(b)). Sequences of 200 or more
 * characters get the "popular element" heuristic: characters making up more
 * than 1% of `b` (plus one) are not used to seed a block, exactly as
 * difflib.SequenceMatcher does with autojunk enabled.
 *
 * All matching happens in the constructor; the sequences need not outlive it.
 *
 * Example usage:
 * @code
 * cascade::SequenceMatcher matcher(U"abcd", U"bcde");
 * double r = matcher.ratio();   // 0.75
 * @endcode
 */
class CASCADE_API SequenceMatcher {
public:
    SequenceMatcher(const std::u32string& a, const std::u32string& b);

    /**
     * @brief Total number of characters in matching blocks
     */
    size_t matching_characters() const { return matches_; }

    /**
     * @brief Similarity in [0, 1]; two empty sequences are identical (1.0)
     */
    double ratio() const;

    /**
     * @brief Upper bound on ratio() from lengths alone
     */
    static double length_bound(size_t len_a, size_t len_b);

private:
    struct Block {
        size_t a;
        size_t b;
        size_t size;
    };

    Block find_longest_match(size_t alo, size_t ahi, size_t blo, size_t bhi);
    size_t count_matches();

    // Only read during construction
    const std::u32string& a_;
    const std::u32string& b_;
    size_t len_a_;
    size_t len_b_;
    std::unordered_map<char32_t, std::vector<size_t>> b2j_;
    size_t matches_ = 0;

    // Rolling rows of the longest-match table, indexed by j + 1
    std::vector<size_t> row_;
    std::vector<size_t> next_row_;
    std::vector<size_t> touched_;
    std::vector<size_t> next_touched_;
};

/**
 * @brief Convenience wrapper around SequenceMatcher::ratio()
 */
CASCADE_API double similarity_ratio(const std::u32string& a, const std::u32string& b);

/**
 * @brief Distance-constrained fuzzy substring search
 *
 * Looks for the window of `haystack` that best matches `needle`, considering
 * only the first `max_search_distance` characters of the haystack so a single
 * unit can never claim text far ahead of the current position.
 *
 * Both strings are compared in normalized form (see normalize_text); the
 * reported span is mapped back into original haystack coordinates and always
 * lies within [0, min(len(haystack), max_search_distance)].
 *
 * Window lengths run from needle_len * min_window_ratio to
 * needle_len * max_window_ratio, shortest first, and offsets left to right;
 * the first window with the strictly highest score wins.
 *
 * @param haystack Text to search (high-fidelity transcript, remaining part)
 * @param needle Text to find (one diarized unit)
 * @param match Output match when found
 * @param options Thresholds and window bounds
 * @param max_search_distance Characters of haystack to consider
 *        (0 = max(needle_len * distance_multiplier, min_search_distance))
 * @return True if a window reached options.min_similarity
 */
CASCADE_API bool fuzzy_substring_search(const std::u32string& haystack,
                                        const std::u32string& needle,
                                        MatchResult& match,
                                        const MatchOptions& options = MatchOptions(),
                                        size_t max_search_distance = 0);

/**
 * @brief UTF-8 overload of fuzzy_substring_search()
 */
CASCADE_API bool fuzzy_substring_search(const std::string& haystack,
                                        const std::string& needle,
                                        MatchResult& match,
                                        const MatchOptions& options = MatchOptions(),
                                        size_t max_search_distance = 0);

/**
 * @brief Default search distance for a needle of the given normalized length
 */
CASCADE_API size_t default_search_distance(size_t needle_len,
                                           const MatchOptions& options = MatchOptions());

} // namespace cascade
