#include "cascade/fuzzy_matcher.h"
#include "cascade/text_normalizer.h"
#include <algorithm>

namespace cascade {

namespace {

// Sequences at least this long get the popular-element heuristic
constexpr size_t AUTOJUNK_MIN_LENGTH = 200;

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// SequenceMatcher
// ═══════════════════════════════════════════════════════════

SequenceMatcher::SequenceMatcher(const std::u32string& a, const std::u32string& b)
    : a_(a)
    , b_(b)
    , len_a_(a.size())
    , len_b_(b.size())
    , row_(b.size() + 1, 0)
    , next_row_(b.size() + 1, 0)
{
    for (size_t j = 0; j < b_.size(); ++j) {
        b2j_[b_[j]].push_back(j);
    }

    if (b_.size() >= AUTOJUNK_MIN_LENGTH) {
        const size_t ntest = b_.size() / 100 + 1;
        for (auto it = b2j_.begin(); it != b2j_.end();) {
            if (it->second.size() > ntest) {
                it = b2j_.erase(it);
            } else {
                ++it;
            }
        }
    }

    matches_ = count_matches();
}

SequenceMatcher::Block SequenceMatcher::find_longest_match(size_t alo, size_t ahi,
                                                           size_t blo, size_t bhi) {
    Block best{alo, blo, 0};

    for (size_t i = alo; i < ahi; ++i) {
        auto it = b2j_.find(a_[i]);
        if (it != b2j_.end()) {
            for (size_t j : it->second) {
                if (j < blo) continue;
                if (j >= bhi) break;

                // row_[j] is the run ending at (i - 1, j - 1)
                size_t k = row_[j] + 1;
                next_row_[j + 1] = k;
                next_touched_.push_back(j + 1);

                if (k > best.size) {
                    best.a = i + 1 - k;
                    best.b = j + 1 - k;
                    best.size = k;
                }
            }
        }

        for (size_t idx : touched_) row_[idx] = 0;
        touched_.clear();
        std::swap(row_, next_row_);
        std::swap(touched_, next_touched_);
    }

    for (size_t idx : touched_) row_[idx] = 0;
    touched_.clear();

    // Popular characters never seed a block but may extend one
    while (best.a > alo && best.b > blo && a_[best.a - 1] == b_[best.b - 1]) {
        --best.a;
        --best.b;
        ++best.size;
    }
    while (best.a + best.size < ahi && best.b + best.size < bhi &&
           a_[best.a + best.size] == b_[best.b + best.size]) {
        ++best.size;
    }

    return best;
}

size_t SequenceMatcher::count_matches() {
    struct Range {
        size_t alo, ahi, blo, bhi;
    };

    size_t total = 0;
    std::vector<Range> pending;
    pending.push_back({0, a_.size(), 0, b_.size()});

    while (!pending.empty()) {
        Range r = pending.back();
        pending.pop_back();

        Block block = find_longest_match(r.alo, r.ahi, r.blo, r.bhi);
        if (block.size == 0) {
            continue;
        }

        total += block.size;
        if (r.alo < block.a && r.blo < block.b) {
            pending.push_back({r.alo, block.a, r.blo, block.b});
        }
        if (block.a + block.size < r.ahi && block.b + block.size < r.bhi) {
            pending.push_back({block.a + block.size, r.ahi, block.b + block.size, r.bhi});
        }
    }

    return total;
}

double SequenceMatcher::ratio() const {
    const size_t length = len_a_ + len_b_;
    if (length == 0) {
        return 1.0;
    }
    return 2.0 * static_cast<double>(matches_) / static_cast<double>(length);
}

double SequenceMatcher::length_bound(size_t len_a, size_t len_b) {
    const size_t length = len_a + len_b;
    if (length == 0) {
        return 1.0;
    }
    return 2.0 * static_cast<double>(std::min(len_a, len_b)) / static_cast<double>(length);
}

double similarity_ratio(const std::u32string& a, const std::u32string& b) {
    return SequenceMatcher(a, b).ratio();
}

// ═══════════════════════════════════════════════════════════
// Fuzzy Substring Search
// ═══════════════════════════════════════════════════════════

size_t default_search_distance(size_t needle_len, const MatchOptions& options) {
    return std::max(needle_len * static_cast<size_t>(options.distance_multiplier),
                    static_cast<size_t>(options.min_search_distance));
}

bool fuzzy_substring_search(const std::u32string& haystack,
                            const std::u32string& needle,
                            MatchResult& match,
                            const MatchOptions& options,
                            size_t max_search_distance) {
    const NormalizedText needle_norm = normalize_text(needle);
    if (needle_norm.empty()) {
        return false;
    }

    const size_t needle_len = needle_norm.size();
    if (max_search_distance == 0) {
        max_search_distance = default_search_distance(needle_len, options);
    }

    // Distance constraint: only the head of the haystack is eligible
    const std::u32string search_text = haystack.substr(0, std::min(max_search_distance, haystack.size()));
    const NormalizedText search_norm = normalize_text(search_text);
    if (search_norm.empty()) {
        return false;
    }

    const size_t search_len = search_norm.size();
    const size_t min_window = std::max<size_t>(1, static_cast<size_t>(needle_len * options.min_window_ratio));
    const size_t max_window = std::min(search_len, static_cast<size_t>(needle_len * options.max_window_ratio));

    double best_score = 0.0;
    size_t best_start = 0;
    size_t best_window = 0;
    size_t evaluated = 0;
    bool exhausted = false;

    for (size_t window = min_window; window <= max_window && !exhausted; ++window) {
        // A window this size cannot beat the current best
        const bool hopeless = SequenceMatcher::length_bound(needle_len, window) <= best_score;

        for (size_t start = 0; start + window <= search_len; ++start) {
            if (options.max_window_evaluations > 0 && evaluated >= options.max_window_evaluations) {
                exhausted = true;
                break;
            }
            ++evaluated;

            if (hopeless) {
                continue;
            }

            const std::u32string candidate = search_norm.text.substr(start, window);
            const double score = SequenceMatcher(needle_norm.text, candidate).ratio();

            if (score > best_score) {
                best_score = score;
                best_start = start;
                best_window = window;
            }
        }
    }

    if (best_window == 0 || best_score < options.min_similarity) {
        return false;
    }

    const size_t original_start = search_norm.map_to_original(best_start);
    const size_t original_end = search_norm.map_to_original(best_start + best_window);

    match.start_pos = original_start;
    match.end_pos = original_end;
    match.similarity = static_cast<float>(best_score);
    match.text = utf8_encode(search_text, original_start, original_end);
    return true;
}

bool fuzzy_substring_search(const std::string& haystack,
                            const std::string& needle,
                            MatchResult& match,
                            const MatchOptions& options,
                            size_t max_search_distance) {
    return fuzzy_substring_search(utf8_decode(haystack), utf8_decode(needle),
                                  match, options, max_search_distance);
}

} // namespace cascade
