#include "cascade/sequential_aligner.h"
#include "cascade/fuzzy_matcher.h"
#include "cascade/text_normalizer.h"
#include <algorithm>

namespace cascade {

SequentialAligner::SequentialAligner(const AlignmentOptions& options)
    : options_(options)
{
    options_.validate();
}

AlignmentPass SequentialAligner::align(const std::string& high_fidelity_text,
                                       const std::vector<SpeakerGroup>& groups) const {
    const std::u32string text = utf8_decode(high_fidelity_text);

    AlignmentPass pass;
    pass.text_length = text.size();
    pass.groups.reserve(groups.size());

    size_t cursor = 0;
    for (const auto& group : groups) {
        pass.groups.push_back(align_group(text, group, cursor));
        cursor = pass.groups.back().cursor_after;
    }

    pass.final_cursor = cursor;
    return pass;
}

GroupAlignment SequentialAligner::align_group(const std::u32string& text,
                                              const SpeakerGroup& group,
                                              size_t cursor) const {
    GroupAlignment result;
    result.group = group;
    result.cursor_before = cursor;
    result.cursor_after = cursor;

    const size_t needle_len = normalized_length(group.text);
    if (needle_len == 0) {
        result.source = TextSource::Empty;
        return result;
    }

    const std::u32string remaining = text.substr(std::min(cursor, text.size()));
    const size_t max_search_distance = default_search_distance(needle_len, options_.match);

    MatchResult match;
    const bool found = fuzzy_substring_search(remaining, utf8_decode(group.text), match,
                                              options_.match, max_search_distance);

    const size_t small_step = std::min(needle_len, options_.fallback_step_cap);
    const size_t text_len = text.size();

    result.verdict = classify_match(group.text, found ? &match : nullptr,
                                    remaining.size(), options_.hallucination);
    if (found) {
        result.similarity = match.similarity;
    }

    if (result.verdict != HallucinationVerdict::Trusted) {
        result.text = group.text;
        result.source = TextSource::HallucinationFallback;
        result.cursor_after = std::min(cursor + small_step, text_len);
        return result;
    }

    // Matches hugging the search boundary are usually a neighbour's text
    if (static_cast<double>(match.start_pos) >
        static_cast<double>(max_search_distance) * options_.boundary_ratio) {
        result.text = group.text;
        result.source = TextSource::SuspiciousFallback;
        result.cursor_after = std::min(cursor + small_step, text_len);
        return result;
    }

    const std::string matched = trim(match.text);
    result.text = matched.empty() ? group.text : matched;
    result.source = TextSource::FuzzyMatch;
    result.cursor_after = std::min(cursor + match.end_pos, text_len);
    return result;
}

} // namespace cascade
