/**
 * @file test_fuzzy_matcher.cpp
 * @brief Sequence similarity and distance-constrained substring search
 */

#include "cascade/fuzzy_matcher.h"
#include "cascade/text_normalizer.h"
#include "test_common.h"
#include <string>

using namespace cascade;

int main() {
    cascade_test::banner("Cascade - Fuzzy Matcher Test");

    cascade_test::step(1, "Similarity ratio");
    {
        CHECK_NEAR(similarity_ratio(U"abcd", U"bcde"), 0.75, 1e-9);
        CHECK_NEAR(similarity_ratio(U"", U""), 1.0, 1e-9);
        CHECK_NEAR(similarity_ratio(U"abc", U""), 0.0, 1e-9);
        CHECK_NEAR(similarity_ratio(U"今天天气", U"今天天气"), 1.0, 1e-9);
        CHECK_NEAR(similarity_ratio(U"今天天气", U"今天"), 2.0 * 2 / 6, 1e-9);

        // Two blocks: "ab" and "d"
        SequenceMatcher matcher(U"abxd", U"abd");
        CHECK_EQ(matcher.matching_characters(), 3u);
        CHECK_NEAR(matcher.ratio(), 6.0 / 7.0, 1e-9);

        CHECK_NEAR(SequenceMatcher::length_bound(4, 2), 4.0 / 6.0, 1e-9);
        CHECK_NEAR(SequenceMatcher::length_bound(0, 0), 1.0, 1e-9);
    }

    cascade_test::step(2, "Popular characters do not seed blocks in long sequences");
    {
        // 300 x's then "abc": 'x' is popular in b, so only "abc" can seed
        std::u32string a(300, U'x');
        a += U"abc";
        std::u32string b(300, U'x');
        b += U"abc";
        SequenceMatcher matcher(a, b);
        CHECK_EQ(matcher.matching_characters(), 303u);   // "abc" seeds, the x's extend it
        CHECK_NEAR(matcher.ratio(), 1.0, 1e-9);

        // A popular character cannot seed a block, but the empty block at
        // the start of the longest-match search still extends over it
        std::u32string xs(300, U'x');
        std::u32string xs_b(250, U'x');
        xs_b += std::u32string(50, U'y');
        SequenceMatcher popular(xs, xs_b);
        CHECK_EQ(popular.matching_characters(), 250u);

        // Short sequences keep every character
        CHECK_NEAR(similarity_ratio(U"xxxxabc", U"xxxxabc"), 1.0, 1e-9);
    }

    cascade_test::step(3, "Match ignores punctuation and maps back to original offsets");
    {
        MatchResult match;
        const bool found = fuzzy_substring_search(std::string("今天 天气 真不错"),
                                                  std::string("今天天气"), match);
        CHECK(found);
        CHECK_EQ(match.start_pos, 0u);
        CHECK(match.similarity >= 0.5f);
        CHECK_NEAR(match.similarity, 1.0, 1e-6);
        CHECK_EQ(trim(match.text), std::string("今天 天气"));
    }

    cascade_test::step(4, "Match in the middle of the haystack");
    {
        MatchResult match;
        const bool found = fuzzy_substring_search(std::string("你好，今天天气很好"),
                                                  std::string("天气很"), match);
        CHECK(found);
        CHECK_EQ(match.start_pos, 5u);
        CHECK_EQ(match.end_pos, 8u);
        CHECK_EQ(match.text, std::string("天气很"));
    }

    cascade_test::step(5, "Distance constraint bounds the span");
    {
        // Needle text sits beyond the allowed distance
        const std::string haystack = std::string(60, 'a') + "xyz";
        MatchResult match;
        const bool found = fuzzy_substring_search(haystack, std::string("xyz"), match,
                                                  MatchOptions(), 10);
        CHECK(!found);

        const std::string near = "abxyzcdefghijkl";
        const bool found_near = fuzzy_substring_search(near, std::string("xyz"), match,
                                                       MatchOptions(), 10);
        CHECK(found_near);
        CHECK(match.start_pos <= match.end_pos);
        CHECK(match.end_pos <= 10u);
        CHECK_EQ(match.text, std::string("xyz"));
    }

    cascade_test::step(6, "Below min_similarity is no match");
    {
        MatchResult match;
        CHECK(!fuzzy_substring_search(std::string("完全不同的内容"), std::string("今天天气"), match));
        CHECK(!fuzzy_substring_search(std::string("今天天气"), std::string("，。"), match));
        CHECK(!fuzzy_substring_search(std::string(""), std::string("今天"), match));
    }

    cascade_test::step(7, "Default search distance");
    {
        CHECK_EQ(default_search_distance(4), 50u);
        CHECK_EQ(default_search_distance(30), 90u);

        MatchOptions options;
        options.distance_multiplier = 5;
        options.min_search_distance = 10;
        CHECK_EQ(default_search_distance(4, options), 20u);
    }

    cascade_test::step(8, "Evaluation cap keeps the first windows deterministic");
    {
        MatchOptions capped;
        capped.max_window_evaluations = 1;
        MatchResult match;
        const bool found = fuzzy_substring_search(std::string("今天天气"), std::string("今天天气"),
                                                  match, capped);
        // Only the first (shortest) window at offset 0 is scored: "今天" -> 0.667
        CHECK(found);
        CHECK_EQ(match.start_pos, 0u);
        CHECK_NEAR(match.similarity, 2.0 * 2 / 6, 1e-6);
    }

    return cascade_test::report();
}
