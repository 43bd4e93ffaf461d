/**
 * @file test_hallucination.cpp
 * @brief Trust rules for diarized units and their matches
 */

#include "cascade/hallucination.h"
#include "test_common.h"
#include <string>

using namespace cascade;

namespace {

MatchResult make_match(size_t start, size_t end, float similarity) {
    MatchResult match;
    match.start_pos = start;
    match.end_pos = end;
    match.similarity = similarity;
    return match;
}

} // anonymous namespace

int main() {
    cascade_test::banner("Cascade - Hallucination Detector Test");

    const MatchResult good = make_match(0, 4, 0.9f);

    cascade_test::step(1, "Empty needle");
    {
        CHECK(classify_match("", &good, 100) == HallucinationVerdict::EmptyNeedle);
        CHECK(is_likely_hallucination("", &good, 100));
    }

    cascade_test::step(2, "Degenerate repeats");
    {
        CHECK(classify_match("阿阿阿阿", &good, 100) == HallucinationVerdict::RepeatedPattern);
        CHECK(classify_match("哈哈嘿哈", &good, 100) == HallucinationVerdict::RepeatedPattern);
        CHECK(is_likely_hallucination("阿阿阿阿", nullptr, 100));

        // Three characters are too short to judge, three distinct are fine
        CHECK(classify_match("阿阿阿", &good, 100) == HallucinationVerdict::Trusted);
        CHECK(classify_match("今天天气", &good, 100) == HallucinationVerdict::Trusted);
    }

    cascade_test::step(3, "No match and low similarity");
    {
        CHECK(classify_match("今天天气", nullptr, 100) == HallucinationVerdict::NoMatch);

        const MatchResult weak = make_match(0, 4, 0.39f);
        CHECK(classify_match("今天天气", &weak, 100) == HallucinationVerdict::LowSimilarity);

        const MatchResult borderline = make_match(0, 4, 0.4f);
        CHECK(classify_match("今天天气", &borderline, 100) == HallucinationVerdict::Trusted);
    }

    cascade_test::step(4, "Match too far into the remaining text");
    {
        const MatchResult far = make_match(51, 55, 0.9f);
        CHECK(classify_match("今天天气", &far, 100) == HallucinationVerdict::FarFromCursor);

        const MatchResult halfway = make_match(50, 54, 0.9f);
        CHECK(classify_match("今天天气", &halfway, 100) == HallucinationVerdict::Trusted);

        // Nothing remaining: the position rule does not apply
        CHECK(classify_match("今天天气", &far, 0) == HallucinationVerdict::Trusted);
    }

    cascade_test::step(5, "Custom thresholds");
    {
        HallucinationOptions strict;
        strict.min_similarity = 0.95f;
        strict.max_relative_start = 0.1f;
        CHECK(classify_match("今天天气", &good, 100, strict) == HallucinationVerdict::LowSimilarity);

        HallucinationOptions relaxed;
        relaxed.max_distinct_chars = 1;
        CHECK(classify_match("哈哈嘿哈", &good, 100, relaxed) == HallucinationVerdict::Trusted);
        CHECK(classify_match("阿阿阿阿", &good, 100, relaxed) == HallucinationVerdict::RepeatedPattern);

        HallucinationOptions invalid;
        invalid.min_similarity = 1.5f;
        CHECK_THROWS(invalid.validate(), std::invalid_argument);
    }

    cascade_test::step(6, "Verdict tags");
    {
        CHECK_EQ(std::string(to_string(HallucinationVerdict::Trusted)), std::string("trusted"));
        CHECK_EQ(std::string(to_string(HallucinationVerdict::RepeatedPattern)), std::string("repeated_pattern"));
    }

    return cascade_test::report();
}
