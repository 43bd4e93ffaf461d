/**
 * @file test_anchors.cpp
 * @brief Alignment segment boundaries
 */

#include "cascade/anchors.h"
#include "test_common.h"
#include <vector>

using namespace cascade;

int main() {
    cascade_test::banner("Cascade - Anchor Detection Test");

    cascade_test::step(1, "Silence gaps and speaker changes");
    {
        const std::vector<Sentence> sentences = {
            Sentence(0, 1000, "你好", 0),
            Sentence(1100, 2000, "今天", 0),
            Sentence(5000, 6000, "天气", 0),     // 3000 ms gap
            Sentence(6100, 7000, "很好", 1),     // speaker change
        };
        const std::vector<size_t> anchors = find_alignment_anchors(sentences);
        CHECK_EQ(anchors, (std::vector<size_t>{0, 2, 3, 4}));

        const std::vector<SegmentSpan> segments = anchors_to_segments(anchors);
        CHECK_EQ(segments.size(), 3u);
        CHECK_EQ(segments[0].begin, 0u);
        CHECK_EQ(segments[0].size(), 2u);
        CHECK_EQ(segments[2].begin, 3u);
        CHECK_EQ(segments[2].end, 4u);

        const std::vector<Sentence> first = segment_sentences(sentences, segments[0]);
        CHECK_EQ(first.size(), 2u);
        CHECK_EQ(first[1].text, std::string("今天"));
    }

    cascade_test::step(2, "Gap plus speaker change is one anchor");
    {
        const std::vector<Sentence> sentences = {
            Sentence(0, 1000, "你好", 0),
            Sentence(1000, 2000, "今天天气", 0),
            Sentence(5000, 6000, "很好", 1),
        };
        CHECK_EQ(find_alignment_anchors(sentences), (std::vector<size_t>{0, 2, 3}));
    }

    cascade_test::step(3, "A gap equal to the threshold does not split");
    {
        const std::vector<Sentence> sentences = {
            Sentence(0, 1000, "a", 0),
            Sentence(3000, 4000, "b", 0),
        };
        CHECK_EQ(find_alignment_anchors(sentences), (std::vector<size_t>{0, 2}));
    }

    cascade_test::step(4, "Speaker split can be disabled");
    {
        const std::vector<Sentence> sentences = {
            Sentence(0, 1000, "a", 0),
            Sentence(1000, 2000, "b", 1),
            Sentence(2000, 3000, "c", 0),
        };
        AnchorOptions options;
        options.split_on_speaker_change = false;
        CHECK_EQ(find_alignment_anchors(sentences, options), (std::vector<size_t>{0, 3}));
        CHECK_EQ(find_alignment_anchors(sentences), (std::vector<size_t>{0, 1, 2, 3}));
    }

    cascade_test::step(5, "Long monologue is cut at the maximum duration");
    {
        AnchorOptions options;
        options.max_segment_duration_ms = 10000;

        std::vector<Sentence> sentences;
        for (int i = 0; i < 12; ++i) {
            sentences.emplace_back(i * 2000, i * 2000 + 1900, "句", 0);
        }
        // Anchors at 0, at the first start past 10 s (12000 ms), then the sentinel
        const std::vector<size_t> anchors = find_alignment_anchors(sentences, options);
        CHECK_EQ(anchors, (std::vector<size_t>{0, 6, 12}));
    }

    cascade_test::step(6, "Empty input and anchor invariants");
    {
        const std::vector<size_t> empty = find_alignment_anchors({});
        CHECK_EQ(empty, (std::vector<size_t>{0, 0}));
        CHECK(anchors_to_segments(empty).empty());

        const std::vector<Sentence> one = {Sentence(0, 500, "嗯", 2)};
        CHECK_EQ(find_alignment_anchors(one), (std::vector<size_t>{0, 1}));

        AnchorOptions invalid;
        invalid.max_segment_duration_ms = 0;
        CHECK_THROWS(invalid.validate(), std::invalid_argument);
    }

    return cascade_test::report();
}
