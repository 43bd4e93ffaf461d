/**
 * @file test_result_assembler.cpp
 * @brief Output records, source statistics and display collapsing
 */

#include "cascade/result_assembler.h"
#include "cascade/speaker_grouping.h"
#include "test_common.h"
#include <string>
#include <vector>

using namespace cascade;

namespace {

AlignmentRecord make(int speaker, int64_t start, int64_t end, const std::string& text,
                     TextSource source, int merged = 1) {
    AlignmentRecord record;
    record.speaker = speaker;
    record.start = start;
    record.end = end;
    record.text = text;
    record.source = source;
    record.merged_count = merged;
    return record;
}

} // anonymous namespace

int main() {
    cascade_test::banner("Cascade - Result Assembler Test");

    const std::vector<Sentence> sentences = {
        Sentence(0, 800, "你好", 0),
        Sentence(800, 1500, "今天", 0),
        Sentence(1500, 2600, "天气", 0),
        Sentence(2600, 3000, "很好", 1),
    };
    const std::vector<SpeakerGroup> groups = group_by_speaker(sentences);

    cascade_test::step(1, "Group records keep group span and member count");
    {
        GroupAlignment alignment;
        alignment.group = groups[0];
        alignment.text = "你好，今天天气";
        alignment.source = TextSource::FuzzyMatch;
        alignment.similarity = 0.8f;

        const AlignmentRecord record = make_record(alignment);
        CHECK_EQ(record.speaker, 0);
        CHECK_EQ(record.start, 0);
        CHECK_EQ(record.end, 2600);
        CHECK_EQ(record.merged_count, 3);
        CHECK_EQ(record.text, std::string("你好，今天天气"));
        CHECK_NEAR(record.similarity, 0.8, 1e-6);

        alignment.source = TextSource::HallucinationFallback;
        CHECK_NEAR(make_record(alignment).similarity, 0.0, 1e-9);

        AlignmentPass pass;
        pass.groups.push_back(alignment);
        GroupAlignment second;
        second.group = groups[1];
        second.text = "很好";
        second.source = TextSource::FuzzyMatch;
        pass.groups.push_back(second);

        const std::vector<AlignmentRecord> records = assemble_records(pass);
        CHECK_EQ(records.size(), 2u);
        CHECK_EQ(records[1].speaker, 1);
        CHECK_EQ(records[1].merged_count, 1);
        CHECK_EQ(total_merged_count(records), 4);
    }

    cascade_test::step(2, "Segment and fallback records");
    {
        const AlignmentRecord direct = make_segment_record({sentences[3]}, "很好。", TextSource::Direct);
        CHECK_EQ(direct.speaker, 1);
        CHECK_EQ(direct.start, 2600);
        CHECK_EQ(direct.end, 3000);
        CHECK_EQ(direct.merged_count, 1);

        const std::vector<Sentence> single_speaker(sentences.begin(), sentences.begin() + 3);
        const AlignmentRecord merged = make_segment_record(single_speaker, "你好，今天天气。", TextSource::Merged);
        CHECK_EQ(merged.merged_count, 3);
        CHECK_EQ(merged.end, 2600);
        CHECK(merged.source == TextSource::Merged);

        const std::vector<AlignmentRecord> fallback = make_fallback_records(groups, TextSource::SourceEmpty);
        CHECK_EQ(fallback.size(), 2u);
        CHECK_EQ(fallback[0].text, std::string("你好今天天气"));
        CHECK_EQ(fallback[0].merged_count, 3);
        CHECK(fallback[1].source == TextSource::SourceEmpty);
        CHECK(is_fallback(TextSource::SourceEmpty));
        CHECK(is_fallback(TextSource::ExtractFailed));
        CHECK(!is_fallback(TextSource::FuzzyMatch));
    }

    cascade_test::step(3, "Source statistics");
    {
        const std::vector<AlignmentRecord> records = {
            make(0, 0, 1000, "a", TextSource::FuzzyMatch),
            make(1, 1000, 2000, "b", TextSource::FuzzyMatch),
            make(0, 2000, 3000, "c", TextSource::HallucinationFallback),
            make(1, 3000, 4000, "", TextSource::Empty),
        };
        const SourceStats stats = compute_source_stats(records);
        CHECK_EQ(stats.size(), 3u);
        CHECK_EQ(stats.at(TextSource::FuzzyMatch), 2);
        CHECK_EQ(stats.at(TextSource::HallucinationFallback), 1);
        CHECK_EQ(stats.at(TextSource::Empty), 1);
        CHECK(compute_source_stats({}).empty());

        CHECK_EQ(std::string(to_string(TextSource::SuspiciousFallback)), std::string("suspicious_fallback"));
        CHECK_EQ(std::string(to_string(TextSource::ExtractFailed)), std::string("extract_failed"));
    }

    cascade_test::step(4, "Collapsing speaker runs for display");
    {
        const std::vector<AlignmentRecord> records = {
            make(0, 0, 1000, "你好", TextSource::Direct),
            make(0, 1200, 2000, "今天", TextSource::Direct, 2),
            make(1, 2000, 2500, "", TextSource::Empty),
            make(0, 2500, 3000, "天气", TextSource::FuzzyMatch),
            make(1, 3000, 4000, "很好", TextSource::FuzzyMatch),
        };
        const std::vector<AlignmentRecord> collapsed = collapse_speaker_runs(records);

        // The empty record disappears, which joins the first three of speaker 0
        CHECK_EQ(collapsed.size(), 2u);
        CHECK_EQ(collapsed[0].text, std::string("你好今天天气"));
        CHECK_EQ(collapsed[0].start, 0);
        CHECK_EQ(collapsed[0].end, 3000);
        CHECK_EQ(collapsed[0].merged_count, 4);
        CHECK(collapsed[0].source == TextSource::Merged);

        CHECK_EQ(collapsed[1].speaker, 1);
        CHECK(collapsed[1].source == TextSource::FuzzyMatch);

        const std::vector<AlignmentRecord> same = collapse_speaker_runs({records[0], records[1]});
        CHECK_EQ(same.size(), 1u);
        CHECK(same[0].source == TextSource::Direct);
    }

    return cascade_test::report();
}
