/**
 * @file test_transcript_export.cpp
 * @brief Text listing, SRT, WebVTT and JSON rendering of merged records
 */

#include "cascade/transcript_export.h"
#include "cascade/result_assembler.h"
#include "test_common.h"
#include <filesystem>
#include <fstream>
#include <sstream>
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

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

} // anonymous namespace

int main() {
    cascade_test::banner("Cascade - Transcript Export Test");

    const std::vector<AlignmentRecord> records = {
        make(0, 0, 2000, "你好，今天天气", TextSource::FuzzyMatch, 2),
        make(0, 2000, 2500, "不错", TextSource::FuzzyMatch),
        make(1, 2500, 2600, "嗯", TextSource::HallucinationFallback),
        make(1, 2600, 3000, "", TextSource::Empty),
        make(0, 3000, 4000, "\"再见\"", TextSource::Direct),
    };

    cascade_test::step(1, "Timestamps and labels");
    {
        CHECK_EQ(TranscriptExporter::format_timestamp(3723456, ','), std::string("01:02:03,456"));
        CHECK_EQ(TranscriptExporter::format_timestamp(0, '.'), std::string("00:00:00.000"));
        CHECK_EQ(TranscriptExporter::format_timestamp(-5, '.'), std::string("00:00:00.000"));

        TranscriptExportOptions options;
        options.speaker_names[1] = "Alice";
        CHECK_EQ(TranscriptExporter::speaker_label(0, options), std::string("Speaker 0"));
        CHECK_EQ(TranscriptExporter::speaker_label(1, options), std::string("Alice"));
        CHECK_EQ(TranscriptExporter::speaker_label(-1, options), std::string("Unknown"));

        CHECK_EQ(TranscriptExporter::apply_speaker_format("{label} ({id}): {text}", 3, "Speaker 3", "{x}"),
                 std::string("Speaker 3 (3): {x}"));
    }

    cascade_test::step(2, "Text listing collapses runs and skips empty records");
    {
        const std::string text = TranscriptExporter::format_text(records, "meeting.wav");
        CHECK(contains(text, "Audio file: meeting.wav\n"));
        CHECK(contains(text, "Speaker 0: 你好，今天天气不错 [merged 3]\n"));
        CHECK(contains(text, "Speaker 1: 嗯\n"));
        CHECK(contains(text, "Speaker 0: \"再见\"\n"));
        CHECK(!contains(text, "source:"));

        TranscriptExportOptions detailed;
        detailed.collapse_speaker_runs = false;
        detailed.show_sources = true;
        const std::string lines = TranscriptExporter::format_text(records, "meeting.wav", detailed);
        CHECK(contains(lines, "Speaker 0: 你好，今天天气 [merged 2] (source: fuzzy_match)\n"));
        CHECK(contains(lines, "Speaker 1: 嗯 (source: hallucination_fallback)\n"));
        CHECK(!contains(lines, "(source: empty)"));

        const std::string nothing = format_transcript({}, "/tmp/a/b.wav");
        CHECK(contains(nothing, "Audio file: b.wav"));
        CHECK(contains(nothing, "No transcript text detected"));
    }

    cascade_test::step(3, "SRT cues");
    {
        const std::string srt = TranscriptExporter::format_srt(records);
        CHECK(contains(srt, "1\n00:00:00,000 --> 00:00:02,000\n[Speaker 0] 你好，今天天气\n\n"));
        // 100 ms record is stretched to the minimum duration
        CHECK(contains(srt, "3\n00:00:02,500 --> 00:00:02,800\n[Speaker 1] 嗯\n\n"));
        CHECK(contains(srt, "4\n00:00:03,000"));
        CHECK(!contains(srt, "5\n"));

        const std::vector<TranscriptEntry> entries =
            TranscriptExporter::records_to_entries(records, TranscriptExportOptions());
        CHECK_EQ(entries.size(), 4u);
        CHECK_EQ(entries[2].speaker_id, 1);
    }

    cascade_test::step(4, "WebVTT voice tags");
    {
        const std::string vtt = TranscriptExporter::format_vtt(records);
        CHECK_EQ(vtt.find("WEBVTT\n\n"), 0u);
        CHECK(contains(vtt, "00:00:00.000 --> 00:00:02.000\n<v Speaker 0>你好，今天天气</v>\n"));

        TranscriptExportOptions plain;
        plain.vtt_voice_tags = false;
        CHECK(contains(TranscriptExporter::format_vtt(records, plain), "[Speaker 0] 你好，今天天气\n"));
    }

    cascade_test::step(5, "JSON keeps every record with provenance");
    {
        const std::string json = TranscriptExporter::format_json(records, "meeting.wav");
        CHECK(contains(json, "\"audio_file\": \"meeting.wav\""));
        CHECK(contains(json, "\"source\": \"empty\""));
        CHECK(contains(json, "\"text\": \"\\\"再见\\\"\""));
        CHECK(contains(json, "\"similarity\": 0.000"));
        CHECK(contains(json, "\"fuzzy_match\": 2"));
        CHECK(contains(json, "\"merged_count\": 2"));
    }

    cascade_test::step(6, "Line wrapping");
    {
        CHECK_EQ(TranscriptExporter::split_text("short", 42), std::string("short"));
        CHECK_EQ(TranscriptExporter::split_text("one two three four", 9, 2), std::string("one two\nthree"));
        CHECK_EQ(TranscriptExporter::split_text("一二三四五六七八", 3, 2), std::string("一二三\n四五六"));
    }

    cascade_test::step(7, "Files next to the audio");
    {
        CHECK_EQ(TranscriptExporter::generate_output_path("dir/talk.webm", TranscriptFormat::Text),
                 (std::filesystem::path("dir") / "talk_cascade.txt").string());
        CHECK_EQ(TranscriptExporter::generate_output_path("talk.webm", TranscriptFormat::SRT),
                 std::string("talk.srt"));
        CHECK_EQ(TranscriptExporter::generate_output_path("talk.webm", TranscriptFormat::JSON),
                 std::string("talk_cascade.json"));

        const std::filesystem::path dir = std::filesystem::temp_directory_path() / "cascade_export_test";
        std::filesystem::create_directories(dir);
        const std::string audio = (dir / "meeting.wav").string();

        TranscriptExporter exporter;
        const std::string path = exporter.export_transcript(records, audio);
        CHECK_EQ(path, (dir / "meeting_cascade.txt").string());
        CHECK(contains(read_file(path), "Speaker 1: 嗯"));

        TranscriptExportOptions vtt;
        vtt.format = TranscriptFormat::VTT;
        const std::string vtt_path = exporter.export_transcript(records, audio, vtt);
        CHECK_EQ(read_file(vtt_path).find("WEBVTT"), 0u);

        TranscriptExportOptions unwritable;
        unwritable.output_path = (dir / "missing" / "out.txt").string();
        CHECK_THROWS(exporter.export_transcript(records, audio, unwritable), std::runtime_error);

        std::filesystem::remove_all(dir);
    }

    cascade_test::step(8, "Source statistics summary");
    {
        const std::string summary = format_source_stats(compute_source_stats(records));
        CHECK(contains(summary, "Source statistics (5 records):"));
        CHECK(contains(summary, "  fuzzy_match: 2 (40.0%)"));
        CHECK_EQ(format_source_stats(SourceStats()), std::string("Source statistics: no records\n"));
    }

    return cascade_test::report();
}
