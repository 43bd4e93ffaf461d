#include "cascade/result_assembler.h"
#include <algorithm>

namespace cascade {

AlignmentRecord make_record(const GroupAlignment& alignment) {
    AlignmentRecord record;
    record.speaker = alignment.group.speaker;
    record.start = alignment.group.start;
    record.end = alignment.group.end;
    record.text = alignment.text;
    record.source = alignment.source;
    record.merged_count = std::max<int>(1, static_cast<int>(alignment.group.members.size()));
    record.similarity = alignment.source == TextSource::FuzzyMatch ? alignment.similarity : 0.0f;
    return record;
}

std::vector<AlignmentRecord> assemble_records(const AlignmentPass& pass) {
    std::vector<AlignmentRecord> records;
    records.reserve(pass.groups.size());
    for (const auto& alignment : pass.groups) {
        records.push_back(make_record(alignment));
    }
    return records;
}

AlignmentRecord make_segment_record(const std::vector<Sentence>& sentences,
                                    const std::string& text,
                                    TextSource source) {
    AlignmentRecord record;
    record.text = text;
    record.source = source;
    if (sentences.empty()) {
        return record;
    }

    record.speaker = sentences.front().speaker;
    record.start = sentences.front().start;
    record.end = sentences.back().end;
    record.merged_count = static_cast<int>(sentences.size());
    return record;
}

std::vector<AlignmentRecord> make_fallback_records(const std::vector<SpeakerGroup>& groups,
                                                   TextSource source) {
    std::vector<AlignmentRecord> records;
    records.reserve(groups.size());

    for (const auto& group : groups) {
        AlignmentRecord record;
        record.speaker = group.speaker;
        record.start = group.start;
        record.end = group.end;
        record.text = group.text;
        record.source = source;
        record.merged_count = std::max<int>(1, static_cast<int>(group.members.size()));
        records.push_back(std::move(record));
    }

    return records;
}

SourceStats compute_source_stats(const std::vector<AlignmentRecord>& records) {
    SourceStats stats;
    for (const auto& record : records) {
        stats[record.source]++;
    }
    return stats;
}

int total_merged_count(const std::vector<AlignmentRecord>& records) {
    int total = 0;
    for (const auto& record : records) {
        total += record.merged_count;
    }
    return total;
}

std::vector<AlignmentRecord> collapse_speaker_runs(const std::vector<AlignmentRecord>& records) {
    std::vector<AlignmentRecord> collapsed;

    for (const auto& record : records) {
        if (record.text.empty()) {
            continue;
        }

        if (!collapsed.empty() && collapsed.back().speaker == record.speaker) {
            AlignmentRecord& run = collapsed.back();
            run.text += record.text;
            run.start = std::min(run.start, record.start);
            run.end = std::max(run.end, record.end);
            run.merged_count += record.merged_count;
            if (run.source != record.source) {
                run.source = TextSource::Merged;
                run.similarity = 0.0f;
            }
            continue;
        }

        collapsed.push_back(record);
    }

    return collapsed;
}

} // namespace cascade
