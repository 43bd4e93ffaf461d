#include "cascade/transcript_export.h"
#include "cascade/result_assembler.h"
#include "cascade/text_normalizer.h"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cascade {

namespace {

const std::string RULE_HEAVY(60, '=');
const std::string RULE_LIGHT(60, '-');

// Records that carry visible text, trimmed
std::vector<AlignmentRecord> visible_records(const std::vector<AlignmentRecord>& records) {
    std::vector<AlignmentRecord> visible;
    for (const auto& record : records) {
        std::string text = trim(record.text);
        if (text.empty()) {
            continue;
        }
        visible.push_back(record);
        visible.back().text = std::move(text);
    }
    return visible;
}

std::string escape_json_string(const std::string& str) {
    std::string escaped;
    escaped.reserve(str.size());

    for (char c : str) {
        switch (c) {
            case '"':  escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    escaped += buf;
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create transcript file: " + path);
    }
    file << content;
    if (!file) {
        throw std::runtime_error("Failed to write transcript file: " + path);
    }
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// High-level Export
// ═══════════════════════════════════════════════════════════

std::string TranscriptExporter::export_transcript(const std::vector<AlignmentRecord>& records,
                                                  const std::string& audio_path,
                                                  const TranscriptExportOptions& options) {
    std::string output_path = options.output_path.empty() ?
        generate_output_path(audio_path, options.format) :
        options.output_path;

    const std::string audio_name = std::filesystem::path(audio_path).filename().string();

    switch (options.format) {
        case TranscriptFormat::Text:
            write_file(output_path, format_text(records, audio_name, options));
            break;
        case TranscriptFormat::SRT:
            write_file(output_path, format_srt(records, options));
            break;
        case TranscriptFormat::VTT:
            write_file(output_path, format_vtt(records, options));
            break;
        case TranscriptFormat::JSON:
            write_file(output_path, format_json(records, audio_name));
            break;
        default:
            throw std::runtime_error("Unsupported transcript format");
    }

    return output_path;
}

// ═══════════════════════════════════════════════════════════
// Text Listing
// ═══════════════════════════════════════════════════════════

std::string TranscriptExporter::format_text(const std::vector<AlignmentRecord>& records,
                                            const std::string& audio_name,
                                            const TranscriptExportOptions& options) {
    std::vector<AlignmentRecord> lines = visible_records(records);
    if (options.collapse_speaker_runs) {
        lines = collapse_speaker_runs(lines);
    }

    std::ostringstream out;
    out << "Audio file: " << audio_name << "\n";
    out << RULE_HEAVY << "\n";
    out << "Speaker transcript:\n";
    out << RULE_LIGHT << "\n";

    if (lines.empty()) {
        out << "No transcript text detected\n";
    }

    for (const auto& record : lines) {
        out << speaker_label(record.speaker, options) << ": " << record.text;
        if (options.show_merged_count && record.merged_count > 1) {
            out << " [merged " << record.merged_count << "]";
        }
        if (options.show_sources) {
            out << " (source: " << to_string(record.source) << ")";
        }
        out << "\n";
    }

    out << "\n" << RULE_HEAVY << "\n";
    return out.str();
}

// ═══════════════════════════════════════════════════════════
// Subtitles
// ═══════════════════════════════════════════════════════════

std::vector<TranscriptEntry> TranscriptExporter::records_to_entries(
    const std::vector<AlignmentRecord>& records,
    const TranscriptExportOptions& options) {

    std::vector<TranscriptEntry> entries;
    int entry_index = 1;

    for (const auto& record : visible_records(records)) {
        TranscriptEntry entry;
        entry.index = entry_index++;
        entry.start = record.start;
        entry.end = std::max(record.end, record.start + options.min_duration_ms);
        entry.speaker_id = record.speaker;

        std::string text = record.text;
        if (options.auto_split_long_text) {
            text = split_text(text, options.max_chars_per_line, options.max_lines);
        }

        if (options.include_speakers && record.speaker >= 0) {
            entry.text = apply_speaker_format(options.speaker_format,
                                              record.speaker,
                                              speaker_label(record.speaker, options),
                                              text);
        } else {
            entry.text = text;
        }

        entries.push_back(std::move(entry));
    }

    return entries;
}

std::string TranscriptExporter::format_srt(const std::vector<AlignmentRecord>& records,
                                           const TranscriptExportOptions& options) {
    std::ostringstream oss;

    for (const auto& entry : records_to_entries(records, options)) {
        oss << entry.index << "\n";
        oss << format_timestamp(entry.start, ',') << " --> "
            << format_timestamp(entry.end, ',') << "\n";
        oss << entry.text << "\n\n";
    }

    return oss.str();
}

std::string TranscriptExporter::format_vtt(const std::vector<AlignmentRecord>& records,
                                           const TranscriptExportOptions& options) {
    // Voice tags carry the speaker, so the text prefix is left out
    TranscriptExportOptions cue_options = options;
    if (options.vtt_voice_tags) {
        cue_options.include_speakers = false;
    }

    std::ostringstream oss;
    oss << "WEBVTT\n\n";

    for (const auto& entry : records_to_entries(records, cue_options)) {
        oss << entry.index << "\n";
        oss << format_timestamp(entry.start, '.') << " --> "
            << format_timestamp(entry.end, '.') << "\n";

        if (options.vtt_voice_tags && entry.speaker_id >= 0) {
            oss << "<v " << speaker_label(entry.speaker_id, options) << ">"
                << entry.text << "</v>\n\n";
        } else {
            oss << entry.text << "\n\n";
        }
    }

    return oss.str();
}

// ═══════════════════════════════════════════════════════════
// JSON
// ═══════════════════════════════════════════════════════════

std::string TranscriptExporter::format_json(const std::vector<AlignmentRecord>& records,
                                            const std::string& audio_name) {
    std::ostringstream json;
    json << std::setprecision(3) << std::fixed;

    json << "{\n";
    json << "  \"audio_file\": \"" << escape_json_string(audio_name) << "\",\n";
    json << "  \"records\": [\n";

    for (size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];
        json << "    {\n";
        json << "      \"speaker\": " << record.speaker << ",\n";
        json << "      \"start\": " << record.start << ",\n";
        json << "      \"end\": " << record.end << ",\n";
        json << "      \"text\": \"" << escape_json_string(record.text) << "\",\n";
        json << "      \"source\": \"" << to_string(record.source) << "\",\n";
        json << "      \"merged_count\": " << record.merged_count;
        if (record.source == TextSource::FuzzyMatch) {
            json << ",\n      \"similarity\": " << record.similarity;
        }
        json << "\n    }" << (i + 1 < records.size() ? "," : "") << "\n";
    }

    json << "  ],\n";
    json << "  \"stats\": {";

    const SourceStats stats = compute_source_stats(records);
    size_t written = 0;
    for (const auto& [source, count] : stats) {
        json << (written++ == 0 ? "\n" : ",\n");
        json << "    \"" << to_string(source) << "\": " << count;
    }
    json << (stats.empty() ? "}\n" : "\n  }\n");
    json << "}\n";

    return json.str();
}

// ═══════════════════════════════════════════════════════════
// Utilities
// ═══════════════════════════════════════════════════════════

std::string TranscriptExporter::format_timestamp(int64_t ms, char separator) {
    if (ms < 0) {
        ms = 0;
    }

    const int64_t hours = ms / 3600000;
    const int64_t minutes = (ms / 60000) % 60;
    const int64_t secs = (ms / 1000) % 60;
    const int64_t millis = ms % 1000;

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << hours << ":"
        << std::setw(2) << minutes << ":"
        << std::setw(2) << secs << separator
        << std::setw(3) << millis;

    return oss.str();
}

std::string TranscriptExporter::generate_output_path(const std::string& audio_path,
                                                     TranscriptFormat format) {
    std::filesystem::path audio(audio_path);
    std::filesystem::path output = audio.parent_path();

    std::string stem = audio.stem().string();

    switch (format) {
        case TranscriptFormat::SRT:
            output /= stem + ".srt";
            break;
        case TranscriptFormat::VTT:
            output /= stem + ".vtt";
            break;
        case TranscriptFormat::JSON:
            output /= stem + "_cascade.json";
            break;
        default:
            output /= stem + "_cascade.txt";
    }

    return output.string();
}

std::string TranscriptExporter::speaker_label(int speaker_id, const TranscriptExportOptions& options) {
    auto it = options.speaker_names.find(speaker_id);
    if (it != options.speaker_names.end()) {
        return it->second;
    }
    if (speaker_id < 0) {
        return "Unknown";
    }
    return "Speaker " + std::to_string(speaker_id);
}

std::string TranscriptExporter::apply_speaker_format(const std::string& format_string,
                                                     int speaker_id,
                                                     const std::string& speaker_label,
                                                     const std::string& text) {
    std::string result = format_string;

    size_t pos = result.find("{label}");
    if (pos != std::string::npos) {
        result.replace(pos, 7, speaker_label);
    }

    pos = result.find("{id}");
    if (pos != std::string::npos) {
        result.replace(pos, 4, std::to_string(speaker_id));
    }

    // Last, so braces inside the text are left alone
    pos = result.find("{text}");
    if (pos != std::string::npos) {
        result.replace(pos, 6, text);
    }

    return result;
}

std::string TranscriptExporter::split_text(const std::string& text,
                                           int max_chars_per_line,
                                           int max_lines) {
    const std::u32string chars = utf8_decode(text);
    const size_t width = static_cast<size_t>(std::max(1, max_chars_per_line));
    const size_t limit = static_cast<size_t>(std::max(1, max_lines));

    if (chars.size() <= width) {
        return text;
    }

    std::vector<std::u32string> lines;
    std::u32string current;
    const size_t n = chars.size();
    size_t i = 0;

    while (i < n && lines.size() < limit) {
        while (i < n && chars[i] == U' ') ++i;
        size_t j = i;
        while (j < n && chars[j] != U' ') ++j;
        if (j == i) {
            break;
        }

        const std::u32string word = chars.substr(i, j - i);
        i = j;

        if (current.empty()) {
            current = word;
        } else if (current.size() + 1 + word.size() <= width) {
            current += U' ';
            current += word;
        } else {
            lines.push_back(current);
            current = word;
        }

        // Runs without spaces are cut at the line width
        while (current.size() > width && lines.size() < limit) {
            lines.push_back(current.substr(0, width));
            current.erase(0, width);
        }
    }

    if (!current.empty() && lines.size() < limit) {
        lines.push_back(current);
    }

    std::string result;
    for (size_t k = 0; k < lines.size(); ++k) {
        result += utf8_encode(lines[k]);
        if (k + 1 < lines.size()) {
            result += "\n";
        }
    }

    return result;
}

// ═══════════════════════════════════════════════════════════
// Free Functions
// ═══════════════════════════════════════════════════════════

std::string format_transcript(const std::vector<AlignmentRecord>& records,
                              const std::string& audio_name,
                              const TranscriptExportOptions& options) {
    return TranscriptExporter::format_text(records,
                                           std::filesystem::path(audio_name).filename().string(),
                                           options);
}

std::string format_source_stats(const SourceStats& stats) {
    int total = 0;
    for (const auto& [source, count] : stats) {
        total += count;
    }

    std::ostringstream out;
    if (total == 0) {
        out << "Source statistics: no records\n";
        return out.str();
    }

    out << "Source statistics (" << total << " records):\n";
    out << std::fixed << std::setprecision(1);
    for (const auto& [source, count] : stats) {
        out << "  " << to_string(source) << ": " << count
            << " (" << (100.0 * count / total) << "%)\n";
    }

    return out.str();
}

} // namespace cascade
