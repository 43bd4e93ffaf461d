#pragma once

#include "export.h"
#include "types.h"
#include <map>
#include <string>
#include <vector>

namespace cascade {

/**
 * @brief Transcript output formats
 */
enum class TranscriptFormat {
    Text,       // Human-readable "Speaker N: text" listing
    SRT,        // SubRip (.srt)
    VTT,        // WebVTT (.vtt) with voice tags
    JSON        // Records with provenance (.json)
};

/**
 * @brief Transcript export configuration
 */
struct TranscriptExportOptions {
    // ═══════════════════════════════════════════════════════════
    // Format Options
    // ═══════════════════════════════════════════════════════════
    TranscriptFormat format = TranscriptFormat::Text;

    // ═══════════════════════════════════════════════════════════
    // Text Listing
    // ═══════════════════════════════════════════════════════════
    bool collapse_speaker_runs = true;     // One line per consecutive same-speaker run
    bool show_merged_count = true;         // Append " [merged N]" when N > 1
    bool show_sources = false;             // Append " (source: tag)"

    // ═══════════════════════════════════════════════════════════
    // Speaker Labels
    // ═══════════════════════════════════════════════════════════
    bool include_speakers = true;          // Prefix subtitle cues with the speaker
    std::string speaker_format = "[{label}] {text}";  // Format: {label}, {text}, {id}
    std::map<int, std::string> speaker_names;  // Custom speaker names (speaker_id -> name)

    // ═══════════════════════════════════════════════════════════
    // Subtitles
    // ═══════════════════════════════════════════════════════════
    int max_chars_per_line = 42;           // Max characters per line (code points)
    int max_lines = 2;                     // Max lines per cue
    bool auto_split_long_text = false;     // Wrap long cue text
    int64_t min_duration_ms = 300;         // Minimum cue duration
    bool vtt_voice_tags = true;            // Wrap VTT cue text in <v Speaker> tags

    // ═══════════════════════════════════════════════════════════
    // Output
    // ═══════════════════════════════════════════════════════════
    std::string output_path;               // Output file path (empty = auto-generate)
};

/**
 * @brief One subtitle cue
 */
struct TranscriptEntry {
    int index;                             // Cue number (1-based)
    int64_t start;                         // Start time (ms)
    int64_t end;                           // End time (ms)
    std::string text;                      // Cue text (speaker prefix applied)
    int speaker_id = -1;                   // Speaker ID (-1 = unknown)

    TranscriptEntry() : index(0), start(0), end(0) {}
};

/**
 * @brief Transcript Exporter
 *
 * Renders merged records as a text listing, SRT, WebVTT or JSON. Records
 * with empty text never produce output.
 *
 * Example usage:
 * @code
 * cascade::TranscriptExporter exporter;
 * exporter.export_transcript(result.records, "meeting.wav");   // meeting_cascade.txt
 *
 * cascade::TranscriptExportOptions options;
 * options.format = cascade::TranscriptFormat::VTT;
 * exporter.export_transcript(result.records, "meeting.wav", options);  // meeting.vtt
 * @endcode
 */
class CASCADE_API TranscriptExporter {
public:
    TranscriptExporter() = default;
    ~TranscriptExporter() = default;

    /**
     * @brief Write records to disk in options.format
     *
     * @param records Merged transcript
     * @param audio_path Source audio (for naming and the text header)
     * @param options Export configuration
     * @return Output file path
     * @throws std::runtime_error if the file cannot be written
     */
    std::string export_transcript(const std::vector<AlignmentRecord>& records,
                                  const std::string& audio_path,
                                  const TranscriptExportOptions& options = TranscriptExportOptions());

    // ═══════════════════════════════════════════════════════════
    // Formatting
    // ═══════════════════════════════════════════════════════════

    static std::string format_text(const std::vector<AlignmentRecord>& records,
                                   const std::string& audio_name,
                                   const TranscriptExportOptions& options = TranscriptExportOptions());

    static std::string format_srt(const std::vector<AlignmentRecord>& records,
                                  const TranscriptExportOptions& options = TranscriptExportOptions());

    static std::string format_vtt(const std::vector<AlignmentRecord>& records,
                                  const TranscriptExportOptions& options = TranscriptExportOptions());

    static std::string format_json(const std::vector<AlignmentRecord>& records,
                                   const std::string& audio_name);

    /**
     * @brief Convert records to subtitle cues
     *
     * Skips empty records, applies the speaker format, wrapping and the
     * minimum cue duration.
     */
    static std::vector<TranscriptEntry> records_to_entries(const std::vector<AlignmentRecord>& records,
                                                           const TranscriptExportOptions& options);

    // ═══════════════════════════════════════════════════════════
    // Utilities
    // ═══════════════════════════════════════════════════════════

    /**
     * @brief Format milliseconds as HH:MM:SS<sep>mmm
     *
     * SRT uses ',' and VTT uses '.' as separator.
     */
    static std::string format_timestamp(int64_t ms, char separator);

    /**
     * @brief Output path next to the audio file
     *
     * Text -> <stem>_cascade.txt, SRT -> <stem>.srt, VTT -> <stem>.vtt,
     * JSON -> <stem>_cascade.json
     */
    static std::string generate_output_path(const std::string& audio_path,
                                            TranscriptFormat format);

    /**
     * @brief Display label for a speaker ("Speaker 2" or a custom name)
     */
    static std::string speaker_label(int speaker_id, const TranscriptExportOptions& options);

    /**
     * @brief Replace {label}, {id} and {text} in a format string
     */
    static std::string apply_speaker_format(const std::string& format_string,
                                            int speaker_id,
                                            const std::string& speaker_label,
                                            const std::string& text);

    /**
     * @brief Wrap text into at most max_lines lines
     *
     * Breaks at spaces where possible; runs without spaces (CJK) are broken
     * at max_chars_per_line code points.
     */
    static std::string split_text(const std::string& text,
                                  int max_chars_per_line,
                                  int max_lines = 2);
};

/**
 * @brief Human-readable transcript listing
 */
CASCADE_API std::string format_transcript(const std::vector<AlignmentRecord>& records,
                                          const std::string& audio_name,
                                          const TranscriptExportOptions& options = TranscriptExportOptions());

/**
 * @brief Per-source summary ("  fuzzy_match: 12 (60.0%)" lines)
 */
CASCADE_API std::string format_source_stats(const SourceStats& stats);

} // namespace cascade
