#pragma once

#include "export.h"
#include "types.h"
#include "engines.h"
#include "sequential_aligner.h"
#include <cstddef>
#include <string>
#include <vector>

namespace cascade {

/**
 * @brief How an alignment segment was resolved
 */
enum class SegmentStrategy {
    Direct,         // One sentence: high-fidelity text taken verbatim
    Merged,         // One speaker: whole high-fidelity text in one record
    Aligned,        // Several speakers: grouped and sequentially aligned
    SourceEmpty,    // No usable high-fidelity text: diarized fallback
    ExtractFailed   // Audio slice failed: diarized fallback
};

CASCADE_API const char* to_string(SegmentStrategy strategy);

/**
 * @brief Per-segment processing summary
 */
struct SegmentReport {
    size_t index;                    // Segment index (0-based)
    size_t total;                    // Number of segments in the file
    size_t first_sentence;           // Index of the first diarized sentence
    size_t sentence_count;           // Diarized sentences in the segment
    int64_t start;                   // Segment start (ms)
    int64_t end;                     // Segment end (ms)
    size_t speaker_count;            // Distinct speakers in the segment
    size_t group_count;              // Speaker groups (Aligned only)
    SegmentStrategy strategy;        // Resolution strategy
    size_t high_fidelity_chars;      // Length of the cleaned high-fidelity text
    size_t final_cursor;             // Aligner cursor after the last group (Aligned only)
    float high_fidelity_seconds;     // Time spent in the high-fidelity engine
    std::string error;               // Extraction / inference failure message, if any

    SegmentReport() : index(0), total(0), first_sentence(0), sentence_count(0),
                      start(0), end(0), speaker_count(0), group_count(0),
                      strategy(SegmentStrategy::Direct), high_fidelity_chars(0),
                      final_cursor(0), high_fidelity_seconds(0.0f) {}

    float duration() const { return static_cast<float>(end - start) / 1000.0f; }
};

/**
 * @brief Complete result for one audio file
 */
struct CascadeResult {
    std::string audio_path;                  // Processed file
    size_t sentence_count;                   // Diarized sentences received
    std::vector<AlignmentRecord> records;    // Merged transcript, in time order
    std::vector<SegmentReport> segments;     // One report per alignment segment
    SourceStats stats;                       // Records per source tag

    // Timing
    float diarization_seconds;
    float high_fidelity_seconds;
    float total_seconds;

    CascadeResult() : sentence_count(0), diarization_seconds(0.0f),
                      high_fidelity_seconds(0.0f), total_seconds(0.0f) {}
};

// ═══════════════════════════════════════════════════════════
// Observer
// ═══════════════════════════════════════════════════════════

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Receives pipeline progress; the pipeline itself never prints
 */
class CASCADE_API PipelineObserver {
public:
    virtual ~PipelineObserver() = default;

    virtual void on_message(LogLevel level, const std::string& message) = 0;
    virtual void on_segment(const SegmentReport& report) = 0;
    virtual void on_complete(const CascadeResult& result) = 0;
};

/**
 * @brief Tagged console output ("[Cascade] ...")
 *
 * Info goes to std::cout, warnings and errors to std::cerr. Debug lines
 * are printed only when verbose.
 */
class CASCADE_API ConsoleObserver : public PipelineObserver {
public:
    explicit ConsoleObserver(bool verbose = false) : verbose_(verbose) {}

    void on_message(LogLevel level, const std::string& message) override;
    void on_segment(const SegmentReport& report) override;
    void on_complete(const CascadeResult& result) override;

private:
    bool verbose_;
};

/**
 * @brief Discards everything
 */
class CASCADE_API NullObserver : public PipelineObserver {
public:
    void on_message(LogLevel, const std::string&) override {}
    void on_segment(const SegmentReport&) override {}
    void on_complete(const CascadeResult&) override {}
};

// ═══════════════════════════════════════════════════════════
// Pipeline
// ═══════════════════════════════════════════════════════════

/**
 * @brief Cascaded transcription: diarized structure, high-fidelity text
 *
 * For each audio file:
 *   1. Diarize into speaker-tagged sentences
 *   2. Split the sentence timeline at anchors (silence, speaker change, max duration)
 *   3. For every segment, slice the audio, run the high-fidelity engine and
 *      merge its text into the segment's sentences
 *   4. Collect records, per-source statistics and timings
 *
 * A failing slice or inference call only affects its own segment, which
 * falls back to the diarized text. A diarization failure aborts the file.
 *
 * The collaborators are borrowed and must outlive the pipeline. One pipeline
 * processes one file at a time; use separate instances for concurrent files.
 *
 * Example usage:
 * @code
 * cascade::AudioExtractor audio;
 * cascade::WhisperEngine whisper(model_options);
 * cascade::DiarizedTranscriber diarized(audio, whisper, &diarizer);
 * cascade::ConsoleObserver console;
 *
 * cascade::CascadePipeline pipeline(diarized, audio, whisper, {}, &console);
 * auto result = pipeline.process("meeting.wav");
 * std::cout << cascade::format_transcript(result.records, "meeting.wav");
 * @endcode
 */
class CASCADE_API CascadePipeline {
public:
    /**
     * @throws std::invalid_argument if options fail validation
     */
    CascadePipeline(DiarizationEngine& diarizer,
                    AudioSource& audio,
                    HighFidelityEngine& high_fidelity,
                    const PipelineOptions& options = PipelineOptions(),
                    PipelineObserver* observer = nullptr);

    // observer_ may point at null_observer_
    CascadePipeline(const CascadePipeline&) = delete;
    CascadePipeline& operator=(const CascadePipeline&) = delete;

    /**
     * @brief Diarize and merge one audio file
     *
     * @throws std::runtime_error if diarization fails or yields no sentences
     */
    CascadeResult process(const std::string& audio_path);

    /**
     * @brief Merge pre-computed diarized sentences for one audio file
     *
     * @throws std::runtime_error if sentences is empty
     */
    CascadeResult process_sentences(const std::string& audio_path,
                                    const std::vector<Sentence>& sentences);

    /**
     * @brief Resolve one segment against its high-fidelity text
     *
     * Chooses Direct, Merged, Aligned or SourceEmpty from the sentence
     * count, speaker count and text.
     *
     * @param segment Sentences of one alignment segment
     * @param high_fidelity_text Cleaned high-fidelity text for the segment
     * @param report Optional report to fill in
     */
    std::vector<AlignmentRecord> align_segment(const std::vector<Sentence>& segment,
                                               const std::string& high_fidelity_text,
                                               SegmentReport* report = nullptr) const;

    const PipelineOptions& get_options() const { return options_; }

private:
    std::vector<AlignmentRecord> process_segment(const std::string& audio_path,
                                                 const std::vector<Sentence>& segment,
                                                 SegmentReport& report);

    void log(LogLevel level, const std::string& message) const;

    DiarizationEngine& diarizer_;
    AudioSource& audio_;
    HighFidelityEngine& high_fidelity_;
    PipelineOptions options_;
    SequentialAligner aligner_;
    NullObserver null_observer_;
    PipelineObserver* observer_;
};

} // namespace cascade
