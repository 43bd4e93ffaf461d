#include "cascade/pipeline.h"
#include "cascade/anchors.h"
#include "cascade/result_assembler.h"
#include "cascade/speaker_grouping.h"
#include "cascade/text_cleanup.h"
#include "cascade/text_normalizer.h"
#include "cascade/transcript_export.h"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace cascade {

namespace {

const PipelineOptions& validated(const PipelineOptions& options) {
    options.validate();
    return options;
}

float seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<float>(std::chrono::steady_clock::now() - start).count();
}

std::string preview(const std::string& text, size_t max_chars = 30) {
    const std::u32string chars = utf8_decode(text);
    if (chars.size() <= max_chars) {
        return text;
    }
    return utf8_encode(chars, 0, max_chars) + "...";
}

} // anonymous namespace

const char* to_string(SegmentStrategy strategy) {
    switch (strategy) {
        case SegmentStrategy::Direct:        return "direct";
        case SegmentStrategy::Merged:        return "merged";
        case SegmentStrategy::Aligned:       return "aligned";
        case SegmentStrategy::SourceEmpty:   return "source_empty";
        case SegmentStrategy::ExtractFailed: return "extract_failed";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════
// ConsoleObserver
// ═══════════════════════════════════════════════════════════

void ConsoleObserver::on_message(LogLevel level, const std::string& message) {
    switch (level) {
        case LogLevel::Debug:
            if (verbose_) {
                std::cout << "[Cascade] " << message << "\n";
            }
            break;
        case LogLevel::Info:
            std::cout << "[Cascade] " << message << "\n";
            break;
        case LogLevel::Warning:
            std::cerr << "[Cascade] WARNING: " << message << "\n";
            break;
        case LogLevel::Error:
            std::cerr << "[Cascade] ERROR: " << message << "\n";
            break;
    }
}

void ConsoleObserver::on_segment(const SegmentReport& report) {
    std::cout << "[Cascade] Segment " << (report.index + 1) << "/" << report.total << ": "
              << std::fixed << std::setprecision(1) << report.duration() << "s, "
              << report.sentence_count << " sentences, "
              << report.speaker_count << " speaker(s) -> " << to_string(report.strategy);
    if (report.strategy == SegmentStrategy::Aligned) {
        std::cout << " (" << report.group_count << " groups, cursor "
                  << report.final_cursor << "/" << report.high_fidelity_chars << ")";
    }
    std::cout << "\n";

    if (!report.error.empty()) {
        std::cerr << "[Cascade]   " << report.error << "\n";
    }
}

void ConsoleObserver::on_complete(const CascadeResult& result) {
    std::cout << "[Cascade] Done: " << result.records.size() << " records from "
              << result.sentence_count << " sentences in "
              << std::fixed << std::setprecision(2) << result.total_seconds << "s"
              << " (diarization " << result.diarization_seconds << "s, high-fidelity "
              << result.high_fidelity_seconds << "s)\n";
    std::cout << format_source_stats(result.stats);
}

// ═══════════════════════════════════════════════════════════
// CascadePipeline
// ═══════════════════════════════════════════════════════════

CascadePipeline::CascadePipeline(DiarizationEngine& diarizer,
                                 AudioSource& audio,
                                 HighFidelityEngine& high_fidelity,
                                 const PipelineOptions& options,
                                 PipelineObserver* observer)
    : diarizer_(diarizer)
    , audio_(audio)
    , high_fidelity_(high_fidelity)
    , options_(validated(options))
    , aligner_(options_.alignment)
    , observer_(observer ? observer : &null_observer_)
{
}

void CascadePipeline::log(LogLevel level, const std::string& message) const {
    observer_->on_message(level, message);
}

CascadeResult CascadePipeline::process(const std::string& audio_path) {
    auto total_start = std::chrono::steady_clock::now();

    log(LogLevel::Info, "Diarizing " + audio_path);
    auto diarize_start = std::chrono::steady_clock::now();
    std::vector<Sentence> sentences = diarizer_.diarize(audio_path);
    const float diarization_seconds = seconds_since(diarize_start);

    if (sentences.empty()) {
        throw std::runtime_error("Diarization produced no sentences: " + audio_path);
    }

    std::ostringstream msg;
    msg << "Detected " << sentences.size() << " sentences in "
        << std::fixed << std::setprecision(2) << diarization_seconds << "s";
    log(LogLevel::Info, msg.str());

    CascadeResult result = process_sentences(audio_path, sentences);
    result.diarization_seconds = diarization_seconds;
    result.total_seconds = seconds_since(total_start);

    observer_->on_complete(result);
    return result;
}

CascadeResult CascadePipeline::process_sentences(const std::string& audio_path,
                                                 const std::vector<Sentence>& input) {
    if (input.empty()) {
        throw std::runtime_error("No diarized sentences for " + audio_path);
    }

    auto start = std::chrono::steady_clock::now();

    std::vector<Sentence> sentences = input;
    std::stable_sort(sentences.begin(), sentences.end(),
                     [](const Sentence& a, const Sentence& b) { return a.start < b.start; });
    if (options_.clean_text) {
        for (auto& sentence : sentences) {
            sentence.text = clean_transcript(sentence.text);
        }
    }

    CascadeResult result;
    result.audio_path = audio_path;
    result.sentence_count = sentences.size();

    const auto anchors = find_alignment_anchors(sentences, options_.anchors);
    const auto spans = anchors_to_segments(anchors);
    log(LogLevel::Info, "Found " + std::to_string(spans.size()) + " alignment segments");

    for (size_t i = 0; i < spans.size(); ++i) {
        const std::vector<Sentence> segment = segment_sentences(sentences, spans[i]);

        SegmentReport report;
        report.index = i;
        report.total = spans.size();
        report.first_sentence = spans[i].begin;
        report.sentence_count = segment.size();
        report.start = segment.front().start;
        report.end = segment.back().end;
        report.speaker_count = count_speakers(segment);

        auto records = process_segment(audio_path, segment, report);
        result.records.insert(result.records.end(), records.begin(), records.end());
        result.high_fidelity_seconds += report.high_fidelity_seconds;

        observer_->on_segment(report);
        result.segments.push_back(std::move(report));
    }

    result.stats = compute_source_stats(result.records);
    result.total_seconds = seconds_since(start);
    return result;
}

std::vector<AlignmentRecord> CascadePipeline::process_segment(const std::string& audio_path,
                                                              const std::vector<Sentence>& segment,
                                                              SegmentReport& report) {
    const int64_t clip_start = std::max<int64_t>(0, report.start - options_.extract_padding_ms);
    const int64_t clip_end = report.end + options_.extract_padding_ms;

    AudioClip clip;
    try {
        clip = audio_.extract(audio_path, clip_start, clip_end);
    } catch (const std::exception& e) {
        report.strategy = SegmentStrategy::ExtractFailed;
        report.error = std::string("Audio extraction failed: ") + e.what();
        log(LogLevel::Error, report.error);
        return make_fallback_records(group_by_speaker(segment), TextSource::ExtractFailed);
    }

    std::string text;
    auto inference_start = std::chrono::steady_clock::now();
    try {
        text = high_fidelity_.transcribe(clip.samples, clip.sample_rate);
    } catch (const std::exception& e) {
        report.error = std::string("High-fidelity transcription failed: ") + e.what();
        log(LogLevel::Error, report.error);
        text.clear();
    }
    report.high_fidelity_seconds = seconds_since(inference_start);

    if (options_.clean_text) {
        text = clean_transcript(text);
    }

    return align_segment(segment, text, &report);
}

std::vector<AlignmentRecord> CascadePipeline::align_segment(const std::vector<Sentence>& segment,
                                                            const std::string& high_fidelity_text,
                                                            SegmentReport* report) const {
    SegmentReport local;
    SegmentReport& rep = report ? *report : local;

    if (segment.empty()) {
        return {};
    }

    const std::string text = trim(high_fidelity_text);
    rep.high_fidelity_chars = utf8_length(text);
    rep.speaker_count = count_speakers(segment);

    if (text.empty()) {
        rep.strategy = SegmentStrategy::SourceEmpty;
        log(LogLevel::Warning, "High-fidelity text is empty, using diarized text");
        auto groups = group_by_speaker(segment);
        rep.group_count = groups.size();
        return make_fallback_records(groups, TextSource::SourceEmpty);
    }

    if (segment.size() == 1) {
        rep.strategy = SegmentStrategy::Direct;
        log(LogLevel::Debug, "Single sentence, direct: " + preview(text));
        return {make_segment_record(segment, text, TextSource::Direct)};
    }

    if (rep.speaker_count == 1) {
        rep.strategy = SegmentStrategy::Merged;
        log(LogLevel::Debug, "Single speaker, " + std::to_string(segment.size()) + " sentences merged");
        return {make_segment_record(segment, text, TextSource::Merged)};
    }

    rep.strategy = SegmentStrategy::Aligned;
    const auto groups = group_by_speaker(segment);
    rep.group_count = groups.size();
    log(LogLevel::Debug, std::to_string(rep.speaker_count) + " speakers, aligning " +
                         std::to_string(groups.size()) + " groups");

    const AlignmentPass pass = aligner_.align(text, groups);
    rep.final_cursor = pass.final_cursor;

    for (const auto& g : pass.groups) {
        std::ostringstream line;
        line << "  Speaker " << g.group.speaker << " [" << to_string(g.source) << "]";
        if (g.source == TextSource::FuzzyMatch) {
            line << " sim=" << std::fixed << std::setprecision(2) << g.similarity;
        } else if (g.source == TextSource::HallucinationFallback) {
            line << " (" << to_string(g.verdict) << ")";
        }
        line << " cursor " << g.cursor_before << "->" << g.cursor_after << ": " << preview(g.text);
        log(LogLevel::Debug, line.str());
    }

    return assemble_records(pass);
}

} // namespace cascade
