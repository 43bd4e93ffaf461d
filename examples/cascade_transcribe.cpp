/**
 * @file cascade_transcribe.cpp
 * @brief Speaker-attributed transcription of a file or a directory of files
 *
 * Runs Whisper twice per file: a timestamped pass that is split into
 * speakers, and an untimed high-fidelity pass per alignment segment whose
 * text replaces the diarized text wherever it can be matched.
 */

#include "cascade/audio_extractor.h"
#include "cascade/diarization.h"
#include "cascade/diarized_transcriber.h"
#include "cascade/pipeline.h"
#include "cascade/transcript_export.h"
#include "cascade/whisper_engine.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace {

struct CliOptions {
    std::string input;
    cascade::WhisperEngineOptions whisper;
    std::string diarization_model;
    cascade::ClusteringOptions clustering;
    cascade::PipelineOptions pipeline;
    cascade::TranscriptExportOptions text;
    bool write_srt = false;
    bool write_vtt = false;
    bool write_json = false;
    bool verbose = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <audio-file|directory>\n";
    std::cout << "\n";
    std::cout << "Models:\n";
    std::cout << "  --model <dir>               CTranslate2 Whisper model (required)\n";
    std::cout << "  --diarization-model <file>  Speaker embedding model (ONNX); one speaker if omitted\n";
    std::cout << "  --device <auto|cuda|cpu>    Inference device (default: auto)\n";
    std::cout << "  --compute-type <type>       float16, int8, int8_float16, default\n";
    std::cout << "  --language <code>           Language code or auto (default: auto)\n";
    std::cout << "  --beam-size <n>             Beam search width (default: 5)\n";
    std::cout << "\n";
    std::cout << "Speakers:\n";
    std::cout << "  --speaker-threshold <f>     Clustering similarity (default: 0.7)\n";
    std::cout << "  --max-speakers <n>          Speaker cap, 0 = unlimited (default: 10)\n";
    std::cout << "\n";
    std::cout << "Alignment:\n";
    std::cout << "  --min-silence-gap <ms>      Silence that starts a segment (default: 2000)\n";
    std::cout << "  --max-segment <ms>          Longest segment (default: 300000)\n";
    std::cout << "  --no-speaker-split          Do not start segments at speaker changes\n";
    std::cout << "  --min-similarity <f>        Fuzzy match threshold (default: 0.5)\n";
    std::cout << "  --padding <ms>              Audio padding per segment (default: 100)\n";
    std::cout << "  --no-clean                  Keep emoji and engine markup\n";
    std::cout << "\n";
    std::cout << "Output:\n";
    std::cout << "  --srt / --vtt / --json      Also write subtitles or records\n";
    std::cout << "  --show-sources              Tag each transcript line with its text source\n";
    std::cout << "  --no-collapse               One line per record instead of per speaker run\n";
    std::cout << "  --verbose                   Per-group alignment details\n";
    std::cout << "\n";
    std::cout << "Example:\n";
    std::cout << "  " << program_name << " --model models/faster-whisper-large-v3 \\\n";
    std::cout << "      --diarization-model models/speaker_embedding.onnx --language zh meetings/\n";
}

// False when help was requested; throws std::invalid_argument on bad arguments
bool parse_args(int argc, char* argv[], CliOptions& cli) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--model") {
            cli.whisper.model_path = value();
        } else if (arg == "--diarization-model") {
            cli.diarization_model = value();
        } else if (arg == "--device") {
            cli.whisper.device = value();
        } else if (arg == "--compute-type") {
            cli.whisper.compute_type = value();
        } else if (arg == "--language") {
            cli.whisper.language = value();
        } else if (arg == "--beam-size") {
            cli.whisper.beam_size = std::stoi(value());
        } else if (arg == "--speaker-threshold") {
            cli.clustering.clustering_threshold = std::stof(value());
        } else if (arg == "--max-speakers") {
            cli.clustering.max_speakers = std::stoi(value());
        } else if (arg == "--min-silence-gap") {
            cli.pipeline.anchors.min_silence_gap_ms = std::stoll(value());
        } else if (arg == "--max-segment") {
            cli.pipeline.anchors.max_segment_duration_ms = std::stoll(value());
        } else if (arg == "--no-speaker-split") {
            cli.pipeline.anchors.split_on_speaker_change = false;
        } else if (arg == "--min-similarity") {
            cli.pipeline.alignment.match.min_similarity = std::stof(value());
        } else if (arg == "--padding") {
            cli.pipeline.extract_padding_ms = std::stoll(value());
        } else if (arg == "--no-clean") {
            cli.pipeline.clean_text = false;
        } else if (arg == "--srt") {
            cli.write_srt = true;
        } else if (arg == "--vtt") {
            cli.write_vtt = true;
        } else if (arg == "--json") {
            cli.write_json = true;
        } else if (arg == "--show-sources") {
            cli.text.show_sources = true;
        } else if (arg == "--no-collapse") {
            cli.text.collapse_speaker_runs = false;
        } else if (arg == "--verbose") {
            cli.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("unknown option " + arg);
        } else if (cli.input.empty()) {
            cli.input = arg;
        } else {
            throw std::invalid_argument("more than one input given");
        }
    }

    if (cli.input.empty()) {
        throw std::invalid_argument("no audio file or directory given");
    }
    if (cli.whisper.model_path.empty()) {
        throw std::invalid_argument("--model is required");
    }

    cli.whisper.validate();
    cli.clustering.validate();
    cli.pipeline.validate();
    return true;
}

bool is_audio_file(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".webm" || ext == ".mp3" || ext == ".wav" || ext == ".m4a" || ext == ".flac";
}

std::vector<std::string> collect_inputs(const std::string& input) {
    std::vector<std::string> files;

    if (fs::is_directory(input)) {
        for (const auto& entry : fs::directory_iterator(input)) {
            if (entry.is_regular_file() && is_audio_file(entry.path())) {
                files.push_back(entry.path().string());
            }
        }
        std::sort(files.begin(), files.end());
    } else if (fs::exists(input)) {
        files.push_back(input);
    } else {
        throw std::runtime_error("Input not found: " + input);
    }

    return files;
}

void write_outputs(const cascade::CascadeResult& result, const CliOptions& cli) {
    cascade::TranscriptExporter exporter;

    std::string path = exporter.export_transcript(result.records, result.audio_path, cli.text);
    std::cout << "[Cascade] ✓ Transcript: " << path << "\n";

    auto export_format = [&](cascade::TranscriptFormat format, const char* name) {
        cascade::TranscriptExportOptions options = cli.text;
        options.format = format;
        try {
            std::string out = exporter.export_transcript(result.records, result.audio_path, options);
            std::cout << "[Cascade] ✓ " << name << ": " << out << "\n";
        } catch (const std::exception& e) {
            std::cerr << "[Cascade] Failed to export " << name << ": " << e.what() << "\n";
        }
    };

    if (cli.write_srt) export_format(cascade::TranscriptFormat::SRT, "SRT");
    if (cli.write_vtt) export_format(cascade::TranscriptFormat::VTT, "VTT");
    if (cli.write_json) export_format(cascade::TranscriptFormat::JSON, "JSON");
}

} // anonymous namespace

int main(int argc, char* argv[]) {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
#endif

    CliOptions cli;
    try {
        if (!parse_args(argc, argv, cli)) {
            print_usage(argv[0]);
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 2;
    }

    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "Cascade - Speaker-Attributed Transcription\n";
    std::cout << "═══════════════════════════════════════════════════════════\n\n";

    std::vector<std::string> files;
    std::unique_ptr<cascade::WhisperEngine> whisper;
    std::unique_ptr<cascade::Diarizer> diarizer;

    try {
        files = collect_inputs(cli.input);
        if (files.empty()) {
            std::cerr << "[Cascade] No audio files (.webm .mp3 .wav .m4a .flac) in " << cli.input << "\n";
            return 1;
        }

        whisper = std::make_unique<cascade::WhisperEngine>(cli.whisper);

        const cascade::WhisperEngine::ModelInfo info = whisper->get_model_info();
        std::cout << "[Cascade] Model: " << (info.is_multilingual ? "multilingual" : "English-only")
                  << ", " << info.n_mels << " mel bins, " << info.device
                  << " / " << info.compute_type << "\n";

        if (!cli.diarization_model.empty()) {
            cascade::DiarizationOptions diarization;
            diarization.embedding_model_path = cli.diarization_model;
            diarization.clustering = cli.clustering;
            diarization.device = cli.whisper.device == "cuda" ? "cuda" : "cpu";
            diarizer = std::make_unique<cascade::Diarizer>(diarization);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Cascade] ERROR: " << e.what() << "\n";
        return 1;
    }

    cascade::AudioExtractor audio;
    cascade::DiarizedTranscriber diarized(audio, *whisper, diarizer.get());
    cascade::ConsoleObserver observer(cli.verbose);
    cascade::CascadePipeline pipeline(diarized, audio, *whisper, cli.pipeline, &observer);

    size_t failed = 0;
    for (size_t i = 0; i < files.size(); ++i) {
        std::cout << "\n[Cascade] File " << (i + 1) << "/" << files.size() << ": " << files[i] << "\n";

        try {
            cascade::CascadeResult result = pipeline.process(files[i]);

            std::cout << "[Cascade] Language: " << whisper->get_language()
                      << ", speakers: " << (diarizer ? diarized.last_result().num_speakers : 1) << "\n";

            std::cout << "\n" << cascade::format_transcript(
                result.records, fs::path(files[i]).filename().string(), cli.text);

            write_outputs(result, cli);
        } catch (const std::exception& e) {
            ++failed;
            std::cerr << "[Cascade] ERROR processing " << files[i] << ": " << e.what() << "\n";
        }

        audio.close();
    }

    std::cout << "\n[Cascade] Processed " << (files.size() - failed) << "/" << files.size() << " files\n";
    return failed == 0 ? 0 : 1;
}
