#include "cascade/whisper_engine.h"
#include "cascade/mel_spectrogram.h"
#include <ctranslate2/models/whisper.h>
#include <ctranslate2/types.h>
#include <ctranslate2/utils.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace cascade {

namespace {

constexpr int kSampleRate = 16000;
constexpr size_t kWindowSamples = 30 * kSampleRate;

std::string strip_language_token(const std::string& token) {
    if (is_special_token(token)) {
        return token.substr(2, token.size() - 4);
    }
    return token;
}

} // anonymous namespace

void WhisperEngineOptions::validate() const {
    if (model_path.empty()) {
        throw std::invalid_argument("WhisperEngineOptions: model_path is empty");
    }
    if (device != "auto" && device != "cuda" && device != "cpu") {
        throw std::invalid_argument("WhisperEngineOptions: device must be auto, cuda or cpu");
    }
    if (task != "transcribe" && task != "translate") {
        throw std::invalid_argument("WhisperEngineOptions: task must be transcribe or translate");
    }
    if (beam_size < 1 || beam_size > 10) {
        throw std::invalid_argument("WhisperEngineOptions: beam_size must be in [1, 10]");
    }
    if (max_length < 1) {
        throw std::invalid_argument("WhisperEngineOptions: max_length must be positive");
    }
    if (no_speech_threshold < 0.0f || no_speech_threshold > 1.0f) {
        throw std::invalid_argument("WhisperEngineOptions: no_speech_threshold must be in [0, 1]");
    }
}

// =======================
// WhisperEngine::Impl
// =======================

class WhisperEngine::Impl {
public:
    std::unique_ptr<ctranslate2::models::Whisper> model;
    MelSpectrogram mel_converter;
    std::string language;

    Impl() : mel_converter(kSampleRate, 400, 80, 160) {}

    // Features for one window, padded to 3000 frames: [1, n_mels, 3000]
    ctranslate2::StorageView window_features(const float* samples, size_t count) const {
        std::vector<float> window(samples, samples + count);
        std::vector<float> mel;
        int n_frames = mel_converter.compute(window, mel);
        if (n_frames == 0) {
            throw std::runtime_error("Failed to compute mel-spectrogram");
        }
        mel_converter.fit_frames(mel, n_frames, MelSpectrogram::CHUNK_FRAMES);

        const auto n_mels = static_cast<ctranslate2::dim_t>(mel_converter.get_mel_bins());
        return ctranslate2::StorageView(
            ctranslate2::Shape{1, n_mels, static_cast<ctranslate2::dim_t>(MelSpectrogram::CHUNK_FRAMES)},
            mel);
    }

    std::string detect_language(const ctranslate2::StorageView& features) {
        auto future_results = model->detect_language(features);
        if (future_results.empty()) {
            return "en";
        }

        auto lang_probs = future_results[0].get();
        if (lang_probs.empty()) {
            return "en";
        }

        auto best = std::max_element(lang_probs.begin(), lang_probs.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });

        std::string code = strip_language_token(best->first);
        std::cout << "[Whisper] Detected language: " << code
                  << " (probability: " << best->second << ")\n";
        return code;
    }

    // Generated tokens for one window, empty if the window is silent
    std::vector<std::string> generate(const ctranslate2::StorageView& features,
                                      const WhisperEngineOptions& options,
                                      bool timestamps) {
        std::vector<std::string> prompt = {
            "<|startoftranscript|>",
            "<|" + language + "|>",
            "<|" + options.task + "|>"
        };
        if (!timestamps) {
            prompt.push_back("<|notimestamps|>");
        }

        ctranslate2::models::WhisperOptions whisper_options;
        whisper_options.beam_size = options.beam_size;
        whisper_options.patience = options.patience;
        whisper_options.length_penalty = options.length_penalty;
        whisper_options.repetition_penalty = options.repetition_penalty;
        whisper_options.no_repeat_ngram_size = options.no_repeat_ngram_size;
        whisper_options.max_length = options.max_length;
        whisper_options.sampling_topk = 1;
        whisper_options.num_hypotheses = 1;
        whisper_options.return_no_speech_prob = true;
        whisper_options.max_initial_timestamp_index = 50;
        whisper_options.suppress_blank = options.suppress_blank;

        const std::vector<std::vector<std::string>> prompts = {prompt};
        auto future_results = model->generate(features, prompts, whisper_options);
        if (future_results.empty()) {
            throw std::runtime_error("Whisper returned no results");
        }

        auto result = future_results[0].get();
        if (result.no_speech_prob > options.no_speech_threshold) {
            std::cout << "[Whisper] Skipping silent window (no_speech: "
                      << result.no_speech_prob << ")\n";
            return {};
        }
        if (result.sequences.empty()) {
            return {};
        }
        return result.sequences[0];
    }

    // Run every 30 second window of a clip through fn(features, offset_ms, end_ms)
    template <typename Fn>
    void for_each_window(const std::vector<float>& samples,
                         const WhisperEngineOptions& options,
                         Fn&& fn) {
        for (size_t offset = 0; offset < samples.size(); offset += kWindowSamples) {
            const size_t count = std::min(kWindowSamples, samples.size() - offset);
            ctranslate2::StorageView features = window_features(samples.data() + offset, count);

            if (options.language == "auto") {
                if (offset == 0 || language.empty()) {
                    language = detect_language(features);
                }
            } else {
                language = options.language;
            }

            const int64_t offset_ms = static_cast<int64_t>(offset) * 1000 / kSampleRate;
            const int64_t end_ms = static_cast<int64_t>(offset + count) * 1000 / kSampleRate;
            fn(features, offset_ms, end_ms);
        }
    }
};

WhisperEngine::WhisperEngine(const WhisperEngineOptions& options)
    : pimpl_(std::make_unique<Impl>())
    , options_(options)
{
    options_.validate();

    try {
        std::cout << "═══════════════════════════════════════════════════════════\n";
        std::cout << "CASCADE WHISPER - LOADING MODEL\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";
        std::cout << "Model: " << options_.model_path << "\n";

        ctranslate2::Device ct_device;
        if (options_.device == "cpu") {
            ct_device = ctranslate2::Device::CPU;
            std::cout << "Device: CPU\n";
        } else {
            ct_device = ctranslate2::Device::CUDA;
            std::cout << (options_.device == "cuda" ? "Device: CUDA (GPU)\n" : "Device: Auto (trying CUDA)\n");
        }

        const ctranslate2::ComputeType compute_type =
            ctranslate2::str_to_compute_type(options_.compute_type);

        try {
            pimpl_->model = std::make_unique<ctranslate2::models::Whisper>(
                options_.model_path, ct_device, compute_type);
        } catch (const std::exception& e) {
            if (options_.device != "auto") {
                throw;
            }
            std::cout << "CUDA unavailable (" << e.what() << "), falling back to CPU\n";
            pimpl_->model = std::make_unique<ctranslate2::models::Whisper>(
                options_.model_path, ctranslate2::Device::CPU, compute_type);
        }

        const size_t n_mels = pimpl_->model->n_mels();
        std::cout << "Languages: " << (pimpl_->model->is_multilingual() ? "Multilingual" : "English-only")
                  << " (" << pimpl_->model->num_languages() << " languages)\n";
        std::cout << "Mel features: " << n_mels << "\n";

        if (n_mels != static_cast<size_t>(pimpl_->mel_converter.get_mel_bins())) {
            pimpl_->mel_converter = MelSpectrogram(kSampleRate, 400, static_cast<int>(n_mels), 160);
        }

        std::cout << "✓ Model loaded successfully\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";

    } catch (const std::exception& e) {
        std::cerr << "✗ Failed to load Whisper model: " << e.what() << "\n";
        std::cerr << "═══════════════════════════════════════════════════════════\n";
        throw std::runtime_error(std::string("Failed to load Whisper model: ") + e.what());
    }
}

WhisperEngine::~WhisperEngine() = default;

std::string WhisperEngine::transcribe(const std::vector<float>& samples, int sample_rate)
{
    if (sample_rate != kSampleRate) {
        throw std::runtime_error("Whisper expects 16kHz audio, got " + std::to_string(sample_rate) + "Hz");
    }

    std::string text;
    pimpl_->for_each_window(samples, options_,
        [&](const ctranslate2::StorageView& features, int64_t, int64_t) {
            const std::string window_text = decode_tokens(pimpl_->generate(features, options_, false));
            if (window_text.empty()) return;
            if (!text.empty() && pimpl_->language != "zh" && pimpl_->language != "ja") {
                text += ' ';
            }
            text += window_text;
        });

    return text;
}

std::vector<TimedText> WhisperEngine::transcribe_timed(const std::vector<float>& samples, int sample_rate)
{
    if (sample_rate != kSampleRate) {
        throw std::runtime_error("Whisper expects 16kHz audio, got " + std::to_string(sample_rate) + "Hz");
    }

    std::vector<TimedText> spans;
    pimpl_->for_each_window(samples, options_,
        [&](const ctranslate2::StorageView& features, int64_t offset_ms, int64_t end_ms) {
            auto window_spans = split_timestamped_tokens(
                pimpl_->generate(features, options_, true), offset_ms, end_ms);
            for (auto& span : window_spans) {
                span.end = std::min(span.end, end_ms);
                spans.push_back(std::move(span));
            }
        });

    std::cout << "[Whisper] " << spans.size() << " timed spans from "
              << static_cast<float>(samples.size()) / kSampleRate << "s of audio\n";
    return spans;
}

std::string WhisperEngine::get_language() const
{
    return pimpl_->language;
}

WhisperEngine::ModelInfo WhisperEngine::get_model_info() const
{
    ModelInfo info;
    info.is_multilingual = pimpl_->model->is_multilingual();
    info.n_mels = pimpl_->model->n_mels();
    info.num_languages = pimpl_->model->num_languages();
    info.device = options_.device;
    info.compute_type = options_.compute_type;
    return info;
}

} // namespace cascade
