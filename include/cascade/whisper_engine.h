#pragma once

#include "export.h"
#include "engines.h"
#include "whisper_tokens.h"
#include <memory>
#include <string>
#include <vector>

namespace cascade {

/**
 * @brief Whisper model configuration
 */
struct WhisperEngineOptions {
    // ═══════════════════════════════════════════════════════════
    // Model Loading
    // ═══════════════════════════════════════════════════════════
    std::string model_path;                // CTranslate2 Whisper model directory
    std::string device = "auto";           // "cuda", "cpu" or "auto" (CUDA first)
    std::string compute_type = "default";  // "float16", "int8", "int8_float16", "default"

    // ═══════════════════════════════════════════════════════════
    // Language and Task
    // ═══════════════════════════════════════════════════════════
    std::string language = "auto";         // "zh", "en", ... or "auto" (detect per file)
    std::string task = "transcribe";       // "transcribe" or "translate"

    // ═══════════════════════════════════════════════════════════
    // Decoding Parameters
    // ═══════════════════════════════════════════════════════════
    int beam_size = 5;                     // Beam search width (1-10)
    float patience = 1.0f;                 // Beam search patience
    float length_penalty = 1.0f;           // Length penalty
    float repetition_penalty = 1.0f;       // Penalty for repeated tokens (1.0 = off)
    int no_repeat_ngram_size = 0;          // Block repeated n-grams (0 = off)
    int max_length = 448;                  // Maximum generated tokens per window
    bool suppress_blank = true;            // Suppress blank outputs at window start

    // ═══════════════════════════════════════════════════════════
    // Quality Thresholds
    // ═══════════════════════════════════════════════════════════
    float no_speech_threshold = 0.6f;      // Drop windows above this no-speech probability

    /**
     * @throws std::invalid_argument on an empty model path or out-of-range value
     */
    void validate() const;
};

/**
 * @brief Whisper inference through CTranslate2
 *
 * Serves both passes of the merge:
 * - transcribe(): plain text without timestamps (the high-fidelity stream)
 * - transcribe_timed(): timestamped spans (the raw material of the diarized stream)
 *
 * Audio longer than 30 seconds is processed in consecutive 30 second windows.
 *
 * Example usage:
 * @code
 * cascade::WhisperEngineOptions options;
 * options.model_path = "models/faster-whisper-large-v3";
 * options.language = "zh";
 * cascade::WhisperEngine whisper(options);
 *
 * std::string text = whisper.transcribe(clip.samples, 16000);
 * @endcode
 */
class CASCADE_API WhisperEngine : public HighFidelityEngine {
public:
    /**
     * @brief Load a model
     *
     * @throws std::runtime_error if the model cannot be loaded
     */
    explicit WhisperEngine(const WhisperEngineOptions& options);
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    /**
     * @brief HighFidelityEngine implementation: untimed text of the whole clip
     *
     * @throws std::runtime_error on inference failure or a non-16kHz clip
     */
    std::string transcribe(const std::vector<float>& samples, int sample_rate) override;

    /**
     * @brief Timestamped spans of the whole clip (times relative to the clip)
     *
     * @throws std::runtime_error on inference failure or a non-16kHz clip
     */
    std::vector<TimedText> transcribe_timed(const std::vector<float>& samples, int sample_rate);

    /**
     * @brief Language code used for the last call ("zh", "en", ...)
     */
    std::string get_language() const;

    /**
     * @brief Model information
     */
    struct ModelInfo {
        bool is_multilingual;
        size_t n_mels;
        size_t num_languages;
        std::string device;
        std::string compute_type;
    };

    ModelInfo get_model_info() const;

    const WhisperEngineOptions& get_options() const { return options_; }

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
    WhisperEngineOptions options_;
};

} // namespace cascade
