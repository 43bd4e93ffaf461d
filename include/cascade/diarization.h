#pragma once

#include "export.h"
#include "speaker_clustering.h"
#include <memory>
#include <string>
#include <vector>
#include <onnxruntime_cxx_api.h>

namespace cascade {

/**
 * @brief Diarization configuration options
 */
struct DiarizationOptions {
    // ═══════════════════════════════════════════════════════════
    // Model Configuration
    // ═══════════════════════════════════════════════════════════
    std::string embedding_model_path;      // Path to speaker embedding model (ONNX, [1, 16000] waveform input)

    // ═══════════════════════════════════════════════════════════
    // Clustering Parameters
    // ═══════════════════════════════════════════════════════════
    ClusteringOptions clustering;          // Threshold, speaker limit, turn merging

    // ═══════════════════════════════════════════════════════════
    // Embedding Extraction
    // ═══════════════════════════════════════════════════════════
    float embedding_window_s = 1.0f;       // Window size (1s = 16000 samples at 16kHz)
    float embedding_step_s = 0.5f;         // Step size between embeddings (50% overlap)
    float min_rms = 0.005f;                // Skip near-silent windows

    // ═══════════════════════════════════════════════════════════
    // Performance
    // ═══════════════════════════════════════════════════════════
    std::string device = "cpu";            // "cuda" or "cpu"
    int num_threads = 4;                   // Intra-op threads

    /**
     * @throws std::invalid_argument on out-of-range values
     */
    void validate() const;
};

/**
 * @brief Speaker Diarization Engine
 *
 * Extracts speaker embeddings with a sliding window through ONNX Runtime
 * and clusters them into speaker turns.
 *
 * Example usage:
 * @code
 * cascade::DiarizationOptions options;
 * options.embedding_model_path = "models/speaker-embedding.onnx";
 * cascade::Diarizer diarizer(options);
 *
 * auto result = diarizer.diarize(audio.data(), audio.size(), 16000);
 * int speaker = cascade::get_speaker_at_time(result, 12500);
 * @endcode
 */
class CASCADE_API Diarizer {
public:
    /**
     * @throws std::runtime_error if the model cannot be loaded
     */
    explicit Diarizer(const DiarizationOptions& options);
    ~Diarizer();

    Diarizer(const Diarizer&) = delete;
    Diarizer& operator=(const Diarizer&) = delete;

    /**
     * @brief Perform speaker diarization on audio
     *
     * @param audio_data Audio samples (mono, 16kHz)
     * @param num_samples Number of audio samples
     * @param sample_rate Sample rate (must be 16000)
     * @return Speaker turns (empty for audio shorter than one window)
     */
    DiarizationResult diarize(const float* audio_data,
                              size_t num_samples,
                              int sample_rate = 16000);

    /**
     * @brief Embeddings for the whole clip with a sliding window
     */
    std::vector<SpeakerEmbedding> extract_embeddings(const float* audio_data,
                                                     size_t num_samples,
                                                     int sample_rate = 16000);

    /**
     * @brief Embedding of one window (padded or truncated to 1 second)
     */
    std::vector<float> run_embedding_model(const float* audio_data, size_t num_samples);

    bool is_ready() const;

    const DiarizationOptions& get_options() const { return options_; }

private:
    void initialize_onnx_session();

    DiarizationOptions options_;

    std::unique_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::SessionOptions> session_options_;
    std::unique_ptr<Ort::Session> embedding_session_;
    std::string input_name_;
    std::string output_name_;
};

} // namespace cascade
