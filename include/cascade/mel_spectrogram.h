#pragma once

#include <vector>

namespace cascade {

/**
 * @brief Whisper-compatible log-mel spectrogram
 *
 * Produces the features CTranslate2's Whisper encoder expects:
 * - 16kHz sample rate
 * - 400-point FFT (25ms @ 16kHz), periodic Hann window, centered frames
 * - 160-sample hop (10ms @ 16kHz)
 * - 80 mel bins (v1/v2 models) or 128 (large-v3)
 *
 * Output is flat and mel-major: value(mel, frame) = out[mel * n_frames + frame],
 * which is the row-major layout of a [n_mels, n_frames] tensor.
 */
class MelSpectrogram {
public:
    static constexpr int CHUNK_FRAMES = 3000;   // 30 seconds at 10ms per frame

    MelSpectrogram(int sample_rate = 16000,
                   int n_fft = 400,
                   int n_mels = 80,
                   int hop_length = 160);

    /**
     * @brief Convert audio samples to a normalized log-mel spectrogram
     *
     * @param samples Audio samples (mono, float32, normalized to [-1, 1])
     * @param mel_output Flat [n_mels * n_frames] output
     * @return Number of frames generated (0 for empty input)
     */
    int compute(const std::vector<float>& samples, std::vector<float>& mel_output) const;

    /**
     * @brief Pad (with the log floor) or trim features to n_frames columns
     */
    void fit_frames(std::vector<float>& mel, int current_frames, int n_frames) const;

    int get_mel_bins() const { return n_mels_; }
    int get_hop_length() const { return hop_length_; }

private:
    void build_window();
    void build_twiddles();
    void build_mel_filters();

    static float hz_to_mel(float hz);
    static float mel_to_hz(float mel);

    int sample_rate_;
    int n_fft_;
    int n_mels_;
    int hop_length_;
    int n_freqs_;
    std::vector<float> window_;
    std::vector<float> cos_table_;        // [n_freqs * n_fft]
    std::vector<float> sin_table_;
    std::vector<float> mel_filters_;      // [n_mels * n_freqs]
};

} // namespace cascade
