#include "cascade/mel_spectrogram.h"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace cascade {

namespace {

// Slaney mel scale (librosa default, used by Whisper)
constexpr float kMinLogHz = 1000.0f;
constexpr float kLinearStep = 200.0f / 3.0f;
constexpr float kMinLogMel = kMinLogHz / kLinearStep;

float log_step() {
    return std::log(6.4f) / 27.0f;
}

// numpy.pad(mode="reflect") index mapping
int reflect_index(int i, int n) {
    if (n == 1) return 0;
    const int period = 2 * (n - 1);
    i %= period;
    if (i < 0) i += period;
    return i < n ? i : period - i;
}

} // anonymous namespace

MelSpectrogram::MelSpectrogram(int sample_rate, int n_fft, int n_mels, int hop_length)
    : sample_rate_(sample_rate)
    , n_fft_(n_fft)
    , n_mels_(n_mels)
    , hop_length_(hop_length)
    , n_freqs_(n_fft / 2 + 1)
{
    build_window();
    build_twiddles();
    build_mel_filters();
}

void MelSpectrogram::build_window()
{
    // Periodic Hann (torch.hann_window default)
    window_.resize(n_fft_);
    for (int i = 0; i < n_fft_; i++) {
        window_[i] = 0.5f * (1.0f - static_cast<float>(std::cos(2.0 * M_PI * i / n_fft_)));
    }
}

void MelSpectrogram::build_twiddles()
{
    cos_table_.resize(static_cast<size_t>(n_freqs_) * n_fft_);
    sin_table_.resize(static_cast<size_t>(n_freqs_) * n_fft_);
    for (int k = 0; k < n_freqs_; k++) {
        for (int n = 0; n < n_fft_; n++) {
            const double angle = -2.0 * M_PI * k * n / n_fft_;
            cos_table_[static_cast<size_t>(k) * n_fft_ + n] = static_cast<float>(std::cos(angle));
            sin_table_[static_cast<size_t>(k) * n_fft_ + n] = static_cast<float>(std::sin(angle));
        }
    }
}

float MelSpectrogram::hz_to_mel(float hz)
{
    if (hz >= kMinLogHz) {
        return kMinLogMel + std::log(hz / kMinLogHz) / log_step();
    }
    return hz / kLinearStep;
}

float MelSpectrogram::mel_to_hz(float mel)
{
    if (mel >= kMinLogMel) {
        return kMinLogHz * std::exp(log_step() * (mel - kMinLogMel));
    }
    return kLinearStep * mel;
}

void MelSpectrogram::build_mel_filters()
{
    mel_filters_.assign(static_cast<size_t>(n_mels_) * n_freqs_, 0.0f);

    const float max_mel = hz_to_mel(sample_rate_ / 2.0f);
    std::vector<float> edges(n_mels_ + 2);
    for (int i = 0; i < n_mels_ + 2; i++) {
        edges[i] = mel_to_hz(max_mel * i / (n_mels_ + 1));
    }

    for (int m = 0; m < n_mels_; m++) {
        const float left = edges[m];
        const float center = edges[m + 1];
        const float right = edges[m + 2];
        const float norm = 2.0f / (right - left);   // Slaney area normalization

        for (int f = 0; f < n_freqs_; f++) {
            const float freq = f * sample_rate_ / static_cast<float>(n_fft_);
            const float rising = (freq - left) / (center - left);
            const float falling = (right - freq) / (right - center);
            const float weight = std::max(0.0f, std::min(rising, falling));
            mel_filters_[static_cast<size_t>(m) * n_freqs_ + f] = weight * norm;
        }
    }
}

int MelSpectrogram::compute(const std::vector<float>& samples, std::vector<float>& mel_output) const
{
    mel_output.clear();
    if (samples.empty()) {
        return 0;
    }

    // Centered STFT: reflect-pad n_fft/2 on both sides, drop the last frame
    const int n_samples = static_cast<int>(samples.size());
    const int pad = n_fft_ / 2;
    const int n_frames = n_samples / hop_length_;
    if (n_frames == 0) {
        return 0;
    }

    std::vector<float> frame(n_fft_);
    std::vector<float> power(n_freqs_);
    mel_output.assign(static_cast<size_t>(n_mels_) * n_frames, 0.0f);

    float max_log = -1e30f;

    for (int t = 0; t < n_frames; t++) {
        const int offset = t * hop_length_ - pad;
        for (int n = 0; n < n_fft_; n++) {
            frame[n] = samples[reflect_index(offset + n, n_samples)] * window_[n];
        }

        for (int k = 0; k < n_freqs_; k++) {
            const float* c = &cos_table_[static_cast<size_t>(k) * n_fft_];
            const float* s = &sin_table_[static_cast<size_t>(k) * n_fft_];
            float re = 0.0f;
            float im = 0.0f;
            for (int n = 0; n < n_fft_; n++) {
                re += frame[n] * c[n];
                im += frame[n] * s[n];
            }
            power[k] = re * re + im * im;
        }

        for (int m = 0; m < n_mels_; m++) {
            const float* filter = &mel_filters_[static_cast<size_t>(m) * n_freqs_];
            float value = 0.0f;
            for (int k = 0; k < n_freqs_; k++) {
                value += filter[k] * power[k];
            }
            const float log_mel = std::log10(std::max(value, 1e-10f));
            mel_output[static_cast<size_t>(m) * n_frames + t] = log_mel;
            max_log = std::max(max_log, log_mel);
        }
    }

    // Dynamic range of 8 (80dB) below the peak, then scale to roughly [-1, 1]
    const float floor = max_log - 8.0f;
    for (float& v : mel_output) {
        v = (std::max(v, floor) + 4.0f) / 4.0f;
    }

    return n_frames;
}

void MelSpectrogram::fit_frames(std::vector<float>& mel, int current_frames, int n_frames) const
{
    if (current_frames == n_frames) {
        return;
    }

    // Padded columns take the clamped floor value (silence)
    float pad_value = -1.5f;
    if (!mel.empty()) {
        pad_value = *std::min_element(mel.begin(), mel.end());
    }

    std::vector<float> fitted(static_cast<size_t>(n_mels_) * n_frames, pad_value);
    const int copy_frames = std::min(current_frames, n_frames);
    for (int m = 0; m < n_mels_; m++) {
        std::copy_n(mel.begin() + static_cast<size_t>(m) * current_frames,
                    copy_frames,
                    fitted.begin() + static_cast<size_t>(m) * n_frames);
    }
    mel.swap(fitted);
}

} // namespace cascade
