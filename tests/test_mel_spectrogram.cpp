/**
 * @file test_mel_spectrogram.cpp
 * @brief Log-mel features for the Whisper encoder
 */

#include "cascade/mel_spectrogram.h"
#include "test_common.h"
#include <algorithm>
#include <cmath>
#include <vector>

using namespace cascade;

int main() {
    cascade_test::banner("Cascade - Mel Spectrogram Test");

    MelSpectrogram mel;

    cascade_test::step(1, "Frame count and layout");
    {
        std::vector<float> tone(16000);
        for (size_t i = 0; i < tone.size(); ++i) {
            tone[i] = 0.5f * static_cast<float>(std::sin(2.0 * 3.14159265358979 * 440.0 * i / 16000.0));
        }

        std::vector<float> features;
        const int frames = mel.compute(tone, features);
        CHECK_EQ(frames, 100);
        CHECK_EQ(features.size(), 80u * 100u);
        CHECK_EQ(mel.get_mel_bins(), 80);
        CHECK_EQ(mel.get_hop_length(), 160);

        // Dynamic range is clamped to 8 log10 units, i.e. 2.0 after scaling
        const auto range = std::minmax_element(features.begin(), features.end());
        CHECK(*range.second - *range.first <= 2.0f + 1e-5f);

        // A 440 Hz tone peaks in a low mel band
        int peak_bin = 0;
        float peak_energy = -1e30f;
        for (int m = 0; m < 80; ++m) {
            float energy = 0.0f;
            for (int t = 10; t < 90; ++t) {
                energy += features[static_cast<size_t>(m) * frames + t];
            }
            if (energy > peak_energy) {
                peak_energy = energy;
                peak_bin = m;
            }
        }
        CHECK(peak_bin >= 7 && peak_bin <= 15);
    }

    cascade_test::step(2, "Silence sits at the log floor");
    {
        std::vector<float> features;
        CHECK_EQ(mel.compute(std::vector<float>(3200, 0.0f), features), 20);
        bool flat = true;
        for (float v : features) {
            flat = flat && std::fabs(v + 1.5f) < 1e-5f;
        }
        CHECK(flat);
    }

    cascade_test::step(3, "Too little audio yields no frames");
    {
        std::vector<float> features = {1.0f};
        CHECK_EQ(mel.compute(std::vector<float>(100, 0.1f), features), 0);
        CHECK(features.empty());
        CHECK_EQ(mel.compute(std::vector<float>(), features), 0);
    }

    cascade_test::step(4, "Padding and trimming to the chunk size");
    {
        std::vector<float> samples(8000);
        for (size_t i = 0; i < samples.size(); ++i) {
            samples[i] = static_cast<float>(i % 50) / 50.0f - 0.5f;
        }
        std::vector<float> features;
        const int frames = mel.compute(samples, features);
        CHECK_EQ(frames, 50);

        std::vector<float> padded = features;
        mel.fit_frames(padded, frames, MelSpectrogram::CHUNK_FRAMES);
        CHECK_EQ(padded.size(), 80u * 3000u);
        const float floor = *std::min_element(features.begin(), features.end());
        CHECK_NEAR(padded[2999], floor, 1e-6);
        CHECK_NEAR(padded[3000 + 5], features[50 + 5], 1e-6);   // mel 1, frame 5

        std::vector<float> trimmed = features;
        mel.fit_frames(trimmed, frames, 10);
        CHECK_EQ(trimmed.size(), 800u);
        CHECK_NEAR(trimmed[10 + 3], features[50 + 3], 1e-6);
    }

    cascade_test::step(5, "Large-v3 uses 128 bins");
    {
        MelSpectrogram wide(16000, 400, 128, 160);
        std::vector<float> features;
        const int frames = wide.compute(std::vector<float>(1600, 0.01f), features);
        CHECK_EQ(frames, 10);
        CHECK_EQ(features.size(), 128u * 10u);
    }

    return cascade_test::report();
}
