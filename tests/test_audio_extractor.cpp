/**
 * @file test_audio_extractor.cpp
 * @brief Manual check of Heimdall-backed decoding and range slicing
 *
 * Needs a real media file, so it is not registered with ctest.
 */

#include "cascade/audio_extractor.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

int main(int argc, char* argv[]) {
    std::cout << "═══════════════════════════════════════════════════════════\n";
    std::cout << "Cascade - Audio Extractor Test\n";
    std::cout << "═══════════════════════════════════════════════════════════\n\n";

    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <video_or_audio_file>\n";
        std::cout << "\nExample:\n";
        std::cout << "  " << argv[0] << " meeting.webm\n";
        return 1;
    }

    const std::string file_path = argv[1];
    std::cout << "[Test] File: " << file_path << "\n\n";

    try {
        cascade::AudioExtractor extractor;

        std::cout << "[1] Opening file...\n";
        if (!extractor.open(file_path)) {
            std::cerr << "[ERROR] Failed to open file: " << extractor.get_last_error() << "\n";
            return 1;
        }
        const float duration = extractor.get_duration();
        std::cout << "    ✓ " << extractor.samples().size() << " samples, "
                  << std::fixed << std::setprecision(2) << duration << "s\n\n";

        std::cout << "[2] Slicing the first second...\n";
        std::vector<float> slice;
        if (!extractor.extract_range(0, 1000, slice)) {
            std::cerr << "[ERROR] " << extractor.get_last_error() << "\n";
            return 1;
        }
        std::cout << "    ✓ " << slice.size() << " samples (expected <= "
                  << cascade::AudioExtractor::SAMPLE_RATE << ")\n\n";

        std::cout << "[3] Slicing past the end...\n";
        const int64_t end_ms = static_cast<int64_t>(duration * 1000.0f);
        if (extractor.extract_range(end_ms + 1000, end_ms + 2000, slice)) {
            std::cerr << "[ERROR] Range past the end should fail\n";
            return 1;
        }
        std::cout << "    ✓ Rejected: " << extractor.get_last_error() << "\n\n";

        std::cout << "[4] Clip through the AudioSource interface...\n";
        cascade::AudioClip clip = extractor.extract(file_path, 0, std::min<int64_t>(end_ms, 5000));
        float sum = 0.0f;
        for (float s : clip.samples) {
            sum += s * s;
        }
        const float rms = clip.samples.empty() ? 0.0f : std::sqrt(sum / clip.samples.size());
        std::cout << "    ✓ " << std::setprecision(2) << clip.duration() << "s at "
                  << clip.sample_rate << " Hz, RMS " << std::setprecision(4) << rms << "\n\n";

        extractor.close();

        std::cout << "═══════════════════════════════════════════════════════════\n";
        std::cout << "✓ SUCCESS: Audio extraction working\n";
        std::cout << "═══════════════════════════════════════════════════════════\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n[EXCEPTION] " << e.what() << "\n";
        return 1;
    }
}
