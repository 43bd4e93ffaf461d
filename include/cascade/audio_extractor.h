#pragma once

#include "export.h"
#include "engines.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cascade {

/**
 * @brief AudioExtractor - decoded audio for both transcription passes
 *
 * Decodes a file once through Heimdall and keeps the samples, so the
 * diarization pass and every per-segment slice share one decode.
 * Output matches what Whisper expects:
 * - 16kHz sample rate
 * - Mono channel (first audio track)
 * - Float32 samples normalized to [-1, 1]
 *
 * Example usage:
 * @code
 * cascade::AudioExtractor extractor;
 * if (!extractor.open("meeting.mp3")) {
 *     std::cerr << extractor.get_last_error() << "\n";
 * }
 * auto clip = extractor.extract("meeting.mp3", 1000, 4500);
 * @endcode
 */
class CASCADE_API AudioExtractor : public AudioSource {
public:
    static constexpr int SAMPLE_RATE = 16000;

    AudioExtractor();
    ~AudioExtractor() override;

    /**
     * @brief Decode a file and make it the current one
     *
     * Re-opening the current file is a no-op.
     *
     * @param file_path Path to audio/video file
     * @return True if successful (see get_last_error() otherwise)
     */
    bool open(const std::string& file_path);

    /**
     * @brief Drop the decoded samples
     */
    void close();

    /**
     * @brief Whether a file is decoded and cached
     */
    bool is_open() const;

    /**
     * @brief Duration of the current file in seconds
     */
    float get_duration() const;

    /**
     * @brief All samples of the current file (empty if none is open)
     */
    const std::vector<float>& samples() const;

    /**
     * @brief Copy [start_ms, end_ms) of the current file
     *
     * The range is clamped to the file.
     *
     * @return True if the clamped range is non-empty
     */
    bool extract_range(int64_t start_ms, int64_t end_ms, std::vector<float>& out);

    /**
     * @brief AudioSource implementation: open (if needed) and slice
     *
     * @throws std::runtime_error if decoding fails or the range is empty
     */
    AudioClip extract(const std::string& audio_path, int64_t start_ms, int64_t end_ms) override;

    /**
     * @brief Get last error message
     */
    std::string get_last_error() const { return last_error_; }

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
    std::string last_error_;
};

} // namespace cascade
