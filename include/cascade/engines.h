#pragma once

#include "export.h"
#include "types.h"
#include <string>
#include <vector>

namespace cascade {

/**
 * @brief Mono audio slice
 */
struct AudioClip {
    std::vector<float> samples;   // Mono float32 samples in [-1, 1]
    int sample_rate;              // Samples per second

    AudioClip() : sample_rate(16000) {}

    float duration() const {
        return sample_rate > 0 ? static_cast<float>(samples.size()) / sample_rate : 0.0f;
    }
};

/**
 * @brief Speaker-attributed transcription source (the diarized stream)
 *
 * Implementations run a timestamped ASR pass plus speaker assignment and
 * return sentences ordered by start time.
 */
class CASCADE_API DiarizationEngine {
public:
    virtual ~DiarizationEngine() = default;

    /**
     * @brief Produce speaker-tagged sentences for an audio file
     *
     * @throws std::runtime_error if the file cannot be processed
     */
    virtual std::vector<Sentence> diarize(const std::string& audio_path) = 0;
};

/**
 * @brief Random access to an audio file's samples
 */
class CASCADE_API AudioSource {
public:
    virtual ~AudioSource() = default;

    /**
     * @brief Slice [start_ms, end_ms) of a file as mono audio
     *
     * @throws std::runtime_error if the file cannot be decoded or the range is empty
     */
    virtual AudioClip extract(const std::string& audio_path, int64_t start_ms, int64_t end_ms) = 0;
};

/**
 * @brief Text-only transcription source (the high-fidelity stream)
 */
class CASCADE_API HighFidelityEngine {
public:
    virtual ~HighFidelityEngine() = default;

    /**
     * @brief Transcribe a clip into plain text (may be empty)
     *
     * @throws std::runtime_error on inference failure
     */
    virtual std::string transcribe(const std::vector<float>& samples, int sample_rate) = 0;
};

} // namespace cascade
