#pragma once

#include "export.h"
#include "audio_extractor.h"
#include "diarization.h"
#include "engines.h"
#include "whisper_engine.h"
#include <string>
#include <vector>

namespace cascade {

/**
 * @brief Diarized stream built from a timestamped Whisper pass plus speaker turns
 *
 * Each timed span becomes one sentence, attributed to the speaker that
 * overlaps it most. Without a diarizer every sentence is speaker 0.
 *
 * The extractor is shared with the pipeline, so the file is decoded once.
 */
class CASCADE_API DiarizedTranscriber : public DiarizationEngine {
public:
    DiarizedTranscriber(AudioExtractor& audio, WhisperEngine& whisper, Diarizer* diarizer = nullptr);

    /**
     * @throws std::runtime_error if decoding or inference fails
     */
    std::vector<Sentence> diarize(const std::string& audio_path) override;

    /**
     * @brief Speaker turns of the last call
     */
    const DiarizationResult& last_result() const { return last_result_; }

private:
    AudioExtractor& audio_;
    WhisperEngine& whisper_;
    Diarizer* diarizer_;
    DiarizationResult last_result_;
};

} // namespace cascade
