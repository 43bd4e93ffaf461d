#include "cascade/diarized_transcriber.h"
#include <iostream>
#include <stdexcept>

namespace cascade {

DiarizedTranscriber::DiarizedTranscriber(AudioExtractor& audio, WhisperEngine& whisper, Diarizer* diarizer)
    : audio_(audio)
    , whisper_(whisper)
    , diarizer_(diarizer)
{
}

std::vector<Sentence> DiarizedTranscriber::diarize(const std::string& audio_path)
{
    if (!audio_.open(audio_path)) {
        throw std::runtime_error(audio_.get_last_error());
    }

    const std::vector<float>& samples = audio_.samples();

    std::vector<TimedText> spans = whisper_.transcribe_timed(samples, AudioExtractor::SAMPLE_RATE);

    last_result_ = DiarizationResult();
    if (diarizer_) {
        last_result_ = diarizer_->diarize(samples.data(), samples.size(), AudioExtractor::SAMPLE_RATE);
    } else {
        std::cout << "[Diarizer] No embedding model, treating audio as one speaker\n";
    }

    return assign_speakers(spans, last_result_);
}

} // namespace cascade
