#include "cascade/audio_extractor.h"
#include <heimdall.h>
#include <algorithm>
#include <iostream>
#include <map>
#include <stdexcept>

namespace cascade {

// =======================
// AudioExtractor::Impl
// =======================

class AudioExtractor::Impl {
public:
    heimdall::Heimdall decoder;

    // Cached decode of the current file
    std::string current_file;
    std::vector<float> samples;
    bool is_open = false;

    size_t ms_to_sample(int64_t ms) const {
        if (ms <= 0) return 0;
        size_t index = static_cast<size_t>(ms * SAMPLE_RATE / 1000);
        return std::min(index, samples.size());
    }
};

AudioExtractor::AudioExtractor()
    : pimpl_(std::make_unique<Impl>())
{
}

AudioExtractor::~AudioExtractor() = default;

bool AudioExtractor::open(const std::string& file_path)
{
    last_error_.clear();

    if (pimpl_->is_open && pimpl_->current_file == file_path) {
        return true;
    }

    close();

    try {
        heimdall::AudioInfo info = pimpl_->decoder.get_audio_info(file_path);
        if (info.stream_count <= 0) {
            last_error_ = "No audio tracks in file";
            std::cerr << "[Audio] " << last_error_ << ": " << file_path << "\n";
            return false;
        }

        // First track only, full quality at the Whisper rate
        std::map<int, std::vector<float>> tracks =
            pimpl_->decoder.extract_audio(file_path, SAMPLE_RATE, {0}, 100);

        auto it = tracks.find(0);
        if (it == tracks.end() || it->second.empty()) {
            last_error_ = "Failed to extract audio from track 0";
            std::cerr << "[Audio] " << last_error_ << ": " << file_path << "\n";
            return false;
        }

        pimpl_->samples = std::move(it->second);
        pimpl_->current_file = file_path;
        pimpl_->is_open = true;

        std::cout << "[Audio] Decoded " << pimpl_->samples.size() << " samples ("
                  << get_duration() << "s at 16kHz) from " << file_path << "\n";

        return true;
    } catch (const std::exception& e) {
        last_error_ = std::string("Failed to decode file: ") + e.what();
        std::cerr << "[Audio] " << last_error_ << "\n";
        return false;
    }
}

void AudioExtractor::close()
{
    pimpl_->is_open = false;
    pimpl_->current_file.clear();
    pimpl_->samples.clear();
    pimpl_->samples.shrink_to_fit();
}

bool AudioExtractor::is_open() const
{
    return pimpl_->is_open;
}

float AudioExtractor::get_duration() const
{
    if (!pimpl_->is_open) return 0.0f;
    return static_cast<float>(pimpl_->samples.size()) / SAMPLE_RATE;
}

const std::vector<float>& AudioExtractor::samples() const
{
    return pimpl_->samples;
}

bool AudioExtractor::extract_range(int64_t start_ms, int64_t end_ms, std::vector<float>& out)
{
    last_error_.clear();

    if (!pimpl_->is_open) {
        last_error_ = "No file is open";
        return false;
    }

    const size_t begin = pimpl_->ms_to_sample(start_ms);
    const size_t end = pimpl_->ms_to_sample(end_ms);
    if (end <= begin) {
        last_error_ = "Empty audio range " + std::to_string(start_ms) + "-" +
                      std::to_string(end_ms) + "ms";
        return false;
    }

    out.assign(pimpl_->samples.begin() + begin, pimpl_->samples.begin() + end);
    return true;
}

AudioClip AudioExtractor::extract(const std::string& audio_path, int64_t start_ms, int64_t end_ms)
{
    if (!open(audio_path)) {
        throw std::runtime_error(last_error_);
    }

    AudioClip clip;
    clip.sample_rate = SAMPLE_RATE;
    if (!extract_range(start_ms, end_ms, clip.samples)) {
        throw std::runtime_error(last_error_);
    }

    return clip;
}

} // namespace cascade
