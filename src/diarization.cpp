#include "cascade/diarization.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace cascade {

namespace {

constexpr size_t kModelSamples = 16000;

float rms(const float* data, size_t count) {
    if (count == 0) return 0.0f;
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(data[i]) * data[i];
    }
    return static_cast<float>(std::sqrt(sum / count));
}

} // anonymous namespace

void DiarizationOptions::validate() const {
    if (embedding_model_path.empty()) {
        throw std::invalid_argument("DiarizationOptions: embedding_model_path is empty");
    }
    if (embedding_window_s <= 0.0f || embedding_step_s <= 0.0f) {
        throw std::invalid_argument("DiarizationOptions: window and step must be positive");
    }
    if (device != "cuda" && device != "cpu") {
        throw std::invalid_argument("DiarizationOptions: device must be cuda or cpu");
    }
    if (num_threads < 1) {
        throw std::invalid_argument("DiarizationOptions: num_threads must be positive");
    }
    clustering.validate();
}

// ═══════════════════════════════════════════════════════════
// Diarizer Implementation
// ═══════════════════════════════════════════════════════════

Diarizer::Diarizer(const DiarizationOptions& options)
    : options_(options) {
    options_.validate();
    initialize_onnx_session();
}

Diarizer::~Diarizer() = default;

void Diarizer::initialize_onnx_session() {
    try {
        env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "CascadeDiarizer");

        session_options_ = std::make_unique<Ort::SessionOptions>();
        session_options_->SetIntraOpNumThreads(options_.num_threads);
        session_options_->SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        if (options_.device == "cuda") {
            OrtCUDAProviderOptions cuda_options;
            cuda_options.device_id = 0;
            session_options_->AppendExecutionProvider_CUDA(cuda_options);
        }

        #ifdef _WIN32
        std::wstring model_path_wide(options_.embedding_model_path.begin(),
                                     options_.embedding_model_path.end());
        embedding_session_ = std::make_unique<Ort::Session>(*env_, model_path_wide.c_str(),
                                                            *session_options_);
        #else
        embedding_session_ = std::make_unique<Ort::Session>(*env_, options_.embedding_model_path.c_str(),
                                                            *session_options_);
        #endif

        Ort::AllocatorWithDefaultOptions allocator;
        input_name_ = embedding_session_->GetInputNameAllocated(0, allocator).get();
        output_name_ = embedding_session_->GetOutputNameAllocated(0, allocator).get();

        std::cout << "[Diarizer] Loaded embedding model: " << options_.embedding_model_path << "\n";
        std::cout << "[Diarizer] Device: " << options_.device
                  << ", input: " << input_name_ << ", output: " << output_name_ << "\n";

    } catch (const Ort::Exception& e) {
        throw std::runtime_error("Failed to initialize ONNX session: " + std::string(e.what()));
    }
}

bool Diarizer::is_ready() const {
    return embedding_session_ != nullptr;
}

// ═══════════════════════════════════════════════════════════
// Core Diarization
// ═══════════════════════════════════════════════════════════

DiarizationResult Diarizer::diarize(const float* audio_data,
                                    size_t num_samples,
                                    int sample_rate) {
    if (sample_rate != 16000) {
        throw std::runtime_error("Diarization requires 16kHz audio (got " +
                                 std::to_string(sample_rate) + "Hz)");
    }

    if (!is_ready()) {
        throw std::runtime_error("Diarizer not initialized");
    }

    auto embeddings = extract_embeddings(audio_data, num_samples, sample_rate);
    if (embeddings.empty()) {
        std::cerr << "[Diarizer] No embeddings extracted (audio too short or silent)\n";
        return DiarizationResult();
    }

    std::cout << "[Diarizer] Extracted " << embeddings.size() << " embeddings\n";

    DiarizationResult result = cluster_speakers(embeddings, options_.clustering);

    std::cout << "[Diarizer] Detected " << result.num_speakers << " speakers in "
              << result.turns.size() << " turns\n";

    return result;
}

// ═══════════════════════════════════════════════════════════
// Embedding Extraction
// ═══════════════════════════════════════════════════════════

std::vector<SpeakerEmbedding> Diarizer::extract_embeddings(const float* audio_data,
                                                           size_t num_samples,
                                                           int sample_rate) {
    std::vector<SpeakerEmbedding> embeddings;

    const size_t window_samples = static_cast<size_t>(options_.embedding_window_s * sample_rate);
    const size_t step_samples = std::max<size_t>(1, static_cast<size_t>(options_.embedding_step_s * sample_rate));

    size_t skipped = 0;
    for (size_t pos = 0; pos + window_samples <= num_samples; pos += step_samples) {
        if (rms(audio_data + pos, window_samples) < options_.min_rms) {
            ++skipped;
            continue;
        }

        SpeakerEmbedding emb;
        emb.features = run_embedding_model(audio_data + pos, window_samples);
        emb.start = static_cast<int64_t>(pos) * 1000 / sample_rate;
        emb.end = static_cast<int64_t>(pos + window_samples) * 1000 / sample_rate;
        embeddings.push_back(std::move(emb));
    }

    if (skipped > 0) {
        std::cout << "[Diarizer] Skipped " << skipped << " silent windows\n";
    }

    return embeddings;
}

std::vector<float> Diarizer::run_embedding_model(const float* audio_data, size_t num_samples) {
    try {
        Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(
            OrtAllocatorType::OrtArenaAllocator, OrtMemType::OrtMemTypeDefault);

        // Model input is exactly [1, 16000] (1 second of audio)
        std::vector<float> input_data(kModelSamples, 0.0f);
        const size_t copy_size = std::min(num_samples, kModelSamples);
        std::copy(audio_data, audio_data + copy_size, input_data.begin());

        std::vector<int64_t> input_shape = {1, static_cast<int64_t>(kModelSamples)};

        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            memory_info, input_data.data(), input_data.size(),
            input_shape.data(), input_shape.size());

        const char* input_name = input_name_.c_str();
        const char* output_name = output_name_.c_str();

        auto output_tensors = embedding_session_->Run(
            Ort::RunOptions{nullptr},
            &input_name, &input_tensor, 1,
            &output_name, 1);

        // [1, embedding_dim]
        const float* output_data = output_tensors[0].GetTensorData<float>();
        auto output_shape = output_tensors[0].GetTensorTypeAndShapeInfo().GetShape();

        const size_t embedding_size = static_cast<size_t>(output_shape.back());
        return std::vector<float>(output_data, output_data + embedding_size);

    } catch (const Ort::Exception& e) {
        throw std::runtime_error("ONNX embedding extraction failed: " + std::string(e.what()));
    }
}

} // namespace cascade
