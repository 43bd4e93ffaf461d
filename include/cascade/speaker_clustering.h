#pragma once

#include "export.h"
#include "types.h"
#include "whisper_tokens.h"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cascade {

/**
 * @brief Speaker embedding for one analysis window
 */
struct SpeakerEmbedding {
    std::vector<float> features;     // Embedding vector (model-defined dimension)
    int64_t start;                   // Window start (ms)
    int64_t end;                     // Window end (ms)

    SpeakerEmbedding() : start(0), end(0) {}
};

/**
 * @brief Speaker cluster
 */
struct Speaker {
    int speaker_id;                  // 0 = most active speaker
    std::vector<float> centroid;     // Mean embedding
    size_t window_count;             // Windows assigned to this speaker
    int64_t total_duration;          // Speaking time (ms)

    Speaker() : speaker_id(-1), window_count(0), total_duration(0) {}
};

/**
 * @brief Contiguous stretch of audio attributed to one speaker
 */
struct SpeakerTurn {
    int64_t start;                   // Start time (ms)
    int64_t end;                     // End time (ms)
    int speaker_id;                  // Speaker ID
    float confidence;                // Mean similarity to the speaker centroid

    SpeakerTurn() : start(0), end(0), speaker_id(-1), confidence(0.0f) {}
};

/**
 * @brief Clustering configuration
 */
struct ClusteringOptions {
    float clustering_threshold = 0.7f;     // Cosine similarity to join a cluster (0.5-0.9)
    int max_speakers = 10;                 // Merge closest clusters above this (0 = unlimited)
    int64_t merge_gap_ms = 500;            // Join same-speaker turns closer than this

    /**
     * @throws std::invalid_argument on out-of-range values
     */
    void validate() const;
};

/**
 * @brief Complete diarization result
 */
struct DiarizationResult {
    std::vector<SpeakerTurn> turns;        // Time-ordered speaker turns
    std::vector<Speaker> speakers;         // Detected speakers, most active first
    int num_speakers;                      // speakers.size()

    DiarizationResult() : num_speakers(0) {}
};

/**
 * @brief Cosine similarity of two embeddings (0.0 for a zero vector)
 *
 * @throws std::invalid_argument on a dimension mismatch
 */
CASCADE_API float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

/**
 * @brief Cluster embeddings into speakers and derive speaker turns
 *
 * Each window joins the most similar existing centroid when the similarity
 * reaches the threshold, otherwise it starts a new speaker. Clusters beyond
 * max_speakers are merged pairwise by centroid similarity. Speaker IDs are
 * renumbered by total speaking time.
 *
 * Overlapping windows own their span up to the next window's start.
 */
CASCADE_API DiarizationResult cluster_speakers(const std::vector<SpeakerEmbedding>& embeddings,
                                               const ClusteringOptions& options = ClusteringOptions());

/**
 * @brief Speaker ID at a time point (-1 if no turn covers it)
 */
CASCADE_API int get_speaker_at_time(const DiarizationResult& result, int64_t time_ms);

/**
 * @brief Speaker with the largest overlap of [start_ms, end_ms)
 *
 * Falls back to the nearest turn when nothing overlaps, and to 0 when the
 * result has no turns (single-speaker audio).
 */
CASCADE_API int dominant_speaker(const DiarizationResult& result, int64_t start_ms, int64_t end_ms);

/**
 * @brief Attach speakers to timed text, producing diarized sentences
 */
CASCADE_API std::vector<Sentence> assign_speakers(const std::vector<TimedText>& spans,
                                                  const DiarizationResult& result);

} // namespace cascade
