#include "cascade/speaker_clustering.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace cascade {

namespace {

struct Cluster {
    std::vector<float> sum;          // Sum of member embeddings
    std::vector<size_t> members;     // Indices into the embedding list

    std::vector<float> centroid() const {
        std::vector<float> c(sum);
        for (float& v : c) {
            v /= static_cast<float>(members.size());
        }
        return c;
    }
};

void add_to(std::vector<float>& sum, const std::vector<float>& features) {
    if (sum.empty()) {
        sum = features;
        return;
    }
    for (size_t i = 0; i < sum.size(); ++i) {
        sum[i] += features[i];
    }
}

// Merge the most similar pair of clusters until at most max_clusters remain
void limit_clusters(std::vector<Cluster>& clusters, size_t max_clusters) {
    while (clusters.size() > max_clusters && clusters.size() > 1) {
        size_t best_a = 0;
        size_t best_b = 1;
        float best_sim = -std::numeric_limits<float>::infinity();

        for (size_t a = 0; a < clusters.size(); ++a) {
            const auto ca = clusters[a].centroid();
            for (size_t b = a + 1; b < clusters.size(); ++b) {
                const float sim = cosine_similarity(ca, clusters[b].centroid());
                if (sim > best_sim) {
                    best_sim = sim;
                    best_a = a;
                    best_b = b;
                }
            }
        }

        add_to(clusters[best_a].sum, clusters[best_b].sum);
        clusters[best_a].members.insert(clusters[best_a].members.end(),
                                        clusters[best_b].members.begin(),
                                        clusters[best_b].members.end());
        clusters.erase(clusters.begin() + static_cast<std::ptrdiff_t>(best_b));
    }
}

int64_t overlap(int64_t a_start, int64_t a_end, int64_t b_start, int64_t b_end) {
    return std::max<int64_t>(0, std::min(a_end, b_end) - std::max(a_start, b_start));
}

} // anonymous namespace

void ClusteringOptions::validate() const {
    if (clustering_threshold < -1.0f || clustering_threshold > 1.0f) {
        throw std::invalid_argument("ClusteringOptions: clustering_threshold must be in [-1, 1]");
    }
    if (max_speakers < 0) {
        throw std::invalid_argument("ClusteringOptions: max_speakers must be >= 0");
    }
    if (merge_gap_ms < 0) {
        throw std::invalid_argument("ClusteringOptions: merge_gap_ms must be >= 0");
    }
}

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Embedding size mismatch");
    }

    float dot_product = 0.0f;
    float norm1 = 0.0f;
    float norm2 = 0.0f;

    for (size_t i = 0; i < a.size(); ++i) {
        dot_product += a[i] * b[i];
        norm1 += a[i] * a[i];
        norm2 += b[i] * b[i];
    }

    if (norm1 == 0.0f || norm2 == 0.0f) {
        return 0.0f;
    }

    return dot_product / (std::sqrt(norm1) * std::sqrt(norm2));
}

DiarizationResult cluster_speakers(const std::vector<SpeakerEmbedding>& embeddings,
                                   const ClusteringOptions& options) {
    options.validate();

    DiarizationResult result;
    if (embeddings.empty()) {
        return result;
    }

    // Online centroid clustering in time order
    std::vector<Cluster> clusters;
    for (size_t i = 0; i < embeddings.size(); ++i) {
        const auto& features = embeddings[i].features;

        int best = -1;
        float best_sim = options.clustering_threshold;
        for (size_t c = 0; c < clusters.size(); ++c) {
            const float sim = cosine_similarity(clusters[c].centroid(), features);
            if (sim >= best_sim) {
                best_sim = sim;
                best = static_cast<int>(c);
            }
        }

        if (best < 0) {
            clusters.emplace_back();
            best = static_cast<int>(clusters.size()) - 1;
        }
        add_to(clusters[best].sum, features);
        clusters[best].members.push_back(i);
    }

    if (options.max_speakers > 0) {
        limit_clusters(clusters, static_cast<size_t>(options.max_speakers));
    }

    // Owned span of each window: up to the next window's start
    std::vector<int64_t> owned_end(embeddings.size());
    for (size_t i = 0; i < embeddings.size(); ++i) {
        owned_end[i] = embeddings[i].end;
        if (i + 1 < embeddings.size()) {
            owned_end[i] = std::min(owned_end[i], std::max(embeddings[i].start, embeddings[i + 1].start));
        }
    }

    // Most active speaker first
    std::vector<int64_t> durations(clusters.size(), 0);
    for (size_t c = 0; c < clusters.size(); ++c) {
        for (size_t idx : clusters[c].members) {
            durations[c] += owned_end[idx] - embeddings[idx].start;
        }
    }
    std::vector<size_t> order(clusters.size());
    for (size_t c = 0; c < order.size(); ++c) order[c] = c;
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return durations[a] > durations[b]; });

    std::vector<int> window_speaker(embeddings.size(), -1);
    std::vector<float> window_confidence(embeddings.size(), 0.0f);
    for (size_t rank = 0; rank < order.size(); ++rank) {
        const Cluster& cluster = clusters[order[rank]];

        Speaker speaker;
        speaker.speaker_id = static_cast<int>(rank);
        speaker.centroid = cluster.centroid();
        speaker.window_count = cluster.members.size();
        speaker.total_duration = durations[order[rank]];

        for (size_t idx : cluster.members) {
            window_speaker[idx] = speaker.speaker_id;
            window_confidence[idx] = cosine_similarity(speaker.centroid, embeddings[idx].features);
        }
        result.speakers.push_back(std::move(speaker));
    }

    // Windows to turns, joining same-speaker neighbours
    for (size_t i = 0; i < embeddings.size(); ++i) {
        SpeakerTurn turn;
        turn.start = embeddings[i].start;
        turn.end = owned_end[i];
        turn.speaker_id = window_speaker[i];
        turn.confidence = window_confidence[i];

        if (!result.turns.empty()) {
            SpeakerTurn& last = result.turns.back();
            if (last.speaker_id == turn.speaker_id && turn.start - last.end < options.merge_gap_ms) {
                last.end = std::max(last.end, turn.end);
                last.confidence = (last.confidence + turn.confidence) / 2.0f;
                continue;
            }
        }
        result.turns.push_back(turn);
    }

    result.num_speakers = static_cast<int>(result.speakers.size());
    return result;
}

int get_speaker_at_time(const DiarizationResult& result, int64_t time_ms) {
    for (const auto& turn : result.turns) {
        if (time_ms >= turn.start && time_ms < turn.end) {
            return turn.speaker_id;
        }
    }
    return -1;
}

int dominant_speaker(const DiarizationResult& result, int64_t start_ms, int64_t end_ms) {
    if (result.turns.empty()) {
        return 0;
    }

    std::map<int, int64_t> overlap_by_speaker;
    for (const auto& turn : result.turns) {
        const int64_t o = overlap(start_ms, end_ms, turn.start, turn.end);
        if (o > 0) {
            overlap_by_speaker[turn.speaker_id] += o;
        }
    }

    if (!overlap_by_speaker.empty()) {
        auto best = std::max_element(overlap_by_speaker.begin(), overlap_by_speaker.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });
        return best->first;
    }

    // Zero-length span or a gap between turns: nearest turn wins
    const int64_t mid = start_ms + (end_ms - start_ms) / 2;
    int speaker = result.turns.front().speaker_id;
    int64_t best_distance = std::numeric_limits<int64_t>::max();
    for (const auto& turn : result.turns) {
        int64_t distance = 0;
        if (mid < turn.start) {
            distance = turn.start - mid;
        } else if (mid >= turn.end) {
            distance = mid - turn.end;
        }
        if (distance < best_distance) {
            best_distance = distance;
            speaker = turn.speaker_id;
        }
    }
    return speaker;
}

std::vector<Sentence> assign_speakers(const std::vector<TimedText>& spans,
                                      const DiarizationResult& result) {
    std::vector<Sentence> sentences;
    sentences.reserve(spans.size());

    for (const auto& span : spans) {
        sentences.emplace_back(span.start, span.end, span.text,
                               dominant_speaker(result, span.start, span.end));
    }

    std::stable_sort(sentences.begin(), sentences.end(),
                     [](const Sentence& a, const Sentence& b) { return a.start < b.start; });
    return sentences;
}

} // namespace cascade
