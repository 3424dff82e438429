#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>

namespace viralclust::clustering {

constexpr int NOISE_LABEL = -1;

enum class Metric {
    Cosine,
    Euclidean
};

struct KnnConfig {
    int k = 15;                   // Neighbours per point, self included
    Metric metric = Metric::Cosine;
    int ef_search = 200;          // HNSW only
    int M = 16;                   // HNSW only
    int ef_construction = 200;    // HNSW only
    int random_seed = 42;
    int threads = 1;
};

// Row i holds the neighbours of point i, nearest first; ids[i][0] == i
struct NeighborList {
    std::vector<std::vector<int>> ids;
    std::vector<std::vector<float>> dists;

    size_t size() const { return ids.size(); }

    void resize(size_t n, size_t k) {
        ids.resize(n);
        dists.resize(n);
        for (size_t i = 0; i < n; ++i) {
            ids[i].reserve(k);
            dists[i].reserve(k);
        }
    }
};

struct EmbeddingConfig {
    int n_neighbors = 15;
    double min_dist = 0.1;
    double spread = 1.0;
    int n_components = 20;
    Metric metric = Metric::Cosine;
    int random_seed = 42;
    int n_epochs = -1;            // -1: 500, or 200 above 10000 points
    double learning_rate = 1.0;
    int negative_sample_rate = 5;
    double repulsion_strength = 1.0;
    int threads = 1;              // kNN search only; SGD stays serial for reproducibility
};

struct HdbscanConfig {
    int min_cluster_size = 5;
    int min_samples = -1;         // -1: same as min_cluster_size
    int threads = 1;
};

struct ClusterAssignment {
    std::vector<int> labels;              // NOISE_LABEL or 0..num_clusters-1
    std::vector<double> probabilities;    // Membership strength, 0 for noise
    int num_clusters = 0;

    int num_noise() const {
        int count = 0;
        for (int l : labels) {
            if (l == NOISE_LABEL) count++;
        }
        return count;
    }
};

}  // namespace viralclust::clustering
