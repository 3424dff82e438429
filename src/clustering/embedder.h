#pragma once

#include "clustering_types.h"
#include <memory>
#include <utility>
#include <vector>

namespace viralclust::clustering {

class IEmbedder {
public:
    virtual ~IEmbedder() = default;

    // Maps each input point to config.n_components coordinates.
    // result[i] belongs to points[i].
    virtual std::vector<std::vector<float>> embed(
        const std::vector<std::vector<float>>& points,
        const EmbeddingConfig& config) = 0;
};

// Symmetric fuzzy neighbour graph, one entry per direction
struct FuzzyGraph {
    std::vector<int> head;
    std::vector<int> tail;
    std::vector<double> weight;

    size_t size() const { return head.size(); }
};

// Fuzzy simplicial set embedding: builds a weighted kNN graph in input space
// and lays it out with negative-sampling SGD. A fixed seed gives identical
// coordinates from run to run.
class FuzzyGraphEmbedder : public IEmbedder {
public:
    FuzzyGraphEmbedder() = default;
    ~FuzzyGraphEmbedder() override = default;

    std::vector<std::vector<float>> embed(
        const std::vector<std::vector<float>>& points,
        const EmbeddingConfig& config) override;

    // Curve 1 / (1 + a * d^(2b)) fitted to the min_dist/spread kernel
    static std::pair<double, double> fit_ab(double spread, double min_dist);

    // Per-point bandwidth sigma and local connectivity rho
    static void smooth_knn_dist(const NeighborList& knn,
                                std::vector<double>& sigmas,
                                std::vector<double>& rhos);

    // Directed memberships combined by fuzzy union a + b - ab
    static FuzzyGraph fuzzy_simplicial_set(const NeighborList& knn, int n_points);

private:
    static std::vector<std::vector<double>> initial_layout(
        const FuzzyGraph& graph, int n_points, int dim, int seed);

    static void optimize_layout(
        std::vector<std::vector<double>>& layout,
        const FuzzyGraph& graph,
        int n_epochs,
        double a, double b,
        const EmbeddingConfig& config);
};

std::unique_ptr<IEmbedder> create_embedder();

}  // namespace viralclust::clustering
