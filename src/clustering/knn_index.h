#pragma once

#include "clustering_types.h"
#include <memory>
#include <vector>

namespace hnswlib {
template<typename dist_t> class HierarchicalNSW;
template<typename MTYPE> class SpaceInterface;
}

namespace viralclust::clustering {

// HNSW neighbour search. Candidates from the graph are re-scored with the
// exact metric, so cosine distances match cosine_distance() including its
// zero-vector rules.
class KnnIndex {
public:
    explicit KnnIndex(const KnnConfig& config = KnnConfig());
    ~KnnIndex();

    KnnIndex(const KnnIndex&) = delete;
    KnnIndex& operator=(const KnnIndex&) = delete;
    KnnIndex(KnnIndex&&) noexcept;
    KnnIndex& operator=(KnnIndex&&) noexcept;

    void build(const std::vector<std::vector<float>>& points);

    // k neighbours per point with the point itself first at distance 0.
    // k is capped at size().
    NeighborList query_all() const;
    NeighborList query_all(int k) const;

    size_t size() const { return n_points_; }
    size_t dim() const { return dim_; }
    bool is_built() const { return index_ != nullptr; }

private:
    double exact_distance(size_t a, size_t b) const;

    KnnConfig config_;
    std::unique_ptr<hnswlib::SpaceInterface<float>> space_;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> index_;
    size_t n_points_ = 0;
    size_t dim_ = 0;
    std::vector<float> data_;       // Raw points, row major
    std::vector<float> indexed_;    // What HNSW sees (unit vectors for cosine)
};

}  // namespace viralclust::clustering
