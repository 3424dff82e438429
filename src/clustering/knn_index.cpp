#include "knn_index.h"
#include "../algorithms/distance.h"
#include "../util/parallel.h"

#include <hnswlib/hnswlib.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace viralclust::clustering {

KnnIndex::KnnIndex(const KnnConfig& config)
    : config_(config) {}

KnnIndex::~KnnIndex() = default;

KnnIndex::KnnIndex(KnnIndex&&) noexcept = default;
KnnIndex& KnnIndex::operator=(KnnIndex&&) noexcept = default;

void KnnIndex::build(const std::vector<std::vector<float>>& points) {
    if (points.empty()) {
        throw std::invalid_argument("Empty point set");
    }

    n_points_ = points.size();
    dim_ = points[0].size();
    if (dim_ == 0) {
        throw std::invalid_argument("Invalid dimensions");
    }

    data_.resize(n_points_ * dim_);
    for (size_t i = 0; i < n_points_; ++i) {
        if (points[i].size() != dim_) {
            throw std::invalid_argument("Inconsistent point dimensions");
        }
        std::copy(points[i].begin(), points[i].end(), data_.begin() + i * dim_);
    }

    indexed_ = data_;
    if (config_.metric == Metric::Cosine) {
        // Inner product on unit vectors is 1 - cosine similarity
        for (size_t i = 0; i < n_points_; ++i) {
            float* row = indexed_.data() + i * dim_;
            double norm = 0.0;
            for (size_t d = 0; d < dim_; ++d) norm += static_cast<double>(row[d]) * row[d];
            if (norm > 0.0) {
                float inv = static_cast<float>(1.0 / std::sqrt(norm));
                for (size_t d = 0; d < dim_; ++d) row[d] *= inv;
            }
        }
        space_ = std::make_unique<hnswlib::InnerProductSpace>(dim_);
    } else {
        space_ = std::make_unique<hnswlib::L2Space>(dim_);
    }

    index_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(
        space_.get(),
        n_points_,
        config_.M,
        config_.ef_construction,
        config_.random_seed
    );

    // Serial insertion keeps the graph identical between runs
    for (size_t i = 0; i < n_points_; ++i) {
        index_->addPoint(indexed_.data() + i * dim_, i);
    }

    index_->setEf(std::max(config_.ef_search, config_.k + 1));
}

double KnnIndex::exact_distance(size_t a, size_t b) const {
    const float* pa = data_.data() + a * dim_;
    const float* pb = data_.data() + b * dim_;
    if (config_.metric == Metric::Cosine) {
        return cosine_distance(pa, pb, dim_);
    }
    double sum = 0.0;
    for (size_t d = 0; d < dim_; ++d) {
        double diff = static_cast<double>(pa[d]) - pb[d];
        sum += diff * diff;
    }
    return std::sqrt(sum);
}

NeighborList KnnIndex::query_all() const {
    return query_all(config_.k);
}

NeighborList KnnIndex::query_all(int k) const {
    if (!is_built()) {
        throw std::runtime_error("Index not built");
    }

    int capped_k = std::min(k, static_cast<int>(n_points_));
    if (capped_k < 1) {
        throw std::invalid_argument("k must be at least 1");
    }

    NeighborList result;
    result.resize(n_points_, capped_k);

    int search_k = std::min(capped_k + 1, static_cast<int>(n_points_));

    parallel_for(n_points_, config_.threads, [&](size_t i) {
        auto neighbors = index_->searchKnn(indexed_.data() + i * dim_, search_k);

        std::vector<std::pair<float, int>> sorted;
        sorted.reserve(neighbors.size());
        while (!neighbors.empty()) {
            auto& top = neighbors.top();
            if (top.second != i) {
                sorted.emplace_back(static_cast<float>(exact_distance(i, top.second)),
                                    static_cast<int>(top.second));
            }
            neighbors.pop();
        }

        // Ties broken by id so the order does not depend on heap layout
        std::sort(sorted.begin(), sorted.end());

        result.ids[i].clear();
        result.dists[i].clear();
        result.ids[i].push_back(static_cast<int>(i));
        result.dists[i].push_back(0.0f);

        int count = std::min(static_cast<int>(sorted.size()), capped_k - 1);
        for (int j = 0; j < count; ++j) {
            result.ids[i].push_back(sorted[j].second);
            result.dists[i].push_back(sorted[j].first);
        }
    });

    return result;
}

}  // namespace viralclust::clustering
