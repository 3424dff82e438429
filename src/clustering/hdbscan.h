#pragma once

#include "clustering_types.h"
#include <memory>
#include <vector>

namespace viralclust::clustering {

class IClusterAssigner {
public:
    virtual ~IClusterAssigner() = default;

    // One label per point: NOISE_LABEL or a cluster number from 0
    virtual ClusterAssignment assign(const std::vector<std::vector<float>>& points) = 0;
};

// Row of the condensed cluster tree. child < n_points is a point, otherwise
// a cluster id; the root cluster is n_points.
struct CondensedEdge {
    int parent;
    int child;
    double lambda;      // 1 / distance at which child leaves parent
    int size;
};

// Density-based clustering over Euclidean distance: mutual reachability
// MST, single-linkage hierarchy condensed at min_cluster_size, clusters
// picked by excess of mass. The root is never selected.
class Hdbscan : public IClusterAssigner {
public:
    explicit Hdbscan(const HdbscanConfig& config = HdbscanConfig());
    ~Hdbscan() override = default;

    ClusterAssignment assign(const std::vector<std::vector<float>>& points) override;

    const std::vector<CondensedEdge>& condensed_tree() const { return condensed_; }

private:
    struct MergeRow {
        int left;
        int right;
        double distance;
        int size;
    };

    std::vector<double> core_distances(const std::vector<std::vector<float>>& points,
                                       int min_samples) const;

    std::vector<MergeRow> single_linkage(const std::vector<std::vector<float>>& points,
                                         const std::vector<double>& core) const;

    std::vector<CondensedEdge> condense(const std::vector<MergeRow>& hierarchy, int n_points) const;

    HdbscanConfig config_;
    std::vector<CondensedEdge> condensed_;
};

std::unique_ptr<IClusterAssigner> create_cluster_assigner(const HdbscanConfig& config);

}  // namespace viralclust::clustering
