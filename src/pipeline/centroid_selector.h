// viralclust - centroid_selector.h
// Representative sequence per cluster

#pragma once

#include "../algorithms/distance.h"

#include <map>
#include <unordered_set>
#include <vector>

namespace viralclust {

struct CentroidSelection {
    std::vector<int> centroids;                  // Selection order, no duplicates
    std::map<int, std::vector<int>> by_cluster;  // label -> centroids it contributed

    bool contains(int id) const;
};

// For each label in ascending order:
//   noise (-1)   only genomes of interest are kept
//   one member   that member, without touching the matrix
//   otherwise    every genome of interest, plus the other member with the
//                strictly smallest mean distance to the rest of the cluster
// clusters maps label -> member ids in iteration order.
CentroidSelection select_centroids(const std::map<int, std::vector<int>>& clusters,
                                   const DistanceMatrix& matrix,
                                   const std::unordered_set<int>& goi);

}  // namespace viralclust
