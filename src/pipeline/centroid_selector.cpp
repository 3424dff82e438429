#include "centroid_selector.h"
#include "../clustering/clustering_types.h"

#include <algorithm>
#include <limits>

namespace viralclust {

bool CentroidSelection::contains(int id) const {
    return std::find(centroids.begin(), centroids.end(), id) != centroids.end();
}

CentroidSelection select_centroids(const std::map<int, std::vector<int>>& clusters,
                                   const DistanceMatrix& matrix,
                                   const std::unordered_set<int>& goi) {
    CentroidSelection selection;
    std::unordered_set<int> seen;

    auto add = [&](int label, int id) {
        if (seen.insert(id).second) {
            selection.centroids.push_back(id);
            selection.by_cluster[label].push_back(id);
        }
    };

    for (const auto& [label, members] : clusters) {
        if (members.empty()) continue;

        if (label == clustering::NOISE_LABEL) {
            for (int id : members) {
                if (goi.count(id)) add(label, id);
            }
            continue;
        }

        if (members.size() == 1) {
            add(label, members.front());
            continue;
        }

        const double denom = static_cast<double>(members.size() - 1);
        int best = -1;
        double best_avg = std::numeric_limits<double>::infinity();
        for (int id : members) {
            if (goi.count(id)) {
                add(label, id);
                continue;
            }
            double sum = 0.0;
            for (int other : members) {
                if (other != id) sum += matrix.get(id, other);
            }
            double avg = sum / denom;
            if (avg < best_avg) {
                best_avg = avg;
                best = id;
            }
        }
        if (best >= 0) add(label, best);
    }
    return selection;
}

}  // namespace viralclust
