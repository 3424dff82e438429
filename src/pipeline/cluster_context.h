// viralclust - cluster_context.h
// State shared by a top-level run and its subcluster runs

#pragma once

#include "../core/sequence_store.h"
#include "../algorithms/kmer_profile.h"
#include "../algorithms/distance.h"

#include <map>
#include <string>
#include <vector>

namespace viralclust {

struct ClusterContext {
    ClusterContext(int k, int threads_)
        : vocab(k), distances(threads_), threads(threads_) {}

    SequenceStore store;
    KmerVocabulary vocab;
    std::vector<std::vector<float>> profiles;   // Indexed by sequence id
    DistanceMatrix matrix;                      // Sized to the store after profiling
    PairwiseDistanceEngine distances;
    std::map<std::string, int> goi_clusters;    // goi header -> top-level label
    int threads;
};

}  // namespace viralclust
