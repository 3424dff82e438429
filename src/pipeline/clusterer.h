// viralclust - clusterer.h
// Profile -> embed -> cluster -> centroid pipeline for one FASTA

#pragma once

#include "cluster_context.h"
#include "centroid_selector.h"
#include "../clustering/clustering_types.h"
#include "../clustering/embedder.h"
#include "../clustering/hdbscan.h"
#include "../io/cluster_writer.h"
#include "../util/logger.h"

#include <memory>
#include <string>
#include <vector>

namespace viralclust {

enum class ClusterOutcome {
    Clustered,
    InsufficientData,    // Fewer than MIN_SEQUENCES records
    NoStructureFound     // A single distinct label
};

const char* to_string(ClusterOutcome outcome);

struct SubclusterReport {
    int clustered = 0;
    int passed_through = 0;
    int failed = 0;
};

class Clusterer {
public:
    Clusterer(ClusterContext& context, Logger& log, const std::string& output_dir);

    void set_embedder(std::unique_ptr<clustering::IEmbedder> embedder);
    void set_cluster_assigner(std::unique_ptr<clustering::IClusterAssigner> assigner);

    // Load the input (and genomes of interest) into the context, profile,
    // cluster and write every top-level output. InsufficientData and
    // NoStructureFound leave a pass-through copy instead.
    ClusterOutcome run(const std::string& input_path, const std::string& goi_path = "");

    // Re-cluster one cluster<label>.fasta written by run(), reusing the
    // context's profiles and distance matrix. Writes only the centroid
    // FASTA and its .clstr (or a pass-through copy).
    ClusterOutcome run_subcluster(const std::string& cluster_fasta);

    // run_subcluster() on every non-noise cluster of the last run(), in
    // ascending label order. A failing cluster is logged and skipped.
    SubclusterReport run_subclusters();

    // Results of the last invocation
    const std::vector<int>& ids() const { return ids_; }
    const clustering::ClusterAssignment& assignment() const { return assignment_; }
    const ClusterMembers& clusters() const { return clusters_; }
    const CentroidSelection& selection() const { return selection_; }

private:
    ClusterOutcome pass_through(const std::string& input_path, ClusterOutcome reason);

    // Embed and cluster the profiles of ids_; false when only one label results
    bool assign_clusters(const clustering::EmbeddingConfig& config);

    void group_members();

    clustering::EmbeddingConfig embedding_config(bool subcluster) const;

    ClusterContext& ctx_;
    Logger& log_;
    ClusterWriter writer_;
    std::unique_ptr<clustering::IEmbedder> embedder_;
    std::unique_ptr<clustering::IClusterAssigner> assigner_;

    std::vector<int> ids_;
    clustering::ClusterAssignment assignment_;
    ClusterMembers clusters_;
    CentroidSelection selection_;
    std::vector<int> top_level_labels_;
};

}  // namespace viralclust
