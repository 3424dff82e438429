// viralclust - cluster_writer.h
// Cluster membership, centroid and assignment files

#pragma once

#include "../core/sequence_store.h"
#include "../clustering/clustering_types.h"
#include "../pipeline/centroid_selector.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace viralclust {

// label -> member ids in ascending id order
using ClusterMembers = std::map<int, std::vector<int>>;

// Sequence text for an id, as the run loaded it
using SequenceLookup = std::function<const std::string&(int)>;

class ClusterWriter {
public:
    explicit ClusterWriter(std::string output_dir);

    // <output_dir>/<input name without last extension>_hdbscan.fasta
    std::string centroid_path(const std::string& input_path) const;

    // cluster.txt and one cluster<label>.fasta per label.
    // FASTA sequences are cut at the first run of ten 'X'.
    void write_membership(const ClusterMembers& clusters,
                          const SequenceStore& store) const;

    // Centroid FASTA in selection order plus its .clstr annotation
    void write_centroids(const std::string& input_path,
                         const ClusterMembers& clusters,
                         const CentroidSelection& selection,
                         const SequenceStore& store,
                         const SequenceLookup& sequence_of) const;

    // header, id, cluster, probability, goi per clustered sequence
    void write_assignments(const std::vector<int>& ids,
                           const clustering::ClusterAssignment& assignment,
                           const SequenceStore& store) const;

    // Byte-for-byte copy of the input to its centroid path
    void pass_through(const std::string& input_path) const;

    static std::string trim_ambiguous(const std::string& sequence);

    const std::string& output_dir() const { return output_dir_; }

private:
    std::string output_dir_;
};

}  // namespace viralclust
