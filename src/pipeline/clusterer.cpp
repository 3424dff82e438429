#include "clusterer.h"
#include <viralclust/config.hpp>

#include <filesystem>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace fs = std::filesystem;

namespace viralclust {

const char* to_string(ClusterOutcome outcome) {
    switch (outcome) {
        case ClusterOutcome::Clustered: return "clustered";
        case ClusterOutcome::InsufficientData: return "insufficient_data";
        case ClusterOutcome::NoStructureFound: return "no_structure";
    }
    return "unknown";
}

Clusterer::Clusterer(ClusterContext& context, Logger& log, const std::string& output_dir)
    : ctx_(context),
      log_(log),
      writer_(output_dir),
      embedder_(clustering::create_embedder()) {
    clustering::HdbscanConfig hdb;
    hdb.min_cluster_size = MIN_CLUSTER_SIZE;
    hdb.min_samples = MIN_CLUSTER_SIZE;
    hdb.threads = ctx_.threads;
    assigner_ = clustering::create_cluster_assigner(hdb);
}

void Clusterer::set_embedder(std::unique_ptr<clustering::IEmbedder> embedder) {
    embedder_ = std::move(embedder);
}

void Clusterer::set_cluster_assigner(std::unique_ptr<clustering::IClusterAssigner> assigner) {
    assigner_ = std::move(assigner);
}

clustering::EmbeddingConfig Clusterer::embedding_config(bool subcluster) const {
    clustering::EmbeddingConfig config;
    config.n_neighbors = subcluster ? SUB_NEIGHBORS : TOP_NEIGHBORS;
    config.min_dist = subcluster ? SUB_MIN_DIST : TOP_MIN_DIST;
    config.n_components = EMBED_DIMENSIONS;
    config.metric = clustering::Metric::Cosine;
    config.random_seed = EMBED_SEED;
    config.threads = ctx_.threads;
    return config;
}

ClusterOutcome Clusterer::pass_through(const std::string& input_path, ClusterOutcome reason) {
    log_.warn("Too few sequences for clustering in " +
              fs::path(input_path).filename().string() +
              ". No subcluster will be created.");
    log_.decision("PASS_THROUGH", to_string(reason), input_path);
    writer_.pass_through(input_path);
    return reason;
}

bool Clusterer::assign_clusters(const clustering::EmbeddingConfig& config) {
    std::vector<std::vector<float>> points;
    points.reserve(ids_.size());
    for (int id : ids_) points.push_back(ctx_.profiles.at(id));

    log_.detail("Embedding " + std::to_string(points.size()) + " profiles into " +
                std::to_string(config.n_components) + " dimensions (n_neighbors=" +
                std::to_string(config.n_neighbors) + ")");
    auto embedding = embedder_->embed(points, config);
    assignment_ = assigner_->assign(embedding);

    if (assignment_.labels.size() != ids_.size()) {
        throw std::runtime_error("Cluster assigner returned " +
                                 std::to_string(assignment_.labels.size()) +
                                 " labels for " + std::to_string(ids_.size()) + " points");
    }

    std::set<int> distinct(assignment_.labels.begin(), assignment_.labels.end());
    log_.metric("distinct_labels", static_cast<int>(distinct.size()));
    log_.metric("noise_points", assignment_.num_noise());
    return distinct.size() > 1;
}

void Clusterer::group_members() {
    clusters_.clear();
    for (size_t i = 0; i < ids_.size(); ++i) {
        clusters_[assignment_.labels[i]].push_back(ids_[i]);
    }
}

ClusterOutcome Clusterer::run(const std::string& input_path, const std::string& goi_path) {
    log_.section("Input");
    size_t n_input = ctx_.store.load(input_path);
    log_.metric("input_sequences", static_cast<int>(n_input));
    if (!goi_path.empty()) {
        size_t n_goi = ctx_.store.load_goi(goi_path);
        log_.metric("goi_sequences", static_cast<int>(n_goi));
    }

    if (ctx_.store.size() < static_cast<size_t>(MIN_SEQUENCES)) {
        return pass_through(input_path, ClusterOutcome::InsufficientData);
    }

    log_.section("Profiles");
    log_.info("Determining k-mer profiles for all sequences.");
    std::vector<const std::string*> seqs;
    seqs.reserve(ctx_.store.size());
    for (size_t id = 0; id < ctx_.store.size(); ++id) {
        seqs.push_back(&ctx_.store.sequence(static_cast<int>(id)));
    }
    size_t zero_profiles = 0;
    ctx_.profiles = compute_profiles(seqs, ctx_.vocab, ctx_.threads, &zero_profiles);
    ctx_.matrix = DistanceMatrix(ctx_.store.size());
    log_.metric("k", ctx_.vocab.k());
    log_.metric("profile_length", static_cast<int>(ctx_.vocab.size()));
    if (zero_profiles > 0) {
        log_.detail(std::to_string(zero_profiles) +
                    " sequence(s) too short for a single k-mer window; using an all-zero profile");
    }
    if (!goi_path.empty()) {
        log_.info("Found " + std::to_string(ctx_.store.goi_ids().size()) +
                  " genome(s) of interest.");
    }

    log_.section("Clustering");
    log_.info("Clustering with UMAP and HDBSCAN.");
    ids_.clear();
    for (size_t id = 0; id < ctx_.store.size(); ++id) ids_.push_back(static_cast<int>(id));
    top_level_labels_.clear();

    if (!assign_clusters(embedding_config(false))) {
        return pass_through(input_path, ClusterOutcome::NoStructureFound);
    }
    group_members();

    int n_noise = assignment_.num_noise();
    log_.info("Summarized " + std::to_string(ids_.size()) + " sequences into " +
              std::to_string(assignment_.num_clusters) + " clusters. Filtered " +
              std::to_string(n_noise) + " sequences due to uncertainty.");

    std::vector<std::vector<std::string>> rows;
    for (const auto& [label, members] : clusters_) {
        rows.push_back({std::to_string(label), std::to_string(members.size())});
        if (label != clustering::NOISE_LABEL) top_level_labels_.push_back(label);
        for (int id : members) {
            if (ctx_.store.is_goi(id)) ctx_.goi_clusters[ctx_.store.header(id)] = label;
        }
    }
    log_.table("clusters", {"label", "members"}, rows);
    for (const auto& [header, label] : ctx_.goi_clusters) {
        log_.info("You find the genome " + header + " in cluster " + std::to_string(label) + ".");
    }

    writer_.write_membership(clusters_, ctx_.store);
    writer_.write_assignments(ids_, assignment_, ctx_.store);

    log_.section("Centroids");
    log_.info("Extracting centroid sequences and writing results to file.");
    for (const auto& [label, members] : clusters_) {
        if (label == clustering::NOISE_LABEL || members.size() < 2) continue;
        ctx_.distances.compute(members, ctx_.profiles, ctx_.matrix);
    }
    log_.metric("distance_pairs", static_cast<int>(ctx_.distances.pairs_computed()));

    const auto& goi_list = ctx_.store.goi_ids();
    std::unordered_set<int> goi(goi_list.begin(), goi_list.end());
    selection_ = select_centroids(clusters_, ctx_.matrix, goi);
    log_.metric("centroids", static_cast<int>(selection_.centroids.size()));

    const SequenceStore& store = ctx_.store;
    writer_.write_centroids(input_path, clusters_, selection_, store,
                            [&store](int id) -> const std::string& { return store.sequence(id); });
    return ClusterOutcome::Clustered;
}

ClusterOutcome Clusterer::run_subcluster(const std::string& cluster_fasta) {
    log_.section("Subcluster " + fs::path(cluster_fasta).filename().string());

    std::vector<ResolvedRecord> records = ctx_.store.resolve(cluster_fasta);
    log_.metric("sequences", static_cast<int>(records.size()));
    if (records.size() < static_cast<size_t>(MIN_SEQUENCES)) {
        return pass_through(cluster_fasta, ClusterOutcome::InsufficientData);
    }
    if (ctx_.profiles.size() != ctx_.store.size()) {
        throw std::runtime_error("Subclustering requires profiles from a top-level run");
    }

    // Sequences as written to the cluster file, which may be trimmed
    std::unordered_map<int, std::string> sequences;
    ids_.clear();
    for (auto& rec : records) {
        ids_.push_back(rec.id);
        sequences[rec.id] = std::move(rec.sequence);
    }

    if (!assign_clusters(embedding_config(true))) {
        return pass_through(cluster_fasta, ClusterOutcome::NoStructureFound);
    }
    group_members();

    // Members of one top-level cluster: every pair is already in the matrix
    const auto& goi_list = ctx_.store.goi_ids();
    std::unordered_set<int> goi(goi_list.begin(), goi_list.end());
    selection_ = select_centroids(clusters_, ctx_.matrix, goi);
    log_.metric("subclusters", assignment_.num_clusters);
    log_.metric("centroids", static_cast<int>(selection_.centroids.size()));

    writer_.write_centroids(cluster_fasta, clusters_, selection_, ctx_.store,
                            [&sequences](int id) -> const std::string& { return sequences.at(id); });
    return ClusterOutcome::Clustered;
}

SubclusterReport Clusterer::run_subclusters() {
    SubclusterReport report;
    const std::vector<int> labels = top_level_labels_;
    for (int label : labels) {
        std::string path = (fs::path(writer_.output_dir()) /
                            ("cluster" + std::to_string(label) + ".fasta")).string();
        try {
            ClusterOutcome outcome = run_subcluster(path);
            if (outcome == ClusterOutcome::Clustered) {
                report.clustered++;
            } else {
                report.passed_through++;
            }
        } catch (const std::exception& e) {
            log_.error("Subclustering " + path + " failed: " + e.what());
            report.failed++;
        }
    }
    log_.decision("SUBCLUSTER", std::to_string(report.clustered) + " clustered, " +
                  std::to_string(report.passed_through) + " passed through, " +
                  std::to_string(report.failed) + " failed");
    return report;
}

}  // namespace viralclust
