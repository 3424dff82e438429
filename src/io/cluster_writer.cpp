#include "cluster_writer.h"
#include <viralclust/config.hpp>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace fs = std::filesystem;

namespace viralclust {

namespace {

std::ofstream open_output(const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    return out;
}

void finish(std::ofstream& out, const std::string& path) {
    out.close();
    if (out.fail()) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

}  // namespace

ClusterWriter::ClusterWriter(std::string output_dir)
    : output_dir_(std::move(output_dir)) {}

std::string ClusterWriter::centroid_path(const std::string& input_path) const {
    std::string stem = fs::path(input_path).stem().string();
    return (fs::path(output_dir_) / (stem + "_hdbscan.fasta")).string();
}

std::string ClusterWriter::trim_ambiguous(const std::string& sequence) {
    size_t cut = sequence.find(std::string(AMBIGUOUS_RUN, 'X'));
    return cut == std::string::npos ? sequence : sequence.substr(0, cut);
}

void ClusterWriter::write_membership(const ClusterMembers& clusters,
                                     const SequenceStore& store) const {
    std::string report_path = (fs::path(output_dir_) / "cluster.txt").string();
    std::ofstream report = open_output(report_path);

    for (const auto& [label, members] : clusters) {
        std::string fasta_path =
            (fs::path(output_dir_) / ("cluster" + std::to_string(label) + ".fasta")).string();
        std::ofstream fasta = open_output(fasta_path);

        report << ">Cluster " << label << "\n";
        for (int id : members) {
            report << store.header(id) << "\n";
            fasta << ">" << store.header(id) << "\n"
                  << trim_ambiguous(store.sequence(id)) << "\n";
        }
        report << "\n";
        finish(fasta, fasta_path);
    }
    finish(report, report_path);
}

void ClusterWriter::write_centroids(const std::string& input_path,
                                    const ClusterMembers& clusters,
                                    const CentroidSelection& selection,
                                    const SequenceStore& store,
                                    const SequenceLookup& sequence_of) const {
    std::string fasta_path = centroid_path(input_path);
    std::ofstream fasta = open_output(fasta_path);
    for (int id : selection.centroids) {
        fasta << ">" << store.header(id) << "\n" << sequence_of(id) << "\n";
    }
    finish(fasta, fasta_path);

    // CD-HIT style annotation; the identity column is a fixed placeholder
    std::string clstr_path = fasta_path + ".clstr";
    std::ofstream clstr = open_output(clstr_path);
    for (const auto& [label, members] : clusters) {
        clstr << ">Cluster " << label << "\n";
        for (size_t idx = 0; idx < members.size(); ++idx) {
            int id = members[idx];
            clstr << idx << "\t" << sequence_of(id).size() << "nt, >"
                  << store.header(id) << " ";
            if (selection.contains(id)) {
                clstr << "*\n";
            } else {
                clstr << "at +/13.37%\n";
            }
        }
    }
    finish(clstr, clstr_path);
}

void ClusterWriter::write_assignments(const std::vector<int>& ids,
                                      const clustering::ClusterAssignment& assignment,
                                      const SequenceStore& store) const {
    std::string path = (fs::path(output_dir_) / "cluster_assignments.tsv").string();
    std::ofstream out = open_output(path);
    out << "header\tid\tcluster\tprobability\tgoi\n";
    for (size_t i = 0; i < ids.size(); ++i) {
        int id = ids[i];
        out << store.header(id) << "\t" << id << "\t" << assignment.labels.at(i) << "\t"
            << std::fixed << std::setprecision(4) << assignment.probabilities.at(i) << "\t"
            << (store.is_goi(id) ? "yes" : "no") << "\n";
    }
    finish(out, path);
}

void ClusterWriter::pass_through(const std::string& input_path) const {
    std::string target = centroid_path(input_path);
    std::error_code ec;
    if (fs::exists(target, ec) && fs::equivalent(input_path, target, ec)) {
        return;
    }
    fs::copy_file(input_path, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw std::runtime_error("Failed to copy " + input_path + " to " + target + ": " +
                                 ec.message());
    }
}

}  // namespace viralclust
