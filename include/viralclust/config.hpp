// viralclust - Centralized configuration structures
// Run options, exit codes and pipeline constants in one place
#ifndef VIRALCLUST_CONFIG_HPP
#define VIRALCLUST_CONFIG_HPP

#include <string>
#include "viralclust/version.h"

namespace viralclust {

// Global version (set by cmake from git describe)
constexpr const char* VERSION = VIRALCLUST_VERSION_STRING;

// Process exit statuses, one per error class
constexpr int EXIT_OK = 0;
constexpr int EXIT_MISSING_INPUT = 1;    // Missing file/argument, bad output dir, unknown command
constexpr int EXIT_BAD_PARAMETER = 2;    // Unparsable --kmer / --threads
constexpr int EXIT_RUNTIME_ERROR = 3;    // I/O or worker failure during the run

// Embedding needs a minimum neighbourhood; below this the input is passed through
constexpr int MIN_SEQUENCES = 21;

// Supported k-mer sizes (profile length is 4^k)
constexpr int MIN_KMER = 1;
constexpr int MAX_KMER = 12;
constexpr int DEFAULT_KMER = 7;

// Embedding parameters shared by top-level and subcluster runs
constexpr int EMBED_DIMENSIONS = 20;
constexpr int EMBED_SEED = 42;

// Top level: wide neighbourhood, coarse grouping
constexpr int TOP_NEIGHBORS = 50;
constexpr double TOP_MIN_DIST = 0.25;

// Subclusters: narrow neighbourhood, fine local structure
constexpr int SUB_NEIGHBORS = 5;
constexpr double SUB_MIN_DIST = 0.0;

// HDBSCAN defaults
constexpr int MIN_CLUSTER_SIZE = 5;

// A run of this many 'X' marks an ambiguous region; cluster FASTAs are cut there
constexpr int AMBIGUOUS_RUN = 10;

// Cluster command configuration
struct ClusterConfig {
    std::string input_path;
    std::string goi_path;          // Optional genome(s) of interest
    std::string output_dir = ".";
    int k = DEFAULT_KMER;
    int threads = 1;
    bool subcluster = false;
    bool link_latest = false;      // Point <parent>/latest at output_dir
    bool verbose = false;
};

}  // namespace viralclust

#endif  // VIRALCLUST_CONFIG_HPP
