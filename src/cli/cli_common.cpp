// viralclust - cli_common.cpp
// Common CLI infrastructure implementation

#include "cli_common.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace viralclust {

std::vector<std::string> CLIOption::aliases() const {
    std::vector<std::string> result;
    std::stringstream ss(name);
    std::string part;
    while (std::getline(ss, part, ',')) {
        size_t b = part.find_first_not_of(' ');
        size_t e = part.find_last_not_of(' ');
        if (b != std::string::npos) result.push_back(part.substr(b, e - b + 1));
    }
    return result;
}

std::string CLIOption::canonical() const {
    auto all = aliases();
    return all.empty() ? name : all.back();
}

std::string ParsedArgs::get(const std::string& name, const std::string& default_val) const {
    auto it = values.find(name);
    return it == values.end() ? default_val : it->second;
}

bool ParsedArgs::has(const std::string& name) const {
    return flags.count(name) > 0 || values.count(name) > 0;
}

namespace {

using HelpRow = std::pair<std::string, std::string>;

// Two aligned columns; the left one is at least 21 characters wide
void print_block(const std::string& title, const std::vector<HelpRow>& rows) {
    if (rows.empty()) return;
    size_t width = 21;
    for (const auto& row : rows) width = std::max(width, row.first.size() + 3);

    std::cerr << title << ":\n";
    for (const auto& row : rows) {
        std::cerr << "  " << std::left << std::setw(static_cast<int>(width - 2)) << row.first
                  << row.second << "\n";
    }
    std::cerr << "\n";
}

HelpRow option_row(const CLIOption& opt) {
    std::string left = opt.arg_name.empty() ? opt.name : opt.name + " " + opt.arg_name;
    std::string right = opt.description;
    if (!opt.required && !opt.default_value.empty()) {
        right += " (default: " + opt.default_value + ")";
    }
    return {left, right};
}

}  // namespace

void CLICommand::print_help() const {
    std::cerr << "Usage: viralclust " << name << " [options]\n\n" << description << "\n";
    for (const auto& line : description_extra) std::cerr << line << "\n";
    std::cerr << "\n";

    std::vector<HelpRow> required_rows, optional_rows, output_rows;
    for (const auto& opt : options) {
        (opt.required ? required_rows : optional_rows).push_back(option_row(opt));
    }
    for (const auto& out : outputs) {
        output_rows.push_back({out.filename, out.condition.empty()
                                                 ? out.description
                                                 : out.description + " " + out.condition});
    }

    print_block("Required", required_rows);
    print_block("Options", optional_rows);
    print_block("Output", output_rows);

    if (!note.empty()) std::cerr << "Note:\n  " << note << "\n\n";
    if (!examples.empty()) {
        std::cerr << "Example:\n";
        for (const auto& ex : examples) std::cerr << "  " << ex << "\n";
    }
}

bool CLICommand::has_help_flag(int argc, char** argv) const {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return true;
        }
    }
    return false;
}

const CLIOption* CLICommand::find(const std::string& arg) const {
    for (const auto& opt : options) {
        auto names = opt.aliases();
        if (std::find(names.begin(), names.end(), arg) != names.end()) {
            return &opt;
        }
    }
    return nullptr;
}

std::vector<std::string> CLICommand::get_missing_required(int argc, char** argv) const {
    // A required option counts only when a value follows it
    std::set<std::string> given;
    for (int i = 1; i + 1 < argc; ++i) {
        if (const CLIOption* opt = find(argv[i])) given.insert(opt->canonical());
    }
    std::vector<std::string> missing;
    for (const auto& opt : options) {
        if (opt.required && !given.count(opt.canonical())) missing.push_back(opt.canonical());
    }
    return missing;
}

bool CLICommand::validate_required(int argc, char** argv) const {
    auto missing = get_missing_required(argc, argv);
    if (missing.empty()) {
        return true;
    }

    std::cerr << "Error: Missing required arguments:";
    for (const auto& m : missing) std::cerr << " " << m;
    std::cerr << "\n\n";
    print_help();
    return false;
}

ParsedArgs CLICommand::parse(int argc, char** argv) const {
    ParsedArgs parsed;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const CLIOption* opt = find(arg);
        if (!opt) {
            throw ParseArgsExit(EXIT_MISSING_INPUT, "Unknown option for '" + name + "': " + arg);
        }
        if (opt->arg_name.empty()) {
            parsed.flags.insert(opt->canonical());
            continue;
        }
        if (i + 1 >= argc) {
            throw ParseArgsExit(EXIT_MISSING_INPUT, "Missing value for " + arg);
        }
        parsed.values[opt->canonical()] = argv[++i];
    }
    return parsed;
}

int parse_int_option(const std::string& value, const std::string& message) {
    try {
        size_t idx = 0;
        int parsed = std::stoi(value, &idx);
        if (idx != value.size()) {
            throw ParseArgsExit(EXIT_BAD_PARAMETER, message);
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw ParseArgsExit(EXIT_BAD_PARAMETER, message);
    } catch (const std::out_of_range&) {
        throw ParseArgsExit(EXIT_BAD_PARAMETER, message);
    }
}

// Command definitions

CLICommand make_cluster_command() {
    CLICommand cmd;
    cmd.name = "cluster";
    cmd.description = "Group viral genomes by k-mer composition and pick one representative per group.";
    cmd.description_extra = {
        "",
        "Profiles are embedded with a fuzzy neighbour graph and clustered with HDBSCAN;",
        "the centroid of each cluster is the member closest on average to the others.",
    };

    cmd.options = {
        {"--input", "FILE", "Input genomes FASTA file (or .gz)", "", true},
        {"--goi", "FILE", "Genome(s) of interest, always kept as representatives"},
        {"--output", "DIR", "Output directory", "current directory"},
        {"-k, --kmer", "N", "k-mer length (1-12)", std::to_string(DEFAULT_KMER)},
        {"-p, --threads", "N", "Number of threads", "1"},
        {"--subcluster", "", "Re-cluster every cluster with a narrow neighbourhood"},
        {"--link-latest", "", "Point <parent of output>/latest at the output directory"},
        {"-v, --verbose", "", "Enable verbose output"},
        {"-h, --help", "", "Show this help message"},
    };

    cmd.outputs = {
        {"<input>_hdbscan.fasta", "Representative (centroid) sequences"},
        {"<input>_hdbscan.fasta.clstr", "Cluster members with centroids marked '*'"},
        {"cluster.txt", "Headers of every cluster, noise as Cluster -1"},
        {"cluster<N>.fasta", "Sequences of cluster N"},
        {"cluster_assignments.tsv", "Per-sequence label and membership probability"},
        {"cluster<N>_hdbscan.fasta", "Subcluster representatives", "(with --subcluster)"},
        {"viralclust_trace.log", "Detailed trace log for debugging"},
    };

    cmd.note = "With fewer than " + std::to_string(MIN_SEQUENCES) +
               " sequences, or when no cluster structure is found, the input is copied\n"
               "  unchanged to <input>_hdbscan.fasta.";

    cmd.examples = {
        "viralclust cluster --input genomes.fa --output clusters/ --threads 8",
        "viralclust cluster --input genomes.fa.gz --goi reference.fa -k 6 --subcluster",
    };

    return cmd;
}

}  // namespace viralclust
