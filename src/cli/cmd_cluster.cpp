// viralclust - cmd_cluster.cpp
// CLI handler for the 'cluster' subcommand

#include "cli_common.h"
#include "../pipeline/clusterer.h"
#include "../util/logger.h"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace viralclust {

ClusterConfig parse_cluster_args(int argc, char** argv) {
    CLICommand cmd = make_cluster_command();

    if (cmd.has_help_flag(argc, argv)) {
        cmd.print_help();
        throw ParseArgsExit(EXIT_OK);
    }

    if (!cmd.validate_required(argc, argv)) {
        throw ParseArgsExit(EXIT_MISSING_INPUT);
    }

    ParsedArgs args = cmd.parse(argc, argv);

    ClusterConfig config;
    config.input_path = args.get("--input");
    config.goi_path = args.get("--goi");
    config.output_dir = args.get("--output", ".");
    config.subcluster = args.has("--subcluster");
    config.link_latest = args.has("--link-latest");
    config.verbose = args.has("--verbose");

    if (!fs::is_regular_file(config.input_path)) {
        throw ParseArgsExit(EXIT_MISSING_INPUT,
                            "Couldn't find input sequences. Check your file: " + config.input_path);
    }
    if (!config.goi_path.empty() && !fs::is_regular_file(config.goi_path)) {
        throw ParseArgsExit(EXIT_MISSING_INPUT,
                            "Couldn't find genome of interest. Check your file: " + config.goi_path);
    }

    if (args.has("--kmer")) {
        config.k = parse_int_option(args.get("--kmer"),
                                    "Invalid parameter for k-mer size. Please input a number.");
        if (config.k < MIN_KMER || config.k > MAX_KMER) {
            throw ParseArgsExit(EXIT_BAD_PARAMETER,
                                "k-mer size must be between " + std::to_string(MIN_KMER) +
                                " and " + std::to_string(MAX_KMER));
        }
    }

    if (args.has("--threads")) {
        config.threads = parse_int_option(args.get("--threads"),
                                          "Invalid number for CPU cores. Please input a number.");
        if (config.threads < 1) {
            throw ParseArgsExit(EXIT_BAD_PARAMETER, "--threads must be >= 1");
        }
    }

    return config;
}

// Replace <parent>/latest with a symlink to the output directory
static void link_latest(const std::string& output_dir, Logger& log) {
    std::error_code ec;
    fs::path target = fs::absolute(output_dir, ec).lexically_normal();
    if (ec) {
        log.warn("Could not resolve output directory for 'latest' link: " + ec.message());
        return;
    }
    if (target.filename().empty()) target = target.parent_path();
    fs::path link = target.parent_path() / "latest";

    if (fs::is_symlink(fs::symlink_status(link, ec))) {
        fs::remove(link, ec);
    } else if (fs::exists(link, ec)) {
        log.warn(link.string() + " exists and is not a symlink; not replacing it");
        return;
    }

    fs::create_directory_symlink(target, link, ec);
    if (ec) {
        log.warn("Could not create " + link.string() + ": " + ec.message());
    } else {
        log.detail("Linked " + link.string() + " -> " + target.string());
    }
}

int run_cluster(const ClusterConfig& config) {
    Logger log("cluster", VERSION);
    log.console_level = config.verbose ? Verbosity::Verbose : Verbosity::Quiet;

    log.info("Starting to cluster your data. Stay tuned.");

    std::error_code ec;
    bool existed = fs::is_directory(config.output_dir, ec);
    if (existed) {
        log.warn("The output directory exists. Files will be overwritten.");
    } else {
        fs::create_directories(config.output_dir, ec);
        if (ec) {
            log.error("Cannot create output directory " + config.output_dir + ": " + ec.message());
            return EXIT_MISSING_INPUT;
        }
        log.info("Creating output directory: " + config.output_dir);
    }

    std::string trace_path = (fs::path(config.output_dir) / "viralclust_trace.log").string();
    if (!log.open_trace(trace_path)) {
        log.warn("Could not open trace file " + trace_path);
    }

    log.section("Configuration");
    log.metric("input", config.input_path);
    log.metric("goi", config.goi_path.empty() ? std::string("none") : config.goi_path);
    log.metric("output", config.output_dir);
    log.metric("k", config.k);
    log.metric("threads", config.threads);
    log.metric("subcluster", std::string(config.subcluster ? "yes" : "no"));

    int status = EXIT_OK;
    try {
        ClusterContext context(config.k, config.threads);
        Clusterer clusterer(context, log, config.output_dir);

        ClusterOutcome outcome = clusterer.run(config.input_path, config.goi_path);
        log.decision("OUTCOME", to_string(outcome));

        if (outcome == ClusterOutcome::Clustered && config.subcluster) {
            log.info("Extracting representative sequences for each cluster.");
            SubclusterReport report = clusterer.run_subclusters();
            if (report.failed > 0) {
                log.error(std::to_string(report.failed) + " subcluster run(s) failed");
                status = EXIT_RUNTIME_ERROR;
            }
        }
    } catch (const std::exception& e) {
        log.error(e.what());
        return EXIT_RUNTIME_ERROR;
    }

    if (config.link_latest) {
        link_latest(config.output_dir, log);
    }
    return status;
}

int cmd_cluster(int argc, char** argv) {
    ClusterConfig config;
    try {
        config = parse_cluster_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.exit_code() != EXIT_OK && e.what()[0] != '\0') {
            Logger log;
            log.error(e.what());
        }
        return e.exit_code();
    }
    return run_cluster(config);
}

}  // namespace viralclust
