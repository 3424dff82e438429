// viralclust - Viral genome clustering
// Entry point: dispatches argv[1] to a subcommand handler

#include <viralclust/config.hpp>
#include "cli/cli_common.h"
#include <iostream>
#include <string>

namespace {

struct Subcommand {
    const char* name;
    const char* summary;
    int (*handler)(int, char**);
};

const Subcommand kSubcommands[] = {
    {"cluster", "Cluster genomes and extract representative sequences", viralclust::cmd_cluster},
};

void print_usage(const char* prog) {
    std::cerr << "viralclust " << viralclust::VERSION
              << " - k-mer based clustering of viral genomes\n\n"
              << "Usage: " << prog << " <command> [options]\n\n"
              << "Commands:\n";
    for (const auto& sub : kSubcommands) {
        std::cerr << "  " << sub.name << std::string(17 - std::string(sub.name).size(), ' ')
                  << sub.summary << "\n";
    }
    std::cerr << "\n  -h, --help       Show this help message\n"
              << "  -v, --version    Show version information\n\n"
              << "Run 'viralclust <command> --help' for the options of a command, e.g.\n"
              << "  viralclust cluster --input genomes.fa --goi reference.fa --subcluster\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return viralclust::EXIT_MISSING_INPUT;
    }

    const std::string cmd = argv[1];
    if (cmd == "-h" || cmd == "--help") {
        print_usage(argv[0]);
        return viralclust::EXIT_OK;
    }
    if (cmd == "-v" || cmd == "--version") {
        std::cout << "viralclust " << viralclust::VERSION << "\n";
        return viralclust::EXIT_OK;
    }

    for (const auto& sub : kSubcommands) {
        if (cmd == sub.name) return sub.handler(argc - 1, argv + 1);
    }

    std::cerr << "Error: Unknown command '" << cmd << "'\n\n";
    print_usage(argv[0]);
    return viralclust::EXIT_MISSING_INPUT;
}
