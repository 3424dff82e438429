// Unit tests for 'cluster' argument parsing

#include "cli/cli_common.h"
#include <cassert>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

class ArgvBuilder {
public:
    ArgvBuilder& add(const std::string& arg) {
        args_.push_back(strdup(arg.c_str()));
        return *this;
    }

    int argc() const { return static_cast<int>(args_.size()); }
    char** argv() { return args_.data(); }

    ~ArgvBuilder() {
        for (char* arg : args_) {
            std::free(arg);
        }
    }

private:
    std::vector<char*> args_;
};

static std::string input_file() {
    fs::path dir = fs::temp_directory_path() / "viralclust_test_cli_args";
    fs::create_directories(dir);
    fs::path p = dir / "input.fa";
    std::ofstream(p) << ">a\nACGT\n";
    return p.string();
}

static void expect_parse_exit(int expected_code, ArgvBuilder& builder) {
    bool threw = false;
    try {
        (void)viralclust::parse_cluster_args(builder.argc(), builder.argv());
    } catch (const viralclust::ParseArgsExit& e) {
        threw = true;
        assert(e.exit_code() == expected_code);
    }
    assert(threw);
}

void test_defaults() {
    std::cout << "Testing defaults... ";
    ArgvBuilder builder;
    builder.add("cluster").add("--input").add(input_file());
    auto config = viralclust::parse_cluster_args(builder.argc(), builder.argv());
    assert(config.input_path == input_file());
    assert(config.goi_path.empty());
    assert(config.output_dir == ".");
    assert(config.k == viralclust::DEFAULT_KMER);
    assert(config.threads == 1);
    assert(!config.subcluster);
    assert(!config.link_latest);
    assert(!config.verbose);
    std::cout << "PASSED\n";
}

void test_all_options() {
    std::cout << "Testing every option... ";
    std::string input = input_file();
    ArgvBuilder builder;
    builder.add("cluster")
           .add("--input").add(input)
           .add("--goi").add(input)
           .add("--output").add("out_dir")
           .add("-k").add("5")
           .add("--threads").add("4")
           .add("--subcluster")
           .add("--link-latest")
           .add("-v");
    auto config = viralclust::parse_cluster_args(builder.argc(), builder.argv());
    assert(config.goi_path == input);
    assert(config.output_dir == "out_dir");
    assert(config.k == 5);
    assert(config.threads == 4);
    assert(config.subcluster);
    assert(config.link_latest);
    assert(config.verbose);

    ArgvBuilder aliases;
    aliases.add("cluster").add("--input").add(input).add("--kmer").add("3").add("-p").add("2");
    auto alias_config = viralclust::parse_cluster_args(aliases.argc(), aliases.argv());
    assert(alias_config.k == 3);
    assert(alias_config.threads == 2);
    std::cout << "PASSED\n";
}

void test_missing_inputs() {
    std::cout << "Testing missing inputs exit 1... ";
    {
        ArgvBuilder builder;
        builder.add("cluster");
        expect_parse_exit(viralclust::EXIT_MISSING_INPUT, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("cluster").add("--input").add("/nonexistent/genomes.fa");
        expect_parse_exit(viralclust::EXIT_MISSING_INPUT, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("cluster").add("--input").add(input_file()).add("--goi").add("/nonexistent/goi.fa");
        expect_parse_exit(viralclust::EXIT_MISSING_INPUT, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("cluster").add("--input").add(input_file()).add("--bogus");
        expect_parse_exit(viralclust::EXIT_MISSING_INPUT, builder);
    }
    std::cout << "PASSED\n";
}

void test_bad_parameters() {
    std::cout << "Testing bad parameters exit 2... ";
    const char* bad_kmers[] = {"x", "7a", "0", "13", "-1"};
    for (const char* k : bad_kmers) {
        ArgvBuilder builder;
        builder.add("cluster").add("--input").add(input_file()).add("-k").add(k);
        expect_parse_exit(viralclust::EXIT_BAD_PARAMETER, builder);
    }
    const char* bad_threads[] = {"two", "0", "-3"};
    for (const char* t : bad_threads) {
        ArgvBuilder builder;
        builder.add("cluster").add("--input").add(input_file()).add("--threads").add(t);
        expect_parse_exit(viralclust::EXIT_BAD_PARAMETER, builder);
    }
    std::cout << "PASSED\n";
}

void test_help_exit() {
    std::cout << "Testing help exits 0... ";
    ArgvBuilder builder;
    builder.add("cluster").add("--help");
    expect_parse_exit(viralclust::EXIT_OK, builder);
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== CLI Argument Parsing Tests ===\n\n";
    test_defaults();
    test_all_options();
    test_missing_inputs();
    test_bad_parameters();
    test_help_exit();
    fs::remove_all(fs::temp_directory_path() / "viralclust_test_cli_args");
    std::cout << "\nAll tests passed!\n";
    return 0;
}
