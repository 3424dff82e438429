// viralclust - cli_common.h
// Common CLI infrastructure for consistent command-line interface

#pragma once

#include <viralclust/config.hpp>

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace viralclust {

struct CLIOption {
    std::string name;           // e.g., "--input" or "-k, --kmer"
    std::string arg_name;       // e.g., "FILE", "N", "" for flags
    std::string description;
    std::string default_value;  // "" if required or no default
    bool required;

    CLIOption(const std::string& n, const std::string& arg, const std::string& desc,
              const std::string& def = "", bool req = false)
        : name(n), arg_name(arg), description(desc), default_value(def), required(req) {}

    // Spellings listed in name, e.g. {"-k", "--kmer"}
    std::vector<std::string> aliases() const;

    // Last alias, used as the key in ParsedArgs
    std::string canonical() const;
};

struct CLIOutput {
    std::string filename;
    std::string description;
    std::string condition;      // e.g., "(with --subcluster)" or ""

    CLIOutput(const std::string& f, const std::string& d, const std::string& c = "")
        : filename(f), description(d), condition(c) {}
};

// Thrown by argument parsing to end the process with exit_code.
// exit_code 0 means help or version was printed.
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int code, const std::string& message = "")
        : std::runtime_error(message), exit_code_(code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

struct ParsedArgs {
    std::map<std::string, std::string> values;   // canonical name -> value
    std::set<std::string> flags;                 // canonical names of flags seen

    std::string get(const std::string& name, const std::string& default_val = "") const;
    bool has(const std::string& name) const;
};

struct CLICommand {
    std::string name;
    std::string description;
    std::vector<std::string> description_extra;  // Additional description lines
    std::vector<CLIOption> options;
    std::vector<CLIOutput> outputs;
    std::string note;
    std::vector<std::string> examples;

    // Print formatted help message to stderr
    void print_help() const;

    // Check if help flag is present
    bool has_help_flag(int argc, char** argv) const;

    // Get list of missing required arguments
    std::vector<std::string> get_missing_required(int argc, char** argv) const;

    // Validate required arguments are present
    // Returns true if valid, false otherwise (prints error message)
    bool validate_required(int argc, char** argv) const;

    // Match every argument against the option table.
    // Throws ParseArgsExit(EXIT_MISSING_INPUT) for unknown options or a
    // missing option value.
    ParsedArgs parse(int argc, char** argv) const;

private:
    const CLIOption* find(const std::string& arg) const;
};

// Strict integer parse; throws ParseArgsExit(EXIT_BAD_PARAMETER, message)
int parse_int_option(const std::string& value, const std::string& message);

// Command definitions
CLICommand make_cluster_command();

// 'cluster' subcommand: argument parsing and run
ClusterConfig parse_cluster_args(int argc, char** argv);
int run_cluster(const ClusterConfig& config);
int cmd_cluster(int argc, char** argv);

}  // namespace viralclust
