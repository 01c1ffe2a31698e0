#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

// Parsed command line for `sshpool`.
struct CliArgs {
    std::string command;                 // "run", "copy", "--help", "--version"
    std::vector<std::string> positional; // run: command words; copy: src dest
    std::vector<std::string> hosts;      // -H, repeatable
    std::optional<std::string> key;      // -i
    std::optional<std::string> strict;   // --strict
    std::optional<std::string> as_user;  // --as-user
    bool remote_to_local = false;        // --remote-to-local
    bool use_shim = false;               // --shim
    std::vector<std::string> ignores;    // --ignore, repeatable
    std::vector<std::string> rsync;      // --rsync, repeatable
};

// Throws std::invalid_argument on a missing option value or unknown flag.
CliArgs parse_cli_args(const std::vector<std::string>& argv);

class PoolCLI {
public:
    explicit PoolCLI(CliArgs args);

    // Returns the process exit code.
    int execute();

private:
    int run_command();
    int run_copy();

    CliArgs args_;
};

void print_usage();
