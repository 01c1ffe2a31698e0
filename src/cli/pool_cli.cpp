#include "pool_cli.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <ssh/connection_pool.hpp>
#include <util/string_utils.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <fmt/format.h>

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::usage("sshpool run <command...>", "Run a command on every host");
    std::cout << theme::usage("sshpool copy <src> <dest>", "Copy files to every host");
    std::cout << theme::section("Options");
    std::cout << theme::usage("-H <user@host[:port]>", "Target host (repeatable, overrides config)");
    std::cout << theme::usage("-i <key>", "SSH identity file");
    std::cout << theme::usage("--strict <yes|no|ask>", "StrictHostKeyChecking policy");
    std::cout << theme::usage("--as-user <user>", "Run remote commands through sudo -u");
    std::cout << theme::usage("--remote-to-local", "copy: pull from the hosts instead of pushing");
    std::cout << theme::usage("--ignore <pattern>", "copy: exclude pattern (repeatable)");
    std::cout << theme::usage("--rsync <arg>", "copy: extra rsync argument (repeatable)");
    std::cout << theme::usage("--shim", "copy: force tar + scp instead of rsync");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    Hosts default to the list in ./sshpool.yaml or ~/.sshpool/config.yaml\n"
              << "    sshpool --version        Show version\n"
              << "    sshpool --help           Show this help"
              << theme::color::RESET << "\n\n";
}

CliArgs parse_cli_args(const std::vector<std::string>& argv) {
    CliArgs args;
    size_t i = 0;

    auto take_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argv.size()) {
            throw std::invalid_argument("Missing value for " + flag);
        }
        return argv[++i];
    };

    for (; i < argv.size(); ++i) {
        const std::string& a = argv[i];

        // Everything after the run command word belongs to the remote command.
        if (args.command == "run" && !args.positional.empty()) {
            args.positional.push_back(a);
            continue;
        }

        if (a == "-H" || a == "--host") {
            args.hosts.push_back(take_value(a));
        } else if (a == "-i" || a == "--key") {
            args.key = take_value(a);
        } else if (a == "--strict") {
            args.strict = take_value(a);
        } else if (a == "--as-user") {
            args.as_user = take_value(a);
        } else if (a == "--ignore") {
            args.ignores.push_back(take_value(a));
        } else if (a == "--rsync") {
            args.rsync.push_back(take_value(a));
        } else if (a == "--remote-to-local") {
            args.remote_to_local = true;
        } else if (a == "--shim") {
            args.use_shim = true;
        } else if (a == "--help" || a == "--version") {
            args.command = a;
            return args;
        } else if (args.command.empty()) {
            args.command = a;
        } else if (StringUtils::starts_with(a, "-") && args.command != "run") {
            throw std::invalid_argument("Unknown option: " + a);
        } else {
            args.positional.push_back(a);
        }
    }
    return args;
}

PoolCLI::PoolCLI(CliArgs args) : args_(std::move(args)) {}

// Host list and shared options: command line first, config file second.
static ConnectionOptions build_base_options(const CliArgs& args,
                                            const std::optional<Config>& config) {
    ConnectionOptions base = config ? config->connection_options() : ConnectionOptions{};
    if (args.key) base.key = args.key;
    if (args.strict) base.strict = args.strict;
    if (args.as_user) base.as_user = args.as_user;
    // Process-wide streams: shared but never deleted.
    base.stdout_sink = std::shared_ptr<std::ostream>(&std::cout, [](std::ostream*) {});
    base.stderr_sink = std::shared_ptr<std::ostream>(&std::cerr, [](std::ostream*) {});
    base.log = [](const std::string& msg) { std::cout << theme::log(msg); };
    return base;
}

static ConnectionPool build_pool(const CliArgs& args, ExecOptions& exec,
                                 std::vector<std::string>& default_ignores) {
    std::optional<Config> config;
    auto loaded = Config::load();
    if (loaded.is_ok()) {
        config = loaded.value;
        exec = config->exec_options();
        default_ignores = config->ignores();
    } else if (args.hosts.empty()) {
        throw ConfigError(loaded.error);
    }

    std::vector<std::string> hosts = args.hosts.empty() ? config->hosts() : args.hosts;
    if (hosts.empty()) {
        throw ConfigError("No hosts given. Use -H user@host or list hosts in sshpool.yaml");
    }

    sshpool_log(fmt::format("pool: {} host(s): {}", hosts.size(), StringUtils::join(hosts, ", ")));
    return ConnectionPool(hosts, build_base_options(args, config));
}

int PoolCLI::execute() {
    if (args_.command == "--help") {
        print_usage();
        return 0;
    }
    if (args_.command == "--version") {
        std::cout << theme::bold("sshpool") << theme::dim(" version 0.1.0") << "\n";
        return 0;
    }
    if (args_.command == "run") return run_command();
    if (args_.command == "copy") return run_copy();

    if (args_.command.empty()) {
        print_usage();
    } else {
        std::cout << theme::fail("Unknown command: " + args_.command);
    }
    return 1;
}

int PoolCLI::run_command() {
    if (args_.positional.empty()) {
        std::cout << theme::fail("Missing command.");
        std::cout << theme::step("Usage: sshpool run <command...>");
        return 1;
    }

    ExecOptions exec;
    std::vector<std::string> ignores;
    ConnectionPool pool = build_pool(args_, exec, ignores);

    std::string command = StringUtils::join(args_.positional, " ");
    pool.run(command, exec);
    std::cout << theme::ok(fmt::format("Ran on {} host(s)", pool.size()));
    return 0;
}

int PoolCLI::run_copy() {
    if (args_.positional.size() != 2) {
        std::cout << theme::fail("copy takes exactly <src> and <dest>.");
        std::cout << theme::step("Usage: sshpool copy <src> <dest>");
        return 1;
    }

    CopyOptions copy;
    std::vector<std::string> default_ignores;
    ConnectionPool pool = build_pool(args_, copy.exec, default_ignores);

    copy.direction = args_.remote_to_local ? CopyDirection::RemoteToLocal
                                           : CopyDirection::LocalToRemote;
    copy.ignores = args_.ignores.empty() ? default_ignores : args_.ignores;
    copy.rsync = args_.rsync;
    copy.use_shim = args_.use_shim;

    pool.copy(args_.positional[0], args_.positional[1], copy);
    std::cout << theme::ok(fmt::format("Copied to {} host(s)", pool.size()));
    return 0;
}
