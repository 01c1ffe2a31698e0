#pragma once

#include <string>
#include <memory>
#include <optional>
#include <variant>
#include <ostream>
#include <core/types.hpp>
#include "command_builder.hpp"
#include "executor.hpp"

struct ConnectionOptions {
    std::variant<std::string, RemoteEndpoint> remote;   // "user@host:port" or parsed
    std::optional<std::string> key;                     // ssh -i
    std::optional<std::string> strict;                  // StrictHostKeyChecking value
    std::optional<std::string> as_user;                 // run commands as sudo -u <as_user>
    std::shared_ptr<std::ostream> stdout_sink;          // receives "@host " lines
    std::shared_ptr<std::ostream> stderr_sink;          // receives "@host-err " lines
    StatusCallback log;

    // Defaults to ShellExecutor / PathProber when empty.
    std::shared_ptr<ProcessExecutor> executor;
    std::shared_ptr<BinaryProber> prober;
};

// One remote endpoint. Owns its SSH argument set and output sinks; no state
// is shared between connections, so connections may be used concurrently.
class Connection {
public:
    // Throws ConfigError if the remote spec is empty or has no host.
    explicit Connection(ConnectionOptions options);

    // Run a shell command on the remote host over ssh.
    ExecResult run(const std::string& command, const ExecOptions& options = {});

    // Copy src to dest using rsync when it is installed, tar + scp otherwise.
    ExecResult copy(const std::string& src, const std::string& dest,
                    const CopyOptions& options = {});

    const RemoteEndpoint& remote() const { return builder_.remote(); }
    const std::vector<std::string>& ssh_args() const { return builder_.ssh_args(); }

private:
    void log(const std::string& msg) const;

    // Execute one command line, decorating output into the configured sinks.
    ExecResult exec_decorated(const std::string& command_line, const ExecOptions& options);

    ConnectionOptions options_;
    SshCommandBuilder builder_;
    std::shared_ptr<ProcessExecutor> executor_;
    std::shared_ptr<BinaryProber> prober_;
};
