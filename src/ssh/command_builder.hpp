#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

// True when the first whitespace-delimited token of command is "sudo".
bool is_sudo_command(const std::string& command);

// Escape every '"' as '\"'.
std::string escape_double_quotes(const std::string& command);

// [-p port] [-i key] [-o StrictHostKeyChecking=strict], in that order.
std::vector<std::string> build_ssh_args(const std::optional<int>& port,
                                        const std::optional<std::string>& key,
                                        const std::optional<std::string>& strict);

// Turns a remote action into the exact `ssh ...` command line for one
// endpoint. The SSH argument set is derived once at construction.
class SshCommandBuilder {
public:
    SshCommandBuilder(RemoteEndpoint remote,
                      std::optional<std::string> key,
                      std::optional<std::string> strict,
                      std::optional<std::string> as_user);

    // ssh [-tt] <ssh args> user@host "<escaped command>"
    std::string build(const std::string& command) const;

    // The payload before escaping, with the as_user wrapping applied.
    std::string wrap_command(const std::string& command) const;

    // "user@host:" + path
    std::string qualify(const std::string& path) const;

    const RemoteEndpoint& remote() const { return remote_; }
    const std::vector<std::string>& ssh_args() const { return ssh_args_; }
    const std::optional<std::string>& key() const { return key_; }
    const std::optional<std::string>& as_user() const { return as_user_; }

private:
    RemoteEndpoint remote_;
    std::optional<std::string> key_;
    std::optional<std::string> as_user_;
    std::vector<std::string> ssh_args_;
};
