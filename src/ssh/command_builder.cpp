#include "command_builder.hpp"
#include <core/constants.hpp>
#include <core/remote.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <cctype>

bool is_sudo_command(const std::string& command) {
    if (!StringUtils::starts_with(command, "sudo")) return false;
    return command.size() == 4 || std::isspace(static_cast<unsigned char>(command[4]));
}

std::string escape_double_quotes(const std::string& command) {
    std::string out;
    out.reserve(command.size());
    for (char c : command) {
        if (c == '"') out += '\\';
        out += c;
    }
    return out;
}

std::vector<std::string> build_ssh_args(const std::optional<int>& port,
                                        const std::optional<std::string>& key,
                                        const std::optional<std::string>& strict) {
    std::vector<std::string> args;
    if (port) {
        args.push_back("-p");
        args.push_back(std::to_string(*port));
    }
    if (key && !key->empty()) {
        args.push_back("-i");
        args.push_back(*key);
    }
    if (strict && !strict->empty()) {
        args.push_back("-o");
        args.push_back("StrictHostKeyChecking=" + *strict);
    }
    return args;
}

SshCommandBuilder::SshCommandBuilder(RemoteEndpoint remote,
                                     std::optional<std::string> key,
                                     std::optional<std::string> strict,
                                     std::optional<std::string> as_user)
    : remote_(std::move(remote)), key_(std::move(key)), as_user_(std::move(as_user)),
      ssh_args_(build_ssh_args(remote_.port, key_, strict)) {
}

std::string SshCommandBuilder::wrap_command(const std::string& command) const {
    if (!as_user_ || as_user_->empty()) return command;

    // Drop an existing leading sudo so we never produce "sudo -u x sudo ...".
    std::string inner = command;
    if (is_sudo_command(inner)) {
        inner = StringUtils::trim(inner.substr(4));
    }
    return fmt::format("sudo -u {} {}", *as_user_, inner);
}

std::string SshCommandBuilder::build(const std::string& command) const {
    std::vector<std::string> args = {"ssh"};
    if (is_sudo_command(command)) args.push_back(SSH_TTY_FLAG);
    args.insert(args.end(), ssh_args_.begin(), ssh_args_.end());
    args.push_back(format_remote(remote_));
    args.push_back("\"" + escape_double_quotes(wrap_command(command)) + "\"");
    return StringUtils::join(args, " ");
}

std::string SshCommandBuilder::qualify(const std::string& path) const {
    return format_remote(remote_) + ":" + path;
}
