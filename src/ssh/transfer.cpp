#include "transfer.hpp"
#include <core/constants.hpp>
#include <core/remote.hpp>
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>

bool is_remote_side(CopyDirection direction, CopySide side) {
    if (direction == CopyDirection::LocalToRemote) return side == CopySide::Destination;
    return side == CopySide::Source;
}

std::vector<std::string> format_excludes(const std::vector<std::string>& ignores) {
    std::vector<std::string> tokens;
    tokens.reserve(ignores.size() * 2);
    for (const auto& pattern : ignores) {
        tokens.push_back("--exclude");
        tokens.push_back("\"" + pattern + "\"");
    }
    return tokens;
}

std::string qualify_path(const SshCommandBuilder& builder, const std::string& path,
                         CopyDirection direction, CopySide side) {
    if (is_remote_side(direction, side)) return builder.qualify(path);
    return resolve_msys_path(path);
}

// ── Rsync ───────────────────────────────────────────────────

std::string RsyncStrategy::build_command(const SshCommandBuilder& builder,
                                         const std::string& src,
                                         const std::string& dest,
                                         const CopyOptions& options) {
    std::vector<std::string> ssh = {"ssh"};
    ssh.insert(ssh.end(), builder.ssh_args().begin(), builder.ssh_args().end());

    std::vector<std::string> args = {"rsync"};
    auto excludes = format_excludes(options.ignores);
    args.insert(args.end(), excludes.begin(), excludes.end());
    args.push_back("-az");
    args.insert(args.end(), options.rsync.begin(), options.rsync.end());
    args.push_back("-e");
    args.push_back("\"" + StringUtils::join(ssh, " ") + "\"");
    args.push_back(qualify_path(builder, src, options.direction, CopySide::Source));
    args.push_back(qualify_path(builder, dest, options.direction, CopySide::Destination));
    return StringUtils::join(args, " ");
}

ExecResult RsyncStrategy::transfer(const SshCommandBuilder& builder,
                                   const std::string& src,
                                   const std::string& dest,
                                   const CopyOptions& options,
                                   const CommandRunner& runner) const {
    return runner(build_command(builder, src, dest, options), options.exec);
}

// ── Staged archive ──────────────────────────────────────────

std::vector<std::string> StagedArchiveStrategy::build_steps(const SshCommandBuilder& builder,
                                                            const std::string& src,
                                                            const std::string& dest,
                                                            const CopyOptions& options) {
    const auto direction = options.direction;
    const bool src_remote = is_remote_side(direction, CopySide::Source);
    const bool dest_remote = is_remote_side(direction, CopySide::Destination);

    const std::string src_path = src_remote ? src : resolve_msys_path(src);
    const std::string dest_path = dest_remote ? dest : resolve_msys_path(dest);
    const std::string src_dir = posix_dirname(src_path);
    const std::string pkg = posix_basename(src_path) + ARCHIVE_SUFFIX;
    const std::string src_pkg = posix_join(src_dir, pkg);
    const std::string dest_pkg = posix_join(dest_path, pkg);

    // sudo -u cannot run "cd x && y" directly; hand compound steps to a shell.
    auto on_side = [&](CopySide side, const std::string& cmd) {
        if (!is_remote_side(direction, side)) return cmd;
        if (builder.as_user() && !builder.as_user()->empty() &&
            cmd.find("&&") != std::string::npos) {
            return builder.build("sh -c '" + cmd + "'");
        }
        return builder.build(cmd);
    };

    std::vector<std::string> tar = {"tar"};
    auto excludes = format_excludes(options.ignores);
    tar.insert(tar.end(), excludes.begin(), excludes.end());
    tar.push_back("-czf");
    tar.push_back(pkg);
    tar.push_back(posix_basename(src_path));

    std::vector<std::string> scp = {"scp"};
    if (builder.remote().port) {
        scp.push_back("-P");
        scp.push_back(std::to_string(*builder.remote().port));
    }
    if (builder.key() && !builder.key()->empty()) {
        scp.push_back("-i");
        scp.push_back(*builder.key());
    }
    scp.push_back(src_remote ? builder.qualify(src_pkg) : src_pkg);
    scp.push_back(dest_remote ? builder.qualify(dest_path) : dest_path);

    return {
        on_side(CopySide::Source,
                fmt::format("cd {} && {}", src_dir, StringUtils::join(tar, " "))),
        on_side(CopySide::Destination, fmt::format("mkdir -p {}", dest_path)),
        StringUtils::join(scp, " "),
        on_side(CopySide::Source, fmt::format("rm -f {}", src_pkg)),
        on_side(CopySide::Destination,
                fmt::format("cd {} && tar --strip-components 1 -xzf {}", dest_path, pkg)),
        on_side(CopySide::Destination, fmt::format("rm -f {}", dest_pkg)),
    };
}

ExecResult StagedArchiveStrategy::transfer(const SshCommandBuilder& builder,
                                           const std::string& src,
                                           const std::string& dest,
                                           const CopyOptions& options,
                                           const CommandRunner& runner) const {
    ExecResult aggregate;
    for (const auto& step : build_steps(builder, src, dest, options)) {
        // Throws on failure; remaining steps never start.
        ExecResult r = runner(step, options.exec);
        aggregate.stdout_data += r.stdout_data;
        aggregate.stderr_data += r.stderr_data;
        aggregate.exit_code = r.exit_code;
        aggregate.pid = r.pid;
    }
    return aggregate;
}

// ── Selection ───────────────────────────────────────────────

std::unique_ptr<TransferStrategy> select_transfer_strategy(BinaryProber& prober,
                                                           const CopyOptions& options) {
    if (!options.use_shim && prober.is_resolvable(RSYNC_BINARY)) {
        return std::make_unique<RsyncStrategy>();
    }
    return std::make_unique<StagedArchiveStrategy>();
}
