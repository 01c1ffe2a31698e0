#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <core/types.hpp>
#include "command_builder.hpp"
#include "executor.hpp"

enum class CopySide {
    Source,
    Destination
};

// LocalToRemote makes the destination remote; RemoteToLocal the source.
bool is_remote_side(CopyDirection direction, CopySide side);

// ["--exclude", "\"a\"", "--exclude", "\"b\""], order preserved.
std::vector<std::string> format_excludes(const std::vector<std::string>& ignores);

// Path as the transfer tool should see it: "user@host:path" on the remote
// side, msys-normalized local path otherwise.
std::string qualify_path(const SshCommandBuilder& builder, const std::string& path,
                         CopyDirection direction, CopySide side);

// Executes one command line with output decoration. Supplied by Connection.
using CommandRunner = std::function<ExecResult(const std::string& command_line,
                                               const ExecOptions& options)>;

class TransferStrategy {
public:
    virtual ~TransferStrategy() = default;

    virtual const char* name() const = 0;

    virtual ExecResult transfer(const SshCommandBuilder& builder,
                                const std::string& src,
                                const std::string& dest,
                                const CopyOptions& options,
                                const CommandRunner& runner) const = 0;
};

class RsyncStrategy : public TransferStrategy {
public:
    const char* name() const override { return "rsync"; }

    // rsync <excludes> -az <extra> -e "ssh <args>" <src> <dest>
    static std::string build_command(const SshCommandBuilder& builder,
                                     const std::string& src,
                                     const std::string& dest,
                                     const CopyOptions& options);

    ExecResult transfer(const SshCommandBuilder& builder,
                        const std::string& src,
                        const std::string& dest,
                        const CopyOptions& options,
                        const CommandRunner& runner) const override;
};

// tar -> mkdir -> scp -> rm -> untar -> rm, one process per step.
// A failing step aborts the rest; nothing already done is undone, so a
// temporary archive or a fresh destination directory may be left behind.
// The archive name only depends on basename(src): concurrent staged copies
// of same-named sources to one host collide.
// With as_user set, the remote "cd ... && tar ..." steps run as
// sudo -u <user> sh -c '<step>'.
class StagedArchiveStrategy : public TransferStrategy {
public:
    const char* name() const override { return "tar+scp"; }

    static std::vector<std::string> build_steps(const SshCommandBuilder& builder,
                                                const std::string& src,
                                                const std::string& dest,
                                                const CopyOptions& options);

    ExecResult transfer(const SshCommandBuilder& builder,
                        const std::string& src,
                        const std::string& dest,
                        const CopyOptions& options,
                        const CommandRunner& runner) const override;
};

// Probes for rsync on every call.
std::unique_ptr<TransferStrategy> select_transfer_strategy(BinaryProber& prober,
                                                           const CopyOptions& options);
