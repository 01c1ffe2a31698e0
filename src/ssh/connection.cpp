#include "connection.hpp"
#include "line_wrapper.hpp"
#include "transfer.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/remote.hpp>
#include <fmt/format.h>

static RemoteEndpoint resolve_remote(const std::variant<std::string, RemoteEndpoint>& remote) {
    if (const auto* spec = std::get_if<std::string>(&remote)) {
        return parse_remote(*spec);
    }
    return std::get<RemoteEndpoint>(remote);
}

Connection::Connection(ConnectionOptions options)
    : options_(std::move(options)),
      builder_(resolve_remote(options_.remote), options_.key, options_.strict, options_.as_user),
      executor_(options_.executor ? options_.executor : std::make_shared<ShellExecutor>()),
      prober_(options_.prober ? options_.prober : std::make_shared<PathProber>()) {
    if (builder_.remote().host.empty()) {
        throw ConfigError("Host cannot be empty.");
    }
}

void Connection::log(const std::string& msg) const {
    if (options_.log) options_.log(msg);
}

ExecResult Connection::exec_decorated(const std::string& command_line,
                                      const ExecOptions& options) {
    const auto& host = builder_.remote().host;
    LineWrapper out(fmt::format(STDOUT_PREFIX, host), options_.stdout_sink);
    LineWrapper err(fmt::format(STDERR_PREFIX, host), options_.stderr_sink);

    ExecStreams streams;
    if (options_.stdout_sink) {
        streams.on_stdout = [&out](const char* data, std::size_t len) { out.write(data, len); };
    }
    if (options_.stderr_sink) {
        streams.on_stderr = [&err](const char* data, std::size_t len) { err.write(data, len); };
    }

    try {
        ExecResult result = executor_->execute(command_line, options, streams);
        out.finish();
        err.finish();
        sshpool_log_exec(host, command_line, result);
        return result;
    } catch (const std::exception& e) {
        out.finish();
        err.finish();
        sshpool_log(fmt::format("{} FAILED: {} ({})", host, command_line, e.what()));
        throw;
    }
}

ExecResult Connection::run(const std::string& command, const ExecOptions& options) {
    log(fmt::format("Running \"{}\" on host \"{}\".", command, builder_.remote().host));
    return exec_decorated(builder_.build(command), options);
}

ExecResult Connection::copy(const std::string& src, const std::string& dest,
                            const CopyOptions& options) {
    auto strategy = select_transfer_strategy(*prober_, options);

    log(fmt::format("Remote copy \"{}\" to \"{}\"",
                    qualify_path(builder_, src, options.direction, CopySide::Source),
                    qualify_path(builder_, dest, options.direction, CopySide::Destination)));
    sshpool_log(fmt::format("{} copy via {}", builder_.remote().host, strategy->name()));

    CommandRunner runner = [this](const std::string& command_line, const ExecOptions& exec) {
        return exec_decorated(command_line, exec);
    };
    return strategy->transfer(builder_, src, dest, options, runner);
}
