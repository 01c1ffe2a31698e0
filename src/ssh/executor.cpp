#include "executor.hpp"
#include <core/errors.hpp>
#include <platform/process.hpp>
#include <system_error>

ExecResult ShellExecutor::execute(const std::string& command_line,
                                  const ExecOptions& options,
                                  const ExecStreams& streams) {
    platform::ShellOutput out;
    try {
        out = platform::run_shell(command_line, options.cwd.value_or(""),
                                  options.max_buffer,
                                  streams.on_stdout, streams.on_stderr);
    } catch (const std::system_error& e) {
        throw ProcessError(command_line, -1, "", e.what());
    }

    if (out.overflow) {
        throw BufferLimitError(command_line, out.overflow_stream, options.max_buffer);
    }
    if (out.exit_code != 0) {
        throw ProcessError(command_line, out.exit_code,
                           std::move(out.stdout_data), std::move(out.stderr_data));
    }

    ExecResult result;
    result.exit_code = out.exit_code;
    result.pid = out.pid;
    result.stdout_data = std::move(out.stdout_data);
    result.stderr_data = std::move(out.stderr_data);
    return result;
}

bool PathProber::is_resolvable(const std::string& name) {
    return platform::find_executable(name);
}
