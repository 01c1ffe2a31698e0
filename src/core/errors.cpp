#include "errors.hpp"
#include <fmt/format.h>

static std::string describe_failure(const std::string& command, int exit_code,
                                    const std::string& stderr_data) {
    if (exit_code < 0) {
        return fmt::format("Failed to spawn command: {}\n{}", command, stderr_data);
    }
    return fmt::format("Command failed (exit {}): {}\n{}", exit_code, command, stderr_data);
}

ProcessError::ProcessError(const std::string& command, int exit_code,
                           std::string stdout_data, std::string stderr_data)
    : std::runtime_error(describe_failure(command, exit_code, stderr_data)),
      command_(command), exit_code_(exit_code),
      stdout_data_(std::move(stdout_data)), stderr_data_(std::move(stderr_data)) {
}

BufferLimitError::BufferLimitError(const std::string& command, const std::string& stream,
                                   std::size_t limit)
    : std::runtime_error(fmt::format("{} maxBuffer of {} bytes exceeded: {}",
                                     stream, limit, command)),
      command_(command), limit_(limit) {
}
