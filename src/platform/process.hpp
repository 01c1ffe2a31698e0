#pragma once

#include <string>
#include <functional>
#include <cstddef>

namespace platform {

// Receives live output chunks as the child writes them.
using ChunkCallback = std::function<void(const char* data, std::size_t len)>;

struct ShellOutput {
    int pid = -1;
    int exit_code = -1;          // 128 + signal for signal deaths
    std::string stdout_data;
    std::string stderr_data;
    bool overflow = false;       // a stream exceeded max_buffer; child was killed
    std::string overflow_stream; // "stdout" or "stderr"
};

// Run command_line through /bin/sh -c and wait for it to exit.
// stdin is /dev/null. cwd empty means inherit. When either captured stream
// grows past max_buffer the child is terminated and overflow is set.
// Throws std::system_error if pipes cannot be created or fork fails.
ShellOutput run_shell(const std::string& command_line,
                      const std::string& cwd,
                      std::size_t max_buffer,
                      const ChunkCallback& on_stdout,
                      const ChunkCallback& on_stderr);

// True if name resolves to an executable file, either directly (when it
// contains '/') or through one of the PATH entries. Never cached.
bool find_executable(const std::string& name);

} // namespace platform
