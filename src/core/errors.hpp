#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

// Bad endpoint spec or configuration value. Raised at construction time.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// An external command exited non-zero or could not be spawned (exit_code -1).
class ProcessError : public std::runtime_error {
public:
    ProcessError(const std::string& command, int exit_code,
                 std::string stdout_data, std::string stderr_data);

    const std::string& command() const { return command_; }
    int exit_code() const { return exit_code_; }
    const std::string& stdout_data() const { return stdout_data_; }
    const std::string& stderr_data() const { return stderr_data_; }

private:
    std::string command_;
    int exit_code_;
    std::string stdout_data_;
    std::string stderr_data_;
};

// Buffered stdout or stderr grew past ExecOptions::max_buffer.
class BufferLimitError : public std::runtime_error {
public:
    BufferLimitError(const std::string& command, const std::string& stream,
                     std::size_t limit);

    const std::string& command() const { return command_; }
    std::size_t limit() const { return limit_; }

private:
    std::string command_;
    std::size_t limit_;
};
