#pragma once

#include <string>
#include <functional>
#include <cstddef>
#include <core/types.hpp>

// Live output hooks. Either may be empty.
struct ExecStreams {
    std::function<void(const char*, std::size_t)> on_stdout;
    std::function<void(const char*, std::size_t)> on_stderr;
};

// Runs one shell command line to completion.
// Implementations throw ProcessError on non-zero exit or spawn failure and
// BufferLimitError when a stream outgrows options.max_buffer.
class ProcessExecutor {
public:
    virtual ~ProcessExecutor() = default;

    virtual ExecResult execute(const std::string& command_line,
                               const ExecOptions& options,
                               const ExecStreams& streams) = 0;
};

// Answers whether a binary can be found on this machine.
class BinaryProber {
public:
    virtual ~BinaryProber() = default;

    virtual bool is_resolvable(const std::string& name) = 0;
};

// /bin/sh -c executor backed by platform::run_shell.
class ShellExecutor : public ProcessExecutor {
public:
    ExecResult execute(const std::string& command_line,
                       const ExecOptions& options,
                       const ExecStreams& streams) override;
};

// PATH lookup, re-checked on every call.
class PathProber : public BinaryProber {
public:
    bool is_resolvable(const std::string& name) override;
};
