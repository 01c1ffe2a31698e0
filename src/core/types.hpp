#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstddef>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of one external process (or an aggregated step sequence).
struct ExecResult {
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
    int pid = -1;
};

// A resolved remote target.
struct RemoteEndpoint {
    std::string user;
    std::string host;
    std::optional<int> port;
};

// Options handed through to the process executor.
struct ExecOptions {
    std::size_t max_buffer = DEFAULT_MAX_BUFFER;
    std::optional<std::string> cwd;
};

enum class CopyDirection {
    LocalToRemote,
    RemoteToLocal
};

struct CopyOptions {
    CopyDirection direction = CopyDirection::LocalToRemote;
    std::vector<std::string> ignores;   // glob patterns, passed as --exclude
    std::vector<std::string> rsync;     // extra rsync arguments
    bool use_shim = false;              // force tar + scp even if rsync exists
    ExecOptions exec;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
