#pragma once

#include <ssh/executor.hpp>
#include <core/errors.hpp>
#include <platform/platform.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// Records every command line instead of running it.
class FakeExecutor : public ProcessExecutor {
public:
    struct Call {
        std::string command_line;
        ExecOptions options;
    };

    // Optional hook: return a custom result or throw for a given command line.
    std::function<ExecResult(const std::string&)> behavior;

    std::string stdout_text = "stdout";
    std::string stderr_text = "stderr";

    ExecResult execute(const std::string& command_line,
                       const ExecOptions& options,
                       const ExecStreams& streams) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back({command_line, options});
        }

        ExecResult result;
        try {
            if (behavior) {
                result = behavior(command_line);
            } else {
                result = {0, stdout_text, stderr_text, 4242};
            }
        } catch (...) {
            finished_++;
            throw;
        }

        if (streams.on_stdout && !result.stdout_data.empty())
            streams.on_stdout(result.stdout_data.data(), result.stdout_data.size());
        if (streams.on_stderr && !result.stderr_data.empty())
            streams.on_stderr(result.stderr_data.data(), result.stderr_data.size());

        finished_++;
        return result;
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<std::string> commands() const {
        std::vector<std::string> out;
        for (const auto& c : calls()) out.push_back(c.command_line);
        return out;
    }

    int finished() const { return finished_; }

private:
    mutable std::mutex mutex_;
    std::vector<Call> calls_;
    std::atomic<int> finished_{0};
};

class FakeProber : public BinaryProber {
public:
    explicit FakeProber(bool available) : available(available) {}

    bool is_resolvable(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        probed.push_back(name);
        return available;
    }

    bool available;
    std::vector<std::string> probed;

private:
    std::mutex mutex_;
};
