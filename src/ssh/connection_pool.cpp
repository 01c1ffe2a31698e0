#include "connection_pool.hpp"
#include <core/log.hpp>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

namespace {

// Shared between the caller and the member threads. Member threads may
// outlive the call after a failure, so it is reference counted.
struct FanOutState {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::optional<ExecResult>> results;
    size_t completed = 0;
    std::exception_ptr error;
};

} // namespace

// Member threads still alive, across every fan_out of this pool.
struct ConnectionPool::Activity {
    std::mutex mutex;
    std::condition_variable cv;
    size_t running = 0;
};

ConnectionPool::ConnectionPool(std::vector<std::shared_ptr<Connection>> connections)
    : connections_(std::move(connections)),
      activity_(std::make_shared<Activity>()) {
}

ConnectionPool::ConnectionPool(const std::vector<std::string>& remotes,
                               const ConnectionOptions& base)
    : activity_(std::make_shared<Activity>()) {
    connections_.reserve(remotes.size());
    for (const auto& remote : remotes) {
        ConnectionOptions opts = base;
        opts.remote = remote;
        connections_.push_back(std::make_shared<Connection>(std::move(opts)));
    }
}

ConnectionPool::~ConnectionPool() {
    wait_idle();
}

void ConnectionPool::wait_idle() {
    if (!activity_) return;  // moved from
    std::unique_lock<std::mutex> lock(activity_->mutex);
    activity_->cv.wait(lock, [this] { return activity_->running == 0; });
}

std::vector<ExecResult> ConnectionPool::run(const std::string& command,
                                            const ExecOptions& options) {
    return fan_out([command, options](Connection& c) {
        return c.run(command, options);
    });
}

std::vector<ExecResult> ConnectionPool::copy(const std::string& src, const std::string& dest,
                                             const CopyOptions& options) {
    return fan_out([src, dest, options](Connection& c) {
        return c.copy(src, dest, options);
    });
}

std::vector<ExecResult> ConnectionPool::fan_out(const MemberOp& op) {
    auto state = std::make_shared<FanOutState>();
    state->results.resize(connections_.size());

    for (size_t i = 0; i < connections_.size(); ++i) {
        std::shared_ptr<Connection> conn = connections_[i];
        std::shared_ptr<Activity> activity = activity_;
        {
            std::lock_guard<std::mutex> lock(activity->mutex);
            activity->running++;
        }

        auto body = [state, activity, conn, op, i]() {
            std::optional<ExecResult> result;
            std::exception_ptr error;
            try {
                result = op(*conn);
            } catch (const std::exception& e) {
                sshpool_log(fmt::format("pool: {} failed: {}", conn->remote().host, e.what()));
                error = std::current_exception();
            } catch (...) {
                sshpool_log(fmt::format("pool: {} failed: unknown exception", conn->remote().host));
                error = std::current_exception();
            }

            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (error) {
                    if (!state->error) state->error = error;
                } else {
                    state->results[i] = std::move(result);
                }
                state->completed++;
                state->cv.notify_all();
            }

            std::lock_guard<std::mutex> lock(activity->mutex);
            activity->running--;
            activity->cv.notify_all();
        };

        try {
            std::thread(body).detach();
        } catch (const std::system_error&) {
            std::lock_guard<std::mutex> lock(activity->mutex);
            activity->running--;
            throw;
        }
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    state->cv.wait(lock, [&] {
        return state->error || state->completed == state->results.size();
    });

    if (state->error) {
        std::rethrow_exception(state->error);
    }

    std::vector<ExecResult> results;
    results.reserve(state->results.size());
    for (auto& r : state->results) {
        results.push_back(std::move(*r));
    }
    return results;
}
