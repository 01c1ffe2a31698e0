#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include "connection.hpp"

// Fans one run/copy out to every member concurrently.
//
// Results come back in member order regardless of completion order. The
// first failure observed is rethrown as soon as it happens; members still
// running finish in the background and their results are dropped. The
// destructor blocks until those stragglers are done.
class ConnectionPool {
public:
    explicit ConnectionPool(std::vector<std::shared_ptr<Connection>> connections);

    // One Connection per remote spec, each built from `base` with its remote replaced.
    ConnectionPool(const std::vector<std::string>& remotes, const ConnectionOptions& base);

    ConnectionPool(ConnectionPool&&) = default;
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ~ConnectionPool();

    std::vector<ExecResult> run(const std::string& command, const ExecOptions& options = {});

    std::vector<ExecResult> copy(const std::string& src, const std::string& dest,
                                 const CopyOptions& options = {});

    const std::vector<std::shared_ptr<Connection>>& connections() const { return connections_; }
    size_t size() const { return connections_.size(); }

    // Block until no member thread from an earlier run/copy is still running.
    void wait_idle();

private:
    struct Activity;

    using MemberOp = std::function<ExecResult(Connection&)>;

    std::vector<ExecResult> fan_out(const MemberOp& op);

    std::vector<std::shared_ptr<Connection>> connections_;
    std::shared_ptr<Activity> activity_;
};
