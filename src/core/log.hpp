#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string sshpool_log_path() {
    static std::string path = [] {
        const char* env = std::getenv(DEBUG_LOG_ENV);
        if (env && *env) return std::string(env);
        return (platform::temp_dir() / DEBUG_LOG_NAME).string();
    }();
    return path;
}

inline std::mutex& sshpool_log_mutex() {
    static std::mutex m;
    return m;
}

inline void sshpool_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    // Pool members log from their own threads.
    std::lock_guard<std::mutex> lock(sshpool_log_mutex());
    std::ofstream out(sshpool_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

inline void sshpool_log_exec(const std::string& label, const std::string& cmd,
                             const ExecResult& r) {
    sshpool_log(fmt::format("{} CMD: {}", label, cmd));
    sshpool_log(fmt::format("{} exit={} pid={} stdout({})={}", label, r.exit_code, r.pid,
                            r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        sshpool_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
