#pragma once

#include <cstddef>

// ── Execution ───────────────────────────────────────────────
constexpr std::size_t DEFAULT_MAX_BUFFER = 1000 * 1024;   // Per-stream output cap
constexpr int EXEC_READ_BUF_SIZE         = 4096;
constexpr const char* SHELL_PATH         = "/bin/sh";

// ── SSH ─────────────────────────────────────────────────────
constexpr const char* DEFAULT_REMOTE_USER = "deploy";
constexpr const char* SSH_TTY_FLAG        = "-tt";          // sudo may prompt

// ── Transfer ────────────────────────────────────────────────
constexpr const char* RSYNC_BINARY   = "rsync";
constexpr const char* ARCHIVE_SUFFIX = ".tar.gz";

// ── Output decoration ───────────────────────────────────────
// Use fmt::format with these: fmt::format(STDOUT_PREFIX, host)
constexpr const char* STDOUT_PREFIX = "@{} ";
constexpr const char* STDERR_PREFIX = "@{}-err ";

// ── Files ───────────────────────────────────────────────────
constexpr const char* PROJECT_CONFIG_NAME = "sshpool.yaml";
constexpr const char* GLOBAL_CONFIG_DIR   = ".sshpool";
constexpr const char* DEBUG_LOG_NAME      = "sshpool_debug.log";
constexpr const char* DEBUG_LOG_ENV       = "SSHPOOL_DEBUG_LOG";
