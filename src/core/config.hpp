#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

struct ConnectionOptions;

class Config {
public:
    // Load ./sshpool.yaml, falling back to ~/.sshpool/config.yaml
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Load one specific file
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (used by load_file)
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const std::vector<std::string>& hosts() const { return hosts_; }
    const std::optional<std::string>& key() const { return key_; }
    const std::optional<std::string>& strict() const { return strict_; }
    const std::optional<std::string>& as_user() const { return as_user_; }
    size_t max_buffer() const { return max_buffer_; }
    const std::vector<std::string>& ignores() const { return ignores_; }
    const fs::path& source_path() const { return source_path_; }

    // Shared options for every pool member (remote left unset).
    ConnectionOptions connection_options() const;

    ExecOptions exec_options() const;

public:
    Config() = default;

private:
    std::vector<std::string> hosts_;
    std::optional<std::string> key_;
    std::optional<std::string> strict_;
    std::optional<std::string> as_user_;
    size_t max_buffer_ = DEFAULT_MAX_BUFFER;
    std::vector<std::string> ignores_;
    fs::path source_path_;
};

// Helper to check if configs exist
bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());
