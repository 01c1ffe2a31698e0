#include "config.hpp"
#include "errors.hpp"
#include "remote.hpp"
#include "utils.hpp"
#include <ssh/connection.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <iterator>

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / GLOBAL_CONFIG_DIR;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_NAME;
}

// Accepts either a single string or a list of strings.
static std::vector<std::string> parse_string_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node) return out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            out.push_back(item.as<std::string>());
        }
    }
    return out;
}

static std::optional<std::string> parse_optional_string(const YAML::Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    std::string value = node.as<std::string>("");
    if (value.empty()) return std::nullopt;
    return value;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Invalid YAML: {}", e.what()));
    }

    Config config;
    if (!root || root.IsNull()) {
        return Result<Config>::Ok(config);
    }
    if (!root.IsMap()) {
        return Result<Config>::Err("Config root must be a mapping");
    }

    try {
        config.hosts_ = parse_string_list(root["hosts"]);
        config.ignores_ = parse_string_list(root["ignores"]);
        config.key_ = parse_optional_string(root["key"]);
        config.strict_ = parse_optional_string(root["strict"]);
        config.as_user_ = parse_optional_string(root["as_user"]);

        if (root["max_buffer"]) {
            long long max_buffer = root["max_buffer"].as<long long>();
            if (max_buffer <= 0) {
                return Result<Config>::Err("max_buffer must be positive");
            }
            config.max_buffer_ = static_cast<size_t>(max_buffer);
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Invalid config value: {}", e.what()));
    }

    if (config.key_) {
        config.key_ = expand_home(*config.key_);
    }

    // Validate hosts up front so a typo fails before anything runs.
    for (const auto& host : config.hosts_) {
        try {
            parse_remote(host);
        } catch (const ConfigError& e) {
            return Result<Config>::Err(fmt::format("Invalid host '{}': {}", host, e.what()));
        }
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file: " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        return Result<Config>::Err(fmt::format("{}: {}", path.string(), result.error));
    }
    result.value.source_path_ = path;
    return result;
}

Result<Config> Config::load(const fs::path& project_dir) {
    if (project_config_exists(project_dir)) {
        return load_file(get_project_config_path(project_dir));
    }
    if (global_config_exists()) {
        return load_file(get_global_config_path());
    }
    return Result<Config>::Err(fmt::format("No {} found in {} and no {}",
                                           PROJECT_CONFIG_NAME, project_dir.string(),
                                           get_global_config_path().string()));
}

ConnectionOptions Config::connection_options() const {
    ConnectionOptions opts;
    opts.key = key_;
    opts.strict = strict_;
    opts.as_user = as_user_;
    return opts;
}

ExecOptions Config::exec_options() const {
    ExecOptions opts;
    opts.max_buffer = max_buffer_;
    return opts;
}
