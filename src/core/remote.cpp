#include "remote.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <regex>

static std::optional<int> parse_port(const std::string& s) {
    int port = safe_stoi(s, 0);
    if (port <= 0 || std::to_string(port) != s) return std::nullopt;
    return port;
}

RemoteEndpoint parse_remote(const std::string& spec) {
    if (spec.empty()) {
        throw ConfigError("Host cannot be empty.");
    }

    RemoteEndpoint remote;
    std::smatch m;

    // Greedy user part: "a@b@c" means user "a@b" on host "c".
    static const std::regex with_user(R"((.*)@([^:]*):?(.*))");
    static const std::regex host_only(R"(([^:]*):?(.*))");

    if (std::regex_match(spec, m, with_user)) {
        remote.user = m[1].str();
        remote.host = m[2].str();
        remote.port = parse_port(m[3].str());
    } else if (std::regex_match(spec, m, host_only)) {
        remote.user = DEFAULT_REMOTE_USER;
        remote.host = m[1].str();
        remote.port = parse_port(m[2].str());
    }

    if (remote.host.empty()) {
        throw ConfigError("Host cannot be empty: '" + spec + "'");
    }
    return remote;
}

std::string format_remote(const RemoteEndpoint& remote) {
    return remote.user + "@" + remote.host;
}
