#pragma once

#include <string>
#include "types.hpp"

// Parse "user@host:port". User defaults to DEFAULT_REMOTE_USER, port is
// optional. Throws ConfigError on an empty spec or an empty host.
RemoteEndpoint parse_remote(const std::string& spec);

// "user@host". The port is never embedded.
std::string format_remote(const RemoteEndpoint& remote);
