// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/acceptor/admission_policy.hpp"
#include "server/net/transport.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lgate {

struct ServerConfig
{
    std::string bind_address{"0.0.0.0"};
    uint16_t listen_port{8484};
    // Listen backlog; independent of session_cap.
    int32_t max_connections{5000};
    uint32_t worker_threads{4};
    bool tcp_nodelay{true};
    bool so_keepalive{true};
    uint32_t accept_poll_ms{100};
    uint32_t session_cap{5000};
    uint32_t ip_soft_threshold{30};
    uint32_t ip_evict_threshold{10};
    std::string log_level{"info"};
    bool log_json{false};
    uint16_t metrics_port{0}; // 0 disables
};

// Command line: `[config.yaml] [--port N] [--duration S]`. Never logs; bad
// values are skipped and described in warnings so they can be reported once
// the logger is configured.
struct CliOptions
{
    std::string config_path{"config/server.yaml"};
    std::optional<uint16_t> port;
    int duration_sec{0}; // 0 means run until signal
    std::vector<std::string> warnings;
};

CliOptions parse_cli(int argc, char **argv);

// Keys missing from the file keep their defaults. Throws YAML::Exception on a
// missing or malformed file.
ServerConfig load_config(const std::string &path);

net::ListenOptions listen_options(const ServerConfig &cfg);
acceptor::AdmissionLimits admission_limits(const ServerConfig &cfg);

} // namespace lgate
