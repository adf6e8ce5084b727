// SPDX-License-Identifier: Apache-2.0
#include "server/config.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <exception>
#include <limits>

namespace lgate {

CliOptions parse_cli(int argc, char **argv)
{
    CliOptions cli;
    // First non-flag argument is the config path
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            std::string v = argv[++i];
            try {
                int port = std::stoi(v);
                if (port <= 0 || port > std::numeric_limits<uint16_t>::max())
                    cli.warnings.push_back("Invalid --port value '" + v + "' (out of range), ignoring");
                else
                    cli.port = static_cast<uint16_t>(port);
            } catch (const std::exception &) {
                cli.warnings.push_back("Invalid --port value '" + v + "', ignoring");
            }
        } else if (a == "--duration" && i + 1 < argc) {
            std::string v = argv[++i];
            try {
                cli.duration_sec = std::stoi(v);
            } catch (const std::exception &) {
                cli.warnings.push_back("Invalid --duration value '" + v + "', ignoring");
            }
        } else if (!a.empty() && a[0] != '-') {
            cli.config_path = a;
        } else {
            cli.warnings.push_back("Unknown argument '" + a + "', ignoring");
        }
    }
    return cli;
}

ServerConfig load_config(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    ServerConfig cfg;
    if (root["bind_address"])
        cfg.bind_address = root["bind_address"].as<std::string>();
    if (root["listen_port"])
        cfg.listen_port = root["listen_port"].as<uint16_t>();
    if (root["max_connections"])
        cfg.max_connections = root["max_connections"].as<int32_t>();
    if (root["worker_threads"])
        cfg.worker_threads = root["worker_threads"].as<uint32_t>();
    if (root["tcp_nodelay"])
        cfg.tcp_nodelay = root["tcp_nodelay"].as<bool>();
    if (root["so_keepalive"])
        cfg.so_keepalive = root["so_keepalive"].as<bool>();
    if (root["accept_poll_ms"])
        cfg.accept_poll_ms = root["accept_poll_ms"].as<uint32_t>();
    if (root["session_cap"])
        cfg.session_cap = root["session_cap"].as<uint32_t>();
    if (root["ip_soft_threshold"])
        cfg.ip_soft_threshold = root["ip_soft_threshold"].as<uint32_t>();
    if (root["ip_evict_threshold"])
        cfg.ip_evict_threshold = root["ip_evict_threshold"].as<uint32_t>();
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    if (root["metrics_port"])
        cfg.metrics_port = root["metrics_port"].as<uint16_t>();
    return cfg;
}

net::ListenOptions listen_options(const ServerConfig &cfg)
{
    net::ListenOptions o;
    o.address = cfg.bind_address;
    o.port = cfg.listen_port;
    o.backlog = cfg.max_connections;
    o.worker_threads = cfg.worker_threads;
    o.tcp_nodelay = cfg.tcp_nodelay;
    o.so_keepalive = cfg.so_keepalive;
    o.poll_interval = std::chrono::milliseconds(cfg.accept_poll_ms);
    return o;
}

acceptor::AdmissionLimits admission_limits(const ServerConfig &cfg)
{
    acceptor::AdmissionLimits l;
    l.session_cap = cfg.session_cap;
    l.ip_soft_threshold = cfg.ip_soft_threshold;
    l.ip_evict_threshold = cfg.ip_evict_threshold;
    return l;
}

} // namespace lgate
