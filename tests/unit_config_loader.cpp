// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "server/config.hpp"

#include <yaml-cpp/yaml.h>

#include <cassert>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

namespace {
std::string write_temp(const std::string &name, const std::string &body)
{
    auto path = std::filesystem::temp_directory_path() / (name + "_" + std::to_string(::getpid()) + ".yaml");
    std::ofstream out(path);
    out << body;
    return path.string();
}

void cli_parsing()
{
    char prog[] = "lgate_server";
    char path[] = "config/server_test.yaml";
    char port_flag[] = "--port";
    char bad_port[] = "80x";
    char duration_flag[] = "--duration";
    char bad_duration[] = "soon";
    char *bad_argv[] = {prog, port_flag, bad_port, duration_flag, bad_duration, path};
    auto bad = lgate::parse_cli(6, bad_argv);
    assert(bad.config_path == "config/server_test.yaml");
    assert(!bad.port);
    assert(bad.duration_sec == 0);
    assert(bad.warnings.size() == 2);
    assert(bad.warnings[0].find("--port value '80x'") != std::string::npos);
    assert(bad.warnings[1].find("--duration value 'soon'") != std::string::npos);
    // Rejected values are only collected: the logger is still untouched, so
    // the config file's log_level/log_json can take effect at init.
    assert(!lgate::log::detail::g_started.load());

    char good_port[] = "41121";
    char huge_port[] = "70000";
    char good_duration[] = "5";
    char *good_argv[] = {prog, port_flag, good_port, duration_flag, good_duration};
    auto good = lgate::parse_cli(5, good_argv);
    assert(good.config_path == "config/server.yaml");
    assert(good.port && *good.port == 41121);
    assert(good.duration_sec == 5);
    assert(good.warnings.empty());

    char *huge_argv[] = {prog, port_flag, huge_port};
    auto huge = lgate::parse_cli(3, huge_argv);
    assert(!huge.port);
    assert(huge.warnings.size() == 1);
    assert(!lgate::log::detail::g_started.load());
}
} // namespace

int main()
{
    cli_parsing();

    // Partial file: present keys override, the rest keep defaults
    auto partial = write_temp(
        "lgate_partial",
        "bind_address: 127.0.0.1\n"
        "listen_port: 41120\n"
        "session_cap: 3\n"
        "ip_evict_threshold: 2\n"
        "tcp_nodelay: false\n"
        "accept_poll_ms: 25\n");
    auto cfg = lgate::load_config(partial);
    std::remove(partial.c_str());
    assert(cfg.bind_address == "127.0.0.1");
    assert(cfg.listen_port == 41120);
    assert(cfg.session_cap == 3);
    assert(cfg.ip_evict_threshold == 2);
    assert(!cfg.tcp_nodelay);
    assert(cfg.ip_soft_threshold == 30);
    assert(cfg.max_connections == 5000);
    assert(cfg.so_keepalive);
    assert(cfg.log_level == "info");
    assert(cfg.metrics_port == 0);

    auto opts = lgate::listen_options(cfg);
    assert(opts.address == "127.0.0.1");
    assert(opts.port == 41120);
    assert(opts.backlog == 5000);
    assert(!opts.tcp_nodelay);
    assert(opts.poll_interval == std::chrono::milliseconds(25));
    auto limits = lgate::admission_limits(cfg);
    assert(limits.session_cap == 3);
    assert(limits.ip_soft_threshold == 30);
    assert(limits.ip_evict_threshold == 2);

    // Empty file: all defaults
    auto empty = write_temp("lgate_empty", "# nothing\n");
    auto defaults = lgate::load_config(empty);
    std::remove(empty.c_str());
    assert(defaults.listen_port == 8484);
    assert(defaults.session_cap == 5000);
    assert(defaults.ip_evict_threshold == 10);
    assert(defaults.worker_threads == 4);

    // Missing file
    bool threw = false;
    try {
        (void)lgate::load_config("/nonexistent/lgate.yaml");
    } catch (const YAML::BadFile &) {
        threw = true;
    }
    assert(threw);

    // Wrong type for a known key
    auto bad = write_temp("lgate_bad", "listen_port: not-a-port\n");
    threw = false;
    try {
        (void)lgate::load_config(bad);
    } catch (const YAML::Exception &) {
        threw = true;
    }
    std::remove(bad.c_str());
    assert(threw);

    std::cout << "unit_config_loader OK" << std::endl;
    return 0;
}
