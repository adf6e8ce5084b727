// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/acceptor/acceptor.hpp"
#include "server/config.hpp"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"

#include <coro/io_scheduler.hpp>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#ifndef LGATE_VERSION
#    define LGATE_VERSION "dev"
#endif

namespace {
std::atomic_bool g_shutdown{false};
// Set from the signal handler, applied by the main loop.
std::atomic_bool g_toggle_mode_change{false};

void handle_signal(int)
{
    g_shutdown.store(true);
}

void handle_mode_signal(int)
{
    g_toggle_mode_change.store(true);
}

void log_runtime_summary(const char *metric, const lgate::acceptor::Acceptor &acceptor)
{
    auto &mc = lgate::metrics::acceptor();
    std::ostringstream j;
    j << "{\"metric\":\"" << metric << "\"";
    j << ",\"state\":\"" << lgate::acceptor::to_string(acceptor.state()) << "\"";
    j << ",\"mode_changing\":" << (acceptor.mode_changing() ? "true" : "false");
    j << ",\"sessions_active\":" << acceptor.session_count();
    j << ",\"tracked_addresses\":" << mc.tracked_addresses.load();
    j << ",\"accepted\":" << mc.connections_accepted.load();
    j << ",\"gated\":" << mc.connections_gated.load();
    j << ",\"flagged\":" << mc.connections_flagged.load();
    j << ",\"sweeps\":" << mc.eviction_sweeps.load();
    j << ",\"sessions_evicted\":" << mc.sessions_evicted.load();
    j << ",\"admission_failures\":" << mc.admission_failures.load();
    j << "}";
    lgate::log::info("{}", j.str());
}
} // namespace

int main(int argc, char **argv)
{
    lgate::ServerConfig cfg;
    // Nothing may log before log::init(): the first line starts the logger
    // with whatever environment is in place at that moment.
    auto cli = lgate::parse_cli(argc, argv);
    std::string load_error;
    try {
        cfg = lgate::load_config(cli.config_path);
    } catch (const YAML::Exception &ex) {
        load_error = ex.what();
    }
    if (cli.port)
        cfg.listen_port = *cli.port;
    const int duration_override_sec = cli.duration_sec;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGUSR1, handle_mode_signal);

    // An explicit LGATE_LOG_LEVEL in the environment wins over the file.
    if (!cfg.log_level.empty() && std::getenv("LGATE_LOG_LEVEL") == nullptr) {
        setenv("LGATE_LOG_LEVEL", cfg.log_level.c_str(), 1);
    }
    if (cfg.log_json) {
        setenv("LGATE_LOG_JSON", "1", 1);
    }
    lgate::log::init();
    for (const auto &w : cli.warnings)
        lgate::log::warn(w);
    if (!load_error.empty()) {
        lgate::log::error("Failed to load config {}: {}", cli.config_path, load_error);
        lgate::log::flush();
        return 1;
    }
    lgate::log::info("lgate server starting (version: {})", LGATE_VERSION);
    lgate::log::info(
        "Admission limits: session_cap={} ip_soft_threshold={} ip_evict_threshold={}",
        cfg.session_cap,
        cfg.ip_soft_threshold,
        cfg.ip_evict_threshold);
    if (duration_override_sec > 0) {
        lgate::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);
    }

    lgate::net::CoroTransport transport;
    lgate::acceptor::Acceptor acceptor{transport, lgate::admission_limits(cfg)};
    if (!acceptor.bind(lgate::listen_options(cfg))) {
        lgate::log::flush();
        return 1;
    }

    // Metrics get their own scheduler so unbinding the acceptor leaves them up.
    std::shared_ptr<coro::io_scheduler> metrics_scheduler;
    if (cfg.metrics_port != 0) {
        metrics_scheduler = coro::io_scheduler::make_shared();
        if (!metrics_scheduler->spawn(
                lgate::net::run_metrics_endpoint(metrics_scheduler, cfg.metrics_port, acceptor, g_shutdown)))
            lgate::log::warn("[metrics] failed to start endpoint");
    }

    auto run_start = std::chrono::steady_clock::now();
    auto last_summary = run_start;
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (g_toggle_mode_change.exchange(false)) {
            acceptor.set_mode_changing(!acceptor.mode_changing());
        }
        auto now = std::chrono::steady_clock::now();
        if (duration_override_sec > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count();
            if (elapsed >= duration_override_sec) {
                lgate::log::info("Duration reached ({}s >= {}s); initiating shutdown", elapsed, duration_override_sec);
                g_shutdown.store(true);
            }
        }
        if (now - last_summary >= std::chrono::seconds(60)) {
            last_summary = now;
            log_runtime_summary("runtime", acceptor);
        }
    }
    lgate::log::info("Signal received, shutting down...");
    acceptor.unbind();
    if (metrics_scheduler)
        metrics_scheduler->shutdown();
    log_runtime_summary("runtime_final", acceptor);
    lgate::log::info("Shutdown complete.");
    lgate::log::flush();
    return 0;
}
