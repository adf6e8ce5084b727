// SPDX-License-Identifier: Apache-2.0
// metrics_http.hpp
// Prometheus text-format endpoint (HTTP/1.1, GET /metrics) exposing acceptor
// counters and live acceptor state.
#pragma once
#include "server/acceptor/acceptor.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace lgate::net {

std::string build_metrics_body(const acceptor::Acceptor &acceptor);

// Serves until stop becomes true (checked once per second).
coro::task<void> run_metrics_endpoint(
    std::shared_ptr<coro::io_scheduler> scheduler,
    uint16_t port,
    const acceptor::Acceptor &acceptor,
    const std::atomic_bool &stop);

} // namespace lgate::net
