// SPDX-License-Identifier: Apache-2.0
#include "server/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <chrono>
#include <span>
#include <sstream>
#include <string>
#include <string_view>

namespace lgate::net {

namespace {

void emit(std::ostringstream &oss, const char *name, const char *type, uint64_t value)
{
    oss << "# TYPE " << name << ' ' << type << "\n";
    oss << name << ' ' << value << "\n";
}

} // namespace

std::string build_metrics_body(const acceptor::Acceptor &acceptor)
{
    std::ostringstream oss;
    auto &mc = lgate::metrics::acceptor();
    emit(oss, "lgate_connections_accepted", "counter", mc.connections_accepted.load());
    emit(oss, "lgate_connections_gated", "counter", mc.connections_gated.load());
    emit(oss, "lgate_admission_failures", "counter", mc.admission_failures.load());
    emit(oss, "lgate_connections_flagged", "counter", mc.connections_flagged.load());
    emit(oss, "lgate_eviction_sweeps", "counter", mc.eviction_sweeps.load());
    emit(oss, "lgate_sessions_evicted", "counter", mc.sessions_evicted.load());
    emit(oss, "lgate_addresses_evicted", "counter", mc.addresses_evicted.load());
    emit(oss, "lgate_sessions_removed", "counter", mc.sessions_removed.load());
    emit(oss, "lgate_bind_failures", "counter", mc.bind_failures.load());
    emit(oss, "lgate_tracked_addresses", "gauge", mc.tracked_addresses.load());
    // Live state read through the acceptor rather than the gauge mirror.
    emit(oss, "lgate_sessions_active", "gauge", acceptor.session_count());
    emit(oss, "lgate_acceptor_closed", "gauge", acceptor.closed() ? 1 : 0);
    emit(oss, "lgate_acceptor_mode_changing", "gauge", acceptor.mode_changing() ? 1 : 0);
    emit(oss, "lgate_session_cap", "gauge", acceptor.limits().session_cap);
    return oss.str();
}

static coro::task<void> handle_client(
    std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client, const acceptor::Acceptor &acceptor)
{
    co_await scheduler->schedule();
    // One-shot request with a short read window
    auto pol = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200));
    if (pol != coro::poll_status::event) {
        co_return;
    }
    std::string buf(1024, '\0');
    auto [rs, span] = client.recv(buf);
    if (rs != coro::net::recv_status::ok)
        co_return;
    std::string_view req(span.data(), span.size());
    bool metrics = req.rfind("GET /metrics", 0) == 0;
    std::string body = metrics ? build_metrics_body(acceptor) : std::string("not found\n");
    std::ostringstream resp;
    resp << "HTTP/1.1 " << (metrics ? "200 OK" : "404 Not Found") << "\r\n";
    resp << "Content-Type: text/plain; version=0.0.4\r\n";
    resp << "Content-Length: " << body.size() << "\r\n";
    resp << "Connection: close\r\n\r\n";
    resp << body;
    auto s = resp.str();
    std::span<const char> out{s.data(), s.size()};
    while (!out.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, rest] = client.send(out);
        if (st == coro::net::send_status::ok || st == coro::net::send_status::would_block) {
            out = rest;
            continue;
        }
        break;
    }
    co_return;
}

coro::task<void> run_metrics_endpoint(
    std::shared_ptr<coro::io_scheduler> scheduler,
    uint16_t port,
    const acceptor::Acceptor &acceptor,
    const std::atomic_bool &stop)
{
    co_await scheduler->schedule();
    lgate::log::info("[metrics] HTTP endpoint on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (!stop.load()) {
        auto st = co_await server.poll(std::chrono::seconds(1));
        if (st == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid() && !scheduler->spawn(handle_client(scheduler, std::move(client), acceptor)))
                lgate::log::warn("[metrics] scheduler refused request task");
        } else if (st == coro::poll_status::error || st == coro::poll_status::closed) {
            lgate::log::error("[metrics] server poll error/closed");
            co_return;
        }
    }
    co_return;
}

} // namespace lgate::net
