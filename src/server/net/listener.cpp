// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "common/logger.hpp"

#include <arpa/inet.h>
#include <coro/poll.hpp>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace lgate::net {

std::string peer_address(int fd)
{
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getpeername(fd, reinterpret_cast<sockaddr *>(&ss), &len) != 0)
        throw std::system_error(errno, std::generic_category(), "getpeername");
    const void *src = nullptr;
    if (ss.ss_family == AF_INET)
        src = &reinterpret_cast<const sockaddr_in *>(&ss)->sin_addr;
    else if (ss.ss_family == AF_INET6)
        src = &reinterpret_cast<const sockaddr_in6 *>(&ss)->sin6_addr;
    else
        throw std::system_error(EAFNOSUPPORT, std::generic_category(), "peer address family");
    char buf[INET6_ADDRSTRLEN] = {};
    if (::inet_ntop(ss.ss_family, src, buf, sizeof(buf)) == nullptr)
        throw std::system_error(errno, std::generic_category(), "inet_ntop");
    return std::string(buf);
}

CoroConnection::CoroConnection(coro::net::tcp::client client)
    : m_client(std::move(client)), m_remote(peer_address(m_client.socket().native_handle()))
{}

void CoroConnection::close() noexcept
{
    if (m_closing.exchange(true, std::memory_order_acq_rel))
        return;
    // shutdown(2) wakes the connection task's poll; the fd itself is released
    // when the task drops its reference. ENOTCONN after a peer reset is fine.
    (void)::shutdown(m_client.socket().native_handle(), SHUT_RDWR);
}

void CoroConnection::on_closed(std::function<void()> handler)
{
    {
        std::scoped_lock lk{m_handler_mutex};
        if (!m_closed_notified) {
            m_on_closed = std::move(handler);
            return;
        }
    }
    // Connection already gone: run it right away.
    if (handler)
        handler();
}

void CoroConnection::notify_closed()
{
    std::function<void()> handler;
    {
        std::scoped_lock lk{m_handler_mutex};
        if (m_closed_notified)
            return;
        m_closed_notified = true;
        handler.swap(m_on_closed);
    }
    if (handler)
        handler();
}

CoroTransport::~CoroTransport()
{
    shutdown();
}

void CoroTransport::bind(const ListenOptions &options, ConnectionSink &sink)
{
    if (m_scheduler)
        throw std::logic_error("transport already bound");

    auto scheduler = coro::io_scheduler::make_shared(coro::io_scheduler::options{
        .thread_strategy = coro::io_scheduler::thread_strategy_t::spawn,
        .pool = coro::thread_pool::options{.thread_count = std::max<uint32_t>(1u, options.worker_threads)},
        .execution_strategy = coro::io_scheduler::execution_strategy_t::process_tasks_on_thread_pool});
    // Throws on a malformed address or when bind/listen fail; the scheduler is
    // released with it.
    auto server = std::make_unique<coro::net::tcp::server>(
        scheduler,
        coro::net::tcp::server::options{
            .address = coro::net::ip_address::from_string(options.address),
            .port = options.port,
            .backlog = options.backlog});

    m_options = options;
    m_sink = &sink;
    m_stopping.store(false, std::memory_order_release);
    m_server = std::move(server);
    m_scheduler = std::move(scheduler);
    m_active_tasks.store(1, std::memory_order_release);
    if (!m_scheduler->spawn(accept_loop())) {
        m_active_tasks.store(0, std::memory_order_release);
        m_server.reset();
        m_scheduler->shutdown();
        m_scheduler.reset();
        m_sink = nullptr;
        throw std::runtime_error("failed to start accept loop");
    }
    lgate::log::info("[listener] TCP listener on {}:{}", options.address, options.port);
}

void CoroTransport::shutdown()
{
    if (!m_scheduler)
        return;
    m_stopping.store(true, std::memory_order_release);
    // Every task re-checks the flag at least once per poll interval.
    const auto step = std::max(std::chrono::milliseconds(1), m_options.poll_interval / 4);
    while (m_active_tasks.load(std::memory_order_acquire) > 0)
        std::this_thread::sleep_for(step);
    m_server.reset();
    m_scheduler->shutdown();
    m_scheduler.reset();
    m_sink = nullptr;
    lgate::log::info("[listener] Listener on {}:{} closed", m_options.address, m_options.port);
}

void CoroTransport::task_finished() noexcept
{
    m_active_tasks.fetch_sub(1, std::memory_order_acq_rel);
}

void CoroTransport::apply_socket_options(int fd) const
{
    int one = 1;
    if (m_options.tcp_nodelay && ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0)
        lgate::log::debug("[listener] TCP_NODELAY failed: {}", std::strerror(errno));
    if (m_options.so_keepalive && ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one)) != 0)
        lgate::log::debug("[listener] SO_KEEPALIVE failed: {}", std::strerror(errno));
}

coro::task<void> CoroTransport::accept_loop()
{
    co_await m_scheduler->schedule();
    while (!m_stopping.load(std::memory_order_acquire)) {
        auto status = co_await m_server->poll(m_options.poll_interval);
        if (status == coro::poll_status::event) {
            auto client = m_server->accept();
            if (!client.socket().is_valid())
                continue;
            apply_socket_options(client.socket().native_handle());
            m_active_tasks.fetch_add(1, std::memory_order_acq_rel);
            if (!m_scheduler->spawn(serve_connection(std::move(client)))) {
                task_finished();
                lgate::log::warn("[listener] Scheduler refused connection task, dropping");
            }
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            lgate::log::error("[listener] Poll error/closed, exiting accept loop");
            break;
        }
    }
    task_finished();
    co_return;
}

coro::task<void> CoroTransport::serve_connection(coro::net::tcp::client client)
{
    co_await m_scheduler->schedule();
    std::shared_ptr<CoroConnection> conn;
    try {
        conn = std::make_shared<CoroConnection>(std::move(client));
    } catch (const std::exception &ex) {
        lgate::log::warn("[listener] Dropping connection: {}", ex.what());
        task_finished();
        co_return;
    }
    try {
        m_sink->on_new_connection(conn);
    } catch (const std::exception &ex) {
        lgate::log::error("[listener] Admission of [{}] failed: {}", conn->remote_address(), ex.what());
        conn->close();
    }

    // No protocol handler is attached at this layer: inbound bytes are
    // discarded and the task only watches for the connection going away.
    std::string buf(1024, '\0');
    while (!m_stopping.load(std::memory_order_acquire) && !conn->closing()) {
        auto pstat = co_await conn->client().poll(coro::poll_op::read, m_options.poll_interval);
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat != coro::poll_status::event)
            break;
        auto rstatus = conn->client().recv(buf).first;
        if (rstatus == coro::net::recv_status::ok || rstatus == coro::net::recv_status::would_block)
            continue;
        if (rstatus != coro::net::recv_status::closed)
            lgate::log::debug("[listener] recv error from [{}]", conn->remote_address());
        break;
    }
    conn->notify_closed();
    task_finished();
    co_return;
}

} // namespace lgate::net
