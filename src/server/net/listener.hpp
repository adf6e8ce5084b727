// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/net/transport.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace lgate::net {

// Peer IP of a connected socket in presentation form. Throws std::system_error
// when the peer cannot be resolved (already disconnected).
std::string peer_address(int fd);

// Accepted libcoro client wrapped as a RawConnection. Owned by the transport's
// per-connection task.
class CoroConnection final : public RawConnection
{
public:
    explicit CoroConnection(coro::net::tcp::client client);

    std::string remote_address() const override { return m_remote; }
    void close() noexcept override;
    void on_closed(std::function<void()> handler) override;

    bool closing() const noexcept { return m_closing.load(std::memory_order_acquire); }
    coro::net::tcp::client &client() noexcept { return m_client; }

    // Runs the close handler once. Called by the transport when the
    // connection task ends.
    void notify_closed();

private:
    coro::net::tcp::client m_client;
    std::string m_remote;
    std::atomic<bool> m_closing{false};
    std::mutex m_handler_mutex;
    std::function<void()> m_on_closed;
    bool m_closed_notified{false}; // guarded by m_handler_mutex
};

// Transport over a libcoro io_scheduler: one accept task plus one task per
// connection, all running on the scheduler's thread pool.
class CoroTransport final : public Transport
{
public:
    CoroTransport() = default;
    ~CoroTransport() override;

    CoroTransport(const CoroTransport &) = delete;
    CoroTransport &operator=(const CoroTransport &) = delete;

    void bind(const ListenOptions &options, ConnectionSink &sink) override;
    void shutdown() override;

    bool bound() const noexcept { return m_scheduler != nullptr; }

private:
    coro::task<void> accept_loop();
    coro::task<void> serve_connection(coro::net::tcp::client client);
    void apply_socket_options(int fd) const;
    void task_finished() noexcept;

    ListenOptions m_options;
    ConnectionSink *m_sink{nullptr};
    std::shared_ptr<coro::io_scheduler> m_scheduler;
    std::unique_ptr<coro::net::tcp::server> m_server;
    std::atomic<bool> m_stopping{false};
    std::atomic<uint32_t> m_active_tasks{0};
};

} // namespace lgate::net
