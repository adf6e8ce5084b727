// SPDX-License-Identifier: Apache-2.0
// transport.hpp
// Seams between the acceptor and whatever owns the sockets. The acceptor only
// sees these interfaces; the libcoro implementation lives in listener.hpp.
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace lgate::net {

// One accepted inbound connection as seen by the acceptor.
class RawConnection
{
public:
    virtual ~RawConnection() = default;

    // Peer IP in presentation form ("10.0.0.1", "::1").
    virtual std::string remote_address() const = 0;

    // Requests teardown. Safe to call more than once and after the peer left.
    virtual void close() noexcept = 0;

    // Installs the handler the transport runs once the connection is gone
    // (peer hangup, error, close() or transport shutdown).
    virtual void on_closed(std::function<void()> handler) = 0;
};

// Capability the transport invokes for every accepted connection.
class ConnectionSink
{
public:
    virtual ~ConnectionSink() = default;
    virtual void on_new_connection(std::shared_ptr<RawConnection> raw) = 0;
};

struct ListenOptions
{
    std::string address{"0.0.0.0"};
    uint16_t port{8484};
    int32_t backlog{5000}; // listen(2) backlog, sized from max_connections
    uint32_t worker_threads{4};
    bool tcp_nodelay{true};
    bool so_keepalive{true};
    // Upper bound on how long accept/connection loops take to notice shutdown.
    std::chrono::milliseconds poll_interval{100};
};

class Transport
{
public:
    virtual ~Transport() = default;

    // Opens the listening channel and starts delivering connections to sink.
    // Throws on failure (address in use, permission denied, malformed address);
    // nothing stays open in that case.
    virtual void bind(const ListenOptions &options, ConnectionSink &sink) = 0;

    // Closes the listening channel and live connections, then releases the
    // worker threads. No-op when not bound.
    virtual void shutdown() = 0;
};

} // namespace lgate::net
