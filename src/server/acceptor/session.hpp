// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/net/transport.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace lgate::acceptor {

// Server-side handle of an admitted connection. The transport owns the
// connection; the session only keeps a weak reference to it.
class Session
{
public:
    Session(uint32_t serial, std::string remote_address, std::weak_ptr<net::RawConnection> connection)
        : m_serial(serial), m_remote_address(std::move(remote_address)), m_connection(std::move(connection))
    {}

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    uint32_t serial() const noexcept { return m_serial; }
    const std::string &remote_address() const noexcept { return m_remote_address; }
    bool is_open() const noexcept { return m_open.load(std::memory_order_acquire); }

    // Marks the session closed and asks the transport to tear the connection
    // down. Returns false when it was already closed or the connection is gone.
    bool close() noexcept;

private:
    const uint32_t m_serial;
    const std::string m_remote_address;
    std::weak_ptr<net::RawConnection> m_connection;
    std::atomic<bool> m_open{true};
};

} // namespace lgate::acceptor
