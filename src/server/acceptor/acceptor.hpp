// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/acceptor/admission_policy.hpp"
#include "server/acceptor/ip_throttle.hpp"
#include "server/acceptor/lifecycle.hpp"
#include "server/acceptor/serial_generator.hpp"
#include "server/acceptor/session.hpp"
#include "server/acceptor/session_registry.hpp"
#include "server/net/transport.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lgate::acceptor {

// Admits inbound connections: gates them on the lifecycle, registers a session
// under a fresh serial number, tracks per-address counts and runs the flood
// eviction sweep. The transport is passed in and must outlive the acceptor.
class Acceptor final : public net::ConnectionSink
{
public:
    explicit Acceptor(net::Transport &transport, AdmissionLimits limits = {});
    ~Acceptor() override;

    Acceptor(const Acceptor &) = delete;
    Acceptor &operator=(const Acceptor &) = delete;

    // Returns false (and stays closed) when the transport fails to bind or the
    // acceptor is not closed.
    bool bind(const net::ListenOptions &options);
    // Stops the transport and drops every remaining session. Only acts when
    // listening; other calls are logged and ignored.
    void unbind();

    void on_new_connection(std::shared_ptr<net::RawConnection> raw) override;

    std::shared_ptr<Session> get_session(uint32_t serial) const;
    size_t session_count() const;
    // Deregisters the session and closes its connection. Unknown serials are a no-op.
    void remove_session(const Session &session);
    void remove_session(uint32_t serial);

    uint32_t ip_connection_count(const std::string &address) const;
    std::unordered_map<std::string, uint32_t> ip_counts() const;

    bool closed() const noexcept { return m_lifecycle.closed(); }
    bool mode_changing() const noexcept { return m_lifecycle.mode_changing(); }
    void set_mode_changing(bool on);
    AcceptorState state() const noexcept { return m_lifecycle.state(); }
    const AdmissionLimits &limits() const noexcept { return m_limits; }

private:
    struct SweepResult
    {
        size_t live_before{0};
        std::vector<std::string> addresses;
        std::vector<std::shared_ptr<Session>> sessions;
    };

    // Caller holds m_mutex.
    SweepResult sweep_locked();
    void publish_gauges_locked() const;
    void report_sweep(const SweepResult &sweep) const;

    net::Transport &m_transport;
    const AdmissionLimits m_limits;
    Lifecycle m_lifecycle;
    SerialNumberGenerator m_serials;

    mutable std::mutex m_mutex; // guards m_sessions and m_ip_counts as one unit
    SessionRegistry m_sessions;
    IpThrottleTable m_ip_counts;
};

} // namespace lgate::acceptor
