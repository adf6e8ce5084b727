// SPDX-License-Identifier: Apache-2.0
#include "server/acceptor/acceptor.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <cstdint>
#include <exception>
#include <unordered_set>

namespace lgate::acceptor {

namespace {
constexpr uint32_t kFlaggedReportEvery = 100;
} // namespace

Acceptor::Acceptor(net::Transport &transport, AdmissionLimits limits) : m_transport(transport), m_limits(limits) {}

Acceptor::~Acceptor()
{
    if (m_lifecycle.state() == AcceptorState::listening)
        unbind();
}

bool Acceptor::bind(const net::ListenOptions &options)
{
    if (!m_lifecycle.begin_bind()) {
        lgate::log::error("[acceptor] bind refused while {}", to_string(m_lifecycle.state()));
        return false;
    }
    try {
        m_transport.bind(options, *this);
    } catch (const std::exception &ex) {
        m_lifecycle.finish_bind(false);
        lgate::metrics::acceptor().bind_failures.fetch_add(1, std::memory_order_relaxed);
        lgate::log::error("[acceptor] Failed to bind {}:{}: {}", options.address, options.port, ex.what());
        return false;
    }
    m_lifecycle.finish_bind(true);
    lgate::log::info(
        "[acceptor] Listening on {}:{} (backlog={} workers={})",
        options.address,
        options.port,
        options.backlog,
        options.worker_threads);
    return true;
}

void Acceptor::unbind()
{
    bool started = false;
    {
        // Taking the admission mutex orders the transition against in-flight
        // admissions: they either finished already or will see the gate closed.
        std::scoped_lock lk{m_mutex};
        started = m_lifecycle.begin_unbind();
    }
    if (!started) {
        lgate::log::warn("[acceptor] unbind ignored while {}", to_string(m_lifecycle.state()));
        return;
    }
    try {
        m_transport.shutdown();
    } catch (const std::exception &ex) {
        lgate::log::error("[acceptor] transport shutdown failed: {}", ex.what());
    }
    std::vector<std::shared_ptr<Session>> leftover;
    {
        std::scoped_lock lk{m_mutex};
        leftover = m_sessions.extract_all();
        m_ip_counts.clear();
        publish_gauges_locked();
    }
    for (auto &s : leftover)
        s->close();
    m_lifecycle.finish_unbind();
    lgate::log::info("[acceptor] Unbound ({} sessions dropped)", leftover.size());
}

void Acceptor::on_new_connection(std::shared_ptr<net::RawConnection> raw)
{
    if (!raw)
        return;
    auto &mc = lgate::metrics::acceptor();
    if (!m_lifecycle.admitting()) {
        mc.connections_gated.fetch_add(1, std::memory_order_relaxed);
        raw->close();
        return;
    }

    std::shared_ptr<Session> session;
    try {
        const uint32_t serial = m_serials.next();
        session = std::make_shared<Session>(serial, raw->remote_address(), raw);
    } catch (const std::exception &ex) {
        mc.admission_failures.fetch_add(1, std::memory_order_relaxed);
        lgate::log::error("[acceptor] Failed to create session: {}", ex.what());
        raw->close();
        return;
    }
    const std::string &address = session->remote_address();

    bool gated = false;
    bool inserted = false;
    uint32_t address_count = 0;
    AdmissionDecision decision;
    SweepResult sweep;
    {
        std::scoped_lock lk{m_mutex};
        if (!m_lifecycle.admitting()) {
            gated = true;
        } else if (m_sessions.insert(session)) {
            inserted = true;
            address_count = m_ip_counts.increment(address);
            decision = evaluate_admission(m_sessions.size(), address_count, m_limits);
            if (decision.sweep)
                sweep = sweep_locked();
            publish_gauges_locked();
        }
    }
    if (gated) {
        mc.connections_gated.fetch_add(1, std::memory_order_relaxed);
        raw->close();
        return;
    }
    if (!inserted) {
        mc.admission_failures.fetch_add(1, std::memory_order_relaxed);
        lgate::log::error("[acceptor] Serial {} already registered, dropping [{}]", session->serial(), address);
        raw->close();
        return;
    }
    // Socket teardown happens outside the admission mutex.
    bool self_evicted = false;
    for (auto &victim : sweep.sessions) {
        if (victim == session)
            self_evicted = true;
        victim->close();
    }
    if (decision.sweep)
        report_sweep(sweep);
    // Evicted by the sweep its own admission triggered: never admitted.
    if (self_evicted)
        return;
    mc.connections_accepted.fetch_add(1, std::memory_order_relaxed);

    const uint32_t serial = session->serial();
    try {
        raw->on_closed([this, serial] { remove_session(serial); });
    } catch (const std::exception &ex) {
        // Without a close handler the slot would leak; undo the admission.
        lgate::log::error("[acceptor] Failed to watch session {}: {}", serial, ex.what());
        remove_session(serial);
        return;
    }

    if (!decision.flagged) {
        lgate::log::info("[acceptor] Connection accepted [{}] serial={}", address, serial);
    } else {
        mc.connections_flagged.fetch_add(1, std::memory_order_relaxed);
        // First crossing of the soft limit, then every kFlaggedReportEvery-th
        // connection of the same address.
        if ((address_count - m_limits.ip_soft_threshold) % kFlaggedReportEvery == 1)
            lgate::log::warn(
                "[acceptor] Suspicious address [{}] holds {} connections (soft limit {}), still admitted serial={}",
                address,
                address_count,
                m_limits.ip_soft_threshold,
                serial);
    }
}

Acceptor::SweepResult Acceptor::sweep_locked()
{
    SweepResult r;
    r.live_before = m_sessions.size();
    r.addresses = m_ip_counts.extract_above(m_limits.ip_evict_threshold);
    if (!r.addresses.empty()) {
        std::unordered_set<std::string> marked(r.addresses.begin(), r.addresses.end());
        r.sessions = m_sessions.extract_if(marked);
    }
    auto &mc = lgate::metrics::acceptor();
    mc.eviction_sweeps.fetch_add(1, std::memory_order_relaxed);
    mc.addresses_evicted.fetch_add(r.addresses.size(), std::memory_order_relaxed);
    mc.sessions_evicted.fetch_add(r.sessions.size(), std::memory_order_relaxed);
    return r;
}

void Acceptor::report_sweep(const SweepResult &sweep) const
{
    lgate::log::error(
        "[acceptor] IP connection count exceeded: {} live sessions > cap {}", sweep.live_before, m_limits.session_cap);
    for (const auto &address : sweep.addresses) {
        size_t closed = 0;
        for (const auto &s : sweep.sessions)
            if (s->remote_address() == address)
                ++closed;
        lgate::log::error("[acceptor] Evicting address [{}] ({} sessions closed)", address, closed);
    }
}

void Acceptor::publish_gauges_locked() const
{
    auto &mc = lgate::metrics::acceptor();
    mc.active_sessions.store(m_sessions.size(), std::memory_order_relaxed);
    mc.tracked_addresses.store(m_ip_counts.size(), std::memory_order_relaxed);
}

std::shared_ptr<Session> Acceptor::get_session(uint32_t serial) const
{
    std::scoped_lock lk{m_mutex};
    return m_sessions.get(serial);
}

size_t Acceptor::session_count() const
{
    std::scoped_lock lk{m_mutex};
    return m_sessions.size();
}

void Acceptor::remove_session(const Session &session)
{
    remove_session(session.serial());
}

void Acceptor::remove_session(uint32_t serial)
{
    std::shared_ptr<Session> removed;
    {
        std::scoped_lock lk{m_mutex};
        removed = m_sessions.remove(serial);
        if (removed) {
            m_ip_counts.decrement(removed->remote_address());
            publish_gauges_locked();
        }
    }
    if (!removed)
        return;
    lgate::metrics::acceptor().sessions_removed.fetch_add(1, std::memory_order_relaxed);
    removed->close();
    lgate::log::debug("[acceptor] Session {} removed [{}]", serial, removed->remote_address());
}

uint32_t Acceptor::ip_connection_count(const std::string &address) const
{
    std::scoped_lock lk{m_mutex};
    return m_ip_counts.count(address);
}

std::unordered_map<std::string, uint32_t> Acceptor::ip_counts() const
{
    std::scoped_lock lk{m_mutex};
    return m_ip_counts.counts();
}

void Acceptor::set_mode_changing(bool on)
{
    m_lifecycle.set_mode_changing(on);
    lgate::log::info("[acceptor] Mode change {}", on ? "started, admission paused" : "finished, admission resumed");
}

} // namespace lgate::acceptor
