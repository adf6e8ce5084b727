// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Acceptor counters (atomics, no dynamic allocation). Read by the metrics
// endpoint and the periodic runtime summary.
#pragma once
#include <atomic>
#include <cstdint>

namespace lgate::metrics {

struct AcceptorCounters
{
    std::atomic<uint64_t> connections_accepted{0};
    // dropped by the lifecycle gate (closed or mode-changing)
    std::atomic<uint64_t> connections_gated{0};
    std::atomic<uint64_t> admission_failures{0};
    // admitted while the address was above the soft threshold
    std::atomic<uint64_t> connections_flagged{0};
    std::atomic<uint64_t> eviction_sweeps{0};
    std::atomic<uint64_t> sessions_evicted{0};
    std::atomic<uint64_t> addresses_evicted{0};
    std::atomic<uint64_t> sessions_removed{0};
    std::atomic<uint64_t> bind_failures{0};
    // Gauges
    std::atomic<uint64_t> active_sessions{0};
    std::atomic<uint64_t> tracked_addresses{0};
};

inline AcceptorCounters &acceptor()
{
    static AcceptorCounters c;
    return c;
}

} // namespace lgate::metrics
