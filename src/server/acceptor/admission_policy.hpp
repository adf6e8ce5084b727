// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>

namespace lgate::acceptor {

// Two independent knobs: the soft threshold only changes how an admission is
// reported, while the sweep is driven by the global session count and, once
// running, evicts addresses above evict_threshold.
struct AdmissionLimits
{
    uint32_t session_cap{5000}; // live sessions before a sweep runs
    uint32_t ip_soft_threshold{30}; // per-address count above which admissions are flagged
    uint32_t ip_evict_threshold{10}; // per-address count above which a sweep evicts
};

struct AdmissionDecision
{
    bool flagged{false}; // admitted, but suppress the "accepted" report
    bool sweep{false}; // run an eviction sweep before releasing the lock
};

// live_sessions and address_count are read after the new session was
// registered and counted.
AdmissionDecision evaluate_admission(size_t live_sessions, uint32_t address_count, const AdmissionLimits &limits) noexcept;

} // namespace lgate::acceptor
