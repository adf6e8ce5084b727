// SPDX-License-Identifier: Apache-2.0
#include "server/acceptor/admission_policy.hpp"

namespace lgate::acceptor {

AdmissionDecision evaluate_admission(size_t live_sessions, uint32_t address_count, const AdmissionLimits &limits) noexcept
{
    AdmissionDecision d;
    d.flagged = address_count > limits.ip_soft_threshold;
    d.sweep = live_sessions > limits.session_cap;
    return d;
}

} // namespace lgate::acceptor
