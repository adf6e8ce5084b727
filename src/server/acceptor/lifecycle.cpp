// SPDX-License-Identifier: Apache-2.0
#include "server/acceptor/lifecycle.hpp"

namespace lgate::acceptor {

const char *to_string(AcceptorState s) noexcept
{
    switch (s) {
        case AcceptorState::closed:
            return "closed";
        case AcceptorState::binding:
            return "binding";
        case AcceptorState::listening:
            return "listening";
        case AcceptorState::unbinding:
            return "unbinding";
    }
    return "unknown";
}

bool Lifecycle::transition(AcceptorState from, AcceptorState to) noexcept
{
    return m_state.compare_exchange_strong(from, to, std::memory_order_acq_rel);
}

bool Lifecycle::begin_bind() noexcept
{
    return transition(AcceptorState::closed, AcceptorState::binding);
}

void Lifecycle::finish_bind(bool ok) noexcept
{
    transition(AcceptorState::binding, ok ? AcceptorState::listening : AcceptorState::closed);
}

bool Lifecycle::begin_unbind() noexcept
{
    return transition(AcceptorState::listening, AcceptorState::unbinding);
}

void Lifecycle::finish_unbind() noexcept
{
    transition(AcceptorState::unbinding, AcceptorState::closed);
}

} // namespace lgate::acceptor
