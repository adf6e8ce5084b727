// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>

namespace lgate::acceptor {

enum class AcceptorState
{
    closed,
    binding,
    listening,
    unbinding
};

const char *to_string(AcceptorState s) noexcept;

// Closed -> Binding -> Listening -> Unbinding -> Closed, plus the orthogonal
// mode-changing flag that pauses admission without a transition. Transitions
// are compare-and-swap so racing callers cannot both win.
class Lifecycle
{
public:
    // Closed -> Binding. False when not closed.
    bool begin_bind() noexcept;
    // Binding -> Listening on success, Binding -> Closed otherwise.
    void finish_bind(bool ok) noexcept;
    // Listening -> Unbinding. False when not listening.
    bool begin_unbind() noexcept;
    // Unbinding -> Closed.
    void finish_unbind() noexcept;

    void set_mode_changing(bool on) noexcept { m_mode_changing.store(on, std::memory_order_release); }
    bool mode_changing() const noexcept { return m_mode_changing.load(std::memory_order_acquire); }

    AcceptorState state() const noexcept { return m_state.load(std::memory_order_acquire); }
    // True whenever the acceptor is not Listening.
    bool closed() const noexcept { return state() != AcceptorState::listening; }
    // Gate for new connections.
    bool admitting() const noexcept { return !closed() && !mode_changing(); }

private:
    bool transition(AcceptorState from, AcceptorState to) noexcept;

    std::atomic<AcceptorState> m_state{AcceptorState::closed};
    std::atomic<bool> m_mode_changing{false};
};

} // namespace lgate::acceptor
