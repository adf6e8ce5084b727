// SPDX-License-Identifier: Apache-2.0
#include "server/acceptor/lifecycle.hpp"

#include <cassert>
#include <cstring>
#include <iostream>

using lgate::acceptor::AcceptorState;

int main()
{
    lgate::acceptor::Lifecycle lc;
    assert(lc.state() == AcceptorState::closed);
    assert(lc.closed());
    assert(!lc.admitting());
    assert(!lc.begin_unbind());

    assert(lc.begin_bind());
    assert(lc.state() == AcceptorState::binding);
    assert(!lc.admitting());
    assert(!lc.begin_bind()); // second binder loses
    lc.finish_bind(false);
    assert(lc.state() == AcceptorState::closed);

    assert(lc.begin_bind());
    lc.finish_bind(true);
    assert(lc.state() == AcceptorState::listening);
    assert(!lc.closed());
    assert(lc.admitting());

    lc.set_mode_changing(true);
    assert(lc.mode_changing());
    assert(!lc.admitting());
    assert(lc.state() == AcceptorState::listening); // no transition
    lc.set_mode_changing(false);
    assert(lc.admitting());

    assert(lc.begin_unbind());
    assert(lc.state() == AcceptorState::unbinding);
    assert(lc.closed());
    assert(!lc.begin_unbind());
    lc.finish_unbind();
    assert(lc.state() == AcceptorState::closed);

    // rebind after unbind
    assert(lc.begin_bind());
    lc.finish_bind(true);
    assert(lc.admitting());
    assert(std::strcmp(lgate::acceptor::to_string(lc.state()), "listening") == 0);
    std::cout << "unit_lifecycle OK" << std::endl;
    return 0;
}
