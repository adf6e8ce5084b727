// SPDX-License-Identifier: Apache-2.0
#include "common/metrics.hpp"
#include "fake_transport.hpp"
#include "server/acceptor/acceptor.hpp"

#include <cassert>
#include <iostream>

using lgate::acceptor::AcceptorState;
using lgate::test::connect;

int main()
{
    lgate::test::FakeTransport transport;
    lgate::acceptor::Acceptor acceptor{transport};
    auto &mc = lgate::metrics::acceptor();

    // Closed: connections are dropped without touching the registry
    assert(acceptor.closed());
    auto gated_before = mc.connections_gated.load();
    auto early = connect(acceptor, "10.0.0.1");
    assert(early->closed());
    assert(!early->has_handler());
    assert(acceptor.session_count() == 0);
    assert(acceptor.ip_connection_count("10.0.0.1") == 0);
    assert(mc.connections_gated.load() == gated_before + 1);

    // Bind failure leaves the acceptor closed
    transport.fail_next_bind = true;
    auto bind_failures = mc.bind_failures.load();
    lgate::net::ListenOptions opts;
    opts.port = 41999;
    assert(!acceptor.bind(opts));
    assert(acceptor.state() == AcceptorState::closed);
    assert(mc.bind_failures.load() == bind_failures + 1);
    auto still_closed = connect(acceptor, "10.0.0.1");
    assert(still_closed->closed());
    assert(acceptor.session_count() == 0);

    // Successful bind: admission becomes effective immediately
    assert(acceptor.bind(opts));
    assert(transport.bind_calls == 2);
    assert(transport.sink == &acceptor);
    assert(transport.last_options.port == 41999);
    assert(acceptor.state() == AcceptorState::listening);
    assert(!acceptor.closed());
    assert(!acceptor.bind(opts)); // already listening
    auto c1 = connect(acceptor, "10.0.0.1");
    assert(!c1->closed());
    assert(c1->has_handler());
    assert(acceptor.session_count() == 1);
    auto s1 = acceptor.get_session(1);
    assert(s1 && s1->remote_address() == "10.0.0.1" && s1->is_open());

    // Mode change pauses admission but keeps existing sessions
    acceptor.set_mode_changing(true);
    assert(acceptor.mode_changing());
    assert(acceptor.state() == AcceptorState::listening);
    auto paused = connect(acceptor, "10.0.0.2");
    assert(paused->closed());
    assert(acceptor.session_count() == 1);
    assert(!c1->closed());
    acceptor.set_mode_changing(false);
    auto c2 = connect(acceptor, "10.0.0.2");
    assert(!c2->closed());
    assert(acceptor.session_count() == 2);
    // serial 2 was never handed out to the paused connection
    assert(acceptor.get_session(2) && acceptor.get_session(2)->remote_address() == "10.0.0.2");

    // Peer hangup deregisters through the close handler
    c2->peer_hangup();
    assert(acceptor.session_count() == 1);
    assert(acceptor.ip_connection_count("10.0.0.2") == 0);

    // Unbind drops what is left and closes the transport
    acceptor.unbind();
    assert(transport.shutdown_calls == 1);
    assert(acceptor.state() == AcceptorState::closed);
    assert(acceptor.session_count() == 0);
    assert(acceptor.ip_counts().empty());
    assert(c1->closed());
    assert(!s1->is_open());
    // a second unbind is refused
    acceptor.unbind();
    assert(transport.shutdown_calls == 1);
    // late close notification from the old connection is harmless
    c1->peer_hangup();
    assert(acceptor.session_count() == 0);

    // Rebind: serial numbers keep increasing
    assert(acceptor.bind(opts));
    auto c3 = connect(acceptor, "10.0.0.3");
    assert(acceptor.get_session(3) && acceptor.get_session(3)->remote_address() == "10.0.0.3");
    assert(acceptor.get_session(1) == nullptr);

    // Peer lookup failure: connection dropped, nothing registered
    auto failures = mc.admission_failures.load();
    auto vanished = std::make_shared<lgate::test::VanishedConnection>();
    acceptor.on_new_connection(vanished);
    assert(vanished->closed());
    assert(acceptor.session_count() == 1);
    assert(mc.admission_failures.load() == failures + 1);

    acceptor.unbind();
    assert(c3->closed());
    std::cout << "unit_acceptor_lifecycle OK" << std::endl;
    return 0;
}
