// SPDX-License-Identifier: Apache-2.0
#include "fake_transport.hpp"
#include "server/acceptor/acceptor.hpp"
#include "server/net/metrics_http.hpp"

#include <cassert>
#include <iostream>
#include <string>

int main()
{
    lgate::test::FakeTransport transport;
    lgate::acceptor::AdmissionLimits limits;
    limits.session_cap = 7;
    lgate::acceptor::Acceptor acceptor{transport, limits};

    auto body = lgate::net::build_metrics_body(acceptor);
    assert(body.find("# TYPE lgate_connections_accepted counter\n") != std::string::npos);
    assert(body.find("lgate_acceptor_closed 1\n") != std::string::npos);
    assert(body.find("lgate_session_cap 7\n") != std::string::npos);

    assert(acceptor.bind({}));
    auto a = lgate::test::connect(acceptor, "192.0.2.1");
    auto b = lgate::test::connect(acceptor, "192.0.2.2");
    acceptor.set_mode_changing(true);
    body = lgate::net::build_metrics_body(acceptor);
    assert(body.find("lgate_sessions_active 2\n") != std::string::npos);
    assert(body.find("lgate_tracked_addresses 2\n") != std::string::npos);
    assert(body.find("lgate_acceptor_closed 0\n") != std::string::npos);
    assert(body.find("lgate_acceptor_mode_changing 1\n") != std::string::npos);

    acceptor.set_mode_changing(false);
    b->peer_hangup();
    body = lgate::net::build_metrics_body(acceptor);
    assert(body.find("lgate_sessions_active 1\n") != std::string::npos);
    assert(body.find("lgate_acceptor_mode_changing 0\n") != std::string::npos);
    assert(body.find("# TYPE lgate_sessions_active gauge\n") != std::string::npos);

    acceptor.unbind();
    std::cout << "unit_metrics_body OK" << std::endl;
    return 0;
}
