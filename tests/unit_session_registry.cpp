// SPDX-License-Identifier: Apache-2.0
#include "fake_transport.hpp"
#include "server/acceptor/session_registry.hpp"

#include <cassert>
#include <iostream>
#include <memory>

using lgate::acceptor::Session;

static std::shared_ptr<Session> make(uint32_t serial, const char *addr, std::shared_ptr<lgate::test::FakeConnection> conn)
{
    return std::make_shared<Session>(serial, addr, conn);
}

int main()
{
    auto c1 = std::make_shared<lgate::test::FakeConnection>("10.0.0.1");
    auto c2 = std::make_shared<lgate::test::FakeConnection>("10.0.0.2");
    auto c3 = std::make_shared<lgate::test::FakeConnection>("10.0.0.1");

    lgate::acceptor::SessionRegistry reg;
    assert(reg.empty());
    assert(reg.insert(make(1, "10.0.0.1", c1)));
    assert(reg.insert(make(2, "10.0.0.2", c2)));
    assert(reg.insert(make(3, "10.0.0.1", c3)));
    assert(reg.size() == 3);
    // duplicate serial is refused, nothing double counted
    assert(!reg.insert(make(2, "10.0.0.9", c2)));
    assert(!reg.insert(nullptr));
    assert(reg.size() == 3);
    assert(reg.get(2)->remote_address() == "10.0.0.2");
    assert(reg.get(42) == nullptr);

    auto removed = reg.remove(2);
    assert(removed && removed->serial() == 2);
    assert(reg.size() == 2);
    // removing again (or an unknown serial) is a no-op
    assert(reg.remove(2) == nullptr);
    assert(reg.remove(1000) == nullptr);
    assert(reg.size() == 2);

    auto out = reg.extract_if({"10.0.0.1"});
    assert(out.size() == 2);
    assert(reg.empty());
    assert(reg.extract_if({}).empty());

    // session close reaches the connection once
    auto s = make(7, "10.0.0.1", c1);
    assert(s->is_open());
    assert(s->close());
    assert(!s->is_open());
    assert(!s->close());
    assert(c1->close_calls() == 1);

    // connection already released by the transport
    auto gone = std::make_shared<lgate::test::FakeConnection>("10.0.0.3");
    auto orphan = make(8, "10.0.0.3", gone);
    gone.reset();
    assert(!orphan->close());
    assert(!orphan->is_open());

    assert(reg.insert(make(9, "10.0.0.2", c2)));
    assert(reg.insert(make(10, "10.0.0.3", c2)));
    assert(reg.extract_all().size() == 2);
    assert(reg.size() == 0);
    std::cout << "unit_session_registry OK" << std::endl;
    return 0;
}
