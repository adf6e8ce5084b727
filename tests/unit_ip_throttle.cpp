// SPDX-License-Identifier: Apache-2.0
#include "server/acceptor/ip_throttle.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>

int main()
{
    lgate::acceptor::IpThrottleTable t;
    assert(t.count("10.0.0.1") == 0);
    for (int i = 0; i < 5; ++i)
        t.increment("10.0.0.1");
    assert(t.increment("10.0.0.2") == 1);
    assert(t.count("10.0.0.1") == 5);
    assert(t.count("10.0.0.2") == 1);
    assert(t.size() == 2);

    t.decrement("10.0.0.2");
    assert(t.count("10.0.0.2") == 0);
    assert(t.size() == 1); // key gone at zero
    t.decrement("10.0.0.2"); // unknown address tolerated
    assert(t.size() == 1);

    for (int i = 0; i < 11; ++i)
        t.increment("192.168.1.50");
    for (int i = 0; i < 10; ++i)
        t.increment("192.168.1.51");
    auto marked = t.extract_above(10);
    assert(marked.size() == 1);
    assert(marked[0] == "192.168.1.50");
    assert(t.count("192.168.1.50") == 0);
    assert(t.count("192.168.1.51") == 10); // exactly at threshold stays
    assert(t.count("10.0.0.1") == 5);

    auto none = t.extract_above(100);
    assert(none.empty());
    assert(t.size() == 2);
    t.clear();
    assert(t.size() == 0);
    std::cout << "unit_ip_throttle OK" << std::endl;
    return 0;
}
