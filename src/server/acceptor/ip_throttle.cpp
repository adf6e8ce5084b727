// SPDX-License-Identifier: Apache-2.0
#include "server/acceptor/ip_throttle.hpp"

namespace lgate::acceptor {

uint32_t IpThrottleTable::increment(const std::string &address)
{
    auto it = m_counts.try_emplace(address, 0u).first;
    return ++it->second;
}

void IpThrottleTable::decrement(const std::string &address)
{
    auto it = m_counts.find(address);
    if (it == m_counts.end())
        return; // evicted by a sweep after this session was counted
    if (it->second <= 1)
        m_counts.erase(it);
    else
        --it->second;
}

uint32_t IpThrottleTable::count(const std::string &address) const
{
    auto it = m_counts.find(address);
    return it == m_counts.end() ? 0u : it->second;
}

std::vector<std::string> IpThrottleTable::extract_above(uint32_t threshold)
{
    std::vector<std::string> out;
    for (auto it = m_counts.begin(); it != m_counts.end();) {
        if (it->second > threshold) {
            out.push_back(it->first);
            it = m_counts.erase(it);
        } else {
            ++it;
        }
    }
    return out;
}

} // namespace lgate::acceptor
