// SPDX-License-Identifier: Apache-2.0
#include "server/acceptor/session_registry.hpp"

namespace lgate::acceptor {

bool SessionRegistry::insert(std::shared_ptr<Session> session)
{
    if (!session)
        return false;
    const uint32_t serial = session->serial();
    return m_by_serial.emplace(serial, std::move(session)).second;
}

std::shared_ptr<Session> SessionRegistry::get(uint32_t serial) const
{
    auto it = m_by_serial.find(serial);
    if (it == m_by_serial.end())
        return nullptr;
    return it->second;
}

std::shared_ptr<Session> SessionRegistry::remove(uint32_t serial)
{
    auto it = m_by_serial.find(serial);
    if (it == m_by_serial.end())
        return nullptr;
    auto s = std::move(it->second);
    m_by_serial.erase(it);
    return s;
}

std::vector<std::shared_ptr<Session>> SessionRegistry::extract_if(const std::unordered_set<std::string> &addresses)
{
    std::vector<std::shared_ptr<Session>> out;
    if (addresses.empty())
        return out;
    for (auto it = m_by_serial.begin(); it != m_by_serial.end();) {
        if (addresses.count(it->second->remote_address())) {
            out.push_back(std::move(it->second));
            it = m_by_serial.erase(it);
        } else {
            ++it;
        }
    }
    return out;
}

std::vector<std::shared_ptr<Session>> SessionRegistry::extract_all()
{
    std::vector<std::shared_ptr<Session>> out;
    out.reserve(m_by_serial.size());
    for (auto &kv : m_by_serial)
        out.push_back(std::move(kv.second));
    m_by_serial.clear();
    return out;
}

} // namespace lgate::acceptor
