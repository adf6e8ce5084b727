// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/acceptor/session.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace lgate::acceptor {

// Serial number -> session. Not synchronized: the acceptor serializes every
// call under its admission mutex.
class SessionRegistry
{
public:
    // Returns false (and leaves the registry unchanged) when the serial is taken.
    bool insert(std::shared_ptr<Session> session);

    std::shared_ptr<Session> get(uint32_t serial) const;

    // Removes and returns the entry; nullptr when it was not registered.
    std::shared_ptr<Session> remove(uint32_t serial);

    size_t size() const noexcept { return m_by_serial.size(); }
    bool empty() const noexcept { return m_by_serial.empty(); }

    // Removes every session whose remote address is in addresses.
    std::vector<std::shared_ptr<Session>> extract_if(const std::unordered_set<std::string> &addresses);

    // Removes everything.
    std::vector<std::shared_ptr<Session>> extract_all();

private:
    std::unordered_map<uint32_t, std::shared_ptr<Session>> m_by_serial;
};

} // namespace lgate::acceptor
