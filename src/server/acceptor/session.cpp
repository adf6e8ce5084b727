// SPDX-License-Identifier: Apache-2.0
#include "server/acceptor/session.hpp"

namespace lgate::acceptor {

bool Session::close() noexcept
{
    if (!m_open.exchange(false, std::memory_order_acq_rel))
        return false;
    auto conn = m_connection.lock();
    if (!conn)
        return false; // transport already released it
    conn->close();
    return true;
}

} // namespace lgate::acceptor
