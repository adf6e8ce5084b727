// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <cstdint>

namespace lgate::acceptor {

// Issues session serial numbers: 1, 2, 3, ... for the lifetime of the process.
// Values are never reused, even after the session that held one is removed.
class SerialNumberGenerator
{
public:
    uint32_t next() noexcept { return m_last.fetch_add(1, std::memory_order_relaxed) + 1; }

    // Most recently issued value (0 before the first call).
    uint32_t last() const noexcept { return m_last.load(std::memory_order_relaxed); }

private:
    std::atomic<uint32_t> m_last{0};
};

} // namespace lgate::acceptor
