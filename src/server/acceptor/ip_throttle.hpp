// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace lgate::acceptor {

// Remote address -> number of live sessions from it. Not synchronized; guarded
// by the same acceptor mutex as the session registry so both are read together.
class IpThrottleTable
{
public:
    // Returns the count after the increment (1 for a first sighting).
    uint32_t increment(const std::string &address);

    // Drops one live connection; the key disappears when it reaches zero.
    void decrement(const std::string &address);

    uint32_t count(const std::string &address) const;
    size_t size() const noexcept { return m_counts.size(); }

    // Removes and returns every address whose count is strictly above threshold.
    std::vector<std::string> extract_above(uint32_t threshold);

    void clear() noexcept { m_counts.clear(); }

    const std::unordered_map<std::string, uint32_t> &counts() const noexcept { return m_counts; }

private:
    std::unordered_map<std::string, uint32_t> m_counts;
};

} // namespace lgate::acceptor
