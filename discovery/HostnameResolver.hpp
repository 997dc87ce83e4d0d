#pragma once

#include "NetworkInspector.hpp"
#include "../common/Device.hpp"

#include <cstddef>
#include <vector>

namespace netscout::discovery
{
    class HostnameResolver
    {
    public:
        static constexpr std::size_t kBatchSize = 32;

        explicit HostnameResolver(NetworkInspector &inspector) : m_inspector(inspector) {}

        // Best effort, in place. A failed or late lookup leaves the device's
        // hostname as it was. Returns how many devices now have a hostname.
        std::size_t Resolve(std::vector<common::Device> &devices);

    private:
        NetworkInspector &m_inspector;
    };
}
