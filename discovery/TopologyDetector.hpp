#pragma once

#include "NetworkInspector.hpp"
#include "../common/Device.hpp"

#include <optional>
#include <vector>

namespace netscout::discovery
{
    class TopologyDetector
    {
    public:
        explicit TopologyDetector(NetworkInspector &inspector) : m_inspector(inspector) {}

        // Network carrying the default route. Throws
        // ScanError(NetworkNotAvailable) when neither query yields a usable subnet.
        common::NetworkInfo Detect();

        // Physical adapter with a gateway first, then any physical adapter,
        // then whatever usable candidate remains.
        static std::optional<common::NetworkInfo> SelectTopology(const std::vector<common::NetworkInfo> &candidates);

    private:
        NetworkInspector &m_inspector;
    };
}
