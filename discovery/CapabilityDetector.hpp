#pragma once

#include "NetworkInspector.hpp"
#include "../common/Device.hpp"

#include <string>

namespace netscout::discovery
{
    class CapabilityDetector
    {
    public:
        explicit CapabilityDetector(NetworkInspector &inspector) : m_inspector(inspector) {}

        // Never fails. Full mode iff the system ping can reach loopback.
        common::ScanCapabilities Detect();

    private:
        NetworkInspector &m_inspector;
    };

    std::string FormatCapabilitiesMessage(const common::ScanCapabilities &caps);
}
