#include "CapabilityDetector.hpp"
#include "../common/Log.hpp"

namespace netscout::discovery
{
    common::ScanCapabilities CapabilityDetector::Detect()
    {
        common::ScanCapabilities caps;
        caps.is_elevated = m_inspector.IsElevated();
        caps.can_ping = m_inspector.Ping("127.0.0.1", std::chrono::milliseconds(1000)).reachable;
        caps.can_read_arp = true;
        caps.can_resolve_hostnames = true;

        if (caps.can_ping)
        {
            caps.mode = common::ScanMode::Full;
        }
        else
        {
            caps.mode = common::ScanMode::Limited;
            caps.warning = "Running with limited scan capabilities. Some devices may not be discovered.";
            caps.elevation_instructions = m_inspector.ElevationInstructions();
            common::LogWarn("Capabilities") << *caps.warning;
        }

        common::LogDebug("Capabilities") << "mode=" << common::ScanModeName(caps.mode)
                                         << " elevated=" << caps.is_elevated;
        return caps;
    }

    std::string FormatCapabilitiesMessage(const common::ScanCapabilities &caps)
    {
        if (caps.mode == common::ScanMode::Full)
            return "Scanning with full capabilities";

        std::string msg = "Scanning with limited capabilities:\n";
        if (!caps.can_ping)
            msg += "  - Ping sweep unavailable (will use ARP table only)\n";
        if (!caps.can_read_arp)
            msg += "  - ARP table reading unavailable\n";
        if (!caps.can_resolve_hostnames)
            msg += "  - Hostname resolution unavailable\n";

        if (caps.elevation_instructions)
        {
            msg += "\nTo enable full scanning:\n";
            msg += *caps.elevation_instructions;
        }
        return msg;
    }
}
