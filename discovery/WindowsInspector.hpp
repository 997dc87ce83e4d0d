#pragma once

#include "NetworkInspector.hpp"

namespace netscout::discovery
{
    class WindowsInspector : public CommandInspector
    {
    public:
        std::string PlatformName() const override { return "windows"; }

        std::vector<common::NetworkInfo> QueryTopology() override;
        std::vector<common::NetworkInfo> QueryTopologyFallback() override;
        std::vector<ArpEntry> ReadArpTable() override;

        // nbtstat needs about 2s for a NetBIOS timeout.
        std::chrono::milliseconds HostnameTimeout() const override { return std::chrono::milliseconds(3000); }
        std::optional<std::string> LocalHostname() override;
        bool IsElevated() override;
        std::string ElevationInstructions() const override;

    protected:
        std::vector<std::string> PingCommand(const std::string &ip,
                                             std::chrono::milliseconds timeout) const override;
        PingFlavor Flavor() const override { return PingFlavor::Windows; }
        std::vector<HostnameMethod> HostnameMethods(const std::string &ip) const override;
    };
}
