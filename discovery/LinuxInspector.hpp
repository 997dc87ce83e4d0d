#pragma once

#include "NetworkInspector.hpp"

namespace netscout::discovery
{
    class LinuxInspector : public CommandInspector
    {
    public:
        std::string PlatformName() const override { return "linux"; }

        std::vector<common::NetworkInfo> QueryTopology() override;
        std::vector<common::NetworkInfo> QueryTopologyFallback() override;
        std::vector<ArpEntry> ReadArpTable() override;

        std::chrono::milliseconds HostnameTimeout() const override { return std::chrono::milliseconds(1500); }
        std::optional<std::string> LocalHostname() override;
        bool IsElevated() override;
        std::string ElevationInstructions() const override;

    protected:
        std::vector<std::string> PingCommand(const std::string &ip,
                                             std::chrono::milliseconds timeout) const override;
        PingFlavor Flavor() const override { return PingFlavor::Unix; }
        std::vector<HostnameMethod> HostnameMethods(const std::string &ip) const override;
    };
}
