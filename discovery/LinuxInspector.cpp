#include "LinuxInspector.hpp"
#include "CommandRunner.hpp"
#include "../common/Log.hpp"
#include "../common/Subnet.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace netscout::discovery
{
    namespace
    {
        constexpr std::chrono::milliseconds kRouteTimeout{3000};
    }

    std::vector<common::NetworkInfo> LinuxInspector::QueryTopology()
    {
        std::vector<common::NetworkInfo> candidates;

        CommandResult routes = RunCommand({"ip", "route", "show", "default"}, kRouteTimeout);
        if (!routes.Succeeded())
        {
            common::LogWarn("Topology") << "ip route failed (exit " << routes.exit_code << ")";
            return candidates;
        }

        for (const auto &route : ParseIpRouteDefault(routes.output))
        {
            CommandResult addr = RunCommand({"ip", "-o", "-4", "addr", "show", "dev", route.interface},
                                            kRouteTimeout);
            if (!addr.Succeeded())
                continue;

            auto address = ParseIpAddrShow(addr.output);
            if (!address)
                continue;

            auto ip = common::ParseIpv4(address->ip);
            if (!ip)
                continue;

            common::NetworkInfo info;
            info.interface = route.interface;
            info.subnet = common::FormatCidr(common::CidrFromAddress(*ip, address->prefix));
            info.gateway_ip = route.gateway;
            info.local_ip = address->ip;
            candidates.push_back(info);
        }
        return candidates;
    }

    std::vector<common::NetworkInfo> LinuxInspector::QueryTopologyFallback()
    {
        return QueryKernelTopology();
    }

    std::vector<ArpEntry> LinuxInspector::ReadArpTable()
    {
        std::ifstream arpFile("/proc/net/arp");
        if (!arpFile.is_open())
            throw std::runtime_error("cannot open /proc/net/arp");

        std::stringstream content;
        content << arpFile.rdbuf();
        return ParseProcNetArp(content.str());
    }

    std::optional<std::string> LinuxInspector::LocalHostname()
    {
        char name[256] = {};
        if (gethostname(name, sizeof(name) - 1) != 0 || name[0] == '\0')
            return std::nullopt;
        return std::string(name);
    }

    bool LinuxInspector::IsElevated()
    {
        return geteuid() == 0;
    }

    std::string LinuxInspector::ElevationInstructions() const
    {
        return "To run with full scan capabilities on Linux:\n"
               "\n"
               "Option 1 - Run as root (not recommended for regular use):\n"
               "$ sudo netscout-agent\n"
               "\n"
               "Option 2 - Grant CAP_NET_RAW capability:\n"
               "$ sudo setcap cap_net_raw+ep /path/to/netscout-agent\n"
               "\n"
               "Option 3 - Ensure the system ping has setuid (usually default):\n"
               "$ ls -la /bin/ping  # Should show '-rwsr-xr-x'\n"
               "\n"
               "The agent uses the system ping command, which typically works\n"
               "without elevation on most Linux distributions.";
    }

    std::vector<std::string> LinuxInspector::PingCommand(const std::string &ip,
                                                         std::chrono::milliseconds timeout) const
    {
        // iputils -W takes whole seconds.
        long seconds = static_cast<long>((timeout.count() + 999) / 1000);
        if (seconds < 1)
            seconds = 1;
        return {"ping", "-c", "1", "-W", std::to_string(seconds), ip};
    }

    std::vector<CommandInspector::HostnameMethod> LinuxInspector::HostnameMethods(const std::string &ip) const
    {
        return {
            {{"getent", "hosts", ip}, ParseGetentHosts, true},
            {{"host", ip}, ParseHostPtr, true},
            {{"avahi-resolve", "-a", ip}, ParseAvahiResolve, true},
        };
    }
}
