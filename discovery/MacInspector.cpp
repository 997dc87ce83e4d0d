#include "MacInspector.hpp"
#include "CommandRunner.hpp"
#include "../common/Log.hpp"
#include "../common/Subnet.hpp"

#include <stdexcept>
#include <unistd.h>

namespace netscout::discovery
{
    namespace
    {
        constexpr std::chrono::milliseconds kRouteTimeout{3000};
    }

    std::vector<common::NetworkInfo> MacInspector::QueryTopology()
    {
        std::vector<common::NetworkInfo> candidates;

        CommandResult route = RunCommand({"route", "-n", "get", "default"}, kRouteTimeout);
        if (!route.Succeeded())
        {
            common::LogWarn("Topology") << "route get default failed (exit " << route.exit_code << ")";
            return candidates;
        }

        auto defaultRoute = ParseRouteGetDefault(route.output);
        if (!defaultRoute)
            return candidates;

        CommandResult ifconfig = RunCommand({"ifconfig", defaultRoute->interface}, kRouteTimeout);
        if (!ifconfig.Succeeded())
            return candidates;

        auto address = ParseIfconfigInet(ifconfig.output);
        if (!address)
            return candidates;

        auto ip = common::ParseIpv4(address->ip);
        if (!ip)
            return candidates;

        common::NetworkInfo info;
        info.interface = defaultRoute->interface;
        info.subnet = common::FormatCidr(common::CidrFromAddress(*ip, address->prefix));
        info.gateway_ip = defaultRoute->gateway;
        info.local_ip = address->ip;
        candidates.push_back(info);
        return candidates;
    }

    std::vector<common::NetworkInfo> MacInspector::QueryTopologyFallback()
    {
        return QueryKernelTopology();
    }

    std::vector<ArpEntry> MacInspector::ReadArpTable()
    {
        CommandResult result = RunCommand({"arp", "-a", "-n"}, std::chrono::milliseconds(5000));
        if (!result.started || result.timed_out)
            throw std::runtime_error("arp -a -n did not complete");
        return ParseBsdArp(result.output);
    }

    std::optional<std::string> MacInspector::LocalHostname()
    {
        char name[256] = {};
        if (gethostname(name, sizeof(name) - 1) != 0 || name[0] == '\0')
            return std::nullopt;
        return std::string(name);
    }

    bool MacInspector::IsElevated()
    {
        return geteuid() == 0;
    }

    std::string MacInspector::ElevationInstructions() const
    {
        return "To run with full scan capabilities on macOS:\n"
               "\n"
               "Option 1 - Run as root (not recommended for regular use):\n"
               "$ sudo netscout-agent\n"
               "\n"
               "Note: Most scan features work without root on macOS.\n"
               "If you're experiencing issues, check System Settings > Privacy & Security\n"
               "to ensure the agent has the necessary permissions.";
    }

    std::vector<std::string> MacInspector::PingCommand(const std::string &ip,
                                                       std::chrono::milliseconds timeout) const
    {
        // BSD ping -W is in milliseconds.
        return {"ping", "-c", "1", "-W", std::to_string(timeout.count()), ip};
    }

    std::vector<CommandInspector::HostnameMethod> MacInspector::HostnameMethods(const std::string &ip) const
    {
        return {
            {{"dscacheutil", "-q", "host", "-a", "ip_address", ip}, ParseDscacheutil, true},
            {{"host", ip}, ParseHostPtr, true},
            {{"dig", "-x", ip, "@224.0.0.251", "-p", "5353", "+short", "+time=1", "+tries=1"},
             ParseDigShort, true},
        };
    }
}
