#include "NetworkInspector.hpp"
#include "../common/Log.hpp"
#include "../common/Subnet.hpp"

#include <tins/tins.h>
#include <algorithm>

namespace netscout::discovery
{
    namespace
    {
        std::optional<common::NetworkInfo> DescribeInterface(const std::string &name,
                                                             const Tins::IPv4Address &gateway)
        {
            Tins::NetworkInterface iface(name);
            Tins::NetworkInterface::Info info = iface.info();

            auto ip = common::ParseIpv4(info.ip_addr.to_string());
            auto mask = common::ParseIpv4(info.netmask.to_string());
            if (!ip || !mask || *ip == 0)
                return std::nullopt;

            auto prefix = common::PrefixFromMask(*mask);
            if (!prefix)
                return std::nullopt;

            common::NetworkInfo network;
            network.interface = name;
            network.subnet = common::FormatCidr(common::CidrFromAddress(*ip, *prefix));
            network.local_ip = info.ip_addr.to_string();
            if (static_cast<uint32_t>(gateway) != 0)
                network.gateway_ip = gateway.to_string();
            return network;
        }
    }

    std::vector<common::NetworkInfo> QueryKernelTopology()
    {
        std::vector<common::NetworkInfo> candidates;
        try
        {
            std::vector<Tins::Utils::RouteEntry> routes = Tins::Utils::route_entries();
            std::vector<Tins::Utils::RouteEntry> defaults;
            for (const auto &entry : routes)
            {
                if (static_cast<uint32_t>(entry.destination) == 0 &&
                    static_cast<uint32_t>(entry.mask) == 0)
                    defaults.push_back(entry);
            }

            std::stable_sort(defaults.begin(), defaults.end(),
                             [](const Tins::Utils::RouteEntry &a, const Tins::Utils::RouteEntry &b)
                             { return a.metric < b.metric; });

            for (const auto &entry : defaults)
            {
                try
                {
                    auto network = DescribeInterface(entry.interface, entry.gateway);
                    if (network)
                        candidates.push_back(*network);
                }
                catch (const std::exception &e)
                {
                    common::LogDebug("Topology") << "Skipping " << entry.interface << ": " << e.what();
                }
            }

            if (candidates.empty())
            {
                Tins::NetworkInterface iface = Tins::NetworkInterface::default_interface();
                auto network = DescribeInterface(iface.name(), Tins::IPv4Address());
                if (network)
                    candidates.push_back(*network);
            }
        }
        catch (const std::exception &e)
        {
            common::LogWarn("Topology") << "Kernel route query failed: " << e.what();
        }
        return candidates;
    }
}
