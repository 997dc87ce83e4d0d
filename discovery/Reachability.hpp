#pragma once

#include "ArpHarvester.hpp"
#include "NetworkInspector.hpp"
#include "../common/Device.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace netscout::discovery
{
    constexpr std::chrono::milliseconds kReachabilityPingTimeout{2000};

    // Ping first; a host that ignores ICMP but sits in the ARP table counts
    // as reachable with 0.0 ms. nullopt means unreachable.
    std::optional<double> CheckReachable(NetworkInspector &inspector, const std::string &ip,
                                         const std::set<std::string> &arp_ips);

    class HealthChecker
    {
    public:
        static constexpr std::size_t kBatchSize = 50;

        HealthChecker(NetworkInspector &inspector, ArpHarvester &arp)
            : m_inspector(inspector), m_arp(arp) {}

        // Checks every device, rewriting its timing in place (unreachable
        // clears it). Reads the ARP table once per run.
        std::vector<common::DeviceHealthResult> Run(std::vector<common::Device> &devices,
                                                    const common::HealthProgressCallback &progress = nullptr);

    private:
        NetworkInspector &m_inspector;
        ArpHarvester &m_arp;
    };
}
