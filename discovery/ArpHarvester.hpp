#pragma once

#include "NetworkInspector.hpp"
#include "../common/Device.hpp"

#include <set>
#include <string>
#include <vector>

namespace netscout::discovery
{
    class ArpHarvester
    {
    public:
        explicit ArpHarvester(NetworkInspector &inspector) : m_inspector(inspector) {}

        // Validated neighbors, one per IP (first wins). Read failures are
        // logged and give an empty list.
        std::vector<common::Device> ReadArpTable();

        std::set<std::string> ArpTableIps();

        // Drops incomplete, multicast / broadcast and zero or broadcast MAC
        // entries, normalizes MACs and removes repeated IPs.
        static std::vector<common::Device> FilterEntries(const std::vector<ArpEntry> &entries);

    private:
        NetworkInspector &m_inspector;
    };
}
