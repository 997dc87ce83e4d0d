#include "ArpHarvester.hpp"
#include "VendorClassifier.hpp"
#include "../common/Log.hpp"
#include "../common/Subnet.hpp"

#include <tins/tins.h>
#include <cctype>

namespace netscout::discovery
{
    namespace
    {
        // Full six-octet address, unlike NormalizeMac which also accepts OUI fragments.
        bool IsCompleteMac(const std::string &mac)
        {
            size_t digits = 0;
            for (char c : mac)
            {
                if (c == ':' || c == '-' || c == '.')
                    continue;
                if (!std::isxdigit(static_cast<unsigned char>(c)))
                    return false;
                ++digits;
            }
            return digits == 12;
        }
    }

    std::vector<common::Device> ArpHarvester::FilterEntries(const std::vector<ArpEntry> &entries)
    {
        std::vector<common::Device> devices;
        std::set<std::string> seen;

        for (const auto &entry : entries)
        {
            if (!entry.complete || !common::IsValidIpv4(entry.ip))
                continue;
            if (common::IsMulticastOrBroadcast(entry.ip))
                continue;
            if (!IsCompleteMac(entry.mac))
                continue;

            auto mac = NormalizeMac(entry.mac);
            if (!mac)
                continue;

            Tins::HWAddress<6> hw(*mac);
            if (hw == Tins::HWAddress<6>() || hw.is_broadcast())
                continue;

            if (!seen.insert(entry.ip).second)
                continue;

            common::Device device;
            device.ip = entry.ip;
            device.mac = *mac;
            devices.push_back(device);
        }
        return devices;
    }

    std::vector<common::Device> ArpHarvester::ReadArpTable()
    {
        try
        {
            auto devices = FilterEntries(m_inspector.ReadArpTable());
            common::LogDebug("ARP") << devices.size() << " neighbors in ARP table";
            return devices;
        }
        catch (const std::exception &e)
        {
            common::LogWarn("ARP") << "Failed to read ARP table: " << e.what();
            return {};
        }
    }

    std::set<std::string> ArpHarvester::ArpTableIps()
    {
        std::set<std::string> ips;
        for (const auto &device : ReadArpTable())
            ips.insert(device.ip);
        return ips;
    }
}
