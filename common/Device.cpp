#include "Device.hpp"

#include <array>
#include <utility>

namespace netscout::common
{
    namespace
    {
        const std::array<std::pair<DeviceType, const char *>, 11> kDeviceTypeNames = {{
            {DeviceType::Firewall, "firewall"},
            {DeviceType::NetworkDevice, "network_device"},
            {DeviceType::Service, "service"},
            {DeviceType::Server, "server"},
            {DeviceType::Apple, "apple"},
            {DeviceType::Nas, "nas"},
            {DeviceType::Iot, "iot"},
            {DeviceType::Printer, "printer"},
            {DeviceType::Gaming, "gaming"},
            {DeviceType::Mobile, "mobile"},
            {DeviceType::Computer, "computer"},
        }};
    }

    const char *DeviceTypeName(DeviceType type)
    {
        for (const auto &entry : kDeviceTypeNames)
        {
            if (entry.first == type)
                return entry.second;
        }
        return "unknown";
    }

    std::optional<DeviceType> ParseDeviceType(const std::string &name)
    {
        for (const auto &entry : kDeviceTypeNames)
        {
            if (name == entry.second)
                return entry.first;
        }
        return std::nullopt;
    }

    const char *ScanModeName(ScanMode mode)
    {
        return mode == ScanMode::Full ? "full" : "limited";
    }

    const char *ScanStageName(ScanStage stage)
    {
        switch (stage)
        {
        case ScanStage::Starting:
            return "starting";
        case ScanStage::DetectingNetwork:
            return "detecting_network";
        case ScanStage::ReadingArp:
            return "reading_arp";
        case ScanStage::PingSweep:
            return "ping_sweep";
        case ScanStage::ResolvingHostnames:
            return "resolving_hostnames";
        case ScanStage::Complete:
            return "complete";
        case ScanStage::Failed:
            return "failed";
        case ScanStage::PrivilegeRequired:
            return "privilege_required";
        }
        return "unknown";
    }
}
