#include "Uploader.hpp"
#include "../common/Log.hpp"

namespace netscout::monitor
{
    bool LogUploader::UploadScan(const common::ScanResult &result)
    {
        const auto &network = result.network_info;
        common::LogInfo("Upload") << "Scan: " << result.devices.size() << " devices on " << network.subnet
                                  << " via " << network.interface
                                  << " (gateway " << network.gateway_ip.value_or("none")
                                  << ", mode " << common::ScanModeName(result.capabilities.mode) << ")";

        for (const auto &device : result.devices)
        {
            auto line = common::LogDebug("Upload");
            line << "  " << device.ip;
            if (device.mac)
                line << " " << *device.mac;
            if (device.hostname)
                line << " " << *device.hostname;
            if (device.vendor)
                line << " [" << *device.vendor << "]";
            if (device.device_type)
                line << " " << common::DeviceTypeName(*device.device_type);
            if (device.response_time_ms)
                line << " " << *device.response_time_ms << "ms";
        }
        return true;
    }

    bool LogUploader::UploadHealth(const std::vector<common::DeviceHealthResult> &results)
    {
        std::size_t healthy = 0;
        for (const auto &result : results)
        {
            if (result.reachable)
                ++healthy;
        }
        common::LogInfo("Upload") << "Health: " << healthy << "/" << results.size() << " reachable";
        return true;
    }
}
