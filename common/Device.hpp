#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace netscout::common
{
    enum class DeviceType
    {
        Firewall,
        NetworkDevice,
        Service,
        Server,
        Apple,
        Nas,
        Iot,
        Printer,
        Gaming,
        Mobile,
        Computer
    };

    const char *DeviceTypeName(DeviceType type);
    std::optional<DeviceType> ParseDeviceType(const std::string &name);

    struct Device
    {
        std::string ip;
        std::optional<std::string> mac;

        // nullopt = unknown, 0.0 = reachable but untimed, > 0 = measured RTT
        std::optional<double> response_time_ms;

        std::optional<std::string> hostname;
        std::optional<std::string> vendor;
        std::optional<DeviceType> device_type;
    };

    struct NetworkInfo
    {
        std::string interface;
        std::string subnet;
        std::optional<std::string> gateway_ip;
        std::optional<std::string> local_ip;
    };

    enum class ScanMode
    {
        Full,
        Limited
    };

    const char *ScanModeName(ScanMode mode);

    struct ScanCapabilities
    {
        ScanMode mode = ScanMode::Full;
        bool can_ping = true;
        bool can_read_arp = true;
        bool can_resolve_hostnames = true;
        bool is_elevated = false;
        std::optional<std::string> warning;
        std::optional<std::string> elevation_instructions;
    };

    struct ScanResult
    {
        std::vector<Device> devices;
        NetworkInfo network_info;
        ScanCapabilities capabilities;
        bool cancelled = false;
    };

    enum class ScanStage
    {
        Starting,
        DetectingNetwork,
        ReadingArp,
        PingSweep,
        ResolvingHostnames,
        Complete,
        Failed,
        PrivilegeRequired
    };

    const char *ScanStageName(ScanStage stage);

    struct ScanProgress
    {
        ScanStage stage = ScanStage::Starting;
        std::string message;
        std::optional<std::uint8_t> percent;
        std::optional<std::size_t> devices_found;
        double elapsed_secs = 0.0;
    };

    using ProgressCallback = std::function<void(const ScanProgress &progress)>;

    struct DeviceHealthResult
    {
        std::string ip;
        bool reachable = false;
        std::optional<double> response_time_ms;
    };

    enum class HealthCheckStage
    {
        Starting,
        CheckingDevices,
        Uploading,
        Complete
    };

    struct HealthCheckProgress
    {
        HealthCheckStage stage = HealthCheckStage::Starting;
        std::string message;
        std::size_t total_devices = 0;
        std::size_t checked_devices = 0;
        std::size_t healthy_devices = 0;
    };

    using HealthProgressCallback = std::function<void(const HealthCheckProgress &progress)>;
}
