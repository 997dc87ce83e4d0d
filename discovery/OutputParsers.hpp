#pragma once

#include "../common/Device.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Parsers for the text printed by the host's network utilities. None of
// these run anything, so every format can be checked against captured output.
namespace netscout::discovery
{
    enum class PingFlavor
    {
        Unix,
        Windows
    };

    // Windows ping can exit 0 for an unreachable host, so its output is
    // checked for failure phrases and must contain a "reply from" line.
    bool IsPingSuccess(PingFlavor flavor, int exit_code, const std::string &output);

    // "time=1.23 ms", "time=4ms", "time<1ms"
    std::optional<double> ParsePingTime(const std::string &output);

    struct DefaultRoute
    {
        std::string interface;
        std::optional<std::string> gateway;
        int metric = 0;
    };

    // `ip route show default`, ordered by ascending metric.
    std::vector<DefaultRoute> ParseIpRouteDefault(const std::string &output);

    // macOS `route -n get default`
    std::optional<DefaultRoute> ParseRouteGetDefault(const std::string &output);

    struct InterfaceAddress
    {
        std::string ip;
        std::uint32_t prefix = 0;
    };

    // `ip -o -4 addr show dev X`; first non-loopback inet.
    std::optional<InterfaceAddress> ParseIpAddrShow(const std::string &output);

    // `ifconfig X`; netmask may be hex (0xffffff00) or dotted.
    std::optional<InterfaceAddress> ParseIfconfigInet(const std::string &output);

    // Single line "iface|network/prefix|gateway|ip".
    std::optional<common::NetworkInfo> ParsePowerShellTopology(const std::string &output);

    // One entry per adapter with a usable IPv4 address and mask, in output order.
    std::vector<common::NetworkInfo> ParseIpconfig(const std::string &output);

    bool IsVirtualAdapterName(const std::string &name);

    struct ArpEntry
    {
        std::string ip;
        std::string mac;
        bool complete = true;
        std::string interface;
    };

    std::vector<ArpEntry> ParseProcNetArp(const std::string &content);
    std::vector<ArpEntry> ParseBsdArp(const std::string &output);
    std::vector<ArpEntry> ParseWindowsArp(const std::string &output);

    std::optional<std::string> ParseGetentHosts(const std::string &output);
    std::optional<std::string> ParseHostPtr(const std::string &output);
    std::optional<std::string> ParseAvahiResolve(const std::string &output);
    std::optional<std::string> ParseDscacheutil(const std::string &output);
    std::optional<std::string> ParseDigShort(const std::string &output);
    std::optional<std::string> ParseNslookupName(const std::string &output, const std::string &ip);
    std::optional<std::string> ParseNbtstatName(const std::string &output);

    // Rejects empty names, the address itself and reverse-zone names.
    bool IsPlausibleHostname(const std::string &name, const std::string &ip);

    bool ParseWhoamiElevated(const std::string &output);

    std::string Trim(const std::string &text);
    std::string ToLower(std::string text);
}
