#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netscout::common
{
    // IPv4 network in host byte order.
    struct Cidr
    {
        std::uint32_t network = 0;
        std::uint32_t prefix = 0;
    };

    // Host byte order. Rejects anything inet_pton rejects.
    std::optional<std::uint32_t> ParseIpv4(const std::string &text);
    std::string FormatIpv4(std::uint32_t address);
    bool IsValidIpv4(const std::string &text);

    std::uint32_t MaskFromPrefix(std::uint32_t prefix);

    // nullopt for a non-contiguous mask.
    std::optional<std::uint32_t> PrefixFromMask(std::uint32_t mask);

    // "a.b.c.d/p". Host bits are masked off.
    std::optional<Cidr> ParseCidr(const std::string &text);
    std::string FormatCidr(const Cidr &cidr);
    Cidr CidrFromAddress(std::uint32_t address, std::uint32_t prefix);

    // True for a parsable subnet that is not 0.0.0.0/x and has a non-zero prefix.
    bool IsUsableSubnet(const std::string &text);

    // Usable host addresses from network+1, at most `limit` of them.
    std::vector<std::string> EnumerateHosts(const Cidr &cidr, std::size_t limit);

    // Multicast (224.0.0.0/4), limited broadcast and any x.x.x.255 address.
    bool IsMulticastOrBroadcast(const std::string &ip);
}
