#include "Subnet.hpp"

#include <tins/tins.h>
#ifdef _WIN32
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#endif

namespace netscout::common
{
    std::optional<std::uint32_t> ParseIpv4(const std::string &text)
    {
        in_addr addr{};
        if (inet_pton(AF_INET, text.c_str(), &addr) != 1)
            return std::nullopt;
        return ntohl(addr.s_addr);
    }

    std::string FormatIpv4(std::uint32_t address)
    {
        return std::to_string((address >> 24) & 0xFF) + "." +
               std::to_string((address >> 16) & 0xFF) + "." +
               std::to_string((address >> 8) & 0xFF) + "." +
               std::to_string(address & 0xFF);
    }

    bool IsValidIpv4(const std::string &text)
    {
        return ParseIpv4(text).has_value();
    }

    std::uint32_t MaskFromPrefix(std::uint32_t prefix)
    {
        if (prefix == 0)
            return 0;
        if (prefix >= 32)
            return 0xFFFFFFFFu;
        return 0xFFFFFFFFu << (32 - prefix);
    }

    std::optional<std::uint32_t> PrefixFromMask(std::uint32_t mask)
    {
        std::uint32_t prefix = 0;
        while (prefix < 32 && (mask & (0x80000000u >> prefix)))
            ++prefix;
        if (MaskFromPrefix(prefix) != mask)
            return std::nullopt;
        return prefix;
    }

    std::optional<Cidr> ParseCidr(const std::string &text)
    {
        auto slash = text.find('/');
        if (slash == std::string::npos)
            return std::nullopt;

        auto address = ParseIpv4(text.substr(0, slash));
        if (!address)
            return std::nullopt;

        std::string prefixText = text.substr(slash + 1);
        if (prefixText.empty() || prefixText.size() > 2)
            return std::nullopt;
        for (char c : prefixText)
        {
            if (c < '0' || c > '9')
                return std::nullopt;
        }

        std::uint32_t prefix = static_cast<std::uint32_t>(std::stoul(prefixText));
        if (prefix > 32)
            return std::nullopt;

        return CidrFromAddress(*address, prefix);
    }

    std::string FormatCidr(const Cidr &cidr)
    {
        return FormatIpv4(cidr.network) + "/" + std::to_string(cidr.prefix);
    }

    Cidr CidrFromAddress(std::uint32_t address, std::uint32_t prefix)
    {
        Cidr cidr;
        cidr.prefix = prefix;
        cidr.network = address & MaskFromPrefix(prefix);
        return cidr;
    }

    bool IsUsableSubnet(const std::string &text)
    {
        if (text.rfind("0.0.0.0/", 0) == 0)
            return false;
        auto cidr = ParseCidr(text);
        return cidr && cidr->prefix > 0 && cidr->network != 0;
    }

    std::vector<std::string> EnumerateHosts(const Cidr &cidr, std::size_t limit)
    {
        std::vector<std::string> hosts;
        if (cidr.prefix >= 32)
            return hosts;

        std::uint32_t broadcast = cidr.network | ~MaskFromPrefix(cidr.prefix);
        std::uint32_t last = cidr.prefix == 31 ? broadcast : broadcast - 1;

        for (std::uint64_t ip = static_cast<std::uint64_t>(cidr.network) + 1;
             ip <= last && hosts.size() < limit; ++ip)
        {
            hosts.push_back(FormatIpv4(static_cast<std::uint32_t>(ip)));
        }
        return hosts;
    }

    bool IsMulticastOrBroadcast(const std::string &ip)
    {
        auto host = ParseIpv4(ip);
        if (!host)
            return false;
        if ((*host & 0xFF) == 0xFF)
            return true;

        Tins::IPv4Address address(ip);
        return address.is_multicast() || address.is_broadcast();
    }
}
