#include "OutputParsers.hpp"
#include "../common/Subnet.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace netscout::discovery
{
    namespace
    {
        std::vector<std::string> SplitLines(const std::string &text)
        {
            std::vector<std::string> lines;
            std::istringstream ss(text);
            std::string line;
            while (std::getline(ss, line))
            {
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                lines.push_back(line);
            }
            return lines;
        }

        std::vector<std::string> Tokens(const std::string &line)
        {
            std::vector<std::string> tokens;
            std::istringstream ss(line);
            std::string token;
            while (ss >> token)
                tokens.push_back(token);
            return tokens;
        }

        bool StartsWith(const std::string &text, const std::string &prefix)
        {
            return text.compare(0, prefix.size(), prefix) == 0;
        }

        bool Contains(const std::string &text, const std::string &needle)
        {
            return text.find(needle) != std::string::npos;
        }

        std::string StripTrailingDot(std::string name)
        {
            while (!name.empty() && name.back() == '.')
                name.pop_back();
            return name;
        }

        std::optional<std::string> SecondToken(const std::string &output)
        {
            for (const auto &line : SplitLines(output))
            {
                auto tokens = Tokens(line);
                if (tokens.size() >= 2)
                    return StripTrailingDot(tokens[1]);
            }
            return std::nullopt;
        }

        // Value after the first ':' on an ipconfig / route line.
        std::string ValueAfterColon(const std::string &line)
        {
            auto pos = line.find(':');
            if (pos == std::string::npos)
                return "";
            return Trim(line.substr(pos + 1));
        }

        // macOS prints "0:1b:2c:..." with leading zeros dropped.
        std::string PadMacOctets(const std::string &mac)
        {
            std::vector<std::string> parts;
            std::string part;
            std::istringstream ss(mac);
            while (std::getline(ss, part, ':'))
                parts.push_back(part);

            if (parts.size() != 6)
                return mac;

            std::string padded;
            for (size_t i = 0; i < parts.size(); ++i)
            {
                if (parts[i].empty() || parts[i].size() > 2)
                    return mac;
                if (i)
                    padded += ':';
                if (parts[i].size() == 1)
                    padded += '0';
                padded += parts[i];
            }
            return padded;
        }
    }

    std::string Trim(const std::string &text)
    {
        size_t begin = 0;
        size_t end = text.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
            ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
            --end;
        return text.substr(begin, end - begin);
    }

    std::string ToLower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    bool IsPingSuccess(PingFlavor flavor, int exit_code, const std::string &output)
    {
        std::string lower = ToLower(output);

        if (flavor == PingFlavor::Windows)
        {
            static const char *failures[] = {
                "request timed out",
                "destination host unreachable",
                "transmit failed",
                "general failure"};
            for (const char *phrase : failures)
            {
                if (Contains(lower, phrase))
                    return false;
            }
            if (exit_code != 0)
                return false;
            return Contains(lower, "reply from");
        }

        if (exit_code != 0)
            return false;
        return !Contains(lower, "100% packet loss") && !Contains(lower, "100.0% packet loss");
    }

    std::optional<double> ParsePingTime(const std::string &output)
    {
        for (const auto &word : Tokens(output))
        {
            if (!StartsWith(word, "time=") && !StartsWith(word, "time<"))
                continue;

            std::string value = word.substr(5);
            if (value.size() >= 2 && value.compare(value.size() - 2, 2, "ms") == 0)
                value.erase(value.size() - 2);
            if (value.empty())
                continue;

            char *end = nullptr;
            double ms = std::strtod(value.c_str(), &end);
            if (end && *end == '\0')
                return ms;
        }
        return std::nullopt;
    }

    std::vector<DefaultRoute> ParseIpRouteDefault(const std::string &output)
    {
        std::vector<DefaultRoute> routes;
        for (const auto &line : SplitLines(output))
        {
            auto tokens = Tokens(line);
            if (tokens.empty() || tokens[0] != "default")
                continue;

            DefaultRoute route;
            for (size_t i = 1; i + 1 < tokens.size(); ++i)
            {
                if (tokens[i] == "via" && common::IsValidIpv4(tokens[i + 1]))
                    route.gateway = tokens[i + 1];
                else if (tokens[i] == "dev")
                    route.interface = tokens[i + 1];
                else if (tokens[i] == "metric")
                    route.metric = std::atoi(tokens[i + 1].c_str());
            }

            if (!route.interface.empty())
                routes.push_back(route);
        }

        std::stable_sort(routes.begin(), routes.end(),
                         [](const DefaultRoute &a, const DefaultRoute &b)
                         { return a.metric < b.metric; });
        return routes;
    }

    std::optional<DefaultRoute> ParseRouteGetDefault(const std::string &output)
    {
        DefaultRoute route;
        for (const auto &line : SplitLines(output))
        {
            std::string trimmed = Trim(line);
            if (StartsWith(trimmed, "gateway:"))
            {
                std::string gateway = ValueAfterColon(trimmed);
                if (common::IsValidIpv4(gateway))
                    route.gateway = gateway;
            }
            else if (StartsWith(trimmed, "interface:"))
            {
                route.interface = ValueAfterColon(trimmed);
            }
        }

        if (route.interface.empty())
            return std::nullopt;
        return route;
    }

    std::optional<InterfaceAddress> ParseIpAddrShow(const std::string &output)
    {
        for (const auto &line : SplitLines(output))
        {
            auto tokens = Tokens(line);
            for (size_t i = 0; i + 1 < tokens.size(); ++i)
            {
                if (tokens[i] != "inet")
                    continue;

                const std::string &cidrText = tokens[i + 1];
                auto slash = cidrText.find('/');
                if (slash == std::string::npos)
                    continue;

                std::string ip = cidrText.substr(0, slash);
                auto cidr = common::ParseCidr(cidrText);
                if (!cidr || StartsWith(ip, "127."))
                    continue;

                return InterfaceAddress{ip, cidr->prefix};
            }
        }
        return std::nullopt;
    }

    std::optional<InterfaceAddress> ParseIfconfigInet(const std::string &output)
    {
        for (const auto &line : SplitLines(output))
        {
            auto tokens = Tokens(line);
            if (tokens.size() < 4 || tokens[0] != "inet")
                continue;

            const std::string &ip = tokens[1];
            if (!common::IsValidIpv4(ip) || StartsWith(ip, "127."))
                continue;

            for (size_t i = 2; i + 1 < tokens.size(); ++i)
            {
                if (tokens[i] != "netmask")
                    continue;

                const std::string &maskText = tokens[i + 1];
                std::optional<std::uint32_t> mask;
                if (StartsWith(maskText, "0x"))
                {
                    char *end = nullptr;
                    unsigned long value = std::strtoul(maskText.c_str() + 2, &end, 16);
                    if (end && *end == '\0')
                        mask = static_cast<std::uint32_t>(value);
                }
                else
                {
                    mask = common::ParseIpv4(maskText);
                }

                if (!mask)
                    break;
                auto prefix = common::PrefixFromMask(*mask);
                if (!prefix)
                    break;
                return InterfaceAddress{ip, *prefix};
            }
        }
        return std::nullopt;
    }

    std::optional<common::NetworkInfo> ParsePowerShellTopology(const std::string &output)
    {
        for (const auto &line : SplitLines(output))
        {
            std::string trimmed = Trim(line);
            if (trimmed.find('|') == std::string::npos)
                continue;

            std::vector<std::string> parts;
            std::string part;
            std::istringstream ss(trimmed);
            while (std::getline(ss, part, '|'))
                parts.push_back(Trim(part));

            if (parts.size() < 2 || parts[0].empty() || parts[1].empty())
                continue;

            common::NetworkInfo info;
            info.interface = parts[0];
            info.subnet = parts[1];
            if (parts.size() > 2 && !parts[2].empty())
                info.gateway_ip = parts[2];
            if (parts.size() > 3 && !parts[3].empty())
                info.local_ip = parts[3];
            return info;
        }
        return std::nullopt;
    }

    std::vector<common::NetworkInfo> ParseIpconfig(const std::string &output)
    {
        struct Adapter
        {
            std::string name;
            std::optional<std::uint32_t> ip;
            std::optional<std::uint32_t> mask;
            std::optional<std::string> gateway;
        };

        std::vector<common::NetworkInfo> result;
        std::optional<Adapter> current;
        bool inGateway = false;

        auto flush = [&]()
        {
            if (!current || !current->ip || !current->mask)
                return;
            auto prefix = common::PrefixFromMask(*current->mask);
            if (!prefix || *prefix == 0)
                return;

            common::NetworkInfo info;
            info.interface = current->name;
            info.subnet = common::FormatCidr(common::CidrFromAddress(*current->ip, *prefix));
            info.gateway_ip = current->gateway;
            info.local_ip = common::FormatIpv4(*current->ip);
            result.push_back(info);
        };

        for (const auto &line : SplitLines(output))
        {
            std::string trimmed = Trim(line);
            if (trimmed.empty())
                continue;

            bool indented = std::isspace(static_cast<unsigned char>(line[0]));
            if (!indented && trimmed.back() == ':' && Contains(trimmed, "adapter "))
            {
                flush();
                current = Adapter{};
                std::string header = trimmed.substr(0, trimmed.size() - 1);
                current->name = header.substr(header.find("adapter ") + 8);
                inGateway = false;
                continue;
            }
            if (!current)
                continue;

            if (StartsWith(trimmed, "IPv4 Address") || StartsWith(trimmed, "IP Address"))
            {
                std::string value = ValueAfterColon(trimmed);
                value = value.substr(0, value.find('('));
                auto ip = common::ParseIpv4(value);
                if (ip && !StartsWith(value, "127.") && !StartsWith(value, "169.254."))
                    current->ip = ip;
                inGateway = false;
            }
            else if (StartsWith(trimmed, "Subnet Mask"))
            {
                current->mask = common::ParseIpv4(ValueAfterColon(trimmed));
                inGateway = false;
            }
            else if (StartsWith(trimmed, "Default Gateway"))
            {
                std::string value = ValueAfterColon(trimmed);
                if (common::IsValidIpv4(value))
                    current->gateway = value;
                inGateway = true;
            }
            else if (inGateway && trimmed.find(':') == std::string::npos)
            {
                // Continuation line under "Default Gateway", typically the IPv4 after an IPv6 one.
                if (!current->gateway && common::IsValidIpv4(trimmed))
                    current->gateway = trimmed;
            }
            else
            {
                inGateway = false;
            }
        }
        flush();
        return result;
    }

    bool IsVirtualAdapterName(const std::string &name)
    {
        static const char *containsPatterns[] = {
            "vethernet", "wsl", "hyper-v", "virtualbox", "vmware",
            "docker", "loopback", "tailscale"};
        static const char *prefixPatterns[] = {
            "docker", "br-", "veth", "virbr", "vmnet", "vboxnet", "tun",
            "tap", "wg", "zt", "utun", "lxc"};

        std::string lower = ToLower(name);
        // "lo", "lo0"; not "Local Area Connection"
        if (lower == "lo" || (lower.size() > 2 && StartsWith(lower, "lo") &&
                              std::isdigit(static_cast<unsigned char>(lower[2]))))
            return true;
        for (const char *pattern : containsPatterns)
        {
            if (Contains(lower, pattern))
                return true;
        }
        for (const char *pattern : prefixPatterns)
        {
            if (StartsWith(lower, pattern))
                return true;
        }
        return false;
    }

    std::vector<ArpEntry> ParseProcNetArp(const std::string &content)
    {
        std::vector<ArpEntry> entries;
        auto lines = SplitLines(content);
        for (size_t i = 1; i < lines.size(); ++i)
        {
            auto tokens = Tokens(lines[i]);
            if (tokens.size() < 6)
                continue;

            ArpEntry entry;
            entry.ip = tokens[0];
            entry.mac = tokens[3];
            entry.interface = tokens[5];
            entry.complete = std::strtoul(tokens[2].c_str(), nullptr, 16) != 0;
            entries.push_back(entry);
        }
        return entries;
    }

    std::vector<ArpEntry> ParseBsdArp(const std::string &output)
    {
        std::vector<ArpEntry> entries;
        for (const auto &line : SplitLines(output))
        {
            auto open = line.find('(');
            auto close = line.find(')', open == std::string::npos ? 0 : open);
            auto at = line.find(" at ");
            if (open == std::string::npos || close == std::string::npos || at == std::string::npos)
                continue;

            ArpEntry entry;
            entry.ip = line.substr(open + 1, close - open - 1);

            auto afterAt = Tokens(line.substr(at + 4));
            if (afterAt.empty())
                continue;
            if (afterAt[0] == "(incomplete)")
            {
                entry.complete = false;
            }
            else
            {
                entry.mac = PadMacOctets(afterAt[0]);
            }

            for (size_t i = 0; i + 1 < afterAt.size(); ++i)
            {
                if (afterAt[i] == "on")
                {
                    entry.interface = afterAt[i + 1];
                    break;
                }
            }
            entries.push_back(entry);
        }
        return entries;
    }

    std::vector<ArpEntry> ParseWindowsArp(const std::string &output)
    {
        std::vector<ArpEntry> entries;
        std::string currentInterface;
        for (const auto &line : SplitLines(output))
        {
            std::string trimmed = Trim(line);
            if (trimmed.empty() || Contains(trimmed, "Internet Address"))
                continue;

            auto tokens = Tokens(trimmed);
            if (StartsWith(trimmed, "Interface:"))
            {
                if (tokens.size() >= 2)
                    currentInterface = tokens[1];
                continue;
            }
            if (tokens.size() < 2 || !common::IsValidIpv4(tokens[0]))
                continue;

            std::string mac = tokens[1];
            if (mac.size() != 17 || mac.find('-') == std::string::npos)
                continue;
            std::replace(mac.begin(), mac.end(), '-', ':');

            ArpEntry entry;
            entry.ip = tokens[0];
            entry.mac = mac;
            entry.interface = currentInterface;
            entries.push_back(entry);
        }
        return entries;
    }

    std::optional<std::string> ParseGetentHosts(const std::string &output)
    {
        return SecondToken(output);
    }

    std::optional<std::string> ParseHostPtr(const std::string &output)
    {
        for (const auto &line : SplitLines(output))
        {
            auto pos = line.find("pointer");
            if (pos == std::string::npos)
                continue;
            auto tokens = Tokens(line.substr(pos + 7));
            if (!tokens.empty())
                return StripTrailingDot(tokens[0]);
        }
        return std::nullopt;
    }

    std::optional<std::string> ParseAvahiResolve(const std::string &output)
    {
        return SecondToken(output);
    }

    std::optional<std::string> ParseDscacheutil(const std::string &output)
    {
        for (const auto &line : SplitLines(output))
        {
            std::string trimmed = Trim(line);
            if (StartsWith(trimmed, "name:"))
            {
                std::string name = StripTrailingDot(Trim(trimmed.substr(5)));
                if (!name.empty())
                    return name;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> ParseDigShort(const std::string &output)
    {
        for (const auto &line : SplitLines(output))
        {
            std::string trimmed = Trim(line);
            if (trimmed.empty() || trimmed[0] == ';')
                continue;
            auto tokens = Tokens(trimmed);
            if (tokens.size() == 1)
                return StripTrailingDot(tokens[0]);
        }
        return std::nullopt;
    }

    std::optional<std::string> ParseNslookupName(const std::string &output, const std::string &ip)
    {
        for (const auto &line : SplitLines(output))
        {
            std::string trimmed = Trim(line);
            if (!StartsWith(trimmed, "Name:"))
                continue;
            std::string name = StripTrailingDot(Trim(trimmed.substr(5)));
            if (!name.empty() && !Contains(name, ip))
                return name;
        }
        return std::nullopt;
    }

    std::optional<std::string> ParseNbtstatName(const std::string &output)
    {
        for (const auto &line : SplitLines(output))
        {
            if (!Contains(line, "<00>") || !Contains(line, "UNIQUE"))
                continue;
            auto tokens = Tokens(line);
            if (!tokens.empty())
                return tokens[0];
        }
        return std::nullopt;
    }

    bool IsPlausibleHostname(const std::string &name, const std::string &ip)
    {
        if (name.empty() || name.size() > 253 || name == ip)
            return false;
        if (common::IsValidIpv4(name))
            return false;

        std::string lower = ToLower(name);
        const std::string reverseZone = "in-addr.arpa";
        if (lower.size() >= reverseZone.size() &&
            lower.compare(lower.size() - reverseZone.size(), reverseZone.size(), reverseZone) == 0)
            return false;

        for (char c : name)
        {
            if (std::isspace(static_cast<unsigned char>(c)) || c == ';')
                return false;
        }
        return true;
    }

    bool ParseWhoamiElevated(const std::string &output)
    {
        return Contains(output, "S-1-16-12288") || Contains(output, "High Mandatory Level");
    }
}
