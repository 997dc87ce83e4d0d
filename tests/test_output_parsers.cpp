#include <catch2/catch.hpp>

#include "../discovery/OutputParsers.hpp"

using namespace netscout::discovery;

TEST_CASE("Ping output is judged per platform", "[parsers][ping]")
{
    SECTION("unix reply with time")
    {
        std::string out =
            "PING 192.168.1.1 (192.168.1.1) 56(84) bytes of data.\n"
            "64 bytes from 192.168.1.1: icmp_seq=1 ttl=64 time=1.23 ms\n"
            "\n"
            "--- 192.168.1.1 ping statistics ---\n"
            "1 packets transmitted, 1 received, 0% packet loss, time 0ms\n";
        REQUIRE(IsPingSuccess(PingFlavor::Unix, 0, out));
        auto time = ParsePingTime(out);
        REQUIRE(time);
        REQUIRE(*time == Approx(1.23));
    }

    SECTION("unix total loss")
    {
        std::string out = "1 packets transmitted, 0 received, 100% packet loss, time 0ms\n";
        REQUIRE_FALSE(IsPingSuccess(PingFlavor::Unix, 1, out));
        REQUIRE_FALSE(IsPingSuccess(PingFlavor::Unix, 0, out));
    }

    SECTION("windows sub-millisecond reply")
    {
        std::string out =
            "Pinging 192.168.1.1 with 32 bytes of data:\r\n"
            "Reply from 192.168.1.1: bytes=32 time<1ms TTL=64\r\n";
        REQUIRE(IsPingSuccess(PingFlavor::Windows, 0, out));
        REQUIRE(ParsePingTime(out) == 1.0);
    }

    SECTION("windows unreachable exits zero but fails")
    {
        std::string out = "Reply from 192.168.1.42: Destination host unreachable.\r\n";
        REQUIRE_FALSE(IsPingSuccess(PingFlavor::Windows, 0, out));
        REQUIRE_FALSE(IsPingSuccess(PingFlavor::Windows, 0, "Request timed out.\r\n"));
    }

    SECTION("no time field")
    {
        REQUIRE_FALSE(ParsePingTime("nothing useful here"));
    }
}

TEST_CASE("Default routes are ordered by metric", "[parsers][route]")
{
    std::string out =
        "default via 192.168.1.1 dev eth0 proto dhcp metric 100\n"
        "default via 10.0.0.1 dev wlan0 proto dhcp metric 50\n"
        "default dev tun0 scope link\n";

    auto routes = ParseIpRouteDefault(out);
    REQUIRE(routes.size() == 3);
    REQUIRE(routes[0].interface == "tun0");
    REQUIRE_FALSE(routes[0].gateway);
    REQUIRE(routes[1].interface == "wlan0");
    REQUIRE(routes[1].gateway == std::string("10.0.0.1"));
    REQUIRE(routes[2].interface == "eth0");
    REQUIRE(routes[2].metric == 100);
}

TEST_CASE("macOS route get default", "[parsers][route]")
{
    std::string out =
        "   route to: default\n"
        "destination: default\n"
        "       mask: default\n"
        "    gateway: 192.168.1.1\n"
        "  interface: en0\n"
        "      flags: <UP,GATEWAY,DONE,STATIC,PRCLONING>\n";

    auto route = ParseRouteGetDefault(out);
    REQUIRE(route);
    REQUIRE(route->interface == "en0");
    REQUIRE(route->gateway == std::string("192.168.1.1"));

    REQUIRE_FALSE(ParseRouteGetDefault("route: writing to routing socket: not in table\n"));
}

TEST_CASE("Interface addresses", "[parsers][address]")
{
    SECTION("ip addr show")
    {
        std::string out = "2: eth0    inet 192.168.1.50/24 brd 192.168.1.255 scope global dynamic eth0\n";
        auto address = ParseIpAddrShow(out);
        REQUIRE(address);
        REQUIRE(address->ip == "192.168.1.50");
        REQUIRE(address->prefix == 24);
    }

    SECTION("ifconfig hex netmask")
    {
        std::string out =
            "en0: flags=8863<UP,BROADCAST,SMART,RUNNING,SIMPLEX,MULTICAST> mtu 1500\n"
            "\tinet 127.0.0.1 netmask 0xff000000\n"
            "\tinet 192.168.1.23 netmask 0xffffff00 broadcast 192.168.1.255\n";
        auto address = ParseIfconfigInet(out);
        REQUIRE(address);
        REQUIRE(address->ip == "192.168.1.23");
        REQUIRE(address->prefix == 24);
    }

    SECTION("ifconfig dotted netmask")
    {
        std::string out = "        inet 10.0.5.7  netmask 255.255.0.0  broadcast 10.0.255.255\n";
        auto address = ParseIfconfigInet(out);
        REQUIRE(address);
        REQUIRE(address->prefix == 16);
    }
}

TEST_CASE("Windows topology output", "[parsers][windows]")
{
    SECTION("powershell single line")
    {
        auto info = ParsePowerShellTopology("Ethernet|192.168.1.0/24|192.168.1.1|192.168.1.42\r\n");
        REQUIRE(info);
        REQUIRE(info->interface == "Ethernet");
        REQUIRE(info->subnet == "192.168.1.0/24");
        REQUIRE(info->gateway_ip == std::string("192.168.1.1"));
        REQUIRE(info->local_ip == std::string("192.168.1.42"));

        auto noGateway = ParsePowerShellTopology("Wi-Fi|10.0.0.0/8||10.1.2.3");
        REQUIRE(noGateway);
        REQUIRE_FALSE(noGateway->gateway_ip);

        REQUIRE_FALSE(ParsePowerShellTopology(""));
    }

    SECTION("ipconfig with IPv6 gateway first")
    {
        std::string out =
            "Windows IP Configuration\r\n"
            "\r\n"
            "Ethernet adapter Ethernet:\r\n"
            "\r\n"
            "   Connection-specific DNS Suffix  . : lan\r\n"
            "   IPv4 Address. . . . . . . . . . . : 192.168.1.42(Preferred)\r\n"
            "   Subnet Mask . . . . . . . . . . . : 255.255.255.0\r\n"
            "   Default Gateway . . . . . . . . . : fe80::1%12\r\n"
            "                                       192.168.1.1\r\n"
            "\r\n"
            "Wireless LAN adapter Wi-Fi:\r\n"
            "\r\n"
            "   Media State . . . . . . . . . . . : Media disconnected\r\n";

        auto adapters = ParseIpconfig(out);
        REQUIRE(adapters.size() == 1);
        REQUIRE(adapters[0].interface == "Ethernet");
        REQUIRE(adapters[0].subnet == "192.168.1.0/24");
        REQUIRE(adapters[0].gateway_ip == std::string("192.168.1.1"));
        REQUIRE(adapters[0].local_ip == std::string("192.168.1.42"));
    }
}

TEST_CASE("Virtual adapter names", "[parsers][adapters]")
{
    REQUIRE(IsVirtualAdapterName("docker0"));
    REQUIRE(IsVirtualAdapterName("vEthernet (WSL)"));
    REQUIRE(IsVirtualAdapterName("br-3f2a1b"));
    REQUIRE(IsVirtualAdapterName("utun3"));
    REQUIRE(IsVirtualAdapterName("lo"));
    REQUIRE(IsVirtualAdapterName("lo0"));

    REQUIRE_FALSE(IsVirtualAdapterName("eth0"));
    REQUIRE_FALSE(IsVirtualAdapterName("en0"));
    REQUIRE_FALSE(IsVirtualAdapterName("wlan0"));
    REQUIRE_FALSE(IsVirtualAdapterName("Ethernet"));
    REQUIRE_FALSE(IsVirtualAdapterName("Local Area Connection"));
}

TEST_CASE("Neighbor tables", "[parsers][arp]")
{
    SECTION("/proc/net/arp")
    {
        std::string content =
            "IP address       HW type     Flags       HW address            Mask     Device\n"
            "192.168.1.1      0x1         0x2         aa:bb:cc:dd:ee:ff     *        eth0\n"
            "192.168.1.9      0x1         0x0         00:00:00:00:00:00     *        eth0\n";

        auto entries = ParseProcNetArp(content);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].ip == "192.168.1.1");
        REQUIRE(entries[0].mac == "aa:bb:cc:dd:ee:ff");
        REQUIRE(entries[0].interface == "eth0");
        REQUIRE(entries[0].complete);
        REQUIRE_FALSE(entries[1].complete);
    }

    SECTION("bsd arp -an")
    {
        std::string out =
            "? (192.168.1.1) at 0:1b:2c:d:e:f on en0 ifscope [ethernet]\n"
            "? (192.168.1.7) at (incomplete) on en0 ifscope [ethernet]\n";

        auto entries = ParseBsdArp(out);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].mac == "00:1b:2c:0d:0e:0f");
        REQUIRE(entries[0].interface == "en0");
        REQUIRE(entries[1].ip == "192.168.1.7");
        REQUIRE_FALSE(entries[1].complete);
    }

    SECTION("windows arp -a")
    {
        std::string out =
            "\r\n"
            "Interface: 192.168.1.42 --- 0xb\r\n"
            "  Internet Address      Physical Address      Type\r\n"
            "  192.168.1.1           aa-bb-cc-dd-ee-ff     dynamic\r\n"
            "  192.168.1.255         ff-ff-ff-ff-ff-ff     static\r\n";

        auto entries = ParseWindowsArp(out);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].ip == "192.168.1.1");
        REQUIRE(entries[0].mac == "aa:bb:cc:dd:ee:ff");
        REQUIRE(entries[0].interface == "192.168.1.42");
    }
}

TEST_CASE("Hostname tool output", "[parsers][hostname]")
{
    REQUIRE(ParseGetentHosts("192.168.1.5     printer.lan\n") == std::string("printer.lan"));
    REQUIRE(ParseHostPtr("5.1.168.192.in-addr.arpa domain name pointer printer.lan.\n") ==
            std::string("printer.lan"));
    REQUIRE(ParseAvahiResolve("192.168.1.5\tprinter.local\n") == std::string("printer.local"));
    REQUIRE(ParseDscacheutil("name: printer.lan\nip_address: 192.168.1.5\n") == std::string("printer.lan"));
    REQUIRE(ParseDigShort("printer.lan.\n") == std::string("printer.lan"));
    REQUIRE_FALSE(ParseDigShort(";; connection timed out; no servers could be reached\n"));
    REQUIRE(ParseNbtstatName("    PRINTER        <00>  UNIQUE      Registered\n") == std::string("PRINTER"));

    std::string nslookup =
        "Server:  router.lan\r\n"
        "Address:  192.168.1.1\r\n"
        "\r\n"
        "Name:    printer.lan\r\n"
        "Address:  192.168.1.5\r\n";
    REQUIRE(ParseNslookupName(nslookup, "192.168.1.5") == std::string("printer.lan"));
    REQUIRE_FALSE(ParseNslookupName("Name: 192.168.1.5\r\n", "192.168.1.5"));
}

TEST_CASE("Hostname plausibility", "[parsers][hostname]")
{
    REQUIRE(IsPlausibleHostname("printer.lan", "192.168.1.5"));
    REQUIRE_FALSE(IsPlausibleHostname("", "192.168.1.5"));
    REQUIRE_FALSE(IsPlausibleHostname("192.168.1.5", "192.168.1.5"));
    REQUIRE_FALSE(IsPlausibleHostname("5.1.168.192.in-addr.arpa", "192.168.1.5"));
    REQUIRE_FALSE(IsPlausibleHostname("no such host", "192.168.1.5"));
}

TEST_CASE("Windows elevation from whoami", "[parsers][windows]")
{
    REQUIRE(ParseWhoamiElevated("Mandatory Label\\High Mandatory Level  Label  S-1-16-12288"));
    REQUIRE_FALSE(ParseWhoamiElevated("Mandatory Label\\Medium Mandatory Level  Label  S-1-16-8192"));
}
