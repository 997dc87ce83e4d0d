#pragma once

#include "../common/Device.hpp"
#include "OutputParsers.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netscout::discovery
{
    struct PingReply
    {
        bool reachable = false;
        double latency_ms = 0.0;
    };

    // Everything the discovery code needs from the host OS. One
    // implementation per platform; tests substitute a scripted fake.
    class NetworkInspector
    {
    public:
        virtual ~NetworkInspector() = default;

        virtual std::string PlatformName() const = 0;

        // Candidate networks, one per default route / adapter, best first.
        // Empty when the query could not run.
        virtual std::vector<common::NetworkInfo> QueryTopology() = 0;
        virtual std::vector<common::NetworkInfo> QueryTopologyFallback() = 0;

        // Raw neighbor table. Throws std::runtime_error when the table
        // cannot be read at all.
        virtual std::vector<ArpEntry> ReadArpTable() = 0;

        virtual PingReply Ping(const std::string &ip, std::chrono::milliseconds timeout) = 0;

        // First plausible name from the platform's resolution methods, all
        // of which share `budget`.
        virtual std::optional<std::string> ResolveHostname(const std::string &ip,
                                                           std::chrono::milliseconds budget) = 0;
        virtual std::chrono::milliseconds HostnameTimeout() const = 0;

        virtual std::optional<std::string> LocalHostname() = 0;
        virtual bool IsElevated() = 0;
        virtual std::string ElevationInstructions() const = 0;
    };

    // Shared ping / hostname plumbing for inspectors that shell out to the
    // system utilities through RunCommand.
    class CommandInspector : public NetworkInspector
    {
    public:
        PingReply Ping(const std::string &ip, std::chrono::milliseconds timeout) override;
        std::optional<std::string> ResolveHostname(const std::string &ip,
                                                   std::chrono::milliseconds budget) override;

    protected:
        struct HostnameMethod
        {
            std::vector<std::string> argv;
            std::function<std::optional<std::string>(const std::string &output)> parse;
            bool require_success = true;
        };

        virtual std::vector<std::string> PingCommand(const std::string &ip,
                                                     std::chrono::milliseconds timeout) const = 0;
        virtual PingFlavor Flavor() const = 0;
        virtual std::vector<HostnameMethod> HostnameMethods(const std::string &ip) const = 0;
    };

    // Libtins view of the kernel routing table, used when the route
    // utilities are missing or print something unexpected.
    std::vector<common::NetworkInfo> QueryKernelTopology();

    std::unique_ptr<NetworkInspector> CreatePlatformInspector();
}
