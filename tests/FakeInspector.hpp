#pragma once

#include "../discovery/NetworkInspector.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace netscout::tests
{
    // Scripted NetworkInspector. Every probe answers from the tables below
    // so no system utility is ever run.
    class FakeInspector : public discovery::NetworkInspector
    {
    public:
        std::vector<common::NetworkInfo> topology;
        std::vector<common::NetworkInfo> fallbackTopology;
        std::vector<discovery::ArpEntry> arpEntries;
        bool arpFails = false;

        // ip -> latency. Anything missing does not answer.
        std::map<std::string, double> pingable;
        bool loopbackPings = true;
        std::chrono::milliseconds pingDelay{0};

        std::map<std::string, std::string> hostnames;
        std::chrono::milliseconds hostnameDelay{0};
        std::chrono::milliseconds hostnameBudget{200};
        std::optional<std::string> localHostname = std::string("agent-host");
        bool elevated = false;

        std::atomic<int> pingCalls{0};
        std::atomic<int> arpReads{0};
        std::atomic<int> hostnameCalls{0};

        std::string PlatformName() const override { return "fake"; }

        std::vector<common::NetworkInfo> QueryTopology() override { return topology; }
        std::vector<common::NetworkInfo> QueryTopologyFallback() override { return fallbackTopology; }

        std::vector<discovery::ArpEntry> ReadArpTable() override
        {
            ++arpReads;
            if (arpFails)
                throw std::runtime_error("neighbor table unavailable");
            return arpEntries;
        }

        discovery::PingReply Ping(const std::string &ip, std::chrono::milliseconds) override
        {
            ++pingCalls;
            if (pingDelay.count() > 0)
                std::this_thread::sleep_for(pingDelay);

            discovery::PingReply reply;
            if (ip == "127.0.0.1")
            {
                reply.reachable = loopbackPings;
                return reply;
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = pingable.find(ip);
            if (it != pingable.end())
            {
                reply.reachable = true;
                reply.latency_ms = it->second;
            }
            return reply;
        }

        std::optional<std::string> ResolveHostname(const std::string &ip, std::chrono::milliseconds) override
        {
            ++hostnameCalls;
            if (hostnameDelay.count() > 0)
                std::this_thread::sleep_for(hostnameDelay);

            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = hostnames.find(ip);
            if (it == hostnames.end())
                return std::nullopt;
            return it->second;
        }

        std::chrono::milliseconds HostnameTimeout() const override { return hostnameBudget; }
        std::optional<std::string> LocalHostname() override { return localHostname; }
        bool IsElevated() override { return elevated; }
        std::string ElevationInstructions() const override { return "Run as root"; }

        void SetPingable(const std::string &ip, double latency)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            pingable[ip] = latency;
        }

        void SetUnreachable(const std::string &ip)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            pingable.erase(ip);
        }

    private:
        std::mutex m_mutex;
    };

    inline common::NetworkInfo MakeNetwork(const std::string &iface, const std::string &subnet,
                                           std::optional<std::string> gateway = std::nullopt,
                                           std::optional<std::string> local = std::nullopt)
    {
        common::NetworkInfo info;
        info.interface = iface;
        info.subnet = subnet;
        info.gateway_ip = gateway;
        info.local_ip = local;
        return info;
    }

    inline discovery::ArpEntry MakeArp(const std::string &ip, const std::string &mac, bool complete = true)
    {
        discovery::ArpEntry entry;
        entry.ip = ip;
        entry.mac = mac;
        entry.complete = complete;
        entry.interface = "eth0";
        return entry;
    }

    inline common::Device MakeDevice(const std::string &ip, std::optional<double> timing = std::nullopt)
    {
        common::Device device;
        device.ip = ip;
        device.response_time_ms = timing;
        return device;
    }
}
