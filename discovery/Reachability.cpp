#include "Reachability.hpp"
#include "../common/Log.hpp"

#include <algorithm>
#include <future>

namespace netscout::discovery
{
    std::optional<double> CheckReachable(NetworkInspector &inspector, const std::string &ip,
                                         const std::set<std::string> &arp_ips)
    {
        PingReply reply = inspector.Ping(ip, kReachabilityPingTimeout);
        if (reply.reachable)
            return reply.latency_ms;

        if (arp_ips.count(ip))
        {
            common::LogDebug("Health") << ip << " ignores ICMP but is in the ARP table";
            return 0.0;
        }
        return std::nullopt;
    }

    std::vector<common::DeviceHealthResult> HealthChecker::Run(std::vector<common::Device> &devices,
                                                               const common::HealthProgressCallback &progress)
    {
        std::vector<common::DeviceHealthResult> results;
        results.reserve(devices.size());

        common::HealthCheckProgress state;
        state.total_devices = devices.size();

        auto emit = [&](common::HealthCheckStage stage, const std::string &message)
        {
            if (!progress)
                return;
            state.stage = stage;
            state.message = message;
            try
            {
                progress(state);
            }
            catch (const std::exception &e)
            {
                common::LogWarn("Health") << "Progress callback threw: " << e.what();
            }
        };

        emit(common::HealthCheckStage::Starting, "Checking " + std::to_string(devices.size()) + " devices...");

        std::set<std::string> arpIps = m_arp.ArpTableIps();
        common::LogDebug("Health") << "ARP table has " << arpIps.size() << " entries for fallback";

        for (std::size_t begin = 0; begin < devices.size(); begin += kBatchSize)
        {
            std::size_t end = std::min(begin + kBatchSize, devices.size());
            std::vector<std::future<std::optional<double>>> checks;
            checks.reserve(end - begin);

            for (std::size_t i = begin; i < end; ++i)
            {
                std::string ip = devices[i].ip;
                checks.push_back(std::async(std::launch::async, [this, ip, &arpIps]()
                                            { return CheckReachable(m_inspector, ip, arpIps); }));
            }

            for (std::size_t i = begin; i < end; ++i)
            {
                std::optional<double> timing;
                try
                {
                    timing = checks[i - begin].get();
                }
                catch (const std::exception &e)
                {
                    common::LogDebug("Health") << "Check of " << devices[i].ip << " failed: " << e.what();
                }

                devices[i].response_time_ms = timing;

                common::DeviceHealthResult result;
                result.ip = devices[i].ip;
                result.reachable = timing.has_value();
                result.response_time_ms = timing;
                results.push_back(result);

                state.checked_devices = results.size();
                if (result.reachable)
                    ++state.healthy_devices;
                emit(common::HealthCheckStage::CheckingDevices, "Checking " + devices[i].ip + "...");
            }
        }

        common::LogInfo("Health") << state.healthy_devices << "/" << devices.size() << " devices reachable";
        return results;
    }
}
