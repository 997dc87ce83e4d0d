#include "ProbeSweeper.hpp"
#include "../common/Log.hpp"
#include "../common/ScanError.hpp"
#include "../common/Subnet.hpp"

#include <algorithm>
#include <future>

namespace netscout::discovery
{
    std::vector<std::string> ProbeSweeper::CandidateHosts(const std::string &subnet)
    {
        auto cidr = common::ParseCidr(subnet);
        if (!cidr)
            throw common::ScanError(common::ScanErrorKind::General, "Failed to parse subnet: " + subnet);
        return common::EnumerateHosts(*cidr, kMaxHosts);
    }

    SweepResult ProbeSweeper::Sweep(const std::string &subnet, const common::CancelToken &cancel)
    {
        SweepResult result;
        std::vector<std::string> hosts = CandidateHosts(subnet);

        common::LogInfo("Sweep") << "Starting ping sweep of " << hosts.size() << " hosts";

        for (std::size_t begin = 0; begin < hosts.size(); begin += kBatchSize)
        {
            if (cancel.IsCancelled())
            {
                common::LogInfo("Sweep") << "Cancelled after " << result.probed << " hosts, "
                                         << result.devices.size() << " responding";
                result.cancelled = true;
                return result;
            }

            std::size_t end = std::min(begin + kBatchSize, hosts.size());
            std::vector<std::future<PingReply>> probes;
            probes.reserve(end - begin);

            for (std::size_t i = begin; i < end; ++i)
            {
                const std::string &ip = hosts[i];
                probes.push_back(std::async(std::launch::async, [this, ip]()
                                            { return m_inspector.Ping(ip, kProbeTimeout); }));
            }

            for (std::size_t i = begin; i < end; ++i)
            {
                PingReply reply;
                try
                {
                    reply = probes[i - begin].get();
                }
                catch (const std::exception &e)
                {
                    common::LogDebug("Sweep") << "Probe of " << hosts[i] << " failed: " << e.what();
                    continue;
                }

                if (!reply.reachable)
                    continue;

                common::Device device;
                device.ip = hosts[i];
                device.response_time_ms = reply.latency_ms;
                result.devices.push_back(device);
            }
            result.probed = end;
        }

        common::LogInfo("Sweep") << "Ping sweep complete: " << result.devices.size() << " responding hosts";
        return result;
    }
}
