#include "HostnameResolver.hpp"
#include "../common/Log.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <optional>
#include <string>

namespace netscout::discovery
{
    namespace
    {
        // Slack for thread start-up on top of the per-host budget.
        constexpr std::chrono::milliseconds kCollectGrace{500};
    }

    std::size_t HostnameResolver::Resolve(std::vector<common::Device> &devices)
    {
        const std::chrono::milliseconds budget = m_inspector.HostnameTimeout();

        for (std::size_t begin = 0; begin < devices.size(); begin += kBatchSize)
        {
            std::size_t end = std::min(begin + kBatchSize, devices.size());
            std::vector<std::future<std::optional<std::string>>> lookups;
            lookups.reserve(end - begin);

            for (std::size_t i = begin; i < end; ++i)
            {
                std::string ip = devices[i].ip;
                lookups.push_back(std::async(std::launch::async, [this, ip, budget]()
                                             { return m_inspector.ResolveHostname(ip, budget); }));
            }

            auto deadline = std::chrono::steady_clock::now() + budget + kCollectGrace;
            for (std::size_t i = begin; i < end; ++i)
            {
                auto &lookup = lookups[i - begin];
                if (lookup.wait_until(deadline) != std::future_status::ready)
                {
                    common::LogDebug("Resolver") << "Lookup for " << devices[i].ip << " timed out";
                    continue;
                }

                try
                {
                    auto hostname = lookup.get();
                    if (hostname)
                        devices[i].hostname = *hostname;
                }
                catch (const std::exception &e)
                {
                    common::LogDebug("Resolver") << "Lookup for " << devices[i].ip << " failed: " << e.what();
                }
            }
        }

        return static_cast<std::size_t>(std::count_if(devices.begin(), devices.end(),
                                                       [](const common::Device &d)
                                                       { return d.hostname.has_value(); }));
    }
}
