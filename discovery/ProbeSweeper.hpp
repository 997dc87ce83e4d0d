#pragma once

#include "NetworkInspector.hpp"
#include "../common/CancelToken.hpp"
#include "../common/Device.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace netscout::discovery
{
    struct SweepResult
    {
        std::vector<common::Device> devices;
        bool cancelled = false;
        std::size_t probed = 0;
    };

    class ProbeSweeper
    {
    public:
        static constexpr std::size_t kBatchSize = 50;
        static constexpr std::size_t kMaxHosts = 253;
        static constexpr std::chrono::milliseconds kProbeTimeout{1000};

        explicit ProbeSweeper(NetworkInspector &inspector) : m_inspector(inspector) {}

        // Pings the subnet's hosts batch by batch. Cancellation is looked at
        // before each batch; when seen, the hosts found so far are returned
        // with `cancelled` set. Throws ScanError(General) for a bad subnet.
        SweepResult Sweep(const std::string &subnet, const common::CancelToken &cancel);

        static std::vector<std::string> CandidateHosts(const std::string &subnet);

    private:
        NetworkInspector &m_inspector;
    };
}
