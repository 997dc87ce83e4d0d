#pragma once

#include "../common/Device.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace netscout::monitor
{
    // One week. Anything longer is treated as a configuration mistake.
    constexpr std::uint64_t kMaxIntervalSeconds = 7 * 24 * 60 * 60;

    inline std::uint64_t ClampInterval(std::uint64_t seconds)
    {
        return std::min<std::uint64_t>(std::max<std::uint64_t>(seconds, 1), kMaxIntervalSeconds);
    }

    struct SchedulerState
    {
        std::vector<common::Device> known_devices;
        std::uint64_t last_scan_time = 0; // unix seconds, 0 = never
        std::uint64_t scan_interval_seconds = 300;
        std::uint64_t health_check_interval_seconds = 60;
    };
}
