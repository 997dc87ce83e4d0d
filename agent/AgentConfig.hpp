#pragma once

#include "../monitor/SchedulerState.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace netscout::agent
{
    struct AgentConfig
    {
        std::string state_db_path;
        // Unset keeps whatever the state database holds.
        std::optional<std::uint64_t> scan_interval_seconds;
        std::optional<std::uint64_t> health_check_interval_seconds;
        std::optional<std::string> oui_file;
    };

    // Plain decimal digits only; stoull alone would take "-5" and wrap it.
    inline std::uint64_t ParseSeconds(const std::string &text, const char *what)
    {
        bool digits = !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c)
                                                   { return std::isdigit(c) != 0; });
        unsigned long long value = 0;
        if (digits)
        {
            try
            {
                value = std::stoull(text);
            }
            catch (const std::out_of_range &)
            {
                value = monitor::kMaxIntervalSeconds + 1;
            }
        }
        if (!digits || value == 0)
            throw std::runtime_error(std::string("Invalid ") + what + ": " + text);
        if (value > monitor::kMaxIntervalSeconds)
            throw std::runtime_error(std::string("Invalid ") + what + ": " + text + " (max " +
                                     std::to_string(monitor::kMaxIntervalSeconds) + ")");
        return value;
    }

    // <state-db> [scan-interval-s] [health-interval-s] [oui-file]
    inline AgentConfig ParseArgs(int argc, char *argv[])
    {
        if (argc < 2)
            throw std::runtime_error("missing state database path");

        AgentConfig config;
        config.state_db_path = argv[1];
        if (argc > 2)
            config.scan_interval_seconds = ParseSeconds(argv[2], "scan interval");
        if (argc > 3)
            config.health_check_interval_seconds = ParseSeconds(argv[3], "health check interval");
        if (argc > 4)
            config.oui_file = argv[4];
        return config;
    }
}
