#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace netscout::discovery
{
    struct CommandResult
    {
        bool started = false;   // false when the tool could not be executed at all
        bool timed_out = false; // child was killed at the deadline
        int exit_code = -1;
        std::string output;
        std::string error_output;
        std::chrono::milliseconds elapsed{0};

        bool Succeeded() const { return started && !timed_out && exit_code == 0; }
    };

    // Runs argv[0] (looked up in PATH) with the given arguments and collects
    // stdout and stderr until the process exits or the timeout expires.
    // Never throws for a missing or failing tool.
    CommandResult RunCommand(const std::vector<std::string> &argv,
                             std::chrono::milliseconds timeout);
}
