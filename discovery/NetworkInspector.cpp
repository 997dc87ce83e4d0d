#include "NetworkInspector.hpp"
#include "CommandRunner.hpp"
#include "../common/Log.hpp"

namespace netscout::discovery
{
    namespace
    {
        // Process start-up on top of the tool's own reply timeout.
        constexpr std::chrono::milliseconds kPingGrace{1500};
    }

    PingReply CommandInspector::Ping(const std::string &ip, std::chrono::milliseconds timeout)
    {
        PingReply reply;
        CommandResult result = RunCommand(PingCommand(ip, timeout), timeout + kPingGrace);
        if (!result.started)
        {
            common::LogDebug("Ping") << "ping could not be executed for " << ip;
            return reply;
        }
        if (result.timed_out)
            return reply;
        if (!IsPingSuccess(Flavor(), result.exit_code, result.output))
            return reply;

        reply.reachable = true;
        reply.latency_ms = ParsePingTime(result.output)
                               .value_or(static_cast<double>(result.elapsed.count()));
        return reply;
    }

    std::optional<std::string> CommandInspector::ResolveHostname(const std::string &ip,
                                                                 std::chrono::milliseconds budget)
    {
        auto deadline = std::chrono::steady_clock::now() + budget;

        for (const auto &method : HostnameMethods(ip))
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                break;

            CommandResult result = RunCommand(method.argv, remaining);
            if (!result.started || result.timed_out)
                continue;
            if (method.require_success && result.exit_code != 0)
                continue;

            auto name = method.parse(result.output);
            if (name && IsPlausibleHostname(*name, ip))
            {
                common::LogDebug("Resolver") << ip << " -> " << *name << " (" << method.argv[0] << ")";
                return name;
            }
        }
        return std::nullopt;
    }
}
