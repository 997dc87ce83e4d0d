#include "WindowsInspector.hpp"
#include "CommandRunner.hpp"
#include "../common/Log.hpp"

#include <cstdlib>
#include <stdexcept>

namespace netscout::discovery
{
    namespace
    {
        constexpr std::chrono::milliseconds kTopologyTimeout{10000};

        // Prints "iface|network/prefix|gateway|ip" for the first non-virtual
        // adapter that has an IPv4 default gateway.
        const char *kTopologyScript = R"PS(
$virtualPatterns = @('vEthernet', 'WSL', 'Hyper-V', 'VirtualBox', 'VMware', 'Docker', 'Loopback', 'Tailscale')
$adapters = @(Get-NetIPConfiguration | Where-Object { $_.IPv4DefaultGateway -ne $null })
$selected = $null
foreach ($adapter in $adapters) {
    $isVirtual = $false
    foreach ($pattern in $virtualPatterns) {
        if ($adapter.InterfaceAlias -like "*$pattern*") { $isVirtual = $true; break }
    }
    if (-not $isVirtual) { $selected = $adapter; break }
}
if ($selected -eq $null -and $adapters.Count -gt 0) { $selected = $adapters[0] }
if ($selected) {
    $addr = @($selected.IPv4Address)[0]
    $gw = @($selected.IPv4DefaultGateway)[0]
    $prefix = $addr.PrefixLength
    $ipBytes = [System.Net.IPAddress]::Parse($addr.IPAddress).GetAddressBytes()
    $maskInt = [uint32]([uint64]0xFFFFFFFF -shl (32 - $prefix) -band 0xFFFFFFFF)
    $maskBytes = [BitConverter]::GetBytes($maskInt)
    [Array]::Reverse($maskBytes)
    $net = @()
    for ($i = 0; $i -lt 4; $i++) { $net += $ipBytes[$i] -band $maskBytes[$i] }
    $network = [System.Net.IPAddress]::new([byte[]]$net)
    Write-Output "$($selected.InterfaceAlias)|$network/$prefix|$($gw.NextHop)|$($addr.IPAddress)"
}
)PS";
    }

    std::vector<common::NetworkInfo> WindowsInspector::QueryTopology()
    {
        std::vector<common::NetworkInfo> candidates;

        CommandResult result = RunCommand({"powershell", "-NoProfile", "-ExecutionPolicy", "Bypass",
                                           "-Command", kTopologyScript},
                                          kTopologyTimeout);
        if (!result.error_output.empty())
            common::LogWarn("Topology") << "PowerShell stderr: " << Trim(result.error_output);
        if (!result.started || result.timed_out)
            return candidates;

        auto info = ParsePowerShellTopology(result.output);
        if (info)
            candidates.push_back(*info);
        return candidates;
    }

    std::vector<common::NetworkInfo> WindowsInspector::QueryTopologyFallback()
    {
        common::LogInfo("Topology") << "Falling back to ipconfig for network detection";
        CommandResult result = RunCommand({"ipconfig"}, kTopologyTimeout);
        if (!result.started || result.timed_out)
            return {};
        return ParseIpconfig(result.output);
    }

    std::vector<ArpEntry> WindowsInspector::ReadArpTable()
    {
        CommandResult result = RunCommand({"arp", "-a"}, std::chrono::milliseconds(5000));
        if (!result.started || result.timed_out)
            throw std::runtime_error("arp -a did not complete");
        return ParseWindowsArp(result.output);
    }

    std::optional<std::string> WindowsInspector::LocalHostname()
    {
        const char *name = std::getenv("COMPUTERNAME");
        if (!name || name[0] == '\0')
            return std::nullopt;
        return std::string(name);
    }

    bool WindowsInspector::IsElevated()
    {
        CommandResult result = RunCommand({"whoami", "/groups"}, std::chrono::milliseconds(5000));
        if (!result.started || result.timed_out)
            return false;
        return ParseWhoamiElevated(result.output);
    }

    std::string WindowsInspector::ElevationInstructions() const
    {
        return "To run with full scan capabilities on Windows:\n"
               "1. Right-click on netscout-agent\n"
               "2. Select 'Run as administrator'\n"
               "\n"
               "Note: Most scan features work without admin rights on Windows.";
    }

    std::vector<std::string> WindowsInspector::PingCommand(const std::string &ip,
                                                           std::chrono::milliseconds timeout) const
    {
        return {"ping", "-n", "1", "-w", std::to_string(timeout.count()), ip};
    }

    std::vector<CommandInspector::HostnameMethod> WindowsInspector::HostnameMethods(const std::string &ip) const
    {
        return {
            {{"nslookup", ip},
             [ip](const std::string &output)
             { return ParseNslookupName(output, ip); },
             true},
            {{"nbtstat", "-A", ip}, ParseNbtstatName, false},
        };
    }
}
