#include "DiscoveryPipeline.hpp"
#include "ArpHarvester.hpp"
#include "CapabilityDetector.hpp"
#include "DeviceMerge.hpp"
#include "HostnameResolver.hpp"
#include "ProbeSweeper.hpp"
#include "TopologyDetector.hpp"
#include "VendorClassifier.hpp"
#include "../common/Log.hpp"
#include "../common/ScanError.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace netscout::discovery
{
    namespace
    {
        using Clock = std::chrono::steady_clock;

        double SecondsSince(Clock::time_point start)
        {
            return std::chrono::duration<double>(Clock::now() - start).count();
        }

        std::string OneDecimal(double value)
        {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(1) << value;
            return ss.str();
        }

        void AddLocalMachine(std::vector<common::Device> &devices, const common::NetworkInfo &network,
                             NetworkInspector &inspector)
        {
            if (!network.local_ip)
                return;

            for (auto &device : devices)
            {
                if (device.ip != *network.local_ip)
                    continue;
                if (!device.hostname)
                    device.hostname = inspector.LocalHostname();
                if (!device.response_time_ms)
                    device.response_time_ms = 0.0;
                return;
            }

            common::LogInfo("Scan") << "Adding local machine " << *network.local_ip << " to device list";
            common::Device self;
            self.ip = *network.local_ip;
            self.response_time_ms = 0.0;
            self.hostname = inspector.LocalHostname();
            devices.push_back(self);
        }
    }

    common::ScanResult DiscoveryPipeline::RunDiscovery(const common::ProgressCallback &progress, bool clearCancel)
    {
        const auto scanStart = Clock::now();

        auto emit = [&](common::ScanStage stage, const std::string &message,
                        std::optional<std::uint8_t> percent, std::optional<std::size_t> found)
        {
            common::ScanProgress update;
            update.stage = stage;
            update.message = message;
            update.percent = percent;
            update.devices_found = found;
            update.elapsed_secs = SecondsSince(scanStart);

            common::LogInfo("Scan") << message;
            if (!progress)
                return;
            try
            {
                progress(update);
            }
            catch (const std::exception &e)
            {
                common::LogWarn("Scan") << "Progress callback threw: " << e.what();
            }
        };

        if (clearCancel)
            m_cancel.Clear();

        emit(common::ScanStage::Starting, "Starting network scan...", 2, std::nullopt);

        common::ScanResult result;
        result.capabilities = CapabilityDetector(m_inspector).Detect();
        if (result.capabilities.mode == common::ScanMode::Limited)
            emit(common::ScanStage::Starting, FormatCapabilitiesMessage(result.capabilities), 3, std::nullopt);

        emit(common::ScanStage::DetectingNetwork, "Detecting network configuration...", 5, std::nullopt);
        try
        {
            result.network_info = TopologyDetector(m_inspector).Detect();
        }
        catch (const common::ScanError &e)
        {
            emit(common::ScanStage::Failed, std::string("Network detection failed: ") + e.what(),
                 std::nullopt, std::nullopt);
            throw;
        }

        const common::NetworkInfo &network = result.network_info;
        common::LogInfo("Scan") << "Network: " << network.subnet << " on " << network.interface
                                << " (gateway: " << network.gateway_ip.value_or("none") << ")";

        emit(common::ScanStage::ReadingArp, "Reading known devices from ARP table...", 10, std::nullopt);
        std::vector<common::Device> devices = ArpHarvester(m_inspector).ReadArpTable();
        emit(common::ScanStage::ReadingArp,
             "Found " + std::to_string(devices.size()) + " devices in ARP cache", 15, devices.size());

        bool cancelled = false;
        if (result.capabilities.mode == common::ScanMode::Limited && !devices.empty())
        {
            emit(common::ScanStage::PingSweep,
                 "Skipping ping sweep (limited mode), using " + std::to_string(devices.size()) + " ARP devices",
                 50, devices.size());
        }
        else
        {
            emit(common::ScanStage::PingSweep, "Discovering devices on network (ping sweep)...", 20,
                 devices.size());

            const auto sweepStart = Clock::now();
            try
            {
                SweepResult sweep = ProbeSweeper(m_inspector).Sweep(network.subnet, m_cancel);
                MergeSweepIntoArp(devices, sweep.devices);
                cancelled = sweep.cancelled;

                common::LogInfo("Scan") << "Ping sweep: " << sweep.devices.size() << " responding hosts in "
                                        << OneDecimal(SecondsSince(sweepStart)) << "s";
                if (!cancelled)
                {
                    emit(common::ScanStage::PingSweep,
                         "Discovered " + std::to_string(devices.size()) + " total devices", 50, devices.size());
                }
            }
            catch (const std::exception &e)
            {
                common::LogWarn("Scan") << "Ping sweep failed: " << e.what();
                emit(common::ScanStage::PingSweep, std::string("Ping sweep had issues: ") + e.what(), 50,
                     devices.size());
            }
        }

        AddLocalMachine(devices, network, m_inspector);

        VendorClassifier classifier(m_oui);

        if (cancelled)
        {
            result.devices = DedupByIp(devices);
            classifier.Enrich(result.devices);
            result.cancelled = true;
            emit(common::ScanStage::Failed, "Scan cancelled", std::nullopt, result.devices.size());
            return result;
        }

        if (!devices.empty())
        {
            emit(common::ScanStage::ResolvingHostnames,
                 "Resolving hostnames for " + std::to_string(devices.size()) + " devices (may take a moment)...",
                 55, devices.size());

            const auto dnsStart = Clock::now();
            std::size_t resolved = HostnameResolver(m_inspector).Resolve(devices);

            emit(common::ScanStage::ResolvingHostnames,
                 "Resolved " + std::to_string(resolved) + "/" + std::to_string(devices.size()) +
                     " hostnames in " + OneDecimal(SecondsSince(dnsStart)) + "s",
                 95, devices.size());
        }

        result.devices = DedupByIp(devices);
        classifier.Enrich(result.devices);

        emit(common::ScanStage::Complete,
             "Scan complete: " + std::to_string(result.devices.size()) + " devices found in " +
                 OneDecimal(SecondsSince(scanStart)) + "s",
             100, result.devices.size());

        return result;
    }
}
