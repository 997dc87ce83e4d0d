#include <catch2/catch.hpp>

#include "../discovery/ArpHarvester.hpp"
#include "../discovery/DiscoveryPipeline.hpp"
#include "../discovery/Reachability.hpp"
#include "../monitor/Scheduler.hpp"
#include "../monitor/StateStore.hpp"
#include "../monitor/Uploader.hpp"
#include "FakeInspector.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <thread>

using namespace netscout;
using tests::FakeInspector;
using tests::MakeArp;
using tests::MakeDevice;
using tests::MakeNetwork;

namespace
{
    class RecordingUploader : public monitor::Uploader
    {
    public:
        std::atomic<int> scans{0};
        std::atomic<int> healthBatches{0};
        std::atomic<bool> accept{true};

        bool UploadScan(const common::ScanResult &) override
        {
            ++scans;
            return accept;
        }

        bool UploadHealth(const std::vector<common::DeviceHealthResult> &) override
        {
            ++healthBatches;
            return accept;
        }
    };

    bool WaitFor(const std::function<bool()> &condition, std::chrono::milliseconds limit)
    {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (condition())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return condition();
    }

    struct SchedulerFixture
    {
        FakeInspector inspector;
        discovery::OuiDatabase oui;
        common::CancelToken cancel;
        discovery::DiscoveryPipeline pipeline{inspector, oui, cancel};
        discovery::ArpHarvester arp{inspector};
        discovery::HealthChecker health{inspector, arp};
        monitor::StateStore store;
        RecordingUploader uploader;

        SchedulerFixture()
        {
            // /29 keeps the sweep to a single batch of six hosts
            inspector.topology = {MakeNetwork("eth0", "192.168.1.0/29", std::string("192.168.1.1"),
                                              std::string("192.168.1.5"))};
            inspector.arpEntries = {MakeArp("192.168.1.1", "aa:bb:cc:dd:ee:01")};
            inspector.pingable = {{"192.168.1.1", 1.0}, {"192.168.1.2", 4.0}};
            inspector.hostnameBudget = std::chrono::milliseconds(50);
            REQUIRE(store.Open(":memory:"));
        }

        const common::Device *Find(const std::vector<common::Device> &devices, const std::string &ip) const
        {
            auto it = std::find_if(devices.begin(), devices.end(),
                                   [&ip](const common::Device &d)
                                   { return d.ip == ip; });
            return it == devices.end() ? nullptr : &*it;
        }
    };
}

TEST_CASE_METHOD(SchedulerFixture, "A completed scan is merged, persisted and uploaded", "[scheduler]")
{
    monitor::Scheduler scheduler(pipeline, health, store, uploader);

    auto outcome = scheduler.RequestScan();

    REQUIRE(outcome.ran);
    REQUIRE(outcome.succeeded);
    REQUIRE(outcome.synced);
    REQUIRE(outcome.device_count == 3);
    REQUIRE(uploader.scans == 1);
    REQUIRE(scheduler.LastScanTime() > 0);
    REQUIRE(scheduler.KnownDevices().size() == 3);
    REQUIRE_FALSE(scheduler.IsScanning());

    auto persisted = store.Load();
    REQUIRE(persisted.known_devices.size() == 3);
    REQUIRE(persisted.last_scan_time == scheduler.LastScanTime());

    SECTION("a rejected upload is reported but the scan still counts")
    {
        uploader.accept = false;
        auto second = scheduler.RequestScan();
        REQUIRE(second.succeeded);
        REQUIRE_FALSE(second.synced);
    }

    SECTION("a rescan keeps timing for devices that now answer without one")
    {
        inspector.SetUnreachable("192.168.1.2");
        inspector.arpEntries.push_back(MakeArp("192.168.1.2", "aa:bb:cc:dd:ee:02"));

        scheduler.RequestScan();
        auto devices = scheduler.KnownDevices();
        const common::Device *kept = Find(devices, "192.168.1.2");
        REQUIRE(kept);
        REQUIRE(kept->response_time_ms == 4.0);
        REQUIRE(kept->mac == std::string("AA:BB:CC:DD:EE:02"));
    }
}

TEST_CASE_METHOD(SchedulerFixture, "Only one scan runs at a time", "[scheduler]")
{
    inspector.pingDelay = std::chrono::milliseconds(300);
    monitor::Scheduler scheduler(pipeline, health, store, uploader);

    auto first = std::async(std::launch::async, [&scheduler]()
                            { return scheduler.RequestScan(); });

    REQUIRE(WaitFor([&scheduler]()
                    { return scheduler.IsScanning(); },
                    std::chrono::milliseconds(2000)));

    auto second = scheduler.RequestScan();
    REQUIRE_FALSE(second.ran);

    REQUIRE(first.get().ran);
    REQUIRE(uploader.scans == 1);
    REQUIRE_FALSE(scheduler.IsScanning());
}

TEST_CASE_METHOD(SchedulerFixture, "A cancelled scan leaves the known set alone", "[scheduler][cancel]")
{
    monitor::Scheduler scheduler(pipeline, health, store, uploader);
    REQUIRE(scheduler.RequestScan().succeeded);
    auto before = scheduler.KnownDevices();
    auto scanTime = scheduler.LastScanTime();

    inspector.arpEntries.clear();
    scheduler.SetScanProgressCallback([&scheduler](const common::ScanProgress &p)
                                      {
                                          if (p.stage == common::ScanStage::PingSweep && p.percent && *p.percent == 20)
                                              scheduler.CancelScan();
                                      });

    auto outcome = scheduler.RequestScan();

    REQUIRE(outcome.ran);
    REQUIRE(outcome.cancelled);
    REQUIRE_FALSE(outcome.succeeded);
    REQUIRE(uploader.scans == 1);
    REQUIRE(scheduler.KnownDevices().size() == before.size());
    REQUIRE(scheduler.LastScanTime() == scanTime);
}

TEST_CASE_METHOD(SchedulerFixture, "A failed scan is absorbed", "[scheduler]")
{
    inspector.topology.clear();
    monitor::Scheduler scheduler(pipeline, health, store, uploader);

    auto outcome = scheduler.RequestScan();

    REQUIRE(outcome.ran);
    REQUIRE_FALSE(outcome.succeeded);
    REQUIRE(uploader.scans == 0);
    REQUIRE_FALSE(scheduler.IsScanning());
}

TEST_CASE_METHOD(SchedulerFixture, "Health checks update the known devices", "[scheduler][health]")
{
    monitor::Scheduler scheduler(pipeline, health, store, uploader);

    std::vector<common::HealthCheckProgress> updates;
    scheduler.SetHealthProgressCallback([&updates](const common::HealthCheckProgress &p)
                                        { updates.push_back(p); });

    SECTION("nothing known yet")
    {
        REQUIRE(scheduler.RunHealthCheck().empty());
        REQUIRE(updates.size() == 1);
        REQUIRE(updates[0].stage == common::HealthCheckStage::Complete);
        REQUIRE(updates[0].message == "No devices to check");
        REQUIRE(uploader.healthBatches == 0);
    }

    SECTION("after a scan")
    {
        REQUIRE(scheduler.RequestScan().succeeded);

        // the local machine never answers ping and is not in the ARP table
        auto results = scheduler.RunHealthCheck();
        REQUIRE(results.size() == 3);
        REQUIRE(uploader.healthBatches == 1);

        REQUIRE(updates.size() >= 3);
        REQUIRE(updates[updates.size() - 2].stage == common::HealthCheckStage::Uploading);
        REQUIRE(updates.back().stage == common::HealthCheckStage::Complete);
        REQUIRE(updates.back().message == "Health check complete: 2 healthy, 1 unreachable");

        auto devices = scheduler.KnownDevices();
        REQUIRE(Find(devices, "192.168.1.1")->response_time_ms == 1.0);
        REQUIRE_FALSE(Find(devices, "192.168.1.5")->response_time_ms);

        auto persisted = store.Load();
        const common::Device *local = Find(persisted.known_devices, "192.168.1.5");
        REQUIRE(local);
        REQUIRE_FALSE(local->response_time_ms);
    }
}

TEST_CASE_METHOD(SchedulerFixture, "Intervals are persisted and reloaded", "[scheduler][config]")
{
    {
        monitor::Scheduler scheduler(pipeline, health, store, uploader);
        scheduler.SetScanInterval(900);
        scheduler.SetHealthCheckInterval(45);
        REQUIRE(scheduler.GetScanInterval() == 900);
        REQUIRE(scheduler.GetHealthCheckInterval() == 45);
    }

    auto persisted = store.Load();
    REQUIRE(persisted.scan_interval_seconds == 900);
    REQUIRE(persisted.health_check_interval_seconds == 45);

    monitor::Scheduler restarted(pipeline, health, store, uploader);
    restarted.Start();
    REQUIRE(restarted.GetScanInterval() == 900);
    REQUIRE(restarted.GetHealthCheckInterval() == 45);
    restarted.Stop();
    REQUIRE_FALSE(restarted.IsRunning());
}

TEST_CASE_METHOD(SchedulerFixture, "Start runs a scan then a health check", "[scheduler][timers]")
{
    monitor::Scheduler scheduler(pipeline, health, store, uploader);
    scheduler.Start();
    REQUIRE(scheduler.IsRunning());

    REQUIRE(WaitFor([this]()
                    { return uploader.scans == 1 && uploader.healthBatches == 1; },
                    std::chrono::milliseconds(5000)));
    REQUIRE(scheduler.KnownDevices().size() == 3);

    scheduler.Stop();
    REQUIRE_FALSE(scheduler.IsRunning());
}

TEST_CASE_METHOD(SchedulerFixture, "Changing the interval re-arms the timer", "[scheduler][timers]")
{
    monitor::Scheduler scheduler(pipeline, health, store, uploader);
    scheduler.SetHealthCheckInterval(3600);
    scheduler.Start();

    REQUIRE(WaitFor([this]()
                    { return uploader.scans == 1 && uploader.healthBatches == 1; },
                    std::chrono::milliseconds(5000)));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    scheduler.SetScanInterval(1);

    // the change itself must not fire a scan
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    REQUIRE(uploader.scans == 1);

    REQUIRE(WaitFor([this]()
                    { return uploader.scans >= 2; },
                    std::chrono::milliseconds(2500)));

    scheduler.Stop();
}

TEST_CASE_METHOD(SchedulerFixture, "Clearing state forgets devices", "[scheduler]")
{
    monitor::Scheduler scheduler(pipeline, health, store, uploader);
    REQUIRE(scheduler.RequestScan().succeeded);

    REQUIRE(scheduler.ClearState());
    REQUIRE(scheduler.KnownDevices().empty());
    REQUIRE(scheduler.LastScanTime() == 0);
    REQUIRE(store.Load().known_devices.empty());
}

TEST_CASE_METHOD(SchedulerFixture, "Interval setters clamp out-of-range values", "[scheduler][config]")
{
    monitor::Scheduler scheduler(pipeline, health, store, uploader);

    scheduler.SetScanInterval(18446744073709551611ull);
    scheduler.SetHealthCheckInterval(0);

    REQUIRE(scheduler.GetScanInterval() == monitor::kMaxIntervalSeconds);
    REQUIRE(scheduler.GetHealthCheckInterval() == 1);
    REQUIRE(store.Load().scan_interval_seconds == monitor::kMaxIntervalSeconds);
}

TEST_CASE_METHOD(SchedulerFixture, "The health timer fires on its own interval", "[scheduler][timers][health]")
{
    monitor::Scheduler scheduler(pipeline, health, store, uploader);
    scheduler.SetHealthCheckInterval(1);
    scheduler.Start();

    REQUIRE(WaitFor([this]()
                    { return uploader.healthBatches >= 3; },
                    std::chrono::milliseconds(5000)));
    REQUIRE(uploader.scans == 1);

    scheduler.Stop();
}

TEST_CASE_METHOD(SchedulerFixture, "Changing the health interval re-arms its timer", "[scheduler][timers][health]")
{
    monitor::Scheduler scheduler(pipeline, health, store, uploader);
    scheduler.SetHealthCheckInterval(3600);
    scheduler.Start();

    REQUIRE(WaitFor([this]()
                    { return uploader.scans == 1 && uploader.healthBatches == 1; },
                    std::chrono::milliseconds(5000)));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    scheduler.SetHealthCheckInterval(1);

    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    REQUIRE(uploader.healthBatches == 1);

    REQUIRE(WaitFor([this]()
                    { return uploader.healthBatches >= 2; },
                    std::chrono::milliseconds(2500)));
    REQUIRE(uploader.scans == 1);

    scheduler.Stop();
}

TEST_CASE_METHOD(SchedulerFixture, "A stopped scheduler starts no new scans", "[scheduler][cancel]")
{
    monitor::Scheduler scheduler(pipeline, health, store, uploader);
    scheduler.Stop();

    auto outcome = scheduler.RequestScan();

    REQUIRE_FALSE(outcome.ran);
    REQUIRE_FALSE(scheduler.IsScanning());
    REQUIRE(uploader.scans == 0);
    REQUIRE(inspector.pingCalls == 0);
}

TEST_CASE_METHOD(SchedulerFixture, "Stop cancels the scan in flight", "[scheduler][cancel]")
{
    // six batches of slow pings, roughly two seconds uncancelled
    inspector.topology = {MakeNetwork("eth0", "192.168.1.0/24", std::string("192.168.1.1"),
                                      std::string("192.168.1.5"))};
    inspector.pingDelay = std::chrono::milliseconds(300);

    monitor::Scheduler scheduler(pipeline, health, store, uploader);
    scheduler.Start();
    REQUIRE(WaitFor([&scheduler]()
                    { return scheduler.IsScanning(); },
                    std::chrono::milliseconds(2000)));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto stopStart = std::chrono::steady_clock::now();
    scheduler.Stop();
    auto stopTook = std::chrono::steady_clock::now() - stopStart;

    REQUIRE(stopTook < std::chrono::milliseconds(1200));
    REQUIRE(uploader.scans == 0);
    REQUIRE(uploader.healthBatches == 0);
    REQUIRE(scheduler.KnownDevices().empty());
}
