#include <catch2/catch.hpp>

#include "../common/ScanError.hpp"
#include "../discovery/DiscoveryPipeline.hpp"
#include "FakeInspector.hpp"

#include <algorithm>

using namespace netscout;
using tests::FakeInspector;
using tests::MakeArp;
using tests::MakeNetwork;

namespace
{
    struct PipelineFixture
    {
        FakeInspector inspector;
        discovery::OuiDatabase oui;
        common::CancelToken cancel;
        std::vector<common::ScanProgress> updates;

        PipelineFixture()
        {
            inspector.topology = {MakeNetwork("eth0", "192.168.1.0/24", std::string("192.168.1.1"),
                                              std::string("192.168.1.50"))};
            inspector.arpEntries = {MakeArp("192.168.1.1", "3c:22:fb:00:00:01")};
            inspector.pingable = {{"192.168.1.1", 1.0}, {"192.168.1.20", 4.0}};
            inspector.hostnames = {{"192.168.1.1", "router.lan"}};
            oui.Add(0x3C22FB, 24, "Apple, Inc.");
        }

        common::ScanResult Run(common::ProgressCallback extra = nullptr)
        {
            discovery::DiscoveryPipeline pipeline(inspector, oui, cancel);
            return pipeline.RunDiscovery([this, extra](const common::ScanProgress &p)
                                         {
                                             updates.push_back(p);
                                             if (extra)
                                                 extra(p);
                                         });
        }

        std::vector<int> Percents() const
        {
            std::vector<int> percents;
            for (const auto &u : updates)
                percents.push_back(u.percent ? *u.percent : -1);
            return percents;
        }

        const common::Device *Find(const common::ScanResult &result, const std::string &ip) const
        {
            auto it = std::find_if(result.devices.begin(), result.devices.end(),
                                   [&ip](const common::Device &d)
                                   { return d.ip == ip; });
            return it == result.devices.end() ? nullptr : &*it;
        }
    };
}

TEST_CASE_METHOD(PipelineFixture, "Full scan walks every stage", "[pipeline]")
{
    auto result = Run();

    REQUIRE_FALSE(result.cancelled);
    REQUIRE(result.capabilities.mode == common::ScanMode::Full);
    REQUIRE(result.network_info.subnet == "192.168.1.0/24");

    REQUIRE(Percents() == std::vector<int>{2, 5, 10, 15, 20, 50, 55, 95, 100});
    REQUIRE(updates.front().stage == common::ScanStage::Starting);
    REQUIRE(updates[1].stage == common::ScanStage::DetectingNetwork);
    REQUIRE(updates[3].message == "Found 1 devices in ARP cache");
    REQUIRE(updates[5].message == "Discovered 2 total devices");
    REQUIRE(updates.back().stage == common::ScanStage::Complete);
    REQUIRE_THAT(updates.back().message, Catch::StartsWith("Scan complete: 3 devices found in "));

    REQUIRE(result.devices.size() == 3);

    const common::Device *router = Find(result, "192.168.1.1");
    REQUIRE(router);
    REQUIRE(router->mac == std::string("3C:22:FB:00:00:01"));
    REQUIRE(router->response_time_ms == 1.0);
    REQUIRE(router->hostname == std::string("router.lan"));
    REQUIRE(router->vendor == std::string("Apple, Inc."));
    REQUIRE(router->device_type == common::DeviceType::Apple);

    const common::Device *swept = Find(result, "192.168.1.20");
    REQUIRE(swept);
    REQUIRE_FALSE(swept->mac);
    REQUIRE(swept->response_time_ms == 4.0);
}

TEST_CASE_METHOD(PipelineFixture, "ARP-only devices survive the merge", "[pipeline]")
{
    // in the ARP cache but silent to ping
    inspector.arpEntries.push_back(MakeArp("192.168.1.30", "3c:22:fb:00:00:30"));

    auto result = Run();

    REQUIRE(result.devices.size() == 4);
    REQUIRE(std::count_if(result.devices.begin(), result.devices.end(),
                          [](const common::Device &d)
                          { return d.ip == "192.168.1.30"; }) == 1);

    const common::Device *quiet = Find(result, "192.168.1.30");
    REQUIRE(quiet);
    REQUIRE(quiet->mac == std::string("3C:22:FB:00:00:30"));
    REQUIRE(quiet->vendor == std::string("Apple, Inc."));
    REQUIRE(quiet->device_type == common::DeviceType::Apple);
}

TEST_CASE_METHOD(PipelineFixture, "Local machine is always listed", "[pipeline]")
{
    auto result = Run();

    const common::Device *self = Find(result, "192.168.1.50");
    REQUIRE(self);
    REQUIRE(self->response_time_ms == 0.0);
    REQUIRE(self->hostname == std::string("agent-host"));
}

TEST_CASE_METHOD(PipelineFixture, "Limited mode with ARP devices skips the sweep", "[pipeline][limited]")
{
    inspector.loopbackPings = false;

    auto result = Run();

    REQUIRE(result.capabilities.mode == common::ScanMode::Limited);
    REQUIRE(inspector.pingCalls == 1);
    REQUIRE(Percents() == std::vector<int>{2, 3, 5, 10, 15, 50, 55, 95, 100});
    REQUIRE_THAT(updates[1].message, Catch::StartsWith("Scanning with limited capabilities"));
    REQUIRE_THAT(updates[5].message, Catch::StartsWith("Skipping ping sweep"));

    // resolution still runs
    REQUIRE(inspector.hostnameCalls > 0);
    REQUIRE(Find(result, "192.168.1.20") == nullptr);
    REQUIRE(result.devices.size() == 2);
}

TEST_CASE_METHOD(PipelineFixture, "Limited mode with an empty ARP table still sweeps", "[pipeline][limited]")
{
    inspector.loopbackPings = false;
    inspector.arpEntries.clear();

    auto result = Run();

    REQUIRE(inspector.pingCalls > 1);
    REQUIRE(Find(result, "192.168.1.20") != nullptr);
}

TEST_CASE_METHOD(PipelineFixture, "Cancelling during the sweep returns partial results", "[pipeline][cancel]")
{
    auto result = Run([this](const common::ScanProgress &p)
                      {
                          if (p.stage == common::ScanStage::PingSweep && p.percent && *p.percent == 20)
                              cancel.RequestCancel();
                      });

    REQUIRE(result.cancelled);
    REQUIRE(updates.back().stage == common::ScanStage::Failed);
    REQUIRE(updates.back().message == "Scan cancelled");
    REQUIRE(inspector.hostnameCalls == 0);

    // ARP entry plus the local machine, already classified
    REQUIRE(result.devices.size() == 2);
    const common::Device *router = Find(result, "192.168.1.1");
    REQUIRE(router);
    REQUIRE(router->vendor == std::string("Apple, Inc."));
}

TEST_CASE_METHOD(PipelineFixture, "A stale cancel request does not affect a new scan", "[pipeline][cancel]")
{
    cancel.RequestCancel();
    auto result = Run();
    REQUIRE_FALSE(result.cancelled);
    REQUIRE(result.devices.size() == 3);
}

TEST_CASE_METHOD(PipelineFixture, "A caller-owned cancel request made before the scan is honored", "[pipeline][cancel]")
{
    cancel.RequestCancel();

    discovery::DiscoveryPipeline pipeline(inspector, oui, cancel);
    auto result = pipeline.RunDiscovery(nullptr, false);

    REQUIRE(result.cancelled);
    REQUIRE(inspector.hostnameCalls == 0);
    REQUIRE(cancel.IsCancelled());
}

TEST_CASE_METHOD(PipelineFixture, "No network is fatal", "[pipeline]")
{
    inspector.topology.clear();

    REQUIRE_THROWS_AS(Run(), common::ScanError);
    REQUIRE(updates.back().stage == common::ScanStage::Failed);
    REQUIRE_THAT(updates.back().message, Catch::StartsWith("Network detection failed: "));
}

TEST_CASE_METHOD(PipelineFixture, "A throwing progress callback does not stop the scan", "[pipeline]")
{
    auto result = Run([](const common::ScanProgress &)
                      { throw std::runtime_error("observer failed"); });

    REQUIRE(result.devices.size() == 3);
    REQUIRE(updates.back().stage == common::ScanStage::Complete);
}
