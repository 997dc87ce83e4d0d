#include "AgentConfig.hpp"
#include "../common/Log.hpp"
#include "../discovery/ArpHarvester.hpp"
#include "../discovery/DiscoveryPipeline.hpp"
#include "../discovery/OuiDatabase.hpp"
#include "../discovery/Reachability.hpp"
#include "../monitor/Scheduler.hpp"
#include "../monitor/StateStore.hpp"
#include "../monitor/Uploader.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#ifndef _WIN32
#include <signal.h>
#endif

namespace
{
    std::atomic<bool> g_stopRequested{false};

    void HandleSignal(int)
    {
        g_stopRequested = true;
    }

    void InstallSignalHandlers()
    {
#ifdef _WIN32
        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);
#else
        struct sigaction action{};
        action.sa_handler = HandleSignal;
        sigemptyset(&action.sa_mask);
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);
#endif
    }

    void LoadVendorDatabase(netscout::discovery::OuiDatabase &oui, const netscout::agent::AgentConfig &config)
    {
        using netscout::discovery::OuiDatabase;

        if (config.oui_file)
        {
            if (!oui.LoadFile(*config.oui_file))
                throw std::runtime_error("cannot read OUI file " + *config.oui_file);
            return;
        }

        if (const char *env = std::getenv("NETSCOUT_OUI_FILE"))
        {
            if (oui.LoadFile(env))
                return;
            netscout::common::LogWarn("Agent") << "NETSCOUT_OUI_FILE=" << env << " is not readable";
        }

        for (const auto &path : OuiDatabase::DefaultPaths())
        {
            if (oui.LoadFile(path))
                return;
        }
        netscout::common::LogWarn("Agent") << "No OUI database found, vendors will not be identified";
    }
}

int main(int argc, char *argv[])
{
    using namespace netscout;

    common::InitLogLevelFromEnv();

    agent::AgentConfig config;
    try
    {
        config = agent::ParseArgs(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        std::cout << "Usage: ./netscout-agent <state-db> [scan-interval-s] [health-interval-s] [oui-file]\n";
        return 1;
    }

    try
    {
        discovery::OuiDatabase oui;
        LoadVendorDatabase(oui, config);

        auto inspector = discovery::CreatePlatformInspector();
        common::LogInfo("Agent") << "Platform: " << inspector->PlatformName();

        monitor::StateStore store;
        if (!store.Open(config.state_db_path))
            throw std::runtime_error("cannot open state database " + config.state_db_path);

        discovery::DiscoveryPipeline pipeline(*inspector, oui);
        discovery::ArpHarvester arp(*inspector);
        discovery::HealthChecker health(*inspector, arp);
        monitor::LogUploader uploader;

        monitor::Scheduler scheduler(pipeline, health, store, uploader);
        scheduler.SetScanProgressCallback([](const common::ScanProgress &progress)
        {
            if (progress.percent)
                common::LogDebug("Progress") << static_cast<int>(*progress.percent) << "% "
                                             << common::ScanStageName(progress.stage);
        });

        InstallSignalHandlers();
        scheduler.Start();
        if (config.scan_interval_seconds)
            scheduler.SetScanInterval(*config.scan_interval_seconds);
        if (config.health_check_interval_seconds)
            scheduler.SetHealthCheckInterval(*config.health_check_interval_seconds);

        common::LogInfo("Agent") << "Running. State in " << config.state_db_path;
        while (!g_stopRequested)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        common::LogInfo("Agent") << "Shutting down";
        scheduler.Stop();
        store.Close();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Agent Error: " << e.what() << '\n';
        return -1;
    }

    return 0;
}
