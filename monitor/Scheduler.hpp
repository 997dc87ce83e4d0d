#pragma once

#include "SchedulerState.hpp"
#include "StateStore.hpp"
#include "Uploader.hpp"
#include "../discovery/DiscoveryPipeline.hpp"
#include "../discovery/Reachability.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace netscout::monitor
{
    struct ScanOutcome
    {
        bool ran = false;       // false when another scan was already in flight
        bool succeeded = false; // scan finished and was merged
        bool cancelled = false;
        bool synced = false;    // uploader accepted the result
        std::size_t device_count = 0;
    };

    // Runs full scans and health checks on two independent timers, keeps the
    // known device set and persists it after every change.
    class Scheduler
    {
    public:
        Scheduler(discovery::DiscoveryPipeline &pipeline, discovery::HealthChecker &health,
                  StateStore &store, Uploader &uploader);
        ~Scheduler();

        Scheduler(const Scheduler &) = delete;
        Scheduler &operator=(const Scheduler &) = delete;

        // Loads persisted state, runs one scan followed by one health check,
        // then keeps both loops going until Stop().
        void Start();
        void Stop();
        bool IsRunning() const;

        // Synchronous. Returns with ran == false when a scan is already running
        // or the scheduler has been stopped.
        ScanOutcome RequestScan();
        bool IsScanning() const;
        void CancelScan();

        std::vector<common::DeviceHealthResult> RunHealthCheck();

        // Takes effect on the running timer: it is re-armed one full new
        // interval from now. Values are clamped to [1, kMaxIntervalSeconds].
        void SetScanInterval(std::uint64_t seconds);
        std::uint64_t GetScanInterval() const;
        void SetHealthCheckInterval(std::uint64_t seconds);
        std::uint64_t GetHealthCheckInterval() const;

        std::vector<common::Device> KnownDevices() const;
        std::uint64_t LastScanTime() const;

        void SetScanProgressCallback(common::ProgressCallback callback);
        void SetHealthProgressCallback(common::HealthProgressCallback callback);

        // Forgets all known devices and wipes the persisted state.
        bool ClearState();

    private:
        enum class Timer
        {
            Scan,
            Health
        };

        void ScanLoop();
        void HealthLoop();

        // Blocks until the timer fires (true) or the scheduler stops (false).
        bool WaitForTick(Timer timer);

        void Persist();
        void EmitHealth(const common::HealthProgressCallback &callback, common::HealthCheckStage stage,
                        const std::string &message, std::size_t total, std::size_t healthy);

        discovery::DiscoveryPipeline &m_pipeline;
        discovery::HealthChecker &m_health;
        StateStore &m_store;
        Uploader &m_uploader;

        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        SchedulerState m_state;
        std::uint64_t m_scanIntervalGeneration = 0;
        std::uint64_t m_healthIntervalGeneration = 0;
        common::ProgressCallback m_scanProgress;
        common::HealthProgressCallback m_healthProgress;

        std::mutex m_persistMutex;
        std::mutex m_healthRunMutex;

        std::atomic<bool> m_running;
        std::atomic<bool> m_scanning;
        std::atomic<bool> m_stopping;
        std::thread m_scanThread;
        std::thread m_healthThread;
    };
}
