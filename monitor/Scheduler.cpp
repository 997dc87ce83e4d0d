#include "Scheduler.hpp"
#include "../common/Log.hpp"
#include "../discovery/DeviceMerge.hpp"

#include <chrono>
#include <unordered_map>

namespace netscout::monitor
{
    namespace
    {
        std::uint64_t UnixNow()
        {
            return static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::seconds>(
                    std::chrono::system_clock::now().time_since_epoch())
                    .count());
        }
    }

    Scheduler::Scheduler(discovery::DiscoveryPipeline &pipeline, discovery::HealthChecker &health,
                         StateStore &store, Uploader &uploader)
        : m_pipeline(pipeline), m_health(health), m_store(store), m_uploader(uploader),
          m_running(false), m_scanning(false), m_stopping(false)
    {
    }

    Scheduler::~Scheduler()
    {
        Stop();
    }

    void Scheduler::Start()
    {
        if (m_running.exchange(true))
            return;
        m_stopping = false;

        {
            SchedulerState loaded = m_store.Load();
            std::lock_guard<std::mutex> lock(m_mutex);
            m_state = loaded;
        }

        common::LogInfo("Scheduler") << "Starting with " << m_state.known_devices.size()
                                     << " known devices, scan every " << m_state.scan_interval_seconds
                                     << "s, health check every " << m_state.health_check_interval_seconds << "s";

        m_scanThread = std::thread(&Scheduler::ScanLoop, this);
        m_healthThread = std::thread(&Scheduler::HealthLoop, this);
    }

    void Scheduler::Stop()
    {
        // Raised before looking at m_scanning; RequestScan checks it after
        // raising m_scanning, so one side always sees the other.
        m_stopping = true;
        if (m_scanning)
            CancelScan();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running && !m_scanThread.joinable() && !m_healthThread.joinable())
                return;
            m_running = false;
        }
        m_cv.notify_all();

        if (m_scanThread.joinable())
            m_scanThread.join();
        if (m_healthThread.joinable())
            m_healthThread.join();

        common::LogInfo("Scheduler") << "Stopped";
    }

    bool Scheduler::IsRunning() const
    {
        return m_running;
    }

    bool Scheduler::IsScanning() const
    {
        return m_scanning;
    }

    void Scheduler::CancelScan()
    {
        common::LogInfo("Scheduler") << "Scan cancellation requested";
        m_pipeline.Cancel().RequestCancel();
    }

    void Scheduler::ScanLoop()
    {
        common::LogInfo("Scheduler") << "Running initial scan sequence";
        RequestScan();
        if (m_running)
            RunHealthCheck();

        while (WaitForTick(Timer::Scan))
            RequestScan();
    }

    void Scheduler::HealthLoop()
    {
        while (WaitForTick(Timer::Health))
            RunHealthCheck();
    }

    bool Scheduler::WaitForTick(Timer timer)
    {
        using Clock = std::chrono::steady_clock;

        std::unique_lock<std::mutex> lock(m_mutex);

        auto generation = [&]()
        {
            return timer == Timer::Scan ? m_scanIntervalGeneration : m_healthIntervalGeneration;
        };
        auto interval = [&]()
        {
            return std::chrono::seconds(timer == Timer::Scan ? m_state.scan_interval_seconds
                                                             : m_state.health_check_interval_seconds);
        };

        std::uint64_t armedGeneration = generation();
        auto deadline = Clock::now() + interval();

        while (m_running)
        {
            if (generation() != armedGeneration)
            {
                // Interval changed while waiting: rebuild the timer and drop this tick.
                armedGeneration = generation();
                deadline = Clock::now() + interval();
                continue;
            }
            if (Clock::now() >= deadline)
                return true;
            m_cv.wait_until(lock, deadline);
        }
        return false;
    }

    ScanOutcome Scheduler::RequestScan()
    {
        ScanOutcome outcome;
        if (m_scanning.exchange(true))
        {
            common::LogDebug("Scheduler") << "Scan already in progress, skipping";
            return outcome;
        }
        m_pipeline.Cancel().Clear();
        if (m_stopping)
        {
            common::LogDebug("Scheduler") << "Scheduler stopping, scan skipped";
            m_scanning = false;
            return outcome;
        }
        outcome.ran = true;

        common::ProgressCallback progress;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            progress = m_scanProgress;
        }

        try
        {
            common::ScanResult result = m_pipeline.RunDiscovery(progress, false);
            outcome.device_count = result.devices.size();

            if (result.cancelled)
            {
                outcome.cancelled = true;
                common::LogInfo("Scheduler") << "Scan cancelled, keeping the previous device set";
            }
            else
            {
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_state.last_scan_time = UnixNow();
                    m_state.known_devices = discovery::MergePreservingHealth(result.devices, m_state.known_devices);
                }
                Persist();
                outcome.succeeded = true;

                common::LogInfo("Scheduler") << "Scan found " << result.devices.size() << " devices (gateway: "
                                             << result.network_info.gateway_ip.value_or("none") << ")";

                outcome.synced = m_uploader.UploadScan(result);
                if (outcome.synced)
                    common::LogInfo("Scheduler") << "Scan synced";
                else
                    common::LogWarn("Scheduler") << "Failed to upload scan";
            }
        }
        catch (const std::exception &e)
        {
            common::LogError("Scheduler") << "Scan failed: " << e.what();
        }

        m_scanning = false;
        return outcome;
    }

    void Scheduler::EmitHealth(const common::HealthProgressCallback &callback, common::HealthCheckStage stage,
                               const std::string &message, std::size_t total, std::size_t healthy)
    {
        if (!callback)
            return;

        common::HealthCheckProgress progress;
        progress.stage = stage;
        progress.message = message;
        progress.total_devices = total;
        progress.checked_devices = total;
        progress.healthy_devices = healthy;
        try
        {
            callback(progress);
        }
        catch (const std::exception &e)
        {
            common::LogWarn("Scheduler") << "Health progress callback threw: " << e.what();
        }
    }

    std::vector<common::DeviceHealthResult> Scheduler::RunHealthCheck()
    {
        std::lock_guard<std::mutex> runLock(m_healthRunMutex);

        std::vector<common::Device> devices;
        common::HealthProgressCallback progress;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            devices = m_state.known_devices;
            progress = m_healthProgress;
        }

        if (devices.empty())
        {
            EmitHealth(progress, common::HealthCheckStage::Complete, "No devices to check", 0, 0);
            return {};
        }

        common::LogInfo("Scheduler") << "Running health checks on " << devices.size() << " devices";

        std::vector<common::DeviceHealthResult> results;
        try
        {
            results = m_health.Run(devices, progress);
        }
        catch (const std::exception &e)
        {
            common::LogError("Scheduler") << "Health check failed: " << e.what();
            return {};
        }

        std::unordered_map<std::string, const common::DeviceHealthResult *> byIp;
        std::size_t healthy = 0;
        for (const auto &result : results)
        {
            byIp.emplace(result.ip, &result);
            if (result.reachable)
                ++healthy;
        }

        {
            // A scan may have replaced the set meanwhile; apply by IP.
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto &device : m_state.known_devices)
            {
                auto it = byIp.find(device.ip);
                if (it != byIp.end())
                    device.response_time_ms = it->second->response_time_ms;
            }
        }
        Persist();

        EmitHealth(progress, common::HealthCheckStage::Uploading, "Syncing results...", results.size(), healthy);

        bool uploaded = false;
        try
        {
            uploaded = m_uploader.UploadHealth(results);
        }
        catch (const std::exception &e)
        {
            common::LogWarn("Scheduler") << "Health upload threw: " << e.what();
        }
        if (!uploaded)
            common::LogWarn("Scheduler") << "Failed to upload health check";

        EmitHealth(progress, common::HealthCheckStage::Complete,
                   "Health check complete: " + std::to_string(healthy) + " healthy, " +
                       std::to_string(results.size() - healthy) + " unreachable",
                   results.size(), healthy);
        return results;
    }

    void Scheduler::Persist()
    {
        std::lock_guard<std::mutex> persistLock(m_persistMutex);

        SchedulerState snapshot;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            snapshot = m_state;
        }

        if (!m_store.Save(snapshot))
            common::LogWarn("Scheduler") << "Failed to persist state";
    }

    void Scheduler::SetScanInterval(std::uint64_t seconds)
    {
        seconds = ClampInterval(seconds);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_state.scan_interval_seconds == seconds)
                return;
            m_state.scan_interval_seconds = seconds;
            ++m_scanIntervalGeneration;
        }
        m_cv.notify_all();
        common::LogInfo("Scheduler") << "Scan interval set to " << seconds << "s";
        Persist();
    }

    std::uint64_t Scheduler::GetScanInterval() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state.scan_interval_seconds;
    }

    void Scheduler::SetHealthCheckInterval(std::uint64_t seconds)
    {
        seconds = ClampInterval(seconds);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_state.health_check_interval_seconds == seconds)
                return;
            m_state.health_check_interval_seconds = seconds;
            ++m_healthIntervalGeneration;
        }
        m_cv.notify_all();
        common::LogInfo("Scheduler") << "Health check interval set to " << seconds << "s";
        Persist();
    }

    std::uint64_t Scheduler::GetHealthCheckInterval() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state.health_check_interval_seconds;
    }

    std::vector<common::Device> Scheduler::KnownDevices() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state.known_devices;
    }

    std::uint64_t Scheduler::LastScanTime() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state.last_scan_time;
    }

    void Scheduler::SetScanProgressCallback(common::ProgressCallback callback)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_scanProgress = std::move(callback);
    }

    void Scheduler::SetHealthProgressCallback(common::HealthProgressCallback callback)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_healthProgress = std::move(callback);
    }

    bool Scheduler::ClearState()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_state.known_devices.clear();
            m_state.last_scan_time = 0;
        }
        std::lock_guard<std::mutex> persistLock(m_persistMutex);
        bool cleared = m_store.Clear();
        if (!cleared)
            common::LogWarn("Scheduler") << "Failed to clear persisted state";
        return cleared;
    }
}
