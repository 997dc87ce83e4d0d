#include "DeviceMerge.hpp"

#include <string>
#include <unordered_map>

namespace netscout::discovery
{
    namespace
    {
        template <typename T>
        void FillIfAbsent(std::optional<T> &target, const std::optional<T> &source)
        {
            if (!target && source)
                target = source;
        }
    }

    std::vector<common::Device> DedupByIp(const std::vector<common::Device> &devices)
    {
        std::vector<common::Device> result;
        std::unordered_map<std::string, std::size_t> index;

        for (const auto &device : devices)
        {
            auto it = index.find(device.ip);
            if (it == index.end())
            {
                index.emplace(device.ip, result.size());
                result.push_back(device);
                continue;
            }

            common::Device &existing = result[it->second];
            FillIfAbsent(existing.mac, device.mac);
            FillIfAbsent(existing.hostname, device.hostname);
            FillIfAbsent(existing.vendor, device.vendor);
            FillIfAbsent(existing.device_type, device.device_type);

            if (!existing.response_time_ms ||
                (*existing.response_time_ms == 0.0 && device.response_time_ms && *device.response_time_ms > 0.0))
            {
                if (device.response_time_ms)
                    existing.response_time_ms = device.response_time_ms;
            }
        }
        return result;
    }

    std::vector<common::Device> MergePreservingHealth(const std::vector<common::Device> &fresh,
                                                      const std::vector<common::Device> &known)
    {
        std::unordered_map<std::string, const common::Device *> previous;
        for (const auto &device : known)
            previous.emplace(device.ip, &device);

        std::vector<common::Device> merged;
        merged.reserve(fresh.size());
        for (const auto &device : fresh)
        {
            common::Device updated = device;
            auto it = previous.find(device.ip);
            if (it != previous.end())
            {
                const common::Device &old = *it->second;
                bool freshUntimed = !updated.response_time_ms || *updated.response_time_ms == 0.0;
                if (freshUntimed && old.response_time_ms)
                    updated.response_time_ms = old.response_time_ms;
                if (!updated.hostname && old.hostname)
                    updated.hostname = old.hostname;
            }
            merged.push_back(updated);
        }
        return merged;
    }

    void MergeSweepIntoArp(std::vector<common::Device> &arp, const std::vector<common::Device> &swept)
    {
        std::unordered_map<std::string, std::size_t> index;
        for (std::size_t i = 0; i < arp.size(); ++i)
            index.emplace(arp[i].ip, i);

        for (const auto &pinged : swept)
        {
            auto it = index.find(pinged.ip);
            if (it != index.end())
            {
                arp[it->second].response_time_ms = pinged.response_time_ms;
            }
            else
            {
                index.emplace(pinged.ip, arp.size());
                arp.push_back(pinged);
            }
        }
    }
}
