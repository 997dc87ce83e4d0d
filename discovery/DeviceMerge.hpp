#pragma once

#include "../common/Device.hpp"

#include <vector>

namespace netscout::discovery
{
    // One record per IP in first-seen order. Later duplicates only fill
    // fields the first record lacks; timing is taken when the kept value is
    // absent, or zero and the duplicate's is positive.
    std::vector<common::Device> DedupByIp(const std::vector<common::Device> &devices);

    // `fresh` is the new scan, `known` the previous device set. Devices only
    // in `known` are dropped. Shared devices keep the old timing when the
    // fresh one is absent or zero, and the old hostname when the fresh one is absent.
    std::vector<common::Device> MergePreservingHealth(const std::vector<common::Device> &fresh,
                                                      const std::vector<common::Device> &known);

    // Ping timing replaces ARP timing for the same IP; new IPs are appended.
    void MergeSweepIntoArp(std::vector<common::Device> &arp, const std::vector<common::Device> &swept);
}
