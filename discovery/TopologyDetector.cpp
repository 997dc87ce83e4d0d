#include "TopologyDetector.hpp"
#include "OutputParsers.hpp"
#include "../common/Log.hpp"
#include "../common/ScanError.hpp"
#include "../common/Subnet.hpp"

namespace netscout::discovery
{
    std::optional<common::NetworkInfo> TopologyDetector::SelectTopology(const std::vector<common::NetworkInfo> &candidates)
    {
        const common::NetworkInfo *physical = nullptr;
        const common::NetworkInfo *any = nullptr;

        for (const auto &candidate : candidates)
        {
            if (!common::IsUsableSubnet(candidate.subnet))
                continue;

            bool isVirtual = IsVirtualAdapterName(candidate.interface);
            if (!isVirtual && candidate.gateway_ip)
                return candidate;

            if (!isVirtual && !physical)
                physical = &candidate;
            if (!any)
                any = &candidate;
        }

        if (physical)
            return *physical;
        if (any)
            return *any;
        return std::nullopt;
    }

    common::NetworkInfo TopologyDetector::Detect()
    {
        auto primary = SelectTopology(m_inspector.QueryTopology());
        if (primary)
            return *primary;

        common::LogWarn("Topology") << "Primary network query gave no usable subnet, trying fallback";

        auto fallback = SelectTopology(m_inspector.QueryTopologyFallback());
        if (fallback)
            return *fallback;

        throw common::ScanError(common::ScanErrorKind::NetworkNotAvailable,
                                "Could not determine the local network");
    }
}
