#pragma once

#include "NetworkInspector.hpp"
#include "OuiDatabase.hpp"
#include "../common/CancelToken.hpp"
#include "../common/Device.hpp"

namespace netscout::discovery
{
    // One full discovery pass: topology, ARP, ping sweep, hostnames,
    // vendor classification and dedup.
    class DiscoveryPipeline
    {
    public:
        DiscoveryPipeline(NetworkInspector &inspector, const OuiDatabase &oui,
                          common::CancelToken &cancel = common::CancelToken::Global())
            : m_inspector(inspector), m_oui(oui), m_cancel(cancel) {}

        // Throws ScanError(NetworkNotAvailable) when no network can be found.
        // A cancelled sweep still returns, with ScanResult::cancelled set.
        // With clearCancel false a request made before the call is honored;
        // callers that own the token reset it themselves.
        common::ScanResult RunDiscovery(const common::ProgressCallback &progress = nullptr,
                                        bool clearCancel = true);

        NetworkInspector &Inspector() { return m_inspector; }
        common::CancelToken &Cancel() { return m_cancel; }

    private:
        NetworkInspector &m_inspector;
        const OuiDatabase &m_oui;
        common::CancelToken &m_cancel;
    };
}
