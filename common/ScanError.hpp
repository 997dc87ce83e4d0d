#pragma once

#include <stdexcept>
#include <string>

namespace netscout::common
{
    enum class ScanErrorKind
    {
        PrivilegeRequired,
        NetworkNotAvailable,
        Timeout,
        Cancelled,
        General
    };

    inline const char *ScanErrorKindName(ScanErrorKind kind)
    {
        switch (kind)
        {
        case ScanErrorKind::PrivilegeRequired:
            return "privilege_required";
        case ScanErrorKind::NetworkNotAvailable:
            return "network_not_available";
        case ScanErrorKind::Timeout:
            return "timeout";
        case ScanErrorKind::Cancelled:
            return "cancelled";
        case ScanErrorKind::General:
            return "general";
        }
        return "general";
    }

    class ScanError : public std::runtime_error
    {
    public:
        ScanError(ScanErrorKind kind, const std::string &message)
            : std::runtime_error(message), m_kind(kind) {}

        ScanErrorKind Kind() const { return m_kind; }

    private:
        ScanErrorKind m_kind;
    };
}
