#include "NetworkInspector.hpp"

#if defined(_WIN32)
#include "WindowsInspector.hpp"
#elif defined(__APPLE__)
#include "MacInspector.hpp"
#else
#include "LinuxInspector.hpp"
#endif

namespace netscout::discovery
{
    std::unique_ptr<NetworkInspector> CreatePlatformInspector()
    {
#if defined(_WIN32)
        return std::make_unique<WindowsInspector>();
#elif defined(__APPLE__)
        return std::make_unique<MacInspector>();
#else
        return std::make_unique<LinuxInspector>();
#endif
    }
}
