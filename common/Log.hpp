#pragma once

#include <ios>
#include <sstream>
#include <string>

namespace netscout::common
{
    enum class LogLevel
    {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3
    };

    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel();

    // Reads NETSCOUT_LOG_LEVEL (error|warn|info|debug). Unknown values are ignored.
    void InitLogLevelFromEnv();

    // One log line. Buffered and written on destruction so that lines from
    // concurrent probe tasks never interleave. Errors and warnings go to
    // std::cerr, everything else to std::cout, prefixed with "[Tag] ".
    class LogLine
    {
    public:
        LogLine(LogLevel level, const char *tag);
        ~LogLine();

        LogLine(const LogLine &) = delete;
        LogLine &operator=(const LogLine &) = delete;

        template <typename T>
        LogLine &operator<<(const T &value)
        {
            if (m_enabled)
                m_stream << value;
            return *this;
        }

        LogLine &operator<<(std::ios_base &(*manip)(std::ios_base &))
        {
            if (m_enabled)
                m_stream << manip;
            return *this;
        }

    private:
        LogLevel m_level;
        bool m_enabled;
        std::ostringstream m_stream;
    };

    inline LogLine LogError(const char *tag) { return LogLine(LogLevel::Error, tag); }
    inline LogLine LogWarn(const char *tag) { return LogLine(LogLevel::Warn, tag); }
    inline LogLine LogInfo(const char *tag) { return LogLine(LogLevel::Info, tag); }
    inline LogLine LogDebug(const char *tag) { return LogLine(LogLevel::Debug, tag); }
}
