#include "Log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace netscout::common
{
    namespace
    {
        std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
        std::mutex g_output_mutex;
    }

    void SetLogLevel(LogLevel level)
    {
        g_level.store(static_cast<int>(level));
    }

    LogLevel GetLogLevel()
    {
        return static_cast<LogLevel>(g_level.load());
    }

    void InitLogLevelFromEnv()
    {
        const char *value = std::getenv("NETSCOUT_LOG_LEVEL");
        if (!value)
            return;

        std::string level(value);
        if (level == "error")
            SetLogLevel(LogLevel::Error);
        else if (level == "warn")
            SetLogLevel(LogLevel::Warn);
        else if (level == "info")
            SetLogLevel(LogLevel::Info);
        else if (level == "debug")
            SetLogLevel(LogLevel::Debug);
    }

    LogLine::LogLine(LogLevel level, const char *tag)
        : m_level(level), m_enabled(static_cast<int>(level) <= g_level.load())
    {
        if (m_enabled)
            m_stream << "[" << tag << "] ";
    }

    LogLine::~LogLine()
    {
        if (!m_enabled)
            return;

        std::lock_guard<std::mutex> lock(g_output_mutex);
        if (m_level == LogLevel::Error || m_level == LogLevel::Warn)
            std::cerr << m_stream.str() << "\n";
        else
            std::cout << m_stream.str() << "\n";
    }
}
