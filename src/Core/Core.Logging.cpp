module;

#include <atomic>
#include <iostream>
#include <mutex>
#include <string_view>

module Core:Logging.Impl;

import :Logging;

namespace Core::Log
{
    namespace
    {
        std::mutex s_SinkMutex;
        std::atomic<Level> s_MinLevel{Level::Debug};
        std::atomic<bool> s_Color{true};

        Counters s_Counters{};

        struct Style
        {
            const char* Color;
            const char* Label;
        };

        constexpr Style StyleFor(Level level)
        {
            switch (level)
            {
            case Level::Debug:   return {"\033[36m", "[DBG]  "};
            case Level::Info:    return {"\033[32m", "[INFO] "};
            case Level::Warning: return {"\033[33m", "[WARN] "};
            case Level::Error:   return {"\033[31m", "[ERR]  "};
            }
            return {"\033[0m", "[?]    "};
        }
    }

    void SetMinLevel(Level level) { s_MinLevel.store(level, std::memory_order_relaxed); }

    Level GetMinLevel() { return s_MinLevel.load(std::memory_order_relaxed); }

    bool IsEnabled(Level level)
    {
        return level == Level::Error || level >= s_MinLevel.load(std::memory_order_relaxed);
    }

    void SetColorOutput(bool enabled) { s_Color.store(enabled, std::memory_order_relaxed); }

    Counters GetCounters()
    {
        std::lock_guard lock(s_SinkMutex);
        return s_Counters;
    }

    void ResetCounters()
    {
        std::lock_guard lock(s_SinkMutex);
        s_Counters = {};
    }

    void Write(Level level, std::string_view message)
    {
        std::lock_guard lock(s_SinkMutex);

        switch (level)
        {
        case Level::Debug:   ++s_Counters.Debug; break;
        case Level::Info:    ++s_Counters.Info; break;
        case Level::Warning: ++s_Counters.Warnings; break;
        case Level::Error:   ++s_Counters.Errors; break;
        }

        const Style style = StyleFor(level);
        std::ostream& out = (level == Level::Error) ? std::cerr : std::cout;
        if (s_Color.load(std::memory_order_relaxed))
            out << style.Color << style.Label << message << "\033[0m" << std::endl;
        else
            out << style.Label << message << std::endl;
    }
}
