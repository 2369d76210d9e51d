module;
#include <cstdint>
#include <format>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    enum class Level : uint8_t
    {
        Debug,
        Info,
        Warning,
        Error
    };

    struct Counters
    {
        uint64_t Debug = 0;
        uint64_t Info = 0;
        uint64_t Warnings = 0;
        uint64_t Errors = 0;
    };

    // Messages below the threshold are dropped before formatting.
    // Error is never dropped.
    void SetMinLevel(Level level);
    [[nodiscard]] Level GetMinLevel();
    [[nodiscard]] bool IsEnabled(Level level);

    void SetColorOutput(bool enabled);

    // Emitted-message counts since start (or the last reset).
    [[nodiscard]] Counters GetCounters();
    void ResetCounters();

    // Serialized sink. Error goes to stderr, everything else to stdout.
    void Write(Level level, std::string_view message);

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (IsEnabled(Level::Info))
            Write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (IsEnabled(Level::Warning))
            Write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        Write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Compiled out under NDEBUG.
    template<typename... Args>
    void Debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args&&... args)
    {
#ifndef NDEBUG
        if (IsEnabled(Level::Debug))
            Write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
