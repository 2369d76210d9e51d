module;
#include <source_location>
#include <string_view>

export module Core:Assert;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Fatal invariant reporting
    // -------------------------------------------------------------------------
    // Panic logs the violated invariant (with call site) at error level and
    // terminates the process. Active in every build configuration: pool and
    // queue capacities are configuration, and running past them would corrupt
    // the frame silently.
    // -------------------------------------------------------------------------
    [[noreturn]] void Panic(std::string_view message,
                            std::source_location loc = std::source_location::current());

    inline void Verify(bool condition, std::string_view message,
                       std::source_location loc = std::source_location::current())
    {
        if (!condition) [[unlikely]]
            Panic(message, loc);
    }
}
