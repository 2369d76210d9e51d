module;

#include <cstdlib>
#include <source_location>
#include <string_view>

module Core:Assert.Impl;

import :Assert;
import :Logging;

namespace Core
{
    void Panic(std::string_view message, std::source_location loc)
    {
        Log::Error("FATAL: {} ({}:{} in {})", message, loc.file_name(), loc.line(), loc.function_name());
        std::abort();
    }
}
