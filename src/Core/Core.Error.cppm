module;

#include <cstdint>
#include <expected>
#include <string_view>
#include <type_traits>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Failure classes
    // -------------------------------------------------------------------------
    // Fatal (Core::Panic / Core::Verify): pool or queue capacity exhausted,
    // out-of-range or stale handle passed to Resolve/Release, precondition
    // violated (double free, push past the end of a buffer).
    //
    // Core::Expected<T>: queries whose caller picks the policy, e.g.
    // SlotPool::TryResolve on a handle that may have been released, or
    // BlockAllocator::TryAlloc when every chunk may be taken.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Handles (100-199)
        InvalidHandle = 100,
        StaleHandle = 101,

        // Capacity (200-299)
        PoolExhausted = 200,
        ArenaExhausted = 201,
        QueueFull = 202,

        // Validation (300-399)
        InvalidArgument = 300,
        OutOfRange = 301,
        SizeMismatch = 302,

        // Backend (400-499)
        BackendFailure = 400,

        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:         return "Success";
            case ErrorCode::InvalidHandle:   return "InvalidHandle";
            case ErrorCode::StaleHandle:     return "StaleHandle";
            case ErrorCode::PoolExhausted:   return "PoolExhausted";
            case ErrorCode::ArenaExhausted:  return "ArenaExhausted";
            case ErrorCode::QueueFull:       return "QueueFull";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::OutOfRange:      return "OutOfRange";
            case ErrorCode::SizeMismatch:    return "SizeMismatch";
            case ErrorCode::BackendFailure:  return "BackendFailure";
            default:                         return "Unknown";
        }
    }

    // Codes in the 100 block mean the caller held on to a handle too long.
    constexpr bool IsHandleError(ErrorCode code)
    {
        const auto value = static_cast<uint32_t>(code);
        return value >= 100 && value < 200;
    }

    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    template<typename T>
    constexpr Expected<std::decay_t<T>> Ok(T&& value)
    {
        return Expected<std::decay_t<T>>(std::forward<T>(value));
    }

    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    struct Unit {};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(Unit{});
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
