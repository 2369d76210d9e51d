module;
#include <cstdint>
#include <limits>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongHandle - generational, tag-typed slot reference
    // -------------------------------------------------------------------------
    // Index names a slot in a SlotPool. Generation is the slot's generation at
    // the time the handle was issued; the pool bumps it on every reacquire, so
    // a handle kept past Release() stops matching and Resolve() rejects it.
    //
    // The Tag keeps resource kinds apart at compile time:
    //   using BufferHandle  = Core::StrongHandle<struct BufferTag>;
    //   using TextureHandle = Core::StrongHandle<struct TextureTag>;
    //   BufferHandle b = textureHandle; // does not compile
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

        uint32_t Index = kInvalidIndex;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;
        constexpr StrongHandle(uint32_t index, uint32_t generation) : Index(index), Generation(generation) {}

        [[nodiscard]] constexpr bool IsValid() const noexcept { return Index != kInvalidIndex; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return IsValid(); }

        // Same slot, possibly a different lifetime of it.
        [[nodiscard]] constexpr bool IsSameSlot(const StrongHandle& other) const noexcept
        {
            return IsValid() && Index == other.Index;
        }

        constexpr bool operator==(const StrongHandle&) const = default;
    };
}
