module;

#include <cstdint>
#include <format>
#include <span>
#include <string_view>
#include <type_traits>

export module Core:SlotPool;

import :Error;
import :Handle;
import :Memory;
import :Assert;

export namespace Core
{
    // -------------------------------------------------------------------------
    // SlotPool - fixed-capacity registry of typed slots addressed by handle
    // -------------------------------------------------------------------------
    // - Storage is carved from a LinearArena once, at construction, and never
    //   grows. Slot addresses are therefore stable for the pool's lifetime.
    // - Acquire() scans in index order for the first dead slot. Capacities are
    //   small (tens of slots) and acquisition is rare compared to per-frame
    //   command traffic, so a linear scan is enough.
    // - Every Acquire() bumps the slot generation. Resolve() and Release()
    //   reject handles whose generation no longer matches (stale handles).
    // - Exhaustion and invalid handles are fatal.
    // - Release() does not touch the payload; callers free whatever backend
    //   object the payload refers to before releasing the slot.
    // -------------------------------------------------------------------------
    template <typename T, typename Tag>
    class SlotPool
    {
    public:
        using Handle = StrongHandle<Tag>;

        struct Slot
        {
            T Payload{};
            uint32_t Generation = 0;
            bool IsAlive = false;
        };

        static_assert(std::is_trivially_destructible_v<T>,
                      "SlotPool storage lives in a LinearArena; payloads must be trivially destructible.");

        SlotPool(Memory::LinearArena& arena, uint32_t capacity, std::string_view name)
            : m_Name(name)
        {
            m_Slots = arena.CarveArray<Slot>(capacity, std::format("SlotPool '{}'", m_Name));
        }

        SlotPool(const SlotPool&) = delete;
        SlotPool& operator=(const SlotPool&) = delete;

        [[nodiscard]] Handle Acquire()
        {
            for (uint32_t i = 0; i < Capacity(); ++i)
            {
                Slot& slot = m_Slots[i];
                if (!slot.IsAlive)
                {
                    slot.IsAlive = true;
                    ++slot.Generation;
                    ++m_LiveCount;
                    return {i, slot.Generation};
                }
            }

            Panic(std::format("SlotPool '{}': pool exhausted (capacity {})", m_Name, Capacity()));
        }

        [[nodiscard]] T& Resolve(Handle handle)
        {
            VerifyLive(handle, "Resolve");
            return m_Slots[handle.Index].Payload;
        }

        [[nodiscard]] const T& Resolve(Handle handle) const
        {
            VerifyLive(handle, "Resolve");
            return m_Slots[handle.Index].Payload;
        }

        [[nodiscard]] Expected<T*> TryResolve(Handle handle)
        {
            if (handle.Index >= Capacity())
                return std::unexpected(ErrorCode::InvalidHandle);

            Slot& slot = m_Slots[handle.Index];
            if (!slot.IsAlive || slot.Generation != handle.Generation)
                return std::unexpected(ErrorCode::StaleHandle);

            return &slot.Payload;
        }

        void Release(Handle handle)
        {
            VerifyLive(handle, "Release");
            Slot& slot = m_Slots[handle.Index];
            slot.IsAlive = false;
            --m_LiveCount;
        }

        [[nodiscard]] bool IsAlive(Handle handle) const
        {
            if (handle.Index >= Capacity()) return false;
            const Slot& slot = m_Slots[handle.Index];
            return slot.IsAlive && slot.Generation == handle.Generation;
        }

        // Visits every live slot in index order.
        template <typename Fn>
        void ForEachLive(Fn&& fn)
        {
            for (uint32_t i = 0; i < Capacity(); ++i)
            {
                Slot& slot = m_Slots[i];
                if (slot.IsAlive)
                    fn(Handle{i, slot.Generation}, slot.Payload);
            }
        }

        [[nodiscard]] uint32_t Capacity() const { return static_cast<uint32_t>(m_Slots.size()); }
        [[nodiscard]] uint32_t LiveCount() const { return m_LiveCount; }
        [[nodiscard]] std::string_view Name() const { return m_Name; }

    private:
        void VerifyLive(Handle handle, std::string_view op) const
        {
            if (handle.Index >= Capacity())
            {
                Panic(std::format("SlotPool '{}': {} of out-of-range handle {} (capacity {})",
                                  m_Name, op, handle.Index, Capacity()));
            }

            const Slot& slot = m_Slots[handle.Index];
            if (!slot.IsAlive || slot.Generation != handle.Generation)
            {
                Panic(std::format("SlotPool '{}': {} of stale handle {}:{} (slot generation {}, alive {})",
                                  m_Name, op, handle.Index, handle.Generation, slot.Generation, slot.IsAlive));
            }
        }

        std::span<Slot> m_Slots;
        uint32_t m_LiveCount = 0;
        std::string_view m_Name;
    };
}
