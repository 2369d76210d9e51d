module;
#include <cstdint>
#include <span>

export module RHI:CommandQueue;

import :Types;
import :Commands;
import :Backend;
import Core;

export namespace RHI
{
    struct ReplayStats
    {
        uint32_t Commands = 0;
        uint32_t DrawCalls = 0;
        uint64_t InstancesDrawn = 0;
    };

    // -------------------------------------------------------------------------
    // CommandQueue - per-frame, insertion-ordered log of render commands
    // -------------------------------------------------------------------------
    // Storage is carved from the caller's arena once. Insert() past capacity
    // is fatal. Replay() walks the log front to back with no reordering;
    // the Batcher depends on bind/draw pairs staying adjacent. Clear() only
    // resets the count.
    // -------------------------------------------------------------------------
    class CommandQueue
    {
    public:
        CommandQueue(Core::Memory::LinearArena& arena, uint32_t capacity);

        CommandQueue(const CommandQueue&) = delete;
        CommandQueue& operator=(const CommandQueue&) = delete;

        void Insert(const RenderCommand& command);

        ReplayStats Replay(IBackend& backend, const ResourceResolver& resolver) const;

        void Clear() { m_Count = 0; }

        [[nodiscard]] uint32_t Size() const { return m_Count; }
        [[nodiscard]] uint32_t Capacity() const { return static_cast<uint32_t>(m_Storage.size()); }
        [[nodiscard]] bool IsEmpty() const { return m_Count == 0; }
        [[nodiscard]] std::span<const RenderCommand> GetCommands() const { return m_Storage.first(m_Count); }

    private:
        std::span<RenderCommand> m_Storage;
        uint32_t m_Count = 0;
    };
}
