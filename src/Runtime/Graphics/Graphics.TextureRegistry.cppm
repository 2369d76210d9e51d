module;

#include <cstdint>
#include <span>
#include <vector>

export module Graphics:TextureRegistry;

import RHI;

export namespace Graphics
{
    // -------------------------------------------------------------------------
    // TextureRegistry - small-integer indirection for bindless texture access
    // -------------------------------------------------------------------------
    // Index i of the registry is slot i of the Argument Table. Instance records
    // carry the index, so one flush can draw shapes with different textures
    // without a bind per draw.
    //
    // - Index 0 is the fallback texture, fixed at construction.
    // - Register() appends; a full registry is fatal.
    // - Every change sets the dirty flag; Encode() pushes the whole table to
    //   the device and clears it.
    // -------------------------------------------------------------------------
    class TextureRegistry
    {
    public:
        static constexpr uint32_t kFallbackIndex = 0;

        TextureRegistry(uint32_t capacity, RHI::TextureHandle fallback);

        [[nodiscard]] uint32_t Register(RHI::TextureHandle texture);
        [[nodiscard]] RHI::TextureHandle Resolve(uint32_t index) const;

        void Encode(RHI::Device& device, RHI::ArgumentTableHandle table);

        [[nodiscard]] bool IsDirty() const { return m_Dirty; }
        [[nodiscard]] uint32_t Size() const { return static_cast<uint32_t>(m_Entries.size()); }
        [[nodiscard]] uint32_t Capacity() const { return m_Capacity; }
        [[nodiscard]] std::span<const RHI::TextureHandle> GetEntries() const { return m_Entries; }

    private:
        std::vector<RHI::TextureHandle> m_Entries;
        uint32_t m_Capacity;
        bool m_Dirty = true;
    };
}
