module;

#include <cstdint>
#include <format>
#include <vector>

module Graphics:TextureRegistry.Impl;

import :TextureRegistry;
import RHI;
import Core;

namespace Graphics
{
    TextureRegistry::TextureRegistry(uint32_t capacity, RHI::TextureHandle fallback)
        : m_Capacity(capacity)
    {
        Core::Verify(capacity > 0, "TextureRegistry: capacity must leave room for the fallback texture");
        Core::Verify(fallback.IsValid(), "TextureRegistry: fallback texture handle is invalid");

        m_Entries.reserve(capacity);
        m_Entries.push_back(fallback);
    }

    uint32_t TextureRegistry::Register(RHI::TextureHandle texture)
    {
        if (m_Entries.size() >= m_Capacity)
        {
            Core::Panic(std::format("TextureRegistry: texture limit reached ({} entries)", m_Capacity));
        }

        const auto index = static_cast<uint32_t>(m_Entries.size());
        m_Entries.push_back(texture);
        m_Dirty = true;

        Core::Log::Debug("TextureRegistry: texture {} -> index {}", texture.Index, index);
        return index;
    }

    RHI::TextureHandle TextureRegistry::Resolve(uint32_t index) const
    {
        if (index >= m_Entries.size())
        {
            Core::Panic(std::format("TextureRegistry: index {} out of range ({} registered)", index,
                                    m_Entries.size()));
        }
        return m_Entries[index];
    }

    void TextureRegistry::Encode(RHI::Device& device, RHI::ArgumentTableHandle table)
    {
        device.EncodeArgumentTableTextures(table, m_Entries);
        m_Dirty = false;
    }
}
