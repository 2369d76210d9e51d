module;

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <span>

#include <glm/glm.hpp>

module Graphics:Batcher.Impl;

import :Batcher;
import :InstanceData;
import :TextureRegistry;
import RHI;
import Core;

namespace Graphics
{
    namespace
    {
        RHI::TextureHandle CreateWhiteTexture(RHI::Device& device)
        {
            static constexpr std::array<std::byte, 4> kWhitePixel = {
                std::byte{0xFF}, std::byte{0xFF}, std::byte{0xFF}, std::byte{0xFF}
            };

            RHI::TextureDesc desc{};
            desc.Label = "batcher-white";
            desc.Width = 1;
            desc.Height = 1;
            desc.Format = RHI::PixelFormat::RGBA8Unorm;
            desc.Pixels = kWhitePixel;
            return device.CreateTexture(desc);
        }

        RHI::BufferHandle CreateQuadVertices(RHI::Device& device)
        {
            const auto bytes = std::as_bytes(std::span(kQuadVertices));
            return device.CreateBuffer({"batcher-quad-vertices", bytes.size(), RHI::BufferUsage::Vertex}, bytes);
        }

        RHI::BufferHandle CreateQuadIndices(RHI::Device& device)
        {
            const auto bytes = std::as_bytes(std::span(kQuadIndices));
            return device.CreateBuffer({"batcher-quad-indices", bytes.size(), RHI::BufferUsage::Index}, bytes);
        }

        size_t InstanceBufferSize(const BatcherConfig& config)
        {
            Core::Verify(config.InstanceCapacity > 0, "Batcher: InstanceCapacity must be at least 1");
            Core::Verify(config.MaxFlushesPerFrame > 0, "Batcher: MaxFlushesPerFrame must be at least 1");
            return static_cast<size_t>(config.InstanceCapacity) * config.MaxFlushesPerFrame * sizeof(ShapeInstance);
        }
    }

    Batcher::Batcher(RHI::Device& device, const BatcherConfig& config)
        : m_Device(device)
        , m_Config(config)
        , m_InstanceBufferSize(InstanceBufferSize(config))
        , m_WhiteTexture(CreateWhiteTexture(device))
        , m_QuadVertices(CreateQuadVertices(device))
        , m_QuadIndices(CreateQuadIndices(device))
        , m_InstanceBuffer(device.CreateBufferZeroed({"batcher-instances", m_InstanceBufferSize,
                                                      RHI::BufferUsage::Instance}))
        , m_ArgumentTable(device.CreateArgumentTable({"batcher-textures", config.MaxTextures}))
        , m_Textures(config.MaxTextures, m_WhiteTexture)
        , m_StagingArena(sizeof(ShapeInstance) * config.InstanceCapacity + Core::Memory::kCacheLine)
        , m_Staging(m_StagingArena.CarveArray<ShapeInstance>(config.InstanceCapacity, "Batcher staging"))
    {
        Core::Log::Info("Batcher created: {} instances per flush, {} flushes per frame ({} KiB instance buffer), "
                        "{} texture slots",
                        config.InstanceCapacity, config.MaxFlushesPerFrame, m_InstanceBufferSize / 1024,
                        config.MaxTextures);
    }

    Batcher::~Batcher()
    {
        m_Device.DestroyArgumentTable(m_ArgumentTable);
        m_Device.DestroyBuffer(m_InstanceBuffer);
        m_Device.DestroyBuffer(m_QuadIndices);
        m_Device.DestroyBuffer(m_QuadVertices);
        m_Device.DestroyTexture(m_WhiteTexture);
    }

    uint32_t Batcher::RegisterTexture(RHI::TextureHandle texture)
    {
        Core::Verify(m_Device.IsAlive(texture), "Batcher: registering a destroyed texture");
        return m_Textures.Register(texture);
    }

    void Batcher::BeginFrame()
    {
        m_RunningOffset = 0;
        m_PendingCount = 0;
        m_Stats = {};
    }

    void Batcher::Submit(const ShapeInstance& instance)
    {
        if (instance.TextureIndex >= m_Textures.Size())
        {
            Core::Panic(std::format("Batcher: instance references texture index {} but only {} are registered",
                                    instance.TextureIndex, m_Textures.Size()));
        }
        VerifyTextureAlive(instance.TextureIndex);

        if (m_PendingCount == m_Config.InstanceCapacity)
        {
            Flush();
            ++m_Stats.AutoFlushes;
        }

        m_Staging[m_PendingCount++] = instance;
    }

    void Batcher::VerifyTextureAlive(uint32_t textureIndex) const
    {
        const RHI::TextureHandle texture = m_Textures.Resolve(textureIndex);
        if (!m_Device.IsAlive(texture))
        {
            Core::Panic(std::format("Batcher: registered texture destroyed (index {}, texture {}:{})",
                                    textureIndex, texture.Index, texture.Generation));
        }
    }

    void Batcher::Flush()
    {
        if (m_PendingCount == 0)
            return;

        const size_t bytes = static_cast<size_t>(m_PendingCount) * sizeof(ShapeInstance);
        if (m_RunningOffset + bytes > m_InstanceBufferSize)
        {
            Core::Panic(std::format("Batcher: flush of {} instances at offset {} overruns the {}-byte instance "
                                    "buffer (MaxFlushesPerFrame {})",
                                    m_PendingCount, m_RunningOffset, m_InstanceBufferSize,
                                    m_Config.MaxFlushesPerFrame));
        }

        // A texture destroyed after Submit would leave a dead native in the table.
        for (const ShapeInstance& instance : m_Staging.first(m_PendingCount))
            VerifyTextureAlive(instance.TextureIndex);

        // 1. Argument table
        if (m_Textures.IsDirty())
        {
            m_Textures.Encode(m_Device, m_ArgumentTable);
            ++m_Stats.ArgumentTableEncodes;
        }

        // 2. Upload
        m_Device.PushBuffer(m_InstanceBuffer, m_RunningOffset, std::as_bytes(m_Staging.first(m_PendingCount)));

        // 3. Binds
        m_Device.Submit(RHI::Cmd::BindBuffer{m_QuadVertices, RHI::ShaderStage::Vertex, m_Config.QuadVertexSlot, 0});
        m_Device.Submit(RHI::Cmd::BindBuffer{m_InstanceBuffer, RHI::ShaderStage::Vertex, m_Config.InstanceSlot,
                                             m_RunningOffset});
        m_Device.Submit(RHI::Cmd::BindArgumentTable{m_ArgumentTable, RHI::ShaderStage::Fragment,
                                                    m_Config.ArgumentTableSlot});

        // 4. Draw
        m_Device.Submit(RHI::Cmd::DrawIndexedInstanced{
            RHI::PrimitiveTopology::Triangle,
            m_QuadIndices,
            RHI::IndexType::UInt16,
            static_cast<uint32_t>(kQuadIndices.size()),
            0,
            m_PendingCount
        });

        // 5. Advance
        m_RunningOffset += bytes;
        m_Stats.Instances += m_PendingCount;
        ++m_Stats.Flushes;
        m_PendingCount = 0;
    }

    // -------------------------------------------------------------------------
    // Shape helpers
    // -------------------------------------------------------------------------

    void Batcher::DrawRect(const glm::vec2& center, const glm::vec2& size, const glm::vec4& color, float rotation)
    {
        ShapeInstance instance{};
        instance.Position = center;
        instance.Scale = size;
        instance.Rotation = rotation;
        instance.Kind = static_cast<uint32_t>(ShapeKind::Rect);
        instance.Color = color;
        Submit(instance);
    }

    void Batcher::DrawRoundedRect(const glm::vec2& center, const glm::vec2& size, float cornerRadius,
                                  const glm::vec4& color, float rotation)
    {
        ShapeInstance instance{};
        instance.Position = center;
        instance.Scale = size;
        instance.Rotation = rotation;
        instance.Kind = static_cast<uint32_t>(ShapeKind::RoundedRect);
        instance.Color = color;
        instance.Params.x = cornerRadius;
        Submit(instance);
    }

    void Batcher::DrawCircle(const glm::vec2& center, float radius, const glm::vec4& color)
    {
        ShapeInstance instance{};
        instance.Position = center;
        instance.Scale = glm::vec2(radius * 2.0f);
        instance.Kind = static_cast<uint32_t>(ShapeKind::Circle);
        instance.Color = color;
        instance.Params.x = radius;
        Submit(instance);
    }

    void Batcher::DrawRing(const glm::vec2& center, float radius, float thickness, const glm::vec4& color)
    {
        ShapeInstance instance{};
        instance.Position = center;
        instance.Scale = glm::vec2(radius * 2.0f);
        instance.Kind = static_cast<uint32_t>(ShapeKind::Ring);
        instance.Color = color;
        instance.Params.x = radius;
        instance.Params.y = thickness;
        Submit(instance);
    }

    // A line is a rect stretched between the endpoints.
    void Batcher::DrawLine(const glm::vec2& from, const glm::vec2& to, float thickness, const glm::vec4& color)
    {
        const glm::vec2 delta = to - from;

        ShapeInstance instance{};
        instance.Position = (from + to) * 0.5f;
        instance.Scale = {glm::length(delta), thickness};
        instance.Rotation = std::atan2(delta.y, delta.x);
        instance.Kind = static_cast<uint32_t>(ShapeKind::Line);
        instance.Color = color;
        instance.Params.x = thickness;
        Submit(instance);
    }

    void Batcher::DrawSprite(const glm::vec2& center, const glm::vec2& size, uint32_t textureIndex,
                             const glm::vec4& uvRect, const glm::vec4& tint, float rotation)
    {
        ShapeInstance instance{};
        instance.Position = center;
        instance.Scale = size;
        instance.Rotation = rotation;
        instance.Kind = static_cast<uint32_t>(ShapeKind::Sprite);
        instance.TextureIndex = textureIndex;
        instance.Color = tint;
        instance.UVRect = uvRect;
        Submit(instance);
    }
}
