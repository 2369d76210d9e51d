module;

#include <cstddef>
#include <cstdint>
#include <span>

#include <glm/glm.hpp>

export module Graphics:Batcher;

import :InstanceData;
import :TextureRegistry;
import RHI;
import Core;

export namespace Graphics
{
    struct BatcherConfig
    {
        uint32_t InstanceCapacity = 4096;   // instances per flush (CPU staging size)
        uint32_t MaxFlushesPerFrame = 16;   // GPU instance buffer holds this many full flushes
        uint32_t MaxTextures = 64;          // registry entries, fallback included

        // Binding slots the shape shaders expect.
        uint32_t QuadVertexSlot = 0;
        uint32_t InstanceSlot = 1;
        uint32_t ArgumentTableSlot = 0;
    };

    struct BatcherStats
    {
        uint32_t Flushes = 0;
        uint32_t AutoFlushes = 0;
        uint64_t Instances = 0;
        uint32_t ArgumentTableEncodes = 0;
    };

    // -------------------------------------------------------------------------
    // Batcher - instanced shape/sprite batching over one shared quad
    // -------------------------------------------------------------------------
    // Contract:
    // - Single-threaded. Call BeginFrame() before the first Submit() of a
    //   frame; otherwise this frame's uploads land on top of last frame's.
    // - Submit() on a full staging array flushes first, so the caller never
    //   sees the capacity.
    // - Flush() emits, in this order: argument table encode (only if the
    //   registry changed), instance upload at the running offset, bind quad
    //   vertices, bind the uploaded instance slice, bind the argument table,
    //   one DrawIndexedInstanced. The device replays them in the same order.
    // - Uploads are synchronous; each flush in a frame writes a disjoint slice
    //   of the GPU instance buffer. Running past the buffer is fatal.
    // - The Device must outlive the Batcher.
    // -------------------------------------------------------------------------
    class Batcher
    {
    public:
        explicit Batcher(RHI::Device& device, const BatcherConfig& config = {});
        ~Batcher();

        Batcher(const Batcher&) = delete;
        Batcher& operator=(const Batcher&) = delete;

        [[nodiscard]] uint32_t RegisterTexture(RHI::TextureHandle texture);

        void BeginFrame();
        void Submit(const ShapeInstance& instance);
        void Flush();

        // Shape helpers. Positions and sizes are in the caller's 2D space.
        void DrawRect(const glm::vec2& center, const glm::vec2& size, const glm::vec4& color, float rotation = 0.0f);
        void DrawRoundedRect(const glm::vec2& center, const glm::vec2& size, float cornerRadius,
                             const glm::vec4& color, float rotation = 0.0f);
        void DrawCircle(const glm::vec2& center, float radius, const glm::vec4& color);
        void DrawRing(const glm::vec2& center, float radius, float thickness, const glm::vec4& color);
        void DrawLine(const glm::vec2& from, const glm::vec2& to, float thickness, const glm::vec4& color);
        void DrawSprite(const glm::vec2& center, const glm::vec2& size, uint32_t textureIndex,
                        const glm::vec4& uvRect = {0.0f, 0.0f, 1.0f, 1.0f},
                        const glm::vec4& tint = glm::vec4(1.0f), float rotation = 0.0f);

        [[nodiscard]] uint32_t GetPendingCount() const { return m_PendingCount; }
        [[nodiscard]] size_t GetRunningOffset() const { return m_RunningOffset; }
        [[nodiscard]] size_t GetInstanceBufferSize() const { return m_InstanceBufferSize; }
        [[nodiscard]] std::span<const ShapeInstance> GetPending() const { return m_Staging.first(m_PendingCount); }
        [[nodiscard]] const BatcherStats& GetStats() const { return m_Stats; }
        [[nodiscard]] const BatcherConfig& GetConfig() const { return m_Config; }
        [[nodiscard]] const TextureRegistry& GetTextureRegistry() const { return m_Textures; }

        [[nodiscard]] RHI::TextureHandle GetFallbackTexture() const { return m_WhiteTexture; }
        [[nodiscard]] RHI::BufferHandle GetQuadVertexBuffer() const { return m_QuadVertices; }
        [[nodiscard]] RHI::BufferHandle GetQuadIndexBuffer() const { return m_QuadIndices; }
        [[nodiscard]] RHI::BufferHandle GetInstanceBuffer() const { return m_InstanceBuffer; }
        [[nodiscard]] RHI::ArgumentTableHandle GetArgumentTable() const { return m_ArgumentTable; }

    private:
        void VerifyTextureAlive(uint32_t textureIndex) const;

        RHI::Device& m_Device;
        BatcherConfig m_Config;
        size_t m_InstanceBufferSize;

        RHI::TextureHandle m_WhiteTexture;
        RHI::BufferHandle m_QuadVertices;
        RHI::BufferHandle m_QuadIndices;
        RHI::BufferHandle m_InstanceBuffer;
        RHI::ArgumentTableHandle m_ArgumentTable;

        TextureRegistry m_Textures;

        Core::Memory::LinearArena m_StagingArena;
        std::span<ShapeInstance> m_Staging;
        uint32_t m_PendingCount = 0;
        size_t m_RunningOffset = 0;

        BatcherStats m_Stats{};
    };
}
