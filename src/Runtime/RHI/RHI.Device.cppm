module;
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

export module RHI:Device;

import :Types;
import :Backend;
import :Commands;
import :CommandQueue;
import Core;

export namespace RHI
{
    struct DeviceConfig
    {
        uint32_t MaxRenderers = 4;
        uint32_t MaxPipelines = 32;
        uint32_t MaxBuffers = 128;
        uint32_t MaxTextures = 256;
        uint32_t MaxSamplers = 16;
        uint32_t MaxArgumentTables = 8;
        uint32_t CommandQueueCapacity = 8192;
    };

    struct ResourceCounts
    {
        uint32_t Renderers = 0;
        uint32_t Pipelines = 0;
        uint32_t Buffers = 0;
        uint32_t Textures = 0;
        uint32_t Samplers = 0;
        uint32_t ArgumentTables = 0;
    };

    struct FrameStats
    {
        uint64_t FramesPresented = 0;
        ReplayStats LastReplay{};
    };

    // -------------------------------------------------------------------------
    // Device - explicit renderer context
    // -------------------------------------------------------------------------
    // Owns every slot pool, the per-renderer backend state blocks and the
    // frame's command queue, all carved from one arena sized from the config
    // at construction. Several Devices may coexist, each over its own backend.
    //
    // Resource creation and destruction are synchronous: they resolve the
    // handle and call straight into the backend. Bind and draw work goes
    // through Submit() and only reaches the backend in Present().
    //
    // The backend must outlive the Device.
    // -------------------------------------------------------------------------
    class Device final : public ResourceResolver
    {
    public:
        explicit Device(IBackend& backend, const DeviceConfig& config = {});
        ~Device() override;

        Device(const Device&) = delete;
        Device& operator=(const Device&) = delete;

        // Renderers (one per window)
        [[nodiscard]] RendererHandle CreateRenderer(const Core::Windowing::IWindowProvider& window);
        void DestroyRenderer(RendererHandle handle);

        [[nodiscard]] PipelineHandle CreatePipeline(const PipelineDesc& desc);
        void DestroyPipeline(PipelineHandle handle);

        [[nodiscard]] BufferHandle CreateBuffer(const BufferDesc& desc, std::span<const std::byte> data);
        [[nodiscard]] BufferHandle CreateBufferZeroed(const BufferDesc& desc);
        // Writes data at offset; the range must lie inside the buffer.
        void PushBuffer(BufferHandle handle, size_t offset, std::span<const std::byte> data);
        void DestroyBuffer(BufferHandle handle);

        [[nodiscard]] TextureHandle CreateTexture(const TextureDesc& desc);
        void DestroyTexture(TextureHandle handle);

        [[nodiscard]] SamplerHandle CreateSampler(const SamplerDesc& desc);
        void DestroySampler(SamplerHandle handle);

        [[nodiscard]] ArgumentTableHandle CreateArgumentTable(const ArgumentTableDesc& desc);
        void EncodeArgumentTableTextures(ArgumentTableHandle handle, std::span<const TextureHandle> textures);
        void DestroyArgumentTable(ArgumentTableHandle handle);

        // Deferred frame API
        void BeginFrame(RendererHandle renderer);
        void Submit(const RenderCommand& command);
        void EndFrame(RendererHandle renderer);
        // Replays the queue, presents, then clears the queue.
        ReplayStats Present(RendererHandle renderer);

        // ResourceResolver
        [[nodiscard]] RendererState ResolveRenderer(RendererHandle handle) const override;
        [[nodiscard]] NativeHandle ResolvePipeline(PipelineHandle handle) const override;
        [[nodiscard]] NativeHandle ResolveBuffer(BufferHandle handle) const override;
        [[nodiscard]] NativeHandle ResolveTexture(TextureHandle handle) const override;
        [[nodiscard]] NativeHandle ResolveSampler(SamplerHandle handle) const override;
        [[nodiscard]] NativeHandle ResolveArgumentTable(ArgumentTableHandle handle) const override;

        [[nodiscard]] const BufferRecord& GetBuffer(BufferHandle handle) const { return m_Buffers.Resolve(handle); }
        [[nodiscard]] const TextureRecord& GetTexture(TextureHandle handle) const { return m_Textures.Resolve(handle); }
        [[nodiscard]] const ArgumentTableRecord& GetArgumentTable(ArgumentTableHandle handle) const
        {
            return m_ArgumentTables.Resolve(handle);
        }

        [[nodiscard]] bool IsAlive(BufferHandle handle) const { return m_Buffers.IsAlive(handle); }
        [[nodiscard]] bool IsAlive(TextureHandle handle) const { return m_Textures.IsAlive(handle); }
        [[nodiscard]] bool IsAlive(PipelineHandle handle) const { return m_Pipelines.IsAlive(handle); }
        [[nodiscard]] bool IsAlive(SamplerHandle handle) const { return m_Samplers.IsAlive(handle); }
        [[nodiscard]] bool IsAlive(ArgumentTableHandle handle) const { return m_ArgumentTables.IsAlive(handle); }
        [[nodiscard]] bool IsAlive(RendererHandle handle) const { return m_Renderers.IsAlive(handle); }

        [[nodiscard]] ResourceCounts GetResourceCounts() const;
        [[nodiscard]] const FrameStats& GetFrameStats() const { return m_FrameStats; }
        [[nodiscard]] const CommandQueue& GetCommandQueue() const { return m_Queue; }
        [[nodiscard]] const DeviceConfig& GetConfig() const { return m_Config; }
        [[nodiscard]] IBackend& GetBackend() const { return m_Backend; }

        // Arena bytes needed for the pools and the command queue of a config.
        [[nodiscard]] static size_t ComputeArenaSize(const DeviceConfig& config, size_t stateChunkSize);
        [[nodiscard]] static size_t ComputeStateChunkSize(size_t backendStateSize);

    private:
        void ReleaseLeakedResources();

        IBackend& m_Backend;
        DeviceConfig m_Config;
        size_t m_StateSize;
        size_t m_StateChunkSize;

        Core::Memory::LinearArena m_Arena;

        Core::SlotPool<RendererRecord, RendererTag> m_Renderers;
        Core::SlotPool<PipelineRecord, PipelineTag> m_Pipelines;
        Core::SlotPool<BufferRecord, BufferTag> m_Buffers;
        Core::SlotPool<TextureRecord, TextureTag> m_Textures;
        Core::SlotPool<SamplerRecord, SamplerTag> m_Samplers;
        Core::SlotPool<ArgumentTableRecord, ArgumentTableTag> m_ArgumentTables;

        Core::Memory::BlockAllocator m_RendererStates;
        CommandQueue m_Queue;

        std::vector<NativeHandle> m_EncodeScratch;
        FrameStats m_FrameStats{};
    };
}
