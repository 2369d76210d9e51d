module;
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

export module RHI:NullBackend;

import :Types;
import :Backend;
import Core;

export namespace RHI
{
    // Call counters kept by the NullBackend.
    struct NullBackendStats
    {
        uint64_t Frames = 0;
        uint64_t Presents = 0;
        uint64_t Binds = 0;
        uint64_t DrawCalls = 0;
        uint64_t InstancesDrawn = 0;
        uint64_t BytesUploaded = 0;
        uint64_t ArgumentTableEncodes = 0;
        uint32_t LiveObjects = 0;
    };

    // -------------------------------------------------------------------------
    // NullBackend - headless backend that never touches a GPU
    // -------------------------------------------------------------------------
    // Hands out monotonically increasing native handles and counts what it is
    // asked to do. Used by the Sandbox when no native backend is compiled in,
    // and by tests that only care about the core's bookkeeping.
    // -------------------------------------------------------------------------
    class NullBackend final : public IBackend
    {
    public:
        // Per-renderer state block layout.
        struct SurfaceState
        {
            uint64_t FramesBegun = 0;
            uint64_t FramesPresented = 0;
            int Width = 0;
            int Height = 0;
        };

        [[nodiscard]] std::string_view Name() const override { return "Null"; }
        [[nodiscard]] size_t StateSize() const override { return sizeof(SurfaceState); }

        void Init(const Core::Windowing::IWindowProvider& window, std::span<std::byte> state) override;
        void Shutdown(std::span<std::byte> state) override;

        void BeginFrame(const RHI::RendererState& renderer) override;
        void EndFrame(const RHI::RendererState& renderer) override;
        void Present(const RHI::RendererState& renderer) override;

        [[nodiscard]] NativeHandle CreatePipeline(const PipelineDesc& desc) override;
        void DestroyPipeline(NativeHandle pipeline) override;
        void BindPipeline(NativeHandle pipeline) override;

        [[nodiscard]] NativeHandle CreateBuffer(const BufferDesc& desc, std::span<const std::byte> data) override;
        [[nodiscard]] NativeHandle CreateBufferZeroed(const BufferDesc& desc) override;
        void PushBuffer(NativeHandle buffer, size_t offset, std::span<const std::byte> data) override;
        void DestroyBuffer(NativeHandle buffer) override;
        void BindBuffer(NativeHandle buffer, ShaderStage stage, uint32_t slot, size_t offset) override;

        [[nodiscard]] NativeHandle CreateTexture(const TextureDesc& desc) override;
        void DestroyTexture(NativeHandle texture) override;
        void BindTexture(NativeHandle texture, ShaderStage stage, uint32_t slot) override;

        [[nodiscard]] NativeHandle CreateSampler(const SamplerDesc& desc) override;
        void DestroySampler(NativeHandle sampler) override;
        void BindSampler(NativeHandle sampler, ShaderStage stage, uint32_t slot) override;

        [[nodiscard]] NativeHandle CreateArgumentTable(const ArgumentTableDesc& desc) override;
        void EncodeArgumentTableTextures(NativeHandle table, std::span<const NativeHandle> textures) override;
        void DestroyArgumentTable(NativeHandle table) override;
        void BindArgumentTable(NativeHandle table, ShaderStage stage, uint32_t slot) override;

        void Draw(PrimitiveTopology topology, uint32_t vertexStart, uint32_t vertexCount) override;
        void DrawIndexed(PrimitiveTopology topology, NativeHandle indexBuffer, IndexType indexType,
                         uint32_t indexCount, size_t indexOffset) override;
        void DrawIndexedInstanced(PrimitiveTopology topology, NativeHandle indexBuffer, IndexType indexType,
                                  uint32_t indexCount, size_t indexOffset, uint32_t instanceCount) override;

        [[nodiscard]] const NullBackendStats& GetStats() const { return m_Stats; }

    private:
        NativeHandle NextHandle();
        void Release(NativeHandle handle);

        NativeHandle m_NextHandle = 1;
        NullBackendStats m_Stats{};
    };
}
