module;
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

export module RHI:Backend;

import :Types;
import Core;

export namespace RHI
{
    // -------------------------------------------------------------------------
    // IBackend - the capability table a native graphics API has to provide
    // -------------------------------------------------------------------------
    // The Device never issues native calls itself. Resource creation and
    // destruction forward here synchronously; everything recorded in the
    // CommandQueue reaches the bind/draw entries during Replay().
    //
    // Native handles returned by Create* are opaque to the core and are only
    // ever handed back to the same backend. kNullNative signals failure.
    // -------------------------------------------------------------------------
    class IBackend
    {
    public:
        virtual ~IBackend() = default;

        [[nodiscard]] virtual std::string_view Name() const = 0;

        // Bytes of per-renderer state the backend wants. The Device allocates
        // this block and passes it back at every frame boundary.
        [[nodiscard]] virtual size_t StateSize() const = 0;

        // Renderer lifetime
        virtual void Init(const Core::Windowing::IWindowProvider& window, std::span<std::byte> state) = 0;
        virtual void Shutdown(std::span<std::byte> state) = 0;

        // Frame boundaries
        virtual void BeginFrame(const RendererState& renderer) = 0;
        virtual void EndFrame(const RendererState& renderer) = 0;
        virtual void Present(const RendererState& renderer) = 0;

        // Pipelines
        [[nodiscard]] virtual NativeHandle CreatePipeline(const PipelineDesc& desc) = 0;
        virtual void DestroyPipeline(NativeHandle pipeline) = 0;
        virtual void BindPipeline(NativeHandle pipeline) = 0;

        // Buffers
        [[nodiscard]] virtual NativeHandle CreateBuffer(const BufferDesc& desc, std::span<const std::byte> data) = 0;
        [[nodiscard]] virtual NativeHandle CreateBufferZeroed(const BufferDesc& desc) = 0;
        virtual void PushBuffer(NativeHandle buffer, size_t offset, std::span<const std::byte> data) = 0;
        virtual void DestroyBuffer(NativeHandle buffer) = 0;
        virtual void BindBuffer(NativeHandle buffer, ShaderStage stage, uint32_t slot, size_t offset) = 0;

        // Textures
        [[nodiscard]] virtual NativeHandle CreateTexture(const TextureDesc& desc) = 0;
        virtual void DestroyTexture(NativeHandle texture) = 0;
        virtual void BindTexture(NativeHandle texture, ShaderStage stage, uint32_t slot) = 0;

        // Samplers
        [[nodiscard]] virtual NativeHandle CreateSampler(const SamplerDesc& desc) = 0;
        virtual void DestroySampler(NativeHandle sampler) = 0;
        virtual void BindSampler(NativeHandle sampler, ShaderStage stage, uint32_t slot) = 0;

        // Bindless argument tables
        [[nodiscard]] virtual NativeHandle CreateArgumentTable(const ArgumentTableDesc& desc) = 0;
        virtual void EncodeArgumentTableTextures(NativeHandle table, std::span<const NativeHandle> textures) = 0;
        virtual void DestroyArgumentTable(NativeHandle table) = 0;
        virtual void BindArgumentTable(NativeHandle table, ShaderStage stage, uint32_t slot) = 0;

        // Draws
        virtual void Draw(PrimitiveTopology topology, uint32_t vertexStart, uint32_t vertexCount) = 0;
        virtual void DrawIndexed(PrimitiveTopology topology, NativeHandle indexBuffer, IndexType indexType,
                                 uint32_t indexCount, size_t indexOffset) = 0;
        virtual void DrawIndexedInstanced(PrimitiveTopology topology, NativeHandle indexBuffer, IndexType indexType,
                                          uint32_t indexCount, size_t indexOffset, uint32_t instanceCount) = 0;
    };
}
