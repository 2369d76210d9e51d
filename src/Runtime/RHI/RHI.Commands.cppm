module;
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string_view>
#include <type_traits>
#include <variant>

export module RHI:Commands;

import :Types;

export namespace RHI
{
    // -------------------------------------------------------------------------
    // Render commands
    // -------------------------------------------------------------------------
    // Plain records holding handles, never native objects. The Device resolves
    // handles at replay time, so a command recorded against a resource that
    // is destroyed before Present() is caught as a stale handle.
    // -------------------------------------------------------------------------
    namespace Cmd
    {
        struct BeginFrame
        {
            RendererHandle Renderer;
        };

        struct EndFrame
        {
            RendererHandle Renderer;
        };

        struct BindPipeline
        {
            PipelineHandle Pipeline;
        };

        struct BindBuffer
        {
            BufferHandle Buffer;
            ShaderStage Stage = ShaderStage::Vertex;
            uint32_t Slot = 0;
            size_t Offset = 0;
        };

        struct BindTexture
        {
            TextureHandle Texture;
            ShaderStage Stage = ShaderStage::Fragment;
            uint32_t Slot = 0;
        };

        struct BindSampler
        {
            SamplerHandle Sampler;
            ShaderStage Stage = ShaderStage::Fragment;
            uint32_t Slot = 0;
        };

        struct BindArgumentTable
        {
            ArgumentTableHandle Table;
            ShaderStage Stage = ShaderStage::Fragment;
            uint32_t Slot = 0;
        };

        struct Draw
        {
            PrimitiveTopology Topology = PrimitiveTopology::Triangle;
            uint32_t VertexStart = 0;
            uint32_t VertexCount = 0;
        };

        struct DrawIndexed
        {
            PrimitiveTopology Topology = PrimitiveTopology::Triangle;
            BufferHandle IndexBuffer;
            IndexType Type = IndexType::UInt16;
            uint32_t IndexCount = 0;
            size_t IndexOffset = 0;
        };

        struct DrawIndexedInstanced
        {
            PrimitiveTopology Topology = PrimitiveTopology::Triangle;
            BufferHandle IndexBuffer;
            IndexType Type = IndexType::UInt16;
            uint32_t IndexCount = 0;
            size_t IndexOffset = 0;
            uint32_t InstanceCount = 0;
        };
    }

    using RenderCommand = std::variant<
        Cmd::BeginFrame,
        Cmd::EndFrame,
        Cmd::BindPipeline,
        Cmd::BindBuffer,
        Cmd::BindTexture,
        Cmd::BindSampler,
        Cmd::BindArgumentTable,
        Cmd::Draw,
        Cmd::DrawIndexed,
        Cmd::DrawIndexedInstanced
    >;

    static_assert(std::is_trivially_destructible_v<RenderCommand>,
                  "RenderCommand storage lives in a LinearArena.");

    [[nodiscard]] constexpr std::string_view CommandName(const RenderCommand& command)
    {
        constexpr std::string_view names[] = {
            "BeginFrame", "EndFrame", "BindPipeline", "BindBuffer", "BindTexture",
            "BindSampler", "BindArgumentTable", "Draw", "DrawIndexed", "DrawIndexedInstanced"
        };
        static_assert(std::size(names) == std::variant_size_v<RenderCommand>);
        return names[command.index()];
    }

    [[nodiscard]] constexpr bool IsDrawCommand(const RenderCommand& command)
    {
        return std::holds_alternative<Cmd::Draw>(command)
            || std::holds_alternative<Cmd::DrawIndexed>(command)
            || std::holds_alternative<Cmd::DrawIndexedInstanced>(command);
    }

    // Maps handles recorded in commands to what the backend understands.
    // Implementations treat out-of-range or stale handles as fatal.
    class ResourceResolver
    {
    public:
        virtual ~ResourceResolver() = default;

        [[nodiscard]] virtual RendererState ResolveRenderer(RendererHandle handle) const = 0;
        [[nodiscard]] virtual NativeHandle ResolvePipeline(PipelineHandle handle) const = 0;
        [[nodiscard]] virtual NativeHandle ResolveBuffer(BufferHandle handle) const = 0;
        [[nodiscard]] virtual NativeHandle ResolveTexture(TextureHandle handle) const = 0;
        [[nodiscard]] virtual NativeHandle ResolveSampler(SamplerHandle handle) const = 0;
        [[nodiscard]] virtual NativeHandle ResolveArgumentTable(ArgumentTableHandle handle) const = 0;
    };
}
