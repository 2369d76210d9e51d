module;
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

export module RHI:Types;

import Core;

export namespace RHI
{
    // -------------------------------------------------------------------------
    // Handles
    // -------------------------------------------------------------------------
    struct RendererTag {};
    struct PipelineTag {};
    struct BufferTag {};
    struct TextureTag {};
    struct SamplerTag {};
    struct ArgumentTableTag {};

    using RendererHandle = Core::StrongHandle<RendererTag>;
    using PipelineHandle = Core::StrongHandle<PipelineTag>;
    using BufferHandle = Core::StrongHandle<BufferTag>;
    using TextureHandle = Core::StrongHandle<TextureTag>;
    using SamplerHandle = Core::StrongHandle<SamplerTag>;
    using ArgumentTableHandle = Core::StrongHandle<ArgumentTableTag>;

    // Opaque backend object (MTLBuffer*, VkBuffer, GLuint, ...). Zero means none.
    using NativeHandle = uint64_t;
    constexpr NativeHandle kNullNative = 0;

    // -------------------------------------------------------------------------
    // Enums
    // -------------------------------------------------------------------------
    enum class ShaderStage : uint8_t
    {
        Vertex,
        Fragment
    };

    enum class PrimitiveTopology : uint8_t
    {
        Triangle,
        TriangleStrip,
        Line,
        LineStrip,
        Point
    };

    enum class IndexType : uint8_t
    {
        UInt16,
        UInt32
    };

    enum class BufferUsage : uint8_t
    {
        Vertex,
        Index,
        Instance,
        Uniform
    };

    enum class PixelFormat : uint8_t
    {
        RGBA8Unorm,
        BGRA8Unorm,
        R8Unorm,
        RGBA16Float
    };

    enum class SamplerFilter : uint8_t
    {
        Nearest,
        Linear
    };

    enum class SamplerAddressMode : uint8_t
    {
        ClampToEdge,
        Repeat,
        MirroredRepeat
    };

    [[nodiscard]] constexpr uint32_t BytesPerPixel(PixelFormat format)
    {
        switch (format)
        {
            case PixelFormat::RGBA8Unorm:  return 4;
            case PixelFormat::BGRA8Unorm:  return 4;
            case PixelFormat::R8Unorm:     return 1;
            case PixelFormat::RGBA16Float: return 8;
        }
        return 0;
    }

    [[nodiscard]] constexpr uint32_t IndexSize(IndexType type)
    {
        return type == IndexType::UInt16 ? 2u : 4u;
    }

    [[nodiscard]] constexpr std::string_view ShaderStageName(ShaderStage stage)
    {
        return stage == ShaderStage::Vertex ? "vertex" : "fragment";
    }

    // -------------------------------------------------------------------------
    // Descriptors
    // -------------------------------------------------------------------------
    // Shader source and compilation live outside the core; a pipeline names
    // the already-built entry points the backend should use.
    struct PipelineDesc
    {
        std::string_view Label = "pipeline";
        std::string_view VertexEntry = "vertex_main";
        std::string_view FragmentEntry = "fragment_main";
        PrimitiveTopology Topology = PrimitiveTopology::Triangle;
        PixelFormat ColorFormat = PixelFormat::BGRA8Unorm;
        bool AlphaBlending = true;
    };

    struct BufferDesc
    {
        std::string_view Label = "buffer";
        size_t Size = 0;
        BufferUsage Usage = BufferUsage::Vertex;
    };

    // Pixels are already decoded; the core never touches image files.
    struct TextureDesc
    {
        std::string_view Label = "texture";
        uint32_t Width = 0;
        uint32_t Height = 0;
        PixelFormat Format = PixelFormat::RGBA8Unorm;
        std::span<const std::byte> Pixels;
    };

    struct SamplerDesc
    {
        SamplerFilter MinFilter = SamplerFilter::Linear;
        SamplerFilter MagFilter = SamplerFilter::Linear;
        SamplerAddressMode AddressMode = SamplerAddressMode::ClampToEdge;
    };

    struct ArgumentTableDesc
    {
        std::string_view Label = "argument-table";
        uint32_t MaxTextures = 0;
    };

    // -------------------------------------------------------------------------
    // Slot payloads. Trivially destructible: they live in arena-backed pools.
    // -------------------------------------------------------------------------
    struct PipelineRecord
    {
        NativeHandle Native = kNullNative;
        PrimitiveTopology Topology = PrimitiveTopology::Triangle;
    };

    struct BufferRecord
    {
        NativeHandle Native = kNullNative;
        size_t Size = 0;
        BufferUsage Usage = BufferUsage::Vertex;
    };

    struct TextureRecord
    {
        NativeHandle Native = kNullNative;
        uint32_t Width = 0;
        uint32_t Height = 0;
        PixelFormat Format = PixelFormat::RGBA8Unorm;
    };

    struct SamplerRecord
    {
        NativeHandle Native = kNullNative;
    };

    struct ArgumentTableRecord
    {
        NativeHandle Native = kNullNative;
        uint32_t MaxTextures = 0;
    };

    // Per-window render context. State points into a BlockAllocator chunk of
    // backend.StateSize() bytes.
    struct RendererRecord
    {
        const Core::Windowing::IWindowProvider* Window = nullptr;
        std::byte* State = nullptr;
        uint64_t FrameIndex = 0;
    };

    // What the backend sees for a renderer at frame boundaries.
    struct RendererState
    {
        std::span<std::byte> Storage;
        const Core::Windowing::IWindowProvider* Window = nullptr;
        uint64_t FrameIndex = 0;
    };
}
