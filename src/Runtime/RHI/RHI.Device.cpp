module;
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <vector>

module RHI:Device.Impl;

import :Device;
import :Types;
import :Backend;
import :Commands;
import :CommandQueue;
import Core;

namespace
{
    // Slack per arena allocation for alignment padding.
    constexpr size_t kArenaPadding = Core::Memory::kCacheLine;

    template <typename T, typename Tag>
    constexpr size_t PoolBytes(uint32_t capacity)
    {
        return sizeof(typename Core::SlotPool<T, Tag>::Slot) * capacity + kArenaPadding;
    }
}

namespace RHI
{
    size_t Device::ComputeStateChunkSize(size_t backendStateSize)
    {
        const size_t minimum = std::max(backendStateSize, sizeof(std::byte*));
        return (minimum + Core::Memory::kDefaultAlignment - 1) & ~(Core::Memory::kDefaultAlignment - 1);
    }

    size_t Device::ComputeArenaSize(const DeviceConfig& config, size_t stateChunkSize)
    {
        size_t bytes = 0;
        bytes += PoolBytes<RendererRecord, RendererTag>(config.MaxRenderers);
        bytes += PoolBytes<PipelineRecord, PipelineTag>(config.MaxPipelines);
        bytes += PoolBytes<BufferRecord, BufferTag>(config.MaxBuffers);
        bytes += PoolBytes<TextureRecord, TextureTag>(config.MaxTextures);
        bytes += PoolBytes<SamplerRecord, SamplerTag>(config.MaxSamplers);
        bytes += PoolBytes<ArgumentTableRecord, ArgumentTableTag>(config.MaxArgumentTables);
        bytes += sizeof(RenderCommand) * config.CommandQueueCapacity + kArenaPadding;
        bytes += stateChunkSize * config.MaxRenderers + kArenaPadding;
        return bytes;
    }

    Device::Device(IBackend& backend, const DeviceConfig& config)
        : m_Backend(backend)
        , m_Config(config)
        , m_StateSize(backend.StateSize())
        , m_StateChunkSize(ComputeStateChunkSize(m_StateSize))
        , m_Arena(ComputeArenaSize(config, m_StateChunkSize))
        , m_Renderers(m_Arena, config.MaxRenderers, "Renderers")
        , m_Pipelines(m_Arena, config.MaxPipelines, "Pipelines")
        , m_Buffers(m_Arena, config.MaxBuffers, "Buffers")
        , m_Textures(m_Arena, config.MaxTextures, "Textures")
        , m_Samplers(m_Arena, config.MaxSamplers, "Samplers")
        , m_ArgumentTables(m_Arena, config.MaxArgumentTables, "ArgumentTables")
        , m_Queue(m_Arena, config.CommandQueueCapacity)
    {
        Core::Verify(config.MaxRenderers > 0, "Device: MaxRenderers must be at least 1");

        m_RendererStates.Init(m_Arena.CarveArray<std::byte>(m_StateChunkSize * config.MaxRenderers,
                                                            "Device renderer states"),
                              m_StateChunkSize);

        m_EncodeScratch.reserve(config.MaxTextures);

        Core::Log::Info("Device created over '{}' backend: arena {} / {} bytes, queue depth {}",
                        m_Backend.Name(), m_Arena.GetUsed(), m_Arena.GetTotal(), config.CommandQueueCapacity);
    }

    Device::~Device()
    {
        ReleaseLeakedResources();
    }

    void Device::ReleaseLeakedResources()
    {
        m_ArgumentTables.ForEachLive([&](ArgumentTableHandle h, ArgumentTableRecord& record)
        {
            Core::Log::Warn("Device: argument table {} leaked, releasing", h.Index);
            m_Backend.DestroyArgumentTable(record.Native);
            m_ArgumentTables.Release(h);
        });
        m_Samplers.ForEachLive([&](SamplerHandle h, SamplerRecord& record)
        {
            Core::Log::Warn("Device: sampler {} leaked, releasing", h.Index);
            m_Backend.DestroySampler(record.Native);
            m_Samplers.Release(h);
        });
        m_Textures.ForEachLive([&](TextureHandle h, TextureRecord& record)
        {
            Core::Log::Warn("Device: texture {} ({}x{}) leaked, releasing", h.Index, record.Width, record.Height);
            m_Backend.DestroyTexture(record.Native);
            m_Textures.Release(h);
        });
        m_Buffers.ForEachLive([&](BufferHandle h, BufferRecord& record)
        {
            Core::Log::Warn("Device: buffer {} ({} bytes) leaked, releasing", h.Index, record.Size);
            m_Backend.DestroyBuffer(record.Native);
            m_Buffers.Release(h);
        });
        m_Pipelines.ForEachLive([&](PipelineHandle h, PipelineRecord& record)
        {
            Core::Log::Warn("Device: pipeline {} leaked, releasing", h.Index);
            m_Backend.DestroyPipeline(record.Native);
            m_Pipelines.Release(h);
        });
        m_Renderers.ForEachLive([&](RendererHandle h, RendererRecord& record)
        {
            Core::Log::Warn("Device: renderer {} leaked, shutting down", h.Index);
            m_Backend.Shutdown({record.State, m_StateSize});
            m_RendererStates.Free(record.State);
            m_Renderers.Release(h);
        });
    }

    // -------------------------------------------------------------------------
    // Renderers
    // -------------------------------------------------------------------------

    RendererHandle Device::CreateRenderer(const Core::Windowing::IWindowProvider& window)
    {
        const RendererHandle handle = m_Renderers.Acquire();
        auto* state = static_cast<std::byte*>(m_RendererStates.Alloc());

        m_Backend.Init(window, {state, m_StateSize});

        RendererRecord& record = m_Renderers.Resolve(handle);
        record.Window = &window;
        record.State = state;
        record.FrameIndex = 0;

        Core::Log::Info("Device: renderer {} created ({}x{})", handle.Index,
                        window.GetFramebufferWidth(), window.GetFramebufferHeight());
        return handle;
    }

    void Device::DestroyRenderer(RendererHandle handle)
    {
        RendererRecord& record = m_Renderers.Resolve(handle);
        m_Backend.Shutdown({record.State, m_StateSize});
        m_RendererStates.Free(record.State);
        record = {};
        m_Renderers.Release(handle);
    }

    // -------------------------------------------------------------------------
    // Pipelines
    // -------------------------------------------------------------------------

    PipelineHandle Device::CreatePipeline(const PipelineDesc& desc)
    {
        const PipelineHandle handle = m_Pipelines.Acquire();
        const NativeHandle native = m_Backend.CreatePipeline(desc);
        if (native == kNullNative)
            Core::Panic(std::format("Device: backend failed to create pipeline '{}'", desc.Label));

        m_Pipelines.Resolve(handle) = {native, desc.Topology};
        Core::Log::Debug("Device: pipeline '{}' -> {}", desc.Label, handle.Index);
        return handle;
    }

    void Device::DestroyPipeline(PipelineHandle handle)
    {
        m_Backend.DestroyPipeline(m_Pipelines.Resolve(handle).Native);
        m_Pipelines.Release(handle);
    }

    // -------------------------------------------------------------------------
    // Buffers
    // -------------------------------------------------------------------------

    BufferHandle Device::CreateBuffer(const BufferDesc& desc, std::span<const std::byte> data)
    {
        if (data.size() > desc.Size)
        {
            Core::Panic(std::format("Device: initial data ({} bytes) exceeds buffer '{}' ({} bytes)",
                                    data.size(), desc.Label, desc.Size));
        }

        const BufferHandle handle = m_Buffers.Acquire();
        const NativeHandle native = m_Backend.CreateBuffer(desc, data);
        if (native == kNullNative)
            Core::Panic(std::format("Device: backend failed to create buffer '{}'", desc.Label));

        m_Buffers.Resolve(handle) = {native, desc.Size, desc.Usage};
        Core::Log::Debug("Device: buffer '{}' ({} bytes) -> {}", desc.Label, desc.Size, handle.Index);
        return handle;
    }

    BufferHandle Device::CreateBufferZeroed(const BufferDesc& desc)
    {
        const BufferHandle handle = m_Buffers.Acquire();
        const NativeHandle native = m_Backend.CreateBufferZeroed(desc);
        if (native == kNullNative)
            Core::Panic(std::format("Device: backend failed to create buffer '{}'", desc.Label));

        m_Buffers.Resolve(handle) = {native, desc.Size, desc.Usage};
        Core::Log::Debug("Device: zeroed buffer '{}' ({} bytes) -> {}", desc.Label, desc.Size, handle.Index);
        return handle;
    }

    void Device::PushBuffer(BufferHandle handle, size_t offset, std::span<const std::byte> data)
    {
        const BufferRecord& record = m_Buffers.Resolve(handle);
        if (offset > record.Size || data.size() > record.Size - offset)
        {
            Core::Panic(std::format("Device: push of {} bytes at offset {} overruns buffer {} ({} bytes)",
                                    data.size(), offset, handle.Index, record.Size));
        }
        m_Backend.PushBuffer(record.Native, offset, data);
    }

    void Device::DestroyBuffer(BufferHandle handle)
    {
        m_Backend.DestroyBuffer(m_Buffers.Resolve(handle).Native);
        m_Buffers.Release(handle);
    }

    // -------------------------------------------------------------------------
    // Textures & samplers
    // -------------------------------------------------------------------------

    TextureHandle Device::CreateTexture(const TextureDesc& desc)
    {
        const size_t expected = static_cast<size_t>(desc.Width) * desc.Height * BytesPerPixel(desc.Format);
        if (desc.Width == 0 || desc.Height == 0 || (!desc.Pixels.empty() && desc.Pixels.size() != expected))
        {
            Core::Panic(std::format("Device: texture '{}' is {}x{} but carries {} bytes (expected {})",
                                    desc.Label, desc.Width, desc.Height, desc.Pixels.size(), expected));
        }

        const TextureHandle handle = m_Textures.Acquire();
        const NativeHandle native = m_Backend.CreateTexture(desc);
        if (native == kNullNative)
            Core::Panic(std::format("Device: backend failed to create texture '{}'", desc.Label));

        m_Textures.Resolve(handle) = {native, desc.Width, desc.Height, desc.Format};
        Core::Log::Debug("Device: texture '{}' ({}x{}) -> {}", desc.Label, desc.Width, desc.Height, handle.Index);
        return handle;
    }

    void Device::DestroyTexture(TextureHandle handle)
    {
        m_Backend.DestroyTexture(m_Textures.Resolve(handle).Native);
        m_Textures.Release(handle);
    }

    SamplerHandle Device::CreateSampler(const SamplerDesc& desc)
    {
        const SamplerHandle handle = m_Samplers.Acquire();
        const NativeHandle native = m_Backend.CreateSampler(desc);
        if (native == kNullNative)
            Core::Panic("Device: backend failed to create sampler");

        m_Samplers.Resolve(handle) = {native};
        return handle;
    }

    void Device::DestroySampler(SamplerHandle handle)
    {
        m_Backend.DestroySampler(m_Samplers.Resolve(handle).Native);
        m_Samplers.Release(handle);
    }

    // -------------------------------------------------------------------------
    // Argument tables
    // -------------------------------------------------------------------------

    ArgumentTableHandle Device::CreateArgumentTable(const ArgumentTableDesc& desc)
    {
        Core::Verify(desc.MaxTextures > 0, "Device: argument table needs room for at least one texture");

        const ArgumentTableHandle handle = m_ArgumentTables.Acquire();
        const NativeHandle native = m_Backend.CreateArgumentTable(desc);
        if (native == kNullNative)
            Core::Panic(std::format("Device: backend failed to create argument table '{}'", desc.Label));

        m_ArgumentTables.Resolve(handle) = {native, desc.MaxTextures};
        Core::Log::Debug("Device: argument table '{}' ({} textures) -> {}", desc.Label, desc.MaxTextures,
                         handle.Index);
        return handle;
    }

    void Device::EncodeArgumentTableTextures(ArgumentTableHandle handle, std::span<const TextureHandle> textures)
    {
        const ArgumentTableRecord& record = m_ArgumentTables.Resolve(handle);
        if (textures.size() > record.MaxTextures)
        {
            Core::Panic(std::format("Device: encoding {} textures into argument table {} (capacity {})",
                                    textures.size(), handle.Index, record.MaxTextures));
        }

        m_EncodeScratch.clear();
        for (const TextureHandle texture : textures)
            m_EncodeScratch.push_back(m_Textures.Resolve(texture).Native);

        m_Backend.EncodeArgumentTableTextures(record.Native, m_EncodeScratch);
    }

    void Device::DestroyArgumentTable(ArgumentTableHandle handle)
    {
        m_Backend.DestroyArgumentTable(m_ArgumentTables.Resolve(handle).Native);
        m_ArgumentTables.Release(handle);
    }

    // -------------------------------------------------------------------------
    // Frame
    // -------------------------------------------------------------------------

    void Device::BeginFrame(RendererHandle renderer)
    {
        m_Queue.Insert(Cmd::BeginFrame{renderer});
    }

    void Device::Submit(const RenderCommand& command)
    {
        m_Queue.Insert(command);
    }

    void Device::EndFrame(RendererHandle renderer)
    {
        m_Queue.Insert(Cmd::EndFrame{renderer});
    }

    ReplayStats Device::Present(RendererHandle renderer)
    {
        const ReplayStats stats = m_Queue.Replay(m_Backend, *this);
        m_Backend.Present(ResolveRenderer(renderer));
        m_Queue.Clear();

        ++m_Renderers.Resolve(renderer).FrameIndex;
        ++m_FrameStats.FramesPresented;
        m_FrameStats.LastReplay = stats;
        return stats;
    }

    // -------------------------------------------------------------------------
    // ResourceResolver
    // -------------------------------------------------------------------------

    RendererState Device::ResolveRenderer(RendererHandle handle) const
    {
        const RendererRecord& record = m_Renderers.Resolve(handle);
        return {{record.State, m_StateSize}, record.Window, record.FrameIndex};
    }

    NativeHandle Device::ResolvePipeline(PipelineHandle handle) const { return m_Pipelines.Resolve(handle).Native; }
    NativeHandle Device::ResolveBuffer(BufferHandle handle) const { return m_Buffers.Resolve(handle).Native; }
    NativeHandle Device::ResolveTexture(TextureHandle handle) const { return m_Textures.Resolve(handle).Native; }
    NativeHandle Device::ResolveSampler(SamplerHandle handle) const { return m_Samplers.Resolve(handle).Native; }

    NativeHandle Device::ResolveArgumentTable(ArgumentTableHandle handle) const
    {
        return m_ArgumentTables.Resolve(handle).Native;
    }

    ResourceCounts Device::GetResourceCounts() const
    {
        return {
            m_Renderers.LiveCount(),
            m_Pipelines.LiveCount(),
            m_Buffers.LiveCount(),
            m_Textures.LiveCount(),
            m_Samplers.LiveCount(),
            m_ArgumentTables.LiveCount()
        };
    }
}
