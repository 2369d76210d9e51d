module;
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

module RHI:NullBackend.Impl;

import :NullBackend;
import :Types;
import Core;

namespace RHI
{
    namespace
    {
        NullBackend::SurfaceState ReadState(std::span<const std::byte> storage)
        {
            NullBackend::SurfaceState state{};
            std::memcpy(&state, storage.data(), sizeof(state));
            return state;
        }

        void WriteState(std::span<std::byte> storage, const NullBackend::SurfaceState& state)
        {
            std::memcpy(storage.data(), &state, sizeof(state));
        }
    }

    NativeHandle NullBackend::NextHandle()
    {
        ++m_Stats.LiveObjects;
        return m_NextHandle++;
    }

    void NullBackend::Release(NativeHandle handle)
    {
        Core::Verify(handle != kNullNative, "NullBackend: destroying a null native handle");
        Core::Verify(m_Stats.LiveObjects > 0, "NullBackend: more objects destroyed than created");
        --m_Stats.LiveObjects;
    }

    void NullBackend::Init(const Core::Windowing::IWindowProvider& window, std::span<std::byte> state)
    {
        Core::Verify(state.size() >= sizeof(SurfaceState), "NullBackend: renderer state block too small");

        SurfaceState initial{};
        initial.Width = window.GetFramebufferWidth();
        initial.Height = window.GetFramebufferHeight();
        WriteState(state, initial);

        Core::Log::Info("NullBackend: renderer initialized ({}x{})", initial.Width, initial.Height);
    }

    void NullBackend::Shutdown(std::span<std::byte> state)
    {
        const SurfaceState current = ReadState(state);
        Core::Log::Info("NullBackend: renderer shut down after {} frames", current.FramesPresented);
    }

    void NullBackend::BeginFrame(const RHI::RendererState& renderer)
    {
        SurfaceState state = ReadState(renderer.Storage);
        ++state.FramesBegun;
        if (renderer.Window)
        {
            state.Width = renderer.Window->GetFramebufferWidth();
            state.Height = renderer.Window->GetFramebufferHeight();
        }
        WriteState(renderer.Storage, state);
        ++m_Stats.Frames;
    }

    void NullBackend::EndFrame(const RHI::RendererState&)
    {
    }

    void NullBackend::Present(const RHI::RendererState& renderer)
    {
        SurfaceState state = ReadState(renderer.Storage);
        ++state.FramesPresented;
        WriteState(renderer.Storage, state);
        ++m_Stats.Presents;
    }

    NativeHandle NullBackend::CreatePipeline(const PipelineDesc&) { return NextHandle(); }
    void NullBackend::DestroyPipeline(NativeHandle pipeline) { Release(pipeline); }
    void NullBackend::BindPipeline(NativeHandle) { ++m_Stats.Binds; }

    NativeHandle NullBackend::CreateBuffer(const BufferDesc&, std::span<const std::byte> data)
    {
        m_Stats.BytesUploaded += data.size();
        return NextHandle();
    }

    NativeHandle NullBackend::CreateBufferZeroed(const BufferDesc&) { return NextHandle(); }

    void NullBackend::PushBuffer(NativeHandle, size_t, std::span<const std::byte> data)
    {
        m_Stats.BytesUploaded += data.size();
    }

    void NullBackend::DestroyBuffer(NativeHandle buffer) { Release(buffer); }
    void NullBackend::BindBuffer(NativeHandle, ShaderStage, uint32_t, size_t) { ++m_Stats.Binds; }

    NativeHandle NullBackend::CreateTexture(const TextureDesc& desc)
    {
        m_Stats.BytesUploaded += desc.Pixels.size();
        return NextHandle();
    }

    void NullBackend::DestroyTexture(NativeHandle texture) { Release(texture); }
    void NullBackend::BindTexture(NativeHandle, ShaderStage, uint32_t) { ++m_Stats.Binds; }

    NativeHandle NullBackend::CreateSampler(const SamplerDesc&) { return NextHandle(); }
    void NullBackend::DestroySampler(NativeHandle sampler) { Release(sampler); }
    void NullBackend::BindSampler(NativeHandle, ShaderStage, uint32_t) { ++m_Stats.Binds; }

    NativeHandle NullBackend::CreateArgumentTable(const ArgumentTableDesc&) { return NextHandle(); }

    void NullBackend::EncodeArgumentTableTextures(NativeHandle, std::span<const NativeHandle>)
    {
        ++m_Stats.ArgumentTableEncodes;
    }

    void NullBackend::DestroyArgumentTable(NativeHandle table) { Release(table); }
    void NullBackend::BindArgumentTable(NativeHandle, ShaderStage, uint32_t) { ++m_Stats.Binds; }

    void NullBackend::Draw(PrimitiveTopology, uint32_t, uint32_t)
    {
        ++m_Stats.DrawCalls;
        ++m_Stats.InstancesDrawn;
    }

    void NullBackend::DrawIndexed(PrimitiveTopology, NativeHandle, IndexType, uint32_t, size_t)
    {
        ++m_Stats.DrawCalls;
        ++m_Stats.InstancesDrawn;
    }

    void NullBackend::DrawIndexedInstanced(PrimitiveTopology, NativeHandle, IndexType, uint32_t, size_t,
                                           uint32_t instanceCount)
    {
        ++m_Stats.DrawCalls;
        m_Stats.InstancesDrawn += instanceCount;
    }
}
