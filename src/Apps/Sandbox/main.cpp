#include <glm/glm.hpp>
#include <array>
#include <cstddef>
#include <cmath>
#include <cstdint>
#include <memory>

import Core;
import RHI;
import Graphics;

using namespace Core;

namespace
{
    constexpr uint32_t kHeadlessFrames = 120;
    constexpr uint32_t kGridColumns = 64;
    constexpr uint32_t kGridRows = 40;
}

class SandboxApp
{
public:
    SandboxApp()
        : m_Window(std::make_unique<Windowing::Window>(Windowing::WindowProps{"Umbra Sandbox", 1600, 900}))
        , m_Device(m_Backend)
    {
        if (!m_Window->IsValid())
        {
            Log::Warn("No window available, running {} headless frames", kHeadlessFrames);
            m_Window.reset();
        }

        const Windowing::IWindowProvider& provider = m_Window
            ? static_cast<const Windowing::IWindowProvider&>(*m_Window)
            : static_cast<const Windowing::IWindowProvider&>(m_Headless);

        m_Renderer = m_Device.CreateRenderer(provider);
        m_Pipeline = m_Device.CreatePipeline({"shapes", "shape_vertex", "shape_fragment"});

        Graphics::BatcherConfig config{};
        config.InstanceCapacity = 1024;
        m_Batcher = std::make_unique<Graphics::Batcher>(m_Device, config);

        CreateCheckerTexture();
    }

    ~SandboxApp()
    {
        m_Batcher.reset();
        m_Device.DestroyTexture(m_Checker);
        m_Device.DestroyPipeline(m_Pipeline);
        m_Device.DestroyRenderer(m_Renderer);
    }

    SandboxApp(const SandboxApp&) = delete;
    SandboxApp& operator=(const SandboxApp&) = delete;

    void Run()
    {
        Log::Info("Sandbox Started!");

        while (true)
        {
            if (m_Window)
            {
                // Nothing to draw into; sleep until the OS reports a change.
                const Windowing::FrameEvents events =
                    m_Window->HasDrawableArea() ? m_Window->PollEvents() : m_Window->WaitEvents();
                if (events.CloseRequested || m_Window->ShouldClose()) break;
                if (events.FramebufferResized)
                {
                    Log::Info("Framebuffer resized to {}x{}",
                              m_Window->GetFramebufferWidth(), m_Window->GetFramebufferHeight());
                }
                if (!m_Window->HasDrawableArea()) continue;
            }
            else if (m_FrameIndex >= kHeadlessFrames)
            {
                break;
            }

            RenderFrame();
            ++m_FrameIndex;
        }

        const RHI::NullBackendStats& stats = m_Backend.GetStats();
        Log::Info("Sandbox finished: {} frames, {} draw calls, {} instances, {} bytes uploaded",
                  stats.Presents, stats.DrawCalls, stats.InstancesDrawn, stats.BytesUploaded);
    }

private:
    void CreateCheckerTexture()
    {
        constexpr uint32_t kSize = 8;
        std::array<std::byte, kSize * kSize * 4> pixels{};
        for (uint32_t y = 0; y < kSize; ++y)
        {
            for (uint32_t x = 0; x < kSize; ++x)
            {
                const auto value = ((x + y) % 2 == 0) ? std::byte{0xFF} : std::byte{0x40};
                const size_t base = (y * kSize + x) * 4;
                pixels[base + 0] = value;
                pixels[base + 1] = value;
                pixels[base + 2] = value;
                pixels[base + 3] = std::byte{0xFF};
            }
        }

        RHI::TextureDesc desc{};
        desc.Label = "checker";
        desc.Width = kSize;
        desc.Height = kSize;
        desc.Pixels = pixels;
        m_Checker = m_Device.CreateTexture(desc);
        m_CheckerIndex = m_Batcher->RegisterTexture(m_Checker);
    }

    void RenderFrame()
    {
        const float t = static_cast<float>(m_FrameIndex) * 0.016f;

        m_Device.BeginFrame(m_Renderer);
        m_Device.Submit(RHI::Cmd::BindPipeline{m_Pipeline});
        m_Batcher->BeginFrame();

        for (uint32_t row = 0; row < kGridRows; ++row)
        {
            for (uint32_t col = 0; col < kGridColumns; ++col)
            {
                const glm::vec2 center{col * 24.0f + 12.0f, row * 22.0f + 11.0f};
                const glm::vec4 color{col / float(kGridColumns), row / float(kGridRows), 0.5f + 0.5f * std::sin(t), 1.0f};

                switch ((row + col) % 5)
                {
                    case 0: m_Batcher->DrawRect(center, {18.0f, 18.0f}, color, t); break;
                    case 1: m_Batcher->DrawRoundedRect(center, {18.0f, 18.0f}, 4.0f, color); break;
                    case 2: m_Batcher->DrawCircle(center, 9.0f, color); break;
                    case 3: m_Batcher->DrawRing(center, 9.0f, 2.0f, color); break;
                    default: m_Batcher->DrawSprite(center, {18.0f, 18.0f}, m_CheckerIndex); break;
                }
            }
        }
        m_Batcher->DrawLine({0.0f, 0.0f}, {1536.0f, 880.0f}, 3.0f, glm::vec4(1.0f));
        m_Batcher->Flush();

        m_Device.EndFrame(m_Renderer);
        const RHI::ReplayStats replay = m_Device.Present(m_Renderer);

        if (m_FrameIndex % 60 == 0)
        {
            const Graphics::BatcherStats& batch = m_Batcher->GetStats();
            Log::Info("Frame {}: {} commands, {} draw calls, {} instances ({} auto-flushes)",
                      m_FrameIndex, replay.Commands, replay.DrawCalls, batch.Instances, batch.AutoFlushes);
        }
    }

    RHI::NullBackend m_Backend;
    Windowing::HeadlessWindow m_Headless{1280, 720};
    std::unique_ptr<Windowing::Window> m_Window;
    RHI::Device m_Device;
    std::unique_ptr<Graphics::Batcher> m_Batcher;

    RHI::RendererHandle m_Renderer;
    RHI::PipelineHandle m_Pipeline;
    RHI::TextureHandle m_Checker;
    uint32_t m_CheckerIndex = 0;

    uint64_t m_FrameIndex = 0;
};

int main()
{
    SandboxApp app;
    app.Run();
    return 0;
}
