#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <cstring>
#include <span>

import Core;
import RHI;

#include "RecordingBackend.h"

TEST(NullBackend, HandsOutIncreasingNativeHandles)
{
    RHI::NullBackend backend;
    const RHI::NativeHandle a = backend.CreateBufferZeroed({"a", 16, RHI::BufferUsage::Vertex});
    const RHI::NativeHandle b = backend.CreatePipeline({});
    const RHI::NativeHandle c = backend.CreateSampler({});

    EXPECT_NE(a, RHI::kNullNative);
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_EQ(backend.GetStats().LiveObjects, 3u);

    backend.DestroyBuffer(a);
    EXPECT_EQ(backend.GetStats().LiveObjects, 2u);
}

TEST(NullBackend, CountsUploadsAndDraws)
{
    RHI::NullBackend backend;
    std::array<std::byte, 64> data{};

    const RHI::NativeHandle buffer = backend.CreateBuffer({"b", 64, RHI::BufferUsage::Vertex}, data);
    backend.PushBuffer(buffer, 0, std::span(data).first(16));
    backend.DrawIndexedInstanced(RHI::PrimitiveTopology::Triangle, buffer, RHI::IndexType::UInt16, 6, 0, 10);
    backend.Draw(RHI::PrimitiveTopology::Triangle, 0, 3);

    const RHI::NullBackendStats& stats = backend.GetStats();
    EXPECT_EQ(stats.BytesUploaded, 80u);
    EXPECT_EQ(stats.DrawCalls, 2u);
    EXPECT_EQ(stats.InstancesDrawn, 11u);
}

TEST(NullBackend, DestroyingNullHandleIsFatal)
{
    RHI::NullBackend backend;
    EXPECT_DEATH(backend.DestroyTexture(RHI::kNullNative), "null native handle");
}

TEST(NullBackend, DrivesFullFrameThroughDevice)
{
    RHI::NullBackend backend;
    FakeWindow window{320, 200};
    {
        RHI::Device device(backend);
        const auto renderer = device.CreateRenderer(window);
        const auto pipeline = device.CreatePipeline({});

        for (int frame = 0; frame < 2; ++frame)
        {
            device.BeginFrame(renderer);
            device.Submit(RHI::Cmd::BindPipeline{pipeline});
            device.Submit(RHI::Cmd::Draw{RHI::PrimitiveTopology::Triangle, 0, 3});
            device.EndFrame(renderer);
            (void)device.Present(renderer);
        }

        const RHI::RendererState state = device.ResolveRenderer(renderer);
        ASSERT_GE(state.Storage.size(), sizeof(RHI::NullBackend::SurfaceState));

        RHI::NullBackend::SurfaceState surface{};
        std::memcpy(&surface, state.Storage.data(), sizeof(surface));
        EXPECT_EQ(surface.FramesBegun, 2u);
        EXPECT_EQ(surface.FramesPresented, 2u);
        EXPECT_EQ(surface.Width, 320);
        EXPECT_EQ(surface.Height, 200);

        device.DestroyPipeline(pipeline);
        device.DestroyRenderer(renderer);
    }

    const RHI::NullBackendStats& stats = backend.GetStats();
    EXPECT_EQ(stats.Frames, 2u);
    EXPECT_EQ(stats.Presents, 2u);
    EXPECT_EQ(stats.Binds, 2u);
    EXPECT_EQ(stats.DrawCalls, 2u);
    EXPECT_EQ(stats.LiveObjects, 0u);
}
