#include <gtest/gtest.h>
#include <string>
#include <vector>

import Core;
import RHI;

#include "RecordingBackend.h"

namespace
{
    // Native handle = 1000 + slot index, so tests can see what got resolved.
    class FakeResolver final : public RHI::ResourceResolver
    {
    public:
        [[nodiscard]] RHI::RendererState ResolveRenderer(RHI::RendererHandle h) const override
        {
            return {{}, nullptr, h.Index};
        }
        [[nodiscard]] RHI::NativeHandle ResolvePipeline(RHI::PipelineHandle h) const override { return 1000 + h.Index; }
        [[nodiscard]] RHI::NativeHandle ResolveBuffer(RHI::BufferHandle h) const override { return 1000 + h.Index; }
        [[nodiscard]] RHI::NativeHandle ResolveTexture(RHI::TextureHandle h) const override { return 1000 + h.Index; }
        [[nodiscard]] RHI::NativeHandle ResolveSampler(RHI::SamplerHandle h) const override { return 1000 + h.Index; }
        [[nodiscard]] RHI::NativeHandle ResolveArgumentTable(RHI::ArgumentTableHandle h) const override
        {
            return 1000 + h.Index;
        }
    };

    RHI::RenderCommand BindVertexBuffer(uint32_t index, uint32_t slot)
    {
        return RHI::Cmd::BindBuffer{RHI::BufferHandle(index, 1), RHI::ShaderStage::Vertex, slot, 0};
    }
}

class CommandQueueTest : public ::testing::Test
{
protected:
    Core::Memory::LinearArena m_Arena{64 * 1024};
    RecordingBackend m_Backend;
    FakeResolver m_Resolver;
};

TEST_F(CommandQueueTest, StartsIdle)
{
    RHI::CommandQueue queue(m_Arena, 16);
    EXPECT_TRUE(queue.IsEmpty());
    EXPECT_EQ(queue.Size(), 0u);
    EXPECT_EQ(queue.Capacity(), 16u);
}

TEST_F(CommandQueueTest, ReplayPreservesInsertionOrder)
{
    RHI::CommandQueue queue(m_Arena, 16);

    queue.Insert(RHI::Cmd::BeginFrame{RHI::RendererHandle(0, 1)});
    queue.Insert(RHI::Cmd::BindPipeline{RHI::PipelineHandle(2, 1)});
    queue.Insert(BindVertexBuffer(5, 0));
    queue.Insert(RHI::Cmd::BindTexture{RHI::TextureHandle(1, 1), RHI::ShaderStage::Fragment, 0});
    queue.Insert(RHI::Cmd::BindSampler{RHI::SamplerHandle(0, 1), RHI::ShaderStage::Fragment, 0});
    queue.Insert(RHI::Cmd::Draw{RHI::PrimitiveTopology::Triangle, 0, 3});
    queue.Insert(BindVertexBuffer(6, 1));
    queue.Insert(RHI::Cmd::BindArgumentTable{RHI::ArgumentTableHandle(0, 1), RHI::ShaderStage::Fragment, 0});
    queue.Insert(RHI::Cmd::DrawIndexed{RHI::PrimitiveTopology::Triangle, RHI::BufferHandle(7, 1),
                                       RHI::IndexType::UInt16, 6, 0});
    queue.Insert(RHI::Cmd::DrawIndexedInstanced{RHI::PrimitiveTopology::Triangle, RHI::BufferHandle(7, 1),
                                                RHI::IndexType::UInt16, 6, 0, 12});
    queue.Insert(RHI::Cmd::EndFrame{RHI::RendererHandle(0, 1)});

    const RHI::ReplayStats stats = queue.Replay(m_Backend, m_Resolver);

    const std::vector<std::string> expected = {
        "BeginFrame", "BindPipeline", "BindBuffer", "BindTexture", "BindSampler", "Draw",
        "BindBuffer", "BindArgumentTable", "DrawIndexed", "DrawIndexedInstanced", "EndFrame"
    };
    EXPECT_EQ(m_Backend.Calls, expected);

    EXPECT_EQ(stats.Commands, 11u);
    EXPECT_EQ(stats.DrawCalls, 3u);
    EXPECT_EQ(stats.InstancesDrawn, 1u + 1u + 12u);
}

TEST_F(CommandQueueTest, ReplayResolvesHandles)
{
    RHI::CommandQueue queue(m_Arena, 4);
    queue.Insert(BindVertexBuffer(5, 1));
    queue.Insert(RHI::Cmd::DrawIndexedInstanced{RHI::PrimitiveTopology::Triangle, RHI::BufferHandle(9, 1),
                                                RHI::IndexType::UInt16, 6, 0, 4});

    (void)queue.Replay(m_Backend, m_Resolver);

    ASSERT_EQ(m_Backend.BufferBinds.size(), 1u);
    EXPECT_EQ(m_Backend.BufferBinds[0].Buffer, 1005u);
    EXPECT_EQ(m_Backend.BufferBinds[0].Slot, 1u);

    ASSERT_EQ(m_Backend.Draws.size(), 1u);
    EXPECT_EQ(m_Backend.Draws[0].IndexBuffer, 1009u);
    EXPECT_EQ(m_Backend.Draws[0].InstanceCount, 4u);
}

TEST_F(CommandQueueTest, ReplayDoesNotConsume)
{
    RHI::CommandQueue queue(m_Arena, 4);
    queue.Insert(RHI::Cmd::Draw{RHI::PrimitiveTopology::Triangle, 0, 3});

    (void)queue.Replay(m_Backend, m_Resolver);
    EXPECT_EQ(queue.Size(), 1u);
}

TEST_F(CommandQueueTest, CapacityThreeScenario)
{
    RHI::CommandQueue queue(m_Arena, 3);

    queue.Insert(BindVertexBuffer(1, 0)); // A
    queue.Insert(BindVertexBuffer(2, 0)); // B
    queue.Insert(BindVertexBuffer(3, 0)); // C
    EXPECT_EQ(queue.Size(), 3u);

    EXPECT_DEATH(queue.Insert(BindVertexBuffer(4, 0)), "command queue overflow");

    queue.Clear();
    EXPECT_TRUE(queue.IsEmpty());

    queue.Insert(BindVertexBuffer(4, 0)); // D
    (void)queue.Replay(m_Backend, m_Resolver);

    ASSERT_EQ(m_Backend.Calls, std::vector<std::string>{"BindBuffer"});
    EXPECT_EQ(m_Backend.BufferBinds[0].Buffer, 1004u);
}

TEST_F(CommandQueueTest, ClearThenFillToCapacity)
{
    RHI::CommandQueue queue(m_Arena, 8);
    for (int frame = 0; frame < 3; ++frame)
    {
        for (uint32_t i = 0; i < queue.Capacity(); ++i)
            queue.Insert(RHI::Cmd::Draw{RHI::PrimitiveTopology::Triangle, 0, 3});
        EXPECT_EQ(queue.Replay(m_Backend, m_Resolver).DrawCalls, 8u);
        queue.Clear();
    }
    EXPECT_EQ(m_Backend.Count("Draw"), 24u);
}

TEST_F(CommandQueueTest, GetCommandsExposesRecordedPrefix)
{
    RHI::CommandQueue queue(m_Arena, 8);
    queue.Insert(RHI::Cmd::BindPipeline{RHI::PipelineHandle(0, 1)});
    queue.Insert(RHI::Cmd::Draw{RHI::PrimitiveTopology::Triangle, 0, 3});

    const auto commands = queue.GetCommands();
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(RHI::CommandName(commands[0]), "BindPipeline");
    EXPECT_EQ(RHI::CommandName(commands[1]), "Draw");
    EXPECT_FALSE(RHI::IsDrawCommand(commands[0]));
    EXPECT_TRUE(RHI::IsDrawCommand(commands[1]));
}
