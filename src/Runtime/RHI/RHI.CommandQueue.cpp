module;
#include <cstdint>
#include <format>
#include <span>
#include <variant>

module RHI:CommandQueue.Impl;

import :CommandQueue;
import :Commands;
import :Backend;
import :Types;
import Core;

namespace
{
    template <class... Ts>
    struct Overloaded : Ts...
    {
        using Ts::operator()...;
    };
}

namespace RHI
{
    CommandQueue::CommandQueue(Core::Memory::LinearArena& arena, uint32_t capacity)
        : m_Storage(arena.CarveArray<RenderCommand>(capacity, "CommandQueue"))
    {
    }

    void CommandQueue::Insert(const RenderCommand& command)
    {
        if (m_Count >= Capacity())
        {
            Core::Panic(std::format("command queue overflow: capacity {} reached while inserting {}",
                                    Capacity(), CommandName(command)));
        }
        m_Storage[m_Count++] = command;
    }

    ReplayStats CommandQueue::Replay(IBackend& backend, const ResourceResolver& resolver) const
    {
        ReplayStats stats{};

        for (const RenderCommand& command : GetCommands())
        {
            std::visit(Overloaded{
                [&](const Cmd::BeginFrame& c)
                {
                    backend.BeginFrame(resolver.ResolveRenderer(c.Renderer));
                },
                [&](const Cmd::EndFrame& c)
                {
                    backend.EndFrame(resolver.ResolveRenderer(c.Renderer));
                },
                [&](const Cmd::BindPipeline& c)
                {
                    backend.BindPipeline(resolver.ResolvePipeline(c.Pipeline));
                },
                [&](const Cmd::BindBuffer& c)
                {
                    backend.BindBuffer(resolver.ResolveBuffer(c.Buffer), c.Stage, c.Slot, c.Offset);
                },
                [&](const Cmd::BindTexture& c)
                {
                    backend.BindTexture(resolver.ResolveTexture(c.Texture), c.Stage, c.Slot);
                },
                [&](const Cmd::BindSampler& c)
                {
                    backend.BindSampler(resolver.ResolveSampler(c.Sampler), c.Stage, c.Slot);
                },
                [&](const Cmd::BindArgumentTable& c)
                {
                    backend.BindArgumentTable(resolver.ResolveArgumentTable(c.Table), c.Stage, c.Slot);
                },
                [&](const Cmd::Draw& c)
                {
                    backend.Draw(c.Topology, c.VertexStart, c.VertexCount);
                    ++stats.DrawCalls;
                    ++stats.InstancesDrawn;
                },
                [&](const Cmd::DrawIndexed& c)
                {
                    backend.DrawIndexed(c.Topology, resolver.ResolveBuffer(c.IndexBuffer), c.Type,
                                        c.IndexCount, c.IndexOffset);
                    ++stats.DrawCalls;
                    ++stats.InstancesDrawn;
                },
                [&](const Cmd::DrawIndexedInstanced& c)
                {
                    backend.DrawIndexedInstanced(c.Topology, resolver.ResolveBuffer(c.IndexBuffer), c.Type,
                                                 c.IndexCount, c.IndexOffset, c.InstanceCount);
                    ++stats.DrawCalls;
                    stats.InstancesDrawn += c.InstanceCount;
                }
            }, command);

            ++stats.Commands;
        }

        return stats;
    }
}
