#include <gtest/gtest.h>
#include <cstdint>
#include <vector>

import Core;

namespace
{
    struct TestTag {};

    struct Payload
    {
        uint64_t Native = 0;
        uint32_t Size = 0;
    };

    using Pool = Core::SlotPool<Payload, TestTag>;
    using Handle = Pool::Handle;

    constexpr size_t kArenaBytes = 64 * 1024;
}

TEST(SlotPool, AcquireReturnsIndicesInOrder)
{
    Core::Memory::LinearArena arena(kArenaBytes);
    Pool pool(arena, 4, "Test");

    for (uint32_t i = 0; i < 4; ++i)
    {
        const Handle h = pool.Acquire();
        EXPECT_EQ(h.Index, i);
        EXPECT_TRUE(pool.IsAlive(h));
    }
    EXPECT_EQ(pool.LiveCount(), 4u);
    EXPECT_EQ(pool.Capacity(), 4u);
    EXPECT_EQ(pool.Name(), "Test");
}

TEST(SlotPool, CapacityTwoScenario)
{
    Core::Memory::LinearArena arena(kArenaBytes);
    Pool pool(arena, 2, "Pipelines");

    const Handle h0 = pool.Acquire();
    const Handle h1 = pool.Acquire();
    EXPECT_EQ(h0.Index, 0u);
    EXPECT_EQ(h1.Index, 1u);

    EXPECT_DEATH((void)pool.Acquire(), "pool exhausted");

    pool.Release(h0);
    const Handle again = pool.Acquire();
    EXPECT_EQ(again.Index, 0u);
    EXPECT_NE(again.Generation, h0.Generation);
}

TEST(SlotPool, LiveHandlesNeverExceedCapacity)
{
    Core::Memory::LinearArena arena(kArenaBytes);
    Pool pool(arena, 8, "Mixed");

    std::vector<Handle> live;
    for (int round = 0; round < 50; ++round)
    {
        if (live.size() < pool.Capacity() && (round % 3) != 2)
        {
            const Handle h = pool.Acquire();
            ASSERT_LT(h.Index, pool.Capacity());
            live.push_back(h);
        }
        else if (!live.empty())
        {
            pool.Release(live.front());
            live.erase(live.begin());
        }
        ASSERT_EQ(pool.LiveCount(), live.size());
        ASSERT_LE(pool.LiveCount(), pool.Capacity());
    }
}

TEST(SlotPool, PayloadSurvivesUntilRelease)
{
    Core::Memory::LinearArena arena(kArenaBytes);
    Pool pool(arena, 2, "Buffers");

    const Handle h = pool.Acquire();
    pool.Resolve(h) = {42, 256};

    const Pool& view = pool;
    EXPECT_EQ(view.Resolve(h).Native, 42u);
    EXPECT_EQ(view.Resolve(h).Size, 256u);
}

TEST(SlotPool, ResolveOutOfRangeIsFatal)
{
    Core::Memory::LinearArena arena(kArenaBytes);
    Pool pool(arena, 2, "Buffers");

    EXPECT_DEATH((void)pool.Resolve(Handle(2, 1)), "out-of-range handle");
    EXPECT_DEATH((void)pool.Resolve(Handle{}), "out-of-range handle");
}

TEST(SlotPool, StaleHandleIsFatal)
{
    Core::Memory::LinearArena arena(kArenaBytes);
    Pool pool(arena, 1, "Textures");

    const Handle old = pool.Acquire();
    pool.Release(old);
    const Handle fresh = pool.Acquire();
    ASSERT_EQ(fresh.Index, old.Index);

    EXPECT_FALSE(pool.IsAlive(old));
    EXPECT_TRUE(pool.IsAlive(fresh));
    EXPECT_DEATH((void)pool.Resolve(old), "stale handle");
}

TEST(SlotPool, ConstResolveChecksLikeMutableResolve)
{
    Core::Memory::LinearArena arena(kArenaBytes);
    Pool pool(arena, 2, "Buffers");

    const Handle h = pool.Acquire();
    pool.Resolve(h).Native = 42;

    const Pool& view = pool;
    EXPECT_EQ(view.Resolve(h).Native, 42u);

    pool.Release(h);
    EXPECT_DEATH((void)view.Resolve(h), "Resolve of stale handle");
    EXPECT_DEATH((void)view.Resolve(Handle(7, 1)), "Resolve of out-of-range handle");
}

TEST(SlotPool, DoubleReleaseIsFatal)
{
    Core::Memory::LinearArena arena(kArenaBytes);
    Pool pool(arena, 2, "Samplers");

    const Handle h = pool.Acquire();
    pool.Release(h);
    EXPECT_DEATH(pool.Release(h), "Release of stale handle");
}

TEST(SlotPool, TryResolveReportsErrors)
{
    Core::Memory::LinearArena arena(kArenaBytes);
    Pool pool(arena, 2, "Tables");

    auto outOfRange = pool.TryResolve(Handle(5, 1));
    ASSERT_FALSE(outOfRange.has_value());
    EXPECT_EQ(outOfRange.error(), Core::ErrorCode::InvalidHandle);

    const Handle h = pool.Acquire();
    auto ok = pool.TryResolve(h);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, &pool.Resolve(h));

    pool.Release(h);
    auto stale = pool.TryResolve(h);
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error(), Core::ErrorCode::StaleHandle);
    EXPECT_TRUE(Core::IsHandleError(stale.error()));
}

TEST(SlotPool, ForEachLiveVisitsInIndexOrder)
{
    Core::Memory::LinearArena arena(kArenaBytes);
    Pool pool(arena, 4, "Renderers");

    const Handle a = pool.Acquire();
    const Handle b = pool.Acquire();
    const Handle c = pool.Acquire();
    pool.Release(b);

    std::vector<uint32_t> visited;
    pool.ForEachLive([&](Handle h, Payload&) { visited.push_back(h.Index); });

    EXPECT_EQ(visited, (std::vector<uint32_t>{a.Index, c.Index}));
}

TEST(SlotPool, StorageComesFromArena)
{
    Core::Memory::LinearArena arena(kArenaBytes);
    const size_t before = arena.GetUsed();
    Pool pool(arena, 16, "Arena");
    EXPECT_GE(arena.GetUsed() - before, sizeof(Pool::Slot) * 16);
}

TEST(SlotPool, ArenaTooSmallIsFatal)
{
    EXPECT_DEATH(
        {
            Core::Memory::LinearArena arena(64);
            Pool pool(arena, 1024, "Huge");
        },
        "arena cannot hold");
}
