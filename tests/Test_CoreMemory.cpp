#include <gtest/gtest.h>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <set>
#include <span>
#include <vector>

import Core;

using namespace Core::Memory;

// Helper struct to test alignment
struct alignas(16) AlignedStruct16
{
    float x, y, z, w;
};

// -----------------------------------------------------------------------------
// LinearArena
// -----------------------------------------------------------------------------

TEST(LinearArena, Initialization)
{
    LinearArena arena(1000);
    EXPECT_EQ(arena.GetUsed(), 0u);
    EXPECT_GE(arena.GetTotal(), 1000u);
    EXPECT_EQ(arena.GetTotal() % kCacheLine, 0u);
}

TEST(LinearArena, NewArrayValueInitializes)
{
    LinearArena arena(4096);

    auto array = arena.NewArray<uint32_t>(64);
    ASSERT_TRUE(array.has_value());
    ASSERT_EQ(array->size(), 64u);
    EXPECT_TRUE(std::all_of(array->begin(), array->end(), [](uint32_t v) { return v == 0; }));
}

TEST(LinearArena, OutOfMemory)
{
    LinearArena arena(128);

    auto big = arena.Alloc(4096);
    ASSERT_FALSE(big.has_value());
    EXPECT_EQ(big.error(), AllocatorError::OutOfMemory);
    EXPECT_EQ(arena.GetUsed(), 0u);
}

TEST(LinearArena, RejectsNonPowerOfTwoAlignment)
{
    LinearArena arena(128);
    auto result = arena.Alloc(8, 3);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), AllocatorError::InvalidAlignment);
}

TEST(LinearArena, NewArrayOverflowIsReported)
{
    LinearArena arena(128);
    auto result = arena.NewArray<uint64_t>(SIZE_MAX / 2);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), AllocatorError::Overflow);
}

TEST(LinearArena, NewArrayHonoursElementAlignment)
{
    LinearArena arena(1024);
    ASSERT_TRUE(arena.Alloc(3, 1).has_value());

    auto aligned = arena.NewArray<AlignedStruct16>(4);
    ASSERT_TRUE(aligned.has_value());
    EXPECT_EQ(reinterpret_cast<uintptr_t>(aligned->data()) % alignof(AlignedStruct16), 0u);
}

TEST(LinearArena, CarveArrayTracksRemaining)
{
    LinearArena arena(256);
    const std::span<uint32_t> carved = arena.CarveArray<uint32_t>(16, "test");
    EXPECT_EQ(carved.size(), 16u);
    EXPECT_EQ(arena.GetRemaining(), arena.GetTotal() - arena.GetUsed());
}

TEST(LinearArena, CarveArrayPastTheEndIsFatal)
{
    LinearArena arena(128);
    EXPECT_DEATH((void)arena.CarveArray<uint64_t>(1024, "CommandQueue"), "CommandQueue: arena cannot hold 1024");
}

TEST(LinearArena, ResetRewindsOffset)
{
    LinearArena arena(256);
    ASSERT_TRUE(arena.Alloc(200).has_value());
    EXPECT_FALSE(arena.Alloc(200).has_value());

    arena.Reset();
    EXPECT_EQ(arena.GetUsed(), 0u);
    EXPECT_TRUE(arena.Alloc(200).has_value());
}

TEST(LinearArena, MoveTransfersOwnership)
{
    LinearArena a(256);
    ASSERT_TRUE(a.Alloc(32).has_value());
    const size_t used = a.GetUsed();

    LinearArena b(std::move(a));
    EXPECT_EQ(b.GetUsed(), used);
    EXPECT_EQ(a.GetTotal(), 0u); // NOLINT(bugprone-use-after-move)
    EXPECT_FALSE(a.Alloc(8).has_value());
}

// -----------------------------------------------------------------------------
// BlockAllocator
// -----------------------------------------------------------------------------

class BlockAllocatorTest : public ::testing::Test
{
protected:
    static constexpr size_t kChunkSize = 32;
    static constexpr size_t kChunkCount = 8;

    void SetUp() override
    {
        m_Backing.resize(kChunkSize * kChunkCount);
        m_Allocator.Init(m_Backing, kChunkSize);
    }

    std::vector<std::byte> m_Backing;
    BlockAllocator m_Allocator;
};

TEST_F(BlockAllocatorTest, InitPartitionsBuffer)
{
    EXPECT_TRUE(m_Allocator.IsInitialized());
    EXPECT_EQ(m_Allocator.GetChunkSize(), kChunkSize);
    EXPECT_EQ(m_Allocator.GetChunkCount(), kChunkCount);
    EXPECT_EQ(m_Allocator.GetFreeCount(), kChunkCount);
}

TEST_F(BlockAllocatorTest, AllocReturnsDistinctChunksInsideBuffer)
{
    std::set<void*> seen;
    for (size_t i = 0; i < kChunkCount; ++i)
    {
        void* p = m_Allocator.Alloc();
        EXPECT_TRUE(m_Allocator.Owns(p));
        EXPECT_EQ((static_cast<std::byte*>(p) - m_Backing.data()) % kChunkSize, 0u);
        seen.insert(p);
    }
    EXPECT_EQ(seen.size(), kChunkCount);
    EXPECT_EQ(m_Allocator.GetFreeCount(), 0u);
}

TEST_F(BlockAllocatorTest, AllocZeroFills)
{
    std::fill(m_Backing.begin(), m_Backing.end(), std::byte{0xAB});
    m_Allocator.Reset();

    auto* p = static_cast<std::byte*>(m_Allocator.Alloc());
    for (size_t i = 0; i < kChunkSize; ++i)
        EXPECT_EQ(p[i], std::byte{0});
}

TEST_F(BlockAllocatorTest, FreeIsLifo)
{
    void* a = m_Allocator.Alloc();
    void* b = m_Allocator.Alloc();
    m_Allocator.Free(a);
    m_Allocator.Free(b);

    EXPECT_EQ(m_Allocator.Alloc(), b);
    EXPECT_EQ(m_Allocator.Alloc(), a);
}

TEST_F(BlockAllocatorTest, AllocFreeRoundTripNeverExhausts)
{
    for (size_t i = 0; i < kChunkCount * 4; ++i)
    {
        void* p = m_Allocator.Alloc();
        m_Allocator.Free(p);
    }
    EXPECT_EQ(m_Allocator.GetFreeCount(), kChunkCount);
}

TEST_F(BlockAllocatorTest, ExhaustionIsFatal)
{
    for (size_t i = 0; i < kChunkCount; ++i)
        (void)m_Allocator.Alloc();

    EXPECT_DEATH((void)m_Allocator.Alloc(), "BlockAllocator exhausted");
}

TEST_F(BlockAllocatorTest, TryAllocReportsExhaustion)
{
    for (size_t i = 0; i < kChunkCount; ++i)
        ASSERT_TRUE(m_Allocator.TryAlloc().has_value());

    auto result = m_Allocator.TryAlloc();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), AllocatorError::OutOfMemory);
}

TEST_F(BlockAllocatorTest, FreeNullIsFatal)
{
    EXPECT_DEATH(m_Allocator.Free(nullptr), "Free\\(nullptr\\)");
}

TEST_F(BlockAllocatorTest, FreeForeignPointerIsFatal)
{
    int local = 0;
    EXPECT_DEATH(m_Allocator.Free(&local), "outside the backing buffer");
    EXPECT_DEATH(m_Allocator.Free(m_Backing.data() + m_Backing.size()), "outside the backing buffer");
}

TEST_F(BlockAllocatorTest, FreeMidChunkPointerIsFatal)
{
    auto* p = static_cast<std::byte*>(m_Allocator.Alloc());
    EXPECT_DEATH(m_Allocator.Free(p + 4), "not a chunk start");
}

TEST_F(BlockAllocatorTest, DoubleFreeIsFatal)
{
    void* p = m_Allocator.Alloc();
    m_Allocator.Free(p);
    EXPECT_DEATH(m_Allocator.Free(p), "double free");
}

TEST_F(BlockAllocatorTest, ResetReclaimsEverything)
{
    for (size_t i = 0; i < kChunkCount; ++i)
        (void)m_Allocator.Alloc();

    m_Allocator.Reset();
    EXPECT_EQ(m_Allocator.GetFreeCount(), kChunkCount);
    EXPECT_EQ(m_Allocator.Alloc(), m_Backing.data());
}

TEST_F(BlockAllocatorTest, MoveLeavesSourceEmpty)
{
    void* held = m_Allocator.Alloc();

    BlockAllocator moved(std::move(m_Allocator));
    EXPECT_TRUE(moved.Owns(held));
    EXPECT_EQ(moved.GetFreeCount(), kChunkCount - 1);

    // NOLINTBEGIN(bugprone-use-after-move)
    EXPECT_FALSE(m_Allocator.IsInitialized());
    EXPECT_EQ(m_Allocator.GetFreeCount(), 0u);
    EXPECT_EQ(m_Allocator.GetChunkCount(), 0u);
    EXPECT_FALSE(m_Allocator.Owns(held));
    EXPECT_EQ(m_Allocator.TryAlloc().error(), AllocatorError::OutOfMemory);
    // NOLINTEND(bugprone-use-after-move)

    moved.Free(held);
    EXPECT_EQ(moved.GetFreeCount(), kChunkCount);
}

TEST_F(BlockAllocatorTest, MoveAssignmentHandsOverChunks)
{
    std::vector<std::byte> otherBacking(kChunkSize * 2);
    BlockAllocator target(otherBacking, kChunkSize);

    target = std::move(m_Allocator);
    EXPECT_EQ(target.GetChunkCount(), kChunkCount);
    EXPECT_EQ(target.Alloc(), m_Backing.data());
    EXPECT_FALSE(m_Allocator.IsInitialized()); // NOLINT(bugprone-use-after-move)
}

TEST(BlockAllocator, TrailingBytesAreIgnored)
{
    std::vector<std::byte> backing(100);
    BlockAllocator allocator(backing, 32);
    EXPECT_EQ(allocator.GetChunkCount(), 3u);
    EXPECT_FALSE(allocator.Owns(backing.data() + 96));
}

TEST(BlockAllocator, ChunkSmallerThanLinkIsFatal)
{
    std::vector<std::byte> backing(64);
    EXPECT_DEATH({ BlockAllocator allocator(backing, 4); }, "smaller than a free-list link");
}

TEST(BlockAllocator, BackingSmallerThanChunkIsFatal)
{
    std::vector<std::byte> backing(16);
    EXPECT_DEATH({ BlockAllocator allocator(backing, 32); }, "cannot hold one");
}
