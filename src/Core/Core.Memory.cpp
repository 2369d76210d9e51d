module;

#include <cstdlib>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <algorithm>
#include <span>
#include <format>
#include <memory>
#include <string_view>
#include <utility>

module Core:Memory.Impl;

import :Memory;
import :Assert;
import :Logging;

namespace Core::Memory
{
    void ReportArenaExhausted(std::string_view owner, size_t count, size_t elementSize, size_t remaining)
    {
        Panic(std::format("{}: arena cannot hold {} x {} bytes ({} bytes remaining)",
                          owner, count, elementSize, remaining));
    }

    // -------------------------------------------------------------------------
    // LinearArena
    // -------------------------------------------------------------------------

    void LinearArena::AlignedFree::operator()(std::byte* memory) const
    {
#if defined(_MSC_VER)
        _aligned_free(memory);
#else
        std::free(memory);
#endif
    }

    LinearArena::LinearArena(size_t sizeBytes)
    {
        if (sizeBytes == 0)
            return;

        // aligned_alloc wants the size to be a multiple of the alignment.
        const size_t rounded = (sizeBytes + kCacheLine - 1) & ~(kCacheLine - 1);
#if defined(_MSC_VER)
        void* memory = _aligned_malloc(rounded, kCacheLine);
#else
        void* memory = std::aligned_alloc(kCacheLine, rounded);
#endif
        if (!memory)
        {
            Log::Warn("LinearArena: failed to reserve {} bytes", rounded);
            return;
        }

        m_Storage.reset(static_cast<std::byte*>(memory));
        m_TotalSize = rounded;
    }

    LinearArena::LinearArena(LinearArena&& other) noexcept
        : m_Storage(std::move(other.m_Storage))
        , m_TotalSize(std::exchange(other.m_TotalSize, 0))
        , m_Offset(std::exchange(other.m_Offset, 0))
    {
    }

    LinearArena& LinearArena::operator=(LinearArena&& other) noexcept
    {
        if (this != &other)
        {
            m_Storage = std::move(other.m_Storage);
            m_TotalSize = std::exchange(other.m_TotalSize, 0);
            m_Offset = std::exchange(other.m_Offset, 0);
        }
        return *this;
    }

    std::expected<void*, AllocatorError> LinearArena::Alloc(size_t size, size_t align)
    {
        if (!m_Storage) return std::unexpected(AllocatorError::OutOfMemory);
        if (align == 0 || (align & (align - 1)) != 0) return std::unexpected(AllocatorError::InvalidAlignment);

        const size_t effective = std::max(align, alignof(std::max_align_t));
        const size_t offset = (m_Offset + effective - 1) & ~(effective - 1);
        if (offset < m_Offset || size > m_TotalSize || offset > m_TotalSize - size)
            return std::unexpected(AllocatorError::OutOfMemory);

        m_Offset = offset + size;
        return m_Storage.get() + offset;
    }

    void LinearArena::Reset()
    {
        m_Offset = 0;
#ifndef NDEBUG
        // Poison small arenas so reads through stale spans stand out.
        constexpr size_t kPoisonLimit = 8 * 1024 * 1024;
        if (m_Storage && m_TotalSize <= kPoisonLimit)
            std::memset(m_Storage.get(), 0xCD, m_TotalSize);
#endif
    }

    // -------------------------------------------------------------------------
    // BlockAllocator
    // -------------------------------------------------------------------------

    BlockAllocator::BlockAllocator(std::span<std::byte> backing, size_t chunkSize)
    {
        Init(backing, chunkSize);
    }

    BlockAllocator::BlockAllocator(BlockAllocator&& other) noexcept
        : m_Start(std::exchange(other.m_Start, nullptr))
        , m_End(std::exchange(other.m_End, nullptr))
        , m_ChunkSize(std::exchange(other.m_ChunkSize, 0))
        , m_ChunkCount(std::exchange(other.m_ChunkCount, 0))
        , m_FreeCount(std::exchange(other.m_FreeCount, 0))
        , m_Head(std::exchange(other.m_Head, nullptr))
        , m_InUse(std::exchange(other.m_InUse, {}))
    {
    }

    BlockAllocator& BlockAllocator::operator=(BlockAllocator&& other) noexcept
    {
        if (this != &other)
        {
            m_Start = std::exchange(other.m_Start, nullptr);
            m_End = std::exchange(other.m_End, nullptr);
            m_ChunkSize = std::exchange(other.m_ChunkSize, 0);
            m_ChunkCount = std::exchange(other.m_ChunkCount, 0);
            m_FreeCount = std::exchange(other.m_FreeCount, 0);
            m_Head = std::exchange(other.m_Head, nullptr);
            m_InUse = std::exchange(other.m_InUse, {});
        }
        return *this;
    }

    void BlockAllocator::Init(std::span<std::byte> backing, size_t chunkSize)
    {
        if (chunkSize < sizeof(std::byte*))
        {
            Panic(std::format("BlockAllocator: chunk size {} is smaller than a free-list link ({})",
                              chunkSize, sizeof(std::byte*)));
        }
        if (backing.data() == nullptr || backing.size() < chunkSize)
        {
            Panic(std::format("BlockAllocator: backing buffer of {} bytes cannot hold one {}-byte chunk",
                              backing.size(), chunkSize));
        }

        m_Start = backing.data();
        m_ChunkSize = chunkSize;
        m_ChunkCount = backing.size() / chunkSize;
        m_End = m_Start + m_ChunkCount * m_ChunkSize;
        m_InUse.assign(m_ChunkCount, 0);

        Reset();
    }

    void BlockAllocator::Reset()
    {
        // Thread back to front so chunk 0 ends up at the head.
        m_Head = nullptr;
        for (size_t i = m_ChunkCount; i > 0; --i)
        {
            std::byte* chunk = m_Start + (i - 1) * m_ChunkSize;
            WriteLink(chunk, m_Head);
            m_Head = chunk;
        }
        std::fill(m_InUse.begin(), m_InUse.end(), uint8_t{0});
        m_FreeCount = m_ChunkCount;
    }

    std::expected<void*, AllocatorError> BlockAllocator::TryAlloc()
    {
        if (!m_Head) return std::unexpected(AllocatorError::OutOfMemory);

        std::byte* chunk = m_Head;
        m_Head = ReadLink(chunk);
        --m_FreeCount;

        const size_t index = static_cast<size_t>(chunk - m_Start) / m_ChunkSize;
        m_InUse[index] = 1;

        std::memset(chunk, 0, m_ChunkSize);
        return chunk;
    }

    void* BlockAllocator::Alloc()
    {
        auto result = TryAlloc();
        if (!result)
        {
            Panic(std::format("BlockAllocator exhausted: all {} chunks of {} bytes are in use",
                              m_ChunkCount, m_ChunkSize));
        }
        return *result;
    }

    void BlockAllocator::Free(void* ptr)
    {
        Verify(ptr != nullptr, "BlockAllocator: Free(nullptr)");
        Verify(Owns(ptr), "BlockAllocator: Free() of a pointer outside the backing buffer");

        auto* chunk = static_cast<std::byte*>(ptr);
        const size_t offset = static_cast<size_t>(chunk - m_Start);
        Verify(offset % m_ChunkSize == 0, "BlockAllocator: Free() of a pointer that is not a chunk start");

        const size_t index = offset / m_ChunkSize;
        if (m_InUse[index] == 0)
            Panic(std::format("BlockAllocator: double free of chunk {}", index));

        m_InUse[index] = 0;
        WriteLink(chunk, m_Head);
        m_Head = chunk;
        ++m_FreeCount;
    }

    bool BlockAllocator::Owns(const void* ptr) const
    {
        const auto* p = static_cast<const std::byte*>(ptr);
        return m_Start != nullptr && p >= m_Start && p < m_End;
    }

    // Chunks need not be pointer-aligned, so links go through memcpy.
    std::byte* BlockAllocator::ReadLink(const std::byte* chunk) const
    {
        std::byte* next = nullptr;
        std::memcpy(&next, chunk, sizeof(next));
        return next;
    }

    void BlockAllocator::WriteLink(std::byte* chunk, std::byte* next) const
    {
        std::memcpy(chunk, &next, sizeof(next));
    }
}
