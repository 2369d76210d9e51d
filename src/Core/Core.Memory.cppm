module; // Global Fragment
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <memory>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

export module Core:Memory;

export namespace Core::Memory
{
    constexpr size_t kDefaultAlignment = 16;
    constexpr size_t kCacheLine = 64;

    enum class AllocatorError
    {
        OutOfMemory,
        InvalidAlignment,
        Overflow
    };

    // Fatal report for CarveArray; kept out of line so the template stays small.
    [[noreturn]] void ReportArenaExhausted(std::string_view owner, size_t count, size_t elementSize,
                                           size_t remaining);

    // -------------------------------------------------------------------------
    // LinearArena - bump allocator for storage sized once at construction
    // -------------------------------------------------------------------------
    // Never runs destructors, so only trivially destructible element types are
    // accepted. The Device carves its slot pools, renderer state blocks and
    // command queue out of one arena; the Batcher carves its instance staging
    // out of another. Nothing is reallocated after startup.
    // -------------------------------------------------------------------------
    class LinearArena
    {
    public:
        explicit LinearArena(size_t sizeBytes);

        LinearArena(const LinearArena&) = delete;
        LinearArena& operator=(const LinearArena&) = delete;

        LinearArena(LinearArena&& other) noexcept;
        LinearArena& operator=(LinearArena&& other) noexcept;

        [[nodiscard]]
        std::expected<void*, AllocatorError> Alloc(size_t size, size_t align = kDefaultAlignment);

        // Value-initialized array of count elements.
        template <typename T>
        [[nodiscard]]
        std::expected<std::span<T>, AllocatorError> NewArray(size_t count)
        {
            static_assert(std::is_trivially_destructible_v<T>, "LinearArena never runs destructors");

            if (count != 0 && sizeof(T) > SIZE_MAX / count)
                return std::unexpected(AllocatorError::Overflow);

            auto mem = Alloc(sizeof(T) * count, alignof(T));
            if (!mem) return std::unexpected(mem.error());

            T* first = static_cast<T*>(*mem);
            for (size_t i = 0; i < count; ++i) std::construct_at(first + i);
            return std::span<T>(first, count);
        }

        // NewArray for fixed-capacity storage: running out is a sizing bug, so
        // it panics naming the owner instead of returning an error.
        template <typename T>
        [[nodiscard]]
        std::span<T> CarveArray(size_t count, std::string_view owner)
        {
            auto storage = NewArray<T>(count);
            if (!storage)
                ReportArenaExhausted(owner, count, sizeof(T), GetRemaining());
            return *storage;
        }

        // Rewinds to empty. Spans handed out earlier dangle afterwards.
        void Reset();

        [[nodiscard]] size_t GetUsed() const { return m_Offset; }
        [[nodiscard]] size_t GetTotal() const { return m_TotalSize; }
        [[nodiscard]] size_t GetRemaining() const { return m_TotalSize - m_Offset; }

    private:
        struct AlignedFree
        {
            void operator()(std::byte* memory) const;
        };

        std::unique_ptr<std::byte[], AlignedFree> m_Storage;
        size_t m_TotalSize = 0;
        size_t m_Offset = 0;
    };

    // -------------------------------------------------------------------------
    // BlockAllocator - fixed-chunk free-list pool over caller-provided memory
    // -------------------------------------------------------------------------
    // - Chunks are threaded onto a singly linked free list stored inside the
    //   free chunks themselves. Reuse order is LIFO.
    // - Alloc() zero-fills the chunk it returns.
    // - Exhaustion, foreign pointers and double frees are fatal. A per-chunk
    //   state byte tracks allocated/free so a second Free() of the same chunk
    //   is caught instead of turning the list into a cycle.
    // - The backing memory is borrowed; it must outlive the allocator.
    // -------------------------------------------------------------------------
    class BlockAllocator
    {
    public:
        BlockAllocator() = default;
        BlockAllocator(std::span<std::byte> backing, size_t chunkSize);

        BlockAllocator(const BlockAllocator&) = delete;
        BlockAllocator& operator=(const BlockAllocator&) = delete;
        // The moved-from allocator is left uninitialized.
        BlockAllocator(BlockAllocator&& other) noexcept;
        BlockAllocator& operator=(BlockAllocator&& other) noexcept;

        // Requires chunkSize >= sizeof(free-list link) and backing.size() >= chunkSize.
        void Init(std::span<std::byte> backing, size_t chunkSize);

        [[nodiscard]] void* Alloc();
        [[nodiscard]] std::expected<void*, AllocatorError> TryAlloc();
        void Free(void* ptr);

        // Discards every outstanding allocation.
        void Reset();

        [[nodiscard]] bool Owns(const void* ptr) const;
        [[nodiscard]] size_t GetChunkSize() const { return m_ChunkSize; }
        [[nodiscard]] size_t GetChunkCount() const { return m_ChunkCount; }
        [[nodiscard]] size_t GetFreeCount() const { return m_FreeCount; }
        [[nodiscard]] bool IsInitialized() const { return m_Start != nullptr; }

    private:
        [[nodiscard]] std::byte* ReadLink(const std::byte* chunk) const;
        void WriteLink(std::byte* chunk, std::byte* next) const;

        std::byte* m_Start = nullptr;
        std::byte* m_End = nullptr; // one past the last whole chunk
        size_t m_ChunkSize = 0;
        size_t m_ChunkCount = 0;
        size_t m_FreeCount = 0;
        std::byte* m_Head = nullptr;
        std::vector<uint8_t> m_InUse;
    };
}
