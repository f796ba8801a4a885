#pragma once
// ============================================================================
// Lac - Lac/Memory/Chunk.hpp
// ----------------------------------------------------------------------------
// Purpose : One contiguous raw buffer owned by at most one arena at a time.
//           The used length is the bump cursor.
// Contract: Non-copyable, non-movable (arenas publish Chunk* to other threads).
//           The buffer is released through the allocator it came from when the
//           Chunk is destroyed.
// Notes   : `Length` is atomic so the lock-free path can CAS it; the
//           single-thread path only uses relaxed loads and stores.
// ============================================================================

#include "Lac/Types.hpp"
#include "Lac/Memory/Allocator.hpp"

#include <atomic>
#include <cstddef>

namespace lac::memory
{
    class Chunk
    {
    public:
        static constexpr usize kBufferAlignment = alignof(std::max_align_t);

        // `pooled` marks nominal-size chunks that may go back to a ChunkPool.
        Chunk(core::AllocatorRef alloc, usize capacity, bool pooled) noexcept
            : m_alloc(alloc)
            , m_capacity(capacity)
            , m_pooled(pooled)
        {
            m_data = static_cast<u8*>(m_alloc.AllocateBytes(capacity, kBufferAlignment));
            if (!m_data)
                m_capacity = 0;
        }

        ~Chunk()
        {
            m_alloc.DeallocateBytes(m_data, m_capacity, kBufferAlignment);
        }

        Chunk(const Chunk&) = delete;
        Chunk& operator=(const Chunk&) = delete;

        [[nodiscard]] bool  IsValid() const noexcept { return m_data != nullptr; }
        [[nodiscard]] u8*   Data() const noexcept { return m_data; }
        [[nodiscard]] usize Capacity() const noexcept { return m_capacity; }
        [[nodiscard]] bool  IsPooled() const noexcept { return m_pooled; }

        [[nodiscard]] std::atomic<usize>& Length() noexcept { return m_length; }
        [[nodiscard]] usize GetLength() const noexcept { return m_length.load(std::memory_order_acquire); }

        [[nodiscard]] bool Contains(const void* p) const noexcept
        {
            const auto* b = static_cast<const u8*>(p);
            return b >= m_data && b < m_data + m_capacity;
        }

    private:
        core::AllocatorRef m_alloc;
        u8*                m_data = nullptr;
        usize              m_capacity = 0;
        std::atomic<usize> m_length{ 0 };
        bool               m_pooled = false;
    };

} // namespace lac::memory
