#pragma once
// ============================================================================
// Lac - Lac/Memory/ChunkPool.hpp
// ----------------------------------------------------------------------------
// Purpose : Recycle nominal-size chunks between arenas; hand out standalone
//           buffers for oversized requests.
// Contract: Thread-safe. Acquire() returns nullptr only when the OOM policy is
//           soft and the host allocator failed.
// Notes   : Standalone chunks never enter the pool: one oversized spike must
//           not inflate steady-state memory.
// ============================================================================

#include "Lac/Types.hpp"
#include "Lac/Memory/Allocator.hpp"
#include "Lac/Memory/Chunk.hpp"
#include "Lac/Memory/Pool.hpp"

#include <atomic>
#include <memory>

namespace lac::memory
{
    struct ChunkPoolStats
    {
        usize chunkSize = 0;
        usize created = 0;      // nominal chunks built by the pool
        usize standalone = 0;   // oversized chunks built outside the pool
        usize gets = 0;
        usize misses = 0;
        usize drops = 0;
        usize pooled = 0;
    };

    class ChunkPool
    {
    public:
        ChunkPool(usize chunkSize, usize maxPooled, core::AllocatorRef alloc) noexcept;

        ChunkPool(const ChunkPool&) = delete;
        ChunkPool& operator=(const ChunkPool&) = delete;

        // ---
        // Purpose : Hand out a chunk with at least `minBytes` capacity and zero length.
        // Contract: Requests up to the nominal size are served from the pool;
        //           larger ones get a standalone chunk sized exactly `minBytes`.
        // ---
        [[nodiscard]] std::unique_ptr<Chunk> Acquire(usize minBytes) noexcept;

        // Truncate and recycle. Standalone chunks are freed here.
        void Release(std::unique_ptr<Chunk> chunk) noexcept;

        void Reserve(usize count) noexcept { m_pool.Reserve(count); }
        void Clear() noexcept { m_pool.Clear(); }

        // Debug mode turns on duplicate detection and delayed reuse.
        void SetDebug(bool enabled) noexcept;

        [[nodiscard]] usize GetChunkSize() const noexcept { return m_chunkSize; }
        [[nodiscard]] ChunkPoolStats GetStats() const noexcept;

    private:
        [[nodiscard]] std::unique_ptr<Chunk> MakeChunk() noexcept;

        usize              m_chunkSize;
        core::AllocatorRef m_alloc;
        std::atomic<usize> m_standalone{ 0 };
        Pool<std::unique_ptr<Chunk>> m_pool;
    };

} // namespace lac::memory
