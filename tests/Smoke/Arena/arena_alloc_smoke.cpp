// ============================================================================
// Arena Allocation Smoke Test
// ----------------------------------------------------------------------------
// Purpose : Validate the raw Alloc path: alignment, non-overlap across chunk
//           boundaries, zeroing, oversized requests, a stable footprint across
//           resets, the kill switch, and the share count protocol.
// Contract: No exceptions; deterministic workload; returns non-zero on failure.
// ============================================================================

#include "Lac/Memory/Arena.hpp"
#include "Lac/Memory/ArenaPool.hpp"
#include "ArenaSmokeCommon.hpp"

#include <algorithm>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <vector>

namespace
{
    using ::lac::memory::Arena;
    using ::lac::memory::ArenaPool;
    using ::lac::memory::ArenaPoolStats;
    using ::lac::memory::usize;

    struct Block
    {
        std::uintptr_t begin;
        usize          size;
    };

    // Deterministic sizes in [0, 600) plus an occasional oversized request.
    usize NextSize(std::uint32_t& state) noexcept
    {
        state = state * 1664525u + 1013904223u;
        if ((state >> 24) == 0x7Fu)
        {
            return 9000u;
        }
        return (state >> 8) % 600u;
    }

    bool Overlaps(std::vector<Block> blocks) noexcept
    {
        std::sort(blocks.begin(), blocks.end(),
            [](const Block& a, const Block& b) { return a.begin < b.begin; });
        for (usize i = 1; i < blocks.size(); ++i)
        {
            if (blocks[i - 1].begin + blocks[i - 1].size > blocks[i].begin)
            {
                return true;
            }
        }
        return false;
    }

    int RunAlignmentAndOverlapScenario()
    {
        ArenaPool pool(::lac::smoke::SmallChunkConfig());
        Arena* arena = pool.Get();

        std::vector<Block> blocks;
        std::uint32_t state = 12345u;
        for (int i = 0; i < 2000; ++i)
        {
            const usize size = NextSize(state);
            void* p = arena->Alloc(size, false);
            if (!p)
            {
                return 1;
            }
            if ((reinterpret_cast<std::uintptr_t>(p) % ::lac::kWordSize) != 0u)
            {
                return 2;
            }
            std::memset(p, 0xAB, size);
            blocks.push_back(Block{ reinterpret_cast<std::uintptr_t>(p), std::max<usize>(size, 1u) });
        }

        // Oversized: exactly one dedicated chunk.
        const usize chunksBefore = arena->GetChunkCount();
        void* big = arena->Alloc(20000u, false);
        if (!big || arena->GetChunkCount() != chunksBefore + 1u)
        {
            return 3;
        }
        blocks.push_back(Block{ reinterpret_cast<std::uintptr_t>(big), 20000u });

        if (Overlaps(blocks))
        {
            return 4;
        }
        if (arena->GetUsedBytes() > arena->GetCapacityBytes())
        {
            return 5;
        }

        pool.Release(arena);
        return 0;
    }

    int RunZeroingScenario()
    {
        ArenaPool pool(::lac::smoke::SmallChunkConfig());
        Arena* arena = pool.Get();

        // Dirty a chunk, reset, then ask for zeroed memory on the recycled chunk.
        auto* dirty = static_cast<unsigned char*>(arena->Alloc(1024u, false));
        std::memset(dirty, 0xCD, 1024u);
        arena->Reset();

        auto* clean = static_cast<unsigned char*>(arena->Alloc(1024u, true));
        for (usize i = 0; i < 1024u; ++i)
        {
            if (clean[i] != 0u)
            {
                return 10;
            }
        }

        pool.Release(arena);
        return 0;
    }

    int RunStableFootprintScenario()
    {
        ArenaPool pool(::lac::smoke::SmallChunkConfig());
        Arena* arena = pool.Get();

        usize chunks[3] = {};
        usize capacity[3] = {};
        for (int round = 0; round < 3; ++round)
        {
            std::uint32_t state = 777u;
            for (int i = 0; i < 400; ++i)
            {
                (void)arena->Alloc(NextSize(state) % 512u, false);
            }
            chunks[round] = arena->GetChunkCount();
            capacity[round] = arena->GetCapacityBytes();
            arena->Reset();
        }

        if (chunks[0] < 2u || chunks[0] != chunks[1] || chunks[1] != chunks[2] || capacity[0] != capacity[2])
        {
            return 20;
        }

        // Every chunk after the first round came from the pool.
        const ArenaPoolStats stats = pool.GetStats();
        if (stats.chunks.created != chunks[0] || stats.chunks.pooled != chunks[0])
        {
            return 21;
        }
        if (stats.resets != 3u || stats.usedBytes == 0u || stats.capacityBytes < stats.usedBytes)
        {
            return 22;
        }

        pool.Release(arena);
        return 0;
    }

    int RunKillSwitchScenario()
    {
        ::lac::memory::ArenaConfig cfg = ::lac::smoke::SmallChunkConfig();
        cfg.disabled = ::lac::memory::Toggle::On;
        ArenaPool pool(cfg);

        Arena* arena = pool.Get();
        if (!arena->IsDisabled())
        {
            return 30;
        }

        auto* p = static_cast<int*>(arena->Alloc(sizeof(int) * 16u, true));
        if (!p || p[15] != 0)
        {
            return 31;
        }
        int* obj = arena->New<int>(5);
        if (!obj || *obj != 5)
        {
            return 32;
        }

        // Host blocks only: no chunk is ever taken.
        if (arena->GetChunkCount() != 0u || arena->GetUsedBytes() == 0u)
        {
            return 33;
        }
        if (pool.GetStats().chunks.gets != 0u)
        {
            return 34;
        }

        arena->Reset();
        if (arena->GetUsedBytes() != 0u)
        {
            return 35;
        }
        pool.Release(arena);

        // Flipping the switch back applies to the next arena handed out.
        pool.SetDisabled(false);
        Arena* normal = pool.Get();
        if (normal->IsDisabled())
        {
            return 36;
        }
        (void)normal->Alloc(64u, false);
        if (normal->GetChunkCount() != 1u)
        {
            return 37;
        }
        pool.Release(normal);
        return 0;
    }

    int RunShareCountScenario()
    {
        ArenaPool pool(::lac::smoke::SmallChunkConfig());
        Arena* arena = pool.Get();
        if (arena->GetRefCount() != 1)
        {
            return 40;
        }

        arena->IncRef();
        arena->IncRef();
        (void)arena->Alloc(32u, false);
        arena->DecRef();
        arena->DecRef();
        if (arena->GetRefCount() != 1 || pool.GetStats().arenasPooled != 0u)
        {
            return 41;
        }

        const ::lac::memory::u64 epoch = arena->GetEpoch();
        arena->DecRef(); // last reference: back to the pool
        if (pool.GetStats().arenasPooled != 1u || arena->GetEpoch() != epoch + 1u)
        {
            return 42;
        }

        // Production mode: an extra DecRef is logged and clamped, never a second release.
        arena->DecRef();
        if (arena->GetRefCount() != 0 || pool.GetStats().arenasPooled != 1u)
        {
            return 43;
        }

        Arena* again = pool.Get();
        if (again != arena || again->GetRefCount() != 1)
        {
            return 44;
        }
        pool.Release(again);

        const bool negative = ::lac::smoke::ExpectDeath([]() {
            ArenaPool debugPool(::lac::smoke::SmallChunkConfig(::lac::memory::Toggle::On));
            Arena* a = debugPool.Get();
            a->DecRef();
            a->DecRef();
        }, SIGABRT, "reference count went negative");
        if (!negative)
        {
            return 45;
        }

        return 0;
    }
} // namespace

int RunArenaAllocSmoke()
{
    if (const int rc = RunAlignmentAndOverlapScenario(); rc != 0)
    {
        return rc;
    }
    if (const int rc = RunZeroingScenario(); rc != 0)
    {
        return rc;
    }
    if (const int rc = RunStableFootprintScenario(); rc != 0)
    {
        return rc;
    }
    if (const int rc = RunKillSwitchScenario(); rc != 0)
    {
        return rc;
    }
    return RunShareCountScenario();
}
