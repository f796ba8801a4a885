// ============================================================================
// Arena Shared Stress Smoke Test
// ----------------------------------------------------------------------------
// Purpose : Hammer one shared arena from several threads through the CAS
//           path and verify that no two allocations overlap.
// Contract: No exceptions; deterministic per-thread workload; returns
//           non-zero on failure.
// Notes   : Small chunks force frequent chunk swaps so the install race is
//           exercised, not just the bump CAS.
// ============================================================================

#include "Lac/Memory/Arena.hpp"
#include "Lac/Memory/ArenaPool.hpp"
#include "ArenaSmokeCommon.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <thread>
#include <vector>

namespace
{
    struct Tagged
    {
        int* value;
    };
    LAC_ARENA_STRUCT(Tagged, LAC_ARENA_FIELD(Tagged, value));

    struct Entry
    {
        unsigned char* ptr{ nullptr };
        std::size_t    size{ 0 };
    };

    int RunSharedScenario(bool debug)
    {
        constexpr std::size_t kThreadCount = 8u;
        constexpr std::size_t kAllocsPerThread = 4000u;
        constexpr std::array<std::size_t, 7> kSizes = { 8u, 16u, 24u, 40u, 64u, 200u, 1000u };

        ::lac::memory::ArenaPool pool(::lac::smoke::SmallChunkConfig(
            debug ? ::lac::memory::Toggle::On : ::lac::memory::Toggle::Off));
        ::lac::memory::Arena* arena = pool.Get();

        std::array<std::vector<Entry>, kThreadCount> buckets{};
        for (auto& bucket : buckets)
        {
            bucket.reserve(kAllocsPerThread);
        }

        std::atomic<int> failure{ 0 };
        std::array<std::thread, kThreadCount> threads{};
        for (std::size_t t = 0; t < kThreadCount; ++t)
        {
            // The reference is taken before the worker starts.
            arena->IncRef();
            threads[t] = std::thread([&, t]() {
                auto& bucket = buckets[t];
                const unsigned char tag = static_cast<unsigned char>(t + 1u);
                for (std::size_t i = 0; i < kAllocsPerThread; ++i)
                {
                    const std::size_t size = kSizes[(i + t) % kSizes.size()];
                    auto* p = static_cast<unsigned char*>(arena->Alloc(size, false));
                    if (!p || (reinterpret_cast<std::uintptr_t>(p) % ::lac::kWordSize) != 0u)
                    {
                        int expected = 0;
                        (void)failure.compare_exchange_strong(expected, 1);
                        break;
                    }
                    std::memset(p, tag, size);
                    bucket.push_back(Entry{ p, size });
                }
                arena->DecRef();
            });
        }

        for (auto& thread : threads)
        {
            thread.join();
        }

        if (failure.load() != 0)
        {
            return 1;
        }
        if (arena->GetRefCount() != 1)
        {
            return 2;
        }

        // Every byte still carries the tag of the thread that wrote it.
        std::vector<Entry> all;
        for (std::size_t t = 0; t < kThreadCount; ++t)
        {
            const unsigned char tag = static_cast<unsigned char>(t + 1u);
            for (const Entry& e : buckets[t])
            {
                for (std::size_t b = 0; b < e.size; ++b)
                {
                    if (e.ptr[b] != tag)
                    {
                        return 3;
                    }
                }
                all.push_back(e);
            }
        }

        std::sort(all.begin(), all.end(),
            [](const Entry& a, const Entry& b) { return a.ptr < b.ptr; });
        for (std::size_t i = 1; i < all.size(); ++i)
        {
            if (all[i - 1].ptr + all[i - 1].size > all[i].ptr)
            {
                return 4;
            }
        }

        if (arena->GetUsedBytes() > arena->GetCapacityBytes())
        {
            return 5;
        }

        arena->DecRef();
        const ::lac::memory::ArenaPoolStats stats = pool.GetStats();
        if (stats.arenasPooled != 1u || stats.resets != 1u)
        {
            return 6;
        }
        // Chunks that lost the install race went straight back to the pool.
        if (stats.chunks.pooled != stats.chunks.created)
        {
            return 7;
        }
        return 0;
    }

    // Every thread overflows the debug root list at once; the overflow
    // warning is claimed by exactly one of them.
    int RunRootOverflowScenario()
    {
        constexpr std::size_t kThreadCount = 8u;
        constexpr std::size_t kRootCap = 4u;

        ::lac::memory::ArenaConfig cfg = ::lac::smoke::SmallChunkConfig(::lac::memory::Toggle::On);
        cfg.max_debug_roots = kRootCap;
        ::lac::memory::ArenaPool pool(cfg);
        ::lac::memory::Arena* arena = pool.Get();

        std::atomic<int> failure{ 0 };
        std::array<std::thread, kThreadCount> threads{};
        for (std::size_t t = 0; t < kThreadCount; ++t)
        {
            arena->IncRef();
            threads[t] = std::thread([&]() {
                for (int i = 0; i < 500; ++i)
                {
                    Tagged* tagged = arena->New<Tagged>();
                    if (!tagged)
                    {
                        failure.store(1);
                        break;
                    }
                    tagged->value = arena->New<int>(i);
                }
                arena->DecRef();
            });
        }
        for (auto& thread : threads)
        {
            thread.join();
        }

        if (failure.load() != 0 || arena->GetRootCount() != kRootCap)
        {
            return 1;
        }
        pool.Release(arena);
        return 0;
    }
} // namespace

int RunArenaSharedStressSmoke()
{
    if (const int rc = RunSharedScenario(false); rc != 0)
    {
        return rc;
    }
    if (const int rc = RunSharedScenario(true); rc != 0)
    {
        return rc + 10;
    }
    const int rc = RunRootOverflowScenario();
    return (rc == 0) ? 0 : rc + 20;
}
