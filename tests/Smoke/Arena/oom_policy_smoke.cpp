// ============================================================================
// OOM Policy Smoke Test
// ----------------------------------------------------------------------------
// Purpose : Validate both out-of-memory dispositions on the arena path: the
//           default policy aborts, the soft policy makes Alloc return nullptr
//           and leaves the arena usable.
// Contract: No exceptions; deterministic; returns non-zero on failure.
// Notes   : The expected "Allocation failed" errors are kept off the console
//           with the logger's category filter. Policy and filter are restored
//           before returning.
// ============================================================================

#include "Lac/Memory/Arena.hpp"
#include "Lac/Memory/ArenaPool.hpp"
#include "Lac/Memory/OOM.hpp"
#include "Lac/Logger.hpp"
#include "ArenaSmokeCommon.hpp"

#include <csignal>
#include <limits>

namespace
{
    using ::lac::core::Logger;
    using ::lac::core::LogLevel;
    using ::lac::memory::Arena;
    using ::lac::memory::ArenaPool;
    using ::lac::memory::usize;

    constexpr usize kMaxSize = (std::numeric_limits<usize>::max)();

    int RunSoftPolicyScenario()
    {
        ArenaPool pool(::lac::smoke::SmallChunkConfig());
        Arena* arena = pool.Get();

        Logger::SetCategoryEqualsFilter(LAC_ARENA_CORE_LOG_CATEGORY);
        if (Logger::IsEnabled(LogLevel::Error, LAC_MEM_LOG_CATEGORY)
            || !Logger::IsEnabled(LogLevel::Error, LAC_ARENA_CORE_LOG_CATEGORY))
        {
            return 1;
        }

        // Rejected before word rounding could overflow.
        if (arena->Alloc(kMaxSize, false) != nullptr)
        {
            return 2;
        }

        // Passes the size guard, then fails inside the host allocator while
        // building the standalone chunk.
        if (arena->Alloc(kMaxSize - 4096u, false) != nullptr)
        {
            return 3;
        }
        if (arena->GetChunkCount() != 0u || pool.GetStats().chunks.standalone != 1u)
        {
            return 4;
        }

        // A failed request leaves the arena serviceable.
        int* value = arena->New<int>(21);
        if (!value || *value != 21 || arena->GetChunkCount() != 1u)
        {
            return 5;
        }

        pool.SetDisabled(true);
        pool.Release(arena);
        arena = pool.Get();
        if (arena->Alloc(kMaxSize - 4096u, false) != nullptr)
        {
            return 6;
        }
        pool.Release(arena);
        return 0;
    }
} // namespace

int RunOomPolicySmoke()
{
    if (!::lac::core::ShouldFatalOnOOM())
    {
        return 10;
    }

    const bool fatal = ::lac::smoke::ExpectDeath([]() {
        ArenaPool pool(::lac::smoke::SmallChunkConfig());
        Arena* arena = pool.Get();
        (void)arena->Alloc(kMaxSize, false);
    }, SIGABRT, "Out of memory in Arena::Alloc");
    if (!fatal)
    {
        return 11;
    }

    ::lac::core::SetFatalOnOOMPolicy(false);
    const int rc = RunSoftPolicyScenario();
    ::lac::core::SetFatalOnOOMPolicy(true);
    Logger::SetCategoryEqualsFilter(nullptr);
    return rc;
}
