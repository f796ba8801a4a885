#pragma once
// ============================================================================
// Lac - Lac/Memory/OOM.hpp
// ----------------------------------------------------------------------------
// Purpose : Declare the out-of-memory policy helpers invoked by the host
//           allocator bridge and the arena chunk refill path after allocation
//           failure.
// Contract: Header-only and noexcept; never allocates or throws. Termination is
//           deterministic according to the runtime policy flag, which defaults
//           to the compile-time LAC_MEM_FATAL_ON_OOM gate.
// Notes   : Arena typed constructors cannot express failure in their return
//           values for every kind, so the library defaults to fatal OOM. Soft
//           mode makes Arena::Alloc return nullptr and leaves the caller in
//           charge.
// ============================================================================
#include "Lac/Logger.hpp"

#include <atomic>
#include <cstddef>
#include <cstdlib>

#ifndef LAC_MEM_LOG_CATEGORY
#define LAC_MEM_LOG_CATEGORY "Memory"
#endif

#ifndef LAC_MEM_FATAL_ON_OOM
#define LAC_MEM_FATAL_ON_OOM 1
#endif

#if (LAC_MEM_FATAL_ON_OOM != 0) && (LAC_MEM_FATAL_ON_OOM != 1)
#   error "LAC_MEM_FATAL_ON_OOM must be 0 (non-fatal) or 1 (fatal)"
#endif

namespace lac::core {

    namespace detail
    {
        [[nodiscard]] inline std::atomic<bool>& FatalPolicyFlag() noexcept
        {
            static std::atomic<bool> policy{ LAC_MEM_FATAL_ON_OOM != 0 };
            return policy;
        }
    }

    // ---
    // Purpose : Determine whether the current OOM policy requires termination.
    // Contract: Reads the runtime flag; no allocation, no logging.
    // ---
    [[nodiscard]] inline bool ShouldFatalOnOOM() noexcept
    {
        return detail::FatalPolicyFlag().load(std::memory_order_relaxed);
    }

    // ---
    // Purpose : Update the runtime OOM disposition (hard abort vs soft nullptr).
    // Contract: Callable from any thread; takes effect for subsequent failures.
    // Notes   : Tests toggle this directly to exercise the soft path.
    // ---
    inline void SetFatalOnOOMPolicy(bool fatal) noexcept
    {
        detail::FatalPolicyFlag().store(fatal, std::memory_order_relaxed);
    }

    [[noreturn]] inline void FatalOOM(std::size_t size, std::size_t align,
        const char* where,
        const char* file, int line) noexcept
    {
        LAC_LOG_FATAL(LAC_MEM_LOG_CATEGORY,
            "Out of memory in {}: size={} align={} at {}:{}",
            where ? where : "<unknown>", size, align, file, line);
    }

    inline void ReportOOM(std::size_t size, std::size_t align,
        const char* where,
        const char* file, int line) noexcept
    {
        LAC_LOG_ERROR(LAC_MEM_LOG_CATEGORY,
            "Allocation failed in {}: size={} align={} at {}:{}",
            where ? where : "<unknown>", size, align, file, line);
    }

    // ---
    // Purpose : Route allocation failures to the fatal or non-fatal handler based on policy.
    // Contract: Strongly noexcept; `where` may be null.
    // Notes   : Central entry used by the LAC_MEM_CHECK_OOM macro.
    // ---
    inline void OnAllocFailure(std::size_t size, std::size_t align,
        const char* where, const char* file, int line) noexcept
    {
        if (ShouldFatalOnOOM()) {
            FatalOOM(size, align, where, file, line);
        }
        ReportOOM(size, align, where, file, line);
    }

} // namespace lac::core

// ---
// Purpose : Convenience macro for invoking OOM policy after allocation failure.
// Contract: Evaluate each argument exactly once.
// ---
#define LAC_MEM_CHECK_OOM(size, align, where) \
    do { ::lac::core::OnAllocFailure((size), (align), (where), __FILE__, __LINE__); } while(0)
