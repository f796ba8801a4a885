#pragma once
// ============================================================================
// Lac - Lac/Memory/Alignment.hpp
// ----------------------------------------------------------------------------
// Purpose : Centralize alignment math (power-of-two predicates, normalization,
//           word rounding) in constexpr-friendly utilities shared by the host
//           allocator and the arena bump paths.
// Contract: NormalizeAlignment() yields power-of-two results >= alignof(max_align_t)
//           for host allocations. Arena requests are rounded with AlignToWord()
//           which only guarantees machine-word alignment.
// Notes   : Integer overloads are constrained to unsigned types. Saturation
//           avoids UB on extreme inputs to keep behavior deterministic.
// ============================================================================

#include <cstddef>      // std::size_t, std::max_align_t
#include <cstdint>      // std::uintptr_t
#include <limits>       // std::numeric_limits
#include <type_traits>  // std::is_integral_v, std::is_unsigned_v

#include "Lac/Types.hpp"
#include "Lac/Logger.hpp" // LAC_LOG_*

#ifndef LAC_LOGCAT_ALIGNMENT
#define LAC_LOGCAT_ALIGNMENT "Memory.Alignment"
#endif

namespace lac::core
{
    // ---
    // Purpose : Test whether the provided unsigned value has exactly one bit set.
    // Contract: Accepts any `usize`; returns true only when value > 0 and power-of-two.
    // Notes   : constexpr-friendly so callers can guard static_assert invariants.
    // ---
    [[nodiscard]] constexpr bool IsPowerOfTwo(usize x) noexcept
    {
        return (x != 0) && ((x & (x - 1)) == 0);
    }

    namespace detail
    {
        [[nodiscard]] constexpr usize HighestPow2() noexcept
        {
            return (usize{ 1 } << (std::numeric_limits<usize>::digits - 1));
        }

        // ---
        // Purpose : Round arbitrary unsigned input up to the next power-of-two with saturation.
        // Contract: Accepts any `usize`; returns at least 1; clamps to HighestPow2() on overflow.
        // ---
        [[nodiscard]] constexpr usize NextPow2Saturated(usize x) noexcept
        {
            if (x == 0) return usize{ 1 };
            if (IsPowerOfTwo(x)) return x;
            if (x > HighestPow2()) return HighestPow2();

            usize p = 1;
            while (p < x)
            {
                p <<= 1;
            }
            return p;
        }

        template <class U>
        [[nodiscard]] constexpr bool add_would_overflow(U a, U b) noexcept
        {
            static_assert(std::is_unsigned_v<U>, "Overflow helper expects unsigned type");
            return a > (std::numeric_limits<U>::max)() - b;
        }
    } // namespace detail

    // ---
    // Purpose : Canonicalize caller-provided alignment for host allocations.
    // Contract: Maps zero to `alignof(std::max_align_t)`; never returns 0.
    // Notes   : Saturates on overflow.
    // ---
    [[nodiscard]] constexpr usize NormalizeAlignment(usize alignment) noexcept
    {
        const usize minAlign = alignof(std::max_align_t);
        if (alignment == 0)
            return minAlign;

        const usize rounded = detail::NextPow2Saturated(alignment);
        return (rounded < minAlign) ? minAlign : rounded;
    }

    // ---
    // Purpose : Bump an unsigned integral value up to the next multiple of a power-of-two.
    // Contract: T must be unsigned integral; `alignment` must already be a power of two.
    // Notes   : Clamps to max on overflow (defined, not UB) and logs through LAC_ASSERT.
    // ---
    template <class T>
    [[nodiscard]] constexpr T AlignUp(T value, usize alignment) noexcept
    {
        static_assert(std::is_integral_v<T>, "AlignUp<T>: T must be integral");
        static_assert(std::is_unsigned_v<T>, "AlignUp<T>: T must be UNSIGNED");
        const T mask = static_cast<T>(alignment - 1u);

        if ((value & mask) == T{ 0 })
            return value;

        if (detail::add_would_overflow<T>(value, mask))
        {
            LAC_ASSERT(false, "AlignUp overflow: value + (alignment-1) exceeds max");
            return (std::numeric_limits<T>::max)();
        }

        return static_cast<T>((value + mask) & ~mask);
    }

    // ---
    // Purpose : Round a request size to the arena's allocation granule.
    // Contract: Zero-byte requests still consume one word so every call yields a distinct address.
    // Notes   : Used by every arena allocation path.
    // ---
    [[nodiscard]] constexpr usize AlignToWord(usize size) noexcept
    {
        return AlignUp<usize>(size == 0 ? usize{ 1 } : size, kWordSize);
    }

    template <class T,
              std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T>, int> = 0>
    [[nodiscard]] constexpr bool IsAligned(T value, usize alignment) noexcept
    {
        return (value & static_cast<T>(alignment - 1u)) == T{ 0 };
    }

    // ---
    // Purpose : Determine whether a pointer satisfies the requested alignment.
    // Contract: Works with null pointers; `alignment` must be a power of two.
    // Notes   : Misalignment diagnostics are logged only when the category is enabled.
    // ---
    [[nodiscard]] inline bool IsAligned(const void* ptr, usize alignment) noexcept
    {
        const std::uintptr_t p = reinterpret_cast<std::uintptr_t>(ptr);
        const bool ok = IsAligned<std::uintptr_t>(p, alignment);
        if (!ok)
        {
            LAC_LOG_WARNING(LAC_LOGCAT_ALIGNMENT, "Pointer {} is NOT aligned to {}", ptr, alignment);
        }
        return ok;
    }

    static_assert(IsPowerOfTwo(1), "1 is power of two");
    static_assert(!IsPowerOfTwo(0), "0 is not power of two");
    static_assert(NormalizeAlignment(0) >= alignof(std::max_align_t),
        "Zero alignment maps to at least max_align_t");
    static_assert(IsPowerOfTwo(NormalizeAlignment((std::numeric_limits<usize>::max)())),
        "Normalization returns a power-of-two even for extreme inputs");
    static_assert(AlignUp<usize>(13, 8) == 16, "13 aligned up to 8 -> 16");
    static_assert(AlignToWord(0) == kWordSize, "empty requests still take a word");
    static_assert(AlignToWord(9) == 2 * kWordSize, "9 bytes round to two words");

} // namespace lac::core
