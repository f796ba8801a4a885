#pragma once
// ============================================================================
// Lac - Lac/Memory/Allocator.hpp
// ----------------------------------------------------------------------------
// Purpose : Declare the host allocator contract (`IAllocator`) used to back
//           arena chunks and pass-through allocations, plus a lightweight
//           non-owning facade (`AllocatorRef`) that normalizes alignment and
//           routes failures through the OOM policy.
// Contract: Deallocate must receive the exact `(size, alignment)` pair that
//           was used when the block was acquired. Alignment parameters are
//           always normalized via `NormalizeAlignment`.
// Notes   : Arenas never free individual blocks; only whole chunks travel back
//           through this interface, so no reallocation hook is declared.
// ============================================================================

#include <cstddef>      // std::size_t

#include "Lac/Types.hpp"
#include "Lac/Memory/Alignment.hpp" // NormalizeAlignment(...)
#include "Lac/Memory/OOM.hpp"

namespace lac::core
{
    // ---
    // Purpose : Define the contract for the memory backends arenas draw from.
    // Contract: Callers must pair Allocate results with matching (size, alignment) on free.
    // Notes   : Implementations must honour NormalizeAlignment and remain noexcept.
    // ---
    class IAllocator
    {
    public:
        virtual ~IAllocator() = default;

        // ---
        // Purpose : Acquire a raw byte buffer honouring the requested alignment.
        // Contract: `size` > 0; returns nullptr on failure; OOM policy handled by the caller.
        // ---
        [[nodiscard]] virtual void* Allocate(usize size, usize alignment) noexcept = 0;

        // ---
        // Purpose : Release a block previously obtained from this allocator.
        // Contract: `ptr` may be null; `(size, alignment)` must match the original request.
        // ---
        virtual void  Deallocate(void* ptr, usize size, usize alignment) noexcept = 0;
    };

    // ---
    // Purpose : Lightweight non-owning facade for invoking allocator operations safely.
    // Contract: Holds a raw IAllocator pointer; helpers normalize alignment and escalate failures.
    // Notes   : Cheap to copy; stored by value inside Chunk and Arena.
    // ---
    class AllocatorRef
    {
    public:
        constexpr AllocatorRef() noexcept : m_Alloc(nullptr) {}
        explicit constexpr AllocatorRef(IAllocator* alloc) noexcept : m_Alloc(alloc) {}

        [[nodiscard]] constexpr bool        IsValid() const noexcept { return m_Alloc != nullptr; }
        [[nodiscard]] constexpr IAllocator* Get()     const noexcept { return m_Alloc; }

        // ---
        // Purpose : Allocate an untyped byte range through the wrapped allocator.
        // Contract: `size` > 0; returns nullptr when the wrapper is invalid or allocation fails.
        // Notes   : Calls LAC_MEM_CHECK_OOM so fatal policy aborts before the caller sees nullptr.
        // ---
        [[nodiscard]] void* AllocateBytes(usize size,
            usize alignment = alignof(std::max_align_t)) const noexcept
        {
            if (!m_Alloc || size == 0)
                return nullptr;

            alignment = NormalizeAlignment(alignment);
            void* memory = m_Alloc->Allocate(size, alignment);
            if (!memory)
            {
                LAC_MEM_CHECK_OOM(size, alignment, "AllocatorRef::AllocateBytes");
            }
            return memory;
        }

        void DeallocateBytes(void* ptr,
            usize size,
            usize alignment = alignof(std::max_align_t)) const noexcept
        {
            if (!m_Alloc || !ptr)
                return;

            alignment = NormalizeAlignment(alignment);
            m_Alloc->Deallocate(ptr, size, alignment);
        }

    private:
        IAllocator* m_Alloc;
    };

} // namespace lac::core
