#pragma once
// ============================================================================
// Lac - Lac/Memory/DefaultAllocator.hpp
// ----------------------------------------------------------------------------
// Purpose : Host allocator behind every chunk buffer and every pass-through
//           block. Honours the alignment rules while delegating storage to
//           ::operator new/delete.
// Contract: Stateless and thread-safe. Callers may pass any alignment value;
//           the allocator normalizes it via NormalizeAlignment and requires
//           the exact (size, alignment) pair on Deallocate(). When
//           LAC_MEM_PARANOID_META is enabled the header also records the
//           tuple and Deallocate() validates it.
// Notes   : No platform-specific APIs are used.
// ============================================================================

#include "Lac/Types.hpp"
#include "Lac/Memory/Allocator.hpp"
#include "Lac/Memory/Alignment.hpp"
#include "Lac/Memory/OOM.hpp"

#include <cstdint>    // std::uintptr_t
#include <limits>
#include <new>        // std::nothrow

// 0 = store minimal header (rawPtr+magic); 1 = also store size+align and check them on free.
#ifndef LAC_MEM_PARANOID_META
#   define LAC_MEM_PARANOID_META 0
#endif
#if (LAC_MEM_PARANOID_META != 0) && (LAC_MEM_PARANOID_META != 1)
#   error "LAC_MEM_PARANOID_META must be 0 or 1"
#endif

// Upper bound on alignments the host bridge accepts. Default: 1 MiB.
#ifndef LAC_MAX_REASONABLE_ALIGNMENT
#   define LAC_MAX_REASONABLE_ALIGNMENT (1u << 20)
#endif

namespace lac::core {

    // ---
    // Purpose : Translate the allocator contract onto ::operator new.
    // Contract: Stateless and thread-safe; mandates matching (size, alignment) on free.
    // Notes   : A header in front of the payload stores the raw pointer and a magic tag.
    // ---
    class DefaultAllocator final : public IAllocator {
    private:
        static constexpr u32 HEADER_MAGIC = 0x1AC0A11Cu;

        struct alignas(alignof(std::max_align_t)) AllocationHeader {
            void* rawPtr;  // original pointer returned by ::operator new
            u32   magic;   // debug guard
#if LAC_MEM_PARANOID_META
            usize size;
            usize align;
#endif
        };

        static_assert(sizeof(AllocationHeader) % alignof(std::max_align_t) == 0,
            "Header must be sized as a multiple of max_align_t");

        static inline bool IsHeaderValid(const AllocationHeader* h) noexcept {
            return h && h->magic == HEADER_MAGIC && h->rawPtr != nullptr;
        }

    public:
        DefaultAllocator() = default;
        ~DefaultAllocator() override = default;

        // ---
        // Purpose : Reserve a block that satisfies the allocator contract using ::operator new.
        // Contract: `size` > 0; returns nullptr only when the OOM policy is soft.
        // ---
        [[nodiscard]] void* Allocate(usize size,
            usize alignment = alignof(std::max_align_t)) noexcept override
        {
            if (size == 0) return nullptr;

            alignment = NormalizeAlignment(alignment);

            if (alignment > static_cast<usize>(LAC_MAX_REASONABLE_ALIGNMENT)) {
                LAC_MEM_CHECK_OOM(size, alignment, "DefaultAllocator::Allocate");
                return nullptr;
            }

            constexpr usize kHeaderSize = sizeof(AllocationHeader);
            const usize extra = alignment - 1;
            const usize maxv = (std::numeric_limits<usize>::max)();
            if (size > maxv - kHeaderSize - extra) {
                LAC_MEM_CHECK_OOM(size, alignment, "DefaultAllocator::Allocate");
                return nullptr;
            }
            const usize totalSize = kHeaderSize + size + extra;

            void* raw = ::operator new(totalSize, std::nothrow);
            if (!raw) {
                LAC_MEM_CHECK_OOM(size, alignment, "DefaultAllocator::Allocate");
                return nullptr;
            }

            void* afterHeader = static_cast<u8*>(raw) + kHeaderSize;
            const usize alignedAddr = AlignUp<usize>(
                static_cast<usize>(reinterpret_cast<std::uintptr_t>(afterHeader)),
                alignment);
            void* userPtr = reinterpret_cast<void*>(alignedAddr);

            auto* header = reinterpret_cast<AllocationHeader*>(
                static_cast<u8*>(userPtr) - kHeaderSize);
            header->rawPtr = raw;
            header->magic = HEADER_MAGIC;
#if LAC_MEM_PARANOID_META
            header->size = size;
            header->align = alignment;
#endif
            return userPtr;
        }

        // ---
        // Purpose : Release a previously allocated block back to ::operator delete.
        // Contract: Accepts null pointer; `(size, alignment)` must match the allocation tuple.
        // Notes   : A corrupted header is reported and the block is leaked rather than freed blindly.
        // ---
        void Deallocate(void* ptr,
            usize size = 0,
            usize alignment = alignof(std::max_align_t)) noexcept override
        {
            if (!ptr) return;

            alignment = NormalizeAlignment(alignment);

            auto* header = reinterpret_cast<AllocationHeader*>(
                static_cast<u8*>(ptr) - sizeof(AllocationHeader));

            if (!IsHeaderValid(header)) {
                LAC_LOG_ERROR(LAC_MEM_LOG_CATEGORY,
                    "DefaultAllocator::Deallocate: {} not owned by DefaultAllocator or header corrupted",
                    ptr);
                return;
            }

#if LAC_MEM_PARANOID_META
            LAC_ASSERT(size == 0 || size == header->size,
                "Deallocate size mismatch (must equal original allocation size)");
            LAC_ASSERT(alignment == header->align,
                "Deallocate alignment mismatch (must equal original allocation alignment)");
#else
            (void)size;
            (void)alignment;
#endif
            header->magic = 0u;
            ::operator delete(header->rawPtr);
        }
    };

    // ---
    // Purpose : Process-wide host allocator used by chunk pools and pass-through arenas.
    // Notes   : Constructed on first use, so it outlives every pool that asked for it.
    // ---
    [[nodiscard]] inline AllocatorRef GetHostAllocator() noexcept
    {
        static DefaultAllocator s_host;
        return AllocatorRef(&s_host);
    }

} // namespace lac::core
