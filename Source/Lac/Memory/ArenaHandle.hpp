#pragma once
// ============================================================================
// Lac - Lac/Memory/ArenaHandle.hpp
// ----------------------------------------------------------------------------
// Purpose : Epoch-tagged reference to an arena object. Dereferencing after the
//           arena was reset is rejected explicitly instead of relying on the
//           checker's sentinel writes.
// Contract: The handle does not own anything. The arena object itself must
//           outlive the handle (pooled arenas do: they are recycled, not
//           destroyed, until their pool goes away).
// ============================================================================

#include "Lac/Types.hpp"
#include "Lac/Logger.hpp"
#include "Lac/Memory/Arena.hpp"

namespace lac::memory
{
    template <typename T>
    class ArenaHandle
    {
    public:
        ArenaHandle() noexcept = default;
        ArenaHandle(Arena& arena, T* ptr) noexcept
            : m_ptr(ptr), m_arena(&arena), m_epoch(arena.GetEpoch()) {}

        // Build a handle to a fresh object.
        template <typename... Args>
        [[nodiscard]] static ArenaHandle Make(Arena& arena, Args&&... args) noexcept
        {
            return ArenaHandle(arena, arena.New<T>(std::forward<Args>(args)...));
        }

        [[nodiscard]] bool IsNull() const noexcept { return m_ptr == nullptr; }

        // False once the arena has been reset since the handle was made.
        [[nodiscard]] bool IsValid() const noexcept
        {
            return m_arena && m_arena->GetEpoch() == m_epoch;
        }

        // ---
        // Purpose : Checked access.
        // Contract: Fatal when the arena has been reset since the handle was made.
        // ---
        [[nodiscard]] T* Get() const noexcept
        {
            if (m_arena && m_arena->GetEpoch() != m_epoch)
            {
                LAC_LOG_FATAL("Arena",
                    "stale handle: arena epoch {} but handle was made in epoch {}",
                    static_cast<unsigned long long>(m_arena->GetEpoch()),
                    static_cast<unsigned long long>(m_epoch));
            }
            return m_ptr;
        }

        T* operator->() const noexcept { return Get(); }
        T& operator*() const noexcept { return *Get(); }

        [[nodiscard]] u64 GetEpoch() const noexcept { return m_epoch; }

    private:
        T*     m_ptr = nullptr;
        Arena* m_arena = nullptr;
        u64    m_epoch = 0;
    };

} // namespace lac::memory
