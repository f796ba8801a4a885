#pragma once
// ============================================================================
// Lac - Lac/Memory/ArenaPool.hpp
// ----------------------------------------------------------------------------
// Purpose : Recycle Arena instances and the chunks behind them; hold the
//           debug switch and the kill switch; report usage statistics.
// Contract: Thread-safe. Settings are resolved once at construction
//           (API -> environment -> macro) and never change afterwards; the
//           two switches may be flipped at runtime and apply to arenas handed
//           out after the flip.
// Notes   : Every pool is independent: tests build differently configured
//           pools side by side. GetDefault() is an opt-in process-wide pool.
// ============================================================================

#include "Lac/Types.hpp"
#include "Lac/Memory/Arena.hpp"
#include "Lac/Memory/ArenaConfig.hpp"
#include "Lac/Memory/ChunkPool.hpp"
#include "Lac/Memory/Pool.hpp"

#include <atomic>
#include <memory>

namespace lac::memory
{
    struct ArenaPoolStats
    {
        usize arenasCreated = 0;
        usize arenaGets = 0;
        usize arenaMisses = 0;
        usize arenasPooled = 0;
        usize arenaDrops = 0;
        usize resets = 0;
        u64   usedBytes = 0;       // summed over every reset
        u64   capacityBytes = 0;   // summed over every reset
        ChunkPoolStats chunks{};

        [[nodiscard]] double Utilization() const noexcept
        {
            return capacityBytes == 0 ? 0.0 : static_cast<double>(usedBytes) / static_cast<double>(capacityBytes);
        }

        [[nodiscard]] double ChunkMissRate() const noexcept
        {
            return chunks.gets == 0 ? 0.0 : static_cast<double>(chunks.misses) / static_cast<double>(chunks.gets);
        }
    };

    class ArenaPool
    {
    public:
        explicit ArenaPool(const ArenaConfig& config = ArenaConfig{}) noexcept;
        ~ArenaPool();

        ArenaPool(const ArenaPool&) = delete;
        ArenaPool& operator=(const ArenaPool&) = delete;

        // ---
        // Purpose : Hand out an idle arena carrying the pool's current switches.
        // Contract: Fatal in debug mode once more than max_new_arenas_in_debug
        //           arenas were ever created (a Release is missing somewhere).
        // ---
        [[nodiscard]] Arena* Get() noexcept;

        // Reset `arena` (checker included) and recycle it. Releasing twice, or
        // releasing another pool's arena, is fatal in debug mode; in production a
        // foreign arena is logged and handed back to its own pool.
        void Release(Arena* arena) noexcept;

        void ReserveChunks(usize count) noexcept { m_chunks.Reserve(count); }
        void ReserveArenas(usize count) noexcept { m_arenas.Reserve(count); }

        // Duplicate-release detection, leak ceiling and delayed chunk reuse.
        void SetDebug(bool enabled) noexcept;
        // Kill switch: arenas handed out afterwards forward to the host allocator.
        void SetDisabled(bool disabled) noexcept;

        [[nodiscard]] bool IsDebug() const noexcept { return m_debug.load(std::memory_order_acquire); }
        [[nodiscard]] bool IsDisabled() const noexcept { return m_disabled.load(std::memory_order_acquire); }

        [[nodiscard]] const ArenaSettings& GetSettings() const noexcept { return m_settings; }
        [[nodiscard]] ChunkPool& GetChunkPool() noexcept { return m_chunks; }

        [[nodiscard]] ArenaPoolStats GetStats() const noexcept;

        // Log counts, bytes, utilisation and miss rate at Info (ArenaPool.Logging.cpp).
        void DumpStats() const noexcept;

        // Process-wide pool configured from the environment and the macros.
        [[nodiscard]] static ArenaPool& GetDefault() noexcept;

    private:
        friend class Arena;

        [[nodiscard]] std::unique_ptr<Arena> MakeArena() noexcept;
        void RecordReset(usize used, usize capacity) noexcept;

        ArenaSettings     m_settings;
        std::atomic<bool> m_debug{ false };
        std::atomic<bool> m_disabled{ false };

        std::atomic<usize> m_resets{ 0 };
        std::atomic<u64>   m_usedBytes{ 0 };
        std::atomic<u64>   m_capacityBytes{ 0 };

        // Declared before m_arenas: pooled arenas hand their chunks back on destruction.
        ChunkPool m_chunks;
        Pool<std::unique_ptr<Arena>> m_arenas;
    };

} // namespace lac::memory
