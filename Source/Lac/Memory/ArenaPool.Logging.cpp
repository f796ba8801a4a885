// ============================================================================
// Lac - Lac/Memory/ArenaPool.Logging.cpp
// ----------------------------------------------------------------------------
// Purpose : Slow-path statistics report for ArenaPool, kept out of the hot
//           allocation TU.
// Contract: noexcept; only emits Info lines in category "Arena.Pool".
// ============================================================================

#include "Lac/Memory/ArenaPool.hpp"

namespace lac
{
namespace memory
{

void ArenaPool::DumpStats() const noexcept
{
    const ArenaPoolStats s = GetStats();

    LAC_LOG_INFO(LAC_POOL_LOG_CATEGORY,
        "Arenas: created={} gets={} misses={} pooled={} dropped={} (debug={}, disabled={})",
        static_cast<unsigned long long>(s.arenasCreated),
        static_cast<unsigned long long>(s.arenaGets),
        static_cast<unsigned long long>(s.arenaMisses),
        static_cast<unsigned long long>(s.arenasPooled),
        static_cast<unsigned long long>(s.arenaDrops),
        IsDebug() ? "true" : "false",
        IsDisabled() ? "true" : "false");
    LAC_LOG_INFO(LAC_POOL_LOG_CATEGORY,
        "Chunks: size={} created={} standalone={} gets={} misses={} pooled={} dropped={} missRate={:.2f}%",
        static_cast<unsigned long long>(s.chunks.chunkSize),
        static_cast<unsigned long long>(s.chunks.created),
        static_cast<unsigned long long>(s.chunks.standalone),
        static_cast<unsigned long long>(s.chunks.gets),
        static_cast<unsigned long long>(s.chunks.misses),
        static_cast<unsigned long long>(s.chunks.pooled),
        static_cast<unsigned long long>(s.chunks.drops),
        s.ChunkMissRate() * 100.0);
    LAC_LOG_INFO(LAC_POOL_LOG_CATEGORY,
        "Resets={} used={} bytes capacity={} bytes utilization={:.2f}%",
        static_cast<unsigned long long>(s.resets),
        static_cast<unsigned long long>(s.usedBytes),
        static_cast<unsigned long long>(s.capacityBytes),
        s.Utilization() * 100.0);
}

} // namespace memory
} // namespace lac
