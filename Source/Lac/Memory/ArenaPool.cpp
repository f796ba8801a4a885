// ============================================================================
// Lac - Lac/Memory/ArenaPool.cpp
// ============================================================================

#include "Lac/Memory/ArenaPool.hpp"
#include "Lac/Memory/DefaultAllocator.hpp"

#include <utility>

namespace lac::memory
{
namespace
{
    bool SameArena(const std::unique_ptr<Arena>& a, const std::unique_ptr<Arena>& b) noexcept
    {
        return a.get() == b.get();
    }
} // namespace

ArenaPool::ArenaPool(const ArenaConfig& config) noexcept
    : m_settings(ResolveAndLogArenaConfig(config))
    , m_chunks(m_settings.chunkSize, m_settings.maxPooledChunks, core::GetHostAllocator())
    , m_arenas("ArenaPool", [this]() noexcept { return MakeArena(); }, m_settings.maxPooledArenas)
{
    m_disabled.store(m_settings.disabled, std::memory_order_release);
    SetDebug(m_settings.debug);

    if (m_settings.reserveChunks != 0)
        m_chunks.Reserve(m_settings.reserveChunks);
}

ArenaPool::~ArenaPool()
{
    m_arenas.Clear();
    m_chunks.Clear();
}

std::unique_ptr<Arena> ArenaPool::MakeArena() noexcept
{
    return std::make_unique<Arena>(m_chunks, m_settings, this);
}

Arena* ArenaPool::Get() noexcept
{
    std::unique_ptr<Arena> arena = m_arenas.Get();
    arena->Activate(IsDebug(), IsDisabled());
    return arena.release();
}

void ArenaPool::Release(Arena* arena) noexcept
{
    if (!arena)
        return;

    // A foreign arena's chunks belong to its own pool's ChunkPool; never park it here.
    ArenaPool* owner = arena->GetOwner();
    if (LAC_UNLIKELY(owner != this))
    {
        if (IsDebug())
        {
            LAC_LOG_FATAL(LAC_POOL_LOG_CATEGORY,
                "Release: arena {} belongs to another pool ({})",
                static_cast<const void*>(arena), static_cast<const void*>(owner));
        }
        LAC_LOG_ERROR(LAC_POOL_LOG_CATEGORY,
            "Release: arena {} belongs to another pool; returned to its owner",
            static_cast<const void*>(arena));
        if (owner)
            owner->Release(arena);
        return;
    }

    arena->Reset();
    arena->Park();
    m_arenas.Put(std::unique_ptr<Arena>(arena));
}

void ArenaPool::SetDebug(bool enabled) noexcept
{
    m_debug.store(enabled, std::memory_order_release);
    m_arenas.SetDebug(enabled, m_settings.maxNewArenasInDebug, enabled ? &SameArena : nullptr, false);
    m_chunks.SetDebug(enabled);
}

void ArenaPool::SetDisabled(bool disabled) noexcept
{
    m_disabled.store(disabled, std::memory_order_release);
    LAC_LOG_INFO(LAC_POOL_LOG_CATEGORY, "ArenaPool kill switch {}", disabled ? "ON (host allocator)" : "OFF");
}

void ArenaPool::RecordReset(usize used, usize capacity) noexcept
{
    m_resets.fetch_add(1, std::memory_order_relaxed);
    m_usedBytes.fetch_add(used, std::memory_order_relaxed);
    m_capacityBytes.fetch_add(capacity, std::memory_order_relaxed);
}

ArenaPoolStats ArenaPool::GetStats() const noexcept
{
    const PoolStats ps = m_arenas.GetStats();
    ArenaPoolStats s{};
    s.arenasCreated = ps.factoryCalls;
    s.arenaGets = ps.gets;
    s.arenaMisses = ps.gets > ps.hits ? ps.gets - ps.hits : 0;
    s.arenasPooled = ps.size;
    s.arenaDrops = ps.drops;
    s.resets = m_resets.load(std::memory_order_relaxed);
    s.usedBytes = m_usedBytes.load(std::memory_order_relaxed);
    s.capacityBytes = m_capacityBytes.load(std::memory_order_relaxed);
    s.chunks = m_chunks.GetStats();
    return s;
}

ArenaPool& ArenaPool::GetDefault() noexcept
{
    static ArenaPool s_default{ ArenaConfig{} };
    return s_default;
}

} // namespace lac::memory
