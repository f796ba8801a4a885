// ============================================================================
// Lac - Lac/Memory/ChunkPool.cpp
// ============================================================================

#include "Lac/Memory/ChunkPool.hpp"

#include <utility>

namespace lac::memory
{
namespace
{
    bool SameChunk(const std::unique_ptr<Chunk>& a, const std::unique_ptr<Chunk>& b) noexcept
    {
        return a.get() == b.get();
    }
} // namespace

ChunkPool::ChunkPool(usize chunkSize, usize maxPooled, core::AllocatorRef alloc) noexcept
    : m_chunkSize(chunkSize)
    , m_alloc(alloc)
    , m_pool("ChunkPool", [this]() noexcept { return MakeChunk(); }, maxPooled)
{
}

std::unique_ptr<Chunk> ChunkPool::MakeChunk() noexcept
{
    return std::make_unique<Chunk>(m_alloc, m_chunkSize, true);
}

std::unique_ptr<Chunk> ChunkPool::Acquire(usize minBytes) noexcept
{
    std::unique_ptr<Chunk> chunk;
    if (minBytes > m_chunkSize)
    {
        m_standalone.fetch_add(1, std::memory_order_relaxed);
        chunk = std::make_unique<Chunk>(m_alloc, minBytes, false);
    }
    else
    {
        chunk = m_pool.Get();
    }

    if (!chunk || !chunk->IsValid())
        return nullptr;
    return chunk;
}

void ChunkPool::Release(std::unique_ptr<Chunk> chunk) noexcept
{
    if (!chunk)
        return;

    chunk->Length().store(0, std::memory_order_relaxed);
    if (!chunk->IsPooled() || !chunk->IsValid())
        return;

    m_pool.Put(std::move(chunk));
}

void ChunkPool::SetDebug(bool enabled) noexcept
{
    m_pool.SetDebug(enabled, 0, enabled ? &SameChunk : nullptr, true);
}

ChunkPoolStats ChunkPool::GetStats() const noexcept
{
    const PoolStats ps = m_pool.GetStats();
    ChunkPoolStats s{};
    s.chunkSize = m_chunkSize;
    s.created = ps.factoryCalls;
    s.standalone = m_standalone.load(std::memory_order_relaxed);
    s.gets = ps.gets;
    s.misses = ps.gets > ps.hits ? ps.gets - ps.hits : 0;
    s.drops = ps.drops;
    s.pooled = ps.size;
    return s;
}

} // namespace lac::memory
