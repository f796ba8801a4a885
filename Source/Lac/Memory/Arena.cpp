// ============================================================================
// Lac - Lac/Memory/Arena.cpp
// ----------------------------------------------------------------------------
// Purpose : Allocation paths, reset and sharing protocol of Arena.
// Contract: See Arena.hpp. Every function is noexcept; fatal conditions go
//           through LAC_LOG_FATAL and never return.
// Notes   : The chunk list is only touched under m_listLock while the arena is
//           shared; on the single-thread path it is owned outright.
// ============================================================================

#include "Lac/Memory/Arena.hpp"
#include "Lac/Memory/ArenaPool.hpp"
#include "Lac/Memory/DefaultAllocator.hpp"
#include "Lac/Memory/SafetyChecker.hpp"

#include <thread>

namespace lac::memory
{

Arena::Arena(ChunkPool& chunks, const ArenaSettings& settings, ArenaPool* owner) noexcept
    : m_chunkPool(chunks)
    , m_settings(settings)
    , m_owner(owner)
    , m_roots(DedupOptions{ settings.registryStrongPrefix, settings.registryRecentWindow, settings.maxDebugRoots })
    , m_debug(settings.debug)
    , m_disabled(settings.disabled)
{
    m_registries.Configure(settings.registryStrongPrefix, settings.registryRecentWindow);
}

Arena::~Arena()
{
    ReleaseStorage();
}

void* Arena::Alloc(usize size, bool zero) noexcept
{
    if (LAC_UNLIKELY(size > (std::numeric_limits<usize>::max)() - kWordSize))
    {
        LAC_MEM_CHECK_OOM(size, kWordSize, "Arena::Alloc");
        return nullptr;
    }

    const usize aligned = core::AlignToWord(size);
    if (m_disabled)
        return AllocPassThrough(aligned, zero);

    void* mem = IsShared() ? AllocShared(aligned) : AllocSingle(aligned);
    if (mem && zero)
        std::memset(mem, 0, aligned);
    return mem;
}

void* Arena::AllocSingle(usize aligned) noexcept
{
    if (aligned > m_settings.chunkSize)
        return AllocOversized(aligned, false);

    for (;;)
    {
        Chunk* chunk = m_current.load(std::memory_order_relaxed);
        if (chunk)
        {
            const usize len = chunk->Length().load(std::memory_order_relaxed);
            if (chunk->Capacity() - len >= aligned)
            {
                chunk->Length().store(len + aligned, std::memory_order_relaxed);
                return chunk->Data() + len;
            }
        }

        std::unique_ptr<Chunk> fresh = m_chunkPool.Acquire(aligned);
        if (!fresh)
            return nullptr;
        Chunk* raw = fresh.get();
        m_chunkList.push_back(std::move(fresh));
        m_current.store(raw, std::memory_order_relaxed);
    }
}

void* Arena::AllocShared(usize aligned) noexcept
{
    if (aligned > m_settings.chunkSize)
        return AllocOversized(aligned, true);

    for (;;)
    {
        Chunk* chunk = m_current.load(std::memory_order_acquire);
        if (chunk)
        {
            std::atomic<usize>& length = chunk->Length();
            usize len = length.load(std::memory_order_relaxed);
            while (chunk->Capacity() - len >= aligned)
            {
                if (length.compare_exchange_weak(len, len + aligned,
                        std::memory_order_acq_rel, std::memory_order_relaxed))
                {
                    return chunk->Data() + len;
                }
            }
        }

        // Out of room: race to install a chunk that already holds this request.
        std::unique_ptr<Chunk> fresh = m_chunkPool.Acquire(aligned);
        if (!fresh)
            return nullptr;
        fresh->Length().store(aligned, std::memory_order_relaxed);

        Chunk* expected = chunk;
        if (m_current.compare_exchange_strong(expected, fresh.get(),
                std::memory_order_acq_rel, std::memory_order_acquire))
        {
            u8* mem = fresh->Data();
            std::lock_guard<core::SpinLock> lock(m_listLock);
            m_chunkList.push_back(std::move(fresh));
            return mem;
        }

        // Lost: another thread installed a chunk first.
        m_chunkPool.Release(std::move(fresh));
        std::this_thread::yield();
    }
}

void* Arena::AllocOversized(usize aligned, bool shared) noexcept
{
    std::unique_ptr<Chunk> big = m_chunkPool.Acquire(aligned);
    if (!big)
        return nullptr;
    big->Length().store(aligned, std::memory_order_relaxed);
    u8* mem = big->Data();

    if (shared)
    {
        std::lock_guard<core::SpinLock> lock(m_listLock);
        m_chunkList.push_back(std::move(big));
    }
    else
    {
        m_chunkList.push_back(std::move(big));
    }
    return mem;
}

void* Arena::AllocPassThrough(usize aligned, bool zero) noexcept
{
    void* mem = core::GetHostAllocator().AllocateBytes(aligned, alignof(std::max_align_t));
    if (!mem)
        return nullptr;
    if (zero)
        std::memset(mem, 0, aligned);

    if (IsShared())
    {
        std::lock_guard<core::SpinLock> lock(m_listLock);
        m_hostBlocks.push_back(HostBlock{ mem, aligned });
    }
    else
    {
        m_hostBlocks.push_back(HostBlock{ mem, aligned });
    }
    return mem;
}

void Arena::Register(ExternalKind kind, const void* address) noexcept
{
    if (m_disabled || !address)
        return;

    if (IsShared())
    {
        std::lock_guard<core::SpinLock> lock(m_listLock);
        m_registries.Push(kind, address);
    }
    else
    {
        m_registries.Push(kind, address);
    }
}

void Arena::PushRoot(const DebugRoot& root) noexcept
{
    bool stored = false;
    if (IsShared())
    {
        std::lock_guard<core::SpinLock> lock(m_listLock);
        stored = m_roots.Push(root);
    }
    else
    {
        stored = m_roots.Push(root);
    }

    if (!stored && !m_rootsOverflowWarned.exchange(true, std::memory_order_relaxed))
    {
        LAC_LOG_WARNING(LAC_ARENA_CORE_LOG_CATEGORY,
            "Debug root list full ({} roots); later objects are not checked",
            static_cast<unsigned long long>(m_settings.maxDebugRoots));
    }
}

void Arena::AddKeeper(std::shared_ptr<void> keeper) noexcept
{
    if (IsShared())
    {
        std::lock_guard<core::SpinLock> lock(m_listLock);
        m_keepers.push_back(std::move(keeper));
    }
    else
    {
        m_keepers.push_back(std::move(keeper));
    }
}

void Arena::ReleaseStorage() noexcept
{
    if (m_settings.poisonOnReset)
    {
        for (const auto& chunk : m_chunkList)
            std::memset(chunk->Data(), m_settings.poisonByte, chunk->GetLength());
    }
    for (auto& chunk : m_chunkList)
        m_chunkPool.Release(std::move(chunk));
    m_chunkList.clear();
    m_current.store(nullptr, std::memory_order_release);

    const core::AllocatorRef host = core::GetHostAllocator();
    for (const HostBlock& block : m_hostBlocks)
        host.DeallocateBytes(block.ptr, block.size, alignof(std::max_align_t));
    m_hostBlocks.clear();

    m_registries.Clear();
    m_roots.Clear();
    m_keepers.clear();
}

void Arena::Reset() noexcept
{
    if (m_debug && !m_disabled)
    {
        SafetyChecker checker(*this);
        checker.Run(true);
    }

    const usize used = GetUsedBytes();
    const usize capacity = GetCapacityBytes();
    ReleaseStorage();
    m_rootsOverflowWarned.store(false, std::memory_order_relaxed);

    m_refCount.store(1, std::memory_order_release);
    m_epoch.fetch_add(1, std::memory_order_acq_rel);

    if (m_owner)
    {
        m_disabled = m_owner->IsDisabled();
        m_owner->RecordReset(used, capacity);
    }
}

void Arena::Release() noexcept
{
    if (m_owner)
        m_owner->Release(this);
    else
        Reset();
}

void Arena::IncRef() noexcept
{
    m_refCount.fetch_add(1, std::memory_order_acq_rel);
}

void Arena::DecRef() noexcept
{
    const i32 now = m_refCount.fetch_sub(1, std::memory_order_acq_rel) - 1;
    if (now == 0)
    {
        Release();
        return;
    }
    if (now < 0)
    {
        if (m_debug)
        {
            LAC_LOG_FATAL(LAC_ARENA_CORE_LOG_CATEGORY,
                "DecRef: reference count went negative ({}), arena released too many times", now);
        }
        LAC_LOG_ERROR(LAC_ARENA_CORE_LOG_CATEGORY,
            "DecRef: reference count went negative ({}); clamped to 0", now);
        m_refCount.store(0, std::memory_order_release);
    }
}

void Arena::CheckExternalPointers() noexcept
{
    if (m_disabled)
        return;
    SafetyChecker checker(*this);
    checker.Run(false);
}

usize Arena::GetUsedBytes() const noexcept
{
    usize total = 0;
    for (const auto& chunk : m_chunkList)
        total += chunk->GetLength();
    for (const HostBlock& block : m_hostBlocks)
        total += block.size;
    return total;
}

usize Arena::GetCapacityBytes() const noexcept
{
    usize total = 0;
    for (const auto& chunk : m_chunkList)
        total += chunk->Capacity();
    for (const HostBlock& block : m_hostBlocks)
        total += block.size;
    return total;
}

} // namespace lac::memory
