#pragma once
// ============================================================================
// Lac - Lac/Memory/Arena.hpp
// ----------------------------------------------------------------------------
// Purpose : Region allocator serving many same-lifetime allocations out of
//           pooled chunks and reclaiming them all at once on Reset().
// Contract: Alloc() returns word-aligned memory. While the share count is 1
//           the arena is owned by one thread and uses plain loads/stores; the
//           caller must IncRef() *before* handing the arena to another thread,
//           after which every Alloc() goes through the lock-free CAS path.
//           Reset()/Release() must not race with any other use of the arena.
//           Destructors of objects built in the arena never run, so typed
//           constructors only accept trivially destructible types.
// Notes   : In debug mode, Reset() runs the SafetyChecker over the registered
//           struct roots before the chunks go back to the pool. When the kill
//           switch is on, the arena forwards every request to the host
//           allocator and frees those blocks on Reset().
// ============================================================================

#include "Lac/Types.hpp"
#include "Lac/Logger.hpp"
#include "Lac/Memory/Alignment.hpp"
#include "Lac/Memory/ArenaConfig.hpp"
#include "Lac/Memory/ArenaTypes.hpp"
#include "Lac/Memory/Chunk.hpp"
#include "Lac/Memory/ChunkPool.hpp"
#include "Lac/Memory/ExternalRegistry.hpp"
#include "Lac/Memory/Schema.hpp"
#include "Lac/Memory/ThreadSafety.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <limits>
#include <memory>
#include <mutex>
#include <new>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#ifndef LAC_ARENA_CORE_LOG_CATEGORY
#define LAC_ARENA_CORE_LOG_CATEGORY "Arena"
#endif

namespace lac::memory
{
    class ArenaPool;
    class SafetyChecker;

    // A struct allocated through New/NewFrom while debug mode was on.
    struct DebugRoot
    {
        void*             address = nullptr;
        const TypeSchema* schema = nullptr;

        friend bool operator==(const DebugRoot& a, const DebugRoot& b) noexcept
        {
            return a.address == b.address && a.schema == b.schema;
        }
    };

    class Arena
    {
    public:
        // `owner` may be null: Release() then only resets.
        Arena(ChunkPool& chunks, const ArenaSettings& settings, ArenaPool* owner = nullptr) noexcept;
        ~Arena();

        Arena(const Arena&) = delete;
        Arena& operator=(const Arena&) = delete;

        // ---
        // Purpose : Bump-allocate `size` bytes (rounded up to the word size, minimum one word).
        // Contract: Word aligned. `zero` clears the returned bytes. Returns nullptr only
        //           when the OOM policy is soft and the host allocator failed.
        // ---
        [[nodiscard]] void* Alloc(usize size, bool zero) noexcept;

        // ---
        // Purpose : Reclaim everything allocated since the last reset.
        // Contract: Runs the checker (debug mode) with invalidation, recycles chunks,
        //           clears registries and keepers, resets the share count to 1 and
        //           bumps the epoch.
        // ---
        void Reset() noexcept;

        // Reset and hand the arena back to its pool. The arena must not be used afterwards.
        void Release() noexcept;

        // Call from the handing-off thread before the new thread starts.
        void IncRef() noexcept;
        void DecRef() noexcept;

        // --------------------------------------------------------------------
        // keepAlive: declare an externally owned value before storing it in
        // arena memory. No-op in pass-through mode.
        // --------------------------------------------------------------------
        template <typename T>
            requires (!std::is_function_v<T>)
        void Attach(T* ptr) noexcept
        {
            Register(ExternalKind::Pointer, static_cast<const void*>(ptr));
        }

        template <typename T>
        void Attach(const Slice<T>& slice) noexcept
        {
            Register(ExternalKind::Array, static_cast<const void*>(slice.Data()));
        }

        void Attach(const String& str) noexcept
        {
            Register(ExternalKind::String, static_cast<const void*>(str.Data()));
        }

        template <typename K, typename V>
        void Attach(const Map<K, V>& map) noexcept
        {
            Register(ExternalKind::Map, static_cast<const void*>(map.Get()));
        }

        template <typename R, typename... Args>
        void Attach(const Func<R(Args...)>& fn) noexcept
        {
            Register(ExternalKind::Function, static_cast<const void*>(fn.Env()));
        }

        // Registers the pointee and keeps it alive until the next reset.
        template <typename T>
        void Attach(std::shared_ptr<T> owned) noexcept
        {
            Register(ExternalKind::Pointer, static_cast<const void*>(owned.get()));
            AddKeeper(std::shared_ptr<void>(std::move(owned)));
        }

        // --------------------------------------------------------------------
        // Typed constructors
        // --------------------------------------------------------------------
        template <typename T, typename... Args>
        [[nodiscard]] T* New(Args&&... args) noexcept
        {
            CheckArenaType<T>();
            void* mem = Alloc(sizeof(T), true);
            if (!mem)
                return nullptr;

            T* obj = nullptr;
            if constexpr (std::is_constructible_v<T, Args&&...>)
                obj = ::new (mem) T(std::forward<Args>(args)...);
            else
                obj = ::new (mem) T{ std::forward<Args>(args)... };
            RegisterRoot(obj);
            return obj;
        }

        // Copy without zeroing: every byte is overwritten.
        template <typename T>
        [[nodiscard]] T* NewFrom(const T& value) noexcept
        {
            CheckArenaType<T>();
            void* mem = Alloc(sizeof(T), false);
            if (!mem)
                return nullptr;

            T* obj = ::new (mem) T(value);
            RegisterRoot(obj);
            return obj;
        }

        // ---
        // Purpose : Slice with `len` value-initialised elements and room for `cap`.
        // Contract: `len > cap` is fatal.
        // ---
        template <typename T>
        [[nodiscard]] Slice<T> NewSlice(usize len, usize cap) noexcept
        {
            CheckArenaType<T>();
            if (len > cap)
            {
                LAC_LOG_FATAL(LAC_ARENA_CORE_LOG_CATEGORY,
                    "NewSlice: len exceeds cap ({} > {})",
                    static_cast<unsigned long long>(len),
                    static_cast<unsigned long long>(cap));
            }
            if (cap == 0)
                return Slice<T>{};

            T* data = AllocArray<T>(cap, true);
            if (!data)
                return Slice<T>{};
            for (usize i = 0; i < len; ++i)
                ::new (static_cast<void*>(data + i)) T();
            return Slice<T>(data, len, cap);
        }

        template <typename T>
        void Append(Slice<T>& slice, const T& value) noexcept
        {
            if (slice.m_len == slice.m_cap && !Grow(slice, slice.m_len + 1))
                return;
            ::new (static_cast<void*>(slice.m_data + slice.m_len)) T(value);
            ++slice.m_len;
        }

        template <typename T>
        void Append(Slice<T>& slice, const T* first, usize count) noexcept
        {
            if (count == 0)
                return;
            if (slice.m_cap - slice.m_len < count && !Grow(slice, slice.m_len + count))
                return;
            std::uninitialized_copy_n(first, count, slice.m_data + slice.m_len);
            slice.m_len += count;
        }

        // NUL-terminated copy of `text`.
        [[nodiscard]] String NewString(std::string_view text) noexcept
        {
            auto* mem = static_cast<char*>(Alloc(text.size() + 1, false));
            if (!mem)
                return String{};
            if (!text.empty())
                std::memcpy(mem, text.data(), text.size());
            mem[text.size()] = '\0';
            return String(mem, text.size());
        }

        // Heap table owned by the arena until the next reset.
        template <typename K, typename V>
        [[nodiscard]] Map<K, V> NewMap(usize reserve = 0) noexcept
        {
            auto table = std::make_shared<typename Map<K, V>::Table>();
            if (reserve != 0)
                table->reserve(reserve);

            Map<K, V> map(table.get());
            Register(ExternalKind::Map, static_cast<const void*>(table.get()));
            AddKeeper(std::shared_ptr<void>(std::move(table)));
            return map;
        }

        // Copies `callable` into the arena; the environment is arena memory.
        template <typename Signature, typename F>
        [[nodiscard]] Func<Signature> NewFunc(F callable) noexcept
        {
            static_assert(std::is_trivially_copyable_v<F> && std::is_trivially_destructible_v<F>,
                "NewFunc requires a trivially copyable callable (capture by value or by pointer)");
            CheckArenaType<F>();
            void* mem = Alloc(sizeof(F), false);
            if (!mem)
                return Func<Signature>{};
            F* env = ::new (mem) F(callable);
            return Func<Signature>::FromCallable(env);
        }

        // --------------------------------------------------------------------
        // Debug
        // --------------------------------------------------------------------

        // Check every registered root without invalidating anything. Fatal on violation.
        void CheckExternalPointers() noexcept;

        // --------------------------------------------------------------------
        // Introspection
        // --------------------------------------------------------------------
        [[nodiscard]] i32   GetRefCount() const noexcept { return m_refCount.load(std::memory_order_acquire); }
        [[nodiscard]] u64   GetEpoch() const noexcept { return m_epoch.load(std::memory_order_acquire); }
        [[nodiscard]] usize GetChunkCount() const noexcept { return m_chunkList.size(); }
        [[nodiscard]] usize GetUsedBytes() const noexcept;
        [[nodiscard]] usize GetCapacityBytes() const noexcept;
        [[nodiscard]] usize GetRootCount() const noexcept { return m_roots.Size(); }
        [[nodiscard]] usize GetExternalCount() const noexcept { return m_registries.TotalSize(); }
        [[nodiscard]] bool  IsDebug() const noexcept { return m_debug; }
        [[nodiscard]] bool  IsDisabled() const noexcept { return m_disabled; }
        [[nodiscard]] ArenaPool* GetOwner() const noexcept { return m_owner; }

    private:
        friend class ArenaPool;
        friend class SafetyChecker;

        // Pool hand-off: a parked arena has share count 0, so an extra DecRef on a
        // released arena drives the count negative instead of releasing it again.
        void Activate(bool debug, bool disabled) noexcept
        {
            m_debug = debug;
            m_disabled = disabled;
            m_refCount.store(1, std::memory_order_release);
        }

        void Park() noexcept { m_refCount.store(0, std::memory_order_release); }

        struct HostBlock
        {
            void* ptr;
            usize size;
        };

        template <typename T>
        static constexpr void CheckArenaType() noexcept
        {
            static_assert(std::is_trivially_destructible_v<T>,
                "Arena memory is reclaimed without running destructors");
            static_assert(alignof(T) <= kWordSize,
                "Arena allocations are word aligned");
        }

        template <typename T>
        [[nodiscard]] T* AllocArray(usize count, bool zero) noexcept
        {
            if (count > (std::numeric_limits<usize>::max)() / sizeof(T))
            {
                LAC_MEM_CHECK_OOM(count, alignof(T), "Arena::AllocArray");
                return nullptr;
            }
            return static_cast<T*>(Alloc(sizeof(T) * count, zero));
        }

        // Growth: start at 4, then multiply by the configured ratio.
        template <typename T>
        [[nodiscard]] bool Grow(Slice<T>& slice, usize minCap) noexcept
        {
            CheckArenaType<T>();
            usize newCap = 4;
            if (slice.m_cap != 0)
            {
                const double scaled = static_cast<double>(slice.m_cap) * m_settings.sliceExtendRatio;
                newCap = (std::max)(slice.m_cap + 1, static_cast<usize>(scaled));
            }
            newCap = (std::max)(newCap, minCap);

            T* data = AllocArray<T>(newCap, false);
            if (!data)
                return false;
            if (slice.m_len != 0)
                std::uninitialized_copy_n(slice.m_data, slice.m_len, data);
            slice.m_data = data;
            slice.m_cap = newCap;
            return true;
        }

        template <typename T>
        void RegisterRoot(T* obj) noexcept
        {
            if constexpr (kIsDescribedStruct<T>)
            {
                if (m_debug && !m_disabled)
                    PushRoot(DebugRoot{ static_cast<void*>(obj), &SchemaOf<T>() });
            }
            else
            {
                (void)obj;
            }
        }

        [[nodiscard]] bool IsShared() const noexcept { return m_refCount.load(std::memory_order_acquire) > 1; }

        [[nodiscard]] void* AllocSingle(usize aligned) noexcept;
        [[nodiscard]] void* AllocShared(usize aligned) noexcept;
        [[nodiscard]] void* AllocOversized(usize aligned, bool shared) noexcept;
        [[nodiscard]] void* AllocPassThrough(usize aligned, bool zero) noexcept;

        void Register(ExternalKind kind, const void* address) noexcept;
        void PushRoot(const DebugRoot& root) noexcept;
        void AddKeeper(std::shared_ptr<void> keeper) noexcept;
        void ReleaseStorage() noexcept;

        ChunkPool&    m_chunkPool;
        ArenaSettings m_settings;
        ArenaPool*    m_owner;

        std::atomic<Chunk*>                 m_current{ nullptr };
        std::vector<std::unique_ptr<Chunk>> m_chunkList{};
        std::vector<HostBlock>              m_hostBlocks{};
        core::SpinLock                      m_listLock{};

        std::atomic<i32> m_refCount{ 1 };
        std::atomic<u64> m_epoch{ 0 };

        ExternalRegistries                 m_registries{};
        DedupQueue<DebugRoot>              m_roots{};
        std::vector<std::shared_ptr<void>> m_keepers{};
        std::atomic<bool>                  m_rootsOverflowWarned{ false };

        bool m_debug = false;
        bool m_disabled = false;
    };

} // namespace lac::memory
