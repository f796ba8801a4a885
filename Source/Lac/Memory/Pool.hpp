#pragma once
// ============================================================================
// Lac - Lac/Memory/Pool.hpp
// ----------------------------------------------------------------------------
// Purpose : Capacity-bounded free list used to recycle chunks and arenas, with
//           opt-in instrumentation that turns double releases and leaks into
//           immediate failures.
// Contract: Thread-safe according to `Policy` (std::mutex by default). Items
//           are moved in and out; Put() on a full pool destroys the item.
//           Debug checks are fatal (LAC_LOG_FATAL) and never return.
// Notes   : The factory runs outside the lock so slow construction (a 128 KiB
//           chunk, a fresh arena) never blocks concurrent Put() calls.
// ============================================================================

#include "Lac/Types.hpp"
#include "Lac/Logger.hpp"
#include "Lac/Memory/ThreadSafety.hpp"

#include <deque>
#include <functional>
#include <utility>

namespace lac::memory
{
    #ifndef LAC_POOL_LOG_CATEGORY
    #define LAC_POOL_LOG_CATEGORY "Arena.Pool"
    #endif

    // Counters are snapshots: they are read without the lock.
    struct PoolStats
    {
        usize gets = 0;          // Get() calls
        usize hits = 0;          // Get() calls served from the free list
        usize factoryCalls = 0;  // items built by the factory (Get misses + Reserve)
        usize drops = 0;         // Put() calls rejected because the pool was full
        usize size = 0;          // items currently pooled
    };

    template <typename T, typename Policy = core::MutexPolicy>
    class Pool
    {
    public:
        using Factory = std::function<T()>;
        using EqualFn = bool (*)(const T&, const T&) noexcept;

        Pool(const char* name, Factory factory, usize capacity) noexcept
            : m_name(name ? name : "Pool")
            , m_factory(std::move(factory))
            , m_capacity(capacity)
        {
        }

        Pool(const Pool&) = delete;
        Pool& operator=(const Pool&) = delete;

        // ---
        // Purpose : Pop the most recently pooled item, or build one.
        // Contract: In debug mode with a ceiling set, building more than `leakCeiling`
        //           items on demand over the pool's lifetime is fatal. Reserve() does
        //           not count against the ceiling.
        // ---
        [[nodiscard]] T Get() noexcept
        {
            m_gets.fetch_add(1);

            bool  debug = false;
            usize ceiling = 0;
            {
                typename Policy::Lock lock(m_mutex);
                if (!m_items.empty())
                {
                    T item = std::move(m_items.back());
                    m_items.pop_back();
                    m_hits.fetch_add(1);
                    return item;
                }
                debug = m_debug;
                ceiling = m_leakCeiling;
            }

            m_factoryCalls.fetch_add(1);
            const usize created = m_misses.fetch_add(1) + 1;
            if (debug && ceiling != 0 && created > ceiling)
            {
                LAC_LOG_FATAL(LAC_POOL_LOG_CATEGORY,
                    "{}: {} items created on demand, exceeds leak ceiling {} (missing Release or DecRef?)",
                    m_name,
                    static_cast<unsigned long long>(created),
                    static_cast<unsigned long long>(ceiling));
            }
            return m_factory();
        }

        // ---
        // Purpose : Return an item to the free list.
        // Contract: Fatal in debug mode when an equal item is already pooled.
        //           Items that do not fit are destroyed after the lock is dropped.
        // ---
        void Put(T item) noexcept
        {
            {
                typename Policy::Lock lock(m_mutex);
                if (m_debug && m_equal)
                {
                    for (const T& existing : m_items)
                    {
                        if (m_equal(existing, item))
                        {
                            LAC_LOG_FATAL(LAC_POOL_LOG_CATEGORY,
                                "{}: duplicate Put (item released twice)", m_name);
                        }
                    }
                }

                if (m_items.size() < m_capacity)
                {
                    if (m_delayReuse)
                        m_items.push_front(std::move(item));
                    else
                        m_items.push_back(std::move(item));
                    return;
                }
            }
            m_drops.fetch_add(1);
        }

        // Build `count` items eagerly. Items beyond capacity are not kept.
        void Reserve(usize count) noexcept
        {
            for (usize i = 0; i < count; ++i)
            {
                m_factoryCalls.fetch_add(1);
                T item = m_factory();
                typename Policy::Lock lock(m_mutex);
                if (m_items.size() >= m_capacity)
                    break;
                m_items.push_back(std::move(item));
            }
        }

        void Clear() noexcept
        {
            std::deque<T> drained;
            {
                typename Policy::Lock lock(m_mutex);
                drained.swap(m_items);
            }
        }

        // ---
        // Purpose : Toggle instrumentation.
        // Contract: `leakCeiling` 0 disables the leak check; `equal` null disables the
        //           duplicate scan; `delayReuse` pushes released items to the cold end.
        // ---
        void SetDebug(bool enabled, usize leakCeiling, EqualFn equal, bool delayReuse) noexcept
        {
            typename Policy::Lock lock(m_mutex);
            m_debug = enabled;
            m_leakCeiling = leakCeiling;
            m_equal = equal;
            m_delayReuse = enabled && delayReuse;
        }

        [[nodiscard]] usize Size() const noexcept
        {
            typename Policy::Lock lock(m_mutex);
            return m_items.size();
        }

        [[nodiscard]] usize GetCapacity() const noexcept { return m_capacity; }
        [[nodiscard]] const char* GetName() const noexcept { return m_name; }

        [[nodiscard]] PoolStats GetStats() const noexcept
        {
            PoolStats s{};
            s.gets = m_gets.load();
            s.hits = m_hits.load();
            s.factoryCalls = m_factoryCalls.load();
            s.drops = m_drops.load();
            s.size = Size();
            return s;
        }

    private:
        const char* m_name;
        Factory     m_factory;
        usize       m_capacity;

        mutable typename Policy::Mutex m_mutex{};
        std::deque<T> m_items{};

        bool    m_debug = false;
        bool    m_delayReuse = false;
        usize   m_leakCeiling = 0;
        EqualFn m_equal = nullptr;

        typename Policy::template Counter<usize> m_gets{};
        typename Policy::template Counter<usize> m_hits{};
        typename Policy::template Counter<usize> m_factoryCalls{};
        typename Policy::template Counter<usize> m_misses{};
        typename Policy::template Counter<usize> m_drops{};
    };

} // namespace lac::memory
