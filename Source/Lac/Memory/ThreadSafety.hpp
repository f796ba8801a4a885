#pragma once
// ============================================================================
// Lac - Lac/Memory/ThreadSafety.hpp
// ----------------------------------------------------------------------------
// Purpose : Provide the locking policies and counters the pools and arenas are
//           parameterised on: a no-op policy, a std::mutex policy and a
//           spinlock policy for very short critical sections.
// Contract: Header-only and noexcept. No exceptions or RTTI. Every policy
//           exposes `Mutex`, `Lock`, `Counter<T>` and `kIsThreadSafe`.
// Notes   : The spinlock yields to the scheduler while contended; it is meant
//           for sections a handful of instructions long (appending a chunk to
//           an arena's tracking list), never for I/O or allocation.
// ============================================================================

#include "Lac/Types.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <type_traits>

namespace lac::core {

    // --------------------------------------------------------------
    // Counter wrapper: uniform API for single-threaded & atomic cases
    // --------------------------------------------------------------
    template <typename T, bool Atomic>
    class CounterImpl;

    template <typename T>
    class CounterImpl<T, false> {
        static_assert(std::is_integral_v<T>, "CounterImpl expects integral type");
        T value_{ 0 };
    public:
        CounterImpl() = default;
        explicit CounterImpl(T v) : value_(v) {}

        T load(std::memory_order = std::memory_order_relaxed) const noexcept { return value_; }
        void store(T v, std::memory_order = std::memory_order_relaxed) noexcept { value_ = v; }

        T fetch_add(T v, std::memory_order = std::memory_order_relaxed) noexcept { T old = value_; value_ += v; return old; }
        T fetch_sub(T v, std::memory_order = std::memory_order_relaxed) noexcept { T old = value_; value_ -= v; return old; }

        operator T() const noexcept { return value_; }
    };

    template <typename T>
    class CounterImpl<T, true> {
        static_assert(std::is_integral_v<T>, "CounterImpl expects integral type");
        std::atomic<T> value_{ 0 };
    public:
        CounterImpl() = default;
        explicit CounterImpl(T v) : value_(v) {}

        T load(std::memory_order order = std::memory_order_relaxed) const noexcept { return value_.load(order); }
        void store(T v, std::memory_order order = std::memory_order_relaxed) noexcept { value_.store(v, order); }

        T fetch_add(T v, std::memory_order order = std::memory_order_relaxed) noexcept { return value_.fetch_add(v, order); }
        T fetch_sub(T v, std::memory_order order = std::memory_order_relaxed) noexcept { return value_.fetch_sub(v, order); }

        operator T() const noexcept { return value_.load(std::memory_order_relaxed); }
    };

    // ---
    // Purpose : Test-and-set lock built on std::atomic_flag.
    // Contract: Non-recursive; lock() spins with a scheduler yield between attempts.
    // Notes   : Satisfies BasicLockable so std::lock_guard works with it.
    // ---
    class SpinLock {
    public:
        SpinLock() noexcept = default;
        SpinLock(const SpinLock&) = delete;
        SpinLock& operator=(const SpinLock&) = delete;

        void lock() noexcept {
            while (m_flag.test_and_set(std::memory_order_acquire)) {
                while (m_flag.test(std::memory_order_relaxed)) {
                    std::this_thread::yield();
                }
            }
        }

        [[nodiscard]] bool try_lock() noexcept {
            return !m_flag.test_and_set(std::memory_order_acquire);
        }

        void unlock() noexcept {
            m_flag.clear(std::memory_order_release);
        }

    private:
        std::atomic_flag m_flag{};
    };

    // --------------------------------------------------------------
    // Policies
    // --------------------------------------------------------------
    // ---
    // Purpose : Zero-cost policy that assumes single-threaded access.
    // Contract: No locking is performed; counters remain plain integrals; caller must enforce exclusivity.
    // ---
    struct SingleThreadedPolicy {
        struct Mutex { /* empty */ };
        struct Lock { explicit Lock(Mutex&) noexcept {} };

        template <typename T>
        using Counter = CounterImpl<T, false>;

        static constexpr bool kIsThreadSafe = false;
    };

    // ---
    // Purpose : std::mutex-based critical section.
    // Contract: Suitable for coarse-grained synchronization; the default for pools.
    // Notes   : Counter implementation switches to atomics to keep stats readable without the lock.
    // ---
    struct MutexPolicy {
        using Mutex = std::mutex;
        using Lock = std::lock_guard<Mutex>;

        template <typename T>
        using Counter = CounterImpl<T, true>;

        static constexpr bool kIsThreadSafe = true;
    };

    // ---
    // Purpose : Spinlock-based critical section for sections far shorter than a context switch.
    // Contract: Same surface as MutexPolicy.
    // ---
    struct SpinLockPolicy {
        using Mutex = SpinLock;
        using Lock = std::lock_guard<Mutex>;

        template <typename T>
        using Counter = CounterImpl<T, true>;

        static constexpr bool kIsThreadSafe = true;
    };

} // namespace lac::core
