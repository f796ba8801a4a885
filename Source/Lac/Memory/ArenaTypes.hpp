#pragma once
// ============================================================================
// Lac - Lac/Memory/ArenaTypes.hpp
// ----------------------------------------------------------------------------
// Purpose : Value types that live inside arena memory and that the safety
//           checker knows how to walk: Slice<T>, String, Map<K,V> and
//           Func<R(Args...)>.
// Contract: Every type here is a trivially copyable, trivially destructible
//           header (pointer + sizes). None of them owns its backing storage;
//           the backing is either arena memory or an external value that was
//           registered with Arena::Attach before being stored.
// Notes   : Arena and the checker mutate headers through detail::ValueAccess.
//           User code only reads them.
// ============================================================================

#include "Lac/Types.hpp"

#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace lac::memory
{
    class Arena;

    namespace detail { struct ValueAccess; }

    // ------------------------------------------------------------------------
    // Slice<T>: growable array header. Grown with Arena::Append.
    // ------------------------------------------------------------------------
    template <typename T>
    class Slice
    {
    public:
        using value_type = T;

        constexpr Slice() noexcept = default;
        constexpr Slice(T* data, usize len, usize cap) noexcept
            : m_data(data), m_len(len), m_cap(cap) {}

        [[nodiscard]] T*    Data() const noexcept { return m_data; }
        [[nodiscard]] usize Size() const noexcept { return m_len; }
        [[nodiscard]] usize Capacity() const noexcept { return m_cap; }
        [[nodiscard]] bool  Empty() const noexcept { return m_len == 0; }

        T& operator[](usize i) const noexcept { return m_data[i]; }

        T* begin() const noexcept { return m_data; }
        T* end() const noexcept { return m_data + m_len; }

    private:
        friend class Arena;
        friend struct detail::ValueAccess;

        T*    m_data = nullptr;
        usize m_len = 0;
        usize m_cap = 0;
    };

    // ------------------------------------------------------------------------
    // String: immutable byte string. Arena-built strings are NUL terminated.
    // ------------------------------------------------------------------------
    class String
    {
    public:
        constexpr String() noexcept = default;
        constexpr String(const char* data, usize size) noexcept
            : m_data(data), m_size(size) {}

        [[nodiscard]] const char*      Data() const noexcept { return m_data; }
        [[nodiscard]] usize            Size() const noexcept { return m_size; }
        [[nodiscard]] bool             Empty() const noexcept { return m_size == 0; }
        [[nodiscard]] std::string_view View() const noexcept { return { m_data ? m_data : "", m_size }; }

        friend bool operator==(const String& a, const String& b) noexcept { return a.View() == b.View(); }

    private:
        friend struct detail::ValueAccess;

        const char* m_data = nullptr;
        usize       m_size = 0;
    };

    // ------------------------------------------------------------------------
    // Map<K,V>: handle to a heap hash table. Hash tables are never arena
    // backed: their storage relocates on rehash, which a bump allocator cannot
    // follow. Arena::NewMap keeps the table alive until reset.
    // ------------------------------------------------------------------------
    template <typename K, typename V>
    class Map
    {
    public:
        using Table = std::unordered_map<K, V>;
        using key_type = K;
        using mapped_type = V;

        constexpr Map() noexcept = default;
        explicit constexpr Map(Table* table) noexcept : m_table(table) {}

        [[nodiscard]] Table* Get() const noexcept { return m_table; }
        [[nodiscard]] bool   IsNull() const noexcept { return m_table == nullptr; }

        Table& operator*() const noexcept { return *m_table; }
        Table* operator->() const noexcept { return m_table; }

    private:
        friend struct detail::ValueAccess;

        Table* m_table = nullptr;
    };

    // ------------------------------------------------------------------------
    // Func<R(Args...)>: thunk + environment pointer. The environment is either
    // null (free function), arena memory (Arena::NewFunc) or an attached
    // external object (FromCallable).
    // ------------------------------------------------------------------------
    template <typename Signature>
    class Func;

    template <typename R, typename... Args>
    class Func<R(Args...)>
    {
    public:
        using Thunk = R (*)(void*, Args...);

        constexpr Func() noexcept = default;
        constexpr Func(Thunk thunk, void* env) noexcept : m_thunk(thunk), m_env(env) {}

        template <auto Fn>
        [[nodiscard]] static Func FromFunction() noexcept
        {
            return Func(&CallFree<Fn>, nullptr);
        }

        // `callable` is not owned; Attach it before storing the result in arena memory.
        template <typename F>
        [[nodiscard]] static Func FromCallable(F* callable) noexcept
        {
            return Func(&CallObject<F>, static_cast<void*>(callable));
        }

        R operator()(Args... args) const
        {
            return m_thunk(m_env, std::forward<Args>(args)...);
        }

        explicit operator bool() const noexcept { return m_thunk != nullptr; }

        [[nodiscard]] void* Env() const noexcept { return m_env; }

    private:
        friend class Arena;
        friend struct detail::ValueAccess;

        template <auto Fn>
        static R CallFree(void*, Args... args)
        {
            return Fn(std::forward<Args>(args)...);
        }

        template <typename F>
        static R CallObject(void* env, Args... args)
        {
            return (*static_cast<F*>(env))(std::forward<Args>(args)...);
        }

        Thunk m_thunk = nullptr;
        void* m_env = nullptr;
    };

    // ------------------------------------------------------------------------
    // Traits
    // ------------------------------------------------------------------------
    template <typename T> struct IsSlice : std::false_type {};
    template <typename T> struct IsSlice<Slice<T>> : std::true_type {};

    template <typename T> struct IsMap : std::false_type {};
    template <typename K, typename V> struct IsMap<Map<K, V>> : std::true_type {};

    template <typename T> struct IsFunc : std::false_type {};
    template <typename R, typename... Args> struct IsFunc<Func<R(Args...)>> : std::true_type {};

    static_assert(std::is_trivially_copyable_v<Slice<int>> && std::is_standard_layout_v<Slice<int>>);
    static_assert(std::is_trivially_copyable_v<String> && std::is_standard_layout_v<String>);
    static_assert(std::is_trivially_copyable_v<Map<int, int>> && std::is_trivially_destructible_v<Map<int, int>>);
    static_assert(std::is_trivially_copyable_v<Func<void()>> && std::is_trivially_destructible_v<Func<void()>>);

} // namespace lac::memory
