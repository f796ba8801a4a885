#pragma once
// ============================================================================
// Lac - Lac/Memory/ExternalRegistry.hpp
// ----------------------------------------------------------------------------
// Purpose : Record the externally owned values an arena has been told about
//           (Attach) and the struct roots it allocated in debug mode.
// Contract: Not thread-safe; the owning arena serialises pushes with its
//           spinlock while shared. Cleared on every arena reset.
// Notes   : Deduplication is weak on purpose. The first `strongPrefix`
//           entries are checked exhaustively, later ones only against the
//           most recent `recentWindow` entries, keeping Push() O(1) after
//           warm-up. Duplicates are harmless to the checker.
// ============================================================================

#include "Lac/Types.hpp"

#include <vector>

namespace lac::memory
{
    struct DedupOptions
    {
        usize strongPrefix = 64;
        usize recentWindow = 16;
        usize maxSize = 0;          // 0 = unbounded
    };

    template <typename T>
    class DedupQueue
    {
    public:
        DedupQueue() = default;
        explicit DedupQueue(const DedupOptions& options) : m_options(options) {}

        void SetOptions(const DedupOptions& options) noexcept { m_options = options; }

        // ---
        // Purpose : Append `value` unless it is already known.
        // Contract: Returns false only when the queue is bounded and full.
        // ---
        bool Push(const T& value)
        {
            const usize n = m_items.size();
            const usize scanFrom = (n <= m_options.strongPrefix || n <= m_options.recentWindow)
                ? 0u
                : n - m_options.recentWindow;
            for (usize i = n; i > scanFrom; --i)
            {
                if (m_items[i - 1] == value)
                    return true;
            }

            if (m_options.maxSize != 0 && n >= m_options.maxSize)
                return false;

            m_items.push_back(value);
            return true;
        }

        void Clear() noexcept { m_items.clear(); }

        [[nodiscard]] usize Size() const noexcept { return m_items.size(); }
        [[nodiscard]] bool  Empty() const noexcept { return m_items.empty(); }

        [[nodiscard]] const T& operator[](usize i) const noexcept { return m_items[i]; }

        [[nodiscard]] auto begin() const noexcept { return m_items.begin(); }
        [[nodiscard]] auto end() const noexcept { return m_items.end(); }

    private:
        DedupOptions   m_options{};
        std::vector<T> m_items{};
    };

    enum class ExternalKind : u8
    {
        Pointer,
        Array,
        String,
        Map,
        Function,
        Count
    };

    [[nodiscard]] constexpr const char* ToString(ExternalKind kind) noexcept
    {
        switch (kind)
        {
        case ExternalKind::Pointer:  return "pointer";
        case ExternalKind::Array:    return "array";
        case ExternalKind::String:   return "string";
        case ExternalKind::Map:      return "map";
        case ExternalKind::Function: return "function";
        default:                     return "unknown";
        }
    }

    // One registry per external kind.
    class ExternalRegistries
    {
    public:
        void Configure(usize strongPrefix, usize recentWindow) noexcept
        {
            const DedupOptions options{ strongPrefix, recentWindow, 0u };
            for (auto& q : m_queues)
                q.SetOptions(options);
        }

        void Push(ExternalKind kind, const void* address) { Queue(kind).Push(address); }

        [[nodiscard]] const DedupQueue<const void*>& Get(ExternalKind kind) const noexcept
        {
            return m_queues[static_cast<usize>(kind)];
        }

        [[nodiscard]] usize TotalSize() const noexcept
        {
            usize total = 0;
            for (const auto& q : m_queues)
                total += q.Size();
            return total;
        }

        void Clear() noexcept
        {
            for (auto& q : m_queues)
                q.Clear();
        }

    private:
        DedupQueue<const void*>& Queue(ExternalKind kind) noexcept
        {
            return m_queues[static_cast<usize>(kind)];
        }

        DedupQueue<const void*> m_queues[static_cast<usize>(ExternalKind::Count)]{};
    };

} // namespace lac::memory
