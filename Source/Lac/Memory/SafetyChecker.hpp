#pragma once
// ============================================================================
// Lac - Lac/Memory/SafetyChecker.hpp
// ----------------------------------------------------------------------------
// Purpose : Debug-mode walk of the object graph reachable from an arena's
//           struct roots. Finds external values that were stored without
//           Attach, and optionally invalidates every pointer-like field so a
//           use after reset faults instead of reading recycled memory.
// Contract: The arena must not be in use by any other thread during Run().
//           Violations are fatal (LAC_LOG_FATAL, category "Arena.Check") and
//           name the field path, e.g. "D.v[2]". Memory that the arena does not
//           own (registered externals, map tables) is never written.
// Notes   : Roots are visited newest first and every struct node at most once
//           per pass, keyed by address and type: a struct and its first member
//           share an address but are distinct nodes. The walk runs off an
//           explicit worklist, so list length is bounded by heap, not stack.
// ============================================================================

#include "Lac/Types.hpp"
#include "Lac/Memory/Arena.hpp"
#include "Lac/Memory/ExternalRegistry.hpp"
#include "Lac/Memory/Schema.hpp"

#include <functional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#ifndef LAC_CHECK_LOG_CATEGORY
#define LAC_CHECK_LOG_CATEGORY "Arena.Check"
#endif

namespace lac::memory
{
    enum class AddressClass : u8
    {
        Null,
        Sentinel,
        Internal,
        Self,
        External,
        Unclassified
    };

    struct CheckStats
    {
        usize roots = 0;
        usize nodes = 0;          // struct nodes visited
        usize references = 0;     // pointer-like fields classified
        usize invalidated = 0;    // fields overwritten
    };

    class SafetyChecker
    {
    public:
        // Snapshots the arena's chunk ranges and registries.
        explicit SafetyChecker(const Arena& arena);

        SafetyChecker(const SafetyChecker&) = delete;
        SafetyChecker& operator=(const SafetyChecker&) = delete;

        CheckStats Run(bool invalidate) noexcept;

        [[nodiscard]] AddressClass Classify(const void* address, ExternalKind kind) const noexcept;

    private:
        struct Range
        {
            uptr begin;
            uptr end;
        };

        // How a pending value extends its parent's path.
        enum class Step : u8
        {
            Root,       // "Type"
            Field,      // ".name", or "name" right after "->"
            Index,      // "[i]"
            Arrow,      // "->"
            MapValue    // "[]"
        };

        // `mark` is the parent's path length. An Index entry with count > 1
        // stands for `count` consecutive elements and is split as it is popped.
        struct Pending
        {
            void*             address;
            const TypeSchema* schema;
            const char*       label;
            usize             mark;
            usize             index;
            usize             count;
            Step              step;
            bool              writable;
        };

        struct NodeKey
        {
            const void*       address;
            const TypeSchema* schema;

            bool operator==(const NodeKey& other) const noexcept
            {
                return address == other.address && schema == other.schema;
            }
        };

        struct NodeKeyHash
        {
            usize operator()(const NodeKey& key) const noexcept
            {
                const usize a = std::hash<const void*>{}(key.address);
                const usize b = std::hash<const void*>{}(key.schema);
                return a ^ (b + 0x9e3779b97f4a7c15ull + (a << 6) + (a >> 2));
            }
        };

        [[nodiscard]] bool IsInternal(uptr address) const noexcept;

        void Push(Step step, void* address, const TypeSchema& schema, bool writable,
            const char* label = nullptr, usize count = 1) noexcept;
        void Drain() noexcept;
        void AppendStep(const Pending& entry) noexcept;

        // `writable` is false below memory the arena does not own.
        void VisitValue(void* value, const TypeSchema& schema, bool writable) noexcept;
        void VisitStruct(void* value, const TypeSchema& schema, bool writable) noexcept;
        void VisitPointer(void* field, const TypeSchema& schema, bool writable) noexcept;
        void VisitArray(void* field, const TypeSchema& schema, bool writable) noexcept;
        void VisitFixedArray(void* field, const TypeSchema& schema, bool writable) noexcept;
        void VisitMap(void* field, const TypeSchema& schema, bool writable) noexcept;
        void VisitString(void* field, const TypeSchema& schema, bool writable) noexcept;
        void VisitFunction(void* field, const TypeSchema& schema, bool writable) noexcept;

        void Invalidate(void* field, const TypeSchema& schema, bool writable) noexcept;
        static void VisitMapValue(const void* value, void* ctx);
        [[noreturn]] void ReportViolation(ExternalKind kind, const void* address) const noexcept;
        static void WarnUnsupported(const TypeSchema& schema, const std::string& path) noexcept;

        Range                  m_self{};
        std::vector<Range>     m_chunks{};
        std::unordered_set<const void*> m_external[static_cast<usize>(ExternalKind::Count)]{};
        std::vector<DebugRoot>   m_roots{};

        std::unordered_set<NodeKey, NodeKeyHash> m_visited{};
        std::vector<Pending> m_pending{};
        std::string m_path{};
        CheckStats  m_stats{};
        bool        m_invalidate = false;
    };

} // namespace lac::memory
