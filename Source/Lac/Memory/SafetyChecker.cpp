// ============================================================================
// Lac - Lac/Memory/SafetyChecker.cpp
// ----------------------------------------------------------------------------
// Purpose : Graph walk behind Arena::Reset (debug mode) and
//           Arena::CheckExternalPointers.
// Contract: See SafetyChecker.hpp.
// Notes   : Classification order is null, sentinel, self, chunk ranges, then
//           the registry of the field's kind. Registered externals are
//           accepted but never entered: their contents belong to another
//           allocator.
// ============================================================================

#include "Lac/Memory/SafetyChecker.hpp"
#include "Lac/Logger.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>

namespace lac::memory
{
namespace
{
    struct MapVisitContext
    {
        SafetyChecker*    checker;
        const TypeSchema* elem;
    };

    [[nodiscard]] uptr ToAddress(const void* p) noexcept
    {
        return reinterpret_cast<uptr>(p);
    }
} // namespace

SafetyChecker::SafetyChecker(const Arena& arena)
{
    m_self.begin = ToAddress(&arena);
    m_self.end = m_self.begin + sizeof(Arena);

    m_chunks.reserve(arena.m_chunkList.size());
    for (const auto& chunk : arena.m_chunkList)
    {
        const uptr begin = ToAddress(chunk->Data());
        m_chunks.push_back(Range{ begin, begin + chunk->Capacity() });
    }
    std::sort(m_chunks.begin(), m_chunks.end(),
        [](const Range& a, const Range& b) noexcept { return a.begin < b.begin; });

    for (usize k = 0; k < static_cast<usize>(ExternalKind::Count); ++k)
    {
        const auto& queue = arena.m_registries.Get(static_cast<ExternalKind>(k));
        m_external[k].insert(queue.begin(), queue.end());
    }

    m_roots.assign(arena.m_roots.begin(), arena.m_roots.end());
}

bool SafetyChecker::IsInternal(uptr address) const noexcept
{
    auto it = std::upper_bound(m_chunks.begin(), m_chunks.end(), address,
        [](uptr value, const Range& r) noexcept { return value < r.begin; });
    if (it == m_chunks.begin())
        return false;
    --it;
    return address < it->end;
}

AddressClass SafetyChecker::Classify(const void* address, ExternalKind kind) const noexcept
{
    const uptr a = ToAddress(address);
    if (a == 0)
        return AddressClass::Null;
    if (a == kSentinelAddress)
        return AddressClass::Sentinel;
    if (a >= m_self.begin && a < m_self.end)
        return AddressClass::Self;
    if (IsInternal(a))
        return AddressClass::Internal;
    if (m_external[static_cast<usize>(kind)].count(address) != 0)
        return AddressClass::External;
    return AddressClass::Unclassified;
}

CheckStats SafetyChecker::Run(bool invalidate) noexcept
{
    m_invalidate = invalidate;
    m_visited.clear();
    m_pending.clear();
    m_stats = CheckStats{};

    // Newest first: nested objects are usually allocated after their containers.
    for (usize i = m_roots.size(); i > 0; --i)
    {
        const DebugRoot& root = m_roots[i - 1];
        if (m_visited.count(NodeKey{ root.address, root.schema }) != 0)
            continue;

        ++m_stats.roots;
        m_path.clear();
        Push(Step::Root, root.address, *root.schema, true, root.schema->name);
        Drain();
    }

    LAC_LOG_VERBOSE(LAC_CHECK_LOG_CATEGORY,
        "Checked {} roots, {} nodes, {} references ({} invalidated)",
        static_cast<unsigned long long>(m_stats.roots),
        static_cast<unsigned long long>(m_stats.nodes),
        static_cast<unsigned long long>(m_stats.references),
        static_cast<unsigned long long>(m_stats.invalidated));
    return m_stats;
}

void SafetyChecker::Push(Step step, void* address, const TypeSchema& schema, bool writable,
    const char* label, usize count) noexcept
{
    m_pending.push_back(Pending{ address, &schema, label, m_path.size(), 0, count, step, writable });
}

void SafetyChecker::Drain() noexcept
{
    while (!m_pending.empty())
    {
        const Pending next = m_pending.back();
        m_pending.pop_back();

        // Siblings go back first so the element's own children are walked before them.
        if (next.step == Step::Index && next.count > 1)
        {
            Pending rest = next;
            rest.address = static_cast<u8*>(next.address) + next.schema->size;
            ++rest.index;
            --rest.count;
            m_pending.push_back(rest);
        }

        m_path.resize(next.mark);
        AppendStep(next);
        VisitValue(next.address, *next.schema, next.writable);
    }
}

void SafetyChecker::AppendStep(const Pending& entry) noexcept
{
    switch (entry.step)
    {
    case Step::Root:
        m_path.append(entry.label);
        break;
    case Step::Field:
        if (m_path.size() < 2 || m_path.compare(m_path.size() - 2, 2, "->") != 0)
            m_path.push_back('.');
        m_path.append(entry.label);
        break;
    case Step::Index:
        fmt::format_to(std::back_inserter(m_path), "[{}]", entry.index);
        break;
    case Step::Arrow:
        m_path.append("->");
        break;
    case Step::MapValue:
        m_path.append("[]");
        break;
    }
}

void SafetyChecker::VisitValue(void* value, const TypeSchema& schema, bool writable) noexcept
{
    switch (schema.kind)
    {
    case FieldKind::Scalar:
    case FieldKind::ArenaSelf:
        return;
    case FieldKind::Pointer:     VisitPointer(value, schema, writable); return;
    case FieldKind::Array:       VisitArray(value, schema, writable); return;
    case FieldKind::FixedArray:  VisitFixedArray(value, schema, writable); return;
    case FieldKind::Map:         VisitMap(value, schema, writable); return;
    case FieldKind::String:      VisitString(value, schema, writable); return;
    case FieldKind::Function:    VisitFunction(value, schema, writable); return;
    case FieldKind::Struct:      VisitStruct(value, schema, writable); return;
    case FieldKind::Unsupported: WarnUnsupported(schema, m_path); return;
    default:                     return;
    }
}

void SafetyChecker::VisitStruct(void* value, const TypeSchema& schema, bool writable) noexcept
{
    if (!m_visited.insert(NodeKey{ value, &schema }).second)
        return;

    ++m_stats.nodes;
    auto* base = static_cast<u8*>(value);

    // Reversed so fields come off the worklist in declaration order.
    for (usize i = schema.fieldCount; i > 0; --i)
    {
        const FieldSchema& field = schema.fields[i - 1];
        Push(Step::Field, base + field.offset, field.type(), writable, field.name);
    }
}

void SafetyChecker::VisitPointer(void* field, const TypeSchema& schema, bool writable) noexcept
{
    ++m_stats.references;
    const void* target = schema.target(field);

    switch (Classify(target, ExternalKind::Pointer))
    {
    case AddressClass::Unclassified:
        ReportViolation(ExternalKind::Pointer, target);

    case AddressClass::Internal:
    {
        const TypeSchema& pointee = schema.elem();
        if (pointee.kind != FieldKind::Scalar && pointee.kind != FieldKind::ArenaSelf)
            Push(Step::Arrow, const_cast<void*>(target), pointee, true);
        break;
    }

    case AddressClass::Null:
    case AddressClass::Sentinel:
    case AddressClass::Self:
    case AddressClass::External:
    default:
        break;
    }

    // The target was read above; overwriting the field no longer affects the walk.
    Invalidate(field, schema, writable);
}

void SafetyChecker::VisitArray(void* field, const TypeSchema& schema, bool writable) noexcept
{
    ++m_stats.references;
    const void* data = schema.target(field);
    const usize len = schema.length(field);

    if (len > 0)
    {
        switch (Classify(data, ExternalKind::Array))
        {
        case AddressClass::Unclassified:
            ReportViolation(ExternalKind::Array, data);

        case AddressClass::Internal:
        {
            const TypeSchema& elem = schema.elem();
            if (elem.kind == FieldKind::Scalar || elem.size == 0)
                break;
            Push(Step::Index, const_cast<void*>(data), elem, true, nullptr, len);
            break;
        }

        default:
            break;
        }
    }

    Invalidate(field, schema, writable);
}

void SafetyChecker::VisitFixedArray(void* field, const TypeSchema& schema, bool writable) noexcept
{
    const TypeSchema& elem = schema.elem();
    if (elem.kind == FieldKind::Scalar || schema.count == 0)
        return;

    Push(Step::Index, field, elem, writable, nullptr, schema.count);
}

void SafetyChecker::VisitMapValue(const void* value, void* ctx)
{
    auto* c = static_cast<MapVisitContext*>(ctx);
    // Values live in the heap table: check, never write.
    c->checker->Push(Step::MapValue, const_cast<void*>(value), *c->elem, false);
}

void SafetyChecker::VisitMap(void* field, const TypeSchema& schema, bool writable) noexcept
{
    ++m_stats.references;
    const void* table = schema.target(field);

    switch (Classify(table, ExternalKind::Map))
    {
    case AddressClass::Null:
    case AddressClass::Sentinel:
        break;

    case AddressClass::External:
    {
        const TypeSchema& elem = schema.elem();
        if (elem.kind != FieldKind::Scalar)
        {
            MapVisitContext ctx{ this, &elem };
            schema.forEachValue(field, &SafetyChecker::VisitMapValue, &ctx);
        }
        break;
    }

    default:
        // Maps are never arena backed: an unregistered handle is a violation
        // even when it happens to point into a chunk.
        ReportViolation(ExternalKind::Map, table);
    }

    Invalidate(field, schema, writable);
}

void SafetyChecker::VisitString(void* field, const TypeSchema& schema, bool writable) noexcept
{
    ++m_stats.references;
    const void* data = schema.target(field);
    if (Classify(data, ExternalKind::String) == AddressClass::Unclassified)
        ReportViolation(ExternalKind::String, data);

    Invalidate(field, schema, writable);
}

void SafetyChecker::VisitFunction(void* field, const TypeSchema& schema, bool writable) noexcept
{
    ++m_stats.references;
    const void* env = schema.target(field);
    const AddressClass cls = Classify(env, ExternalKind::Function);
    if (cls == AddressClass::Unclassified || cls == AddressClass::Self)
        ReportViolation(ExternalKind::Function, env);

    Invalidate(field, schema, writable);
}

void SafetyChecker::Invalidate(void* field, const TypeSchema& schema, bool writable) noexcept
{
    if (!m_invalidate || !writable || !schema.invalidate)
        return;
    schema.invalidate(field);
    ++m_stats.invalidated;
}

void SafetyChecker::ReportViolation(ExternalKind kind, const void* address) const noexcept
{
    LAC_LOG_FATAL(LAC_CHECK_LOG_CATEGORY,
        "{}: unexpected external {} {} (Attach it before storing it in arena memory)",
        m_path, ToString(kind), address);
}

void SafetyChecker::WarnUnsupported(const TypeSchema& schema, const std::string& path) noexcept
{
    static std::mutex s_mutex;
    static std::unordered_set<const TypeSchema*> s_reported;

    {
        std::lock_guard<std::mutex> lock(s_mutex);
        if (!s_reported.insert(&schema).second)
            return;
    }

    LAC_LOG_WARNING(LAC_CHECK_LOG_CATEGORY,
        "{}: field type {} is not supported by the checker; values behind it are not covered",
        path, schema.name);
}

} // namespace lac::memory
