// ============================================================================
// Arena Safety Checker Smoke Test
// ----------------------------------------------------------------------------
// Purpose : Validate the debug-mode graph walk: internal references pass,
//           attached externals pass, unattached externals are fatal with a
//           field path, and released references fault on use.
// Contract: No exceptions; deterministic; returns non-zero on failure.
// Notes   : Fatal scenarios run in a forked child (see ArenaSmokeCommon.hpp).
// ============================================================================

#include "Lac/Memory/Arena.hpp"
#include "Lac/Memory/ArenaPool.hpp"
#include "Lac/Memory/SafetyChecker.hpp"
#include "ArenaSmokeCommon.hpp"

#include <climits>
#include <csignal>
#include <memory>
#include <unordered_map>
#include <utility>

namespace
{
    using ::lac::memory::Arena;
    using ::lac::memory::ArenaPool;
    using ::lac::memory::CheckStats;
    using ::lac::memory::Func;
    using ::lac::memory::Map;
    using ::lac::memory::SafetyChecker;
    using ::lac::memory::Slice;
    using ::lac::memory::String;
    using ::lac::memory::usize;
    using ::lac::memory::uptr;

    struct D
    {
        int* v[4];
    };
    LAC_ARENA_STRUCT(D, LAC_ARENA_FIELD(D, v));

    struct Ref
    {
        int* p;
    };
    LAC_ARENA_STRUCT(Ref, LAC_ARENA_FIELD(Ref, p));

    struct Holder
    {
        Slice<Ref> refs;
        Slice<int> values;
    };
    LAC_ARENA_STRUCT(Holder, LAC_ARENA_FIELD(Holder, refs), LAC_ARENA_FIELD(Holder, values));

    struct Node
    {
        Node* next;
        int   value;
    };
    LAC_ARENA_STRUCT(Node, LAC_ARENA_FIELD(Node, next), LAC_ARENA_FIELD(Node, value));

    struct M
    {
        Map<int, int*> table;
    };
    LAC_ARENA_STRUCT(M, LAC_ARENA_FIELD(M, table));

    struct F
    {
        Func<int(int)> fn;
    };
    LAC_ARENA_STRUCT(F, LAC_ARENA_FIELD(F, fn));

    struct S
    {
        String name;
    };
    LAC_ARENA_STRUCT(S, LAC_ARENA_FIELD(S, name));

    struct Owner
    {
        Arena*              arena;
        int*                p;
        std::pair<int, int> extra;
    };
    LAC_ARENA_STRUCT(Owner, LAC_ARENA_FIELD(Owner, arena), LAC_ARENA_FIELD(Owner, p), LAC_ARENA_FIELD(Owner, extra));

    struct Inner
    {
        int* a;
    };
    LAC_ARENA_STRUCT(Inner, LAC_ARENA_FIELD(Inner, a));

    // `in` sits at offset 0: an Outer and its Inner share one address.
    struct Outer
    {
        Inner in;
        int*  b;
    };
    LAC_ARENA_STRUCT(Outer, LAC_ARENA_FIELD(Outer, in), LAC_ARENA_FIELD(Outer, b));

    struct InnerRef
    {
        Inner* ip;
    };
    LAC_ARENA_STRUCT(InnerRef, LAC_ARENA_FIELD(InnerRef, ip));

    int Negate(int v)
    {
        return -v;
    }

    ::lac::memory::ArenaConfig DebugConfig() noexcept
    {
        return ::lac::smoke::SmallChunkConfig(::lac::memory::Toggle::On);
    }

    int RunInternalReferencesScenario()
    {
        ArenaPool pool(DebugConfig());
        Arena* arena = pool.Get();
        if (!arena->IsDebug())
        {
            return 1;
        }

        D* d = arena->New<D>();
        for (int i = 0; i < 4; ++i)
        {
            d->v[i] = arena->New<int>(i);
        }

        // External but attached: accepted, not entered.
        static int s_attached = 11;
        arena->Attach(&s_attached);
        d->v[3] = &s_attached;

        Holder* h = arena->New<Holder>();
        h->refs = arena->NewSlice<Ref>(2u, 2u);
        h->refs[0].p = arena->New<int>(1);
        h->refs[1].p = nullptr;
        arena->Append(h->values, 5);

        if (arena->GetRootCount() != 2u)
        {
            return 2;
        }

        arena->CheckExternalPointers();
        if (d->v[0] == nullptr || *d->v[1] != 1 || h->values.Size() != 1u)
        {
            return 3; // checking alone must not invalidate
        }

        pool.Release(arena);

        // The chunk is parked in the pool, so the old words are still readable.
        for (int i = 0; i < 4; ++i)
        {
            if (reinterpret_cast<uptr>(d->v[i]) != ::lac::memory::kSentinelAddress)
            {
                return 4;
            }
        }
        if (h->refs.Data() != nullptr || h->refs.Size() != static_cast<usize>(INT32_MAX))
        {
            return 5;
        }
        return 0;
    }

    int RunExternalPointerDeathScenarios()
    {
        const bool fixedArray = ::lac::smoke::ExpectDeath([]() {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();
            int local[4] = { 1, 2, 3, 4 };
            D* d = arena->New<D>();
            d->v[0] = &local[0];
            pool.Release(arena);
        }, SIGABRT, "D.v[0]: unexpected external pointer");
        if (!fixedArray)
        {
            return 10;
        }

        const bool inSlice = ::lac::smoke::ExpectDeath([]() {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();
            static int s_outside = 3;
            Holder* h = arena->New<Holder>();
            h->refs = arena->NewSlice<Ref>(2u, 4u);
            h->refs[0].p = arena->New<int>(0);
            h->refs[1].p = &s_outside;
            arena->CheckExternalPointers();
        }, SIGABRT, "Holder.refs[1].p: unexpected external pointer");
        if (!inSlice)
        {
            return 11;
        }

        const bool externalSlice = ::lac::smoke::ExpectDeath([]() {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();
            static int s_values[3] = { 1, 2, 3 };
            Holder* h = arena->New<Holder>();
            h->values = Slice<int>(s_values, 3u, 3u);
            pool.Release(arena);
        }, SIGABRT, "Holder.values: unexpected external array");
        if (!externalSlice)
        {
            return 12;
        }

        // Attaching the slice backing store makes the same graph legal.
        {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();
            static int s_values[3] = { 1, 2, 3 };
            Holder* h = arena->New<Holder>();
            h->values = Slice<int>(s_values, 3u, 3u);
            arena->Attach(h->values);

            auto owned = std::make_shared<int>(9);
            Ref* r = arena->New<Ref>();
            r->p = owned.get();
            arena->Attach(std::move(owned));
            pool.Release(arena);

            if (s_values[2] != 3)
            {
                return 13; // externals are never written
            }
        }
        return 0;
    }

    int RunUseAfterReleaseScenario()
    {
        const bool pointer = ::lac::smoke::ExpectDeath([]() {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();
            D* d = arena->New<D>();
            d->v[0] = arena->New<int>(7);
            pool.Release(arena);
            volatile int value = *d->v[0];
            (void)value;
        }, SIGSEGV, nullptr);
        if (!pointer)
        {
            return 20;
        }

        const bool slice = ::lac::smoke::ExpectDeath([]() {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();
            Holder* h = arena->New<Holder>();
            h->values = arena->NewSlice<int>(4u, 4u);
            pool.Release(arena);
            volatile int value = h->values[2];
            (void)value;
        }, SIGSEGV, nullptr);
        if (!slice)
        {
            return 21;
        }
        return 0;
    }

    int RunMapScenario()
    {
        {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();
            M* m = arena->New<M>();
            m->table = arena->NewMap<int, int*>();
            (*m->table)[1] = arena->New<int>(10);
            pool.Release(arena);
            if (reinterpret_cast<uptr>(m->table.Get()) != ::lac::memory::kSentinelAddress)
            {
                return 30;
            }
        }

        const bool unattached = ::lac::smoke::ExpectDeath([]() {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();
            static std::unordered_map<int, int*> s_table;
            M* m = arena->New<M>();
            m->table = Map<int, int*>(&s_table);
            pool.Release(arena);
        }, SIGABRT, "M.table: unexpected external map");
        if (!unattached)
        {
            return 31;
        }

        const bool badValue = ::lac::smoke::ExpectDeath([]() {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();
            static std::unordered_map<int, int*> s_table;
            static int s_outside = 4;
            M* m = arena->New<M>();
            m->table = Map<int, int*>(&s_table);
            arena->Attach(m->table);
            s_table[1] = arena->New<int>(1);
            s_table[2] = &s_outside;
            pool.Release(arena);
        }, SIGABRT, "M.table[]: unexpected external pointer");
        if (!badValue)
        {
            return 32;
        }

        {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();
            std::unordered_map<int, int*> table;
            M* m = arena->New<M>();
            m->table = Map<int, int*>(&table);
            arena->Attach(m->table);
            table[1] = arena->New<int>(1);
            pool.Release(arena);
            if (table.size() != 1u || table[1] == nullptr)
            {
                return 33; // attached tables are checked, never rewritten
            }
        }
        return 0;
    }

    int RunFunctionAndStringScenario()
    {
        {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();

            F* plain = arena->New<F>();
            plain->fn = Func<int(int)>::FromFunction<&Negate>();

            const int k = 3;
            F* closure = arena->New<F>();
            closure->fn = arena->NewFunc<int(int)>([k](int v) { return v * k; });
            if (closure->fn(2) != 6)
            {
                return 40;
            }

            static auto s_add = [](int v) { return v + 1; };
            F* attached = arena->New<F>();
            attached->fn = Func<int(int)>::FromCallable(&s_add);
            arena->Attach(attached->fn);

            S* s = arena->New<S>();
            s->name = arena->NewString("inside");
            static const char s_text[] = "outside";
            S* t = arena->New<S>();
            t->name = String(s_text, 7u);
            arena->Attach(t->name);

            pool.Release(arena);

            if (closure->fn || closure->fn.Env() != ::lac::memory::SentinelPointer())
            {
                return 41;
            }
            if (s->name.Data() != nullptr || !s->name.Empty())
            {
                return 42;
            }
        }

        const bool externalEnv = ::lac::smoke::ExpectDeath([]() {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();
            auto add = [](int v) { return v + 1; };
            F* f = arena->New<F>();
            f->fn = Func<int(int)>::FromCallable(&add);
            pool.Release(arena);
        }, SIGABRT, "F.fn: unexpected external function");
        if (!externalEnv)
        {
            return 43;
        }

        const bool literal = ::lac::smoke::ExpectDeath([]() {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();
            static const char s_text[] = "literal";
            S* s = arena->New<S>();
            s->name = String(s_text, 7u);
            pool.Release(arena);
        }, SIGABRT, "S.name: unexpected external string");
        if (!literal)
        {
            return 44;
        }
        return 0;
    }

    int RunGraphScenario()
    {
        ArenaPool pool(DebugConfig());
        Arena* arena = pool.Get();

        // n1 -> n2 -> n3 -> n1: each node visited once, from the newest root.
        Node* n1 = arena->New<Node>();
        Node* n2 = arena->New<Node>();
        Node* n3 = arena->New<Node>();
        n1->next = n2;
        n2->next = n3;
        n3->next = n1;

        CheckStats stats = SafetyChecker(*arena).Run(false);
        if (stats.roots != 1u || stats.nodes != 3u || stats.references != 3u || stats.invalidated != 0u)
        {
            return 50;
        }
        if (n1->next != n2 || n3->next != n1)
        {
            return 51;
        }

        // Self references and unsupported members are not violations.
        Owner* owner = arena->New<Owner>();
        owner->arena = arena;
        owner->p = &n1->value;
        owner->extra = { 1, 2 };

        stats = SafetyChecker(*arena).Run(true);
        if (stats.roots != 2u || stats.nodes != 4u || stats.invalidated != 5u)
        {
            return 52;
        }
        if (reinterpret_cast<uptr>(n2->next) != ::lac::memory::kSentinelAddress || owner->extra.second != 2)
        {
            return 53;
        }

        pool.Release(arena);
        return 0;
    }

    int RunEmbeddedMemberScenario()
    {
        {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();
            Outer* o = arena->New<Outer>();
            o->in.a = arena->New<int>(1);
            o->b = arena->New<int>(2);
            InnerRef* r = arena->New<InnerRef>();
            r->ip = &o->in;

            // InnerRef (newest) reaches the Inner first; the Outer root at the
            // same address is still a node of its own.
            const CheckStats stats = SafetyChecker(*arena).Run(false);
            if (stats.roots != 2u || stats.nodes != 3u || stats.references != 3u)
            {
                return 60;
            }

            pool.Release(arena);
            if (reinterpret_cast<uptr>(o->b) != ::lac::memory::kSentinelAddress
                || reinterpret_cast<uptr>(o->in.a) != ::lac::memory::kSentinelAddress)
            {
                return 61;
            }
        }

        const bool hidden = ::lac::smoke::ExpectDeath([]() {
            ArenaPool pool(DebugConfig());
            Arena* arena = pool.Get();
            static int s_outside = 5;
            Outer* o = arena->New<Outer>();
            o->in.a = arena->New<int>(1);
            o->b = &s_outside;
            InnerRef* r = arena->New<InnerRef>();
            r->ip = &o->in;
            pool.Release(arena);
        }, SIGABRT, "Outer.b: unexpected external pointer");
        if (!hidden)
        {
            return 62;
        }
        return 0;
    }

    int RunLongListScenario()
    {
        constexpr usize kNodeCount = 200000u;

        ::lac::memory::ArenaConfig cfg = DebugConfig();
        cfg.chunk_size = 64u * 1024u;
        cfg.max_debug_roots = 1u; // only the head is a root: one chain, kNodeCount deep
        ArenaPool pool(cfg);
        Arena* arena = pool.Get();

        Node* head = arena->New<Node>();
        Node* tail = head;
        Node* middle = nullptr;
        for (usize i = 1; i < kNodeCount; ++i)
        {
            Node* node = arena->New<Node>();
            node->value = static_cast<int>(i);
            tail->next = node;
            tail = node;
            if (i == kNodeCount / 2u)
            {
                middle = node;
            }
        }

        const CheckStats stats = SafetyChecker(*arena).Run(false);
        if (stats.roots != 1u || stats.nodes != kNodeCount || stats.references != kNodeCount)
        {
            return 70;
        }

        pool.Release(arena);
        if (reinterpret_cast<uptr>(head->next) != ::lac::memory::kSentinelAddress
            || reinterpret_cast<uptr>(middle->next) != ::lac::memory::kSentinelAddress)
        {
            return 71;
        }
        return 0;
    }
} // namespace

int RunArenaCheckerSmoke()
{
    if (const int rc = RunInternalReferencesScenario(); rc != 0)
    {
        return rc;
    }
    if (const int rc = RunExternalPointerDeathScenarios(); rc != 0)
    {
        return rc;
    }
    if (const int rc = RunUseAfterReleaseScenario(); rc != 0)
    {
        return rc;
    }
    if (const int rc = RunMapScenario(); rc != 0)
    {
        return rc;
    }
    if (const int rc = RunFunctionAndStringScenario(); rc != 0)
    {
        return rc;
    }
    if (const int rc = RunGraphScenario(); rc != 0)
    {
        return rc;
    }
    if (const int rc = RunEmbeddedMemberScenario(); rc != 0)
    {
        return rc;
    }
    return RunLongListScenario();
}
