#pragma once
// ============================================================================
// Lac - Lac/Memory/Schema.hpp
// ----------------------------------------------------------------------------
// Purpose : Describe, once per type, the fields the safety checker has to
//           inspect. A described struct is a list of (name, offset, schema);
//           every other type maps onto one FieldKind with the accessors the
//           checker needs for that kind.
// Contract: SchemaOf<T>() returns a reference to a function-local static and
//           is safe to call from any thread. Schemas are linked through
//           SchemaFn pointers so recursive types (a node pointing to its own
//           type) resolve lazily.
// Notes   : Structs opt in with LAC_ARENA_STRUCT, written in the namespace of
//           the struct so argument-dependent lookup finds it:
//
//               struct D { int* v[4]; Slice<int> s; };
//               LAC_ARENA_STRUCT(D, LAC_ARENA_FIELD(D, v), LAC_ARENA_FIELD(D, s));
//
//           Members left out of the list are not checked.
// ============================================================================

#include "Lac/Types.hpp"
#include "Lac/Platform/PlatformMacros.hpp"
#include "Lac/Memory/ArenaTypes.hpp"

#include <array>
#include <climits>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <source_location>
#include <type_traits>

namespace lac::memory
{
    // Written into invalidated pointer fields: non-null, never mapped.
    inline constexpr uptr kSentinelAddress = 1u;

    [[nodiscard]] inline void* SentinelPointer() noexcept
    {
        return reinterpret_cast<void*>(kSentinelAddress);
    }

    enum class FieldKind : u8
    {
        Scalar,
        Pointer,
        Array,
        FixedArray,
        Map,
        String,
        Function,
        Struct,
        ArenaSelf,
        Unsupported
    };

    [[nodiscard]] constexpr const char* ToString(FieldKind kind) noexcept
    {
        switch (kind)
        {
        case FieldKind::Scalar:      return "Scalar";
        case FieldKind::Pointer:     return "Pointer";
        case FieldKind::Array:       return "Array";
        case FieldKind::FixedArray:  return "FixedArray";
        case FieldKind::Map:         return "Map";
        case FieldKind::String:      return "String";
        case FieldKind::Function:    return "Function";
        case FieldKind::Struct:      return "Struct";
        case FieldKind::ArenaSelf:   return "ArenaSelf";
        case FieldKind::Unsupported: return "Unsupported";
        default:                     return "Unknown";
        }
    }

    struct TypeSchema;
    using SchemaFn = const TypeSchema& (*)() noexcept;

    struct FieldSchema
    {
        const char* name;
        usize       offset;
        SchemaFn    type;
    };

    using MapValueVisitor = void (*)(const void* value, void* ctx);

    // ---
    // Purpose : Tagged description of one type.
    // Contract: Only the members relevant to `kind` are set:
    //   Pointer    : elem (pointee), target, invalidate
    //   Array      : elem, target (backing data), length, invalidate
    //   FixedArray : elem, count
    //   Map        : elem (mapped type), target (table), forEachValue, invalidate
    //   String     : target (backing data), invalidate
    //   Function   : target (environment), invalidate
    //   Struct     : fields, fieldCount
    // ---
    struct TypeSchema
    {
        const char* name = "";
        FieldKind   kind = FieldKind::Unsupported;
        usize       size = 0;
        SchemaFn    elem = nullptr;
        usize       count = 0;
        const FieldSchema* fields = nullptr;
        usize       fieldCount = 0;

        const void* (*target)(const void* self) noexcept = nullptr;
        usize       (*length)(const void* self) noexcept = nullptr;
        void        (*invalidate)(void* self) noexcept = nullptr;
        void        (*forEachValue)(const void* self, MapValueVisitor visit, void* ctx) = nullptr;
    };

    namespace detail
    {
        // Header surgery for the checker and the arena.
        struct ValueAccess
        {
            template <typename T>
            static void InvalidateSlice(Slice<T>& s) noexcept
            {
                s.m_data = nullptr;
                s.m_len = static_cast<usize>(INT32_MAX);
                s.m_cap = static_cast<usize>(INT32_MAX);
            }

            static void ClearString(String& s) noexcept
            {
                s.m_data = nullptr;
                s.m_size = 0;
            }

            template <typename K, typename V>
            static void InvalidateMap(Map<K, V>& m) noexcept
            {
                m.m_table = reinterpret_cast<typename Map<K, V>::Table*>(kSentinelAddress);
            }

            template <typename R, typename... Args>
            static void InvalidateFunc(Func<R(Args...)>& f) noexcept
            {
                f.m_thunk = nullptr;
                f.m_env = SentinelPointer();
            }
        };

        template <typename T>
        [[nodiscard]] constexpr const char* TypeName() noexcept
        {
            return std::source_location::current().function_name();
        }

        template <typename T> struct IsStdArray : std::false_type {};
        template <typename T, std::size_t N> struct IsStdArray<std::array<T, N>> : std::true_type {};

        template <typename P>
        const void* PointerTarget(const void* self) noexcept
        {
            return static_cast<const void*>(*static_cast<const P*>(self));
        }

        template <typename P>
        void PointerInvalidate(void* self) noexcept
        {
            *static_cast<P*>(self) = reinterpret_cast<P>(kSentinelAddress);
        }

        template <typename S>
        const void* SliceTarget(const void* self) noexcept
        {
            return static_cast<const void*>(static_cast<const S*>(self)->Data());
        }

        template <typename S>
        usize SliceLength(const void* self) noexcept
        {
            return static_cast<const S*>(self)->Size();
        }

        template <typename S>
        void SliceInvalidate(void* self) noexcept
        {
            ValueAccess::InvalidateSlice(*static_cast<S*>(self));
        }

        inline const void* StringTarget(const void* self) noexcept
        {
            return static_cast<const void*>(static_cast<const String*>(self)->Data());
        }

        inline void StringInvalidate(void* self) noexcept
        {
            ValueAccess::ClearString(*static_cast<String*>(self));
        }

        template <typename M>
        const void* MapTarget(const void* self) noexcept
        {
            return static_cast<const void*>(static_cast<const M*>(self)->Get());
        }

        template <typename M>
        void MapInvalidate(void* self) noexcept
        {
            ValueAccess::InvalidateMap(*static_cast<M*>(self));
        }

        template <typename M>
        void MapForEachValue(const void* self, MapValueVisitor visit, void* ctx)
        {
            const auto* table = static_cast<const M*>(self)->Get();
            for (const auto& kv : *table)
                visit(static_cast<const void*>(&kv.second), ctx);
        }

        template <typename F>
        const void* FuncTarget(const void* self) noexcept
        {
            return static_cast<const void*>(static_cast<const F*>(self)->Env());
        }

        template <typename F>
        void FuncInvalidate(void* self) noexcept
        {
            ValueAccess::InvalidateFunc(*static_cast<F*>(self));
        }

        // Structs described with LAC_ARENA_STRUCT.
        template <typename T>
        concept DescribedStruct = requires(const T* p) {
            { LacArenaSchemaOf(p) } -> std::same_as<const TypeSchema&>;
        };
    } // namespace detail

    [[nodiscard]] constexpr TypeSchema MakeStructSchema(const char* name, usize size,
        const FieldSchema* fields, usize fieldCount) noexcept
    {
        TypeSchema s{};
        s.name = name;
        s.kind = FieldKind::Struct;
        s.size = size;
        s.fields = fields;
        s.fieldCount = fieldCount;
        return s;
    }

    template <typename T>
    [[nodiscard]] const TypeSchema& SchemaOf() noexcept;

    namespace detail
    {
        template <typename T>
        [[nodiscard]] TypeSchema BuildSchema() noexcept
        {
            TypeSchema s{};
            s.name = TypeName<T>();

            if constexpr (std::is_void_v<T>)
            {
                // Opaque pointee: the address is classified, nothing behind it is walked.
                s.kind = FieldKind::Scalar;
            }
            else if constexpr (std::is_same_v<T, Arena>)
            {
                s.kind = FieldKind::ArenaSelf;
            }
            else if constexpr (std::is_arithmetic_v<T> || std::is_enum_v<T> || std::is_null_pointer_v<T>
                || std::is_member_pointer_v<T>
                || (std::is_pointer_v<T> && std::is_function_v<std::remove_pointer_t<T>>))
            {
                s.kind = FieldKind::Scalar;
                s.size = sizeof(T);
            }
            else if constexpr (std::is_pointer_v<T>)
            {
                s.kind = FieldKind::Pointer;
                s.size = sizeof(T);
                s.elem = &SchemaOf<std::remove_pointer_t<T>>;
                s.target = &PointerTarget<T>;
                s.invalidate = &PointerInvalidate<T>;
            }
            else if constexpr (std::is_array_v<T> && std::extent_v<T> != 0)
            {
                s.kind = FieldKind::FixedArray;
                s.size = sizeof(T);
                s.elem = &SchemaOf<std::remove_extent_t<T>>;
                s.count = std::extent_v<T>;
            }
            else if constexpr (IsStdArray<T>::value)
            {
                s.kind = FieldKind::FixedArray;
                s.size = sizeof(T);
                s.elem = &SchemaOf<typename T::value_type>;
                s.count = std::tuple_size_v<T>;
            }
            else if constexpr (IsSlice<T>::value)
            {
                s.kind = FieldKind::Array;
                s.size = sizeof(T);
                s.elem = &SchemaOf<typename T::value_type>;
                s.target = &SliceTarget<T>;
                s.length = &SliceLength<T>;
                s.invalidate = &SliceInvalidate<T>;
            }
            else if constexpr (std::is_same_v<T, String>)
            {
                s.kind = FieldKind::String;
                s.size = sizeof(T);
                s.target = &StringTarget;
                s.invalidate = &StringInvalidate;
            }
            else if constexpr (IsMap<T>::value)
            {
                s.kind = FieldKind::Map;
                s.size = sizeof(T);
                s.elem = &SchemaOf<typename T::mapped_type>;
                s.target = &MapTarget<T>;
                s.invalidate = &MapInvalidate<T>;
                s.forEachValue = &MapForEachValue<T>;
            }
            else if constexpr (IsFunc<T>::value)
            {
                s.kind = FieldKind::Function;
                s.size = sizeof(T);
                s.target = &FuncTarget<T>;
                s.invalidate = &FuncInvalidate<T>;
            }
            else
            {
                s.kind = FieldKind::Unsupported;
                s.size = sizeof(T);
            }
            return s;
        }
    } // namespace detail

    // ---
    // Purpose : Schema of `T`, built on first use.
    // Notes   : Described structs return the schema emitted by LAC_ARENA_STRUCT.
    // ---
    template <typename T>
    [[nodiscard]] const TypeSchema& SchemaOf() noexcept
    {
        using U = std::remove_cv_t<T>;
        if constexpr (!std::is_same_v<U, T>)
        {
            return SchemaOf<U>();
        }
        else if constexpr (detail::DescribedStruct<U>)
        {
            return LacArenaSchemaOf(static_cast<const U*>(nullptr));
        }
        else
        {
            static const TypeSchema kSchema = detail::BuildSchema<U>();
            return kSchema;
        }
    }

    template <typename T>
    inline constexpr bool kIsDescribedStruct = detail::DescribedStruct<std::remove_cv_t<T>>;

} // namespace lac::memory

// -----------------------------------------------------------------------------
// Struct description macros
// -----------------------------------------------------------------------------
#define LAC_ARENA_FIELD(Type, Member) \
    ::lac::memory::FieldSchema{ #Member, offsetof(Type, Member), &::lac::memory::SchemaOf<decltype(Type::Member)> }

#define LAC_ARENA_STRUCT(Type, ...)                                                              \
    [[maybe_unused]] inline const ::lac::memory::TypeSchema& LacArenaSchemaOf(const Type*) noexcept \
    {                                                                                            \
        static_assert(std::is_standard_layout_v<Type>, #Type " must be standard layout");       \
        static const ::lac::memory::FieldSchema kFields[] = { __VA_ARGS__ };                     \
        static const ::lac::memory::TypeSchema kSchema =                                         \
            ::lac::memory::MakeStructSchema(#Type, sizeof(Type), kFields, LAC_ARRAY_COUNT(kFields)); \
        return kSchema;                                                                          \
    }                                                                                            \
    static_assert(true, "")
