#pragma once

#include <cstdint>  // int32_t, uint32_t...
#include <cstddef>  // size_t, ptrdiff_t

// =============================
// Types.hpp
// =============================
// Fixed-size aliases used across the library. Arena code sticks to these
// instead of raw native types like 'int' or 'long'.
// =============================

namespace lac
{
// ---- Integer types ----
using int8 = std::int8_t;
using int16 = std::int16_t;
using int32 = std::int32_t;
using int64 = std::int64_t;

using uint8 = std::uint8_t;
using uint16 = std::uint16_t;
using uint32 = std::uint32_t;
using uint64 = std::uint64_t;

// ---- Short aliases (i*/u* pattern) ----
using i8  = int8;
using i16 = int16;
using i32 = int32;
using i64 = int64;

using u8  = uint8;
using u16 = uint16;
using u32 = uint32;
using u64 = uint64;

// ---- Floating point ----
using float32 = float;
using float64 = double;

// ---- Size and pointer-related ----
using usize = std::size_t;
using isize = std::ptrdiff_t;
using uptr  = std::uintptr_t;

// ---- Aliases for readability ----
using byte = uint8;

// Word size the arena aligns every allocation to.
inline constexpr usize kWordSize = sizeof(void*);

static_assert(kWordSize == 8, "Lac targets 64-bit platforms only");

// Switch with an explicit "not set" state so API overrides can defer to the
// environment / compile-time layers.
enum class Toggle : u8
{
    Default = 0,
    Off,
    On
};

namespace core {
    using ::lac::usize;
    using ::lac::isize;
    using ::lac::u8;
    using ::lac::u32;
    using ::lac::u64;
    using ::lac::i32;
    using ::lac::uptr;
}

namespace memory {
    using ::lac::usize;
    using ::lac::isize;
    using ::lac::u8;
    using ::lac::u32;
    using ::lac::u64;
    using ::lac::i32;
    using ::lac::i64;
    using ::lac::uptr;
    using ::lac::Toggle;
}
} // namespace lac
