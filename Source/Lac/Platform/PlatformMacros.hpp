// =============================
// PlatformMacros.hpp
// =============================
#pragma once

// General-purpose lightweight macros safe across platforms.

// -----------------------------
// UNUSED(x)
// -----------------------------
#ifndef LAC_UNUSED
#define LAC_UNUSED(x) (void)(x)
#endif

// -----------------------------
// Branch prediction hints
// -----------------------------
#if defined(__GNUC__) || defined(__clang__)
#ifndef LAC_LIKELY
#define LAC_LIKELY(x)   __builtin_expect(!!(x), 1)
#endif
#ifndef LAC_UNLIKELY
#define LAC_UNLIKELY(x) __builtin_expect(!!(x), 0)
#endif
#else
  // Safe fallbacks
#ifndef LAC_LIKELY
#define LAC_LIKELY(x)   (!!(x))
#endif
#ifndef LAC_UNLIKELY
#define LAC_UNLIKELY(x) (!!(x))
#endif
#endif

// -----------------------------
// Array count (do not pass pointers)
// -----------------------------
#ifndef LAC_ARRAY_COUNT
#define LAC_ARRAY_COUNT(arr) (sizeof(arr) / sizeof((arr)[0]))
#endif

// Keep this header minimal; prefer standard attributes (e.g. [[nodiscard]]) over macro aliases.
