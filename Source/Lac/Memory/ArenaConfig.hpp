// ============================================================================
// Lac - Lac/Memory/ArenaConfig.hpp
// ----------------------------------------------------------------------------
// Purpose : Centralize the compile-time defaults and the runtime configuration
//           struct for the arena subsystem (chunk size, pool caps, leak
//           ceiling, growth ratio, debug switch, kill switch).
// Contract: Header-only declarations plus ArenaConfig.cpp for resolution.
//           Precedence for every tunable is API -> environment -> macro and is
//           resolved once, when an ArenaPool is constructed. Invalid values at
//           any layer fall back to the next layer with a warning.
// Notes   : There is no ambient global configuration: each ArenaPool owns the
//           ArenaSettings it was built with, so differently configured pools
//           coexist (and are tested) side by side.
// ============================================================================

#pragma once

#include "Lac/Types.hpp"
#include "Lac/Logger.hpp"

#include <cstddef>
#include <cstdint>

#ifndef LAC_ARENA_LOG_CATEGORY
#define LAC_ARENA_LOG_CATEGORY "Arena.Config"
#endif

// -----------------------------------------------------------------------------
// Compile-time defaults. Override in the build system or before including
// this header.
// -----------------------------------------------------------------------------

// Nominal chunk size in bytes. Larger requests get a standalone buffer.
#ifndef LAC_ARENA_CHUNK_SIZE
#   define LAC_ARENA_CHUNK_SIZE (128u * 1024u)
#endif

// Chunks beyond this count are returned to the host instead of pooled.
#ifndef LAC_ARENA_MAX_POOLED_CHUNKS
#   define LAC_ARENA_MAX_POOLED_CHUNKS 8192u
#endif

// Arenas beyond this count are destroyed instead of pooled.
#ifndef LAC_ARENA_MAX_POOLED_ARENAS
#   define LAC_ARENA_MAX_POOLED_ARENAS 10000u
#endif

// Debug mode only: creating more arenas than this means Release/DecRef calls are missing.
#ifndef LAC_ARENA_MAX_NEW_IN_DEBUG
#   define LAC_ARENA_MAX_NEW_IN_DEBUG 20u
#endif

// Growth factor for Append on a full slice. Memory from an arena is cheap, so
// this is more aggressive than std::vector's doubling.
#ifndef LAC_ARENA_SLICE_EXTEND_RATIO
#   define LAC_ARENA_SLICE_EXTEND_RATIO 2.5
#endif

#ifndef LAC_ARENA_DEBUG
#   define LAC_ARENA_DEBUG 0
#endif

// Kill switch: 1 turns every arena into a pass-through to the host allocator.
#ifndef LAC_ARENA_DISABLED
#   define LAC_ARENA_DISABLED 0
#endif

#ifndef LAC_ARENA_MAX_DEBUG_ROOTS
#   define LAC_ARENA_MAX_DEBUG_ROOTS (64u * 1024u)
#endif

// Registries check uniqueness against every entry until they hold this many,
// then only against the most recent LAC_ARENA_REGISTRY_RECENT_WINDOW entries.
#ifndef LAC_ARENA_REGISTRY_STRONG_PREFIX
#   define LAC_ARENA_REGISTRY_STRONG_PREFIX 64u
#endif

#ifndef LAC_ARENA_REGISTRY_RECENT_WINDOW
#   define LAC_ARENA_REGISTRY_RECENT_WINDOW 16u
#endif

#if (LAC_ARENA_DEBUG != 0) && (LAC_ARENA_DEBUG != 1)
#   error "LAC_ARENA_DEBUG must be 0 or 1"
#endif

#if (LAC_ARENA_DISABLED != 0) && (LAC_ARENA_DISABLED != 1)
#   error "LAC_ARENA_DISABLED must be 0 or 1"
#endif

static_assert((LAC_ARENA_CHUNK_SIZE) >= 4096u, "Arena chunk size must be at least 4 KiB");
static_assert(((LAC_ARENA_CHUNK_SIZE) % sizeof(void*)) == 0u, "Arena chunk size must be word aligned");
static_assert((LAC_ARENA_SLICE_EXTEND_RATIO) > 1.0, "Slice extend ratio must be > 1");
static_assert((LAC_ARENA_REGISTRY_RECENT_WINDOW) >= 1u, "Registry recent window must be >= 1");

namespace lac::memory
{
    // clang-format off
    constexpr usize  CompiledChunkSize() noexcept        { return static_cast<usize>(LAC_ARENA_CHUNK_SIZE); }
    constexpr usize  CompiledMaxPooledChunks() noexcept  { return static_cast<usize>(LAC_ARENA_MAX_POOLED_CHUNKS); }
    constexpr usize  CompiledMaxPooledArenas() noexcept  { return static_cast<usize>(LAC_ARENA_MAX_POOLED_ARENAS); }
    constexpr usize  CompiledMaxNewInDebug() noexcept    { return static_cast<usize>(LAC_ARENA_MAX_NEW_IN_DEBUG); }
    constexpr double CompiledSliceExtendRatio() noexcept { return static_cast<double>(LAC_ARENA_SLICE_EXTEND_RATIO); }
    constexpr bool   CompiledDebug() noexcept            { return LAC_ARENA_DEBUG != 0; }
    constexpr bool   CompiledDisabled() noexcept         { return LAC_ARENA_DISABLED != 0; }
    // clang-format on

    // =========================================================================
    // ArenaConfig: what the caller asks for.
    //   Numeric fields left at 0 defer to the environment, then to the macro.
    //   Toggle fields left at Default behave the same way.
    // =========================================================================
    struct ArenaConfig
    {
        usize  chunk_size = 0;
        usize  max_pooled_chunks = 0;
        usize  max_pooled_arenas = 0;
        usize  max_new_arenas_in_debug = 0;
        double slice_extend_ratio = 0.0;

        Toggle debug_mode = Toggle::Default;
        Toggle disabled = Toggle::Default;

        // API-only knobs (no environment layer).
        usize max_debug_roots = LAC_ARENA_MAX_DEBUG_ROOTS;
        usize registry_strong_unique_prefix = LAC_ARENA_REGISTRY_STRONG_PREFIX;
        usize registry_recent_window = LAC_ARENA_REGISTRY_RECENT_WINDOW;

        // Fill used chunk bytes on reset so stale reads show a recognisable pattern.
        bool poison_on_reset = false;
        u8   poison_byte = 0xDD;

        // Chunks allocated eagerly when the pool is constructed.
        usize reserve_chunks = 0;
    };

    // =========================================================================
    // ArenaSettings: the effective values a pool and its arenas run with.
    // =========================================================================
    struct ArenaSettings
    {
        usize  chunkSize = CompiledChunkSize();
        usize  maxPooledChunks = CompiledMaxPooledChunks();
        usize  maxPooledArenas = CompiledMaxPooledArenas();
        usize  maxNewArenasInDebug = CompiledMaxNewInDebug();
        double sliceExtendRatio = CompiledSliceExtendRatio();
        bool   debug = CompiledDebug();
        bool   disabled = CompiledDisabled();
        usize  maxDebugRoots = LAC_ARENA_MAX_DEBUG_ROOTS;
        usize  registryStrongPrefix = LAC_ARENA_REGISTRY_STRONG_PREFIX;
        usize  registryRecentWindow = LAC_ARENA_REGISTRY_RECENT_WINDOW;
        bool   poisonOnReset = false;
        u8     poisonByte = 0xDD;
        usize  reserveChunks = 0;
    };

    enum class OverrideSource : std::uint8_t
    {
        Macro,
        Environment,
        Api
    };

    [[nodiscard]] constexpr const char* ToString(OverrideSource source) noexcept
    {
        switch (source)
        {
        case OverrideSource::Macro:       return "macro";
        case OverrideSource::Environment: return "env";
        case OverrideSource::Api:         return "api";
        default:                          return "unknown";
        }
    }

    // Outcome of resolving one tunable across the three layers.
    template <typename T>
    struct OverrideResult
    {
        T value{};
        OverrideSource source{ OverrideSource::Macro };
        bool envInvalid{ false };
        bool apiInvalid{ false };
        T apiRaw{};
    };

    struct ArenaConfigResolution
    {
        ArenaSettings settings{};
        OverrideResult<usize>  chunkSize{};
        OverrideResult<usize>  maxPooledChunks{};
        OverrideResult<usize>  maxPooledArenas{};
        OverrideResult<usize>  maxNewArenasInDebug{};
        OverrideResult<double> sliceExtendRatio{};
        OverrideResult<bool>   debug{};
        OverrideResult<bool>   disabled{};
        bool registryWindowClamped{ false };
    };

    static constexpr const char* kEnvChunkSize        = "LAC_ARENA_CHUNK_SIZE";
    static constexpr const char* kEnvMaxPooledChunks  = "LAC_ARENA_MAX_POOLED_CHUNKS";
    static constexpr const char* kEnvMaxPooledArenas  = "LAC_ARENA_MAX_POOLED_ARENAS";
    static constexpr const char* kEnvMaxNewInDebug    = "LAC_ARENA_MAX_NEW_IN_DEBUG";
    static constexpr const char* kEnvSliceExtendRatio = "LAC_ARENA_SLICE_EXTEND_RATIO";
    static constexpr const char* kEnvDebug            = "LAC_ARENA_DEBUG";
    static constexpr const char* kEnvDisabled         = "LAC_ARENA_DISABLED";

    namespace detail
    {
        // ---
        // Purpose : Parse an unsigned decimal with full-string validation.
        // Contract: Returns false on empty input, trailing garbage, overflow or out-of-range values.
        // ---
        [[nodiscard]] bool TryParseUSize(const char* text, usize minValue, usize maxValue, usize& out) noexcept;
        [[nodiscard]] bool TryParseRatio(const char* text, double& out) noexcept;
        [[nodiscard]] bool TryParseBool(const char* text, bool& out) noexcept;
        [[nodiscard]] const char* GetEnvNoWarn(const char* name) noexcept;

        // Slow-path log helpers (ArenaConfig.Logging.cpp).
        void LogResolveWarnings(const ArenaConfigResolution& resolution) noexcept;
        void LogResolveSummary(const ArenaConfigResolution& resolution) noexcept;
    }

    // ---
    // Purpose : Resolve the effective settings from the API struct, the environment and the macros.
    // Contract: Never fails; every invalid input falls back and is flagged in the returned resolution.
    // Notes   : Pure apart from reading the environment; logging is left to the caller.
    // ---
    [[nodiscard]] ArenaConfigResolution ResolveArenaConfig(const ArenaConfig& cfg) noexcept;

    // ---
    // Purpose : Resolve and log in one call. ArenaPool uses this at construction.
    // ---
    [[nodiscard]] ArenaSettings ResolveAndLogArenaConfig(const ArenaConfig& cfg) noexcept;

} // namespace lac::memory
