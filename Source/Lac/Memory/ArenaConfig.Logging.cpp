// ============================================================================
// Lac - Lac/Memory/ArenaConfig.Logging.cpp
// ----------------------------------------------------------------------------
// Purpose : Implement the slow-path formatting helpers declared in
//           ArenaConfig.hpp so the resolution code stays free of message text.
// Contract: All functions are `noexcept` and only emit log lines.
// Notes   : Runs once per ArenaPool construction; never on an allocation path.
// ============================================================================

#include "Lac/Memory/ArenaConfig.hpp"

namespace lac
{
namespace memory
{
namespace detail
{

namespace
{
    void WarnCount(const char* envName, const char* apiField, const OverrideResult<usize>& r, const char* rule) noexcept
    {
        if (r.envInvalid)
        {
            LAC_LOG_WARNING(LAC_ARENA_LOG_CATEGORY,
                "Ignoring {} environment override ({}).", envName, rule);
        }
        if (r.apiInvalid)
        {
            LAC_LOG_WARNING(LAC_ARENA_LOG_CATEGORY,
                "Ignoring ArenaConfig::{} override {} ({}).",
                apiField,
                static_cast<unsigned long long>(r.apiRaw),
                rule);
        }
    }
} // namespace

void LogResolveWarnings(const ArenaConfigResolution& resolution) noexcept
{
    WarnCount(kEnvChunkSize, "chunk_size", resolution.chunkSize, "must be >= 4096 and a multiple of the word size");
    WarnCount(kEnvMaxPooledChunks, "max_pooled_chunks", resolution.maxPooledChunks, "must be >= 1");
    WarnCount(kEnvMaxPooledArenas, "max_pooled_arenas", resolution.maxPooledArenas, "must be >= 1");
    WarnCount(kEnvMaxNewInDebug, "max_new_arenas_in_debug", resolution.maxNewArenasInDebug, "must be >= 1");

    if (resolution.sliceExtendRatio.envInvalid)
    {
        LAC_LOG_WARNING(LAC_ARENA_LOG_CATEGORY,
            "Ignoring {} environment override (must be in (1, 16]).", kEnvSliceExtendRatio);
    }
    if (resolution.sliceExtendRatio.apiInvalid)
    {
        LAC_LOG_WARNING(LAC_ARENA_LOG_CATEGORY,
            "Ignoring ArenaConfig::slice_extend_ratio override {} (must be in (1, 16]).",
            resolution.sliceExtendRatio.apiRaw);
    }

    if (resolution.debug.envInvalid)
    {
        LAC_LOG_WARNING(LAC_ARENA_LOG_CATEGORY,
            "Ignoring {} environment override (expected 0/1/true/false/on/off).", kEnvDebug);
    }
    if (resolution.disabled.envInvalid)
    {
        LAC_LOG_WARNING(LAC_ARENA_LOG_CATEGORY,
            "Ignoring {} environment override (expected 0/1/true/false/on/off).", kEnvDisabled);
    }

    if (resolution.registryWindowClamped)
    {
        LAC_LOG_WARNING(LAC_ARENA_LOG_CATEGORY,
            "ArenaConfig::registry_recent_window was 0; clamped to 1.");
    }
}

void LogResolveSummary(const ArenaConfigResolution& resolution) noexcept
{
    const ArenaSettings& s = resolution.settings;

    LAC_LOG_INFO(LAC_ARENA_LOG_CATEGORY,
        "ArenaPool configured (Debug={}, Disabled={})",
        s.debug ? "true" : "false",
        s.disabled ? "true" : "false");
    LAC_LOG_VERBOSE(LAC_ARENA_LOG_CATEGORY,
        "Chunk size={} (source={})",
        static_cast<unsigned long long>(s.chunkSize),
        ToString(resolution.chunkSize.source));
    LAC_LOG_VERBOSE(LAC_ARENA_LOG_CATEGORY,
        "Pooled chunks max={} (source={}), pooled arenas max={} (source={})",
        static_cast<unsigned long long>(s.maxPooledChunks),
        ToString(resolution.maxPooledChunks.source),
        static_cast<unsigned long long>(s.maxPooledArenas),
        ToString(resolution.maxPooledArenas.source));
    LAC_LOG_VERBOSE(LAC_ARENA_LOG_CATEGORY,
        "Debug leak ceiling={} (source={}), slice extend ratio={} (source={})",
        static_cast<unsigned long long>(s.maxNewArenasInDebug),
        ToString(resolution.maxNewArenasInDebug.source),
        s.sliceExtendRatio,
        ToString(resolution.sliceExtendRatio.source));
    LAC_LOG_VERBOSE(LAC_ARENA_LOG_CATEGORY,
        "Debug source={}, kill switch source={}",
        ToString(resolution.debug.source),
        ToString(resolution.disabled.source));
}

} // namespace detail
} // namespace memory
} // namespace lac
