// ============================================================================
// Lac - Lac/Memory/ArenaConfig.cpp
// ----------------------------------------------------------------------------
// Purpose : Resolve ArenaConfig (API) + environment + compile-time macros into
//           the ArenaSettings a pool runs with.
// Contract: Every function is noexcept. The environment is read once per
//           resolution; results carry enough information for the logging TU
//           to explain each fallback.
// Notes   : Parsing uses strtoull/strtod with errno and end-pointer checks;
//           partially numeric strings ("12k") are rejected.
// ============================================================================

#include "Lac/Memory/ArenaConfig.hpp"
#include "Lac/Memory/Alignment.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace lac::memory
{
namespace detail
{

bool TryParseUSize(const char* text, usize minValue, usize maxValue, usize& out) noexcept
{
    if (!text || *text == '\0' || *text == '-')
    {
        return false;
    }

    errno = 0;
    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(text, &end, 10);
    if ((errno != 0) || (end == text) || (*end != '\0'))
    {
        return false;
    }

    if (parsed < minValue || parsed > maxValue)
    {
        return false;
    }

    out = static_cast<usize>(parsed);
    return true;
}

bool TryParseRatio(const char* text, double& out) noexcept
{
    if (!text || *text == '\0')
    {
        return false;
    }

    errno = 0;
    char* end = nullptr;
    const double parsed = std::strtod(text, &end);
    if ((errno != 0) || (end == text) || (*end != '\0'))
    {
        return false;
    }

    // Ratios at or below 1 would never grow a full slice.
    if (!(parsed > 1.0) || parsed > 16.0)
    {
        return false;
    }

    out = parsed;
    return true;
}

bool TryParseBool(const char* text, bool& out) noexcept
{
    if (!text)
    {
        return false;
    }
    if (std::strcmp(text, "1") == 0 || std::strcmp(text, "true") == 0 || std::strcmp(text, "on") == 0)
    {
        out = true;
        return true;
    }
    if (std::strcmp(text, "0") == 0 || std::strcmp(text, "false") == 0 || std::strcmp(text, "off") == 0)
    {
        out = false;
        return true;
    }
    return false;
}

// Purpose : Retrieve environment variable without surfacing MSVC C4996 deprecation as an error.
// Contract: Returns pointer owned by C runtime; do not free; name must be null-terminated.
const char* GetEnvNoWarn(const char* name) noexcept
{
#if defined(_MSC_VER)
#  pragma warning(push)
#  pragma warning(disable:4996)
#endif
    return std::getenv(name);
#if defined(_MSC_VER)
#  pragma warning(pop)
#endif
}

namespace
{
    [[nodiscard]] bool IsValidChunkSize(usize value) noexcept
    {
        return value >= 4096u && ::lac::core::IsAligned<usize>(value, kWordSize);
    }

    [[nodiscard]] OverrideResult<usize> ResolveCount(const char* envName,
        usize macroValue,
        usize apiValue,
        usize minValue,
        bool (*validate)(usize) noexcept) noexcept
    {
        OverrideResult<usize> result{};
        result.value = macroValue;
        result.source = OverrideSource::Macro;

        const char* envText = GetEnvNoWarn(envName);
        if (envText && *envText)
        {
            usize parsed = 0;
            if (TryParseUSize(envText, minValue, (std::numeric_limits<u32>::max)(), parsed)
                && (!validate || validate(parsed)))
            {
                result.value = parsed;
                result.source = OverrideSource::Environment;
            }
            else
            {
                result.envInvalid = true;
            }
        }

        if (apiValue != 0u)
        {
            result.apiRaw = apiValue;
            if (apiValue >= minValue && (!validate || validate(apiValue)))
            {
                result.value = apiValue;
                result.source = OverrideSource::Api;
            }
            else
            {
                result.apiInvalid = true;
            }
        }

        return result;
    }

    [[nodiscard]] OverrideResult<double> ResolveRatio(double apiValue) noexcept
    {
        OverrideResult<double> result{};
        result.value = CompiledSliceExtendRatio();
        result.source = OverrideSource::Macro;

        const char* envText = GetEnvNoWarn(kEnvSliceExtendRatio);
        if (envText && *envText)
        {
            double parsed = 0.0;
            if (TryParseRatio(envText, parsed))
            {
                result.value = parsed;
                result.source = OverrideSource::Environment;
            }
            else
            {
                result.envInvalid = true;
            }
        }

        if (apiValue != 0.0)
        {
            result.apiRaw = apiValue;
            if (apiValue > 1.0 && apiValue <= 16.0)
            {
                result.value = apiValue;
                result.source = OverrideSource::Api;
            }
            else
            {
                result.apiInvalid = true;
            }
        }

        return result;
    }

    [[nodiscard]] OverrideResult<bool> ResolveSwitch(const char* envName, bool macroValue, Toggle apiValue) noexcept
    {
        OverrideResult<bool> result{};
        result.value = macroValue;
        result.source = OverrideSource::Macro;

        const char* envText = GetEnvNoWarn(envName);
        if (envText && *envText)
        {
            bool parsed = false;
            if (TryParseBool(envText, parsed))
            {
                result.value = parsed;
                result.source = OverrideSource::Environment;
            }
            else
            {
                result.envInvalid = true;
            }
        }

        if (apiValue != Toggle::Default)
        {
            result.value = (apiValue == Toggle::On);
            result.apiRaw = result.value;
            result.source = OverrideSource::Api;
        }

        return result;
    }
} // namespace

} // namespace detail

ArenaConfigResolution ResolveArenaConfig(const ArenaConfig& cfg) noexcept
{
    ArenaConfigResolution r{};

    r.chunkSize = detail::ResolveCount(kEnvChunkSize, CompiledChunkSize(), cfg.chunk_size, 4096u,
        &detail::IsValidChunkSize);
    r.maxPooledChunks = detail::ResolveCount(kEnvMaxPooledChunks, CompiledMaxPooledChunks(), cfg.max_pooled_chunks, 1u, nullptr);
    r.maxPooledArenas = detail::ResolveCount(kEnvMaxPooledArenas, CompiledMaxPooledArenas(), cfg.max_pooled_arenas, 1u, nullptr);
    r.maxNewArenasInDebug = detail::ResolveCount(kEnvMaxNewInDebug, CompiledMaxNewInDebug(), cfg.max_new_arenas_in_debug, 1u, nullptr);
    r.sliceExtendRatio = detail::ResolveRatio(cfg.slice_extend_ratio);
    r.debug = detail::ResolveSwitch(kEnvDebug, CompiledDebug(), cfg.debug_mode);
    r.disabled = detail::ResolveSwitch(kEnvDisabled, CompiledDisabled(), cfg.disabled);

    ArenaSettings& s = r.settings;
    s.chunkSize = r.chunkSize.value;
    s.maxPooledChunks = r.maxPooledChunks.value;
    s.maxPooledArenas = r.maxPooledArenas.value;
    s.maxNewArenasInDebug = r.maxNewArenasInDebug.value;
    s.sliceExtendRatio = r.sliceExtendRatio.value;
    s.debug = r.debug.value;
    s.disabled = r.disabled.value;
    s.maxDebugRoots = cfg.max_debug_roots;
    s.registryStrongPrefix = cfg.registry_strong_unique_prefix;
    s.registryRecentWindow = cfg.registry_recent_window;
    if (s.registryRecentWindow == 0u)
    {
        s.registryRecentWindow = 1u;
        r.registryWindowClamped = true;
    }
    s.poisonOnReset = cfg.poison_on_reset;
    s.poisonByte = cfg.poison_byte;
    s.reserveChunks = cfg.reserve_chunks;

    return r;
}

ArenaSettings ResolveAndLogArenaConfig(const ArenaConfig& cfg) noexcept
{
    const ArenaConfigResolution resolution = ResolveArenaConfig(cfg);
    detail::LogResolveWarnings(resolution);
    detail::LogResolveSummary(resolution);
    return resolution.settings;
}

} // namespace lac::memory
