// ============================================================================
// Lac - tests/ArenaSmokes/ArenaSmokes_main.cpp
// ----------------------------------------------------------------------------
// Purpose : Aggregate executable that runs the arena smoke helpers.
// Contract: No exceptions; deterministic ordering; returns 0 on success.
// Notes   : Assumes Run*Smoke helpers are linked from their respective TUs.
//           Fatal-path scenarios fork, so expect "[F]" lines from children.
// ============================================================================

#include <cstdio>

int RunPoolSmoke();
int RunChunkPoolSmoke();
int RunExternalRegistrySmoke();
int RunArenaConfigSmoke();
int RunArenaAllocSmoke();
int RunArenaTypedSmoke();
int RunArenaCheckerSmoke();
int RunArenaPoolSmoke();
int RunOomPolicySmoke();

namespace
{
    struct SmokeEntry
    {
        const char* name;
        int (*func)();
    };
}

int main()
{
    const SmokeEntry smokes[] = {
        {"Pool", &RunPoolSmoke},
        {"ChunkPool", &RunChunkPoolSmoke},
        {"ExternalRegistry", &RunExternalRegistrySmoke},
        {"ArenaConfig", &RunArenaConfigSmoke},
        {"ArenaAlloc", &RunArenaAllocSmoke},
        {"ArenaTyped", &RunArenaTypedSmoke},
        {"ArenaChecker", &RunArenaCheckerSmoke},
        {"ArenaPool", &RunArenaPoolSmoke},
        {"OomPolicy", &RunOomPolicySmoke},
    };

    int failures = 0;

    for (const SmokeEntry& entry : smokes)
    {
        const int code = entry.func ? entry.func() : 1;
        if (code != 0)
        {
            ++failures;
        }

        std::printf("%s: %s (code=%d)\n", entry.name, (code == 0) ? "OK" : "FAIL", code);
        std::fflush(stdout);
    }

    return (failures == 0) ? 0 : 1;
}
