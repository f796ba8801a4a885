#pragma once
// ============================================================================
// Lac - tests/Smoke/Arena/ArenaSmokeCommon.hpp
// ----------------------------------------------------------------------------
// Purpose : Helpers shared by the arena smokes: a small-chunk pool config and
//           a fork-based runner for code paths that must end the process.
// Contract: POSIX only. ExpectDeath() runs `fn` in a child whose stderr is
//           captured; it passes when the child dies from `expectedSignal` and
//           the captured text contains `fragment` (null skips the text check).
// ============================================================================

#include "Lac/Memory/ArenaConfig.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lac::smoke
{
    // Smallest legal chunk so a handful of allocations already spans chunks.
    inline memory::ArenaConfig SmallChunkConfig(memory::Toggle debug = memory::Toggle::Off) noexcept
    {
        memory::ArenaConfig cfg{};
        cfg.chunk_size = 4096u;
        cfg.debug_mode = debug;
        cfg.disabled = memory::Toggle::Off;
        return cfg;
    }

    template <typename Fn>
    bool ExpectDeath(Fn&& fn, int expectedSignal, const char* fragment)
    {
        int fds[2];
        if (::pipe(fds) != 0)
            return false;

        std::fflush(stdout);
        std::fflush(stderr);

        const pid_t pid = ::fork();
        if (pid < 0)
        {
            ::close(fds[0]);
            ::close(fds[1]);
            return false;
        }

        if (pid == 0)
        {
            ::close(fds[0]);
            ::dup2(fds[1], STDERR_FILENO);
            ::close(fds[1]);
            fn();
            std::_Exit(0);
        }

        ::close(fds[1]);
        std::string captured;
        char buffer[512];
        for (;;)
        {
            const ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
            if (n > 0)
            {
                captured.append(buffer, static_cast<std::size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            break;
        }
        ::close(fds[0]);

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0)
        {
            if (errno != EINTR)
                return false;
        }

        if (!WIFSIGNALED(status) || WTERMSIG(status) != expectedSignal)
            return false;
        return fragment == nullptr || captured.find(fragment) != std::string::npos;
    }
} // namespace lac::smoke
