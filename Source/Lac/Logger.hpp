#pragma once


// =============================
// Lac - Logger.hpp (C++23, minimal but solid)
// =============================
// Goals
//  - Always-safe to include (header-only, single formatting dependency)
//  - {fmt} backend (fmt::format_string checks placeholders at compile time)
//  - Zero/low overhead when disabled (compile-time switches)
//  - Simple runtime min-level filter and optional category filter
//  - Thread-safe emission (coarse-grained mutex around a single print)
//
// Non-goals (for now)
//  - Async logging, ring buffers, files, colors, sinks fan-out
//  - Structured logs (JSON)
//
// Notes
//  - Categories are plain string literals (const char*). Keep them short (e.g., "Arena", "Arena.Check").
//  - Fatal prints, flushes stderr and aborts. Every invariant break in the arena goes through it.

#include <cstdint>
#include <atomic>
#include <mutex>
#include <exception>
#include <string_view>
#include <cstdio>       // std::FILE, stdout/stderr
#include <cstdlib>      // std::abort

#include <fmt/format.h>

#ifndef LAC_ENABLE_LOGGING
#  define LAC_ENABLE_LOGGING 1
#endif
#ifndef LAC_ENABLE_LOG_ASSERT
#  define LAC_ENABLE_LOG_ASSERT 1
#endif

namespace lac::core {

    enum class LogLevel : std::uint8_t {
        Disabled = 0,
        Fatal = 1,
        Error = 2,
        Warn = 3,
        Info = 4,
        Verbose = 5,
        // NOTE: higher number == more chatty
        // MinLevel policy: a message is emitted if (level <= MinLevel).
    };

    struct LoggerConfig {
        std::atomic<LogLevel> MinLevel{ LogLevel::Info };
        // If non-null, only messages whose category equals this filter are printed.
        // Must stay a stable C-string literal (e.g., "Arena").
        std::atomic<const char*> CategoryEqualsFilter{ nullptr };
    };

    class Logger final {
    public:
        static Logger& Get() noexcept {
            static Logger g;
            return g;
        }

        static void SetMinLevel(LogLevel lvl) noexcept { Get().mCfg.MinLevel.store(lvl, std::memory_order_relaxed); }
        static LogLevel GetMinLevel() noexcept { return Get().mCfg.MinLevel.load(std::memory_order_relaxed); }
        static void SetCategoryEqualsFilter(const char* cat) noexcept {
            Get().mCfg.CategoryEqualsFilter.store(cat, std::memory_order_relaxed);
        }

        // Public check to short-circuit expensive logging
        static bool IsEnabled(LogLevel lvl, const char* category) noexcept {
            return ShouldEmit(lvl, category);
        }

        // ----------------------
        // Level-specific helpers
        // ----------------------
        template <class... Args>
        static void Info(const char* category, fmt::format_string<Args...> format, Args&&... args) noexcept {
            Print(LogLevel::Info, category, stdout, format, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        static void Warn(const char* category, fmt::format_string<Args...> format, Args&&... args) noexcept {
            Print(LogLevel::Warn, category, stderr, format, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        static void Error(const char* category, fmt::format_string<Args...> format, Args&&... args) noexcept {
            Print(LogLevel::Error, category, stderr, format, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        [[noreturn]] static void Fatal(const char* category, fmt::format_string<Args...> format, Args&&... args) noexcept {
            Print(LogLevel::Fatal, category, stderr, format, static_cast<Args&&>(args)...);
            std::fflush(stderr);
            std::abort();
        }
        template <class... Args>
        static void Verbose(const char* category, fmt::format_string<Args...> format, Args&&... args) noexcept {
            Print(LogLevel::Verbose, category, stdout, format, static_cast<Args&&>(args)...);
        }

    private:
        Logger() = default;

        static bool ShouldEmit(LogLevel lvl, const char* category) noexcept {
            Logger& self = Get();
            if (lvl == LogLevel::Disabled) return false;
            // Fatal is never filtered: the process is about to die and the reason must reach stderr.
            if (lvl == LogLevel::Fatal) return true;
            if (lvl > self.mCfg.MinLevel.load(std::memory_order_relaxed)) return false;
            const char* filter = self.mCfg.CategoryEqualsFilter.load(std::memory_order_relaxed);
            if (filter) {
                if (!category) return false; // filter active => category is required
                if (std::string_view(filter) != category) return false;
            }
            return true;
        }

        template <class... Args>
        static void Print(LogLevel lvl, const char* category, std::FILE* stream, fmt::format_string<Args...> format, Args&&... args) noexcept {
            if (!ShouldEmit(lvl, category)) return;
            Logger& self = Get();
            const char* lvlStr = ToShortLevel(lvl);
            std::scoped_lock lock(self.mMutex);
            try {
                if (category) {
                    fmt::print(stream, "[{}][{}] ", lvlStr, category);
                }
                else {
                    fmt::print(stream, "[{}] ", lvlStr);
                }
                fmt::print(stream, format, static_cast<Args&&>(args)...);
                std::fputc('\n', stream);
            }
            catch (const std::exception& e) {
                // Formatting or I/O failure: keep the line readable instead of losing it.
                std::fputs("<log format error: ", stream);
                std::fputs(e.what(), stream);
                std::fputs(">\n", stream);
            }
        }

        static const char* ToShortLevel(LogLevel lvl) noexcept {
            switch (lvl) {
            case LogLevel::Fatal:   return "F";
            case LogLevel::Error:   return "E";
            case LogLevel::Warn:    return "W";
            case LogLevel::Info:    return "I";
            case LogLevel::Verbose: return "V";
            default:                return "-";
            }
        }

    private:
        std::mutex mMutex{};
        LoggerConfig mCfg{};
    };

} // namespace lac::core

// ----------------------
// Public log macros (single evaluation of Category)
// ----------------------
#if LAC_ENABLE_LOGGING
#define LAC_LOG_VERBOSE(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::lac::core::Logger::IsEnabled(::lac::core::LogLevel::Verbose, _cat)) { \
            ::lac::core::Logger::Verbose(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define LAC_LOG_INFO(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::lac::core::Logger::IsEnabled(::lac::core::LogLevel::Info, _cat)) { \
            ::lac::core::Logger::Info(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define LAC_LOG_WARNING(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::lac::core::Logger::IsEnabled(::lac::core::LogLevel::Warn, _cat)) { \
            ::lac::core::Logger::Warn(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define LAC_LOG_ERROR(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::lac::core::Logger::IsEnabled(::lac::core::LogLevel::Error, _cat)) { \
            ::lac::core::Logger::Error(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)
#else
#define LAC_LOG_VERBOSE(Category, Fmt, ...)  ((void)0)
#define LAC_LOG_INFO(Category, Fmt, ...)     ((void)0)
#define LAC_LOG_WARNING(Category, Fmt, ...)  ((void)0)
#define LAC_LOG_ERROR(Category, Fmt, ...)    ((void)0)
#endif

// Fatal stays live even with logging compiled out: it is the abort path.
#define LAC_LOG_FATAL(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        ::lac::core::Logger::Fatal(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
    } while (0)

// ----------------------
// Assert macro
// ----------------------
#if LAC_ENABLE_LOG_ASSERT
#ifndef LAC_ASSERT
#include <source_location>

// Argument-counting helper to choose ASSERT_1 or ASSERT_2
#define LAC_EXPAND(x) x
#define LAC_GET_MACRO(_1,_2,NAME,...) NAME

// 1-arg form: LAC_ASSERT(Expr)
#define LAC_ASSERT_1(Expr) do { \
            if (!(Expr)) { \
                const auto loc = std::source_location::current(); \
                ::lac::core::Logger::Error("Assert", "{} ({}:{}): assertion failed: {}", \
                    loc.function_name(), loc.file_name(), loc.line(), #Expr); \
            } \
        } while(0)

// 2-arg form: LAC_ASSERT(Expr, Msg)
#define LAC_ASSERT_2(Expr, Msg) do { \
            if (!(Expr)) { \
                const auto loc = std::source_location::current(); \
                ::lac::core::Logger::Error("Assert", "{} ({}:{}): {}", \
                    loc.function_name(), loc.file_name(), loc.line(), Msg); \
            } \
        } while(0)

// Dispatcher that supports both 1-arg and 2-arg calls
#define LAC_ASSERT(...) \
            LAC_EXPAND(LAC_GET_MACRO(__VA_ARGS__, LAC_ASSERT_2, LAC_ASSERT_1)(__VA_ARGS__))

#endif
#else
#ifndef LAC_ASSERT
#define LAC_ASSERT(...) ((void)0)
#endif
#endif
