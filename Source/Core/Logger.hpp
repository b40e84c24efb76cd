#pragma once


// =============================
// XComponentGuard - Logger.hpp (C++23, minimal but solid)
// =============================
// Goals
//  - Always-safe to include (no heavy deps, header-only)
//  - C++23 std::format_string front end, checked at compile time
//  - Pluggable sink: the host installs one at start-up; the default sink
//    is null and emits nothing
//  - Zero overhead when disabled (XCG_ENABLE_LOGGING=0 turns macros into no-ops)
//  - Simple runtime min-level filter and optional category filter
//  - Thread-safe emission (coarse-grained mutex around a single sink call)
//  - No dynamic allocations: std::format_to_n writes into a bounded stack buffer
//
// Non-goals (for now)
//  - Async logging, ring buffers, files, colors, sinks fan-out
//  - Structured logs (JSON) or source-location rich metadata
//
// Notes
//  - Categories are plain string literals (const char*). Keep them short (e.g., "XComponent").
//  - Messages longer than XCG_LOG_BUFFER_SIZE bytes are truncated.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>       // std::FILE, stdout/stderr
#include <cstdlib>      // std::abort
#include <format>       // std::format_string, std::format_to_n
#include <mutex>
#include <string_view>

#ifndef XCG_ENABLE_LOGGING
#  define XCG_ENABLE_LOGGING 1
#endif
#ifndef XCG_LOG_BUFFER_SIZE
#  define XCG_LOG_BUFFER_SIZE 512
#endif

namespace xcg::core {

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

    // Sink contract: called with the logger mutex held; must not log re-entrantly.
    // `message` is only valid for the duration of the call.
    using LogSinkFunc = void (*)(void* user, LogLevel level, const char* category, std::string_view message) noexcept;

    struct LogSink {
        LogSinkFunc func = nullptr; // nullptr == null sink (drop everything)
        void*       user = nullptr; // Non-owning, forwarded to func.
    };

    struct LoggerConfig {
        std::atomic<LogLevel> MinLevel{ LogLevel::Error };
        // If non-null, only messages whose category equals this filter are emitted.
        // Keep nullptr to accept all categories.
        // Must stay a stable C-string literal (e.g., "XComponent").
        std::atomic<const char*> CategoryEqualsFilter{ nullptr };
    };

    [[nodiscard]] inline const char* ToShortLevel(LogLevel lvl) noexcept {
        switch (lvl) {
        case LogLevel::Fatal:   return "F";
        case LogLevel::Error:   return "E";
        case LogLevel::Warn:    return "W";
        case LogLevel::Info:    return "I";
        case LogLevel::Verbose: return "V";
        default:                return "-";
        }
    }

    namespace detail {
        inline void ConsoleSinkWrite(void*, LogLevel lvl, const char* category, std::string_view message) noexcept {
            std::FILE* stream = (lvl <= LogLevel::Warn) ? stderr : stdout;
            const int size = static_cast<int>(message.size());
            if (category) {
                std::fprintf(stream, "[%s][%s] %.*s\n", ToShortLevel(lvl), category, size, message.data());
            }
            else {
                std::fprintf(stream, "[%s] %.*s\n", ToShortLevel(lvl), size, message.data());
            }
        }
    } // namespace detail

    // Writes "[E][Category] message" lines; Fatal/Error/Warn go to stderr.
    [[nodiscard]] inline LogSink ConsoleLogSink() noexcept {
        return LogSink{ &detail::ConsoleSinkWrite, nullptr };
    }

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

        static void SetSink(LogSink sink) noexcept {
            Logger& self = Get();
            std::scoped_lock lock(self.mMutex);
            self.mSink = sink;
            self.mHasSink.store(sink.func != nullptr, std::memory_order_release);
        }

        static LogSink GetSink() noexcept {
            Logger& self = Get();
            std::scoped_lock lock(self.mMutex);
            return self.mSink;
        }

        // Public check to short-circuit expensive logging
        static bool IsEnabled(LogLevel lvl, const char* category) noexcept {
            return ShouldEmit(lvl, category);
        }

        // ----------------------
        // Level-specific helpers
        // ----------------------
        template <class... Args>
        static void Info(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Info, category, fmt, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        static void Warn(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Warn, category, fmt, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        static void Error(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Error, category, fmt, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        [[noreturn]] static void Fatal(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Fatal, category, fmt, static_cast<Args&&>(args)...);
            std::fflush(stderr);
            std::abort();
        }
        template <class... Args>
        static void Verbose(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Verbose, category, fmt, static_cast<Args&&>(args)...);
        }

        // Raw message overloads (no fmt)
        static void Info(const char* category, std::string_view msg) noexcept { PrintRaw(LogLevel::Info, category, msg); }
        static void Warn(const char* category, std::string_view msg) noexcept { PrintRaw(LogLevel::Warn, category, msg); }
        static void Error(const char* category, std::string_view msg) noexcept { PrintRaw(LogLevel::Error, category, msg); }
        [[noreturn]] static void Fatal(const char* category, std::string_view msg) noexcept {
            PrintRaw(LogLevel::Fatal, category, msg);
            std::fflush(stderr);
            std::abort();
        }
        static void Verbose(const char* category, std::string_view msg) noexcept { PrintRaw(LogLevel::Verbose, category, msg); }

        // Generic entry (level chosen by caller).
        template <class... Args>
        static void Log(LogLevel lvl, const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(lvl, category, fmt, static_cast<Args&&>(args)...);
        }

    private:
        Logger() = default;

        static bool ShouldEmit(LogLevel lvl, const char* category) noexcept {
            Logger& self = Get();
            if (lvl == LogLevel::Disabled) return false;
            if (!self.mHasSink.load(std::memory_order_acquire)) return false;
            if (lvl > self.mCfg.MinLevel.load(std::memory_order_relaxed)) return false;
            const char* filter = self.mCfg.CategoryEqualsFilter.load(std::memory_order_relaxed);
            if (filter) {
                if (!category) return false; // filter active => category is required
                if (std::string_view(filter) != category) return false;
            }
            return true;
        }

        template <class... Args>
        static void Print(LogLevel lvl, const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            if (!ShouldEmit(lvl, category)) return;

            char buffer[XCG_LOG_BUFFER_SIZE];
            std::size_t length = 0;
            try {
                const auto result = std::format_to_n(buffer, static_cast<std::ptrdiff_t>(sizeof(buffer)), fmt, static_cast<Args&&>(args)...);
                length = (result.size < static_cast<std::ptrdiff_t>(sizeof(buffer)))
                    ? static_cast<std::size_t>(result.size)
                    : sizeof(buffer);
            }
            catch (const std::format_error&) {
                // Runtime-only format failure (e.g. dynamic width): emit the pattern itself.
                PrintRaw(lvl, category, fmt.get());
                return;
            }
            Emit(lvl, category, std::string_view(buffer, length));
        }

        static void PrintRaw(LogLevel lvl, const char* category, std::string_view msg) noexcept {
            if (!ShouldEmit(lvl, category)) return;
            Emit(lvl, category, msg.substr(0, XCG_LOG_BUFFER_SIZE));
        }

        static void Emit(LogLevel lvl, const char* category, std::string_view msg) noexcept {
            Logger& self = Get();
            std::scoped_lock lock(self.mMutex);
            if (self.mSink.func) {
                self.mSink.func(self.mSink.user, lvl, category, msg);
            }
        }

    private:
        std::mutex mMutex{};
        LoggerConfig mCfg{};
        LogSink mSink{};                    // Guarded by mMutex.
        std::atomic<bool> mHasSink{ false };
    };

} // namespace xcg::core

// ----------------------
// Public log macros (single evaluation of Category)
// ----------------------
#if XCG_ENABLE_LOGGING
#define XCG_LOG_VERBOSE(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::xcg::core::Logger::IsEnabled(::xcg::core::LogLevel::Verbose, _cat)) { \
            ::xcg::core::Logger::Verbose(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define XCG_LOG_INFO(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::xcg::core::Logger::IsEnabled(::xcg::core::LogLevel::Info, _cat)) { \
            ::xcg::core::Logger::Info(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define XCG_LOG_WARNING(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::xcg::core::Logger::IsEnabled(::xcg::core::LogLevel::Warn, _cat)) { \
            ::xcg::core::Logger::Warn(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define XCG_LOG_ERROR(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::xcg::core::Logger::IsEnabled(::xcg::core::LogLevel::Error, _cat)) { \
            ::xcg::core::Logger::Error(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define XCG_LOG_FATAL(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        ::xcg::core::Logger::Fatal(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
    } while (0)
#else
#define XCG_LOG_VERBOSE(Category, Fmt, ...)  ((void)0)
#define XCG_LOG_INFO(Category, Fmt, ...)     ((void)0)
#define XCG_LOG_WARNING(Category, Fmt, ...)  ((void)0)
#define XCG_LOG_ERROR(Category, Fmt, ...)    ((void)0)
#define XCG_LOG_FATAL(Category, Fmt, ...)    ::std::abort()
#endif
