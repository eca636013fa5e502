#pragma once

#include "Platform.hpp"
#include "Types.hpp"

SW_DISABLE_WARNINGS_PUSH
#include <spdlog/spdlog.h>
SW_DISABLE_WARNINGS_POP

#include <memory>

// ============================================================================
// Logging
// One "SplitWindow" spdlog logger: colored stderr plus an optional file.
// The library logs subrange choices and IO failures through SW_LOG_*;
// the command-line tool decides the level from [log] in its config.
// ============================================================================

namespace splitwindow {

/// Static logging facade. Every call is a no-op until Init() has been called.
class SW_API Log {
public:
    /// Log severity levels
    enum class Level {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Critical,
        Off
    };

    /// (Re)create the logger
    /// @param logFilePath Log file, truncated on open; nullptr or "" = stderr only
    /// @param level Minimum severity level to display
    static void Init(const char* logFilePath = "splitwindow.log", Level level = Level::Info);

    /// Shutdown the logging system (flushes buffers)
    static void Shutdown();

    static void SetLevel(Level level);
    static Level GetLevel();

    /// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
    static Optional<Level> ParseLevel(StringView name);

    // fmt-style format strings, checked at compile time

    template<typename... Args>
    static void Trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (s_Logger) s_Logger->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (s_Logger) s_Logger->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (s_Logger) s_Logger->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (s_Logger) s_Logger->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (s_Logger) s_Logger->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (s_Logger) s_Logger->critical(fmt, std::forward<Args>(args)...);
    }

private:
    static std::shared_ptr<spdlog::logger> s_Logger;
};

} // namespace splitwindow

// ============================================================================
// Convenience Macros
// ============================================================================

#define SW_LOG_TRACE(...)    ::splitwindow::Log::Trace(__VA_ARGS__)
#define SW_LOG_DEBUG(...)    ::splitwindow::Log::Debug(__VA_ARGS__)
#define SW_LOG_INFO(...)     ::splitwindow::Log::Info(__VA_ARGS__)
#define SW_LOG_WARN(...)     ::splitwindow::Log::Warn(__VA_ARGS__)
#define SW_LOG_ERROR(...)    ::splitwindow::Log::Error(__VA_ARGS__)
#define SW_LOG_CRITICAL(...) ::splitwindow::Log::Critical(__VA_ARGS__)
