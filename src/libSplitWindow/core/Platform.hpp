#pragma once

// ============================================================================
// Platform Detection
// Platform and compiler identification for the startup log, plus the
// export and third-party warning macros used by every header
// ============================================================================

// Platform identification macros (defined by CMake)
#if defined(SPLITWINDOW_PLATFORM_WINDOWS)
    #define SW_WINDOWS 1
#elif defined(SPLITWINDOW_PLATFORM_LINUX)
    #define SW_LINUX 1
#elif defined(SPLITWINDOW_PLATFORM_MACOS)
    #define SW_MACOS 1
#else
    #error "Unsupported platform! SplitWindow requires Windows, Linux, or macOS."
#endif

// Compiler detection
#if defined(_MSC_VER)
    #define SW_COMPILER_MSVC 1
#elif defined(__clang__)
    #define SW_COMPILER_CLANG 1
#elif defined(__GNUC__)
    #define SW_COMPILER_GCC 1
#else
    #error "Unsupported compiler! C++20 support required."
#endif

// libSplitWindow is built static; only ELF/Mach-O need explicit visibility
#if defined(SW_WINDOWS)
    #define SW_API
#else
    #define SW_API __attribute__((visibility("default")))
#endif

// Silence warnings raised inside spdlog, fmt and toml++ headers
#if defined(SW_COMPILER_MSVC)
    #define SW_DISABLE_WARNINGS_PUSH __pragma(warning(push, 0))
    #define SW_DISABLE_WARNINGS_POP  __pragma(warning(pop))
#else
    #define SW_DISABLE_WARNINGS_PUSH \
        _Pragma("GCC diagnostic push") \
        _Pragma("GCC diagnostic ignored \"-Wall\"") \
        _Pragma("GCC diagnostic ignored \"-Wextra\"")
    #define SW_DISABLE_WARNINGS_POP _Pragma("GCC diagnostic pop")
#endif

namespace splitwindow {

constexpr const char* GetPlatformName() {
    #if defined(SW_WINDOWS)
        return "Windows";
    #elif defined(SW_MACOS)
        return "macOS";
    #else
        return "Linux";
    #endif
}

constexpr const char* GetCompilerName() {
    #if defined(SW_COMPILER_MSVC)
        return "MSVC";
    #elif defined(SW_COMPILER_CLANG)
        return "Clang";
    #else
        return "GCC";
    #endif
}

constexpr const char* GetBuildConfig() {
    #if defined(NDEBUG)
        return "Release";
    #else
        return "Debug";
    #endif
}

} // namespace splitwindow
