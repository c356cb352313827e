#pragma once

// Build-level macros of clean-ring.
// Everything here is either detection (compiler, OS, build mode) or a thin attribute wrapper.

// =========================================================================================================
// Toolchain and platform
// =========================================================================================================

// exactly one of CR_COMPILER_MSVC / CR_COMPILER_CLANG / CR_COMPILER_GCC
// CR_COMPILER_POSIX is additionally set for the gcc-style frontends
#if defined(_MSC_VER) && !defined(__clang__)
#define CR_COMPILER_MSVC
#elif defined(__clang__)
#define CR_COMPILER_CLANG
#define CR_COMPILER_POSIX
#elif defined(__GNUC__)
#define CR_COMPILER_GCC
#define CR_COMPILER_POSIX
#else
#error "clean-ring: unsupported compiler"
#endif

// exactly one of CR_OS_WINDOWS / CR_OS_LINUX / CR_OS_APPLE / CR_OS_BSD
#if defined(_WIN32)
#define CR_OS_WINDOWS
#elif defined(__APPLE__)
#define CR_OS_APPLE
#elif defined(__linux__)
#define CR_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define CR_OS_BSD
#else
#error "clean-ring: unsupported operating system"
#endif

// =========================================================================================================
// Build mode
// =========================================================================================================

// CMake sets one of CR_DEBUG, CR_RELEASE, CR_RELWITHDEBINFO.
// CR_ASSERT (see assert.hh) checks run in debug-ish builds,
// and in release builds that opt in via CR_ENABLE_ASSERT_IN_RELEASE.
#if defined(CR_DEBUG) || defined(CR_RELWITHDEBINFO) || defined(CR_ENABLE_ASSERT_IN_RELEASE)
#define CR_ASSERT_ENABLED 1
#else
#define CR_ASSERT_ENABLED 0
#endif

// =========================================================================================================
// Attributes
// =========================================================================================================

#if defined(CR_COMPILER_MSVC)

#define CR_FORCE_INLINE __forceinline
#define CR_COLD_FUNC
#define CR_BUILTIN_UNREACHABLE __assume(0)

#else

// gcc wants the extra 'inline' next to always_inline
#define CR_FORCE_INLINE __attribute__((always_inline)) inline
// assertion failure paths, keeps them out of the hot code layout
#define CR_COLD_FUNC __attribute__((cold))
#define CR_BUILTIN_UNREACHABLE __builtin_unreachable()

#endif

// Type-checks expr without evaluating it (sizeof operand).
// Usage: CR_UNUSED(cond); in stripped assertion macros
#define CR_UNUSED(expr) (void)(sizeof((expr)))
