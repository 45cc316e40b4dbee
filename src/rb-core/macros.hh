#pragma once

// Platform, build-mode and attribute macros shared by all rb-core headers.
// Nothing in here pulls in other headers.

// compiler
// exactly one of RB_COMPILER_MSVC / RB_COMPILER_POSIX (gcc, clang, mingw) is defined

#if defined(_MSC_VER) && !defined(__clang__)
#define RB_COMPILER_MSVC
#elif defined(__GNUC__) || defined(__clang__)
#define RB_COMPILER_POSIX
#else
#error "rb-core: unsupported compiler"
#endif

// operating system
// only the debugger detection in assert.cc cares about this

#if defined(_WIN32)
#define RB_OS_WINDOWS
#elif defined(__linux__)
#define RB_OS_LINUX
#endif

// build mode
// CMake defines one of RB_DEBUG, RB_RELEASE, RB_RELWITHDEBINFO
// RB_ASSERT_ENABLED is always 0 or 1 so it can be used in `if constexpr`

#if defined(RB_RELEASE) && !defined(RB_ENABLE_ASSERT_IN_RELEASE)
#define RB_ASSERT_ENABLED 0
#else
#define RB_ASSERT_ENABLED 1
#endif

// attributes

#ifdef RB_COMPILER_MSVC
#define RB_FORCE_INLINE __forceinline
#define RB_COLD_FUNC
#else
// gcc requires the extra 'inline'
#define RB_FORCE_INLINE __attribute__((always_inline)) inline
#define RB_COLD_FUNC __attribute__((cold))
#endif

// type-checks expr without evaluating it
#define RB_UNUSED(expr) (void)(sizeof((expr)))
