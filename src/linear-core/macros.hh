#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: LC_COMPILER_MSVC, LC_COMPILER_CLANG, LC_COMPILER_GCC, LC_COMPILER_POSIX

#if defined(_MSC_VER)
#define LC_COMPILER_MSVC
#elif defined(__clang__)
#define LC_COMPILER_CLANG
#elif defined(__GNUC__)
#define LC_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(LC_COMPILER_CLANG) || defined(LC_COMPILER_GCC)
#define LC_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: LC_OS_WINDOWS, LC_OS_LINUX, LC_OS_APPLE, LC_OS_BSD
// Freestanding targets (no OS) define none of them.

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define LC_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define LC_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define LC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define LC_OS_BSD
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// From CMake: LC_DEBUG, LC_RELEASE, LC_RELWITHDEBINFO, LC_ENABLE_ASSERT_IN_RELEASE
// Derived here: LC_ASSERT_ENABLED (0 or 1)

#ifndef LC_ASSERT_ENABLED
#if defined(LC_DEBUG) || defined(LC_RELWITHDEBINFO) || defined(LC_ENABLE_ASSERT_IN_RELEASE)
#define LC_ASSERT_ENABLED 1
#elif defined(LC_RELEASE)
#define LC_ASSERT_ENABLED 0
#else
// unknown configuration (e.g. consumed without our CMake): we believe in more checks
#define LC_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// LC_FORCE_INLINE - Force function to be inlined
#define LC_FORCE_INLINE LC_IMPL_FORCE_INLINE

// LC_COLD_FUNC - Mark function as rarely executed (growth paths, assertion failures)
// Usage: LC_COLD_FUNC void grow() { ... }
#define LC_COLD_FUNC LC_IMPL_COLD_FUNC

// LC_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define LC_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(LC_COMPILER_MSVC)

#define LC_IMPL_FORCE_INLINE __forceinline
#define LC_IMPL_COLD_FUNC

#elif defined(LC_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define LC_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define LC_IMPL_COLD_FUNC __attribute__((cold))

#endif
