#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: ASH_COMPILER_MSVC, ASH_COMPILER_CLANG, ASH_COMPILER_GCC, ASH_COMPILER_POSIX

#if defined(_MSC_VER)
#define ASH_COMPILER_MSVC
#elif defined(__clang__)
#define ASH_COMPILER_CLANG
#elif defined(__GNUC__)
#define ASH_COMPILER_GCC
#else
#error "Unknown compiler"
#endif

#if defined(ASH_COMPILER_CLANG) || defined(ASH_COMPILER_GCC)
#define ASH_COMPILER_POSIX
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: ASH_OS_WINDOWS, ASH_OS_LINUX, ASH_OS_APPLE, ASH_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define ASH_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
#define ASH_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define ASH_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define ASH_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// From CMake: ASH_DEBUG, ASH_RELEASE, ASH_RELWITHDEBINFO
// Optional:   ASH_ENABLE_ASSERT_IN_RELEASE
// Derived:    ASH_ASSERT_ENABLED (0 or 1), can be predefined to force a value

#ifndef ASH_ASSERT_ENABLED
#if defined(ASH_DEBUG) || defined(ASH_RELWITHDEBINFO) || defined(ASH_ENABLE_ASSERT_IN_RELEASE)
#define ASH_ASSERT_ENABLED 1
#else
#define ASH_ASSERT_ENABLED 0
#endif
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// ASH_FORCE_INLINE - Force function to be inlined
#define ASH_FORCE_INLINE ASH_IMPL_FORCE_INLINE

// ASH_COLD_FUNC - Mark function as rarely executed (error paths, assertions, reallocation)
// Usage: ASH_COLD_FUNC void grow_to(isize new_cap) { ... }
#define ASH_COLD_FUNC ASH_IMPL_COLD_FUNC

// ASH_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define ASH_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(ASH_COMPILER_MSVC)

#define ASH_IMPL_FORCE_INLINE __forceinline
#define ASH_IMPL_COLD_FUNC

#elif defined(ASH_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define ASH_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define ASH_IMPL_COLD_FUNC __attribute__((cold))

#endif

