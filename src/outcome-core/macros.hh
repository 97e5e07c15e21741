#pragma once

// =========================================================================================================
// Platform
// =========================================================================================================
// Exactly one of OC_COMPILER_MSVC, OC_COMPILER_CLANG, OC_COMPILER_GCC
// OC_COMPILER_POSIX for clang and gcc
// Exactly one of OC_OS_WINDOWS, OC_OS_APPLE, OC_OS_LINUX, OC_OS_BSD

#if defined(_MSC_VER)
#define OC_COMPILER_MSVC
#elif defined(__clang__)
#define OC_COMPILER_CLANG
#define OC_COMPILER_POSIX
#elif defined(__GNUC__)
#define OC_COMPILER_GCC
#define OC_COMPILER_POSIX
#else
#error "outcome-core supports msvc, clang and gcc"
#endif

#if defined(_WIN32)
#define OC_OS_WINDOWS
#elif defined(__APPLE__)
#define OC_OS_APPLE
#elif defined(__linux__)
#define OC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define OC_OS_BSD
#else
#error "outcome-core supports windows, apple, linux and the bsds"
#endif

// =========================================================================================================
// Language features
// =========================================================================================================
// OC_HAS_RTTI if typeid works on polymorphic objects, exception type names are demangled from it

#if defined(OC_COMPILER_MSVC)
#ifdef _CPPRTTI
#define OC_HAS_RTTI
#endif
#if !defined(_CPPUNWIND)
#error "outcome-core requires C++ exceptions (/EHsc)"
#endif
#else
#if defined(__GXX_RTTI) || defined(__cpp_rtti)
#define OC_HAS_RTTI
#endif
#if !defined(__cpp_exceptions) && !defined(__EXCEPTIONS)
#error "outcome-core requires C++ exceptions"
#endif
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
// The build defines one of OC_DEBUG, OC_RELWITHDEBINFO, OC_RELEASE, optionally OC_ENABLE_ASSERT_IN_RELEASE
// OC_ASSERT_ENABLED is always 0 or 1

#if defined(OC_DEBUG) || defined(OC_RELWITHDEBINFO) || defined(OC_ENABLE_ASSERT_IN_RELEASE)
#define OC_ASSERT_ENABLED 1
#else
#define OC_ASSERT_ENABLED 0
#endif

// =========================================================================================================
// Helpers
// =========================================================================================================

// OC_FORCE_INLINE - for the move/forward helpers, which must not show up as calls in debug builds
#if defined(OC_COMPILER_MSVC)
#define OC_FORCE_INLINE __forceinline
#else
#define OC_FORCE_INLINE __attribute__((always_inline)) inline
#endif

// OC_UNUSED(expr) - silences unused warnings, expr is not evaluated
#define OC_UNUSED(expr) (void)(sizeof((expr)))
