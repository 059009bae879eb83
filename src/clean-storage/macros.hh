#pragma once

// Platform, compiler and build-mode switches of clean-storage.
//
// Defined here:
//   CS_COMPILER_MSVC | CS_COMPILER_CLANG | CS_COMPILER_GCC, plus CS_COMPILER_POSIX for the latter two
//   CS_OS_WINDOWS | CS_OS_LINUX | CS_OS_APPLE | CS_OS_BSD
//   CS_HAS_CPP_EXCEPTIONS     if the translation unit is compiled with exceptions
//   CS_ASSERT_ENABLED         0 or 1, whether CS_ASSERT checks anything
//
// Expected from the build (see CMakeLists.txt):
//   CS_DEBUG, CS_RELEASE, CS_RELWITHDEBINFO, CS_ENABLE_ASSERT_IN_RELEASE

// =========================================================================================================
// Compiler and OS
// =========================================================================================================

#if defined(_MSC_VER)
#define CS_COMPILER_MSVC
#elif defined(__clang__)
#define CS_COMPILER_CLANG
#define CS_COMPILER_POSIX
#elif defined(__GNUC__) // also MinGW
#define CS_COMPILER_GCC
#define CS_COMPILER_POSIX
#else
#error "clean-storage: unsupported compiler"
#endif

#if defined(_WIN32)
#define CS_OS_WINDOWS
#elif defined(__APPLE__)
#define CS_OS_APPLE
#elif defined(__linux__)
#define CS_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define CS_OS_BSD
#else
#error "clean-storage: unsupported platform"
#endif

// =========================================================================================================
// Build mode
// =========================================================================================================

#if defined(CS_COMPILER_MSVC)
#ifdef _CPPUNWIND
#define CS_HAS_CPP_EXCEPTIONS
#endif
#elif defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define CS_HAS_CPP_EXCEPTIONS
#endif

// storage preconditions are checked everywhere except in plain release builds
#if defined(CS_RELEASE) && !defined(CS_ENABLE_ASSERT_IN_RELEASE)
#define CS_ASSERT_ENABLED 0
#else
#define CS_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Function and expression helpers
// =========================================================================================================

#if defined(CS_COMPILER_MSVC)
#define CS_FORCE_INLINE __forceinline
#define CS_COLD_FUNC
#else
// gcc wants the extra 'inline'
#define CS_FORCE_INLINE __attribute__((always_inline)) inline
#define CS_COLD_FUNC __attribute__((cold))
#endif

/// Marks expr as used without evaluating it
/// Usage: CS_UNUSED(userdata);
#define CS_UNUSED(expr) (void)(sizeof((expr)))
