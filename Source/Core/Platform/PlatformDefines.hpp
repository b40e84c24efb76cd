// =============================
// PlatformDefines.hpp
// =============================
#pragma once

// Pure preprocessor platform detection (OS and word size).
// Keep this header *very* lightweight: no runtime logic, no external deps.

// -----------------------------
// OS Detection
// -----------------------------
#if defined(__OHOS__)
#define XCG_PLATFORM_OHOS 1
#else
#define XCG_PLATFORM_OHOS 0
#endif

#if defined(__linux__) && !XCG_PLATFORM_OHOS
#define XCG_PLATFORM_LINUX 1
#else
#define XCG_PLATFORM_LINUX 0
#endif

#if defined(__APPLE__) && defined(__MACH__)
#define XCG_PLATFORM_APPLE 1
#else
#define XCG_PLATFORM_APPLE 0
#endif

#if defined(_WIN32) || defined(_WIN64)
#define XCG_PLATFORM_WINDOWS 1
#else
#define XCG_PLATFORM_WINDOWS 0
#endif

// -----------------------------
// Word size (32/64 bits)
// -----------------------------
#if defined(_WIN64) || defined(__x86_64__) || defined(__aarch64__) || defined(__LP64__)
#define XCG_PLATFORM_64BITS 1
#define XCG_PLATFORM_32BITS 0
#else
#define XCG_PLATFORM_64BITS 0
#define XCG_PLATFORM_32BITS 1
#endif

// -----------------------------
// Composite flags
// -----------------------------
// OpenHarmony is a musl-based POSIX system; fork/waitpid are available.
#define XCG_PLATFORM_POSIX (XCG_PLATFORM_OHOS || XCG_PLATFORM_LINUX || XCG_PLATFORM_APPLE)

// -----------------------------
// Sanity guards
// -----------------------------
#if ((XCG_PLATFORM_32BITS + XCG_PLATFORM_64BITS) != 1)
#error "XCG: Exactly one of XCG_PLATFORM_32BITS or XCG_PLATFORM_64BITS must be 1."
#endif

// Keep this file preprocessor-only.
