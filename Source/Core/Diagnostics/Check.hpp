#pragma once
//
// XComponentGuard - Core/Diagnostics/Check.hpp
// Centralized lightweight diagnostics macros (no heavy deps).
//
// Provided:
//   - XCG_CHECK(cond): soft check (no-op in Release). In Debug, optional breakpoint.
//   - XCG_CHECK_FATAL(cond, Category, Msg): always evaluated, in every build.
//     On failure logs at Fatal severity through Logger.hpp and aborts. Reserved
//     for platform contracts whose violation leaves no defined value to return.
//
// Optional toggles (define before including this header):
//   - XCG_CHECK_BREAK : if defined, XCG_CHECK will break in Debug when cond fails
//

#include "Core/Logger.hpp"

// ----------------------------------------------------------------------------
// Debug detection (respects user-defined XCG_DEBUG; falls back to !NDEBUG)
// ----------------------------------------------------------------------------
#ifndef XCG_DEBUG
#  ifndef NDEBUG
#    define XCG_DEBUG 1
#  else
#    define XCG_DEBUG 0
#  endif
#endif

// ----------------------------------------------------------------------------
// Internal cross-compiler debug break helper (Debug only)
// ----------------------------------------------------------------------------
#if XCG_DEBUG
#  if defined(_MSC_VER)
#    define XCG_INTERNAL_DEBUG_BREAK() __debugbreak()
#  elif defined(__clang__) || defined(__GNUC__)
#    define XCG_INTERNAL_DEBUG_BREAK() __builtin_trap()
#  else
#    define XCG_INTERNAL_DEBUG_BREAK() std::abort()
#  endif
#else
#  define XCG_INTERNAL_DEBUG_BREAK() ((void)0)
#endif

// ----------------------------------------------------------------------------
// XCG_CHECK: soft check
//  - Release: no-op
//  - Debug:   by default no break (non-intrusive); define XCG_CHECK_BREAK to break
// ----------------------------------------------------------------------------
#ifndef XCG_CHECK
#  if XCG_DEBUG
#    ifdef XCG_CHECK_BREAK
#      define XCG_CHECK(cond) do { if(!(cond)) { XCG_INTERNAL_DEBUG_BREAK(); } } while(0)
#    else
#      define XCG_CHECK(cond) do { if(!(cond)) { /* optional breakpoint in debug */ } } while(0)
#    endif
#  else
#    define XCG_CHECK(cond) ((void)0)
#  endif
#endif

// ----------------------------------------------------------------------------
// XCG_CHECK_FATAL: hard check, never compiled out
//  - Msg is a std::format pattern; trailing arguments are forwarded to the logger.
//  - With XCG_ENABLE_LOGGING=0 the message is dropped but the abort remains.
// ----------------------------------------------------------------------------
#define XCG_CHECK_FATAL(cond, Category, Msg, ...) do { \
        if (!(cond)) { \
            XCG_LOG_FATAL((Category), "{} ({}:{}): " Msg, #cond, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)
