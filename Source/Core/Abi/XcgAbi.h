// ============================================================================
// XComponentGuard - Core/Abi/XcgAbi.h
// ----------------------------------------------------------------------------
// Purpose : Common ABI definitions shared by the native XComponent mirror and
//           the host object-model mirror (C99-compatible).
// Contract: POD-only types, explicit sizes; no exceptions/RTTI/unwinding; C ABI
//           with an explicit calling-convention macro; ownership is defined by the
//           higher-level C++ layer; ASCII-only.
// Notes   : ABI v1 is frozen once published. Do not modify existing v1 entries.
//           Status codes are passed through from the platform unchanged.
// ============================================================================
#ifndef XCG_ABI_XCG_ABI_H
#define XCG_ABI_XCG_ABI_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stdint.h>

// Calling convention for every function-pointer entry of the ABI tables -------------------
#if defined(_WIN32) || defined(_WIN64)
    #define XCG_ABI_CALL __cdecl
#else
    #define XCG_ABI_CALL
#endif

// Fixed-width primitive aliases -----------------------------------------------------------
typedef uint32_t xcg_u32;
typedef uint64_t xcg_u64;
typedef int32_t  xcg_i32;
typedef int64_t  xcg_i64;
typedef float    xcg_f32;
typedef double   xcg_f64;

enum { XCG_ABI_VERSION_V1 = 1u };

typedef struct xcg_abi_header_v1 {
    xcg_u32 struct_size;
    xcg_u32 abi_version;
} xcg_abi_header_v1;

// 0 means success; every other value is an opaque platform code.
typedef xcg_i32 xcg_status;

#define XCG_STATUS_OK ((xcg_status)0)

#ifdef __cplusplus
} // extern "C"
#endif

#endif // XCG_ABI_XCG_ABI_H
