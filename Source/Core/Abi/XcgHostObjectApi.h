// ============================================================================
// XComponentGuard - Core/Abi/XcgHostObjectApi.h
// ----------------------------------------------------------------------------
// Purpose : Host object-model services used when registering callbacks from
//           module init: named-property lookup, type query and native unwrap.
// Contract: C99 POD-only; functions return xcg_status (host codes, 0 = ok);
//           no exceptions or RTTI; env/value handles are opaque and owned by
//           the host embedding. ASCII-only.
// Notes   : Header-first; ABI v1 is frozen once published. Status values
//           mirror the host's own enumeration (napi_status on OpenHarmony).
//           Handles are only valid inside the host call that produced them.
// ============================================================================
#ifndef XCG_ABI_XCG_HOST_OBJECT_API_H
#define XCG_ABI_XCG_HOST_OBJECT_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include "Core/Abi/XcgAbi.h"

typedef struct xcg_host_env_s*   xcg_host_env;   // napi_env
typedef struct xcg_host_value_s* xcg_host_value; // napi_value

// Host status subset referenced by the core (napi_ok, napi_invalid_arg, ...).
#define XCG_HOST_STATUS_OK              ((xcg_status)0)
#define XCG_HOST_STATUS_INVALID_ARG     ((xcg_status)1)
#define XCG_HOST_STATUS_OBJECT_EXPECTED ((xcg_status)2)
#define XCG_HOST_STATUS_GENERIC_FAILURE ((xcg_status)9)

// Property the host attaches to module exports for every XComponent instance.
#define XCG_NATIVE_XCOMPONENT_OBJ "__NATIVE_XCOMPONENT_OBJ__"

typedef enum xcg_host_value_type {
    XCG_HOST_VALUE_UNDEFINED = 0,
    XCG_HOST_VALUE_NULL,
    XCG_HOST_VALUE_OBJECT,
    XCG_HOST_VALUE_OTHER
} xcg_host_value_type;

typedef struct xcg_host_object_api_v1 {
    xcg_abi_header_v1 header; // { struct_size, abi_version }

    // Purpose : Look up `name` on `object`.
    // Contract: Writes *out_value on success; a missing property may still
    //           succeed with an undefined value (check with type_of).
    xcg_status (XCG_ABI_CALL *get_named_property)(xcg_host_env env, xcg_host_value object,
                                     const char* name, xcg_host_value* out_value);

    // Purpose : Classify a value.
    // Contract: Writes *out_type on success.
    xcg_status (XCG_ABI_CALL *type_of)(xcg_host_env env, xcg_host_value value, xcg_host_value_type* out_type);

    // Purpose : Recover the native pointer wrapped inside a host object.
    // Contract: Writes *out_native on success; no ownership transfer.
    xcg_status (XCG_ABI_CALL *unwrap)(xcg_host_env env, xcg_host_value wrapper, void** out_native);
} xcg_host_object_api_v1;

#ifdef __cplusplus
} // extern "C"
#endif

#endif // XCG_ABI_XCG_HOST_OBJECT_API_H
