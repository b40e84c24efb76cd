// ============================================================================
// XComponentGuard - Core/Abi/XcgXComponentApi.h
// ----------------------------------------------------------------------------
// Purpose : Native XComponent surface (v1) mirrored as C99 POD types and a
//           function table: size query, touch-event query and callback
//           registration.
// Contract: C ABI, POD-only; every function returns xcg_status (0 = success,
//           anything else passed through untouched); no exceptions or RTTI.
//           Pointers handed to the table are owned by the native runtime.
// Notes   : Record layouts mirror the platform SDK one-to-one; the platform
//           binding static_asserts size and alignment against the SDK header.
//           register_callback keeps the callback table address after it
//           returns; callers must pass storage that lives for the process.
// ============================================================================
#ifndef XCG_ABI_XCG_XCOMPONENT_API_H
#define XCG_ABI_XCG_XCOMPONENT_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include "Core/Abi/XcgAbi.h"

#include <stdbool.h>

// Opaque native component; only ever handled through pointers.
typedef struct xcg_native_xcomponent xcg_native_xcomponent;

// Platform result codes (OH_NATIVEXCOMPONENT_RESULT_*).
#define XCG_XCOMPONENT_RESULT_SUCCESS       ((xcg_status)0)
#define XCG_XCOMPONENT_RESULT_FAILED        ((xcg_status)-1)
#define XCG_XCOMPONENT_RESULT_BAD_PARAMETER ((xcg_status)-2)

#define XCG_MAX_TOUCH_POINTS 10

typedef enum xcg_touch_event_type {
    XCG_TOUCH_EVENT_DOWN = 0,
    XCG_TOUCH_EVENT_UP,
    XCG_TOUCH_EVENT_MOVE,
    XCG_TOUCH_EVENT_CANCEL,
    XCG_TOUCH_EVENT_UNKNOWN
} xcg_touch_event_type;

typedef struct xcg_touch_point_v1 {
    xcg_i32              id;
    xcg_f32              screen_x;
    xcg_f32              screen_y;
    xcg_f32              x;
    xcg_f32              y;
    xcg_touch_event_type type;
    xcg_f64              size;
    xcg_f32              force;
    xcg_i64              time_stamp;
    bool                 is_pressed;
} xcg_touch_point_v1;

typedef struct xcg_touch_event_v1 {
    xcg_i32              id;
    xcg_f32              screen_x;
    xcg_f32              screen_y;
    xcg_f32              x;
    xcg_f32              y;
    xcg_touch_event_type type;
    xcg_f64              size;
    xcg_f32              force;
    xcg_i64              device_id;
    xcg_i64              time_stamp;
    xcg_touch_point_v1   touch_points[XCG_MAX_TOUCH_POINTS];
    xcg_u32              num_points;
} xcg_touch_event_v1;

// Callback slots invoked later by the native runtime, from a thread of its
// choosing. Any slot may be NULL.
typedef void (*xcg_xcomponent_event_fn)(xcg_native_xcomponent* component, void* window);

typedef struct xcg_xcomponent_callback_v1 {
    xcg_xcomponent_event_fn OnSurfaceCreated;
    xcg_xcomponent_event_fn OnSurfaceChanged;
    xcg_xcomponent_event_fn OnSurfaceDestroyed;
    xcg_xcomponent_event_fn DispatchTouchEvent;
} xcg_xcomponent_callback_v1;

typedef struct xcg_xcomponent_api_v1 {
    xcg_abi_header_v1 header; // { struct_size, abi_version }

    // Writes *out_width/*out_height on success only.
    xcg_status (XCG_ABI_CALL *get_size)(xcg_native_xcomponent* component, const void* window,
                           xcg_u64* out_width, xcg_u64* out_height);

    // Writes *out_event on success only; storage is untouched otherwise.
    xcg_status (XCG_ABI_CALL *get_touch_event)(xcg_native_xcomponent* component, const void* window,
                                  xcg_touch_event_v1* out_event);

    // Retains `callbacks` beyond the call; see file notes.
    xcg_status (XCG_ABI_CALL *register_callback)(xcg_native_xcomponent* component,
                                    xcg_xcomponent_callback_v1* callbacks);
} xcg_xcomponent_api_v1;

#ifdef __cplusplus
} // extern "C"
#endif

#endif // XCG_ABI_XCG_XCOMPONENT_API_H
