// ============================================================================
// XComponentGuard - Core/Interop/XComponentAbi.hpp
// ----------------------------------------------------------------------------
// Purpose : Thin C++ helpers around xcg_xcomponent_api_v1 and
//           xcg_host_object_api_v1 (no ownership changes).
// Contract: Inline wrappers; no allocations; forward status codes untouched;
//           a missing function pointer reports a failure code instead of
//           crashing; no exceptions/RTTI.
// Notes   : Thread-safety follows the underlying platform implementation.
// ============================================================================
#ifndef XCG_INTEROP_XCOMPONENT_ABI_HPP
#define XCG_INTEROP_XCOMPONENT_ABI_HPP

#include "Core/Abi/XcgHostObjectApi.h"
#include "Core/Abi/XcgXComponentApi.h"

namespace xcg
{

inline xcg_status XComponentGetSize(const xcg_xcomponent_api_v1& api, xcg_native_xcomponent* component, const void* window, xcg_u64* outWidth, xcg_u64* outHeight) noexcept
{
    return api.get_size ? api.get_size(component, window, outWidth, outHeight) : XCG_XCOMPONENT_RESULT_FAILED;
}

inline xcg_status XComponentGetTouchEvent(const xcg_xcomponent_api_v1& api, xcg_native_xcomponent* component, const void* window, xcg_touch_event_v1* outEvent) noexcept
{
    return api.get_touch_event ? api.get_touch_event(component, window, outEvent) : XCG_XCOMPONENT_RESULT_FAILED;
}

inline xcg_status XComponentRegisterCallback(const xcg_xcomponent_api_v1& api, xcg_native_xcomponent* component, xcg_xcomponent_callback_v1* callbacks) noexcept
{
    return api.register_callback ? api.register_callback(component, callbacks) : XCG_XCOMPONENT_RESULT_FAILED;
}

inline xcg_status HostGetNamedProperty(const xcg_host_object_api_v1& api, xcg_host_env env, xcg_host_value object, const char* name, xcg_host_value* outValue) noexcept
{
    return api.get_named_property ? api.get_named_property(env, object, name, outValue) : XCG_HOST_STATUS_GENERIC_FAILURE;
}

inline xcg_status HostTypeOf(const xcg_host_object_api_v1& api, xcg_host_env env, xcg_host_value value, xcg_host_value_type* outType) noexcept
{
    return api.type_of ? api.type_of(env, value, outType) : XCG_HOST_STATUS_GENERIC_FAILURE;
}

inline xcg_status HostUnwrap(const xcg_host_object_api_v1& api, xcg_host_env env, xcg_host_value wrapper, void** outNative) noexcept
{
    return api.unwrap ? api.unwrap(env, wrapper, outNative) : XCG_HOST_STATUS_GENERIC_FAILURE;
}

} // namespace xcg

#endif // XCG_INTEROP_XCOMPONENT_ABI_HPP
