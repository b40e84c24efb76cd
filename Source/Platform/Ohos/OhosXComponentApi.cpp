// ============================================================================
// XComponentGuard - Source/Platform/Ohos/OhosXComponentApi.cpp
// ----------------------------------------------------------------------------
// Purpose : Bind the xcg_* mirror tables to OH_NativeXComponent_* and napi_*.
// Contract: No exceptions/RTTI; status codes forwarded untouched; mirror
//           records are layout-checked against the SDK at compile time.
// Notes   : napi_valuetype is folded into xcg_host_value_type.
// ============================================================================
#include "Platform/Ohos/OhosXComponentApi.hpp"

#include <ace/xcomponent/native_interface_xcomponent.h>
#include <hilog/log.h>
#include <napi/native_api.h>

#include <cstddef>

namespace xcg::ohos
{
namespace
{
    static_assert(sizeof(xcg_touch_event_v1) == sizeof(OH_NativeXComponent_TouchEvent), "touch event mirror size");
    static_assert(alignof(xcg_touch_event_v1) == alignof(OH_NativeXComponent_TouchEvent), "touch event mirror alignment");
    static_assert(offsetof(xcg_touch_event_v1, touch_points) == offsetof(OH_NativeXComponent_TouchEvent, touchPoints), "touch points offset");
    static_assert(offsetof(xcg_touch_event_v1, num_points) == offsetof(OH_NativeXComponent_TouchEvent, numPoints), "num points offset");
    static_assert(XCG_MAX_TOUCH_POINTS == OH_MAX_TOUCH_POINTS_NUMBER, "touch point capacity");

    static_assert(sizeof(xcg_xcomponent_callback_v1) == sizeof(OH_NativeXComponent_Callback), "callback table mirror size");
    static_assert(offsetof(xcg_xcomponent_callback_v1, OnSurfaceCreated) == offsetof(OH_NativeXComponent_Callback, OnSurfaceCreated), "OnSurfaceCreated slot");
    static_assert(offsetof(xcg_xcomponent_callback_v1, OnSurfaceChanged) == offsetof(OH_NativeXComponent_Callback, OnSurfaceChanged), "OnSurfaceChanged slot");
    static_assert(offsetof(xcg_xcomponent_callback_v1, OnSurfaceDestroyed) == offsetof(OH_NativeXComponent_Callback, OnSurfaceDestroyed), "OnSurfaceDestroyed slot");
    static_assert(offsetof(xcg_xcomponent_callback_v1, DispatchTouchEvent) == offsetof(OH_NativeXComponent_Callback, DispatchTouchEvent), "DispatchTouchEvent slot");

    static_assert(XCG_XCOMPONENT_RESULT_SUCCESS == OH_NATIVEXCOMPONENT_RESULT_SUCCESS, "result code mirror");
    static_assert(XCG_XCOMPONENT_RESULT_FAILED == OH_NATIVEXCOMPONENT_RESULT_FAILED, "result code mirror");
    static_assert(XCG_XCOMPONENT_RESULT_BAD_PARAMETER == OH_NATIVEXCOMPONENT_RESULT_BAD_PARAMETER, "result code mirror");
    static_assert(XCG_HOST_STATUS_OK == napi_ok && XCG_HOST_STATUS_INVALID_ARG == napi_invalid_arg, "host status mirror");
    static_assert(XCG_HOST_STATUS_OBJECT_EXPECTED == napi_object_expected && XCG_HOST_STATUS_GENERIC_FAILURE == napi_generic_failure, "host status mirror");

    constexpr unsigned int kHilogDomain = 0xFF00u;
    constexpr const char*  kHilogTag    = "XComponentGuard";

    OH_NativeXComponent* ToNative(xcg_native_xcomponent* component) noexcept
    {
        return reinterpret_cast<OH_NativeXComponent*>(component);
    }

    xcg_status XCG_ABI_CALL GetSize(xcg_native_xcomponent* component, const void* window, xcg_u64* outWidth, xcg_u64* outHeight) noexcept
    {
        return OH_NativeXComponent_GetXComponentSize(ToNative(component), window, outWidth, outHeight);
    }

    xcg_status XCG_ABI_CALL GetTouchEvent(xcg_native_xcomponent* component, const void* window, xcg_touch_event_v1* outEvent) noexcept
    {
        return OH_NativeXComponent_GetTouchEvent(ToNative(component), window,
                                                 reinterpret_cast<OH_NativeXComponent_TouchEvent*>(outEvent));
    }

    xcg_status XCG_ABI_CALL RegisterCallback(xcg_native_xcomponent* component, xcg_xcomponent_callback_v1* callbacks) noexcept
    {
        return OH_NativeXComponent_RegisterCallback(ToNative(component),
                                                    reinterpret_cast<OH_NativeXComponent_Callback*>(callbacks));
    }

    xcg_status XCG_ABI_CALL GetNamedProperty(xcg_host_env env, xcg_host_value object, const char* name, xcg_host_value* outValue) noexcept
    {
        napi_value value = nullptr;
        const napi_status status = napi_get_named_property(reinterpret_cast<napi_env>(env),
                                                           reinterpret_cast<napi_value>(object),
                                                           name, &value);
        if (status == napi_ok)
        {
            *outValue = reinterpret_cast<xcg_host_value>(value);
        }
        return static_cast<xcg_status>(status);
    }

    xcg_status XCG_ABI_CALL TypeOf(xcg_host_env env, xcg_host_value value, xcg_host_value_type* outType) noexcept
    {
        napi_valuetype type = napi_undefined;
        const napi_status status = napi_typeof(reinterpret_cast<napi_env>(env), reinterpret_cast<napi_value>(value), &type);
        if (status != napi_ok)
        {
            return static_cast<xcg_status>(status);
        }

        switch (type)
        {
            case napi_undefined: *outType = XCG_HOST_VALUE_UNDEFINED; break;
            case napi_null:      *outType = XCG_HOST_VALUE_NULL;      break;
            case napi_object:    *outType = XCG_HOST_VALUE_OBJECT;    break;
            default:             *outType = XCG_HOST_VALUE_OTHER;     break;
        }
        return XCG_HOST_STATUS_OK;
    }

    xcg_status XCG_ABI_CALL Unwrap(xcg_host_env env, xcg_host_value wrapper, void** outNative) noexcept
    {
        return static_cast<xcg_status>(napi_unwrap(reinterpret_cast<napi_env>(env), reinterpret_cast<napi_value>(wrapper), outNative));
    }

    ::LogLevel ToHilogLevel(core::LogLevel level) noexcept
    {
        switch (level)
        {
            case core::LogLevel::Fatal: return LOG_FATAL;
            case core::LogLevel::Error: return LOG_ERROR;
            case core::LogLevel::Warn:  return LOG_WARN;
            case core::LogLevel::Info:  return LOG_INFO;
            default:                    return LOG_DEBUG;
        }
    }

    void HilogWrite(void*, core::LogLevel level, const char* category, std::string_view message) noexcept
    {
        OH_LOG_Print(LOG_APP, ToHilogLevel(level), kHilogDomain, kHilogTag, "[%{public}s] %{public}.*s",
                     category ? category : "-", static_cast<int>(message.size()), message.data());
    }
} // namespace

const xcg_xcomponent_api_v1& OhosXComponentApi() noexcept
{
    static const xcg_xcomponent_api_v1 api = {
        { static_cast<xcg_u32>(sizeof(xcg_xcomponent_api_v1)), XCG_ABI_VERSION_V1 },
        &GetSize,
        &GetTouchEvent,
        &RegisterCallback,
    };
    return api;
}

const xcg_host_object_api_v1& OhosHostObjectApi() noexcept
{
    static const xcg_host_object_api_v1 api = {
        { static_cast<xcg_u32>(sizeof(xcg_host_object_api_v1)), XCG_ABI_VERSION_V1 },
        &GetNamedProperty,
        &TypeOf,
        &Unwrap,
    };
    return api;
}

core::LogSink HilogSink() noexcept
{
    return core::LogSink{ &HilogWrite, nullptr };
}

} // namespace xcg::ohos
