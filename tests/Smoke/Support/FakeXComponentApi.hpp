// ============================================================================
// XComponentGuard - tests/Smoke/Support/FakeXComponentApi.hpp
// ----------------------------------------------------------------------------
// Purpose : Scriptable native and host tables plus a capturing log sink for
//           smoke tests. Each fake records what it was called with.
// Contract: Test-only; single-threaded use; state is process-global because
//           the ABI entries carry no context pointer.
// Notes   : Call InstallFakes() at the start of a smoke and ShutdownInterop()
//           at the end so smokes stay independent inside AllSmokes.
// ============================================================================

#pragma once

#include "Core/Abi/XcgHostObjectApi.h"
#include "Core/Abi/XcgXComponentApi.h"
#include "Core/Interop/InteropRuntime.hpp"
#include "Core/Logger.hpp"

#include <cstring>
#include <string>

namespace xcg::test
{
    struct FakeNativeState
    {
        xcg_status sizeStatus = XCG_XCOMPONENT_RESULT_SUCCESS;
        xcg_u64    width      = 1920;
        xcg_u64    height     = 1080;
        int        sizeCalls  = 0;

        xcg_status         touchStatus = XCG_XCOMPONENT_RESULT_SUCCESS;
        xcg_touch_event_v1 touchEvent{};
        int                touchCalls  = 0;

        xcg_status                  registerStatus = XCG_XCOMPONENT_RESULT_SUCCESS;
        xcg_xcomponent_callback_v1* lastCallbacks  = nullptr;
        int                         registerCalls  = 0;

        xcg_native_xcomponent* lastComponent = nullptr;
        const void*            lastWindow    = nullptr;
    };

    struct FakeHostState
    {
        xcg_status          propertyStatus = XCG_HOST_STATUS_OK;
        xcg_status          typeOfStatus   = XCG_HOST_STATUS_OK;
        xcg_host_value_type valueType      = XCG_HOST_VALUE_OBJECT;
        xcg_status          unwrapStatus   = XCG_HOST_STATUS_OK;
        void*               unwrapResult   = nullptr;

        xcg_host_value wrapper = nullptr; // Value returned by the property lookup.
        std::string    lastPropertyName;

        int propertyCalls = 0;
        int typeOfCalls   = 0;
        int unwrapCalls   = 0;
    };

    struct CapturedLog
    {
        int            count = 0;
        core::LogLevel lastLevel = core::LogLevel::Disabled;
        std::string    lastCategory;
        std::string    lastMessage;
    };

    inline FakeNativeState& NativeState() noexcept
    {
        static FakeNativeState state;
        return state;
    }

    inline FakeHostState& HostState() noexcept
    {
        static FakeHostState state;
        return state;
    }

    inline CapturedLog& Captured() noexcept
    {
        static CapturedLog log;
        return log;
    }

    namespace detail
    {
        inline xcg_status XCG_ABI_CALL FakeGetSize(xcg_native_xcomponent* component, const void* window, xcg_u64* outWidth, xcg_u64* outHeight) noexcept
        {
            FakeNativeState& state = NativeState();
            ++state.sizeCalls;
            state.lastComponent = component;
            state.lastWindow = window;
            if (state.sizeStatus != XCG_XCOMPONENT_RESULT_SUCCESS)
            {
                return state.sizeStatus;
            }
            *outWidth = state.width;
            *outHeight = state.height;
            return XCG_XCOMPONENT_RESULT_SUCCESS;
        }

        inline xcg_status XCG_ABI_CALL FakeGetTouchEvent(xcg_native_xcomponent* component, const void* window, xcg_touch_event_v1* outEvent) noexcept
        {
            FakeNativeState& state = NativeState();
            ++state.touchCalls;
            state.lastComponent = component;
            state.lastWindow = window;
            if (state.touchStatus != XCG_XCOMPONENT_RESULT_SUCCESS)
            {
                // A misbehaving platform may scribble on the slot before failing.
                std::memset(outEvent, 0xEE, sizeof(*outEvent));
                return state.touchStatus;
            }
            std::memcpy(outEvent, &state.touchEvent, sizeof(*outEvent));
            return XCG_XCOMPONENT_RESULT_SUCCESS;
        }

        inline xcg_status XCG_ABI_CALL FakeRegisterCallback(xcg_native_xcomponent* component, xcg_xcomponent_callback_v1* callbacks) noexcept
        {
            FakeNativeState& state = NativeState();
            ++state.registerCalls;
            state.lastComponent = component;
            state.lastCallbacks = callbacks;
            return state.registerStatus;
        }

        inline xcg_status XCG_ABI_CALL FakeGetNamedProperty(xcg_host_env, xcg_host_value, const char* name, xcg_host_value* outValue) noexcept
        {
            FakeHostState& state = HostState();
            ++state.propertyCalls;
            state.lastPropertyName = name ? name : "";
            if (state.propertyStatus != XCG_HOST_STATUS_OK)
            {
                return state.propertyStatus;
            }
            *outValue = state.wrapper;
            return XCG_HOST_STATUS_OK;
        }

        inline xcg_status XCG_ABI_CALL FakeTypeOf(xcg_host_env, xcg_host_value, xcg_host_value_type* outType) noexcept
        {
            FakeHostState& state = HostState();
            ++state.typeOfCalls;
            if (state.typeOfStatus != XCG_HOST_STATUS_OK)
            {
                return state.typeOfStatus;
            }
            *outType = state.valueType;
            return XCG_HOST_STATUS_OK;
        }

        inline xcg_status XCG_ABI_CALL FakeUnwrap(xcg_host_env, xcg_host_value, void** outNative) noexcept
        {
            FakeHostState& state = HostState();
            ++state.unwrapCalls;
            if (state.unwrapStatus != XCG_HOST_STATUS_OK)
            {
                return state.unwrapStatus;
            }
            *outNative = state.unwrapResult;
            return XCG_HOST_STATUS_OK;
        }

        inline void CaptureSink(void*, core::LogLevel level, const char* category, std::string_view message) noexcept
        {
            CapturedLog& log = Captured();
            ++log.count;
            log.lastLevel = level;
            log.lastCategory = category ? category : "";
            log.lastMessage.assign(message.data(), message.size());
        }
    } // namespace detail

    inline const xcg_xcomponent_api_v1& FakeXComponentApi() noexcept
    {
        static const xcg_xcomponent_api_v1 api = {
            { static_cast<xcg_u32>(sizeof(xcg_xcomponent_api_v1)), XCG_ABI_VERSION_V1 },
            &detail::FakeGetSize,
            &detail::FakeGetTouchEvent,
            &detail::FakeRegisterCallback,
        };
        return api;
    }

    inline const xcg_host_object_api_v1& FakeHostObjectApi() noexcept
    {
        static const xcg_host_object_api_v1 api = {
            { static_cast<xcg_u32>(sizeof(xcg_host_object_api_v1)), XCG_ABI_VERSION_V1 },
            &detail::FakeGetNamedProperty,
            &detail::FakeTypeOf,
            &detail::FakeUnwrap,
        };
        return api;
    }

    inline core::LogSink CaptureLogSink() noexcept
    {
        return core::LogSink{ &detail::CaptureSink, nullptr };
    }

    // Resets every fake and binds them with the capturing sink at Verbose.
    [[nodiscard]] inline bool InstallFakes() noexcept
    {
        NativeState() = FakeNativeState{};
        HostState() = FakeHostState{};
        Captured() = CapturedLog{};

        interop::InteropConfig config{};
        config.xcomponentApi = &FakeXComponentApi();
        config.hostObjectApi = &FakeHostObjectApi();
        config.logSink       = CaptureLogSink();
        config.minLogLevel   = core::LogLevel::Verbose;
        return interop::InitInterop(config) == interop::InteropStatus::Ok;
    }

    // Distinct, never-dereferenced addresses standing in for native pointers.
    inline xcg_native_xcomponent* FakeComponent() noexcept
    {
        alignas(16) static unsigned char storage[16];
        return reinterpret_cast<xcg_native_xcomponent*>(storage);
    }

    inline void* FakeWindow() noexcept
    {
        alignas(16) static unsigned char storage[16];
        return storage;
    }

} // namespace xcg::test
