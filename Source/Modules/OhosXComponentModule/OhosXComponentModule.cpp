// ============================================================================
// XComponentGuard - Modules/OhosXComponentModule/OhosXComponentModule.cpp
// ----------------------------------------------------------------------------
// Purpose : NAPI module that binds the OpenHarmony tables at load time and
//           registers a static XComponent callback table from the exports
//           object handed to module init.
// Contract: C ABI entry points; no exceptions/RTTI; registration happens
//           once per module init and is never undone.
// Notes   : Callbacks run on a thread chosen by the ArkUI runtime. They only
//           query the surface; drawing and event handling belong elsewhere.
// ============================================================================
#include "Core/Interop/InteropRuntime.hpp"
#include "Core/Logger.hpp"
#include "Core/XComponent/HostRegistration.hpp"
#include "Core/XComponent/XComponent.hpp"
#include "Platform/Ohos/OhosXComponentApi.hpp"

#include <napi/native_api.h>

namespace
{
    constexpr const char* kLogCategory = "Module";

    void OnSurfaceCreated(xcg_native_xcomponent* component, void* window)
    {
        auto xc = xcg::xc::XComponent::Create(component, window);
        if (!xc)
        {
            XCG_LOG_ERROR(kLogCategory, "OnSurfaceCreated received a null pointer");
            return;
        }

        const xcg::xc::Size size = xc->GetSize();
        XCG_LOG_INFO(kLogCategory, "surface created {}x{}", size.Width(), size.Height());
    }

    void OnSurfaceChanged(xcg_native_xcomponent* component, void* window)
    {
        auto xc = xcg::xc::XComponent::Create(component, window);
        if (!xc)
        {
            XCG_LOG_ERROR(kLogCategory, "OnSurfaceChanged received a null pointer");
            return;
        }

        const xcg::xc::Size size = xc->GetSize();
        XCG_LOG_INFO(kLogCategory, "surface changed {}x{}", size.Width(), size.Height());
    }

    void OnSurfaceDestroyed(xcg_native_xcomponent*, void*)
    {
        XCG_LOG_INFO(kLogCategory, "surface destroyed");
    }

    void DispatchTouchEvent(xcg_native_xcomponent* component, void* window)
    {
        auto xc = xcg::xc::XComponent::Create(component, window);
        if (!xc)
        {
            XCG_LOG_ERROR(kLogCategory, "DispatchTouchEvent received a null pointer");
            return;
        }

        const auto touch = xc->GetTouchEvent();
        if (touch)
        {
            XCG_LOG_VERBOSE(kLogCategory, "touch type {} with {} points",
                            static_cast<int>(touch->type), touch->num_points);
        }
    }

    xcg_xcomponent_callback_v1 gCallbacks = {
        &OnSurfaceCreated,
        &OnSurfaceChanged,
        &OnSurfaceDestroyed,
        &DispatchTouchEvent,
    };

    napi_value Init(napi_env env, napi_value exports)
    {
        xcg::interop::InteropConfig config{};
        config.xcomponentApi = &xcg::ohos::OhosXComponentApi();
        config.hostObjectApi = &xcg::ohos::OhosHostObjectApi();
        config.logSink       = xcg::ohos::HilogSink();
        config.minLogLevel   = xcg::core::LogLevel::Info;

        const xcg::interop::InteropStatus status = xcg::interop::InitInterop(config);
        if (status != xcg::interop::InteropStatus::Ok)
        {
            XCG_LOG_ERROR(kLogCategory, "InitInterop failed: {}", xcg::interop::ToString(status));
            return exports;
        }

        const auto registered = xcg::xc::RegisterXComponentCallback(
            reinterpret_cast<xcg_host_env>(env),
            reinterpret_cast<xcg_host_value>(exports),
            xcg::xc::CallbackTableRef::FromStatic<gCallbacks>());
        if (!registered)
        {
            XCG_LOG_ERROR(kLogCategory, "callback registration failed: {}",
                          xcg::xc::ToString(registered.error().kind));
        }
        return exports;
    }

    napi_module gModule = {
        1,        // nm_version
        0,        // nm_flags
        nullptr,  // nm_filename
        Init,     // nm_register_func
        "xcomponentguard",
        nullptr,  // nm_priv
        { 0 },    // reserved
    };
} // namespace

extern "C" __attribute__((constructor)) void RegisterXComponentGuardModule()
{
    napi_module_register(&gModule);
}
