// ============================================================================
// XComponentGuard - Source/Core/Interop/NullApis.hpp
// ----------------------------------------------------------------------------
// Purpose : Null native and host tables that satisfy the ABI shape without
//           talking to any platform. Bound by default until a host installs
//           the real platform tables through InitInterop.
// Contract: Header-only, no exceptions/RTTI, no allocations. Every entry
//           leaves its outputs untouched and reports a failure code.
// Notes   : A size query against the null table aborts the process, because
//           no platform is bound yet.
// ============================================================================

#pragma once

#include "Core/Abi/XcgHostObjectApi.h"
#include "Core/Abi/XcgXComponentApi.h"

namespace xcg::interop
{
    namespace detail
    {
        inline xcg_status XCG_ABI_CALL NullGetSize(xcg_native_xcomponent*, const void*, xcg_u64*, xcg_u64*) noexcept
        {
            return XCG_XCOMPONENT_RESULT_FAILED;
        }

        inline xcg_status XCG_ABI_CALL NullGetTouchEvent(xcg_native_xcomponent*, const void*, xcg_touch_event_v1*) noexcept
        {
            return XCG_XCOMPONENT_RESULT_FAILED;
        }

        inline xcg_status XCG_ABI_CALL NullRegisterCallback(xcg_native_xcomponent*, xcg_xcomponent_callback_v1*) noexcept
        {
            return XCG_XCOMPONENT_RESULT_FAILED;
        }

        inline xcg_status XCG_ABI_CALL NullGetNamedProperty(xcg_host_env, xcg_host_value, const char*, xcg_host_value*) noexcept
        {
            return XCG_HOST_STATUS_GENERIC_FAILURE;
        }

        inline xcg_status XCG_ABI_CALL NullTypeOf(xcg_host_env, xcg_host_value, xcg_host_value_type*) noexcept
        {
            return XCG_HOST_STATUS_GENERIC_FAILURE;
        }

        inline xcg_status XCG_ABI_CALL NullUnwrap(xcg_host_env, xcg_host_value, void**) noexcept
        {
            return XCG_HOST_STATUS_GENERIC_FAILURE;
        }
    } // namespace detail

    [[nodiscard]] inline const xcg_xcomponent_api_v1& NullXComponentApi() noexcept
    {
        static const xcg_xcomponent_api_v1 api = {
            { static_cast<xcg_u32>(sizeof(xcg_xcomponent_api_v1)), XCG_ABI_VERSION_V1 },
            &detail::NullGetSize,
            &detail::NullGetTouchEvent,
            &detail::NullRegisterCallback,
        };
        return api;
    }

    [[nodiscard]] inline const xcg_host_object_api_v1& NullHostObjectApi() noexcept
    {
        static const xcg_host_object_api_v1 api = {
            { static_cast<xcg_u32>(sizeof(xcg_host_object_api_v1)), XCG_ABI_VERSION_V1 },
            &detail::NullGetNamedProperty,
            &detail::NullTypeOf,
            &detail::NullUnwrap,
        };
        return api;
    }

} // namespace xcg::interop
