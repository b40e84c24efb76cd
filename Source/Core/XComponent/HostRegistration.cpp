// ============================================================================
// XComponentGuard - Source/Core/XComponent/HostRegistration.cpp
// ----------------------------------------------------------------------------
// Purpose : Exports lookup + unwrap + native registration.
// Contract: No exceptions/RTTI; status codes forwarded untouched.
// ============================================================================
#include "Core/XComponent/HostRegistration.hpp"

#include "Core/Interop/InteropRuntime.hpp"
#include "Core/Interop/XComponentAbi.hpp"
#include "Core/Logger.hpp"

namespace xcg::xc
{
namespace
{
    constexpr const char* kLogCategory = "XComponent";

    std::unexpected<RegisterCallbackError> Fail(RegisterCallbackErrorKind kind, xcg_status status, const char* message) noexcept
    {
        XCG_LOG_ERROR(kLogCategory, "{}: {} (status {})", ToString(kind), message, status);
        return std::unexpected(RegisterCallbackError{ kind, status, message });
    }
} // namespace

std::expected<void, RegisterCallbackError>
RegisterXComponentCallback(xcg_host_env env, xcg_host_value exports, CallbackTableRef callbacks) noexcept
{
    const xcg_host_object_api_v1& host = interop::ActiveHostObjectApi();

    xcg_host_value wrapper = nullptr;
    xcg_status status = HostGetNamedProperty(host, env, exports, XCG_NATIVE_XCOMPONENT_OBJ, &wrapper);
    if (status != XCG_HOST_STATUS_OK)
    {
        return Fail(RegisterCallbackErrorKind::XComponentPropertyMissing, status,
                    "lookup of " XCG_NATIVE_XCOMPONENT_OBJ " on exports failed");
    }

    xcg_host_value_type type = XCG_HOST_VALUE_UNDEFINED;
    status = HostTypeOf(host, env, wrapper, &type);
    if (status != XCG_HOST_STATUS_OK)
    {
        return Fail(RegisterCallbackErrorKind::XComponentPropertyMissing, status,
                    "type query of " XCG_NATIVE_XCOMPONENT_OBJ " failed");
    }
    if (type != XCG_HOST_VALUE_OBJECT)
    {
        return Fail(RegisterCallbackErrorKind::XComponentPropertyMissing, XCG_HOST_STATUS_OBJECT_EXPECTED,
                    XCG_NATIVE_XCOMPONENT_OBJ " is not an object");
    }

    void* native = nullptr;
    status = HostUnwrap(host, env, wrapper, &native);
    if (status != XCG_HOST_STATUS_OK)
    {
        return Fail(RegisterCallbackErrorKind::UnwrapXComponentFailed, status,
                    "unwrap of " XCG_NATIVE_XCOMPONENT_OBJ " failed");
    }
    if (native == nullptr)
    {
        return Fail(RegisterCallbackErrorKind::UnwrapXComponentFailed, XCG_XCOMPONENT_RESULT_BAD_PARAMETER,
                    "unwrap of " XCG_NATIVE_XCOMPONENT_OBJ " produced a null component");
    }

    status = XComponentRegisterCallback(interop::ActiveXComponentApi(),
                                        static_cast<xcg_native_xcomponent*>(native),
                                        callbacks.Get());
    if (status != XCG_XCOMPONENT_RESULT_SUCCESS)
    {
        return Fail(RegisterCallbackErrorKind::RegisterCallbackFailed, status,
                    "native callback registration failed");
    }

    return {};
}

} // namespace xcg::xc
