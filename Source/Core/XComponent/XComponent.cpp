// ============================================================================
// XComponentGuard - Source/Core/XComponent/XComponent.cpp
// ----------------------------------------------------------------------------
// Purpose : Checked calls from the XComponent handle into the bound native
//           table.
// Contract: No exceptions/RTTI; status codes forwarded untouched; only Error
//           and Fatal severities are logged.
// ============================================================================
#include "Core/XComponent/XComponent.hpp"

#include "Core/Diagnostics/Check.hpp"
#include "Core/Interop/InteropRuntime.hpp"
#include "Core/Interop/OutSlot.hpp"
#include "Core/Interop/XComponentAbi.hpp"

namespace xcg::xc
{
namespace
{
    constexpr const char* kLogCategory = "XComponent";
} // namespace

XComponent::XComponent(xcg_native_xcomponent* component, void* window) noexcept
    : mComponent(component)
    , mWindow(window)
{
#if XCG_DEBUG
    // Create() is the only caller and rejects null pointers first.
    if (mComponent == nullptr || mWindow == nullptr)
    {
        XCG_INTERNAL_DEBUG_BREAK();
    }
#endif
}

std::optional<XComponent> XComponent::Create(xcg_native_xcomponent* component, void* window) noexcept
{
    if (component == nullptr || window == nullptr)
    {
        return std::nullopt;
    }
    return XComponent(component, window);
}

Size XComponent::GetSize() const noexcept
{
    xcg_u64 width = 0;
    xcg_u64 height = 0;
    const xcg_status status = XComponentGetSize(interop::ActiveXComponentApi(), mComponent, mWindow, &width, &height);
    XCG_CHECK_FATAL(status == XCG_STATUS_OK, kLogCategory, "GetXComponentSize failed with {}", status);
    return Size(width, height);
}

std::expected<TouchEvent, NativeStatusError> XComponent::GetTouchEvent() const noexcept
{
    interop::OutSlot<TouchEvent> out;
    const xcg_status status = XComponentGetTouchEvent(interop::ActiveXComponentApi(), mComponent, mWindow, out.WritePtr());
    if (status != XCG_STATUS_OK)
    {
        XCG_LOG_ERROR(kLogCategory, "GetTouchEvent failed with {}", status);
    }
    return out.Take<NativeStatusError>(status);
}

std::expected<void, NativeStatusError> XComponent::RegisterCallback(CallbackTable callbacks) noexcept
{
    return RegisterCallback(CallbackTableRef::Leak(callbacks));
}

std::expected<void, NativeStatusError> XComponent::RegisterCallback(CallbackTableRef callbacks) noexcept
{
    const xcg_status status = XComponentRegisterCallback(interop::ActiveXComponentApi(), mComponent, callbacks.Get());
    if (status != XCG_STATUS_OK)
    {
        XCG_LOG_ERROR(kLogCategory, "RegisterCallback failed with {}", status);
        return std::unexpected(NativeStatusError{ status });
    }
    return {};
}

} // namespace xcg::xc
