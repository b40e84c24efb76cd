// ============================================================================
// XComponentGuard - Source/Core/XComponent/XComponent.hpp
// ----------------------------------------------------------------------------
// Purpose : Validated, non-owning handle over the two pointers the native
//           runtime passes to every XComponent callback (component, window),
//           with the checked size, touch-event and registration operations.
// Contract: No exceptions/RTTI. Both pointers are non-null for the whole
//           life of the handle; the handle never frees or mutates them.
//           Operations go through the table bound by InitInterop.
// Notes   : Valid only inside the native callback invocation that supplied
//           the pointers. The handle is non-copyable so it cannot be stashed
//           by accident. The move constructor exists only so Create() can
//           return it inside std::optional; keep that optional a local of the
//           callback and never move the handle into longer-lived storage.
//           Thread-safety: none needed, the handle holds no mutable state.
//
// Example :
//   void OnSurfaceCreated(xcg_native_xcomponent* component, void* window)
//   {
//       auto xc = xcg::xc::XComponent::Create(component, window);
//       if (!xc) return;
//       const xcg::xc::Size size = xc->GetSize();
//       ...
//   }
// ============================================================================

#pragma once

#include "Core/Abi/XcgXComponentApi.h"
#include "Core/XComponent/CallbackTable.hpp"
#include "Core/XComponent/Errors.hpp"
#include "Core/XComponent/Size.hpp"

#include <expected>
#include <optional>

namespace xcg::xc
{
    using TouchEvent = xcg_touch_event_v1;

    class XComponent
    {
    public:
        // Purpose : Single admission point for native pointers.
        // Contract: Engaged iff both pointers are non-null. No side effects.
        [[nodiscard]] static std::optional<XComponent> Create(xcg_native_xcomponent* component, void* window) noexcept;

        XComponent(const XComponent&) = delete;
        XComponent& operator=(const XComponent&) = delete;
        XComponent(XComponent&&) noexcept = default; // For std::optional return only.
        XComponent& operator=(XComponent&&) = delete;
        ~XComponent() = default;

        // Purpose : Current pixel size of the surface.
        // Contract: The platform guarantees success for a valid handle; a
        //           non-zero status logs at Fatal severity and aborts.
        [[nodiscard]] Size GetSize() const noexcept;

        // Purpose : Latest pending touch event.
        // Contract: On non-zero status returns the raw code and logs it at
        //           Error severity; the event storage is never read then.
        [[nodiscard]] std::expected<TouchEvent, NativeStatusError> GetTouchEvent() const noexcept;

        // Purpose : Register callbacks from a table value.
        // Contract: Escapes the table with CallbackTableRef::Leak before the
        //           native call; the copy is never freed, even on failure.
        [[nodiscard]] std::expected<void, NativeStatusError> RegisterCallback(CallbackTable callbacks) noexcept;

        // Purpose : Register callbacks from a process-lifetime table.
        // Contract: No allocation. Not guarded: a second call reaches the
        //           native runtime again.
        [[nodiscard]] std::expected<void, NativeStatusError> RegisterCallback(CallbackTableRef callbacks) noexcept;

        [[nodiscard]] xcg_native_xcomponent* NativeComponent() const noexcept { return mComponent; }
        [[nodiscard]] void* NativeWindow() const noexcept { return mWindow; }

    private:
        XComponent(xcg_native_xcomponent* component, void* window) noexcept;

        xcg_native_xcomponent* mComponent; // Non-null, not owned.
        void*                  mWindow;    // Non-null, not owned.
    };

} // namespace xcg::xc
