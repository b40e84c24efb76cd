#include "Core/Interop/InteropRuntime.hpp"
#include "Core/Interop/NullApis.hpp"
#include "Core/Interop/OutSlot.hpp"
#include "Core/Interop/XComponentAbi.hpp"

namespace
{
    struct Status
    {
        xcg_status code;
    };

    static_assert(sizeof(xcg::interop::OutSlot<xcg_touch_event_v1>) >= sizeof(xcg_touch_event_v1));

    void UseInterop() noexcept
    {
        const xcg_xcomponent_api_v1& api = xcg::interop::NullXComponentApi();
        xcg::interop::OutSlot<xcg_touch_event_v1> slot;
        const xcg_status status = xcg::XComponentGetTouchEvent(api, nullptr, nullptr, slot.WritePtr());
        const auto taken = slot.Take<Status>(status);
        (void)taken;
        (void)xcg::interop::ValidateXComponentApi(api);
    }
}
