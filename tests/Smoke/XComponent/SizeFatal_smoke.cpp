// Size queries abort instead of returning a value when the platform reports
// failure. Verified in a forked child so the smoke runner survives.
#include "Core/Interop/InteropRuntime.hpp"
#include "Core/Platform/PlatformDefines.hpp"
#include "Core/XComponent/XComponent.hpp"
#include "Smoke/Support/AbortCheck.hpp"
#include "Smoke/Support/FakeXComponentApi.hpp"

int RunSizeFatalSmoke()
{
#if XCG_PLATFORM_POSIX
    if (!xcg::test::InstallFakes())
    {
        return 1;
    }

    const bool abortedOnStatus = xcg::test::DiesWithAbort([] {
        xcg::test::NativeState().sizeStatus = XCG_XCOMPONENT_RESULT_FAILED;
        const auto xc = xcg::xc::XComponent::Create(xcg::test::FakeComponent(), xcg::test::FakeWindow());
        if (xc)
        {
            (void)xc->GetSize();
        }
    });
    if (!abortedOnStatus)
    {
        xcg::interop::ShutdownInterop();
        return 2;
    }

    // Nothing bound: the null table fails, which is just as fatal.
    const bool abortedUnbound = xcg::test::DiesWithAbort([] {
        xcg::interop::ShutdownInterop();
        const auto xc = xcg::xc::XComponent::Create(xcg::test::FakeComponent(), xcg::test::FakeWindow());
        if (xc)
        {
            (void)xc->GetSize();
        }
    });
    if (!abortedUnbound)
    {
        xcg::interop::ShutdownInterop();
        return 3;
    }

    // The parent's fakes were untouched by the children.
    if (xcg::test::NativeState().sizeStatus != XCG_XCOMPONENT_RESULT_SUCCESS ||
        xcg::test::NativeState().sizeCalls != 0)
    {
        xcg::interop::ShutdownInterop();
        return 4;
    }

    xcg::interop::ShutdownInterop();
#endif
    return 0;
}
