#include "Core/XComponent/XComponent.hpp"

namespace
{
    using namespace xcg::xc;

    static_assert(!std::is_copy_constructible_v<XComponent>, "XComponent must not be copyable.");
    static_assert(std::is_move_constructible_v<XComponent>, "Create() returns the handle inside std::optional.");
    static_assert(!std::is_move_assignable_v<XComponent>, "A handle must not be reseated into another one.");
    static_assert(std::is_trivially_copyable_v<Size>);

    CallbackTable gTable{};

    void UseXComponent() noexcept
    {
        constexpr CallbackTableRef ref = CallbackTableRef::FromStatic<gTable>();
        auto xc = XComponent::Create(nullptr, nullptr);
        if (xc)
        {
            (void)xc->RegisterCallback(ref);
        }
        constexpr Size size(4, 3);
        static_assert(size.Width() == 4 && size.Height() == 3);
        (void)ToString(RegisterCallbackErrorKind::UnwrapXComponentFailed);
    }
}
