// ============================================================================
// XComponentGuard - Source/Core/XComponent/Size.hpp
// ----------------------------------------------------------------------------
// Purpose : Immutable pixel size of an XComponent surface.
// Contract: Header-only, trivially copyable, returned by value.
// ============================================================================

#pragma once

#include "Core/Types.hpp"

#include <type_traits>

namespace xcg::xc
{
    class Size
    {
    public:
        constexpr Size(xcg::u64 width, xcg::u64 height) noexcept
            : mWidth(width)
            , mHeight(height)
        {
        }

        [[nodiscard]] constexpr xcg::u64 Width() const noexcept { return mWidth; }
        [[nodiscard]] constexpr xcg::u64 Height() const noexcept { return mHeight; }

        [[nodiscard]] friend constexpr bool operator==(const Size&, const Size&) noexcept = default;

    private:
        xcg::u64 mWidth;
        xcg::u64 mHeight;
    };

    static_assert(std::is_trivially_copyable_v<Size>);

} // namespace xcg::xc
