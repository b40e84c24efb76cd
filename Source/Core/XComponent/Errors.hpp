// ============================================================================
// XComponentGuard - Source/Core/XComponent/Errors.hpp
// ----------------------------------------------------------------------------
// Purpose : Typed failures returned by XComponent operations.
// Contract: Header-only, trivially copyable, no allocations. Status codes
//           are the raw platform values, never remapped.
// Notes   : Messages are static ASCII literals.
// ============================================================================

#pragma once

#include "Core/Abi/XcgAbi.h"
#include "Core/Types.hpp"

#include <type_traits>

namespace xcg::xc
{
    // Non-zero status reported by a native XComponent call.
    struct NativeStatusError
    {
        xcg_status code = XCG_STATUS_OK;
    };

    enum class RegisterCallbackErrorKind : xcg::u8
    {
        XComponentPropertyMissing = 0, // exports has no usable XComponent object
        UnwrapXComponentFailed,        // the host could not unwrap the native pointer
        RegisterCallbackFailed         // the native registration call failed
    };

    struct RegisterCallbackError
    {
        RegisterCallbackErrorKind kind    = RegisterCallbackErrorKind::RegisterCallbackFailed;
        xcg_status                status  = XCG_STATUS_OK; // Host status for the first two kinds, native otherwise.
        const char*               message = "";
    };

    static_assert(std::is_trivially_copyable_v<NativeStatusError>);
    static_assert(std::is_trivially_copyable_v<RegisterCallbackError>);

    [[nodiscard]] constexpr const char* ToString(RegisterCallbackErrorKind kind) noexcept
    {
        switch (kind)
        {
            case RegisterCallbackErrorKind::XComponentPropertyMissing: return "XComponentPropertyMissing";
            case RegisterCallbackErrorKind::UnwrapXComponentFailed:    return "UnwrapXComponentFailed";
            case RegisterCallbackErrorKind::RegisterCallbackFailed:    return "RegisterCallbackFailed";
            default:                                                   return "Unknown";
        }
    }

} // namespace xcg::xc
