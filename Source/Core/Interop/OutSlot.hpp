// ============================================================================
// XComponentGuard - Source/Core/Interop/OutSlot.hpp
// ----------------------------------------------------------------------------
// Purpose : Write-only output slot for C out-parameters. The native side fills
//           the storage; the C++ side can only read it after a zero status.
// Contract: Header-only, no exceptions/RTTI, no allocations. T must be
//           trivially copyable and implicit-lifetime (C POD records).
// Notes   : Storage is deliberately left uninitialized; there is no accessor
//           that returns the value without a status check.
// ============================================================================

#pragma once

#include "Core/Abi/XcgAbi.h"

#include <cstddef>
#include <cstring>
#include <expected>
#include <type_traits>

namespace xcg::interop
{
    template <typename T>
    class OutSlot
    {
        static_assert(std::is_trivially_copyable_v<T>, "OutSlot requires a trivially copyable C record.");
        static_assert(std::is_standard_layout_v<T>, "OutSlot requires a standard layout C record.");

    public:
        OutSlot() noexcept = default;
        OutSlot(const OutSlot&) = delete;
        OutSlot& operator=(const OutSlot&) = delete;

        // Address handed to the native call. Never dereferenced on this side.
        [[nodiscard]] T* WritePtr() noexcept { return reinterpret_cast<T*>(mStorage); }

        // Purpose : Convert a native status into the slot's value or the code.
        // Contract: Reads the storage only when status == XCG_STATUS_OK.
        template <typename Error>
        [[nodiscard]] std::expected<T, Error> Take(xcg_status status) const noexcept
        {
            if (status != XCG_STATUS_OK)
            {
                return std::unexpected(Error{ status });
            }

            T value;
            std::memcpy(&value, mStorage, sizeof(T));
            return value;
        }

    private:
        alignas(T) std::byte mStorage[sizeof(T)];
    };

} // namespace xcg::interop
