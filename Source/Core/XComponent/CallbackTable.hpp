// ============================================================================
// XComponentGuard - Source/Core/XComponent/CallbackTable.hpp
// ----------------------------------------------------------------------------
// Purpose : Callback table handed to the native runtime, plus the only
//           reference type registration accepts: one whose target is known
//           to live for the rest of the process.
// Contract: CallbackTableRef can only be produced from a table with static
//           storage duration (checked by the compiler) or by leaking a heap
//           copy. Leak() never returns ownership and nothing ever frees it.
// Notes   : The native registration call keeps the table address after it
//           returns and reads it later, possibly from another thread. A table
//           on the stack or one freed after registration is a use-after-free.
//           Do not mutate a table once it has been registered.
// ============================================================================

#pragma once

#include "Core/Abi/XcgXComponentApi.h"
#include "Core/Diagnostics/Check.hpp"

#include <new>
#include <type_traits>

// The escaped copy is a leak on purpose; LeakSanitizer is told so.
#if defined(__SANITIZE_ADDRESS__)
#  define XCG_LSAN_ENABLED 1
#elif defined(__has_feature)
#  if __has_feature(address_sanitizer) || __has_feature(leak_sanitizer)
#    define XCG_LSAN_ENABLED 1
#  endif
#endif
#ifndef XCG_LSAN_ENABLED
#  define XCG_LSAN_ENABLED 0
#endif

#if XCG_LSAN_ENABLED
#  include <sanitizer/lsan_interface.h>
#endif

namespace xcg::xc
{
    using CallbackTable = xcg_xcomponent_callback_v1;

    static_assert(std::is_trivially_copyable_v<CallbackTable>);

    class CallbackTableRef
    {
    public:
        // Purpose : Reference a table with static storage duration.
        // Contract: Table must be a namespace-scope or static object; the
        //           template argument rule rejects automatic storage at
        //           compile time.
        template <CallbackTable& Table>
        [[nodiscard]] static constexpr CallbackTableRef FromStatic() noexcept
        {
            return CallbackTableRef(&Table);
        }

        // Purpose : Escape a copy of `callbacks` to process lifetime.
        // Contract: Allocates once and never frees. Aborts if the allocation
        //           fails, since there is no table to register.
        [[nodiscard]] static CallbackTableRef Leak(const CallbackTable& callbacks) noexcept
        {
            CallbackTable* escaped = new (std::nothrow) CallbackTable(callbacks);
            XCG_CHECK_FATAL(escaped != nullptr, "XComponent", "out of memory escaping callback table");
#if XCG_LSAN_ENABLED
            __lsan_ignore_object(escaped);
#endif
            return CallbackTableRef(escaped);
        }

        [[nodiscard]] CallbackTable* Get() const noexcept { return mTable; }

    private:
        explicit constexpr CallbackTableRef(CallbackTable* table) noexcept
            : mTable(table)
        {
        }

        CallbackTable* mTable;
    };

} // namespace xcg::xc
