// ============================================================================
// XComponentGuard - Source/Core/XComponent/HostRegistration.hpp
// ----------------------------------------------------------------------------
// Purpose : Register an XComponent callback table from module init, starting
//           from the host exports object instead of a native pointer.
// Contract: No exceptions/RTTI. Steps run in order (property lookup, unwrap,
//           native registration); the first failure is returned and later
//           steps do not run. Every failure is logged at Error severity.
// Notes   : Uses the host object table and native table bound by InitInterop.
//           Only CallbackTableRef is accepted, so the table outlives the call.
// ============================================================================

#pragma once

#include "Core/Abi/XcgHostObjectApi.h"
#include "Core/XComponent/CallbackTable.hpp"
#include "Core/XComponent/Errors.hpp"

#include <expected>

namespace xcg::xc
{
    // Purpose : Look up XCG_NATIVE_XCOMPONENT_OBJ on exports, unwrap it and
    //           register `callbacks` with the native component found there.
    // Contract: env/exports come from the host module-init call and are only
    //           used for its duration.
    [[nodiscard]] std::expected<void, RegisterCallbackError>
    RegisterXComponentCallback(xcg_host_env env, xcg_host_value exports, CallbackTableRef callbacks) noexcept;

} // namespace xcg::xc
