// ============================================================================
// XComponentGuard - Core/Interop/InteropRuntime.hpp
// ----------------------------------------------------------------------------
// Purpose : Process-wide binding of the native XComponent table, the host
//           object-model table and the log sink. Resolved once at start-up
//           (module init), then read by every XComponent operation.
// Contract: No exceptions/RTTI; returns InteropStatus; tables are validated
//           (struct_size, abi_version, non-null entries) before being bound;
//           a rejected config leaves the bound tables untouched (the log
//           sink and level are applied first so the rejection is reported).
// Notes   : Tables are referenced, not copied, and must outlive every call
//           that may reach them (static storage in practice). Readers are
//           lock-free; Init/Shutdown are cold-path and should not race with
//           each other.
// ============================================================================
#ifndef XCG_INTEROP_INTEROP_RUNTIME_HPP
#define XCG_INTEROP_INTEROP_RUNTIME_HPP

#include "Core/Abi/XcgHostObjectApi.h"
#include "Core/Abi/XcgXComponentApi.h"
#include "Core/Logger.hpp"
#include "Core/Types.hpp"

namespace xcg::interop
{

enum class InteropStatus : xcg::u8
{
    Ok = 0,
    InvalidXComponentApi,
    InvalidHostObjectApi,
    UnsupportedAbiVersion
};

struct InteropConfig
{
    const xcg_xcomponent_api_v1*  xcomponentApi = nullptr; // nullptr selects NullXComponentApi().
    const xcg_host_object_api_v1* hostObjectApi = nullptr; // nullptr selects NullHostObjectApi().
    core::LogSink                 logSink{};               // Null sink by default.
    core::LogLevel                minLogLevel = core::LogLevel::Error;
};

// Purpose : Validate and bind the tables and log sink in config.
// Contract: Idempotent; may be called again to rebind. No throw.
[[nodiscard]] InteropStatus InitInterop(const InteropConfig& config) noexcept;

// Purpose : Restore the null tables and the null log sink.
// Contract: Safe to call multiple times; no throw.
void ShutdownInterop() noexcept;

[[nodiscard]] bool IsInteropInitialized() noexcept;

// Never null; the null table when nothing is bound.
[[nodiscard]] const xcg_xcomponent_api_v1& ActiveXComponentApi() noexcept;
[[nodiscard]] const xcg_host_object_api_v1& ActiveHostObjectApi() noexcept;

[[nodiscard]] InteropStatus ValidateXComponentApi(const xcg_xcomponent_api_v1& api) noexcept;
[[nodiscard]] InteropStatus ValidateHostObjectApi(const xcg_host_object_api_v1& api) noexcept;

[[nodiscard]] const char* ToString(InteropStatus status) noexcept;

} // namespace xcg::interop

#endif // XCG_INTEROP_INTEROP_RUNTIME_HPP
