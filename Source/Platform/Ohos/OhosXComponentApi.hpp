// ============================================================================
// XComponentGuard - Source/Platform/Ohos/OhosXComponentApi.hpp
// ----------------------------------------------------------------------------
// Purpose : OpenHarmony implementations of the native XComponent table and
//           the host object-model table (libace_ndk + libace_napi).
// Contract: Returned tables have static storage and pass InitInterop
//           validation. No exceptions/RTTI.
// Notes   : Only built when CMake finds the OpenHarmony SDK.
// ============================================================================
#ifndef XCG_PLATFORM_OHOS_XCOMPONENT_API_HPP
#define XCG_PLATFORM_OHOS_XCOMPONENT_API_HPP

#include "Core/Abi/XcgHostObjectApi.h"
#include "Core/Abi/XcgXComponentApi.h"
#include "Core/Logger.hpp"

namespace xcg::ohos
{

[[nodiscard]] const xcg_xcomponent_api_v1& OhosXComponentApi() noexcept;
[[nodiscard]] const xcg_host_object_api_v1& OhosHostObjectApi() noexcept;

// Log sink writing through hilog (domain 0xFF00, tag "XComponentGuard").
[[nodiscard]] core::LogSink HilogSink() noexcept;

} // namespace xcg::ohos

#endif // XCG_PLATFORM_OHOS_XCOMPONENT_API_HPP
