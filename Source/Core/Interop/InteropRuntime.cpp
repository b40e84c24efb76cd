// ============================================================================
// XComponentGuard - Core/Interop/InteropRuntime.cpp
// ----------------------------------------------------------------------------
// Purpose : Implementation of the process-wide interop bindings.
// Contract: No exceptions/RTTI; status codes only; cold-path usage; issues
//           are reported at Error severity through the configured sink.
// Notes   : Bindings are plain atomics so the query path never locks.
// ============================================================================
#include "Core/Interop/InteropRuntime.hpp"

#include "Core/Interop/NullApis.hpp"

#include <atomic>

namespace xcg::interop
{
namespace
{
    constexpr const char* kLogCategory = "Interop";

    struct Bindings
    {
        std::atomic<const xcg_xcomponent_api_v1*>  xcomponent{ nullptr };
        std::atomic<const xcg_host_object_api_v1*> hostObject{ nullptr };
        std::atomic<bool>                          initialized{ false };
    };

    Bindings& GetBindings() noexcept
    {
        static Bindings bindings;
        return bindings;
    }

    InteropStatus ValidateHeader(const xcg_abi_header_v1& header, xcg_u32 expectedSize, InteropStatus sizeMismatch) noexcept
    {
        if (header.struct_size != expectedSize)
        {
            return sizeMismatch;
        }

        if (header.abi_version != XCG_ABI_VERSION_V1)
        {
            return InteropStatus::UnsupportedAbiVersion;
        }

        return InteropStatus::Ok;
    }
} // namespace

InteropStatus ValidateXComponentApi(const xcg_xcomponent_api_v1& api) noexcept
{
    const InteropStatus headerStatus = ValidateHeader(api.header,
                                                      static_cast<xcg_u32>(sizeof(xcg_xcomponent_api_v1)),
                                                      InteropStatus::InvalidXComponentApi);
    if (headerStatus != InteropStatus::Ok)
    {
        XCG_LOG_ERROR(kLogCategory, "XComponent api header rejected: {}", ToString(headerStatus));
        return headerStatus;
    }

    if (!api.get_size || !api.get_touch_event || !api.register_callback)
    {
        XCG_LOG_ERROR(kLogCategory, "XComponent api missing function pointer");
        return InteropStatus::InvalidXComponentApi;
    }

    return InteropStatus::Ok;
}

InteropStatus ValidateHostObjectApi(const xcg_host_object_api_v1& api) noexcept
{
    const InteropStatus headerStatus = ValidateHeader(api.header,
                                                      static_cast<xcg_u32>(sizeof(xcg_host_object_api_v1)),
                                                      InteropStatus::InvalidHostObjectApi);
    if (headerStatus != InteropStatus::Ok)
    {
        XCG_LOG_ERROR(kLogCategory, "Host object api header rejected: {}", ToString(headerStatus));
        return headerStatus;
    }

    if (!api.get_named_property || !api.type_of || !api.unwrap)
    {
        XCG_LOG_ERROR(kLogCategory, "Host object api missing function pointer");
        return InteropStatus::InvalidHostObjectApi;
    }

    return InteropStatus::Ok;
}

InteropStatus InitInterop(const InteropConfig& config) noexcept
{
    // The sink goes first so validation failures below are reported.
    core::Logger::SetSink(config.logSink);
    core::Logger::SetMinLevel(config.minLogLevel);

    const xcg_xcomponent_api_v1& xcomponent = config.xcomponentApi ? *config.xcomponentApi : NullXComponentApi();
    const xcg_host_object_api_v1& hostObject = config.hostObjectApi ? *config.hostObjectApi : NullHostObjectApi();

    InteropStatus status = ValidateXComponentApi(xcomponent);
    if (status != InteropStatus::Ok)
    {
        return status;
    }

    status = ValidateHostObjectApi(hostObject);
    if (status != InteropStatus::Ok)
    {
        return status;
    }

    Bindings& bindings = GetBindings();
    bindings.xcomponent.store(&xcomponent, std::memory_order_release);
    bindings.hostObject.store(&hostObject, std::memory_order_release);
    bindings.initialized.store(true, std::memory_order_release);
    return InteropStatus::Ok;
}

void ShutdownInterop() noexcept
{
    Bindings& bindings = GetBindings();
    bindings.xcomponent.store(nullptr, std::memory_order_release);
    bindings.hostObject.store(nullptr, std::memory_order_release);
    bindings.initialized.store(false, std::memory_order_release);

    core::Logger::SetSink(core::LogSink{});
    core::Logger::SetMinLevel(core::LogLevel::Error);
}

bool IsInteropInitialized() noexcept
{
    return GetBindings().initialized.load(std::memory_order_acquire);
}

const xcg_xcomponent_api_v1& ActiveXComponentApi() noexcept
{
    const xcg_xcomponent_api_v1* api = GetBindings().xcomponent.load(std::memory_order_acquire);
    return api ? *api : NullXComponentApi();
}

const xcg_host_object_api_v1& ActiveHostObjectApi() noexcept
{
    const xcg_host_object_api_v1* api = GetBindings().hostObject.load(std::memory_order_acquire);
    return api ? *api : NullHostObjectApi();
}

const char* ToString(InteropStatus status) noexcept
{
    switch (status)
    {
        case InteropStatus::Ok:                    return "Ok";
        case InteropStatus::InvalidXComponentApi:  return "InvalidXComponentApi";
        case InteropStatus::InvalidHostObjectApi:  return "InvalidHostObjectApi";
        case InteropStatus::UnsupportedAbiVersion: return "UnsupportedAbiVersion";
        default:                                   return "Unknown";
    }
}

} // namespace xcg::interop
