#include "Core/Logger.hpp"
#include "Core/Types.hpp"
#include "Smoke/Support/FakeXComponentApi.hpp"

#include <string>

namespace
{
    using xcg::core::Logger;
    using xcg::core::LogLevel;

    void ResetCapture()
    {
        xcg::test::Captured() = xcg::test::CapturedLog{};
    }

    void RestoreDefaults()
    {
        Logger::SetSink(xcg::core::LogSink{});
        Logger::SetMinLevel(LogLevel::Error);
        Logger::SetCategoryEqualsFilter(nullptr);
    }
} // namespace

int RunLoggerSmoke()
{
    RestoreDefaults();
    ResetCapture();

    // Null sink: nothing is enabled, whatever the level.
    if (Logger::IsEnabled(LogLevel::Fatal, "Logger") || Logger::IsEnabled(LogLevel::Error, "Logger"))
    {
        return 1;
    }
    XCG_LOG_ERROR("Logger", "dropped {}", 1);
    if (xcg::test::Captured().count != 0)
    {
        return 2;
    }

    Logger::SetSink(xcg::test::CaptureLogSink());

    // Default level keeps Error and drops anything chattier.
    XCG_LOG_WARNING("Logger", "dropped");
    XCG_LOG_INFO("Logger", "dropped");
    if (xcg::test::Captured().count != 0)
    {
        RestoreDefaults();
        return 3;
    }
    XCG_LOG_ERROR("Logger", "code {} on {}", -2, "surface");
    const auto& log = xcg::test::Captured();
    if (log.count != 1 || log.lastLevel != LogLevel::Error || log.lastCategory != "Logger" ||
        log.lastMessage != "code -2 on surface")
    {
        RestoreDefaults();
        return 4;
    }

    Logger::SetMinLevel(LogLevel::Verbose);
    XCG_LOG_VERBOSE("Logger", "chatty");
    if (log.count != 2 || log.lastLevel != LogLevel::Verbose)
    {
        RestoreDefaults();
        return 5;
    }

    Logger::SetMinLevel(LogLevel::Disabled);
    XCG_LOG_ERROR("Logger", "dropped");
    if (log.count != 2)
    {
        RestoreDefaults();
        return 6;
    }
    Logger::SetMinLevel(LogLevel::Verbose);

    // Category filter is an exact match.
    Logger::SetCategoryEqualsFilter("XComponent");
    XCG_LOG_ERROR("Interop", "dropped");
    XCG_LOG_ERROR("XComponentX", "dropped");
    XCG_LOG_ERROR(nullptr, "dropped");
    XCG_LOG_ERROR("XComponent", "kept");
    if (log.count != 3 || log.lastCategory != "XComponent")
    {
        RestoreDefaults();
        return 7;
    }
    Logger::SetCategoryEqualsFilter(nullptr);

    // Oversized messages are cut to the buffer, never overrun.
    const std::string longText(XCG_LOG_BUFFER_SIZE * 2, 'x');
    XCG_LOG_INFO("Logger", "{}", longText);
    if (log.count != 4 || log.lastMessage.size() != XCG_LOG_BUFFER_SIZE)
    {
        RestoreDefaults();
        return 8;
    }

    // Format specs and 64-bit values go through std::format rules.
    const xcg::u64 wide = 18446744073709551615ull;
    XCG_LOG_INFO("Logger", "{:>4}|{}|{}x{}", "ok", wide, xcg::u64{ 1920 }, xcg::u64{ 1080 });
    if (log.count != 5 || log.lastMessage != "  ok|18446744073709551615|1920x1080")
    {
        RestoreDefaults();
        return 12;
    }

    const xcg::core::LogSink console = xcg::core::ConsoleLogSink();
    if (console.func == nullptr || console.user != nullptr)
    {
        RestoreDefaults();
        return 9;
    }
    if (std::string(xcg::core::ToShortLevel(LogLevel::Warn)) != "W")
    {
        RestoreDefaults();
        return 10;
    }

    RestoreDefaults();
    if (Logger::GetSink().func != nullptr || Logger::GetMinLevel() != LogLevel::Error)
    {
        return 11;
    }
    return 0;
}
