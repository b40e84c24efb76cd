// ============================================================================
// XComponentGuard - tests/AllSmokes/LoggingDisabledSmokes_main.cpp
// ----------------------------------------------------------------------------
// Purpose : Runs the smokes that need a core built with XCG_ENABLE_LOGGING=0.
// Contract: Returns 0 on success.
// ============================================================================

#include <cstdio>

int RunLoggingDisabledSmoke();

int main()
{
    const int code = RunLoggingDisabledSmoke();
    if (code != 0)
    {
        std::fprintf(stderr, "[LoggingDisabledSmokes] LoggingDisabled failed with code %d\n", code);
        return 1;
    }
    return 0;
}
