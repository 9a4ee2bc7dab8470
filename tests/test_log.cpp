#include "lamina/geometry/MultiPassGeometry.hpp"
#include "lamina/log/Log.hpp"

#include <cstdio>
#include <string>
#include <string_view>

using namespace lamina;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { std::fprintf(stderr, "ASSERT TRUE FAILED: %s @ %s:%d\n", msg, __FILE__, __LINE__); \
        ++g_failures; } } while(0)

static void testHandlersCapture() {
    std::string info;
    std::string error;
    {
        lamina::log::ScopedLogHandlers capture(
            [&info](std::string_view m) { info.append(m); },
            [&error](std::string_view m) { error.append(m); });

        logInfo("passes=", 2, " warmup=", 12.5, "\n");
        logError("plain message\n");
    }
    ASSERT_TRUE(info == "passes=2 warmup=12.5\n", "variadic info message built");
    ASSERT_TRUE(error == "plain message\n", "error routed to error handler");

    logInfo("");
    ASSERT_TRUE(info == "passes=2 warmup=12.5\n", "handlers restored after scope");
}

static void testLibraryDiagnostics() {
    std::string error;
    lamina::log::ScopedLogHandlers capture(
        [](std::string_view) {},
        [&error](std::string_view m) { error.append(m); });

    auto rejected = lamina::geometry::MultiPassGeometry::create(10.0, 10.0, 0.0, 2.0);
    ASSERT_TRUE(!rejected, "zero dwell time rejected");
    ASSERT_TRUE(error.find("[MultiPassGeometry]") != std::string::npos, "component prefix logged");
    ASSERT_TRUE(error.find("dwell_time") != std::string::npos, "offending field logged");
}

int main() {
    testHandlersCapture();
    testLibraryDiagnostics();

    if (g_failures) {
        std::fprintf(stderr, "Tests failed: %d failure(s)\n", g_failures);
        return 1;
    }
    std::puts("Log tests passed.");
    return 0;
}
