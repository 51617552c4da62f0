#pragma once

#include "wellscan/log/Log.hpp"

#include <cmath>

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { wellscan::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { wellscan::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_NEAR(a,b,tol,msg) \
    do { double _va=(a); double _vb=(b); if (!(std::fabs(_va-_vb) <= (tol))) { wellscan::logError("ASSERT NEAR FAILED: ", (msg), \
        "  (", _va, " vs ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

inline int finishTests(const char* suite) {
    if (g_failures) {
        wellscan::logError(suite, " tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    wellscan::logInfo(suite, " tests passed.\n");
    return 0;
}
