#pragma once

#include "log.hpp"

#include <cmath>

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { log_errorf("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { log_errorf("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_NEAR(a,b,tol,msg) \
    do { double _va=(a); double _vb=(b); if (!(std::fabs(_va - _vb) <= (tol))) { log_errorf("ASSERT NEAR FAILED: ", (msg), \
        "  (", _va, " vs ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_THROWS(expr, ExceptionType, msg) \
    do { bool _thrown = false; \
        try { (void)(expr); } catch (const ExceptionType&) { _thrown = true; } \
        if (!_thrown) { log_errorf("ASSERT THROWS FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static int finish_tests(const char* suite) {
    if (g_failures) {
        log_errorf(suite, " tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    log_infof(suite, " tests passed.\n");
    return 0;
}
