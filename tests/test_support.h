#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

#include "GachaErrors.h"
#include "ModelRegistry.h"
#include "PityModel.h"
#include <cmath>
#include <cstdio>
#include <iostream>
#include <string>

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
        return 1; \
    } \
} while (0)

#define RUN_TEST(fn) do { \
    if (fn() != 0) { \
        fprintf(stderr, "  in %s\n", #fn); \
        return 1; \
    } \
} while (0)

namespace TestSupport {

    inline bool near(double a, double b, double tolerance) {
        return std::fabs(a - b) <= tolerance;
    }

    // Runs fn and reports whether it threw exactly E. Any other exception
    // propagates and fails the test executable.
    template <typename E, typename Fn>
    bool throws(Fn fn) {
        try {
            fn();
        } catch (const E&) {
            return true;
        }
        return false;
    }

    // Hit on every pull, 50/50 with guarantee after a loss: E = 1.5.
    inline Gacha::PityModelConfig referenceConfig() {
        Gacha::PityModelConfig c;
        c.game = "test";
        c.pool = "reference";
        c.baseRate = 1.0;
        c.softPityStart = 1;
        c.rampRate = 0.0;
        c.hardPity = 1;
        c.hasFiftyFifty = true;
        c.upProbability = 0.5;
        c.guaranteeAfterLoss = true;
        c.defaultTrials = 20000;
        return c;
    }

    inline Gacha::SimulationLimits testLimits() {
        Gacha::SimulationLimits limits;
        limits.minTrials = 2000;
        limits.maxTrials = 5000000;
        limits.maxPullsPerTrial = 1000000;
        return limits;
    }

    // Mutes [Init]/[Monitor]/[Analysis] output for the test's lifetime.
    class QuietLog {
    public:
        QuietLog() : m_saved(std::clog.rdbuf(nullptr)) {}
        ~QuietLog() { std::clog.rdbuf(m_saved); }

    private:
        std::streambuf* m_saved;
    };

} // namespace TestSupport

#endif // TEST_SUPPORT_H
