/*
Exact expectation solver tests.
*/
#include "test_support.h"
#include "ExpectationSolver.h"

using namespace Gacha;
using TestSupport::near;
using TestSupport::throws;

static int test_reference_configuration(void)
{
    PityModel model(TestSupport::referenceConfig());
    ExpectationSolver solver(model);

    EXPECT(near(solver.expectedPulls({0, false, 0}, 1), 1.5, 1e-12), "reference mean is 1.5");
    EXPECT(near(solver.expectedPulls({0, true, 0}, 1), 1.0, 1e-12), "guaranteed start takes one pull");
    EXPECT(near(solver.expectedPulls({0, false, 0}, 2), 3.0, 1e-12), "two copies take 3.0");
    EXPECT(near(expectedPulls(model, {0, true, 0}, 3), 4.0, 1e-12), "guaranteed then two fresh copies");
    EXPECT(solver.layerCount() == 2, "no counter means two layers");
    return 0;
}

static int test_geometric_without_fifty_fifty(void)
{
    PityModelConfig c = TestSupport::referenceConfig();
    c.baseRate = 0.25;
    c.softPityStart = 1000;
    c.hardPity = 1000;
    c.hasFiftyFifty = false;
    PityModel model(c);

    EXPECT(near(expectedPulls(model, {0, false, 0}, 1), 4.0, 1e-9), "flat 25% rate averages 4 pulls");
    return 0;
}

static int test_self_loop_closed_form(void)
{
    PityModelConfig c = TestSupport::referenceConfig();
    c.guaranteeAfterLoss = false;
    PityModel model(c);

    EXPECT(near(expectedPulls(model, {0, false, 0}, 1), 2.0, 1e-12), "coin flip without guarantee averages 2");
    EXPECT(near(expectedPulls(model, {0, false, 0}, 3), 6.0, 1e-12), "independent copies add up");
    return 0;
}

static int test_fifty_fifty_decomposition(void)
{
    ModelRegistry registry;
    registry.initializeWithBuiltinTables();
    const PityModel& model = registry.lookup("hsr", "character");
    ExpectationSolver solver(model);

    const double guaranteed = solver.expectedPullsForOne({0, true, 0});
    const double fresh = solver.expectedPullsForOne({0, false, 0});
    EXPECT(guaranteed > 50.0 && guaranteed < 90.0, "guaranteed expectation within the pity window");
    EXPECT(near(fresh, guaranteed * (1.0 + (1.0 - 0.5625)), 1e-9), "lost flip costs one more guaranteed cycle");

    const double last = solver.expectedPullsForOne({89, false, 0});
    EXPECT(near(last, 1.0 + (1.0 - 0.5625) * guaranteed, 1e-9), "hard pity resolves in one pull plus the loss");

    EXPECT(solver.expectedPullsForOne({80, false, 0}) < fresh, "higher pity needs fewer pulls");
    return 0;
}

static int test_additivity_without_residue(void)
{
    ModelRegistry registry;
    registry.initializeWithBuiltinTables();
    const PityModel& model = registry.lookup("hsr", "character");
    ExpectationSolver solver(model);

    const PullState start{37, true, 0};
    const double one = solver.expectedPullsForOne(start);
    const double fromReset = solver.expectedPullsForOne(model.resetState());
    EXPECT(near(solver.expectedPulls(start, 3), one + 2.0 * fromReset, 1e-9), "later copies start from reset");
    return 0;
}

static int test_streak_residual_state(void)
{
    PityModelConfig c = TestSupport::referenceConfig();
    c.accelerator = {AcceleratorKind::STREAK_BONUS, 1, 0.0};
    PityModel model(c);
    ExpectationSolver solver(model);

    // Half the first copies leave a full streak behind, which makes the
    // second copy a single pull.
    EXPECT(near(solver.expectedPulls({0, false, 0}, 1), 1.5, 1e-12), "first copy");
    EXPECT(near(solver.expectedPulls({0, false, 0}, 2), 2.75, 1e-12), "residual streak shortens the second copy");
    EXPECT(near(solver.expectedPulls({0, false, 1}, 1), 1.0, 1e-12), "full streak wins at once");
    EXPECT(solver.layerCount() == 4, "streak of one doubles the layers");
    return 0;
}

static int test_points_guarantee(void)
{
    PityModelConfig c = TestSupport::referenceConfig();
    c.guaranteeAfterLoss = false;
    c.accelerator = {AcceleratorKind::POINTS_GUARANTEE, 2, 0.0};
    PityModel model(c);

    EXPECT(near(expectedPulls(model, {0, false, 0}, 1), 1.75, 1e-12), "two points to the guarantee");
    EXPECT(near(expectedPulls(model, {0, false, 1}, 1), 1.5, 1e-12), "one point already banked");
    EXPECT(near(expectedPulls(model, {0, false, 2}, 1), 1.0, 1e-12), "full points normalize to a guarantee");
    return 0;
}

static int test_builtin_pools_solve(void)
{
    ModelRegistry registry;
    registry.initializeWithBuiltinTables();
    for (const std::string& key : registry.keys()) {
        const std::string game = key.substr(0, key.find('-'));
        const std::string pool = key.substr(key.find('-') + 1);
        const PityModel& model = registry.lookup(game, pool);
        const double mean = expectedPulls(model, model.resetState(), 1);
        EXPECT(mean > 1.0 && mean < 2.0 * model.config().hardPity * (model.config().accelerator.threshold + 2),
               "built-in pool has a finite plausible mean");
    }
    return 0;
}

static int test_invalid_inputs(void)
{
    PityModel model(TestSupport::referenceConfig());
    ExpectationSolver solver(model);

    EXPECT(throws<ValidationError>([&] { solver.expectedPulls({0, false, 0}, 0); }), "targetCount 0 rejected");
    EXPECT(throws<ValidationError>([&] { solver.expectedPulls({1, false, 0}, 1); }), "pity beyond the cap rejected");
    EXPECT(throws<ValidationError>([&] { solver.expectedPulls({-1, false, 0}, 1); }), "negative pity rejected");
    return 0;
}

static int test_unreachable_target(void)
{
    PityModelConfig c = TestSupport::referenceConfig();
    c.guaranteeAfterLoss = false;
    c.upProbability = 1e-14;
    PityModel model(c);

    EXPECT(throws<ComputeError>([&] { expectedPulls(model, {0, false, 0}, 1); }),
           "a vanishing escape probability is a compute error");
    return 0;
}

static bool failsAsUnreachable(ExpectationSolver& solver)
{
    try {
        solver.expectedPulls({0, false, 0}, 1);
    } catch (const ComputeError& e) {
        return std::string(e.what()).find("unreachable") != std::string::npos;
    }
    return false;
}

static int test_failed_solve_can_be_retried(void)
{
    PityModelConfig c = TestSupport::referenceConfig();
    c.guaranteeAfterLoss = false;
    c.upProbability = 1e-14;
    PityModel model(c);
    ExpectationSolver solver(model);

    EXPECT(failsAsUnreachable(solver), "first solve reports the unreachable item");
    EXPECT(failsAsUnreachable(solver), "second solve reports the same error, not a cycle");
    return 0;
}

int main(void)
{
    TestSupport::QuietLog quiet;
    RUN_TEST(test_reference_configuration);
    RUN_TEST(test_geometric_without_fifty_fifty);
    RUN_TEST(test_self_loop_closed_form);
    RUN_TEST(test_fifty_fifty_decomposition);
    RUN_TEST(test_additivity_without_residue);
    RUN_TEST(test_streak_residual_state);
    RUN_TEST(test_points_guarantee);
    RUN_TEST(test_builtin_pools_solve);
    RUN_TEST(test_invalid_inputs);
    RUN_TEST(test_unreachable_target);
    RUN_TEST(test_failed_solve_can_be_retried);
    return 0;
}
