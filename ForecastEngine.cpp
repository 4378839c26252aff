#include "ForecastEngine.h"
#include "ExpectationSolver.h"
#include "MonteCarloSimulator.h"
#include "RequestParser.h"
#include "ResultAggregator.h"
#include <iomanip>
#include <iostream>

namespace Gacha {

    SimulationResult runForecast(const ModelRegistry& registry, const SimulationRequest& request) {
        const PityModel& model = registry.lookup(request.game, request.pool);
        const SimulationLimits& limits = registry.limits();
        validateRequest(request, model, limits);

        const PullState start = resolveInitialState(request, model);
        std::clog << "[Config] " << model.config().key() << " | mode " << modeName(request.mode)
                  << " | target " << request.targetCount << " | pity " << start.pity
                  << (start.guaranteed ? " (guaranteed)" : "") << " | counter " << start.counter << std::endl;

        ExpectationSolver solver(model);
        const double exact = solver.expectedPulls(start, request.targetCount);
        std::clog << "[Analysis] Exact expected pulls: " << std::fixed << std::setprecision(4) << exact << std::endl;

        if (request.mode == SimulationMode::EXPECTATION) {
            return ResultAggregator::aggregate(request, exact, nullptr);
        }

        MonteCarloSimulator simulator(limits);
        if (request.seed) simulator.setSeed(*request.seed);
        simulator.run(model, start, request.targetCount, effectiveTrials(request, model),
                      request.budget, request.secondaryUpMaxed, request.useParallel);
        simulator.printResults();

        const SimulationOutcome& outcome = simulator.outcome();
        if (exact < outcome.meanInterval.lower_bound || exact > outcome.meanInterval.upper_bound) {
            std::clog << "[Warning] Exact mean " << exact << " lies outside the simulated "
                      << outcome.meanInterval.level << "% interval." << std::endl;
        }
        return ResultAggregator::aggregate(request, exact, &outcome);
    }

} // namespace Gacha
