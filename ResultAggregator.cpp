#include "ResultAggregator.h"
#include <cmath>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Gacha {

    namespace {
        long long asPullCount(double value) {
            return static_cast<long long>(std::llround(value));
        }

        json summaryToJson(const Summary& s) {
            return json{
                {"mean", s.mean},
                {"p25", s.p25},
                {"p50", s.p50},
                {"p75", s.p75},
                {"p90", s.p90},
                {"p95", s.p95}
            };
        }
    }

    SimulationResult ResultAggregator::aggregate(const SimulationRequest& request,
                                                 std::optional<double> exactMean,
                                                 const SimulationOutcome* simulated) {
        SimulationResult result;

        if (request.mode == SimulationMode::EXPECTATION) {
            if (!exactMean) {
                throw std::invalid_argument("expectation mode requires the solver's mean");
            }
            result.pulls.mean = *exactMean;
            return result;
        }

        if (simulated == nullptr) {
            throw std::invalid_argument("distribution mode requires a simulation outcome");
        }
        result.pulls.mean = simulated->pulls.mean;
        result.pulls.hasPercentiles = true;
        result.pulls.p25 = asPullCount(simulated->pulls.p25);
        result.pulls.p50 = asPullCount(simulated->pulls.p50);
        result.pulls.p75 = asPullCount(simulated->pulls.p75);
        result.pulls.p90 = asPullCount(simulated->pulls.p90);
        result.pulls.p95 = asPullCount(simulated->pulls.p95);
        result.pulls.exactMean = exactMean;
        result.pulls.meanInterval = simulated->meanInterval;

        if (request.budget) {
            result.successRate = simulated->successRate;
        }
        result.byproduct = simulated->byproduct;
        result.trials = simulated->trials;
        result.seed = simulated->seed;
        return result;
    }

    std::string ResultAggregator::toJson(const SimulationResult& result) {
        json pulls = {{"mean", result.pulls.mean}};
        if (result.pulls.hasPercentiles) {
            pulls["p25"] = result.pulls.p25;
            pulls["p50"] = result.pulls.p50;
            pulls["p75"] = result.pulls.p75;
            pulls["p90"] = result.pulls.p90;
            pulls["p95"] = result.pulls.p95;
        }
        if (result.pulls.exactMean) {
            pulls["exact_mean"] = *result.pulls.exactMean;
        }
        if (result.pulls.meanInterval) {
            pulls["ci95"] = {result.pulls.meanInterval->lower_bound, result.pulls.meanInterval->upper_bound};
        }

        json out = {{"pulls", pulls}};
        if (result.successRate) out["success_rate"] = *result.successRate;
        if (result.byproduct) out["returns"] = summaryToJson(*result.byproduct);
        if (result.trials) out["trials"] = *result.trials;
        if (result.seed) out["seed"] = *result.seed;
        return out.dump();
    }

} // namespace Gacha
