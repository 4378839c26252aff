#ifndef SIMULATION_TYPES_H
#define SIMULATION_TYPES_H

#include <optional>
#include <string>

namespace Gacha {

    enum class SimulationMode {
        EXPECTATION,    // exact solver only
        DISTRIBUTION    // Monte Carlo, cross-checked against the solver
    };

    // Player progress as it arrives on the wire. Which counter matters is a
    // property of the pool's model, resolved by resolveInitialState().
    struct RequestState {
        int pity = 0;
        bool isGuaranteed = false;
        int streakCounter = 0;   // "mingguangCounter": lost flips toward the streak bonus
        int pointsCounter = 0;   // "fatePoint": points toward the points guarantee
    };

    struct SimulationRequest {
        std::string game;
        std::string pool;
        SimulationMode mode = SimulationMode::EXPECTATION;
        int targetCount = 1;
        RequestState initialState;
        std::optional<long long> budget;
        bool secondaryUpMaxed = false;                 // "up4C6"
        std::optional<unsigned long long> seed;
        std::optional<long long> trials;
        bool useParallel = true;
    };

    // mean plus nearest-rank percentiles of one per-trial quantity.
    struct Summary {
        double mean = 0.0;
        double p25 = 0.0;
        double p50 = 0.0;
        double p75 = 0.0;
        double p90 = 0.0;
        double p95 = 0.0;
    };

    struct ConfidenceInterval {
        double level = 0.0;
        double lower_bound = 0.0;
        double upper_bound = 0.0;
    };

    // Raw output of one MonteCarloSimulator run.
    struct SimulationOutcome {
        long long trials = 0;
        unsigned long long seed = 0;

        Summary pulls;
        double pullsStdDev = 0.0;
        ConfidenceInterval meanInterval;

        std::optional<double> successRate;   // percentage of trials with pulls <= budget
        std::optional<Summary> byproduct;

        double meanOffBannerHits = 0.0;
        double meanSecondaryHits = 0.0;
    };

    // The response contract: one shape per mode, decided by ResultAggregator.
    struct PullStatistics {
        double mean = 0.0;
        bool hasPercentiles = false;
        long long p25 = 0;
        long long p50 = 0;
        long long p75 = 0;
        long long p90 = 0;
        long long p95 = 0;
        std::optional<double> exactMean;
        std::optional<ConfidenceInterval> meanInterval;
    };

    struct SimulationResult {
        PullStatistics pulls;
        std::optional<double> successRate;
        std::optional<Summary> byproduct;
        std::optional<long long> trials;
        std::optional<unsigned long long> seed;
    };

} // namespace Gacha

#endif // SIMULATION_TYPES_H
