#ifndef MONTE_CARLO_SIMULATOR_H
#define MONTE_CARLO_SIMULATOR_H

#include <vector>
#include <string>
#include <optional>
#include "ModelRegistry.h"
#include "PityModel.h"
#include "SimulationTypes.h"

// Runs independent play-throughs of one PityModel and reduces them to
// pull-count and byproduct distributions. Every trial owns its state and a
// random stream derived from (seed, trial index), so results are identical
// for any thread count.
class MonteCarloSimulator {
public:
    explicit MonteCarloSimulator(const Gacha::SimulationLimits& limits);

    // --- Seeding ---
    void setSeed(unsigned long long seed);
    unsigned long long seed() const { return m_seed; }

    // --- Main Execution ---
    /**
     * @brief Simulates `numTrials` trials and analyzes them.
     * @throws Gacha::ValidationError for out-of-domain arguments (trial count
     *         outside the configured limits, targetCount < 1, budget < 1).
     * @throws Gacha::ComputeError if a trial hits maxPullsPerTrial.
     */
    void run(const Gacha::PityModel& model, const Gacha::PullState& initial, int targetCount,
             long long numTrials, std::optional<long long> budget, bool secondaryUpMaxed, bool useParallel);

    const Gacha::SimulationOutcome& outcome() const;

    // Percentage of the last run's trials finishing within `budget` pulls.
    double successRateForBudget(long long budget) const;

    void printResults() const;

private:
    Gacha::SimulationLimits m_limits;
    unsigned long long m_seed;

    // --- Per-trial data, indexed by trial; sorted copies after analysis ---
    std::vector<double> m_pulls;
    std::vector<double> m_byproduct;
    std::vector<double> m_sorted_pulls;
    std::vector<double> m_sorted_byproduct;
    long long m_total_off_banner_hits = 0;
    long long m_total_secondary_hits = 0;

    struct Histogram {
        std::vector<double> dividers;
        std::vector<long long> bins;
    } m_histogram;

    Gacha::SimulationOutcome m_outcome;
    bool m_has_outcome = false;

    // --- Private Runner Methods ---
    void runSingleThread(const Gacha::PityModel& model, const Gacha::PullState& initial, int targetCount,
                         long long numTrials, bool secondaryUpMaxed);
    void runParallel(const Gacha::PityModel& model, const Gacha::PullState& initial, int targetCount,
                     long long numTrials, bool secondaryUpMaxed);

    // --- Private Helper Methods ---
    void resetState(long long numTrials);
    void validateRun(const Gacha::PityModel& model, const Gacha::PullState& initial, int targetCount,
                     long long numTrials, std::optional<long long> budget) const;
    void analyzeResults(std::optional<long long> budget, bool accruesByproduct);
    void buildHistogram();
};

#endif // MONTE_CARLO_SIMULATOR_H
