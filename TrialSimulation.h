#ifndef TRIAL_SIMULATION_H
#define TRIAL_SIMULATION_H

#include "PityModel.h"
#include <random>

namespace Gacha {

    // --- Result Struct ---
    // Returned by each simulated play-through.
    struct TrialResult {
        long long pulls = 0;              // pulls spent until the target count was reached
        double byproduct = 0.0;           // byproduct currency accrued along the way
        long long upHits = 0;
        long long offBannerHits = 0;      // lost 50/50s
        long long secondaryHits = 0;      // next-rarity drops (byproduct pools only)
        bool capped = false;              // stopped by maxPullsPerTrial before reaching the target
    };

    /**
     * @brief Builds the private random stream of one trial.
     * @param seed The request-level seed.
     * @param trialIndex Index of the trial within the run.
     * @return A generator that depends only on (seed, trialIndex).
     */
    std::mt19937 makeTrialRng(unsigned long long seed, long long trialIndex);

    /**
     * @brief Plays one trial from `initial` until `targetCount` UP items are obtained.
     * @param rng The trial's private stream.
     * @param model The pity model; only its pure functions are used.
     * @param initial Starting state, already validated and normalized.
     * @param targetCount Number of UP items to obtain, >= 1.
     * @param maxPulls Hard cap on pulls; the result is flagged `capped` when hit.
     * @param secondaryUpMaxed Whether the secondary UP item is already maxed out.
     */
    TrialResult simulateTrial(std::mt19937& rng, const PityModel& model, const PullState& initial,
                              int targetCount, long long maxPulls, bool secondaryUpMaxed);

} // namespace Gacha

#endif // TRIAL_SIMULATION_H
