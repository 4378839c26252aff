#include "MonteCarloSimulator.h"
#include "GachaErrors.h"
#include "Statistics.h"
#include "TrialSimulation.h"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <cmath>
#include <algorithm>
#include <omp.h>
#include <sstream>
#include <stdexcept>
#include <atomic>

using Gacha::ComputeError;
using Gacha::ValidationError;

// --- MonteCarloSimulator Method Implementations ---

MonteCarloSimulator::MonteCarloSimulator(const Gacha::SimulationLimits& limits) : m_limits(limits) {
    m_limits.validate();
    m_seed = static_cast<unsigned long long>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
}

void MonteCarloSimulator::setSeed(unsigned long long seed) {
    m_seed = seed;
}

const Gacha::SimulationOutcome& MonteCarloSimulator::outcome() const {
    if (!m_has_outcome) {
        throw std::logic_error("MonteCarloSimulator::outcome() called before run()");
    }
    return m_outcome;
}

// --- State Management ---
void MonteCarloSimulator::resetState(long long numTrials) {
    m_pulls.assign(numTrials, 0.0);
    m_byproduct.assign(numTrials, 0.0);
    m_sorted_pulls.clear();
    m_sorted_byproduct.clear();
    m_total_off_banner_hits = 0;
    m_total_secondary_hits = 0;
    m_histogram.dividers.clear();
    m_histogram.bins.clear();
    m_outcome = Gacha::SimulationOutcome();
    m_has_outcome = false;
}

void MonteCarloSimulator::validateRun(const Gacha::PityModel& model, const Gacha::PullState& initial, int targetCount,
                                      long long numTrials, std::optional<long long> budget) const {
    if (numTrials < m_limits.minTrials) {
        throw ValidationError("trials", "trial count " + std::to_string(numTrials)
                              + " is below the precision floor of " + std::to_string(m_limits.minTrials));
    }
    if (numTrials > m_limits.maxTrials) {
        throw ValidationError("trials", "trial count " + std::to_string(numTrials)
                              + " exceeds the limit of " + std::to_string(m_limits.maxTrials));
    }
    if (targetCount < 1) {
        throw ValidationError("targetCount", "targetCount must be at least 1");
    }
    if (budget && *budget < 1) {
        throw ValidationError("budget", "budget must be a positive pull count");
    }
    if (initial.pity < 0 || initial.pity >= model.config().hardPity) {
        throw ValidationError("initialState.pity",
                              "pity must lie in [0, " + std::to_string(model.config().hardPity - 1) + "]");
    }
}

void MonteCarloSimulator::run(const Gacha::PityModel& model, const Gacha::PullState& initial, int targetCount,
                              long long numTrials, std::optional<long long> budget, bool secondaryUpMaxed,
                              bool useParallel) {
    validateRun(model, initial, targetCount, numTrials, budget);
    resetState(numTrials);

    const Gacha::PullState start = model.normalize(initial);
    std::clog << "[Monitor] Simulating " << numTrials << " trials of " << model.config().key()
              << " (target " << targetCount << ", seed " << m_seed << ")." << std::endl;

    if (!useParallel) {
        std::clog << "\n[Monitor] Running in SINGLE-THREADED mode." << std::endl;
        runSingleThread(model, start, targetCount, numTrials, secondaryUpMaxed);
    } else {
        std::clog << "\n[Monitor] Running in PARALLEL mode." << std::endl;
        runParallel(model, start, targetCount, numTrials, secondaryUpMaxed);
    }

    analyzeResults(budget, model.accruesByproduct());
}


// --- Runners ---

void MonteCarloSimulator::runSingleThread(const Gacha::PityModel& model, const Gacha::PullState& initial,
                                          int targetCount, long long numTrials, bool secondaryUpMaxed) {
    auto start_sim_time = std::chrono::high_resolution_clock::now();
    const long long progress_interval = numTrials > 20 ? numTrials / 20 : 1;

    for (long long i = 0; i < numTrials; ++i) {
        std::mt19937 rng = Gacha::makeTrialRng(m_seed, i);
        Gacha::TrialResult result = Gacha::simulateTrial(rng, model, initial, targetCount,
                                                         m_limits.maxPullsPerTrial, secondaryUpMaxed);
        if (result.capped) {
            throw ComputeError("trial " + std::to_string(i) + " did not reach the target within "
                               + std::to_string(m_limits.maxPullsPerTrial) + " pulls");
        }
        m_pulls[i] = static_cast<double>(result.pulls);
        m_byproduct[i] = result.byproduct;
        m_total_off_banner_hits += result.offBannerHits;
        m_total_secondary_hits += result.secondaryHits;

        if ((i + 1) % progress_interval == 0) {
            std::clog << "          ... Progress: " << (100 * (i + 1) / numTrials) << "% complete." << std::endl;
        }
    }
    auto end_sim_time = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> sim_elapsed = end_sim_time - start_sim_time;
    std::clog << "[Monitor] Simulation loop finished in " << sim_elapsed.count() << " seconds." << std::endl;
}

void MonteCarloSimulator::runParallel(const Gacha::PityModel& model, const Gacha::PullState& initial,
                                      int targetCount, long long numTrials, bool secondaryUpMaxed) {
    auto start_sim_time = std::chrono::high_resolution_clock::now();

    long long total_off_banner_p = 0;
    long long total_secondary_p = 0;
    std::atomic<long long> completed_count{0};
    std::atomic<long long> first_capped_trial{numTrials};
    std::string failure_message;
    const long long progress_interval = numTrials > 20 ? numTrials / 20 : 1;

    // Trials share nothing mutable; each writes only its own slot.
    #pragma omp parallel
    {
        #pragma omp master
        {
            std::clog << "[Monitor] Detected and using " << omp_get_num_threads() << " threads." << std::endl;
        }

        #pragma omp for reduction(+:total_off_banner_p, total_secondary_p) schedule(dynamic, 256)
        for (long long i = 0; i < numTrials; ++i) {
            try {
                std::mt19937 rng = Gacha::makeTrialRng(m_seed, i);
                Gacha::TrialResult result = Gacha::simulateTrial(rng, model, initial, targetCount,
                                                                 m_limits.maxPullsPerTrial, secondaryUpMaxed);
                if (result.capped) {
                    // Keep the lowest capped index, matching the single-threaded report.
                    long long current = first_capped_trial.load();
                    while (i < current && !first_capped_trial.compare_exchange_weak(current, i)) {
                    }
                }
                m_pulls[i] = static_cast<double>(result.pulls);
                m_byproduct[i] = result.byproduct;
                total_off_banner_p += result.offBannerHits;
                total_secondary_p += result.secondaryHits;
            } catch (const std::exception& e) {
                // Exceptions must not leave the parallel region; rethrown below.
                #pragma omp critical
                {
                    if (failure_message.empty()) failure_message = e.what();
                }
            }

            long long current_completed = completed_count.fetch_add(1, std::memory_order_relaxed) + 1;
            if (current_completed % progress_interval == 0) {
                #pragma omp critical
                std::clog << "          ... Progress: " << (100 * current_completed / numTrials) << "% complete." << std::endl;
            }
        }
    }

    if (!failure_message.empty()) {
        throw ComputeError("trial failed: " + failure_message);
    }
    if (first_capped_trial.load() < numTrials) {
        throw ComputeError("trial " + std::to_string(first_capped_trial.load()) + " did not reach the target within "
                           + std::to_string(m_limits.maxPullsPerTrial) + " pulls");
    }

    m_total_off_banner_hits = total_off_banner_p;
    m_total_secondary_hits = total_secondary_p;

    auto end_sim_time = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> sim_elapsed = end_sim_time - start_sim_time;
    std::clog << "[Monitor] Simulation loop finished in " << sim_elapsed.count() << " seconds." << std::endl;
}


// --- Analysis ---

static Gacha::Summary summarize(const std::vector<double>& data, const std::vector<double>& sorted) {
    Gacha::Summary s;
    s.mean = Statistics::calculateMean(data);
    s.p25 = Statistics::findValueAtPercentile(sorted, 25.0);
    s.p50 = Statistics::findValueAtPercentile(sorted, 50.0);
    s.p75 = Statistics::findValueAtPercentile(sorted, 75.0);
    s.p90 = Statistics::findValueAtPercentile(sorted, 90.0);
    s.p95 = Statistics::findValueAtPercentile(sorted, 95.0);
    return s;
}

void MonteCarloSimulator::analyzeResults(std::optional<long long> budget, bool accruesByproduct) {
    std::clog << "\n[Analysis] Starting analysis of " << m_pulls.size() << " trials..." << std::endl;
    auto start_analysis_time = std::chrono::high_resolution_clock::now();
    const long long n = static_cast<long long>(m_pulls.size());

    m_outcome.trials = n;
    m_outcome.seed = m_seed;

    std::clog << "[Analysis] Sorting pull counts for percentile calculations..." << std::endl;
    m_sorted_pulls = m_pulls;
    std::sort(m_sorted_pulls.begin(), m_sorted_pulls.end());
    m_outcome.pulls = summarize(m_pulls, m_sorted_pulls);

    double variance = Statistics::calculateVariance(m_pulls, m_outcome.pulls.mean);
    m_outcome.pullsStdDev = Statistics::calculateStdDev(variance);
    double t = Statistics::findTValue(95.0, static_cast<int>(std::min<long long>(n - 1, 1000000)));
    double half_width = t * m_outcome.pullsStdDev / std::sqrt(static_cast<double>(n));
    m_outcome.meanInterval = {95.0, m_outcome.pulls.mean - half_width, m_outcome.pulls.mean + half_width};

    if (budget) {
        m_outcome.successRate = successRateForBudget(*budget);
    }

    if (accruesByproduct) {
        std::clog << "[Analysis] Sorting byproduct amounts..." << std::endl;
        m_sorted_byproduct = m_byproduct;
        std::sort(m_sorted_byproduct.begin(), m_sorted_byproduct.end());
        m_outcome.byproduct = summarize(m_byproduct, m_sorted_byproduct);
    }

    m_outcome.meanOffBannerHits = static_cast<double>(m_total_off_banner_hits) / n;
    m_outcome.meanSecondaryHits = static_cast<double>(m_total_secondary_hits) / n;

    buildHistogram();
    m_has_outcome = true;

    std::chrono::duration<double> analysis_elapsed = std::chrono::high_resolution_clock::now() - start_analysis_time;
    std::clog << "[Monitor] Full analysis complete in " << analysis_elapsed.count() << " seconds." << std::endl;
}

double MonteCarloSimulator::successRateForBudget(long long budget) const {
    if (m_sorted_pulls.empty()) {
        throw std::logic_error("successRateForBudget() called before run()");
    }
    return 100.0 * Statistics::findFractionAtOrBelow(m_sorted_pulls, static_cast<double>(budget));
}

// Fixed-width bins over [min, max] of the observed pull counts, at most 20 bins.
void MonteCarloSimulator::buildHistogram() {
    const double lo = m_sorted_pulls.front();
    const double hi = m_sorted_pulls.back() + 1.0;
    const double width = std::max(1.0, std::ceil((hi - lo) / 20.0));

    m_histogram.dividers.clear();
    for (double d = lo; d < hi; d += width) m_histogram.dividers.push_back(d);
    m_histogram.dividers.push_back(m_histogram.dividers.back() + width);
    m_histogram.bins.assign(m_histogram.dividers.size() - 1, 0);

    for (const double result : m_sorted_pulls) {
        auto it = std::upper_bound(m_histogram.dividers.begin(), m_histogram.dividers.end(), result);
        int bin_index = static_cast<int>(std::distance(m_histogram.dividers.begin(), it)) - 1;
        m_histogram.bins[bin_index]++;
    }
}

void MonteCarloSimulator::printResults() const {
    const Gacha::SimulationOutcome& o = outcome();
    std::clog << "\n------ Monte Carlo Simulation Results ------" << std::endl;
    std::clog << std::fixed << std::setprecision(4);
    std::clog << "Trials Run:        " << o.trials << " (seed " << o.seed << ")" << std::endl;
    std::clog << "------------------------------------------" << std::endl;
    std::clog << "Mean Pulls:        " << o.pulls.mean << std::endl;
    std::clog << "Standard Deviation:" << o.pullsStdDev << std::endl;
    std::clog << std::setprecision(1) << o.meanInterval.level << "% CI of Mean:   "
              << std::setprecision(4) << "[" << o.meanInterval.lower_bound << ", " << o.meanInterval.upper_bound << "]" << std::endl;
    std::clog << "------------------------------------------" << std::endl;
    std::clog << std::setprecision(0);
    std::clog << "25th Percentile:   " << o.pulls.p25 << std::endl;
    std::clog << "50th Percentile:   " << o.pulls.p50 << std::endl;
    std::clog << "75th Percentile:   " << o.pulls.p75 << std::endl;
    std::clog << "90th Percentile:   " << o.pulls.p90 << std::endl;
    std::clog << "95th Percentile:   " << o.pulls.p95 << std::endl;
    std::clog << std::setprecision(4);
    if (o.successRate) {
        std::clog << "Budget Success:    " << *o.successRate << "%" << std::endl;
    }

    std::clog << "\n------ Pull Outcome Statistics ------" << std::endl;
    std::clog << "Avg. Lost 50/50s per Trial:      " << o.meanOffBannerHits << std::endl;
    if (o.byproduct) {
        std::clog << "Avg. Secondary Drops per Trial:  " << o.meanSecondaryHits << std::endl;
        std::clog << "Avg. Byproduct per Trial:        " << o.byproduct->mean << std::endl;
        std::clog << "Byproduct p25/p50/p75:           " << o.byproduct->p25 << " / " << o.byproduct->p50
                  << " / " << o.byproduct->p75 << std::endl;
    }

    std::clog << "\n------ Pull Count Histogram ------" << std::endl;
    std::clog << std::left << std::setw(20) << "Bin Range" << std::right << std::setw(20) << "Count"
              << std::setw(25) << "Percentage" << std::endl;
    std::clog << std::string(65, '-') << std::endl;

    std::stringstream ss;
    for (size_t i = 0; i < m_histogram.bins.size(); ++i) {
        if (m_histogram.bins[i] == 0) continue;
        ss << std::fixed << std::setprecision(0)
           << "[" << m_histogram.dividers[i] << ", " << m_histogram.dividers[i + 1] << ")";
        double percentage = 100.0 * m_histogram.bins[i] / o.trials;
        std::stringstream perc_ss;
        perc_ss << std::fixed << std::setprecision(4) << percentage << "%";
        std::clog << std::left << std::setw(20) << ss.str()
                  << std::right << std::setw(20) << m_histogram.bins[i]
                  << std::setw(25) << perc_ss.str() << std::endl;
        ss.str("");
    }
    std::clog << "-----------------------------------------------" << std::endl;
}
