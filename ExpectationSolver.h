#ifndef EXPECTATION_SOLVER_H
#define EXPECTATION_SOLVER_H

#include "PityModel.h"
#include <vector>

namespace Gacha {

    // Exact expected-pull computation by dynamic programming over the finite
    // (pity, guaranteed, counter) state space of one PityModel.
    //
    // States are grouped into layers of equal (guaranteed, counter). Inside a
    // layer a miss only moves pity forward, so each layer is solved by
    // backward substitution from pity = hardPity - 1 down to 0. A lost flip
    // restarts at pity 0 of the layer the model sends it to, which is solved
    // first; a flip lost back into the same layer is closed in form.
    //
    // Alongside the expectation the solver keeps, per state, the probability
    // of each post-success layer. Items after the first start from that
    // distribution, so residual state left by a success (a streak counter
    // surviving a guaranteed win) is accounted for exactly.
    class ExpectationSolver {
    public:
        explicit ExpectationSolver(const PityModel& model);

        /**
         * @brief Expected pulls until one more UP item, from `state`.
         * @throws ValidationError if `state` lies outside the model's state space.
         * @throws ComputeError if the layer graph cannot be solved.
         */
        double expectedPullsForOne(const PullState& state);

        /**
         * @brief Expected pulls until `targetCount` UP items, from `state`.
         */
        double expectedPulls(const PullState& state, int targetCount);

        // Number of distinct (guaranteed, counter) layers.
        int layerCount() const { return m_layerCount; }

    private:
        struct Layer {
            bool solved = false;
            bool inProgress = false;
            std::vector<double> expected;                // indexed by pity
            std::vector<std::vector<double>> residual;   // [pity][post-success layer]
        };

        const PityModel& m_model;
        int m_counterLimit;
        int m_layerCount;
        std::vector<Layer> m_layers;

        int layerIndex(bool guaranteed, int counter) const;
        int layerIndex(const PullState& state) const;
        PullState layerState(int layer, int pity) const;
        void checkState(const PullState& state) const;
        const Layer& solveLayer(int layer);
    };

    // Convenience wrapper: expected pulls for `targetCount` items from `state`.
    double expectedPulls(const PityModel& model, const PullState& state, int targetCount);

} // namespace Gacha

#endif // EXPECTATION_SOLVER_H
