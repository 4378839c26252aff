#include "ExpectationSolver.h"
#include "GachaErrors.h"
#include <cmath>
#include <string>

namespace Gacha {

    namespace {
        // Below this, 1 - b0 means the UP item is effectively unobtainable.
        const double kMinEscapeProbability = 1e-12;
        const double kNegligibleMass = 1e-15;
    }

    ExpectationSolver::ExpectationSolver(const PityModel& model)
        : m_model(model) {
        const GuaranteeAccelerator& acc = model.config().accelerator;
        m_counterLimit = (acc.kind == AcceleratorKind::NONE) ? 0 : acc.threshold;
        m_layerCount = 2 * (m_counterLimit + 1);
        m_layers.resize(m_layerCount);
    }

    int ExpectationSolver::layerIndex(bool guaranteed, int counter) const {
        return counter * 2 + (guaranteed ? 1 : 0);
    }

    int ExpectationSolver::layerIndex(const PullState& state) const {
        return layerIndex(state.guaranteed, state.counter);
    }

    PullState ExpectationSolver::layerState(int layer, int pity) const {
        PullState s;
        s.pity = pity;
        s.guaranteed = (layer % 2) == 1;
        s.counter = layer / 2;
        return s;
    }

    void ExpectationSolver::checkState(const PullState& state) const {
        const int hardPity = m_model.config().hardPity;
        if (state.pity < 0 || state.pity >= hardPity) {
            throw ValidationError("initialState.pity",
                                  "pity must lie in [0, " + std::to_string(hardPity - 1) + "]");
        }
        if (state.counter < 0 || state.counter > m_counterLimit) {
            throw ValidationError("initialState.counter",
                                  "counter must lie in [0, " + std::to_string(m_counterLimit) + "]");
        }
    }

    const ExpectationSolver::Layer& ExpectationSolver::solveLayer(int layer) {
        if (m_layers[layer].solved) return m_layers[layer];
        if (m_layers[layer].inProgress) {
            throw ComputeError("pity state graph has a cycle through layer " + std::to_string(layer)
                               + "; the expectation is not defined by backward substitution");
        }
        m_layers[layer].inProgress = true;
        // Cleared on every exit so a failed solve is not later mistaken for a cycle.
        struct InProgressReset {
            Layer& target;
            ~InProgressReset() { target.inProgress = false; }
        } reset{m_layers[layer]};

        const int hardPity = m_model.config().hardPity;
        const PullState entry = layerState(layer, 0);
        const double up = m_model.upProbability(entry);
        const int winLayer = layerIndex(m_model.advance(entry, PullOutcome::UP_HIT));

        bool selfLoop = false;
        double lossExpected = 0.0;
        std::vector<double> lossResidual(m_layerCount, 0.0);
        if (up < 1.0) {
            const int lossLayer = layerIndex(m_model.advance(entry, PullOutcome::OFF_HIT));
            if (lossLayer == layer) {
                selfLoop = true;
            } else {
                const Layer& next = solveLayer(lossLayer);
                lossExpected = next.expected[0];
                lossResidual = next.residual[0];
            }
        }

        // V(p) = a[p] + b[p] * V(0), R(p) = c[p] + b[p] * R(0); b is non-zero only for a self loop.
        std::vector<double> a(hardPity, 0.0);
        std::vector<double> b(hardPity, 0.0);
        std::vector<std::vector<double>> c(hardPity, std::vector<double>(m_layerCount, 0.0));

        for (int p = hardPity - 1; p >= 0; --p) {
            const double hit = m_model.hitProbability(layerState(layer, p));
            const double lose = hit * (1.0 - up);

            a[p] = 1.0;
            c[p][winLayer] += hit * up;
            if (lose > 0.0) {
                if (selfLoop) {
                    b[p] += lose;
                } else {
                    a[p] += lose * lossExpected;
                    for (int r = 0; r < m_layerCount; ++r) c[p][r] += lose * lossResidual[r];
                }
            }
            if (hit < 1.0) {
                const double miss = 1.0 - hit;
                a[p] += miss * a[p + 1];
                b[p] += miss * b[p + 1];
                for (int r = 0; r < m_layerCount; ++r) c[p][r] += miss * c[p + 1][r];
            }
        }

        Layer& self = m_layers[layer];
        self.expected.assign(hardPity, 0.0);
        self.residual.assign(hardPity, std::vector<double>(m_layerCount, 0.0));

        double v0 = 0.0;
        std::vector<double> r0(m_layerCount, 0.0);
        if (selfLoop) {
            const double escape = 1.0 - b[0];
            if (escape <= kMinEscapeProbability) {
                throw ComputeError("UP item is unreachable from layer " + std::to_string(layer));
            }
            v0 = a[0] / escape;
            for (int r = 0; r < m_layerCount; ++r) r0[r] = c[0][r] / escape;
        }

        for (int p = 0; p < hardPity; ++p) {
            self.expected[p] = a[p] + b[p] * v0;
            for (int r = 0; r < m_layerCount; ++r) self.residual[p][r] = c[p][r] + b[p] * r0[r];
            if (!std::isfinite(self.expected[p])) {
                throw ComputeError("expectation diverged at pity " + std::to_string(p));
            }
        }

        self.solved = true;
        return self;
    }

    double ExpectationSolver::expectedPullsForOne(const PullState& state) {
        const PullState s = m_model.normalize(state);
        checkState(s);
        return solveLayer(layerIndex(s)).expected[s.pity];
    }

    double ExpectationSolver::expectedPulls(const PullState& state, int targetCount) {
        if (targetCount < 1) {
            throw ValidationError("targetCount", "targetCount must be at least 1");
        }
        const PullState s = m_model.normalize(state);
        checkState(s);

        const Layer& first = solveLayer(layerIndex(s));
        double total = first.expected[s.pity];
        std::vector<double> dist = first.residual[s.pity];

        for (int k = 2; k <= targetCount; ++k) {
            std::vector<double> next(m_layerCount, 0.0);
            double pulls = 0.0;
            for (int r = 0; r < m_layerCount; ++r) {
                if (dist[r] <= kNegligibleMass) continue;
                const Layer& from = solveLayer(r);
                pulls += dist[r] * from.expected[0];
                for (int q = 0; q < m_layerCount; ++q) next[q] += dist[r] * from.residual[0][q];
            }
            total += pulls;
            dist.swap(next);
        }
        return total;
    }

    double expectedPulls(const PityModel& model, const PullState& state, int targetCount) {
        ExpectationSolver solver(model);
        return solver.expectedPulls(state, targetCount);
    }

} // namespace Gacha
