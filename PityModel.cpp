#include "PityModel.h"
#include "GachaErrors.h"
#include <algorithm>
#include <stdexcept>

namespace Gacha {

    double ReturnTier::forCopy(int copyIndex) const {
        if (copyIndex <= 1) return first;
        if (copyIndex <= maxCopies) return duplicate;
        return maxed;
    }

    static void requireProbability(double value, const std::string& field) {
        if (!(value >= 0.0 && value <= 1.0)) {
            throw ConfigurationError("probability must lie in [0, 1]", field);
        }
    }

    void PityModelConfig::validate() const {
        const std::string prefix = key() + ".";
        if (game.empty() || pool.empty()) {
            throw ConfigurationError("game and pool identifiers must not be empty", prefix + "game");
        }
        if (hardPity < 1) {
            throw ConfigurationError("hardPity must be at least 1", prefix + "hardPity");
        }
        if (softPityStart < 0 || softPityStart > hardPity) {
            throw ConfigurationError("softPityStart must lie in [0, hardPity]", prefix + "softPityStart");
        }
        requireProbability(baseRate, prefix + "baseRate");
        if (baseRate <= 0.0) {
            throw ConfigurationError("baseRate must be positive", prefix + "baseRate");
        }
        if (!(rampRate >= 0.0)) {
            throw ConfigurationError("rampRate must not be negative", prefix + "rampRate");
        }
        requireProbability(upProbability, prefix + "upProbability");
        if (defaultTrials <= 0) {
            throw ConfigurationError("defaultTrials must be positive", prefix + "defaultTrials");
        }

        if (accelerator.kind != AcceleratorKind::NONE) {
            if (!hasFiftyFifty) {
                throw ConfigurationError("a guarantee accelerator requires a 50/50", prefix + "mechanic");
            }
            if (accelerator.threshold < 1) {
                throw ConfigurationError("accelerator threshold must be at least 1", prefix + "mechanic");
            }
            if (!(accelerator.bonusRate >= 0.0 && accelerator.bonusRate < 1.0)) {
                throw ConfigurationError("streakBonusRate must lie in [0, 1)", prefix + "streakBonusRate");
            }
        }
        // A lost flip that neither guarantees nor accelerates can still be
        // solved, but only if a flip can be won at all.
        if (hasFiftyFifty && upProbability <= 0.0 && !guaranteeAfterLoss
            && accelerator.kind == AcceleratorKind::NONE) {
            throw ConfigurationError("UP item can never be obtained", prefix + "upProbability");
        }

        if (byproduct.enabled) {
            const std::string bp = prefix + "byproduct.";
            requireProbability(byproduct.secondaryRate, bp + "secondaryRate");
            requireProbability(byproduct.secondaryUpProbability, bp + "secondaryUpProbability");
            requireProbability(byproduct.secondaryCharacterShare, bp + "secondaryCharacterShare");
            if (byproduct.secondaryHardPity < 1) {
                throw ConfigurationError("secondaryHardPity must be at least 1", bp + "secondaryHardPity");
            }
            if (byproduct.offBannerPoolSize < 0) {
                throw ConfigurationError("offBannerPoolSize must not be negative", bp + "offBannerPoolSize");
            }
            if (byproduct.secondaryCharacterShare > 0.0 && byproduct.secondaryCharacterPoolSize < 1) {
                throw ConfigurationError("secondaryCharacterPoolSize must be positive when characters can drop",
                                         bp + "secondaryCharacterPoolSize");
            }
            if (byproduct.featuredReturn.maxCopies < 1 || byproduct.offBannerReturn.maxCopies < 1
                || byproduct.secondaryCharacterReturn.maxCopies < 1) {
                throw ConfigurationError("maxCopies must be at least 1", bp + "maxCopies");
            }
        }
    }

    PityModel::PityModel(const PityModelConfig& config) : m_config(config) {
        m_config.validate();
    }

    double PityModel::hitProbability(const PullState& state) const {
        if (state.pity >= m_config.hardPity - 1) return 1.0;
        if (state.pity < m_config.softPityStart) return m_config.baseRate;
        double p = m_config.baseRate + m_config.rampRate * (state.pity - m_config.softPityStart + 1);
        return std::min(1.0, std::max(0.0, p));
    }

    double PityModel::upProbability(const PullState& state) const {
        if (!m_config.hasFiftyFifty || state.guaranteed) return 1.0;

        const GuaranteeAccelerator& acc = m_config.accelerator;
        if (acc.kind == AcceleratorKind::STREAK_BONUS) {
            if (state.counter >= acc.threshold) return 1.0;
            return acc.bonusRate + (1.0 - acc.bonusRate) * m_config.upProbability;
        }
        return m_config.upProbability;
    }

    PullState PityModel::advance(const PullState& state, PullOutcome outcome) const {
        PullState next = state;
        const GuaranteeAccelerator& acc = m_config.accelerator;

        switch (outcome) {
            case PullOutcome::MISS:
                if (hitProbability(state) >= 1.0) {
                    throw std::invalid_argument("a miss is impossible at hard pity");
                }
                next.pity = state.pity + 1;
                return next;

            case PullOutcome::UP_HIT:
                next.pity = 0;
                next.guaranteed = false;
                if (acc.kind == AcceleratorKind::STREAK_BONUS) {
                    // A flip decided by the guarantee does not count toward the streak.
                    next.counter = state.guaranteed ? state.counter : 0;
                } else {
                    next.counter = 0;
                }
                return next;

            case PullOutcome::OFF_HIT:
                if (upProbability(state) >= 1.0) {
                    throw std::invalid_argument("an off-banner hit is impossible from a guaranteed state");
                }
                next.pity = 0;
                if (m_config.guaranteeAfterLoss) next.guaranteed = true;
                if (acc.kind != AcceleratorKind::NONE) {
                    next.counter = std::min(state.counter + 1, acc.threshold);
                }
                return normalize(next);
        }
        return next;
    }

    PullState PityModel::normalize(const PullState& state) const {
        PullState next = state;
        const GuaranteeAccelerator& acc = m_config.accelerator;
        if (acc.kind == AcceleratorKind::NONE) {
            next.counter = 0;
        } else if (acc.kind == AcceleratorKind::POINTS_GUARANTEE && next.counter >= acc.threshold) {
            next.guaranteed = true;
        }
        return next;
    }

} // namespace Gacha
