#ifndef PITY_MODEL_H
#define PITY_MODEL_H

#include <string>

namespace Gacha {

    // Two variants of the "guarantee accelerator" capability. A pool carries
    // at most one; its counter lives in PullState::counter.
    enum class AcceleratorKind {
        NONE,
        STREAK_BONUS,      // counts lost coin flips; at the threshold the next flip is won
        POINTS_GUARANTEE   // one point per off-banner hit; at the threshold guaranteed is forced
    };

    struct GuaranteeAccelerator {
        AcceleratorKind kind = AcceleratorKind::NONE;
        int threshold = 0;        // streak length or points threshold
        double bonusRate = 0.0;   // STREAK_BONUS only: chance a coin flip is won outright
    };

    // Return table for repeated copies of the same item: copy 1 returns
    // `first`, copies 2..maxCopies return `duplicate`, later copies `maxed`.
    struct ReturnTier {
        double first = 0.0;
        double duplicate = 0.0;
        double maxed = 0.0;
        int maxCopies = 7;

        double forCopy(int copyIndex) const;
    };

    // Byproduct currency rules for one pool. Only the Monte Carlo simulator
    // consumes this; it never changes pull counts.
    struct ByproductConfig {
        bool enabled = false;

        // --- Top tier (the rarity tracked by pity) ---
        ReturnTier featuredReturn;
        ReturnTier offBannerReturn;
        int offBannerPoolSize = 0;              // 0: every off-banner hit returns offBannerReturn.duplicate

        // --- Secondary tier (next rarity down, 10-pull pity) ---
        double secondaryRate = 0.0;
        int secondaryHardPity = 10;
        double secondaryUpProbability = 0.5;
        double secondaryUpReturn = 0.0;
        double secondaryUpReturnMaxed = 0.0;    // used when the request reports the UP item as maxed
        double secondaryCharacterShare = 0.0;   // share of off-banner secondary hits that are characters
        int secondaryCharacterPoolSize = 0;
        ReturnTier secondaryCharacterReturn;
        double secondaryOtherReturn = 0.0;
    };

    // Immutable per (game, pool) descriptor of the per-pull law and the
    // transition rules.
    struct PityModelConfig {
        std::string game;
        std::string pool;

        double baseRate = 0.0;
        int softPityStart = 0;
        double rampRate = 0.0;
        int hardPity = 1;

        bool hasFiftyFifty = true;
        double upProbability = 0.5;
        bool guaranteeAfterLoss = true;
        GuaranteeAccelerator accelerator;

        long long defaultTrials = 0;
        ByproductConfig byproduct;

        /**
         * @brief Checks the parameters for internal consistency.
         * @throws ConfigurationError naming the offending field.
         */
        void validate() const;

        std::string key() const { return game + "-" + pool; }
    };

    struct PullState {
        int pity = 0;              // pulls since the last top-tier hit, [0, hardPity - 1]
        bool guaranteed = false;   // next top-tier hit is the UP item
        int counter = 0;           // accelerator counter, [0, accelerator.threshold]

        bool operator==(const PullState& other) const {
            return pity == other.pity && guaranteed == other.guaranteed && counter == other.counter;
        }
        bool operator!=(const PullState& other) const { return !(*this == other); }
    };

    enum class PullOutcome {
        MISS,
        UP_HIT,
        OFF_HIT
    };

    // Pure state machine over PullState. Randomness is supplied by the caller
    // through the PullOutcome passed to advance().
    class PityModel {
    public:
        explicit PityModel(const PityModelConfig& config);

        const PityModelConfig& config() const { return m_config; }

        // Probability that the next pull is a top-tier hit.
        double hitProbability(const PullState& state) const;

        // Probability that a top-tier hit from `state` is the UP item.
        double upProbability(const PullState& state) const;

        /**
         * @brief Returns the state after one pull with the given outcome.
         * @throws std::invalid_argument for outcomes the state cannot produce
         *         (a miss at hard pity, a lost flip that was certain to be won).
         */
        PullState advance(const PullState& state, PullOutcome outcome) const;

        // Re-establishes the points/guarantee invariant on a caller-supplied state.
        PullState normalize(const PullState& state) const;

        // Canonical state right after a success that leaves no residue.
        PullState resetState() const { return PullState{}; }

        bool accruesByproduct() const { return m_config.byproduct.enabled; }

    private:
        PityModelConfig m_config;
    };

} // namespace Gacha

#endif // PITY_MODEL_H
