#include "TrialSimulation.h"
#include <algorithm>
#include <vector>

namespace Gacha {

    namespace {

        // Per-trial copy counts used to price duplicates.
        struct Collection {
            int upCopies = 0;
            std::vector<int> offBannerCopies;
            std::vector<int> secondaryCharacterCopies;
            int secondaryPity = 0;
            bool secondaryGuaranteed = false;
        };

        int pickIndex(double draw, int size) {
            int index = static_cast<int>(draw * size);
            return std::min(index, size - 1);
        }

        double topTierReturn(const ByproductConfig& b, bool isUp, Collection& c,
                             std::uniform_real_distribution<double>& dist, std::mt19937& rng) {
            if (isUp) {
                return b.featuredReturn.forCopy(++c.upCopies);
            }
            if (b.offBannerPoolSize <= 0) {
                return b.offBannerReturn.duplicate;
            }
            int& copies = c.offBannerCopies[pickIndex(dist(rng), b.offBannerPoolSize)];
            return b.offBannerReturn.forCopy(++copies);
        }

        double secondaryReturn(const ByproductConfig& b, bool secondaryUpMaxed, Collection& c,
                               std::uniform_real_distribution<double>& dist, std::mt19937& rng) {
            c.secondaryPity = 0;
            if (c.secondaryGuaranteed || dist(rng) < b.secondaryUpProbability) {
                c.secondaryGuaranteed = false;
                return secondaryUpMaxed ? b.secondaryUpReturnMaxed : b.secondaryUpReturn;
            }
            c.secondaryGuaranteed = true;
            if (dist(rng) < b.secondaryCharacterShare) {
                int& copies = c.secondaryCharacterCopies[pickIndex(dist(rng), b.secondaryCharacterPoolSize)];
                return b.secondaryCharacterReturn.forCopy(++copies);
            }
            return b.secondaryOtherReturn;
        }

    } // namespace

    std::mt19937 makeTrialRng(unsigned long long seed, long long trialIndex) {
        const unsigned long long index = static_cast<unsigned long long>(trialIndex);
        std::seed_seq seq{
            static_cast<unsigned>(seed & 0xffffffffULL), static_cast<unsigned>(seed >> 32),
            static_cast<unsigned>(index & 0xffffffffULL), static_cast<unsigned>(index >> 32)
        };
        return std::mt19937(seq);
    }

    TrialResult simulateTrial(std::mt19937& rng, const PityModel& model, const PullState& initial,
                              int targetCount, long long maxPulls, bool secondaryUpMaxed) {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        const ByproductConfig& bp = model.config().byproduct;

        TrialResult result;
        PullState state = initial;
        Collection collection;
        if (bp.enabled) {
            collection.offBannerCopies.assign(std::max(bp.offBannerPoolSize, 0), 0);
            collection.secondaryCharacterCopies.assign(std::max(bp.secondaryCharacterPoolSize, 0), 0);
        }

        while (result.upHits < targetCount) {
            if (result.pulls >= maxPulls) {
                result.capped = true;
                break;
            }
            result.pulls++;

            const double hit = model.hitProbability(state);
            if (hit >= 1.0 || dist(rng) < hit) {
                const double up = model.upProbability(state);
                const bool isUp = up >= 1.0 || dist(rng) < up;
                if (bp.enabled) {
                    result.byproduct += topTierReturn(bp, isUp, collection, dist, rng);
                    collection.secondaryPity = 0;
                }
                state = model.advance(state, isUp ? PullOutcome::UP_HIT : PullOutcome::OFF_HIT);
                if (isUp) result.upHits++;
                else result.offBannerHits++;
                continue;
            }

            state = model.advance(state, PullOutcome::MISS);
            if (!bp.enabled) continue;

            // The secondary rate is conditional on the pull not being a top-tier hit.
            collection.secondaryPity++;
            const double conditional = bp.secondaryRate / (hit < 1.0 ? 1.0 - hit : 0.99);
            if (collection.secondaryPity >= bp.secondaryHardPity || dist(rng) < conditional) {
                result.byproduct += secondaryReturn(bp, secondaryUpMaxed, collection, dist, rng);
                result.secondaryHits++;
            }
        }
        return result;
    }

} // namespace Gacha
