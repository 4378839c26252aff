#ifndef MODEL_REGISTRY_H
#define MODEL_REGISTRY_H

#include "PityModel.h"
#include <map>
#include <string>
#include <vector>

namespace Gacha {

    // Work caps every simulation is checked against. All three are required.
    struct SimulationLimits {
        long long minTrials = 0;         // precision floor for percentile estimates
        long long maxTrials = 0;         // bound on total work per request
        long long maxPullsPerTrial = 0;  // non-convergence cap for a single trial

        void validate() const;
    };

    // Holds exactly one PityModel per (game, pool) pair plus the simulation
    // limits. Read-only once loaded; requests receive it by const reference.
    class ModelRegistry {
    public:
        /**
         * @brief Installs the reference tables compiled into the binary
         *        (genshin, hsr and zzz pools). Mirrors data/pity_tables.json.
         */
        void initializeWithBuiltinTables();

        /**
         * @brief Replaces the tables with the contents of a JSON tables file.
         * @param filename Path to a file shaped like data/pity_tables.json.
         * @throws ConfigurationError on I/O, parse or consistency failures.
         */
        void initializeFromJSON(const std::string& filename);

        // Same as initializeFromJSON but from in-memory JSON text.
        void initializeFromString(const std::string& text);

        void addModel(const PityModelConfig& config);
        void setLimits(const SimulationLimits& limits);

        // Throws ConfigurationError for an unknown (game, pool) pair.
        const PityModel& lookup(const std::string& game, const std::string& pool) const;

        // Throws ConfigurationError when no limits were configured.
        const SimulationLimits& limits() const;

        size_t size() const { return m_models.size(); }
        std::vector<std::string> keys() const;

    private:
        std::map<std::string, PityModel> m_models;
        SimulationLimits m_limits;
        bool m_hasLimits = false;

        void clear();
        void printSummary() const;
    };

} // namespace Gacha

#endif // MODEL_REGISTRY_H
