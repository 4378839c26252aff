#ifndef REQUEST_PARSER_H
#define REQUEST_PARSER_H

#include "ModelRegistry.h"
#include "PityModel.h"
#include "SimulationTypes.h"
#include <string>

namespace Gacha {

    /**
     * @brief Parses a JSON request such as
     *        {"game":"genshin","pool":"character","mode":"distribution",
     *         "targetCount":2,"initialState":{"pity":10,"isGuaranteed":false,
     *         "mingguangCounter":1,"fatePoint":0},"budget":180,"up4C6":true}
     * @throws ValidationError naming the malformed field.
     */
    SimulationRequest parseRequest(const std::string& text);

    /**
     * @brief Checks every request field against the pool's model and the limits.
     * @throws ValidationError naming the first offending field.
     */
    void validateRequest(const SimulationRequest& request, const PityModel& model, const SimulationLimits& limits);

    // Maps the wire counters onto the model's single accelerator counter.
    PullState resolveInitialState(const SimulationRequest& request, const PityModel& model);

    // Trial count for a distribution request: explicit, else the pool default.
    long long effectiveTrials(const SimulationRequest& request, const PityModel& model);

    const char* modeName(SimulationMode mode);

} // namespace Gacha

#endif // REQUEST_PARSER_H
