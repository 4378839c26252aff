#ifndef FORECAST_ENGINE_H
#define FORECAST_ENGINE_H

#include "ModelRegistry.h"
#include "SimulationTypes.h"

namespace Gacha {

    /**
     * @brief Answers one self-contained request against the loaded tables.
     *
     * Looks up the pool's model, validates the request, runs the exact solver
     * and, in distribution mode, the Monte Carlo simulator, then hands both
     * outputs to ResultAggregator.
     *
     * @throws ConfigurationError, ValidationError or ComputeError.
     */
    SimulationResult runForecast(const ModelRegistry& registry, const SimulationRequest& request);

} // namespace Gacha

#endif // FORECAST_ENGINE_H
