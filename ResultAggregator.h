#ifndef RESULT_AGGREGATOR_H
#define RESULT_AGGREGATOR_H

#include "SimulationTypes.h"
#include <optional>
#include <string>

namespace Gacha {

    // The single place that decides which fields a mode produces. It selects
    // and copies; it computes nothing.
    class ResultAggregator {
    public:
        /**
         * @brief Builds the response for `request`.
         * @param request The validated request; its mode and budget pick the shape.
         * @param exactMean Solver output. Required in expectation mode, an
         *        optional cross-check in distribution mode.
         * @param simulated Simulator output. Required in distribution mode, ignored otherwise.
         * @throws std::invalid_argument if the output required by the mode is missing.
         */
        static SimulationResult aggregate(const SimulationRequest& request,
                                          std::optional<double> exactMean,
                                          const SimulationOutcome* simulated);

        // Serializes to the JSON response format.
        static std::string toJson(const SimulationResult& result);
    };

} // namespace Gacha

#endif // RESULT_AGGREGATOR_H
