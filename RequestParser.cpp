#include "RequestParser.h"
#include "GachaErrors.h"
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Gacha {

    namespace {

        template <typename T>
        T readField(const json& j, const char* key, const std::string& path, T fallback) {
            if (!j.contains(key) || j.at(key).is_null()) return fallback;
            try {
                return j.at(key).get<T>();
            } catch (json::exception& e) {
                throw ValidationError(path, "malformed value: " + std::string(e.what()));
            }
        }

        // Rejects fractional values and anything that does not fit T.
        template <typename T>
        T readInteger(const json& j, const char* key, const std::string& path, T fallback) {
            if (!j.contains(key) || j.at(key).is_null()) return fallback;
            const json& v = j.at(key);
            if (!v.is_number_integer()) {
                throw ValidationError(path, "must be an integer, got " + v.dump());
            }
            if (v.is_number_unsigned()) {
                const unsigned long long u = v.get<unsigned long long>();
                if (u > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
                    throw ValidationError(path, "value " + v.dump() + " is out of range");
                }
                return static_cast<T>(u);
            }
            const long long n = v.get<long long>();
            if (n < static_cast<long long>(std::numeric_limits<T>::min())
                || n > static_cast<long long>(std::numeric_limits<T>::max())) {
                throw ValidationError(path, "value " + v.dump() + " is out of range");
            }
            return static_cast<T>(n);
        }

        std::string readRequiredString(const json& j, const char* key) {
            if (!j.contains(key) || !j.at(key).is_string()) {
                throw ValidationError(key, std::string("required string field '") + key + "' is missing");
            }
            return j.at(key).get<std::string>();
        }

    } // namespace

    const char* modeName(SimulationMode mode) {
        return mode == SimulationMode::DISTRIBUTION ? "distribution" : "expectation";
    }

    SimulationRequest parseRequest(const std::string& text) {
        json data;
        try {
            data = json::parse(text);
        } catch (json::exception& e) {
            throw ValidationError("request", "request is not valid JSON: " + std::string(e.what()));
        }
        if (!data.is_object()) {
            throw ValidationError("request", "request must be a JSON object");
        }

        SimulationRequest request;
        request.game = readRequiredString(data, "game");
        request.pool = readRequiredString(data, "pool");

        const std::string mode = readField<std::string>(data, "mode", "mode", "expectation");
        if (mode == "expectation") {
            request.mode = SimulationMode::EXPECTATION;
        } else if (mode == "distribution") {
            request.mode = SimulationMode::DISTRIBUTION;
        } else {
            throw ValidationError("mode", "mode must be 'expectation' or 'distribution', got '" + mode + "'");
        }

        request.targetCount = readInteger<int>(data, "targetCount", "targetCount", 1);

        if (data.contains("initialState") && !data.at("initialState").is_null()) {
            const json& s = data.at("initialState");
            if (!s.is_object()) {
                throw ValidationError("initialState", "initialState must be a JSON object");
            }
            request.initialState.pity = readInteger<int>(s, "pity", "initialState.pity", 0);
            request.initialState.isGuaranteed = readField<bool>(s, "isGuaranteed", "initialState.isGuaranteed", false);
            request.initialState.streakCounter =
                readInteger<int>(s, "mingguangCounter", "initialState.mingguangCounter", 0);
            request.initialState.pointsCounter = readInteger<int>(s, "fatePoint", "initialState.fatePoint", 0);
        }

        if (data.contains("budget") && !data.at("budget").is_null()) {
            request.budget = readInteger<long long>(data, "budget", "budget", 0);
        }
        request.secondaryUpMaxed = readField<bool>(data, "up4C6", "up4C6", false);

        if (data.contains("seed") && !data.at("seed").is_null()) {
            if (!data.at("seed").is_number_unsigned()) {
                throw ValidationError("seed", "seed must be a non-negative integer");
            }
            request.seed = data.at("seed").get<unsigned long long>();
        }
        if (data.contains("trials") && !data.at("trials").is_null()) {
            request.trials = readInteger<long long>(data, "trials", "trials", 0);
        }
        request.useParallel = readField<bool>(data, "parallel", "parallel", true);
        return request;
    }

    void validateRequest(const SimulationRequest& request, const PityModel& model, const SimulationLimits& limits) {
        const PityModelConfig& config = model.config();
        const RequestState& s = request.initialState;

        if (request.targetCount < 1) {
            throw ValidationError("targetCount", "targetCount must be at least 1");
        }
        if (s.pity < 0 || s.pity >= config.hardPity) {
            throw ValidationError("initialState.pity",
                                  "pity must lie in [0, " + std::to_string(config.hardPity - 1) + "] for "
                                  + config.key());
        }
        if (s.streakCounter < 0) {
            throw ValidationError("initialState.mingguangCounter", "counter must not be negative");
        }
        if (s.pointsCounter < 0) {
            throw ValidationError("initialState.fatePoint", "counter must not be negative");
        }

        const GuaranteeAccelerator& acc = config.accelerator;
        if (acc.kind == AcceleratorKind::STREAK_BONUS && s.streakCounter > acc.threshold) {
            throw ValidationError("initialState.mingguangCounter",
                                  "counter must lie in [0, " + std::to_string(acc.threshold) + "]");
        }
        if (acc.kind == AcceleratorKind::POINTS_GUARANTEE && s.pointsCounter > acc.threshold) {
            throw ValidationError("initialState.fatePoint",
                                  "counter must lie in [0, " + std::to_string(acc.threshold) + "]");
        }
        if (acc.kind != AcceleratorKind::STREAK_BONUS && s.streakCounter != 0) {
            std::clog << "[Warning] " << config.key() << " has no streak mechanic; mingguangCounter ignored." << std::endl;
        }
        if (acc.kind != AcceleratorKind::POINTS_GUARANTEE && s.pointsCounter != 0) {
            std::clog << "[Warning] " << config.key() << " has no points mechanic; fatePoint ignored." << std::endl;
        }

        if (request.budget) {
            if (*request.budget < 1) {
                throw ValidationError("budget", "budget must be a positive pull count");
            }
            if (request.mode != SimulationMode::DISTRIBUTION) {
                std::clog << "[Warning] budget only applies to distribution mode; ignored." << std::endl;
            }
        }

        if (request.mode == SimulationMode::DISTRIBUTION) {
            const long long trials = effectiveTrials(request, model);
            if (trials < limits.minTrials || trials > limits.maxTrials) {
                throw ValidationError("trials", "trial count " + std::to_string(trials) + " must lie in ["
                                      + std::to_string(limits.minTrials) + ", "
                                      + std::to_string(limits.maxTrials) + "]");
            }
        }
    }

    PullState resolveInitialState(const SimulationRequest& request, const PityModel& model) {
        PullState state;
        state.pity = request.initialState.pity;
        state.guaranteed = request.initialState.isGuaranteed;
        switch (model.config().accelerator.kind) {
            case AcceleratorKind::STREAK_BONUS:
                state.counter = request.initialState.streakCounter;
                break;
            case AcceleratorKind::POINTS_GUARANTEE:
                state.counter = request.initialState.pointsCounter;
                break;
            case AcceleratorKind::NONE:
                state.counter = 0;
                break;
        }
        return model.normalize(state);
    }

    long long effectiveTrials(const SimulationRequest& request, const PityModel& model) {
        return request.trials ? *request.trials : model.config().defaultTrials;
    }

} // namespace Gacha
