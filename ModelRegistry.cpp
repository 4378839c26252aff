#include "ModelRegistry.h"
#include "GachaErrors.h"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Gacha {

    void SimulationLimits::validate() const {
        if (minTrials <= 0) throw ConfigurationError("minTrials must be configured and positive", "limits.minTrials");
        if (maxTrials <= 0) throw ConfigurationError("maxTrials must be configured and positive", "limits.maxTrials");
        if (maxPullsPerTrial <= 0) {
            throw ConfigurationError("maxPullsPerTrial must be configured and positive", "limits.maxPullsPerTrial");
        }
        if (minTrials > maxTrials) throw ConfigurationError("minTrials exceeds maxTrials", "limits.minTrials");
    }

    // --- Built-in tables ---

    namespace {

        ReturnTier tier(double first, double duplicate, double maxed) {
            ReturnTier t;
            t.first = first;
            t.duplicate = duplicate;
            t.maxed = maxed;
            return t;
        }

        PityModelConfig baseConfig(const char* game, const char* pool, double base, int soft, double ramp,
                                   int hard, double up, long long trials) {
            PityModelConfig c;
            c.game = game;
            c.pool = pool;
            c.baseRate = base;
            c.softPityStart = soft;
            c.rampRate = ramp;
            c.hardPity = hard;
            c.hasFiftyFifty = true;
            c.upProbability = up;
            c.guaranteeAfterLoss = true;
            c.defaultTrials = trials;
            return c;
        }

        void setSecondary(ByproductConfig& b, double rate, double up, double upReturn, double upReturnMaxed,
                          double characterShare, int characterPool, ReturnTier characterReturn, double other) {
            b.secondaryRate = rate;
            b.secondaryHardPity = 10;
            b.secondaryUpProbability = up;
            b.secondaryUpReturn = upReturn;
            b.secondaryUpReturnMaxed = upReturnMaxed;
            b.secondaryCharacterShare = characterShare;
            b.secondaryCharacterPoolSize = characterPool;
            b.secondaryCharacterReturn = characterReturn;
            b.secondaryOtherReturn = other;
        }

        AcceleratorKind parseAccelerator(const std::string& name, const std::string& field) {
            if (name == "none") return AcceleratorKind::NONE;
            if (name == "streak-bonus") return AcceleratorKind::STREAK_BONUS;
            if (name == "points-guarantee") return AcceleratorKind::POINTS_GUARANTEE;
            throw ConfigurationError("unknown mechanic '" + name + "'", field);
        }

        const char* acceleratorName(AcceleratorKind kind) {
            switch (kind) {
                case AcceleratorKind::NONE:             return "none";
                case AcceleratorKind::STREAK_BONUS:     return "streak-bonus";
                case AcceleratorKind::POINTS_GUARANTEE: return "points-guarantee";
            }
            return "none";
        }

        // Accepts both {"first":..,"duplicate":..,"maxed":..,"maxCopies":..}
        // and the compact [first, duplicate, maxed, maxCopies] form.
        ReturnTier parseReturnTier(const json& j) {
            ReturnTier t;
            if (j.is_array()) {
                t.first = j.at(0).get<double>();
                t.duplicate = j.at(1).get<double>();
                t.maxed = j.at(2).get<double>();
                if (j.size() > 3) t.maxCopies = j.at(3).get<int>();
            } else {
                t.first = j.at("first").get<double>();
                t.duplicate = j.at("duplicate").get<double>();
                t.maxed = j.at("maxed").get<double>();
                t.maxCopies = j.value("maxCopies", 7);
            }
            return t;
        }

        ByproductConfig parseByproduct(const json& j) {
            ByproductConfig b;
            b.enabled = true;
            b.featuredReturn = parseReturnTier(j.at("featuredReturn"));
            b.offBannerReturn = parseReturnTier(j.at("offBannerReturn"));
            b.offBannerPoolSize = j.value("offBannerPoolSize", 0);

            const auto& s = j.at("secondary");
            b.secondaryRate = s.at("rate").get<double>();
            b.secondaryHardPity = s.value("hardPity", 10);
            b.secondaryUpProbability = s.at("upProbability").get<double>();
            b.secondaryUpReturn = s.at("upReturn").get<double>();
            b.secondaryUpReturnMaxed = s.value("upReturnMaxed", b.secondaryUpReturn);
            b.secondaryCharacterShare = s.value("characterShare", 0.0);
            b.secondaryCharacterPoolSize = s.value("characterPoolSize", 0);
            if (s.contains("characterReturn")) b.secondaryCharacterReturn = parseReturnTier(s.at("characterReturn"));
            b.secondaryOtherReturn = s.value("otherReturn", 0.0);
            return b;
        }

        PityModelConfig parsePool(const json& item) {
            PityModelConfig c;
            c.game = item.at("game").get<std::string>();
            c.pool = item.at("pool").get<std::string>();
            c.baseRate = item.at("baseRate").get<double>();
            c.softPityStart = item.at("softPityStart").get<int>();
            c.rampRate = item.at("rampRate").get<double>();
            c.hardPity = item.at("hardPity").get<int>();
            c.hasFiftyFifty = item.at("hasFiftyFifty").get<bool>();
            c.upProbability = item.value("upProbability", 0.5);
            c.guaranteeAfterLoss = item.value("guaranteeAfterLoss", true);
            c.defaultTrials = item.at("defaultTrials").get<long long>();

            const std::string mechanic = item.value("mechanic", std::string("none"));
            c.accelerator.kind = parseAccelerator(mechanic, c.key() + ".mechanic");
            if (c.accelerator.kind == AcceleratorKind::STREAK_BONUS) {
                c.accelerator.threshold = item.at("streakLength").get<int>();
                c.accelerator.bonusRate = item.value("streakBonusRate", 0.0);
            } else if (c.accelerator.kind == AcceleratorKind::POINTS_GUARANTEE) {
                c.accelerator.threshold = item.at("pointsThreshold").get<int>();
            }

            if (item.contains("byproduct") && !item.at("byproduct").is_null()) {
                c.byproduct = parseByproduct(item.at("byproduct"));
            }
            return c;
        }

    } // namespace

    void ModelRegistry::clear() {
        m_models.clear();
        m_limits = SimulationLimits();
        m_hasLimits = false;
    }

    void ModelRegistry::initializeWithBuiltinTables() {
        clear();
        std::clog << "[Init] Loading built-in pity tables..." << std::endl;

        // Genshin Impact, character event wish: Capturing Radiance after 3 lost flips.
        PityModelConfig gc = baseConfig("genshin", "character", 0.006, 73, 0.06, 90, 0.5, 50000);
        gc.accelerator = {AcceleratorKind::STREAK_BONUS, 3, 0.00018};
        gc.byproduct.enabled = true;
        gc.byproduct.featuredReturn = tier(10, 10, 25);
        gc.byproduct.offBannerReturn = tier(0, 10, 25);
        gc.byproduct.offBannerPoolSize = 7;
        setSecondary(gc.byproduct, 0.051, 0.5, 2, 5, 39.0 / 57.0, 39, tier(0, 2, 5), 2);
        addModel(gc);

        // Genshin Impact, weapon event wish: Epitomized Path.
        PityModelConfig gw = baseConfig("genshin", "weapon", 0.007, 63, 0.07, 80, 0.375, 25000);
        gw.guaranteeAfterLoss = false;
        gw.accelerator = {AcceleratorKind::POINTS_GUARANTEE, 1, 0.0};
        addModel(gw);

        // Honkai: Star Rail, character warp.
        PityModelConfig hc = baseConfig("hsr", "character", 0.006, 73, 0.06, 90, 0.5625, 50000);
        hc.byproduct.enabled = true;
        hc.byproduct.featuredReturn = tier(40, 40, 100);
        hc.byproduct.offBannerReturn = tier(0, 40, 100);
        hc.byproduct.offBannerPoolSize = 7;
        setSecondary(hc.byproduct, 0.051, 0.5, 8, 20, 22.0 / 51.0, 22, tier(0, 8, 20), 8);
        addModel(hc);

        // Honkai: Star Rail, light cone warp.
        PityModelConfig hl = baseConfig("hsr", "lightcone", 0.008, 65, 0.08, 80, 0.75, 25000);
        addModel(hl);

        // Zenless Zone Zero, exclusive channel.
        PityModelConfig zc = baseConfig("zzz", "character", 0.006, 73, 0.06, 90, 0.5, 50000);
        zc.byproduct.enabled = true;
        zc.byproduct.featuredReturn = tier(0, 40, 100);
        zc.byproduct.offBannerReturn = tier(0, 40, 100);
        zc.byproduct.offBannerPoolSize = 6;
        setSecondary(zc.byproduct, 0.094, 0.5, 8, 20, 7.05 / (7.05 + 2.35), 12, tier(0, 8, 20), 8);
        addModel(zc);

        // Zenless Zone Zero, W-Engine channel.
        PityModelConfig zw = baseConfig("zzz", "weapon", 0.01, 64, 0.061875, 80, 0.75, 25000);
        addModel(zw);

        SimulationLimits limits;
        limits.minTrials = 2000;
        limits.maxTrials = 5000000;
        limits.maxPullsPerTrial = 1000000;
        setLimits(limits);

        printSummary();
    }

    void ModelRegistry::initializeFromJSON(const std::string& filename) {
        std::clog << "[Init] Loading pity tables from '" << filename << "'..." << std::endl;
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw ConfigurationError("Could not open tables file: " + filename);
        }
        std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        initializeFromString(text);
    }

    void ModelRegistry::initializeFromString(const std::string& text) {
        clear();
        try {
            json data = json::parse(text);

            if (!data.contains("limits")) {
                throw ConfigurationError("tables file has no limits section", "limits");
            }
            const auto& l = data.at("limits");
            SimulationLimits limits;
            limits.minTrials = l.value("minTrials", 0LL);
            limits.maxTrials = l.value("maxTrials", 0LL);
            limits.maxPullsPerTrial = l.value("maxPullsPerTrial", 0LL);
            setLimits(limits);

            const auto& pools = data.at("pools");
            if (!pools.is_array() || pools.empty()) {
                throw ConfigurationError("tables file must list at least one pool", "pools");
            }
            for (const auto& item : pools) {
                addModel(parsePool(item));
            }
        } catch (json::exception& e) {
            clear();
            throw ConfigurationError("JSON tables error: " + std::string(e.what()));
        } catch (const ConfigurationError&) {
            clear();
            throw;
        }
        printSummary();
    }

    void ModelRegistry::addModel(const PityModelConfig& config) {
        const std::string key = config.key();
        if (m_models.count(key) != 0) {
            throw ConfigurationError("duplicate pool definition", key);
        }
        m_models.emplace(key, PityModel(config));
    }

    void ModelRegistry::setLimits(const SimulationLimits& limits) {
        limits.validate();
        m_limits = limits;
        m_hasLimits = true;
    }

    const PityModel& ModelRegistry::lookup(const std::string& game, const std::string& pool) const {
        auto it = m_models.find(game + "-" + pool);
        if (it == m_models.end()) {
            throw ConfigurationError("no pity model for game '" + game + "' pool '" + pool + "'", "pool");
        }
        return it->second;
    }

    const SimulationLimits& ModelRegistry::limits() const {
        if (!m_hasLimits) {
            throw ConfigurationError("simulation limits are not configured", "limits");
        }
        return m_limits;
    }

    std::vector<std::string> ModelRegistry::keys() const {
        std::vector<std::string> out;
        out.reserve(m_models.size());
        for (const auto& [key, model] : m_models) out.push_back(key);
        return out;
    }

    void ModelRegistry::printSummary() const {
        std::clog << "\n------ Pity Table Summary ------" << std::endl;
        for (const auto& [key, model] : m_models) {
            const PityModelConfig& c = model.config();
            std::clog << "  " << std::left << std::setw(20) << key << std::right
                      << " base=" << std::fixed << std::setprecision(4) << c.baseRate
                      << " soft=" << c.softPityStart
                      << " hard=" << c.hardPity
                      << " up=" << c.upProbability
                      << " mechanic=" << acceleratorName(c.accelerator.kind);
            if (c.accelerator.kind != AcceleratorKind::NONE) std::clog << "(" << c.accelerator.threshold << ")";
            std::clog << (c.byproduct.enabled ? " byproduct" : "") << std::endl;
        }
        std::clog << "  Limits: trials [" << m_limits.minTrials << ", " << m_limits.maxTrials
                  << "], max pulls/trial " << m_limits.maxPullsPerTrial << std::endl;
    }

} // namespace Gacha
