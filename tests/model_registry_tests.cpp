/*
Model registry loading tests.
*/
#include "test_support.h"

#include <cstdlib>
#include <string>
#include <vector>

using namespace Gacha;
using TestSupport::near;
using TestSupport::throws;

static const char* kMinimalTables = R"({
  "limits": {"minTrials": 100, "maxTrials": 1000, "maxPullsPerTrial": 500},
  "pools": [
    {"game": "toy", "pool": "coin", "baseRate": 1.0, "softPityStart": 1, "rampRate": 0.0,
     "hardPity": 1, "hasFiftyFifty": true, "upProbability": 0.5, "defaultTrials": 200},
    {"game": "toy", "pool": "points", "baseRate": 0.5, "softPityStart": 3, "rampRate": 0.1,
     "hardPity": 5, "hasFiftyFifty": true, "upProbability": 0.25, "guaranteeAfterLoss": false,
     "mechanic": "points-guarantee", "pointsThreshold": 2, "defaultTrials": 300,
     "byproduct": {
       "featuredReturn": {"first": 1, "duplicate": 2, "maxed": 3},
       "offBannerReturn": [0, 4, 5, 6],
       "secondary": {"rate": 0.1, "upProbability": 0.5, "upReturn": 1}
     }}
  ]
})";

static int test_builtin_tables(void)
{
    ModelRegistry registry;
    registry.initializeWithBuiltinTables();

    EXPECT(registry.size() == 6, "six built-in pools");
    const std::vector<std::string> keys = registry.keys();
    const std::vector<std::string> expected = {
        "genshin-character", "genshin-weapon", "hsr-character", "hsr-lightcone", "zzz-character", "zzz-weapon"
    };
    EXPECT(keys == expected, "built-in keys");

    const PityModelConfig& gc = registry.lookup("genshin", "character").config();
    EXPECT(gc.accelerator.kind == AcceleratorKind::STREAK_BONUS && gc.accelerator.threshold == 3,
           "genshin character streak");
    const PityModelConfig& gw = registry.lookup("genshin", "weapon").config();
    EXPECT(gw.accelerator.kind == AcceleratorKind::POINTS_GUARANTEE && !gw.guaranteeAfterLoss,
           "genshin weapon points");
    EXPECT(registry.lookup("zzz", "weapon").config().hardPity == 80, "zzz weapon hard pity");
    for (const std::string& key : keys) {
        const std::string pool = key.substr(key.find('-') + 1);
        const std::string game = key.substr(0, key.find('-'));
        EXPECT(registry.lookup(game, pool).config().byproduct.enabled == (pool == "character"),
               "only character pools accrue byproduct");
    }

    const SimulationLimits& limits = registry.limits();
    EXPECT(limits.minTrials == 2000 && limits.maxTrials == 5000000 && limits.maxPullsPerTrial == 1000000,
           "built-in limits");
    return 0;
}

static int test_unknown_pool(void)
{
    ModelRegistry registry;
    registry.initializeWithBuiltinTables();

    bool named = false;
    try {
        registry.lookup("genshin", "chronicled");
    } catch (const ConfigurationError& e) {
        named = (e.field() == "pool");
    }
    EXPECT(named, "unknown pool is a configuration error on 'pool'");
    EXPECT(throws<ConfigurationError>([&] { registry.lookup("starrail", "character"); }), "unknown game");
    return 0;
}

static int test_load_from_string(void)
{
    ModelRegistry registry;
    registry.initializeFromString(kMinimalTables);

    EXPECT(registry.size() == 2, "two toy pools");
    EXPECT(registry.limits().maxPullsPerTrial == 500, "limits read");

    const PityModelConfig& coin = registry.lookup("toy", "coin").config();
    EXPECT(coin.guaranteeAfterLoss, "guaranteeAfterLoss defaults to true");
    EXPECT(coin.accelerator.kind == AcceleratorKind::NONE, "mechanic defaults to none");
    EXPECT(!coin.byproduct.enabled, "no byproduct block");

    const PityModelConfig& points = registry.lookup("toy", "points").config();
    EXPECT(points.accelerator.threshold == 2, "points threshold");
    EXPECT(points.byproduct.enabled, "byproduct block enables accrual");
    EXPECT(points.byproduct.featuredReturn.duplicate == 2.0 && points.byproduct.featuredReturn.maxCopies == 7,
           "object form of a return tier");
    EXPECT(points.byproduct.offBannerReturn.maxed == 5.0 && points.byproduct.offBannerReturn.maxCopies == 6,
           "array form of a return tier");
    EXPECT(points.byproduct.secondaryHardPity == 10, "secondary pity defaults to 10");
    EXPECT(points.byproduct.secondaryUpReturnMaxed == 1.0, "maxed return defaults to the plain return");
    return 0;
}

static int test_reload_replaces_tables(void)
{
    ModelRegistry registry;
    registry.initializeWithBuiltinTables();
    registry.initializeFromString(kMinimalTables);
    EXPECT(registry.size() == 2, "reload drops the previous pools");
    EXPECT(throws<ConfigurationError>([&] { registry.lookup("hsr", "character"); }), "old pool gone");
    return 0;
}

static int test_missing_limits(void)
{
    ModelRegistry registry;
    EXPECT(throws<ConfigurationError>([&] { registry.limits(); }), "limits before loading");

    const char* noLimits = R"({"pools": [{"game": "a", "pool": "b", "baseRate": 1.0, "softPityStart": 1,
        "rampRate": 0.0, "hardPity": 1, "hasFiftyFifty": false, "defaultTrials": 10}]})";
    EXPECT(throws<ConfigurationError>([&] { registry.initializeFromString(noLimits); }), "limits section required");

    const char* partialLimits = R"({"limits": {"minTrials": 10, "maxTrials": 100},
        "pools": [{"game": "a", "pool": "b", "baseRate": 1.0, "softPityStart": 1,
        "rampRate": 0.0, "hardPity": 1, "hasFiftyFifty": false, "defaultTrials": 10}]})";
    bool named = false;
    try {
        registry.initializeFromString(partialLimits);
    } catch (const ConfigurationError& e) {
        named = (e.field() == "limits.maxPullsPerTrial");
    }
    EXPECT(named, "missing maxPullsPerTrial is never defaulted");
    EXPECT(registry.size() == 0, "failed load leaves the registry empty");
    return 0;
}

static int test_invalid_tables(void)
{
    ModelRegistry registry;
    EXPECT(throws<ConfigurationError>([&] { registry.initializeFromString("{not json"); }), "malformed JSON");

    const char* duplicate = R"({"limits": {"minTrials": 1, "maxTrials": 10, "maxPullsPerTrial": 10},
        "pools": [
          {"game": "a", "pool": "b", "baseRate": 1.0, "softPityStart": 1, "rampRate": 0.0,
           "hardPity": 1, "hasFiftyFifty": false, "defaultTrials": 10},
          {"game": "a", "pool": "b", "baseRate": 0.5, "softPityStart": 1, "rampRate": 0.0,
           "hardPity": 1, "hasFiftyFifty": false, "defaultTrials": 10}]})";
    bool named = false;
    try {
        registry.initializeFromString(duplicate);
    } catch (const ConfigurationError& e) {
        named = (e.field() == "a-b");
    }
    EXPECT(named, "duplicate (game, pool) rejected");

    const char* badMechanic = R"({"limits": {"minTrials": 1, "maxTrials": 10, "maxPullsPerTrial": 10},
        "pools": [{"game": "a", "pool": "b", "baseRate": 1.0, "softPityStart": 1, "rampRate": 0.0,
           "hardPity": 1, "hasFiftyFifty": true, "mechanic": "spark", "defaultTrials": 10}]})";
    EXPECT(throws<ConfigurationError>([&] { registry.initializeFromString(badMechanic); }), "unknown mechanic");

    const char* inconsistent = R"({"limits": {"minTrials": 1, "maxTrials": 10, "maxPullsPerTrial": 10},
        "pools": [{"game": "a", "pool": "b", "baseRate": 1.0, "softPityStart": 9, "rampRate": 0.0,
           "hardPity": 5, "hasFiftyFifty": true, "defaultTrials": 10}]})";
    EXPECT(throws<ConfigurationError>([&] { registry.initializeFromString(inconsistent); }), "soft > hard");

    const char* noPools = R"({"limits": {"minTrials": 1, "maxTrials": 10, "maxPullsPerTrial": 10}, "pools": []})";
    EXPECT(throws<ConfigurationError>([&] { registry.initializeFromString(noPools); }), "empty pool list");

    EXPECT(throws<ConfigurationError>([&] { registry.initializeFromJSON("/nonexistent/pity_tables.json"); }),
           "missing file");
    return 0;
}

static int test_shipped_tables_match_builtin(void)
{
    const char* path = std::getenv("GACHA_TABLES_FILE");
    if (path == nullptr) {
        fprintf(stderr, "note: GACHA_TABLES_FILE not set, skipping shipped table comparison\n");
        return 0;
    }

    ModelRegistry builtin;
    builtin.initializeWithBuiltinTables();
    ModelRegistry shipped;
    shipped.initializeFromJSON(path);

    EXPECT(shipped.keys() == builtin.keys(), "same pools");
    EXPECT(shipped.limits().minTrials == builtin.limits().minTrials, "same trial floor");
    EXPECT(shipped.limits().maxPullsPerTrial == builtin.limits().maxPullsPerTrial, "same pull cap");

    for (const std::string& key : builtin.keys()) {
        const std::string game = key.substr(0, key.find('-'));
        const std::string pool = key.substr(key.find('-') + 1);
        const PityModelConfig& a = builtin.lookup(game, pool).config();
        const PityModelConfig& b = shipped.lookup(game, pool).config();
        EXPECT(near(a.baseRate, b.baseRate, 1e-12) && a.softPityStart == b.softPityStart
               && near(a.rampRate, b.rampRate, 1e-12) && a.hardPity == b.hardPity, "same pity law");
        EXPECT(near(a.upProbability, b.upProbability, 1e-12) && a.guaranteeAfterLoss == b.guaranteeAfterLoss,
               "same coin flip");
        EXPECT(a.accelerator.kind == b.accelerator.kind && a.accelerator.threshold == b.accelerator.threshold
               && near(a.accelerator.bonusRate, b.accelerator.bonusRate, 1e-12), "same mechanic");
        EXPECT(a.defaultTrials == b.defaultTrials, "same default trials");
        EXPECT(a.byproduct.enabled == b.byproduct.enabled
               && near(a.byproduct.secondaryRate, b.byproduct.secondaryRate, 1e-12)
               && near(a.byproduct.secondaryCharacterShare, b.byproduct.secondaryCharacterShare, 1e-9)
               && a.byproduct.offBannerPoolSize == b.byproduct.offBannerPoolSize
               && near(a.byproduct.featuredReturn.maxed, b.byproduct.featuredReturn.maxed, 1e-12),
               "same byproduct rules");
    }
    return 0;
}

int main(void)
{
    TestSupport::QuietLog quiet;
    RUN_TEST(test_builtin_tables);
    RUN_TEST(test_unknown_pool);
    RUN_TEST(test_load_from_string);
    RUN_TEST(test_reload_replaces_tables);
    RUN_TEST(test_missing_limits);
    RUN_TEST(test_invalid_tables);
    RUN_TEST(test_shipped_tables_match_builtin);
    return 0;
}
