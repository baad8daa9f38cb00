#include "ScoringEngine.hpp"
#include "TestFixtures.hpp"

#include <gtest/gtest.h>

namespace hexmosaic {
namespace gtest {

using json = nlohmann::json;

class ScoringEngineTest : public ::testing::Test {
protected:
    ScoringEngineTest() : profile_(scenario_profile()), executor_(1), engine_(profile_, executor_) {}

    ClassProfile profile_;
    ParallelExecutor executor_;
    ScoringEngine engine_;
};

TEST_F(ScoringEngineTest, WeightedScoreCombinesAllEvidence) {
    EXPECT_DOUBLE_EQ(engine_.score(area_evidence(FOREST, 0.8)), 0.48);
    EXPECT_DOUBLE_EQ(engine_.score(area_evidence(FOREST, 1.0, 1.0, 1.0, 1.0)), 1.0);
    EXPECT_DOUBLE_EQ(engine_.score(area_evidence(RIVER, 0.0, 0.0, 0.5, 1.0)), 0.1);
}

TEST_F(ScoringEngineTest, DominantForest) {
    ClassificationResult result = engine_.classify(tile_evidence(3, {area_evidence(FOREST, 0.8)}));

    EXPECT_EQ(result.tile, 3u);
    ASSERT_TRUE(result.class_index.has_value());
    EXPECT_EQ(*result.class_index, FOREST);
    EXPECT_EQ(result.tile_type, "Forest");
    EXPECT_EQ(result.outcome, Outcome::DOMINANT);
    EXPECT_NEAR(result.confidence, 0.48, 1e-12);
    EXPECT_EQ(result.rationale.rule, "max score");
    ASSERT_EQ(result.rationale.scores.size(), 1u);
    EXPECT_NEAR(result.rationale.scores[0].score, 0.48, 1e-12);
}

TEST_F(ScoringEngineTest, EvenSplitBelowThresholdIsMixed) {
    ClassificationResult result = engine_.classify(
        tile_evidence(0, {area_evidence(FOREST, 0.3), area_evidence(FIELD, 0.3)}));

    EXPECT_EQ(result.tile_type, ClassProfile::MIXED_LABEL);
    EXPECT_EQ(result.outcome, Outcome::MIXED);
    EXPECT_FALSE(result.class_index.has_value());
    EXPECT_LT(result.confidence, profile_.dominance_threshold());
    EXPECT_NEAR(result.confidence, 0.18, 1e-12);
    EXPECT_EQ(result.rationale.scores.size(), 2u);
}

TEST_F(ScoringEngineTest, WaterOverridesHigherScoringClass) {
    // Forest scores 0.55 against Water's 0.30, but water covers half the tile
    ClassificationResult result = engine_.classify(
        tile_evidence(0, {area_evidence(WATER, 0.5), area_evidence(FOREST, 0.5, 1.0)}));

    EXPECT_EQ(result.tile_type, "Water");
    EXPECT_EQ(result.outcome, Outcome::WATER_OVERRIDE);
    EXPECT_GE(result.confidence, profile_.water_override()->confidence_floor);
    EXPECT_NE(result.rationale.rule.find("water_override"), std::string::npos);
}

TEST_F(ScoringEngineTest, WaterAtThresholdDoesNotOverride) {
    ClassificationResult result = engine_.classify(
        tile_evidence(0, {area_evidence(WATER, 0.4), area_evidence(FOREST, 0.6)}));
    EXPECT_NE(result.outcome, Outcome::WATER_OVERRIDE);
}

TEST_F(ScoringEngineTest, MajorWaterLineAtCentroidOverrides) {
    ClassificationResult result = engine_.classify(
        tile_evidence(0, {area_evidence(FOREST, 0.9), area_evidence(RIVER, 0.0, 1.0, 0.3, 1.0)}));
    EXPECT_EQ(result.tile_type, "Water");
    EXPECT_EQ(result.outcome, Outcome::WATER_OVERRIDE);
}

TEST_F(ScoringEngineTest, TieBrokenByPriorityOrder) {
    ClassificationResult result = engine_.classify(
        tile_evidence(0, {area_evidence(FOREST, 0.7), area_evidence(FIELD, 0.7)}));
    EXPECT_EQ(result.tile_type, "Forest");
    EXPECT_EQ(result.rationale.rule, "max score, tie broken by priority order");

    // Same evidence, Field ranked first
    json document = scenario_profile_json();
    document["priority_order"] = {"Water", "River", "Field", "Forest", "Bare"};
    ClassProfile reordered = ClassProfile::from_json(document);
    ScoringEngine engine(reordered, executor_);
    ClassificationResult swapped = engine.classify(
        tile_evidence(0, {area_evidence(FOREST, 0.7), area_evidence(FIELD, 0.7)}));
    EXPECT_EQ(swapped.tile_type, "Field");
}

TEST_F(ScoringEngineTest, ScoreIsMonotonicInAreaFraction) {
    double previous = -1.0;
    for (int step = 0; step <= 20; ++step) {
        const double fraction = step / 20.0;
        const double value = engine_.score(area_evidence(FOREST, fraction, 1.0, 0.5));
        EXPECT_GE(value, previous);
        previous = value;
    }
}

TEST_F(ScoringEngineTest, MissingElevationHalvesConfidence) {
    ClassificationResult result = engine_.classify(
        tile_evidence(0, {area_evidence(FOREST, 0.8)}, std::nullopt));

    EXPECT_EQ(result.tile_type, "Forest");
    EXPECT_NEAR(result.confidence, 0.24, 1e-12);
    EXPECT_FALSE(result.elevation_tier.has_value());
    EXPECT_FALSE(result.elevation.has_value());
    EXPECT_EQ(result.outcome, Outcome::DOMINANT_LOW_CONFIDENCE);
    ASSERT_EQ(result.rationale.notes.size(), 1u);
    EXPECT_NE(result.rationale.notes[0].find("no elevation"), std::string::npos);
}

TEST_F(ScoringEngineTest, ElevationTierUsesMinimum) {
    ClassificationResult result = engine_.classify(tile_evidence(0, {area_evidence(FOREST, 0.8)}, 123.0));
    ASSERT_TRUE(result.elevation_tier.has_value());
    EXPECT_DOUBLE_EQ(*result.elevation_tier, 100.0);
    EXPECT_DOUBLE_EQ(*result.elevation, 128.0);
}

TEST(ScoringEngine, ElevationTierFloorsAndSnaps) {
    EXPECT_DOUBLE_EQ(elevation_tier(123.0, 50.0), 100.0);
    EXPECT_DOUBLE_EQ(elevation_tier(150.0, 50.0), 150.0);
    EXPECT_DOUBLE_EQ(elevation_tier(-10.0, 50.0), -50.0);
    EXPECT_DOUBLE_EQ(elevation_tier(0.0, 50.0), 0.0);
    EXPECT_DOUBLE_EQ(elevation_tier(7.3, 2.5), 5.0);
}

TEST_F(ScoringEngineTest, NoEvidenceIsUnknown) {
    ClassificationResult result = engine_.classify(tile_evidence(0, {}));
    EXPECT_EQ(result.tile_type, ClassProfile::UNKNOWN_LABEL);
    EXPECT_EQ(result.outcome, Outcome::UNKNOWN);
    EXPECT_FALSE(result.class_index.has_value());
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
}

TEST_F(ScoringEngineTest, ConfidenceStaysInUnitInterval) {
    for (double fraction : {0.0, 0.25, 0.5, 0.75, 1.0}) {
        for (auto elevation : {std::optional<double>(10.0), std::optional<double>()}) {
            ClassificationResult result = engine_.classify(
                tile_evidence(0, {area_evidence(FIELD, fraction, 1.0, 1.0, 1.0)}, elevation));
            EXPECT_GE(result.confidence, 0.0);
            EXPECT_LE(result.confidence, 1.0);
        }
    }
}

TEST_F(ScoringEngineTest, ClassifyAllKeepsTileOrder) {
    ParallelExecutor parallel(4);
    ScoringEngine engine(profile_, parallel);

    std::vector<TileEvidence> evidence;
    for (TileId id = 0; id < 500; ++id) {
        evidence.push_back(tile_evidence(id, {area_evidence(id % 2 ? FOREST : FIELD, 0.9)}));
    }
    std::vector<ClassificationResult> results = engine.classify_all(evidence);

    ASSERT_EQ(results.size(), evidence.size());
    for (TileId id = 0; id < 500; ++id) {
        EXPECT_EQ(results[id].tile, id);
        EXPECT_EQ(results[id].tile_type, id % 2 ? "Forest" : "Field");
    }
}

TEST_F(ScoringEngineTest, ResultSerialisesWithNullTier) {
    ClassificationResult result = engine_.classify(tile_evidence(7, {area_evidence(FOREST, 0.8)}, std::nullopt));
    json j = result;
    EXPECT_EQ(j["tile"], 7);
    EXPECT_EQ(j["tile_type"], "Forest");
    EXPECT_TRUE(j["elevation_tier"].is_null());
    EXPECT_EQ(j["outcome"], "dominant_low_confidence");
    EXPECT_EQ(j["rationale"]["scores"].size(), 1u);
}

TEST(ScoringEngineAreaThreshold, CoverageBelowClassThresholdDoesNotCount) {
    json document = scenario_profile_json();
    document["classes"][FOREST]["area_threshold"] = 0.5;
    ClassProfile profile = ClassProfile::from_json(document);
    ParallelExecutor executor(1);
    ScoringEngine engine(profile, executor);

    // Forest would win on 0.52 against Field's 0.42
    ClassificationResult result = engine.classify(
        tile_evidence(0, {area_evidence(FOREST, 0.45, 1.0), area_evidence(FIELD, 0.7)}));
    ASSERT_TRUE(result.class_index.has_value());
    EXPECT_EQ(*result.class_index, FIELD);
    ASSERT_EQ(result.rationale.scores.size(), 1u);
    EXPECT_EQ(result.rationale.scores[0].class_index, FIELD);
    ASSERT_EQ(result.rationale.notes.size(), 1u);
    EXPECT_NE(result.rationale.notes[0].find("area threshold"), std::string::npos);

    ClassificationResult at_threshold = engine.classify(
        tile_evidence(0, {area_evidence(FOREST, 0.5, 1.0), area_evidence(FIELD, 0.7)}));
    EXPECT_EQ(at_threshold.class_index, std::optional<size_t>(FOREST));

    ClassificationResult only_gated = engine.classify(tile_evidence(0, {area_evidence(FOREST, 0.2, 1.0)}));
    EXPECT_EQ(only_gated.outcome, Outcome::UNKNOWN);
}

} // namespace gtest
} // namespace hexmosaic
