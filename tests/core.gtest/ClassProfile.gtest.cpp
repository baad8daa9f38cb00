#include "ClassProfile.hpp"
#include "HexMosaicError.hpp"
#include "TestFixtures.hpp"

#include <gtest/gtest.h>

namespace hexmosaic {
namespace gtest {

using json = nlohmann::json;

namespace {

//! Expect loading to fail with INVALID_CONFIGURATION naming the given key.
void expect_rejected(const json& document, const std::string& key) {
    try {
        ClassProfile::from_json(document);
        FAIL() << "profile accepted, expected rejection of " << key;
    } catch (const HexMosaicError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_CONFIGURATION) << e.what();
        EXPECT_EQ(e.phase(), Phase::VALIDATION);
        EXPECT_EQ(e.context(), key) << e.what();
    }
}

} // namespace

TEST(ClassProfile, LoadsScenarioProfile) {
    ClassProfile profile = scenario_profile();

    ASSERT_EQ(profile.class_count(), 5u);
    EXPECT_EQ(profile.class_at(FOREST).label, "Forest");
    EXPECT_TRUE(profile.class_at(RIVER).is_line());
    EXPECT_EQ(profile.find_class("Field"), std::optional<size_t>(FIELD));
    EXPECT_FALSE(profile.find_class("Lava").has_value());

    EXPECT_EQ(profile.priority_order(), (std::vector<size_t>{WATER, RIVER, FOREST, FIELD, BARE}));
    EXPECT_EQ(profile.priority_rank(RIVER), 1u);
    EXPECT_DOUBLE_EQ(profile.weights().area, 0.6);
    EXPECT_DOUBLE_EQ(profile.dominance_threshold(), 0.4);
    EXPECT_DOUBLE_EQ(profile.tier_size(), 50.0);
    EXPECT_EQ(profile.cleanup().max_passes, 5);
}

TEST(ClassProfile, DefaultsOptionalSections) {
    ClassProfile profile = scenario_profile();

    EXPECT_DOUBLE_EQ(profile.missing_elevation_factor(), 0.5);
    EXPECT_DOUBLE_EQ(profile.cleanup().low_confidence_threshold, 0.35);
    EXPECT_DOUBLE_EQ(profile.cleanup().blend_weight, 0.5);
    EXPECT_DOUBLE_EQ(profile.snap_tolerance(RIVER), profile.sampling().snap_tolerance);
    EXPECT_EQ(profile.sampling().probe_ring_count, 6);
    EXPECT_EQ(profile.sampling().elevation_method, ElevationMethod::MEAN);

    // Implied by the water-body class
    ASSERT_TRUE(profile.water_override().has_value());
    EXPECT_EQ(profile.water_override()->target_class, WATER);
    EXPECT_DOUBLE_EQ(profile.water_override()->area_threshold, 0.4);
}

TEST(ClassProfile, ExplicitWaterOverrideAndSampling) {
    json document = scenario_profile_json();
    document["water_override"] = {{"class", "Water"}, {"area_threshold", 0.25}, {"confidence_floor", 0.7}};
    document["sampling"] = {{"snap_tolerance", 25.0}, {"probe_ring_count", 12}, {"elevation_method", "median"}};
    document["classes"][4]["snap_tolerance"] = 5.0;

    ClassProfile profile = ClassProfile::from_json(document);
    EXPECT_DOUBLE_EQ(profile.water_override()->area_threshold, 0.25);
    EXPECT_DOUBLE_EQ(profile.water_override()->confidence_floor, 0.7);
    EXPECT_EQ(profile.sampling().probe_ring_count, 12);
    EXPECT_EQ(profile.sampling().elevation_method, ElevationMethod::MEDIAN);
    EXPECT_DOUBLE_EQ(profile.snap_tolerance(RIVER), 5.0);
}

TEST(ClassProfile, PerClassAreaThresholdAndTraceStep) {
    json document = scenario_profile_json();
    document["classes"][1]["area_threshold"] = 0.25;
    document["classes"][4]["trace_step"] = 100.0;

    ClassProfile profile = ClassProfile::from_json(document);
    EXPECT_EQ(std::get<AreaClass>(profile.class_at(FOREST).kind).area_threshold, std::optional<double>(0.25));
    EXPECT_FALSE(std::get<AreaClass>(profile.class_at(FIELD).kind).area_threshold.has_value());
    EXPECT_EQ(std::get<LineClass>(profile.class_at(RIVER).kind).trace_step, std::optional<double>(100.0));

    ClassProfile reloaded = ClassProfile::from_json(profile.to_json());
    EXPECT_EQ(reloaded.to_json(), profile.to_json());
}

TEST(ClassProfile, RoundTripsThroughJson) {
    ClassProfile profile = scenario_profile();
    ClassProfile reloaded = ClassProfile::from_json(profile.to_json());
    EXPECT_EQ(reloaded.to_json(), profile.to_json());
}

TEST(ClassProfile, RejectsIncompletePriorityOrder) {
    json document = scenario_profile_json();
    document["priority_order"] = {"Water", "River", "Forest", "Field"};
    expect_rejected(document, "priority_order");
}

TEST(ClassProfile, RejectsDuplicateInPriorityOrder) {
    json document = scenario_profile_json();
    document["priority_order"] = {"Water", "River", "Forest", "Field", "Bare", "Forest"};
    expect_rejected(document, "priority_order");
}

TEST(ClassProfile, RejectsUnknownLabelInPriorityOrder) {
    json document = scenario_profile_json();
    document["priority_order"][4] = "Lava";
    expect_rejected(document, "priority_order");
}

TEST(ClassProfile, RejectsDuplicateClassLabel) {
    json document = scenario_profile_json();
    document["classes"][2]["label"] = "Forest";
    expect_rejected(document, "classes[2].label");
}

TEST(ClassProfile, RejectsReservedLabel) {
    json document = scenario_profile_json();
    document["classes"][3]["label"] = "Mixed";
    expect_rejected(document, "classes[3].label");
}

TEST(ClassProfile, RejectsNegativeWeight) {
    json document = scenario_profile_json();
    document["weights"]["probe"] = -0.1;
    expect_rejected(document, "weights.probe");
}

TEST(ClassProfile, RejectsMissingWeight) {
    json document = scenario_profile_json();
    document["weights"].erase("edge");
    expect_rejected(document, "weights.edge");
}

TEST(ClassProfile, RejectsThresholdOutsideUnitInterval) {
    json document = scenario_profile_json();
    document["dominance_threshold"] = 1.5;
    expect_rejected(document, "dominance_threshold");
}

TEST(ClassProfile, RejectsNonPositiveTierSize) {
    json document = scenario_profile_json();
    document["tier_size"] = 0;
    expect_rejected(document, "tier_size");
}

TEST(ClassProfile, RejectsNegativePassCount) {
    json document = scenario_profile_json();
    document["cleanup"]["max_passes"] = -1;
    expect_rejected(document, "cleanup.max_passes");
}

TEST(ClassProfile, RejectsPassCountBeyondIntegerRange) {
    json document = scenario_profile_json();
    document["cleanup"]["max_passes"] = 1e20;
    expect_rejected(document, "cleanup.max_passes");
}

TEST(ClassProfile, RejectsAreaThresholdOutsideUnitInterval) {
    json document = scenario_profile_json();
    document["classes"][1]["area_threshold"] = 1.2;
    expect_rejected(document, "classes[1].area_threshold");
}

TEST(ClassProfile, RejectsNonPositiveTraceStep) {
    json document = scenario_profile_json();
    document["classes"][4]["trace_step"] = 0.0;
    expect_rejected(document, "classes[4].trace_step");
}

TEST(ClassProfile, RejectsZeroMajorityThreshold) {
    json document = scenario_profile_json();
    document["cleanup"]["neighbor_majority_threshold"] = 0.0;
    expect_rejected(document, "cleanup.neighbor_majority_threshold");
}

TEST(ClassProfile, RejectsLineClassAsWaterOverrideTarget) {
    json document = scenario_profile_json();
    document["water_override"] = {{"class", "River"}};
    expect_rejected(document, "water_override.class");
}

TEST(ClassProfile, RejectsUnknownClassKind) {
    json document = scenario_profile_json();
    document["classes"][1]["kind"] = "raster";
    expect_rejected(document, "classes[1].kind");
}

TEST(ClassProfile, RejectsMalformedJsonText) {
    try {
        ClassProfile::from_string("{\"classes\": [");
        FAIL() << "malformed profile accepted";
    } catch (const HexMosaicError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_CONFIGURATION);
    }
}

TEST(ClassProfile, RejectsMissingFile) {
    EXPECT_THROW(ClassProfile::load_file("/nonexistent/profile.json"), HexMosaicError);
}

} // namespace gtest
} // namespace hexmosaic
