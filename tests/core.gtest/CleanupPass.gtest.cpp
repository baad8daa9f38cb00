#include "CleanupPass.hpp"
#include "HexMosaicError.hpp"
#include "TestFixtures.hpp"

#include <gtest/gtest.h>

namespace hexmosaic {
namespace gtest {

using json = nlohmann::json;

namespace {

//! Tile 0 surrounded by tiles 1..6, each of which only touches tile 0.
std::vector<std::vector<TileId>> star_adjacency() {
    std::vector<std::vector<TileId>> adjacency(7);
    for (TileId id = 1; id <= 6; ++id) {
        adjacency[0].push_back(id);
        adjacency[id].push_back(0);
    }
    return adjacency;
}

//! Low-confidence Bare tile in a ring of five Field tiles and one Forest tile.
std::vector<ClassificationResult> island_results() {
    std::vector<ClassificationResult> results;
    results.push_back(make_result(0, BARE, "Bare", 0.2, Outcome::DOMINANT_LOW_CONFIDENCE, {{BARE, 0.2}}));
    for (TileId id = 1; id <= 5; ++id) {
        results.push_back(make_result(id, FIELD, "Field", 0.8, Outcome::DOMINANT, {{FIELD, 0.8}}));
    }
    results.push_back(make_result(6, FOREST, "Forest", 0.8, Outcome::DOMINANT, {{FOREST, 0.8}}));
    return results;
}

} // namespace

class CleanupPassTest : public ::testing::Test {
protected:
    CleanupPassTest() : profile_(scenario_profile()), executor_(2), cleanup_(profile_, executor_) {}

    ClassProfile profile_;
    ParallelExecutor executor_;
    CleanupPass cleanup_;
};

TEST_F(CleanupPassTest, IslandTakesNeighbourMajority) {
    std::vector<ClassificationResult> results = island_results();
    CleanupReport report = cleanup_.run(results, star_adjacency());

    EXPECT_EQ(results[0].tile_type, "Field");
    EXPECT_EQ(results[0].class_index, std::optional<size_t>(FIELD));
    EXPECT_EQ(results[0].outcome, Outcome::REASSIGNED);
    // No own Field score: 0.5 * 0 + 0.5 * 5/6
    EXPECT_NEAR(results[0].confidence, 5.0 / 12.0, 1e-12);
    ASSERT_EQ(results[0].rationale.cleanup_notes.size(), 1u);
    EXPECT_NE(results[0].rationale.cleanup_notes[0].find("Bare -> Field"), std::string::npos);

    ASSERT_EQ(report.reassignments.size(), 1u);
    const Reassignment& entry = report.reassignments[0];
    EXPECT_EQ(entry.tile, 0u);
    EXPECT_EQ(entry.from, "Bare");
    EXPECT_EQ(entry.to, "Field");
    EXPECT_EQ(entry.pass, 1);
    EXPECT_NEAR(entry.neighbor_fraction, 5.0 / 6.0, 1e-12);
    EXPECT_DOUBLE_EQ(entry.confidence_before, 0.2);

    EXPECT_EQ(report.passes, 2);
    EXPECT_TRUE(report.converged);

    for (TileId id = 1; id <= 6; ++id) {
        EXPECT_EQ(results[id].outcome, Outcome::DOMINANT);
    }
}

TEST_F(CleanupPassTest, SecondRunChangesNothing) {
    std::vector<ClassificationResult> results = island_results();
    cleanup_.run(results, star_adjacency());

    const json before = results;
    CleanupReport again = cleanup_.run(results, star_adjacency());
    EXPECT_TRUE(again.reassignments.empty());
    EXPECT_EQ(again.passes, 1);
    EXPECT_EQ(json(results), before);
}

TEST_F(CleanupPassTest, OwnScoreBlendsIntoConfidence) {
    std::vector<ClassificationResult> results = island_results();
    results[0].rationale.scores.push_back(ClassScore{FIELD, "Field", 0.3, area_evidence(FIELD, 0.5)});

    cleanup_.run(results, star_adjacency());
    EXPECT_NEAR(results[0].confidence, 0.5 * 0.3 + 0.5 * 5.0 / 6.0, 1e-12);
}

TEST_F(CleanupPassTest, HighConfidenceTilesAreKept) {
    std::vector<ClassificationResult> results = island_results();
    results[0].confidence = profile_.cleanup().low_confidence_threshold;

    CleanupReport report = cleanup_.run(results, star_adjacency());
    EXPECT_EQ(results[0].tile_type, "Bare");
    EXPECT_TRUE(report.reassignments.empty());
    EXPECT_TRUE(report.converged);
}

TEST_F(CleanupPassTest, EvenSplitBelowMajorityIsKept) {
    std::vector<ClassificationResult> results = island_results();
    for (TileId id = 4; id <= 6; ++id) {
        results[id] = make_result(id, FOREST, "Forest", 0.8, Outcome::DOMINANT, {{FOREST, 0.8}});
    }

    CleanupReport report = cleanup_.run(results, star_adjacency());
    EXPECT_EQ(results[0].tile_type, "Bare");
    EXPECT_TRUE(report.reassignments.empty());
}

TEST_F(CleanupPassTest, MixedNeighboursCountAgainstMajority) {
    std::vector<ClassificationResult> results = island_results();
    for (TileId id = 4; id <= 6; ++id) {
        results[id] = make_result(id, std::nullopt, ClassProfile::MIXED_LABEL, 0.3, Outcome::MIXED);
    }

    cleanup_.run(results, star_adjacency());
    EXPECT_EQ(results[0].tile_type, "Bare");
}

TEST_F(CleanupPassTest, MixedTileCanBeReassigned) {
    std::vector<ClassificationResult> results = island_results();
    results[0] = make_result(0, std::nullopt, ClassProfile::MIXED_LABEL, 0.18, Outcome::MIXED,
                             {{FOREST, 0.18}, {FIELD, 0.18}});

    cleanup_.run(results, star_adjacency());
    EXPECT_EQ(results[0].tile_type, "Field");
    EXPECT_EQ(results[0].outcome, Outcome::REASSIGNED);
}

// Both tiles read the same snapshot, so each takes the other's former label.
TEST_F(CleanupPassTest, DecisionsReadThePreviousPassOnly) {
    std::vector<ClassificationResult> results;
    results.push_back(make_result(0, FOREST, "Forest", 0.2, Outcome::DOMINANT_LOW_CONFIDENCE, {{FOREST, 0.2}}));
    results.push_back(make_result(1, FIELD, "Field", 0.2, Outcome::DOMINANT_LOW_CONFIDENCE, {{FIELD, 0.2}}));
    std::vector<std::vector<TileId>> adjacency = {{1}, {0}};

    CleanupReport report = cleanup_.run(results, adjacency);

    EXPECT_EQ(results[0].tile_type, "Field");
    EXPECT_EQ(results[1].tile_type, "Forest");
    EXPECT_EQ(report.reassignments.size(), 2u);
    EXPECT_TRUE(report.converged);
}

TEST_F(CleanupPassTest, ResultDoesNotDependOnThreadCount) {
    std::vector<ClassificationResult> serial_results = island_results();
    std::vector<ClassificationResult> parallel_results = island_results();

    ParallelExecutor serial(1);
    ParallelExecutor parallel(4);
    CleanupPass(profile_, serial).run(serial_results, star_adjacency());
    CleanupPass(profile_, parallel).run(parallel_results, star_adjacency());

    EXPECT_EQ(json(serial_results), json(parallel_results));
}

TEST_F(CleanupPassTest, PassLimitReportsNonConvergence) {
    json document = scenario_profile_json();
    document["cleanup"]["max_passes"] = 1;
    ClassProfile profile = ClassProfile::from_json(document);
    CleanupPass cleanup(profile, executor_);

    LogCapture capture;
    std::vector<ClassificationResult> results = island_results();
    CleanupReport report = cleanup.run(results, star_adjacency());

    EXPECT_EQ(results[0].tile_type, "Field");
    EXPECT_EQ(report.passes, 1);
    EXPECT_FALSE(report.converged);
    EXPECT_EQ(capture.count(LogLevel::WARNING, "CleanupPass"), 1u);
}

TEST_F(CleanupPassTest, ZeroPassesDisablesCleanup) {
    json document = scenario_profile_json();
    document["cleanup"]["max_passes"] = 0;
    ClassProfile profile = ClassProfile::from_json(document);

    std::vector<ClassificationResult> results = island_results();
    CleanupReport report = CleanupPass(profile, executor_).run(results, star_adjacency());

    EXPECT_EQ(report.passes, 0);
    EXPECT_TRUE(report.converged);
    EXPECT_EQ(results[0].tile_type, "Bare");
}

TEST_F(CleanupPassTest, HonoursCancellation) {
    CancellationToken cancel;
    cancel.request_cancel();
    std::vector<ClassificationResult> results = island_results();

    try {
        cleanup_.run(results, star_adjacency(), &cancel);
        FAIL() << "cleanup ran to completion";
    } catch (const HexMosaicError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CANCELLED);
        EXPECT_EQ(e.phase(), Phase::CLEANUP);
    }
    EXPECT_EQ(results[0].tile_type, "Bare");
}

} // namespace gtest
} // namespace hexmosaic
