#include "HexMosaicEngine.hpp"
#include "HexMosaicError.hpp"
#include "TestFixtures.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <numeric>
#include <vector>

namespace hexmosaic {
namespace gtest {

using json = nlohmann::json;

namespace {

//! 5 km square: forest west, field east, a lake in the north-east and a
//! river along y = 2500, over flat 120 m terrain.
RunInputs scenario_inputs() {
    RunInputs inputs;
    inputs.boundary = rectangle(0, 0, 5000, 5000);
    inputs.sources.push_back(polygon_source("landcover-west", "Forest", {rectangle(-100, -100, 2500, 5100)}));
    inputs.sources.push_back(polygon_source("landcover-east", "Field", {rectangle(2500, -100, 5100, 5100)}));
    inputs.sources.push_back(polygon_source("lakes", "Water", {rectangle(3500, 3500, 4500, 4500)}));
    inputs.sources.push_back(line_source("rivers", "River", {line({Point2D(-100, 2500), Point2D(5100, 2500)})}));
    inputs.raster = constant_raster(120.0f);
    return inputs;
}

HexMosaicConfig scenario_config(PersistenceMode mode = PersistenceMode::PREVIEW) {
    HexMosaicConfig config;
    config.tessellation.hex_edge_length = 500.0;
    config.mode = mode;
    config.num_threads = 2;
    return config;
}

} // namespace

TEST(HexMosaicEngine, PreviewRunClassifiesEveryTile) {
    HexMosaicEngine engine(scenario_config(), scenario_profile());
    RunInputs inputs = scenario_inputs();
    RunOutcome outcome = engine.run(inputs);

    ASSERT_NE(outcome.tessellation, nullptr);
    const size_t tiles = outcome.tessellation->size();
    ASSERT_EQ(outcome.results.size(), tiles);
    EXPECT_EQ(outcome.artifact.records.size(), tiles);
    EXPECT_FALSE(outcome.artifact.applied);

    for (size_t i = 0; i < tiles; ++i) {
        EXPECT_EQ(outcome.results[i].tile, i);
        EXPECT_GE(outcome.results[i].confidence, 0.0);
        EXPECT_LE(outcome.results[i].confidence, 1.0);
        // Slivers can miss every pixel centre; full tiles never do
        if (!outcome.tessellation->tile(static_cast<TileId>(i)).is_partial) {
            ASSERT_TRUE(outcome.results[i].elevation_tier.has_value());
        }
        if (outcome.results[i].elevation_tier) {
            EXPECT_DOUBLE_EQ(*outcome.results[i].elevation_tier, 100.0);
        }
    }

    const RunSummary& summary = outcome.summary;
    EXPECT_EQ(summary.tile_count, tiles);
    const size_t counted = std::accumulate(summary.class_counts.begin(), summary.class_counts.end(), size_t(0),
        [](size_t sum, const auto& entry) { return sum + entry.second; });
    EXPECT_EQ(counted, tiles);
    EXPECT_GT(summary.class_counts.at("Forest"), 0u);
    EXPECT_GT(summary.class_counts.at("Field"), 0u);
    EXPECT_GT(summary.class_counts.at("Water"), 0u);
    EXPECT_LT(summary.tiles_without_elevation, tiles / 4);

    // The river crosses the square once
    ASSERT_EQ(outcome.line_paths.size(), 1u);
    EXPECT_EQ(outcome.line_paths[0].class_index, RIVER);
    EXPECT_EQ(outcome.line_paths[0].paths.size(), 1u);
    EXPECT_EQ(summary.line_paths, 1u);

    for (const char* phase : {"validation", "tessellation", "sampling", "scoring", "cleanup", "persistence"}) {
        EXPECT_TRUE(summary.phase_timings.contains(phase)) << phase;
    }
}

TEST(HexMosaicEngine, TessellationProgressIsMonotonic) {
    HexMosaicEngine engine(scenario_config(), scenario_profile());
    RunInputs inputs = scenario_inputs();

    std::mutex mutex;
    std::vector<ProgressEvent> events;
    engine.run(inputs, nullptr, [&](const ProgressEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        if (event.phase == Phase::TESSELLATION) {
            events.push_back(event);
        }
    });

    ASSERT_GT(events.size(), 1u);
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_GT(events[i].tiles_processed, events[i - 1].tiles_processed);
        EXPECT_EQ(events[i].tiles_total, events[0].tiles_total);
    }
    EXPECT_EQ(events.back().tiles_processed, events.back().tiles_total);
}

TEST(HexMosaicEngine, TilesAtLakeCentreAreWater) {
    HexMosaicEngine engine(scenario_config(), scenario_profile());
    RunInputs inputs = scenario_inputs();
    RunOutcome outcome = engine.run(inputs);

    const HexLayout& layout = outcome.tessellation->layout();
    auto lake = outcome.tessellation->find(layout.locate(Point2D(4000, 4000)));
    ASSERT_TRUE(lake.has_value());
    EXPECT_EQ(outcome.results[*lake].tile_type, "Water");
    EXPECT_EQ(outcome.results[*lake].outcome, Outcome::WATER_OVERRIDE);

    auto west = outcome.tessellation->find(layout.locate(Point2D(1000, 4000)));
    ASSERT_TRUE(west.has_value());
    EXPECT_EQ(outcome.results[*west].tile_type, "Forest");
}

TEST(HexMosaicEngine, RepeatedRunsAreIdentical) {
    HexMosaicEngine engine(scenario_config(), scenario_profile());
    RunInputs first_inputs = scenario_inputs();
    RunInputs second_inputs = scenario_inputs();

    RunOutcome first = engine.run(first_inputs);
    RunOutcome second = engine.run(second_inputs);

    EXPECT_EQ(json(first.results).dump(), json(second.results).dump());
    EXPECT_EQ(json(first.artifact).dump(), json(second.artifact).dump());
    EXPECT_EQ(json(first.summary.class_counts), json(second.summary.class_counts));
}

TEST(HexMosaicEngine, ThreadCountDoesNotChangeResults) {
    HexMosaicConfig serial_config = scenario_config();
    serial_config.num_threads = 1;
    HexMosaicConfig parallel_config = scenario_config();
    parallel_config.num_threads = 4;

    RunInputs serial_inputs = scenario_inputs();
    RunInputs parallel_inputs = scenario_inputs();
    RunOutcome serial = HexMosaicEngine(serial_config, scenario_profile()).run(serial_inputs);
    RunOutcome parallel = HexMosaicEngine(parallel_config, scenario_profile()).run(parallel_inputs);

    EXPECT_EQ(json(serial.results).dump(), json(parallel.results).dump());
}

TEST(HexMosaicEngine, ApplyWritesTheStore) {
    InMemoryAttributeStore store;
    HexMosaicEngine engine(scenario_config(PersistenceMode::APPLY), scenario_profile());
    RunInputs inputs = scenario_inputs();
    inputs.store = &store;

    RunOutcome outcome = engine.run(inputs);
    EXPECT_TRUE(outcome.artifact.applied);
    EXPECT_EQ(store.committed_count(), outcome.results.size());
    for (const auto& result : outcome.results) {
        EXPECT_EQ(store.read(result.tile), std::optional<TileAttributes>(to_attributes(result)));
    }

    // A preview afterwards reports the committed state as "before"
    HexMosaicEngine preview(scenario_config(), scenario_profile());
    RunInputs again = scenario_inputs();
    again.store = &store;
    RunOutcome previewed = preview.run(again);
    ASSERT_TRUE(previewed.artifact.records[0].before.has_value());
    EXPECT_EQ(*previewed.artifact.records[0].before, previewed.artifact.records[0].after);
}

TEST(HexMosaicEngine, ApplyWithoutStoreIsRejected) {
    HexMosaicEngine engine(scenario_config(PersistenceMode::APPLY), scenario_profile());
    RunInputs inputs = scenario_inputs();

    try {
        engine.run(inputs);
        FAIL() << "apply without a store accepted";
    } catch (const HexMosaicError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_CONFIGURATION);
        EXPECT_EQ(e.phase(), Phase::VALIDATION);
    }
}

TEST(HexMosaicEngine, CancelledRunWritesNothing) {
    InMemoryAttributeStore store;
    HexMosaicEngine engine(scenario_config(PersistenceMode::APPLY), scenario_profile());
    RunInputs inputs = scenario_inputs();
    inputs.store = &store;

    CancellationToken cancel;
    cancel.request_cancel();
    try {
        engine.run(inputs, &cancel);
        FAIL() << "cancelled run completed";
    } catch (const HexMosaicError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CANCELLED);
    }
    EXPECT_EQ(store.committed_count(), 0u);

    const PhaseRecord& last = engine.tracker().phases().back();
    EXPECT_TRUE(last.completed);
    EXPECT_FALSE(last.successful);
}

TEST(HexMosaicEngine, IgnoredSourcesAreSummarised) {
    HexMosaicEngine engine(scenario_config(), scenario_profile());
    RunInputs inputs = scenario_inputs();
    inputs.sources.push_back(polygon_source("glaciers", "Glacier", {rectangle(0, 0, 100, 100)}));

    RunOutcome outcome = engine.run(inputs);
    ASSERT_EQ(outcome.summary.ignored_sources.size(), 1u);
    EXPECT_EQ(outcome.summary.ignored_sources[0].source, "glaciers");
    EXPECT_FALSE(outcome.summary.warnings.empty());
}

TEST(HexMosaicEngine, MissingRasterLowersConfidence) {
    HexMosaicEngine engine(scenario_config(), scenario_profile());
    RunInputs inputs = scenario_inputs();
    inputs.raster.reset();

    RunOutcome outcome = engine.run(inputs);
    EXPECT_EQ(outcome.summary.tiles_without_elevation, outcome.results.size());
    for (const auto& result : outcome.results) {
        EXPECT_FALSE(result.elevation_tier.has_value());
    }
}

} // namespace gtest
} // namespace hexmosaic
