#include "cli/ConfigurationManager.hpp"
#include "HexMosaicError.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace hexmosaic {
namespace gtest {

namespace {

//! Expect the call to fail with INVALID_CONFIGURATION naming the key.
template <typename Call>
void expect_rejected(const std::string& key, Call&& call) {
    try {
        call();
        FAIL() << "value accepted for " << key;
    } catch (const HexMosaicError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_CONFIGURATION);
        EXPECT_EQ(e.context(), key);
    }
}

} // namespace

TEST(ConfigurationManager, TypedGetters) {
    ConfigurationManager manager;
    manager.set_value("edge", "250.5");
    manager.set_value("threads", "8");
    manager.set_value("edges", "Yes");

    EXPECT_DOUBLE_EQ(manager.get_double("edge"), 250.5);
    EXPECT_EQ(manager.get_int("threads"), 8);
    EXPECT_TRUE(manager.get_bool("edges"));
    EXPECT_EQ(manager.get_int("missing", 42), 42);
    EXPECT_EQ(manager.get_string("missing", "fallback"), "fallback");
}

TEST(ConfigurationManager, MalformedValuesNameTheirKey) {
    ConfigurationManager manager;
    manager.set_value("threads", "8x");
    manager.set_value("edge", "wide");
    manager.set_value("edges", "maybe");

    expect_rejected("threads", [&] { manager.get_int("threads"); });
    expect_rejected("edge", [&] { manager.get_double("edge"); });
    expect_rejected("edges", [&] { manager.get_bool("edges"); });
}

TEST(ConfigurationManager, ListSplitsOnSemicolons) {
    ConfigurationManager manager;
    manager.set_value("sources", " Forest=a.gpkg ; ;Water=b.gpkg#lakes; ");
    EXPECT_EQ(manager.get_list("sources"), (std::vector<std::string>{"Forest=a.gpkg", "Water=b.gpkg#lakes"}));
    EXPECT_TRUE(manager.get_list("missing").empty());
}

TEST(ConfigurationManager, ParsesEnumerationsAndPoints) {
    EXPECT_EQ(ConfigurationManager::parse_orientation("Flat"), HexOrientation::FLAT_TOP);
    EXPECT_EQ(ConfigurationManager::parse_orientation("pointy-top"), HexOrientation::POINTY_TOP);
    EXPECT_EQ(ConfigurationManager::parse_mode(" APPLY "), PersistenceMode::APPLY);
    EXPECT_EQ(ConfigurationManager::parse_point("100.5, -20"), Point2D(100.5, -20.0));

    expect_rejected("orientation", [] { ConfigurationManager::parse_orientation("round"); });
    expect_rejected("mode", [] { ConfigurationManager::parse_mode("commit"); });
    expect_rejected("origin", [] { ConfigurationManager::parse_point("12"); });
    expect_rejected("origin", [] { ConfigurationManager::parse_point("1,2,3"); });
}

TEST(ConfigurationManager, RunConfigRoundTrip) {
    HexMosaicConfig config;
    config.tessellation.hex_edge_length = 750.0;
    config.tessellation.orientation = HexOrientation::FLAT_TOP;
    config.tessellation.origin = Point2D(10.0, -5.0);
    config.tessellation.max_tiles = 1000;
    config.mode = PersistenceMode::APPLY;
    config.num_threads = 3;
    config.source_timeout = std::chrono::milliseconds(1500);
    config.log_level = 5;
    config.log_file = "run.log";

    ConfigurationManager manager;
    manager.from_run_config(config);
    HexMosaicConfig restored = manager.to_run_config();

    EXPECT_DOUBLE_EQ(restored.tessellation.hex_edge_length, 750.0);
    EXPECT_EQ(restored.tessellation.orientation, HexOrientation::FLAT_TOP);
    EXPECT_EQ(restored.tessellation.origin, Point2D(10.0, -5.0));
    EXPECT_EQ(restored.tessellation.max_tiles, 1000u);
    EXPECT_EQ(restored.mode, PersistenceMode::APPLY);
    EXPECT_EQ(restored.num_threads, 3);
    EXPECT_EQ(restored.source_timeout.count(), 1500);
    EXPECT_EQ(restored.log_level, 5);
    EXPECT_EQ(restored.log_file, std::optional<std::string>("run.log"));
}

TEST(ConfigurationManager, EmptyManagerGivesDefaults) {
    HexMosaicConfig defaults;
    HexMosaicConfig config = ConfigurationManager().to_run_config();
    EXPECT_DOUBLE_EQ(config.tessellation.hex_edge_length, defaults.tessellation.hex_edge_length);
    EXPECT_EQ(config.tessellation.max_tiles, defaults.tessellation.max_tiles);
    EXPECT_EQ(config.mode, PersistenceMode::PREVIEW);
    EXPECT_FALSE(config.log_file.has_value());
}

TEST(ConfigurationManager, RejectsNegativeTileCap) {
    ConfigurationManager manager;
    manager.set_value("max_tiles", "-5");
    expect_rejected("max_tiles", [&] { manager.to_run_config(); });
}

TEST(ConfigurationManager, FileRoundTrip) {
    const std::string path = (std::filesystem::temp_directory_path() / "hexmosaic_config_test.cfg").string();

    ConfigurationManager manager;
    manager.from_run_config(HexMosaicConfig());
    manager.set_value("sources", "Forest=forest.gpkg");
    ASSERT_TRUE(manager.save_to_file(path));

    ConfigurationManager loaded;
    ASSERT_TRUE(loaded.load_from_file(path));
    EXPECT_EQ(loaded.values(), manager.values());
    std::filesystem::remove(path);
}

TEST(ConfigurationManager, LoadSkipsCommentsAndTrims) {
    const std::string path = (std::filesystem::temp_directory_path() / "hexmosaic_config_comments.cfg").string();
    {
        std::ofstream file(path);
        file << "# comment\n\n  hex_edge_length =  300 \nnot a setting\nmode=apply\n";
    }

    ConfigurationManager manager;
    ASSERT_TRUE(manager.load_from_file(path));
    EXPECT_EQ(manager.values().size(), 2u);
    EXPECT_EQ(manager.get_string("hex_edge_length"), "300");
    EXPECT_EQ(manager.to_run_config().mode, PersistenceMode::APPLY);
    std::filesystem::remove(path);

    EXPECT_FALSE(manager.load_from_file("/nonexistent/run.cfg"));
}

} // namespace gtest
} // namespace hexmosaic
