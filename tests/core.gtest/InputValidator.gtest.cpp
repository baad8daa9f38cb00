#include "InputValidator.hpp"
#include "HexMosaicError.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace hexmosaic {
namespace gtest {

TEST(InputValidator, DefaultConfigurationIsValid) {
    InputValidator validator;
    ValidationResult result = validator.validate(HexMosaicConfig());
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.conflicts.empty());
    EXPECT_EQ(result.format_error_message(), "");
}

TEST(InputValidator, RejectsNonPositiveEdgeLength) {
    HexMosaicConfig config;
    config.tessellation.hex_edge_length = 0.0;

    ValidationResult result = InputValidator().validate(config);
    ASSERT_FALSE(result.is_valid);
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_NE(result.involved_keys().find("hex_edge_length"), std::string::npos);
}

TEST(InputValidator, RejectsNonFiniteOrigin) {
    HexMosaicConfig config;
    config.tessellation.origin = Point2D(std::numeric_limits<double>::infinity(), 0.0);
    EXPECT_FALSE(InputValidator().validate(config).is_valid);
}

TEST(InputValidator, ApplyNeedsAStore) {
    HexMosaicConfig config;
    config.mode = PersistenceMode::APPLY;

    EXPECT_TRUE(InputValidator().validate(config, true).is_valid);

    ValidationResult result = InputValidator().validate(config, false);
    ASSERT_FALSE(result.is_valid);
    EXPECT_EQ(result.involved_keys(), "mode = apply");
}

TEST(InputValidator, ReportsEveryConflictAtOnce) {
    HexMosaicConfig config;
    config.tessellation.hex_edge_length = -1.0;
    config.tessellation.max_tiles = 0;
    config.num_threads = -2;
    config.log_level = 9;
    config.mode = PersistenceMode::APPLY;

    ValidationResult result = InputValidator().validate(config, false);
    ASSERT_FALSE(result.is_valid);
    EXPECT_EQ(result.conflicts.size(), 4u);

    // Execution problems are grouped into one conflict
    const std::string message = result.format_error_message();
    EXPECT_NE(message.find("Conflict 4"), std::string::npos);
    EXPECT_NE(message.find("num_threads = -2"), std::string::npos);
    EXPECT_NE(message.find("log_level = 9"), std::string::npos);
}

TEST(InputValidator, RejectsSliverFractionOfOne) {
    HexMosaicConfig config;
    config.tessellation.min_sliver_fraction = 1.0;
    EXPECT_FALSE(InputValidator().validate(config).is_valid);
}

TEST(InputValidator, RequireValidThrowsConfigurationError) {
    HexMosaicConfig config;
    config.source_timeout = std::chrono::milliseconds(0);

    try {
        InputValidator().require_valid(config);
        FAIL() << "invalid configuration accepted";
    } catch (const HexMosaicError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_CONFIGURATION);
        EXPECT_EQ(e.phase(), Phase::VALIDATION);
        EXPECT_NE(e.context().find("source_timeout_ms"), std::string::npos);
    }
}

} // namespace gtest
} // namespace hexmosaic
