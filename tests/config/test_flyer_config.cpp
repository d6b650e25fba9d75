/**
 * @file test_flyer_config.cpp
 * @brief Unit tests for the flyer and simulation configuration sections
 */

#include <gtest/gtest.h>

#include "config/sections/flyer_config.hpp"
#include "config/sections/simulation_config.hpp"

namespace flyscan::config::test {

class FlyerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// ============================================================================
// Defaults Tests
// ============================================================================

TEST_F(FlyerConfigTest, Defaults) {
    FlyerConfig config;
    EXPECT_DOUBLE_EQ(config.preStartOffset, -0.5);
    EXPECT_DOUBLE_EQ(config.startPosition, -20.0);
    EXPECT_DOUBLE_EQ(config.finishPosition, 20.0);
    EXPECT_EQ(config.pollIntervalMs, 50);
    EXPECT_EQ(config.numCycles, 1);
    EXPECT_EQ(config.streamName, "spin_flyer_stream");
    EXPECT_TRUE(config.validate().isValid());
}

TEST_F(FlyerConfigTest, TaxiPositionAddsRunUp) {
    FlyerConfig config;
    EXPECT_DOUBLE_EQ(config.taxiPosition(), -20.5);

    config.startPosition = 5.0;
    config.preStartOffset = 1.25;
    EXPECT_DOUBLE_EQ(config.taxiPosition(), 6.25);
}

TEST_F(FlyerConfigTest, PollIntervals) {
    FlyerConfig config;
    config.pollIntervalMs = 7;
    config.fileWritePollMs = 3;
    EXPECT_EQ(config.pollInterval(), std::chrono::milliseconds(7));
    EXPECT_EQ(config.fileWritePollInterval(), std::chrono::milliseconds(3));
}

TEST_F(FlyerConfigTest, PathIsStable) {
    EXPECT_EQ(FlyerConfig::PATH, "/flyscan/flyer");
    EXPECT_EQ(SimulationConfig::PATH, "/flyscan/simulation");
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST_F(FlyerConfigTest, SerializeUsesFieldNames) {
    FlyerConfig config;
    config.numCycles = 4;
    auto j = config.toJson();

    EXPECT_EQ(j["numCycles"], 4);
    EXPECT_DOUBLE_EQ(j["preStartOffset"].get<double>(), -0.5);
    EXPECT_EQ(j["streamName"], "spin_flyer_stream");
    EXPECT_TRUE(j.contains("completeTimeoutMs"));
}

TEST_F(FlyerConfigTest, DeserializePartialKeepsDefaults) {
    json j = {{"startPosition", -10.0}, {"numCycles", 3}};
    auto config = FlyerConfig::fromJson(j);

    EXPECT_DOUBLE_EQ(config.startPosition, -10.0);
    EXPECT_EQ(config.numCycles, 3);
    EXPECT_DOUBLE_EQ(config.finishPosition, 20.0);
    EXPECT_EQ(config.maxFrames, 10000);
}

TEST_F(FlyerConfigTest, SerializeThenDeserializeIsEqual) {
    FlyerConfig config;
    config.finishPosition = 42.0;
    config.streamName = "primary";

    EXPECT_TRUE(FlyerConfig::fromJson(config.toJson()) == config);
}

TEST_F(FlyerConfigTest, FromJsonRejectsWrongType) {
    json j = {{"numCycles", "many"}};
    EXPECT_THROW((void)FlyerConfig::fromJson(j), json::exception);
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(FlyerConfigTest, ValidateRejectsZeroCycles) {
    FlyerConfig config;
    config.numCycles = 0;
    auto result = config.validate();

    EXPECT_FALSE(result.isValid());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].path, "/flyscan/flyer/numCycles");
    EXPECT_EQ(result.errors[0].keyword, "minimum");
}

TEST_F(FlyerConfigTest, ValidateCollectsEveryError) {
    FlyerConfig config;
    config.maxFrames = 0;
    config.pollIntervalMs = 0;
    config.streamName.clear();
    auto result = config.validate();

    EXPECT_EQ(result.errors.size(), 3u);
    EXPECT_NE(result.summary().find("/flyscan/flyer/streamName"),
              std::string::npos);
}

TEST_F(FlyerConfigTest, NegativeIntervalsRejected) {
    auto config = FlyerConfig::fromJson(
        {{"pollIntervalMs", -5}, {"completeTimeoutMs", -1}});
    EXPECT_EQ(config.pollIntervalMs, -5);

    auto result = config.validate();
    EXPECT_FALSE(result.isValid());
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].path, "/flyscan/flyer/pollIntervalMs");
    EXPECT_EQ(result.errors[1].path, "/flyscan/flyer/completeTimeoutMs");
}

TEST_F(FlyerConfigTest, SchemaListsRanges) {
    auto schema = FlyerConfig::schema();
    EXPECT_EQ(schema["type"], "object");
    EXPECT_EQ(schema["properties"]["numCycles"]["type"], "integer");
    EXPECT_DOUBLE_EQ(
        schema["properties"]["numCycles"]["minimum"].get<double>(), 1.0);
    EXPECT_EQ(schema["properties"]["streamName"]["default"],
              "spin_flyer_stream");
}

// ============================================================================
// SimulationConfig Tests
// ============================================================================

TEST_F(FlyerConfigTest, SimulationDefaultsAreValid) {
    SimulationConfig config;
    EXPECT_EQ(config.actuatorName, "m1");
    EXPECT_EQ(config.busyFlagName, "mybusy");
    EXPECT_TRUE(config.validate().isValid());
}

TEST_F(FlyerConfigTest, SimulationRejectsNegativeVelocity) {
    SimulationConfig config;
    config.velocity = -1.0;
    config.captureName.clear();
    auto result = config.validate();

    EXPECT_FALSE(result.isValid());
    EXPECT_EQ(result.errors.size(), 2u);
}

}  // namespace flyscan::config::test
