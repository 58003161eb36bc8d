#include <gtest/gtest.h>
#include "SimulationSettings.h"
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

TEST(SimulationSettingsTest, DefaultsAreValid)
{
    SimulationSettings settings;
    EXPECT_NO_THROW(settings.validate());
}

TEST(SimulationSettingsTest, RejectsNonPositiveGridSize)
{
    SimulationSettings settings;
    settings.gridSize = 0;
    try
    {
        settings.validate();
        FAIL() << "expected std::invalid_argument";
    }
    catch (const std::invalid_argument &e)
    {
        EXPECT_NE(std::string(e.what()).find("gridSize"), std::string::npos);
    }
}

TEST(SimulationSettingsTest, RejectsOutOfRangeValues)
{
    SimulationSettings probability;
    probability.branchProbability = 1.5f;
    EXPECT_THROW(probability.validate(), std::invalid_argument);

    SimulationSettings decay;
    decay.energyDecayRate = 0.0f;
    EXPECT_THROW(decay.validate(), std::invalid_argument);

    SimulationSettings strengths;
    strengths.minConnectionStrength = 0.5f;
    strengths.initialConnectionStrength = 0.3f;
    EXPECT_THROW(strengths.validate(), std::invalid_argument);

    SimulationSettings lifespan;
    lifespan.fruitingLifespanMin = 5.0f;
    lifespan.fruitingLifespanMax = 2.0f;
    EXPECT_THROW(lifespan.validate(), std::invalid_argument);

    SimulationSettings flow;
    flow.connectionFlowRate = 0.6f;
    EXPECT_THROW(flow.validate(), std::invalid_argument);

    SimulationSettings bucket;
    bucket.bucketSize = 0.0f;
    EXPECT_THROW(bucket.validate(), std::invalid_argument);
}

TEST(SimulationSettingsTest, SetValueParsesEveryKind)
{
    SimulationSettings settings;
    EXPECT_TRUE(settings.setValue("gridSize", "128"));
    EXPECT_TRUE(settings.setValue("diffusionRate", "0.125"));
    EXPECT_TRUE(settings.setValue("fruitingEnabled", "0"));
    EXPECT_EQ(settings.gridSize, 128);
    EXPECT_FLOAT_EQ(settings.diffusionRate, 0.125f);
    EXPECT_FALSE(settings.fruitingEnabled);

    EXPECT_FALSE(settings.setValue("noSuchOption", "1"));
    EXPECT_FALSE(settings.setValue("gridSize", "many"));
    EXPECT_EQ(settings.gridSize, 128);
}

TEST(SimulationSettingsTest, DescribeListsEveryOption)
{
    SimulationSettings settings;
    auto entries = settings.describe();
    ASSERT_FALSE(entries.empty());

    bool sawGrid = false;
    bool sawVerbose = false;
    for (const auto &[key, value] : entries)
    {
        if (key == "gridSize")
        {
            sawGrid = true;
            EXPECT_EQ(value, "200");
        }
        if (key == "verboseLogging")
            sawVerbose = true;
    }
    EXPECT_TRUE(sawGrid);
    EXPECT_TRUE(sawVerbose);
}

TEST(SimulationSettingsTest, SaveAndLoadRoundTrip)
{
    const std::string path = "mycelium_settings_roundtrip.txt";

    SimulationSettings original;
    original.gridSize = 96;
    original.tropismAngle = 0.1234567f;
    original.memoryEnabled = false;
    original.sporeEnergy = 0.42f;
    ASSERT_TRUE(original.saveToFile(path));

    SimulationSettings loaded;
    ASSERT_TRUE(loaded.loadFromFile(path));
    EXPECT_EQ(loaded.describe(), original.describe());

    std::remove(path.c_str());
}

TEST(SimulationSettingsTest, LoadReportsMissingFileAndBadLines)
{
    SimulationSettings settings;
    EXPECT_FALSE(settings.loadFromFile("does/not/exist.txt"));

    const std::string path = "mycelium_settings_bad.txt";
    {
        std::ofstream file(path);
        file << "# comment\n";
        file << "gridSize=64\n";
        file << "garbage line\n";
        file << "unknownKey=3\n";
    }
    EXPECT_FALSE(settings.loadFromFile(path));
    EXPECT_EQ(settings.gridSize, 64);

    std::remove(path.c_str());
}
