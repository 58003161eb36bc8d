#include <gtest/gtest.h>
#include "Agent.h"
#include "MemoryField.h"
#include "NutrientField.h"
#include "SimulationSettings.h"
#include <cmath>
#include <limits>

namespace
{
    SimulationSettings calmSettings()
    {
        SimulationSettings settings;
        settings.tropismStrength = 0.0f;
        settings.angleWanderRange = 0.0f;
        settings.memoryWeight = 0.0f;
        settings.signalSteeringWeight = 0.0f;
        return settings;
    }
}

TEST(SteeringTest, NoInputKeepsHeading)
{
    SimulationSettings settings = calmSettings();
    sf::Vector2f heading = steerHeading({1.0f, 0.0f}, SenseInput{}, settings, 0.7f);
    EXPECT_NEAR(heading.x, 1.0f, 1e-6f);
    EXPECT_NEAR(heading.y, 0.0f, 1e-6f);
}

TEST(SteeringTest, GradientPullsTowardNutrient)
{
    SimulationSettings settings = calmSettings();
    SenseInput input;
    input.nutrientGradient = {0.0f, 2.0f};

    sf::Vector2f heading = steerHeading({1.0f, 0.0f}, input, settings, 0.0f);
    EXPECT_GT(heading.y, 0.0f);
    EXPECT_NEAR(heading.length(), 1.0f, 1e-5f);
}

TEST(SteeringTest, WeakGradientIsIgnored)
{
    SimulationSettings settings = calmSettings();
    SenseInput input;
    input.nutrientGradient = {0.0f, settings.minGradientMagnitude * 0.5f};

    sf::Vector2f heading = steerHeading({1.0f, 0.0f}, input, settings, 0.0f);
    EXPECT_NEAR(heading.y, 0.0f, 1e-6f);
}

TEST(SteeringTest, WanderIsBoundedAndBoostedWithoutGradient)
{
    SimulationSettings settings = calmSettings();
    settings.angleWanderRange = 0.1f;

    sf::Vector2f wandered = steerHeading({1.0f, 0.0f}, SenseInput{}, settings, 1.0f);
    EXPECT_NEAR(std::atan2(wandered.y, wandered.x), 0.15f, 1e-5f);

    SenseInput input;
    input.nutrientGradient = {1.0f, 0.0f};
    sf::Vector2f guided = steerHeading({1.0f, 0.0f}, input, settings, -1.0f);
    EXPECT_NEAR(std::atan2(guided.y, guided.x), -0.1f, 1e-5f);
}

TEST(SteeringTest, OpposingGradientNeverProducesNaN)
{
    SimulationSettings settings = calmSettings();
    settings.gradientWeight = 1.0f;
    SenseInput input;
    input.nutrientGradient = {-5.0f, 0.0f};

    sf::Vector2f heading = steerHeading({1.0f, 0.0f}, input, settings, 0.0f);
    EXPECT_FALSE(std::isnan(heading.x));
    EXPECT_FALSE(std::isnan(heading.y));
    EXPECT_NEAR(heading.length(), 1.0f, 1e-5f);
}

TEST(SteeringTest, SignalPullsTowardRememberedNutrient)
{
    SimulationSettings settings = calmSettings();
    settings.signalSteeringWeight = 0.5f;
    NutrientField nutrients(50);

    Agent agent(1, {10.0f, 10.0f}, {1.0f, 0.0f}, Reserves{0.5f, 0.05f});
    agent.signal = 1.0f;
    agent.lastNutrientLocation = sf::Vector2f(10.0f, 30.0f);

    SenseInput input = senseEnvironment(agent, nutrients, nullptr, settings);
    EXPECT_NEAR(input.signalPull.y, 1.0f, 1e-6f);

    sf::Vector2f heading = steerHeading(agent.heading, input, settings, 0.0f);
    EXPECT_GT(heading.y, 0.0f);
}

TEST(AvoidanceTest, TurnsAwayFromNearest)
{
    sf::Vector2f heading = avoidNeighbors({1.0f, 0.0f}, {5.0f, 5.0f}, sf::Vector2f(5.0f, 6.0f), 0.6f);
    EXPECT_LT(heading.y, 0.0f);
    EXPECT_GT(heading.x, 0.0f);
    EXPECT_NEAR(heading.length(), 1.0f, 1e-5f);
}

TEST(AvoidanceTest, NoNeighborOrZeroWeightLeavesHeading)
{
    sf::Vector2f alone = avoidNeighbors({0.0f, 1.0f}, {5.0f, 5.0f}, std::nullopt, 0.6f);
    EXPECT_EQ(alone, sf::Vector2f(0.0f, 1.0f));

    sf::Vector2f weightless = avoidNeighbors({0.0f, 1.0f}, {5.0f, 5.0f}, sf::Vector2f(5.0f, 6.0f), 0.0f);
    EXPECT_EQ(weightless, sf::Vector2f(0.0f, 1.0f));

    // coincident neighbour gives no direction to flee
    sf::Vector2f stacked = avoidNeighbors({0.0f, 1.0f}, {5.0f, 5.0f}, sf::Vector2f(5.0f, 5.0f), 0.6f);
    EXPECT_EQ(stacked, sf::Vector2f(0.0f, 1.0f));
}

TEST(AvoidanceTest, HeadOnNeighborStillTurns)
{
    // heading straight at the neighbour with full weight cancels out
    sf::Vector2f heading = avoidNeighbors({1.0f, 0.0f}, {5.0f, 5.0f}, sf::Vector2f(6.0f, 5.0f), 1.0f);
    EXPECT_NEAR(heading.x, -1.0f, 1e-6f);
}

TEST(ReflectionTest, FlipsAtLeftBoundary)
{
    MoveProposal move = reflectAtBoundary({1.2f, 50.0f}, {-1.0f, 0.0f}, 0.5f, 100, 0.0f);
    EXPECT_TRUE(move.reflected);
    EXPECT_NEAR(move.heading.x, 1.0f, 1e-6f);
    EXPECT_NEAR(move.position.x, 1.7f, 1e-5f);
    EXPECT_FLOAT_EQ(move.position.y, 50.0f);
}

TEST(ReflectionTest, FlipsBothComponentsInCorner)
{
    sf::Vector2f diagonal(std::sqrt(0.5f), std::sqrt(0.5f));
    MoveProposal move = reflectAtBoundary({98.8f, 98.8f}, diagonal, 0.5f, 100, 0.0f);
    EXPECT_TRUE(move.reflected);
    EXPECT_LT(move.heading.x, 0.0f);
    EXPECT_LT(move.heading.y, 0.0f);
    EXPECT_LT(move.position.x, 99.0f);
    EXPECT_LT(move.position.y, 99.0f);
}

TEST(ReflectionTest, InteriorMoveIsUntouched)
{
    MoveProposal move = reflectAtBoundary({50.0f, 50.0f}, {0.0f, 1.0f}, 0.5f, 100, 0.3f);
    EXPECT_FALSE(move.reflected);
    EXPECT_FLOAT_EQ(move.position.y, 50.5f);
}

TEST(ReflectionTest, BouncesOffObstacleWall)
{
    NutrientField nutrients(20);
    for (int y = 0; y < 20; ++y)
        nutrients.setBlocked(10, y, true);

    MoveProposal move = reflectAtObstacle(nutrients, {9.7f, 5.5f}, {1.0f, 0.0f}, 0.5f, 0.0f);
    EXPECT_TRUE(move.reflected);
    EXPECT_FALSE(move.blocked);
    EXPECT_LT(move.heading.x, 0.0f);
    EXPECT_FALSE(nutrients.isBlocked(move.position));
}

TEST(ReflectionTest, StaysPutWhenBoxedIn)
{
    NutrientField nutrients(9);
    for (int y = 0; y < 9; ++y)
        for (int x = 0; x < 9; ++x)
            if (x != 4 || y != 4)
                nutrients.setBlocked(x, y, true);

    // the mirrored move lands in a wall as well
    MoveProposal move = reflectAtObstacle(nutrients, {4.5f, 4.5f}, {1.0f, 0.0f}, 1.0f, 0.0f);
    EXPECT_TRUE(move.blocked);
    EXPECT_EQ(move.position, sf::Vector2f(4.5f, 4.5f));
}

TEST(GrowthEfficiencyTest, PeaksAtOptimalRatio)
{
    EXPECT_NEAR(growthEfficiency({1.0f, 0.1f}, 10.0f, 0.5f, 0.2f), 1.0f, 1e-5f);
    EXPECT_LT(growthEfficiency({1.0f, 0.5f}, 10.0f, 0.5f, 0.2f), 1.0f);
    EXPECT_FLOAT_EQ(growthEfficiency({0.0f, 0.0f}, 10.0f, 0.5f, 0.2f), 1.0f);
    EXPECT_FLOAT_EQ(growthEfficiency({1.0f, 0.0f}, 10.0f, 0.5f, 0.2f), 0.2f);
    EXPECT_GE(growthEfficiency({1.0f, 0.0001f}, 10.0f, 5.0f, 0.2f), 0.2f);
}

TEST(SenescenceRiskTest, BaseProbabilityWhenHealthy)
{
    SimulationSettings settings;
    SenescenceInput input;
    SenescenceOutcome outcome = senescenceRisk(input, settings);
    EXPECT_FLOAT_EQ(outcome.probability, settings.senescenceBaseProbability);
    EXPECT_FALSE(outcome.collapse);
}

TEST(SenescenceRiskTest, StressTermsAddUp)
{
    SimulationSettings settings;
    SenescenceInput starved;
    starved.hasConnections = true;
    starved.aggregateFlow = 0.0f;
    EXPECT_GT(senescenceRisk(starved, settings).probability, settings.senescenceBaseProbability);

    // low flow only counts for connected agents
    SenescenceInput isolated;
    isolated.aggregateFlow = 0.0f;
    EXPECT_FLOAT_EQ(senescenceRisk(isolated, settings).probability, settings.senescenceBaseProbability);

    SenescenceInput far;
    far.hubDistance = settings.senescenceDistanceThreshold + 10.0f;
    SenescenceOutcome farOutcome = senescenceRisk(far, settings);
    EXPECT_GT(farOutcome.probability, settings.senescenceBaseProbability);
    EXPECT_FALSE(farOutcome.collapse);

    SenescenceInput stormy;
    stormy.weatherExtreme = 1.0f;
    EXPECT_GT(senescenceRisk(stormy, settings).probability, settings.senescenceBaseProbability);
}

TEST(SenescenceRiskTest, CollapseBeyondHubRange)
{
    SimulationSettings settings;
    SenescenceInput input;
    input.hubDistance = std::numeric_limits<float>::max();
    EXPECT_TRUE(senescenceRisk(input, settings).collapse);

    // no hub at all means no distance stress
    SenescenceInput noHub;
    EXPECT_FALSE(senescenceRisk(noHub, settings).collapse);
}

TEST(ClampToWorldTest, KeepsPositionsWalkable)
{
    sf::Vector2f p = clampToWorld({-3.0f, 250.0f}, 100);
    EXPECT_FLOAT_EQ(p.x, 1.0f);
    EXPECT_LT(p.y, 99.0f);
    EXPECT_GE(p.y, 98.9f);
}

TEST(ClampToWorldTest, NonFiniteCoordinatesLandOnTheBorder)
{
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();

    sf::Vector2f p = clampToWorld({nan, 40.0f}, 100);
    EXPECT_FLOAT_EQ(p.x, 1.0f);
    EXPECT_FLOAT_EQ(p.y, 40.0f);

    sf::Vector2f q = clampToWorld({inf, -inf}, 100);
    EXPECT_TRUE(std::isfinite(q.x) && std::isfinite(q.y));
    EXPECT_FLOAT_EQ(q.x, 1.0f);
    EXPECT_FLOAT_EQ(q.y, 1.0f);
}
