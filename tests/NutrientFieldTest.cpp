#include <gtest/gtest.h>
#include "FieldMath.h"
#include "MemoryField.h"
#include "NutrientField.h"
#include "SimulationRng.h"
#include <cmath>
#include <limits>

using Channel = NutrientField::Channel;

namespace
{
    float channelTotal(const NutrientField &field, Channel channel)
    {
        double sum = 0.0;
        const float *data = field.getData(channel);
        for (size_t i = 0; i < field.getDataSize(); ++i)
            sum += data[i];
        return static_cast<float>(sum);
    }
}

TEST(NutrientFieldTest, ConsumeIsBoundedByRateAndAvailability)
{
    NutrientField field(20);
    field.set(5, 5, Channel::Sugar, 0.4f);
    field.set(5, 5, Channel::Nitrogen, 0.1f);

    NutrientField::Amount taken = field.consume({5.5f, 5.5f}, 0.0f, 0.05f, 1.0f, 1.0f, nullptr, 0.0f);
    EXPECT_NEAR(taken.total(), 0.05f, 1e-6f);
    // split by availability, 4:1
    EXPECT_NEAR(taken.sugar, 0.04f, 1e-6f);
    EXPECT_NEAR(taken.nitrogen, 0.01f, 1e-6f);
    EXPECT_NEAR(field.sample(5, 5, Channel::Sugar), 0.36f, 1e-6f);

    NutrientField::Amount rest = field.consume({5.5f, 5.5f}, 0.0f, 10.0f, 1.0f, 1.0f, nullptr, 0.0f);
    EXPECT_NEAR(rest.total(), 0.45f, 1e-5f);
    EXPECT_NEAR(field.totalAt(5, 5), 0.0f, 1e-6f);
}

TEST(NutrientFieldTest, ConsumeRespectsPerChannelLimits)
{
    NutrientField field(20);
    field.set(3, 3, Channel::Sugar, 0.5f);
    field.set(3, 3, Channel::Nitrogen, 0.5f);

    NutrientField::Amount taken = field.consume({3.2f, 3.2f}, 0.0f, 0.2f, 0.02f, 1.0f, nullptr, 0.0f);
    EXPECT_NEAR(taken.sugar, 0.02f, 1e-6f);
    EXPECT_NEAR(taken.nitrogen, 0.1f, 1e-6f);
}

TEST(NutrientFieldTest, ConsumeOnEmptyCellIsNeutral)
{
    NutrientField field(10);
    MemoryField memory(10);
    NutrientField::Amount taken = field.consume({4.0f, 4.0f}, 2.0f, 0.1f, 1.0f, 1.0f, &memory, 1.0f);
    EXPECT_EQ(taken.total(), 0.0f);
    EXPECT_EQ(memory.total(), 0.0);
}

TEST(NutrientFieldTest, ConsumeWritesMemory)
{
    NutrientField field(10);
    MemoryField memory(10);
    field.set(4, 4, Channel::Sugar, 0.5f);

    NutrientField::Amount taken = field.consume({4.5f, 4.5f}, 0.0f, 0.1f, 1.0f, 1.0f, &memory, 2.0f);
    EXPECT_NEAR(memory.sample(4, 4), taken.total() * 2.0f, 1e-6f);
}

TEST(NutrientFieldTest, DiffusionConservesMassAndStaysBounded)
{
    NutrientField field(16);
    field.set(8, 8, Channel::Sugar, 1.0f);
    field.set(2, 3, Channel::Nitrogen, 0.8f);
    const float sugarBefore = channelTotal(field, Channel::Sugar);
    const float nitrogenBefore = channelTotal(field, Channel::Nitrogen);

    for (int i = 0; i < 50; ++i)
        field.diffuse(0.5f, 0.7f, 0.0f);

    EXPECT_NEAR(channelTotal(field, Channel::Sugar), sugarBefore, 1e-4f);
    EXPECT_NEAR(channelTotal(field, Channel::Nitrogen), nitrogenBefore, 1e-4f);
    EXPECT_LT(field.sample(8, 8, Channel::Sugar), 1.0f);
    EXPECT_GT(field.sample(9, 8, Channel::Sugar), 0.0f);
}

TEST(NutrientFieldTest, AdvectionNeverOverfillsCells)
{
    SimulationRng rng(7);
    NutrientField field(12);
    field.seedFlow(rng);
    for (int y = 0; y < 12; ++y)
        for (int x = 0; x < 12; ++x)
            field.set(x, y, Channel::Sugar, 0.9f);

    const float before = channelTotal(field, Channel::Sugar);
    for (int i = 0; i < 20; ++i)
        field.diffuse(0.0f, 0.7f, 0.7f);

    const float *sugar = field.getData(Channel::Sugar);
    for (size_t i = 0; i < field.getDataSize(); ++i)
    {
        EXPECT_GE(sugar[i], 0.0f);
        EXPECT_LE(sugar[i], 1.0f);
    }
    EXPECT_NEAR(channelTotal(field, Channel::Sugar), before, 1e-3f);
}

TEST(NutrientFieldTest, ObstaclesNeitherSendNorReceive)
{
    NutrientField field(8);
    field.set(4, 4, Channel::Sugar, 1.0f);
    field.setBlocked(5, 4, true);

    for (int i = 0; i < 10; ++i)
        field.diffuse(1.0f, 1.0f, 0.0f);

    EXPECT_EQ(field.sample(5, 4, Channel::Sugar), 0.0f);
    EXPECT_TRUE(field.isBlocked(5, 4));
    EXPECT_TRUE(field.isBlocked(sf::Vector2f(5.5f, 4.5f)));
}

TEST(NutrientFieldTest, RegenerationStopsAtFloor)
{
    SimulationRng rng(3);
    NutrientField field(6);
    field.set(0, 0, Channel::Sugar, 0.5f);

    for (int i = 0; i < 500; ++i)
        field.regenerate(rng, 36, 0.01f, 0.2f);

    for (int y = 0; y < 6; ++y)
    {
        for (int x = 0; x < 6; ++x)
        {
            if (x == 0 && y == 0)
                continue;
            EXPECT_NEAR(field.sample(x, y, Channel::Sugar), 0.2f, 1e-5f);
            EXPECT_NEAR(field.sample(x, y, Channel::Nitrogen), 0.12f, 1e-5f);
        }
    }
    // already above the floor, untouched
    EXPECT_FLOAT_EQ(field.sample(0, 0, Channel::Sugar), 0.5f);
}

TEST(NutrientFieldTest, GradientPointsUphill)
{
    NutrientField field(10);
    for (int y = 0; y < 10; ++y)
        for (int x = 0; x < 10; ++x)
            field.set(x, y, Channel::Sugar, 0.1f * static_cast<float>(x));

    sf::Vector2f g = field.gradient({5.5f, 5.5f});
    EXPECT_GT(g.x, 0.0f);
    EXPECT_NEAR(g.y, 0.0f, 1e-6f);

    // zero on the border ring
    sf::Vector2f edge = field.gradient({0.5f, 5.5f});
    EXPECT_EQ(edge.x, 0.0f);
    EXPECT_EQ(edge.y, 0.0f);
}

TEST(NutrientFieldTest, DepositSpillsAndReturnsLeftover)
{
    NutrientField field(3, 1.0f);
    NutrientField::Amount left = field.deposit({1.5f, 1.5f}, 5.0f, 0.0f);
    // nine cells of capacity 1, everything fits
    EXPECT_NEAR(left.sugar, 0.0f, 1e-6f);
    EXPECT_NEAR(channelTotal(field, Channel::Sugar), 5.0f, 1e-5f);

    NutrientField::Amount overflow = field.deposit({1.5f, 1.5f}, 10.0f, 0.0f);
    EXPECT_NEAR(overflow.sugar, 6.0f, 1e-5f);
}

TEST(NutrientFieldTest, PatchesAndCellsAreClampedIntoTheGrid)
{
    NutrientField field(10);
    field.addPatch({-50.0f, -50.0f}, 1.5f, Channel::Sugar, 0.3f);
    EXPECT_GT(field.sample(0, 0, Channel::Sugar), 0.0f);

    field.addCell({500.0f, 3.2f}, Channel::Nitrogen, 2.0f);
    EXPECT_FLOAT_EQ(field.sample(9, 3, Channel::Nitrogen), 1.0f);

    const float nan = std::numeric_limits<float>::quiet_NaN();
    field.addCell({nan, 1e12f}, Channel::Nitrogen, 0.2f);
    EXPECT_FLOAT_EQ(field.sample(0, 9, Channel::Nitrogen), 0.2f);
    EXPECT_FLOAT_EQ(field.totalAt(sf::Vector2f(nan, nan)), field.totalAt(0, 0));
}

TEST(NutrientFieldTest, PatchRadiusIsBoundedByTheGrid)
{
    NutrientField field(10);
    field.addPatch({5.0f, 5.0f}, 1e9f, Channel::Sugar, 0.1f);
    EXPECT_NEAR(channelTotal(field, Channel::Sugar), 100 * 0.1f, 1e-4f);

    NutrientField nanField(10);
    nanField.addPatch({5.0f, 5.0f}, std::numeric_limits<float>::quiet_NaN(), Channel::Sugar, 0.1f);
    EXPECT_FLOAT_EQ(nanField.sample(5, 5, Channel::Sugar), 0.1f);
    EXPECT_NEAR(channelTotal(nanField, Channel::Sugar), 0.1f, 1e-6f);

    NutrientField negativeField(10);
    negativeField.addPatch({5.0f, 5.0f}, -4.0f, Channel::Sugar, 0.1f);
    EXPECT_NEAR(channelTotal(negativeField, Channel::Sugar), 0.1f, 1e-6f);
}

TEST(NutrientFieldTest, ObstaclesStayClearOfTheCenter)
{
    SimulationRng rng(11);
    NutrientField field(40);
    field.placeObstacles(rng, 2000, {20.0f, 20.0f}, 5.0f);

    for (int y = 16; y < 24; ++y)
        for (int x = 16; x < 24; ++x)
            EXPECT_FALSE(field.isBlocked(x, y));
}

TEST(NutrientFieldTest, SeededFieldIsBounded)
{
    SimulationRng rng(5);
    NutrientField field(60);
    field.seedPatches(rng);

    EXPECT_GT(field.totalNutrient(), 0.0);
    for (Channel channel : {Channel::Sugar, Channel::Nitrogen})
    {
        const float *data = field.getData(channel);
        for (size_t i = 0; i < field.getDataSize(); ++i)
        {
            ASSERT_GE(data[i], 0.0f);
            ASSERT_LE(data[i], 1.0f);
        }
    }
}

TEST(MemoryFieldTest, DecaysGeometrically)
{
    MemoryField memory(8, 1.0f);
    memory.add(3, 3, 0.8f);
    memory.decay(0.5f);
    EXPECT_FLOAT_EQ(memory.sample(3, 3), 0.4f);
    memory.decay(0.5f);
    EXPECT_FLOAT_EQ(memory.sample(3, 3), 0.2f);
}

TEST(MemoryFieldTest, ClampsToMaxAndIgnoresOutOfRange)
{
    MemoryField memory(8, 1.0f);
    memory.add(2, 2, 5.0f);
    memory.add(-1, 2, 1.0f);
    memory.add(2, 8, 1.0f);
    const float nan = std::numeric_limits<float>::quiet_NaN();
    memory.addAt({nan, 2.0f}, 1.0f);
    memory.addAt({3.0f, 1e12f}, 1.0f);
    EXPECT_FLOAT_EQ(memory.sample(2, 2), 1.0f);
    EXPECT_DOUBLE_EQ(memory.total(), 1.0);

    sf::Vector2f g = memory.gradient({nan, nan});
    EXPECT_FLOAT_EQ(g.x, 0.0f);
    EXPECT_FLOAT_EQ(g.y, 0.0f);
}

TEST(MemoryFieldTest, GradientLeansTowardMemory)
{
    MemoryField memory(10, 1.0f);
    memory.add(6, 5, 1.0f);
    sf::Vector2f g = memory.gradient({5.5f, 5.5f});
    EXPECT_GT(g.x, 0.0f);
}

TEST(FieldMathTest, SobelIsZeroOnTheBorderRing)
{
    float grid[4 * 4] = {};
    grid[1 * 4 + 2] = 1.0f;

    sf::Vector2f inner = sobelGradient(grid, 4, 1, 1);
    EXPECT_FLOAT_EQ(inner.x, 2.0f);
    EXPECT_FLOAT_EQ(inner.y, 0.0f);

    sf::Vector2f edge = sobelGradient(grid, 4, 0, 1);
    EXPECT_FLOAT_EQ(edge.x, 0.0f);
    EXPECT_FLOAT_EQ(edge.y, 0.0f);
    EXPECT_FLOAT_EQ(sobelGradient(grid, 4, 3, 3).x, 0.0f);
}
