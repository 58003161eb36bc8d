#include <gtest/gtest.h>
#include "Agent.h"
#include "SpatialGrid.h"
#include <algorithm>
#include <limits>
#include <vector>

TEST(SpatialGridTest, NeighborsAreExactWithinRadius)
{
    SpatialGrid grid(4.0f);
    grid.insert(0, {10.0f, 10.0f});
    grid.insert(1, {12.0f, 10.0f});
    grid.insert(2, {13.5f, 10.0f});
    grid.insert(3, {40.0f, 40.0f});

    std::vector<size_t> found = grid.neighbors({10.0f, 10.0f}, 2.0f);
    std::sort(found.begin(), found.end());
    EXPECT_EQ(found, (std::vector<size_t>{0, 1}));

    EXPECT_EQ(grid.size(), 4u);
    EXPECT_TRUE(grid.neighbors({25.0f, 25.0f}, 3.0f).empty());
}

TEST(SpatialGridTest, RadiusLargerThanBucketSpansBuckets)
{
    SpatialGrid grid(2.0f);
    grid.insert(0, {1.0f, 1.0f});
    grid.insert(1, {8.0f, 1.0f});
    grid.insert(2, {1.0f, 8.5f});

    std::vector<size_t> found = grid.neighbors({1.0f, 1.0f}, 7.5f);
    std::sort(found.begin(), found.end());
    EXPECT_EQ(found, (std::vector<size_t>{0, 1, 2}));
}

TEST(SpatialGridTest, NeighborOrderIsDeterministic)
{
    SpatialGrid first(4.0f);
    SpatialGrid second(4.0f);
    for (size_t i = 0; i < 50; ++i)
    {
        sf::Vector2f p(static_cast<float>(i % 7) * 1.3f, static_cast<float>(i % 5) * 1.7f);
        first.insert(i, p);
        second.insert(i, p);
    }
    EXPECT_EQ(first.neighbors({4.0f, 4.0f}, 5.0f), second.neighbors({4.0f, 4.0f}, 5.0f));
}

TEST(SpatialGridTest, NearestSkipsExcludedSlot)
{
    SpatialGrid grid(4.0f);
    grid.insert(0, {5.0f, 5.0f});
    grid.insert(1, {6.0f, 5.0f});
    grid.insert(2, {8.0f, 5.0f});

    auto nearest = grid.nearest({5.0f, 5.0f}, 5.0f, 0);
    ASSERT_TRUE(nearest.has_value());
    EXPECT_EQ(*nearest, 1u);

    EXPECT_FALSE(grid.nearest({50.0f, 50.0f}, 2.0f).has_value());
}

TEST(SpatialGridTest, NonFiniteQueriesFindNothing)
{
    const float nan = std::numeric_limits<float>::quiet_NaN();
    SpatialGrid grid(4.0f);
    grid.insert(0, {5.0f, 5.0f});
    grid.insert(1, {nan, nan});
    grid.insert(2, {1e30f, -1e30f});

    EXPECT_EQ(grid.size(), 3u);
    EXPECT_TRUE(grid.neighbors({5.0f, 5.0f}, nan).empty());
    EXPECT_TRUE(grid.neighbors({nan, 5.0f}, 3.0f).empty());
    EXPECT_FALSE(grid.nearest({5.0f, 5.0f}, nan).has_value());
    EXPECT_FALSE(grid.nearest({1e30f, 1e30f}, 2.0f).has_value());

    std::vector<size_t> found = grid.neighbors({5.0f, 5.0f}, 1.0f);
    EXPECT_EQ(found, (std::vector<size_t>{0}));
}

TEST(SpatialGridTest, RebuildIndexesLiveAgentsOnly)
{
    std::vector<Agent> agents;
    agents.emplace_back(1, sf::Vector2f(3.0f, 3.0f), sf::Vector2f(1.0f, 0.0f), Reserves{0.5f, 0.05f});
    agents.emplace_back(2, sf::Vector2f(3.5f, 3.0f), sf::Vector2f(1.0f, 0.0f), Reserves{0.5f, 0.05f});
    agents.emplace_back(3, sf::Vector2f(4.0f, 3.0f), sf::Vector2f(1.0f, 0.0f), Reserves{0.5f, 0.05f});
    agents[1].alive = false;

    SpatialGrid grid(4.0f);
    grid.insert(7, {0.0f, 0.0f});
    grid.rebuild(agents);

    EXPECT_EQ(grid.size(), 2u);
    std::vector<size_t> found = grid.neighbors({3.5f, 3.0f}, 2.0f);
    std::sort(found.begin(), found.end());
    EXPECT_EQ(found, (std::vector<size_t>{0, 2}));

    grid.clear();
    EXPECT_TRUE(grid.empty());
}
