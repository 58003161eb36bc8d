#include "SpatialGrid.h"
#include "Agent.h"
#include <algorithm>
#include <cmath>

SpatialGrid::SpatialGrid(float bucketSize)
    : bucketSize_(bucketSize), invBucketSize_(1.0f / bucketSize)
{
}

void SpatialGrid::clear()
{
    // keep the buckets allocated between rebuilds
    for (auto &[key, cell] : cells_)
    {
        cell.clear();
    }
    entryCount_ = 0;
}

void SpatialGrid::insert(size_t slot, const sf::Vector2f &position)
{
    auto [gridX, gridY] = worldToGrid(position);
    cells_[cellKey(gridX, gridY)].entries.push_back({slot, position});
    ++entryCount_;
}

void SpatialGrid::rebuild(const std::vector<Agent> &agents)
{
    clear();

    for (size_t i = 0; i < agents.size(); ++i)
    {
        if (agents[i].alive)
            insert(i, agents[i].position);
    }
}

std::vector<size_t> SpatialGrid::neighbors(const sf::Vector2f &position, float radius) const
{
    std::vector<size_t> result;
    if (!std::isfinite(radius) || radius < 0.0f || entryCount_ == 0)
        return result;

    int radiusInCells = std::max(1, static_cast<int>(std::ceil(radius * invBucketSize_)));
    auto [centerX, centerY] = worldToGrid(position);
    float radiusSq = radius * radius;

    for (int dy = -radiusInCells; dy <= radiusInCells; ++dy)
    {
        for (int dx = -radiusInCells; dx <= radiusInCells; ++dx)
        {
            auto it = cells_.find(cellKey(centerX + dx, centerY + dy));
            if (it == cells_.end())
                continue;

            for (const Entry &entry : it->second.entries)
            {
                sf::Vector2f d = entry.position - position;
                if (d.x * d.x + d.y * d.y <= radiusSq)
                    result.push_back(entry.slot);
            }
        }
    }

    return result;
}

std::optional<size_t> SpatialGrid::nearest(const sf::Vector2f &position, float radius, size_t exclude) const
{
    std::optional<size_t> best;
    if (!std::isfinite(radius) || radius < 0.0f)
        return best;
    float bestDistSq = radius * radius;

    int radiusInCells = std::max(1, static_cast<int>(std::ceil(radius * invBucketSize_)));
    auto [centerX, centerY] = worldToGrid(position);

    for (int dy = -radiusInCells; dy <= radiusInCells; ++dy)
    {
        for (int dx = -radiusInCells; dx <= radiusInCells; ++dx)
        {
            auto it = cells_.find(cellKey(centerX + dx, centerY + dy));
            if (it == cells_.end())
                continue;

            for (const Entry &entry : it->second.entries)
            {
                if (entry.slot == exclude)
                    continue;
                sf::Vector2f d = entry.position - position;
                float distSq = d.x * d.x + d.y * d.y;
                if (distSq <= bestDistSq && (!best || distSq < bestDistSq))
                {
                    best = entry.slot;
                    bestDistSq = distSq;
                }
            }
        }
    }

    return best;
}
