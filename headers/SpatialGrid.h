#pragma once
#include <SFML/System/Vector2.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

struct Agent;

/**
 * spatial hash grid for neighbor lookup
 * buckets are keyed by floor(position / bucketSize) and hold pool slots,
 * so a query only touches the buckets covering its radius
 */
class SpatialGrid
{
public:
    static constexpr size_t ESTIMATED_AGENTS_PER_CELL = 16;
    static constexpr size_t NO_EXCLUDE = static_cast<size_t>(-1);

    struct Entry
    {
        size_t slot;
        sf::Vector2f position;
    };

    struct Cell
    {
        std::vector<Entry> entries;

        Cell()
        {
            entries.reserve(ESTIMATED_AGENTS_PER_CELL);
        }

        void clear()
        {
            entries.clear();
        }
    };

    explicit SpatialGrid(float bucketSize);
    ~SpatialGrid() = default;

    // core operations
    void clear();
    void insert(size_t slot, const sf::Vector2f &position);
    void rebuild(const std::vector<Agent> &agents); // live agents only

    // slots within radius (inclusive), ordered by bucket then insertion
    std::vector<size_t> neighbors(const sf::Vector2f &position, float radius) const;
    std::optional<size_t> nearest(const sf::Vector2f &position, float radius, size_t exclude = NO_EXCLUDE) const;

    bool empty() const { return entryCount_ == 0; }
    size_t size() const { return entryCount_; }
    size_t getCellCount() const { return cells_.size(); }
    float getBucketSize() const { return bucketSize_; }

private:
    std::unordered_map<uint64_t, Cell> cells_;
    float bucketSize_;
    float invBucketSize_; // precomputed for faster division
    size_t entryCount_ = 0;

    static constexpr float MAX_BUCKET = 1e6f;

    // exact packing, distinct buckets never share a key
    static uint64_t cellKey(int x, int y)
    {
        return (static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32) | static_cast<uint32_t>(y);
    }

    // non-finite coordinates land in bucket 0, huge ones are clamped before the int cast
    static int bucketOf(float scaled)
    {
        if (!std::isfinite(scaled))
            return 0;
        return static_cast<int>(std::clamp(std::floor(scaled), -MAX_BUCKET, MAX_BUCKET));
    }

    std::pair<int, int> worldToGrid(const sf::Vector2f &position) const
    {
        return {bucketOf(position.x * invBucketSize_), bucketOf(position.y * invBucketSize_)};
    }
};
