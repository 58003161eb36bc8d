#pragma once
#include <SFML/System/Vector2.hpp>
#include <cstdint>
#include <memory>
#include <vector>

class MemoryField;
class ParallelProcessor;
struct SimulationRng;

/**
 * two co-located nutrient grids (sugar, nitrogen) with obstacles and a flow direction field
 * one world unit == one cell, cells are row-major (y * size + x)
 */
class NutrientField
{
public:
    enum class Channel
    {
        Sugar = 0,
        Nitrogen = 1
    };

    struct Amount
    {
        float sugar = 0.0f;
        float nitrogen = 0.0f;

        float total() const { return sugar + nitrogen; }
    };

    NutrientField(int size, float maxValue = 1.0f);
    ~NutrientField();

    void clear();

    // world <-> cell helpers
    int getSize() const { return size_; }
    float getMaxValue() const { return maxValue_; }
    bool inBounds(const sf::Vector2f &position) const;
    sf::Vector2i cellOf(const sf::Vector2f &position) const; // clamped into the grid

    float sample(int x, int y, Channel channel) const;
    float totalAt(int x, int y) const; // sugar + nitrogen * 0.5 (nitrogen is less energy dense)
    float totalAt(const sf::Vector2f &position) const;

    // direct cell writes, clamped into [0, max]; add returns the accepted amount
    void set(int x, int y, Channel channel, float value);
    float add(int x, int y, Channel channel, float amount);

    // removes up to `rate` from the disc around position, split between the
    // channels by availability and limited per channel; bumps memory at position
    Amount consume(const sf::Vector2f &position, float radius, float rate,
                   float sugarLimit, float nitrogenLimit,
                   MemoryField *memory, float memoryStrength);

    // adds at position, spilling into rings up to radius 3, returns what did not fit
    Amount deposit(const sf::Vector2f &position, float sugar, float nitrogen);

    // perturbations from the outside, positions are clamped
    void addPatch(const sf::Vector2f &position, float radius, Channel channel, float amount);
    void addCell(const sf::Vector2f &position, Channel channel, float amount);

    // processing, diffusion rows are split over the processor when one is given
    void diffuse(float rate, float nitrogenScale, float advection, ParallelProcessor *processor = nullptr);
    void driftFlow(SimulationRng &rng, float range);
    void regenerate(SimulationRng &rng, int samples, float rate, float floorValue);

    // sobel gradient of sugar + 0.5 * nitrogen
    sf::Vector2f gradient(const sf::Vector2f &position) const;
    sf::Vector2f flowDirection(int x, int y) const;

    // initial state
    void seedPatches(SimulationRng &rng);
    void seedFlow(SimulationRng &rng);
    void placeObstacles(SimulationRng &rng, int count, const sf::Vector2f &keepClearCenter, float keepClearRadius);

    // obstacles
    bool isBlocked(int x, int y) const;
    bool isBlocked(const sf::Vector2f &position) const;
    void setBlocked(int x, int y, bool blocked);
    sf::Vector2f obstacleNormal(int x, int y) const; // zero when no blocked neighbour

    // accessors
    const float *getData(Channel channel) const { return channel == Channel::Sugar ? sugar_.get() : nitrogen_.get(); }
    const std::vector<uint8_t> &getObstacles() const { return obstacles_; }
    float getFlowDrift() const { return flowDrift_; }
    double totalNutrient() const;
    size_t getDataSize() const { return static_cast<size_t>(size_) * size_; }

private:
    int size_;
    float maxValue_;
    std::unique_ptr<float[]> sugar_;
    std::unique_ptr<float[]> nitrogen_;
    std::unique_ptr<float[]> temp_; // scratch buffer for diffusion passes
    std::vector<uint8_t> obstacles_;
    std::vector<float> flowAngles_; // per cell base direction, radians
    float flowDrift_ = 0.0f;        // global rotation added to every cell

    bool isValidCoordinate(int x, int y) const { return x >= 0 && y >= 0 && x < size_ && y < size_; }
    int getIndex(int x, int y) const { return y * size_ + x; }
    float *channelData(Channel channel) { return channel == Channel::Sugar ? sugar_.get() : nitrogen_.get(); }

    void diffuseChannel(float *data, float rate, ParallelProcessor *processor);
    void advectChannel(float *data, float advection);
};
