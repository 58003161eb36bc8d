#include "NutrientField.h"
#include "FieldMath.h"
#include "MemoryField.h"
#include "ParallelProcessor.h"
#include "SimulationRng.h"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace
{
    constexpr float PI = 3.14159265359f;
    constexpr int MAX_SPILL_RADIUS = 3;
    constexpr float MAX_ADVECTION = 0.7f;

    // cheap layered value noise in [0,1], deterministic per seed
    float layeredNoise(float x, float y, uint32_t seed)
    {
        float value = 0.0f;
        float amplitude = 1.0f;
        float frequency = 0.1f;
        float maxValue = 0.0f;

        for (int octave = 0; octave < 4; ++octave)
        {
            int nx = static_cast<int>(x * frequency);
            int ny = static_cast<int>(y * frequency);
            uint32_t hash = (static_cast<uint32_t>(nx) * 73856093u) ^ (static_cast<uint32_t>(ny) * 19349663u);
            hash *= (seed | 1u);
            hash ^= hash >> 15;
            float noise = static_cast<float>(hash % 1000u) / 1000.0f * 2.0f - 1.0f;
            value += noise * amplitude;
            maxValue += amplitude;
            amplitude *= 0.5f;
            frequency *= 2.0f;
        }
        return (value / maxValue + 1.0f) * 0.5f;
    }
}

NutrientField::NutrientField(int size, float maxValue)
    : size_(size), maxValue_(maxValue)
{
    size_t count = getDataSize();
    sugar_ = std::make_unique<float[]>(count);
    nitrogen_ = std::make_unique<float[]>(count);
    temp_ = std::make_unique<float[]>(count);
    obstacles_.assign(count, 0);
    flowAngles_.assign(count, 0.0f);

    clear();
}

NutrientField::~NutrientField() = default;

void NutrientField::clear()
{
    size_t bytes = getDataSize() * sizeof(float);
    std::memset(sugar_.get(), 0, bytes);
    std::memset(nitrogen_.get(), 0, bytes);
    std::fill(obstacles_.begin(), obstacles_.end(), 0);
    std::fill(flowAngles_.begin(), flowAngles_.end(), 0.0f);
    flowDrift_ = 0.0f;
}

bool NutrientField::inBounds(const sf::Vector2f &position) const
{
    return position.x >= 0.0f && position.y >= 0.0f &&
           position.x < static_cast<float>(size_) && position.y < static_cast<float>(size_);
}

sf::Vector2i NutrientField::cellOf(const sf::Vector2f &position) const
{
    // clamp in float space so the int cast never overflows
    float hi = static_cast<float>(size_ - 1);
    float fx = std::isfinite(position.x) ? std::clamp(std::floor(position.x), 0.0f, hi) : 0.0f;
    float fy = std::isfinite(position.y) ? std::clamp(std::floor(position.y), 0.0f, hi) : 0.0f;
    return {static_cast<int>(fx), static_cast<int>(fy)};
}

float NutrientField::sample(int x, int y, Channel channel) const
{
    if (!isValidCoordinate(x, y))
        return 0.0f;
    return getData(channel)[getIndex(x, y)];
}

float NutrientField::totalAt(int x, int y) const
{
    if (!isValidCoordinate(x, y))
        return 0.0f;
    int idx = getIndex(x, y);
    return sugar_[idx] + nitrogen_[idx] * 0.5f;
}

float NutrientField::totalAt(const sf::Vector2f &position) const
{
    sf::Vector2i cell = cellOf(position);
    return totalAt(cell.x, cell.y);
}

void NutrientField::set(int x, int y, Channel channel, float value)
{
    if (!isValidCoordinate(x, y))
        return;
    channelData(channel)[getIndex(x, y)] = std::clamp(value, 0.0f, maxValue_);
}

float NutrientField::add(int x, int y, Channel channel, float amount)
{
    if (!isValidCoordinate(x, y) || amount <= 0.0f)
        return 0.0f;
    float &cell = channelData(channel)[getIndex(x, y)];
    float accepted = std::min(amount, maxValue_ - cell);
    if (accepted <= 0.0f)
        return 0.0f;
    cell += accepted;
    return accepted;
}

NutrientField::Amount NutrientField::consume(const sf::Vector2f &position, float radius, float rate,
                                             float sugarLimit, float nitrogenLimit,
                                             MemoryField *memory, float memoryStrength)
{
    Amount taken;
    if (rate <= 0.0f || !inBounds(position))
        return taken;

    if (!std::isfinite(radius))
        radius = 0.0f;
    radius = std::clamp(radius, 0.0f, static_cast<float>(size_));

    sf::Vector2i center = cellOf(position);
    int reach = static_cast<int>(std::ceil(radius));
    float radiusSq = radius * radius;

    // gather the disc once, removal below is proportional per cell
    std::vector<int> cells;
    double availSugar = 0.0;
    double availNitrogen = 0.0;
    for (int dy = -reach; dy <= reach; ++dy)
    {
        for (int dx = -reach; dx <= reach; ++dx)
        {
            int x = center.x + dx;
            int y = center.y + dy;
            if (!isValidCoordinate(x, y) || isBlocked(x, y))
                continue;
            if (reach > 0 && static_cast<float>(dx * dx + dy * dy) > radiusSq)
                continue;
            int idx = getIndex(x, y);
            cells.push_back(idx);
            availSugar += sugar_[idx];
            availNitrogen += nitrogen_[idx];
        }
    }

    double available = availSugar + availNitrogen;
    if (available <= 0.0)
        return taken;

    double take = std::min(available, static_cast<double>(rate));
    double sugarTake = std::min(take * availSugar / available, static_cast<double>(std::max(sugarLimit, 0.0f)));
    double nitrogenTake = std::min(take * availNitrogen / available, static_cast<double>(std::max(nitrogenLimit, 0.0f)));

    float sugarFraction = availSugar > 0.0 ? static_cast<float>(sugarTake / availSugar) : 0.0f;
    float nitrogenFraction = availNitrogen > 0.0 ? static_cast<float>(nitrogenTake / availNitrogen) : 0.0f;
    sugarFraction = std::min(sugarFraction, 1.0f);
    nitrogenFraction = std::min(nitrogenFraction, 1.0f);

    for (int idx : cells)
    {
        float s = sugar_[idx] * sugarFraction;
        float n = nitrogen_[idx] * nitrogenFraction;
        sugar_[idx] -= s;
        nitrogen_[idx] -= n;
        taken.sugar += s;
        taken.nitrogen += n;
    }

    if (memory && taken.total() > 0.0f)
        memory->addAt(position, taken.total() * memoryStrength);

    return taken;
}

NutrientField::Amount NutrientField::deposit(const sf::Vector2f &position, float sugar, float nitrogen)
{
    Amount left{std::max(sugar, 0.0f), std::max(nitrogen, 0.0f)};
    sf::Vector2i center = cellOf(position);

    for (int ring = 0; ring <= MAX_SPILL_RADIUS; ++ring)
    {
        for (int dy = -ring; dy <= ring; ++dy)
        {
            for (int dx = -ring; dx <= ring; ++dx)
            {
                if (std::max(std::abs(dx), std::abs(dy)) != ring)
                    continue;
                int x = center.x + dx;
                int y = center.y + dy;
                if (!isValidCoordinate(x, y) || isBlocked(x, y))
                    continue;
                left.sugar -= add(x, y, Channel::Sugar, left.sugar);
                left.nitrogen -= add(x, y, Channel::Nitrogen, left.nitrogen);
            }
        }
        if (left.sugar <= 0.0f && left.nitrogen <= 0.0f)
            break;
    }

    left.sugar = std::max(left.sugar, 0.0f);
    left.nitrogen = std::max(left.nitrogen, 0.0f);
    return left;
}

void NutrientField::addPatch(const sf::Vector2f &position, float radius, Channel channel, float amount)
{
    if (!std::isfinite(radius))
        radius = 0.0f;
    radius = std::clamp(radius, 0.0f, static_cast<float>(size_));

    sf::Vector2i center = cellOf(position);
    int reach = static_cast<int>(std::ceil(radius));

    for (int dy = -reach; dy <= reach; ++dy)
    {
        for (int dx = -reach; dx <= reach; ++dx)
        {
            int x = center.x + dx;
            int y = center.y + dy;
            if (!isValidCoordinate(x, y) || isBlocked(x, y))
                continue;
            float dist = std::sqrt(static_cast<float>(dx * dx + dy * dy));
            if (dist < radius || (dx == 0 && dy == 0))
                add(x, y, channel, amount);
        }
    }
}

void NutrientField::addCell(const sf::Vector2f &position, Channel channel, float amount)
{
    sf::Vector2i cell = cellOf(position);
    if (!isBlocked(cell.x, cell.y))
        add(cell.x, cell.y, channel, amount);
}

void NutrientField::diffuse(float rate, float nitrogenScale, float advection, ParallelProcessor *processor)
{
    rate = std::clamp(rate, 0.0f, 1.0f);
    if (rate > 0.0f)
    {
        diffuseChannel(sugar_.get(), rate, processor);
        diffuseChannel(nitrogen_.get(), std::clamp(rate * nitrogenScale, 0.0f, 1.0f), processor);
    }

    advection = std::clamp(advection, 0.0f, MAX_ADVECTION);
    if (advection > 0.0f)
    {
        advectChannel(sugar_.get(), advection);
        advectChannel(nitrogen_.get(), advection);
    }
}

// symmetric exchange with the 4 neighbours, each pair swaps rate/4 of its difference
void NutrientField::diffuseChannel(float *data, float rate, ParallelProcessor *processor)
{
    const float k = rate * 0.25f;
    float *out = temp_.get();

    // reads data, writes only its own rows of out
    auto diffuseRows = [this, data, out, k](size_t firstRow, size_t lastRow)
    {
        for (int y = static_cast<int>(firstRow); y < static_cast<int>(lastRow); ++y)
        {
            for (int x = 0; x < size_; ++x)
            {
                int idx = getIndex(x, y);
                float v = data[idx];
                if (obstacles_[idx])
                {
                    out[idx] = v;
                    continue;
                }

                float delta = 0.0f;
                if (x > 0 && !obstacles_[idx - 1])
                    delta += data[idx - 1] - v;
                if (x < size_ - 1 && !obstacles_[idx + 1])
                    delta += data[idx + 1] - v;
                if (y > 0 && !obstacles_[idx - size_])
                    delta += data[idx - size_] - v;
                if (y < size_ - 1 && !obstacles_[idx + size_])
                    delta += data[idx + size_] - v;

                out[idx] = std::clamp(v + k * delta, 0.0f, maxValue_);
            }
        }
    };

    if (processor)
        processor->parallelRange(static_cast<size_t>(size_), diffuseRows);
    else
        diffuseRows(0, static_cast<size_t>(size_));

    std::memcpy(data, out, getDataSize() * sizeof(float));
}

// upwind transport toward the downstream x and y neighbours of every cell
void NutrientField::advectChannel(float *data, float advection)
{
    float *out = temp_.get();
    std::memcpy(out, data, getDataSize() * sizeof(float));

    for (int y = 0; y < size_; ++y)
    {
        for (int x = 0; x < size_; ++x)
        {
            int idx = getIndex(x, y);
            float v = data[idx];
            if (obstacles_[idx] || v <= 0.0f)
                continue;

            sf::Vector2f dir = flowDirection(x, y);
            int tx = x + (dir.x > 0.0f ? 1 : -1);
            int ty = y + (dir.y > 0.0f ? 1 : -1);
            float alignX = std::abs(dir.x);
            float alignY = std::abs(dir.y);

            if (isValidCoordinate(tx, y) && !isBlocked(tx, y))
            {
                int target = getIndex(tx, y);
                float amount = std::min(advection * v * alignX, (maxValue_ - data[target]) * 0.25f);
                if (amount > 0.0f)
                {
                    out[idx] -= amount;
                    out[target] += amount;
                }
            }
            if (isValidCoordinate(x, ty) && !isBlocked(x, ty))
            {
                int target = getIndex(x, ty);
                float amount = std::min(advection * v * alignY, (maxValue_ - data[target]) * 0.25f);
                if (amount > 0.0f)
                {
                    out[idx] -= amount;
                    out[target] += amount;
                }
            }
        }
    }

    // transfers are bounded so this only trims float noise
    size_t count = getDataSize();
    for (size_t i = 0; i < count; ++i)
        data[i] = std::clamp(out[i], 0.0f, maxValue_);
}

void NutrientField::driftFlow(SimulationRng &rng, float range)
{
    flowDrift_ += rng.symmetric(range);
    if (flowDrift_ > PI)
        flowDrift_ -= 2.0f * PI;
    else if (flowDrift_ < -PI)
        flowDrift_ += 2.0f * PI;
}

sf::Vector2f NutrientField::flowDirection(int x, int y) const
{
    if (!isValidCoordinate(x, y))
        return {0.0f, 0.0f};
    float angle = flowAngles_[getIndex(x, y)] + flowDrift_;
    return {std::cos(angle), std::sin(angle)};
}

void NutrientField::regenerate(SimulationRng &rng, int samples, float rate, float floorValue)
{
    if (rate <= 0.0f || floorValue <= 0.0f)
        return;

    const float nitrogenFloor = floorValue * 0.6f;
    const float nitrogenRate = rate * 0.6f;

    for (int i = 0; i < samples; ++i)
    {
        int x = rng.uniformInt(0, size_ - 1);
        int y = rng.uniformInt(0, size_ - 1);
        int idx = getIndex(x, y);
        if (obstacles_[idx])
            continue;

        if (sugar_[idx] < floorValue)
            sugar_[idx] = std::min(floorValue, sugar_[idx] + rate);
        if (nitrogen_[idx] < nitrogenFloor)
            nitrogen_[idx] = std::min(nitrogenFloor, nitrogen_[idx] + nitrogenRate);
    }
}

sf::Vector2f NutrientField::gradient(const sf::Vector2f &position) const
{
    if (!inBounds(position))
        return {0.0f, 0.0f};
    int x = static_cast<int>(std::floor(position.x));
    int y = static_cast<int>(std::floor(position.y));
    sf::Vector2f g = sobelGradient(sugar_.get(), size_, x, y);
    g += sobelGradient(nitrogen_.get(), size_, x, y) * 0.5f;
    return g;
}

void NutrientField::seedPatches(SimulationRng &rng)
{
    const float extent = static_cast<float>(size_);
    const float scale = extent / 200.0f;
    size_t count = getDataSize();
    std::memset(sugar_.get(), 0, count * sizeof(float));
    std::memset(nitrogen_.get(), 0, count * sizeof(float));

    // broad sugar patches, like decaying plant matter
    int sugarPatches = 8 + rng.uniformInt(0, 4);
    for (int p = 0; p < sugarPatches; ++p)
    {
        float px = rng.uniform(0.0f, extent);
        float py = rng.uniform(0.0f, extent);
        float radius = rng.uniform(15.0f, 40.0f) * scale;
        float intensity = rng.uniform(0.4f, 0.9f);
        uint32_t seed = rng.nextSeed();

        for (int y = 0; y < size_; ++y)
        {
            for (int x = 0; x < size_; ++x)
            {
                float dx = x - px;
                float dy = y - py;
                float falloff = std::max(0.0f, 1.0f - std::min(std::sqrt(dx * dx + dy * dy) / radius, 1.0f));
                if (falloff <= 0.0f)
                    continue;
                float noise = layeredNoise(static_cast<float>(x), static_cast<float>(y), seed);
                int idx = getIndex(x, y);
                sugar_[idx] = std::min(maxValue_, sugar_[idx] + falloff * falloff * intensity * (0.7f + 0.3f * noise));
            }
        }
    }

    // rarer, sharper nitrogen patches
    int nitrogenPatches = 3 + rng.uniformInt(0, 3);
    for (int p = 0; p < nitrogenPatches; ++p)
    {
        float px = rng.uniform(0.0f, extent);
        float py = rng.uniform(0.0f, extent);
        float radius = rng.uniform(8.0f, 25.0f) * scale;
        float intensity = rng.uniform(0.5f, 1.0f);
        uint32_t seed = rng.nextSeed();

        for (int y = 0; y < size_; ++y)
        {
            for (int x = 0; x < size_; ++x)
            {
                float dx = x - px;
                float dy = y - py;
                float falloff = std::max(0.0f, 1.0f - std::min(std::sqrt(dx * dx + dy * dy) / radius, 1.0f));
                if (falloff <= 0.0f)
                    continue;
                float noise = layeredNoise(static_cast<float>(x), static_cast<float>(y), seed);
                int idx = getIndex(x, y);
                nitrogen_[idx] = std::min(maxValue_, nitrogen_[idx] + falloff * falloff * falloff * intensity * (0.6f + 0.4f * noise));
            }
        }
    }

    // background variation
    uint32_t backgroundSeed = rng.nextSeed();
    for (int y = 0; y < size_; ++y)
    {
        for (int x = 0; x < size_; ++x)
        {
            int idx = getIndex(x, y);
            float noise = layeredNoise(static_cast<float>(x), static_cast<float>(y), backgroundSeed) - 0.5f;
            sugar_[idx] = std::clamp(sugar_[idx] + noise * 0.15f, 0.0f, maxValue_);
            nitrogen_[idx] = std::clamp(nitrogen_[idx] + noise * 0.1f, 0.0f, maxValue_);
        }
    }
}

void NutrientField::seedFlow(SimulationRng &rng)
{
    // a slowly varying direction field: one prevailing angle bent by two waves
    float prevailing = rng.uniform(0.0f, 2.0f * PI);
    float freqX = rng.uniform(0.01f, 0.05f);
    float freqY = rng.uniform(0.01f, 0.05f);
    float phaseX = rng.uniform(0.0f, 2.0f * PI);
    float phaseY = rng.uniform(0.0f, 2.0f * PI);

    for (int y = 0; y < size_; ++y)
    {
        for (int x = 0; x < size_; ++x)
        {
            flowAngles_[getIndex(x, y)] = prevailing + 0.6f * std::sin(x * freqX + phaseX) + 0.6f * std::cos(y * freqY + phaseY);
        }
    }
    flowDrift_ = 0.0f;
}

void NutrientField::placeObstacles(SimulationRng &rng, int count, const sf::Vector2f &keepClearCenter, float keepClearRadius)
{
    for (int i = 0; i < count; ++i)
    {
        int x = rng.uniformInt(0, size_ - 1);
        int y = rng.uniformInt(0, size_ - 1);
        if (std::abs(x + 0.5f - keepClearCenter.x) <= keepClearRadius &&
            std::abs(y + 0.5f - keepClearCenter.y) <= keepClearRadius)
            continue;
        setBlocked(x, y, true);
    }
}

bool NutrientField::isBlocked(int x, int y) const
{
    if (!isValidCoordinate(x, y))
        return false;
    return obstacles_[getIndex(x, y)] != 0;
}

bool NutrientField::isBlocked(const sf::Vector2f &position) const
{
    if (!inBounds(position))
        return false;
    return isBlocked(static_cast<int>(position.x), static_cast<int>(position.y));
}

void NutrientField::setBlocked(int x, int y, bool blocked)
{
    if (!isValidCoordinate(x, y))
        return;
    int idx = getIndex(x, y);
    obstacles_[idx] = blocked ? 1 : 0;
    if (blocked)
    {
        // obstacle cells hold no nutrient
        sugar_[idx] = 0.0f;
        nitrogen_[idx] = 0.0f;
    }
}

sf::Vector2f NutrientField::obstacleNormal(int x, int y) const
{
    sf::Vector2f normal{0.0f, 0.0f};
    for (int dy = -1; dy <= 1; ++dy)
    {
        for (int dx = -1; dx <= 1; ++dx)
        {
            if (dx == 0 && dy == 0)
                continue;
            if (isBlocked(x + dx, y + dy))
                normal -= sf::Vector2f(static_cast<float>(dx), static_cast<float>(dy));
        }
    }
    float len = std::sqrt(normal.x * normal.x + normal.y * normal.y);
    if (len < 1e-6f)
        return {0.0f, 0.0f};
    return normal / len;
}

double NutrientField::totalNutrient() const
{
    double sum = 0.0;
    size_t count = getDataSize();
    for (size_t i = 0; i < count; ++i)
        sum += static_cast<double>(sugar_[i]) + nitrogen_[i];
    return sum;
}
