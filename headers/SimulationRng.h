#pragma once
#include <cstdint>
#include <random>

// the single seeded random stream owned by one simulation instance
struct SimulationRng
{
    std::mt19937 gen;

    explicit SimulationRng(uint32_t seed) : gen(seed) {}

    // uniform in [a, b), returns a when the range is empty
    float uniform(float a = 0.0f, float b = 1.0f)
    {
        if (!(b > a))
            return a;
        std::uniform_real_distribution<float> dist(a, b);
        return dist(gen);
    }

    // symmetric range [-range, range)
    float symmetric(float range) { return uniform(-range, range); }

    int uniformInt(int a, int b)
    {
        if (b <= a)
            return a;
        std::uniform_int_distribution<int> dist(a, b);
        return dist(gen);
    }

    bool chance(float probability)
    {
        if (probability <= 0.0f)
            return false;
        if (probability >= 1.0f)
            return true;
        return uniform() < probability;
    }

    uint32_t nextSeed() { return gen(); }
};
