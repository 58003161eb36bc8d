#pragma once
#include "Agent.h"
#include "AgentPool.h"
#include "NetworkGraph.h"
#include "ReproductionSystem.h"
#include "Weather.h"
#include <cstdint>
#include <vector>

/**
 * immutable copy of one finished tick, published by MyceliumSimulation
 * readers hold it through a shared_ptr and never see a tick in progress
 */
struct SimulationSnapshot
{
    uint64_t tickIndex = 0;
    int gridSize = 0;

    // entities
    std::vector<Agent> agents; // alive only, in slot order
    std::vector<Connection> connections;
    std::vector<Segment> segments;
    std::vector<Spore> spores;
    std::vector<FruitingBody> fruitingBodies;

    // fields, row-major gridSize * gridSize
    std::vector<float> sugar;
    std::vector<float> nitrogen;
    std::vector<float> memory;
    std::vector<uint8_t> obstacles;
    float flowDrift = 0.0f; // global offset added to every cell's base flow angle

    // weather
    float temperature = 0.0f;
    float humidity = 0.0f;
    float rain = 0.0f;
    Weather::Season season = Weather::Season::Spring;

    // aggregates
    size_t aliveCount = 0;
    size_t sporeCount = 0;
    size_t connectionCount = 0;
    size_t fruitingBodyCount = 0;
    double totalEnergy = 0.0; // agent reserves
    double averageEnergy = 0.0;
    double totalNutrient = 0.0;
    LifecycleCounters counters;
};
