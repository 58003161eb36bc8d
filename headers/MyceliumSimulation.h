#pragma once
#include <SFML/System/Vector2.hpp>
#include "SimulationSettings.h"
#include "SimulationRng.h"
#include "NutrientField.h"
#include "MemoryField.h"
#include "Weather.h"
#include "SpatialGrid.h"
#include "AgentPool.h"
#include "NetworkGraph.h"
#include "ParallelProcessor.h"
#include "ReproductionSystem.h"
#include "SimulationSnapshot.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

/**
 * everything one simulation instance owns
 * reset builds a fresh one and swaps it in, nothing is patched in place
 */
struct SimulationState
{
    SimulationSettings settings;
    SimulationRng rng;
    NutrientField nutrients;
    MemoryField memory;
    Weather weather;
    AgentPool pool;
    NetworkGraph graph;
    ReproductionSystem reproduction;
    std::vector<Segment> segments;
    ParallelProcessor processor; // field diffusion workers

    SpatialGrid index;    // live agents
    SpatialGrid hubIndex; // agents with degree >= senescenceHubMinDegree
    std::vector<int> degree;
    std::vector<float> aggregateFlow;

    LifecycleCounters counters;
    uint64_t tickIndex = 0;

    SimulationState(uint32_t seed, const SimulationSettings &config);

    GrowthContext context();
};

/**
 * mycelium growth engine
 * one tick runs every stage in a fixed order under tickMutex_; readers take
 * immutable snapshots that are swapped in under snapshotMutex_
 */
class MyceliumSimulation
{
public:
    // throws std::invalid_argument before any state exists
    MyceliumSimulation(uint32_t seed, const SimulationSettings &settings);
    ~MyceliumSimulation() = default;

    MyceliumSimulation(const MyceliumSimulation &) = delete;
    MyceliumSimulation &operator=(const MyceliumSimulation &) = delete;

    // core simulation methods
    void step();
    void stepMany(int count);
    void reset(const SimulationSettings &settings);

    // external perturbations, out of range positions are clamped or ignored
    void addNutrientPatch(const sf::Vector2f &position, float radius, NutrientField::Channel channel);
    void addNutrientCell(const sf::Vector2f &position, NutrientField::Channel channel);
    std::optional<AgentRef> spawnAgent(const sf::Vector2f &position);

    std::shared_ptr<const SimulationSnapshot> snapshot() const;

    SimulationSettings getSettings() const;
    uint32_t getSeed() const { return seed_; }
    uint64_t getTickIndex() const;

    // unsynchronized, single threaded tests and tools only
    SimulationState &state() { return *state_; }
    const SimulationState &state() const { return *state_; }

private:
    uint32_t seed_;
    std::unique_ptr<SimulationState> state_;
    mutable std::mutex tickMutex_;

    std::shared_ptr<const SimulationSnapshot> snapshot_;
    mutable std::mutex snapshotMutex_;

    static std::unique_ptr<SimulationState> buildState(uint32_t seed, const SimulationSettings &settings);
    static void spawnInitialAgents(SimulationState &state);

    // the per tick pipeline, caller holds tickMutex_
    void tick();
    void updateEnvironment(SimulationState &state);
    void computeGraphInputs(SimulationState &state);
    void updateSegments(SimulationState &state);

    std::shared_ptr<const SimulationSnapshot> capture() const;
    void publish();
};
