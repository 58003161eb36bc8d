#include "MyceliumSimulation.h"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace
{
    constexpr float TWO_PI = 6.28318530718f;
    constexpr float OBSTACLE_CLEAR_MARGIN = 5.0f; // around the initial spawn square

    bool isFinitePosition(const sf::Vector2f &p)
    {
        return std::isfinite(p.x) && std::isfinite(p.y);
    }
}

SimulationState::SimulationState(uint32_t seed, const SimulationSettings &config)
    : settings(config),
      rng(seed),
      nutrients(config.gridSize, config.maxNutrient),
      memory(config.gridSize, config.maxMemory),
      weather(config.weatherEnabled, config.seasonalCycleEnabled),
      processor(static_cast<size_t>(config.fieldThreads)),
      index(config.bucketSize),
      hubIndex(std::max(config.senescenceCollapseDistance, config.bucketSize))
{
}

GrowthContext SimulationState::context()
{
    return GrowthContext{settings, nutrients, memory, weather, index, hubIndex,
                         aggregateFlow, degree, rng, segments, counters};
}

MyceliumSimulation::MyceliumSimulation(uint32_t seed, const SimulationSettings &settings)
    : seed_(seed)
{
    settings.validate();
    state_ = buildState(seed_, settings);
    publish();

    if (settings.verboseLogging)
    {
        std::cout << "MyceliumSimulation initialized:" << std::endl;
        std::cout << "  Grid: " << settings.gridSize << "x" << settings.gridSize << std::endl;
        std::cout << "  Seed: " << seed_ << std::endl;
        std::cout << "  Hyphae: " << state_->pool.aliveCount() << std::endl;
        std::cout << "  Field threads: " << state_->processor.getThreadCount() << std::endl;
        std::cout << "  Total nutrient: " << state_->nutrients.totalNutrient() << std::endl;
    }
}

std::unique_ptr<SimulationState> MyceliumSimulation::buildState(uint32_t seed, const SimulationSettings &settings)
{
    auto state = std::make_unique<SimulationState>(seed, settings);

    const float center = static_cast<float>(settings.gridSize) * 0.5f;
    if (settings.seedNutrients)
        state->nutrients.seedPatches(state->rng);
    state->nutrients.seedFlow(state->rng);
    state->nutrients.placeObstacles(state->rng, settings.obstacleCount, {center, center},
                                    settings.initialSpawnSpread + OBSTACLE_CLEAR_MARGIN);

    spawnInitialAgents(*state);
    state->index.rebuild(state->pool.getAgents());
    return state;
}

void MyceliumSimulation::spawnInitialAgents(SimulationState &state)
{
    const SimulationSettings &settings = state.settings;
    const float center = static_cast<float>(settings.gridSize) * 0.5f;

    for (int i = 0; i < settings.initialHyphaeCount; ++i)
    {
        if (!state.pool.hasCapacity(settings.maxHyphae))
            break;

        sf::Vector2f position(center + state.rng.symmetric(settings.initialSpawnSpread),
                              center + state.rng.symmetric(settings.initialSpawnSpread));
        position = clampToWorld(position, settings.gridSize);
        if (state.nutrients.isBlocked(position))
            continue;

        float angle = state.rng.uniform(0.0f, TWO_PI);
        state.pool.spawn(position, {std::cos(angle), std::sin(angle)},
                         Reserves{settings.initialCarbon, settings.initialNitrogen});
    }
}

void MyceliumSimulation::step()
{
    {
        std::lock_guard<std::mutex> lock(tickMutex_);
        tick();
    }
    publish();
}

void MyceliumSimulation::stepMany(int count)
{
    for (int i = 0; i < count; ++i)
        step();
}

void MyceliumSimulation::reset(const SimulationSettings &settings)
{
    settings.validate();
    {
        std::lock_guard<std::mutex> lock(tickMutex_);
        state_ = buildState(seed_, settings);
    }
    publish();

    if (settings.verboseLogging)
        std::cout << "Simulation reset with " << settings.initialHyphaeCount << " hyphae" << std::endl;
}

void MyceliumSimulation::tick()
{
    SimulationState &state = *state_;
    const SimulationSettings &settings = state.settings;

    updateEnvironment(state);

    state.index.rebuild(state.pool.getAgents());
    computeGraphInputs(state);

    GrowthContext ctx = state.context();
    state.pool.step(ctx);
    auto fusedPairs = state.pool.fuse(ctx);

    // fused pairs are skipped, so a merged pair never also gets a link
    state.graph.formConnections(state.pool, state.index, settings, fusedPairs);
    state.graph.removeDeadEdges(state.pool);

    state.graph.updateFlow(state.pool, settings);
    state.graph.propagateSignals(state.pool, settings);
    state.graph.prune(settings);

    state.reproduction.update(state.pool, state.graph, ctx);

    if (settings.memoryEnabled)
        state.memory.decay(settings.memoryDecayRate);

    updateSegments(state);

    state.pool.reap(state.nutrients);
    ++state.tickIndex;
}

void MyceliumSimulation::updateEnvironment(SimulationState &state)
{
    const SimulationSettings &settings = state.settings;
    state.weather.update(settings.tickSeconds, state.rng);

    state.nutrients.driftFlow(state.rng, settings.flowDriftRange);
    float advection = settings.flowBaseStrength + settings.flowRainStrength * state.weather.getRain();
    state.nutrients.diffuse(settings.diffusionRate * state.weather.nutrientDiffusionMultiplier(),
                            settings.nitrogenDiffusionScale, advection, &state.processor);
    state.nutrients.regenerate(state.rng, settings.regenSamples,
                               settings.regenRate * state.weather.regenerationMultiplier(), settings.regenFloor);
}

void MyceliumSimulation::computeGraphInputs(SimulationState &state)
{
    const SimulationSettings &settings = state.settings;
    state.graph.agentInputs(state.pool.slotCount(), state.degree, state.aggregateFlow);

    state.hubIndex.clear();
    for (size_t slot = 0; slot < state.pool.slotCount(); ++slot)
    {
        if (state.pool.isLive(slot) && state.degree[slot] >= settings.senescenceHubMinDegree)
            state.hubIndex.insert(slot, state.pool.at(slot).position);
    }
}

void MyceliumSimulation::updateSegments(SimulationState &state)
{
    const SimulationSettings &settings = state.settings;
    std::vector<Segment> &segments = state.segments;

    for (Segment &segment : segments)
        segment.age += settings.segmentAgeIncrement;

    segments.erase(std::remove_if(segments.begin(), segments.end(), [&settings](const Segment &s)
                                  { return s.age > settings.maxSegmentAge; }),
                   segments.end());

    // appended in time order, so the oldest sit at the front
    if (settings.maxSegments >= 0 && segments.size() > static_cast<size_t>(settings.maxSegments))
        segments.erase(segments.begin(), segments.end() - settings.maxSegments);
}

void MyceliumSimulation::addNutrientPatch(const sf::Vector2f &position, float radius, NutrientField::Channel channel)
{
    if (!isFinitePosition(position))
        return;
    {
        std::lock_guard<std::mutex> lock(tickMutex_);
        SimulationState &state = *state_;
        state.nutrients.addPatch(position, radius, channel, state.settings.patchAmount);
    }
    publish();
}

void MyceliumSimulation::addNutrientCell(const sf::Vector2f &position, NutrientField::Channel channel)
{
    if (!isFinitePosition(position))
        return;
    {
        std::lock_guard<std::mutex> lock(tickMutex_);
        SimulationState &state = *state_;
        state.nutrients.addCell(position, channel, state.settings.patchAmount);
    }
    publish();
}

std::optional<AgentRef> MyceliumSimulation::spawnAgent(const sf::Vector2f &position)
{
    if (!isFinitePosition(position))
        return std::nullopt;

    std::optional<AgentRef> ref;
    {
        std::lock_guard<std::mutex> lock(tickMutex_);
        SimulationState &state = *state_;
        const SimulationSettings &settings = state.settings;

        sf::Vector2f clamped = clampToWorld(position, settings.gridSize);
        if (!state.pool.hasCapacity(settings.maxHyphae) || state.nutrients.isBlocked(clamped))
            return std::nullopt;

        float angle = state.rng.uniform(0.0f, TWO_PI);
        ref = state.pool.spawn(clamped, {std::cos(angle), std::sin(angle)},
                               Reserves{settings.initialCarbon, settings.initialNitrogen});
        ++state.counters.births;
        state.index.insert(ref->slot, clamped);
    }
    publish();
    return ref;
}

SimulationSettings MyceliumSimulation::getSettings() const
{
    std::lock_guard<std::mutex> lock(tickMutex_);
    return state_->settings;
}

uint64_t MyceliumSimulation::getTickIndex() const
{
    return snapshot()->tickIndex;
}

std::shared_ptr<const SimulationSnapshot> MyceliumSimulation::snapshot() const
{
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return snapshot_;
}

std::shared_ptr<const SimulationSnapshot> MyceliumSimulation::capture() const
{
    const SimulationState &state = *state_;
    auto snap = std::make_shared<SimulationSnapshot>();

    snap->tickIndex = state.tickIndex;
    snap->gridSize = state.settings.gridSize;

    snap->agents.reserve(state.pool.aliveCount());
    for (const Agent &agent : state.pool.getAgents())
    {
        if (agent.alive)
            snap->agents.push_back(agent);
    }
    snap->connections = state.graph.getConnections();
    snap->segments = state.segments;
    snap->spores = state.reproduction.getSpores();
    snap->fruitingBodies = state.reproduction.getFruitingBodies();

    const size_t cells = state.nutrients.getDataSize();
    const float *sugar = state.nutrients.getData(NutrientField::Channel::Sugar);
    const float *nitrogen = state.nutrients.getData(NutrientField::Channel::Nitrogen);
    snap->sugar.assign(sugar, sugar + cells);
    snap->nitrogen.assign(nitrogen, nitrogen + cells);
    snap->memory.assign(state.memory.getData(), state.memory.getData() + cells);
    snap->obstacles = state.nutrients.getObstacles();
    snap->flowDrift = state.nutrients.getFlowDrift();

    snap->temperature = state.weather.getTemperature();
    snap->humidity = state.weather.getHumidity();
    snap->rain = state.weather.getRain();
    snap->season = state.weather.getSeason();

    snap->aliveCount = state.pool.aliveCount();
    snap->sporeCount = state.reproduction.aliveSporeCount();
    snap->connectionCount = state.graph.size();
    snap->fruitingBodyCount = state.reproduction.getFruitingBodies().size();
    snap->totalEnergy = state.pool.totalReserves();
    snap->averageEnergy = snap->aliveCount > 0 ? snap->totalEnergy / static_cast<double>(snap->aliveCount) : 0.0;
    snap->totalNutrient = state.nutrients.totalNutrient();
    snap->counters = state.counters;
    return snap;
}

void MyceliumSimulation::publish()
{
    std::shared_ptr<const SimulationSnapshot> next;
    {
        std::lock_guard<std::mutex> lock(tickMutex_);
        next = capture();
    }
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    snapshot_ = std::move(next);
}
