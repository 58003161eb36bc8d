#include "AgentPool.h"
#include "MemoryField.h"
#include "NutrientField.h"
#include "SimulationRng.h"
#include "SimulationSettings.h"
#include "SpatialGrid.h"
#include "Weather.h"
#include <SFML/System/Angle.hpp>
#include <algorithm>
#include <cassert>
#include <cmath>
#include <functional>
#include <limits>

void AgentPool::clear()
{
    agents_.clear();
    freeSlots_.clear();
    nextId_ = 1;
    aliveCount_ = 0;
}

AgentRef AgentPool::spawn(const sf::Vector2f &position, const sf::Vector2f &heading, const Reserves &reserves)
{
    size_t slot;
    if (!freeSlots_.empty())
    {
        slot = freeSlots_.back();
        freeSlots_.pop_back();
        assert(agents_[slot].id == 0 && "slot reused before reap");
    }
    else
    {
        slot = agents_.size();
        agents_.emplace_back();
    }

    agents_[slot] = Agent(nextId_++, position, heading, reserves);
    ++aliveCount_;
    return {slot, agents_[slot].id};
}

void AgentPool::kill(size_t slot, DeathCause cause, LifecycleCounters &counters)
{
    Agent &agent = agents_[slot];
    if (!agent.alive)
        return;

    agent.alive = false;
    --aliveCount_;

    switch (cause)
    {
    case DeathCause::Starvation:
        ++counters.deathsStarvation;
        break;
    case DeathCause::Senescence:
        ++counters.deathsSenescence;
        break;
    case DeathCause::Fusion:
        ++counters.deathsFusion;
        break;
    }
}

bool AgentPool::hasCapacity(int maxHyphae, size_t pending) const
{
    if (maxHyphae <= 0)
        return true;
    return aliveCount_ + pending < static_cast<size_t>(maxHyphae);
}

void AgentPool::step(GrowthContext &ctx)
{
    std::vector<PendingChild> children;

    // children join after the loop, so agents_ never reallocates under a reference
    const size_t count = agents_.size();
    for (size_t slot = 0; slot < count; ++slot)
    {
        if (agents_[slot].alive)
            stepAgent(slot, ctx, children);
    }

    for (const PendingChild &child : children)
    {
        AgentRef ref = spawn(child.position, child.heading, child.reserves);
        Agent &agent = agents_[ref.slot];
        agent.strength = child.strength;
        agent.senescence = child.senescence;
        agent.lastNutrientLocation = child.lastNutrientLocation;
        ++ctx.counters.births;
    }
}

void AgentPool::stepAgent(size_t slot, GrowthContext &ctx, std::vector<PendingChild> &children)
{
    const SimulationSettings &settings = ctx.settings;
    Agent &agent = agents_[slot];
    agent.previousPosition = agent.position;

    // sense + steer
    SenseInput input = senseEnvironment(agent, ctx.nutrients, &ctx.memory, settings);
    sf::Vector2f heading = steerHeading(agent.heading, input, settings, ctx.rng.uniform(-1.0f, 1.0f));

    // avoid
    if (settings.avoidanceDistance > 0.0f && settings.avoidanceWeight > 0.0f)
    {
        std::optional<sf::Vector2f> nearestPosition;
        std::optional<size_t> nearest = ctx.index.nearest(agent.position, settings.avoidanceDistance, slot);
        if (nearest && agents_[*nearest].alive)
            nearestPosition = agents_[*nearest].position;
        heading = avoidNeighbors(heading, agent.position, nearestPosition, settings.avoidanceWeight);
    }

    // reflect + move
    MoveProposal move = reflectAtBoundary(agent.position, heading, settings.stepLength, settings.gridSize,
                                          ctx.rng.symmetric(settings.reflectionJitter));
    if (ctx.nutrients.isBlocked(move.position))
        move = reflectAtObstacle(ctx.nutrients, agent.position, move.heading, settings.stepLength,
                                 ctx.rng.symmetric(settings.reflectionJitter));

    agent.heading = move.heading;
    agent.position = move.position;
    if (settings.trailsEnabled && !move.blocked)
        ctx.segments.push_back({agent.previousPosition, agent.position, 0.0f});

    // feed
    const float growthMultiplier = settings.weatherAffectsGrowth ? ctx.weather.growthMultiplier() : 1.0f;
    const float localNutrient = ctx.nutrients.totalAt(agent.position);
    float efficiency = growthEfficiency(agent.reserves, settings.optimalCnRatio, settings.cnPenaltyStrength,
                                        settings.minGrowthEfficiency);
    NutrientField::Amount taken = ctx.nutrients.consume(
        agent.position, settings.uptakeRadius, settings.uptakeRate * efficiency * growthMultiplier,
        settings.maxReserve - agent.reserves.carbon, settings.maxReserve - agent.reserves.nitrogen,
        settings.memoryEnabled ? &ctx.memory : nullptr, settings.memoryUpdateStrength);

    if (taken.total() > 0.0f)
    {
        agent.reserves.carbon = std::min(agent.reserves.carbon + taken.sugar, settings.maxReserve);
        agent.reserves.nitrogen = std::min(agent.reserves.nitrogen + taken.nitrogen, settings.maxReserve);
        agent.lastNutrientLocation = agent.position;

        if (settings.adaptiveGrowthEnabled)
            agent.strength = std::min(agent.strength + taken.total() * 0.1f, 1.0f);
        if (settings.signalPropagationEnabled && localNutrient > settings.signalTriggerNutrientThreshold)
            agent.signal = 1.0f;
    }

    // decay, heat and dry air burn reserves faster
    const float consumption = settings.weatherAffectsEnergy ? ctx.weather.energyConsumptionMultiplier() : 1.0f;
    const float retain = std::clamp(1.0f - (1.0f - settings.energyDecayRate) * consumption, 0.0f, 1.0f);
    agent.reserves.carbon *= retain;
    agent.reserves.nitrogen *= retain;

    agent.age += settings.ageIncrement;

    // starvation wins over senescence
    if (agent.reserves.carbon <= settings.minEnergyToLive || agent.reserves.nitrogen <= settings.minEnergyToLive)
    {
        kill(slot, DeathCause::Starvation, ctx.counters);
        return;
    }

    if (settings.senescenceEnabled && agent.age >= settings.senescenceMinAge)
    {
        SenescenceInput stress;
        stress.hasConnections = slot < ctx.degree.size() && ctx.degree[slot] > 0;
        stress.aggregateFlow = slot < ctx.aggregateFlow.size() ? ctx.aggregateFlow[slot] : 0.0f;
        stress.weatherExtreme = ctx.weather.extremeFactor(settings.senescenceWeatherExtremeThreshold);
        if (!ctx.hubIndex.empty())
        {
            std::optional<size_t> hub = ctx.hubIndex.nearest(agent.position, settings.senescenceCollapseDistance);
            if (hub && *hub < agents_.size())
                stress.hubDistance = (agents_[*hub].position - agent.position).length();
            else
                stress.hubDistance = std::numeric_limits<float>::max();
        }

        SenescenceOutcome risk = senescenceRisk(stress, settings);
        agent.senescence = std::min(agent.senescence + risk.probability * 5.0f, 1.0f);
        bool dies = ctx.rng.uniform() < risk.probability;
        if (risk.collapse || dies)
        {
            kill(slot, DeathCause::Senescence, ctx.counters);
            return;
        }
    }

    tryBranch(agent, ctx, growthMultiplier, children);
}

void AgentPool::tryBranch(Agent &agent, GrowthContext &ctx, float growthMultiplier, std::vector<PendingChild> &children)
{
    const SimulationSettings &settings = ctx.settings;
    if (settings.branchProbability <= 0.0f || !hasCapacity(settings.maxHyphae, children.size()))
        return;
    if (settings.branchingSuppressionThreshold > 0 &&
        aliveCount_ + children.size() >= static_cast<size_t>(settings.branchingSuppressionThreshold))
        return;

    float ageBoost = std::min(1.0f + agent.age * 0.05f, 2.0f);
    float probability = std::max(settings.branchProbability * ageBoost * growthMultiplier,
                                 settings.branchProbability * 0.3f);
    if (!ctx.rng.chance(probability))
        return;

    sf::Vector2f direction = agent.heading.rotatedBy(sf::radians(ctx.rng.symmetric(settings.branchAngleRange)));
    sf::Vector2f position = clampToWorld(agent.position + direction * settings.branchOffset, settings.gridSize);
    if (ctx.nutrients.isBlocked(position))
        position = agent.position;

    // the child takes exactly half of each reserve
    PendingChild child;
    child.position = position;
    child.heading = direction;
    child.reserves.carbon = agent.reserves.carbon * 0.5f;
    child.reserves.nitrogen = agent.reserves.nitrogen * 0.5f;
    child.strength = agent.strength * 0.8f;
    child.senescence = agent.senescence * 0.5f;
    child.lastNutrientLocation = agent.lastNutrientLocation;
    agent.reserves.carbon -= child.reserves.carbon;
    agent.reserves.nitrogen -= child.reserves.nitrogen;

    if (settings.trailsEnabled)
        ctx.segments.push_back({agent.position, position, 0.0f});

    children.push_back(child);
    ++ctx.counters.branches;
}

std::vector<std::pair<AgentRef, AgentRef>> AgentPool::fuse(GrowthContext &ctx)
{
    const SimulationSettings &settings = ctx.settings;
    std::vector<std::pair<AgentRef, AgentRef>> fusedPairs;

    ctx.index.rebuild(agents_);
    if (!settings.fusionEnabled || settings.fusionDistance <= 0.0f)
        return fusedPairs;

    std::vector<uint8_t> fused(agents_.size(), 0);
    for (size_t i = 0; i < agents_.size(); ++i)
    {
        if (!agents_[i].alive || fused[i] || agents_[i].age < settings.fusionMinAge)
            continue;

        for (size_t j : ctx.index.neighbors(agents_[i].position, settings.fusionDistance))
        {
            if (j == i || !agents_[j].alive || fused[j] || agents_[j].age < settings.fusionMinAge)
                continue;

            size_t keepSlot = std::min(i, j);
            size_t goneSlot = std::max(i, j);
            Agent &keep = agents_[keepSlot];
            Agent &gone = agents_[goneSlot];
            AgentRef keepRef = refOf(keepSlot);
            AgentRef goneRef = refOf(goneSlot);

            // the survivor stays put when the midpoint falls inside an obstacle
            sf::Vector2f midpoint = (keep.position + gone.position) * 0.5f;
            if (!ctx.nutrients.isBlocked(midpoint))
                keep.position = midpoint;
            keep.strength = std::max(keep.strength, gone.strength);
            keep.signal = std::max(keep.signal, gone.signal);

            // what does not fit stays with the absorbed agent and is recycled at reap
            float carbon = std::clamp(gone.reserves.carbon * settings.fusionEnergyTransfer, 0.0f,
                                      std::max(settings.maxReserve - keep.reserves.carbon, 0.0f));
            float nitrogen = std::clamp(gone.reserves.nitrogen * settings.fusionEnergyTransfer, 0.0f,
                                        std::max(settings.maxReserve - keep.reserves.nitrogen, 0.0f));
            keep.reserves.carbon += carbon;
            keep.reserves.nitrogen += nitrogen;
            gone.reserves.carbon -= carbon;
            gone.reserves.nitrogen -= nitrogen;

            kill(goneSlot, DeathCause::Fusion, ctx.counters);
            ++ctx.counters.fusions;
            fused[i] = fused[j] = 1;
            fusedPairs.emplace_back(keepRef, goneRef);
            break;
        }
    }

    if (!fusedPairs.empty())
        ctx.index.rebuild(agents_);
    return fusedPairs;
}

size_t AgentPool::reap(NutrientField &nutrients)
{
    size_t reaped = 0;
    for (size_t slot = 0; slot < agents_.size(); ++slot)
    {
        Agent &agent = agents_[slot];
        if (agent.alive || agent.id == 0)
            continue;

        if (agent.reserves.total() > 0.0f)
            nutrients.deposit(agent.position, agent.reserves.carbon, agent.reserves.nitrogen);

        agent = Agent();
        agent.alive = false;
        freeSlots_.push_back(slot);
        ++reaped;
    }

    // lowest slots are handed out first
    std::sort(freeSlots_.begin(), freeSlots_.end(), std::greater<size_t>());
    return reaped;
}

double AgentPool::totalReserves() const
{
    double total = 0.0;
    for (const Agent &agent : agents_)
    {
        if (agent.alive)
            total += static_cast<double>(agent.reserves.carbon) + agent.reserves.nitrogen;
    }
    return total;
}
