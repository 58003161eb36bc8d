#include "ReproductionSystem.h"
#include "AgentPool.h"
#include "NetworkGraph.h"
#include "NutrientField.h"
#include "SimulationRng.h"
#include "SimulationSettings.h"
#include "SpatialGrid.h"
#include "Weather.h"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace
{
    constexpr float TWO_PI = 6.28318530718f;
    constexpr float SPAWN_JITTER = 1.5f;
    constexpr float MIN_DONOR_ENERGY = 0.05f; // agents below this are left alone
    constexpr float MAX_DRAW_PER_AGENT = 0.12f;
    constexpr float SPORE_WOBBLE = 0.02f;

    // a germinated agent starts near the optimal C:N ratio
    Reserves sporeReserves(float energy, float optimalRatio)
    {
        Reserves reserves;
        reserves.nitrogen = energy / (optimalRatio + 1.0f);
        reserves.carbon = energy - reserves.nitrogen;
        return reserves;
    }

    bool insideWorld(const sf::Vector2f &p, int gridSize)
    {
        float hi = static_cast<float>(gridSize) - 1.0f;
        return p.x >= 1.0f && p.y >= 1.0f && p.x < hi && p.y < hi;
    }
}

void ReproductionSystem::clear()
{
    spores_.clear();
    bodies_.clear();
    cooldown_ = 0.0f;
}

size_t ReproductionSystem::aliveSporeCount() const
{
    return static_cast<size_t>(std::count_if(spores_.begin(), spores_.end(), [](const Spore &s)
                                             { return s.alive; }));
}

double ReproductionSystem::totalEnergy() const
{
    double total = 0.0;
    for (const FruitingBody &body : bodies_)
        total += body.energy;
    for (const Spore &spore : spores_)
    {
        if (spore.alive)
            total += spore.energy;
    }
    return total;
}

void ReproductionSystem::update(AgentPool &pool, const NetworkGraph &graph, GrowthContext &ctx)
{
    const SimulationSettings &settings = ctx.settings;
    if (!settings.fruitingEnabled && bodies_.empty() && spores_.empty())
        return;

    if (settings.fruitingEnabled)
    {
        cooldown_ = std::max(cooldown_ - settings.tickSeconds, 0.0f);
        if (cooldown_ <= 0.0f)
            trySpawnBody(pool, graph, ctx);
    }

    for (FruitingBody &body : bodies_)
    {
        body.age += settings.ageIncrement;
        drawEnergy(body, pool, ctx);
        releaseSpores(body, pool, ctx);
    }

    // expired bodies give part of what they hold back to the soil
    auto expired = std::remove_if(bodies_.begin(), bodies_.end(), [&](FruitingBody &body)
                                  {
        if (body.age < body.lifespan)
            return false;
        if (body.releases == 0 && settings.maxSporeReleases > 0)
        {
            body.nextReleaseAge = body.age;
            releaseSpores(body, pool, ctx);
        }
        float returned = body.energy * settings.fruitingNutrientReturnFraction;
        if (returned > 0.0f)
            ctx.nutrients.deposit(body.position, returned * 0.7f, returned * 0.3f);
        return true; });
    bodies_.erase(expired, bodies_.end());

    updateSpores(pool, ctx);
}

bool ReproductionSystem::trySpawnBody(const AgentPool &pool, const NetworkGraph &graph, GrowthContext &ctx)
{
    const SimulationSettings &settings = ctx.settings;
    if (pool.aliveCount() < static_cast<size_t>(std::max(settings.fruitingMinHyphae, 0)))
        return false;

    double totalEnergy = pool.totalReserves();
    if (totalEnergy < settings.fruitingEnergyThreshold || totalEnergy <= 0.0)
        return false;

    // the best connected agent, or the energy weighted centroid of a graph-less colony
    sf::Vector2f site;
    if (graph.size() > 0)
    {
        std::vector<int> degree;
        std::vector<float> flow;
        graph.agentInputs(pool.slotCount(), degree, flow);

        size_t best = pool.slotCount();
        for (size_t slot = 0; slot < pool.slotCount(); ++slot)
        {
            if (pool.isLive(slot) && (best == pool.slotCount() || degree[slot] > degree[best]))
                best = slot;
        }
        if (best == pool.slotCount())
            return false;
        site = pool.at(best).position;
    }
    else
    {
        double cx = 0.0;
        double cy = 0.0;
        for (const Agent &agent : pool.getAgents())
        {
            if (!agent.alive)
                continue;
            cx += static_cast<double>(agent.position.x) * agent.reserves.total();
            cy += static_cast<double>(agent.position.y) * agent.reserves.total();
        }
        site = {static_cast<float>(cx / totalEnergy), static_cast<float>(cy / totalEnergy)};
    }

    const float hi = static_cast<float>(settings.gridSize) - 2.0f;
    site.x = std::clamp(site.x + ctx.rng.symmetric(SPAWN_JITTER), 1.0f, std::max(hi, 1.0f));
    site.y = std::clamp(site.y + ctx.rng.symmetric(SPAWN_JITTER), 1.0f, std::max(hi, 1.0f));
    if (ctx.nutrients.isBlocked(site))
        return false;

    FruitingBody body;
    body.position = site;
    body.lifespan = ctx.rng.uniform(settings.fruitingLifespanMin, settings.fruitingLifespanMax);
    body.nextReleaseAge = std::clamp(body.lifespan * settings.sporeReleaseFraction, 0.0f, body.lifespan);
    bodies_.push_back(body);

    cooldown_ = settings.fruitingCooldown / std::max(ctx.weather.fruitingMultiplier(), 0.1f);

    if (settings.verboseLogging)
    {
        std::cout << "Fruiting body at (" << site.x << ", " << site.y << ") lifespan=" << body.lifespan
                  << " colony energy=" << totalEnergy << std::endl;
    }
    return true;
}

void ReproductionSystem::drawEnergy(FruitingBody &body, AgentPool &pool, GrowthContext &ctx)
{
    const SimulationSettings &settings = ctx.settings;
    const float radius = settings.fruitingTransferRadius;
    if (radius <= 0.0f)
        return;

    // stops filling once every planned spore is paid for
    const float capacity = std::max(settings.sporeEnergy * settings.sporesPerRelease * std::max(settings.maxSporeReleases, 1), 1.0f);

    for (size_t slot : ctx.index.neighbors(body.position, radius))
    {
        if (body.energy >= capacity)
            break;
        if (!pool.isLive(slot))
            continue;

        Agent &agent = pool.at(slot);
        float available = agent.reserves.total();
        if (available < MIN_DONOR_ENERGY)
            continue;

        float dist = (agent.position - body.position).length();
        float closeness = std::max(0.0f, 1.0f - dist / radius);
        float amount = std::min({available * (0.02f + 0.06f * closeness), MAX_DRAW_PER_AGENT, capacity - body.energy});
        if (amount <= 0.0f)
            continue;

        float carbonShare = agent.reserves.carbon / available;
        agent.reserves.carbon -= amount * carbonShare;
        agent.reserves.nitrogen -= amount * (1.0f - carbonShare);
        agent.reserves.carbon = std::max(agent.reserves.carbon, 0.0f);
        agent.reserves.nitrogen = std::max(agent.reserves.nitrogen, 0.0f);
        body.energy += amount;
    }
}

void ReproductionSystem::releaseSpores(FruitingBody &body, AgentPool &pool, GrowthContext &ctx)
{
    const SimulationSettings &settings = ctx.settings;
    const float interval = std::max(settings.sporeReleaseInterval * body.lifespan, settings.ageIncrement);
    const float radius = std::max(settings.sporeRadius, 1.0f);

    while (body.age >= body.nextReleaseAge && body.releases < settings.maxSporeReleases)
    {
        for (int i = 0; i < settings.sporesPerRelease; ++i)
        {
            float angle = ctx.rng.uniform(0.0f, TWO_PI);
            float distance = ctx.rng.uniform(0.5f, radius);
            sf::Vector2f position = body.position + sf::Vector2f(std::cos(angle), std::sin(angle)) * distance;
            if (!insideWorld(position, settings.gridSize))
                continue;

            float heading = ctx.rng.uniform(0.0f, TWO_PI);
            float speed = ctx.rng.uniform(0.02f, std::max(settings.sporeDrift, 0.05f));

            Spore spore;
            spore.position = position;
            spore.velocity = sf::Vector2f(std::cos(heading), std::sin(heading)) * speed;
            spore.energy = std::min(settings.sporeEnergy, body.energy);
            body.energy -= spore.energy;

            // some land on good ground right away
            if (ctx.rng.chance(settings.sporeImmediateGerminationChance) && germinate(spore, pool, ctx))
                continue;
            spores_.push_back(spore);
        }

        ++body.releases;
        body.nextReleaseAge += interval;
    }
}

void ReproductionSystem::updateSpores(AgentPool &pool, GrowthContext &ctx)
{
    const SimulationSettings &settings = ctx.settings;
    const float threshold = settings.sporeGerminationThreshold / std::max(ctx.weather.sporeGerminationMultiplier(), 0.1f);

    for (Spore &spore : spores_)
    {
        if (!spore.alive)
            continue;

        spore.position += spore.velocity;
        spore.age += settings.ageIncrement;
        spore.velocity += sf::Vector2f(ctx.rng.symmetric(SPORE_WOBBLE), ctx.rng.symmetric(SPORE_WOBBLE));

        if (!insideWorld(spore.position, settings.gridSize))
        {
            spore.alive = false;
            ctx.nutrients.deposit(clampToWorld(spore.position, settings.gridSize), spore.energy * 0.7f, spore.energy * 0.3f);
            continue;
        }

        if (ctx.nutrients.totalAt(spore.position) > threshold && !ctx.nutrients.isBlocked(spore.position) &&
            germinate(spore, pool, ctx))
            continue;

        if (spore.age >= settings.sporeMaxAge)
        {
            spore.alive = false;
            ctx.nutrients.deposit(spore.position, spore.energy * 0.7f, spore.energy * 0.3f);
        }
    }

    spores_.erase(std::remove_if(spores_.begin(), spores_.end(), [](const Spore &s)
                                 { return !s.alive; }),
                  spores_.end());
}

bool ReproductionSystem::germinate(Spore &spore, AgentPool &pool, GrowthContext &ctx)
{
    const SimulationSettings &settings = ctx.settings;
    if (!pool.hasCapacity(settings.maxHyphae))
        return false;

    sf::Vector2f position = clampToWorld(spore.position + sf::Vector2f(ctx.rng.symmetric(0.5f), ctx.rng.symmetric(0.5f)),
                                         settings.gridSize);
    if (ctx.nutrients.isBlocked(position))
        return false;

    float angle = ctx.rng.uniform(0.0f, TWO_PI);
    AgentRef ref = pool.spawn(position, {std::cos(angle), std::sin(angle)},
                              sporeReserves(spore.energy, settings.optimalCnRatio));
    pool.at(ref.slot).lastNutrientLocation = position;

    spore.alive = false;
    spore.energy = 0.0f;
    ++ctx.counters.germinations;
    ++ctx.counters.births;
    return true;
}
