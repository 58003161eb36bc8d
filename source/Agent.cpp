#include "Agent.h"
#include "MemoryField.h"
#include "NutrientField.h"
#include "SimulationSettings.h"
#include <SFML/System/Angle.hpp>
#include <algorithm>
#include <cmath>

namespace
{
    // per-tick death probability added at full stress, per senescence cause
    constexpr float FLOW_STRESS_WEIGHT = 0.0002f;
    constexpr float DISTANCE_STRESS_WEIGHT = 0.0001f;
    constexpr float WEATHER_STRESS_WEIGHT = 0.0002f;

    constexpr float BORDER = 1.0f;
    constexpr float BORDER_EPSILON = 1e-3f;

    sf::Vector2f rotate(const sf::Vector2f &v, float angle)
    {
        if (angle == 0.0f)
            return v;
        return v.rotatedBy(sf::radians(angle));
    }
}

sf::Vector2f clampToWorld(const sf::Vector2f &p, int gridSize)
{
    float hi = std::max(BORDER, static_cast<float>(gridSize) - BORDER - BORDER_EPSILON);
    // std::clamp passes NaN through
    float x = std::isfinite(p.x) ? std::clamp(p.x, BORDER, hi) : BORDER;
    float y = std::isfinite(p.y) ? std::clamp(p.y, BORDER, hi) : BORDER;
    return {x, y};
}

Agent::Agent(uint64_t agentId, const sf::Vector2f &pos, const sf::Vector2f &dir, const Reserves &initial)
    : id(agentId), position(pos), previousPosition(pos), heading(dir), reserves(initial)
{
}

SenseInput senseEnvironment(const Agent &agent, const NutrientField &nutrients, const MemoryField *memory,
                            const SimulationSettings &settings)
{
    SenseInput input;
    input.nutrientGradient = nutrients.gradient(agent.position);

    if (settings.memoryEnabled && memory)
        input.memoryGradient = memory->gradient(agent.position);

    if (settings.signalPropagationEnabled)
    {
        input.signal = agent.signal;
        if (agent.signal > settings.signalStrengthThreshold && agent.lastNutrientLocation)
        {
            sf::Vector2f toward = *agent.lastNutrientLocation - agent.position;
            // already there, nothing to pull toward
            if (toward.lengthSquared() > 1.0f)
                input.signalPull = safeNormalized(toward);
        }
    }
    return input;
}

sf::Vector2f steerHeading(const sf::Vector2f &heading, const SenseInput &input,
                          const SimulationSettings &settings, float wanderRoll)
{
    sf::Vector2f desired = heading;

    bool hasGradient = input.nutrientGradient.length() > settings.minGradientMagnitude;
    if (hasGradient)
        desired += safeNormalized(input.nutrientGradient) * settings.gradientWeight;

    if (input.memoryGradient.lengthSquared() > 1e-4f)
        desired += safeNormalized(input.memoryGradient) * settings.memoryWeight;

    desired += sf::Vector2f(std::cos(settings.tropismAngle), std::sin(settings.tropismAngle)) * settings.tropismStrength;

    if (input.signal > settings.signalStrengthThreshold)
        desired += input.signalPull * (settings.signalSteeringWeight * std::min(input.signal, 1.0f));

    sf::Vector2f result = safeNormalized(desired);
    if (result.lengthSquared() == 0.0f)
        result = heading;

    // wander harder when there is nothing to follow
    float wander = std::clamp(wanderRoll, -1.0f, 1.0f) * settings.angleWanderRange * (hasGradient ? 1.0f : 1.5f);
    return rotate(result, wander);
}

sf::Vector2f avoidNeighbors(const sf::Vector2f &heading, const sf::Vector2f &position,
                            const std::optional<sf::Vector2f> &nearest, float weight)
{
    if (!nearest || weight <= 0.0f)
        return heading;

    sf::Vector2f away = safeNormalized(position - *nearest);
    if (away.lengthSquared() == 0.0f)
        return heading;

    sf::Vector2f turned = safeNormalized(heading + away * weight);
    if (turned.lengthSquared() == 0.0f)
        return away;
    return turned;
}

MoveProposal reflectAtBoundary(const sf::Vector2f &position, const sf::Vector2f &heading,
                               float stepLength, int gridSize, float jitterAngle)
{
    MoveProposal move;
    move.heading = heading;

    const float hi = static_cast<float>(gridSize) - BORDER;
    sf::Vector2f proposed = position + heading * stepLength;

    if (proposed.x < BORDER || proposed.x >= hi)
    {
        move.heading.x = -move.heading.x;
        move.reflected = true;
    }
    if (proposed.y < BORDER || proposed.y >= hi)
    {
        move.heading.y = -move.heading.y;
        move.reflected = true;
    }

    if (move.reflected)
    {
        move.heading = rotate(move.heading, jitterAngle);
        proposed = position + move.heading * stepLength;
    }

    move.position = clampToWorld(proposed, gridSize);
    return move;
}

MoveProposal reflectAtObstacle(const NutrientField &nutrients, const sf::Vector2f &position,
                               const sf::Vector2f &heading, float stepLength, float jitterAngle)
{
    MoveProposal move;
    move.heading = heading;
    move.position = position + heading * stepLength;
    if (!nutrients.isBlocked(move.position))
        return move;

    sf::Vector2i cell = nutrients.cellOf(move.position);
    sf::Vector2f normal = nutrients.obstacleNormal(cell.x, cell.y);
    sf::Vector2f mirrored;
    if (normal.lengthSquared() > 0.0f)
        mirrored = heading - normal * (2.0f * heading.dot(normal));
    else
        mirrored = -heading;

    move.reflected = true;
    move.heading = safeNormalized(rotate(mirrored, jitterAngle));
    if (move.heading.lengthSquared() == 0.0f)
        move.heading = -heading;

    move.position = clampToWorld(position + move.heading * stepLength, nutrients.getSize());
    if (nutrients.isBlocked(move.position))
    {
        move.position = position;
        move.blocked = true;
    }
    return move;
}

float growthEfficiency(const Reserves &reserves, float optimalRatio, float penaltyStrength, float minEfficiency)
{
    if (reserves.carbon <= 0.0f && reserves.nitrogen <= 0.0f)
        return 1.0f;
    if (reserves.carbon <= 0.0f || reserves.nitrogen <= 0.0f)
        return minEfficiency;

    float logRatio = std::log((reserves.carbon / reserves.nitrogen) / optimalRatio);
    float efficiency = std::exp(-penaltyStrength * logRatio * logRatio);
    return std::max(efficiency, minEfficiency);
}

SenescenceOutcome senescenceRisk(const SenescenceInput &input, const SimulationSettings &settings)
{
    SenescenceOutcome outcome;
    float p = settings.senescenceBaseProbability;

    // starved connections only count once the agent is part of the network
    if (input.hasConnections && input.aggregateFlow < settings.senescenceFlowThreshold)
    {
        float flowStress = 1.0f - input.aggregateFlow / settings.senescenceFlowThreshold;
        p += flowStress * FLOW_STRESS_WEIGHT;
    }

    if (input.hubDistance && *input.hubDistance > settings.senescenceDistanceThreshold)
    {
        float distanceStress = std::min((*input.hubDistance - settings.senescenceDistanceThreshold) /
                                            settings.senescenceCollapseDistance,
                                        1.0f);
        p += distanceStress * DISTANCE_STRESS_WEIGHT;
        if (*input.hubDistance > settings.senescenceCollapseDistance)
            outcome.collapse = true;
    }

    p += std::clamp(input.weatherExtreme, 0.0f, 1.0f) * WEATHER_STRESS_WEIGHT;

    outcome.probability = std::clamp(p, 0.0f, 1.0f);
    return outcome;
}
