#pragma once
#include <SFML/System/Vector2.hpp>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

class SimulationSettings;
class NutrientField;
class MemoryField;

// carbon/nitrogen reserves carried by a hypha tip
struct Reserves
{
    float carbon = 0.0f;
    float nitrogen = 0.0f;

    float total() const { return carbon + nitrogen; }
};

// pool slot plus the id that lived there when the reference was taken
struct AgentRef
{
    size_t slot = 0;
    uint64_t id = 0;

    bool operator==(const AgentRef &other) const { return slot == other.slot && id == other.id; }
    bool operator!=(const AgentRef &other) const { return !(*this == other); }
};

// immutable trail piece, only aged and culled
struct Segment
{
    sf::Vector2f from;
    sf::Vector2f to;
    float age = 0.0f;
};

/**
 * a single growing hypha tip
 * plain record owned by AgentPool, slot indices stay stable until the end-of-tick reap
 */
struct Agent
{
    uint64_t id = 0;
    sf::Vector2f position;
    sf::Vector2f previousPosition;
    sf::Vector2f heading{1.0f, 0.0f}; // unit vector
    Reserves reserves;
    float age = 0.0f;
    float strength = 1.0f;
    float senescence = 0.0f; // accumulated stress, [0, 1]
    float signal = 0.0f;
    std::optional<sf::Vector2f> lastNutrientLocation;
    bool alive = true;

    Agent() = default;
    Agent(uint64_t agentId, const sf::Vector2f &pos, const sf::Vector2f &dir, const Reserves &initial);
};

// everything an agent perceives before it turns
struct SenseInput
{
    sf::Vector2f nutrientGradient;
    sf::Vector2f memoryGradient; // zero when memory is disabled
    sf::Vector2f signalPull;     // unit vector toward the remembered nutrient spot, or zero
    float signal = 0.0f;
};

// result of the reflection stages
struct MoveProposal
{
    sf::Vector2f position;
    sf::Vector2f heading;
    bool reflected = false;
    bool blocked = false; // no admissible move, the agent stays put
};

SenseInput senseEnvironment(const Agent &agent, const NutrientField &nutrients, const MemoryField *memory,
                            const SimulationSettings &settings);

// weighted blend of heading, gradients, tropism and signal, then a bounded wander;
// wanderRoll in [-1, 1] is drawn by the caller
sf::Vector2f steerHeading(const sf::Vector2f &heading, const SenseInput &input,
                          const SimulationSettings &settings, float wanderRoll);

// turns away from the nearest neighbour, never stops
sf::Vector2f avoidNeighbors(const sf::Vector2f &heading, const sf::Vector2f &position,
                            const std::optional<sf::Vector2f> &nearest, float weight);

// flips the heading component(s) that would leave [1, gridSize - 1), then jitters;
// the returned position is always clamped in bounds
MoveProposal reflectAtBoundary(const sf::Vector2f &position, const sf::Vector2f &heading,
                               float stepLength, int gridSize, float jitterAngle);

// mirrors the heading about the obstacle surface normal, then jitters
MoveProposal reflectAtObstacle(const NutrientField &nutrients, const sf::Vector2f &position,
                               const sf::Vector2f &heading, float stepLength, float jitterAngle);

// smooth C:N penalty exp(-k * ln(ratio / optimal)^2), floored
float growthEfficiency(const Reserves &reserves, float optimalRatio, float penaltyStrength, float minEfficiency);

struct SenescenceInput
{
    bool hasConnections = false;
    float aggregateFlow = 0.0f;
    std::optional<float> hubDistance; // empty while no hub exists
    float weatherExtreme = 0.0f;      // [0, 1]
};

struct SenescenceOutcome
{
    float probability = 0.0f;
    bool collapse = false; // unsupported branch, dies regardless of the roll
};

SenescenceOutcome senescenceRisk(const SenescenceInput &input, const SimulationSettings &settings);

// clamps into the walkable area [1, gridSize - 1)
sf::Vector2f clampToWorld(const sf::Vector2f &position, int gridSize);

// unit vector or zero, never NaN
inline sf::Vector2f safeNormalized(const sf::Vector2f &v)
{
    float lenSq = v.lengthSquared();
    if (lenSq < 1e-12f)
        return {0.0f, 0.0f};
    return v / std::sqrt(lenSq);
}
