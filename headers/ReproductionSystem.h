#pragma once
#include <SFML/System/Vector2.hpp>
#include <vector>

class AgentPool;
class NetworkGraph;
struct GrowthContext;

struct Spore
{
    sf::Vector2f position;
    sf::Vector2f velocity;
    float age = 0.0f;
    float energy = 0.0f;
    bool alive = true;
};

struct FruitingBody
{
    sf::Vector2f position;
    float age = 0.0f;
    float lifespan = 0.0f;
    float energy = 0.0f;
    float nextReleaseAge = 0.0f;
    int releases = 0;
};

/**
 * fruiting bodies and spores
 * bodies grow from a well fed network, pull energy from nearby agents and pay
 * for every spore they release; spores drift until they germinate or die
 */
class ReproductionSystem
{
public:
    ReproductionSystem() = default;

    void clear();

    // trigger, body lifecycle, then spore drift and germination
    void update(AgentPool &pool, const NetworkGraph &graph, GrowthContext &ctx);

    const std::vector<Spore> &getSpores() const { return spores_; }
    const std::vector<FruitingBody> &getFruitingBodies() const { return bodies_; }
    float getCooldown() const { return cooldown_; }
    size_t aliveSporeCount() const;
    double totalEnergy() const; // held by bodies and spores

private:
    std::vector<Spore> spores_;
    std::vector<FruitingBody> bodies_;
    float cooldown_ = 0.0f; // seconds until the next body may appear

    bool trySpawnBody(const AgentPool &pool, const NetworkGraph &graph, GrowthContext &ctx);
    void drawEnergy(FruitingBody &body, AgentPool &pool, GrowthContext &ctx);
    void releaseSpores(FruitingBody &body, AgentPool &pool, GrowthContext &ctx);
    void updateSpores(AgentPool &pool, GrowthContext &ctx);
    bool germinate(Spore &spore, AgentPool &pool, GrowthContext &ctx);
};
