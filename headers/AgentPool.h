#pragma once
#include "Agent.h"
#include <cstdint>
#include <utility>
#include <vector>

class SimulationSettings;
class NutrientField;
class MemoryField;
class Weather;
class SpatialGrid;
struct SimulationRng;

enum class DeathCause
{
    Starvation,
    Senescence,
    Fusion
};

// cumulative since the last reset
struct LifecycleCounters
{
    uint64_t births = 0; // every agent created after initialization
    uint64_t branches = 0;
    uint64_t germinations = 0;
    uint64_t fusions = 0;
    uint64_t deathsStarvation = 0;
    uint64_t deathsSenescence = 0;
    uint64_t deathsFusion = 0;

    uint64_t deaths() const { return deathsStarvation + deathsSenescence + deathsFusion; }
};

// per-tick inputs for the growth step, all owned by the simulation state
struct GrowthContext
{
    const SimulationSettings &settings;
    NutrientField &nutrients;
    MemoryField &memory;
    const Weather &weather;
    SpatialGrid &index;                      // live agents, rebuilt at the start of the tick
    const SpatialGrid &hubIndex;             // well connected agents
    const std::vector<float> &aggregateFlow; // per slot, from the network graph
    const std::vector<int> &degree;          // per slot
    SimulationRng &rng;
    std::vector<Segment> &segments;
    LifecycleCounters &counters;
};

/**
 * arena of hypha tips: dense vector plus a free list of reaped slots
 * dead agents keep their slot until reap() so slot indices stay valid for the whole tick
 */
class AgentPool
{
public:
    AgentPool() = default;

    void clear();

    // never reuses a slot that has not been reaped
    AgentRef spawn(const sf::Vector2f &position, const sf::Vector2f &heading, const Reserves &reserves);
    void kill(size_t slot, DeathCause cause, LifecycleCounters &counters);

    bool isLive(size_t slot) const { return slot < agents_.size() && agents_[slot].alive; }
    bool isLive(const AgentRef &ref) const { return isLive(ref.slot) && agents_[ref.slot].id == ref.id; }
    AgentRef refOf(size_t slot) const { return {slot, agents_[slot].id}; }

    Agent &at(size_t slot) { return agents_[slot]; }
    const Agent &at(size_t slot) const { return agents_[slot]; }

    // maxHyphae of 0 means uncapped
    bool hasCapacity(int maxHyphae, size_t pending = 0) const;

    // move, feed, decay, age, starve, senesce and branch every live agent; children join afterwards
    void step(GrowthContext &ctx);

    // merges touching pairs in slot order, returns the fused pairs (survivor, absorbed)
    std::vector<std::pair<AgentRef, AgentRef>> fuse(GrowthContext &ctx);

    // returns dead agents' reserves to the field and frees their slots
    size_t reap(NutrientField &nutrients);

    const std::vector<Agent> &getAgents() const { return agents_; }
    size_t aliveCount() const { return aliveCount_; }
    size_t slotCount() const { return agents_.size(); }
    double totalReserves() const;

private:
    struct PendingChild
    {
        sf::Vector2f position;
        sf::Vector2f heading;
        Reserves reserves;
        float strength;
        float senescence;
        std::optional<sf::Vector2f> lastNutrientLocation;
    };

    std::vector<Agent> agents_;
    std::vector<size_t> freeSlots_;
    uint64_t nextId_ = 1; // 0 marks a free slot
    size_t aliveCount_ = 0;

    void stepAgent(size_t slot, GrowthContext &ctx, std::vector<PendingChild> &children);
    void tryBranch(Agent &agent, GrowthContext &ctx, float growthMultiplier, std::vector<PendingChild> &children);
};
